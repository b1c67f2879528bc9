#pragma once
// Debug.hpp – printf-style trace, compiled in only with EPUBPARSER_DEBUG.

#include <cstdio>

#ifdef EPUBPARSER_DEBUG
  #define EPUBPARSER_DBG(fmt, ...) \
    std::fprintf(stderr, "[epub] %s:%d: " fmt "\n", \
                 __FILE__, __LINE__, ##__VA_ARGS__)
#else
  #define EPUBPARSER_DBG(fmt, ...) ((void)0)
#endif
