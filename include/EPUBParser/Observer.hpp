#pragma once
// Observer.hpp – Lifecycle callbacks delivered by Parser::parse.

#include "Types.hpp"

#include <exception>
#include <filesystem>

namespace epub {

// Receives parse progress synchronously, on the parsing thread, in this order:
//   parseBegan → archiveExtracted → metadataReady → manifestReady →
//   spineReady → tableOfContentsReady → parseFinished
// On failure, parseFailed is delivered instead of the remaining callbacks,
// before the error reaches the caller of parse().
// Every callback defaults to a no-op.
class ParserObserver {
public:
    virtual ~ParserObserver() = default;

    virtual void parseBegan(const std::filesystem::path& /*archive*/) {}
    virtual void archiveExtracted(const std::filesystem::path& /*directory*/) {}
    virtual void metadataReady(const Metadata& /*metadata*/) {}
    virtual void manifestReady(const Manifest& /*manifest*/) {}
    virtual void spineReady(const Spine& /*spine*/) {}
    virtual void tableOfContentsReady(const TableOfContents& /*toc*/) {}
    virtual void parseFinished(const std::filesystem::path& /*archive*/) {}

    // error is usually a ParseError; other exceptions escaping the pipeline
    // (e.g. std::bad_alloc) are reported here too.
    virtual void parseFailed(const std::filesystem::path& /*archive*/,
                             const std::exception& /*error*/) {}
};

} // namespace epub
