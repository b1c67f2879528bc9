#pragma once
// MediaType.hpp – Mapping between IANA media-type strings and MediaType.

#include "Types.hpp"
#include <string_view>

namespace epub {

// Maps a manifest "media-type" literal to its MediaType.
// The literal is compared verbatim; anything unrecognised yields MediaType::Unknown.
[[nodiscard]] MediaType parseMediaType(std::string_view literal);

// Canonical literal for a MediaType. Unknown maps to an empty string.
[[nodiscard]] std::string_view toString(MediaType type);

} // namespace epub
