// Errors.cpp – ParseError and ErrorKind names.

#include "EPUBParser/Errors.hpp"

#include <utility>

namespace epub {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Extraction:   return "ExtractionError";
        case ErrorKind::Container:    return "ContainerError";
        case ErrorKind::Manifest:     return "ManifestError";
        case ErrorKind::Spine:        return "SpineError";
        case ErrorKind::NotFound:     return "NotFoundError";
        case ErrorKind::Toc:          return "TocError";
        case ErrorKind::PackageParse: return "PackageParseError";
    }
    return "ParseError";
}

ParseError::ParseError(ErrorKind kind, const std::string& message, std::string element)
    : std::runtime_error(message), kind_(kind), element_(std::move(element)) {}

} // namespace epub
