#pragma once
// Errors.hpp – Exception hierarchy raised while parsing a package.
// Every failure is terminal for the parse call that raised it.

#include <stdexcept>
#include <string>
#include <utility>

namespace epub {

enum class ErrorKind {
    Extraction,    // archive missing, corrupt or of an unsupported format
    Container,     // META-INF/container.xml missing, malformed or without full-path
    Manifest,      // no <item> elements, or an item missing id / href
    Spine,         // no <spine>, or an <itemref> missing idref
    NotFound,      // spine toc absent or not present in the manifest
    Toc,           // NCX missing its title, or a navPoint missing label / id / src
    PackageParse,  // XML parse failure on the package or NCX document
};

const char* toString(ErrorKind kind);

// Base of every error raised by the library.
// element() identifies the offending XML element when there is one,
// e.g. "<item> #3 (id 'ch2')".
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, const std::string& message, std::string element = {});

    ErrorKind          kind() const noexcept { return kind_; }
    const std::string& element() const noexcept { return element_; }

private:
    ErrorKind   kind_;
    std::string element_;
};

class ExtractionError : public ParseError {
public:
    explicit ExtractionError(const std::string& message)
        : ParseError(ErrorKind::Extraction, message) {}
};

class ContainerError : public ParseError {
public:
    explicit ContainerError(const std::string& message)
        : ParseError(ErrorKind::Container, message) {}
};

class ManifestError : public ParseError {
public:
    explicit ManifestError(const std::string& message, std::string element = {})
        : ParseError(ErrorKind::Manifest, message, std::move(element)) {}
};

class SpineError : public ParseError {
public:
    explicit SpineError(const std::string& message, std::string element = {})
        : ParseError(ErrorKind::Spine, message, std::move(element)) {}
};

class NotFoundError : public ParseError {
public:
    explicit NotFoundError(const std::string& message, std::string element = {})
        : ParseError(ErrorKind::NotFound, message, std::move(element)) {}
};

class TocError : public ParseError {
public:
    explicit TocError(const std::string& message, std::string element = {})
        : ParseError(ErrorKind::Toc, message, std::move(element)) {}
};

class PackageParseError : public ParseError {
public:
    explicit PackageParseError(const std::string& message)
        : ParseError(ErrorKind::PackageParse, message) {}
};

} // namespace epub
