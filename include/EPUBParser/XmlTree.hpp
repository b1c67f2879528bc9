#pragma once
// XmlTree.hpp – Narrow read-only view over a parsed XML document.
// The extractors only see XmlElement; the backing parser stays in XmlTree.cpp.

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pugi {
class xml_document;
struct xml_node_struct;
} // namespace pugi

namespace epub {

// Non-owning handle to one element of an XmlDocument.
// A default-constructed (or failed lookup) element is null and every query on
// it yields an empty result, so lookups can be chained: root.child("a").child("b").
// Handles are only valid while their XmlDocument is alive.
class XmlElement {
public:
    XmlElement() = default;

    explicit operator bool() const { return node_ != nullptr; }

    // Qualified tag name as written, e.g. "dc:title". Empty for a null element.
    [[nodiscard]] std::string name() const;

    // Attribute value by qualified name; nullopt when absent.
    [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;

    // First child element with the given tag name (null element if none).
    [[nodiscard]] XmlElement child(std::string_view name) const;

    // All child elements with the given tag name, in document order.
    [[nodiscard]] std::vector<XmlElement> children(std::string_view name) const;

    // Child elements with the given tag name whose attribute attr equals value.
    [[nodiscard]] std::vector<XmlElement> children(std::string_view name,
                                                   std::string_view attr,
                                                   std::string_view value) const;

    // Text content with surrounding whitespace trimmed; nullopt when the element
    // is null or carries no text.
    [[nodiscard]] std::optional<std::string> value() const;

private:
    friend class XmlDocument;
    explicit XmlElement(pugi::xml_node_struct* node) : node_(node) {}

    pugi::xml_node_struct* node_{nullptr};
};

// Owns one parsed XML tree.
class XmlDocument {
public:
    // Parse the file at path. Throws PackageParseError on I/O or syntax errors.
    static XmlDocument load(const std::filesystem::path& path);

    // Parse an in-memory buffer. Throws PackageParseError on syntax errors.
    static XmlDocument parse(std::string_view text);

    XmlDocument(XmlDocument&&) noexcept;
    XmlDocument& operator=(XmlDocument&&) noexcept;
    XmlDocument(const XmlDocument&)            = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;
    ~XmlDocument();

    // The document element (e.g. <package>, <ncx>, <container>).
    [[nodiscard]] XmlElement root() const;

private:
    XmlDocument();

    std::unique_ptr<pugi::xml_document> doc_;
};

} // namespace epub
