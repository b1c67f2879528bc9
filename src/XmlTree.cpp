// XmlTree.cpp – XmlDocument / XmlElement on top of pugixml.

#include "EPUBParser/XmlTree.hpp"
#include "EPUBParser/Errors.hpp"

#include <pugixml.hpp>

#include <string>

namespace epub {

static pugi::xml_node wrap(pugi::xml_node_struct* node) {
    return pugi::xml_node(node);
}

static std::string trim(const char* s) {
    static constexpr const char* kWhitespace = " \t\r\n";
    std::string text(s);
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// ─── XmlElement ───────────────────────────────────────────────────────────────

std::string XmlElement::name() const {
    return wrap(node_).name();
}

std::optional<std::string> XmlElement::attribute(std::string_view name) const {
    if (!node_) return std::nullopt;
    pugi::xml_attribute attr = wrap(node_).attribute(std::string(name).c_str());
    if (!attr) return std::nullopt;
    return std::string(attr.value());
}

XmlElement XmlElement::child(std::string_view name) const {
    if (!node_) return {};
    pugi::xml_node found = wrap(node_).child(std::string(name).c_str());
    return XmlElement(found.internal_object());
}

std::vector<XmlElement> XmlElement::children(std::string_view name) const {
    std::vector<XmlElement> out;
    if (!node_) return out;
    for (auto node : wrap(node_).children(std::string(name).c_str()))
        out.push_back(XmlElement(node.internal_object()));
    return out;
}

std::vector<XmlElement> XmlElement::children(std::string_view name,
                                             std::string_view attr,
                                             std::string_view value) const {
    std::vector<XmlElement> out;
    if (!node_) return out;
    const std::string attr_name(attr);
    for (auto node : wrap(node_).children(std::string(name).c_str())) {
        pugi::xml_attribute a = node.attribute(attr_name.c_str());
        if (a && value == a.value())
            out.push_back(XmlElement(node.internal_object()));
    }
    return out;
}

std::optional<std::string> XmlElement::value() const {
    if (!node_) return std::nullopt;
    std::string text = trim(wrap(node_).text().get());
    if (text.empty()) return std::nullopt;
    return text;
}

// ─── XmlDocument ──────────────────────────────────────────────────────────────

XmlDocument::XmlDocument() : doc_(std::make_unique<pugi::xml_document>()) {}
XmlDocument::XmlDocument(XmlDocument&&) noexcept            = default;
XmlDocument& XmlDocument::operator=(XmlDocument&&) noexcept = default;
XmlDocument::~XmlDocument()                                 = default;

XmlDocument XmlDocument::load(const std::filesystem::path& path) {
    XmlDocument doc;
    pugi::xml_parse_result result = doc.doc_->load_file(path.c_str());
    if (!result)
        throw PackageParseError("Failed to parse XML '" + path.string() +
                                "': " + result.description() +
                                " at offset " + std::to_string(result.offset));
    return doc;
}

XmlDocument XmlDocument::parse(std::string_view text) {
    XmlDocument doc;
    pugi::xml_parse_result result = doc.doc_->load_buffer(text.data(), text.size());
    if (!result)
        throw PackageParseError(std::string("Failed to parse XML buffer: ") +
                                result.description() +
                                " at offset " + std::to_string(result.offset));
    return doc;
}

XmlElement XmlDocument::root() const {
    return XmlElement(doc_->document_element().internal_object());
}

} // namespace epub
