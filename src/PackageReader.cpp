// PackageReader.cpp – Metadata / manifest / spine extraction from the package
// document.

#include "EPUBParser/PackageReader.hpp"
#include "EPUBParser/Errors.hpp"
#include "EPUBParser/MediaType.hpp"

#include <string>

namespace epub {

// ─── Element identity used in error messages ──────────────────────────────────

static std::string describe(const char* tag, size_t index,
                            const std::optional<std::string>& id) {
    std::string s = std::string("<") + tag + "> #" + std::to_string(index + 1);
    if (id) s += " (id '" + *id + "')";
    return s;
}

// ─── Metadata ─────────────────────────────────────────────────────────────────

static Creator parseCreator(const XmlElement& node) {
    Creator c;
    c.name    = node.value();
    c.role    = node.attribute("opf:role");
    c.file_as = node.attribute("opf:file-as");
    return c;
}

Metadata extractMetadata(const XmlElement& node) {
    Metadata m;

    if (auto c = node.child("dc:contributor")) m.contributor = parseCreator(c);
    m.coverage    = node.child("dc:coverage").value();
    if (auto c = node.child("dc:creator"))     m.creator     = parseCreator(c);
    m.date        = node.child("dc:date").value();
    m.description = node.child("dc:description").value();
    m.format      = node.child("dc:format").value();
    m.identifier  = node.child("dc:identifier").value();
    m.language    = node.child("dc:language").value();
    m.publisher   = node.child("dc:publisher").value();
    m.relation    = node.child("dc:relation").value();
    m.rights      = node.child("dc:rights").value();
    m.source      = node.child("dc:source").value();
    m.subject     = node.child("dc:subject").value();
    m.title       = node.child("dc:title").value();
    m.type        = node.child("dc:type").value();

    // First <meta name="cover"> wins
    auto covers = node.children("meta", "name", "cover");
    if (!covers.empty())
        m.cover_id = covers.front().attribute("content");

    return m;
}

// ─── Manifest ─────────────────────────────────────────────────────────────────

Manifest extractManifest(const XmlElement& node) {
    if (!node)
        throw ManifestError("Package document has no <manifest> element", "<manifest>");

    auto item_nodes = node.children("item");
    if (item_nodes.empty())
        throw ManifestError("<manifest> contains no <item> elements", "<manifest>");

    Manifest manifest;
    manifest.id = node.attribute("id");

    for (size_t i = 0; i < item_nodes.size(); ++i) {
        const XmlElement& item_node = item_nodes[i];
        auto id   = item_node.attribute("id");
        auto href = item_node.attribute("href");

        if (!id) {
            std::string where = describe("item", i, std::nullopt);
            throw ManifestError("Manifest " + where + " missing 'id' attribute", where);
        }
        if (!href) {
            std::string where = describe("item", i, id);
            throw ManifestError("Manifest " + where + " missing 'href' attribute", where);
        }

        ManifestItem item;
        item.id         = *id;
        item.path       = std::move(*href);
        item.media_type = parseMediaType(item_node.attribute("media-type").value_or(""));
        item.property   = item_node.attribute("properties");
        manifest.items.insert_or_assign(std::move(*id), std::move(item));
    }

    return manifest;
}

// ─── Spine ────────────────────────────────────────────────────────────────────

static PageProgressionDirection parseDirection(const std::optional<std::string>& s) {
    if (!s || *s == "ltr") return PageProgressionDirection::LeftToRight;
    if (*s == "rtl")       return PageProgressionDirection::RightToLeft;
    return PageProgressionDirection::Unspecified;
}

Spine extractSpine(const XmlElement& node) {
    if (!node)
        throw SpineError("Package document has no <spine> element", "<spine>");

    Spine spine;
    spine.id  = node.attribute("id");
    spine.toc = node.attribute("toc");
    spine.page_progression_direction_raw = node.attribute("page-progression-direction");
    spine.page_progression_direction     = parseDirection(spine.page_progression_direction_raw);

    auto itemrefs = node.children("itemref");
    spine.items.reserve(itemrefs.size());
    for (size_t i = 0; i < itemrefs.size(); ++i) {
        const XmlElement& ref = itemrefs[i];
        SpineItem item;
        item.id = ref.attribute("id");

        auto idref = ref.attribute("idref");
        if (!idref) {
            std::string where = describe("itemref", i, item.id);
            throw SpineError("Spine " + where + " missing 'idref' attribute", where);
        }
        item.idref = std::move(*idref);

        // Only the exact literal "yes" counts as linear when the attribute is present
        auto linear = ref.attribute("linear");
        item.linear = !linear || *linear == "yes";

        spine.items.push_back(std::move(item));
    }

    return spine;
}

} // namespace epub
