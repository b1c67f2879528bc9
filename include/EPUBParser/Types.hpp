#pragma once
// Types.hpp – In-memory model of a parsed EPUB package.
// Every structure here is filled once by the Parser and handed to the caller.

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace epub {

// ─── Resource media types recognised inside a package ────────────────────────
// Any string not listed maps to Unknown; see MediaType.hpp for the table.
enum class MediaType {
    Gif,            // image/gif
    Jpeg,           // image/jpeg
    Png,            // image/png
    Svg,            // image/svg+xml
    Webp,           // image/webp
    Xhtml,          // application/xhtml+xml
    Html,           // text/html
    Ncx,            // application/x-dtbncx+xml (legacy navigation map)
    OpenType,       // application/vnd.ms-opentype
    FontWoff,       // application/font-woff
    Woff,           // font/woff
    Woff2,          // font/woff2
    Ttf,            // font/ttf
    Otf,            // font/otf
    MediaOverlays,  // application/smil+xml
    Pls,            // application/pls+xml
    Mp3,            // audio/mpeg
    Mp4,            // audio/mp4
    Css,            // text/css
    JavaScript,     // text/javascript
    AppJavaScript,  // application/javascript
    DtBook,         // application/x-dtbook+xml
    Oeb1Document,   // text/x-oeb1-document
    Xpgt,           // application/adobe-page-template+xml
    Xml,            // application/xml
    Unknown,
};

// ─── Reading direction declared on <spine> ────────────────────────────────────
enum class PageProgressionDirection {
    LeftToRight,  // "ltr", also the value when the attribute is absent
    RightToLeft,  // "rtl"
    Unspecified,  // attribute present with any other literal
};

// ─── Dublin Core creator / contributor ────────────────────────────────────────
struct Creator {
    std::optional<std::string> name;
    std::optional<std::string> role;     // opf:role, e.g. "aut"
    std::optional<std::string> file_as;  // opf:file-as
};

// ─── Publication metadata (<metadata>) ────────────────────────────────────────
// All fields are independently optional; an absent element is not an error.
struct Metadata {
    std::optional<Creator>     contributor;
    std::optional<std::string> coverage;
    std::optional<Creator>     creator;
    std::optional<std::string> date;
    std::optional<std::string> description;
    std::optional<std::string> format;
    std::optional<std::string> identifier;
    std::optional<std::string> language;
    std::optional<std::string> publisher;
    std::optional<std::string> relation;
    std::optional<std::string> rights;
    std::optional<std::string> source;
    std::optional<std::string> subject;
    std::optional<std::string> title;
    std::optional<std::string> type;

    // Manifest id of the cover image (<meta name="cover" content="...">)
    std::optional<std::string> cover_id;
};

// ─── One resource listed in <manifest> ────────────────────────────────────────
struct ManifestItem {
    std::string                id;
    std::string                path;        // href, relative to the content directory
    MediaType                  media_type{MediaType::Unknown};
    std::optional<std::string> property;    // "properties" attribute, verbatim
};

// ─── Id-indexed resource registry ─────────────────────────────────────────────
struct Manifest {
    std::optional<std::string>          id;
    std::map<std::string, ManifestItem> items;  // item id → item; last duplicate wins

    // Returns the item with the given id, or nullptr.
    [[nodiscard]] const ManifestItem* find(const std::string& item_id) const;

    // Returns the path of the item with the given id.
    // Throws NotFoundError when no such item exists.
    [[nodiscard]] const std::string& path(const std::string& item_id) const;
};

// ─── One <itemref> in reading order ───────────────────────────────────────────
struct SpineItem {
    std::optional<std::string> id;
    std::string                idref;
    bool                       linear{true};
};

// ─── Linear reading order (<spine>) ───────────────────────────────────────────
struct Spine {
    std::optional<std::string> id;
    std::optional<std::string> toc;  // manifest id of the NCX document
    PageProgressionDirection   page_progression_direction{PageProgressionDirection::LeftToRight};

    // The attribute literal as written, absent when the attribute was absent
    std::optional<std::string> page_progression_direction_raw;

    std::vector<SpineItem>     items;
};

// ─── Table of contents node (NCX <navPoint>, or the <ncx> root) ───────────────
// Each node owns its children; the tree is built top-down and has no cycles.
struct TableOfContents {
    std::string                  label;
    std::string                  id;          // "0" for the root
    std::optional<std::string>   item;        // content src (dtb:uid for the root)
    std::vector<TableOfContents> sub_table;
};

// Id given to the root node of every TableOfContents tree.
inline constexpr const char* kTableOfContentsRootId = "0";

// ─── Fully parsed package ─────────────────────────────────────────────────────
// Built once at the end of a successful parse; read-only afterwards.
class Document {
public:
    Document(std::filesystem::path directory,
             std::filesystem::path content_directory,
             Metadata metadata,
             Manifest manifest,
             Spine spine,
             TableOfContents table_of_contents);

    // Directory the archive was extracted into
    const std::filesystem::path& directory() const { return directory_; }
    // Directory holding the package document; manifest paths are relative to it
    const std::filesystem::path& contentDirectory() const { return content_directory_; }

    const Metadata&        metadata() const { return metadata_; }
    const Manifest&        manifest() const { return manifest_; }
    const Spine&           spine() const { return spine_; }
    const TableOfContents& tableOfContents() const { return table_of_contents_; }

    // Shorthands over the metadata
    [[nodiscard]] std::optional<std::string> title() const;
    [[nodiscard]] std::optional<std::string> author() const;
    [[nodiscard]] std::optional<std::string> publisher() const;

    // Absolute path of the cover image, when metadata names a cover id that
    // resolves to a manifest item.
    [[nodiscard]] std::optional<std::filesystem::path> coverPath() const;

private:
    std::filesystem::path directory_;
    std::filesystem::path content_directory_;
    Metadata              metadata_;
    Manifest              manifest_;
    Spine                 spine_;
    TableOfContents       table_of_contents_;
};

} // namespace epub
