// TocReader.cpp – Recursive NCX navMap walk.

#include "EPUBParser/TocReader.hpp"
#include "EPUBParser/Errors.hpp"

#include <string>
#include <vector>

namespace epub {

// `where` is the position path of the parent, e.g. "navMap/navPoint[2]".
static std::vector<TableOfContents> parseNavPoints(const XmlElement& parent,
                                                   const std::string& where) {
    std::vector<TableOfContents> out;
    auto points = parent.children("navPoint");
    out.reserve(points.size());

    for (size_t i = 0; i < points.size(); ++i) {
        const XmlElement& point = points[i];
        std::string path = where + "/navPoint[" + std::to_string(i + 1) + "]";

        TableOfContents entry;
        auto id = point.attribute("id");
        if (id) path += " (id '" + *id + "')";

        auto label = point.child("navLabel").child("text").value();
        if (!label)
            throw TocError("Navigation point " + path + " missing navLabel/text", path);
        if (!id)
            throw TocError("Navigation point " + path + " missing 'id' attribute", path);

        auto src = point.child("content").attribute("src");
        if (!src)
            throw TocError("Navigation point " + path + " missing content/@src", path);

        entry.label     = std::move(*label);
        entry.id        = std::move(*id);
        entry.item      = std::move(*src);
        entry.sub_table = parseNavPoints(point, path);
        out.push_back(std::move(entry));
    }
    return out;
}

TableOfContents extractTableOfContents(const XmlElement& ncx) {
    auto title = ncx.child("docTitle").child("text").value();
    if (!title)
        throw TocError("Navigation document missing docTitle/text", "<docTitle>");

    TableOfContents root;
    root.label = std::move(*title);
    root.id    = kTableOfContentsRootId;

    auto uids = ncx.child("head").children("meta", "name", "dtb:uid");
    if (!uids.empty())
        root.item = uids.front().attribute("content");

    root.sub_table = parseNavPoints(ncx.child("navMap"), "navMap");
    return root;
}

} // namespace epub
