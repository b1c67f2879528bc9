// Parser.cpp – Parse pipeline:
//
//   archive ─extract→ directory ─container.xml→ package document (.opf)
//     ├─ <metadata> → Metadata
//     ├─ <manifest> → Manifest
//     ├─ <spine>    → Spine
//     └─ spine@toc ─manifest→ NCX document → TableOfContents
//
// Observer notifications are only issued from this file.

#include "EPUBParser/Parser.hpp"
#include "EPUBParser/ContainerLocator.hpp"
#include "EPUBParser/Debug.hpp"
#include "EPUBParser/Errors.hpp"
#include "EPUBParser/PackageReader.hpp"
#include "EPUBParser/TocReader.hpp"
#include "EPUBParser/XmlTree.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace epub {

namespace fs = std::filesystem;

Parser::Parser() : extractor_(std::make_shared<ZipArchiveExtractor>()) {}

Parser::Parser(std::shared_ptr<ArchiveExtractor> extractor)
    : extractor_(std::move(extractor)) {
    if (!extractor_)
        throw std::invalid_argument("Parser requires an archive extractor");
}

Document Parser::parse(const fs::path& path) const {
    notify([&](ParserObserver& o) { o.parseBegan(path); });
    try {
        fs::path directory;
        try {
            directory = extractor_->extract(path);
        } catch (const ExtractionError&) {
            throw;
        } catch (const std::exception& e) {
            throw ExtractionError("Cannot extract '" + path.string() + "': " + e.what());
        }
        notify([&](ParserObserver& o) { o.archiveExtracted(directory); });

        Document doc = parseExtracted(directory);
        notify([&](ParserObserver& o) { o.parseFinished(path); });
        return doc;
    } catch (const std::exception& e) {
        EPUBPARSER_DBG("parse of %s failed: %s", path.c_str(), e.what());
        notify([&](ParserObserver& o) { o.parseFailed(path, e); });
        throw;
    }
}

Document Parser::parseDirectory(const fs::path& directory) const {
    notify([&](ParserObserver& o) { o.parseBegan(directory); });
    try {
        Document doc = parseExtracted(directory);
        notify([&](ParserObserver& o) { o.parseFinished(directory); });
        return doc;
    } catch (const std::exception& e) {
        EPUBPARSER_DBG("parse of %s failed: %s", directory.c_str(), e.what());
        notify([&](ParserObserver& o) { o.parseFailed(directory, e); });
        throw;
    }
}

Document Parser::parseExtracted(const fs::path& directory) const {
    const fs::path package_path      = locatePackageDocument(directory);
    const fs::path content_directory = package_path.parent_path();

    XmlDocument package = XmlDocument::load(package_path);
    XmlElement  root    = package.root();

    Metadata metadata = extractMetadata(root.child("metadata"));
    notify([&](ParserObserver& o) { o.metadataReady(metadata); });

    Manifest manifest = extractManifest(root.child("manifest"));
    notify([&](ParserObserver& o) { o.manifestReady(manifest); });

    Spine spine = extractSpine(root.child("spine"));
    notify([&](ParserObserver& o) { o.spineReady(spine); });

    // Navigation document: spine@toc names a manifest item
    if (!spine.toc)
        throw NotFoundError("Spine declares no 'toc' attribute", "<spine>");
    const ManifestItem* toc_item = manifest.find(*spine.toc);
    if (!toc_item)
        throw NotFoundError("Spine toc '" + *spine.toc + "' is not a manifest item", "<spine>");

    const fs::path toc_path = (content_directory / toc_item->path).lexically_normal();
    if (!isWithinDirectory(directory, toc_path))
        throw NotFoundError("Navigation document '" + toc_item->path +
                            "' lies outside the extracted archive", "<spine>");
    EPUBPARSER_DBG("navigation document: %s", toc_path.c_str());

    XmlDocument     ncx               = XmlDocument::load(toc_path);
    TableOfContents table_of_contents = extractTableOfContents(ncx.root());
    notify([&](ParserObserver& o) { o.tableOfContentsReady(table_of_contents); });

    return Document(directory, content_directory, std::move(metadata), std::move(manifest),
                    std::move(spine), std::move(table_of_contents));
}

} // namespace epub
