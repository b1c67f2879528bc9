#pragma once
// Parser.hpp – Public EPUB parse API.
//
// Usage example:
//   epub::Parser parser;
//   epub::Document doc = parser.parse("books/moby-dick.epub");
//
//   // Reading order:
//   for (const auto& ref : doc.spine().items)
//       const std::string& href = doc.manifest().path(ref.idref);
//
//   // Table of contents:
//   for (const auto& entry : doc.tableOfContents().sub_table)
//       std::cout << entry.label << '\n';

#include "Archive.hpp"
#include "Observer.hpp"
#include "Types.hpp"

#include <filesystem>
#include <memory>

namespace epub {

class Parser {
public:
    // Uses a ZipArchiveExtractor with default options.
    Parser();
    explicit Parser(std::shared_ptr<ArchiveExtractor> extractor);

    // The observer is not kept alive by the parser; once it expires,
    // notifications are skipped.
    void setObserver(std::weak_ptr<ParserObserver> observer) { observer_ = std::move(observer); }

    // Extracts the archive at path and parses it into a Document.
    // Blocks until done. Throws a ParseError subclass on failure; no partial
    // Document is ever returned.
    [[nodiscard]] Document parse(const std::filesystem::path& path) const;

    // Parses an already-extracted package directory, skipping extraction.
    [[nodiscard]] Document parseDirectory(const std::filesystem::path& directory) const;

private:
    [[nodiscard]] Document parseExtracted(const std::filesystem::path& directory) const;

    template <typename Fn>
    void notify(Fn&& fn) const {
        if (auto observer = observer_.lock()) fn(*observer);
    }

    std::shared_ptr<ArchiveExtractor> extractor_;
    std::weak_ptr<ParserObserver>     observer_;
};

} // namespace epub
