// test_parser.cpp – End-to-end parse of real .epub archives.
//
// Archives are assembled from tests/fixtures with libzip at run time, then
// parsed through epub::Parser with a ZipArchiveExtractor writing into a
// scratch directory.

#include "EPUBParser/Errors.hpp"
#include "EPUBParser/Parser.hpp"

#include <zip.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace epub;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─── Utility ─────────────────────────────────────────────────────────────────

static std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Entry name → contents
using Entries = std::vector<std::pair<std::string, std::string>>;

// All regular files under dir, "mimetype" first as the format requires.
static Entries entriesFrom(const fs::path& dir) {
    Entries entries;
    for (const auto& f : fs::recursive_directory_iterator(dir)) {
        if (!f.is_regular_file()) continue;
        std::string name = f.path().lexically_relative(dir).generic_string();
        auto entry = std::make_pair(name, readFile(f.path()));
        if (name == "mimetype") entries.insert(entries.begin(), std::move(entry));
        else                    entries.push_back(std::move(entry));
    }
    return entries;
}

static void writeArchive(const fs::path& out, const Entries& entries) {
    fs::create_directories(out.parent_path());
    int err = 0;
    zip_t* z = zip_open(out.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!z) throw std::runtime_error("zip_open failed for " + out.string());

    for (const auto& [name, data] : entries) {
        // Buffers outlive zip_close: entries is owned by the caller
        zip_source_t* src = zip_source_buffer(z, data.data(), data.size(), 0);
        zip_int64_t idx = src ? zip_file_add(z, name.c_str(), src, ZIP_FL_ENC_UTF_8) : -1;
        if (idx < 0) {
            if (src) zip_source_free(src);
            zip_discard(z);
            throw std::runtime_error("zip_file_add failed for " + name);
        }
        if (name == "mimetype")
            zip_set_file_compression(z, static_cast<zip_uint64_t>(idx), ZIP_CM_STORE, 0);
    }
    if (zip_close(z) != 0) {
        std::string msg = zip_strerror(z);
        zip_discard(z);
        throw std::runtime_error("zip_close failed: " + msg);
    }
}

// ─── Scratch area: <tmp>/epubparser-test-parser/{in,out} ──────────────────────
struct Scratch {
    fs::path root = fs::temp_directory_path() / "epubparser-test-parser";
    Scratch()  { fs::remove_all(root); fs::create_directories(root / "in"); }
    ~Scratch() { std::error_code ec; fs::remove_all(root, ec); }

    fs::path in(const std::string& name) const { return root / "in" / name; }
    fs::path out() const { return root / "out"; }

    std::shared_ptr<ZipArchiveExtractor> extractor() const {
        ExtractorOptions options;
        options.extraction_root = out();
        return std::make_shared<ZipArchiveExtractor>(options);
    }

    Parser parser() const { return Parser(extractor()); }
};

// ─── Observer that records every callback ────────────────────────────────────
struct RecordingObserver : ParserObserver {
    std::vector<std::string> events;
    ErrorKind                failed_kind{ErrorKind::Extraction};
    std::string              failed_element;

    void parseBegan(const fs::path&) override       { events.push_back("began"); }
    void archiveExtracted(const fs::path&) override { events.push_back("extracted"); }
    void metadataReady(const Metadata&) override    { events.push_back("metadata"); }
    void manifestReady(const Manifest&) override    { events.push_back("manifest"); }
    void spineReady(const Spine&) override          { events.push_back("spine"); }
    void tableOfContentsReady(const TableOfContents&) override { events.push_back("toc"); }
    void parseFinished(const fs::path&) override    { events.push_back("finished"); }
    void parseFailed(const fs::path&, const std::exception& error) override {
        events.push_back("failed");
        if (auto pe = dynamic_cast<const ParseError*>(&error)) {
            failed_kind    = pe->kind();
            failed_element = pe->element();
        }
    }

    std::string joined() const {
        std::string s;
        for (const auto& e : events) s += (s.empty() ? "" : ",") + e;
        return s;
    }
};

// Copy of a fixture with one file replaced
static Entries withFile(Entries entries, const std::string& name, const std::string& data) {
    for (auto& e : entries)
        if (e.first == name) { e.second = data; return entries; }
    entries.emplace_back(name, data);
    return entries;
}

static Entries without(Entries entries, const std::string& name) {
    std::erase_if(entries, [&](const auto& e) { return e.first == name; });
    return entries;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Minimal package, end to end
// ─────────────────────────────────────────────────────────────────────────────
static void testMinimal(const Scratch& s, const fs::path& fixtures) {
    std::cout << "\n=== Test: Minimal package ===\n";
    fs::path archive = s.in("minimal.epub");
    writeArchive(archive, entriesFrom(fixtures / "minimal"));

    auto observer = std::make_shared<RecordingObserver>();
    Parser parser = s.parser();
    parser.setObserver(observer);

    Document doc = parser.parse(archive);

    CHECK(doc.metadata().title == std::optional<std::string>("T"), "metadata.title == T");
    CHECK(doc.manifest().items.count("toc") == 1,                  "manifest has toc");
    CHECK(doc.manifest().items.at("toc").media_type == MediaType::Ncx, "toc media type is NCX");
    CHECK(!doc.spine().items.empty() && doc.spine().items[0].idref == "toc", "spine[0].idref == toc");
    CHECK(!doc.tableOfContents().sub_table.empty() &&
          doc.tableOfContents().sub_table[0].label == "Ch1", "toc[0].label == Ch1");
    CHECK(doc.tableOfContents().id == "0", "toc root id");

    const fs::path destination = s.extractor()->destinationFor(archive);
    CHECK(doc.directory() == destination,                 "extracted into the per-archive directory");
    CHECK(destination.parent_path() == s.out(),           "destination under the extraction root");
    CHECK(destination.filename().string().rfind("minimal-", 0) == 0, "destination named after the stem");
    CHECK(doc.contentDirectory() == (destination / "OEBPS").lexically_normal(),
          "content directory is the package's parent");
    CHECK(fs::exists(doc.contentDirectory() / "ch1.html"), "archive files materialised");
    CHECK(!doc.coverPath(), "no cover declared");

    CHECK(observer->joined() == "began,extracted,metadata,manifest,spine,toc,finished",
          "observer order: " + observer->joined());

    // Re-parsing the same archive overwrites the previous extraction
    Document again = parser.parse(archive);
    CHECK(again.metadata().title == doc.metadata().title, "second parse of same archive");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Richer package through an archive
// ─────────────────────────────────────────────────────────────────────────────
static void testNovel(const Scratch& s, const fs::path& fixtures) {
    std::cout << "\n=== Test: Novel package ===\n";
    fs::path archive = s.in("Novel.EPUB");
    writeArchive(archive, entriesFrom(fixtures / "novel"));

    Document doc = s.parser().parse(archive);
    CHECK(doc.title()     == std::optional<std::string>("The Lighthouse Keeper"), "title()");
    CHECK(doc.author()    == std::optional<std::string>("Elise Moreau"),          "author()");
    CHECK(doc.publisher() == std::optional<std::string>("Harbour Press"),         "publisher()");
    CHECK(doc.coverPath() == std::optional<fs::path>(doc.contentDirectory() / "images" / "cover.jpg"),
          "coverPath() resolves through the manifest");
    if (auto cover = doc.coverPath())
        CHECK(fs::exists(*cover), "cover file extracted");

    CHECK(doc.spine().items.size() == 3, "three spine items");
    CHECK(doc.spine().page_progression_direction == PageProgressionDirection::RightToLeft, "rtl spine");
    CHECK(doc.tableOfContents().sub_table.size() == 2, "two top-level toc entries");
    if (!doc.tableOfContents().sub_table.empty())
        CHECK(doc.tableOfContents().sub_table[0].sub_table.size() == 2, "nested toc entries");

    // Reading order resolves to manifest paths
    std::vector<std::string> order;
    for (const auto& ref : doc.spine().items)
        order.push_back(doc.manifest().path(ref.idref));
    CHECK(order == std::vector<std::string>({"text/ch1.xhtml", "text/ch2.xhtml", "text/notes.xhtml"}),
          "spine → manifest paths");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Already-extracted directory
// ─────────────────────────────────────────────────────────────────────────────
static void testDirectory(const fs::path& fixtures) {
    std::cout << "\n=== Test: parseDirectory ===\n";
    auto observer = std::make_shared<RecordingObserver>();
    Parser parser;
    parser.setObserver(observer);

    Document doc = parser.parseDirectory(fixtures / "novel");
    CHECK(doc.manifest().items.size() == 8, "manifest entries");
    CHECK(doc.metadata().cover_id == std::optional<std::string>("cover-image"), "cover id");
    CHECK(observer->joined() == "began,metadata,manifest,spine,toc,finished",
          "no extraction callback: " + observer->joined());
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Observer lifetime
// ─────────────────────────────────────────────────────────────────────────────
static void testExpiredObserver(const fs::path& fixtures) {
    std::cout << "\n=== Test: Expired observer ===\n";
    Parser parser;
    {
        auto observer = std::make_shared<RecordingObserver>();
        parser.setObserver(observer);
    }
    try {
        Document doc = parser.parseDirectory(fixtures / "minimal");
        CHECK(doc.metadata().title == std::optional<std::string>("T"), "parse with expired observer");
    } catch (const std::exception& e) {
        CHECK(false, std::string("parse with expired observer threw: ") + e.what());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Failures are reported, then propagated
// ─────────────────────────────────────────────────────────────────────────────
template <typename Error>
static void expectFailure(const Scratch& s, const std::string& file, const Entries& entries,
                          ErrorKind kind, const std::string& label,
                          const std::string& element = {}) {
    fs::path archive = s.in(file);
    writeArchive(archive, entries);

    auto observer = std::make_shared<RecordingObserver>();
    Parser parser = s.parser();
    parser.setObserver(observer);

    try {
        (void)parser.parse(archive);
        CHECK(false, label + " should throw");
    } catch (const Error& e) {
        CHECK(e.kind() == kind, label + ": " + e.what());
        if (!element.empty())
            CHECK(e.element() == element, label + " names " + element);
    }
    CHECK(!observer->events.empty() && observer->events.back() == "failed",
          label + " reported to observer: " + observer->joined());
    CHECK(observer->failed_kind == kind, label + " observer saw the same kind");
    if (!element.empty())
        CHECK(observer->failed_element == element, label + " observer saw the same element");
}

static const char* kOpfHead = R"(<?xml version="1.0"?>
<package xmlns="http://www.idpf.org/2007/opf" version="2.0">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/"><dc:title>T</dc:title></metadata>
)";

static void testFailures(const Scratch& s, const fs::path& fixtures) {
    std::cout << "\n=== Test: Parse failures ===\n";
    const Entries minimal = entriesFrom(fixtures / "minimal");

    expectFailure<ContainerError>(s, "no-container.epub",
        without(minimal, "META-INF/container.xml"), ErrorKind::Container, "missing container.xml");

    expectFailure<ManifestError>(s, "no-href.epub",
        withFile(minimal, "OEBPS/content.opf", std::string(kOpfHead) + R"(
  <manifest>
    <item id="toc" href="toc.ncx" media-type="application/x-dtbncx+xml"/>
    <item id="ch1" media-type="application/xhtml+xml"/>
  </manifest>
  <spine toc="toc"><itemref idref="ch1"/></spine>
</package>)"), ErrorKind::Manifest, "manifest item without href", "<item> #2 (id 'ch1')");

    expectFailure<SpineError>(s, "no-idref.epub",
        withFile(minimal, "OEBPS/content.opf", std::string(kOpfHead) + R"(
  <manifest><item id="toc" href="toc.ncx" media-type="application/x-dtbncx+xml"/></manifest>
  <spine toc="toc"><itemref linear="no"/></spine>
</package>)"), ErrorKind::Spine, "itemref without idref");

    expectFailure<NotFoundError>(s, "no-toc-attr.epub",
        withFile(minimal, "OEBPS/content.opf", std::string(kOpfHead) + R"(
  <manifest><item id="toc" href="toc.ncx" media-type="application/x-dtbncx+xml"/></manifest>
  <spine><itemref idref="toc"/></spine>
</package>)"), ErrorKind::NotFound, "spine without toc");

    expectFailure<NotFoundError>(s, "dangling-toc.epub",
        withFile(minimal, "OEBPS/content.opf", std::string(kOpfHead) + R"(
  <manifest><item id="toc" href="toc.ncx" media-type="application/x-dtbncx+xml"/></manifest>
  <spine toc="ncx"><itemref idref="toc"/></spine>
</package>)"), ErrorKind::NotFound, "spine toc not in manifest");

    expectFailure<PackageParseError>(s, "no-ncx-file.epub",
        without(minimal, "OEBPS/toc.ncx"), ErrorKind::PackageParse, "missing NCX file");

    expectFailure<PackageParseError>(s, "bad-opf.epub",
        withFile(minimal, "OEBPS/content.opf", "<package><metadata>"),
        ErrorKind::PackageParse, "malformed package document");

    expectFailure<TocError>(s, "untitled-ncx.epub",
        withFile(minimal, "OEBPS/toc.ncx", "<ncx><navMap/></ncx>"),
        ErrorKind::Toc, "NCX without docTitle", "<docTitle>");

    expectFailure<ExtractionError>(s, "escape.epub",
        withFile(minimal, "../escape.txt", "x"), ErrorKind::Extraction, "entry escaping destination");
    CHECK(!fs::exists(s.out() / "escape.txt"), "escaping entry not written");

    expectFailure<NotFoundError>(s, "outside-ncx.epub",
        withFile(minimal, "OEBPS/content.opf", std::string(kOpfHead) + R"(
  <manifest><item id="toc" href="../../../outside.ncx" media-type="application/x-dtbncx+xml"/></manifest>
  <spine toc="toc"><itemref idref="toc"/></spine>
</package>)"), ErrorKind::NotFound, "NCX href climbing out of the archive", "<spine>");

    expectFailure<ContainerError>(s, "outside-opf.epub",
        withFile(minimal, "META-INF/container.xml",
                 R"(<container><rootfiles><rootfile full-path="../../content.opf"/></rootfiles></container>)"),
        ErrorKind::Container, "rootfile climbing out of the archive");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Same file name, different archives: no shared extraction state
// ─────────────────────────────────────────────────────────────────────────────
static void testSameStemArchives(const Scratch& s, const fs::path& fixtures) {
    std::cout << "\n=== Test: Archives sharing a file name ===\n";
    const Entries minimal = entriesFrom(fixtures / "minimal");
    const fs::path first  = s.root / "in1" / "book.epub";
    const fs::path second = s.root / "in2" / "book.epub";
    writeArchive(first, minimal);
    writeArchive(second, without(minimal, "META-INF/container.xml"));

    auto extractor = s.extractor();
    CHECK(extractor->destinationFor(first) != extractor->destinationFor(second),
          "distinct archive paths get distinct destinations");
    CHECK(extractor->destinationFor(first) == extractor->destinationFor(first),
          "destination is stable for one path");

    auto observer = std::make_shared<RecordingObserver>();
    Parser parser(extractor);
    parser.setObserver(observer);

    Document doc = parser.parse(first);
    CHECK(doc.metadata().title == std::optional<std::string>("T"), "first book.epub parses");

    observer->events.clear();
    try {
        (void)parser.parse(second);
        CHECK(false, "second book.epub without container.xml should throw");
    } catch (const ContainerError& e) {
        CHECK(true, std::string("second book.epub: ") + e.what());
    }
    CHECK(observer->joined() == "began,extracted,failed",
          "second book.epub reported to observer: " + observer->joined());
    CHECK(observer->failed_kind == ErrorKind::Container, "observer saw ContainerError");

    // Rewriting an archive in place: the re-extraction drops the old files
    writeArchive(first, without(minimal, "META-INF/container.xml"));
    try {
        (void)parser.parse(first);
        CHECK(false, "re-parse after losing container.xml should throw");
    } catch (const ContainerError& e) {
        CHECK(true, std::string("re-parse of rewritten archive: ") + e.what());
    }
    CHECK(!fs::exists(extractor->destinationFor(first) / "META-INF" / "container.xml"),
          "stale container.xml removed by re-extraction");
}

static void testExtractionFailures(const Scratch& s) {
    std::cout << "\n=== Test: Extraction failures ===\n";
    auto expect = [&](const fs::path& archive, const std::string& label) {
        auto observer = std::make_shared<RecordingObserver>();
        Parser parser = s.parser();
        parser.setObserver(observer);
        try {
            (void)parser.parse(archive);
            CHECK(false, label + " should throw");
        } catch (const ExtractionError& e) {
            CHECK(true, label + ": " + e.what());
        }
        CHECK(observer->joined() == "began,failed", label + " callbacks: " + observer->joined());
    };

    expect(s.in("does-not-exist.epub"), "missing archive");

    std::ofstream(s.in("garbage.epub")) << "this is not a zip archive";
    expect(s.in("garbage.epub"), "corrupt archive");

    writeArchive(s.in("book.txt"), {{"mimetype", "application/epub+zip"}});
    expect(s.in("book.txt"), "unsupported extension");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: Custom extractors
// ─────────────────────────────────────────────────────────────────────────────
struct FixedExtractor : ArchiveExtractor {
    fs::path directory;
    explicit FixedExtractor(fs::path d) : directory(std::move(d)) {}
    fs::path extract(const fs::path&) override { return directory; }
};

struct ThrowingExtractor : ArchiveExtractor {
    fs::path extract(const fs::path&) override { throw std::runtime_error("disk on fire"); }
};

static void testCustomExtractor(const fs::path& fixtures) {
    std::cout << "\n=== Test: Custom extractors ===\n";
    Parser fixed(std::make_shared<FixedExtractor>(fixtures / "minimal"));
    Document doc = fixed.parse("anything.epub");
    CHECK(doc.directory() == fixtures / "minimal", "extractor's directory is used");

    Parser throwing(std::make_shared<ThrowingExtractor>());
    try {
        (void)throwing.parse("anything.epub");
        CHECK(false, "throwing extractor should fail the parse");
    } catch (const ExtractionError& e) {
        CHECK(std::string(e.what()).find("disk on fire") != std::string::npos,
              std::string("foreign error wrapped as ExtractionError: ") + e.what());
    }

    try {
        Parser none(nullptr);
        CHECK(false, "null extractor should be rejected");
    } catch (const std::invalid_argument&) {
        CHECK(true, "null extractor rejected");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path fixtures = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path() / "fixtures";

    std::cout << "Using fixtures: " << fixtures << '\n';

    Scratch scratch;
    try {
        testMinimal(scratch, fixtures);
        testNovel(scratch, fixtures);
        testDirectory(fixtures);
        testExpiredObserver(fixtures);
        testFailures(scratch, fixtures);
        testSameStemArchives(scratch, fixtures);
        testExtractionFailures(scratch);
        testCustomExtractor(fixtures);
    } catch (const std::exception& e) {
        std::cerr << "FAIL unexpected exception: " << e.what() << '\n';
        ++failures;
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
