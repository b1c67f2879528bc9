// Archive.cpp – libzip-backed ZipArchiveExtractor.

#include "EPUBParser/Archive.hpp"
#include "EPUBParser/Debug.hpp"
#include "EPUBParser/Errors.hpp"

#include <zip.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace epub {

namespace fs = std::filesystem;

using ZipHandle     = std::unique_ptr<zip_t, decltype(&zip_discard)>;
using ZipFileHandle = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static ZipHandle openArchive(const fs::path& archive) {
    int errcode = 0;
    zip_t* z = zip_open(archive.c_str(), ZIP_RDONLY, &errcode);
    if (!z) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = "Cannot open archive '" + archive.string() + "': " +
                          zip_error_strerror(&ze);
        zip_error_fini(&ze);
        throw ExtractionError(msg);
    }
    return ZipHandle(z, &zip_discard);
}

// Entry names are '/'-separated and relative; anything that could land outside
// the destination is refused.
static bool isSafeEntryName(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') return false;
    if (name.find(':') != std::string::npos) return false;
    for (const auto& part : fs::path(name))
        if (part == "..") return false;
    return true;
}

static void copyEntry(zip_t* z, zip_uint64_t index, const std::string& name, const fs::path& target) {
    ZipFileHandle file(zip_fopen_index(z, index, 0), &zip_fclose);
    if (!file)
        throw ExtractionError("Cannot open archive entry '" + name + "': " + zip_strerror(z));

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        throw ExtractionError("Cannot create '" + target.string() + "'");

    std::array<char, 64 * 1024> buf;
    for (;;) {
        zip_int64_t n = zip_fread(file.get(), buf.data(), buf.size());
        if (n < 0)
            throw ExtractionError("Cannot read archive entry '" + name + "': " +
                                  zip_file_strerror(file.get()));
        if (n == 0) break;
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out)
            throw ExtractionError("Cannot write '" + target.string() + "'");
    }
}

bool isWithinDirectory(const fs::path& root, const fs::path& candidate) {
    const fs::path rel = candidate.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

// ─── ZipArchiveExtractor ──────────────────────────────────────────────────────

ZipArchiveExtractor::ZipArchiveExtractor(ExtractorOptions options)
    : options_(std::move(options)) {}

bool ZipArchiveExtractor::acceptsExtension(const fs::path& archive) const {
    std::string ext = archive.extension().string();
    if (ext.empty()) return false;
    ext = lower(ext.substr(1));
    return std::any_of(options_.extensions.begin(), options_.extensions.end(),
                       [&](const std::string& e) { return lower(e) == ext; });
}

fs::path ZipArchiveExtractor::destinationFor(const fs::path& archive) const {
    std::error_code ec;
    fs::path absolute = fs::absolute(archive, ec);
    if (ec) absolute = archive;
    const size_t hash = std::hash<std::string>{}(absolute.lexically_normal().generic_string());

    char suffix[2 * sizeof(size_t) + 2];
    std::snprintf(suffix, sizeof(suffix), "-%0*zx", static_cast<int>(2 * sizeof(size_t)), hash);
    return options_.extraction_root / (archive.stem().string() + suffix);
}

fs::path ZipArchiveExtractor::extract(const fs::path& archive) {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec))
        throw ExtractionError("Archive not found: '" + archive.string() + "'");
    if (!acceptsExtension(archive))
        throw ExtractionError("Unsupported archive extension: '" + archive.string() + "'");

    ZipHandle z = openArchive(archive);

    // Leftovers of an earlier extraction must not leak into this one
    const fs::path destination = destinationFor(archive);
    fs::remove_all(destination, ec);
    if (!ec) fs::create_directories(destination, ec);
    if (ec)
        throw ExtractionError("Cannot prepare '" + destination.string() + "': " + ec.message());

    zip_int64_t count = zip_get_num_entries(z.get(), 0);
    if (count < 0)
        throw ExtractionError("Cannot list entries of '" + archive.string() + "'");

    for (zip_int64_t i = 0; i < count; ++i) {
        const auto index = static_cast<zip_uint64_t>(i);
        const char* raw_name = zip_get_name(z.get(), index, 0);
        if (!raw_name)
            throw ExtractionError("Cannot read entry name #" + std::to_string(i) + ": " +
                                  zip_strerror(z.get()));

        std::string name(raw_name);
        const fs::path target = (destination / name).lexically_normal();
        if (!isSafeEntryName(name) || !isWithinDirectory(destination, target))
            throw ExtractionError("Archive entry escapes destination: '" + name + "'");

        if (name.back() == '/') {
            fs::create_directories(target, ec);
        } else {
            fs::create_directories(target.parent_path(), ec);
            if (!ec) copyEntry(z.get(), index, name, target);
        }
        if (ec)
            throw ExtractionError("Cannot create '" + target.string() + "': " + ec.message());
    }

    EPUBPARSER_DBG("extracted %lld entries to %s", static_cast<long long>(count),
                   destination.c_str());
    return destination;
}

} // namespace epub
