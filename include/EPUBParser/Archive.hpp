#pragma once
// Archive.hpp – Archive extraction collaborator and its libzip implementation.

#include <filesystem>
#include <string>
#include <vector>

namespace epub {

// True when candidate, once lexically normalised, names an entry strictly
// inside root. Absolute escapes and ".." climbs out of root yield false.
[[nodiscard]] bool isWithinDirectory(const std::filesystem::path& root,
                                     const std::filesystem::path& candidate);

// Turns an archive on disk into a directory of files.
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    // Extracts archive and returns the directory holding its contents.
    // Throws ExtractionError on missing, corrupt or unsupported archives.
    virtual std::filesystem::path extract(const std::filesystem::path& archive) = 0;
};

struct ExtractorOptions {
    // Archives are extracted into extraction_root / "<stem>-<hash of absolute path>".
    std::filesystem::path extraction_root = std::filesystem::temp_directory_path() / "epubparser";

    // Accepted file extensions, without the dot; compared case-insensitively.
    std::vector<std::string> extensions{"epub", "zip"};
};

// Extracts zip archives (including the .epub variant) with libzip.
// Each archive path gets its own destination, emptied before every extraction,
// so distinct archives never share files. Entries whose name would escape the
// destination directory are rejected.
class ZipArchiveExtractor : public ArchiveExtractor {
public:
    ZipArchiveExtractor() = default;
    explicit ZipArchiveExtractor(ExtractorOptions options);

    std::filesystem::path extract(const std::filesystem::path& archive) override;

    // Directory the given archive would be extracted into; distinct for distinct
    // absolute archive paths.
    [[nodiscard]] std::filesystem::path destinationFor(const std::filesystem::path& archive) const;

    const ExtractorOptions& options() const { return options_; }

private:
    [[nodiscard]] bool acceptsExtension(const std::filesystem::path& archive) const;

    ExtractorOptions options_;
};

} // namespace epub
