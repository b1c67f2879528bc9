// Types.cpp – Manifest lookups and Document accessors.

#include "EPUBParser/Types.hpp"
#include "EPUBParser/Errors.hpp"

#include <utility>

namespace epub {

// ─── Manifest ─────────────────────────────────────────────────────────────────

const ManifestItem* Manifest::find(const std::string& item_id) const {
    auto it = items.find(item_id);
    return it == items.end() ? nullptr : &it->second;
}

const std::string& Manifest::path(const std::string& item_id) const {
    auto it = items.find(item_id);
    if (it == items.end())
        throw NotFoundError("No manifest item with id '" + item_id + "'");
    return it->second.path;
}

// ─── Document ─────────────────────────────────────────────────────────────────

Document::Document(std::filesystem::path directory,
                   std::filesystem::path content_directory,
                   Metadata metadata,
                   Manifest manifest,
                   Spine spine,
                   TableOfContents table_of_contents)
    : directory_(std::move(directory)),
      content_directory_(std::move(content_directory)),
      metadata_(std::move(metadata)),
      manifest_(std::move(manifest)),
      spine_(std::move(spine)),
      table_of_contents_(std::move(table_of_contents)) {}

std::optional<std::string> Document::title() const {
    return metadata_.title;
}

std::optional<std::string> Document::author() const {
    if (!metadata_.creator) return std::nullopt;
    return metadata_.creator->name;
}

std::optional<std::string> Document::publisher() const {
    return metadata_.publisher;
}

std::optional<std::filesystem::path> Document::coverPath() const {
    if (!metadata_.cover_id) return std::nullopt;
    const ManifestItem* item = manifest_.find(*metadata_.cover_id);
    if (!item) return std::nullopt;
    return (content_directory_ / item->path).lexically_normal();
}

} // namespace epub
