#pragma once
// ContainerLocator.hpp – Finds the package document inside an extracted archive.

#include <filesystem>

namespace epub {

// Relative location of the pointer file in every package.
inline constexpr const char* kContainerPath = "META-INF/container.xml";

// Reads META-INF/container.xml under directory and returns the absolute path of
// the first <rootfile full-path="..."> it declares.
// Throws ContainerError if the file is missing, unparsable, lacks full-path, or
// full-path resolves outside directory.
std::filesystem::path locatePackageDocument(const std::filesystem::path& directory);

} // namespace epub
