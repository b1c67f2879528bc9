// ContainerLocator.cpp – META-INF/container.xml → package document path.

#include "EPUBParser/ContainerLocator.hpp"
#include "EPUBParser/Archive.hpp"
#include "EPUBParser/Debug.hpp"
#include "EPUBParser/Errors.hpp"
#include "EPUBParser/XmlTree.hpp"

#include <string>

namespace epub {

std::filesystem::path locatePackageDocument(const std::filesystem::path& directory) {
    const std::filesystem::path container_path = directory / kContainerPath;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(container_path, ec))
        throw ContainerError("Container file not found: '" + container_path.string() + "'");

    XmlDocument doc = [&] {
        try {
            return XmlDocument::load(container_path);
        } catch (const PackageParseError& e) {
            throw ContainerError(std::string("Malformed container file: ") + e.what());
        }
    }();

    XmlElement rootfile = doc.root().child("rootfiles").child("rootfile");
    if (!rootfile)
        throw ContainerError("Container file has no <rootfiles>/<rootfile> element");

    auto full_path = rootfile.attribute("full-path");
    if (!full_path || full_path->empty())
        throw ContainerError("<rootfile> missing 'full-path' attribute");

    std::filesystem::path package_path = (directory / *full_path).lexically_normal();
    if (!isWithinDirectory(directory, package_path))
        throw ContainerError("<rootfile> full-path '" + *full_path +
                             "' points outside the extracted archive");
    EPUBPARSER_DBG("package document: %s", package_path.c_str());
    return package_path;
}

} // namespace epub
