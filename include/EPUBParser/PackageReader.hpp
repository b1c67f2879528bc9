#pragma once
// PackageReader.hpp – Maps the subtrees of a package document (.opf) into
// Metadata, Manifest and Spine records.

#include "Types.hpp"
#include "XmlTree.hpp"

namespace epub {

// <metadata> → Metadata. Never throws: missing elements leave fields absent,
// and a null element yields an empty Metadata.
Metadata extractMetadata(const XmlElement& metadata);

// <manifest> → Manifest.
// Throws ManifestError when the element is null, has no <item> children, or an
// item lacks its id or href. Duplicate ids: the later item wins.
Manifest extractManifest(const XmlElement& manifest);

// <spine> → Spine, itemrefs in document order.
// Throws SpineError when the element is null or an <itemref> lacks idref.
Spine extractSpine(const XmlElement& spine);

} // namespace epub
