#pragma once
// TocReader.hpp – Builds a TableOfContents tree from a legacy NCX document.

#include "Types.hpp"
#include "XmlTree.hpp"

namespace epub {

// <ncx> root → TableOfContents.
// The root node takes its label from docTitle/text, its id is "0", and its item
// is the content of <head><meta name="dtb:uid">. Children mirror the nested
// <navPoint> elements under <navMap>.
// Throws TocError when docTitle/text is missing, or a navPoint lacks its
// navLabel/text, id or content/@src.
TableOfContents extractTableOfContents(const XmlElement& ncx);

} // namespace epub
