// MediaType.cpp – Static table of package media types.

#include "EPUBParser/MediaType.hpp"

#include <array>
#include <utility>

namespace epub {

static constexpr std::array<std::pair<MediaType, std::string_view>, 25> kMediaTypes{{
    {MediaType::Gif,           "image/gif"},
    {MediaType::Jpeg,          "image/jpeg"},
    {MediaType::Png,           "image/png"},
    {MediaType::Svg,           "image/svg+xml"},
    {MediaType::Webp,          "image/webp"},
    {MediaType::Xhtml,         "application/xhtml+xml"},
    {MediaType::Html,          "text/html"},
    {MediaType::Ncx,           "application/x-dtbncx+xml"},
    {MediaType::OpenType,      "application/vnd.ms-opentype"},
    {MediaType::FontWoff,      "application/font-woff"},
    {MediaType::Woff,          "font/woff"},
    {MediaType::Woff2,         "font/woff2"},
    {MediaType::Ttf,           "font/ttf"},
    {MediaType::Otf,           "font/otf"},
    {MediaType::MediaOverlays, "application/smil+xml"},
    {MediaType::Pls,           "application/pls+xml"},
    {MediaType::Mp3,           "audio/mpeg"},
    {MediaType::Mp4,           "audio/mp4"},
    {MediaType::Css,           "text/css"},
    {MediaType::JavaScript,    "text/javascript"},
    {MediaType::AppJavaScript, "application/javascript"},
    {MediaType::DtBook,        "application/x-dtbook+xml"},
    {MediaType::Oeb1Document,  "text/x-oeb1-document"},
    {MediaType::Xpgt,          "application/adobe-page-template+xml"},
    {MediaType::Xml,           "application/xml"},
}};

MediaType parseMediaType(std::string_view literal) {
    for (const auto& [type, name] : kMediaTypes)
        if (name == literal) return type;
    return MediaType::Unknown;
}

std::string_view toString(MediaType type) {
    for (const auto& [t, name] : kMediaTypes)
        if (t == type) return name;
    return {};
}

} // namespace epub
