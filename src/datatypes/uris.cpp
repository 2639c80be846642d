#include "datatypes/uris.hpp"

#include <QString>
#include <QUrl>

namespace oscal {
namespace {

Error uri_error(ErrorKind kind, std::string_view type_name, std::string_view text, std::string reason) {
    return Error(kind, std::string(type_name), std::move(reason)).with_input(text);
}

QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

// QUrl tolerates surrounding whitespace in some paths through the parser,
// and accepts raw non-ASCII text as an IRI. A URI is printable ASCII only.
std::optional<std::string> find_illegal_character(std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c <= 0x20 || c == 0x7f) {
            return "illegal character at position " + std::to_string(i);
        }
        if (c >= 0x80) {
            return "illegal character at position " + std::to_string(i) +
                   " (non-ASCII text must be percent-encoded)";
        }
    }
    return std::nullopt;
}

// "scheme://..." or "//..." has an authority, even an empty one.
bool has_authority(std::string_view text, const std::string& scheme) {
    const auto rest = scheme.empty() ? text : text.substr(scheme.size() + 1);
    return rest.substr(0, 2) == "//";
}

Result<UriComponents> decode_uri(std::string_view type_name, std::string_view text) {
    if (text.empty()) {
        return Result<UriComponents>::err(uri_error(ErrorKind::Uri, type_name, text, "empty URI"));
    }
    if (auto why = find_illegal_character(text)) {
        return Result<UriComponents>::err(uri_error(ErrorKind::Uri, type_name, text, *why));
    }

    const QUrl url(to_qstring(text), QUrl::StrictMode);
    if (!url.isValid()) {
        return Result<UriComponents>::err(
            uri_error(ErrorKind::Uri, type_name, text, url.errorString().toStdString()));
    }

    UriComponents out;
    out.scheme = url.scheme().toStdString();
    if (has_authority(text, out.scheme)) {
        out.authority = url.authority(QUrl::FullyEncoded).toStdString();
    }
    out.host = url.host(QUrl::FullyEncoded).toStdString();
    if (const int port = url.port(-1); port >= 0) {
        out.port = port;
    }
    out.path = url.path(QUrl::FullyEncoded).toStdString();
    if (url.hasQuery()) {
        out.query = url.query(QUrl::FullyEncoded).toStdString();
    }
    if (url.hasFragment()) {
        out.fragment = url.fragment(QUrl::FullyEncoded).toStdString();
    }
    return Result<UriComponents>::ok(std::move(out));
}

} // namespace

// -- UriDatatype -------------------------------------------------------------

const DatatypeInfo& UriDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A universal resource identifier (URI) formatted according to RFC3986.",
        .format = "uri",
        .pattern = R"(^[a-zA-Z][a-zA-Z0-9+\-.]+:.+$)",
        .min_length = 3,
        .cpp_type = "oscal::UriDatatype",
    };
    return kInfo;
}

Result<UriDatatype> UriDatatype::parse(std::string_view text, const ParseOptions&) {
    auto components = decode_uri(kName, text);
    if (components.is_err()) {
        return Result<UriDatatype>::err(components.unwrap_err());
    }
    if (components.unwrap().scheme.empty()) {
        return Result<UriDatatype>::err(uri_error(ErrorKind::UriNotAbsolute, kName, text,
                                                  "URI must be absolute: missing required scheme"));
    }
    return Result<UriDatatype>::ok(UriDatatype(std::string(text), std::move(components).unwrap()));
}

Result<UriDatatype> UriDatatype::resolve(const UriReferenceDatatype& reference) const {
    const QUrl base(to_qstring(raw_), QUrl::StrictMode);
    const QUrl relative(to_qstring(reference.str()), QUrl::StrictMode);
    const auto resolved = base.resolved(relative).toString(QUrl::FullyEncoded).toStdString();
    return parse(resolved);
}

// -- UriReferenceDatatype ----------------------------------------------------

const DatatypeInfo& UriReferenceDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A URI Reference, either a URI or a relative-reference, formatted according to section 4.1 of RFC3986.",
        .format = "uri-reference",
        .min_length = 1,
        .cpp_type = "oscal::UriReferenceDatatype",
    };
    return kInfo;
}

Result<UriReferenceDatatype> UriReferenceDatatype::parse(std::string_view text, const ParseOptions&) {
    return decode_uri(kName, text).map([&](UriComponents components) {
        return UriReferenceDatatype(std::string(text), std::move(components));
    });
}

} // namespace oscal
