#include "datatypes/strings.hpp"

#include <QList>
#include <QString>
#include <QStringDecoder>
#include <QUrl>

#include <algorithm>
#include <optional>

namespace oscal {
namespace {

using Reason = std::string;

Error string_error(ErrorKind kind, std::string_view type_name, std::string_view text, Reason reason) {
    return Error(kind, std::string(type_name), std::move(reason)).with_input(text);
}

// Strict UTF-8 decode; malformed sequences are an error rather than U+FFFD.
Result<QString, Reason> decode_utf8(std::string_view text) {
    QStringDecoder decoder(QStringDecoder::Utf8);
    QString out = decoder.decode(QByteArrayView(text.data(), static_cast<qsizetype>(text.size())));
    if (decoder.hasError()) {
        return Result<QString, Reason>::err("not valid UTF-8");
    }
    return Result<QString, Reason>::ok(std::move(out));
}

bool in_range(char32_t c, char32_t lo, char32_t hi) noexcept { return c >= lo && c <= hi; }

// NameStartChar of XML 1.1 without ':'.
bool is_ncname_start(char32_t c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           in_range(c, 0xC0, 0xD6) || in_range(c, 0xD8, 0xF6) || in_range(c, 0xF8, 0x2FF) ||
           in_range(c, 0x370, 0x37D) || in_range(c, 0x37F, 0x1FFF) || in_range(c, 0x200C, 0x200D) ||
           in_range(c, 0x2070, 0x218F) || in_range(c, 0x2C00, 0x2FEF) || in_range(c, 0x3001, 0xD7FF) ||
           in_range(c, 0xF900, 0xFDCF) || in_range(c, 0xFDF0, 0xFFFD) || in_range(c, 0x10000, 0xEFFFF);
}

bool is_ncname_char(char32_t c) noexcept {
    return is_ncname_start(c) || c == '-' || c == '.' || (c >= '0' && c <= '9') || c == 0xB7 ||
           in_range(c, 0x300, 0x36F) || in_range(c, 0x203F, 0x2040);
}

bool is_ascii_space_or_control(char c) noexcept {
    return static_cast<unsigned char>(c) <= 0x20 || c == 0x7F;
}

// Labels of 1-63 letters, digits and hyphens, not starting or ending with '-'.
std::optional<Reason> check_ace_host(const QByteArray& ace) {
    if (ace.size() > 253) {
        return "host name longer than 253 characters";
    }
    const auto labels = ace.split('.');
    for (qsizetype i = 0; i < labels.size(); ++i) {
        const QByteArray& label = labels[i];
        if (label.isEmpty()) {
            // A single trailing dot names the root.
            if (i == labels.size() - 1 && i > 0) continue;
            return std::string("empty label");
        }
        if (label.size() > 63) {
            return "label \"" + label.toStdString() + "\" longer than 63 characters";
        }
        if (label.startsWith('-') || label.endsWith('-')) {
            return "label \"" + label.toStdString() + "\" starts or ends with '-'";
        }
        const bool ok = std::all_of(label.begin(), label.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
        });
        if (!ok) {
            return "label \"" + label.toStdString() + "\" contains characters not allowed in a host name";
        }
    }
    return std::nullopt;
}

Result<QHostAddress, Reason> parse_address(std::string_view text, QAbstractSocket::NetworkLayerProtocol protocol) {
    using R = Result<QHostAddress, Reason>;
    QHostAddress address;
    if (!address.setAddress(QString::fromLatin1(text.data(), static_cast<qsizetype>(text.size())))) {
        return R::err("not an IP address");
    }
    if (address.protocol() != protocol) {
        return R::err(protocol == QAbstractSocket::IPv4Protocol ? "not an IPv4 address"
                                                                : "not an IPv6 address");
    }
    return R::ok(std::move(address));
}

} // namespace

// ---------------------------------------------------------------------------
// StringDatatype

const DatatypeInfo& StringDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A non-empty string with leading and trailing whitespace disallowed. "
                       "Whitespace is: U+9, U+10, U+32 or [ \\n\\t]+",
        .pattern = R"(^\S(.*\S)?$)",
        .content_encoding = "string",
        .min_length = 1,
        .cpp_type = "oscal::StringDatatype",
    };
    return kInfo;
}

Result<StringDatatype> StringDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<StringDatatype>;
    if (text.empty()) {
        return R::err(string_error(ErrorKind::String, kName, text, "empty string"));
    }
    auto decoded = decode_utf8(text);
    if (decoded.is_err()) {
        return R::err(string_error(ErrorKind::String, kName, text, decoded.unwrap_err()));
    }
    const QString& s = decoded.unwrap();
    if (s.front().isSpace() || s.back().isSpace()) {
        return R::err(string_error(ErrorKind::String, kName, text,
                                   "leading and trailing whitespace is not allowed"));
    }
    return R::ok(StringDatatype(std::string(text)));
}

// ---------------------------------------------------------------------------
// TokenDatatype

const DatatypeInfo& TokenDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A non-colonized name as defined by XML Schema Part 2: Datatypes Second Edition.",
        .pattern = R"(^(\p{L}|_)(\p{L}|\p{N}|[.\-_])*$)",
        .min_length = 1,
        .cpp_type = "oscal::TokenDatatype",
    };
    return kInfo;
}

Result<TokenDatatype> TokenDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<TokenDatatype>;
    if (text.empty()) {
        return R::err(string_error(ErrorKind::Token, kName, text, "empty name"));
    }
    auto decoded = decode_utf8(text);
    if (decoded.is_err()) {
        return R::err(string_error(ErrorKind::Token, kName, text, decoded.unwrap_err()));
    }

    const QList<uint> code_points = decoded.unwrap().toUcs4();
    for (qsizetype i = 0; i < code_points.size(); ++i) {
        const auto c = static_cast<char32_t>(code_points[i]);
        if (i == 0 && !is_ncname_start(c)) {
            return R::err(string_error(ErrorKind::Token, kName, text,
                                       "illegal first character (expected a letter or '_')"));
        }
        if (i > 0 && !is_ncname_char(c)) {
            return R::err(string_error(ErrorKind::Token, kName, text,
                                       "illegal character at position " + std::to_string(i)));
        }
    }
    return R::ok(TokenDatatype(std::string(text)));
}

// ---------------------------------------------------------------------------
// Base64Datatype

const DatatypeInfo& Base64Datatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "Binary data encoded using the Base 64 encoding algorithm as defined by RFC4648.",
        .pattern = R"(^[0-9A-Za-z+\/]+={0,2}$)",
        .content_encoding = "base64",
        .min_length = 1,
        .cpp_type = "oscal::Base64Datatype",
    };
    return kInfo;
}

Result<Base64Datatype> Base64Datatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<Base64Datatype>;
    if (!matches_pattern(info(), text)) {
        return R::err(string_error(ErrorKind::Base64, kName, text,
                                   "characters outside the base64 alphabet or misplaced padding"));
    }
    const auto decoded = QByteArray::fromBase64Encoding(
        QByteArray(text.data(), static_cast<qsizetype>(text.size())),
        QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
    if (decoded.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
        return R::err(string_error(ErrorKind::Base64, kName, text, "undecodable base64"));
    }
    return R::ok(Base64Datatype(std::string(text), decoded.decoded));
}

Result<Base64Datatype> Base64Datatype::encode(const QByteArray& bytes) {
    if (bytes.isEmpty()) {
        return Result<Base64Datatype>::err(
            Error(ErrorKind::Base64, std::string(kName), "nothing to encode, empty input"));
    }
    return Result<Base64Datatype>::ok(Base64Datatype(bytes.toBase64().toStdString(), bytes));
}

// ---------------------------------------------------------------------------
// EmailAddressDatatype

const DatatypeInfo& EmailAddressDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An email address string formatted according to RFC 6531.",
        .format = "email",
        .pattern = R"(^.+@.+$)",
        .min_length = 3,
        .cpp_type = "oscal::EmailAddressDatatype",
    };
    return kInfo;
}

Result<EmailAddressDatatype> EmailAddressDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<EmailAddressDatatype>;
    auto fail = [&](Reason why) { return R::err(string_error(ErrorKind::String, kName, text, std::move(why))); };

    const auto at = text.rfind('@');
    if (at == std::string_view::npos) {
        return fail("missing '@'");
    }
    if (at == 0) {
        return fail("empty local part");
    }
    if (at + 1 == text.size()) {
        return fail("empty domain");
    }
    if (std::any_of(text.begin(), text.end(), is_ascii_space_or_control)) {
        return fail("whitespace or control characters are not allowed");
    }
    auto decoded = decode_utf8(text);
    if (decoded.is_err()) {
        return fail(decoded.unwrap_err());
    }
    return R::ok(EmailAddressDatatype(std::string(text), at));
}

// ---------------------------------------------------------------------------
// HostnameDatatype

const DatatypeInfo& HostnameDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An internationalized Internet host name string formatted according to "
                       "section 2.3.2.3 of RFC5890.",
        .format = "idn-hostname",
        .min_length = 1,
        .cpp_type = "oscal::HostnameDatatype",
    };
    return kInfo;
}

Result<HostnameDatatype> HostnameDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<HostnameDatatype>;
    auto fail = [&](Reason why) { return R::err(string_error(ErrorKind::String, kName, text, std::move(why))); };

    if (text.empty()) {
        return fail("empty host name");
    }
    if (std::any_of(text.begin(), text.end(), is_ascii_space_or_control)) {
        return fail("whitespace or control characters are not allowed");
    }
    auto decoded = decode_utf8(text);
    if (decoded.is_err()) {
        return fail(decoded.unwrap_err());
    }

    const QByteArray ace = QUrl::toAce(decoded.unwrap());
    if (ace.isEmpty()) {
        return fail("not convertible to an ASCII host name");
    }
    if (auto why = check_ace_host(ace)) {
        return fail(std::move(*why));
    }
    return R::ok(HostnameDatatype(std::string(text), ace.toStdString()));
}

// ---------------------------------------------------------------------------
// IP addresses

const DatatypeInfo& IPv4AddressDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An Internet Protocol version 4 address represented using dotted-quad syntax "
                       "as defined in section 3.2 of RFC2673.",
        .format = "ipv4",
        .pattern = R"(^((25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])\.){3}(25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])$)",
        .min_length = 7,
        .max_length = 15,
        .cpp_type = "oscal::IPv4AddressDatatype",
    };
    return kInfo;
}

Result<IPv4AddressDatatype> IPv4AddressDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<IPv4AddressDatatype>;
    // QHostAddress also takes shorthand like "10.1"; the pattern does not.
    if (!matches_pattern(info(), text)) {
        return R::err(string_error(ErrorKind::Address, kName, text, "not a dotted-quad IPv4 address"));
    }
    auto address = parse_address(text, QAbstractSocket::IPv4Protocol);
    if (address.is_err()) {
        return R::err(string_error(ErrorKind::Address, kName, text, address.unwrap_err()));
    }
    return R::ok(IPv4AddressDatatype(std::string(text), std::move(address).unwrap()));
}

const DatatypeInfo& IPv6AddressDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An Internet Protocol version 6 address represented using the syntax defined "
                       "in section 2.2 of RFC3513.",
        .format = "ipv6",
        .pattern = R"(^(([0-9a-fA-F]{1,4}:){7,7}[0-9a-fA-F]{1,4}|([0-9a-fA-F]{1,4}:){1,7}:|([0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4}|([0-9a-fA-F]{1,4}:){1,5}(:[0-9a-fA-F]{1,4}){1,2}|([0-9a-fA-F]{1,4}:){1,4}(:[0-9a-fA-F]{1,4}){1,3}|([0-9a-fA-F]{1,4}:){1,3}(:[0-9a-fA-F]{1,4}){1,4}|([0-9a-fA-F]{1,4}:){1,2}(:[0-9a-fA-F]{1,4}){1,5}|[0-9a-fA-F]{1,4}:((:[0-9a-fA-F]{1,4}){1,6})|:((:[0-9a-fA-F]{1,4}){1,7}|:)|[fF][eE]80:(:[0-9a-fA-F]{0,4}){0,4}%[0-9a-zA-Z]{1,}|::([fF]{4}(:0{1,4}){0,1}:){0,1}((25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])\.){3,3}(25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])|([0-9a-fA-F]{1,4}:){1,4}:((25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9])\.){3,3}(25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9][0-9]|[0-9]))$)",
        .min_length = 2,
        .cpp_type = "oscal::IPv6AddressDatatype",
    };
    return kInfo;
}

Result<IPv6AddressDatatype> IPv6AddressDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<IPv6AddressDatatype>;
    if (!matches_pattern(info(), text)) {
        return R::err(string_error(ErrorKind::Address, kName, text, "not an RFC 3513 IPv6 address"));
    }
    auto address = parse_address(text, QAbstractSocket::IPv6Protocol);
    if (address.is_err()) {
        return R::err(string_error(ErrorKind::Address, kName, text, address.unwrap_err()));
    }
    return R::ok(IPv6AddressDatatype(std::string(text), std::move(address).unwrap()));
}

} // namespace oscal
