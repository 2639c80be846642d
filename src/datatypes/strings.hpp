#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>

#include <string>
#include <string_view>

namespace oscal {

/**
 * StringDatatype - non-empty UTF-8 text without leading or trailing whitespace.
 */
class StringDatatype {
public:
    static constexpr std::string_view kName = "StringDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<StringDatatype> parse(std::string_view text,
                                                      const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }

    bool operator==(const StringDatatype&) const = default;

private:
    explicit StringDatatype(std::string raw) : raw_(std::move(raw)) {}

    std::string raw_;
};

/**
 * TokenDatatype - an XML non-colonized name (NCName): a letter or '_'
 * followed by letters, digits, '.', '-', '_' and combining characters.
 */
class TokenDatatype {
public:
    static constexpr std::string_view kName = "TokenDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<TokenDatatype> parse(std::string_view text,
                                                     const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }

    bool operator==(const TokenDatatype&) const = default;

private:
    explicit TokenDatatype(std::string raw) : raw_(std::move(raw)) {}

    std::string raw_;
};

/**
 * Base64Datatype - binary data in the RFC 4648 base64 alphabet.
 */
class Base64Datatype {
public:
    static constexpr std::string_view kName = "Base64Datatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<Base64Datatype> parse(std::string_view text,
                                                      const ParseOptions& options = {});

    /**
     * Encode bytes with padding. Empty input has no base64 form and fails.
     */
    [[nodiscard]] static Result<Base64Datatype> encode(const QByteArray& bytes);

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const QByteArray& bytes() const noexcept { return bytes_; }

    bool operator==(const Base64Datatype& other) const { return raw_ == other.raw_; }

private:
    Base64Datatype(std::string raw, QByteArray bytes) : raw_(std::move(raw)), bytes_(std::move(bytes)) {}

    std::string raw_;
    QByteArray bytes_;
};

/**
 * EmailAddressDatatype - "local@domain" (RFC 6531), split at the last '@'.
 */
class EmailAddressDatatype {
public:
    static constexpr std::string_view kName = "EmailAddressDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<EmailAddressDatatype> parse(std::string_view text,
                                                            const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] std::string_view local_part() const noexcept {
        return std::string_view(raw_).substr(0, at_);
    }
    [[nodiscard]] std::string_view domain() const noexcept {
        return std::string_view(raw_).substr(at_ + 1);
    }

    bool operator==(const EmailAddressDatatype& other) const { return raw_ == other.raw_; }

private:
    EmailAddressDatatype(std::string raw, size_t at) : raw_(std::move(raw)), at_(at) {}

    std::string raw_;
    size_t at_;
};

/**
 * HostnameDatatype - an internationalized host name (RFC 5890 section 2.3.2.3).
 */
class HostnameDatatype {
public:
    static constexpr std::string_view kName = "HostnameDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<HostnameDatatype> parse(std::string_view text,
                                                        const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }

    /**
     * The ASCII (punycode) form, e.g. "xn--bcher-kva.example" for "bücher.example".
     */
    [[nodiscard]] const std::string& ace() const noexcept { return ace_; }

    bool operator==(const HostnameDatatype& other) const { return raw_ == other.raw_; }

private:
    HostnameDatatype(std::string raw, std::string ace) : raw_(std::move(raw)), ace_(std::move(ace)) {}

    std::string raw_;
    std::string ace_;
};

/**
 * IPv4AddressDatatype - dotted-quad IPv4 (RFC 2673 section 3.2).
 */
class IPv4AddressDatatype {
public:
    static constexpr std::string_view kName = "IPV4AddressDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<IPv4AddressDatatype> parse(std::string_view text,
                                                           const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const QHostAddress& address() const noexcept { return address_; }

    bool operator==(const IPv4AddressDatatype& other) const { return raw_ == other.raw_; }

private:
    IPv4AddressDatatype(std::string raw, QHostAddress address)
        : raw_(std::move(raw)), address_(std::move(address)) {}

    std::string raw_;
    QHostAddress address_;
};

/**
 * IPv6AddressDatatype - IPv6 in RFC 3513 section 2.2 text form, including
 * "::" compression, embedded IPv4 and link-local zone ids.
 */
class IPv6AddressDatatype {
public:
    static constexpr std::string_view kName = "IPV6AddressDatatype";

    [[nodiscard]] static const DatatypeInfo& info();
    [[nodiscard]] static Result<IPv6AddressDatatype> parse(std::string_view text,
                                                           const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const QHostAddress& address() const noexcept { return address_; }

    bool operator==(const IPv6AddressDatatype& other) const { return raw_ == other.raw_; }

private:
    IPv6AddressDatatype(std::string raw, QHostAddress address)
        : raw_(std::move(raw)), address_(std::move(address)) {}

    std::string raw_;
    QHostAddress address_;
};

} // namespace oscal
