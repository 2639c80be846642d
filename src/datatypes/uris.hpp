#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace oscal {

/**
 * UriComponents - the decoded parts of a URI reference, percent-encoded as
 * written. Absent components are nullopt, present-but-empty ones are "".
 */
struct UriComponents {
    std::string scheme;
    std::optional<std::string> authority;
    std::string host;
    std::optional<int> port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    bool operator==(const UriComponents&) const = default;
};

class UriReferenceDatatype;

/**
 * UriDatatype - an absolute URI: the scheme is required.
 *
 * For relative references and fragments use UriReferenceDatatype.
 */
class UriDatatype {
public:
    static constexpr std::string_view kName = "URIDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    /**
     * Fails with ErrorKind::UriNotAbsolute when the text is a well-formed
     * reference without a scheme, ErrorKind::Uri when it is malformed.
     */
    [[nodiscard]] static Result<UriDatatype> parse(std::string_view text,
                                                   const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const UriComponents& components() const noexcept { return components_; }
    [[nodiscard]] const std::string& scheme() const noexcept { return components_.scheme; }

    /**
     * Resolve a reference against this URI (RFC 3986 section 5).
     */
    [[nodiscard]] Result<UriDatatype> resolve(const UriReferenceDatatype& reference) const;

    bool operator==(const UriDatatype& other) const { return raw_ == other.raw_; }

private:
    UriDatatype(std::string raw, UriComponents components)
        : raw_(std::move(raw)), components_(std::move(components)) {}

    std::string raw_;
    UriComponents components_;
};

/**
 * UriReferenceDatatype - an absolute URI or a relative reference.
 */
class UriReferenceDatatype {
public:
    static constexpr std::string_view kName = "URIReferenceDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<UriReferenceDatatype> parse(std::string_view text,
                                                            const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const UriComponents& components() const noexcept { return components_; }
    [[nodiscard]] bool is_absolute() const noexcept { return !components_.scheme.empty(); }

    bool operator==(const UriReferenceDatatype& other) const { return raw_ == other.raw_; }

private:
    UriReferenceDatatype(std::string raw, UriComponents components)
        : raw_(std::move(raw)), components_(std::move(components)) {}

    std::string raw_;
    UriComponents components_;
};

} // namespace oscal
