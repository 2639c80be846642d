#pragma once

#include <string>
#include <string_view>

namespace oscal {

/**
 * ErrorKind - which datatype family rejected its input.
 */
enum class ErrorKind {
    Date,
    Duration,
    Uri,
    UriNotAbsolute,
    Uuid,
    Version,
    String,
    Token,
    Base64,
    Address,
    Boolean,
    Number,
    UnrecognizedType,
    Document
};

/**
 * Get a stable lower-case tag for an error kind ("date", "uri-not-absolute", ...).
 */
[[nodiscard]] std::string_view kind_name(ErrorKind kind);

/**
 * Error - a rejected construction or deserialization.
 *
 * Carries the expected datatype, the offending text and the reason, either a
 * delegated parser's diagnostic or a locally detected grammar violation.
 * When raised while reading a document, path names the field.
 */
struct Error {
    ErrorKind kind{ErrorKind::Document};
    std::string type_name;
    std::string input;
    std::string reason;
    std::string path;

    Error() = default;
    Error(ErrorKind k, std::string type, std::string why)
        : kind(k), type_name(std::move(type)), reason(std::move(why)) {}

    /**
     * Copy of this error recording the text that was rejected.
     */
    [[nodiscard]] Error with_input(std::string_view text) const;

    /**
     * Copy of this error nested under a document field.
     *
     * Segments are joined with '.', except index segments like "[2]" which
     * attach directly: at_field("a") of an error at "b[2].c" gives "a.b[2].c".
     */
    [[nodiscard]] Error at_field(std::string_view segment) const;

    /**
     * Human readable form: `<path>: invalid <type_name> "<input>": <reason>`.
     */
    [[nodiscard]] std::string message() const;

    bool operator==(const Error&) const = default;
};

} // namespace oscal
