#include "core/error.hpp"

namespace oscal {
namespace {

// Inputs are echoed into messages; keep pathological ones readable.
constexpr size_t kMaxEchoedInput = 64;

} // namespace

std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Date: return "date";
        case ErrorKind::Duration: return "duration";
        case ErrorKind::Uri: return "uri";
        case ErrorKind::UriNotAbsolute: return "uri-not-absolute";
        case ErrorKind::Uuid: return "uuid";
        case ErrorKind::Version: return "version";
        case ErrorKind::String: return "string";
        case ErrorKind::Token: return "token";
        case ErrorKind::Base64: return "base64";
        case ErrorKind::Address: return "address";
        case ErrorKind::Boolean: return "boolean";
        case ErrorKind::Number: return "number";
        case ErrorKind::UnrecognizedType: return "unrecognized-type";
        case ErrorKind::Document: return "document";
    }
    return "unknown";
}

Error Error::with_input(std::string_view text) const {
    Error out = *this;
    if (text.size() > kMaxEchoedInput) {
        out.input = std::string(text.substr(0, kMaxEchoedInput)) + "...";
    } else {
        out.input = std::string(text);
    }
    return out;
}

Error Error::at_field(std::string_view segment) const {
    Error out = *this;
    if (segment.empty()) {
        return out;
    }
    if (path.empty()) {
        out.path = std::string(segment);
    } else if (path.front() == '[') {
        out.path = std::string(segment) + path;
    } else {
        out.path = std::string(segment) + "." + path;
    }
    return out;
}

std::string Error::message() const {
    std::string out;
    if (!path.empty()) {
        out += path;
        out += ": ";
    }
    out += "invalid ";
    out += type_name.empty() ? std::string(kind_name(kind)) : type_name;
    if (!input.empty()) {
        out += " \"";
        out += input;
        out += "\"";
    }
    if (!reason.empty()) {
        out += ": ";
        out += reason;
    }
    return out;
}

} // namespace oscal
