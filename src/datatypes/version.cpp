#include "datatypes/version.hpp"

#include <algorithm>
#include <charconv>

namespace oscal {
namespace {

using Reason = std::string;

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool is_identifier_char(char c) noexcept {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

bool is_numeric(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const auto end = s.find(sep, start);
        if (end == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
}

Result<uint64_t, Reason> parse_core_number(std::string_view s, std::string_view what) {
    using R = Result<uint64_t, Reason>;
    if (s.empty()) {
        return R::err("missing " + std::string(what) + " version");
    }
    if (!is_numeric(s)) {
        return R::err(std::string(what) + " version \"" + std::string(s) + "\" is not numeric");
    }
    if (s.size() > 1 && s.front() == '0') {
        return R::err(std::string(what) + " version \"" + std::string(s) + "\" has a leading zero");
    }
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return R::err(std::string(what) + " version \"" + std::string(s) + "\" is out of range");
    }
    return R::ok(value);
}

Result<std::vector<std::string>, Reason> parse_identifiers(std::string_view s, std::string_view what,
                                                           bool numeric_no_leading_zero) {
    using R = Result<std::vector<std::string>, Reason>;
    std::vector<std::string> out;
    for (const auto id : split(s, '.')) {
        if (id.empty()) {
            return R::err("empty " + std::string(what) + " identifier");
        }
        if (!std::all_of(id.begin(), id.end(), is_identifier_char)) {
            return R::err(std::string(what) + " identifier \"" + std::string(id) +
                          "\" contains characters outside [0-9A-Za-z-]");
        }
        if (numeric_no_leading_zero && is_numeric(id) && id.size() > 1 && id.front() == '0') {
            return R::err(std::string(what) + " identifier \"" + std::string(id) + "\" has a leading zero");
        }
        out.emplace_back(id);
    }
    return R::ok(std::move(out));
}

// Numeric identifiers carry no leading zeros, so a longer one is larger.
std::weak_ordering compare_numeric(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return a.size() < b.size() ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    const auto c = a.compare(b);
    if (c == 0) return std::weak_ordering::equivalent;
    return c < 0 ? std::weak_ordering::less : std::weak_ordering::greater;
}

std::weak_ordering compare_identifier(std::string_view a, std::string_view b) {
    const bool a_num = is_numeric(a);
    const bool b_num = is_numeric(b);
    if (a_num && b_num) return compare_numeric(a, b);
    // Numeric identifiers always have lower precedence than alphanumeric ones.
    if (a_num) return std::weak_ordering::less;
    if (b_num) return std::weak_ordering::greater;
    const auto c = a.compare(b);
    if (c == 0) return std::weak_ordering::equivalent;
    return c < 0 ? std::weak_ordering::less : std::weak_ordering::greater;
}

} // namespace

const DatatypeInfo& VersionDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A version string following Semantic Versioning 2.0.0.",
        .pattern = R"(^(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*)(?:-((?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?(?:\+([0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)",
        .min_length = 5,
        .cpp_type = "oscal::VersionDatatype",
    };
    return kInfo;
}

Result<VersionDatatype> VersionDatatype::parse(std::string_view text, const ParseOptions&) {
    auto fail = [&](Reason why) {
        return Result<VersionDatatype>::err(
            Error(ErrorKind::Version, std::string(kName), std::move(why)).with_input(text));
    };

    if (text.empty()) {
        return fail("empty version string");
    }

    std::string_view rest = text;
    std::string_view build_text;
    bool has_build = false;
    if (const auto plus = rest.find('+'); plus != std::string_view::npos) {
        build_text = rest.substr(plus + 1);
        rest = rest.substr(0, plus);
        has_build = true;
    }

    // The first '-' starts the pre-release; later ones belong to it.
    std::string_view pre_text;
    bool has_pre = false;
    if (const auto dash = rest.find('-'); dash != std::string_view::npos) {
        pre_text = rest.substr(dash + 1);
        rest = rest.substr(0, dash);
        has_pre = true;
    }

    const auto core = split(rest, '.');
    if (core.size() != 3) {
        return fail("expected major.minor.patch, found " + std::to_string(core.size()) + " component(s)");
    }

    VersionDatatype v;
    static constexpr std::string_view kParts[] = {"major", "minor", "patch"};
    uint64_t* targets[] = {&v.major_, &v.minor_, &v.patch_};
    for (size_t i = 0; i < 3; ++i) {
        auto n = parse_core_number(core[i], kParts[i]);
        if (n.is_err()) return fail(n.unwrap_err());
        *targets[i] = n.unwrap();
    }

    if (has_pre) {
        auto ids = parse_identifiers(pre_text, "pre-release", true);
        if (ids.is_err()) return fail(ids.unwrap_err());
        v.prerelease_ = std::move(ids).unwrap();
    }
    if (has_build) {
        auto ids = parse_identifiers(build_text, "build metadata", false);
        if (ids.is_err()) return fail(ids.unwrap_err());
        v.build_ = std::move(ids).unwrap();
    }

    v.raw_ = std::string(text);
    return Result<VersionDatatype>::ok(std::move(v));
}

std::weak_ordering VersionDatatype::operator<=>(const VersionDatatype& other) const {
    if (major_ != other.major_) return major_ < other.major_ ? std::weak_ordering::less : std::weak_ordering::greater;
    if (minor_ != other.minor_) return minor_ < other.minor_ ? std::weak_ordering::less : std::weak_ordering::greater;
    if (patch_ != other.patch_) return patch_ < other.patch_ ? std::weak_ordering::less : std::weak_ordering::greater;

    // A pre-release has lower precedence than the release itself.
    if (prerelease_.empty() != other.prerelease_.empty()) {
        return prerelease_.empty() ? std::weak_ordering::greater : std::weak_ordering::less;
    }

    const auto n = std::min(prerelease_.size(), other.prerelease_.size());
    for (size_t i = 0; i < n; ++i) {
        const auto c = compare_identifier(prerelease_[i], other.prerelease_[i]);
        if (c != 0) return c;
    }
    if (prerelease_.size() != other.prerelease_.size()) {
        return prerelease_.size() < other.prerelease_.size() ? std::weak_ordering::less
                                                             : std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

} // namespace oscal
