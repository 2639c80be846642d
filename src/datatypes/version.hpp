#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace oscal {

/**
 * VersionDatatype - a Semantic Versioning 2.0.0 string:
 * major.minor.patch[-prerelease][+build].
 *
 * Ordering follows semver precedence and ignores build metadata, so
 * "1.0.0+a" and "1.0.0+b" are equivalent (neither is less) yet not equal.
 */
class VersionDatatype {
public:
    static constexpr std::string_view kName = "VersionDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<VersionDatatype> parse(std::string_view text,
                                                       const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }

    [[nodiscard]] uint64_t major() const noexcept { return major_; }
    [[nodiscard]] uint64_t minor() const noexcept { return minor_; }
    [[nodiscard]] uint64_t patch() const noexcept { return patch_; }
    [[nodiscard]] const std::vector<std::string>& prerelease() const noexcept { return prerelease_; }
    [[nodiscard]] const std::vector<std::string>& build() const noexcept { return build_; }

    [[nodiscard]] bool is_prerelease() const noexcept { return !prerelease_.empty(); }

    std::weak_ordering operator<=>(const VersionDatatype& other) const;
    bool operator==(const VersionDatatype& other) const { return raw_ == other.raw_; }

private:
    VersionDatatype() = default;

    std::string raw_;
    uint64_t major_{0};
    uint64_t minor_{0};
    uint64_t patch_{0};
    std::vector<std::string> prerelease_;
    std::vector<std::string> build_;
};

} // namespace oscal
