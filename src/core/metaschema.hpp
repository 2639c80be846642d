#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace oscal {

/**
 * DatatypeInfo - the declarative description of a datatype.
 *
 * This is what a metaschema or JSON schema generator needs to emit a field
 * rule (type, format, pattern, length and value bounds). It does not replace parse():
 * several datatypes check more than their pattern can express.
 */
struct DatatypeInfo {
    std::string_view name;
    std::string_view description;
    std::string_view json_type{"string"};
    std::string_view format{};
    std::string_view pattern{};
    std::string_view content_encoding{};
    std::size_t min_length{0};
    std::optional<std::size_t> max_length{};
    std::string_view cpp_type{};
    std::optional<std::int64_t> minimum{};
    std::optional<std::int64_t> maximum{};
};

/**
 * Check text against the datatype's pattern, anchored at both ends.
 * A datatype without a pattern matches everything.
 */
[[nodiscard]] bool matches_pattern(const DatatypeInfo& info, std::string_view text);

/**
 * Check text against the datatype's length bounds.
 */
[[nodiscard]] constexpr bool within_length(const DatatypeInfo& info, std::string_view text) noexcept {
    if (text.size() < info.min_length) return false;
    if (info.max_length && text.size() > *info.max_length) return false;
    return true;
}

} // namespace oscal
