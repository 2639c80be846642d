#pragma once

namespace oscal {

// Build-time default for calendar validation of the date family.
#ifdef OSCAL_DATE_VALIDATION
inline constexpr bool kDateValidationDefault = OSCAL_DATE_VALIDATION != 0;
#else
inline constexpr bool kDateValidationDefault = true;
#endif

/**
 * ParseOptions - knobs passed to every datatype parse.
 *
 * date_validation: when set, dates and date-times must name a real calendar
 * instant (month 13 or Feb 30 are rejected). When clear, only the lexical
 * shape is checked.
 */
struct ParseOptions {
    bool date_validation{kDateValidationDefault};

    [[nodiscard]] static constexpr ParseOptions strict() noexcept {
        return ParseOptions{true};
    }

    [[nodiscard]] static constexpr ParseOptions lexical() noexcept {
        return ParseOptions{false};
    }

    /**
     * Options from OSCAL_DATE_VALIDATION=0|1, or the build default when unset.
     */
    [[nodiscard]] static ParseOptions from_environment();

    bool operator==(const ParseOptions&) const = default;
};

} // namespace oscal
