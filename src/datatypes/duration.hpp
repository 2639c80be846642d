#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace oscal {

/**
 * DurationComponents - the decoded fields of an ISO-8601 duration.
 * Designators that were not written read as zero.
 */
struct DurationComponents {
    bool negative{false};
    std::uint32_t years{0};
    std::uint32_t months{0};
    std::uint32_t days{0};
    std::uint32_t hours{0};
    std::uint32_t minutes{0};
    std::uint32_t seconds{0};
    std::uint32_t nanoseconds{0};

    bool operator==(const DurationComponents&) const = default;
};

/**
 * DurationDatatype - an ISO-8601 duration, [-]P[nY][nM][nD][T[nH][nM][n[.f]S]].
 *
 * Only seconds take a fraction (up to nanosecond precision). Weeks ("P2W")
 * are not part of the metaschema grammar and are rejected.
 */
class DurationDatatype {
public:
    static constexpr std::string_view kName = "DurationDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DurationDatatype> parse(std::string_view text,
                                                        const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const DurationComponents& components() const noexcept { return parts_; }

    [[nodiscard]] bool is_negative() const noexcept { return parts_.negative; }
    [[nodiscard]] std::uint32_t years() const noexcept { return parts_.years; }
    [[nodiscard]] std::uint32_t months() const noexcept { return parts_.months; }
    [[nodiscard]] std::uint32_t days() const noexcept { return parts_.days; }
    [[nodiscard]] std::uint32_t hours() const noexcept { return parts_.hours; }
    [[nodiscard]] std::uint32_t minutes() const noexcept { return parts_.minutes; }
    [[nodiscard]] std::uint32_t seconds() const noexcept { return parts_.seconds; }
    [[nodiscard]] std::uint32_t nanoseconds() const noexcept { return parts_.nanoseconds; }

    // Which designators were written, not whether they are non-zero.
    [[nodiscard]] bool has_year_month() const noexcept { return has_year_month_; }
    [[nodiscard]] bool has_day_time() const noexcept { return has_day_time_; }

    // Same components written with the same designator families: "P0Y" and
    // "PT0S" differ, as do "P1Y" and "P1Y0D".
    bool operator==(const DurationDatatype& other) const {
        return parts_ == other.parts_ && has_year_month_ == other.has_year_month_ &&
               has_day_time_ == other.has_day_time_;
    }

private:
    DurationDatatype() = default;

    std::string raw_;
    DurationComponents parts_;
    bool has_year_month_{false};
    bool has_day_time_{false};
};

/**
 * Order two durations by length.
 *
 * A month has no fixed length in days, so only two year-month durations or
 * two day-time durations can be compared; anything else is a Duration error.
 */
[[nodiscard]] Result<std::weak_ordering> compare(const DurationDatatype& a, const DurationDatatype& b);

/**
 * DayTimeDurationDatatype - a duration written with days, hours, minutes and
 * seconds only.
 */
class DayTimeDurationDatatype {
public:
    static constexpr std::string_view kName = "DayTimeDurationDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DayTimeDurationDatatype> parse(std::string_view text,
                                                               const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return duration_.str(); }
    [[nodiscard]] const DurationDatatype& duration() const noexcept { return duration_; }

    // Total length; "P1D" and "PT24H" are equivalent but not equal.
    std::weak_ordering operator<=>(const DayTimeDurationDatatype& other) const;
    bool operator==(const DayTimeDurationDatatype& other) const { return duration_ == other.duration_; }

private:
    explicit DayTimeDurationDatatype(DurationDatatype d) : duration_(std::move(d)) {}

    DurationDatatype duration_;
};

/**
 * YearMonthDurationDatatype - a duration written with years and months only.
 */
class YearMonthDurationDatatype {
public:
    static constexpr std::string_view kName = "YearMonthDurationDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<YearMonthDurationDatatype> parse(std::string_view text,
                                                                 const ParseOptions& options = {});

    [[nodiscard]] const std::string& str() const noexcept { return duration_.str(); }
    [[nodiscard]] const DurationDatatype& duration() const noexcept { return duration_; }

    [[nodiscard]] std::int64_t total_months() const noexcept;

    std::weak_ordering operator<=>(const YearMonthDurationDatatype& other) const;
    bool operator==(const YearMonthDurationDatatype& other) const { return duration_ == other.duration_; }

private:
    explicit YearMonthDurationDatatype(DurationDatatype d) : duration_(std::move(d)) {}

    DurationDatatype duration_;
};

} // namespace oscal
