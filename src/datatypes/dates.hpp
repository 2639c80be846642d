#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <QDate>
#include <QDateTime>
#include <QTime>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace oscal {

/**
 * CalendarDate - the decoded YYYY-MM-DD part of a date or date-time.
 *
 * Fields hold what was written. With date validation disabled they may
 * not name a real day (month 13, Feb 30); is_valid() tells.
 */
struct CalendarDate {
    int year{1970};
    unsigned month{1};
    unsigned day{1};

    [[nodiscard]] bool is_valid() const {
        return QDate::isValid(year, static_cast<int>(month), static_cast<int>(day));
    }

    [[nodiscard]] QDate to_qdate() const {
        return QDate(year, static_cast<int>(month), static_cast<int>(day));
    }

    bool operator==(const CalendarDate&) const = default;
};

/**
 * TimeOfDay - the decoded hh:mm:ss[.fraction] part of a date-time.
 * Fraction digits past nanosecond precision are dropped from nanosecond.
 */
struct TimeOfDay {
    unsigned hour{0};
    unsigned minute{0};
    unsigned second{0};
    std::uint32_t nanosecond{0};

    [[nodiscard]] bool is_valid() const {
        return QTime::isValid(static_cast<int>(hour), static_cast<int>(minute), static_cast<int>(second));
    }

    // Millisecond precision; the rest of nanosecond is carried by Instant.
    [[nodiscard]] QTime to_qtime() const {
        return QTime(static_cast<int>(hour), static_cast<int>(minute), static_cast<int>(second),
                     static_cast<int>(nanosecond / 1000000));
    }

    bool operator==(const TimeOfDay&) const = default;
};

/**
 * UtcOffset - a trailing "Z" or "+hh:mm"/"-hh:mm".
 */
struct UtcOffset {
    bool zulu{false};       // written as "Z"
    bool negative{false};
    unsigned hours{0};
    unsigned minutes{0};

    // Signed offset east of UTC.
    [[nodiscard]] int total_minutes() const noexcept {
        const int magnitude = static_cast<int>(hours * 60 + minutes);
        return negative ? -magnitude : magnitude;
    }

    [[nodiscard]] bool is_valid() const noexcept { return hours < 24 && minutes < 60; }

    bool operator==(const UtcOffset&) const = default;
};

/**
 * Instant - a moment on the UTC time line.
 *
 * `at` keeps the offset it was written with, so two instants written in
 * different zones still compare equal. QDateTime stops at milliseconds;
 * sub_millisecond holds the remaining nanoseconds.
 */
struct Instant {
    QDateTime at;
    std::uint32_t sub_millisecond{0};

    bool operator==(const Instant& other) const {
        return at == other.at && sub_millisecond == other.sub_millisecond;
    }
};

/**
 * DateDatatype - a 24-hour period, "2024-02-10", with an optional offset.
 */
class DateDatatype {
public:
    static constexpr std::string_view kName = "DateDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DateDatatype> parse(std::string_view text,
                                                    const ParseOptions& options = {});

    /**
     * The current local date, without an offset.
     */
    [[nodiscard]] static DateDatatype today();

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const CalendarDate& date() const noexcept { return date_; }
    [[nodiscard]] const std::optional<UtcOffset>& offset() const noexcept { return offset_; }

    bool operator==(const DateDatatype& other) const { return raw_ == other.raw_; }

private:
    DateDatatype(std::string raw, CalendarDate date, std::optional<UtcOffset> offset)
        : raw_(std::move(raw)), date_(date), offset_(offset) {}

    std::string raw_;
    CalendarDate date_;
    std::optional<UtcOffset> offset_;
};

/**
 * DateTimeDatatype - a point in time, "2024-04-13T09:57:13", with an
 * optional fractional second and an optional offset.
 */
class DateTimeDatatype {
public:
    static constexpr std::string_view kName = "DateTimeDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DateTimeDatatype> parse(std::string_view text,
                                                        const ParseOptions& options = {});

    /**
     * The current local time to the second, without an offset.
     */
    [[nodiscard]] static DateTimeDatatype now();

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const CalendarDate& date() const noexcept { return date_; }
    [[nodiscard]] const TimeOfDay& time() const noexcept { return time_; }
    [[nodiscard]] const std::optional<UtcOffset>& offset() const noexcept { return offset_; }

    /**
     * The UTC instant named by this value. Fails when there is no offset or
     * the fields are not a real calendar time (possible in lexical mode).
     */
    [[nodiscard]] Result<Instant> instant() const;

    /**
     * RFC 2822 rendering ("Sat, 13 Apr 2024 09:57:13 +0500"), when instant() succeeds.
     */
    [[nodiscard]] std::optional<std::string> to_rfc2822() const;

    bool operator==(const DateTimeDatatype& other) const { return raw_ == other.raw_; }

private:
    DateTimeDatatype(std::string raw, CalendarDate date, TimeOfDay time,
                     std::optional<UtcOffset> offset)
        : raw_(std::move(raw)), date_(date), time_(time), offset_(offset) {}

    std::string raw_;
    CalendarDate date_;
    TimeOfDay time_;
    std::optional<UtcOffset> offset_;
};

/**
 * DateTimeWithTimezoneDatatype - a date-time whose offset is required.
 */
class DateTimeWithTimezoneDatatype {
public:
    static constexpr std::string_view kName = "DateTimeWithTimezoneDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DateTimeWithTimezoneDatatype> parse(std::string_view text,
                                                                    const ParseOptions& options = {});

    /**
     * The current UTC time to the second, written with "Z".
     */
    [[nodiscard]] static DateTimeWithTimezoneDatatype now();

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const CalendarDate& date() const noexcept { return date_; }
    [[nodiscard]] const TimeOfDay& time() const noexcept { return time_; }
    [[nodiscard]] const UtcOffset& offset() const noexcept { return offset_; }

    [[nodiscard]] Result<Instant> instant() const;
    [[nodiscard]] std::optional<std::string> to_rfc2822() const;

    bool operator==(const DateTimeWithTimezoneDatatype& other) const { return raw_ == other.raw_; }

private:
    DateTimeWithTimezoneDatatype(std::string raw, CalendarDate date, TimeOfDay time, UtcOffset offset)
        : raw_(std::move(raw)), date_(date), time_(time), offset_(offset) {}

    std::string raw_;
    CalendarDate date_;
    TimeOfDay time_;
    UtcOffset offset_;
};

/**
 * Whether two offset-bearing date-times name the same instant, e.g.
 * "2020-01-01T00:00:00Z" and "2020-01-01T05:30:00+05:30". Fails when either
 * side has no instant.
 */
[[nodiscard]] Result<bool> same_instant(const DateTimeWithTimezoneDatatype& a,
                                        const DateTimeWithTimezoneDatatype& b);
[[nodiscard]] Result<bool> same_instant(const DateTimeDatatype& a, const DateTimeDatatype& b);

} // namespace oscal
