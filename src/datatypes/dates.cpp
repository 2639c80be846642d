#include "datatypes/dates.hpp"

#include <QString>
#include <QTimeZone>

namespace oscal {
namespace {

constexpr std::string_view kDatePattern =
    R"(^(((2000|2400|2800|(19|2[0-9](0[48]|[2468][048]|[13579][26])))-02-29)|(((19|2[0-9])[0-9]{2})-02-(0[1-9]|1[0-9]|2[0-8]))|(((19|2[0-9])[0-9]{2})-(0[13578]|10|12)-(0[1-9]|[12][0-9]|3[01]))|(((19|2[0-9])[0-9]{2})-(0[469]|11)-(0[1-9]|[12][0-9]|30)))(Z|(-((0[0-9]|1[0-2]):00|0[39]:30)|\+((0[0-9]|1[0-4]):00|(0[34569]|10):30|(0[58]|12):45)))?$)";

constexpr std::string_view kDateTimePattern =
    R"(^(((2000|2400|2800|(19|2[0-9](0[48]|[2468][048]|[13579][26])))-02-29)|(((19|2[0-9])[0-9]{2})-02-(0[1-9]|1[0-9]|2[0-8]))|(((19|2[0-9])[0-9]{2})-(0[13578]|10|12)-(0[1-9]|[12][0-9]|3[01]))|(((19|2[0-9])[0-9]{2})-(0[469]|11)-(0[1-9]|[12][0-9]|30)))T(2[0-3]|[01][0-9]):([0-5][0-9]):([0-5][0-9])(\.[0-9]+)?(Z|(-((0[0-9]|1[0-2]):00|0[39]:30)|\+((0[0-9]|1[0-4]):00|(0[34569]|10):30|(0[58]|12):45)))?$)";

constexpr std::string_view kDateTimeWithTimezonePattern =
    R"(^(((2000|2400|2800|(19|2[0-9](0[48]|[2468][048]|[13579][26])))-02-29)|(((19|2[0-9])[0-9]{2})-02-(0[1-9]|1[0-9]|2[0-8]))|(((19|2[0-9])[0-9]{2})-(0[13578]|10|12)-(0[1-9]|[12][0-9]|3[01]))|(((19|2[0-9])[0-9]{2})-(0[469]|11)-(0[1-9]|[12][0-9]|30)))T(2[0-3]|[01][0-9]):([0-5][0-9]):([0-5][0-9])(\.[0-9]+)?(Z|(-((0[0-9]|1[0-2]):00|0[39]:30)|\+((0[0-9]|1[0-4]):00|(0[34569]|10):30|(0[58]|12):45)))$)";

using Reason = std::string;

// Left-to-right reader over the lexical grammar. Every expect_* either
// advances or leaves a reason naming the position that failed.
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ == text_.size(); }
    [[nodiscard]] size_t pos() const noexcept { return pos_; }

    [[nodiscard]] bool peek(char c) const noexcept {
        return pos_ < text_.size() && text_[pos_] == c;
    }

    bool consume(char c) noexcept {
        if (!peek(c)) return false;
        ++pos_;
        return true;
    }

    Result<unsigned, Reason> expect_digits(size_t count, std::string_view what) {
        unsigned value = 0;
        for (size_t i = 0; i < count; ++i) {
            if (pos_ + i >= text_.size() || !is_digit(text_[pos_ + i])) {
                return Result<unsigned, Reason>::err(
                    "expected " + std::to_string(count) + "-digit " + std::string(what) +
                    " at position " + std::to_string(pos_));
            }
            value = value * 10 + static_cast<unsigned>(text_[pos_ + i] - '0');
        }
        pos_ += count;
        return Result<unsigned, Reason>::ok(value);
    }

    Result<bool, Reason> expect(char c) {
        if (consume(c)) return Result<bool, Reason>::ok(true);
        return Result<bool, Reason>::err(
            std::string("expected '") + c + "' at position " + std::to_string(pos_));
    }

    // One or more digits; returns the digits consumed.
    std::string_view take_digits() noexcept {
        const auto start = pos_;
        while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
        return text_.substr(start, pos_ - start);
    }

private:
    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    std::string_view text_;
    size_t pos_{0};
};

Result<CalendarDate, Reason> read_date(Cursor& cur) {
    auto year = cur.expect_digits(4, "year");
    if (year.is_err()) return Result<CalendarDate, Reason>::err(year.unwrap_err());
    if (auto sep = cur.expect('-'); sep.is_err()) return Result<CalendarDate, Reason>::err(sep.unwrap_err());
    auto month = cur.expect_digits(2, "month");
    if (month.is_err()) return Result<CalendarDate, Reason>::err(month.unwrap_err());
    if (auto sep = cur.expect('-'); sep.is_err()) return Result<CalendarDate, Reason>::err(sep.unwrap_err());
    auto day = cur.expect_digits(2, "day");
    if (day.is_err()) return Result<CalendarDate, Reason>::err(day.unwrap_err());

    return Result<CalendarDate, Reason>::ok(CalendarDate{
        .year = static_cast<int>(year.unwrap()),
        .month = month.unwrap(),
        .day = day.unwrap(),
    });
}

Result<TimeOfDay, Reason> read_time(Cursor& cur) {
    auto hour = cur.expect_digits(2, "hour");
    if (hour.is_err()) return Result<TimeOfDay, Reason>::err(hour.unwrap_err());
    if (auto sep = cur.expect(':'); sep.is_err()) return Result<TimeOfDay, Reason>::err(sep.unwrap_err());
    auto minute = cur.expect_digits(2, "minute");
    if (minute.is_err()) return Result<TimeOfDay, Reason>::err(minute.unwrap_err());
    if (auto sep = cur.expect(':'); sep.is_err()) return Result<TimeOfDay, Reason>::err(sep.unwrap_err());
    auto second = cur.expect_digits(2, "second");
    if (second.is_err()) return Result<TimeOfDay, Reason>::err(second.unwrap_err());

    TimeOfDay time{
        .hour = hour.unwrap(),
        .minute = minute.unwrap(),
        .second = second.unwrap(),
        .nanosecond = 0,
    };

    if (cur.consume('.')) {
        const auto fraction = cur.take_digits();
        if (fraction.empty()) {
            return Result<TimeOfDay, Reason>::err(
                "expected fractional second digits at position " + std::to_string(cur.pos()));
        }
        std::uint32_t nanos = 0;
        for (size_t i = 0; i < 9; ++i) {
            nanos *= 10;
            if (i < fraction.size()) nanos += static_cast<std::uint32_t>(fraction[i] - '0');
        }
        time.nanosecond = nanos;
    }
    return Result<TimeOfDay, Reason>::ok(time);
}

// Returns nullopt when no offset is written.
Result<std::optional<UtcOffset>, Reason> read_offset(Cursor& cur) {
    using R = Result<std::optional<UtcOffset>, Reason>;
    if (cur.consume('Z')) {
        return R::ok(UtcOffset{.zulu = true});
    }

    bool negative = false;
    if (cur.consume('-')) {
        negative = true;
    } else if (!cur.consume('+')) {
        return R::ok(std::nullopt);
    }

    auto hours = cur.expect_digits(2, "offset hour");
    if (hours.is_err()) return R::err(hours.unwrap_err());
    if (auto sep = cur.expect(':'); sep.is_err()) return R::err(sep.unwrap_err());
    auto minutes = cur.expect_digits(2, "offset minute");
    if (minutes.is_err()) return R::err(minutes.unwrap_err());

    return R::ok(UtcOffset{
        .zulu = false,
        .negative = negative,
        .hours = hours.unwrap(),
        .minutes = minutes.unwrap(),
    });
}

std::optional<Reason> check_date(const CalendarDate& date) {
    if (date.month < 1 || date.month > 12) {
        return "month " + std::to_string(date.month) + " is out of range";
    }
    if (date.year == 0) {
        return std::string("year 0000 is not a calendar year");
    }
    if (!date.is_valid()) {
        return "day " + std::to_string(date.day) + " is out of range for " +
               QString::asprintf("%04d-%02u", date.year, date.month).toStdString();
    }
    return std::nullopt;
}

std::optional<Reason> check_time(const TimeOfDay& time) {
    if (!time.is_valid()) {
        return "time " +
               QString::asprintf("%02u:%02u:%02u", time.hour, time.minute, time.second).toStdString() +
               " is out of range";
    }
    return std::nullopt;
}

std::optional<Reason> check_offset(const UtcOffset& offset) {
    if (offset.hours >= 24) return "offset hour " + std::to_string(offset.hours) + " is out of range";
    if (offset.minutes >= 60) return "offset minute " + std::to_string(offset.minutes) + " is out of range";
    return std::nullopt;
}

struct DecodedDateTime {
    CalendarDate date;
    TimeOfDay time;
    std::optional<UtcOffset> offset;
};

// Shared by DateTime and DateTimeWithTimezone; the caller decides whether
// a missing offset is acceptable.
Result<DecodedDateTime, Reason> decode_date_time(std::string_view text, const ParseOptions& options) {
    using R = Result<DecodedDateTime, Reason>;
    Cursor cur(text);

    auto date = read_date(cur);
    if (date.is_err()) return R::err(date.unwrap_err());
    if (!cur.consume('T')) {
        return R::err("expected 'T' between date and time at position " + std::to_string(cur.pos()));
    }
    auto time = read_time(cur);
    if (time.is_err()) return R::err(time.unwrap_err());
    auto offset = read_offset(cur);
    if (offset.is_err()) return R::err(offset.unwrap_err());
    if (!cur.at_end()) {
        return R::err("unexpected trailing text at position " + std::to_string(cur.pos()));
    }

    DecodedDateTime decoded{date.unwrap(), time.unwrap(), offset.unwrap()};
    if (options.date_validation) {
        if (auto why = check_date(decoded.date)) return R::err(*why);
        if (auto why = check_time(decoded.time)) return R::err(*why);
        if (decoded.offset) {
            if (auto why = check_offset(*decoded.offset)) return R::err(*why);
        }
    }
    return R::ok(decoded);
}

Error date_error(std::string_view type_name, std::string_view text, Reason reason) {
    return Error(ErrorKind::Date, std::string(type_name), std::move(reason)).with_input(text);
}

Result<Instant> instant_of(std::string_view type_name, const std::string& raw,
                           const CalendarDate& date, const TimeOfDay& time,
                           const std::optional<UtcOffset>& offset) {
    if (!offset) {
        return Result<Instant>::err(date_error(type_name, raw, "no UTC offset, instant is ambiguous"));
    }
    if (auto why = check_date(date)) {
        return Result<Instant>::err(date_error(type_name, raw, *why));
    }
    if (auto why = check_time(time)) {
        return Result<Instant>::err(date_error(type_name, raw, *why));
    }
    if (auto why = check_offset(*offset)) {
        return Result<Instant>::err(date_error(type_name, raw, *why));
    }

    const QDateTime at(date.to_qdate(), time.to_qtime(),
                       QTimeZone::fromSecondsAheadOfUtc(offset->total_minutes() * 60));
    if (!at.isValid()) {
        return Result<Instant>::err(date_error(type_name, raw, "offset is not representable as a time zone"));
    }
    return Result<Instant>::ok(Instant{at, time.nanosecond % 1000000});
}

std::string rfc2822(const Instant& instant) {
    return instant.at.toString(Qt::RFC2822Date).toStdString();
}

} // namespace

// -- DateDatatype ------------------------------------------------------------

const DatatypeInfo& DateDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A string representing a 24-hour period with an optional timezone.",
        .pattern = kDatePattern,
        .min_length = 10,
        .max_length = 16,
        .cpp_type = "oscal::DateDatatype",
    };
    return kInfo;
}

Result<DateDatatype> DateDatatype::parse(std::string_view text, const ParseOptions& options) {
    Cursor cur(text);

    auto date = read_date(cur);
    if (date.is_err()) {
        return Result<DateDatatype>::err(date_error(kName, text, date.unwrap_err()));
    }
    auto offset = read_offset(cur);
    if (offset.is_err()) {
        return Result<DateDatatype>::err(date_error(kName, text, offset.unwrap_err()));
    }
    if (!cur.at_end()) {
        return Result<DateDatatype>::err(date_error(
            kName, text, "unexpected trailing text at position " + std::to_string(cur.pos())));
    }

    if (options.date_validation) {
        if (auto why = check_date(date.unwrap())) {
            return Result<DateDatatype>::err(date_error(kName, text, *why));
        }
        if (offset.unwrap()) {
            if (auto why = check_offset(*offset.unwrap())) {
                return Result<DateDatatype>::err(date_error(kName, text, *why));
            }
        }
    }

    return Result<DateDatatype>::ok(DateDatatype(std::string(text), date.unwrap(), offset.unwrap()));
}

DateDatatype DateDatatype::today() {
    const auto now = QDate::currentDate();
    const CalendarDate date{
        .year = now.year(),
        .month = static_cast<unsigned>(now.month()),
        .day = static_cast<unsigned>(now.day()),
    };
    return DateDatatype(now.toString(Qt::ISODate).toStdString(), date, std::nullopt);
}

// -- DateTimeDatatype --------------------------------------------------------

const DatatypeInfo& DateTimeDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A string representing a point in time with an optional timezone.",
        .pattern = kDateTimePattern,
        .min_length = 19,
        .cpp_type = "oscal::DateTimeDatatype",
    };
    return kInfo;
}

Result<DateTimeDatatype> DateTimeDatatype::parse(std::string_view text, const ParseOptions& options) {
    auto decoded = decode_date_time(text, options);
    if (decoded.is_err()) {
        return Result<DateTimeDatatype>::err(date_error(kName, text, decoded.unwrap_err()));
    }
    const auto& d = decoded.unwrap();
    return Result<DateTimeDatatype>::ok(DateTimeDatatype(std::string(text), d.date, d.time, d.offset));
}

DateTimeDatatype DateTimeDatatype::now() {
    const auto now = QDateTime::currentDateTime();
    const auto d = now.date();
    const auto t = now.time();
    return DateTimeDatatype(
        now.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")).toStdString(),
        CalendarDate{d.year(), static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day())},
        TimeOfDay{static_cast<unsigned>(t.hour()), static_cast<unsigned>(t.minute()),
                  static_cast<unsigned>(t.second()), 0},
        std::nullopt);
}

Result<Instant> DateTimeDatatype::instant() const {
    return instant_of(kName, raw_, date_, time_, offset_);
}

std::optional<std::string> DateTimeDatatype::to_rfc2822() const {
    auto at = instant();
    if (at.is_err()) return std::nullopt;
    return rfc2822(at.unwrap());
}

// -- DateTimeWithTimezoneDatatype --------------------------------------------

const DatatypeInfo& DateTimeWithTimezoneDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A string representing a point in time with a required timezone.",
        .format = "date-time",
        .pattern = kDateTimeWithTimezonePattern,
        .min_length = 20,
        .cpp_type = "oscal::DateTimeWithTimezoneDatatype",
    };
    return kInfo;
}

Result<DateTimeWithTimezoneDatatype> DateTimeWithTimezoneDatatype::parse(std::string_view text,
                                                                         const ParseOptions& options) {
    using R = Result<DateTimeWithTimezoneDatatype>;
    auto decoded = decode_date_time(text, options);
    if (decoded.is_err()) {
        return R::err(date_error(kName, text, decoded.unwrap_err()));
    }
    const auto& d = decoded.unwrap();
    if (!d.offset) {
        return R::err(date_error(kName, text, "a timezone offset ('Z' or '+hh:mm') is required"));
    }
    return R::ok(DateTimeWithTimezoneDatatype(std::string(text), d.date, d.time, *d.offset));
}

DateTimeWithTimezoneDatatype DateTimeWithTimezoneDatatype::now() {
    const auto now = QDateTime::currentDateTimeUtc();
    const auto d = now.date();
    const auto t = now.time();
    return DateTimeWithTimezoneDatatype(
        now.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss'Z'")).toStdString(),
        CalendarDate{d.year(), static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day())},
        TimeOfDay{static_cast<unsigned>(t.hour()), static_cast<unsigned>(t.minute()),
                  static_cast<unsigned>(t.second()), 0},
        UtcOffset{.zulu = true});
}

Result<Instant> DateTimeWithTimezoneDatatype::instant() const {
    return instant_of(kName, raw_, date_, time_, offset_);
}

std::optional<std::string> DateTimeWithTimezoneDatatype::to_rfc2822() const {
    auto at = instant();
    if (at.is_err()) return std::nullopt;
    return rfc2822(at.unwrap());
}

// -- instants ----------------------------------------------------------------

Result<bool> same_instant(const DateTimeWithTimezoneDatatype& a, const DateTimeWithTimezoneDatatype& b) {
    return a.instant().and_then([&](const Instant& lhs) {
        return b.instant().map([&](const Instant& rhs) { return lhs == rhs; });
    });
}

Result<bool> same_instant(const DateTimeDatatype& a, const DateTimeDatatype& b) {
    return a.instant().and_then([&](const Instant& lhs) {
        return b.instant().map([&](const Instant& rhs) { return lhs == rhs; });
    });
}

} // namespace oscal
