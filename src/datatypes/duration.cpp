#include "datatypes/duration.hpp"

#include <limits>
#include <optional>
#include <utility>

namespace oscal {
namespace {

using Reason = std::string;

constexpr std::uint64_t kComponentMax = std::numeric_limits<std::uint32_t>::max();
constexpr size_t kMaxFractionDigits = 9;

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

struct Decoded {
    DurationComponents parts;
    bool has_year_month{false};
    bool has_day_time{false};
};

class DurationScanner {
public:
    explicit DurationScanner(std::string_view text) : text_(text) {}

    Result<Decoded, Reason> run() {
        using R = Result<Decoded, Reason>;
        Decoded out;

        if (peek() == '-') {
            out.parts.negative = true;
            ++pos_;
        }
        if (peek() != 'P') {
            return R::err("missing 'P' designator");
        }
        ++pos_;

        bool any = false;
        size_t next = 0;
        while (!at_end() && peek() != 'T') {
            auto r = component("YMD", next, out);
            if (r) return R::err(std::move(*r));
            any = true;
        }

        if (peek() == 'T') {
            ++pos_;
            if (at_end()) {
                return R::err("'T' must be followed by a time component");
            }
            next = 0;
            while (!at_end()) {
                auto r = component("HMS", next, out);
                if (r) return R::err(std::move(*r));
                any = true;
            }
        }

        if (!any) {
            return R::err("no duration components");
        }
        return R::ok(std::move(out));
    }

private:
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    // Reads one "<n>[.<f>]<designator>" and stores it; returns a reason on failure.
    std::optional<Reason> component(std::string_view order, size_t& next, Decoded& out) {
        const size_t start = pos_;
        std::uint64_t value = 0;
        while (!at_end() && is_digit(peek())) {
            value = value * 10 + static_cast<std::uint64_t>(peek() - '0');
            if (value > kComponentMax) {
                return "component at position " + std::to_string(start) + " exceeds " +
                       std::to_string(kComponentMax);
            }
            ++pos_;
        }
        if (pos_ == start) {
            return "expected a number at position " + std::to_string(pos_);
        }

        bool has_fraction = false;
        std::uint32_t nanos = 0;
        if (peek() == '.') {
            ++pos_;
            const size_t frac_start = pos_;
            while (!at_end() && is_digit(peek())) {
                if (pos_ - frac_start == kMaxFractionDigits) {
                    return "more than " + std::to_string(kMaxFractionDigits) + " fraction digits";
                }
                nanos = nanos * 10 + static_cast<std::uint32_t>(peek() - '0');
                ++pos_;
            }
            if (pos_ == frac_start) {
                return "expected fraction digits at position " + std::to_string(pos_);
            }
            for (size_t n = pos_ - frac_start; n < kMaxFractionDigits; ++n) {
                nanos *= 10;
            }
            has_fraction = true;
        }

        if (at_end()) {
            return "missing designator after number at position " + std::to_string(start);
        }
        const char designator = peek();
        if (designator == 'W') {
            return std::string("week durations are not supported");
        }
        const size_t slot = order.find(designator);
        if (slot == std::string_view::npos) {
            return std::string("unexpected designator '") + designator + "' at position " +
                   std::to_string(pos_);
        }
        if (slot < next) {
            return std::string("designator '") + designator + "' is repeated or out of order";
        }
        if (has_fraction && !(order == "HMS" && designator == 'S')) {
            return std::string("only seconds may have a fraction, found one on '") + designator + "'";
        }
        next = slot + 1;
        ++pos_;

        const auto v = static_cast<std::uint32_t>(value);
        auto& p = out.parts;
        if (order == "YMD") {
            switch (designator) {
            case 'Y': p.years = v; out.has_year_month = true; break;
            case 'M': p.months = v; out.has_year_month = true; break;
            default: p.days = v; out.has_day_time = true; break;
            }
        } else {
            out.has_day_time = true;
            switch (designator) {
            case 'H': p.hours = v; break;
            case 'M': p.minutes = v; break;
            default: p.seconds = v; p.nanoseconds = nanos; break;
            }
        }
        return std::nullopt;
    }

    std::string_view text_;
    size_t pos_{0};
};

Error duration_error(std::string_view type_name, std::string_view text, Reason reason) {
    return Error(ErrorKind::Duration, std::string(type_name), std::move(reason)).with_input(text);
}

// Orders two signed magnitudes; negative and positive zero are equivalent.
template<typename Magnitude>
std::weak_ordering compare_signed(bool neg_a, const Magnitude& a, bool neg_b, const Magnitude& b) {
    const Magnitude zero{};
    const bool na = neg_a && a != zero;
    const bool nb = neg_b && b != zero;
    if (na != nb) {
        return na ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    const std::weak_ordering c = a <=> b;
    return na ? 0 <=> c : c;
}

std::uint64_t months_of(const DurationComponents& p) {
    return static_cast<std::uint64_t>(p.years) * 12 + p.months;
}

std::pair<std::uint64_t, std::uint32_t> seconds_of(const DurationComponents& p) {
    const std::uint64_t secs = static_cast<std::uint64_t>(p.days) * 86400 +
                               static_cast<std::uint64_t>(p.hours) * 3600 +
                               static_cast<std::uint64_t>(p.minutes) * 60 + p.seconds;
    return {secs, p.nanoseconds};
}

std::weak_ordering compare_day_time(const DurationComponents& a, const DurationComponents& b) {
    return compare_signed(a.negative, seconds_of(a), b.negative, seconds_of(b));
}

std::weak_ordering compare_year_month(const DurationComponents& a, const DurationComponents& b) {
    return compare_signed(a.negative, months_of(a), b.negative, months_of(b));
}

} // namespace

const DatatypeInfo& DurationDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An amount of time based on ISO-8601 durations (see also RFC3339 appendix A).",
        .format = "duration",
        .pattern = R"(^-?P(?!$)([0-9]+Y)?([0-9]+M)?([0-9]+D)?(T(?=[0-9])([0-9]+H)?([0-9]+M)?([0-9]+(\.[0-9]+)?S)?)?$)",
        .min_length = 3,
        .cpp_type = "oscal::DurationDatatype",
    };
    return kInfo;
}

Result<DurationDatatype> DurationDatatype::parse(std::string_view text, const ParseOptions&) {
    auto decoded = DurationScanner(text).run();
    if (decoded.is_err()) {
        return Result<DurationDatatype>::err(duration_error(kName, text, decoded.unwrap_err()));
    }

    Decoded d = std::move(decoded).unwrap();
    DurationDatatype out;
    out.raw_ = std::string(text);
    out.parts_ = d.parts;
    out.has_year_month_ = d.has_year_month;
    out.has_day_time_ = d.has_day_time;
    return Result<DurationDatatype>::ok(std::move(out));
}

Result<std::weak_ordering> compare(const DurationDatatype& a, const DurationDatatype& b) {
    const bool a_ym = a.has_year_month() && !a.has_day_time();
    const bool b_ym = b.has_year_month() && !b.has_day_time();
    const bool a_dt = a.has_day_time() && !a.has_year_month();
    const bool b_dt = b.has_day_time() && !b.has_year_month();

    if (a_ym && b_ym) {
        return Result<std::weak_ordering>::ok(compare_year_month(a.components(), b.components()));
    }
    if (a_dt && b_dt) {
        return Result<std::weak_ordering>::ok(compare_day_time(a.components(), b.components()));
    }
    return Result<std::weak_ordering>::err(
        Error(ErrorKind::Duration, std::string(DurationDatatype::kName),
              "cannot order \"" + a.str() + "\" against \"" + b.str() +
                  "\": year-month and day-time durations are incomparable"));
}

const DatatypeInfo& DayTimeDurationDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An amount of time quantified in days, hours, minutes, and seconds.",
        .format = "duration",
        .pattern = R"(^-?P([0-9]+D(T(([0-9]+H([0-9]+M)?(([0-9]+|[0-9]+(\.[0-9]+)?)S)?)|([0-9]+M(([0-9]+|[0-9]+(\.[0-9]+)?)S)?)|([0-9]+|[0-9]+(\.[0-9]+)?)S))?|T(([0-9]+H([0-9]+M)?(([0-9]+|[0-9]+(\.[0-9]+)?)S)?)|([0-9]+M(([0-9]+|[0-9]+(\.[0-9]+)?)S)?)|([0-9]+|[0-9]+(\.[0-9]+)?)S))$)",
        .min_length = 3,
        .cpp_type = "oscal::DayTimeDurationDatatype",
    };
    return kInfo;
}

Result<DayTimeDurationDatatype> DayTimeDurationDatatype::parse(std::string_view text,
                                                               const ParseOptions& options) {
    using R = Result<DayTimeDurationDatatype>;
    auto base = DurationDatatype::parse(text, options);
    if (base.is_err()) {
        Error e = base.unwrap_err();
        e.type_name = std::string(kName);
        return R::err(std::move(e));
    }
    if (base.unwrap().has_year_month()) {
        return R::err(duration_error(kName, text, "year and month designators are not allowed"));
    }
    return R::ok(DayTimeDurationDatatype(std::move(base).unwrap()));
}

std::weak_ordering DayTimeDurationDatatype::operator<=>(const DayTimeDurationDatatype& other) const {
    return compare_day_time(duration_.components(), other.duration_.components());
}

const DatatypeInfo& YearMonthDurationDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An amount of time quantified in years and months based on ISO-8601 durations "
                       "(see also RFC3339 appendix A).",
        .format = "duration",
        .pattern = R"(^-?P([0-9]+Y([0-9]+M)?|[0-9]+M)$)",
        .min_length = 3,
        .cpp_type = "oscal::YearMonthDurationDatatype",
    };
    return kInfo;
}

Result<YearMonthDurationDatatype> YearMonthDurationDatatype::parse(std::string_view text,
                                                                   const ParseOptions& options) {
    using R = Result<YearMonthDurationDatatype>;
    auto base = DurationDatatype::parse(text, options);
    if (base.is_err()) {
        Error e = base.unwrap_err();
        e.type_name = std::string(kName);
        return R::err(std::move(e));
    }
    if (base.unwrap().has_day_time()) {
        return R::err(duration_error(kName, text, "only year and month designators are allowed"));
    }
    return R::ok(YearMonthDurationDatatype(std::move(base).unwrap()));
}

std::int64_t YearMonthDurationDatatype::total_months() const noexcept {
    const auto m = static_cast<std::int64_t>(months_of(duration_.components()));
    return duration_.is_negative() ? -m : m;
}

std::weak_ordering YearMonthDurationDatatype::operator<=>(const YearMonthDurationDatatype& other) const {
    return compare_year_month(duration_.components(), other.duration_.components());
}

} // namespace oscal
