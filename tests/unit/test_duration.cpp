#include <catch2/catch_test_macros.hpp>
#include "datatypes/duration.hpp"

using namespace oscal;

TEST_CASE("DurationDatatype: decomposes every component", "[duration]") {
    auto d = DurationDatatype::parse("P1Y2M3DT4H5M6S");
    REQUIRE(d.is_ok());

    const auto& dur = d.unwrap();
    REQUIRE(dur.str() == "P1Y2M3DT4H5M6S");
    REQUIRE(dur.years() == 1);
    REQUIRE(dur.months() == 2);
    REQUIRE(dur.days() == 3);
    REQUIRE(dur.hours() == 4);
    REQUIRE(dur.minutes() == 5);
    REQUIRE(dur.seconds() == 6);
    REQUIRE(dur.nanoseconds() == 0);
    REQUIRE_FALSE(dur.is_negative());
    REQUIRE(dur.has_year_month());
    REQUIRE(dur.has_day_time());
}

TEST_CASE("DurationDatatype: fractions and signs", "[duration]") {
    auto d = DurationDatatype::parse("-PT1.5S");
    REQUIRE(d.is_ok());
    REQUIRE(d.unwrap().is_negative());
    REQUIRE(d.unwrap().seconds() == 1);
    REQUIRE(d.unwrap().nanoseconds() == 500000000);

    auto nanos = DurationDatatype::parse("PT0.000000001S");
    REQUIRE(nanos.is_ok());
    REQUIRE(nanos.unwrap().nanoseconds() == 1);
}

TEST_CASE("DurationDatatype: M means months before T and minutes after", "[duration]") {
    REQUIRE(DurationDatatype::parse("P1M").unwrap().months() == 1);
    REQUIRE(DurationDatatype::parse("PT1M").unwrap().minutes() == 1);
}

TEST_CASE("DurationDatatype: rejects malformed durations", "[duration]") {
    for (const char* bad : {"", "P", "PT", "P1Y2MT", "1Y", "P1", "P1D2Y", "P1Y1Y", "PT1S1H", "P1.5Y",
                            "PT1.5M", "PT1.S", "PT1.0000000001S", "P2W", "P4294967296D", "P-1D", "PT1H ",
                            "p1D", "P1DT"}) {
        INFO(bad);
        auto d = DurationDatatype::parse(bad);
        REQUIRE(d.is_err());
        REQUIRE(d.unwrap_err().kind == ErrorKind::Duration);
    }
}

TEST_CASE("DurationDatatype: component limits", "[duration]") {
    auto max = DurationDatatype::parse("P4294967295D");
    REQUIRE(max.is_ok());
    REQUIRE(max.unwrap().days() == 4294967295u);
}

TEST_CASE("DurationDatatype: equality is component-wise", "[duration]") {
    REQUIRE(DurationDatatype::parse("P1D").unwrap() == DurationDatatype::parse("P01D").unwrap());
    REQUIRE_FALSE(DurationDatatype::parse("P1D").unwrap() == DurationDatatype::parse("PT24H").unwrap());
    REQUIRE(DurationDatatype::parse("PT0S").unwrap() == DurationDatatype::parse("P0D").unwrap());
}

TEST_CASE("DurationDatatype: zero durations of different families are not equal", "[duration]") {
    const auto zero_years = DurationDatatype::parse("P0Y").unwrap();
    const auto zero_seconds = DurationDatatype::parse("PT0S").unwrap();

    REQUIRE(zero_years.components() == zero_seconds.components());
    REQUIRE_FALSE(zero_years == zero_seconds);
    REQUIRE(compare(zero_years, zero_seconds).is_err());

    REQUIRE_FALSE(DurationDatatype::parse("P1Y").unwrap() == DurationDatatype::parse("P1Y0D").unwrap());
    REQUIRE(compare(zero_years, DurationDatatype::parse("P0M").unwrap()).unwrap() ==
            std::weak_ordering::equivalent);
}

TEST_CASE("compare: orders durations of the same family", "[duration]") {
    const auto one_day = DurationDatatype::parse("P1D").unwrap();
    const auto hours_24 = DurationDatatype::parse("PT24H").unwrap();
    const auto hours_25 = DurationDatatype::parse("PT25H").unwrap();
    const auto minus_day = DurationDatatype::parse("-P1D").unwrap();

    REQUIRE(compare(one_day, hours_24).unwrap() == std::weak_ordering::equivalent);
    REQUIRE(compare(one_day, hours_25).unwrap() == std::weak_ordering::less);
    REQUIRE(compare(minus_day, one_day).unwrap() == std::weak_ordering::less);
    REQUIRE(compare(DurationDatatype::parse("-PT0S").unwrap(), DurationDatatype::parse("PT0S").unwrap())
                .unwrap() == std::weak_ordering::equivalent);

    const auto year = DurationDatatype::parse("P1Y").unwrap();
    const auto months = DurationDatatype::parse("P13M").unwrap();
    REQUIRE(compare(year, months).unwrap() == std::weak_ordering::less);
    REQUIRE(compare(DurationDatatype::parse("-P2Y").unwrap(), DurationDatatype::parse("-P1Y").unwrap())
                .unwrap() == std::weak_ordering::less);
}

TEST_CASE("compare: year-month and day-time durations are incomparable", "[duration]") {
    const auto month = DurationDatatype::parse("P1M").unwrap();
    const auto days = DurationDatatype::parse("P30D").unwrap();
    const auto mixed = DurationDatatype::parse("P1Y2D").unwrap();

    auto r = compare(month, days);
    REQUIRE(r.is_err());
    REQUIRE(r.unwrap_err().kind == ErrorKind::Duration);
    REQUIRE(compare(mixed, mixed).is_err());
}

TEST_CASE("DayTimeDurationDatatype: days and time only", "[duration]") {
    auto d = DayTimeDurationDatatype::parse("P4DT23H10S");
    REQUIRE(d.is_ok());
    REQUIRE(d.unwrap().str() == "P4DT23H10S");
    REQUIRE(d.unwrap().duration().days() == 4);

    auto bad = DayTimeDurationDatatype::parse("P2Y3M4D");
    REQUIRE(bad.is_err());
    REQUIRE(bad.unwrap_err().type_name == "DayTimeDurationDatatype");

    auto malformed = DayTimeDurationDatatype::parse("PT");
    REQUIRE(malformed.unwrap_err().type_name == "DayTimeDurationDatatype");

    REQUIRE(DayTimeDurationDatatype::parse("P1D").unwrap() < DayTimeDurationDatatype::parse("PT25H").unwrap());
}

TEST_CASE("YearMonthDurationDatatype: years and months only", "[duration]") {
    auto d = YearMonthDurationDatatype::parse("P2Y3M");
    REQUIRE(d.is_ok());
    REQUIRE(d.unwrap().total_months() == 27);
    REQUIRE(YearMonthDurationDatatype::parse("-P1M").unwrap().total_months() == -1);

    REQUIRE(YearMonthDurationDatatype::parse("P2Y3M4D").is_err());
    REQUIRE(YearMonthDurationDatatype::parse("PT1H").is_err());
    REQUIRE(YearMonthDurationDatatype::parse("P1Y").unwrap() < YearMonthDurationDatatype::parse("P13M").unwrap());
}
