#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "datatypes/dates.hpp"
#include "datatypes/duration.hpp"
#include "datatypes/uuid.hpp"

#include <cstdio>
#include <string>

using namespace oscal;

namespace rc {

template<>
struct Arbitrary<Uuid> {
    static Gen<Uuid> arbitrary() {
        return gen::map(gen::arbitrary<Uuid::Bytes>(), [](const Uuid::Bytes& bytes) { return Uuid(bytes); });
    }
};

template<>
struct Arbitrary<DurationComponents> {
    static Gen<DurationComponents> arbitrary() {
        return gen::build<DurationComponents>(
            gen::set(&DurationComponents::negative),
            gen::set(&DurationComponents::years),
            gen::set(&DurationComponents::months),
            gen::set(&DurationComponents::days),
            gen::set(&DurationComponents::hours),
            gen::set(&DurationComponents::minutes),
            gen::set(&DurationComponents::seconds),
            gen::set(&DurationComponents::nanoseconds, gen::inRange<uint32_t>(0, 1000000000)));
    }
};

} // namespace rc

namespace {

std::string format_duration(const DurationComponents& c) {
    std::string out = c.negative ? "-P" : "P";
    out += std::to_string(c.years) + "Y" + std::to_string(c.months) + "M" + std::to_string(c.days) + "D";
    out += "T" + std::to_string(c.hours) + "H" + std::to_string(c.minutes) + "M" + std::to_string(c.seconds);
    if (c.nanoseconds != 0) {
        char fraction[11];
        std::snprintf(fraction, sizeof(fraction), ".%09u", static_cast<unsigned>(c.nanoseconds));
        out += fraction;
    }
    out += "S";
    return out;
}

std::string two(unsigned v) {
    return (v < 10 ? "0" : "") + std::to_string(v);
}

} // namespace

TEST_CASE("Property: UUID text round-trips", "[property][uuid]") {
    REQUIRE(rc::check("Uuid::parse(u.to_string()) == u",
        [](const Uuid& id) {
            auto parsed = Uuid::parse(id.to_string());
            RC_ASSERT(parsed.is_ok());
            RC_ASSERT(parsed.unwrap() == id);
            return true;
        }
    ));
}

TEST_CASE("Property: UUID parsing ignores case", "[property][uuid]") {
    REQUIRE(rc::check("upper-case text parses to the same value",
        [](const Uuid& id) {
            std::string upper = id.to_string();
            for (auto& c : upper) {
                if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
            }
            auto parsed = UuidDatatype::parse(upper);
            RC_ASSERT(parsed.is_ok());
            RC_ASSERT(parsed.unwrap().str() == id.to_string());
            return true;
        }
    ));
}

TEST_CASE("Property: duration components round-trip", "[property][duration]") {
    REQUIRE(rc::check("components survive formatting and parsing",
        [](const DurationComponents& c) {
            const auto text = format_duration(c);
            auto parsed = DurationDatatype::parse(text);
            RC_ASSERT(parsed.is_ok());
            RC_ASSERT(parsed.unwrap().components() == c);
            RC_ASSERT(parsed.unwrap().str() == text);
            return true;
        }
    ));
}

TEST_CASE("Property: real calendar dates parse in strict mode", "[property][dates]") {
    REQUIRE(rc::check("YYYY-MM-DD with a valid day parses and keeps its text",
        [](void) {
            const auto year = *rc::gen::inRange(1, 10000);
            const auto month = *rc::gen::inRange(1u, 13u);
            const auto last = static_cast<unsigned>(QDate(year, static_cast<int>(month), 1).daysInMonth());
            const auto day = *rc::gen::inRange(1u, last + 1);

            char text[11];
            std::snprintf(text, sizeof(text), "%04d-%s-%s", year, two(month).c_str(), two(day).c_str());
            auto parsed = DateDatatype::parse(text, ParseOptions::strict());
            RC_ASSERT(parsed.is_ok());
            RC_ASSERT(parsed.unwrap().str() == std::string(text));
            RC_ASSERT((parsed.unwrap().date() == CalendarDate{year, month, day}));
            return true;
        }
    ));
}

TEST_CASE("Property: lexical mode accepts every well-shaped date", "[property][dates]") {
    REQUIRE(rc::check("any digits in YYYY-MM-DD shape parse lexically",
        [](void) {
            const auto year = *rc::gen::inRange(0, 10000);
            const auto month = *rc::gen::inRange(0u, 100u);
            const auto day = *rc::gen::inRange(0u, 100u);

            char text[11];
            std::snprintf(text, sizeof(text), "%04d-%s-%s", year, two(month).c_str(), two(day).c_str());
            RC_ASSERT(DateDatatype::parse(text, ParseOptions::lexical()).is_ok());
            return true;
        }
    ));
}
