#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "datatypes/version.hpp"

#include <string>
#include <tuple>
#include <vector>

using namespace oscal;

namespace {

std::string join(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += '.';
        out += ids[i];
    }
    return out;
}

} // namespace

namespace rc {

// Generator for valid semantic versions, with small components so that
// collisions (and so ties) happen often.
template<>
struct Arbitrary<VersionDatatype> {
    static Gen<VersionDatatype> arbitrary() {
        const auto identifier = gen::oneOf(
            gen::map(gen::inRange<uint64_t>(0, 20), [](uint64_t n) { return std::to_string(n); }),
            gen::elementOf(std::vector<std::string>{"alpha", "beta", "rc", "x-1", "--"}));
        return gen::map(
            gen::tuple(gen::inRange<uint64_t>(0, 4), gen::inRange<uint64_t>(0, 4), gen::inRange<uint64_t>(0, 4),
                       gen::container<std::vector<std::string>>(identifier),
                       gen::container<std::vector<std::string>>(
                           gen::elementOf(std::vector<std::string>{"001", "build", "sha.5114f85"}))),
            [](const std::tuple<uint64_t, uint64_t, uint64_t, std::vector<std::string>,
                                std::vector<std::string>>& t) {
                const auto& [major, minor, patch, pre, build] = t;
                std::string text = std::to_string(major) + "." + std::to_string(minor) + "." +
                                   std::to_string(patch);
                if (!pre.empty()) text += "-" + join(pre);
                if (!build.empty()) text += "+" + join(build);
                return VersionDatatype::parse(text).unwrap();
            });
    }
};

} // namespace rc

TEST_CASE("Property: generated versions round-trip", "[property][version]") {
    REQUIRE(rc::check("parse(v.str()) == v",
        [](const VersionDatatype& v) {
            auto again = VersionDatatype::parse(v.str());
            RC_ASSERT(again.is_ok());
            RC_ASSERT(again.unwrap() == v);
            return true;
        }
    ));
}

TEST_CASE("Property: precedence is antisymmetric", "[property][version]") {
    REQUIRE(rc::check("a < b implies !(b < a)",
        [](const VersionDatatype& a, const VersionDatatype& b) {
            if (a < b) {
                RC_ASSERT(!(b < a));
                RC_ASSERT(b > a);
            }
            return true;
        }
    ));
}

TEST_CASE("Property: precedence is transitive", "[property][version]") {
    REQUIRE(rc::check("a < b and b < c implies a < c",
        [](const VersionDatatype& a, const VersionDatatype& b, const VersionDatatype& c) {
            if (a < b && b < c) {
                RC_ASSERT(a < c);
            }
            return true;
        }
    ));
}

TEST_CASE("Property: release triples order numerically", "[property][version]") {
    REQUIRE(rc::check("release versions compare like (major, minor, patch)",
        [](const VersionDatatype& a, const VersionDatatype& b) {
            if (a.is_prerelease() || b.is_prerelease()) return true;
            const auto lhs = std::tuple(a.major(), a.minor(), a.patch());
            const auto rhs = std::tuple(b.major(), b.minor(), b.patch());
            RC_ASSERT((a < b) == (lhs < rhs));
            return true;
        }
    ));
}

TEST_CASE("Property: a pre-release precedes its release", "[property][version]") {
    REQUIRE(rc::check("x.y.z-pre < x.y.z",
        [](const VersionDatatype& v) {
            if (!v.is_prerelease()) return true;
            const auto release = VersionDatatype::parse(std::to_string(v.major()) + "." +
                                                        std::to_string(v.minor()) + "." +
                                                        std::to_string(v.patch()));
            RC_ASSERT(release.is_ok());
            RC_ASSERT(v < release.unwrap());
            return true;
        }
    ));
}
