#include <catch2/catch_test_macros.hpp>
#include "datatypes/version.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace oscal;

namespace {

VersionDatatype v(const char* text) {
    return VersionDatatype::parse(text).unwrap();
}

} // namespace

TEST_CASE("VersionDatatype: decomposes a full version", "[version]") {
    auto version = VersionDatatype::parse("1.2.3-alpha.1+build.5");
    REQUIRE(version.is_ok());

    const auto& ver = version.unwrap();
    REQUIRE(ver.str() == "1.2.3-alpha.1+build.5");
    REQUIRE(ver.major() == 1);
    REQUIRE(ver.minor() == 2);
    REQUIRE(ver.patch() == 3);
    REQUIRE(ver.prerelease() == std::vector<std::string>{"alpha", "1"});
    REQUIRE(ver.build() == std::vector<std::string>{"build", "5"});
    REQUIRE(ver.is_prerelease());
}

TEST_CASE("VersionDatatype: hyphens inside the pre-release", "[version]") {
    auto ver = v("1.0.0-x-y-z.--");
    REQUIRE(ver.prerelease() == std::vector<std::string>{"x-y-z", "--"});
}

TEST_CASE("VersionDatatype: rejects invalid versions", "[version]") {
    for (const char* bad : {"", "1", "1.2", "1.2.3.4", "01.2.3", "1.02.3", "1.2.03", "a.b.c",
                            "1.2.3-", "1.2.3-01", "1.2.3-alpha..1", "1.2.3+", "1.2.3+a..b",
                            "1.2.3-al$pha", "v1.2.3", " 1.2.3", "99999999999999999999.0.0"}) {
        INFO(bad);
        auto r = VersionDatatype::parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.unwrap_err().kind == ErrorKind::Version);
        REQUIRE(r.unwrap_err().type_name == "VersionDatatype");
    }
}

TEST_CASE("VersionDatatype: build identifiers may have leading zeros", "[version]") {
    REQUIRE(VersionDatatype::parse("1.0.0+001").is_ok());
    REQUIRE(VersionDatatype::parse("1.0.0-0.3.7").is_ok());
}

TEST_CASE("VersionDatatype: precedence", "[version]") {
    REQUIRE(v("1.2.3") < v("1.10.0"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0"));
    REQUIRE(v("2.0.0") > v("1.99.99"));

    SECTION("the semver 2.0.0 example chain") {
        const std::vector<const char*> chain{
            "1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta", "1.0.0-beta",
            "1.0.0-beta.2", "1.0.0-beta.11", "1.0.0-rc.1", "1.0.0"};
        for (size_t i = 0; i + 1 < chain.size(); ++i) {
            INFO(chain[i] << " < " << chain[i + 1]);
            REQUIRE(v(chain[i]) < v(chain[i + 1]));
            REQUIRE_FALSE(v(chain[i + 1]) < v(chain[i]));
        }
    }

    SECTION("sorting") {
        std::vector<VersionDatatype> versions{v("1.10.0"), v("1.2.3"), v("1.0.0-rc.1"), v("0.9.0")};
        std::sort(versions.begin(), versions.end());
        REQUIRE(versions[0].str() == "0.9.0");
        REQUIRE(versions[1].str() == "1.0.0-rc.1");
        REQUIRE(versions[2].str() == "1.2.3");
        REQUIRE(versions[3].str() == "1.10.0");
    }
}

TEST_CASE("VersionDatatype: build metadata is ignored by ordering only", "[version]") {
    const auto a = v("1.0.0+a");
    const auto b = v("1.0.0+b");

    REQUIRE((a <=> b) == std::weak_ordering::equivalent);
    REQUIRE_FALSE(a < b);
    REQUIRE_FALSE(b < a);
    REQUIRE_FALSE(a == b);
    REQUIRE(a == v("1.0.0+a"));
}
