#include <catch2/catch_test_macros.hpp>

#include "datatypes/dates.hpp"
#include "datatypes/duration.hpp"
#include "datatypes/numbers.hpp"
#include "datatypes/strings.hpp"
#include "datatypes/uris.hpp"
#include "datatypes/uuid.hpp"
#include "datatypes/version.hpp"
#include "json/datatype_json.hpp"

#include <QJsonDocument>

using namespace oscal;
using namespace oscal::json;

namespace {

const QByteArray kCatalog = R"({
  "uuid": "74C8BA1E-5CD4-4AD1-BBFD-D888E2F6C724",
  "metadata": {
    "title": "Example catalog",
    "last-modified": "2024-04-13T09:57:13Z",
    "version": "1.2.0-draft.3",
    "oscal-version": "1.1.2",
    "links": ["https://example.com/catalog", "#appendix"],
    "parties": [
      {"uuid": "11111111-2222-4333-8444-555555555555", "type": "organization",
       "email-addresses": ["security@example.com"]},
      {"uuid": "22222222-3333-4444-8555-666666666666", "type": "person"}
    ]
  },
  "review-period": "P1Y"
})";

struct Party {
    UuidDatatype uuid;
    TokenDatatype type;
    std::vector<EmailAddressDatatype> emails;
};

Result<Party> read_party(const FieldReader& reader) {
    auto uuid = reader.required<UuidDatatype>("uuid");
    if (uuid.is_err()) return Result<Party>::err(uuid.unwrap_err());
    auto type = reader.required<TokenDatatype>("type");
    if (type.is_err()) return Result<Party>::err(type.unwrap_err());
    auto emails = reader.array<EmailAddressDatatype>("email-addresses");
    if (emails.is_err()) return Result<Party>::err(emails.unwrap_err());
    return Result<Party>::ok(Party{std::move(uuid).unwrap(), std::move(type).unwrap(), std::move(emails).unwrap()});
}

QByteArray with_party_uuid(const char* uuid) {
    auto doc = QJsonDocument::fromJson(kCatalog).object();
    auto metadata = doc["metadata"].toObject();
    auto parties = metadata["parties"].toArray();
    auto party = parties[1].toObject();
    party["uuid"] = QString::fromUtf8(uuid);
    parties[1] = party;
    metadata["parties"] = parties;
    doc["metadata"] = metadata;
    return QJsonDocument(doc).toJson(QJsonDocument::Compact);
}

} // namespace

TEST_CASE("JSON fields: reads a nested document", "[integration][json]") {
    auto root_obj = parse_json_object(kCatalog);
    REQUIRE(root_obj.is_ok());
    const FieldReader root(root_obj.unwrap());

    auto uuid = root.required<UuidDatatype>("uuid");
    REQUIRE(uuid.is_ok());
    REQUIRE(uuid.unwrap().str() == "74c8ba1e-5cd4-4ad1-bbfd-d888e2f6c724");

    auto metadata = root.object("metadata");
    REQUIRE(metadata.is_ok());
    const auto& meta = metadata.unwrap();
    REQUIRE(meta.path() == "metadata");

    REQUIRE(meta.required<StringDatatype>("title").unwrap().str() == "Example catalog");
    REQUIRE(meta.required<DateTimeWithTimezoneDatatype>("last-modified").is_ok());
    REQUIRE(meta.required<VersionDatatype>("version").unwrap().prerelease().size() == 2);

    auto links = meta.array<UriReferenceDatatype>("links");
    REQUIRE(links.is_ok());
    REQUIRE(links.unwrap().size() == 2);
    REQUIRE_FALSE(links.unwrap()[1].is_absolute());

    auto parties = meta.objects("parties");
    REQUIRE(parties.is_ok());
    REQUIRE(parties.unwrap().size() == 2);
    REQUIRE(parties.unwrap()[1].path() == "metadata.parties[1]");

    auto first = read_party(parties.unwrap()[0]);
    REQUIRE(first.is_ok());
    REQUIRE(first.unwrap().emails.size() == 1);
    REQUIRE(read_party(parties.unwrap()[1]).unwrap().emails.empty());

    auto period = root.optional<YearMonthDurationDatatype>("review-period");
    REQUIRE(period.is_ok());
    REQUIRE(period.unwrap()->total_months() == 12);

    auto missing = root.optional<DurationDatatype>("retention");
    REQUIRE(missing.is_ok());
    REQUIRE_FALSE(missing.unwrap().has_value());
}

TEST_CASE("JSON fields: a bad primitive names its full path", "[integration][json]") {
    const FieldReader root(parse_json_object(with_party_uuid("not-a-uuid")).unwrap());

    auto parties = root.object("metadata").unwrap().objects("parties");
    REQUIRE(parties.is_ok());

    auto party = read_party(parties.unwrap()[1]);
    REQUIRE(party.is_err());

    const auto& e = party.unwrap_err();
    REQUIRE(e.kind == ErrorKind::Uuid);
    REQUIRE(e.path == "metadata.parties[1].uuid");
    REQUIRE(e.input == "not-a-uuid");
    REQUIRE(e.message().rfind("metadata.parties[1].uuid: invalid UUIDDatatype \"not-a-uuid\"", 0) == 0);
}

TEST_CASE("JSON fields: array elements carry their index", "[integration][json]") {
    const FieldReader root(parse_json_object(R"({"links": ["https://a.example", "bad uri"]})").unwrap());

    auto links = root.array<UriDatatype>("links");
    REQUIRE(links.is_err());
    REQUIRE(links.unwrap_err().path == "links[1]");
    REQUIRE(links.unwrap_err().kind == ErrorKind::Uri);
}

TEST_CASE("JSON fields: shape errors", "[integration][json]") {
    const FieldReader root(parse_json_object(
        R"({"version": 3, "when": null, "meta": [], "list": "x", "items": [1]})").unwrap());

    SECTION("non-string primitive") {
        auto r = root.required<VersionDatatype>("version");
        REQUIRE(r.is_err());
        REQUIRE(r.unwrap_err().kind == ErrorKind::Document);
        REQUIRE(r.unwrap_err().path == "version");
        REQUIRE(r.unwrap_err().reason == "expected a JSON string, found number");
    }

    SECTION("missing and null required fields") {
        REQUIRE(root.required<DateDatatype>("absent").unwrap_err().reason == "missing required field");
        REQUIRE(root.required<DateDatatype>("when").unwrap_err().path == "when");
        REQUIRE(root.optional<DateDatatype>("when").unwrap() == std::nullopt);
    }

    SECTION("objects and arrays") {
        REQUIRE(root.object("meta").unwrap_err().reason == "expected a JSON object, found array");
        REQUIRE(root.array<TokenDatatype>("list").unwrap_err().path == "list");
        REQUIRE(root.objects("items").unwrap_err().path == "items[0]");
        REQUIRE(root.array<TokenDatatype>("absent").unwrap().empty());
    }
}

TEST_CASE("JSON fields: options reach nested readers", "[integration][json]") {
    const auto obj = parse_json_object(R"({"outer": {"date": "2021-02-30"}})").unwrap();

    const FieldReader strict(obj, ParseOptions::strict());
    REQUIRE(strict.object("outer").unwrap().required<DateDatatype>("date").unwrap_err().path == "outer.date");

    const FieldReader lexical(obj, ParseOptions::lexical());
    REQUIRE(lexical.object("outer").unwrap().required<DateDatatype>("date").is_ok());
}

TEST_CASE("JSON documents: malformed input", "[integration][json]") {
    auto broken = parse_json_object("{\"a\": ");
    REQUIRE(broken.is_err());
    REQUIRE(broken.unwrap_err().kind == ErrorKind::Document);
    REQUIRE(broken.unwrap_err().reason.find("offset") != std::string::npos);

    auto not_object = parse_json_object("[1, 2]");
    REQUIRE(not_object.is_err());
    REQUIRE(not_object.unwrap_err().reason == "root is not a JSON object");
}

TEST_CASE("JSON values: serialize as their canonical string", "[integration][json]") {
    const auto id = UuidDatatype::parse("74C8BA1E-5CD4-4AD1-BBFD-D888E2F6C724").unwrap();
    REQUIRE(to_json(id) == QJsonValue(QStringLiteral("74c8ba1e-5cd4-4ad1-bbfd-d888e2f6c724")));

    const auto back = from_json<UuidDatatype>(to_json(id));
    REQUIRE(back.is_ok());
    REQUIRE(back.unwrap() == id);

    const std::vector<VersionDatatype> versions{VersionDatatype::parse("1.0.0").unwrap(),
                                                VersionDatatype::parse("2.0.0-rc.1").unwrap()};
    const auto arr = to_json_array(versions);
    REQUIRE(arr.size() == 2);
    REQUIRE(arr.at(1).toString() == QStringLiteral("2.0.0-rc.1"));
}

TEST_CASE("JSON fields: booleans and numbers use native JSON types", "[integration][json]") {
    const FieldReader root(parse_json_object(R"({
      "rank": 3, "limit": -1, "ratio": 0.25, "big": 1.5,
      "enabled": true, "flag": "true", "count": "3",
      "sizes": [1, 2, 0]
    })").unwrap());

    REQUIRE(root.required<PositiveIntegerDatatype>("rank").unwrap().value() == 3);
    REQUIRE(root.required<IntegerDatatype>("limit").unwrap().value() == -1);
    REQUIRE(root.required<DecimalDatatype>("ratio").unwrap().value() == 0.25);
    REQUIRE(root.required<BooleanDatatype>("enabled").unwrap().value());

    SECTION("bounds and whole numbers") {
        auto limit = root.required<NonNegativeIntegerDatatype>("limit");
        REQUIRE(limit.is_err());
        REQUIRE(limit.unwrap_err().kind == ErrorKind::Number);
        REQUIRE(limit.unwrap_err().path == "limit");
        REQUIRE(limit.unwrap_err().reason == "value -1 is below the minimum 0");

        REQUIRE(root.required<IntegerDatatype>("big").unwrap_err().reason == "not a whole number");

        auto sizes = root.array<PositiveIntegerDatatype>("sizes");
        REQUIRE(sizes.is_err());
        REQUIRE(sizes.unwrap_err().path == "sizes[2]");
    }

    SECTION("strings are not booleans or numbers") {
        auto flag = root.required<BooleanDatatype>("flag");
        REQUIRE(flag.unwrap_err().kind == ErrorKind::Document);
        REQUIRE(flag.unwrap_err().reason == "expected a JSON boolean, found string");

        auto count = root.required<IntegerDatatype>("count");
        REQUIRE(count.unwrap_err().reason == "expected a JSON integer, found string");
    }

    SECTION("serialization keeps the native type") {
        REQUIRE(to_json(BooleanDatatype(false)).isBool());
        const auto rank = root.required<PositiveIntegerDatatype>("rank").unwrap();
        REQUIRE(to_json(rank).isDouble());
        REQUIRE(to_json(rank).toInteger() == 3);
        REQUIRE(from_json<PositiveIntegerDatatype>(to_json(rank)).unwrap() == rank);
    }
}
