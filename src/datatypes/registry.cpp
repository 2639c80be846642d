#include "datatypes/registry.hpp"

#include "datatypes/dates.hpp"
#include "datatypes/duration.hpp"
#include "datatypes/numbers.hpp"
#include "datatypes/strings.hpp"
#include "datatypes/uris.hpp"
#include "datatypes/uuid.hpp"
#include "datatypes/version.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace oscal {
namespace {

using Validator = Result<void> (*)(std::string_view, const ParseOptions&);

struct RegistryEntry {
    std::string_view name;
    const DatatypeInfo& (*info)();
    Validator validate;
};

template<typename T>
Result<void> validate_as(std::string_view text, const ParseOptions& options) {
    auto parsed = T::parse(text, options);
    if (parsed.is_err()) {
        return Result<void>::err(parsed.unwrap_err());
    }
    return Result<void>::ok();
}

template<typename T>
constexpr RegistryEntry entry() {
    return RegistryEntry{T::kName, &T::info, &validate_as<T>};
}

const auto& registry() {
    static const std::array kEntries{
        entry<BooleanDatatype>(),
        entry<IntegerDatatype>(),
        entry<NonNegativeIntegerDatatype>(),
        entry<PositiveIntegerDatatype>(),
        entry<DecimalDatatype>(),
        entry<StringDatatype>(),
        entry<TokenDatatype>(),
        entry<Base64Datatype>(),
        entry<EmailAddressDatatype>(),
        entry<HostnameDatatype>(),
        entry<IPv4AddressDatatype>(),
        entry<IPv6AddressDatatype>(),
        entry<DateDatatype>(),
        entry<DateTimeDatatype>(),
        entry<DateTimeWithTimezoneDatatype>(),
        entry<DurationDatatype>(),
        entry<DayTimeDurationDatatype>(),
        entry<YearMonthDurationDatatype>(),
        entry<UriDatatype>(),
        entry<UriReferenceDatatype>(),
        entry<UuidDatatype>(),
        entry<VersionDatatype>(),
    };
    return kEntries;
}

const RegistryEntry* lookup(std::string_view name) {
    const auto& entries = registry();
    const auto it = std::find_if(entries.begin(), entries.end(),
                                 [name](const RegistryEntry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

Error unrecognized(std::string_view name) {
    return Error(ErrorKind::UnrecognizedType, "datatype name", "not a known metaschema datatype")
        .with_input(name);
}

} // namespace

Result<DatatypeInfo> find_datatype(std::string_view name) {
    if (const auto* e = lookup(name)) {
        return Result<DatatypeInfo>::ok(e->info());
    }
    return Result<DatatypeInfo>::err(unrecognized(name));
}

std::vector<DatatypeInfo> all_datatypes() {
    std::vector<DatatypeInfo> out;
    out.reserve(registry().size());
    for (const auto& e : registry()) {
        out.push_back(e.info());
    }
    return out;
}

Result<void> validate_value(std::string_view name, std::string_view text, const ParseOptions& options) {
    const auto* e = lookup(name);
    if (!e) {
        return Result<void>::err(unrecognized(name));
    }
    return e->validate(text, options);
}

} // namespace oscal
