#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

namespace oscal {

/**
 * Uuid - a 128-bit universally unique identifier (RFC 4122).
 *
 * Stored as 16 bytes in network order. Only the hyphenated 8-4-4-4-12 form
 * is accepted as text, in either case; output is always lower case.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    static constexpr size_t TEXT_SIZE = 36;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     * Each thread draws from its own engine, so concurrent callers never share state.
     */
    [[nodiscard]] static Uuid generate_v4();

    /**
     * Generate a name-based UUID (version 5, SHA-1) within a namespace.
     */
    [[nodiscard]] static Uuid generate_v5(const Uuid& name_space, std::string_view name);

    [[nodiscard]] static Result<Uuid> parse(std::string_view text);

    /**
     * Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lower case.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * The version nibble (4 for random, 5 for name-based, 0 for nil).
     */
    [[nodiscard]] constexpr unsigned version() const noexcept {
        return bytes_[6] >> 4;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

    // Namespaces from RFC 4122 appendix C.
    static const Uuid kNamespaceDns;
    static const Uuid kNamespaceUrl;
    static const Uuid kNamespaceOid;
    static const Uuid kNamespaceX500;

private:
    Bytes bytes_;
};

/**
 * UuidDatatype - the metaschema "uuid" field: a validated Uuid whose
 * string form is the canonical lower-case text.
 */
class UuidDatatype {
public:
    static constexpr std::string_view kName = "UUIDDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<UuidDatatype> parse(std::string_view text,
                                                    const ParseOptions& options = {});

    [[nodiscard]] static UuidDatatype generate_v4() {
        return UuidDatatype(Uuid::generate_v4());
    }

    [[nodiscard]] static UuidDatatype generate_v5(const Uuid& name_space, std::string_view name) {
        return UuidDatatype(Uuid::generate_v5(name_space, name));
    }

    explicit UuidDatatype(const Uuid& value) : raw_(value.to_string()), value_(value) {}

    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] const Uuid& value() const noexcept { return value_; }

    bool operator==(const UuidDatatype& other) const { return value_ == other.value_; }

private:
    std::string raw_;
    Uuid value_;
};

} // namespace oscal

template<>
struct std::hash<oscal::Uuid> {
    size_t operator()(const oscal::Uuid& uuid) const noexcept {
        // v4 and v5 values are already uniformly distributed; fold the two halves.
        uint64_t hi = 0;
        uint64_t lo = 0;
        std::memcpy(&hi, uuid.bytes().data(), sizeof(hi));
        std::memcpy(&lo, uuid.bytes().data() + sizeof(hi), sizeof(lo));
        return static_cast<size_t>(hi ^ (lo * 0x9e3779b97f4a7c15ULL));
    }
};
