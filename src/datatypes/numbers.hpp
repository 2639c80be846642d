#pragma once

#include "core/metaschema.hpp"
#include "core/options.hpp"
#include "core/result.hpp"

#include <QJsonValue>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace oscal {

/**
 * BooleanDatatype - "true" or "false". Serialized as a JSON boolean.
 */
class BooleanDatatype {
public:
    static constexpr std::string_view kName = "BooleanDatatype";

    explicit BooleanDatatype(bool value) : value_(value) {}

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<BooleanDatatype> parse(std::string_view text,
                                                       const ParseOptions& options = {});
    [[nodiscard]] static Result<BooleanDatatype> from_json_value(const QJsonValue& value,
                                                                 const ParseOptions& options = {});

    [[nodiscard]] bool value() const noexcept { return value_; }
    [[nodiscard]] std::string str() const { return value_ ? "true" : "false"; }
    [[nodiscard]] QJsonValue json_value() const { return QJsonValue(value_); }

    bool operator==(const BooleanDatatype&) const = default;

private:
    bool value_;
};

/**
 * IntegerDatatype - a whole number in the signed 64-bit range, "-12" or "+7".
 * Serialized as a JSON number.
 */
class IntegerDatatype {
public:
    static constexpr std::string_view kName = "IntegerDatatype";

    explicit IntegerDatatype(std::int64_t value);

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<IntegerDatatype> parse(std::string_view text,
                                                       const ParseOptions& options = {});
    [[nodiscard]] static Result<IntegerDatatype> from_json_value(const QJsonValue& value,
                                                                 const ParseOptions& options = {});

    [[nodiscard]] std::int64_t value() const noexcept { return value_; }
    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] QJsonValue json_value() const { return QJsonValue(static_cast<qint64>(value_)); }

    bool operator==(const IntegerDatatype& other) const { return value_ == other.value_; }

private:
    IntegerDatatype(std::string raw, std::int64_t value) : raw_(std::move(raw)), value_(value) {}

    std::string raw_;
    std::int64_t value_;
};

/**
 * NonNegativeIntegerDatatype - an integer of at least 0.
 */
class NonNegativeIntegerDatatype {
public:
    static constexpr std::string_view kName = "NonNegativeIntegerDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<NonNegativeIntegerDatatype> parse(std::string_view text,
                                                                  const ParseOptions& options = {});
    [[nodiscard]] static Result<NonNegativeIntegerDatatype> from_json_value(const QJsonValue& value,
                                                                            const ParseOptions& options = {});
    [[nodiscard]] static Result<NonNegativeIntegerDatatype> from_value(std::uint64_t value);

    [[nodiscard]] std::uint64_t value() const noexcept { return value_; }
    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] QJsonValue json_value() const;

    bool operator==(const NonNegativeIntegerDatatype& other) const { return value_ == other.value_; }

private:
    NonNegativeIntegerDatatype(std::string raw, std::uint64_t value) : raw_(std::move(raw)), value_(value) {}

    std::string raw_;
    std::uint64_t value_;
};

/**
 * PositiveIntegerDatatype - an integer of at least 1.
 */
class PositiveIntegerDatatype {
public:
    static constexpr std::string_view kName = "PositiveIntegerDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<PositiveIntegerDatatype> parse(std::string_view text,
                                                               const ParseOptions& options = {});
    [[nodiscard]] static Result<PositiveIntegerDatatype> from_json_value(const QJsonValue& value,
                                                                         const ParseOptions& options = {});
    [[nodiscard]] static Result<PositiveIntegerDatatype> from_value(std::uint64_t value);

    [[nodiscard]] std::uint64_t value() const noexcept { return value_; }
    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] QJsonValue json_value() const;

    bool operator==(const PositiveIntegerDatatype& other) const { return value_ == other.value_; }

private:
    PositiveIntegerDatatype(std::string raw, std::uint64_t value) : raw_(std::move(raw)), value_(value) {}

    std::string raw_;
    std::uint64_t value_;
};

/**
 * DecimalDatatype - a finite decimal number without an exponent, "-1.50"
 * or ".5", held as a double. JSON numbers with an exponent are accepted
 * and rendered in plain notation.
 */
class DecimalDatatype {
public:
    static constexpr std::string_view kName = "DecimalDatatype";

    [[nodiscard]] static const DatatypeInfo& info();

    [[nodiscard]] static Result<DecimalDatatype> parse(std::string_view text,
                                                       const ParseOptions& options = {});
    [[nodiscard]] static Result<DecimalDatatype> from_json_value(const QJsonValue& value,
                                                                 const ParseOptions& options = {});
    [[nodiscard]] static Result<DecimalDatatype> from_value(double value);

    [[nodiscard]] double value() const noexcept { return value_; }
    [[nodiscard]] const std::string& str() const noexcept { return raw_; }
    [[nodiscard]] QJsonValue json_value() const { return QJsonValue(value_); }

    bool operator==(const DecimalDatatype& other) const { return value_ == other.value_; }

private:
    DecimalDatatype(std::string raw, double value) : raw_(std::move(raw)), value_(value) {}

    std::string raw_;
    double value_;
};

// Datatypes serialized as a native JSON value instead of a JSON string.
template<typename T>
inline constexpr bool is_json_native_v = false;

template<> inline constexpr bool is_json_native_v<BooleanDatatype> = true;
template<> inline constexpr bool is_json_native_v<IntegerDatatype> = true;
template<> inline constexpr bool is_json_native_v<NonNegativeIntegerDatatype> = true;
template<> inline constexpr bool is_json_native_v<PositiveIntegerDatatype> = true;
template<> inline constexpr bool is_json_native_v<DecimalDatatype> = true;

} // namespace oscal
