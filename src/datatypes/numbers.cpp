#include "datatypes/numbers.hpp"

#include <QByteArray>
#include <QLocale>
#include <QString>

#include <cmath>
#include <optional>

namespace oscal {
namespace {

using Reason = std::string;

constexpr double kTwoToThe63 = 9223372036854775808.0;

Error number_error(std::string_view type_name, std::string_view text, Reason reason) {
    return Error(ErrorKind::Number, std::string(type_name), std::move(reason)).with_input(text);
}

Error json_number_error(std::string_view type_name, const QJsonValue& value, Reason reason) {
    Error err(ErrorKind::Number, std::string(type_name), std::move(reason));
    if (value.isDouble()) {
        return err.with_input(QString::number(value.toDouble(), 'g', 17).toStdString());
    }
    return err;
}

QByteArray to_bytes(std::string_view text) {
    return QByteArray(text.data(), static_cast<qsizetype>(text.size()));
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

std::string_view without_plus(std::string_view text) {
    return !text.empty() && text.front() == '+' ? text.substr(1) : text;
}

// [+-]?[0-9]+
std::optional<Reason> check_integer_lexical(std::string_view text) {
    if (text.empty()) return Reason("empty string");
    size_t i = (text.front() == '+' || text.front() == '-') ? 1 : 0;
    if (i == text.size()) return Reason("sign without digits");
    for (; i < text.size(); ++i) {
        if (!is_digit(text[i])) {
            return "unexpected character at position " + std::to_string(i);
        }
    }
    return std::nullopt;
}

// [+-]?([0-9]+(.[0-9]*)?|.[0-9]+)
std::optional<Reason> check_decimal_lexical(std::string_view text) {
    if (text.empty()) return Reason("empty string");
    size_t i = (text.front() == '+' || text.front() == '-') ? 1 : 0;
    size_t whole = 0;
    while (i < text.size() && is_digit(text[i])) { ++i; ++whole; }
    size_t fraction = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && is_digit(text[i])) { ++i; ++fraction; }
    }
    if (whole == 0 && fraction == 0) return Reason("expected digits");
    if (i != text.size()) return "unexpected character at position " + std::to_string(i);
    return std::nullopt;
}

Result<std::int64_t, Reason> read_signed(std::string_view text) {
    using R = Result<std::int64_t, Reason>;
    if (auto why = check_integer_lexical(text)) return R::err(*why);
    bool ok = false;
    const qint64 value = to_bytes(without_plus(text)).toLongLong(&ok, 10);
    if (!ok) return R::err("out of the signed 64-bit range");
    return R::ok(static_cast<std::int64_t>(value));
}

std::string below_minimum(long long value, std::uint64_t minimum) {
    return "value " + std::to_string(value) + " is below the minimum " + std::to_string(minimum);
}

Result<std::uint64_t, Reason> read_unsigned(std::string_view text, std::uint64_t minimum) {
    using R = Result<std::uint64_t, Reason>;
    if (auto why = check_integer_lexical(text)) return R::err(*why);

    std::uint64_t value = 0;
    if (text.front() == '-') {
        // Only "-0", "-00", ... survive this branch.
        auto negative = read_signed(text);
        if (negative.is_err()) return R::err("below the minimum " + std::to_string(minimum));
        if (negative.unwrap() < 0) return R::err(below_minimum(negative.unwrap(), minimum));
    } else {
        bool ok = false;
        value = to_bytes(without_plus(text)).toULongLong(&ok, 10);
        if (!ok) return R::err("out of the unsigned 64-bit range");
    }
    if (value < minimum) return R::err(below_minimum(static_cast<long long>(value), minimum));
    return R::ok(value);
}

// A JSON number holding a whole value that fits in 64 bits.
Result<std::int64_t, Reason> json_whole_number(const QJsonValue& value) {
    using R = Result<std::int64_t, Reason>;
    if (!value.isDouble()) return R::err("expected a JSON number");
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::trunc(d) != d) return R::err("not a whole number");
    if (d < -kTwoToThe63 || d >= kTwoToThe63) return R::err("out of the signed 64-bit range");
    return R::ok(static_cast<std::int64_t>(value.toInteger(static_cast<qint64>(d))));
}

Result<std::uint64_t, Reason> json_unsigned(const QJsonValue& value, std::uint64_t minimum) {
    using R = Result<std::uint64_t, Reason>;
    auto whole = json_whole_number(value);
    if (whole.is_err()) return R::err(whole.unwrap_err());
    const auto n = whole.unwrap();
    if (n < 0 || static_cast<std::uint64_t>(n) < minimum) return R::err(below_minimum(n, minimum));
    return R::ok(static_cast<std::uint64_t>(n));
}

QJsonValue unsigned_json(std::uint64_t value) {
    if (value < static_cast<std::uint64_t>(kTwoToThe63)) {
        return QJsonValue(static_cast<qint64>(value));
    }
    return QJsonValue(static_cast<double>(value));
}

} // namespace

// -- BooleanDatatype ---------------------------------------------------------

const DatatypeInfo& BooleanDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A binary value that is either: true or false.",
        .json_type = "boolean",
        .pattern = "true|false",
        .min_length = 4,
        .max_length = 5,
        .cpp_type = "oscal::BooleanDatatype",
    };
    return kInfo;
}

Result<BooleanDatatype> BooleanDatatype::parse(std::string_view text, const ParseOptions&) {
    if (text == "true") return Result<BooleanDatatype>::ok(BooleanDatatype(true));
    if (text == "false") return Result<BooleanDatatype>::ok(BooleanDatatype(false));
    return Result<BooleanDatatype>::err(
        Error(ErrorKind::Boolean, std::string(kName), "expected true or false").with_input(text));
}

Result<BooleanDatatype> BooleanDatatype::from_json_value(const QJsonValue& value, const ParseOptions&) {
    if (!value.isBool()) {
        return Result<BooleanDatatype>::err(
            Error(ErrorKind::Boolean, std::string(kName), "expected a JSON boolean"));
    }
    return Result<BooleanDatatype>::ok(BooleanDatatype(value.toBool()));
}

// -- IntegerDatatype ---------------------------------------------------------

IntegerDatatype::IntegerDatatype(std::int64_t value) : raw_(std::to_string(value)), value_(value) {}

const DatatypeInfo& IntegerDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A whole number value.",
        .json_type = "integer",
        .pattern = "[-+]?[0-9]+",
        .min_length = 1,
        .cpp_type = "oscal::IntegerDatatype",
    };
    return kInfo;
}

Result<IntegerDatatype> IntegerDatatype::parse(std::string_view text, const ParseOptions&) {
    auto value = read_signed(text);
    if (value.is_err()) {
        return Result<IntegerDatatype>::err(number_error(kName, text, value.unwrap_err()));
    }
    return Result<IntegerDatatype>::ok(IntegerDatatype(std::string(text), value.unwrap()));
}

Result<IntegerDatatype> IntegerDatatype::from_json_value(const QJsonValue& value, const ParseOptions&) {
    auto n = json_whole_number(value);
    if (n.is_err()) {
        return Result<IntegerDatatype>::err(json_number_error(kName, value, n.unwrap_err()));
    }
    return Result<IntegerDatatype>::ok(IntegerDatatype(n.unwrap()));
}

// -- NonNegativeIntegerDatatype ----------------------------------------------

const DatatypeInfo& NonNegativeIntegerDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An integer value that is equal to or greater than 0.",
        .json_type = "integer",
        .pattern = "[-+]?[0-9]+",
        .min_length = 1,
        .cpp_type = "oscal::NonNegativeIntegerDatatype",
        .minimum = 0,
    };
    return kInfo;
}

Result<NonNegativeIntegerDatatype> NonNegativeIntegerDatatype::parse(std::string_view text,
                                                                     const ParseOptions&) {
    using R = Result<NonNegativeIntegerDatatype>;
    auto value = read_unsigned(text, 0);
    if (value.is_err()) return R::err(number_error(kName, text, value.unwrap_err()));
    return R::ok(NonNegativeIntegerDatatype(std::string(text), value.unwrap()));
}

Result<NonNegativeIntegerDatatype> NonNegativeIntegerDatatype::from_json_value(const QJsonValue& value,
                                                                               const ParseOptions&) {
    using R = Result<NonNegativeIntegerDatatype>;
    auto n = json_unsigned(value, 0);
    if (n.is_err()) return R::err(json_number_error(kName, value, n.unwrap_err()));
    return from_value(n.unwrap());
}

Result<NonNegativeIntegerDatatype> NonNegativeIntegerDatatype::from_value(std::uint64_t value) {
    return Result<NonNegativeIntegerDatatype>::ok(NonNegativeIntegerDatatype(std::to_string(value), value));
}

QJsonValue NonNegativeIntegerDatatype::json_value() const {
    return unsigned_json(value_);
}

// -- PositiveIntegerDatatype -------------------------------------------------

const DatatypeInfo& PositiveIntegerDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "An integer value that is greater than 0.",
        .json_type = "integer",
        .pattern = "[-+]?[0-9]+",
        .min_length = 1,
        .cpp_type = "oscal::PositiveIntegerDatatype",
        .minimum = 1,
    };
    return kInfo;
}

Result<PositiveIntegerDatatype> PositiveIntegerDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<PositiveIntegerDatatype>;
    auto value = read_unsigned(text, 1);
    if (value.is_err()) return R::err(number_error(kName, text, value.unwrap_err()));
    return R::ok(PositiveIntegerDatatype(std::string(text), value.unwrap()));
}

Result<PositiveIntegerDatatype> PositiveIntegerDatatype::from_json_value(const QJsonValue& value,
                                                                         const ParseOptions&) {
    using R = Result<PositiveIntegerDatatype>;
    auto n = json_unsigned(value, 1);
    if (n.is_err()) return R::err(json_number_error(kName, value, n.unwrap_err()));
    return from_value(n.unwrap());
}

Result<PositiveIntegerDatatype> PositiveIntegerDatatype::from_value(std::uint64_t value) {
    using R = Result<PositiveIntegerDatatype>;
    if (value == 0) {
        return R::err(number_error(kName, "0", below_minimum(0, 1)));
    }
    return R::ok(PositiveIntegerDatatype(std::to_string(value), value));
}

QJsonValue PositiveIntegerDatatype::json_value() const {
    return unsigned_json(value_);
}

// -- DecimalDatatype ---------------------------------------------------------

const DatatypeInfo& DecimalDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A real number expressed using a whole and optional fractional part "
                       "separated by a period.",
        .json_type = "number",
        .pattern = R"((\+|-)?([0-9]+(\.[0-9]*)?|\.[0-9]+))",
        .min_length = 1,
        .cpp_type = "oscal::DecimalDatatype",
    };
    return kInfo;
}

Result<DecimalDatatype> DecimalDatatype::parse(std::string_view text, const ParseOptions&) {
    using R = Result<DecimalDatatype>;
    if (auto why = check_decimal_lexical(text)) {
        return R::err(number_error(kName, text, *why));
    }
    // "5." and ".5" are lexically fine; hand Qt the fully written form.
    QByteArray digits = to_bytes(text);
    const qsizetype point = digits.indexOf('.');
    if (point >= 0 && point == digits.size() - 1) {
        digits.append('0');
    }
    if (point >= 0 && (point == 0 || !is_digit(digits.at(point - 1)))) {
        digits.insert(point, '0');
    }
    bool ok = false;
    const double value = digits.toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        return R::err(number_error(kName, text, "out of the double precision range"));
    }
    return R::ok(DecimalDatatype(std::string(text), value));
}

Result<DecimalDatatype> DecimalDatatype::from_json_value(const QJsonValue& value, const ParseOptions&) {
    if (!value.isDouble()) {
        return Result<DecimalDatatype>::err(
            Error(ErrorKind::Number, std::string(kName), "expected a JSON number"));
    }
    return from_value(value.toDouble());
}

Result<DecimalDatatype> DecimalDatatype::from_value(double value) {
    using R = Result<DecimalDatatype>;
    if (!std::isfinite(value)) {
        return R::err(Error(ErrorKind::Number, std::string(kName), "not a finite number"));
    }
    // Plain notation, shortest digits that read back as the same double.
    const auto text = QString::number(value, 'f', QLocale::FloatingPointShortest).toStdString();
    return R::ok(DecimalDatatype(text, value));
}

} // namespace oscal
