#pragma once

#include "core/error.hpp"
#include "core/options.hpp"
#include "core/result.hpp"
#include "datatypes/numbers.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oscal::json {

/**
 * Parse bytes as a JSON document whose root is an object.
 * Malformed JSON is an ErrorKind::Document error with Qt's message and offset.
 */
[[nodiscard]] Result<QJsonObject> parse_json_object(const QByteArray& bytes);

/**
 * "string", "number", "object", ... for diagnostics.
 */
[[nodiscard]] std::string json_type_name(const QJsonValue& value);

/**
 * Decode a datatype from a JSON value. Booleans and numbers read their
 * native JSON type; every other datatype must be a JSON string, and any
 * other JSON type is rejected before T::parse runs.
 */
template<typename T>
[[nodiscard]] Result<T> from_json(const QJsonValue& value, const ParseOptions& options = {}) {
    if constexpr (is_json_native_v<T>) {
        const auto expected = T::info().json_type;
        if (expected == "boolean" ? !value.isBool() : !value.isDouble()) {
            return Result<T>::err(Error(ErrorKind::Document, std::string(T::kName),
                                        "expected a JSON " + std::string(expected) + ", found " +
                                            json_type_name(value)));
        }
        return T::from_json_value(value, options);
    } else {
        if (!value.isString()) {
            return Result<T>::err(Error(ErrorKind::Document, std::string(T::kName),
                                        "expected a JSON string, found " + json_type_name(value)));
        }
        const QByteArray utf8 = value.toString().toUtf8();
        return T::parse(std::string_view(utf8.constData(), static_cast<size_t>(utf8.size())), options);
    }
}

template<typename T>
[[nodiscard]] QJsonValue to_json(const T& value) {
    if constexpr (is_json_native_v<T>) {
        return value.json_value();
    } else {
        return QJsonValue(QString::fromStdString(value.str()));
    }
}

template<typename T>
[[nodiscard]] QJsonArray to_json_array(const std::vector<T>& values) {
    QJsonArray out;
    for (const auto& v : values) {
        out.append(to_json(v));
    }
    return out;
}

/**
 * FieldReader - typed access to the fields of one JSON object.
 *
 * The reader knows where its object sits in the document, so any failure,
 * however deeply nested, names the full field path:
 *
 *   auto root = FieldReader(parse_json_object(bytes).unwrap());
 *   auto metadata = root.object("metadata");            // Result<FieldReader>
 *   auto parties = metadata.unwrap().objects("parties"); // Result<std::vector<FieldReader>>
 *   auto uuid = parties.unwrap()[1].required<UuidDatatype>("uuid");
 *   // on failure: metadata.parties[1].uuid: invalid UUIDDatatype "...": ...
 *
 * A JSON null reads the same as an absent field.
 */
class FieldReader {
public:
    explicit FieldReader(QJsonObject object, ParseOptions options = {}, std::string path = {})
        : object_(std::move(object)), options_(options), path_(std::move(path)) {}

    [[nodiscard]] const QJsonObject& json() const noexcept { return object_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

    [[nodiscard]] bool contains(const QString& key) const {
        return !object_.value(key).isUndefined() && !object_.value(key).isNull();
    }

    template<typename T>
    [[nodiscard]] Result<T> required(const QString& key) const {
        const QJsonValue value = object_.value(key);
        if (value.isUndefined() || value.isNull()) {
            return Result<T>::err(reject(Error(ErrorKind::Document, std::string(T::kName),
                                               "missing required field"),
                                         key));
        }
        return from_json<T>(value, options_).map_err([&](Error e) { return reject(std::move(e), key); });
    }

    template<typename T>
    [[nodiscard]] Result<std::optional<T>> optional(const QString& key) const {
        using R = Result<std::optional<T>>;
        if (!contains(key)) {
            return R::ok(std::nullopt);
        }
        auto parsed = from_json<T>(object_.value(key), options_);
        if (parsed.is_err()) {
            return R::err(reject(parsed.unwrap_err(), key));
        }
        return R::ok(std::optional<T>(std::move(parsed).unwrap()));
    }

    /**
     * An array of datatype values. An absent field reads as an empty array.
     */
    template<typename T>
    [[nodiscard]] Result<std::vector<T>> array(const QString& key) const {
        using R = Result<std::vector<T>>;
        auto items = array_items(key);
        if (items.is_err()) {
            return R::err(items.unwrap_err());
        }
        std::vector<T> out;
        const QJsonArray& arr = items.unwrap();
        out.reserve(static_cast<size_t>(arr.size()));
        for (qsizetype i = 0; i < arr.size(); ++i) {
            auto parsed = from_json<T>(arr.at(i), options_);
            if (parsed.is_err()) {
                return R::err(reject(parsed.unwrap_err().at_field(index_segment(i)), key));
            }
            out.push_back(std::move(parsed).unwrap());
        }
        return R::ok(std::move(out));
    }

    /**
     * A required nested object.
     */
    [[nodiscard]] Result<FieldReader> object(const QString& key) const;

    /**
     * An array of nested objects. An absent field reads as an empty array.
     */
    [[nodiscard]] Result<std::vector<FieldReader>> objects(const QString& key) const;

private:
    [[nodiscard]] Result<QJsonArray> array_items(const QString& key) const;

    // Places an error raised at `key` of this object into the document path.
    [[nodiscard]] Error reject(Error error, const QString& key) const;

    [[nodiscard]] std::string child_path(const QString& key) const;

    static std::string index_segment(qsizetype index) {
        return "[" + std::to_string(index) + "]";
    }

    QJsonObject object_;
    ParseOptions options_;
    std::string path_;
};

} // namespace oscal::json
