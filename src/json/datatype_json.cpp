#include "json/datatype_json.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace oscal::json {

Result<QJsonObject> parse_json_object(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<QJsonObject>::err(
            Error(ErrorKind::Document, "JSON document",
                  err.errorString().toStdString() + " at offset " + std::to_string(err.offset)));
    }
    if (!doc.isObject()) {
        return Result<QJsonObject>::err(
            Error(ErrorKind::Document, "JSON document", "root is not a JSON object"));
    }
    return Result<QJsonObject>::ok(doc.object());
}

std::string json_type_name(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Null: return "null";
        case QJsonValue::Bool: return "boolean";
        case QJsonValue::Double: return "number";
        case QJsonValue::String: return "string";
        case QJsonValue::Array: return "array";
        case QJsonValue::Object: return "object";
        case QJsonValue::Undefined: return "nothing";
    }
    return "unknown";
}

Result<FieldReader> FieldReader::object(const QString& key) const {
    using R = Result<FieldReader>;
    const QJsonValue value = object_.value(key);
    if (value.isUndefined() || value.isNull()) {
        return R::err(reject(Error(ErrorKind::Document, "object", "missing required field"), key));
    }
    if (!value.isObject()) {
        return R::err(reject(Error(ErrorKind::Document, "object",
                                   "expected a JSON object, found " + json_type_name(value)),
                             key));
    }
    return R::ok(FieldReader(value.toObject(), options_, child_path(key)));
}

Result<std::vector<FieldReader>> FieldReader::objects(const QString& key) const {
    using R = Result<std::vector<FieldReader>>;
    auto items = array_items(key);
    if (items.is_err()) {
        return R::err(items.unwrap_err());
    }

    std::vector<FieldReader> out;
    const QJsonArray& arr = items.unwrap();
    out.reserve(static_cast<size_t>(arr.size()));
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QJsonValue item = arr.at(i);
        if (!item.isObject()) {
            return R::err(reject(Error(ErrorKind::Document, "object",
                                       "expected a JSON object, found " + json_type_name(item))
                                     .at_field(index_segment(i)),
                                 key));
        }
        out.emplace_back(item.toObject(), options_, child_path(key) + index_segment(i));
    }
    return R::ok(std::move(out));
}

Result<QJsonArray> FieldReader::array_items(const QString& key) const {
    const QJsonValue value = object_.value(key);
    if (value.isUndefined() || value.isNull()) {
        return Result<QJsonArray>::ok(QJsonArray{});
    }
    if (!value.isArray()) {
        return Result<QJsonArray>::err(reject(
            Error(ErrorKind::Document, "array", "expected a JSON array, found " + json_type_name(value)), key));
    }
    return Result<QJsonArray>::ok(value.toArray());
}

Error FieldReader::reject(Error error, const QString& key) const {
    return error.at_field(key.toStdString()).at_field(path_);
}

std::string FieldReader::child_path(const QString& key) const {
    if (path_.empty()) {
        return key.toStdString();
    }
    return path_ + "." + key.toStdString();
}

} // namespace oscal::json
