// ==============================================================================
// value.cpp - Значение колонки SQLite / атрибута контейнера
// ==============================================================================

#include <winevtrc/value.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <stdexcept>

namespace winevtrc {

std::optional<std::int64_t> Value::to_int64() const {
    if (is_integer()) {
        return as_integer();
    }
    return std::nullopt;
}

std::optional<std::string> Value::to_optional_string() const {
    if (is_text()) {
        return as_text();
    }
    return std::nullopt;
}

Value::StringList Value::to_string_vector() const {
    if (is_string_list()) {
        return as_string_list();
    }
    return {};
}

std::string Value::to_display_string() const {
    switch (type()) {
    case Type::Null:
        return "";
    case Type::Integer:
        return std::to_string(as_integer());
    case Type::Real:
        return to_json();
    case Type::Text:
        return as_text();
    case Type::StringList:
        return to_json();
    }
    return "";
}

std::string Value::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    switch (type()) {
    case Type::Null:
        writer.Null();
        break;
    case Type::Integer:
        writer.Int64(as_integer());
        break;
    case Type::Real:
        if (!std::isfinite(as_real())) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        writer.Double(as_real());
        break;
    case Type::Text:
        writer.String(as_text().c_str(), static_cast<rapidjson::SizeType>(as_text().size()));
        break;
    case Type::StringList:
        writer.StartArray();
        for (const auto& item : as_string_list()) {
            writer.String(item.c_str(), static_cast<rapidjson::SizeType>(item.size()));
        }
        writer.EndArray();
        break;
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

Value Value::from_json(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("JSON parse error: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()) +
                                 " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsArray()) {
        throw std::runtime_error("JSON value is not an array");
    }

    StringList items;
    items.reserve(doc.Size());
    for (const auto& item : doc.GetArray()) {
        if (item.IsString()) {
            items.emplace_back(item.GetString(), item.GetStringLength());
        }
    }
    return Value(std::move(items));
}

}  // namespace winevtrc
