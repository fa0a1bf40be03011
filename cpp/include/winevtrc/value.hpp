// ==============================================================================
// winevtrc/value.hpp - Значение колонки SQLite / атрибута контейнера
// ==============================================================================
//
// Классы хранения SQLite (NULL, INTEGER, REAL, TEXT) и список строк.
// Списки (log_sources, файлы сообщений) хранятся в колонке TEXT как JSON
// массив и разбираются через RapidJSON.
//
// ==============================================================================

#ifndef WINEVTRC_VALUE_HPP
#define WINEVTRC_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace winevtrc {

class Value {
public:
    enum class Type { Null, Integer, Real, Text, StringList };

    using StringList = std::vector<std::string>;

    Value() = default;
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(StringList v) : data_(std::move(v)) {}

    /// Список строк (log_sources, event_message_files, ...)
    static Value make_string_list(StringList items) { return Value(std::move(items)); }

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_null() const { return type() == Type::Null; }
    bool is_integer() const { return type() == Type::Integer; }
    bool is_real() const { return type() == Type::Real; }
    bool is_text() const { return type() == Type::Text; }
    bool is_string_list() const { return type() == Type::StringList; }

    // Доступ без проверки типа (std::bad_variant_access при несовпадении)
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    double as_real() const { return std::get<double>(data_); }
    const std::string& as_text() const { return std::get<std::string>(data_); }
    const StringList& as_string_list() const { return std::get<StringList>(data_); }

    /// INTEGER; nullopt для остальных типов
    std::optional<std::int64_t> to_int64() const;

    /// TEXT; nullopt для остальных типов
    std::optional<std::string> to_optional_string() const;

    /// Список строк; пустой для остальных типов
    StringList to_string_vector() const;

    /// Текст для вывода: NULL -> "", числа в десятичном виде, список как JSON
    std::string to_display_string() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Компактный JSON (список -> массив строк)
    std::string to_json() const;

    /// Разобрать JSON массив строк; нестроковые элементы пропускаются
    /// @throws std::runtime_error при ошибке разбора или если это не массив
    static Value from_json(const std::string& text);

private:
    // Порядок альтернатив совпадает с Type
    std::variant<std::monostate, std::int64_t, double, std::string, StringList> data_;
};

}  // namespace winevtrc

#endif  // WINEVTRC_VALUE_HPP
