// ==============================================================================
// winevtrc/container.hpp - Контейнеры атрибутов и интерфейс хранилища
// ==============================================================================
//
// Назначение:
// - AttributeContainer: типизированная запись (тип + идентификатор + атрибуты)
// - ContainerSchema: описание атрибутов типа контейнера (колонки SQLite)
// - ContainerFilter: конъюнкция условий "атрибут == значение"
// - AttributeContainerStore: интерфейс хранилища (запрос по типу и фильтру)
// - FakeAttributeContainerStore: хранилище в памяти
//
// Ссылки между контейнерами (строка сообщения -> таблица -> файл) хранятся
// как строковые идентификаторы "<тип>.<номер>", а не указатели.
//
// ==============================================================================

#ifndef WINEVTRC_CONTAINER_HPP
#define WINEVTRC_CONTAINER_HPP

#include <winevtrc/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace winevtrc::store {

// ----------------------------------------------------------------------------
// AttributeContainer
// ----------------------------------------------------------------------------

/// Контейнер атрибутов
class AttributeContainer {
public:
    AttributeContainer() = default;
    explicit AttributeContainer(std::string container_type)
        : container_type_(std::move(container_type)) {}

    const std::string& container_type() const { return container_type_; }

    /// Идентификатор "<тип>.<номер>", назначается хранилищем при добавлении
    const std::optional<std::string>& identifier() const { return identifier_; }
    void set_identifier(std::string identifier) { identifier_ = std::move(identifier); }

    /// Установить атрибут
    void set(const std::string& name, Value value) { attributes_[name] = std::move(value); }

    /// Получить атрибут (nullptr если не задан)
    const Value* get(const std::string& name) const;

    /// Строковый атрибут; nullopt если не задан или не строка
    std::optional<std::string> get_string(const std::string& name) const;

    /// Целочисленный атрибут; nullopt если не задан или не целое
    std::optional<std::int64_t> get_integer(const std::string& name) const;

    /// Список строк; пустой если не задан
    std::vector<std::string> get_string_list(const std::string& name) const;

    const std::map<std::string, Value>& attributes() const { return attributes_; }

private:
    std::string container_type_;
    std::optional<std::string> identifier_;
    std::map<std::string, Value> attributes_;
};

/// Построить идентификатор контейнера: ("winevtrc_message_file", 3) -> "winevtrc_message_file.3"
std::string make_container_identifier(std::string_view container_type, std::int64_t sequence);

// ----------------------------------------------------------------------------
// ContainerSchema
// ----------------------------------------------------------------------------

/// Тип атрибута в схеме
enum class AttributeType {
    String,      // TEXT
    Integer,     // INTEGER
    StringList,  // JSON массив строк в TEXT
    Identifier   // идентификатор другого контейнера, TEXT
};

/// Описание атрибута
struct AttributeDefinition {
    std::string name;
    AttributeType type;
};

/// Схема типа контейнера
struct ContainerSchema {
    std::string container_type;
    std::vector<AttributeDefinition> attributes;

    /// Найти атрибут по имени
    const AttributeDefinition* find(std::string_view name) const;
};

// ----------------------------------------------------------------------------
// ContainerFilter
// ----------------------------------------------------------------------------

/// Фильтр выборки: все условия должны выполняться
///
/// @code
///   ContainerFilter filter;
///   filter.where("language_identifier", 0x0409).where("message_identifier", 1);
/// @endcode
class ContainerFilter {
public:
    struct Condition {
        std::string attribute;
        Value value;
    };

    ContainerFilter& where(const std::string& attribute, Value value);
    ContainerFilter& where(const std::string& attribute, std::int64_t value);
    ContainerFilter& where(const std::string& attribute, const std::string& value);

    const std::vector<Condition>& conditions() const { return conditions_; }
    bool empty() const { return conditions_.empty(); }

    /// Проверить контейнер (для хранилищ без SQL)
    bool matches(const AttributeContainer& container) const;

    /// Текстовое представление для диагностики: a == 1 and b == "x"
    std::string to_string() const;

private:
    std::vector<Condition> conditions_;
};

// ----------------------------------------------------------------------------
// AttributeContainerStore
// ----------------------------------------------------------------------------

/// Хранилище контейнеров атрибутов
class AttributeContainerStore {
public:
    virtual ~AttributeContainerStore() = default;

    /// Есть ли в хранилище хотя бы один контейнер типа
    virtual bool has_attribute_containers(const std::string& container_type) = 0;

    /// Контейнеры типа, удовлетворяющие фильтру, в порядке добавления
    virtual std::vector<AttributeContainer> get_attribute_containers(
        const std::string& container_type, const ContainerFilter& filter = {}) = 0;

    /// Количество контейнеров типа
    virtual std::size_t get_number_of_attribute_containers(const std::string& container_type) = 0;

    /// Добавить контейнер; назначает container.identifier()
    virtual void add_attribute_container(AttributeContainer& container) = 0;

protected:
    AttributeContainerStore() = default;
};

// ----------------------------------------------------------------------------
// FakeAttributeContainerStore
// ----------------------------------------------------------------------------

/// Хранилище в памяти
class FakeAttributeContainerStore : public AttributeContainerStore {
public:
    FakeAttributeContainerStore() = default;

    bool has_attribute_containers(const std::string& container_type) override;
    std::vector<AttributeContainer> get_attribute_containers(
        const std::string& container_type, const ContainerFilter& filter = {}) override;
    std::size_t get_number_of_attribute_containers(const std::string& container_type) override;
    void add_attribute_container(AttributeContainer& container) override;

private:
    std::map<std::string, std::vector<AttributeContainer>> containers_;
};

}  // namespace winevtrc::store

#endif  // WINEVTRC_CONTAINER_HPP
