// ==============================================================================
// container.cpp - Контейнеры атрибутов, фильтры, хранилище в памяти
// ==============================================================================

#include <winevtrc/container.hpp>

namespace winevtrc::store {

// ============================================================================
// AttributeContainer
// ============================================================================

const Value* AttributeContainer::get(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> AttributeContainer::get_string(const std::string& name) const {
    if (const auto* value = get(name)) {
        return value->to_optional_string();
    }
    return std::nullopt;
}

std::optional<std::int64_t> AttributeContainer::get_integer(const std::string& name) const {
    if (const auto* value = get(name)) {
        return value->to_int64();
    }
    return std::nullopt;
}

std::vector<std::string> AttributeContainer::get_string_list(const std::string& name) const {
    if (const auto* value = get(name)) {
        return value->to_string_vector();
    }
    return {};
}

std::string make_container_identifier(std::string_view container_type, std::int64_t sequence) {
    std::string identifier(container_type);
    identifier += '.';
    identifier += std::to_string(sequence);
    return identifier;
}

const AttributeDefinition* ContainerSchema::find(std::string_view name) const {
    for (const auto& attribute : attributes) {
        if (attribute.name == name) {
            return &attribute;
        }
    }
    return nullptr;
}

// ============================================================================
// ContainerFilter
// ============================================================================

ContainerFilter& ContainerFilter::where(const std::string& attribute, Value value) {
    conditions_.push_back(Condition{attribute, std::move(value)});
    return *this;
}

ContainerFilter& ContainerFilter::where(const std::string& attribute, std::int64_t value) {
    return where(attribute, Value(value));
}

ContainerFilter& ContainerFilter::where(const std::string& attribute, const std::string& value) {
    return where(attribute, Value(value));
}

bool ContainerFilter::matches(const AttributeContainer& container) const {
    for (const auto& condition : conditions_) {
        const Value* value = container.get(condition.attribute);
        if (value == nullptr) {
            if (!condition.value.is_null()) {
                return false;
            }
            continue;
        }
        if (*value != condition.value) {
            return false;
        }
    }
    return true;
}

std::string ContainerFilter::to_string() const {
    std::string result;
    for (const auto& condition : conditions_) {
        if (!result.empty()) {
            result += " and ";
        }
        result += condition.attribute;
        result += " == ";
        if (condition.value.is_text()) {
            result += '"' + condition.value.as_text() + '"';
        } else {
            result += condition.value.to_display_string();
        }
    }
    return result;
}

// ============================================================================
// FakeAttributeContainerStore
// ============================================================================

bool FakeAttributeContainerStore::has_attribute_containers(const std::string& container_type) {
    auto it = containers_.find(container_type);
    return it != containers_.end() && !it->second.empty();
}

std::vector<AttributeContainer> FakeAttributeContainerStore::get_attribute_containers(
    const std::string& container_type, const ContainerFilter& filter) {
    std::vector<AttributeContainer> result;
    auto it = containers_.find(container_type);
    if (it == containers_.end()) {
        return result;
    }
    for (const auto& container : it->second) {
        if (filter.matches(container)) {
            result.push_back(container);
        }
    }
    return result;
}

std::size_t FakeAttributeContainerStore::get_number_of_attribute_containers(
    const std::string& container_type) {
    auto it = containers_.find(container_type);
    return it == containers_.end() ? 0 : it->second.size();
}

void FakeAttributeContainerStore::add_attribute_container(AttributeContainer& container) {
    auto& containers = containers_[container.container_type()];
    // Номера последовательности начинаются с 1, как rowid в SQLite
    container.set_identifier(make_container_identifier(
        container.container_type(), static_cast<std::int64_t>(containers.size()) + 1));
    containers.push_back(container);
}

}  // namespace winevtrc::store
