// ==============================================================================
// resources.cpp - Контейнеры ресурсов EventLog и хранилище winevt-rc
// ==============================================================================

#include <winevtrc/error.hpp>
#include <winevtrc/resources.hpp>

#include <algorithm>

namespace winevtrc::resources {

using store::AttributeContainer;
using store::AttributeType;
using store::ContainerSchema;

namespace {

void set_optional(AttributeContainer& container, const char* name,
                  const std::optional<std::string>& value) {
    if (value) {
        container.set(name, Value(*value));
    }
}

void set_list(AttributeContainer& container, const char* name,
              const std::vector<std::string>& values) {
    container.set(name, Value::make_string_list(values));
}

std::uint32_t get_uint32(const AttributeContainer& container, const char* name) {
    return static_cast<std::uint32_t>(container.get_integer(name).value_or(0));
}

}  // namespace

bool is_supported_string_format(const std::string& string_format) {
    return string_format == STRING_FORMAT_WRC || string_format == STRING_FORMAT_PEP3101;
}

// ============================================================================
// EventLogProvider
// ============================================================================

void EventLogProvider::add_message_file(std::vector<std::string>& files, const std::string& path) {
    if (std::find(files.begin(), files.end(), path) == files.end()) {
        files.push_back(path);
    }
}

EventLogProvider EventLogProvider::from_container(const AttributeContainer& container) {
    EventLogProvider provider;
    provider.identifier = container.get_string("identifier");
    provider.additional_identifier = container.get_string("additional_identifier");
    provider.name = container.get_string("name");
    provider.windows_version = container.get_string("windows_version");
    provider.log_sources = container.get_string_list("log_sources");
    provider.log_types = container.get_string_list("log_types");
    provider.category_message_files = container.get_string_list("category_message_files");
    provider.event_message_files = container.get_string_list("event_message_files");
    provider.parameter_message_files = container.get_string_list("parameter_message_files");
    return provider;
}

AttributeContainer EventLogProvider::to_container(const std::string& container_type) const {
    AttributeContainer container(container_type);
    set_optional(container, "identifier", identifier);
    set_optional(container, "additional_identifier", additional_identifier);
    set_optional(container, "name", name);
    set_list(container, "log_sources", log_sources);
    set_list(container, "log_types", log_types);
    set_list(container, "category_message_files", category_message_files);
    set_list(container, "event_message_files", event_message_files);
    set_list(container, "parameter_message_files", parameter_message_files);
    if (container_type == EVENTLOG_PROVIDER_TYPE) {
        set_optional(container, "windows_version", windows_version);
    }
    return container;
}

// ============================================================================
// MessageFile / MessageTable / MessageString / MessageStringMapping
// ============================================================================

AttributeContainer MessageFile::to_container() const {
    AttributeContainer container(MESSAGE_FILE_TYPE);
    set_optional(container, "windows_path", windows_path);
    set_optional(container, "windows_version", windows_version);
    set_optional(container, "file_version", file_version);
    set_optional(container, "product_version", product_version);
    return container;
}

AttributeContainer MessageTable::to_container() const {
    AttributeContainer container(MESSAGE_TABLE_TYPE);
    container.set("language_identifier", Value(static_cast<std::int64_t>(language_identifier)));
    container.set("_message_file_identifier", Value(message_file_identifier));
    return container;
}

MessageString MessageString::from_container(const AttributeContainer& container) {
    MessageString message_string;
    message_string.message_identifier = get_uint32(container, "message_identifier");
    message_string.text = container.get_string("text").value_or(std::string());
    message_string.message_table_identifier =
        container.get_string("_message_table_identifier").value_or(std::string());
    return message_string;
}

AttributeContainer MessageString::to_container() const {
    AttributeContainer container(MESSAGE_STRING_TYPE);
    container.set("message_identifier", Value(static_cast<std::int64_t>(message_identifier)));
    container.set("text", Value(text));
    container.set("_message_table_identifier", Value(message_table_identifier));
    return container;
}

MessageStringMapping MessageStringMapping::from_container(const AttributeContainer& container) {
    MessageStringMapping mapping;
    mapping.event_identifier = get_uint32(container, "event_identifier");
    mapping.event_version = container.get_integer("event_version");
    mapping.message_identifier = get_uint32(container, "message_identifier");
    mapping.provider_identifier =
        container.get_string("provider_identifier").value_or(std::string());
    mapping.message_file_identifier =
        container.get_string("_message_file_identifier").value_or(std::string());
    return mapping;
}

AttributeContainer MessageStringMapping::to_container() const {
    AttributeContainer container(MESSAGE_STRING_MAPPING_TYPE);
    container.set("event_identifier", Value(static_cast<std::int64_t>(event_identifier)));
    if (event_version) {
        container.set("event_version", Value(*event_version));
    }
    container.set("message_identifier", Value(static_cast<std::int64_t>(message_identifier)));
    container.set("provider_identifier", Value(provider_identifier));
    container.set("_message_file_identifier", Value(message_file_identifier));
    return container;
}

// ============================================================================
// Схемы
// ============================================================================

std::vector<ContainerSchema> resources_schemas() {
    return {
        {EVENTLOG_PROVIDER_TYPE,
         {{"additional_identifier", AttributeType::String},
          {"category_message_files", AttributeType::StringList},
          {"event_message_files", AttributeType::StringList},
          {"identifier", AttributeType::String},
          {"log_sources", AttributeType::StringList},
          {"log_types", AttributeType::StringList},
          {"name", AttributeType::String},
          {"parameter_message_files", AttributeType::StringList},
          {"windows_version", AttributeType::String}}},
        {MESSAGE_FILE_TYPE,
         {{"file_version", AttributeType::String},
          {"product_version", AttributeType::String},
          {"windows_path", AttributeType::String},
          {"windows_version", AttributeType::String}}},
        {MESSAGE_STRING_TYPE,
         {{"_message_table_identifier", AttributeType::Identifier},
          {"message_identifier", AttributeType::Integer},
          {"text", AttributeType::String}}},
        {MESSAGE_STRING_MAPPING_TYPE,
         {{"_message_file_identifier", AttributeType::Identifier},
          {"event_identifier", AttributeType::Integer},
          {"event_version", AttributeType::Integer},
          {"message_identifier", AttributeType::Integer},
          {"provider_identifier", AttributeType::String}}},
        {MESSAGE_TABLE_TYPE,
         {{"_message_file_identifier", AttributeType::Identifier},
          {"language_identifier", AttributeType::Integer}}},
    };
}

std::vector<ContainerSchema> case_storage_schemas() {
    return {
        {CASE_PROVIDER_TYPE,
         {{"additional_identifier", AttributeType::String},
          {"category_message_files", AttributeType::StringList},
          {"event_message_files", AttributeType::StringList},
          {"identifier", AttributeType::String},
          {"log_sources", AttributeType::StringList},
          {"log_types", AttributeType::StringList},
          {"name", AttributeType::String},
          {"parameter_message_files", AttributeType::StringList}}},
        {CASE_MESSAGE_FILE_TYPE,
         {{"path", AttributeType::String},
          {"windows_path", AttributeType::String}}},
        {CASE_MESSAGE_STRING_TYPE,
         {{"_message_file_identifier", AttributeType::Identifier},
          {"language_identifier", AttributeType::Integer},
          {"message_identifier", AttributeType::Integer},
          {"string", AttributeType::String}}},
        {CASE_TEMPLATE_EVENT_TYPE,
         {{"identifier", AttributeType::Integer},
          {"message_identifier", AttributeType::Integer},
          {"provider_identifier", AttributeType::String},
          {"version", AttributeType::Integer}}},
        {CASE_ENVIRONMENT_VARIABLE_TYPE,
         {{"case_sensitive", AttributeType::Integer},
          {"name", AttributeType::String},
          {"value", AttributeType::String}}},
    };
}

store::FormatVersions resources_format_versions() {
    store::FormatVersions versions;
    versions.format = 20240929;
    versions.append_compatible = 20240929;
    versions.upgrade_compatible = 20240929;
    versions.read_compatible = 20240929;
    return versions;
}

// ============================================================================
// ResourcesStore
// ============================================================================

ResourcesStore::ResourcesStore(std::string string_format)
    : store::SqliteAttributeContainerStore(resources_format_versions()),
      string_format_(std::move(string_format)) {
    for (auto& schema : resources_schemas()) {
        register_schema(std::move(schema));
    }
}

void ResourcesStore::read_and_check_storage_metadata(bool check_readable_only) {
    store::StorageMetadata metadata = read_metadata();
    store::check_storage_metadata(metadata, format_versions(), check_readable_only);

    auto it = metadata.find("string_format");
    std::string string_format = it != metadata.end() ? it->second : std::string();
    if (!is_supported_string_format(string_format)) {
        throw ResourceError(ResourceErrorKind::Io,
                            "Unsupported string format: " + string_format);
    }

    format_version_ = std::stoll(metadata["format_version"]);
    serialization_format_ = metadata["serialization_format"];
    string_format_ = string_format;
}

store::StorageMetadata ResourcesStore::initial_metadata() const {
    store::StorageMetadata metadata = store::SqliteAttributeContainerStore::initial_metadata();
    metadata["string_format"] = string_format_;
    return metadata;
}

// ============================================================================
// Хранилище дела
// ============================================================================

namespace {

std::unique_ptr<store::SqliteAttributeContainerStore> make_case_storage() {
    auto storage = std::make_unique<store::SqliteAttributeContainerStore>();
    for (auto& schema : case_storage_schemas()) {
        storage->register_schema(std::move(schema));
    }
    return storage;
}

}  // namespace

std::unique_ptr<store::SqliteAttributeContainerStore> open_case_storage(
    const std::filesystem::path& path) {
    auto storage = make_case_storage();
    storage->open(path, true);
    return storage;
}

std::unique_ptr<store::SqliteAttributeContainerStore> create_case_storage(
    const std::filesystem::path& path) {
    auto storage = make_case_storage();
    storage->open(path, false);
    return storage;
}

}  // namespace winevtrc::resources
