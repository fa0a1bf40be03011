// ==============================================================================
// winevtrc/resources.hpp - Контейнеры ресурсов EventLog и хранилище winevt-rc
// ==============================================================================
//
// Назначение:
// - Типизированные записи: провайдер EventLog, файл сообщений, таблица
//   сообщений, строка сообщения, отображение идентификатора события
// - Схемы контейнеров хранилища winevt-rc (winevtrc_*) и хранилища дела
//   (windows_eventlog_*, windows_wevt_template_event, environment_variable)
// - ResourcesStore: версионированное хранилище winevt-rc поверх
//   SqliteAttributeContainerStore
//
// Цепочка ссылок: строка -> таблица -> файл, через идентификаторы
// "<тип>.<номер>" (_message_table_identifier, _message_file_identifier).
//
// ==============================================================================

#ifndef WINEVTRC_RESOURCES_HPP
#define WINEVTRC_RESOURCES_HPP

#include <winevtrc/container.hpp>
#include <winevtrc/sqlite_store.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace winevtrc::resources {

// ----------------------------------------------------------------------------
// Типы контейнеров
// ----------------------------------------------------------------------------

// Хранилище winevt-rc
constexpr const char* EVENTLOG_PROVIDER_TYPE = "winevtrc_eventlog_provider";
constexpr const char* MESSAGE_FILE_TYPE = "winevtrc_message_file";
constexpr const char* MESSAGE_STRING_TYPE = "winevtrc_message_string";
constexpr const char* MESSAGE_STRING_MAPPING_TYPE = "winevtrc_message_string_mapping";
constexpr const char* MESSAGE_TABLE_TYPE = "winevtrc_message_table";

// Хранилище дела
constexpr const char* CASE_PROVIDER_TYPE = "windows_eventlog_provider";
constexpr const char* CASE_MESSAGE_FILE_TYPE = "windows_eventlog_message_file";
constexpr const char* CASE_MESSAGE_STRING_TYPE = "windows_eventlog_message_string";
constexpr const char* CASE_TEMPLATE_EVENT_TYPE = "windows_wevt_template_event";
constexpr const char* CASE_ENVIRONMENT_VARIABLE_TYPE = "environment_variable";

/// Допустимые форматы строк хранилища
constexpr const char* STRING_FORMAT_WRC = "wrc";
constexpr const char* STRING_FORMAT_PEP3101 = "pep3101";

bool is_supported_string_format(const std::string& string_format);

// ----------------------------------------------------------------------------
// Записи
// ----------------------------------------------------------------------------

/// Провайдер Windows EventLog
struct EventLogProvider {
    std::optional<std::string> identifier;  // GUID провайдера
    std::optional<std::string> additional_identifier;
    std::optional<std::string> name;
    std::optional<std::string> windows_version;
    std::vector<std::string> log_sources;  // порядок значим
    std::vector<std::string> log_types;
    std::vector<std::string> category_message_files;
    std::vector<std::string> event_message_files;
    std::vector<std::string> parameter_message_files;

    /// Добавить файл сообщений без повторов
    static void add_message_file(std::vector<std::string>& files, const std::string& path);

    static EventLogProvider from_container(const store::AttributeContainer& container);

    /// @param container_type EVENTLOG_PROVIDER_TYPE или CASE_PROVIDER_TYPE
    store::AttributeContainer to_container(
        const std::string& container_type = EVENTLOG_PROVIDER_TYPE) const;
};

/// Файл сообщений (winevtrc_message_file)
struct MessageFile {
    std::optional<std::string> windows_path;
    std::optional<std::string> windows_version;
    std::optional<std::string> file_version;
    std::optional<std::string> product_version;

    store::AttributeContainer to_container() const;
};

/// Таблица сообщений одного языка в файле сообщений
struct MessageTable {
    std::uint32_t language_identifier = 0;
    std::string message_file_identifier;

    store::AttributeContainer to_container() const;
};

/// Строка сообщения таблицы (winevtrc_message_string)
struct MessageString {
    std::uint32_t message_identifier = 0;
    std::string text;
    std::string message_table_identifier;

    static MessageString from_container(const store::AttributeContainer& container);
    store::AttributeContainer to_container() const;
};

/// Отображение идентификатора события в идентификатор сообщения
/// (WEVT_TEMPLATE)
struct MessageStringMapping {
    std::uint32_t event_identifier = 0;
    std::optional<std::int64_t> event_version;
    std::uint32_t message_identifier = 0;
    std::string provider_identifier;
    std::string message_file_identifier;

    static MessageStringMapping from_container(const store::AttributeContainer& container);
    store::AttributeContainer to_container() const;
};

// ----------------------------------------------------------------------------
// Схемы
// ----------------------------------------------------------------------------

/// Схемы хранилища winevt-rc (пять типов winevtrc_*)
std::vector<store::ContainerSchema> resources_schemas();

/// Схемы хранилища дела
std::vector<store::ContainerSchema> case_storage_schemas();

/// Версии формата хранилища winevt-rc
store::FormatVersions resources_format_versions();

// ----------------------------------------------------------------------------
// ResourcesStore
// ----------------------------------------------------------------------------

/// Версионированное хранилище ресурсов Windows EventLog
///
/// Формат строк (string_format) хранится в metadata:
///   wrc     - строки в формате Windows Resource, конвертируются при чтении
///   pep3101 - строки уже в позиционном формате
class ResourcesStore : public store::SqliteAttributeContainerStore {
public:
    /// @param string_format Формат строк для нового хранилища
    explicit ResourcesStore(std::string string_format = STRING_FORMAT_WRC);

    const std::string& string_format() const { return string_format_; }

protected:
    void read_and_check_storage_metadata(bool check_readable_only) override;
    store::StorageMetadata initial_metadata() const override;

private:
    std::string string_format_;
};

// ----------------------------------------------------------------------------
// Хранилище дела
// ----------------------------------------------------------------------------

/// Открыть хранилище дела (результат извлечения артефактов) для чтения
/// @throws ResourceError(Io) если файл не открывается или несовместим
std::unique_ptr<store::SqliteAttributeContainerStore> open_case_storage(
    const std::filesystem::path& path);

/// Создать или открыть хранилище дела для записи
std::unique_ptr<store::SqliteAttributeContainerStore> create_case_storage(
    const std::filesystem::path& path);

}  // namespace winevtrc::resources

#endif  // WINEVTRC_RESOURCES_HPP
