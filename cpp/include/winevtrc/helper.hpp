// ==============================================================================
// winevtrc/helper.hpp - Разрешение строк сообщений Windows EventLog
// ==============================================================================
//
// Назначение:
// - ResourcesHelper: фасад (кэш -> активный источник -> запись в кэш)
// - ResolutionBackend: источник строк, выбирается один раз:
//     StorageReaderBackend   - контейнеры хранилища дела
//     LegacyDatabaseBackend  - winevt-rc.db старого формата
//     ResourcesStoreBackend  - winevt-rc.db версионированного формата
// - ProviderIndex / MessageFileIndex: индексы провайдеров и файлов
//   сообщений (ключи в нижнем регистре)
//
// Цепочка разрешения сообщения:
//   провайдер (GUID, затем источник)
//     -> отображение WEVT_TEMPLATE (идентификатор события -> сообщения)
//     -> файлы сообщений провайдера (путь и <путь>\<язык>\<файл>.mui)
//     -> строки сообщений для LCID и идентификатора
//
// Не потокобезопасен: каждый рабочий поток владеет своим экземпляром.
//
// ==============================================================================

#ifndef WINEVTRC_HELPER_HPP
#define WINEVTRC_HELPER_HPP

#include <winevtrc/cache.hpp>
#include <winevtrc/container.hpp>
#include <winevtrc/legacy.hpp>
#include <winevtrc/output.hpp>
#include <winevtrc/resources.hpp>
#include <winevtrc/windows.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace winevtrc::resources {

/// Имя файла базы ресурсов в каталоге данных
constexpr const char* WINEVT_RC_DATABASE = "winevt-rc.db";

/// Файлы параметров по умолчанию, если у провайдера нет своих
extern const std::vector<std::string> DEFAULT_PARAMETER_MESSAGE_FILES;

// ----------------------------------------------------------------------------
// Индексы
// ----------------------------------------------------------------------------

/// Индекс провайдеров по GUID и по источнику (без учёта регистра)
///
/// При повторе ключа выигрывает провайдер, добавленный последним.
class ProviderIndex {
public:
    void add(EventLogProvider provider);

    /// Найти провайдера: сначала по GUID, затем по источнику
    ///
    /// @return провайдер (nullptr если не найден) и использованный ключ
    std::pair<const EventLogProvider*, std::string> find(const std::string& provider_identifier,
                                                         const std::string& log_source) const;

    size_t size() const { return providers_.size(); }

private:
    std::vector<EventLogProvider> providers_;
    std::unordered_map<std::string, size_t> by_identifier_;
    std::unordered_map<std::string, size_t> by_log_source_;
};

/// Индекс файлов сообщений: "<путь>\<файл>" в нижнем регистре -> идентификатор
class MessageFileIndex {
public:
    explicit MessageFileIndex(std::string language_tag);

    /// Добавить файл сообщений по его пути Windows
    void add(const std::string& windows_path, const std::string& identifier,
             const windows::EnvironmentVariables& environment);

    /// Идентификаторы файлов для путей провайдера
    ///
    /// Для каждого пути проверяются "<путь>\<файл>" и
    /// "<путь>\<язык>\<файл>.mui", в этом порядке.
    std::vector<std::string> resolve(const std::vector<std::string>& message_files,
                                     const windows::EnvironmentVariables& environment) const;

    size_t size() const { return files_.size(); }

private:
    std::string language_tag_;
    std::unordered_map<std::string, std::string> files_;
};

// ----------------------------------------------------------------------------
// Источники
// ----------------------------------------------------------------------------

/// Параметры разрешения, общие для всех источников
struct ResolutionSettings {
    std::uint32_t lcid = windows::DEFAULT_LCID;
    std::string language_tag = "en-us";
    windows::EnvironmentVariables environment;  // переопределения
    output::Writer* writer = nullptr;
};

/// Активный источник строк сообщений
class ResolutionBackend {
public:
    virtual ~ResolutionBackend() = default;

    virtual std::optional<std::string> resolve_message(
        const std::string& provider_identifier, const std::string& log_source,
        std::uint32_t message_identifier, std::optional<std::int64_t> event_version) = 0;

    virtual std::optional<std::string> resolve_parameter(const std::string& provider_identifier,
                                                         const std::string& log_source,
                                                         std::uint32_t message_identifier) = 0;
};

/// Имена типов и атрибутов контейнеров конкретного хранилища
struct ContainerLayout {
    const char* provider_type;
    const char* message_file_type;
    const char* message_file_path_attribute;
    const char* message_string_type;
    const char* mapping_type;
    const char* mapping_event_identifier_attribute;
    const char* mapping_event_version_attribute;
    const char* environment_variable_type;  // nullptr если не хранится
};

const ContainerLayout& case_storage_layout();
const ContainerLayout& resources_store_layout();

/// Общая цепочка разрешения поверх хранилища контейнеров
class ContainerBackend : public ResolutionBackend {
public:
    ContainerBackend(store::AttributeContainerStore& store, const ContainerLayout& layout,
                     ResolutionSettings settings);

    std::optional<std::string> resolve_message(const std::string& provider_identifier,
                                               const std::string& log_source,
                                               std::uint32_t message_identifier,
                                               std::optional<std::int64_t> event_version) override;

    std::optional<std::string> resolve_parameter(const std::string& provider_identifier,
                                                 const std::string& log_source,
                                                 std::uint32_t message_identifier) override;

protected:
    /// Тексты строк сообщения из указанных файлов, в порядке хранения
    virtual std::vector<std::string> get_message_strings(
        const std::vector<std::string>& message_file_identifiers,
        std::uint32_t message_identifier) = 0;

    /// Привести строку к позиционному формату
    virtual std::string normalize(std::string message_string) const { return message_string; }

    store::AttributeContainerStore& store() { return store_; }
    const ResolutionSettings& settings() const { return settings_; }

private:
    void ensure_loaded();
    void read_environment_variables();
    void read_providers();
    void read_message_files();

    std::uint32_t get_mapped_message_identifier(const std::string& provider_identifier,
                                                std::uint32_t message_identifier,
                                                std::optional<std::int64_t> event_version);

    void warn(const std::string& message) const;
    void debug(const std::string& message) const;

    store::AttributeContainerStore& store_;
    const ContainerLayout& layout_;
    ResolutionSettings settings_;

    windows::EnvironmentVariables environment_;
    ProviderIndex providers_;
    MessageFileIndex message_files_;
    bool environment_loaded_ = false;
    bool providers_loaded_ = false;
    bool message_files_loaded_ = false;
};

/// Хранилище дела: строки windows_eventlog_message_string напрямую
class StorageReaderBackend : public ContainerBackend {
public:
    StorageReaderBackend(store::AttributeContainerStore& storage_reader,
                         ResolutionSettings settings);

protected:
    std::vector<std::string> get_message_strings(
        const std::vector<std::string>& message_file_identifiers,
        std::uint32_t message_identifier) override;
};

/// Версионированная база winevt-rc: файл -> таблица -> строка
class ResourcesStoreBackend : public ContainerBackend {
public:
    ResourcesStoreBackend(std::unique_ptr<ResourcesStore> resources_store,
                          ResolutionSettings settings);

protected:
    std::vector<std::string> get_message_strings(
        const std::vector<std::string>& message_file_identifiers,
        std::uint32_t message_identifier) override;

    std::string normalize(std::string message_string) const override;

private:
    std::unique_ptr<ResourcesStore> resources_store_;
};

/// База winevt-rc старого формата (только сообщения, по источнику)
class LegacyDatabaseBackend : public ResolutionBackend {
public:
    LegacyDatabaseBackend(std::unique_ptr<LegacyDatabaseReader> reader, std::uint32_t lcid);

    std::optional<std::string> resolve_message(const std::string& provider_identifier,
                                               const std::string& log_source,
                                               std::uint32_t message_identifier,
                                               std::optional<std::int64_t> event_version) override;

    /// В базе старого формата нет файлов параметров провайдера
    std::optional<std::string> resolve_parameter(const std::string& provider_identifier,
                                                 const std::string& log_source,
                                                 std::uint32_t message_identifier) override;

private:
    std::unique_ptr<LegacyDatabaseReader> reader_;
    std::uint32_t lcid_;
};

// ----------------------------------------------------------------------------
// ResourcesHelper
// ----------------------------------------------------------------------------

/// Вид активного источника
enum class BackendKind { None, StorageReader, LegacyDatabase, ResourcesStore };

const char* backend_kind_to_string(BackendKind kind);

/// Разрешение строк сообщений и параметров Windows EventLog
///
/// Использование:
/// @code
///   ResourcesHelper helper(nullptr, "/usr/share/winevtrc", 0x0409, &writer);
///   auto text = helper.get_message_string("", "Application Error", 1000, std::nullopt);
/// @endcode
class ResourcesHelper {
public:
    /// @param storage_reader Хранилище дела; используется, только если в нём
    ///                       есть контейнеры windows_eventlog_provider
    /// @param data_location Каталог с winevt-rc.db (пустой = без базы)
    /// @param lcid LCID; 0 = 0x0409
    /// @param writer Диагностика (nullptr = без вывода)
    /// @param cache_capacity Ёмкость кэша
    /// @param environment Переопределения переменных окружения Windows
    ResourcesHelper(store::AttributeContainerStore* storage_reader,
                    std::filesystem::path data_location, std::uint32_t lcid,
                    output::Writer* writer = nullptr,
                    std::size_t cache_capacity = DEFAULT_CACHE_CAPACITY,
                    windows::EnvironmentVariables environment = {});

    ResourcesHelper(const ResourcesHelper&) = delete;
    ResourcesHelper& operator=(const ResourcesHelper&) = delete;

    /// Получить строку сообщения
    ///
    /// @return nullopt если строка не найдена или источника нет
    /// @throws ResourceError(Integrity) при нарушении целостности базы
    std::optional<std::string> get_message_string(const std::string& provider_identifier,
                                                  const std::string& log_source,
                                                  std::uint32_t message_identifier,
                                                  std::optional<std::int64_t> event_version);

    /// Получить строку параметра (%%<id> в строках событий)
    std::optional<std::string> get_parameter_string(const std::string& provider_identifier,
                                                    const std::string& log_source,
                                                    std::uint32_t message_identifier);

    /// Активный источник (выбирается при первом обращении)
    BackendKind backend_kind();

    std::uint32_t lcid() const { return settings_.lcid; }
    const std::string& language_tag() const { return settings_.language_tag; }
    bool has_storage_reader() const { return storage_reader_ != nullptr; }
    const MessageStringCache& cache() const { return cache_; }

private:
    ResolutionBackend* get_backend();
    std::unique_ptr<ResolutionBackend> open_fallback_database();
    void trace_cache_hit(const std::string& log_source, std::uint32_t message_identifier) const;

    store::AttributeContainerStore* storage_reader_ = nullptr;
    std::filesystem::path data_location_;
    ResolutionSettings settings_;
    MessageStringCache cache_;

    std::unique_ptr<ResolutionBackend> backend_;
    BackendKind backend_kind_ = BackendKind::None;
    bool backend_selected_ = false;
};

}  // namespace winevtrc::resources

#endif  // WINEVTRC_HELPER_HPP
