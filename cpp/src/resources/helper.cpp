// ==============================================================================
// helper.cpp - Разрешение строк сообщений Windows EventLog
// ==============================================================================

#include <winevtrc/error.hpp>
#include <winevtrc/helper.hpp>
#include <winevtrc/platform.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>

namespace winevtrc::resources {

const std::vector<std::string> DEFAULT_PARAMETER_MESSAGE_FILES = {
    "%SystemRoot%\\System32\\MsObjs.dll",
    "%SystemRoot%\\System32\\kernel32.dll",
};

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string format_hex32(std::uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", value);
    return buffer;
}

std::string join_lookup_path(const windows::SystemPath& system_path) {
    return to_lower(system_path.path + "\\" + system_path.filename);
}

}  // namespace

// ============================================================================
// ProviderIndex
// ============================================================================

void ProviderIndex::add(EventLogProvider provider) {
    size_t index = providers_.size();

    if (provider.identifier && !provider.identifier->empty()) {
        by_identifier_[to_lower(*provider.identifier)] = index;
    }
    for (const auto& log_source : provider.log_sources) {
        by_log_source_[to_lower(log_source)] = index;
    }
    providers_.push_back(std::move(provider));
}

std::pair<const EventLogProvider*, std::string> ProviderIndex::find(
    const std::string& provider_identifier, const std::string& log_source) const {
    if (!provider_identifier.empty()) {
        std::string lookup_key = to_lower(provider_identifier);
        auto it = by_identifier_.find(lookup_key);
        if (it != by_identifier_.end()) {
            return {&providers_[it->second], lookup_key};
        }
    }

    std::string lookup_key = to_lower(log_source);
    auto it = by_log_source_.find(lookup_key);
    if (it != by_log_source_.end()) {
        return {&providers_[it->second], lookup_key};
    }
    return {nullptr, lookup_key};
}

// ============================================================================
// MessageFileIndex
// ============================================================================

MessageFileIndex::MessageFileIndex(std::string language_tag)
    : language_tag_(to_lower(std::move(language_tag))) {}

void MessageFileIndex::add(const std::string& windows_path, const std::string& identifier,
                           const windows::EnvironmentVariables& environment) {
    auto system_path = windows::get_windows_system_path(windows_path, environment);
    files_[join_lookup_path(system_path)] = identifier;
}

std::vector<std::string> MessageFileIndex::resolve(
    const std::vector<std::string>& message_files,
    const windows::EnvironmentVariables& environment) const {
    std::vector<std::string> identifiers;

    for (const auto& windows_path : message_files) {
        auto system_path = windows::get_windows_system_path(windows_path, environment);

        auto it = files_.find(join_lookup_path(system_path));
        if (it != files_.end()) {
            identifiers.push_back(it->second);
        }

        std::string mui_path =
            system_path.path + "\\" + language_tag_ + "\\" + system_path.filename + ".mui";
        it = files_.find(to_lower(mui_path));
        if (it != files_.end()) {
            identifiers.push_back(it->second);
        }
    }
    return identifiers;
}

// ============================================================================
// ContainerLayout
// ============================================================================

const ContainerLayout& case_storage_layout() {
    static const ContainerLayout layout{
        CASE_PROVIDER_TYPE,       CASE_MESSAGE_FILE_TYPE, "path",    CASE_MESSAGE_STRING_TYPE,
        CASE_TEMPLATE_EVENT_TYPE, "identifier",           "version", CASE_ENVIRONMENT_VARIABLE_TYPE,
    };
    return layout;
}

const ContainerLayout& resources_store_layout() {
    static const ContainerLayout layout{
        EVENTLOG_PROVIDER_TYPE,      MESSAGE_FILE_TYPE,  "windows_path",  MESSAGE_STRING_TYPE,
        MESSAGE_STRING_MAPPING_TYPE, "event_identifier", "event_version", nullptr,
    };
    return layout;
}

// ============================================================================
// ContainerBackend
// ============================================================================

ContainerBackend::ContainerBackend(store::AttributeContainerStore& store,
                                   const ContainerLayout& layout, ResolutionSettings settings)
    : store_(store),
      layout_(layout),
      settings_(std::move(settings)),
      message_files_(settings_.language_tag) {}

void ContainerBackend::warn(const std::string& message) const {
    if (settings_.writer != nullptr) {
        settings_.writer->warn(message);
    }
}

void ContainerBackend::debug(const std::string& message) const {
    if (settings_.writer != nullptr) {
        settings_.writer->debug(message);
    }
}

void ContainerBackend::ensure_loaded() {
    if (!environment_loaded_) {
        read_environment_variables();
    }
    if (!providers_loaded_) {
        read_providers();
    }
    if (!message_files_loaded_) {
        read_message_files();
    }
}

void ContainerBackend::read_environment_variables() {
    // Переопределения из конфигурации имеют приоритет
    environment_ = settings_.environment;

    if (layout_.environment_variable_type != nullptr &&
        store_.has_attribute_containers(layout_.environment_variable_type)) {
        for (const auto& container :
             store_.get_attribute_containers(layout_.environment_variable_type)) {
            auto name = container.get_string("name");
            auto value = container.get_string("value");
            if (name && !name->empty() && value) {
                environment_.emplace(*name, *value);
            }
        }
    }
    environment_loaded_ = true;
}

void ContainerBackend::read_providers() {
    providers_ = ProviderIndex();
    if (store_.has_attribute_containers(layout_.provider_type)) {
        for (const auto& container : store_.get_attribute_containers(layout_.provider_type)) {
            providers_.add(EventLogProvider::from_container(container));
        }
    }
    providers_loaded_ = true;
}

void ContainerBackend::read_message_files() {
    message_files_ = MessageFileIndex(settings_.language_tag);
    if (store_.has_attribute_containers(layout_.message_file_type)) {
        for (const auto& container :
             store_.get_attribute_containers(layout_.message_file_type)) {
            auto path = container.get_string(layout_.message_file_path_attribute);
            if (!path || !container.identifier()) {
                continue;
            }
            message_files_.add(*path, *container.identifier(), environment_);
        }
    }
    message_files_loaded_ = true;
}

std::uint32_t ContainerBackend::get_mapped_message_identifier(
    const std::string& provider_identifier, std::uint32_t message_identifier,
    std::optional<std::int64_t> event_version) {
    if (provider_identifier.empty() || !store_.has_attribute_containers(layout_.mapping_type)) {
        return message_identifier;
    }

    store::ContainerFilter filter;
    filter.where("provider_identifier", provider_identifier)
        .where(layout_.mapping_event_identifier_attribute,
               static_cast<std::int64_t>(message_identifier));
    if (event_version) {
        filter.where(layout_.mapping_event_version_attribute, *event_version);
    }
    debug("Template event filter: " + filter.to_string());

    for (const auto& mapping : store_.get_attribute_containers(layout_.mapping_type, filter)) {
        auto mapped = mapping.get_integer("message_identifier");
        if (!mapped) {
            continue;
        }
        auto mapped_identifier = static_cast<std::uint32_t>(*mapped);
        debug("Message: " + format_hex32(message_identifier) +
              " of provider: " + provider_identifier +
              " maps to: " + format_hex32(mapped_identifier));
        return mapped_identifier;
    }
    return message_identifier;
}

std::optional<std::string> ContainerBackend::resolve_message(
    const std::string& provider_identifier, const std::string& log_source,
    std::uint32_t message_identifier, std::optional<std::int64_t> event_version) {
    ensure_loaded();

    auto [provider, lookup_key] = providers_.find(provider_identifier, log_source);
    if (provider == nullptr) {
        return std::nullopt;
    }
    if (!store_.has_attribute_containers(layout_.message_string_type)) {
        return std::nullopt;
    }

    std::uint32_t original_message_identifier = message_identifier;
    message_identifier =
        get_mapped_message_identifier(provider_identifier, message_identifier, event_version);

    auto message_file_identifiers =
        message_files_.resolve(provider->event_message_files, environment_);
    if (message_file_identifiers.empty()) {
        warn("No event message file for identifier: " + format_hex32(message_identifier) +
             " (original: " + format_hex32(original_message_identifier) +
             ") of provider: " + lookup_key);
        return std::nullopt;
    }

    auto message_strings = get_message_strings(message_file_identifiers, message_identifier);
    if (message_strings.empty()) {
        warn("No message string for identifier: " + format_hex32(message_identifier) +
             " (original: " + format_hex32(original_message_identifier) +
             ") of provider: " + lookup_key);
        return std::nullopt;
    }
    return normalize(std::move(message_strings.front()));
}

std::optional<std::string> ContainerBackend::resolve_parameter(
    const std::string& provider_identifier, const std::string& log_source,
    std::uint32_t message_identifier) {
    ensure_loaded();

    auto [provider, lookup_key] = providers_.find(provider_identifier, log_source);
    if (provider == nullptr) {
        return std::nullopt;
    }
    if (!store_.has_attribute_containers(layout_.message_string_type)) {
        return std::nullopt;
    }

    std::vector<std::string> message_files = provider->parameter_message_files;
    if (message_files.empty()) {
        message_files = provider->event_message_files;
        for (const auto& path : DEFAULT_PARAMETER_MESSAGE_FILES) {
            EventLogProvider::add_message_file(message_files, path);
        }
    }

    auto message_file_identifiers = message_files_.resolve(message_files, environment_);
    if (message_file_identifiers.empty()) {
        warn("No parameter message file for identifier: " + format_hex32(message_identifier) +
             " of provider: " + lookup_key);
        return std::nullopt;
    }

    auto message_strings = get_message_strings(message_file_identifiers, message_identifier);
    if (message_strings.empty()) {
        warn("No parameter string for identifier: " + format_hex32(message_identifier) +
             " of provider: " + lookup_key);
        return std::nullopt;
    }
    return normalize(std::move(message_strings.front()));
}

// ============================================================================
// StorageReaderBackend
// ============================================================================

StorageReaderBackend::StorageReaderBackend(store::AttributeContainerStore& storage_reader,
                                           ResolutionSettings settings)
    : ContainerBackend(storage_reader, case_storage_layout(), std::move(settings)) {}

std::vector<std::string> StorageReaderBackend::get_message_strings(
    const std::vector<std::string>& message_file_identifiers,
    std::uint32_t message_identifier) {
    std::vector<std::string> message_strings;

    store::ContainerFilter filter;
    filter.where("language_identifier", static_cast<std::int64_t>(settings().lcid))
        .where("message_identifier", static_cast<std::int64_t>(message_identifier));

    for (const auto& container : store().get_attribute_containers(CASE_MESSAGE_STRING_TYPE,
                                                                  filter)) {
        auto identifier = container.get_string("_message_file_identifier");
        if (!identifier) {
            continue;
        }
        if (std::find(message_file_identifiers.begin(), message_file_identifiers.end(),
                      *identifier) == message_file_identifiers.end()) {
            continue;
        }
        message_strings.push_back(container.get_string("string").value_or(std::string()));
    }
    return message_strings;
}

// ============================================================================
// ResourcesStoreBackend
// ============================================================================

ResourcesStoreBackend::ResourcesStoreBackend(std::unique_ptr<ResourcesStore> resources_store,
                                             ResolutionSettings settings)
    : ContainerBackend(*resources_store, resources_store_layout(), std::move(settings)),
      resources_store_(std::move(resources_store)) {}

std::vector<std::string> ResourcesStoreBackend::get_message_strings(
    const std::vector<std::string>& message_file_identifiers,
    std::uint32_t message_identifier) {
    std::vector<std::string> message_strings;

    for (const auto& message_file_identifier : message_file_identifiers) {
        store::ContainerFilter table_filter;
        table_filter.where("_message_file_identifier", message_file_identifier)
            .where("language_identifier", static_cast<std::int64_t>(settings().lcid));

        for (const auto& table :
             store().get_attribute_containers(MESSAGE_TABLE_TYPE, table_filter)) {
            if (!table.identifier()) {
                continue;
            }

            store::ContainerFilter string_filter;
            string_filter.where("_message_table_identifier", *table.identifier())
                .where("message_identifier", static_cast<std::int64_t>(message_identifier));

            for (const auto& container :
                 store().get_attribute_containers(MESSAGE_STRING_TYPE, string_filter)) {
                message_strings.push_back(MessageString::from_container(container).text);
            }
        }
    }
    return message_strings;
}

std::string ResourcesStoreBackend::normalize(std::string message_string) const {
    if (resources_store_->string_format() == STRING_FORMAT_WRC) {
        return windows::format_message_string_in_pep3101(message_string);
    }
    return message_string;
}

// ============================================================================
// LegacyDatabaseBackend
// ============================================================================

LegacyDatabaseBackend::LegacyDatabaseBackend(std::unique_ptr<LegacyDatabaseReader> reader,
                                             std::uint32_t lcid)
    : reader_(std::move(reader)), lcid_(lcid) {}

std::optional<std::string> LegacyDatabaseBackend::resolve_message(
    const std::string& /*provider_identifier*/, const std::string& log_source,
    std::uint32_t message_identifier, std::optional<std::int64_t> /*event_version*/) {
    return reader_->get_message(log_source, lcid_, message_identifier);
}

std::optional<std::string> LegacyDatabaseBackend::resolve_parameter(
    const std::string& /*provider_identifier*/, const std::string& /*log_source*/,
    std::uint32_t /*message_identifier*/) {
    return std::nullopt;
}

// ============================================================================
// ResourcesHelper
// ============================================================================

const char* backend_kind_to_string(BackendKind kind) {
    switch (kind) {
    case BackendKind::None:
        return "none";
    case BackendKind::StorageReader:
        return "storage";
    case BackendKind::LegacyDatabase:
        return "legacy";
    case BackendKind::ResourcesStore:
        return "resources";
    }
    return "unknown";
}

ResourcesHelper::ResourcesHelper(store::AttributeContainerStore* storage_reader,
                                 std::filesystem::path data_location, std::uint32_t lcid,
                                 output::Writer* writer, std::size_t cache_capacity,
                                 windows::EnvironmentVariables environment)
    : data_location_(std::move(data_location)), cache_(cache_capacity) {
    settings_.lcid = lcid != 0 ? lcid : windows::DEFAULT_LCID;
    // Неизвестный LCID: путь .mui строится для en-US
    settings_.language_tag =
        to_lower(windows::language_tag_for_lcid(settings_.lcid).value_or("en-US"));
    settings_.environment = std::move(environment);
    settings_.writer = writer;

    if (storage_reader != nullptr && storage_reader->has_attribute_containers(CASE_PROVIDER_TYPE)) {
        storage_reader_ = storage_reader;
    }
}

BackendKind ResourcesHelper::backend_kind() {
    get_backend();
    return backend_kind_;
}

ResolutionBackend* ResourcesHelper::get_backend() {
    if (backend_selected_) {
        return backend_.get();
    }
    backend_selected_ = true;

    if (storage_reader_ != nullptr) {
        backend_ = std::make_unique<StorageReaderBackend>(*storage_reader_, settings_);
        backend_kind_ = BackendKind::StorageReader;
    } else {
        backend_ = open_fallback_database();
    }
    return backend_.get();
}

std::unique_ptr<ResolutionBackend> ResourcesHelper::open_fallback_database() {
    if (data_location_.empty()) {
        return nullptr;
    }

    output::Writer* writer = settings_.writer;
    if (writer != nullptr) {
        writer->warn(std::string("Falling back to ") + WINEVT_RC_DATABASE +
                     ". Please make sure the Windows EventLog message strings in the database"
                     " correspond to those in the EventLog files.");
    }

    std::filesystem::path database_path = data_location_ / WINEVT_RC_DATABASE;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(database_path, ec)) {
        if (writer != nullptr) {
            writer->warn("Missing database: " + platform::path_to_utf8(database_path));
        }
        return nullptr;
    }

    try {
        auto reader = std::make_unique<LegacyDatabaseReader>();
        if (reader->open(database_path)) {
            backend_kind_ = BackendKind::LegacyDatabase;
            return std::make_unique<LegacyDatabaseBackend>(std::move(reader), settings_.lcid);
        }

        auto resources_store = std::make_unique<ResourcesStore>();
        resources_store->open(database_path, true);
        backend_kind_ = BackendKind::ResourcesStore;
        return std::make_unique<ResourcesStoreBackend>(std::move(resources_store), settings_);
    } catch (const ResourceError& e) {
        if (e.kind() != ResourceErrorKind::UnsupportedFormat &&
            e.kind() != ResourceErrorKind::Io) {
            throw;
        }
        if (writer != nullptr) {
            writer->warn("Unable to open database: " + platform::path_to_utf8(database_path) +
                         " with error: " + e.what());
        }
    }
    return nullptr;
}

void ResourcesHelper::trace_cache_hit(const std::string& log_source,
                                      std::uint32_t message_identifier) const {
    if (settings_.writer != nullptr) {
        settings_.writer->trace("Cached string for: " + log_source + " " +
                                format_hex32(message_identifier));
    }
}

std::optional<std::string> ResourcesHelper::get_message_string(
    const std::string& provider_identifier, const std::string& log_source,
    std::uint32_t message_identifier, std::optional<std::int64_t> event_version) {
    auto message_string = cache_.get_cached_message_string(provider_identifier, log_source,
                                                           message_identifier, event_version);
    if (message_string) {
        trace_cache_hit(log_source, message_identifier);
        return message_string;
    }

    ResolutionBackend* backend = get_backend();
    if (backend == nullptr) {
        return std::nullopt;
    }

    message_string = backend->resolve_message(provider_identifier, log_source,
                                              message_identifier, event_version);
    if (message_string && !message_string->empty()) {
        cache_.cache_message_string(provider_identifier, log_source, message_identifier,
                                    event_version, *message_string);
    }
    return message_string;
}

std::optional<std::string> ResourcesHelper::get_parameter_string(
    const std::string& provider_identifier, const std::string& log_source,
    std::uint32_t message_identifier) {
    auto message_string = cache_.get_cached_message_string(provider_identifier, log_source,
                                                           message_identifier, std::nullopt);
    if (message_string) {
        trace_cache_hit(log_source, message_identifier);
        return message_string;
    }

    ResolutionBackend* backend = get_backend();
    if (backend == nullptr) {
        return std::nullopt;
    }

    message_string = backend->resolve_parameter(provider_identifier, log_source,
                                                message_identifier);
    if (message_string && !message_string->empty()) {
        cache_.cache_message_string(provider_identifier, log_source, message_identifier,
                                    std::nullopt, *message_string);
    }
    return message_string;
}

}  // namespace winevtrc::resources
