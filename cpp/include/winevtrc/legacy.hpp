// ==============================================================================
// winevtrc/legacy.hpp - Чтение базы winevt-rc в старом формате (20150315)
// ==============================================================================
//
// Схема базы:
//   metadata(name, value)                      - version, string_format
//   event_log_providers(log_source, event_log_provider_key)
//   message_file_per_event_log_provider(event_log_provider_key, message_file_key)
//   message_table_<message_file_key>_0x<lcid:08x>(message_identifier, message_string)
//
// message_identifier хранится текстом "0x%08x".
//
// ==============================================================================

#ifndef WINEVTRC_LEGACY_HPP
#define WINEVTRC_LEGACY_HPP

#include <winevtrc/sqlite.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace winevtrc::resources {

/// Поддерживаемая версия базы старого формата
constexpr const char* LEGACY_DATABASE_VERSION = "20150315";

/// Читатель базы winevt-rc старого формата
class LegacyDatabaseReader {
public:
    LegacyDatabaseReader() = default;

    /// Открыть базу только для чтения и проверить метаданные
    ///
    /// @return false если файл не открывается или не является базой
    ///         ожидаемой схемы (база при этом закрыта)
    /// @throws ResourceError(UnsupportedFormat) при версии не 20150315 или
    ///         string_format не wrc/pep3101
    bool open(const std::filesystem::path& path);

    /// Закрыть базу
    void close();

    bool is_open() const { return database_.is_open(); }

    /// Формат строк базы (wrc по умолчанию)
    const std::string& string_format() const { return string_format_; }

    /// Получить строку сообщения
    ///
    /// Файлы сообщений провайдера перебираются в порядке хранения, первая
    /// найденная непустая строка возвращается. При string_format == wrc
    /// строка конвертируется в позиционный формат.
    ///
    /// @throws ResourceError(Integrity) при нескольких провайдерах для
    ///         источника или нескольких строках в одной таблице
    std::optional<std::string> get_message(const std::string& log_source, std::uint32_t lcid,
                                           std::uint32_t message_identifier);

    /// Значение метаданных; nullopt если таблицы или строки нет
    /// @throws ResourceError(Integrity) при нескольких строках
    std::optional<std::string> get_metadata_attribute(const std::string& name);

private:
    std::optional<std::int64_t> get_event_log_provider_key(const std::string& log_source);
    std::vector<std::int64_t> get_message_file_keys(std::int64_t event_log_provider_key);
    std::optional<std::string> get_message_from_table(std::int64_t message_file_key,
                                                      std::uint32_t lcid,
                                                      std::uint32_t message_identifier);

    sqlite::DatabaseFile database_;
    std::string string_format_ = "wrc";
};

}  // namespace winevtrc::resources

#endif  // WINEVTRC_LEGACY_HPP
