// ==============================================================================
// winevtrc/sqlite_store.hpp - Хранилище контейнеров атрибутов в SQLite
// ==============================================================================
//
// Формат файла:
//   metadata(key TEXT, value TEXT)   - format_version, serialization_format, ...
//   <container_type>(_identifier INTEGER PRIMARY KEY AUTOINCREMENT, <атрибуты>)
//
// Атрибуты-списки сериализуются в JSON (serialization_format = "json").
// Таблица типа создаётся при первой записи контейнера этого типа.
//
// Совместимость проверяется по четырём версиям формата:
//   read_compatible <= format_version <= format   - можно читать
//   format_version >= append/upgrade_compatible   - можно дописывать
//
// ==============================================================================

#ifndef WINEVTRC_SQLITE_STORE_HPP
#define WINEVTRC_SQLITE_STORE_HPP

#include <winevtrc/container.hpp>
#include <winevtrc/sqlite.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace winevtrc::store {

/// Версии формата хранилища
struct FormatVersions {
    std::int64_t format = 20230312;
    std::int64_t append_compatible = 20230226;
    std::int64_t upgrade_compatible = 20221023;
    std::int64_t read_compatible = 20221023;
};

/// Метаданные хранилища: ключ -> значение
using StorageMetadata = std::map<std::string, std::string>;

/// Проверить метаданные хранилища на совместимость
///
/// @param metadata Прочитанные метаданные
/// @param versions Версии формата, поддерживаемые хранилищем
/// @param check_readable_only true - только чтение, false - чтение и запись
/// @throws ResourceError(Io) при отсутствии/некорректности версии, слишком
///         старом или новом формате, неподдерживаемом serialization_format
void check_storage_metadata(const StorageMetadata& metadata, const FormatVersions& versions,
                            bool check_readable_only);

/// Хранилище контейнеров атрибутов в SQLite файле
class SqliteAttributeContainerStore : public AttributeContainerStore {
public:
    explicit SqliteAttributeContainerStore(FormatVersions versions = FormatVersions{});
    ~SqliteAttributeContainerStore() override;

    SqliteAttributeContainerStore(const SqliteAttributeContainerStore&) = delete;
    SqliteAttributeContainerStore& operator=(const SqliteAttributeContainerStore&) = delete;

    /// Зарегистрировать схему типа контейнера
    /// @throws std::invalid_argument при недопустимом имени типа или атрибута
    void register_schema(ContainerSchema schema);

    /// Открыть хранилище
    ///
    /// @param path Путь к файлу
    /// @param read_only true - только чтение; false - новый файл создаётся
    ///                  с метаданными, существующий проверяется на
    ///                  возможность дозаписи
    /// @throws ResourceError(Io) если файл не открывается или несовместим
    void open(const std::filesystem::path& path, bool read_only = true);

    /// Закрыть хранилище
    /// @throws ResourceError(State) если хранилище не открыто
    void close();

    bool is_open() const { return database_.is_open(); }
    bool read_only() const { return database_.read_only(); }

    std::int64_t format_version() const { return format_version_; }
    const std::string& serialization_format() const { return serialization_format_; }
    const FormatVersions& format_versions() const { return versions_; }

    /// Значение метаданных по ключу
    std::optional<std::string> get_metadata_value(const std::string& key);

    // AttributeContainerStore
    bool has_attribute_containers(const std::string& container_type) override;
    std::vector<AttributeContainer> get_attribute_containers(
        const std::string& container_type, const ContainerFilter& filter = {}) override;
    std::size_t get_number_of_attribute_containers(const std::string& container_type) override;
    void add_attribute_container(AttributeContainer& container) override;

protected:
    /// Прочитать все метаданные
    StorageMetadata read_metadata();

    /// Прочитать и проверить метаданные при открытии существующего файла
    virtual void read_and_check_storage_metadata(bool check_readable_only);

    /// Метаданные, записываемые в новый файл
    virtual StorageMetadata initial_metadata() const;

    std::int64_t format_version_ = 0;
    std::string serialization_format_;

private:
    const ContainerSchema& require_schema(const std::string& container_type) const;
    void write_metadata(const StorageMetadata& metadata);
    void create_table(const ContainerSchema& schema);
    AttributeContainer read_container(const ContainerSchema& schema,
                                      const sqlite::Statement& statement) const;

    FormatVersions versions_;
    sqlite::DatabaseFile database_;
    std::map<std::string, ContainerSchema> schemas_;
};

}  // namespace winevtrc::store

#endif  // WINEVTRC_SQLITE_STORE_HPP
