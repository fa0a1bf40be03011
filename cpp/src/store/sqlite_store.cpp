// ==============================================================================
// sqlite_store.cpp - Хранилище контейнеров атрибутов в SQLite
// ==============================================================================

#include <winevtrc/error.hpp>
#include <winevtrc/platform.hpp>
#include <winevtrc/sqlite_store.hpp>

#include <cctype>
#include <stdexcept>
#include <system_error>

namespace winevtrc::store {

namespace {

constexpr const char* METADATA_TABLE = "metadata";
constexpr const char* SERIALIZATION_FORMAT = "json";

// Имена таблиц и колонок подставляются в SQL напрямую
bool is_valid_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

const char* column_type(AttributeType type) {
    return type == AttributeType::Integer ? "INTEGER" : "TEXT";
}

std::optional<std::int64_t> parse_integer(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos, 10);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

[[noreturn]] void throw_io(const std::string& message) {
    throw ResourceError(ResourceErrorKind::Io, message);
}

}  // namespace

// ============================================================================
// Проверка метаданных
// ============================================================================

void check_storage_metadata(const StorageMetadata& metadata, const FormatVersions& versions,
                            bool check_readable_only) {
    auto it = metadata.find("format_version");
    if (it == metadata.end() || it->second.empty()) {
        throw_io("Missing format version.");
    }

    auto format_version = parse_integer(it->second);
    if (!format_version) {
        throw_io("Invalid format version: " + it->second + ".");
    }

    if (!check_readable_only && *format_version < versions.upgrade_compatible) {
        throw_io("Format version: " + std::to_string(*format_version) +
                 " is too old and can no longer be written, minimum supported version: " +
                 std::to_string(versions.upgrade_compatible) + ".");
    }

    if (!check_readable_only && *format_version < versions.append_compatible) {
        throw_io("Format version: " + std::to_string(*format_version) +
                 " is too old and can no longer be appended to, minimum supported version: " +
                 std::to_string(versions.append_compatible) + ".");
    }

    if (*format_version < versions.read_compatible) {
        throw_io("Format version: " + std::to_string(*format_version) +
                 " is too old and can no longer be read, minimum supported version: " +
                 std::to_string(versions.read_compatible) + ".");
    }

    if (*format_version > versions.format) {
        throw_io("Format version: " + std::to_string(*format_version) +
                 " is too new and not supported, maximum supported version: " +
                 std::to_string(versions.format) + ".");
    }

    auto serialization = metadata.find("serialization_format");
    std::string serialization_format =
        serialization != metadata.end() ? serialization->second : std::string();
    if (serialization_format != SERIALIZATION_FORMAT) {
        throw_io("Unsupported serialization format: " + serialization_format + ".");
    }
}

// ============================================================================
// SqliteAttributeContainerStore
// ============================================================================

SqliteAttributeContainerStore::SqliteAttributeContainerStore(FormatVersions versions)
    : versions_(versions) {}

SqliteAttributeContainerStore::~SqliteAttributeContainerStore() = default;

void SqliteAttributeContainerStore::register_schema(ContainerSchema schema) {
    if (!is_valid_name(schema.container_type)) {
        throw std::invalid_argument("invalid container type: " + schema.container_type);
    }
    for (const auto& attribute : schema.attributes) {
        if (!is_valid_name(attribute.name) || attribute.name == "_identifier") {
            throw std::invalid_argument("invalid attribute name: " + attribute.name);
        }
    }
    std::string container_type = schema.container_type;
    schemas_[container_type] = std::move(schema);
}

void SqliteAttributeContainerStore::open(const std::filesystem::path& path, bool read_only) {
    std::string path_utf8 = platform::path_to_utf8(path);

    std::error_code ec;
    bool exists = std::filesystem::is_regular_file(path, ec);
    if (read_only && !exists) {
        throw_io("No such storage file: " + path_utf8);
    }

    if (!database_.open(path, read_only)) {
        throw_io("Unable to open storage file: " + path_utf8);
    }

    try {
        if (database_.has_table(METADATA_TABLE)) {
            read_and_check_storage_metadata(read_only);
        } else if (read_only) {
            throw_io("Missing metadata in storage file: " + path_utf8);
        } else {
            database_.execute("CREATE TABLE metadata (key TEXT, value TEXT)");
            write_metadata(initial_metadata());
            read_and_check_storage_metadata(false);
        }
    } catch (const ResourceError& e) {
        database_.close();
        if (e.kind() == ResourceErrorKind::Sql) {
            throw_io("Unable to read storage file: " + path_utf8 + " - " + e.what());
        }
        throw;
    }
}

void SqliteAttributeContainerStore::close() {
    database_.close();
    format_version_ = 0;
    serialization_format_.clear();
}

StorageMetadata SqliteAttributeContainerStore::read_metadata() {
    StorageMetadata metadata;
    auto cursor = database_.get_values({METADATA_TABLE}, {"key", "value"}, "");
    sqlite::Row row;
    while (cursor.next(row)) {
        metadata[row["key"].to_display_string()] = row["value"].to_display_string();
    }
    return metadata;
}

void SqliteAttributeContainerStore::read_and_check_storage_metadata(bool check_readable_only) {
    StorageMetadata metadata = read_metadata();
    check_storage_metadata(metadata, versions_, check_readable_only);

    format_version_ = parse_integer(metadata["format_version"]).value_or(0);
    serialization_format_ = metadata["serialization_format"];
}

StorageMetadata SqliteAttributeContainerStore::initial_metadata() const {
    return {
        {"format_version", std::to_string(versions_.format)},
        {"serialization_format", SERIALIZATION_FORMAT},
    };
}

std::optional<std::string> SqliteAttributeContainerStore::get_metadata_value(
    const std::string& key) {
    if (!database_.has_table(METADATA_TABLE)) {
        return std::nullopt;
    }
    auto statement = database_.prepare("SELECT value FROM metadata WHERE key = ?");
    statement.bind_text(1, key);
    if (!statement.step()) {
        return std::nullopt;
    }
    return statement.column(0).to_display_string();
}

void SqliteAttributeContainerStore::write_metadata(const StorageMetadata& metadata) {
    for (const auto& [key, value] : metadata) {
        auto statement = database_.prepare("INSERT INTO metadata (key, value) VALUES (?, ?)");
        statement.bind_text(1, key);
        statement.bind_text(2, value);
        statement.step();
    }
}

const ContainerSchema& SqliteAttributeContainerStore::require_schema(
    const std::string& container_type) const {
    auto it = schemas_.find(container_type);
    if (it == schemas_.end()) {
        throw_io("Unsupported attribute container type: " + container_type);
    }
    return it->second;
}

void SqliteAttributeContainerStore::create_table(const ContainerSchema& schema) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + schema.container_type +
                      " (_identifier INTEGER PRIMARY KEY AUTOINCREMENT";
    for (const auto& attribute : schema.attributes) {
        sql += ", ";
        sql += attribute.name;
        sql += ' ';
        sql += column_type(attribute.type);
    }
    sql += ")";
    database_.execute(sql);
}

bool SqliteAttributeContainerStore::has_attribute_containers(const std::string& container_type) {
    return get_number_of_attribute_containers(container_type) > 0;
}

std::size_t SqliteAttributeContainerStore::get_number_of_attribute_containers(
    const std::string& container_type) {
    if (schemas_.find(container_type) == schemas_.end() ||
        !database_.has_table(container_type)) {
        return 0;
    }
    auto statement = database_.prepare("SELECT COUNT(*) FROM " + container_type);
    if (!statement.step()) {
        return 0;
    }
    return static_cast<std::size_t>(statement.column(0).to_int64().value_or(0));
}

std::vector<AttributeContainer> SqliteAttributeContainerStore::get_attribute_containers(
    const std::string& container_type, const ContainerFilter& filter) {
    std::vector<AttributeContainer> result;

    const ContainerSchema& schema = require_schema(container_type);
    if (!database_.has_table(container_type)) {
        return result;
    }

    std::string sql = "SELECT _identifier";
    for (const auto& attribute : schema.attributes) {
        sql += ", ";
        sql += attribute.name;
    }
    sql += " FROM " + container_type;

    const auto& conditions = filter.conditions();
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (schema.find(conditions[i].attribute) == nullptr) {
            throw_io("Unsupported filter attribute: " + conditions[i].attribute + " of type: " +
                     container_type);
        }
        sql += (i == 0) ? " WHERE " : " AND ";
        sql += conditions[i].attribute;
        sql += conditions[i].value.is_null() ? " IS ?" : " = ?";
    }
    sql += " ORDER BY _identifier";

    auto statement = database_.prepare(sql);
    for (size_t i = 0; i < conditions.size(); ++i) {
        statement.bind(static_cast<int>(i) + 1, conditions[i].value);
    }

    while (statement.step()) {
        result.push_back(read_container(schema, statement));
    }
    return result;
}

AttributeContainer SqliteAttributeContainerStore::read_container(
    const ContainerSchema& schema, const sqlite::Statement& statement) const {
    AttributeContainer container(schema.container_type);

    auto sequence = statement.column(0).to_int64();
    if (sequence) {
        container.set_identifier(make_container_identifier(schema.container_type, *sequence));
    }

    for (size_t i = 0; i < schema.attributes.size(); ++i) {
        const auto& attribute = schema.attributes[i];
        Value value = statement.column(static_cast<int>(i) + 1);
        if (value.is_null()) {
            continue;
        }
        if (attribute.type == AttributeType::StringList && value.is_text()) {
            try {
                value = Value::from_json(value.as_text());
            } catch (const std::runtime_error& e) {
                throw_io("Unable to deserialize attribute: " + attribute.name + " of " +
                         schema.container_type + " - " + e.what());
            }
        }
        container.set(attribute.name, std::move(value));
    }
    return container;
}

void SqliteAttributeContainerStore::add_attribute_container(AttributeContainer& container) {
    if (database_.read_only()) {
        throw ResourceError(ResourceErrorKind::State,
                            "Cannot write attribute container storage opened read-only.");
    }

    const ContainerSchema& schema = require_schema(container.container_type());
    create_table(schema);

    std::string columns;
    std::string placeholders;
    for (const auto& attribute : schema.attributes) {
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += attribute.name;
        placeholders += '?';
    }

    std::string sql = "INSERT INTO " + schema.container_type;
    if (columns.empty()) {
        sql += " DEFAULT VALUES";
    } else {
        sql += " (" + columns + ") VALUES (" + placeholders + ")";
    }

    auto statement = database_.prepare(sql);
    for (size_t i = 0; i < schema.attributes.size(); ++i) {
        const Value* value = container.get(schema.attributes[i].name);
        if (value == nullptr) {
            statement.bind_null(static_cast<int>(i) + 1);
        } else {
            statement.bind(static_cast<int>(i) + 1, *value);
        }
    }
    statement.step();

    container.set_identifier(
        make_container_identifier(schema.container_type, database_.last_insert_rowid()));
}

}  // namespace winevtrc::store
