// ==============================================================================
// legacy.cpp - Чтение базы winevt-rc в старом формате
// ==============================================================================

#include <winevtrc/error.hpp>
#include <winevtrc/legacy.hpp>
#include <winevtrc/resources.hpp>
#include <winevtrc/windows.hpp>

#include <cstdio>

namespace winevtrc::resources {

namespace {

std::string format_hex32(std::uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", value);
    return buffer;
}

[[noreturn]] void throw_more_than_one() {
    throw ResourceError(ResourceErrorKind::Integrity, "More than one value found in database.");
}

}  // namespace

bool LegacyDatabaseReader::open(const std::filesystem::path& path) {
    if (!database_.open(path, true)) {
        return false;
    }

    std::optional<std::string> version;
    std::optional<std::string> string_format;
    try {
        version = get_metadata_attribute("version");
        string_format = get_metadata_attribute("string_format");
    } catch (const ResourceError& e) {
        if (e.kind() != ResourceErrorKind::Sql) {
            database_.close();
            throw;
        }
        // Не база данных или другая схема
        database_.close();
        return false;
    }

    if (!version || *version != LEGACY_DATABASE_VERSION) {
        database_.close();
        throw ResourceError(ResourceErrorKind::UnsupportedFormat,
                            "Unsupported version: " + version.value_or(std::string()));
    }

    if (!string_format || string_format->empty()) {
        string_format = STRING_FORMAT_WRC;
    }
    if (!is_supported_string_format(*string_format)) {
        database_.close();
        throw ResourceError(ResourceErrorKind::UnsupportedFormat,
                            "Unsupported string format: " + *string_format);
    }

    string_format_ = *string_format;
    return true;
}

void LegacyDatabaseReader::close() {
    database_.close();
}

std::optional<std::string> LegacyDatabaseReader::get_metadata_attribute(const std::string& name) {
    if (!database_.has_table("metadata")) {
        return std::nullopt;
    }

    auto rows =
        database_.get_values({"metadata"}, {"value"}, "name = " + sqlite::quote_literal(name))
            .collect();
    if (rows.empty()) {
        return std::nullopt;
    }
    if (rows.size() > 1) {
        throw_more_than_one();
    }
    return rows.front()["value"].to_optional_string();
}

std::optional<std::int64_t> LegacyDatabaseReader::get_event_log_provider_key(
    const std::string& log_source) {
    auto rows = database_
                    .get_values({"event_log_providers"}, {"event_log_provider_key"},
                                "log_source = " + sqlite::quote_literal(log_source))
                    .collect();
    if (rows.empty()) {
        return std::nullopt;
    }
    if (rows.size() > 1) {
        throw_more_than_one();
    }
    return rows.front()["event_log_provider_key"].to_int64();
}

std::vector<std::int64_t> LegacyDatabaseReader::get_message_file_keys(
    std::int64_t event_log_provider_key) {
    std::vector<std::int64_t> keys;

    auto cursor = database_.get_values({"message_file_per_event_log_provider"},
                                       {"message_file_key"},
                                       "event_log_provider_key = " +
                                           std::to_string(event_log_provider_key));
    sqlite::Row row;
    while (cursor.next(row)) {
        if (auto key = row["message_file_key"].to_int64()) {
            keys.push_back(*key);
        }
    }
    return keys;
}

std::optional<std::string> LegacyDatabaseReader::get_message_from_table(
    std::int64_t message_file_key, std::uint32_t lcid, std::uint32_t message_identifier) {
    std::string table_name =
        "message_table_" + std::to_string(message_file_key) + "_" + format_hex32(lcid);
    if (!database_.has_table(table_name)) {
        return std::nullopt;
    }

    auto rows = database_
                    .get_values({table_name}, {"message_string"},
                                "message_identifier = " +
                                    sqlite::quote_literal(format_hex32(message_identifier)))
                    .collect();
    if (rows.empty()) {
        return std::nullopt;
    }
    if (rows.size() > 1) {
        throw_more_than_one();
    }
    return rows.front()["message_string"].to_optional_string();
}

std::optional<std::string> LegacyDatabaseReader::get_message(const std::string& log_source,
                                                             std::uint32_t lcid,
                                                             std::uint32_t message_identifier) {
    auto event_log_provider_key = get_event_log_provider_key(log_source);
    if (!event_log_provider_key) {
        return std::nullopt;
    }

    std::optional<std::string> message_string;
    for (std::int64_t message_file_key : get_message_file_keys(*event_log_provider_key)) {
        message_string = get_message_from_table(message_file_key, lcid, message_identifier);
        if (message_string && !message_string->empty()) {
            break;
        }
        message_string.reset();
    }

    if (message_string && string_format_ == STRING_FORMAT_WRC) {
        message_string = windows::format_message_string_in_pep3101(*message_string);
    }
    return message_string;
}

}  // namespace winevtrc::resources
