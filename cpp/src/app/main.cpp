// ==============================================================================
// main.cpp - Точка входа winevtrc
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации, опции командной строки поверх неё
// 4. Dispatch команды, exit code
//
// Exit codes: 0 - строка найдена, 1 - не найдена или ошибка, 2 - ошибка
// использования.
//
// ==============================================================================

#include <winevtrc/cli.hpp>
#include <winevtrc/config.hpp>
#include <winevtrc/error.hpp>
#include <winevtrc/helper.hpp>
#include <winevtrc/legacy.hpp>
#include <winevtrc/output.hpp>
#include <winevtrc/platform.hpp>
#include <winevtrc/resources.hpp>

#include <rapidjson/document.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <system_error>
#include <type_traits>

namespace {

using namespace winevtrc;

std::string format_hex32(std::uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", value);
    return buffer;
}

void add_string_member(rapidjson::Value& object, const char* name, const std::string& value,
                       rapidjson::Document::AllocatorType& alloc) {
    object.AddMember(rapidjson::Value(name, alloc), rapidjson::Value(value.c_str(), alloc), alloc);
}

// ----------------------------------------------------------------------------
// Конфигурация
// ----------------------------------------------------------------------------

/// Собрать конфигурацию: файл -c, затем опции командной строки
bool build_config(const cli::ResolveOptions& options, output::Writer& writer,
                  config::ResolverConfig& out) {
    if (options.config) {
        auto result = config::load_config(*options.config);
        if (!result) {
            writer.error("Unable to load configuration: " + result.error.format());
            return false;
        }
        out = std::move(result.config);
        writer.debug("Loaded configuration: " + platform::path_to_utf8(*options.config));
    }

    if (options.data_location) {
        out.data_location = *options.data_location;
    }
    if (options.lcid) {
        out.lcid = *options.lcid;
    }
    if (options.storage) {
        out.storage_path = *options.storage;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Вывод результата
// ----------------------------------------------------------------------------

int print_resolution(const char* kind, const std::string& log_source, std::uint32_t identifier,
                     const std::optional<std::string>& text, bool json,
                     resources::ResourcesHelper& helper, output::Writer& writer) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        add_string_member(doc, "kind", kind, alloc);
        add_string_member(doc, "log_source", log_source, alloc);
        add_string_member(doc, "identifier", format_hex32(identifier), alloc);
        add_string_member(doc, "lcid", format_hex32(helper.lcid()), alloc);
        add_string_member(doc, "backend",
                          resources::backend_kind_to_string(helper.backend_kind()), alloc);
        if (text) {
            add_string_member(doc, "text", *text, alloc);
        } else {
            rapidjson::Value null_text(rapidjson::kNullType);
            doc.AddMember("text", null_text, alloc);
        }
        writer.write_json_pretty(doc);
    } else if (text) {
        writer.write_line(output::Stream::Stdout, *text);
    }

    if (!text) {
        writer.error(std::string("No ") + kind + " string for identifier: " +
                     format_hex32(identifier) + " of: " + log_source);
        return 1;
    }
    return 0;
}

/// Выполнить разрешение с открытыми хранилищами
template <typename Resolve>
int with_helper(const cli::ResolveOptions& options, output::Writer& writer, Resolve resolve) {
    config::ResolverConfig cfg;
    if (!build_config(options, writer, cfg)) {
        return 1;
    }

    std::unique_ptr<store::SqliteAttributeContainerStore> storage;
    if (cfg.storage_path) {
        storage = resources::open_case_storage(*cfg.storage_path);
        writer.debug("Opened case storage: " + platform::path_to_utf8(*cfg.storage_path));
    }

    resources::ResourcesHelper helper(storage.get(), cfg.data_location, cfg.lcid, &writer,
                                      cfg.cache_capacity, cfg.environment);
    writer.debug("Language: " + helper.language_tag() + " (" + format_hex32(helper.lcid()) +
                 ")");
    return resolve(helper);
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_message(const cli::MessageCommand& cmd, output::Writer& writer) {
    return with_helper(cmd.options, writer, [&](resources::ResourcesHelper& helper) {
        auto text = helper.get_message_string(cmd.options.provider.value_or(""), cmd.log_source,
                                              cmd.message_identifier, cmd.event_version);
        return print_resolution("message", cmd.log_source, cmd.message_identifier, text,
                                cmd.options.json, helper, writer);
    });
}

int run_parameter(const cli::ParameterCommand& cmd, output::Writer& writer) {
    return with_helper(cmd.options, writer, [&](resources::ResourcesHelper& helper) {
        auto text = helper.get_parameter_string(cmd.options.provider.value_or(""),
                                                cmd.log_source, cmd.parameter_identifier);
        return print_resolution("parameter", cmd.log_source, cmd.parameter_identifier, text,
                                cmd.options.json, helper, writer);
    });
}

void print_metadata(const char* kind, const store::StorageMetadata& metadata, bool json,
                    output::Writer& writer) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        add_string_member(doc, "kind", kind, alloc);
        for (const auto& [key, value] : metadata) {
            add_string_member(doc, key.c_str(), value, alloc);
        }
        writer.write_json_pretty(doc);
        return;
    }

    output::Table table;
    table.set_headers({"name", "value"});
    table.add_row({"kind", kind});
    for (const auto& [key, value] : metadata) {
        table.add_row({key, output::format_field(value)});
    }
    writer.write(output::Stream::Stdout, table.to_string());
}

int run_metadata(const cli::MetadataCommand& cmd, output::Writer& writer) {
    std::string path_utf8 = platform::path_to_utf8(cmd.database);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(cmd.database, ec)) {
        writer.error("No such database: " + path_utf8);
        return 1;
    }

    resources::LegacyDatabaseReader reader;
    if (reader.open(cmd.database)) {
        store::StorageMetadata metadata;
        metadata["version"] = reader.get_metadata_attribute("version").value_or("");
        metadata["string_format"] = reader.string_format();
        reader.close();
        print_metadata("legacy", metadata, cmd.json, writer);
        return 0;
    }
    writer.debug("Not a legacy database: " + path_utf8);

    resources::ResourcesStore resources_store;
    resources_store.open(cmd.database, true);

    store::StorageMetadata metadata;
    metadata["format_version"] = std::to_string(resources_store.format_version());
    metadata["serialization_format"] = resources_store.serialization_format();
    metadata["string_format"] = resources_store.string_format();
    for (const char* type :
         {resources::EVENTLOG_PROVIDER_TYPE, resources::MESSAGE_FILE_TYPE,
          resources::MESSAGE_TABLE_TYPE, resources::MESSAGE_STRING_TYPE,
          resources::MESSAGE_STRING_MAPPING_TYPE}) {
        metadata[std::string("number_of_") + type] =
            std::to_string(resources_store.get_number_of_attribute_containers(type));
    }
    resources_store.close();

    print_metadata("resources", metadata, cmd.json, writer);
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    try {
        return std::visit(
            [&](auto&& cmd) -> int {
                using T = std::decay_t<decltype(cmd)>;

                if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                    writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                    return 0;
                } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                    writer.write(output::Stream::Stdout, cli::render_version());
                    return 0;
                } else if constexpr (std::is_same_v<T, cli::MessageCommand>) {
                    return run_message(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::ParameterCommand>) {
                    return run_parameter(cmd, writer);
                } else {
                    return run_metadata(cmd, writer);
                }
            },
            parse_result.command);
    } catch (const ResourceError& e) {
        writer.error(e.format());
        return 1;
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
