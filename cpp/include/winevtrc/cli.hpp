// ==============================================================================
// winevtrc/cli.hpp - Парсинг командной строки winevtrc
// ==============================================================================
//
// Назначение:
// - Парсинг argv в команду и опции
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Команды:
//   winevtrc message [OPTIONS] <LOG_SOURCE> <MESSAGE_ID>
//   winevtrc parameter [OPTIONS] <LOG_SOURCE> <PARAMETER_ID>
//   winevtrc metadata [OPTIONS] <DATABASE>
//
// ==============================================================================

#ifndef WINEVTRC_CLI_HPP
#define WINEVTRC_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace winevtrc::cli {

// ----------------------------------------------------------------------------
// Опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (повторяемая)
    bool quiet = false;  // -q
};

/// Опции разрешения строк, общие для message и parameter
struct ResolveOptions {
    std::optional<std::filesystem::path> data_location;  // -d, --data-location
    std::optional<std::uint32_t> lcid;                   // -l, --lcid
    std::optional<std::filesystem::path> storage;        // -s, --storage
    std::optional<std::filesystem::path> config;         // -c, --config
    std::optional<std::string> provider;                 // -p, --provider
    bool json = false;                                   // -j, --json
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// message - строка сообщения события
struct MessageCommand {
    ResolveOptions options;
    std::string log_source;
    std::uint32_t message_identifier = 0;
    std::optional<std::int64_t> event_version;  // --event-version
};

/// parameter - строка параметра (%%<id>)
struct ParameterCommand {
    ResolveOptions options;
    std::string log_source;
    std::uint32_t parameter_identifier = 0;
};

/// metadata - метаданные базы winevt-rc
struct MetadataCommand {
    std::filesystem::path database;
    bool json = false;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<MessageCommand, ParameterCommand, MetadataCommand, HelpCommand,
                             VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для команды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Разобрать идентификатор: десятичный или 0x<hex>, до 0xffffffff
std::optional<std::uint32_t> parse_identifier(std::string_view text);

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Resolve Windows EventLog message strings";

}  // namespace winevtrc::cli

#endif  // WINEVTRC_CLI_HPP
