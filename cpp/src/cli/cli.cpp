// ==============================================================================
// cli.cpp - Парсинг командной строки winevtrc
// ==============================================================================
//
// Формат ошибок и справки следует clap: "error: ...", пустая строка,
// Usage, подсказка "For more information, try '--help'."
//
// ==============================================================================

#include <winevtrc/cli.hpp>
#include <winevtrc/config.hpp>
#include <winevtrc/platform.hpp>

#include <cstring>
#include <stdexcept>
#include <vector>

namespace winevtrc::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

const char* usage_for(const std::string& command) {
    if (command == "message") {
        return "Usage: winevtrc message [OPTIONS] <LOG_SOURCE> <MESSAGE_ID>\n";
    }
    if (command == "parameter") {
        return "Usage: winevtrc parameter [OPTIONS] <LOG_SOURCE> <PARAMETER_ID>\n";
    }
    if (command == "metadata") {
        return "Usage: winevtrc metadata [OPTIONS] <DATABASE>\n";
    }
    return "Usage: winevtrc [OPTIONS] <COMMAND>\n";
}

ParseResult usage_error(ParseResult result, const std::string& command,
                        const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message + "\n\n" + usage_for(command) +
                                       "\nFor more information, try '--help'.\n";
    return result;
}

/// Разбор аргументов одной подкоманды
///
/// Общие опции (-q, -v, -d, -l, -s, -c, -p, -j) разбираются здесь, опции
/// конкретной команды передаются в handle_option.
class CommandArgs {
public:
    CommandArgs(int argc, char** argv, int start) : argc_(argc), argv_(argv), index_(start) {}

    bool done() const { return index_ >= argc_; }
    const char* current() const { return argv_[index_]; }
    void advance() { ++index_; }

    /// Значение опции: следующий аргумент
    std::optional<std::string> take_value() {
        if (index_ + 1 >= argc_) {
            return std::nullopt;
        }
        ++index_;
        return std::string(argv_[index_]);
    }

private:
    int argc_;
    char** argv_;
    int index_;
};

enum class OptionStatus { Handled, NotMatched, Error };

/// Разобрать общую опцию разрешения
OptionStatus parse_resolve_option(CommandArgs& args, ResolveOptions& options,
                                  GlobalOptions& global, std::string& error) {
    const char* arg = args.current();

    auto require_value = [&](const char* name) -> std::optional<std::string> {
        auto value = args.take_value();
        if (!value) {
            error = std::string("a value is required for '") + name + "' but none was supplied";
        }
        return value;
    };

    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
        global.verbose++;
    } else if (str_eq(arg, "-vv")) {
        global.verbose += 2;
    } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
        options.json = true;
    } else if (str_eq(arg, "-d") || str_eq(arg, "--data-location")) {
        auto value = require_value("--data-location <DATA_LOCATION>");
        if (!value) {
            return OptionStatus::Error;
        }
        options.data_location = platform::path_from_utf8(*value);
    } else if (str_eq(arg, "-s") || str_eq(arg, "--storage")) {
        auto value = require_value("--storage <STORAGE>");
        if (!value) {
            return OptionStatus::Error;
        }
        options.storage = platform::path_from_utf8(*value);
    } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
        auto value = require_value("--config <CONFIG>");
        if (!value) {
            return OptionStatus::Error;
        }
        options.config = platform::path_from_utf8(*value);
    } else if (str_eq(arg, "-p") || str_eq(arg, "--provider")) {
        auto value = require_value("--provider <PROVIDER>");
        if (!value) {
            return OptionStatus::Error;
        }
        options.provider = *value;
    } else if (str_eq(arg, "-l") || str_eq(arg, "--lcid")) {
        auto value = require_value("--lcid <LCID>");
        if (!value) {
            return OptionStatus::Error;
        }
        auto lcid = config::parse_lcid(*value);
        if (!lcid) {
            error = "invalid value '" + *value + "' for '--lcid <LCID>'";
            return OptionStatus::Error;
        }
        options.lcid = *lcid;
    } else {
        return OptionStatus::NotMatched;
    }
    return OptionStatus::Handled;
}

ParseResult parse_resolve_command(ParseResult result, const std::string& command, int argc,
                                  char** argv, int start) {
    ResolveOptions options;
    std::optional<std::int64_t> event_version;
    std::vector<std::string> positional;

    CommandArgs args(argc, argv, start);
    for (; !args.done(); args.advance()) {
        const char* arg = args.current();

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{command};
            return result;
        }

        if (command == "message" && str_eq(arg, "--event-version")) {
            auto value = args.take_value();
            if (!value) {
                return usage_error(
                    result, command,
                    "a value is required for '--event-version <EVENT_VERSION>' but none was "
                    "supplied");
            }
            auto version = parse_identifier(*value);
            if (!version) {
                return usage_error(result, command,
                                   "invalid value '" + *value +
                                       "' for '--event-version <EVENT_VERSION>'");
            }
            event_version = static_cast<std::int64_t>(*version);
            continue;
        }

        std::string error;
        switch (parse_resolve_option(args, options, result.global, error)) {
        case OptionStatus::Handled:
            continue;
        case OptionStatus::Error:
            return usage_error(result, command, error);
        case OptionStatus::NotMatched:
            break;
        }

        if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(result, command, std::string("unexpected argument '") + arg +
                                                    "' found");
        }
        positional.emplace_back(arg);
    }

    const char* id_name = command == "message" ? "<MESSAGE_ID>" : "<PARAMETER_ID>";
    if (positional.size() < 2) {
        std::string missing = "the following required arguments were not provided:\n";
        if (positional.empty()) {
            missing += "  <LOG_SOURCE>\n";
        }
        missing += std::string("  ") + id_name;
        return usage_error(result, command, missing);
    }
    if (positional.size() > 2) {
        return usage_error(result, command,
                           "unexpected argument '" + positional[2] + "' found");
    }

    auto identifier = parse_identifier(positional[1]);
    if (!identifier) {
        return usage_error(result, command,
                           "invalid value '" + positional[1] + "' for '" + id_name + "'");
    }

    if (command == "message") {
        MessageCommand message_cmd;
        message_cmd.options = std::move(options);
        message_cmd.log_source = positional[0];
        message_cmd.message_identifier = *identifier;
        message_cmd.event_version = event_version;
        result.command = std::move(message_cmd);
    } else {
        ParameterCommand parameter_cmd;
        parameter_cmd.options = std::move(options);
        parameter_cmd.log_source = positional[0];
        parameter_cmd.parameter_identifier = *identifier;
        result.command = std::move(parameter_cmd);
    }
    result.ok = true;
    return result;
}

ParseResult parse_metadata_command(ParseResult result, int argc, char** argv, int start) {
    MetadataCommand metadata_cmd;
    bool have_database = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{std::string("metadata")};
            return result;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            metadata_cmd.json = true;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result.global.verbose++;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(result, "metadata",
                               std::string("unexpected argument '") + arg + "' found");
        } else if (have_database) {
            return usage_error(result, "metadata",
                               std::string("unexpected argument '") + arg + "' found");
        } else {
            metadata_cmd.database = platform::path_from_utf8(arg);
            have_database = true;
        }
    }

    if (!have_database) {
        return usage_error(result, "metadata",
                           "the following required arguments were not provided:\n  <DATABASE>");
    }

    result.ok = true;
    result.command = std::move(metadata_cmd);
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("winevtrc ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    static const char* RESOLVE_OPTIONS =
        "  -d, --data-location <DATA_LOCATION>  Directory containing winevt-rc.db\n"
        "  -l, --lcid <LCID>                    Language code identifier [default: 0x0409]\n"
        "  -s, --storage <STORAGE>              Case storage file with EventLog resources\n"
        "  -c, --config <CONFIG>                YAML configuration file\n"
        "  -p, --provider <PROVIDER>            EventLog provider identifier (GUID)\n"
        "  -j, --json                           Output as JSON\n"
        "  -q                                   Suppress informational output\n"
        "  -v...                                Print verbose output\n"
        "  -h, --help                           Print help\n";

    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: winevtrc [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  message    Resolve the message string of an event\n"
               "  parameter  Resolve a parameter string\n"
               "  metadata   Print the metadata of a winevt-rc database\n"
               "  help       Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -q             Suppress informational output\n"
               "  -v...          Print verbose output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Resolve event 1000 of \"Application Error\":\n"
               "        ./winevtrc message -d data/ \"Application Error\" 1000\n"
               "\n"
               "    Resolve a German parameter string from a case storage file:\n"
               "        ./winevtrc parameter -s case.sqlite -l 0x0407 Security 0x2d02\n";
    } else if (*command == "message") {
        return std::string("Resolve the message string of an event\n"
                           "\n") +
               usage_for(*command) +
               "\n"
               "Arguments:\n"
               "  <LOG_SOURCE>  EventLog source, such as \"Application Error\"\n"
               "  <MESSAGE_ID>  Event or message identifier, decimal or 0x hexadecimal\n"
               "\n"
               "Options:\n"
               "      --event-version <EVENT_VERSION>  Event version\n" +
               RESOLVE_OPTIONS;
    } else if (*command == "parameter") {
        return std::string("Resolve a parameter string\n"
                           "\n") +
               usage_for(*command) +
               "\n"
               "Arguments:\n"
               "  <LOG_SOURCE>    EventLog source, such as \"Security\"\n"
               "  <PARAMETER_ID>  Parameter identifier, decimal or 0x hexadecimal\n"
               "\n"
               "Options:\n" +
               RESOLVE_OPTIONS;
    } else if (*command == "metadata") {
        return std::string("Print the metadata of a winevt-rc database\n"
                           "\n") +
               usage_for(*command) +
               "\n"
               "Arguments:\n"
               "  <DATABASE>  Path to a winevt-rc database\n"
               "\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse_identifier
// ----------------------------------------------------------------------------

std::optional<std::uint32_t> parse_identifier(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    int base = 10;
    std::string digits(text);
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits = digits.substr(2);
    }
    if (digits.empty() || digits[0] == '-' || digits[0] == '+' || digits[0] == ' ') {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(digits, &pos, base);
        if (pos != digits.size() || value > 0xffffffffULL) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return usage_error(result, "", std::string("unexpected argument '") + arg +
                                               "' found");
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    std::string command = argv[cmd_idx];
    if (command == "message" || command == "parameter") {
        return parse_resolve_command(result, command, argc, argv, cmd_idx + 1);
    }
    if (command == "metadata") {
        return parse_metadata_command(result, argc, argv, cmd_idx + 1);
    }
    if (command == "help") {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
        return result;
    }

    return usage_error(result, "", "unrecognized subcommand '" + command + "'");
}

}  // namespace winevtrc::cli
