// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include <winevtrc/cli.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace winevtrc::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_NoArgs_PrintsHelpWithExitCode2) {
    Args args{"winevtrc"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: winevtrc [OPTIONS] <COMMAND>"));
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"winevtrc", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"winevtrc", "--version"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "winevtrc 0.1.0\n");
}

TEST(CliTest, Parse_OnlyGlobalFlags_ReturnsHelp) {
    Args args{"winevtrc", "-q", "-v"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 1);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_UnknownGlobalOption_IsUsageError) {
    Args args{"winevtrc", "--bogus", "message"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unexpected argument '--bogus' found\n\n"
              "Usage: winevtrc [OPTIONS] <COMMAND>\n"
              "\nFor more information, try '--help'.\n");
}

TEST(CliTest, Parse_UnknownSubcommand_IsUsageError) {
    Args args{"winevtrc", "foo"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "error: unrecognized subcommand 'foo'"));
}

TEST(CliTest, Parse_HelpSubcommand_CarriesCommandName) {
    Args args{"winevtrc", "help", "message"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "message");
}

// ==============================================================================
// message / parameter
// ==============================================================================

TEST(CliTest, Parse_Message_AllOptions) {
    // Arrange
    Args args{"winevtrc",  "-v",       "message", "-d",
              "/data",     "-l",       "0x0407",  "-p",
              "{guid}",    "--event-version", "2", "-j",
              "Application Error", "0x3e8"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_EQ(result.global.verbose, 1);
    ASSERT_TRUE(std::holds_alternative<MessageCommand>(result.command));
    const auto& cmd = std::get<MessageCommand>(result.command);
    EXPECT_EQ(cmd.log_source, "Application Error");
    EXPECT_EQ(cmd.message_identifier, 0x3e8u);
    EXPECT_EQ(cmd.event_version.value_or(-1), 2);
    EXPECT_EQ(cmd.options.data_location.value_or("").string(), "/data");
    EXPECT_EQ(cmd.options.lcid.value_or(0), 0x0407u);
    EXPECT_EQ(cmd.options.provider.value_or(""), "{guid}");
    EXPECT_TRUE(cmd.options.json);
    EXPECT_FALSE(cmd.options.storage.has_value());
}

TEST(CliTest, Parse_Message_LanguageTagLcid) {
    Args args{"winevtrc", "message", "--lcid", "de-DE", "Application Error", "1000"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<MessageCommand>(result.command);
    EXPECT_EQ(cmd.options.lcid.value_or(0), 0x0407u);
    EXPECT_EQ(cmd.message_identifier, 1000u);
    EXPECT_FALSE(cmd.event_version.has_value());
}

TEST(CliTest, Parse_Parameter_WithStorageAndQuiet) {
    Args args{"winevtrc", "parameter", "-q", "-s", "case.sqlite", "Security", "0x2d02"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(std::holds_alternative<ParameterCommand>(result.command));
    const auto& cmd = std::get<ParameterCommand>(result.command);
    EXPECT_EQ(cmd.log_source, "Security");
    EXPECT_EQ(cmd.parameter_identifier, 0x2d02u);
    EXPECT_EQ(cmd.options.storage.value_or("").string(), "case.sqlite");
}

TEST(CliTest, Parse_Parameter_EventVersionIsUnexpected) {
    Args args{"winevtrc", "parameter", "--event-version", "2", "Security", "1"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "error: unexpected argument '--event-version' found"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "Usage: winevtrc parameter [OPTIONS] <LOG_SOURCE> <PARAMETER_ID>"));
}

TEST(CliTest, Parse_Message_MissingPositionals) {
    Args args{"winevtrc", "message"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "the following required arguments were not provided:\n"
                         "  <LOG_SOURCE>\n"
                         "  <MESSAGE_ID>"));
}

TEST(CliTest, Parse_Message_MissingIdentifierOnly) {
    Args args{"winevtrc", "message", "Application Error"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "were not provided:\n  <MESSAGE_ID>\n"));
    EXPECT_FALSE(contains(result.diagnostic.stderr_message, "<LOG_SOURCE>\n  <MESSAGE_ID>"));
}

TEST(CliTest, Parse_Message_ExtraPositional) {
    Args args{"winevtrc", "message", "Application Error", "1", "extra"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument 'extra' found"));
}

TEST(CliTest, Parse_Message_InvalidIdentifier) {
    Args args{"winevtrc", "message", "Application Error", "0xzz"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "invalid value '0xzz' for '<MESSAGE_ID>'"));
}

TEST(CliTest, Parse_Message_InvalidLcid) {
    Args args{"winevtrc", "message", "-l", "xx-YY", "Application Error", "1"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "invalid value 'xx-YY' for '--lcid <LCID>'"));
}

TEST(CliTest, Parse_Message_MissingOptionValue) {
    Args args{"winevtrc", "message", "Application Error", "1", "--storage"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "a value is required for '--storage <STORAGE>' but none was supplied"));
}

TEST(CliTest, Parse_Message_HelpInsideSubcommand) {
    Args args{"winevtrc", "message", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "message");
}

// ==============================================================================
// metadata
// ==============================================================================

TEST(CliTest, Parse_Metadata_Json) {
    Args args{"winevtrc", "metadata", "-j", "winevt-rc.db"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<MetadataCommand>(result.command));
    const auto& cmd = std::get<MetadataCommand>(result.command);
    EXPECT_TRUE(cmd.json);
    EXPECT_EQ(cmd.database.string(), "winevt-rc.db");
}

TEST(CliTest, Parse_Metadata_MissingDatabase) {
    Args args{"winevtrc", "metadata"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "the following required arguments were not provided:\n  <DATABASE>"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "Usage: winevtrc metadata [OPTIONS] <DATABASE>"));
}

TEST(CliTest, Parse_Metadata_ResolveOptionIsUnexpected) {
    Args args{"winevtrc", "metadata", "-d", "/data", "winevt-rc.db"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument '-d' found"));
}

// ==============================================================================
// Справка и идентификаторы
// ==============================================================================

TEST(CliTest, RenderHelp_PerCommand) {
    EXPECT_TRUE(contains(render_help(), "Commands:\n  message"));
    EXPECT_TRUE(contains(render_help(std::string("message")), "--event-version"));
    EXPECT_FALSE(contains(render_help(std::string("parameter")), "--event-version"));
    EXPECT_TRUE(contains(render_help(std::string("metadata")), "<DATABASE>"));
    EXPECT_EQ(render_help(std::string("foo")), "error: unrecognized subcommand 'foo'\n");
}

TEST(CliTest, ParseIdentifier_DecimalAndHex) {
    EXPECT_EQ(parse_identifier("1000").value_or(0), 1000u);
    EXPECT_EQ(parse_identifier("0x3E8").value_or(0), 0x3e8u);
    EXPECT_EQ(parse_identifier("0xffffffff").value_or(0), 0xffffffffu);
    EXPECT_EQ(parse_identifier("0").value_or(1), 0u);
}

TEST(CliTest, ParseIdentifier_Rejects) {
    EXPECT_FALSE(parse_identifier("").has_value());
    EXPECT_FALSE(parse_identifier("0x").has_value());
    EXPECT_FALSE(parse_identifier("0x100000000").has_value());
    EXPECT_FALSE(parse_identifier("-1").has_value());
    EXPECT_FALSE(parse_identifier("12abc").has_value());
    EXPECT_FALSE(parse_identifier(" 1").has_value());
}

}  // namespace winevtrc::cli::test
