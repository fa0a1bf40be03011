// ==============================================================================
// test_windows_gtest.cpp - Тесты строк wrc, языков и путей Windows
// ==============================================================================

#include <winevtrc/windows.hpp>

#include <gtest/gtest.h>

#include <string>

namespace winevtrc::windows::test {

// ==============================================================================
// format_message_string_in_pep3101
// ==============================================================================

TEST(FormatMessageTest, InsertionSpecifiers_BecomePositional) {
    EXPECT_EQ(format_message_string_in_pep3101("Service %1 failed"), "Service {0} failed");
    EXPECT_EQ(format_message_string_in_pep3101("%1 and %2 and %10"), "{0} and {1} and {9}");
    EXPECT_EQ(format_message_string_in_pep3101("%99"), "{98}");
}

TEST(FormatMessageTest, PrintfSuffix_IsDropped) {
    EXPECT_EQ(format_message_string_in_pep3101("Code %1!08lx! set"), "Code {0} set");
    EXPECT_EQ(format_message_string_in_pep3101("%2!s!"), "{1}");
}

TEST(FormatMessageTest, Braces_AreDoubled) {
    EXPECT_EQ(format_message_string_in_pep3101("{%1}"), "{{{0}}}");
}

TEST(FormatMessageTest, EscapeSequences) {
    EXPECT_EQ(format_message_string_in_pep3101("a%nb%tc"), "a\nb\tc");
    EXPECT_EQ(format_message_string_in_pep3101("100%% done%."), "100% done.");
    EXPECT_EQ(format_message_string_in_pep3101("%!x%! %b"), "!x! ");
}

TEST(FormatMessageTest, LineBreaksAndTerminator_AreRemoved) {
    EXPECT_EQ(format_message_string_in_pep3101("Line one\r\nLine two%0"), "Line oneLine two");
}

TEST(FormatMessageTest, Terminator_DropsRemainingText) {
    EXPECT_EQ(format_message_string_in_pep3101("Access %1 granted.%0%r%nTrailing %2 text"),
              "Access {0} granted.");
    EXPECT_EQ(format_message_string_in_pep3101("%0Hidden"), "");
    EXPECT_EQ(format_message_string_in_pep3101("Kept %%0 literal"), "Kept %0 literal");
}

TEST(FormatMessageTest, TrailingPercent_IsKept) {
    EXPECT_EQ(format_message_string_in_pep3101("100%"), "100%");
    EXPECT_EQ(format_message_string_in_pep3101("%q"), "%q");
}

TEST(FormatMessageTest, PlainText_Unchanged) {
    EXPECT_EQ(format_message_string_in_pep3101("Nothing to see"), "Nothing to see");
    EXPECT_EQ(format_message_string_in_pep3101(""), "");
}

// ==============================================================================
// Языки
// ==============================================================================

TEST(LanguageTest, KnownLcid_ReturnsTag) {
    EXPECT_EQ(language_tag_for_lcid(0x0409).value_or(""), "en-US");
    EXPECT_EQ(language_tag_for_lcid(0x0407).value_or(""), "de-DE");
    EXPECT_FALSE(language_tag_for_lcid(0xffff).has_value());
}

TEST(LanguageTest, TagLookup_IsCaseInsensitive) {
    ASSERT_TRUE(lcid_for_language_tag("en-us").has_value());
    EXPECT_EQ(*lcid_for_language_tag("en-us"), 0x0409u);
    EXPECT_EQ(*lcid_for_language_tag("DE-de"), 0x0407u);
    EXPECT_FALSE(lcid_for_language_tag("xx-XX").has_value());
}

// ==============================================================================
// Пути
// ==============================================================================

TEST(WindowsPathTest, ExpandWindowsPath_UsesOverridesThenDefaults) {
    EnvironmentVariables environment = {{"SystemRoot", "D:\\WINNT"}};

    EXPECT_EQ(expand_windows_path("%systemroot%\\System32", environment),
              "D:\\WINNT\\System32");
    EXPECT_EQ(expand_windows_path("%WinDir%\\explorer.exe", {}), "C:\\Windows\\explorer.exe");
    EXPECT_EQ(expand_windows_path("%Unknown%\\a.dll", {}), "%Unknown%\\a.dll");
}

TEST(WindowsPathTest, SystemRootVariable_Normalized) {
    auto result = get_windows_system_path("%SystemRoot%\\System32\\wevtapi.dll", {});
    EXPECT_EQ(result.path, "\\Windows\\System32");
    EXPECT_EQ(result.filename, "wevtapi.dll");
}

TEST(WindowsPathTest, AllSpellings_ShareLookupPath) {
    const char* spellings[] = {
        "C:\\Windows\\System32\\wer.dll",
        "\\SystemRoot\\System32\\wer.dll",
        "\\??\\C:\\Windows\\System32\\wer.dll",
        "System32\\wer.dll",
        "wer.dll",
    };
    for (const char* spelling : spellings) {
        auto result = get_windows_system_path(spelling, {});
        EXPECT_EQ(result.path, "\\Windows\\System32") << spelling;
        EXPECT_EQ(result.filename, "wer.dll") << spelling;
    }
}

TEST(WindowsPathTest, ForwardSlashes_AreConverted) {
    auto result = get_windows_system_path("C:/Program Files/App/app.dll", {});
    EXPECT_EQ(result.path, "\\Program Files\\App");
    EXPECT_EQ(result.filename, "app.dll");
}

TEST(WindowsPathTest, EnvironmentOverride_ChangesSystemRoot) {
    EnvironmentVariables environment = {{"SystemRoot", "C:\\WINNT"}};
    auto result = get_windows_system_path("%SystemRoot%\\System32\\netmsg.dll", environment);
    EXPECT_EQ(result.path, "\\WINNT\\System32");
}

}  // namespace winevtrc::windows::test
