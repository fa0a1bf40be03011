// ==============================================================================
// winevtrc/windows.hpp - Windows специфика: строки ресурсов, языки, пути
// ==============================================================================
//
// Назначение:
// - Конвертация строк сообщений из формата Windows Resource (wrc, %1)
//   в позиционный формат ({0})
// - Таблица LCID -> тег языка (0x0409 -> en-US), используется для
//   построения путей MUI файлов (<path>\en-us\<file>.mui)
// - Раскрытие переменных окружения и нормализация путей файлов сообщений
//
// ==============================================================================

#ifndef WINEVTRC_WINDOWS_HPP
#define WINEVTRC_WINDOWS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace winevtrc::windows {

// ----------------------------------------------------------------------------
// Строки сообщений
// ----------------------------------------------------------------------------

/// Конвертировать строку сообщения wrc в позиционный формат
///
/// - %1..%99 (с необязательным суффиксом !fmt!) -> {0}..{98}
/// - { и } удваиваются
/// - %n -> '\n', %t -> '\t', %r -> '\r', %% %. %! %<пробел> -> символ
/// - %0, %b, '\r' и '\n' удаляются
std::string format_message_string_in_pep3101(std::string_view message_string);

// ----------------------------------------------------------------------------
// Языки
// ----------------------------------------------------------------------------

/// LCID по умолчанию (en-US)
constexpr std::uint32_t DEFAULT_LCID = 0x0409;

/// Тег языка для LCID, например "en-US"; nullopt если LCID неизвестен
std::optional<std::string> language_tag_for_lcid(std::uint32_t lcid);

/// LCID для тега языка (сравнение без учёта регистра)
std::optional<std::uint32_t> lcid_for_language_tag(std::string_view language_tag);

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Сравнение имён переменных окружения без учёта регистра
struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/// Переменные окружения Windows: имя -> значение
using EnvironmentVariables = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Путь и имя файла, разделённые по последнему '\'
struct SystemPath {
    std::string path;
    std::string filename;
};

/// Раскрыть %VAR% в пути; неизвестные переменные остаются как есть
std::string expand_windows_path(std::string_view path, const EnvironmentVariables& environment);

/// Получить системный путь файла сообщений
///
/// Пример: "%SystemRoot%\System32\wevtapi.dll" -> {"\Windows\System32", "wevtapi.dll"}
///
/// - раскрывает переменные окружения (%SystemRoot% и %WinDir% по умолчанию
///   C:\Windows)
/// - убирает префикс \??\ и букву диска
/// - \SystemRoot\... и относительные System32\... переносит под системный
///   каталог
/// - для имени файла без пути использует \Windows\System32
SystemPath get_windows_system_path(std::string_view path, const EnvironmentVariables& environment);

}  // namespace winevtrc::windows

#endif  // WINEVTRC_WINDOWS_HPP
