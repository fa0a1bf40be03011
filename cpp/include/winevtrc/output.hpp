// ==============================================================================
// winevtrc/output.hpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами [x] [!] [+] [*] [~] и уровнями -q / -v / -vv
// - Результаты разрешения: текст, таблица метаданных или pretty JSON
//
// Библиотечные классы принимают output::Writer* (nullptr = без вывода).
//
// ==============================================================================

#ifndef WINEVTRC_OUTPUT_HPP
#define WINEVTRC_OUTPUT_HPP

#include <rapidjson/document.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace winevtrc::output {

enum class Stream { Stdout, Stderr };

/// Уровень диагностики
enum class Level {
    Error,    // [x] всегда
    Warning,  // [!] кроме -q
    Info,     // [+] кроме -q
    Debug,    // [*] при -v
    Trace     // [~] при -vv
};

struct OutputConfig {
    bool quiet = false;  // -q
    int verbose = 0;     // -v (повторяемая)
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Будет ли сообщение уровня level напечатано
    bool enabled(Level level) const;

    /// "<prefix> <message>" в stderr, если уровень включен
    void log(Level level, std::string_view message);

    void error(std::string_view message) { log(Level::Error, message); }
    void warn(std::string_view message) { log(Level::Warning, message); }
    void info(std::string_view message) { log(Level::Info, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    /// JSON с отступом в 4 пробела + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

/// Таблица с Unicode рамкой (вывод metadata)
class Table {
public:
    void set_headers(std::vector<std::string> headers);
    void add_row(std::vector<std::string> cells);

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "<prefix> <message>\n" без цвета
std::string format_diagnostic(Level level, std::string_view message);

/// Строка для ячейки таблицы: \r, \n, \t и повторные пробелы -> один пробел
std::string format_field(std::string_view field);

/// Количество символов UTF-8 строки (для выравнивания таблиц)
size_t display_width(std::string_view text);

}  // namespace winevtrc::output

#endif  // WINEVTRC_OUTPUT_HPP
