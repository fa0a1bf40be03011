// ==============================================================================
// output.cpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты пишутся через fwrite,
// без std::endl.
//
// ==============================================================================

#include <winevtrc/output.hpp>
#include <winevtrc/platform.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <cstdio>
#include <utility>

namespace winevtrc::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";

struct LevelStyle {
    const char* prefix;
    const char* color;
};

LevelStyle style_of(Level level) {
    switch (level) {
    case Level::Error:
        return {"[x]", "\x1b[31m"};
    case Level::Warning:
        return {"[!]", "\x1b[33m"};
    case Level::Info:
        return {"[+]", "\x1b[32m"};
    case Level::Debug:
        return {"[*]", "\x1b[36m"};
    case Level::Trace:
        return {"[~]", "\x1b[35m"};
    }
    return {"[?]", ""};
}

// Unicode box-drawing, UTF-8
constexpr const char* BOX_V = "\xe2\x94\x82";  // │
constexpr const char* BOX_H = "\xe2\x94\x80";  // ─

struct BorderStyle {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr BorderStyle BORDER_TOP = {"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};     // ┌┬┐
constexpr BorderStyle BORDER_HEADER = {"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├┼┤
constexpr BorderStyle BORDER_BOTTOM = {"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └┴┘

std::string border_line(const std::vector<size_t>& widths, const BorderStyle& style) {
    std::string line = style.left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? style.middle : style.right;
    }
    if (widths.empty()) {
        line += style.right;
    }
    line += '\n';
    return line;
}

std::string table_row(const std::vector<size_t>& widths, const std::vector<std::string>& cells) {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string& cell = (i < cells.size()) ? cells[i] : std::string();
        line += ' ';
        line += cell;
        line.append(widths[i] - std::min(widths[i], display_width(cell)), ' ');
        line += ' ';
        line += BOX_V;
    }
    line += '\n';
    return line;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = (s == Stream::Stdout) ? stdout : stderr;
    std::fwrite(bytes.data(), 1, bytes.size(), f);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warning:
    case Level::Info:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Trace:
        return config_.verbose > 1;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    if (!platform::is_terminal(stderr)) {
        write(Stream::Stderr, format_diagnostic(level, message));
        return;
    }
    LevelStyle style = style_of(level);
    std::string line = std::string(style.color) + style.prefix + ANSI_RESET + " ";
    line.append(message);
    line += '\n';
    write(Stream::Stderr, line);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(std::vector<std::string> headers) {
    headers_ = std::move(headers);
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::vector<size_t> Table::column_widths() const {
    std::vector<size_t> widths(headers_.size(), 0);
    auto widen = [&widths](const std::vector<std::string>& cells) {
        if (widths.size() < cells.size()) {
            widths.resize(cells.size(), 0);
        }
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };

    widen(headers_);
    for (const auto& row : rows_) {
        widen(row);
    }
    return widths;
}

std::string Table::to_string() const {
    auto widths = column_widths();

    std::string result = border_line(widths, BORDER_TOP);
    if (!headers_.empty()) {
        result += table_row(widths, headers_);
        result += border_line(widths, BORDER_HEADER);
    }
    for (const auto& row : rows_) {
        result += table_row(widths, row);
    }
    result += border_line(widths, BORDER_BOTTOM);
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_diagnostic(Level level, std::string_view message) {
    std::string line = style_of(level).prefix;
    line += ' ';
    line.append(message);
    line += '\n';
    return line;
}

std::string format_field(std::string_view field) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        bool space = c == '\n' || c == '\r' || c == '\t' || c == ' ';
        if (space && prev_space) {
            continue;
        }
        result += space ? ' ' : c;
        prev_space = space;
    }
    return result;
}

size_t display_width(std::string_view text) {
    // Продолжения UTF-8 (10xxxxxx) не считаются
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace winevtrc::output
