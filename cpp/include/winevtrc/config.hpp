// ==============================================================================
// winevtrc/config.hpp - Конфигурация разрешения строк (YAML)
// ==============================================================================
//
// Пример файла:
//
//   data_location: /usr/share/winevtrc
//   lcid: 0x0407
//   storage: case.sqlite
//   cache_capacity: 65536
//   environment:
//     SystemRoot: D:\Windows
//
// Все ключи необязательны. Опции командной строки имеют приоритет.
//
// ==============================================================================

#ifndef WINEVTRC_CONFIG_HPP
#define WINEVTRC_CONFIG_HPP

#include <winevtrc/cache.hpp>
#include <winevtrc/windows.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace winevtrc::config {

struct ResolverConfig {
    std::filesystem::path data_location;
    std::uint32_t lcid = windows::DEFAULT_LCID;
    std::optional<std::filesystem::path> storage_path;
    std::size_t cache_capacity = resources::DEFAULT_CACHE_CAPACITY;
    windows::EnvironmentVariables environment;
};

enum class ConfigErrorKind {
    Io,      // Файл не найден / не читается
    Syntax,  // Некорректный YAML
    Value    // Некорректное значение ключа
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::Io;
    std::string message;
    std::string path;

    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    ResolverConfig config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из строки YAML
ConfigResult parse_config(const std::string& text);

/// Разобрать LCID: десятичное число, 0x<hex> или тег языка (en-US)
std::optional<std::uint32_t> parse_lcid(const std::string& text);

}  // namespace winevtrc::config

#endif  // WINEVTRC_CONFIG_HPP
