// ==============================================================================
// winevtrc/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// - UTF-8 <-> std::filesystem::path (пути к базам и файлам дела)
// - Проверка терминала для цветной диагностики
// - Временные файлы и каталоги для фикстур баз winevt-rc
//
// ==============================================================================

#ifndef WINEVTRC_PLATFORM_HPP
#define WINEVTRC_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace winevtrc::platform {

/// Создать path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// UTF-8 представление path
std::string path_to_utf8(const std::filesystem::path& p);

/// Поток связан с терминалом
bool is_terminal(std::FILE* stream);

/// Создать пустой временный файл <tmp>/<prefix>_XXXXXX
///
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file(std::string_view prefix);

/// Создать пустой временный каталог <tmp>/<prefix>_XXXXXX
///
/// @throws std::runtime_error если каталог создать не удалось
std::filesystem::path make_temp_directory(std::string_view prefix);

}  // namespace winevtrc::platform

#endif  // WINEVTRC_PLATFORM_HPP
