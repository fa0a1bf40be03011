// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "winevtrc/platform.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#include <random>
#else
#include <stdlib.h>
#include <unistd.h>
#endif

namespace winevtrc::platform {

namespace {

std::string temp_template(std::string_view prefix) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("Failed to get temp path: " + ec.message());
    }
    return path_to_utf8(base / path_from_utf8(std::string(prefix) + "_XXXXXX"));
}

#ifdef _WIN32
// Заменить XXXXXX случайными hex символами
std::string randomize(std::string tmpl) {
    static const char hex_chars[] = "0123456789abcdef";
    std::random_device rd;
    std::uniform_int_distribution<> dis(0, 15);
    for (size_t i = tmpl.size() - 6; i < tmpl.size(); ++i) {
        tmpl[i] = hex_chars[dis(rd)];
    }
    return tmpl;
}
#endif

}  // namespace

std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_terminal(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

std::filesystem::path make_temp_file(std::string_view prefix) {
    std::string tmpl = temp_template(prefix);
#ifdef _WIN32
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = path_from_utf8(randomize(tmpl));
        // "x": не открывать существующий файл
        FILE* f = _wfopen(candidate.c_str(), L"wbx");
        if (f != nullptr) {
            std::fclose(f);
            return candidate;
        }
    }
#else
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    int fd = mkstemp(buffer.data());
    if (fd != -1) {
        close(fd);
        return path_from_utf8(buffer.data());
    }
#endif
    throw std::runtime_error("Failed to create temp file");
}

std::filesystem::path make_temp_directory(std::string_view prefix) {
    std::string tmpl = temp_template(prefix);
#ifdef _WIN32
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = path_from_utf8(randomize(tmpl));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
    }
#else
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) != nullptr) {
        return path_from_utf8(buffer.data());
    }
#endif
    throw std::runtime_error("Failed to create temp directory");
}

}  // namespace winevtrc::platform
