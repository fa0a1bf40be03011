// ==============================================================================
// path.cpp - Нормализация путей файлов сообщений Windows
// ==============================================================================
//
// Пути файлов сообщений в провайдерах EventLog записаны в реестре в разных
// формах:
//   %SystemRoot%\System32\wevtapi.dll
//   C:\Windows\System32\wevtapi.dll
//   \SystemRoot\System32\drivers\foo.sys
//   \??\C:\Windows\System32\foo.dll
//   System32\foo.dll
//   foo.dll
// Все они приводятся к виду {"\Windows\System32", "foo.dll"}, чтобы индекс
// файлов сообщений и пути провайдеров совпадали.
//
// ==============================================================================

#include <winevtrc/windows.hpp>

#include <algorithm>
#include <cctype>

namespace winevtrc::windows {

namespace {

const EnvironmentVariables& default_environment() {
    static const EnvironmentVariables defaults = {
        {"SystemRoot", "C:\\Windows"},
        {"WinDir", "C:\\Windows"},
        {"SystemDrive", "C:"},
        {"ProgramFiles", "C:\\Program Files"},
        {"ProgramData", "C:\\ProgramData"},
        {"CommonProgramFiles", "C:\\Program Files\\Common Files"},
    };
    return defaults;
}

bool starts_with_ci(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string strip_drive(std::string path) {
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        path.erase(0, 2);
    }
    return path;
}

void strip_trailing_separators(std::string& path) {
    while (!path.empty() && path.back() == '\\') {
        path.pop_back();
    }
}

}  // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

std::string expand_windows_path(std::string_view path, const EnvironmentVariables& environment) {
    std::string result;
    result.reserve(path.size());

    size_t i = 0;
    while (i < path.size()) {
        if (path[i] != '%') {
            result += path[i];
            ++i;
            continue;
        }

        size_t closing = path.find('%', i + 1);
        if (closing == std::string_view::npos || closing == i + 1) {
            result += path[i];
            ++i;
            continue;
        }

        std::string name(path.substr(i + 1, closing - i - 1));
        auto it = environment.find(name);
        if (it != environment.end()) {
            result += it->second;
        } else if (auto def = default_environment().find(name);
                   def != default_environment().end()) {
            result += def->second;
        } else {
            result.append(path.substr(i, closing - i + 1));
        }
        i = closing + 1;
    }

    return result;
}

SystemPath get_windows_system_path(std::string_view path, const EnvironmentVariables& environment) {
    std::string expanded = expand_windows_path(path, environment);
    std::replace(expanded.begin(), expanded.end(), '/', '\\');

    SystemPath result;
    size_t separator = expanded.rfind('\\');
    if (separator == std::string::npos) {
        result.filename = expanded;
    } else {
        result.path = expanded.substr(0, separator);
        result.filename = expanded.substr(separator + 1);
    }

    std::string system_root = strip_drive(expand_windows_path("%SystemRoot%", environment));
    strip_trailing_separators(system_root);

    std::string& dir = result.path;
    if (starts_with_ci(dir, "\\??\\")) {
        dir.erase(0, 4);
    }
    dir = strip_drive(std::move(dir));
    strip_trailing_separators(dir);

    if (starts_with_ci(dir, "\\SystemRoot") &&
        (dir.size() == 11 || dir[11] == '\\')) {
        dir = system_root + dir.substr(11);
    }

    if (separator == std::string::npos) {
        dir = system_root + "\\System32";
    } else if (!dir.empty() && dir[0] != '\\') {
        dir = system_root + "\\" + dir;
    }

    return result;
}

}  // namespace winevtrc::windows
