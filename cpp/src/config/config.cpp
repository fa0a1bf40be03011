// ==============================================================================
// config.cpp - Конфигурация разрешения строк (YAML)
// ==============================================================================

#include <winevtrc/config.hpp>
#include <winevtrc/platform.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <system_error>

namespace winevtrc::config {

namespace {

// Ошибка значения ключа; перехватывается в parse_root
struct ValueError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    int base = 10;
    std::string digits = text;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        digits = text.substr(2);
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(digits, &pos, base);
        if (pos != digits.size() || digits[0] == '-' || digits[0] == '+') {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

void parse_root(const YAML::Node& root, ResolverConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ValueError("configuration must be a mapping");
    }

    if (auto node = root["data_location"]) {
        config.data_location = platform::path_from_utf8(node.as<std::string>());
    }

    if (auto node = root["lcid"]) {
        auto lcid = parse_lcid(node.as<std::string>());
        if (!lcid) {
            throw ValueError("invalid lcid: " + node.as<std::string>());
        }
        config.lcid = *lcid;
    }

    if (auto node = root["storage"]) {
        config.storage_path = platform::path_from_utf8(node.as<std::string>());
    }

    if (auto node = root["cache_capacity"]) {
        auto capacity = parse_unsigned(node.as<std::string>());
        if (!capacity || *capacity == 0) {
            throw ValueError("invalid cache_capacity: " + node.as<std::string>());
        }
        config.cache_capacity = static_cast<std::size_t>(*capacity);
    }

    if (auto node = root["environment"]) {
        if (!node.IsMap()) {
            throw ValueError("environment must be a mapping");
        }
        for (const auto& entry : node) {
            config.environment[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
}

ConfigResult parse_node(const YAML::Node& root, const std::string& path) {
    ConfigResult result;
    try {
        parse_root(root, result.config);
        result.ok = true;
    } catch (const ValueError& e) {
        result.error = ConfigError{ConfigErrorKind::Value, e.what(), path};
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{ConfigErrorKind::Value, e.what(), path};
    }
    return result;
}

}  // namespace

std::string ConfigError::format() const {
    if (path.empty()) {
        return message;
    }
    return message + " in " + path;
}

std::optional<std::uint32_t> parse_lcid(const std::string& text) {
    auto value = parse_unsigned(text);
    if (value) {
        if (*value > 0xffffffffULL) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(*value);
    }
    return windows::lcid_for_language_tag(text);
}

ConfigResult load_config(const std::filesystem::path& path) {
    std::string path_utf8 = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        ConfigResult result;
        result.error = ConfigError{ConfigErrorKind::Io, "configuration file not found", path_utf8};
        return result;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_utf8);
    } catch (const YAML::BadFile& e) {
        ConfigResult result;
        result.error = ConfigError{ConfigErrorKind::Io, e.what(), path_utf8};
        return result;
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = ConfigError{ConfigErrorKind::Syntax, e.what(), path_utf8};
        return result;
    }
    return parse_node(root, path_utf8);
}

ConfigResult parse_config(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = ConfigError{ConfigErrorKind::Syntax, e.what(), ""};
        return result;
    }
    return parse_node(root, "");
}

}  // namespace winevtrc::config
