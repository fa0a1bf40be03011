// ==============================================================================
// cache.cpp - LRU кэш строк сообщений
// ==============================================================================

#include <winevtrc/cache.hpp>

#include <cstdio>

namespace winevtrc::resources {

std::string make_cache_key(CacheKeyKind kind, const std::string& identifier,
                           std::uint32_t message_identifier,
                           std::optional<std::int64_t> event_version) {
    char hex[16];
    std::snprintf(hex, sizeof(hex), "0x%08x", message_identifier);

    std::string key = kind == CacheKeyKind::Provider ? "p|" : "s|";
    key += identifier;
    key += ':';
    key += hex;
    if (event_version) {
        key += ':';
        key += std::to_string(*event_version);
    }
    return key;
}

MessageStringCache::MessageStringCache(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<std::string> MessageStringCache::get(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
}

void MessageStringCache::put(const std::string& key, std::string value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(value);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    if (index_.size() >= capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }

    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();
}

void MessageStringCache::clear() {
    entries_.clear();
    index_.clear();
}

void MessageStringCache::cache_message_string(const std::string& provider_identifier,
                                              const std::string& log_source,
                                              std::uint32_t message_identifier,
                                              std::optional<std::int64_t> event_version,
                                              const std::string& message_string) {
    if (!provider_identifier.empty()) {
        put(make_cache_key(CacheKeyKind::Provider, provider_identifier, message_identifier,
                           event_version),
            message_string);
    }
    if (!log_source.empty()) {
        put(make_cache_key(CacheKeyKind::LogSource, log_source, message_identifier,
                           event_version),
            message_string);
    }
}

std::optional<std::string> MessageStringCache::get_cached_message_string(
    const std::string& provider_identifier, const std::string& log_source,
    std::uint32_t message_identifier, std::optional<std::int64_t> event_version) {
    if (!provider_identifier.empty()) {
        auto message_string = get(make_cache_key(CacheKeyKind::Provider, provider_identifier,
                                                 message_identifier, event_version));
        if (message_string) {
            return message_string;
        }
    }
    if (!log_source.empty()) {
        return get(make_cache_key(CacheKeyKind::LogSource, log_source, message_identifier,
                                  event_version));
    }
    return std::nullopt;
}

}  // namespace winevtrc::resources
