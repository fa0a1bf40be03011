// ==============================================================================
// winevtrc/cache.hpp - LRU кэш строк сообщений
// ==============================================================================
//
// Ключи:
//   <provider_identifier>:0x<id:08x>[:<event_version>]   - по провайдеру
//   <log_source>:0x<id:08x>[:<event_version>]            - по источнику
//
// Ключ дополнительно несёт вид (провайдер/источник), чтобы GUID провайдера
// и имя источника не пересекались.
//
// ==============================================================================

#ifndef WINEVTRC_CACHE_HPP
#define WINEVTRC_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace winevtrc::resources {

/// Ёмкость кэша по умолчанию
constexpr std::size_t DEFAULT_CACHE_CAPACITY = 64 * 1024;

/// Вид ключа кэша
enum class CacheKeyKind { Provider, LogSource };

/// Построить ключ кэша
std::string make_cache_key(CacheKeyKind kind, const std::string& identifier,
                           std::uint32_t message_identifier,
                           std::optional<std::int64_t> event_version);

/// LRU кэш строк сообщений
///
/// put() нового ключа при заполненном кэше вытесняет ровно один
/// наименее используемый элемент. get() и put() существующего ключа
/// делают элемент самым свежим.
class MessageStringCache {
public:
    explicit MessageStringCache(std::size_t capacity = DEFAULT_CACHE_CAPACITY);

    std::optional<std::string> get(const std::string& key);
    void put(const std::string& key, std::string value);

    /// Проверить наличие без изменения порядка
    bool contains(const std::string& key) const { return index_.count(key) != 0; }

    std::size_t size() const { return index_.size(); }
    std::size_t capacity() const { return capacity_; }
    void clear();

    /// Записать строку под ключом провайдера, затем под ключом источника
    ///
    /// Пустой provider_identifier или log_source пропускается.
    void cache_message_string(const std::string& provider_identifier,
                              const std::string& log_source, std::uint32_t message_identifier,
                              std::optional<std::int64_t> event_version,
                              const std::string& message_string);

    /// Найти строку: сначала по ключу провайдера, затем по ключу источника
    std::optional<std::string> get_cached_message_string(
        const std::string& provider_identifier, const std::string& log_source,
        std::uint32_t message_identifier, std::optional<std::int64_t> event_version);

private:
    using Entry = std::pair<std::string, std::string>;

    std::size_t capacity_;
    std::list<Entry> entries_;  // от самого свежего к самому старому
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace winevtrc::resources

#endif  // WINEVTRC_CACHE_HPP
