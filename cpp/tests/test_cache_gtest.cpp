// ==============================================================================
// test_cache_gtest.cpp - Тесты LRU кэша строк сообщений
// ==============================================================================

#include <winevtrc/cache.hpp>

#include <gtest/gtest.h>

#include <string>

namespace winevtrc::resources::test {

TEST(CacheKeyTest, Format) {
    EXPECT_EQ(make_cache_key(CacheKeyKind::Provider, "{guid}", 0x3e8, std::nullopt),
              "p|{guid}:0x000003e8");
    EXPECT_EQ(make_cache_key(CacheKeyKind::LogSource, "Application Error", 1, 2),
              "s|Application Error:0x00000001:2");
}

TEST(CacheKeyTest, ProviderAndLogSource_DoNotCollide) {
    EXPECT_NE(make_cache_key(CacheKeyKind::Provider, "same", 1, std::nullopt),
              make_cache_key(CacheKeyKind::LogSource, "same", 1, std::nullopt));
}

TEST(MessageStringCacheTest, DefaultCapacity_Is64Ki) {
    MessageStringCache cache;
    EXPECT_EQ(cache.capacity(), 64u * 1024u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MessageStringCacheTest, ZeroCapacity_BecomesOne) {
    MessageStringCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
}

TEST(MessageStringCacheTest, PutAtCapacity_EvictsLeastRecentlyUsed) {
    // Arrange
    MessageStringCache cache(2);
    cache.put("a", "A");
    cache.put("b", "B");

    // Act: "a" становится самым свежим, вытесняется "b"
    ASSERT_EQ(cache.get("a").value_or(""), "A");
    cache.put("c", "C");

    // Assert
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
}

TEST(MessageStringCacheTest, PutExistingKey_UpdatesWithoutEviction) {
    MessageStringCache cache(2);
    cache.put("a", "A");
    cache.put("b", "B");
    cache.put("a", "A2");

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a").value_or(""), "A2");

    // "b" теперь самый старый
    cache.put("c", "C");
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("a"));
}

TEST(MessageStringCacheTest, SizeNeverExceedsCapacity) {
    MessageStringCache cache(8);
    for (int i = 0; i < 100; ++i) {
        cache.put("key" + std::to_string(i), "value");
        EXPECT_LE(cache.size(), 8u);
    }
    EXPECT_TRUE(cache.contains("key99"));
    EXPECT_FALSE(cache.contains("key91"));
}

TEST(MessageStringCacheTest, Clear_RemovesEverything) {
    MessageStringCache cache(4);
    cache.put("a", "A");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a").has_value());
}

TEST(MessageStringCacheTest, CacheMessageString_WritesBothKeys) {
    MessageStringCache cache(16);
    cache.cache_message_string("{guid}", "Application Error", 1, std::nullopt,
                               "Service {0} failed");

    EXPECT_TRUE(cache.contains("p|{guid}:0x00000001"));
    EXPECT_TRUE(cache.contains("s|Application Error:0x00000001"));

    // Поиск только по провайдеру и только по источнику дает одну строку
    auto by_provider = cache.get_cached_message_string("{guid}", "", 1, std::nullopt);
    auto by_log_source =
        cache.get_cached_message_string("", "Application Error", 1, std::nullopt);
    ASSERT_TRUE(by_provider.has_value());
    ASSERT_TRUE(by_log_source.has_value());
    EXPECT_EQ(*by_provider, *by_log_source);
}

TEST(MessageStringCacheTest, EmptyIdentifiers_AreSkipped) {
    MessageStringCache cache(16);
    cache.cache_message_string("", "Application Error", 1, std::nullopt, "text");
    EXPECT_EQ(cache.size(), 1u);

    cache.cache_message_string("", "", 2, std::nullopt, "text");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.get_cached_message_string("", "", 2, std::nullopt).has_value());
}

TEST(MessageStringCacheTest, EventVersion_IsPartOfKey) {
    MessageStringCache cache(16);
    cache.cache_message_string("", "Application Error", 1, 2, "version two");

    EXPECT_FALSE(
        cache.get_cached_message_string("", "Application Error", 1, std::nullopt).has_value());
    EXPECT_EQ(cache.get_cached_message_string("", "Application Error", 1, 2).value_or(""),
              "version two");
}

TEST(MessageStringCacheTest, ProviderKey_TakesPrecedence) {
    MessageStringCache cache(16);
    cache.put(make_cache_key(CacheKeyKind::Provider, "{guid}", 1, std::nullopt), "from provider");
    cache.put(make_cache_key(CacheKeyKind::LogSource, "Source", 1, std::nullopt),
              "from log source");

    EXPECT_EQ(cache.get_cached_message_string("{guid}", "Source", 1, std::nullopt).value_or(""),
              "from provider");
    EXPECT_EQ(cache.get_cached_message_string("{other}", "Source", 1, std::nullopt).value_or(""),
              "from log source");
}

}  // namespace winevtrc::resources::test
