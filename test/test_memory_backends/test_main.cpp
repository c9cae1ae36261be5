#include <unity.h>
#include <ArduinoJson.h>

#include <string>
#include <vector>

#include "Core/Runtime.h"
#include "Modules/Stores/CacheModule/CacheBackend.h"
#include "Modules/Stores/CacheModule/MemoryCache.h"
#include "Modules/Stores/DurableStoreModule/DurableBackend.h"
#include "Modules/Stores/DurableStoreModule/MemoryStore.h"

static uint64_t gNowMs = 1700000000000ULL;

static uint64_t fakeNow(void*) { return gNowMs; }
static const ClockHooks kFakeClock{fakeNow, nullptr};

void setUp()
{
    gNowMs = 1700000000000ULL;
    Clock::setHooks(&kFakeClock);
}

void tearDown()
{
    Clock::setHooks(nullptr);
}

static bool collect(void* user, const char* value)
{
    static_cast<std::vector<std::string>*>(user)->push_back(value);
    return true;
}

void test_cache_ttl_expires()
{
    MemoryCache cache;
    TEST_ASSERT_TRUE(cache.set("decision:last", "{}", 1800));
    TEST_ASSERT_TRUE(cache.set("pump:state", "{\"is_on\":false}", 0));

    std::string out;
    bool found = false;
    gNowMs += 1799ULL * 1000ULL;
    TEST_ASSERT_TRUE(cache.get("decision:last", out, found));
    TEST_ASSERT_TRUE(found);

    gNowMs += 1000ULL;
    TEST_ASSERT_TRUE(cache.get("decision:last", out, found));
    TEST_ASSERT_FALSE(found);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)cache.size());

    TEST_ASSERT_TRUE(cache.get("pump:state", out, found));
    TEST_ASSERT_TRUE(found);
    TEST_ASSERT_EQUAL_STRING("{\"is_on\":false}", out.c_str());
}

void test_cache_list_is_newest_first_and_trimmed()
{
    MemoryCache cache;
    TEST_ASSERT_TRUE(cache.listPush("pump:history", "a", 3));
    TEST_ASSERT_TRUE(cache.listPush("pump:history", "b", 3));
    TEST_ASSERT_TRUE(cache.listPush("pump:history", "c", 3));
    TEST_ASSERT_TRUE(cache.listPush("pump:history", "d", 3));

    std::vector<std::string> items;
    TEST_ASSERT_TRUE(cache.listRange("pump:history", 10, items));
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)items.size());
    TEST_ASSERT_EQUAL_STRING("d", items[0].c_str());
    TEST_ASSERT_EQUAL_STRING("b", items[2].c_str());

    TEST_ASSERT_TRUE(cache.listRange("pump:history", 1, items));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)items.size());

    TEST_ASSERT_TRUE(cache.del("pump:history"));
    TEST_ASSERT_TRUE(cache.listRange("pump:history", 10, items));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)items.size());
}

void test_cache_service_adds_prefix()
{
    MemoryCache cache;
    CacheBinding binding;
    binding.backend = &cache;
    binding.prefix = "irriflow:";
    CacheService svc = makeCacheService(&binding);

    TEST_ASSERT_TRUE(svc.set(svc.ctx, "pump:state", "1", 0));
    std::string out;
    bool found = false;
    TEST_ASSERT_TRUE(cache.get("irriflow:pump:state", out, found));
    TEST_ASSERT_TRUE(found);

    TEST_ASSERT_TRUE(svc.listPush(svc.ctx, "decision:history", "x", 0));
    TEST_ASSERT_TRUE(svc.listPush(svc.ctx, "decision:history", "y", 0));
    std::vector<std::string> items;
    TEST_ASSERT_EQUAL_UINT16(2, svc.listRead(svc.ctx, "decision:history", 5, collect, &items));
    TEST_ASSERT_EQUAL_STRING("y", items[0].c_str());
    TEST_ASSERT_TRUE(svc.isAvailable(svc.ctx));
}

void test_cache_service_without_backend_reports_failure()
{
    CacheBinding binding;
    CacheService svc = makeCacheService(&binding);
    std::string out;
    bool found = false;
    TEST_ASSERT_FALSE(svc.get(svc.ctx, "pump:state", &out, &found));
    TEST_ASSERT_FALSE(svc.set(svc.ctx, "pump:state", "1", 0));
    TEST_ASSERT_FALSE(svc.isAvailable(svc.ctx));
}

void test_store_set_get_and_compose()
{
    MemoryStore store;
    TEST_ASSERT_TRUE(store.set("pump/state", "{\"is_on\":true,\"total_water_used\":12.5}"));
    TEST_ASSERT_TRUE(store.set("/config/", "{\"auto_irrigation_enabled\":false}"));

    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(store.get("pump", json, found));
    TEST_ASSERT_TRUE(found);

    StaticJsonDocument<256> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_TRUE(doc["state"]["is_on"].as<bool>());

    TEST_ASSERT_TRUE(store.get("config", json, found));
    TEST_ASSERT_TRUE(found);
    TEST_ASSERT_EQUAL_STRING("{\"auto_irrigation_enabled\":false}", json.c_str());

    TEST_ASSERT_TRUE(store.get("missing", json, found));
    TEST_ASSERT_FALSE(found);
}

void test_store_update_merges_and_null_deletes()
{
    MemoryStore store;
    TEST_ASSERT_TRUE(store.update("config", "{\"a\":1,\"b\":2}"));
    TEST_ASSERT_TRUE(store.update("config", "{\"b\":null,\"c\":3}"));

    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(store.get("config", json, found));
    StaticJsonDocument<256> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_EQUAL_INT(1, doc["a"].as<int>());
    TEST_ASSERT_FALSE(doc.containsKey("b"));
    TEST_ASSERT_EQUAL_INT(3, doc["c"].as<int>());

    TEST_ASSERT_FALSE(store.update("config", "[1,2]"));
}

void test_store_push_keys_are_ordered_and_get_last_limits()
{
    MemoryStore store;
    std::string k1;
    std::string k2;
    std::string k3;
    TEST_ASSERT_TRUE(store.push("irrigation_events", "{\"n\":1}", k1));
    TEST_ASSERT_TRUE(store.push("irrigation_events", "{\"n\":2}", k2));
    gNowMs += 5;
    TEST_ASSERT_TRUE(store.push("irrigation_events", "{\"n\":3}", k3));

    TEST_ASSERT_EQUAL_UINT32(19, (uint32_t)k1.size());
    TEST_ASSERT_TRUE(k1 < k2);
    TEST_ASSERT_TRUE(k2 < k3);

    std::string json;
    TEST_ASSERT_TRUE(store.getLast("irrigation_events", 2, json));
    DynamicJsonDocument doc(512);
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    JsonObjectConst obj = doc.as<JsonObjectConst>();
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)obj.size());
    TEST_ASSERT_FALSE(obj.containsKey(k1.c_str()));
    TEST_ASSERT_EQUAL_INT(3, obj[k3.c_str()]["n"].as<int>());

    TEST_ASSERT_TRUE(store.getLast("nothing_here", 5, json));
    TEST_ASSERT_EQUAL_STRING("{}", json.c_str());
}

void test_store_remove_subtree()
{
    MemoryStore store;
    std::string key;
    TEST_ASSERT_TRUE(store.push("decision_history", "{\"n\":1}", key));
    TEST_ASSERT_TRUE(store.set("last_decision", "{\"n\":1}"));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)store.leafCount());

    TEST_ASSERT_TRUE(store.remove("decision_history"));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)store.leafCount());

    TEST_ASSERT_TRUE(store.set("last_decision", "null"));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)store.leafCount());
}

void test_store_rejects_invalid_json()
{
    MemoryStore store;
    TEST_ASSERT_FALSE(store.set("pump/state", "{not json"));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)store.leafCount());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_cache_ttl_expires);
    RUN_TEST(test_cache_list_is_newest_first_and_trimmed);
    RUN_TEST(test_cache_service_adds_prefix);
    RUN_TEST(test_cache_service_without_backend_reports_failure);
    RUN_TEST(test_store_set_get_and_compose);
    RUN_TEST(test_store_update_merges_and_null_deletes);
    RUN_TEST(test_store_push_keys_are_ordered_and_get_last_limits);
    RUN_TEST(test_store_remove_subtree);
    RUN_TEST(test_store_rejects_invalid_json);
    return UNITY_END();
}
