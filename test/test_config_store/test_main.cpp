#include <unity.h>
#include <ArduinoJson.h>

#include <cstdio>
#include <fstream>
#include <string.h>

#include "Core/ConfigStore.h"
#include "Core/EventBus/EventBus.h"

static const char* kBootstrapPath = "test_config_store.bootstrap.json";
static const char* kStatePath = "test_config_store.state.json";

/// One module's worth of config, registered like a module would.
struct PumpLikeConfig {
    int32_t maxRuntime = 1800;
    double flowRate = 0.5;
    bool enabled = false;
    char feed[32] = "water-pump-control";
    char password[16] = "secret";

    ConfigVariable<int32_t,0> maxRuntimeVar {
        CFG_KEY("tp_max_rt"),"max_runtime_s","pump",ConfigType::Int32,
        &maxRuntime,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> flowVar {
        CFG_KEY("tp_flow"),"flow_rate_lps","pump",ConfigType::Double,
        &flowRate,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool,0> enabledVar {
        CFG_KEY("tp_enabled"),"enabled","decision",ConfigType::Bool,
        &enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> feedVar {
        CFG_KEY("tp_feed"),"feed_key","pump",ConfigType::CharArray,
        (char*)feed,ConfigPersistence::Runtime,sizeof(feed)
    };
    ConfigVariable<char,0> passVar {
        CFG_KEY("tp_pass"),"password","cache",ConfigType::CharArray,
        (char*)password,ConfigPersistence::Runtime,sizeof(password)
    };

    void registerAll(ConfigStore& cfg)
    {
        cfg.registerVar(maxRuntimeVar);
        cfg.registerVar(flowVar);
        cfg.registerVar(enabledVar);
        cfg.registerVar(feedVar);
        cfg.registerVar(passVar);
    }
};

static void writeText(const char* path, const char* text)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << text;
}

void setUp()
{
    std::remove(kBootstrapPath);
    std::remove(kStatePath);
}

void tearDown()
{
    std::remove(kBootstrapPath);
    std::remove(kStatePath);
}

void test_apply_json_updates_registered_values()
{
    ConfigStore cfg;
    PumpLikeConfig c;
    c.registerAll(cfg);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"pump\":{\"max_runtime_s\":600,\"feed_key\":\"pump-2\"},\"other\":{\"x\":1}}"));
    TEST_ASSERT_EQUAL_INT32(600, c.maxRuntime);
    TEST_ASSERT_EQUAL_STRING("pump-2", c.feed);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.5, c.flowRate);
}

void test_apply_json_rejects_wrong_types()
{
    ConfigStore cfg;
    PumpLikeConfig c;
    c.registerAll(cfg);

    TEST_ASSERT_FALSE(cfg.applyJson("{\"pump\":{\"max_runtime_s\":\"long\"}}"));
    TEST_ASSERT_EQUAL_INT32(1800, c.maxRuntime);
    TEST_ASSERT_FALSE(cfg.applyJson("[1,2,3]"));
    TEST_ASSERT_FALSE(cfg.applyJson("{broken"));
}

void test_module_export_masks_secrets()
{
    ConfigStore cfg;
    PumpLikeConfig c;
    c.registerAll(cfg);

    char out[256];
    TEST_ASSERT_TRUE(cfg.toJsonModule("cache", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("{\"password\":\"***\"}", out);

    TEST_ASSERT_TRUE(cfg.toJsonModule("pump", out, sizeof(out)));
    StaticJsonDocument<256> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, out));
    TEST_ASSERT_EQUAL_INT32(1800, doc["max_runtime_s"].as<int32_t>());
    TEST_ASSERT_EQUAL_STRING("water-pump-control", doc["feed_key"].as<const char*>());

    TEST_ASSERT_FALSE(cfg.toJsonModule("unknown", out, sizeof(out)));

    const char* modules[8];
    TEST_ASSERT_EQUAL_UINT8(3, cfg.listModules(modules, 8));
}

void test_set_posts_config_changed_once()
{
    EventBus bus;
    ConfigStore cfg;
    cfg.setEventBus(&bus);
    PumpLikeConfig c;
    c.registerAll(cfg);

    static int changed;
    changed = 0;
    TEST_ASSERT_TRUE(bus.subscribe(EventId::ConfigChanged, [](const Event&, void*) { ++changed; }, nullptr));

    TEST_ASSERT_TRUE(cfg.set(c.enabledVar, true));
    TEST_ASSERT_TRUE(cfg.set(c.enabledVar, true));
    bus.dispatch(8);
    TEST_ASSERT_EQUAL_INT(1, changed);
    TEST_ASSERT_TRUE(c.enabled);
}

void test_persistent_values_survive_restart_and_win_over_bootstrap()
{
    writeText(kBootstrapPath, "{\"pump\":{\"max_runtime_s\":900,\"feed_key\":\"boot-feed\"},\"decision\":{\"enabled\":false}}");

    {
        ConfigStore cfg;
        cfg.setBootstrapPath(kBootstrapPath);
        cfg.setStoragePath(kStatePath);
        PumpLikeConfig c;
        c.registerAll(cfg);
        TEST_ASSERT_TRUE(cfg.loadPersistent());
        TEST_ASSERT_EQUAL_INT32(900, c.maxRuntime);
        TEST_ASSERT_EQUAL_STRING("boot-feed", c.feed);

        TEST_ASSERT_TRUE(cfg.set(c.enabledVar, true));
        TEST_ASSERT_EQUAL_UINT32(1, cfg.persistWriteCount());
    }

    ConfigStore cfg;
    cfg.setBootstrapPath(kBootstrapPath);
    cfg.setStoragePath(kStatePath);
    PumpLikeConfig c;
    c.registerAll(cfg);
    TEST_ASSERT_TRUE(cfg.loadPersistent());
    TEST_ASSERT_TRUE(c.enabled);
    TEST_ASSERT_EQUAL_INT32(900, c.maxRuntime);

    TEST_ASSERT_TRUE(cfg.erasePersistent());
}

void test_missing_files_keep_defaults()
{
    ConfigStore cfg;
    cfg.setBootstrapPath("does-not-exist.json");
    cfg.setStoragePath(kStatePath);
    PumpLikeConfig c;
    c.registerAll(cfg);
    TEST_ASSERT_TRUE(cfg.loadPersistent());
    TEST_ASSERT_EQUAL_INT32(1800, c.maxRuntime);
    TEST_ASSERT_FALSE(c.enabled);
}

void test_corrupt_state_file_is_reported()
{
    writeText(kStatePath, "{not json");
    ConfigStore cfg;
    cfg.setStoragePath(kStatePath);
    PumpLikeConfig c;
    c.registerAll(cfg);
    TEST_ASSERT_FALSE(cfg.loadPersistent());
    TEST_ASSERT_EQUAL_INT32(1800, c.maxRuntime);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_apply_json_updates_registered_values);
    RUN_TEST(test_apply_json_rejects_wrong_types);
    RUN_TEST(test_module_export_masks_secrets);
    RUN_TEST(test_set_posts_config_changed_once);
    RUN_TEST(test_persistent_values_survive_restart_and_win_over_bootstrap);
    RUN_TEST(test_missing_files_keep_defaults);
    RUN_TEST(test_corrupt_state_file_is_reported);
    return UNITY_END();
}
