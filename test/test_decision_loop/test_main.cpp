#include <unity.h>
#include <ArduinoJson.h>

#include <stdio.h>
#include <string.h>

#include <string>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/Stores/CacheModule/CacheModule.h"
#include "Modules/Stores/DurableStoreModule/DurableStoreModule.h"
#include "Modules/EnvironmentModule/EnvironmentModule.h"
#include "Modules/PumpModule/PumpModule.h"
#include "Modules/DecisionModule/DecisionModule.h"

#include "../support/FakeGateway.h"

static const uint64_t kStartMs = 1760000000000ULL;
static const char* kEnabled = "{\"decision\":{\"enabled\":true},\"pump\":{\"min_interval_s\":0}}";

struct DecisionRig {
    ConfigStore cfg;
    ServiceRegistry services;
    FakeGateway gw;
    EventBusModule eventBus;
    CacheModule cache;
    DurableStoreModule store;
    EnvironmentModule env;
    PumpModule pump;
    DecisionModule decision;

    explicit DecisionRig(const char* configJson = kEnabled)
    {
        cfg.setEventBus(&eventBus.bus());
        services.add("gateway", &gw.svc);
        eventBus.init(cfg, services);
        cache.init(cfg, services);
        store.init(cfg, services);
        env.init(cfg, services);
        pump.init(cfg, services);
        decision.init(cfg, services);
        if (configJson) (void)cfg.applyJson(configJson);
        cache.onConfigLoaded(cfg, services);
        store.onConfigLoaded(cfg, services);
        env.onConfigLoaded(cfg, services);
        pump.onConfigLoaded(cfg, services);
        decision.onConfigLoaded(cfg, services);
    }
};

static AiRecommendation makeAi(bool irrigate, double minutes, double confidence, const char* reason)
{
    AiRecommendation ai;
    ai.shouldIrrigate = irrigate;
    ai.durationMinutes = minutes;
    ai.confidence = confidence;
    snprintf(ai.reason, sizeof(ai.reason), "%s", reason);
    return ai;
}

void setUp()
{
    FakeClock::install(kStartMs);
}

void tearDown()
{
    FakeClock::uninstall();
}

void test_disabled_loop_refuses()
{
    DecisionRig rig(nullptr);
    rig.gw.setNumber("soil-moisture", 15.0);
    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_FALSE(o.made);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::AutoIrrigationDisabled, (uint16_t)o.refusal);
    TEST_ASSERT_EQUAL_INT(0, rig.gw.switchCalls);
}

void test_dry_soil_starts_heavy_run()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 15.0);

    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_TRUE(o.decision.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::High, (uint8_t)o.decision.urgency);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Heavy, (uint8_t)o.decision.amount);
    TEST_ASSERT_TRUE(o.decision.actionStarted);
    TEST_ASSERT_TRUE(o.decision.actionSuccess);
    TEST_ASSERT_EQUAL_UINT32(300, o.decision.actionDurationSec);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 15.0, o.decision.soilMoisture);

    PumpStatus st;
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_TRUE(st.isOn);
    TEST_ASSERT_EQUAL_UINT64(kStartMs + 300000ULL, st.scheduledStopMs);

    Decision last;
    TEST_ASSERT_TRUE(rig.decision.lastDecision(last));
    TEST_ASSERT_EQUAL_UINT64(kStartMs, last.tsMs);

    Decision hist[4];
    TEST_ASSERT_EQUAL_UINT16(1, rig.decision.history(10, hist, 4));
    TEST_ASSERT_TRUE(hist[0].needsWater);
}

void test_running_pump_blocks_decision()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 15.0);
    TEST_ASSERT_TRUE(rig.pump.turnOn(600, IrrigationSource::Manual, nullptr).success);
    const int callsBefore = rig.gw.switchCalls;

    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_FALSE(o.made);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::PumpAlreadyRunning, (uint16_t)o.refusal);
    TEST_ASSERT_EQUAL_INT(callsBefore, rig.gw.switchCalls);

    Decision last;
    TEST_ASSERT_FALSE(rig.decision.lastDecision(last));
}

void test_min_interval_between_decisions()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 55.0);

    DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_FALSE(o.decision.needsWater);
    TEST_ASSERT_FALSE(o.decision.actionStarted);
    TEST_ASSERT_EQUAL_STRING("No irrigation needed", o.decision.actionMessage);

    FakeClock::advanceSec(100);
    o = rig.decision.makeDecision();
    TEST_ASSERT_FALSE(o.made);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::MinIntervalNotMet, (uint16_t)o.refusal);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 3500.0, o.waitRemainingSec);

    FakeClock::advanceSec(3500);
    o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);

    Decision hist[4];
    TEST_ASSERT_EQUAL_UINT16(2, rig.decision.history(10, hist, 4));
    TEST_ASSERT_TRUE(hist[0].tsMs > hist[1].tsMs);
}

void test_missing_soil_reading_refuses()
{
    DecisionRig rig;
    rig.gw.setNumber("dht20-temperature", 25.0);
    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_FALSE(o.made);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::NoSoilMoistureData, (uint16_t)o.refusal);
}

void test_confident_ai_recommendation_overrides_analysis()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 55.0);
    TEST_ASSERT_TRUE(rig.decision.queueRecommendation(makeAi(true, 20.0, 0.9, "Dry forecast")));

    DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_TRUE(o.decision.aiApplied);
    TEST_ASSERT_TRUE(o.decision.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Heavy, (uint8_t)o.decision.amount);
    TEST_ASSERT_EQUAL_STRING("Dry forecast (AI recommended)", o.decision.reason);
    TEST_ASSERT_EQUAL_UINT32(300, o.decision.actionDurationSec);
    TEST_ASSERT_TRUE(o.decision.actionSuccess);

    // Consumed: the next tick runs on sensor data alone.
    TEST_ASSERT_TRUE(rig.pump.turnOff(IrrigationSource::Manual, nullptr).success);
    FakeClock::advanceSec(3600);
    o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_FALSE(o.decision.aiApplied);
    TEST_ASSERT_FALSE(o.decision.needsWater);
}

void test_ai_reason_is_appended_to_rule_reason()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 37.0);
    TEST_ASSERT_TRUE(rig.decision.queueRecommendation(makeAi(true, 20.0, 0.9, "Dry forecast")));

    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_TRUE(o.decision.aiApplied);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::Medium, (uint8_t)o.decision.urgency);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Heavy, (uint8_t)o.decision.amount);
    TEST_ASSERT_EQUAL_STRING("soil_somewhat_dry; Dry forecast (AI recommended)", o.decision.reason);
}

void test_ai_without_reason_keeps_rule_reason()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 37.0);
    TEST_ASSERT_TRUE(rig.decision.queueRecommendation(makeAi(true, 3.0, 0.9, "")));

    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.decision.aiApplied);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Light, (uint8_t)o.decision.amount);
    TEST_ASSERT_EQUAL_UINT32(60, o.decision.actionDurationSec);
    TEST_ASSERT_EQUAL_STRING("soil_somewhat_dry (AI recommended)", o.decision.reason);
}

void test_low_confidence_ai_is_ignored()
{
    DecisionRig rig;
    rig.gw.setNumber("soil-moisture", 55.0);
    TEST_ASSERT_TRUE(rig.decision.queueRecommendation(makeAi(true, 3.0, 0.5, "Maybe")));

    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_FALSE(o.decision.aiApplied);
    TEST_ASSERT_FALSE(o.decision.needsWater);
    TEST_ASSERT_EQUAL_INT(0, rig.gw.switchCalls);
}

void test_update_config_bounds_and_durations()
{
    DecisionRig rig;
    TEST_ASSERT_TRUE(rig.decision.updateConfig(
        "{\"min_decision_interval\":30,\"ai_min_confidence\":0.8,\"watering_durations\":{\"heavy\":420}}"));

    const DecisionConfig c = rig.decision.config();
    TEST_ASSERT_EQUAL_INT32(IrrigationDefaults::DecisionMinIntervalSec, c.minDecisionIntervalSec);
    TEST_ASSERT_EQUAL_INT32(420, c.durationHeavySec);
    TEST_ASSERT_EQUAL_INT32(180, c.durationNormalSec);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.8, c.aiMinConfidence);
    TEST_ASSERT_FALSE(rig.decision.updateConfig("[]"));

    const DurableStoreService* store = rig.services.get<DurableStoreService>("store");
    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(store->get(store->ctx, "config", &json, &found));
    TEST_ASSERT_TRUE(found);
    StaticJsonDocument<512> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_EQUAL_INT(420, doc["watering_durations"]["heavy"].as<int>());

    rig.gw.setNumber("soil-moisture", 10.0);
    const DecisionOutcome o = rig.decision.makeDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_EQUAL_UINT32(420, o.decision.actionDurationSec);
}

void test_enable_toggles_and_persists_flag()
{
    DecisionRig rig(nullptr);
    TEST_ASSERT_FALSE(rig.decision.config().enabled);
    TEST_ASSERT_TRUE(rig.decision.enable(true));
    TEST_ASSERT_TRUE(rig.decision.config().enabled);

    const DurableStoreService* store = rig.services.get<DurableStoreService>("store");
    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(store->get(store->ctx, "config", &json, &found));
    TEST_ASSERT_TRUE(found);
    StaticJsonDocument<128> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_TRUE(doc["auto_irrigation_enabled"].as<bool>());

    TEST_ASSERT_TRUE(rig.decision.enable(false));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::AutoIrrigationDisabled,
                             (uint16_t)rig.decision.makeDecision().refusal);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_disabled_loop_refuses);
    RUN_TEST(test_dry_soil_starts_heavy_run);
    RUN_TEST(test_running_pump_blocks_decision);
    RUN_TEST(test_min_interval_between_decisions);
    RUN_TEST(test_missing_soil_reading_refuses);
    RUN_TEST(test_confident_ai_recommendation_overrides_analysis);
    RUN_TEST(test_ai_reason_is_appended_to_rule_reason);
    RUN_TEST(test_ai_without_reason_keeps_rule_reason);
    RUN_TEST(test_low_confidence_ai_is_ignored);
    RUN_TEST(test_update_config_bounds_and_durations);
    RUN_TEST(test_enable_toggles_and_persists_flag);
    return UNITY_END();
}
