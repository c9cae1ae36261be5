#include <unity.h>
#include <ArduinoJson.h>

#include <string>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/Stores/CacheModule/CacheModule.h"
#include "Modules/Stores/DurableStoreModule/DurableStoreModule.h"
#include "Modules/EnvironmentModule/EnvironmentModule.h"
#include "Modules/PumpModule/PumpModule.h"

#include "../support/FakeGateway.h"

static const char* kPumpFeed = "water-pump-control";
static const uint64_t kStartMs = 1760000000000ULL;

/// Pump wired to in-memory stores and a fake feed platform.
struct PumpRig {
    ConfigStore cfg;
    ServiceRegistry services;
    FakeGateway gw;
    EventBusModule eventBus;
    CacheModule cache;
    DurableStoreModule store;
    EnvironmentModule env;
    PumpModule pump;

    explicit PumpRig(const char* configJson = nullptr)
    {
        cfg.setEventBus(&eventBus.bus());
        services.add("gateway", &gw.svc);
        eventBus.init(cfg, services);
        cache.init(cfg, services);
        store.init(cfg, services);
        env.init(cfg, services);
        pump.init(cfg, services);
        if (configJson) (void)cfg.applyJson(configJson);
        cache.onConfigLoaded(cfg, services);
        store.onConfigLoaded(cfg, services);
        env.onConfigLoaded(cfg, services);
        pump.onConfigLoaded(cfg, services);
    }

    const CacheService* cacheSvc() const { return services.get<CacheService>("cache"); }
};

void setUp()
{
    FakeClock::install(kStartMs);
}

void tearDown()
{
    FakeClock::uninstall();
}

void test_turn_on_reports_remaining_time()
{
    PumpRig rig;
    const PumpResult r = rig.pump.turnOn(5, IrrigationSource::Manual, nullptr);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(5, r.durationSec);
    TEST_ASSERT_EQUAL_STRING("1", rig.gw.value(kPumpFeed));

    FakeClock::advanceSec(2);
    PumpStatus st;
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_TRUE(st.isOn);
    TEST_ASSERT_TRUE(st.hasRemaining);
    TEST_ASSERT_TRUE(st.remainingSec > 0.0);
    TEST_ASSERT_TRUE(st.remainingSec <= 5.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 2.0, st.currentRuntimeSec);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1.0, st.currentWaterL);
    TEST_ASSERT_TRUE(st.stateSynced);
}

void test_expiry_stops_once_and_records_one_event()
{
    PumpRig rig;
    rig.gw.setNumber("soil-moisture", 30.0);
    TEST_ASSERT_EQUAL_UINT8(1, rig.env.collect());

    TEST_ASSERT_TRUE(rig.pump.turnOn(5, IrrigationSource::Manual, "{\"who\":\"test\"}").success);

    FakeClock::advanceSec(3);
    PumpCheckResult early = rig.pump.checkScheduledActions();
    TEST_ASSERT_EQUAL_UINT8(0, early.actionsTaken);
    TEST_ASSERT_TRUE(early.isOn);

    FakeClock::advanceSec(3);
    PumpCheckResult due = rig.pump.checkScheduledActions();
    TEST_ASSERT_EQUAL_UINT8(1, due.actionsTaken);
    TEST_ASSERT_TRUE(due.wasOn);
    TEST_ASSERT_FALSE(due.isOn);
    TEST_ASSERT_TRUE(due.stop.success);
    TEST_ASSERT_EQUAL_STRING("0", rig.gw.value(kPumpFeed));

    PumpCheckResult again = rig.pump.checkScheduledActions();
    TEST_ASSERT_EQUAL_UINT8(0, again.actionsTaken);

    IrrigationEvent events[4];
    TEST_ASSERT_EQUAL_UINT16(1, rig.pump.history(4, events, 4));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)IrrigationSource::Schedule, (uint8_t)events[0].source);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 6.0, events[0].durationSec);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 3.0, events[0].waterL);
    TEST_ASSERT_EQUAL_UINT64(kStartMs, events[0].startMs);
    TEST_ASSERT_TRUE(events[0].hasMoistureBefore);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 30.0, events[0].moistureBefore);
}

void test_second_start_is_refused_while_running()
{
    PumpRig rig;
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    const PumpResult again = rig.pump.turnOn(60, IrrigationSource::Auto, nullptr);
    TEST_ASSERT_FALSE(again.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::AlreadyRunning, (uint16_t)again.code);
}

void test_min_interval_refusal_reports_wait()
{
    PumpRig rig("{\"pump\":{\"min_interval_s\":600}}");
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    FakeClock::advanceSec(10);
    TEST_ASSERT_TRUE(rig.pump.turnOff(IrrigationSource::Manual, nullptr).success);

    FakeClock::advanceSec(100);
    const PumpResult early = rig.pump.turnOn(60, IrrigationSource::Manual, nullptr);
    TEST_ASSERT_FALSE(early.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::MinIntervalNotMet, (uint16_t)early.code);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 500.0, early.waitRemainingSec);

    FakeClock::advanceSec(500);
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
}

void test_duration_is_clamped_and_defaulted()
{
    PumpRig rig("{\"pump\":{\"min_interval_s\":0,\"max_runtime_s\":900,\"default_duration_s\":120}}");
    PumpResult r = rig.pump.turnOn(99999, IrrigationSource::Manual, nullptr);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(900, r.durationSec);
    TEST_ASSERT_EQUAL_UINT64(kStartMs + 900000ULL, r.scheduledStopMs);
    TEST_ASSERT_TRUE(rig.pump.turnOff(IrrigationSource::Manual, nullptr).success);

    r = rig.pump.turnOn(0, IrrigationSource::Manual, nullptr);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(120, r.durationSec);
}

void test_failed_on_command_leaves_pump_off()
{
    PumpRig rig;
    rig.gw.failSwitch = true;
    const PumpResult r = rig.pump.turnOn(60, IrrigationSource::Manual, nullptr);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::CommandFailed, (uint16_t)r.code);
    TEST_ASSERT_FALSE(rig.pump.state().isOn);
}

void test_failed_off_command_keeps_pump_on()
{
    PumpRig rig;
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    rig.gw.failSwitch = true;
    const PumpResult r = rig.pump.turnOff(IrrigationSource::Manual, nullptr);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::CommandFailed, (uint16_t)r.code);
    TEST_ASSERT_TRUE(rig.pump.state().isOn);

    IrrigationEvent events[2];
    TEST_ASSERT_EQUAL_UINT16(0, rig.pump.history(2, events, 2));
}

void test_turn_off_when_off_is_refused()
{
    PumpRig rig;
    const PumpResult r = rig.pump.turnOff(IrrigationSource::Manual, nullptr);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::AlreadyOff, (uint16_t)r.code);
}

void test_remote_on_is_adopted_once()
{
    PumpRig rig("{\"pump\":{\"max_runtime_s\":600}}");
    rig.gw.setValue(kPumpFeed, "ON");

    PumpStatus st;
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_TRUE(st.isOn);
    TEST_ASSERT_EQUAL_UINT64(kStartMs, st.startMs);
    TEST_ASSERT_EQUAL_UINT64(kStartMs + 600000ULL, st.scheduledStopMs);
    TEST_ASSERT_TRUE(st.stateSynced);

    FakeClock::advanceSec(5);
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_EQUAL_UINT64(kStartMs, st.startMs);
}

void test_remote_off_closes_the_run()
{
    PumpRig rig;
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    FakeClock::advanceSec(20);
    rig.gw.setValue(kPumpFeed, "0");

    PumpStatus st;
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_FALSE(st.isOn);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 20.0, st.totalRuntimeSec);

    IrrigationEvent events[2];
    TEST_ASSERT_EQUAL_UINT16(1, rig.pump.history(2, events, 2));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)IrrigationSource::Sync, (uint8_t)events[0].source);
}

void test_repeated_reconciliation_leaves_counters_alone()
{
    PumpRig rig;
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);

    // Gateway agrees the pump is ON: nothing accumulates while it runs.
    PumpStatus st;
    for (int i = 0; i < 3; ++i) {
        FakeClock::advanceSec(5);
        TEST_ASSERT_TRUE(rig.pump.getStatus(st));
        TEST_ASSERT_TRUE(st.isOn);
        TEST_ASSERT_EQUAL_UINT64(kStartMs, st.startMs);
        TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.0, st.totalRuntimeSec);
        TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.0, st.totalWaterL);
    }
    IrrigationEvent events[4];
    TEST_ASSERT_EQUAL_UINT16(0, rig.pump.history(4, events, 4));

    FakeClock::advanceSec(5);
    rig.gw.setValue(kPumpFeed, "0");
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_FALSE(st.isOn);
    const double runtime = st.totalRuntimeSec;
    const double water = st.totalWaterL;
    const uint64_t offAt = st.lastOffMs;
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 20.0, runtime);

    // Gateway stays OFF: later reconciliations are no-ops.
    for (int i = 0; i < 3; ++i) {
        FakeClock::advanceSec(30);
        TEST_ASSERT_TRUE(rig.pump.getStatus(st));
        TEST_ASSERT_FALSE(st.isOn);
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, runtime, st.totalRuntimeSec);
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, water, st.totalWaterL);
        TEST_ASSERT_EQUAL_UINT64(offAt, st.lastOffMs);
        (void)rig.pump.checkScheduledActions();
    }
    TEST_ASSERT_EQUAL_UINT16(1, rig.pump.history(4, events, 4));
}

void test_destroying_running_module_joins_its_task()
{
    {
        PumpRig rig;
        TEST_ASSERT_TRUE(rig.pump.startTask());
        TEST_ASSERT_TRUE(rig.pump.isTaskRunning());
        TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    }
    // A fresh rig on the same clock starts clean once the old task is gone.
    PumpRig rig;
    TEST_ASSERT_FALSE(rig.pump.isTaskRunning());
    TEST_ASSERT_TRUE(rig.pump.startTask());
    TEST_ASSERT_TRUE(rig.pump.stopTask());
    TEST_ASSERT_FALSE(rig.pump.isTaskRunning());
}

void test_unreadable_feed_keeps_local_state()
{
    PumpRig rig;
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    rig.gw.failReads = true;

    PumpStatus st;
    TEST_ASSERT_TRUE(rig.pump.getStatus(st));
    TEST_ASSERT_TRUE(st.isOn);
    TEST_ASSERT_FALSE(st.stateSynced);
    TEST_ASSERT_EQUAL_INT8((int8_t)FeedSwitchState::Unknown, (int8_t)st.gatewayState);
}

void test_state_is_cached_and_statistics_accumulate()
{
    PumpRig rig("{\"pump\":{\"min_interval_s\":0}}");
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    FakeClock::advanceSec(10);
    TEST_ASSERT_TRUE(rig.pump.turnOff(IrrigationSource::Manual, nullptr).success);
    TEST_ASSERT_TRUE(rig.pump.turnOn(60, IrrigationSource::Manual, nullptr).success);
    FakeClock::advanceSec(30);
    TEST_ASSERT_TRUE(rig.pump.turnOff(IrrigationSource::Manual, nullptr).success);

    const CacheService* cache = rig.cacheSvc();
    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(cache->get(cache->ctx, "pump:state", &json, &found));
    TEST_ASSERT_TRUE(found);
    StaticJsonDocument<512> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_FALSE(doc["is_on"].as<bool>());
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 40.0, doc["total_runtime_seconds"].as<double>());

    PumpStatistics stats;
    TEST_ASSERT_TRUE(rig.pump.statistics(stats));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 20.0, stats.totalWaterL);
    TEST_ASSERT_EQUAL_UINT16(2, stats.events24h);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 20.0, stats.avgDurationSec);

    IrrigationEvent events[4];
    TEST_ASSERT_EQUAL_UINT16(2, rig.pump.history(4, events, 4));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 30.0, events[0].durationSec);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_turn_on_reports_remaining_time);
    RUN_TEST(test_expiry_stops_once_and_records_one_event);
    RUN_TEST(test_second_start_is_refused_while_running);
    RUN_TEST(test_min_interval_refusal_reports_wait);
    RUN_TEST(test_duration_is_clamped_and_defaulted);
    RUN_TEST(test_failed_on_command_leaves_pump_off);
    RUN_TEST(test_failed_off_command_keeps_pump_on);
    RUN_TEST(test_turn_off_when_off_is_refused);
    RUN_TEST(test_remote_on_is_adopted_once);
    RUN_TEST(test_remote_off_closes_the_run);
    RUN_TEST(test_repeated_reconciliation_leaves_counters_alone);
    RUN_TEST(test_destroying_running_module_joins_its_task);
    RUN_TEST(test_unreadable_feed_keeps_local_state);
    RUN_TEST(test_state_is_cached_and_statistics_accumulate);
    return UNITY_END();
}
