#include <unity.h>
#include <ArduinoJson.h>

#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <string>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/Stores/CacheModule/CacheModule.h"
#include "Modules/Stores/DurableStoreModule/DurableStoreModule.h"
#include "Modules/EnvironmentModule/EnvironmentModule.h"
#include "Modules/PumpModule/PumpModule.h"
#include "Modules/IrrigationSchedulerModule/IrrigationSchedulerModule.h"
#include "Modules/IrrigationSchedulerModule/ScheduleCodec.h"

#include "../support/FakeGateway.h"

// Thursday 2025-10-09 08:00:00 UTC
static const uint64_t kThursday0800Ms = 1759996800000ULL;

struct SchedulerRig {
    ConfigStore cfg;
    ServiceRegistry services;
    FakeGateway gw;
    EventBusModule eventBus;
    CacheModule cache;
    DurableStoreModule store;
    EnvironmentModule env;
    PumpModule pump;
    IrrigationSchedulerModule scheduler;

    SchedulerRig()
    {
        cfg.setEventBus(&eventBus.bus());
        services.add("gateway", &gw.svc);
        eventBus.init(cfg, services);
        cache.init(cfg, services);
        store.init(cfg, services);
        env.init(cfg, services);
        pump.init(cfg, services);
        scheduler.init(cfg, services);
        (void)cfg.applyJson("{\"pump\":{\"min_interval_s\":0}}");
        cache.onConfigLoaded(cfg, services);
        store.onConfigLoaded(cfg, services);
        env.onConfigLoaded(cfg, services);
        pump.onConfigLoaded(cfg, services);
        scheduler.onConfigLoaded(cfg, services);
    }
};

void setUp()
{
    FakeClock::install(kThursday0800Ms);
}

void tearDown()
{
    FakeClock::uninstall();
}

void test_time_of_day_parsing()
{
    uint8_t h = 0;
    uint8_t m = 0;
    TEST_ASSERT_TRUE(parseTimeOfDay("6:30", h, m));
    TEST_ASSERT_EQUAL_UINT8(6, h);
    TEST_ASSERT_EQUAL_UINT8(30, m);
    TEST_ASSERT_TRUE(parseTimeOfDay("23:59", h, m));
    TEST_ASSERT_FALSE(parseTimeOfDay("24:00", h, m));
    TEST_ASSERT_FALSE(parseTimeOfDay("7:5", h, m));
    TEST_ASSERT_FALSE(parseTimeOfDay("07:00:00", h, m));
    TEST_ASSERT_FALSE(parseTimeOfDay("", h, m));

    uint8_t bit = 0;
    TEST_ASSERT_TRUE(weekdayBitFromName("Sunday", bit));
    TEST_ASSERT_EQUAL_UINT8(IRR_WEEKDAY_SUN, bit);
    TEST_ASSERT_FALSE(weekdayBitFromName("funday", bit));
    TEST_ASSERT_EQUAL_UINT8(0, weekdayIndexFromTm(1));
    TEST_ASSERT_EQUAL_UINT8(6, weekdayIndexFromTm(0));
}

void test_add_assigns_id_and_persists()
{
    SchedulerRig rig;
    const ScheduleMutationResult r = rig.scheduler.add(
        "{\"name\":\"Morning\",\"days\":[\"monday\",\"thursday\"],\"start_time\":\"6:30\",\"duration\":\"90\"}");
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_STRING("schedule_1759996800_0", r.entry.id);
    TEST_ASSERT_EQUAL_UINT8(IRR_WEEKDAY_MON | IRR_WEEKDAY_THU, r.entry.weekdayMask);
    TEST_ASSERT_EQUAL_UINT32(90, r.entry.durationSec);
    TEST_ASSERT_TRUE(r.entry.active);
    TEST_ASSERT_EQUAL_UINT64(kThursday0800Ms, r.entry.createdAtMs);

    const DurableStoreService* store = rig.services.get<DurableStoreService>("store");
    std::string json;
    bool found = false;
    TEST_ASSERT_TRUE(store->get(store->ctx, "schedules", &json, &found));
    TEST_ASSERT_TRUE(found);
    StaticJsonDocument<512> doc;
    TEST_ASSERT_FALSE((bool)deserializeJson(doc, json));
    TEST_ASSERT_EQUAL_STRING("Morning", doc[r.entry.id]["name"].as<const char*>());

    // A fresh instance restores the table from the cache.
    IrrigationSchedulerModule reloaded;
    reloaded.init(rig.cfg, rig.services);
    reloaded.onConfigLoaded(rig.cfg, rig.services);
    ScheduleEntry e;
    TEST_ASSERT_TRUE(reloaded.get(r.entry.id, e));
    TEST_ASSERT_EQUAL_UINT8(6, e.hour);
    TEST_ASSERT_EQUAL_UINT8(30, e.minute);
}

void test_add_validation_codes()
{
    SchedulerRig rig;
    ScheduleMutationResult r = rig.scheduler.add("{\"name\":\"x\",\"days\":[\"monday\"],\"duration\":60}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::MissingField, (uint16_t)r.code);
    TEST_ASSERT_EQUAL_STRING("Missing required field: start_time", r.message);

    r = rig.scheduler.add("{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"25:00\",\"duration\":60}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidTimeFormat, (uint16_t)r.code);

    r = rig.scheduler.add("{\"name\":\"x\",\"days\":\"monday\",\"start_time\":\"06:00\",\"duration\":60}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDays, (uint16_t)r.code);

    r = rig.scheduler.add("{\"name\":\"x\",\"days\":[\"mon\"],\"start_time\":\"06:00\",\"duration\":60}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDay, (uint16_t)r.code);
    TEST_ASSERT_EQUAL_STRING("Invalid day: mon", r.message);

    r = rig.scheduler.add("{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":0}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDuration, (uint16_t)r.code);
    r = rig.scheduler.add("{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":\"ten\"}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDuration, (uint16_t)r.code);

    r = rig.scheduler.add("{\"name\":\"\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":60}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidName, (uint16_t)r.code);

    r = rig.scheduler.add("[1]");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::BadJson, (uint16_t)r.code);

    TEST_ASSERT_EQUAL_UINT8(0, rig.scheduler.count());
}

void test_out_of_range_durations_are_rejected()
{
    SchedulerRig rig;
    const char* bad[] = {
        "{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":4294967296}",
        "{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":1e30}",
        "{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":\"99999999999999999999\"}",
        "{\"name\":\"x\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":-60}",
    };
    for (const char* json : bad) {
        const ScheduleMutationResult r = rig.scheduler.add(json);
        TEST_ASSERT_FALSE(r.success);
        TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDuration, (uint16_t)r.code);
    }
    TEST_ASSERT_EQUAL_UINT8(0, rig.scheduler.count());

    ScheduleMutationResult r = rig.scheduler.add(
        "{\"name\":\"Max\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":\"4294967295\"}");
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(4294967295UL, r.entry.durationSec);

    r = rig.scheduler.update(r.entry.id, "{\"duration\":4294967296}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidDuration, (uint16_t)r.code);
    ScheduleEntry e;
    TEST_ASSERT_TRUE(rig.scheduler.list(&e, 1) == 1);
    TEST_ASSERT_EQUAL_UINT32(4294967295UL, e.durationSec);
}

void test_update_and_remove()
{
    SchedulerRig rig;
    const ScheduleMutationResult added = rig.scheduler.add(
        "{\"name\":\"Evening\",\"days\":[\"friday\"],\"start_time\":\"19:00\",\"duration\":60}");
    TEST_ASSERT_TRUE(added.success);

    FakeClock::advanceSec(30);
    ScheduleMutationResult r = rig.scheduler.update(added.entry.id, "{\"duration\":240,\"active\":false}");
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(240, r.entry.durationSec);
    TEST_ASSERT_FALSE(r.entry.active);
    TEST_ASSERT_EQUAL_STRING("Evening", r.entry.name);
    TEST_ASSERT_EQUAL_UINT64(kThursday0800Ms + 30000ULL, r.entry.updatedAtMs);

    r = rig.scheduler.update(added.entry.id, "{\"start_time\":\"7\"}");
    TEST_ASSERT_FALSE(r.success);
    ScheduleEntry e;
    TEST_ASSERT_TRUE(rig.scheduler.get(added.entry.id, e));
    TEST_ASSERT_EQUAL_UINT8(19, e.hour);

    r = rig.scheduler.update("schedule_0_9", "{\"duration\":10}");
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::UnknownSchedule, (uint16_t)r.code);

    TEST_ASSERT_FALSE(rig.scheduler.remove("schedule_0_9"));
    TEST_ASSERT_EQUAL_UINT8(1, rig.scheduler.count());
    TEST_ASSERT_TRUE(rig.scheduler.remove(added.entry.id));
    TEST_ASSERT_EQUAL_UINT8(0, rig.scheduler.count());
    TEST_ASSERT_FALSE(rig.scheduler.get(added.entry.id, e));
}

void test_matching_entry_starts_pump_once()
{
    SchedulerRig rig;
    static int fired;
    fired = 0;
    TEST_ASSERT_TRUE(rig.eventBus.bus().subscribe(EventId::ScheduleFired, [](const Event&, void*) { ++fired; }, nullptr));

    const ScheduleMutationResult first = rig.scheduler.add(
        "{\"name\":\"A\",\"days\":[\"thursday\"],\"start_time\":\"08:00\",\"duration\":120}");
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"B\",\"days\":[\"thursday\"],\"start_time\":\"8:00\",\"duration\":600}").success);

    const ScheduleCheckResult r = rig.scheduler.check();
    TEST_ASSERT_FALSE(r.pumpWasOn);
    TEST_ASSERT_EQUAL_UINT8(2, r.matched);
    TEST_ASSERT_EQUAL_UINT8(1, r.fired);
    TEST_ASSERT_EQUAL_STRING(first.entry.id, r.firedId);
    TEST_ASSERT_TRUE(r.pumpResult.success);
    TEST_ASSERT_EQUAL_UINT32(120, r.pumpResult.durationSec);
    TEST_ASSERT_EQUAL_STRING("1", rig.gw.value("water-pump-control"));

    rig.eventBus.bus().dispatch(32);
    TEST_ASSERT_EQUAL_INT(1, fired);

    const ScheduleCheckResult again = rig.scheduler.check();
    TEST_ASSERT_TRUE(again.pumpWasOn);
    TEST_ASSERT_EQUAL_UINT8(0, again.fired);
}

void test_same_minute_is_evaluated_once()
{
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"A\",\"days\":[\"thursday\"],\"start_time\":\"08:00\",\"duration\":120}").success);
    rig.gw.failSwitch = true;

    const ScheduleCheckResult r = rig.scheduler.check();
    TEST_ASSERT_EQUAL_UINT8(1, r.fired);
    TEST_ASSERT_FALSE(r.pumpResult.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::CommandFailed, (uint16_t)r.pumpResult.code);

    FakeClock::advanceSec(20);
    const ScheduleCheckResult same = rig.scheduler.check();
    TEST_ASSERT_TRUE(same.skippedSameMinute);
    TEST_ASSERT_EQUAL_UINT8(0, same.fired);
    TEST_ASSERT_EQUAL_INT(1, rig.gw.switchCalls);
}

void test_running_pump_suppresses_evaluation()
{
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"A\",\"days\":[\"thursday\"],\"start_time\":\"08:00\",\"duration\":120}").success);
    TEST_ASSERT_TRUE(rig.pump.turnOn(600, IrrigationSource::Manual, nullptr).success);

    const ScheduleCheckResult r = rig.scheduler.check();
    TEST_ASSERT_TRUE(r.pumpWasOn);
    TEST_ASSERT_EQUAL_UINT8(0, r.matched);
}

void test_non_matching_entries_are_ignored()
{
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"Friday\",\"days\":[\"friday\"],\"start_time\":\"08:00\",\"duration\":60}").success);
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"Later\",\"days\":[\"thursday\"],\"start_time\":\"08:01\",\"duration\":60}").success);
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"Off\",\"days\":[\"thursday\"],\"start_time\":\"08:00\",\"duration\":60,\"active\":false}").success);

    const ScheduleCheckResult r = rig.scheduler.check();
    TEST_ASSERT_EQUAL_UINT8(0, r.matched);
    TEST_ASSERT_EQUAL_UINT8(0, r.fired);
    TEST_ASSERT_EQUAL_INT(0, rig.gw.switchCalls);
}

void test_check_stops_expired_run_first()
{
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"A\",\"days\":[\"thursday\"],\"start_time\":\"08:00\",\"duration\":60}").success);
    TEST_ASSERT_EQUAL_UINT8(1, rig.scheduler.check().fired);

    FakeClock::advanceSec(61);
    const ScheduleCheckResult r = rig.scheduler.check();
    TEST_ASSERT_EQUAL_UINT8(1, r.pumpActions);
    TEST_ASSERT_FALSE(r.pumpWasOn);
    TEST_ASSERT_EQUAL_UINT8(0, r.fired);
    TEST_ASSERT_EQUAL_STRING("0", rig.gw.value("water-pump-control"));
}

int main()
{
    setenv("TZ", "UTC", 1);
    tzset();

    UNITY_BEGIN();
    RUN_TEST(test_time_of_day_parsing);
    RUN_TEST(test_add_assigns_id_and_persists);
    RUN_TEST(test_add_validation_codes);
    RUN_TEST(test_out_of_range_durations_are_rejected);
    RUN_TEST(test_update_and_remove);
    RUN_TEST(test_matching_entry_starts_pump_once);
    RUN_TEST(test_same_minute_is_evaluated_once);
    RUN_TEST(test_running_pump_suppresses_evaluation);
    RUN_TEST(test_non_matching_entries_are_ignored);
    RUN_TEST(test_check_stops_expired_run_first);
    return UNITY_END();
}
