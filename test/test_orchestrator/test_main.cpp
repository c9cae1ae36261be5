#include <unity.h>

#include <math.h>
#include <stdio.h>
#include <string.h>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/Stores/CacheModule/CacheModule.h"
#include "Modules/Stores/DurableStoreModule/DurableStoreModule.h"
#include "Modules/EnvironmentModule/EnvironmentModule.h"
#include "Modules/PumpModule/PumpModule.h"
#include "Modules/IrrigationSchedulerModule/IrrigationSchedulerModule.h"
#include "Modules/DecisionModule/DecisionModule.h"
#include "Modules/OrchestratorModule/OrchestratorModule.h"

#include "../support/FakeGateway.h"

static const uint64_t kStartMs = 1760000000000ULL;
static const char* kAiEnabled =
    "{\"orchestrator\":{\"ai_enabled\":true,\"ai_allowed_sources\":\"planner, weather\"},"
    "\"decision\":{\"enabled\":true},\"pump\":{\"min_interval_s\":0}}";

/// Full irrigation stack over in-memory stores and a fake feed platform.
struct SystemRig {
    ConfigStore cfg;
    ServiceRegistry services;
    FakeGateway gw;
    EventBusModule eventBus;
    CacheModule cache;
    DurableStoreModule store;
    EnvironmentModule env;
    PumpModule pump;
    IrrigationSchedulerModule scheduler;
    DecisionModule decision;
    OrchestratorModule orchestrator;

    explicit SystemRig(const char* configJson = kAiEnabled)
    {
        cfg.setEventBus(&eventBus.bus());
        services.add("gateway", &gw.svc);
        eventBus.init(cfg, services);
        cache.init(cfg, services);
        store.init(cfg, services);
        env.init(cfg, services);
        pump.init(cfg, services);
        scheduler.init(cfg, services);
        decision.init(cfg, services);
        orchestrator.init(cfg, services);
        if (configJson) (void)cfg.applyJson(configJson);
        cache.onConfigLoaded(cfg, services);
        store.onConfigLoaded(cfg, services);
        env.onConfigLoaded(cfg, services);
        pump.onConfigLoaded(cfg, services);
        scheduler.onConfigLoaded(cfg, services);
        decision.onConfigLoaded(cfg, services);
        orchestrator.onConfigLoaded(cfg, services);
    }

    void drainEvents() { eventBus.bus().dispatch(64); }
};

static AiRecommendation makeAi(bool irrigate, double minutes, double confidence)
{
    AiRecommendation ai;
    ai.shouldIrrigate = irrigate;
    ai.durationMinutes = minutes;
    ai.confidence = confidence;
    snprintf(ai.reason, sizeof(ai.reason), "%s", "Forecast heat");
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

void test_recommendations_disabled_by_default()
{
    SystemRig rig(nullptr);
    const IngestResult r = rig.orchestrator.ingestRecommendation("planner", "high", makeAi(true, 10, 0.9), 0);
    TEST_ASSERT_FALSE(r.accepted);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::RecommendationsDisabled, (uint16_t)r.code);
    TEST_ASSERT_EQUAL_INT(0, rig.gw.switchCalls);
    TEST_ASSERT_EQUAL_UINT32(1, rig.orchestrator.activity().recommendationsReceived);
}

void test_source_and_priority_are_checked()
{
    SystemRig rig;
    TEST_ASSERT_TRUE(rig.orchestrator.sourceAllowed("weather"));
    TEST_ASSERT_FALSE(rig.orchestrator.sourceAllowed("rogue"));

    IngestResult r = rig.orchestrator.ingestRecommendation("rogue", "high", makeAi(true, 10, 0.9), 0);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::SourceNotAllowed, (uint16_t)r.code);
    TEST_ASSERT_EQUAL_STRING("Source 'rogue' is not allowed", r.message);

    r = rig.orchestrator.ingestRecommendation("planner", "urgent", makeAi(true, 10, 0.9), 0);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidPriority, (uint16_t)r.code);
    TEST_ASSERT_FALSE(r.accepted);
    TEST_ASSERT_EQUAL_UINT32(0, rig.orchestrator.activity().recommendationsAccepted);
}

void test_high_priority_irrigates_immediately()
{
    SystemRig rig;
    const IngestResult r = rig.orchestrator.ingestRecommendation("planner", "high", makeAi(true, 10, 0.9), 0);
    TEST_ASSERT_TRUE(r.accepted);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RecommendationAction::ImmediateIrrigation, (uint8_t)r.action);
    TEST_ASSERT_EQUAL_UINT32(600, r.pump.durationSec);
    TEST_ASSERT_TRUE(strncmp(r.message, "Applied high priority AI recommendation: ", 41) == 0);

    TEST_ASSERT_TRUE(rig.pump.state().isOn);
    TEST_ASSERT_EQUAL_UINT64(kStartMs + 600000ULL, r.pump.scheduledStopMs);
}

void test_oversized_recommendation_is_held_to_max_runtime()
{
    SystemRig rig;
    const IngestResult r = rig.orchestrator.ingestRecommendation("planner", "high", makeAi(true, 71582789.0, 0.9), 0);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)IrrigationDefaults::MaxRuntimeSec, r.pump.durationSec);
    TEST_ASSERT_EQUAL_UINT64(kStartMs + (uint64_t)IrrigationDefaults::MaxRuntimeSec * 1000ULL,
                             r.pump.scheduledStopMs);

    TEST_ASSERT_TRUE(rig.orchestrator.manualControl("off", 0).success);
    const IngestResult inf = rig.orchestrator.ingestRecommendation("planner", "high", makeAi(true, INFINITY, 0.9), 0);
    TEST_ASSERT_TRUE(inf.success);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)IrrigationDefaults::MaxRuntimeSec, inf.pump.durationSec);
}

void test_normal_priority_is_queued_for_next_decision()
{
    SystemRig rig;
    const IngestResult r = rig.orchestrator.ingestRecommendationJson(
        "{\"source\":\"weather\",\"priority\":\"normal\",\"timestamp\":\"2025-10-09T08:53:00Z\","
        "\"recommendation\":{\"should_irrigate\":true,\"duration_minutes\":8,\"confidence\":0.85,"
        "\"reason\":\"Heatwave\",\"zones\":[\"north\"]}}");
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RecommendationAction::Queued, (uint8_t)r.action);
    TEST_ASSERT_EQUAL_INT(0, rig.gw.switchCalls);

    rig.gw.setNumber("soil-moisture", 55.0);
    const DecisionOutcome o = rig.orchestrator.triggerManualDecision();
    TEST_ASSERT_TRUE(o.made);
    TEST_ASSERT_TRUE(o.decision.aiApplied);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Moderate, (uint8_t)o.decision.amount);
    TEST_ASSERT_EQUAL_STRING("Heatwave (AI recommended)", o.decision.reason);
    TEST_ASSERT_EQUAL_UINT32(180, o.decision.actionDurationSec);

    rig.drainEvents();
    const ActivityCounters a = rig.orchestrator.activity();
    TEST_ASSERT_EQUAL_UINT32(1, a.decisions);
    TEST_ASSERT_EQUAL_UINT32(1, a.aiOverrides);
    TEST_ASSERT_EQUAL_UINT32(1, a.autoIrrigations);
}

void test_recommendation_without_irrigation_is_acknowledged()
{
    SystemRig rig;
    const IngestResult r = rig.orchestrator.ingestRecommendation("planner", "low", makeAi(false, 0, 0.9), 0);
    TEST_ASSERT_TRUE(r.accepted);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RecommendationAction::None, (uint8_t)r.action);
    TEST_ASSERT_EQUAL_STRING("Recommendation received but no irrigation action needed", r.message);

    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::BadJson,
                             (uint16_t)rig.orchestrator.ingestRecommendationJson("[]").code);
}

void test_manual_control_and_activity_counters()
{
    SystemRig rig;
    PumpResult r = rig.orchestrator.manualControl("toggle", 30);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidAction, (uint16_t)r.code);

    r = rig.orchestrator.manualControl("ON", 30);
    TEST_ASSERT_TRUE(r.success);
    FakeClock::advanceSec(10);
    r = rig.orchestrator.manualControl("off", 0);
    TEST_ASSERT_TRUE(r.success);

    rig.drainEvents();
    const ActivityCounters a = rig.orchestrator.activity();
    TEST_ASSERT_EQUAL_UINT32(1, a.pumpStarts);
    TEST_ASSERT_EQUAL_UINT32(1, a.pumpStops);
    TEST_ASSERT_EQUAL_UINT32(1, a.irrigations);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 5.0, a.waterL);

    IrrigationHistory h;
    rig.orchestrator.irrigationHistory(h, 5);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)h.events.size());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)IrrigationSource::Manual, (uint8_t)h.events[0].source);
    TEST_ASSERT_TRUE(h.hasStatistics);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 5.0, h.statistics.totalWaterL);
}

void test_system_status_aggregates_components()
{
    SystemRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.add(
        "{\"name\":\"Morning\",\"days\":[\"monday\"],\"start_time\":\"06:00\",\"duration\":60}").success);

    SystemStatus st;
    rig.orchestrator.systemStatus(st);
    TEST_ASSERT_EQUAL_UINT64(kStartMs, st.tsMs);
    TEST_ASSERT_TRUE(st.hasPump);
    TEST_ASSERT_FALSE(st.pump.isOn);
    TEST_ASSERT_EQUAL_UINT8(1, st.scheduleCount);
    TEST_ASSERT_EQUAL_STRING("Morning", st.schedules[0].name);
    TEST_ASSERT_TRUE(st.autoEnabled);
    TEST_ASSERT_FALSE(st.schedulerActive);
    TEST_ASSERT_FALSE(st.decisionActive);
    TEST_ASSERT_FALSE(st.hasLastDecision);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SoilTrend::Unknown, (uint8_t)st.soilTrend.trend);
}

void test_stop_forces_pump_off()
{
    SystemRig rig(nullptr);
    TEST_ASSERT_TRUE(rig.pump.turnOn(600, IrrigationSource::Manual, nullptr).success);

    LifecycleResult started = rig.orchestrator.start();
    TEST_ASSERT_TRUE(started.success);
    TEST_ASSERT_EQUAL_UINT8(2, started.count);
    TEST_ASSERT_TRUE(rig.scheduler.isTaskRunning());
    TEST_ASSERT_TRUE(rig.decision.isTaskRunning());

    const LifecycleResult again = rig.orchestrator.start();
    TEST_ASSERT_FALSE(again.success);
    TEST_ASSERT_EQUAL_STRING("Failed to start irrigation scheduler", again.components[0].message);

    const LifecycleResult stopped = rig.orchestrator.stop();
    TEST_ASSERT_TRUE(stopped.success);
    TEST_ASSERT_EQUAL_UINT8(3, stopped.count);
    TEST_ASSERT_EQUAL_STRING("pump", stopped.components[2].name);
    TEST_ASSERT_EQUAL_STRING("Water pump stopped", stopped.components[2].message);
    TEST_ASSERT_FALSE(rig.pump.state().isOn);
    TEST_ASSERT_EQUAL_STRING("0", rig.gw.value("water-pump-control"));
    TEST_ASSERT_FALSE(rig.scheduler.isTaskRunning());

    IrrigationEvent events[2];
    TEST_ASSERT_EQUAL_UINT16(1, rig.pump.history(2, events, 2));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)IrrigationSource::System, (uint8_t)events[0].source);

    const LifecycleResult idle = rig.orchestrator.stop();
    TEST_ASSERT_FALSE(idle.success);
    TEST_ASSERT_EQUAL_STRING("Water pump already OFF", idle.components[2].message);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_recommendations_disabled_by_default);
    RUN_TEST(test_source_and_priority_are_checked);
    RUN_TEST(test_high_priority_irrigates_immediately);
    RUN_TEST(test_oversized_recommendation_is_held_to_max_runtime);
    RUN_TEST(test_normal_priority_is_queued_for_next_decision);
    RUN_TEST(test_recommendation_without_irrigation_is_acknowledged);
    RUN_TEST(test_manual_control_and_activity_counters);
    RUN_TEST(test_system_status_aggregates_components);
    RUN_TEST(test_stop_forces_pump_off);
    return UNITY_END();
}
