#pragma once
/**
 * @file OrchestratorModule.h
 * @brief Lifecycle of the background loops and external recommendation intake.
 */
#include "Core/ModulePassive.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "Modules/EnvironmentModule/EnvironmentAnalysis.h"

#include <atomic>
#include <string>
#include <vector>

/** @brief Orchestrator configuration values. */
struct OrchestratorConfig {
    bool aiEnabled = false;
    char allowedSources[96] = "all";
};

/** @brief Result of one component in start()/stop(). */
struct ComponentResult {
    const char* name = "";
    bool success = false;
    char message[Limits::Irrigation::Message] = {0};
};

/** @brief Per-component lifecycle result; success is the conjunction. */
struct LifecycleResult {
    bool success = true;
    uint8_t count = 0;
    ComponentResult components[3];
};

/** @brief What an accepted recommendation led to. */
enum class RecommendationAction : uint8_t { None = 0, ImmediateIrrigation, Queued };

/** @brief Outcome of ingestRecommendation. */
struct IngestResult {
    bool success = false;
    bool accepted = false;
    ErrorCode code = ErrorCode::None;
    RecommendationAction action = RecommendationAction::None;
    char message[Limits::Irrigation::Message + 64] = {0};
    PumpResult pump;             ///< valid when action is ImmediateIrrigation
};

/** @brief Recent activity seen on the event bus since boot. */
struct ActivityCounters {
    uint32_t pumpStarts = 0;
    uint32_t pumpStops = 0;
    uint32_t irrigations = 0;
    double waterL = 0.0;
    uint32_t schedulesFired = 0;
    uint32_t decisions = 0;
    uint32_t autoIrrigations = 0;
    uint32_t aiOverrides = 0;
    uint32_t recommendationsReceived = 0;
    uint32_t recommendationsAccepted = 0;
};

/** @brief Aggregated system view. */
struct SystemStatus {
    uint64_t tsMs = 0;
    bool hasPump = false;
    PumpStatus pump;
    bool schedulerActive = false;
    uint8_t scheduleCount = 0;
    ScheduleEntry schedules[Limits::Irrigation::MaxSchedules];
    bool autoEnabled = false;
    bool decisionActive = false;
    DecisionConfig decisionConfig;
    bool hasLastDecision = false;
    Decision lastDecision;
    SoilTrendAnalysis soilTrend;
    ActivityCounters activity;
};

/** @brief Combined irrigation and decision history. */
struct IrrigationHistory {
    uint64_t tsMs = 0;
    std::vector<IrrigationEvent> events;
    std::vector<Decision> decisions;
    bool hasStatistics = false;
    PumpStatistics statistics;
};

static inline const char* recommendationActionStr(RecommendationAction a)
{
    switch (a) {
    case RecommendationAction::None: return "none";
    case RecommendationAction::ImmediateIrrigation: return "immediate_irrigation";
    case RecommendationAction::Queued: return "queued";
    }
    return "none";
}

/**
 * @brief Composition point above the pump, scheduler and decision loop.
 */
class OrchestratorModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "orchestrator"; }

    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "pump";
        if (i == 3) return "scheduler";
        if (i == 4) return "decision";
        if (i == 5) return "environment";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    LifecycleResult start();
    /** @brief Stop both loops and force the pump OFF if it is still running. */
    LifecycleResult stop();

    IngestResult ingestRecommendation(const char* source, const char* priority,
                                      const AiRecommendation& rec, uint64_t timestampMs);
    /** @brief Same as above from `{source, priority, recommendation:{...}, timestamp}`. */
    IngestResult ingestRecommendationJson(const char* json);

    PumpResult manualControl(const char* action, uint32_t durationSec);
    DecisionOutcome triggerManualDecision();
    void systemStatus(SystemStatus& out);
    void irrigationHistory(IrrigationHistory& out, uint16_t limit = 20);

    ActivityCounters activity() const;
    bool sourceAllowed(const char* source) const;

private:
    OrchestratorConfig cfgData_;
    const PumpService* pump_ = nullptr;
    const SchedulerService* scheduler_ = nullptr;
    const DecisionService* decision_ = nullptr;
    const EnvironmentService* env_ = nullptr;
    EventBus* eventBus_ = nullptr;

    std::atomic<uint32_t> pumpStarts_{0};
    std::atomic<uint32_t> pumpStops_{0};
    std::atomic<uint32_t> irrigations_{0};
    std::atomic<uint32_t> waterMl_{0};
    std::atomic<uint32_t> schedulesFired_{0};
    std::atomic<uint32_t> decisions_{0};
    std::atomic<uint32_t> autoIrrigations_{0};
    std::atomic<uint32_t> aiOverrides_{0};
    std::atomic<uint32_t> recReceived_{0};
    std::atomic<uint32_t> recAccepted_{0};

    ConfigVariable<bool,0> aiEnabledVar {
        CFG_KEY(ConfigKeys::Orchestrator::AiEnabled),"ai_enabled","orchestrator",ConfigType::Bool,
        &cfgData_.aiEnabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> allowedSourcesVar {
        CFG_KEY(ConfigKeys::Orchestrator::AllowedSources),"ai_allowed_sources","orchestrator",ConfigType::CharArray,
        (char*)cfgData_.allowedSources,ConfigPersistence::Persistent,sizeof(cfgData_.allowedSources)
    };

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);
};
