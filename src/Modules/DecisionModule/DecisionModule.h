#pragma once
/**
 * @file DecisionModule.h
 * @brief Periodic autonomous irrigation decision loop.
 */
#include "Core/Module.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "Domain/IrrigationDefaults.h"

#include <mutex>
#include <string>

/** @brief Decision loop configuration values. */
struct DecisionLoopConfig {
    bool enabled = false;
    int32_t minIntervalSec = IrrigationDefaults::DecisionMinIntervalSec;
    int32_t checkIntervalSec = IrrigationDefaults::DecisionCheckIntervalSec;
    int32_t lightSec = IrrigationDefaults::DurationLightSec;
    int32_t normalSec = IrrigationDefaults::DurationNormalSec;
    int32_t heavySec = IrrigationDefaults::DurationHeavySec;
    double aiMinConfidence = IrrigationDefaults::AiMinConfidence;
    double soilMin = IrrigationDefaults::SoilMin;
    double soilMax = IrrigationDefaults::SoilMax;
    double soilOptMin = IrrigationDefaults::SoilOptMin;
    double soilOptMax = IrrigationDefaults::SoilOptMax;
};

/**
 * @brief Combines sensor analysis with an optional AI recommendation and
 * starts the pump when irrigation is needed.
 *
 * Every tick is serialized; a decision is only recorded when all
 * preconditions hold (enabled, pump off, interval elapsed, soil reading).
 */
class DecisionModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~DecisionModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "decision"; }
    /** @brief Task name. */
    const char* taskName() const override { return "decision"; }
    bool autoStart() const override { return false; }

    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cache";
        if (i == 3) return "store";
        if (i == 4) return "pump";
        if (i == 5) return "environment";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    DecisionOutcome makeDecision();
    bool enable(bool enabled);
    DecisionConfig config() const;
    bool updateConfig(const char* json);
    bool lastDecision(Decision& out);
    uint16_t history(uint16_t limit, Decision* out, uint16_t max);
    bool queueRecommendation(const AiRecommendation& rec);

private:
    DecisionLoopConfig cfgData_;
    ConfigStore* cfgStore_ = nullptr;
    const CacheService* cache_ = nullptr;
    const DurableStoreService* store_ = nullptr;
    const PumpService* pump_ = nullptr;
    const EnvironmentService* env_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DecisionService svc_{};

    std::mutex decideMtx_;
    mutable std::mutex stateMtx_;
    Decision last_{};
    bool hasLast_ = false;
    AiRecommendation pendingAi_{};
    bool hasPendingAi_ = false;

    ConfigVariable<bool,0> enabledVar {
        CFG_KEY(ConfigKeys::Decision::Enabled),"enabled","decision",ConfigType::Bool,
        &cfgData_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> minIntervalVar {
        CFG_KEY(ConfigKeys::Decision::MinIntervalS),"min_interval_s","decision",ConfigType::Int32,
        &cfgData_.minIntervalSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> checkIntervalVar {
        CFG_KEY(ConfigKeys::Decision::CheckIntervalS),"check_interval_s","decision",ConfigType::Int32,
        &cfgData_.checkIntervalSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> lightVar {
        CFG_KEY(ConfigKeys::Decision::LightS),"light_s","decision",ConfigType::Int32,
        &cfgData_.lightSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> normalVar {
        CFG_KEY(ConfigKeys::Decision::NormalS),"normal_s","decision",ConfigType::Int32,
        &cfgData_.normalSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> heavyVar {
        CFG_KEY(ConfigKeys::Decision::HeavyS),"heavy_s","decision",ConfigType::Int32,
        &cfgData_.heavySec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> aiConfidenceVar {
        CFG_KEY(ConfigKeys::Decision::AiMinConfidence),"ai_min_confidence","decision",ConfigType::Double,
        &cfgData_.aiMinConfidence,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> soilMinVar {
        CFG_KEY(ConfigKeys::Decision::SoilMin),"soil_min","decision",ConfigType::Double,
        &cfgData_.soilMin,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> soilMaxVar {
        CFG_KEY(ConfigKeys::Decision::SoilMax),"soil_max","decision",ConfigType::Double,
        &cfgData_.soilMax,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> soilOptMinVar {
        CFG_KEY(ConfigKeys::Decision::SoilOptMin),"soil_optimal_min","decision",ConfigType::Double,
        &cfgData_.soilOptMin,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> soilOptMaxVar {
        CFG_KEY(ConfigKeys::Decision::SoilOptMax),"soil_optimal_max","decision",ConfigType::Double,
        &cfgData_.soilOptMax,ConfigPersistence::Persistent,0
    };

    bool consumeRecommendation_(AiRecommendation& out);
    uint32_t durationFor_(WaterAmount amount) const;
    void record_(const Decision& d);
    bool readLast_(Decision& out);

    static DecisionOutcome svcMakeDecision_(void* ctx);
    static bool svcEnable_(void* ctx, bool enabled);
    static bool svcGetConfig_(void* ctx, DecisionConfig* out);
    static bool svcUpdateConfig_(void* ctx, const char* json);
    static bool svcLastDecision_(void* ctx, Decision* out);
    static uint16_t svcHistory_(void* ctx, uint16_t limit, Decision* out, uint16_t max);
    static bool svcQueueRecommendation_(void* ctx, const AiRecommendation* rec);
    static bool svcStartLoop_(void* ctx);
    static bool svcStopLoop_(void* ctx);
    static bool svcIsRunning_(void* ctx);
};
