#pragma once
/**
 * @file PumpModule.h
 * @brief Irrigation pump actuator controller (safety interlocks, reconciliation, events).
 */
#include "Core/Module.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "Domain/IrrigationDefaults.h"
#include "PumpStateCodec.h"

#include <mutex>

/** @brief Pump configuration values. */
struct PumpConfig {
    char feedKey[Limits::Gateway::FeedKey] = "water-pump-control";
    int32_t maxRuntimeSec = IrrigationDefaults::MaxRuntimeSec;
    int32_t minIntervalSec = IrrigationDefaults::MinIntervalSec;
    double flowRateLps = IrrigationDefaults::FlowRateLitresPerSec;
    int32_t defaultDurationSec = IrrigationDefaults::DefaultDurationSec;
    int32_t historyMax = IrrigationDefaults::HistoryMax;
    int32_t statusIntervalSec = IrrigationDefaults::PumpStatusIntervalSec;
};

/**
 * @brief Exclusive owner of one pump's logical state.
 *
 * Every operation takes the device lock, reconciles against the gateway
 * switch feed, then acts. The task ticks every `status_interval_s` or at the
 * scheduled stop, whichever comes first.
 */
class PumpModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~PumpModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "pump"; }
    /** @brief Task name. */
    const char* taskName() const override { return "pump"; }

    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cache";
        if (i == 3) return "store";
        if (i == 4) return "gateway";
        if (i == 5) return "environment";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief duration 0 selects `default_duration_s`; longer requests are clamped. */
    PumpResult turnOn(uint32_t durationSec, IrrigationSource source, const char* detailsJson);
    PumpResult turnOff(IrrigationSource source, const char* detailsJson);
    bool getStatus(PumpStatus& out);
    PumpCheckResult checkScheduledActions();
    /** @brief Newest first, cache list then durable store. */
    uint16_t history(uint16_t limit, IrrigationEvent* out, uint16_t max);
    bool statistics(PumpStatistics& out);

    /** @brief Copy of the local state without reconciling. */
    ActuatorState state() const;

private:
    PumpConfig cfgData_;
    const GatewayService* gateway_ = nullptr;
    const CacheService* cache_ = nullptr;
    const DurableStoreService* store_ = nullptr;
    const EnvironmentService* env_ = nullptr;
    EventBus* eventBus_ = nullptr;
    PumpService svc_{};
    bool feedReady_ = false;

    mutable std::mutex devMtx_;
    ActuatorState st_;

    ConfigVariable<char,0> feedVar {
        CFG_KEY(ConfigKeys::Pump::FeedKey),"feed_key","pump",ConfigType::CharArray,
        (char*)cfgData_.feedKey,ConfigPersistence::Runtime,sizeof(cfgData_.feedKey)
    };
    ConfigVariable<int32_t,0> maxRuntimeVar {
        CFG_KEY(ConfigKeys::Pump::MaxRuntimeS),"max_runtime_s","pump",ConfigType::Int32,
        &cfgData_.maxRuntimeSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> minIntervalVar {
        CFG_KEY(ConfigKeys::Pump::MinIntervalS),"min_interval_s","pump",ConfigType::Int32,
        &cfgData_.minIntervalSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<double,0> flowRateVar {
        CFG_KEY(ConfigKeys::Pump::FlowRateLps),"flow_rate_lps","pump",ConfigType::Double,
        &cfgData_.flowRateLps,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> defaultDurationVar {
        CFG_KEY(ConfigKeys::Pump::DefaultDurationS),"default_duration_s","pump",ConfigType::Int32,
        &cfgData_.defaultDurationSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> historyMaxVar {
        CFG_KEY(ConfigKeys::Pump::HistoryMax),"history_max","pump",ConfigType::Int32,
        &cfgData_.historyMax,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> statusIntervalVar {
        CFG_KEY(ConfigKeys::Pump::StatusIntervalS),"status_interval_s","pump",ConfigType::Int32,
        &cfgData_.statusIntervalSec,ConfigPersistence::Persistent,0
    };

    void loadState_();
    void persistState_();
    bool readSoil_(double& out) const;

    FeedSwitchState reconcileLocked_();
    PumpResult turnOffLocked_(IrrigationSource source, const char* detailsJson);
    PumpResult applyStopLocked_(IrrigationSource source, const char* detailsJson, uint64_t nowMs);
    void recordEvent_(const IrrigationEvent& ev);
    void postStateChanged_(bool on, IrrigationSource source, uint32_t durationSec);

    static void onFeedPush_(void* user, const char* feedKey, const char* payload);
    static void onEventStatic_(const Event& e, void* user);

    static PumpResult svcTurnOn_(void* ctx, uint32_t durationSec, IrrigationSource source, const char* detailsJson);
    static PumpResult svcTurnOff_(void* ctx, IrrigationSource source, const char* detailsJson);
    static bool svcGetStatus_(void* ctx, PumpStatus* out);
    static PumpCheckResult svcCheckScheduledActions_(void* ctx);
    static uint16_t svcHistory_(void* ctx, uint16_t limit, IrrigationEvent* out, uint16_t max);
    static bool svcStatistics_(void* ctx, PumpStatistics* out);
};
