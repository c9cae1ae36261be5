#pragma once
/**
 * @file IrrigationSchedulerModule.h
 * @brief Weekday + time-of-day irrigation schedules with CRUD and a poll loop.
 */
#include "Core/Module.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "Domain/IrrigationDefaults.h"

#include <mutex>
#include <string>

/** @brief Scheduler configuration values. */
struct SchedulerConfig {
    int32_t checkIntervalSec = IrrigationDefaults::ScheduleCheckIntervalSec;
};

/**
 * @brief Holds the ordered schedule table and fires the first matching entry.
 *
 * The poll task is not started at boot; the orchestrator owns its lifecycle.
 */
class IrrigationSchedulerModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~IrrigationSchedulerModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "scheduler"; }
    /** @brief Task name. */
    const char* taskName() const override { return "scheduler"; }
    bool autoStart() const override { return false; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cache";
        if (i == 3) return "store";
        if (i == 4) return "pump";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    ScheduleMutationResult add(const char* json);
    ScheduleMutationResult update(const char* id, const char* json);
    bool remove(const char* id);
    bool get(const char* id, ScheduleEntry& out) const;
    uint8_t list(ScheduleEntry* out, uint8_t max) const;
    ScheduleCheckResult check();

    uint8_t count() const;

private:
    SchedulerConfig cfgData_;
    const CacheService* cache_ = nullptr;
    const DurableStoreService* store_ = nullptr;
    const PumpService* pump_ = nullptr;
    EventBus* eventBus_ = nullptr;
    SchedulerService svc_{};

    mutable std::mutex mtx_;
    ScheduleEntry entries_[Limits::Irrigation::MaxSchedules]{};
    uint8_t count_ = 0;
    int64_t lastCheckedMinute_ = -1;

    ConfigVariable<int32_t,0> checkIntervalVar {
        CFG_KEY(ConfigKeys::Scheduler::CheckIntervalS),"check_interval_s","scheduler",ConfigType::Int32,
        &cfgData_.checkIntervalSec,ConfigPersistence::Persistent,0
    };

    int findLocked_(const char* id) const;
    void makeIdLocked_(char* out, size_t outLen) const;
    void load_();
    bool persistLocked_();
    bool encodeCollectionLocked_(std::string& cacheJson, std::string& storeJson) const;

    static ScheduleMutationResult svcAdd_(void* ctx, const char* json);
    static ScheduleMutationResult svcUpdate_(void* ctx, const char* id, const char* json);
    static bool svcRemove_(void* ctx, const char* id);
    static bool svcGet_(void* ctx, const char* id, ScheduleEntry* out);
    static uint8_t svcList_(void* ctx, ScheduleEntry* out, uint8_t max);
    static ScheduleCheckResult svcCheck_(void* ctx);
    static bool svcStartLoop_(void* ctx);
    static bool svcStopLoop_(void* ctx);
    static bool svcIsRunning_(void* ctx);
};
