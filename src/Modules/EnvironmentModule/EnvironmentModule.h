#pragma once
/**
 * @file EnvironmentModule.h
 * @brief Environment sampler: sensor feeds to in-memory and cached readings.
 */
#include "Core/Module.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "Domain/IrrigationDefaults.h"

#include <mutex>

/** @brief Environment sampler configuration values. */
struct EnvironmentConfig {
    int32_t maxAgeSec = IrrigationDefaults::SensorMaxAgeSec;
    int32_t collectIntervalSec = IrrigationDefaults::SensorCollectIntervalSec;
    char soilFeed[Limits::Gateway::FeedKey] = "soil-moisture";
    char tempFeed[Limits::Gateway::FeedKey] = "dht20-temperature";
    char humidityFeed[Limits::Gateway::FeedKey] = "dht20-humidity";
    char lightFeed[Limits::Gateway::FeedKey] = "light-sensor";
};

/**
 * @brief Active module owning the latest reading of every sensor kind.
 *
 * Readings arrive by periodic collection through the gateway and by pub/sub
 * pushes. Pushes only touch memory and post `SensorReadingReceived`; the
 * cache write happens on the event bus thread.
 */
class EnvironmentModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~EnvironmentModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "environment"; }
    /** @brief Task name. */
    const char* taskName() const override { return "environment"; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cache";
        if (i == 3) return "gateway";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    bool latest(SensorKind kind, SensorReading& out);
    bool snapshot(bool collectIfStale, EnvironmentSnapshot& out);
    /** @brief Read every feed now; returns the number of fresh readings. */
    uint8_t collect();
    uint16_t soilSamples(SoilSample* out, uint16_t max) const;

    /** @brief Feed key configured for a kind. */
    const char* feedKey(SensorKind kind) const;

private:
    EnvironmentConfig cfgData_;
    const GatewayService* gateway_ = nullptr;
    const CacheService* cache_ = nullptr;
    EventBus* eventBus_ = nullptr;
    EnvironmentService svc_{};
    bool feedsInitialized_ = false;

    mutable std::mutex mtx_;
    SensorReading readings_[SENSOR_KIND_COUNT]{};
    SoilSample soilRing_[Limits::Environment::SoilHistory]{};
    uint16_t soilHead_ = 0;
    uint16_t soilCount_ = 0;

    ConfigVariable<int32_t,0> maxAgeVar {
        CFG_KEY(ConfigKeys::Environment::MaxAgeS),"max_age_s","environment",ConfigType::Int32,
        &cfgData_.maxAgeSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> collectVar {
        CFG_KEY(ConfigKeys::Environment::CollectIntervalS),"collect_interval_s","environment",ConfigType::Int32,
        &cfgData_.collectIntervalSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> soilFeedVar {
        CFG_KEY(ConfigKeys::Environment::SoilFeed),"soil_feed","environment",ConfigType::CharArray,
        (char*)cfgData_.soilFeed,ConfigPersistence::Runtime,sizeof(cfgData_.soilFeed)
    };
    ConfigVariable<char,0> tempFeedVar {
        CFG_KEY(ConfigKeys::Environment::TempFeed),"temperature_feed","environment",ConfigType::CharArray,
        (char*)cfgData_.tempFeed,ConfigPersistence::Runtime,sizeof(cfgData_.tempFeed)
    };
    ConfigVariable<char,0> humidityFeedVar {
        CFG_KEY(ConfigKeys::Environment::HumidityFeed),"humidity_feed","environment",ConfigType::CharArray,
        (char*)cfgData_.humidityFeed,ConfigPersistence::Runtime,sizeof(cfgData_.humidityFeed)
    };
    ConfigVariable<char,0> lightFeedVar {
        CFG_KEY(ConfigKeys::Environment::LightFeed),"light_feed","environment",ConfigType::CharArray,
        (char*)cfgData_.lightFeed,ConfigPersistence::Runtime,sizeof(cfgData_.lightFeed)
    };

    uint64_t maxAgeMs_() const;
    bool isFresh_(const SensorReading& r, uint64_t nowMs) const;
    bool kindForFeed_(const char* feedKey, SensorKind& out) const;
    void store_(SensorKind kind, double value, uint64_t tsMs);
    bool collectOne_(SensorKind kind);
    bool loadCached_(SensorKind kind, SensorReading& out);
    void cacheReading_(const SensorReading& r);

    static void onSensorPush_(void* user, const char* feedKey, const char* payload);
    static void onEventStatic_(const Event& e, void* user);

    static bool svcLatest_(void* ctx, SensorKind kind, SensorReading* out);
    static bool svcSnapshot_(void* ctx, bool collectIfStale, EnvironmentSnapshot* out);
    static uint8_t svcCollect_(void* ctx);
    static uint16_t svcSoilSamples_(void* ctx, SoilSample* out, uint16_t max);
};
