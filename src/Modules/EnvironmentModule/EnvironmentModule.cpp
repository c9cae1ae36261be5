/**
 * @file EnvironmentModule.cpp
 * @brief Implementation file.
 */
#include "EnvironmentModule.h"
#include "EnvironmentAnalysis.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Runtime.h"
#include "Modules/Network/GatewayModule/FeedCodec.h"
#define LOG_TAG "EnvirMod"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <string.h>

#include <string>

static void cacheKeyFor(SensorKind kind, char* out, size_t outLen)
{
    IRRI_SNPRINTF_CHECKED(LOG_TAG, out, outLen, "sensor:%s:latest", sensorKindStr(kind));
}

bool EnvironmentModule::svcLatest_(void* ctx, SensorKind kind, SensorReading* out)
{
    if (!out) return false;
    return static_cast<EnvironmentModule*>(ctx)->latest(kind, *out);
}

bool EnvironmentModule::svcSnapshot_(void* ctx, bool collectIfStale, EnvironmentSnapshot* out)
{
    if (!out) return false;
    return static_cast<EnvironmentModule*>(ctx)->snapshot(collectIfStale, *out);
}

uint8_t EnvironmentModule::svcCollect_(void* ctx)
{
    return static_cast<EnvironmentModule*>(ctx)->collect();
}

uint16_t EnvironmentModule::svcSoilSamples_(void* ctx, SoilSample* out, uint16_t max)
{
    return static_cast<EnvironmentModule*>(ctx)->soilSamples(out, max);
}

void EnvironmentModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(maxAgeVar);
    cfg.registerVar(collectVar);
    cfg.registerVar(soilFeedVar);
    cfg.registerVar(tempFeedVar);
    cfg.registerVar(humidityFeedVar);
    cfg.registerVar(lightFeedVar);

    gateway_ = services.get<GatewayService>("gateway");
    cache_ = services.get<CacheService>("cache");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) {
        eventBus_->subscribe(EventId::SensorReadingReceived, &EnvironmentModule::onEventStatic_, this);
    }

    svc_ = EnvironmentService{svcLatest_, svcSnapshot_, svcCollect_, svcSoilSamples_, this};
    services.add("environment", &svc_);
}

void EnvironmentModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (cfgData_.collectIntervalSec < 5) cfgData_.collectIntervalSec = IrrigationDefaults::SensorCollectIntervalSec;
    if (cfgData_.maxAgeSec <= 0) cfgData_.maxAgeSec = IrrigationDefaults::SensorMaxAgeSec;

    if (!gateway_) {
        LOGW("gateway service missing, readings come from the cache only");
        return;
    }
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        const char* key = feedKey((SensorKind)i);
        if (!gateway_->registerHandler(gateway_->ctx, key, &EnvironmentModule::onSensorPush_, this)) {
            LOGW("no pub/sub handler slot for feed=%s", key);
        }
    }
    LOGI("sampling every %lds, max age %lds", (long)cfgData_.collectIntervalSec, (long)cfgData_.maxAgeSec);
}

const char* EnvironmentModule::feedKey(SensorKind kind) const
{
    switch (kind) {
    case SensorKind::SoilMoisture: return cfgData_.soilFeed;
    case SensorKind::Temperature: return cfgData_.tempFeed;
    case SensorKind::Humidity: return cfgData_.humidityFeed;
    case SensorKind::Light: return cfgData_.lightFeed;
    default: return "";
    }
}

bool EnvironmentModule::kindForFeed_(const char* key, SensorKind& out) const
{
    if (!key) return false;
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        if (strcmp(key, feedKey((SensorKind)i)) == 0) {
            out = (SensorKind)i;
            return true;
        }
    }
    return false;
}

uint64_t EnvironmentModule::maxAgeMs_() const
{
    return (uint64_t)(cfgData_.maxAgeSec > 0 ? cfgData_.maxAgeSec : 0) * 1000ULL;
}

bool EnvironmentModule::isFresh_(const SensorReading& r, uint64_t nowMs) const
{
    if (!r.valid) return false;
    if (r.tsMs > nowMs) return true;
    return (nowMs - r.tsMs) <= maxAgeMs_();
}

void EnvironmentModule::store_(SensorKind kind, double value, uint64_t tsMs)
{
    SensorReading r;
    r.valid = true;
    r.kind = kind;
    r.value = value;
    r.tsMs = tsMs;
    r.status = evaluateStatus(value, defaultThresholds(kind));

    std::lock_guard<std::mutex> lk(mtx_);
    SensorReading& slot = readings_[(uint8_t)kind];
    // An older timestamp never replaces a newer reading.
    if (slot.valid && slot.tsMs > tsMs) return;
    const bool sameSample = slot.valid && slot.tsMs == tsMs;
    slot = r;
    if (kind == SensorKind::SoilMoisture && !sameSample) {
        soilRing_[soilHead_] = SoilSample{value, tsMs};
        soilHead_ = (uint16_t)((soilHead_ + 1) % Limits::Environment::SoilHistory);
        if (soilCount_ < Limits::Environment::SoilHistory) ++soilCount_;
    }
}

void EnvironmentModule::cacheReading_(const SensorReading& r)
{
    if (!cache_ || !r.valid) return;

    StaticJsonDocument<Limits::Environment::JsonReadingBuf> doc;
    doc["kind"] = sensorKindStr(r.kind);
    doc["value"] = r.value;
    doc["unit"] = sensorUnitStr(r.kind);
    doc["timestamp_ms"] = r.tsMs;
    char iso[32];
    if (Clock::formatIso8601(r.tsMs, iso, sizeof(iso))) doc["timestamp"] = iso;
    doc["status"] = readingStatusStr(r.status);

    std::string json;
    serializeJson(doc, json);
    char key[48];
    cacheKeyFor(r.kind, key, sizeof(key));
    if (!cache_->set(cache_->ctx, key, json.c_str(), IrrigationDefaults::SensorCacheTtlSec)) {
        LOGW("cache write failed key=%s", key);
    }
}

bool EnvironmentModule::loadCached_(SensorKind kind, SensorReading& out)
{
    if (!cache_) return false;
    char key[48];
    cacheKeyFor(kind, key, sizeof(key));
    std::string json;
    bool found = false;
    if (!cache_->get(cache_->ctx, key, &json, &found) || !found) return false;

    StaticJsonDocument<Limits::Environment::JsonReadingBuf> doc;
    if (deserializeJson(doc, json)) {
        LOGW("bad cached reading key=%s", key);
        return false;
    }
    if (!doc["value"].is<double>()) return false;

    out = SensorReading{};
    out.valid = true;
    out.kind = kind;
    out.value = doc["value"].as<double>();
    out.tsMs = doc["timestamp_ms"] | (uint64_t)0;
    out.status = evaluateStatus(out.value, defaultThresholds(kind));
    return true;
}

bool EnvironmentModule::latest(SensorKind kind, SensorReading& out)
{
    if ((uint8_t)kind >= SENSOR_KIND_COUNT) return false;
    const uint64_t now = Clock::nowEpochMs();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const SensorReading& r = readings_[(uint8_t)kind];
        if (isFresh_(r, now)) {
            out = r;
            return true;
        }
    }

    SensorReading cached;
    if (!loadCached_(kind, cached) || !isFresh_(cached, now)) return false;
    store_(kind, cached.value, cached.tsMs);
    out = cached;
    return true;
}

bool EnvironmentModule::collectOne_(SensorKind kind)
{
    if (!gateway_) return false;
    const char* key = feedKey(kind);
    FeedReading fr;
    if (!gateway_->getLatest(gateway_->ctx, key, &fr)) {
        LOGD("no data from feed=%s", key);
        return false;
    }
    if (!fr.isNumber) {
        LOGW("feed=%s non numeric value '%s'", key, fr.value);
        return false;
    }
    const uint64_t ts = fr.createdAtMs ? fr.createdAtMs : Clock::nowEpochMs();
    store_(kind, fr.number, ts);

    SensorReading r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        r = readings_[(uint8_t)kind];
    }
    cacheReading_(r);
    return isFresh_(r, Clock::nowEpochMs());
}

uint8_t EnvironmentModule::collect()
{
    uint8_t fresh = 0;
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        if (collectOne_((SensorKind)i)) ++fresh;
    }
    LOGD("collected %u/%u fresh readings", (unsigned)fresh, (unsigned)SENSOR_KIND_COUNT);
    return fresh;
}

bool EnvironmentModule::snapshot(bool collectIfStale, EnvironmentSnapshot& out)
{
    out = EnvironmentSnapshot{};
    out.tsMs = Clock::nowEpochMs();
    bool any = false;
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        const SensorKind kind = (SensorKind)i;
        SensorReading r;
        bool ok = latest(kind, r);
        if (!ok && collectIfStale && collectOne_(kind)) ok = latest(kind, r);
        if (ok) {
            out.readings[i] = r;
            any = true;
        } else {
            out.readings[i] = SensorReading{};
            out.readings[i].kind = kind;
        }
    }
    return any;
}

uint16_t EnvironmentModule::soilSamples(SoilSample* out, uint16_t max) const
{
    if (!out || max == 0) return 0;
    std::lock_guard<std::mutex> lk(mtx_);
    const uint16_t n = soilCount_ < max ? soilCount_ : max;
    // Oldest retained sample sits at head when the ring is full.
    const uint16_t cap = Limits::Environment::SoilHistory;
    const uint16_t start = (uint16_t)((soilHead_ + cap - n) % cap);
    for (uint16_t i = 0; i < n; ++i) {
        out[i] = soilRing_[(start + i) % cap];
    }
    return n;
}

void EnvironmentModule::onSensorPush_(void* user, const char* feedKey, const char* payload)
{
    EnvironmentModule* self = static_cast<EnvironmentModule*>(user);
    SensorKind kind;
    if (!self->kindForFeed_(feedKey, kind)) return;
    double value = 0.0;
    if (!parseFeedNumber(payload, value)) {
        LOGW("push feed=%s non numeric payload", feedKey);
        return;
    }
    const uint64_t now = Clock::nowEpochMs();
    self->store_(kind, value, now);
    if (self->eventBus_) {
        SensorReadingPayload p{(uint8_t)kind, value, now};
        (void)self->eventBus_->post(EventId::SensorReadingReceived, &p, sizeof(p));
    }
}

void EnvironmentModule::onEventStatic_(const Event& e, void* user)
{
    if (e.id != EventId::SensorReadingReceived || !e.payload || e.len < sizeof(SensorReadingPayload)) return;
    EnvironmentModule* self = static_cast<EnvironmentModule*>(user);
    SensorReadingPayload p;
    memcpy(&p, e.payload, sizeof(p));
    if (p.kind >= SENSOR_KIND_COUNT) return;

    SensorReading r;
    {
        std::lock_guard<std::mutex> lk(self->mtx_);
        r = self->readings_[p.kind];
    }
    if (r.valid && r.tsMs == p.tsMs) self->cacheReading_(r);
}

void EnvironmentModule::loop()
{
    if (!feedsInitialized_ && gateway_) {
        const char* keys[SENSOR_KIND_COUNT];
        for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) keys[i] = feedKey((SensorKind)i);
        const uint8_t ok = gateway_->initializeFeeds(gateway_->ctx, keys, SENSOR_KIND_COUNT);
        LOGI("sensor feeds provisioned %u/%u", (unsigned)ok, (unsigned)SENSOR_KIND_COUNT);
        feedsInitialized_ = true;
    }

    (void)collect();
    (void)waitOrStop((uint32_t)cfgData_.collectIntervalSec * 1000U);
}
