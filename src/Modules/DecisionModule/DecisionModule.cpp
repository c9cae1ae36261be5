/**
 * @file DecisionModule.cpp
 * @brief Implementation file.
 */
#include "DecisionModule.h"
#include "DecisionCodec.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Runtime.h"
#include "Modules/EnvironmentModule/EnvironmentAnalysis.h"
#define LOG_TAG "Decision"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <string.h>

#include <algorithm>
#include <vector>

namespace {
constexpr char kCacheLastKey[] = "decision:last";
constexpr char kCacheHistoryKey[] = "decision:history";
constexpr char kCacheAiKey[] = "decision:ai_recommendation";
constexpr char kStoreLastPath[] = "last_decision";
constexpr char kStoreHistoryPath[] = "decision_history";
constexpr char kStoreConfigPath[] = "config";

bool collectListItem(void* user, const char* value)
{
    static_cast<std::vector<std::string>*>(user)->push_back(value ? value : "");
    return true;
}

bool readInt(JsonVariantConst v, int32_t& out)
{
    if (v.is<int32_t>()) {
        out = v.as<int32_t>();
        return true;
    }
    return false;
}

bool readNumber(JsonVariantConst v, double& out)
{
    if (v.is<double>() || v.is<long>()) {
        out = v.as<double>();
        return true;
    }
    return false;
}
}  // namespace

DecisionOutcome DecisionModule::svcMakeDecision_(void* ctx)
{
    return static_cast<DecisionModule*>(ctx)->makeDecision();
}

bool DecisionModule::svcEnable_(void* ctx, bool enabled)
{
    return static_cast<DecisionModule*>(ctx)->enable(enabled);
}

bool DecisionModule::svcGetConfig_(void* ctx, DecisionConfig* out)
{
    if (!out) return false;
    *out = static_cast<DecisionModule*>(ctx)->config();
    return true;
}

bool DecisionModule::svcUpdateConfig_(void* ctx, const char* json)
{
    return static_cast<DecisionModule*>(ctx)->updateConfig(json);
}

bool DecisionModule::svcLastDecision_(void* ctx, Decision* out)
{
    if (!out) return false;
    return static_cast<DecisionModule*>(ctx)->lastDecision(*out);
}

uint16_t DecisionModule::svcHistory_(void* ctx, uint16_t limit, Decision* out, uint16_t max)
{
    return static_cast<DecisionModule*>(ctx)->history(limit, out, max);
}

bool DecisionModule::svcQueueRecommendation_(void* ctx, const AiRecommendation* rec)
{
    if (!rec) return false;
    return static_cast<DecisionModule*>(ctx)->queueRecommendation(*rec);
}

bool DecisionModule::svcStartLoop_(void* ctx)
{
    DecisionModule* self = static_cast<DecisionModule*>(ctx);
    if (!self->startTask()) {
        LOGW("decision loop already running");
        return false;
    }
    LOGI("decision loop started (every %lds)", (long)self->cfgData_.checkIntervalSec);
    return true;
}

bool DecisionModule::svcStopLoop_(void* ctx)
{
    DecisionModule* self = static_cast<DecisionModule*>(ctx);
    if (!self->stopTask()) {
        LOGW("decision loop not running");
        return false;
    }
    LOGI("decision loop stopped");
    return true;
}

bool DecisionModule::svcIsRunning_(void* ctx)
{
    return static_cast<DecisionModule*>(ctx)->isTaskRunning();
}

void DecisionModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    cfg.registerVar(enabledVar);
    cfg.registerVar(minIntervalVar);
    cfg.registerVar(checkIntervalVar);
    cfg.registerVar(lightVar);
    cfg.registerVar(normalVar);
    cfg.registerVar(heavyVar);
    cfg.registerVar(aiConfidenceVar);
    cfg.registerVar(soilMinVar);
    cfg.registerVar(soilMaxVar);
    cfg.registerVar(soilOptMinVar);
    cfg.registerVar(soilOptMaxVar);

    cache_ = services.get<CacheService>("cache");
    store_ = services.get<DurableStoreService>("store");
    pump_ = services.get<PumpService>("pump");
    env_ = services.get<EnvironmentService>("environment");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    svc_ = DecisionService{
        svcMakeDecision_, svcEnable_, svcGetConfig_, svcUpdateConfig_, svcLastDecision_,
        svcHistory_, svcQueueRecommendation_, svcStartLoop_, svcStopLoop_, svcIsRunning_, this
    };
    services.add("decision", &svc_);
}

void DecisionModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (cfgData_.minIntervalSec < IrrigationDefaults::DecisionMinIntervalFloorSec) {
        LOGW("min decision interval %lds below floor, using %lds",
             (long)cfgData_.minIntervalSec, (long)IrrigationDefaults::DecisionMinIntervalFloorSec);
        cfgData_.minIntervalSec = IrrigationDefaults::DecisionMinIntervalFloorSec;
    }
    if (cfgData_.checkIntervalSec < IrrigationDefaults::DecisionCheckIntervalMinSec) {
        LOGW("check interval %lds below minimum, using %lds",
             (long)cfgData_.checkIntervalSec, (long)IrrigationDefaults::DecisionCheckIntervalMinSec);
        cfgData_.checkIntervalSec = IrrigationDefaults::DecisionCheckIntervalMinSec;
    }
    if (cfgData_.lightSec <= 0) cfgData_.lightSec = IrrigationDefaults::DurationLightSec;
    if (cfgData_.normalSec <= 0) cfgData_.normalSec = IrrigationDefaults::DurationNormalSec;
    if (cfgData_.heavySec <= 0) cfgData_.heavySec = IrrigationDefaults::DurationHeavySec;
    if (cfgData_.aiMinConfidence < 0.0 || cfgData_.aiMinConfidence > 1.0) {
        cfgData_.aiMinConfidence = IrrigationDefaults::AiMinConfidence;
    }
    LOGI("auto irrigation %s, min interval %lds, tick %lds",
         cfgData_.enabled ? "enabled" : "disabled",
         (long)cfgData_.minIntervalSec, (long)cfgData_.checkIntervalSec);
}

uint32_t DecisionModule::durationFor_(WaterAmount amount) const
{
    switch (amount) {
    case WaterAmount::Heavy: return (uint32_t)cfgData_.heavySec;
    case WaterAmount::Moderate: return (uint32_t)cfgData_.normalSec;
    default: return (uint32_t)cfgData_.lightSec;
    }
}

bool DecisionModule::queueRecommendation(const AiRecommendation& rec)
{
    AiRecommendation r = rec;
    if (r.receivedMs == 0) r.receivedMs = Clock::nowEpochMs();

    std::string json;
    if (cache_ && encodeAiRecommendation(r, json) &&
        cache_->set(cache_->ctx, kCacheAiKey, json.c_str(), IrrigationDefaults::AiRecommendationTtlSec)) {
        std::lock_guard<std::mutex> lk(stateMtx_);
        hasPendingAi_ = false;
        LOGI("AI recommendation queued (irrigate=%d, %.1f min, confidence %.2f)",
             (int)r.shouldIrrigate, r.durationMinutes, r.confidence);
        return true;
    }

    std::lock_guard<std::mutex> lk(stateMtx_);
    pendingAi_ = r;
    hasPendingAi_ = true;
    LOGW("cache unavailable, AI recommendation held in memory");
    return true;
}

bool DecisionModule::consumeRecommendation_(AiRecommendation& out)
{
    std::string json;
    bool found = false;
    if (cache_ && cache_->get(cache_->ctx, kCacheAiKey, &json, &found) && found) {
        if (!cache_->del(cache_->ctx, kCacheAiKey)) LOGW("queued AI recommendation not cleared");
        if (decodeAiRecommendation(json.c_str(), out)) return true;
        LOGW("queued AI recommendation unreadable");
    }

    std::lock_guard<std::mutex> lk(stateMtx_);
    if (!hasPendingAi_) return false;
    hasPendingAi_ = false;
    const uint64_t now = Clock::nowEpochMs();
    if (now > pendingAi_.receivedMs &&
        now - pendingAi_.receivedMs > (uint64_t)IrrigationDefaults::AiRecommendationTtlSec * 1000ULL) {
        LOGD("held AI recommendation expired");
        return false;
    }
    out = pendingAi_;
    return true;
}

bool DecisionModule::readLast_(Decision& out)
{
    {
        std::lock_guard<std::mutex> lk(stateMtx_);
        if (hasLast_) {
            out = last_;
            return true;
        }
    }

    std::string json;
    bool found = false;
    if (cache_ && cache_->get(cache_->ctx, kCacheLastKey, &json, &found) && found &&
        decodeDecision(json.c_str(), out)) {
        return true;
    }

    found = false;
    if (store_ && store_->get(store_->ctx, kStoreLastPath, &json, &found) && found &&
        decodeDecision(json.c_str(), out)) {
        if (cache_) (void)cache_->set(cache_->ctx, kCacheLastKey, json.c_str(), IrrigationDefaults::DecisionLastTtlSec);
        return true;
    }
    return false;
}

bool DecisionModule::lastDecision(Decision& out)
{
    return readLast_(out);
}

void DecisionModule::record_(const Decision& d)
{
    {
        std::lock_guard<std::mutex> lk(stateMtx_);
        last_ = d;
        hasLast_ = true;
    }

    std::string json;
    if (!encodeDecision(d, json)) {
        LOGE("decision record exceeds json buffer");
        return;
    }
    if (cache_) {
        if (!cache_->set(cache_->ctx, kCacheLastKey, json.c_str(), IrrigationDefaults::DecisionLastTtlSec) ||
            !cache_->listPush(cache_->ctx, kCacheHistoryKey, json.c_str(), IrrigationDefaults::DecisionHistoryMax)) {
            LOGW("decision not cached");
        }
    }
    if (store_) {
        char key[32];
        if (!store_->set(store_->ctx, kStoreLastPath, json.c_str()) ||
            !store_->push(store_->ctx, kStoreHistoryPath, json.c_str(), key, sizeof(key))) {
            LOGW("decision not stored");
        }
    }

    if (eventBus_) {
        DecisionRecordedPayload p{};
        p.needsWater = d.needsWater;
        p.actionStarted = d.actionStarted && d.actionSuccess;
        p.aiApplied = d.aiApplied;
        (void)eventBus_->post(EventId::DecisionRecorded, &p, sizeof(p));
    }
}

DecisionOutcome DecisionModule::makeDecision()
{
    std::lock_guard<std::mutex> tick(decideMtx_);
    DecisionOutcome out;

    if (!cfgData_.enabled) {
        out.refusal = ErrorCode::AutoIrrigationDisabled;
        LOGD("auto irrigation disabled");
        return out;
    }
    if (!pump_ || !env_) {
        out.refusal = ErrorCode::ServiceUnavailable;
        LOGE("pump or environment service missing");
        return out;
    }

    PumpStatus ps;
    if (!pump_->getStatus(pump_->ctx, &ps)) {
        out.refusal = ErrorCode::ServiceUnavailable;
        LOGW("pump status unavailable");
        return out;
    }
    if (ps.isOn) {
        out.refusal = ErrorCode::PumpAlreadyRunning;
        LOGI("pump already running, no decision");
        return out;
    }

    const uint64_t now = Clock::nowEpochMs();
    Decision prev;
    if (readLast_(prev) && prev.tsMs <= now) {
        const uint64_t minMs = (uint64_t)cfgData_.minIntervalSec * 1000ULL;
        const uint64_t elapsed = now - prev.tsMs;
        if (elapsed < minMs) {
            out.refusal = ErrorCode::MinIntervalNotMet;
            out.waitRemainingSec = (double)(minMs - elapsed) / 1000.0;
            LOGD("min interval not met, %.0fs remaining", out.waitRemainingSec);
            return out;
        }
    }

    EnvironmentSnapshot snap;
    if (!env_->snapshot(env_->ctx, true, &snap) || !snap.has(SensorKind::SoilMoisture)) {
        out.refusal = ErrorCode::NoSoilMoistureData;
        LOGW("no soil moisture data");
        return out;
    }

    AnalysisThresholds th;
    th.soil.min = cfgData_.soilMin;
    th.soil.max = cfgData_.soilMax;
    th.soil.optMin = cfgData_.soilOptMin;
    th.soil.optMax = cfgData_.soilOptMax;
    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, th);

    Decision d;
    d.tsMs = now;
    d.needsWater = rec.needsWater;
    d.urgency = rec.urgency;
    snprintf(d.reason, sizeof(d.reason), "%s", rec.reason);
    d.amount = rec.amount;
    d.overall = rec.overall;
    d.hasSoil = rec.hasSoil;
    d.soilMoisture = rec.soilMoisture;
    d.soilStatus = rec.soilStatus;

    AiRecommendation ai;
    if (consumeRecommendation_(ai)) {
        if (ai.confidence >= cfgData_.aiMinConfidence) {
            d.aiApplied = true;
            d.needsWater = ai.shouldIrrigate;
            d.amount = waterAmountFromMinutes(ai.durationMinutes);
            // The rule-based reason is kept; the AI text is appended to it.
            if (rec.reason[0] != '\0' && ai.reason[0] != '\0') {
                snprintf(d.reason, sizeof(d.reason), "%s; %s (AI recommended)", rec.reason, ai.reason);
            } else {
                snprintf(d.reason, sizeof(d.reason), "%s%s (AI recommended)", rec.reason, ai.reason);
            }
            LOGI("AI recommendation applied (confidence %.2f)", ai.confidence);
        } else {
            LOGI("AI recommendation ignored, confidence %.2f below %.2f",
                 ai.confidence, cfgData_.aiMinConfidence);
        }
    }

    if (d.needsWater) {
        const uint32_t duration = durationFor_(d.amount);
        StaticJsonDocument<Limits::Irrigation::JsonItemBuf> details;
        char iso[32];
        if (Clock::formatIso8601(now, iso, sizeof(iso))) details["decision_timestamp"] = iso;
        details["urgency"] = urgencyStr(d.urgency);
        details["reason"] = d.reason;
        std::string detailsJson;
        serializeJson(details, detailsJson);

        const PumpResult r = pump_->turnOn(pump_->ctx, duration, IrrigationSource::Auto, detailsJson.c_str());
        d.actionStarted = true;
        d.actionDurationSec = duration;
        d.actionSuccess = r.success;
        snprintf(d.actionMessage, sizeof(d.actionMessage), "%s", r.message);
        if (r.success) {
            LOGI("irrigation started for %lus (%s, %s)", (unsigned long)duration,
                 waterAmountStr(d.amount), d.reason);
        } else {
            LOGW("irrigation start refused: %s", r.message);
        }
    } else {
        snprintf(d.actionMessage, sizeof(d.actionMessage), "%s", "No irrigation needed");
        LOGI("no irrigation needed (%s)", d.reason);
    }

    record_(d);
    out.made = true;
    out.decision = d;
    return out;
}

bool DecisionModule::enable(bool enabled)
{
    if (!cfgStore_) return false;
    if (!cfgStore_->set(enabledVar, enabled)) return false;
    if (store_) {
        StaticJsonDocument<64> doc;
        doc["auto_irrigation_enabled"] = enabled;
        std::string json;
        serializeJson(doc, json);
        if (!store_->update(store_->ctx, kStoreConfigPath, json.c_str())) LOGW("enabled flag not stored");
    }
    LOGI("auto irrigation %s", enabled ? "enabled" : "disabled");
    return true;
}

DecisionConfig DecisionModule::config() const
{
    DecisionConfig c;
    c.enabled = cfgData_.enabled;
    c.minDecisionIntervalSec = cfgData_.minIntervalSec;
    c.checkIntervalSec = cfgData_.checkIntervalSec;
    c.durationLightSec = cfgData_.lightSec;
    c.durationNormalSec = cfgData_.normalSec;
    c.durationHeavySec = cfgData_.heavySec;
    c.aiMinConfidence = cfgData_.aiMinConfidence;
    c.soilMin = cfgData_.soilMin;
    c.soilMax = cfgData_.soilMax;
    c.soilOptMin = cfgData_.soilOptMin;
    c.soilOptMax = cfgData_.soilOptMax;
    return c;
}

bool DecisionModule::updateConfig(const char* json)
{
    if (!cfgStore_) return false;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (!json || deserializeJson(doc, json) || !doc.is<JsonObject>()) {
        LOGW("config update is not a JSON object");
        return false;
    }
    JsonObjectConst src = doc.as<JsonObjectConst>();

    if (src["enabled"].is<bool>()) (void)cfgStore_->set(enabledVar, src["enabled"].as<bool>());

    int32_t n = 0;
    if (readInt(src["min_decision_interval"], n)) {
        if (n >= IrrigationDefaults::DecisionMinIntervalFloorSec) {
            (void)cfgStore_->set(minIntervalVar, n);
        } else {
            LOGW("min_decision_interval %ld below %lds ignored", (long)n, (long)IrrigationDefaults::DecisionMinIntervalFloorSec);
        }
    }
    if (readInt(src["check_interval"], n)) {
        if (n >= IrrigationDefaults::DecisionCheckIntervalMinSec) {
            (void)cfgStore_->set(checkIntervalVar, n);
        } else {
            LOGW("check_interval %ld below %lds ignored", (long)n, (long)IrrigationDefaults::DecisionCheckIntervalMinSec);
        }
    }

    double v = 0.0;
    if (readNumber(src["ai_min_confidence"], v) && v >= 0.0 && v <= 1.0) {
        (void)cfgStore_->set(aiConfidenceVar, v);
    }

    JsonObjectConst durations = src["watering_durations"].as<JsonObjectConst>();
    if (!durations.isNull()) {
        if (readInt(durations["light"], n) && n > 0) (void)cfgStore_->set(lightVar, n);
        if (readInt(durations["normal"], n) && n > 0) (void)cfgStore_->set(normalVar, n);
        if (readInt(durations["heavy"], n) && n > 0) (void)cfgStore_->set(heavyVar, n);
    }

    JsonObjectConst moisture = src["moisture_thresholds"].as<JsonObjectConst>();
    if (!moisture.isNull()) {
        if (readNumber(moisture["min"], v)) (void)cfgStore_->set(soilMinVar, v);
        if (readNumber(moisture["max"], v)) (void)cfgStore_->set(soilMaxVar, v);
        if (readNumber(moisture["optimal_min"], v)) (void)cfgStore_->set(soilOptMinVar, v);
        if (readNumber(moisture["optimal_max"], v)) (void)cfgStore_->set(soilOptMaxVar, v);
    }

    if (store_) {
        StaticJsonDocument<Limits::Irrigation::JsonItemBuf> out;
        out["auto_irrigation_enabled"] = cfgData_.enabled;
        out["min_decision_interval"] = cfgData_.minIntervalSec;
        out["check_interval"] = cfgData_.checkIntervalSec;
        out["ai_min_confidence"] = cfgData_.aiMinConfidence;
        JsonObject d = out.createNestedObject("watering_durations");
        d["light"] = cfgData_.lightSec;
        d["normal"] = cfgData_.normalSec;
        d["heavy"] = cfgData_.heavySec;
        JsonObject m = out.createNestedObject("moisture_thresholds");
        m["min"] = cfgData_.soilMin;
        m["max"] = cfgData_.soilMax;
        m["optimal_min"] = cfgData_.soilOptMin;
        m["optimal_max"] = cfgData_.soilOptMax;
        std::string text;
        serializeJson(out, text);
        if (!store_->set(store_->ctx, kStoreConfigPath, text.c_str())) LOGW("decision config not stored");
    }
    LOGI("decision config updated");
    return true;
}

uint16_t DecisionModule::history(uint16_t limit, Decision* out, uint16_t max)
{
    if (!out || max == 0 || limit == 0) return 0;
    if (limit > max) limit = max;
    if (limit > (uint16_t)IrrigationDefaults::DecisionHistoryMax) limit = (uint16_t)IrrigationDefaults::DecisionHistoryMax;

    std::vector<std::string> items;
    if (cache_) (void)cache_->listRead(cache_->ctx, kCacheHistoryKey, limit, &collectListItem, &items);

    if (!items.empty()) {
        uint16_t n = 0;
        for (const std::string& s : items) {
            if (n >= limit) break;
            if (decodeDecision(s.c_str(), out[n])) ++n;
        }
        return n;
    }

    std::string json;
    if (!store_ || !store_->getLast(store_->ctx, kStoreHistoryPath, limit, &json)) return 0;
    DynamicJsonDocument doc(json.size() * 2 + 1024);
    if (deserializeJson(doc, json) || !doc.is<JsonObject>()) {
        LOGW("stored decision history unreadable");
        return 0;
    }
    std::vector<Decision> all;
    for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
        std::string text;
        serializeJson(kv.value(), text);
        Decision d;
        if (decodeDecision(text.c_str(), d)) all.push_back(d);
    }
    std::sort(all.begin(), all.end(), [](const Decision& a, const Decision& b) { return a.tsMs > b.tsMs; });

    uint16_t n = 0;
    for (const Decision& d : all) {
        if (n >= limit) break;
        out[n++] = d;
    }
    return n;
}

void DecisionModule::loop()
{
    const DecisionOutcome o = makeDecision();
    if (!o.made && o.refusal != ErrorCode::AutoIrrigationDisabled) {
        LOGD("tick skipped: %s", errorCodeStr(o.refusal));
    }
    (void)waitOrStop((uint32_t)cfgData_.checkIntervalSec * 1000U);
}
