/**
 * @file OrchestratorModule.cpp
 * @brief Implementation file.
 */
#include "OrchestratorModule.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Runtime.h"
#include "Modules/DecisionModule/DecisionCodec.h"
#define LOG_TAG "Orchestr"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <ctype.h>
#include <stdint.h>
#include <string.h>
#include <strings.h>

#include <cmath>

namespace {

void setMsg(ComponentResult& c, const char* name, bool ok, const char* okMsg, const char* failMsg)
{
    c.name = name;
    c.success = ok;
    snprintf(c.message, sizeof(c.message), "%s", ok ? okMsg : failMsg);
}

/// Saturating minutes-to-seconds; the pump clamps the result to its max runtime.
uint32_t minutesToSeconds(double minutes)
{
    const double sec = minutes * 60.0;
    if (!(sec > 0.0)) return 0;
    if (sec >= (double)UINT32_MAX) return UINT32_MAX;
    return (uint32_t)std::lround(sec);
}

IngestResult reject(ErrorCode code, const char* msg)
{
    IngestResult r;
    r.code = code;
    snprintf(r.message, sizeof(r.message), "%s", msg);
    return r;
}

}  // namespace

void OrchestratorModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(aiEnabledVar);
    cfg.registerVar(allowedSourcesVar);

    pump_ = services.get<PumpService>("pump");
    scheduler_ = services.get<SchedulerService>("scheduler");
    decision_ = services.get<DecisionService>("decision");
    env_ = services.get<EnvironmentService>("environment");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    if (eventBus_) {
        eventBus_->subscribe(EventId::PumpStateChanged, &OrchestratorModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::IrrigationRecorded, &OrchestratorModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::DecisionRecorded, &OrchestratorModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ScheduleFired, &OrchestratorModule::onEventStatic_, this);
    }
}

void OrchestratorModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!pump_ || !scheduler_ || !decision_) LOGE("pump, scheduler or decision service missing");
    LOGI("AI recommendations %s, sources=%s",
         cfgData_.aiEnabled ? "enabled" : "disabled", cfgData_.allowedSources);
}

void OrchestratorModule::onEventStatic_(const Event& e, void* user)
{
    static_cast<OrchestratorModule*>(user)->onEvent_(e);
}

void OrchestratorModule::onEvent_(const Event& e)
{
    switch (e.id) {
    case EventId::PumpStateChanged: {
        if (!e.payload || e.len < sizeof(PumpStateChangedPayload)) return;
        PumpStateChangedPayload p;
        memcpy(&p, e.payload, sizeof(p));
        if (p.on) pumpStarts_.fetch_add(1);
        else pumpStops_.fetch_add(1);
        return;
    }
    case EventId::IrrigationRecorded: {
        if (!e.payload || e.len < sizeof(IrrigationRecordedPayload)) return;
        IrrigationRecordedPayload p;
        memcpy(&p, e.payload, sizeof(p));
        irrigations_.fetch_add(1);
        if (p.waterL > 0.0f) waterMl_.fetch_add((uint32_t)std::lround((double)p.waterL * 1000.0));
        return;
    }
    case EventId::DecisionRecorded: {
        if (!e.payload || e.len < sizeof(DecisionRecordedPayload)) return;
        DecisionRecordedPayload p;
        memcpy(&p, e.payload, sizeof(p));
        decisions_.fetch_add(1);
        if (p.actionStarted) autoIrrigations_.fetch_add(1);
        if (p.aiApplied) aiOverrides_.fetch_add(1);
        return;
    }
    case EventId::ScheduleFired:
        schedulesFired_.fetch_add(1);
        return;
    default:
        return;
    }
}

ActivityCounters OrchestratorModule::activity() const
{
    ActivityCounters c;
    c.pumpStarts = pumpStarts_.load();
    c.pumpStops = pumpStops_.load();
    c.irrigations = irrigations_.load();
    c.waterL = (double)waterMl_.load() / 1000.0;
    c.schedulesFired = schedulesFired_.load();
    c.decisions = decisions_.load();
    c.autoIrrigations = autoIrrigations_.load();
    c.aiOverrides = aiOverrides_.load();
    c.recommendationsReceived = recReceived_.load();
    c.recommendationsAccepted = recAccepted_.load();
    return c;
}

LifecycleResult OrchestratorModule::start()
{
    LifecycleResult res;
    const bool schedOk = scheduler_ && scheduler_->startLoop(scheduler_->ctx);
    setMsg(res.components[res.count++], "scheduler", schedOk,
           "Irrigation scheduler started", "Failed to start irrigation scheduler");

    const bool decOk = decision_ && decision_->startLoop(decision_->ctx);
    setMsg(res.components[res.count++], "auto_decision", decOk,
           "Auto decision maker started", "Failed to start auto decision maker");

    res.success = schedOk && decOk;
    if (res.success) LOGI("irrigation system started");
    else LOGW("irrigation system started with errors");
    return res;
}

LifecycleResult OrchestratorModule::stop()
{
    LifecycleResult res;
    const bool schedOk = scheduler_ && scheduler_->stopLoop(scheduler_->ctx);
    setMsg(res.components[res.count++], "scheduler", schedOk,
           "Irrigation scheduler stopped", "Failed to stop irrigation scheduler");

    const bool decOk = decision_ && decision_->stopLoop(decision_->ctx);
    setMsg(res.components[res.count++], "auto_decision", decOk,
           "Auto decision maker stopped", "Failed to stop auto decision maker");

    ComponentResult& pc = res.components[res.count++];
    bool pumpOk = false;
    PumpStatus ps;
    if (!pump_ || !pump_->getStatus(pump_->ctx, &ps)) {
        setMsg(pc, "pump", false, "", "Water pump status unavailable");
    } else if (ps.isOn) {
        const PumpResult r = pump_->turnOff(pump_->ctx, IrrigationSource::System, "{\"reason\":\"system_shutdown\"}");
        pumpOk = r.success;
        setMsg(pc, "pump", pumpOk, "Water pump stopped", "Failed to stop water pump");
        if (!pumpOk) LOGE("pump still ON at shutdown: %s", r.message);
    } else {
        pumpOk = true;
        setMsg(pc, "pump", true, "Water pump already OFF", "");
    }

    res.success = schedOk && decOk && pumpOk;
    LOGI("irrigation system stopped%s", res.success ? "" : " with errors");
    return res;
}

bool OrchestratorModule::sourceAllowed(const char* source) const
{
    if (!source) return false;
    const char* p = cfgData_.allowedSources;
    while (*p) {
        while (*p == ',' || isspace((unsigned char)*p)) ++p;
        const char* start = p;
        while (*p && *p != ',') ++p;
        const char* end = p;
        while (end > start && isspace((unsigned char)end[-1])) --end;
        const size_t len = (size_t)(end - start);
        if (len == 0) continue;
        if (len == 3 && strncmp(start, "all", 3) == 0) return true;
        if (strlen(source) == len && strncmp(start, source, len) == 0) return true;
    }
    return false;
}

IngestResult OrchestratorModule::ingestRecommendation(const char* source, const char* priority,
                                                      const AiRecommendation& rec, uint64_t timestampMs)
{
    recReceived_.fetch_add(1);
    const char* src = (source && source[0]) ? source : "unknown";
    const char* prio = (priority && priority[0]) ? priority : "normal";
    LOGI("recommendation from %s priority=%s irrigate=%d %.1f min confidence %.2f",
         src, prio, (int)rec.shouldIrrigate, rec.durationMinutes, rec.confidence);

    if (!cfgData_.aiEnabled) return reject(ErrorCode::RecommendationsDisabled, "AI recommendations are disabled");
    if (!sourceAllowed(src)) {
        IngestResult r = reject(ErrorCode::SourceNotAllowed, "");
        snprintf(r.message, sizeof(r.message), "Source '%s' is not allowed", src);
        return r;
    }
    const bool high = strcmp(prio, "high") == 0;
    if (!high && strcmp(prio, "normal") != 0 && strcmp(prio, "low") != 0) {
        IngestResult r = reject(ErrorCode::InvalidPriority, "");
        snprintf(r.message, sizeof(r.message), "Invalid priority '%s'. Valid priorities: high, normal, low", prio);
        return r;
    }

    IngestResult res;
    res.accepted = true;
    recAccepted_.fetch_add(1);

    if (!rec.shouldIrrigate || !(rec.durationMinutes > 0.0)) {
        res.success = true;
        snprintf(res.message, sizeof(res.message), "%s", "Recommendation received but no irrigation action needed");
        return res;
    }

    if (high) {
        if (rec.zones[0] != '\0') LOGW("zones '%s' not addressable, irrigating the whole area", rec.zones);
        res.action = RecommendationAction::ImmediateIrrigation;
        if (!pump_) {
            res.code = ErrorCode::ServiceUnavailable;
            snprintf(res.message, sizeof(res.message), "%s", "Applied high priority AI recommendation: pump unavailable");
            return res;
        }
        const uint32_t durationSec = minutesToSeconds(rec.durationMinutes);
        StaticJsonDocument<Limits::Irrigation::Details> details;
        details["source"] = src;
        details["priority"] = prio;
        details["confidence"] = rec.confidence;
        char detailsJson[Limits::Irrigation::Details];
        serializeJson(details, detailsJson, sizeof(detailsJson));
        res.pump = pump_->turnOn(pump_->ctx, durationSec, IrrigationSource::AiRecommendation, detailsJson);
        res.success = res.pump.success;
        res.code = res.pump.code;
        snprintf(res.message, sizeof(res.message), "Applied high priority AI recommendation: %s", res.pump.message);
        return res;
    }

    AiRecommendation queued = rec;
    queued.receivedMs = timestampMs ? timestampMs : Clock::nowEpochMs();
    res.action = RecommendationAction::Queued;
    res.success = decision_ && decision_->queueRecommendation(decision_->ctx, &queued);
    if (!res.success) res.code = ErrorCode::ServiceUnavailable;
    snprintf(res.message, sizeof(res.message), "%s",
             res.success ? "Recommendation queued for next decision cycle" : "Recommendation could not be queued");
    return res;
}

IngestResult OrchestratorModule::ingestRecommendationJson(const char* json)
{
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (!json || deserializeJson(doc, json) || !doc.is<JsonObject>()) {
        return reject(ErrorCode::BadJson, "Recommendation must be a JSON object");
    }

    AiRecommendation rec;
    JsonObjectConst body = doc["recommendation"].as<JsonObjectConst>();
    if (!body.isNull()) {
        std::string text;
        serializeJson(body, text);
        if (!decodeAiRecommendation(text.c_str(), rec)) {
            return reject(ErrorCode::BadJson, "Recommendation body unreadable");
        }
    }

    uint64_t ts = 0;
    JsonVariantConst t = doc["timestamp"];
    if (t.is<uint64_t>()) {
        ts = t.as<uint64_t>();
    } else if (t.is<const char*>() && !Clock::parseIso8601(t.as<const char*>(), ts)) {
        ts = 0;
    }
    const std::string source = doc["source"] | "unknown";
    const std::string priority = doc["priority"] | "normal";
    return ingestRecommendation(source.c_str(), priority.c_str(), rec, ts);
}

PumpResult OrchestratorModule::manualControl(const char* action, uint32_t durationSec)
{
    if (pump_ && action && strcasecmp(action, "on") == 0) {
        return pump_->turnOn(pump_->ctx, durationSec, IrrigationSource::Manual, nullptr);
    }
    if (pump_ && action && strcasecmp(action, "off") == 0) {
        return pump_->turnOff(pump_->ctx, IrrigationSource::Manual, nullptr);
    }
    PumpResult r;
    r.code = pump_ ? ErrorCode::InvalidAction : ErrorCode::ServiceUnavailable;
    if (pump_) {
        snprintf(r.message, sizeof(r.message), "Invalid action: %s. Valid actions: 'on' or 'off'", action ? action : "");
    } else {
        snprintf(r.message, sizeof(r.message), "%s", "Water pump unavailable");
    }
    return r;
}

DecisionOutcome OrchestratorModule::triggerManualDecision()
{
    if (!decision_) {
        DecisionOutcome o;
        o.refusal = ErrorCode::ServiceUnavailable;
        return o;
    }
    LOGI("manual decision requested");
    return decision_->makeDecision(decision_->ctx);
}

void OrchestratorModule::systemStatus(SystemStatus& out)
{
    out = SystemStatus{};
    out.tsMs = Clock::nowEpochMs();
    if (pump_) out.hasPump = pump_->getStatus(pump_->ctx, &out.pump);
    if (scheduler_) {
        out.schedulerActive = scheduler_->isRunning(scheduler_->ctx);
        out.scheduleCount = scheduler_->list(scheduler_->ctx, out.schedules, Limits::Irrigation::MaxSchedules);
    }
    if (decision_) {
        out.decisionActive = decision_->isRunning(decision_->ctx);
        (void)decision_->getConfig(decision_->ctx, &out.decisionConfig);
        out.autoEnabled = out.decisionConfig.enabled;
        out.hasLastDecision = decision_->lastDecision(decision_->ctx, &out.lastDecision);
    }
    if (env_) {
        std::vector<SoilSample> samples(Limits::Environment::SoilHistory);
        const uint16_t n = env_->soilSamples(env_->ctx, samples.data(), (uint16_t)samples.size());
        SensorThresholds th = defaultThresholds(SensorKind::SoilMoisture);
        if (decision_) {
            th.min = out.decisionConfig.soilMin;
            th.max = out.decisionConfig.soilMax;
            th.optMin = out.decisionConfig.soilOptMin;
            th.optMax = out.decisionConfig.soilOptMax;
        }
        out.soilTrend = analyzeSoilTrend(samples.data(), n, th, out.tsMs);
    }
    out.activity = activity();
}

void OrchestratorModule::irrigationHistory(IrrigationHistory& out, uint16_t limit)
{
    out = IrrigationHistory{};
    out.tsMs = Clock::nowEpochMs();
    if (limit == 0) return;
    if (pump_) {
        out.events.resize(limit);
        out.events.resize(pump_->history(pump_->ctx, limit, out.events.data(), limit));
        out.hasStatistics = pump_->statistics(pump_->ctx, &out.statistics);
    }
    if (decision_) {
        out.decisions.resize(limit);
        out.decisions.resize(decision_->history(decision_->ctx, limit, out.decisions.data(), limit));
    }
}
