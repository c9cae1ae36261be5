/**
 * @file PumpModule.cpp
 * @brief Implementation file.
 */
#include "PumpModule.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Runtime.h"
#include "Modules/Network/GatewayModule/FeedCodec.h"
#define LOG_TAG "PumpCtrl"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <string.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace {
constexpr char kCacheStateKey[] = "pump:state";
constexpr char kCacheHistoryKey[] = "pump:history";
constexpr char kStoreStatePath[] = "pump/state";
constexpr char kStoreEventsPath[] = "irrigation_events";
constexpr uint64_t kDayMs = 24ULL * 3600ULL * 1000ULL;
constexpr uint32_t kMinTickMs = 100;

bool collectListItem(void* user, const char* value)
{
    static_cast<std::vector<std::string>*>(user)->push_back(value ? value : "");
    return true;
}

void setMessage(PumpResult& r, const char* msg)
{
    snprintf(r.message, sizeof(r.message), "%s", msg ? msg : "");
}

PumpResult refusal(ErrorCode code, const char* msg)
{
    PumpResult r;
    r.success = false;
    r.code = code;
    setMessage(r, msg);
    return r;
}
}  // namespace

PumpResult PumpModule::svcTurnOn_(void* ctx, uint32_t durationSec, IrrigationSource source, const char* detailsJson)
{
    return static_cast<PumpModule*>(ctx)->turnOn(durationSec, source, detailsJson);
}

PumpResult PumpModule::svcTurnOff_(void* ctx, IrrigationSource source, const char* detailsJson)
{
    return static_cast<PumpModule*>(ctx)->turnOff(source, detailsJson);
}

bool PumpModule::svcGetStatus_(void* ctx, PumpStatus* out)
{
    if (!out) return false;
    return static_cast<PumpModule*>(ctx)->getStatus(*out);
}

PumpCheckResult PumpModule::svcCheckScheduledActions_(void* ctx)
{
    return static_cast<PumpModule*>(ctx)->checkScheduledActions();
}

uint16_t PumpModule::svcHistory_(void* ctx, uint16_t limit, IrrigationEvent* out, uint16_t max)
{
    return static_cast<PumpModule*>(ctx)->history(limit, out, max);
}

bool PumpModule::svcStatistics_(void* ctx, PumpStatistics* out)
{
    if (!out) return false;
    return static_cast<PumpModule*>(ctx)->statistics(*out);
}

void PumpModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(feedVar);
    cfg.registerVar(maxRuntimeVar);
    cfg.registerVar(minIntervalVar);
    cfg.registerVar(flowRateVar);
    cfg.registerVar(defaultDurationVar);
    cfg.registerVar(historyMaxVar);
    cfg.registerVar(statusIntervalVar);

    gateway_ = services.get<GatewayService>("gateway");
    cache_ = services.get<CacheService>("cache");
    store_ = services.get<DurableStoreService>("store");
    env_ = services.get<EnvironmentService>("environment");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) {
        eventBus_->subscribe(EventId::ActuatorFeedChanged, &PumpModule::onEventStatic_, this);
    }

    svc_ = PumpService{
        svcTurnOn_, svcTurnOff_, svcGetStatus_, svcCheckScheduledActions_,
        svcHistory_, svcStatistics_, this
    };
    services.add("pump", &svc_);
}

void PumpModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (cfgData_.maxRuntimeSec <= 0) cfgData_.maxRuntimeSec = IrrigationDefaults::MaxRuntimeSec;
    if (cfgData_.minIntervalSec < 0) cfgData_.minIntervalSec = 0;
    if (cfgData_.flowRateLps < 0.0) cfgData_.flowRateLps = IrrigationDefaults::FlowRateLitresPerSec;
    if (cfgData_.defaultDurationSec <= 0) cfgData_.defaultDurationSec = IrrigationDefaults::DefaultDurationSec;
    if (cfgData_.historyMax <= 0) cfgData_.historyMax = IrrigationDefaults::HistoryMax;
    if (cfgData_.statusIntervalSec <= 0) cfgData_.statusIntervalSec = IrrigationDefaults::PumpStatusIntervalSec;

    if (cfgData_.feedKey[0] == '\0') {
        LOGE("no feed key configured for the pump");
    } else if (gateway_) {
        if (!gateway_->registerHandler(gateway_->ctx, cfgData_.feedKey, &PumpModule::onFeedPush_, this)) {
            LOGW("no pub/sub handler slot for feed=%s", cfgData_.feedKey);
        }
    }

    loadState_();
    LOGI("feed=%s max_runtime=%lds min_interval=%lds flow=%.2fL/s",
         cfgData_.feedKey, (long)cfgData_.maxRuntimeSec, (long)cfgData_.minIntervalSec, cfgData_.flowRateLps);
}

void PumpModule::loadState_()
{
    std::string json;
    bool found = false;
    ActuatorState loaded;

    if (cache_ && cache_->get(cache_->ctx, kCacheStateKey, &json, &found) && found) {
        if (decodePumpState(json.c_str(), loaded)) {
            std::lock_guard<std::mutex> lk(devMtx_);
            st_ = loaded;
            LOGI("state loaded from cache (on=%d)", (int)loaded.isOn);
            return;
        }
        LOGW("cached pump state unreadable");
    }

    found = false;
    if (store_ && store_->get(store_->ctx, kStoreStatePath, &json, &found) && found) {
        if (decodePumpState(json.c_str(), loaded)) {
            {
                std::lock_guard<std::mutex> lk(devMtx_);
                st_ = loaded;
            }
            if (cache_) (void)cache_->set(cache_->ctx, kCacheStateKey, json.c_str(), 0);
            LOGI("state loaded from store (on=%d)", (int)loaded.isOn);
            return;
        }
        LOGW("stored pump state unreadable");
    }
    LOGI("no saved pump state, starting OFF");
}

void PumpModule::persistState_()
{
    std::string json;
    if (!encodePumpState(st_, json)) {
        LOGE("pump state encode failed");
        return;
    }
    if (!cache_ || !cache_->set(cache_->ctx, kCacheStateKey, json.c_str(), 0)) {
        LOGW("pump state not cached");
    }
    if (!store_ || !store_->set(store_->ctx, kStoreStatePath, json.c_str())) {
        LOGW("pump state not stored");
    }
}

bool PumpModule::readSoil_(double& out) const
{
    if (!env_) return false;
    SensorReading r;
    if (!env_->latest(env_->ctx, SensorKind::SoilMoisture, &r) || !r.valid) return false;
    out = r.value;
    return true;
}

void PumpModule::postStateChanged_(bool on, IrrigationSource source, uint32_t durationSec)
{
    if (!eventBus_) return;
    PumpStateChangedPayload p{(uint8_t)(on ? 1 : 0), (uint8_t)source, durationSec};
    (void)eventBus_->post(EventId::PumpStateChanged, &p, sizeof(p));
}

FeedSwitchState PumpModule::reconcileLocked_()
{
    if (!gateway_ || cfgData_.feedKey[0] == '\0') return FeedSwitchState::Unknown;
    const FeedSwitchState remote = gateway_->switchState(gateway_->ctx, cfgData_.feedKey);
    if (remote == FeedSwitchState::Unknown) return remote;

    const bool remoteOn = remote == FeedSwitchState::On;
    if (remoteOn == st_.isOn) return remote;

    const uint64_t now = Clock::nowEpochMs();
    if (!remoteOn) {
        LOGW("sync: gateway reports OFF while local ON, closing the run");
        (void)applyStopLocked_(IrrigationSource::Sync, "{\"reason\":\"sync_detected_off\"}", now);
    } else {
        LOGW("sync: gateway reports ON while local OFF, adopting with max runtime");
        st_.isOn = true;
        st_.startMs = now;
        st_.scheduledStopMs = now + (uint64_t)cfgData_.maxRuntimeSec * 1000ULL;
        st_.lastOnMs = now;
        double soil = 0.0;
        st_.hasMoistureBefore = readSoil_(soil);
        st_.moistureBefore = soil;
        persistState_();
        postStateChanged_(true, IrrigationSource::Sync, (uint32_t)cfgData_.maxRuntimeSec);
        wakeTask();
    }
    return remote;
}

PumpResult PumpModule::turnOn(uint32_t durationSec, IrrigationSource source, const char* detailsJson)
{
    if (cfgData_.feedKey[0] == '\0') return refusal(ErrorCode::NoFeedKey, "No feed key configured for water pump");

    std::lock_guard<std::mutex> lk(devMtx_);
    (void)reconcileLocked_();

    if (st_.isOn) return refusal(ErrorCode::AlreadyRunning, "Cannot start pump: already_running");

    const uint64_t now = Clock::nowEpochMs();
    if (st_.lastOffMs != 0 && cfgData_.minIntervalSec > 0) {
        const double sinceOff = (now > st_.lastOffMs) ? (double)(now - st_.lastOffMs) / 1000.0 : 0.0;
        if (sinceOff < (double)cfgData_.minIntervalSec) {
            PumpResult r = refusal(ErrorCode::MinIntervalNotMet, "Cannot start pump: min_interval_not_met");
            const double remaining = (double)cfgData_.minIntervalSec - sinceOff;
            r.waitRemainingSec = remaining > 0.0 ? remaining : 0.0;
            return r;
        }
    }

    uint32_t duration = durationSec == 0 ? (uint32_t)cfgData_.defaultDurationSec : durationSec;
    if (duration > (uint32_t)cfgData_.maxRuntimeSec) {
        LOGW("requested %lus exceeds max runtime, using %lds", (unsigned long)duration, (long)cfgData_.maxRuntimeSec);
        duration = (uint32_t)cfgData_.maxRuntimeSec;
    }

    if (!gateway_ || !gateway_->setSwitch(gateway_->ctx, cfgData_.feedKey, true)) {
        LOGE("ON command failed feed=%s", cfgData_.feedKey);
        return refusal(ErrorCode::CommandFailed, "Failed to turn ON water pump through gateway");
    }

    st_.isOn = true;
    st_.startMs = now;
    st_.scheduledStopMs = now + (uint64_t)duration * 1000ULL;
    st_.lastOnMs = now;
    double soil = 0.0;
    st_.hasMoistureBefore = readSoil_(soil);
    st_.moistureBefore = soil;
    persistState_();
    postStateChanged_(true, source, duration);
    wakeTask();

    LOGI("pump ON for %lus source=%s details=%s", (unsigned long)duration, irrigationSourceStr(source),
         (detailsJson && detailsJson[0]) ? detailsJson : "{}");
    PumpResult r;
    r.success = true;
    r.startMs = now;
    r.scheduledStopMs = st_.scheduledStopMs;
    r.durationSec = duration;
    snprintf(r.message, sizeof(r.message), "Water pump turned ON for %lu seconds", (unsigned long)duration);
    return r;
}

PumpResult PumpModule::turnOff(IrrigationSource source, const char* detailsJson)
{
    if (cfgData_.feedKey[0] == '\0') return refusal(ErrorCode::NoFeedKey, "No feed key configured for water pump");
    std::lock_guard<std::mutex> lk(devMtx_);
    (void)reconcileLocked_();
    return turnOffLocked_(source, detailsJson);
}

PumpResult PumpModule::turnOffLocked_(IrrigationSource source, const char* detailsJson)
{
    if (!st_.isOn) return refusal(ErrorCode::AlreadyOff, "Water pump is already OFF");

    if (!gateway_ || !gateway_->setSwitch(gateway_->ctx, cfgData_.feedKey, false)) {
        LOGE("OFF command failed feed=%s, pump stays ON", cfgData_.feedKey);
        return refusal(ErrorCode::CommandFailed, "Failed to turn OFF water pump through gateway");
    }
    return applyStopLocked_(source, detailsJson, Clock::nowEpochMs());
}

PumpResult PumpModule::applyStopLocked_(IrrigationSource source, const char* detailsJson, uint64_t nowMs)
{
    const uint64_t startMs = st_.startMs;
    const double runSec = (startMs != 0 && nowMs > startMs) ? (double)(nowMs - startMs) / 1000.0 : 0.0;
    const double waterL = runSec * cfgData_.flowRateLps;

    IrrigationEvent ev;
    ev.startMs = startMs ? startMs : nowMs;
    ev.durationSec = runSec;
    ev.waterL = waterL;
    ev.source = source;
    ev.hasMoistureBefore = st_.hasMoistureBefore;
    ev.moistureBefore = st_.moistureBefore;
    double soil = 0.0;
    ev.hasMoistureAfter = readSoil_(soil);
    ev.moistureAfter = soil;
    snprintf(ev.details, sizeof(ev.details), "%s", (detailsJson && detailsJson[0]) ? detailsJson : "{}");

    st_.totalRuntimeSec += runSec;
    st_.totalWaterL += waterL;
    st_.isOn = false;
    st_.startMs = 0;
    st_.scheduledStopMs = 0;
    st_.lastOffMs = nowMs;
    st_.hasMoistureBefore = false;
    st_.moistureBefore = 0.0;

    recordEvent_(ev);
    persistState_();
    postStateChanged_(false, source, (uint32_t)runSec);

    LOGI("pump OFF after %.1fs, %.2fL source=%s", runSec, waterL, irrigationSourceStr(source));
    PumpResult r;
    r.success = true;
    r.startMs = startMs;
    r.runSec = runSec;
    r.waterL = waterL;
    setMessage(r, "Water pump turned OFF");
    return r;
}

void PumpModule::recordEvent_(const IrrigationEvent& ev)
{
    std::string json;
    if (!encodeIrrigationEvent(ev, json)) {
        LOGE("irrigation event encode failed");
        return;
    }
    if (!cache_ || !cache_->listPush(cache_->ctx, kCacheHistoryKey, json.c_str(), (uint32_t)cfgData_.historyMax)) {
        LOGW("irrigation event not cached");
    }
    char key[48] = {0};
    if (!store_ || !store_->push(store_->ctx, kStoreEventsPath, json.c_str(), key, sizeof(key))) {
        LOGW("irrigation event not stored");
    }
    if (eventBus_) {
        IrrigationRecordedPayload p{(uint8_t)ev.source, (float)ev.durationSec, (float)ev.waterL};
        (void)eventBus_->post(EventId::IrrigationRecorded, &p, sizeof(p));
    }
}

bool PumpModule::getStatus(PumpStatus& out)
{
    std::lock_guard<std::mutex> lk(devMtx_);
    const FeedSwitchState remote = reconcileLocked_();
    const uint64_t now = Clock::nowEpochMs();

    out = PumpStatus{};
    out.isOn = st_.isOn;
    out.startMs = st_.startMs;
    out.scheduledStopMs = st_.scheduledStopMs;
    out.lastOnMs = st_.lastOnMs;
    out.lastOffMs = st_.lastOffMs;
    out.totalRuntimeSec = st_.totalRuntimeSec;
    out.totalWaterL = st_.totalWaterL;
    if (st_.isOn && st_.startMs != 0) {
        out.currentRuntimeSec = now > st_.startMs ? (double)(now - st_.startMs) / 1000.0 : 0.0;
        out.currentWaterL = out.currentRuntimeSec * cfgData_.flowRateLps;
        if (st_.scheduledStopMs != 0) {
            out.hasRemaining = true;
            out.remainingSec = st_.scheduledStopMs > now ? (double)(st_.scheduledStopMs - now) / 1000.0 : 0.0;
        }
    }
    out.gatewayState = remote;
    out.stateSynced = remote != FeedSwitchState::Unknown && ((remote == FeedSwitchState::On) == st_.isOn);
    return true;
}

PumpCheckResult PumpModule::checkScheduledActions()
{
    PumpCheckResult res;
    std::lock_guard<std::mutex> lk(devMtx_);
    (void)reconcileLocked_();
    res.wasOn = st_.isOn;

    const uint64_t now = Clock::nowEpochMs();
    if (st_.isOn && st_.scheduledStopMs != 0 && now >= st_.scheduledStopMs) {
        res.stop = turnOffLocked_(IrrigationSource::Schedule, "{\"reason\":\"scheduled_stop\"}");
        res.actionsTaken = 1;
        if (!res.stop.success) LOGW("scheduled stop failed (%s), retrying next tick", res.stop.message);
    }
    res.isOn = st_.isOn;
    return res;
}

uint16_t PumpModule::history(uint16_t limit, IrrigationEvent* out, uint16_t max)
{
    if (!out || max == 0 || limit == 0) return 0;
    if (limit > max) limit = max;
    if (limit > Limits::Irrigation::MaxHistoryRead) limit = Limits::Irrigation::MaxHistoryRead;

    std::vector<std::string> items;
    if (cache_) (void)cache_->listRead(cache_->ctx, kCacheHistoryKey, limit, &collectListItem, &items);

    if (items.empty() && store_) {
        std::string json;
        if (store_->getLast(store_->ctx, kStoreEventsPath, limit, &json)) {
            DynamicJsonDocument doc(json.size() * 2 + 1024);
            if (!deserializeJson(doc, json) && doc.is<JsonObject>()) {
                std::vector<std::pair<std::string, std::string>> byKey;
                for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
                    std::string text;
                    serializeJson(kv.value(), text);
                    byKey.emplace_back(kv.key().c_str(), text);
                }
                // Push keys are time ordered; newest first.
                std::sort(byKey.begin(), byKey.end(),
                          [](const std::pair<std::string, std::string>& a,
                             const std::pair<std::string, std::string>& b) { return a.first > b.first; });
                for (const auto& kv : byKey) items.push_back(kv.second);
            } else {
                LOGW("stored irrigation history unreadable");
            }
        }
    }

    uint16_t n = 0;
    for (const std::string& s : items) {
        if (n >= limit) break;
        if (decodeIrrigationEvent(s.c_str(), out[n])) ++n;
    }
    return n;
}

bool PumpModule::statistics(PumpStatistics& out)
{
    out = PumpStatistics{};
    {
        std::lock_guard<std::mutex> lk(devMtx_);
        out.totalRuntimeSec = st_.totalRuntimeSec;
        out.totalWaterL = st_.totalWaterL;
        out.isOn = st_.isOn;
    }
    out.totalRuntimeHours = out.totalRuntimeSec / 3600.0;

    const uint16_t want = (uint16_t)std::min<int32_t>(cfgData_.historyMax, Limits::Irrigation::MaxHistoryRead);
    std::vector<IrrigationEvent> events(want);
    const uint16_t n = history(want, events.data(), want);
    if (n == 0) return true;

    const uint64_t now = Clock::nowEpochMs();
    const uint64_t dayAgo = now > kDayMs ? now - kDayMs : 0;
    double sumDur = 0.0;
    double sumWater = 0.0;
    for (uint16_t i = 0; i < n; ++i) {
        const IrrigationEvent& ev = events[i];
        sumDur += ev.durationSec;
        sumWater += ev.waterL;
        if (ev.startMs >= dayAgo) {
            ++out.events24h;
            out.runtime24hSec += ev.durationSec;
            out.water24hL += ev.waterL;
        }
    }
    out.avgDurationSec = sumDur / (double)n;
    out.avgWaterL = sumWater / (double)n;
    return true;
}

ActuatorState PumpModule::state() const
{
    std::lock_guard<std::mutex> lk(devMtx_);
    return st_;
}

void PumpModule::onFeedPush_(void* user, const char*, const char* payload)
{
    PumpModule* self = static_cast<PumpModule*>(user);
    if (!self->eventBus_) {
        self->wakeTask();
        return;
    }
    ActuatorFeedPayload p{(int8_t)parseSwitchValue(payload)};
    (void)self->eventBus_->post(EventId::ActuatorFeedChanged, &p, sizeof(p));
}

void PumpModule::onEventStatic_(const Event& e, void* user)
{
    if (e.id != EventId::ActuatorFeedChanged) return;
    PumpModule* self = static_cast<PumpModule*>(user);
    LOGD("pump feed update, reconciling early");
    self->wakeTask();
}

void PumpModule::loop()
{
    (void)checkScheduledActions();

    uint32_t waitMs = (uint32_t)cfgData_.statusIntervalSec * 1000U;
    {
        std::lock_guard<std::mutex> lk(devMtx_);
        if (st_.isOn && st_.scheduledStopMs != 0) {
            const uint64_t now = Clock::nowEpochMs();
            const uint64_t untilStop = st_.scheduledStopMs > now ? st_.scheduledStopMs - now : 0;
            if (untilStop < waitMs) waitMs = (uint32_t)untilStop;
        }
    }
    if (waitMs < kMinTickMs) waitMs = kMinTickMs;
    (void)waitOrStop(waitMs);
}
