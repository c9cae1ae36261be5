/**
 * @file IrrigationSchedulerModule.cpp
 * @brief Implementation file.
 */
#include "IrrigationSchedulerModule.h"
#include "ScheduleCodec.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Runtime.h"
#define LOG_TAG "Schedulr"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>
#include <string.h>

#include <vector>

namespace {
constexpr char kCacheKey[] = "schedule:schedules";
constexpr char kStorePath[] = "schedules";

void setMsg(ScheduleMutationResult& r, const char* text)
{
    snprintf(r.message, sizeof(r.message), "%s", text);
}
}  // namespace

ScheduleMutationResult IrrigationSchedulerModule::svcAdd_(void* ctx, const char* json)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->add(json);
}

ScheduleMutationResult IrrigationSchedulerModule::svcUpdate_(void* ctx, const char* id, const char* json)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->update(id, json);
}

bool IrrigationSchedulerModule::svcRemove_(void* ctx, const char* id)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->remove(id);
}

bool IrrigationSchedulerModule::svcGet_(void* ctx, const char* id, ScheduleEntry* out)
{
    if (!out) return false;
    return static_cast<IrrigationSchedulerModule*>(ctx)->get(id, *out);
}

uint8_t IrrigationSchedulerModule::svcList_(void* ctx, ScheduleEntry* out, uint8_t max)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->list(out, max);
}

ScheduleCheckResult IrrigationSchedulerModule::svcCheck_(void* ctx)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->check();
}

bool IrrigationSchedulerModule::svcStartLoop_(void* ctx)
{
    IrrigationSchedulerModule* self = static_cast<IrrigationSchedulerModule*>(ctx);
    if (!self->startTask()) {
        LOGW("schedule loop already running");
        return false;
    }
    LOGI("schedule loop started (every %lds)", (long)self->cfgData_.checkIntervalSec);
    return true;
}

bool IrrigationSchedulerModule::svcStopLoop_(void* ctx)
{
    IrrigationSchedulerModule* self = static_cast<IrrigationSchedulerModule*>(ctx);
    if (!self->stopTask()) {
        LOGW("schedule loop not running");
        return false;
    }
    LOGI("schedule loop stopped");
    return true;
}

bool IrrigationSchedulerModule::svcIsRunning_(void* ctx)
{
    return static_cast<IrrigationSchedulerModule*>(ctx)->isTaskRunning();
}

void IrrigationSchedulerModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(checkIntervalVar);

    cache_ = services.get<CacheService>("cache");
    store_ = services.get<DurableStoreService>("store");
    pump_ = services.get<PumpService>("pump");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    svc_ = SchedulerService{
        svcAdd_, svcUpdate_, svcRemove_, svcGet_, svcList_, svcCheck_,
        svcStartLoop_, svcStopLoop_, svcIsRunning_, this
    };
    services.add("scheduler", &svc_);
}

void IrrigationSchedulerModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (cfgData_.checkIntervalSec < IrrigationDefaults::ScheduleCheckIntervalMinSec) {
        LOGW("check interval %lds below minimum, using %lds",
             (long)cfgData_.checkIntervalSec, (long)IrrigationDefaults::ScheduleCheckIntervalMinSec);
        cfgData_.checkIntervalSec = IrrigationDefaults::ScheduleCheckIntervalMinSec;
    }
    load_();
}

void IrrigationSchedulerModule::load_()
{
    std::string json;
    bool found = false;

    if (cache_ && cache_->get(cache_->ctx, kCacheKey, &json, &found) && found) {
        DynamicJsonDocument doc(Limits::Irrigation::JsonCollectionBuf);
        if (!deserializeJson(doc, json) && doc.is<JsonArray>()) {
            std::lock_guard<std::mutex> lk(mtx_);
            count_ = 0;
            for (JsonObjectConst item : doc.as<JsonArrayConst>()) {
                if (count_ >= Limits::Irrigation::MaxSchedules) break;
                if (scheduleFromJson(item, nullptr, entries_[count_])) ++count_;
            }
            LOGI("loaded %u schedules from cache", (unsigned)count_);
            return;
        }
        LOGW("cached schedules unreadable");
    }

    found = false;
    if (store_ && store_->get(store_->ctx, kStorePath, &json, &found) && found) {
        DynamicJsonDocument doc(Limits::Irrigation::JsonCollectionBuf);
        if (deserializeJson(doc, json) || !doc.is<JsonObject>()) {
            LOGE("invalid stored schedules format");
            return;
        }
        std::lock_guard<std::mutex> lk(mtx_);
        count_ = 0;
        for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
            if (count_ >= Limits::Irrigation::MaxSchedules) break;
            if (scheduleFromJson(kv.value().as<JsonObjectConst>(), kv.key().c_str(), entries_[count_])) ++count_;
        }
        std::string cacheJson;
        std::string storeJson;
        if (cache_ && encodeCollectionLocked_(cacheJson, storeJson)) {
            (void)cache_->set(cache_->ctx, kCacheKey, cacheJson.c_str(), IrrigationDefaults::ScheduleCacheTtlSec);
        }
        LOGI("loaded %u schedules from store", (unsigned)count_);
        return;
    }
    LOGI("no schedules found in storage");
}

bool IrrigationSchedulerModule::encodeCollectionLocked_(std::string& cacheJson, std::string& storeJson) const
{
    DynamicJsonDocument list(Limits::Irrigation::JsonCollectionBuf);
    JsonArray arr = list.to<JsonArray>();
    DynamicJsonDocument byId(Limits::Irrigation::JsonCollectionBuf);
    JsonObject obj = byId.to<JsonObject>();

    for (uint8_t i = 0; i < count_; ++i) {
        scheduleToJson(entries_[i], arr.createNestedObject(), true);
        scheduleToJson(entries_[i], obj.createNestedObject(entries_[i].id), false);
    }
    if (list.overflowed() || byId.overflowed()) {
        LOGE("schedule collection exceeds json buffer");
        return false;
    }
    cacheJson.clear();
    storeJson.clear();
    serializeJson(list, cacheJson);
    serializeJson(byId, storeJson);
    return true;
}

bool IrrigationSchedulerModule::persistLocked_()
{
    std::string cacheJson;
    std::string storeJson;
    if (!encodeCollectionLocked_(cacheJson, storeJson)) return false;

    bool ok = true;
    if (!cache_ || !cache_->set(cache_->ctx, kCacheKey, cacheJson.c_str(), IrrigationDefaults::ScheduleCacheTtlSec)) {
        LOGW("schedules not cached");
        ok = false;
    }
    if (!store_ || !store_->set(store_->ctx, kStorePath, storeJson.c_str())) {
        LOGW("schedules not stored");
        ok = false;
    }
    if (ok) LOGI("saved %u schedules", (unsigned)count_);
    return ok;
}

int IrrigationSchedulerModule::findLocked_(const char* id) const
{
    if (!id) return -1;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].id, id) == 0) return i;
    }
    return -1;
}

void IrrigationSchedulerModule::makeIdLocked_(char* out, size_t outLen) const
{
    const long long epoch = (long long)Clock::nowEpochSec();
    unsigned n = count_;
    for (;;) {
        snprintf(out, outLen, "schedule_%lld_%u", epoch, n);
        if (findLocked_(out) < 0) return;
        ++n;
    }
}

ScheduleMutationResult IrrigationSchedulerModule::add(const char* json)
{
    ScheduleMutationResult res;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (!json || deserializeJson(doc, json) || !doc.is<JsonObject>()) {
        res.code = ErrorCode::BadJson;
        setMsg(res, "Schedule must be a JSON object");
        return res;
    }

    ScheduleEntry e;
    e.active = true;
    res.code = applyScheduleFields(doc.as<JsonObjectConst>(), true, e, res.message, sizeof(res.message));
    if (res.code != ErrorCode::None) return res;

    std::lock_guard<std::mutex> lk(mtx_);
    if (count_ >= Limits::Irrigation::MaxSchedules) {
        res.code = ErrorCode::ScheduleTableFull;
        setMsg(res, "Schedule table is full");
        return res;
    }
    makeIdLocked_(e.id, sizeof(e.id));
    e.createdAtMs = Clock::nowEpochMs();
    entries_[count_++] = e;
    (void)persistLocked_();

    LOGI("schedule added id=%s name=%s %02u:%02u %lus",
         e.id, e.name, (unsigned)e.hour, (unsigned)e.minute, (unsigned long)e.durationSec);
    res.success = true;
    res.entry = e;
    setMsg(res, "Schedule added successfully");
    return res;
}

ScheduleMutationResult IrrigationSchedulerModule::update(const char* id, const char* json)
{
    ScheduleMutationResult res;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (!json || deserializeJson(doc, json) || !doc.is<JsonObject>()) {
        res.code = ErrorCode::BadJson;
        setMsg(res, "Update must be a JSON object");
        return res;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    const int idx = findLocked_(id);
    if (idx < 0) {
        res.code = ErrorCode::UnknownSchedule;
        snprintf(res.message, sizeof(res.message), "Schedule with ID %s not found", id ? id : "");
        return res;
    }

    ScheduleEntry e = entries_[idx];
    res.code = applyScheduleFields(doc.as<JsonObjectConst>(), false, e, res.message, sizeof(res.message));
    if (res.code != ErrorCode::None) return res;

    e.updatedAtMs = Clock::nowEpochMs();
    entries_[idx] = e;
    (void)persistLocked_();

    LOGI("schedule updated id=%s", e.id);
    res.success = true;
    res.entry = e;
    setMsg(res, "Schedule updated successfully");
    return res;
}

bool IrrigationSchedulerModule::remove(const char* id)
{
    std::lock_guard<std::mutex> lk(mtx_);
    const int idx = findLocked_(id);
    if (idx < 0) {
        LOGW("delete: schedule %s not found", id ? id : "");
        return false;
    }
    for (uint8_t i = (uint8_t)idx; i + 1 < count_; ++i) entries_[i] = entries_[i + 1];
    entries_[--count_] = ScheduleEntry{};
    (void)persistLocked_();
    LOGI("schedule deleted id=%s", id);
    return true;
}

bool IrrigationSchedulerModule::get(const char* id, ScheduleEntry& out) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    const int idx = findLocked_(id);
    if (idx < 0) return false;
    out = entries_[idx];
    return true;
}

uint8_t IrrigationSchedulerModule::list(ScheduleEntry* out, uint8_t max) const
{
    if (!out) return 0;
    std::lock_guard<std::mutex> lk(mtx_);
    uint8_t n = 0;
    for (; n < count_ && n < max; ++n) out[n] = entries_[n];
    return n;
}

uint8_t IrrigationSchedulerModule::count() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
}

ScheduleCheckResult IrrigationSchedulerModule::check()
{
    ScheduleCheckResult res;
    if (!pump_) return res;

    const PumpCheckResult pc = pump_->checkScheduledActions(pump_->ctx);
    res.pumpActions = pc.actionsTaken;

    PumpStatus ps;
    if (pump_->getStatus(pump_->ctx, &ps) && ps.isOn) {
        res.pumpWasOn = true;
        return res;
    }

    const uint64_t now = Clock::nowEpochMs();
    struct tm t{};
    if (!Clock::toLocalTm(now, t)) return res;
    const uint8_t todayBit = (uint8_t)(1u << weekdayIndexFromTm(t.tm_wday));
    const int64_t minuteKey = (int64_t)(now / 60000ULL);

    std::vector<ScheduleEntry> matches;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (minuteKey == lastCheckedMinute_) {
            res.skippedSameMinute = true;
            return res;
        }
        lastCheckedMinute_ = minuteKey;
        for (uint8_t i = 0; i < count_; ++i) {
            const ScheduleEntry& e = entries_[i];
            if (!e.active || !(e.weekdayMask & todayBit)) continue;
            if (e.hour != (uint8_t)t.tm_hour || e.minute != (uint8_t)t.tm_min) continue;
            matches.push_back(e);
        }
    }
    res.matched = (uint8_t)matches.size();
    if (matches.empty()) return res;

    const ScheduleEntry& first = matches.front();
    StaticJsonDocument<Limits::Irrigation::Details> details;
    details["schedule_id"] = first.id;
    details["schedule_name"] = first.name;
    char detailsJson[Limits::Irrigation::Details];
    serializeJson(details, detailsJson, sizeof(detailsJson));

    res.pumpResult = pump_->turnOn(pump_->ctx, first.durationSec, IrrigationSource::Schedule, detailsJson);
    res.fired = 1;
    snprintf(res.firedId, sizeof(res.firedId), "%s", first.id);

    if (res.pumpResult.success) {
        LOGI("schedule %s (%s) started pump for %lus", first.id, first.name, (unsigned long)res.pumpResult.durationSec);
    } else {
        LOGW("schedule %s (%s) refused: %s", first.id, first.name, res.pumpResult.message);
    }
    if (res.matched > 1) LOGD("%u other schedules matched, first match only", (unsigned)(res.matched - 1));

    if (eventBus_) {
        ScheduleFiredPayload p{};
        snprintf(p.scheduleId, sizeof(p.scheduleId), "%s", first.id);
        (void)eventBus_->post(EventId::ScheduleFired, &p, sizeof(p));
    }
    return res;
}

void IrrigationSchedulerModule::loop()
{
    const ScheduleCheckResult r = check();
    if (r.fired) LOGD("check fired %s", r.firedId);
    (void)waitOrStop((uint32_t)cfgData_.checkIntervalSec * 1000U);
}
