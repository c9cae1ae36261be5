/**
 * @file PumpStateCodec.cpp
 * @brief Implementation file.
 */
#include "PumpStateCodec.h"
#include "Core/Runtime.h"

#include <ArduinoJson.h>
#include <stdio.h>

namespace {

void putTime(JsonObject obj, const char* isoName, const char* msName, uint64_t ms)
{
    if (ms == 0) {
        obj[isoName] = nullptr;
        return;
    }
    char iso[32];
    if (Clock::formatIso8601(ms, iso, sizeof(iso))) obj[isoName] = iso;
    obj[msName] = ms;
}

uint64_t getTime(JsonVariantConst root, const char* isoName, const char* msName)
{
    const uint64_t ms = root[msName] | (uint64_t)0;
    if (ms != 0) return ms;
    const char* iso = root[isoName] | (const char*)nullptr;
    uint64_t parsed = 0;
    if (iso && Clock::parseIso8601(iso, parsed)) return parsed;
    return 0;
}

}  // namespace

bool encodePumpState(const ActuatorState& st, std::string& out)
{
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    JsonObject root = doc.to<JsonObject>();
    root["is_on"] = st.isOn;
    putTime(root, "start_time", "start_time_ms", st.startMs);
    putTime(root, "scheduled_stop_time", "scheduled_stop_time_ms", st.scheduledStopMs);
    putTime(root, "last_on_time", "last_on_time_ms", st.lastOnMs);
    putTime(root, "last_off_time", "last_off_time_ms", st.lastOffMs);
    root["total_runtime_seconds"] = st.totalRuntimeSec;
    root["total_water_used"] = st.totalWaterL;
    if (st.hasMoistureBefore) root["moisture_before"] = st.moistureBefore;
    if (doc.overflowed()) return false;
    out.clear();
    serializeJson(doc, out);
    return true;
}

bool decodePumpState(const char* json, ActuatorState& out)
{
    if (!json) return false;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (deserializeJson(doc, json)) return false;
    JsonVariantConst root = doc.as<JsonVariantConst>();
    if (!root.is<JsonObjectConst>()) return false;

    ActuatorState st;
    st.isOn = root["is_on"] | false;
    st.startMs = getTime(root, "start_time", "start_time_ms");
    st.scheduledStopMs = getTime(root, "scheduled_stop_time", "scheduled_stop_time_ms");
    st.lastOnMs = getTime(root, "last_on_time", "last_on_time_ms");
    st.lastOffMs = getTime(root, "last_off_time", "last_off_time_ms");
    st.totalRuntimeSec = root["total_runtime_seconds"] | 0.0;
    st.totalWaterL = root["total_water_used"] | 0.0;
    if (root["moisture_before"].is<double>()) {
        st.hasMoistureBefore = true;
        st.moistureBefore = root["moisture_before"].as<double>();
    }
    out = st;
    return true;
}

bool encodeIrrigationEvent(const IrrigationEvent& ev, std::string& out)
{
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    JsonObject root = doc.to<JsonObject>();
    char iso[32];
    if (Clock::formatIso8601(ev.startMs, iso, sizeof(iso))) root["timestamp"] = iso;
    root["start_time_ms"] = ev.startMs;
    root["duration_seconds"] = ev.durationSec;
    root["water_amount_liters"] = ev.waterL;
    root["source"] = irrigationSourceStr(ev.source);
    if (ev.hasMoistureBefore) root["moisture_before"] = ev.moistureBefore;
    if (ev.hasMoistureAfter) root["moisture_after"] = ev.moistureAfter;

    StaticJsonDocument<Limits::Irrigation::Details * 2> details;
    if (ev.details[0] != '\0' && !deserializeJson(details, ev.details) && details.is<JsonObject>()) {
        root["details"] = details.as<JsonObjectConst>();
    } else {
        root.createNestedObject("details");
    }
    if (doc.overflowed()) return false;
    out.clear();
    serializeJson(doc, out);
    return true;
}

bool decodeIrrigationEvent(const char* json, IrrigationEvent& out)
{
    if (!json) return false;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (deserializeJson(doc, json)) return false;
    JsonVariantConst root = doc.as<JsonVariantConst>();
    if (!root.is<JsonObjectConst>()) return false;

    IrrigationEvent ev;
    ev.startMs = getTime(root, "timestamp", "start_time_ms");
    ev.durationSec = root["duration_seconds"] | 0.0;
    ev.waterL = root["water_amount_liters"] | 0.0;
    if (!parseIrrigationSource(root["source"] | "manual", &ev.source)) ev.source = IrrigationSource::Manual;
    if (root["moisture_before"].is<double>()) {
        ev.hasMoistureBefore = true;
        ev.moistureBefore = root["moisture_before"].as<double>();
    }
    if (root["moisture_after"].is<double>()) {
        ev.hasMoistureAfter = true;
        ev.moistureAfter = root["moisture_after"].as<double>();
    }
    if (root["details"].is<JsonObjectConst>()) {
        serializeJson(root["details"], ev.details, sizeof(ev.details));
    }
    out = ev;
    return true;
}
