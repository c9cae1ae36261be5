/**
 * @file DecisionCodec.cpp
 * @brief Implementation file.
 */
#include "DecisionCodec.h"
#include "Core/Runtime.h"
#include "Domain/IrrigationDefaults.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

namespace {

bool parseUrgency(const char* s, Urgency& out)
{
    if (!s) return false;
    static const Urgency kAll[] = {Urgency::None, Urgency::Medium, Urgency::High};
    for (Urgency u : kAll) {
        if (strcmp(s, urgencyStr(u)) == 0) {
            out = u;
            return true;
        }
    }
    return false;
}

bool parseWaterAmount(const char* s, WaterAmount& out)
{
    if (!s) return false;
    static const WaterAmount kAll[] = {WaterAmount::None, WaterAmount::Light, WaterAmount::Moderate, WaterAmount::Heavy};
    for (WaterAmount a : kAll) {
        if (strcmp(s, waterAmountStr(a)) == 0) {
            out = a;
            return true;
        }
    }
    return false;
}

ReadingStatus parseStatus(const char* s)
{
    if (!s) return ReadingStatus::Unknown;
    static const ReadingStatus kAll[] = {ReadingStatus::Normal, ReadingStatus::Warning, ReadingStatus::Critical};
    for (ReadingStatus st : kAll) {
        if (strcmp(s, readingStatusStr(st)) == 0) return st;
    }
    return ReadingStatus::Unknown;
}

}  // namespace

WaterAmount waterAmountFromMinutes(double minutes)
{
    if (minutes > IrrigationDefaults::AiHeavyAboveMin) return WaterAmount::Heavy;
    if (minutes > IrrigationDefaults::AiModerateAboveMin) return WaterAmount::Moderate;
    return WaterAmount::Light;
}

bool encodeDecision(const Decision& d, std::string& out)
{
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    char iso[32];
    if (Clock::formatIso8601(d.tsMs, iso, sizeof(iso))) doc["timestamp"] = iso;
    doc["timestamp_ms"] = d.tsMs;
    doc["needs_water"] = d.needsWater;
    doc["urgency"] = urgencyStr(d.urgency);
    doc["reason"] = d.reason;
    doc["water_amount"] = waterAmountStr(d.amount);
    doc["ai_applied"] = d.aiApplied;

    JsonObject summary = doc.createNestedObject("analysis_summary");
    summary["overall_status"] = readingStatusStr(d.overall);
    if (d.hasSoil) {
        JsonObject soil = summary.createNestedObject("soil_moisture");
        soil["value"] = d.soilMoisture;
        soil["unit"] = sensorUnitStr(SensorKind::SoilMoisture);
        soil["status"] = readingStatusStr(d.soilStatus);
    } else {
        summary["soil_moisture"] = nullptr;
    }

    JsonObject action = doc.createNestedObject("action_taken");
    if (d.actionStarted) {
        action["action"] = "irrigation_started";
        action["duration"] = d.actionDurationSec;
        action["success"] = d.actionSuccess;
        action["message"] = d.actionMessage;
    } else {
        action["action"] = "no_action";
        action["message"] = d.actionMessage[0] ? d.actionMessage : "No irrigation needed";
    }

    if (doc.overflowed()) return false;
    out.clear();
    serializeJson(doc, out);
    return true;
}

bool decodeDecision(const char* json, Decision& out)
{
    if (!json) return false;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (deserializeJson(doc, json) || !doc.is<JsonObject>()) return false;

    Decision d;
    d.tsMs = doc["timestamp_ms"] | (uint64_t)0;
    if (d.tsMs == 0) {
        uint64_t ms = 0;
        const char* iso = doc["timestamp"] | (const char*)nullptr;
        if (iso && Clock::parseIso8601(iso, ms)) d.tsMs = ms;
    }
    if (d.tsMs == 0) return false;

    d.needsWater = doc["needs_water"] | false;
    if (!parseUrgency(doc["urgency"] | "none", d.urgency)) d.urgency = Urgency::None;
    snprintf(d.reason, sizeof(d.reason), "%s", doc["reason"] | "");
    if (!parseWaterAmount(doc["water_amount"] | "none", d.amount)) d.amount = WaterAmount::None;
    d.aiApplied = doc["ai_applied"] | false;

    JsonObjectConst summary = doc["analysis_summary"].as<JsonObjectConst>();
    d.overall = parseStatus(summary["overall_status"] | "unknown");
    JsonObjectConst soil = summary["soil_moisture"].as<JsonObjectConst>();
    if (!soil.isNull() && soil["value"].is<double>()) {
        d.hasSoil = true;
        d.soilMoisture = soil["value"].as<double>();
        d.soilStatus = parseStatus(soil["status"] | "unknown");
    }

    JsonObjectConst action = doc["action_taken"].as<JsonObjectConst>();
    const char* act = action["action"] | "no_action";
    d.actionStarted = strcmp(act, "irrigation_started") == 0;
    d.actionDurationSec = action["duration"] | 0U;
    d.actionSuccess = action["success"] | false;
    snprintf(d.actionMessage, sizeof(d.actionMessage), "%s", action["message"] | "");
    out = d;
    return true;
}

bool encodeAiRecommendation(const AiRecommendation& rec, std::string& out)
{
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    doc["should_irrigate"] = rec.shouldIrrigate;
    doc["duration_minutes"] = rec.durationMinutes;
    doc["reason"] = rec.reason;
    doc["confidence"] = rec.confidence;
    if (rec.zones[0] != '\0') doc["zones"] = rec.zones;
    doc["received_at_ms"] = rec.receivedMs;
    if (doc.overflowed()) return false;
    out.clear();
    serializeJson(doc, out);
    return true;
}

bool decodeAiRecommendation(const char* json, AiRecommendation& out)
{
    if (!json) return false;
    StaticJsonDocument<Limits::Irrigation::JsonItemBuf> doc;
    if (deserializeJson(doc, json) || !doc.is<JsonObject>()) return false;

    AiRecommendation rec;
    rec.shouldIrrigate = doc["should_irrigate"] | false;
    rec.durationMinutes = doc["duration_minutes"] | 0.0;
    if (rec.durationMinutes < 0.0) rec.durationMinutes = 0.0;
    rec.confidence = doc["confidence"] | 0.0;
    if (rec.confidence < 0.0) rec.confidence = 0.0;
    if (rec.confidence > 1.0) rec.confidence = 1.0;
    snprintf(rec.reason, sizeof(rec.reason), "%s", doc["reason"] | "");

    JsonVariantConst zones = doc["zones"];
    if (zones.is<JsonArrayConst>()) {
        size_t used = 0;
        for (JsonVariantConst z : zones.as<JsonArrayConst>()) {
            const char* name = z | "";
            if (name[0] == '\0') continue;
            const int n = snprintf(rec.zones + used, sizeof(rec.zones) - used, "%s%s", used ? "," : "", name);
            if (n < 0 || (size_t)n >= sizeof(rec.zones) - used) break;
            used += (size_t)n;
        }
    } else if (zones.is<const char*>()) {
        snprintf(rec.zones, sizeof(rec.zones), "%s", zones.as<const char*>());
    }
    rec.receivedMs = doc["received_at_ms"] | (uint64_t)0;
    out = rec;
    return true;
}
