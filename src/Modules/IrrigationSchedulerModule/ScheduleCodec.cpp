/**
 * @file ScheduleCodec.cpp
 * @brief Implementation file.
 */
#include "ScheduleCodec.h"
#include "Core/Runtime.h"

#include <ctype.h>
#include <errno.h>
#include <math.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

namespace {

const char* const kDayNames[7] = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

void setMsg(char* msg, size_t len, const char* text)
{
    if (msg && len > 0) snprintf(msg, len, "%s", text);
}

/// Positive whole-number duration that fits in 32 bits, from a JSON integer or a string of digits.
bool readDuration(JsonVariantConst v, uint32_t& out)
{
    long long n = 0;
    if (v.is<long long>()) {
        n = v.as<long long>();
    } else if (v.is<double>()) {
        const double d = v.as<double>();
        if (!(d >= 1.0 && d <= (double)UINT32_MAX)) return false;
        if (d != floor(d)) return false;
        n = (long long)d;
    } else if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        while (*s && isspace((unsigned char)*s)) ++s;
        if (*s == '\0') return false;
        char* end = nullptr;
        errno = 0;
        n = strtoll(s, &end, 10);
        if (errno == ERANGE) return false;
        while (end && *end && isspace((unsigned char)*end)) ++end;
        if (!end || *end != '\0') return false;
    } else {
        return false;
    }
    if (n <= 0 || n > (long long)UINT32_MAX) return false;
    out = (uint32_t)n;
    return true;
}

uint64_t readTime(JsonVariantConst v)
{
    if (v.is<uint64_t>()) return v.as<uint64_t>();
    const char* iso = v | (const char*)nullptr;
    uint64_t ms = 0;
    if (iso && Clock::parseIso8601(iso, ms)) return ms;
    return 0;
}

}  // namespace

bool parseTimeOfDay(const char* s, uint8_t& hour, uint8_t& minute)
{
    if (!s) return false;
    int h = 0;
    int m = 0;
    int digits = 0;
    const char* p = s;
    while (isdigit((unsigned char)*p) && digits < 3) {
        h = h * 10 + (*p - '0');
        ++p;
        ++digits;
    }
    if (digits < 1 || digits > 2 || *p != ':') return false;
    ++p;
    digits = 0;
    while (isdigit((unsigned char)*p) && digits < 3) {
        m = m * 10 + (*p - '0');
        ++p;
        ++digits;
    }
    if (digits != 2 || *p != '\0') return false;
    if (h > 23 || m > 59) return false;
    hour = (uint8_t)h;
    minute = (uint8_t)m;
    return true;
}

bool weekdayBitFromName(const char* name, uint8_t& bit)
{
    if (!name) return false;
    for (uint8_t i = 0; i < 7; ++i) {
        if (strcasecmp(name, kDayNames[i]) == 0) {
            bit = (uint8_t)(1u << i);
            return true;
        }
    }
    return false;
}

const char* weekdayName(uint8_t index)
{
    return index < 7 ? kDayNames[index] : "";
}

uint8_t weekdayIndexFromTm(int tmWday)
{
    return (uint8_t)((tmWday + 6) % 7);
}

ErrorCode applyScheduleFields(JsonObjectConst src, bool requireAll, ScheduleEntry& entry,
                              char* msg, size_t msgLen)
{
    if (src.isNull()) {
        setMsg(msg, msgLen, "Schedule must be a JSON object");
        return ErrorCode::BadJson;
    }

    if (requireAll) {
        static const char* const kRequired[] = {"name", "days", "start_time", "duration"};
        for (const char* field : kRequired) {
            if (!src.containsKey(field)) {
                if (msg && msgLen > 0) snprintf(msg, msgLen, "Missing required field: %s", field);
                return ErrorCode::MissingField;
            }
        }
    }

    ScheduleEntry next = entry;

    if (src.containsKey("name")) {
        const char* name = src["name"] | (const char*)nullptr;
        if (!name || name[0] == '\0' || strlen(name) >= sizeof(next.name)) {
            setMsg(msg, msgLen, "Name must be a non-empty string");
            return ErrorCode::InvalidName;
        }
        snprintf(next.name, sizeof(next.name), "%s", name);
    }

    if (src.containsKey("start_time")) {
        uint8_t h = 0;
        uint8_t m = 0;
        if (!parseTimeOfDay(src["start_time"] | "", h, m)) {
            setMsg(msg, msgLen, "Invalid time format. Use HH:MM (24-hour format)");
            return ErrorCode::InvalidTimeFormat;
        }
        next.hour = h;
        next.minute = m;
    }

    if (src.containsKey("days")) {
        JsonArrayConst days = src["days"].as<JsonArrayConst>();
        if (days.isNull()) {
            setMsg(msg, msgLen, "Days must be a list");
            return ErrorCode::InvalidDays;
        }
        uint8_t mask = 0;
        for (JsonVariantConst d : days) {
            uint8_t bit = 0;
            const char* name = d | (const char*)nullptr;
            if (!weekdayBitFromName(name, bit)) {
                if (msg && msgLen > 0) {
                    snprintf(msg, msgLen, "Invalid day: %s", name ? name : "?");
                }
                return ErrorCode::InvalidDay;
            }
            mask |= bit;
        }
        next.weekdayMask = mask;
    }

    if (src.containsKey("duration")) {
        uint32_t duration = 0;
        if (!readDuration(src["duration"], duration)) {
            setMsg(msg, msgLen, "Duration must be a positive integer");
            return ErrorCode::InvalidDuration;
        }
        next.durationSec = duration;
    }

    if (src.containsKey("active")) {
        JsonVariantConst a = src["active"];
        if (!a.is<bool>()) {
            setMsg(msg, msgLen, "Active must be a boolean");
            return ErrorCode::BadJson;
        }
        next.active = a.as<bool>();
    }

    entry = next;
    return ErrorCode::None;
}

void scheduleToJson(const ScheduleEntry& entry, JsonObject out, bool withId)
{
    if (withId) out["id"] = entry.id;
    out["name"] = entry.name;
    JsonArray days = out.createNestedArray("days");
    for (uint8_t i = 0; i < 7; ++i) {
        if (entry.weekdayMask & (1u << i)) days.add(weekdayName(i));
    }
    char hhmm[8];
    snprintf(hhmm, sizeof(hhmm), "%02u:%02u", (unsigned)entry.hour, (unsigned)entry.minute);
    out["start_time"] = hhmm;
    out["duration"] = entry.durationSec;
    out["active"] = entry.active;

    char iso[32];
    if (entry.createdAtMs && Clock::formatIso8601(entry.createdAtMs, iso, sizeof(iso))) out["created_at"] = iso;
    if (entry.updatedAtMs && Clock::formatIso8601(entry.updatedAtMs, iso, sizeof(iso))) out["updated_at"] = iso;
}

bool scheduleFromJson(JsonObjectConst src, const char* id, ScheduleEntry& out)
{
    if (src.isNull()) return false;
    ScheduleEntry e;
    const char* sid = id ? id : (src["id"] | (const char*)nullptr);
    if (!sid || sid[0] == '\0' || strlen(sid) >= sizeof(e.id)) return false;
    snprintf(e.id, sizeof(e.id), "%s", sid);
    snprintf(e.name, sizeof(e.name), "%s", src["name"] | "");

    uint8_t h = 0;
    uint8_t m = 0;
    if (!parseTimeOfDay(src["start_time"] | "", h, m)) return false;
    e.hour = h;
    e.minute = m;

    JsonArrayConst days = src["days"].as<JsonArrayConst>();
    for (JsonVariantConst d : days) {
        uint8_t bit = 0;
        if (weekdayBitFromName(d | "", bit)) e.weekdayMask |= bit;
    }

    if (!readDuration(src["duration"], e.durationSec)) return false;
    e.active = src["active"] | true;
    e.createdAtMs = readTime(src["created_at"]);
    e.updatedAtMs = readTime(src["updated_at"]);
    out = e;
    return true;
}
