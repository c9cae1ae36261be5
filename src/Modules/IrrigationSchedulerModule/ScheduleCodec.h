#pragma once
/**
 * @file ScheduleCodec.h
 * @brief Schedule entry validation and JSON mapping.
 */
#include <stddef.h>
#include <stdint.h>

#include <ArduinoJson.h>

#include "Core/Services/IIrrigationScheduler.h"

/** @brief Parse `H:MM` / `HH:MM` (24-hour). */
bool parseTimeOfDay(const char* s, uint8_t& hour, uint8_t& minute);

/** @brief Weekday bit (Mon-first) for a case-insensitive day name. */
bool weekdayBitFromName(const char* name, uint8_t& bit);

/** @brief Lowercase day name for bit index 0 (monday) .. 6 (sunday). */
const char* weekdayName(uint8_t index);

/** @brief Mon-first weekday index (0..6) from a `tm_wday` (0 = Sunday). */
uint8_t weekdayIndexFromTm(int tmWday);

/**
 * @brief Validate `src` and apply its fields onto `entry`.
 *
 * With `requireAll`, `name`, `days`, `start_time` and `duration` must all be
 * present (add). Otherwise only the given fields are checked (update). On
 * failure `entry` is left untouched and `msg` explains the rejection.
 */
ErrorCode applyScheduleFields(JsonObjectConst src, bool requireAll, ScheduleEntry& entry,
                              char* msg, size_t msgLen);

/** @brief Write an entry as a JSON object; `withId` adds the `id` member. */
void scheduleToJson(const ScheduleEntry& entry, JsonObject out, bool withId);

/**
 * @brief Read a stored entry (no validation beyond types).
 * @param id Overrides `id` from the object when non-null (id-keyed collections).
 */
bool scheduleFromJson(JsonObjectConst src, const char* id, ScheduleEntry& out);
