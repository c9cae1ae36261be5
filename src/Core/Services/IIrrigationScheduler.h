#pragma once
/**
 * @file IIrrigationScheduler.h
 * @brief Irrigation schedule service interface (weekday + HH:MM rules).
 */
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IPump.h"

/** @brief Weekday bit constants (Mon..Sun). */
constexpr uint8_t IRR_WEEKDAY_MON = (1u << 0);
constexpr uint8_t IRR_WEEKDAY_TUE = (1u << 1);
constexpr uint8_t IRR_WEEKDAY_WED = (1u << 2);
constexpr uint8_t IRR_WEEKDAY_THU = (1u << 3);
constexpr uint8_t IRR_WEEKDAY_FRI = (1u << 4);
constexpr uint8_t IRR_WEEKDAY_SAT = (1u << 5);
constexpr uint8_t IRR_WEEKDAY_SUN = (1u << 6);
constexpr uint8_t IRR_WEEKDAY_ALL = 0x7F;

constexpr size_t IRR_SCHEDULE_ID_MAX = 40;
constexpr size_t IRR_SCHEDULE_NAME_MAX = 48;

/**
 * @brief One recurring irrigation rule.
 */
struct ScheduleEntry {
    char id[IRR_SCHEDULE_ID_MAX] = {0};
    char name[IRR_SCHEDULE_NAME_MAX] = {0};
    uint8_t weekdayMask = 0;     // bit0=Mon ... bit6=Sun
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint32_t durationSec = 0;
    bool active = true;
    uint64_t createdAtMs = 0;
    uint64_t updatedAtMs = 0;    // 0 = never updated
};

/** @brief Outcome of add / update. */
struct ScheduleMutationResult {
    bool success = false;
    ErrorCode code = ErrorCode::None;
    char message[Limits::Irrigation::Message] = {0};
    ScheduleEntry entry;
};

/** @brief Outcome of one checkSchedules pass. */
struct ScheduleCheckResult {
    bool pumpWasOn = false;      ///< returned early, nothing evaluated
    bool skippedSameMinute = false;
    uint8_t pumpActions = 0;     ///< timed stops performed by the pump first
    uint8_t matched = 0;
    uint8_t fired = 0;           ///< 0 or 1
    char firedId[IRR_SCHEDULE_ID_MAX] = {0};
    PumpResult pumpResult;       ///< valid when an entry matched
};

/** @brief Service wrapper exposed by IrrigationSchedulerModule. */
struct SchedulerService {
    ScheduleMutationResult (*add)(void* ctx, const char* json);
    ScheduleMutationResult (*update)(void* ctx, const char* id, const char* json);
    bool (*remove)(void* ctx, const char* id);
    bool (*get)(void* ctx, const char* id, ScheduleEntry* out);
    uint8_t (*list)(void* ctx, ScheduleEntry* out, uint8_t max);
    ScheduleCheckResult (*check)(void* ctx);
    bool (*startLoop)(void* ctx);
    bool (*stopLoop)(void* ctx);
    bool (*isRunning)(void* ctx);
    void* ctx;
};
