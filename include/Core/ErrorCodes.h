#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error / refusal codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    None = 0,
    Failed,
    BadJson,
    ServiceUnavailable,
    // Gateway
    Unauthorized,
    NotFound,
    Transient,
    NoFeedKey,
    // Pump
    AlreadyRunning,
    MinIntervalNotMet,
    AlreadyOff,
    CommandFailed,
    // Scheduler
    MissingField,
    InvalidTimeFormat,
    InvalidDays,
    InvalidDay,
    InvalidDuration,
    InvalidName,
    UnknownSchedule,
    ScheduleTableFull,
    // Decision
    AutoIrrigationDisabled,
    PumpAlreadyRunning,
    NoSoilMoistureData,
    // Orchestrator
    RecommendationsDisabled,
    SourceNotAllowed,
    InvalidPriority,
    InvalidAction,
    // Storage
    CacheUnavailable,
    StoreUnavailable
};

/** @brief Stable snake-case reason string for a code. */
static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::Failed: return "failed";
    case ErrorCode::BadJson: return "bad_json";
    case ErrorCode::ServiceUnavailable: return "service_unavailable";
    case ErrorCode::Unauthorized: return "unauthorized";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Transient: return "transient";
    case ErrorCode::NoFeedKey: return "no_feed_key";
    case ErrorCode::AlreadyRunning: return "already_running";
    case ErrorCode::MinIntervalNotMet: return "min_interval_not_met";
    case ErrorCode::AlreadyOff: return "already_off";
    case ErrorCode::CommandFailed: return "command_failed";
    case ErrorCode::MissingField: return "missing_field";
    case ErrorCode::InvalidTimeFormat: return "invalid_time_format";
    case ErrorCode::InvalidDays: return "invalid_days";
    case ErrorCode::InvalidDay: return "invalid_day";
    case ErrorCode::InvalidDuration: return "invalid_duration";
    case ErrorCode::InvalidName: return "invalid_name";
    case ErrorCode::UnknownSchedule: return "unknown_schedule";
    case ErrorCode::ScheduleTableFull: return "schedule_table_full";
    case ErrorCode::AutoIrrigationDisabled: return "auto_irrigation_disabled";
    case ErrorCode::PumpAlreadyRunning: return "pump_already_running";
    case ErrorCode::NoSoilMoistureData: return "no_soil_moisture_data";
    case ErrorCode::RecommendationsDisabled: return "recommendations_disabled";
    case ErrorCode::SourceNotAllowed: return "source_not_allowed";
    case ErrorCode::InvalidPriority: return "invalid_priority";
    case ErrorCode::InvalidAction: return "invalid_action";
    case ErrorCode::CacheUnavailable: return "cache_unavailable";
    case ErrorCode::StoreUnavailable: return "store_unavailable";
    default: return "unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::ServiceUnavailable:
    case ErrorCode::Transient:
    case ErrorCode::CommandFailed:
    case ErrorCode::MinIntervalNotMet:
    case ErrorCode::CacheUnavailable:
    case ErrorCode::StoreUnavailable:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
