#pragma once
/**
 * @file IPump.h
 * @brief Irrigation pump (actuator controller) service interface.
 */
#include <stdint.h>
#include <string.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IGateway.h"

/** @brief What triggered an irrigation transition. */
enum class IrrigationSource : uint8_t {
    Manual = 0,
    Schedule,
    Auto,
    Sync,
    System,
    AiRecommendation
};

/** @brief Outcome of turnOn / turnOff. Refusals are `success=false` with a code. */
struct PumpResult {
    bool success = false;
    ErrorCode code = ErrorCode::None;
    char message[Limits::Irrigation::Message] = {0};
    uint64_t startMs = 0;
    uint64_t scheduledStopMs = 0;
    uint32_t durationSec = 0;          ///< requested duration after clamping (turnOn)
    double runSec = 0.0;               ///< elapsed runtime (turnOff)
    double waterL = 0.0;               ///< water delivered (turnOff)
    double waitRemainingSec = 0.0;     ///< min_interval_not_met only, always >= 0
};

/** @brief ActuatorState plus derived live values. */
struct PumpStatus {
    bool isOn = false;
    uint64_t startMs = 0;
    uint64_t scheduledStopMs = 0;
    uint64_t lastOnMs = 0;
    uint64_t lastOffMs = 0;
    double totalRuntimeSec = 0.0;
    double totalWaterL = 0.0;
    double currentRuntimeSec = 0.0;
    double currentWaterL = 0.0;
    bool hasRemaining = false;
    double remainingSec = 0.0;         ///< >= 0, valid when hasRemaining
    FeedSwitchState gatewayState = FeedSwitchState::Unknown;
    bool stateSynced = false;
};

/** @brief Append-only irrigation record. */
struct IrrigationEvent {
    uint64_t startMs = 0;
    double durationSec = 0.0;
    double waterL = 0.0;
    IrrigationSource source = IrrigationSource::Manual;
    bool hasMoistureBefore = false;
    double moistureBefore = 0.0;
    bool hasMoistureAfter = false;
    double moistureAfter = 0.0;
    char details[Limits::Irrigation::Details] = {0};  ///< JSON object text
};

/** @brief Outcome of checkScheduledActions. */
struct PumpCheckResult {
    uint8_t actionsTaken = 0;
    bool wasOn = false;
    bool isOn = false;
    PumpResult stop;                   ///< valid when actionsTaken > 0
};

/** @brief Lifetime and 24 h statistics. */
struct PumpStatistics {
    double totalRuntimeSec = 0.0;
    double totalRuntimeHours = 0.0;
    double totalWaterL = 0.0;
    bool isOn = false;
    uint16_t events24h = 0;
    double runtime24hSec = 0.0;
    double water24hL = 0.0;
    double avgDurationSec = 0.0;
    double avgWaterL = 0.0;
};

/** @brief Service wrapper exposed by PumpModule. */
struct PumpService {
    PumpResult (*turnOn)(void* ctx, uint32_t durationSec, IrrigationSource source, const char* detailsJson);
    PumpResult (*turnOff)(void* ctx, IrrigationSource source, const char* detailsJson);
    bool (*getStatus)(void* ctx, PumpStatus* out);
    PumpCheckResult (*checkScheduledActions)(void* ctx);
    /** @brief Newest first. */
    uint16_t (*history)(void* ctx, uint16_t limit, IrrigationEvent* out, uint16_t max);
    bool (*statistics)(void* ctx, PumpStatistics* out);
    void* ctx;
};

static inline const char* irrigationSourceStr(IrrigationSource s)
{
    switch (s) {
    case IrrigationSource::Manual: return "manual";
    case IrrigationSource::Schedule: return "schedule";
    case IrrigationSource::Auto: return "auto";
    case IrrigationSource::Sync: return "sync";
    case IrrigationSource::System: return "system";
    case IrrigationSource::AiRecommendation: return "ai_recommendation";
    }
    return "manual";
}

static inline bool parseIrrigationSource(const char* s, IrrigationSource* out)
{
    if (!s || !out) return false;
    static const IrrigationSource kAll[] = {
        IrrigationSource::Manual, IrrigationSource::Schedule, IrrigationSource::Auto,
        IrrigationSource::Sync, IrrigationSource::System, IrrigationSource::AiRecommendation
    };
    for (IrrigationSource v : kAll) {
        if (strcmp(s, irrigationSourceStr(v)) == 0) {
            *out = v;
            return true;
        }
    }
    return false;
}
