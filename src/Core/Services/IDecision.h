#pragma once
/**
 * @file IDecision.h
 * @brief Autonomous irrigation decision service interface.
 */
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IEnvironment.h"

/** @brief Irrigation urgency. */
enum class Urgency : uint8_t { None = 0, Medium, High };

/** @brief Water-amount class. */
enum class WaterAmount : uint8_t { None = 0, Light, Moderate, Heavy };

/** @brief Externally supplied (AI) irrigation recommendation. */
struct AiRecommendation {
    bool shouldIrrigate = false;
    double durationMinutes = 0.0;
    double confidence = 0.0;     ///< [0,1]
    char reason[Limits::Irrigation::Message] = {0};
    char zones[64] = {0};        ///< comma separated, optional
    uint64_t receivedMs = 0;
};

/** @brief Immutable record of one decision tick. */
struct Decision {
    uint64_t tsMs = 0;
    bool needsWater = false;
    Urgency urgency = Urgency::None;
    char reason[Limits::Irrigation::Message] = {0};
    WaterAmount amount = WaterAmount::None;
    ReadingStatus overall = ReadingStatus::Unknown;
    bool hasSoil = false;
    double soilMoisture = 0.0;
    ReadingStatus soilStatus = ReadingStatus::Unknown;
    bool aiApplied = false;
    bool actionStarted = false;  ///< false => `no_action`
    uint32_t actionDurationSec = 0;
    bool actionSuccess = false;
    char actionMessage[Limits::Irrigation::Message] = {0};
};

/** @brief Outcome of makeDecision. */
struct DecisionOutcome {
    bool made = false;           ///< false => preconditions refused
    ErrorCode refusal = ErrorCode::None;
    double waitRemainingSec = 0.0;
    Decision decision;           ///< valid when made
};

/** @brief Current decision loop configuration. */
struct DecisionConfig {
    bool enabled = false;
    int32_t minDecisionIntervalSec = 0;
    int32_t checkIntervalSec = 0;
    int32_t durationLightSec = 0;
    int32_t durationNormalSec = 0;
    int32_t durationHeavySec = 0;
    double aiMinConfidence = 0.0;
    double soilMin = 0.0;
    double soilMax = 0.0;
    double soilOptMin = 0.0;
    double soilOptMax = 0.0;
};

/** @brief Service wrapper exposed by DecisionModule. */
struct DecisionService {
    DecisionOutcome (*makeDecision)(void* ctx);
    bool (*enable)(void* ctx, bool enabled);
    bool (*getConfig)(void* ctx, DecisionConfig* out);
    /** @brief Partial update from a flat JSON object; unknown keys ignored. */
    bool (*updateConfig)(void* ctx, const char* json);
    bool (*lastDecision)(void* ctx, Decision* out);
    /** @brief Newest first. */
    uint16_t (*history)(void* ctx, uint16_t limit, Decision* out, uint16_t max);
    /** @brief Queue a recommendation for the next tick (replaces any queued one). */
    bool (*queueRecommendation)(void* ctx, const AiRecommendation* rec);
    bool (*startLoop)(void* ctx);
    bool (*stopLoop)(void* ctx);
    bool (*isRunning)(void* ctx);
    void* ctx;
};

static inline const char* urgencyStr(Urgency u)
{
    switch (u) {
    case Urgency::None: return "none";
    case Urgency::Medium: return "medium";
    case Urgency::High: return "high";
    }
    return "none";
}

static inline const char* waterAmountStr(WaterAmount a)
{
    switch (a) {
    case WaterAmount::None: return "none";
    case WaterAmount::Light: return "light";
    case WaterAmount::Moderate: return "moderate";
    case WaterAmount::Heavy: return "heavy";
    }
    return "none";
}
