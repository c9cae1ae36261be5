#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char key[32];
};

/** @brief Payload for inbound sensor pushes (pub/sub). */
struct SensorReadingPayload {
    uint8_t kind;      ///< SensorKind
    double value;
    uint64_t tsMs;
};

/** @brief Payload for inbound actuator feed updates (pub/sub). */
struct ActuatorFeedPayload {
    int8_t state;      ///< 1 on, 0 off, -1 unparsable
};

/** @brief Payload for pump state transitions. */
struct PumpStateChangedPayload {
    uint8_t on;        ///< 0/1
    uint8_t source;    ///< IrrigationSource
    uint32_t durationS;
};

/** @brief Payload for recorded irrigation events. */
struct IrrigationRecordedPayload {
    uint8_t source;    ///< IrrigationSource
    float durationS;
    float waterL;
};

/** @brief Payload for recorded decisions. */
struct DecisionRecordedPayload {
    uint8_t needsWater;
    uint8_t actionStarted;
    uint8_t aiApplied;
};

/** @brief Payload for fired schedules. */
struct ScheduleFiredPayload {
    char scheduleId[40];
};
