#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // Configuration
    ConfigChanged = 100,

    // Sensors / runtime data
    SensorReadingReceived = 200,

    // Actuators
    ActuatorFeedChanged = 300,
    PumpStateChanged = 301,
    IrrigationRecorded = 302,

    // Domain events
    DecisionRecorded = 400,
    ScheduleFired = 420,
};
