#pragma once
/**
 * @file PumpStateCodec.h
 * @brief Actuator state record and JSON codecs for pump state and irrigation events.
 */
#include <stdint.h>
#include <string>

#include "Core/Services/IPump.h"

/** @brief Persisted logical state of one pump. */
struct ActuatorState {
    bool isOn = false;
    uint64_t startMs = 0;
    uint64_t scheduledStopMs = 0;
    uint64_t lastOnMs = 0;
    uint64_t lastOffMs = 0;
    double totalRuntimeSec = 0.0;
    double totalWaterL = 0.0;
    bool hasMoistureBefore = false;
    double moistureBefore = 0.0;
};

bool encodePumpState(const ActuatorState& st, std::string& out);
bool decodePumpState(const char* json, ActuatorState& out);

/** @brief Event JSON; `details` is embedded as an object when it parses. */
bool encodeIrrigationEvent(const IrrigationEvent& ev, std::string& out);
bool decodeIrrigationEvent(const char* json, IrrigationEvent& out);
