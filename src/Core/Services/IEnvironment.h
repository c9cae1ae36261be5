#pragma once
/**
 * @file IEnvironment.h
 * @brief Environment sampling service interface and sensor types.
 */
#include <stdint.h>

/** @brief Sensor kinds sampled from the gateway feeds. */
enum class SensorKind : uint8_t {
    SoilMoisture = 0,
    Temperature,
    Humidity,
    Light,
    Count
};

constexpr uint8_t SENSOR_KIND_COUNT = (uint8_t)SensorKind::Count;

/** @brief Threshold status of a reading (ordered by severity). */
enum class ReadingStatus : uint8_t { Unknown = 0, Normal, Warning, Critical };

/** @brief One sensor value. */
struct SensorReading {
    bool valid = false;
    SensorKind kind = SensorKind::SoilMoisture;
    double value = 0.0;
    uint64_t tsMs = 0;
    ReadingStatus status = ReadingStatus::Unknown;
};

/** @brief One reading slot per sensor kind. */
struct EnvironmentSnapshot {
    uint64_t tsMs = 0;
    SensorReading readings[SENSOR_KIND_COUNT];

    const SensorReading& at(SensorKind k) const { return readings[(uint8_t)k]; }
    SensorReading& at(SensorKind k) { return readings[(uint8_t)k]; }
    bool has(SensorKind k) const { return readings[(uint8_t)k].valid; }
};

/** @brief One soil moisture sample kept for trend analysis. */
struct SoilSample {
    double value = 0.0;
    uint64_t tsMs = 0;
};

/** @brief Service wrapper exposed by EnvironmentModule. */
struct EnvironmentService {
    /** @brief Newest non-stale reading of one kind. */
    bool (*latest)(void* ctx, SensorKind kind, SensorReading* out);
    /** @brief One reading per kind, collecting stale kinds first when asked. */
    bool (*snapshot)(void* ctx, bool collectIfStale, EnvironmentSnapshot* out);
    /** @brief Read every sensor feed now; returns the number of fresh readings. */
    uint8_t (*collect)(void* ctx);
    /** @brief Recent soil moisture samples, oldest first. */
    uint16_t (*soilSamples)(void* ctx, SoilSample* out, uint16_t max);
    void* ctx;
};

static inline const char* sensorKindStr(SensorKind k)
{
    switch (k) {
    case SensorKind::SoilMoisture: return "soil_moisture";
    case SensorKind::Temperature: return "temperature";
    case SensorKind::Humidity: return "humidity";
    case SensorKind::Light: return "light";
    default: return "unknown";
    }
}

static inline const char* sensorUnitStr(SensorKind k)
{
    switch (k) {
    case SensorKind::SoilMoisture: return "%";
    case SensorKind::Temperature: return "C";
    case SensorKind::Humidity: return "%";
    case SensorKind::Light: return "lux";
    default: return "";
    }
}

static inline const char* readingStatusStr(ReadingStatus s)
{
    switch (s) {
    case ReadingStatus::Unknown: return "unknown";
    case ReadingStatus::Normal: return "normal";
    case ReadingStatus::Warning: return "warning";
    case ReadingStatus::Critical: return "critical";
    }
    return "unknown";
}
