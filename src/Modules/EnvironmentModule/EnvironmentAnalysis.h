#pragma once
/**
 * @file EnvironmentAnalysis.h
 * @brief Deterministic rule-based analysis of environment readings.
 */

#include <stdint.h>

#include "Core/Services/IDecision.h"
#include "Core/Services/IEnvironment.h"

/** @brief Critical bounds and optimal band of one sensor. */
struct SensorThresholds {
    double min = 0.0;
    double max = 0.0;
    double optMin = 0.0;
    double optMax = 0.0;
};

/** @brief Graded risk / stress level. */
enum class RiskLevel : uint8_t { None = 0, Medium, High, Extreme };

/** @brief Built-in thresholds for a sensor kind. */
SensorThresholds defaultThresholds(SensorKind kind);

/**
 * @brief Threshold status with a warning band of 15% of the critical range
 * inside each bound.
 */
ReadingStatus evaluateStatus(double value, const SensorThresholds& th);

/**
 * @brief Position of a value relative to its band: `critically_low`,
 * `warning_low`, `normal_low`, `optimal`, `normal_high`, `warning_high`,
 * `critically_high`.
 */
const char* statusDescription(double value, const SensorThresholds& th);

struct SoilAnalysis {
    ReadingStatus status = ReadingStatus::Unknown;
    bool needsWater = false;
    RiskLevel risk = RiskLevel::None;
    const char* recommendation = "optimal";
};

SoilAnalysis analyzeSoil(double value, const SensorThresholds& th);

enum class SoilTrend : uint8_t { Unknown = 0, Stable, Decreasing, Increasing };

/** @brief Soil moisture trend over the last 24 h. */
struct SoilTrendAnalysis {
    SoilTrend trend = SoilTrend::Unknown;
    double ratePerHour = 0.0;
    bool hasHoursUntilDry = false;
    double hoursUntilDry = 0.0;
    uint16_t samples = 0;
    double mean = 0.0;
    double median = 0.0;
    double minValue = 0.0;
    double maxValue = 0.0;
    const char* recommendation = "collect_more_data";
};

/**
 * @brief Trend from samples in any order.
 *
 * Needs at least two samples inside the 24 h window ending at nowMs, spanning
 * one hour or more; otherwise the trend is unknown.
 */
SoilTrendAnalysis analyzeSoilTrend(const SoilSample* samples, uint16_t count,
                                   const SensorThresholds& th, uint64_t nowMs);

struct TemperatureAnalysis {
    ReadingStatus status = ReadingStatus::Unknown;
    RiskLevel stress = RiskLevel::None;
    const char* growthCondition = "optimal_growth";
};

TemperatureAnalysis analyzeTemperature(double value, const SensorThresholds& th);

enum class HumidityCondition : uint8_t { VeryDry = 0, Dry, Comfortable, Humid, VeryHumid };

struct HumidityAnalysis {
    ReadingStatus status = ReadingStatus::Unknown;
    HumidityCondition condition = HumidityCondition::Comfortable;
    /** low / medium / high / severe */
    const char* diseaseRisk = "low";
};

HumidityAnalysis analyzeHumidity(double value, const SensorThresholds& th);

struct LightAnalysis {
    ReadingStatus status = ReadingStatus::Unknown;
    const char* condition = "moderate";
};

LightAnalysis analyzeLight(double value, const SensorThresholds& th);

/** @brief Most severe status among the valid readings, unknown when none. */
ReadingStatus overallStatus(const EnvironmentSnapshot& snap);

/** @brief Thresholds used by one analysis pass (soil is configurable). */
struct AnalysisThresholds {
    SensorThresholds soil = defaultThresholds(SensorKind::SoilMoisture);
    SensorThresholds temperature = defaultThresholds(SensorKind::Temperature);
    SensorThresholds humidity = defaultThresholds(SensorKind::Humidity);
    SensorThresholds light = defaultThresholds(SensorKind::Light);
};

/** @brief Rule-based irrigation recommendation. */
struct IrrigationRecommendation {
    bool needsWater = false;
    Urgency urgency = Urgency::None;
    char reason[Limits::Irrigation::Message] = {0};
    WaterAmount amount = WaterAmount::None;
    ReadingStatus overall = ReadingStatus::Unknown;
    bool hasSoil = false;
    double soilMoisture = 0.0;
    ReadingStatus soilStatus = ReadingStatus::Unknown;
};

/** @brief Analyze a snapshot and derive need, urgency, reason and amount. */
IrrigationRecommendation buildIrrigationRecommendation(const EnvironmentSnapshot& snap,
                                                       const AnalysisThresholds& th);

const char* riskLevelStr(RiskLevel r);
const char* soilTrendStr(SoilTrend t);
const char* humidityConditionStr(HumidityCondition c);
