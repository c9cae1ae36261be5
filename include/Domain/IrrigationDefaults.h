#pragma once

#include <stdint.h>

namespace IrrigationDefaults {

// Actuator
constexpr int32_t MaxRuntimeSec = 1800;
constexpr int32_t MinIntervalSec = 3600;
constexpr double FlowRateLitresPerSec = 0.5;
constexpr int32_t DefaultDurationSec = 300;
constexpr int32_t HistoryMax = 50;
constexpr int32_t PumpStatusIntervalSec = 15;
constexpr char PumpFeedKey[] = "water-pump-control";

// Scheduler
constexpr int32_t ScheduleCheckIntervalSec = 60;
constexpr int32_t ScheduleCheckIntervalMinSec = 30;
constexpr uint32_t ScheduleCacheTtlSec = 3600;

// Decision loop
constexpr int32_t DecisionMinIntervalSec = 3600;
constexpr int32_t DecisionMinIntervalFloorSec = 60;
constexpr int32_t DecisionCheckIntervalSec = 900;
constexpr int32_t DecisionCheckIntervalMinSec = 300;
constexpr int32_t DurationLightSec = 60;
constexpr int32_t DurationNormalSec = 180;
constexpr int32_t DurationHeavySec = 300;
constexpr double AiMinConfidence = 0.7;
constexpr int32_t DecisionHistoryMax = 100;
constexpr uint32_t DecisionLastTtlSec = 1800;
constexpr uint32_t AiRecommendationTtlSec = 3600;
/** AI duration (minutes) above which the class is heavy / moderate. */
constexpr double AiHeavyAboveMin = 15.0;
constexpr double AiModerateAboveMin = 5.0;

// Environment
constexpr int32_t SensorMaxAgeSec = 300;
constexpr int32_t SensorCollectIntervalSec = 60;
constexpr uint32_t SensorCacheTtlSec = 600;
constexpr double WarningMarginRatio = 0.15;

constexpr double SoilMin = 20.0;
constexpr double SoilMax = 90.0;
constexpr double SoilOptMin = 40.0;
constexpr double SoilOptMax = 70.0;
/** Soil trend: below this absolute rate (%/h) the trend is stable. */
constexpr double SoilStableRatePerHour = 0.5;

constexpr double TempMin = 10.0;
constexpr double TempMax = 40.0;
constexpr double TempOptMin = 18.0;
constexpr double TempOptMax = 30.0;
constexpr double TempStressMargin = 3.0;
/** Temperature above which heat stress alone requests irrigation. */
constexpr double TempIrrigateAbove = 30.0;

constexpr double HumidityMin = 30.0;
constexpr double HumidityMax = 90.0;
constexpr double HumidityOptMin = 40.0;
constexpr double HumidityOptMax = 70.0;

constexpr double LightMin = 200.0;
constexpr double LightMax = 10000.0;
constexpr double LightOptMin = 1000.0;
constexpr double LightOptMax = 7000.0;

// Orchestrator
constexpr int32_t PumpStatusCheckSec = 15;

}  // namespace IrrigationDefaults
