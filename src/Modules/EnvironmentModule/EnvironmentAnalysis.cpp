/**
 * @file EnvironmentAnalysis.cpp
 * @brief Deterministic rule-based analysis of environment readings.
 */

#include "Modules/EnvironmentModule/EnvironmentAnalysis.h"
#include "Domain/IrrigationDefaults.h"

#include <math.h>
#include <string.h>

#include <algorithm>
#include <vector>

namespace {
constexpr uint64_t kTrendWindowMs = 24ULL * 3600ULL * 1000ULL;
constexpr double kMsPerHour = 3600.0 * 1000.0;
constexpr double kSoilBandMargin = 5.0;
}

SensorThresholds defaultThresholds(SensorKind kind)
{
    using namespace IrrigationDefaults;
    SensorThresholds th;
    switch (kind) {
    case SensorKind::SoilMoisture:
        th.min = SoilMin; th.max = SoilMax; th.optMin = SoilOptMin; th.optMax = SoilOptMax;
        break;
    case SensorKind::Temperature:
        th.min = TempMin; th.max = TempMax; th.optMin = TempOptMin; th.optMax = TempOptMax;
        break;
    case SensorKind::Humidity:
        th.min = HumidityMin; th.max = HumidityMax; th.optMin = HumidityOptMin; th.optMax = HumidityOptMax;
        break;
    case SensorKind::Light:
    default:
        th.min = LightMin; th.max = LightMax; th.optMin = LightOptMin; th.optMax = LightOptMax;
        break;
    }
    return th;
}

ReadingStatus evaluateStatus(double value, const SensorThresholds& th)
{
    if (!isfinite(value)) return ReadingStatus::Unknown;
    const double warning = (th.max - th.min) * IrrigationDefaults::WarningMarginRatio;

    if (value < th.min) return ReadingStatus::Critical;
    if (value < th.min + warning) return ReadingStatus::Warning;
    if (value > th.max) return ReadingStatus::Critical;
    if (value > th.max - warning) return ReadingStatus::Warning;
    return ReadingStatus::Normal;
}

const char* statusDescription(double value, const SensorThresholds& th)
{
    const double range = th.max - th.min;
    switch (evaluateStatus(value, th)) {
    case ReadingStatus::Critical:
        return (value < th.min) ? "critically_low" : "critically_high";
    case ReadingStatus::Warning:
        return (value < th.min + range / 2.0) ? "warning_low" : "warning_high";
    case ReadingStatus::Normal:
        if (value < th.min + range / 3.0) return "normal_low";
        if (value > th.min + 2.0 * range / 3.0) return "normal_high";
        return "optimal";
    default:
        return "unknown";
    }
}

SoilAnalysis analyzeSoil(double value, const SensorThresholds& th)
{
    SoilAnalysis out;
    out.status = evaluateStatus(value, th);
    out.needsWater = value < th.optMin;

    if (value < th.min) out.risk = RiskLevel::Extreme;
    else if (value < th.optMin - kSoilBandMargin) out.risk = RiskLevel::High;
    else if (value < th.optMin) out.risk = RiskLevel::Medium;
    else if (value > th.max) out.risk = RiskLevel::High;
    else if (value > th.optMax + kSoilBandMargin) out.risk = RiskLevel::Medium;
    else out.risk = RiskLevel::None;

    if (value < th.min) out.recommendation = "water_immediately";
    else if (value < th.optMin - kSoilBandMargin) out.recommendation = "water_soon";
    else if (value < th.optMin) out.recommendation = "monitor";
    else if (value > th.max) out.recommendation = "stop_watering";
    else if (value > th.optMax) out.recommendation = "no_water_needed";
    else out.recommendation = "optimal";
    return out;
}

static const char* soilTrendRecommendation_(const SoilTrendAnalysis& a, double current, const SensorThresholds& th)
{
    if (a.trend == SoilTrend::Unknown) return "collect_more_data";
    if (current < th.min) return "water_immediately";

    switch (a.trend) {
    case SoilTrend::Decreasing:
        if (a.hasHoursUntilDry && a.hoursUntilDry < 3.0) return "water_soon";
        if (a.hasHoursUntilDry && a.hoursUntilDry < 12.0) return "schedule_watering";
        if (current < th.optMin) return "monitor_closely";
        return "normal_monitoring";
    case SoilTrend::Stable:
        if (current < th.optMin) return "consider_watering";
        if (current > th.optMax) return "monitor_for_excess";
        return "maintain_current_conditions";
    case SoilTrend::Increasing:
    default:
        if (current > th.max) return "stop_watering";
        if (current > th.optMax) return "reduce_watering";
        return "normal_monitoring";
    }
}

SoilTrendAnalysis analyzeSoilTrend(const SoilSample* samples, uint16_t count,
                                   const SensorThresholds& th, uint64_t nowMs)
{
    SoilTrendAnalysis out;
    if (!samples || count == 0) return out;

    const uint64_t cutoff = (nowMs > kTrendWindowMs) ? (nowMs - kTrendWindowMs) : 0;
    std::vector<SoilSample> recent;
    recent.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        if (samples[i].tsMs >= cutoff && isfinite(samples[i].value)) recent.push_back(samples[i]);
    }
    out.samples = (uint16_t)recent.size();
    if (recent.size() < 2) return out;

    std::stable_sort(recent.begin(), recent.end(),
                     [](const SoilSample& a, const SoilSample& b) { return a.tsMs < b.tsMs; });

    const SoilSample& first = recent.front();
    const SoilSample& last = recent.back();
    const double hours = (double)(last.tsMs - first.tsMs) / kMsPerHour;
    if (hours < 1.0) return out;

    out.ratePerHour = (last.value - first.value) / hours;
    if (fabs(out.ratePerHour) < IrrigationDefaults::SoilStableRatePerHour) out.trend = SoilTrend::Stable;
    else out.trend = (out.ratePerHour < 0.0) ? SoilTrend::Decreasing : SoilTrend::Increasing;

    if (out.ratePerHour < 0.0) {
        const double toMin = last.value - th.min;
        if (toMin > 0.0) {
            out.hasHoursUntilDry = true;
            out.hoursUntilDry = toMin / fabs(out.ratePerHour);
        }
    }

    std::vector<double> values;
    values.reserve(recent.size());
    double sum = 0.0;
    for (const SoilSample& s : recent) {
        values.push_back(s.value);
        sum += s.value;
    }
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    out.mean = sum / (double)n;
    out.median = (n % 2 == 1) ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
    out.minValue = values.front();
    out.maxValue = values.back();

    out.recommendation = soilTrendRecommendation_(out, last.value, th);
    return out;
}

TemperatureAnalysis analyzeTemperature(double value, const SensorThresholds& th)
{
    const double margin = IrrigationDefaults::TempStressMargin;
    TemperatureAnalysis out;
    out.status = evaluateStatus(value, th);

    if (value < th.min) {
        out.stress = RiskLevel::Extreme;
        out.growthCondition = "growth_halted";
    } else if (value < th.optMin - margin) {
        out.stress = RiskLevel::High;
        out.growthCondition = "slow_growth";
    } else if (value < th.optMin) {
        out.stress = RiskLevel::Medium;
        out.growthCondition = "reduced_growth";
    } else if (value > th.max) {
        out.stress = RiskLevel::Extreme;
        out.growthCondition = "heat_damage";
    } else if (value > th.optMax + margin) {
        out.stress = RiskLevel::High;
        out.growthCondition = "stressed_growth";
    } else if (value > th.optMax) {
        out.stress = RiskLevel::Medium;
        out.growthCondition = "suboptimal_growth";
    } else {
        out.stress = RiskLevel::None;
        out.growthCondition = "optimal_growth";
    }
    return out;
}

HumidityAnalysis analyzeHumidity(double value, const SensorThresholds& th)
{
    HumidityAnalysis out;
    out.status = evaluateStatus(value, th);

    if (value < th.min) out.condition = HumidityCondition::VeryDry;
    else if (value < th.optMin) out.condition = HumidityCondition::Dry;
    else if (value > th.max) out.condition = HumidityCondition::VeryHumid;
    else if (value > th.optMax) out.condition = HumidityCondition::Humid;
    else out.condition = HumidityCondition::Comfortable;

    if (value > 85.0) out.diseaseRisk = "severe";
    else if (value > 75.0) out.diseaseRisk = "high";
    else if (value > 65.0) out.diseaseRisk = "medium";
    else out.diseaseRisk = "low";
    return out;
}

LightAnalysis analyzeLight(double value, const SensorThresholds& th)
{
    LightAnalysis out;
    out.status = evaluateStatus(value, th);
    if (value < 50.0) out.condition = "dark";
    else if (value < 200.0) out.condition = "dim";
    else if (value < 1000.0) out.condition = "moderate";
    else if (value < 5000.0) out.condition = "bright";
    else if (value < 10000.0) out.condition = "very_bright";
    else out.condition = "intense";
    return out;
}

ReadingStatus overallStatus(const EnvironmentSnapshot& snap)
{
    ReadingStatus worst = ReadingStatus::Unknown;
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        const SensorReading& r = snap.readings[i];
        if (!r.valid) continue;
        if ((uint8_t)r.status > (uint8_t)worst) worst = r.status;
    }
    return worst;
}

IrrigationRecommendation buildIrrigationRecommendation(const EnvironmentSnapshot& snap,
                                                       const AnalysisThresholds& th)
{
    IrrigationRecommendation rec;

    // Statuses are re-evaluated so configured thresholds win over the sampler's.
    EnvironmentSnapshot graded = snap;
    const SensorThresholds* perKind[SENSOR_KIND_COUNT] = { &th.soil, &th.temperature, &th.humidity, &th.light };
    for (uint8_t i = 0; i < SENSOR_KIND_COUNT; ++i) {
        SensorReading& r = graded.readings[i];
        if (r.valid) r.status = evaluateStatus(r.value, *perKind[i]);
    }
    rec.overall = overallStatus(graded);

    if (graded.has(SensorKind::SoilMoisture)) {
        const double soil = graded.at(SensorKind::SoilMoisture).value;
        const SoilAnalysis sa = analyzeSoil(soil, th.soil);
        rec.hasSoil = true;
        rec.soilMoisture = soil;
        rec.soilStatus = sa.status;
        if (sa.needsWater) {
            rec.needsWater = true;
            if (sa.risk == RiskLevel::Extreme || sa.risk == RiskLevel::High) {
                rec.urgency = Urgency::High;
                strncpy(rec.reason, "soil_too_dry", sizeof(rec.reason) - 1);
            } else if (sa.risk == RiskLevel::Medium) {
                rec.urgency = Urgency::Medium;
                strncpy(rec.reason, "soil_somewhat_dry", sizeof(rec.reason) - 1);
            }
        }
    }

    if (!rec.needsWater && graded.has(SensorKind::Temperature)) {
        const double temp = graded.at(SensorKind::Temperature).value;
        const TemperatureAnalysis ta = analyzeTemperature(temp, th.temperature);
        const bool flagged = ta.status == ReadingStatus::Critical || ta.status == ReadingStatus::Warning;
        const bool stressed = ta.stress == RiskLevel::Extreme || ta.stress == RiskLevel::High;
        if (flagged && stressed && temp > IrrigationDefaults::TempIrrigateAbove) {
            rec.needsWater = true;
            rec.urgency = Urgency::Medium;
            strncpy(rec.reason, "high_temperature", sizeof(rec.reason) - 1);
        }
    }

    if (rec.needsWater && rec.urgency == Urgency::None && graded.has(SensorKind::Humidity)) {
        const HumidityAnalysis ha = analyzeHumidity(graded.at(SensorKind::Humidity).value, th.humidity);
        if (ha.condition == HumidityCondition::VeryDry || ha.condition == HumidityCondition::Dry) {
            rec.urgency = Urgency::High;
            strncat(rec.reason, "_with_dry_air", sizeof(rec.reason) - strlen(rec.reason) - 1);
        }
    }

    if (!rec.needsWater) rec.amount = WaterAmount::None;
    else if (rec.urgency == Urgency::High) rec.amount = WaterAmount::Heavy;
    else if (rec.urgency == Urgency::Medium) rec.amount = WaterAmount::Moderate;
    else rec.amount = WaterAmount::Light;
    return rec;
}

const char* riskLevelStr(RiskLevel r)
{
    switch (r) {
    case RiskLevel::None: return "none";
    case RiskLevel::Medium: return "medium";
    case RiskLevel::High: return "high";
    case RiskLevel::Extreme: return "extreme";
    }
    return "none";
}

const char* soilTrendStr(SoilTrend t)
{
    switch (t) {
    case SoilTrend::Unknown: return "unknown";
    case SoilTrend::Stable: return "stable";
    case SoilTrend::Decreasing: return "decreasing";
    case SoilTrend::Increasing: return "increasing";
    }
    return "unknown";
}

const char* humidityConditionStr(HumidityCondition c)
{
    switch (c) {
    case HumidityCondition::VeryDry: return "very_dry";
    case HumidityCondition::Dry: return "dry";
    case HumidityCondition::Comfortable: return "comfortable";
    case HumidityCondition::Humid: return "humid";
    case HumidityCondition::VeryHumid: return "very_humid";
    }
    return "comfortable";
}
