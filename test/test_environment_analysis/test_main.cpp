#include <unity.h>
#include <math.h>
#include <string.h>

#include "Modules/EnvironmentModule/EnvironmentAnalysis.h"

void setUp() {}
void tearDown() {}

static void setReading(EnvironmentSnapshot& snap, SensorKind kind, double value)
{
    SensorReading& r = snap.at(kind);
    r.valid = true;
    r.kind = kind;
    r.value = value;
    r.tsMs = 1000;
}

void test_soil_below_min_is_extreme_and_needs_water()
{
    const SoilAnalysis a = analyzeSoil(15.0, defaultThresholds(SensorKind::SoilMoisture));
    TEST_ASSERT_TRUE(a.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Critical, (uint8_t)a.status);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RiskLevel::Extreme, (uint8_t)a.risk);
    TEST_ASSERT_EQUAL_STRING("water_immediately", a.recommendation);
}

void test_soil_bands()
{
    const SensorThresholds th = defaultThresholds(SensorKind::SoilMoisture);
    // optMin 40, margin 5
    TEST_ASSERT_EQUAL_STRING("water_soon", analyzeSoil(30.0, th).recommendation);
    TEST_ASSERT_EQUAL_STRING("monitor", analyzeSoil(37.0, th).recommendation);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RiskLevel::Medium, (uint8_t)analyzeSoil(37.0, th).risk);
    TEST_ASSERT_EQUAL_STRING("optimal", analyzeSoil(55.0, th).recommendation);
    TEST_ASSERT_FALSE(analyzeSoil(55.0, th).needsWater);
    TEST_ASSERT_EQUAL_STRING("no_water_needed", analyzeSoil(80.0, th).recommendation);
    TEST_ASSERT_EQUAL_STRING("stop_watering", analyzeSoil(95.0, th).recommendation);
}

void test_status_warning_band_is_fifteen_percent()
{
    const SensorThresholds th = defaultThresholds(SensorKind::SoilMoisture);
    // range 70 -> warning band 10.5
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Warning, (uint8_t)evaluateStatus(25.0, th));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Normal, (uint8_t)evaluateStatus(31.0, th));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Warning, (uint8_t)evaluateStatus(85.0, th));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Unknown, (uint8_t)evaluateStatus(NAN, th));
    TEST_ASSERT_EQUAL_STRING("critically_low", statusDescription(10.0, th));
    TEST_ASSERT_EQUAL_STRING("warning_high", statusDescription(85.0, th));
}

void test_dry_soil_recommends_heavy_high_urgency()
{
    EnvironmentSnapshot snap;
    setReading(snap, SensorKind::SoilMoisture, 15.0);
    setReading(snap, SensorKind::Temperature, 24.0);

    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, AnalysisThresholds{});
    TEST_ASSERT_TRUE(rec.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::High, (uint8_t)rec.urgency);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Heavy, (uint8_t)rec.amount);
    TEST_ASSERT_EQUAL_STRING("soil_too_dry", rec.reason);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Critical, (uint8_t)rec.overall);
    TEST_ASSERT_TRUE(rec.hasSoil);
}

void test_somewhat_dry_soil_is_moderate()
{
    EnvironmentSnapshot snap;
    setReading(snap, SensorKind::SoilMoisture, 37.0);

    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, AnalysisThresholds{});
    TEST_ASSERT_TRUE(rec.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::Medium, (uint8_t)rec.urgency);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::Moderate, (uint8_t)rec.amount);
    TEST_ASSERT_EQUAL_STRING("soil_somewhat_dry", rec.reason);
}

void test_heat_stress_alone_requests_water()
{
    EnvironmentSnapshot snap;
    setReading(snap, SensorKind::SoilMoisture, 55.0);
    setReading(snap, SensorKind::Temperature, 38.0);

    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, AnalysisThresholds{});
    TEST_ASSERT_TRUE(rec.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::Medium, (uint8_t)rec.urgency);
    TEST_ASSERT_EQUAL_STRING("high_temperature", rec.reason);
}

void test_optimal_conditions_need_nothing()
{
    EnvironmentSnapshot snap;
    setReading(snap, SensorKind::SoilMoisture, 55.0);
    setReading(snap, SensorKind::Temperature, 24.0);
    setReading(snap, SensorKind::Humidity, 55.0);

    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, AnalysisThresholds{});
    TEST_ASSERT_FALSE(rec.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WaterAmount::None, (uint8_t)rec.amount);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ReadingStatus::Normal, (uint8_t)rec.overall);
}

void test_configured_soil_thresholds_win()
{
    EnvironmentSnapshot snap;
    setReading(snap, SensorKind::SoilMoisture, 45.0);

    AnalysisThresholds th;
    th.soil.min = 30.0;
    th.soil.max = 95.0;
    th.soil.optMin = 60.0;
    th.soil.optMax = 80.0;
    const IrrigationRecommendation rec = buildIrrigationRecommendation(snap, th);
    TEST_ASSERT_TRUE(rec.needsWater);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)Urgency::High, (uint8_t)rec.urgency);
}

void test_soil_trend_decreasing()
{
    const uint64_t hour = 3600ULL * 1000ULL;
    const uint64_t now = 100 * hour;
    SoilSample s[3];
    s[0] = SoilSample{50.0, now - 4 * hour};
    s[1] = SoilSample{46.0, now - 2 * hour};
    s[2] = SoilSample{42.0, now};

    const SoilTrendAnalysis a = analyzeSoilTrend(s, 3, defaultThresholds(SensorKind::SoilMoisture), now);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SoilTrend::Decreasing, (uint8_t)a.trend);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, -2.0, a.ratePerHour);
    TEST_ASSERT_TRUE(a.hasHoursUntilDry);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 11.0, a.hoursUntilDry);
    TEST_ASSERT_EQUAL_STRING("schedule_watering", a.recommendation);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 46.0, a.median);
}

void test_soil_trend_needs_an_hour_of_data()
{
    const uint64_t now = 1000ULL * 3600ULL * 1000ULL;
    SoilSample s[2];
    s[0] = SoilSample{50.0, now - 10 * 60 * 1000};
    s[1] = SoilSample{40.0, now};

    const SoilTrendAnalysis a = analyzeSoilTrend(s, 2, defaultThresholds(SensorKind::SoilMoisture), now);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SoilTrend::Unknown, (uint8_t)a.trend);
    TEST_ASSERT_EQUAL_STRING("collect_more_data", a.recommendation);
}

void test_humidity_disease_risk()
{
    const SensorThresholds th = defaultThresholds(SensorKind::Humidity);
    TEST_ASSERT_EQUAL_STRING("severe", analyzeHumidity(88.0, th).diseaseRisk);
    TEST_ASSERT_EQUAL_STRING("low", analyzeHumidity(50.0, th).diseaseRisk);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)HumidityCondition::VeryDry, (uint8_t)analyzeHumidity(20.0, th).condition);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_soil_below_min_is_extreme_and_needs_water);
    RUN_TEST(test_soil_bands);
    RUN_TEST(test_status_warning_band_is_fifteen_percent);
    RUN_TEST(test_dry_soil_recommends_heavy_high_urgency);
    RUN_TEST(test_somewhat_dry_soil_is_moderate);
    RUN_TEST(test_heat_stress_alone_requests_water);
    RUN_TEST(test_optimal_conditions_need_nothing);
    RUN_TEST(test_configured_soil_thresholds_win);
    RUN_TEST(test_soil_trend_decreasing);
    RUN_TEST(test_soil_trend_needs_an_hour_of_data);
    RUN_TEST(test_humidity_disease_risk);
    return UNITY_END();
}
