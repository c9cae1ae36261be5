#pragma once
/**
 * @file DecisionCodec.h
 * @brief JSON mapping of decisions and queued AI recommendations.
 */
#include <string>

#include "Core/Services/IDecision.h"

bool encodeDecision(const Decision& d, std::string& out);
bool decodeDecision(const char* json, Decision& out);

bool encodeAiRecommendation(const AiRecommendation& rec, std::string& out);
/**
 * @brief Parse `{should_irrigate, duration_minutes, reason, confidence, zones}`.
 * Confidence is clamped to [0,1]; `zones` may be an array or a string.
 */
bool decodeAiRecommendation(const char* json, AiRecommendation& out);

/** @brief Water-amount class from a recommended duration in minutes. */
WaterAmount waterAmountFromMinutes(double minutes);
