#pragma once
/**
 * @file FeedCodec.h
 * @brief Feed value parsing and topic helpers.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/Services/IGateway.h"

/** @brief Parse `1/ON/TRUE/YES` and `0/OFF/FALSE/NO` (trimmed, case-insensitive). */
FeedSwitchState parseSwitchValue(const char* value);

/** @brief Parse a whole (trimmed) value as a number. */
bool parseFeedNumber(const char* value, double& out);

/** @brief Fill a reading; `createdAtIso` may be null. */
void fillFeedReading(FeedReading& out, const char* feedKey, const char* id,
                     const char* value, const char* createdAtIso);

/** @brief `{account}/feeds/{feedKey}`. */
bool formatFeedTopic(char* out, size_t outLen, const char* account, const char* feedKey);

/** @brief Feed key is the last segment of `{account}/feeds/{feedKey}`. */
bool feedKeyFromTopic(const char* topic, char* out, size_t outLen);
