/**
 * @file FeedCodec.cpp
 * @brief Implementation file.
 */
#include "FeedCodec.h"
#include "Core/Runtime.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

namespace {

/// Copy `in` without surrounding whitespace; false when it does not fit.
bool trimmedCopy(const char* in, char* out, size_t outLen)
{
    if (!in || !out || outLen == 0) return false;
    while (*in && isspace((unsigned char)*in)) ++in;
    size_t len = strlen(in);
    while (len > 0 && isspace((unsigned char)in[len - 1])) --len;
    if (len >= outLen) return false;
    memcpy(out, in, len);
    out[len] = '\0';
    return true;
}

}  // namespace

FeedSwitchState parseSwitchValue(const char* value)
{
    char v[16];
    if (!trimmedCopy(value, v, sizeof(v))) return FeedSwitchState::Unknown;

    static const char* const kOn[] = {"1", "ON", "TRUE", "YES"};
    static const char* const kOff[] = {"0", "OFF", "FALSE", "NO"};
    for (const char* s : kOn) {
        if (strcasecmp(v, s) == 0) return FeedSwitchState::On;
    }
    for (const char* s : kOff) {
        if (strcasecmp(v, s) == 0) return FeedSwitchState::Off;
    }
    return FeedSwitchState::Unknown;
}

bool parseFeedNumber(const char* value, double& out)
{
    char v[Limits::Gateway::FeedValue];
    if (!trimmedCopy(value, v, sizeof(v)) || v[0] == '\0') return false;
    char* end = nullptr;
    const double d = strtod(v, &end);
    if (!end || *end != '\0') return false;
    out = d;
    return true;
}

void fillFeedReading(FeedReading& out, const char* feedKey, const char* id,
                     const char* value, const char* createdAtIso)
{
    out = FeedReading{};
    snprintf(out.feedKey, sizeof(out.feedKey), "%s", feedKey ? feedKey : "");
    snprintf(out.id, sizeof(out.id), "%s", id ? id : "");
    snprintf(out.value, sizeof(out.value), "%s", value ? value : "");
    out.isNumber = parseFeedNumber(out.value, out.number);
    if (createdAtIso && createdAtIso[0] != '\0') {
        uint64_t ms = 0;
        if (Clock::parseIso8601(createdAtIso, ms)) out.createdAtMs = ms;
    }
}

bool formatFeedTopic(char* out, size_t outLen, const char* account, const char* feedKey)
{
    if (!out || outLen == 0 || !account || !feedKey) return false;
    const int n = snprintf(out, outLen, "%s/feeds/%s", account, feedKey);
    return n > 0 && (size_t)n < outLen;
}

bool feedKeyFromTopic(const char* topic, char* out, size_t outLen)
{
    if (!topic || !out || outLen == 0) return false;
    uint8_t segments = 1;
    for (const char* p = topic; *p; ++p) {
        if (*p == '/') ++segments;
    }
    if (segments < 3) return false;
    const char* last = strrchr(topic, '/');
    const char* key = last ? last + 1 : topic;
    if (key[0] == '\0') return false;
    const int n = snprintf(out, outLen, "%s", key);
    return n > 0 && (size_t)n < outLen;
}
