/**
 * @file Runtime.cpp
 * @brief Implementation file.
 */
#include "Core/Runtime.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctype.h>

namespace {
    const auto g_bootTime = std::chrono::steady_clock::now();
    std::atomic<const ClockHooks*> g_hooks{nullptr};

    bool isLeap(int y) { return ((y % 4) == 0 && (y % 100) != 0) || ((y % 400) == 0); }

    /// Civil date to epoch seconds (UTC), independent of TZ.
    int64_t civilToEpoch(int y, int mon, int d, int h, int mi, int s)
    {
        static const int kCumDays[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
        int64_t days = 0;
        for (int yy = 1970; yy < y; ++yy) days += isLeap(yy) ? 366 : 365;
        days += kCumDays[mon - 1];
        if (mon > 2 && isLeap(y)) days += 1;
        days += d - 1;
        return days * 86400LL + h * 3600LL + mi * 60LL + s;
    }
}

uint32_t millis()
{
    const auto dt = std::chrono::steady_clock::now() - g_bootTime;
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
}

void Clock::setHooks(const ClockHooks* hooks)
{
    g_hooks.store(hooks);
}

uint64_t Clock::nowEpochMs()
{
    const ClockHooks* h = g_hooks.load();
    if (h && h->nowEpochMs) return h->nowEpochMs(h->ctx);
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

int64_t Clock::nowEpochSec()
{
    return (int64_t)(nowEpochMs() / 1000ULL);
}

bool Clock::isWallTimeValid()
{
    return nowEpochSec() > 1609459200; ///< 2021-01-01 00:00:00
}

bool Clock::toLocalTm(uint64_t epochMs, struct tm& out)
{
    const time_t t = (time_t)(epochMs / 1000ULL);
    return localtime_r(&t, &out) != nullptr;
}

bool Clock::formatIso8601(uint64_t epochMs, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    const time_t t = (time_t)(epochMs / 1000ULL);
    struct tm tmv{};
    if (!gmtime_r(&t, &tmv)) {
        out[0] = '\0';
        return false;
    }
    const size_t n = strftime(out, outLen, "%Y-%m-%dT%H:%M:%SZ", &tmv);
    return n > 0;
}

bool Clock::parseIso8601(const char* s, uint64_t& outEpochMs)
{
    if (!s) return false;
    int y = 0, mon = 0, d = 0, h = 0, mi = 0, sec = 0;
    int consumed = 0;
    if (sscanf(s, "%4d-%2d-%2d%*[T ]%2d:%2d:%2d%n", &y, &mon, &d, &h, &mi, &sec, &consumed) < 6) {
        return false;
    }
    if (y < 1970 || mon < 1 || mon > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) {
        return false;
    }

    const char* p = s + consumed;
    uint32_t frac = 0;
    if (*p == '.') {
        ++p;
        uint32_t scale = 100;
        while (isdigit((unsigned char)*p)) {
            frac += (uint32_t)(*p - '0') * scale;
            scale /= 10;
            ++p;
        }
    }

    int64_t offsetSec = 0;
    if (*p == '+' || *p == '-') {
        const int sign = (*p == '-') ? -1 : 1;
        int oh = 0, om = 0;
        if (sscanf(p + 1, "%2d:%2d", &oh, &om) < 1) return false;
        offsetSec = sign * (oh * 3600 + om * 60);
    }

    const int64_t epoch = civilToEpoch(y, mon, d, h, mi, sec) - offsetSec;
    if (epoch < 0) return false;
    outEpochMs = (uint64_t)epoch * 1000ULL + frac;
    return true;
}
