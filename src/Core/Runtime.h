#pragma once
/**
 * @file Runtime.h
 * @brief Host runtime helpers: uptime, wall clock and ISO-8601 timestamps.
 */
#include <stddef.h>
#include <stdint.h>
#include <time.h>

/** @brief Overridable wall clock source (tests drive time through this). */
struct ClockHooks {
    uint64_t (*nowEpochMs)(void* ctx);
    void* ctx;
};

/** @brief Milliseconds since process start (monotonic). */
uint32_t millis();

namespace Clock {
    /** @brief Install a wall clock source, or nullptr to restore the system clock. */
    void setHooks(const ClockHooks* hooks);

    /** @brief Current wall time in epoch milliseconds. */
    uint64_t nowEpochMs();
    /** @brief Current wall time in epoch seconds. */
    int64_t nowEpochSec();
    /** @brief Whether the wall clock looks synchronized (after 2021-01-01). */
    bool isWallTimeValid();

    /** @brief Break an epoch millisecond timestamp into local calendar fields. */
    bool toLocalTm(uint64_t epochMs, struct tm& out);

    /** @brief Format as UTC ISO-8601 (`YYYY-MM-DDTHH:MM:SSZ`). */
    bool formatIso8601(uint64_t epochMs, char* out, size_t outLen);
    /**
     * @brief Parse ISO-8601 (`Z`, `+hh:mm` offsets and fractional seconds accepted).
     * Timestamps without offset are read as UTC.
     */
    bool parseIso8601(const char* s, uint64_t& outEpochMs);
}
