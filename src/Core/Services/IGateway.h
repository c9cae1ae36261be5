#pragma once
/**
 * @file IGateway.h
 * @brief IoT feed gateway service interface and shared feed types.
 */
#include <stddef.h>
#include <stdint.h>
#include "Core/SystemLimits.h"

/** @brief Classified outcome of one gateway call. */
enum class GatewayStatus : uint8_t {
    Ok = 0,
    Unauthorized,   ///< 401/403: fatal, never retried
    NotFound,       ///< 404: triggers provisioning
    Transient,      ///< 429/5xx/transport: retried with fixed delay
    Failed          ///< other client errors / malformed responses
};

/** @brief Transport that served the last gateway call. */
enum class FeedTransport : uint8_t { None = 0, PubSub, Rest };

/** @brief Parsed state of a switch-like feed (`1/ON/TRUE/YES`, `0/OFF/FALSE/NO`). */
enum class FeedSwitchState : int8_t { Unknown = -1, Off = 0, On = 1 };

/** @brief One data point of a feed. */
struct FeedReading {
    char feedKey[Limits::Gateway::FeedKey] = {0};
    char id[40] = {0};
    char value[Limits::Gateway::FeedValue] = {0};
    bool isNumber = false;
    double number = 0.0;
    uint64_t createdAtMs = 0;  ///< 0 when the platform did not provide it
};

/** @brief Inbound pub/sub callback (runs on the network thread, must not block). */
using FeedHandlerFn = void (*)(void* user, const char* feedKey, const char* payload);

/** @brief Service wrapper exposed by GatewayModule. */
struct GatewayService {
    /** @brief Check-then-create a feed (cached once provisioned). */
    bool (*ensureFeed)(void* ctx, const char* feedKey);
    /** @brief Check-then-create a feed group. */
    bool (*ensureGroup)(void* ctx, const char* groupKey, const char* name);
    /** @brief Ensure each feed; returns how many are provisioned. */
    uint8_t (*initializeFeeds)(void* ctx, const char* const* feedKeys, uint8_t count);
    /** @brief Publish, pub/sub first then REST fallback. */
    bool (*publish)(void* ctx, const char* feedKey, const char* value);
    bool (*getLatest)(void* ctx, const char* feedKey, FeedReading* out);
    /** @brief Newest first; returns the number of items written to out. */
    uint16_t (*getHistory)(void* ctx, const char* feedKey, uint16_t limit, FeedReading* out, uint16_t max);
    bool (*registerHandler)(void* ctx, const char* feedKey, FeedHandlerFn fn, void* user);
    /** @brief Ensure the feed then publish `1`/`0`. */
    bool (*setSwitch)(void* ctx, const char* feedKey, bool on);
    FeedSwitchState (*switchState)(void* ctx, const char* feedKey);
    bool (*isPubSubConnected)(void* ctx);
    FeedTransport (*lastTransport)(void* ctx);
    void* ctx;
};

static inline const char* gatewayStatusStr(GatewayStatus s)
{
    switch (s) {
    case GatewayStatus::Ok: return "ok";
    case GatewayStatus::Unauthorized: return "unauthorized";
    case GatewayStatus::NotFound: return "not_found";
    case GatewayStatus::Transient: return "transient";
    case GatewayStatus::Failed: return "failed";
    }
    return "failed";
}

static inline const char* feedTransportStr(FeedTransport t)
{
    switch (t) {
    case FeedTransport::None: return "none";
    case FeedTransport::PubSub: return "mqtt";
    case FeedTransport::Rest: return "rest";
    }
    return "none";
}
