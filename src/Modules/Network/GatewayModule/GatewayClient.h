#pragma once
/**
 * @file GatewayClient.h
 * @brief Dual-transport feed client with retry policy and feed provisioning.
 */
#include <stdint.h>

#include <mutex>
#include <string>
#include <vector>

#include "Core/SystemLimits.h"
#include "FeedPorts.h"

/** @brief Retry and provisioning policy. */
struct GatewayClientConfig {
    uint8_t maxRetries = 3;          ///< attempts per REST call (>= 1)
    uint32_t retryDelayMs = 1000;    ///< fixed delay between attempts
    bool autoCreate = true;          ///< create missing feeds on read/switch
};

/** @brief Sleep hook used between retries (tests install a no-op). */
using GatewayDelayFn = void (*)(void* ctx, uint32_t ms);

/**
 * @brief Bridges in-process logic to the feed platform.
 *
 * Writes go through the pub/sub channel when it is connected and fall back
 * to REST. Provisioning and reads always use REST. Either transport may be
 * null. Thread-safe.
 */
class GatewayClient {
public:
    GatewayClient(FeedRestApi* rest, FeedPubSub* pubsub);

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    void configure(const GatewayClientConfig& cfg);
    void setDelayHook(GatewayDelayFn fn, void* ctx);

    /**
     * @brief Check-then-create a feed.
     * @param name display name (defaults to the key)
     * @param groupKey optional group ensured first
     */
    GatewayStatus ensureFeed(const char* feedKey, const char* name = nullptr,
                             const char* description = nullptr, const char* groupKey = nullptr);
    GatewayStatus ensureGroup(const char* groupKey, const char* name);
    /** @brief Ensure every feed, logging a summary; returns how many are provisioned. */
    uint8_t initializeFeeds(const char* const* feedKeys, uint8_t count);

    /** @brief Pub/sub first then REST; records the transport that served the call. */
    bool publish(const char* feedKey, const char* value);
    /** @brief Newest value; false when missing or unreadable. */
    bool getLatest(const char* feedKey, FeedReading& out);
    /** @brief Newest first, at most `limit` (capped to Limits::Gateway::MaxHistory). */
    uint16_t getHistory(const char* feedKey, uint16_t limit, std::vector<FeedReading>& out);

    bool registerHandler(const char* feedKey, FeedHandlerFn fn, void* user);
    /** @brief Ensure the feed (when auto-create is on) then publish `1`/`0`. */
    bool setSwitch(const char* feedKey, bool on);
    FeedSwitchState switchState(const char* feedKey);

    bool isPubSubConnected() const;
    FeedTransport lastTransport() const;
    bool isProvisioned(const char* feedKey) const;
    uint8_t handlerCount() const;

    /** @brief Resubscribe every handler topic (call on each pub/sub connect). */
    void onPubSubConnected();
    /** @brief Deliver one inbound message to the handlers of its feed. */
    void dispatchInbound(const char* feedKey, const char* payload);

private:
    struct Handler {
        char feedKey[Limits::Gateway::FeedKey];
        FeedHandlerFn fn;
        void* user;
    };

    FeedRestApi* rest_;
    FeedPubSub* pubsub_;
    GatewayClientConfig cfg_;
    GatewayDelayFn delayFn_;
    void* delayCtx_ = nullptr;

    mutable std::mutex mtx_;
    std::vector<std::string> provisioned_;
    Handler handlers_[Limits::Gateway::MaxHandlers]{};
    uint8_t handlerCount_ = 0;
    FeedTransport lastTransport_ = FeedTransport::None;

    template <typename Op>
    GatewayStatus withRetry_(const char* what, const char* key, Op op);

    void rememberProvisioned_(const char* feedKey);
    void setLastTransport_(FeedTransport t);
    static void sleepDefault_(void*, uint32_t ms);
};
