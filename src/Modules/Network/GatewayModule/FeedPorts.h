#pragma once
/**
 * @file FeedPorts.h
 * @brief Transport ports used by GatewayClient (pub/sub channel and REST API).
 */
#include <stdint.h>
#include <vector>

#include "Core/Services/IGateway.h"

/**
 * @brief Anything able to write one value to a feed.
 */
class FeedWriter {
public:
    virtual ~FeedWriter() = default;

    /** @brief Short name for logs. */
    virtual const char* name() const = 0;
    virtual FeedTransport kind() const = 0;
    /** @brief Whether a write can be attempted now. */
    virtual bool ready() const = 0;
    virtual GatewayStatus write(const char* feedKey, const char* value) = 0;
};

/**
 * @brief Request/response channel: provisioning and reads.
 */
class FeedRestApi : public FeedWriter {
public:
    FeedTransport kind() const override { return FeedTransport::Rest; }

    virtual GatewayStatus getFeed(const char* feedKey) = 0;
    /** @brief `groupKey` may be null. */
    virtual GatewayStatus createFeed(const char* feedKey, const char* name,
                                     const char* description, const char* groupKey) = 0;
    virtual GatewayStatus getGroup(const char* groupKey) = 0;
    virtual GatewayStatus createGroup(const char* groupKey, const char* name) = 0;
    virtual GatewayStatus readLast(const char* feedKey, FeedReading& out) = 0;
    /** @brief Newest first. */
    virtual GatewayStatus readRange(const char* feedKey, uint16_t limit, std::vector<FeedReading>& out) = 0;
};

/** @brief Inbound message sink (network thread). */
using FeedInboundSink = void (*)(void* user, const char* feedKey, const char* payload);
/** @brief Connection state listener (network thread). */
using FeedConnectionListener = void (*)(void* user, bool connected);

/**
 * @brief Publish/subscribe channel: low-latency writes and pushes.
 */
class FeedPubSub : public FeedWriter {
public:
    FeedTransport kind() const override { return FeedTransport::PubSub; }

    virtual bool subscribe(const char* feedKey) = 0;
    virtual void setInboundSink(FeedInboundSink sink, void* user) = 0;
    virtual void setConnectionListener(FeedConnectionListener listener, void* user) = 0;
};
