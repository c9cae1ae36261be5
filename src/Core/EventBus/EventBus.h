#pragma once
/**
 * @file EventBus.h
 * @brief Simple queued event bus with fixed-size payloads.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <deque>
#include <mutex>

#include "EventId.h"
#include "Core/SystemLimits.h"

#ifndef EVENTBUS_PROFILE
#define EVENTBUS_PROFILE 1
#endif

#ifndef EVENTBUS_HANDLER_WARN_US
#define EVENTBUS_HANDLER_WARN_US 50000  // 50ms
#endif

#ifndef EVENTBUS_DISPATCH_WARN_US
#define EVENTBUS_DISPATCH_WARN_US 200000 // 200ms for a batch
#endif

#ifndef EVENTBUS_WARN_MIN_INTERVAL_MS
#define EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/** @brief Event delivered to subscribers during dispatch(). */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

/** @brief Callback signature for event subscribers. */
using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Thread-safe event queue with subscriber dispatch.
 */
class EventBus {
public:
    static constexpr uint16_t MAX_SUBSCRIBERS = 24;

    // Maximum payload size copied into internal queue.
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 48;

    // Maximum number of queued events.
    static constexpr uint16_t QUEUE_LENGTH = Limits::EventQueueLen;

    EventBus() = default;
    ~EventBus() = default;

    /** @brief Subscribe to an event id (call during init). */
    bool subscribe(EventId id, EventCallback cb, void* user);

    /**
     * @brief Post an event from any thread; payload is copied into the queue.
     */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    /** @brief Dispatch queued events and call subscribers. */
    uint16_t dispatch(uint16_t maxEvents = 8);

    /** @brief Number of events dropped because the queue was full. */
    uint32_t dropped() const;

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    mutable std::mutex _mtx;
    Subscriber _subs[MAX_SUBSCRIBERS]{};
    uint16_t _count = 0;

    std::deque<QueuedEvent> _queue;
    uint32_t _dropped = 0;

    void dispatchOne(const QueuedEvent& qe);
};
