/**
 * @file EventBus.cpp
 * @brief Implementation file.
 */
#include "EventBus.h"
#include "Core/Log.h"
#include "Core/Runtime.h"

#include <atomic>
#include <chrono>

#define LOG_TAG_CORE "EventBus"

#if EVENTBUS_PROFILE
static std::atomic<uint32_t> g_lastWarnMs{0};
static bool canWarnNow() {
    uint32_t now = millis();
    uint32_t last = g_lastWarnMs.load();
    if ((uint32_t)(now - last) < EVENTBUS_WARN_MIN_INTERVAL_MS) return false;
    g_lastWarnMs.store(now);
    return true;
}

static uint64_t micros64() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}
#endif

bool EventBus::subscribe(EventId id, EventCallback cb, void* user) {
    if (cb == nullptr) return false;
    std::lock_guard<std::mutex> lk(_mtx);
    if (_count >= MAX_SUBSCRIBERS) return false;

    _subs[_count].id = id;
    _subs[_count].cb = cb;
    _subs[_count].user = user;
    _count++;
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len) {
    if (len > MAX_PAYLOAD_SIZE) return false;

    QueuedEvent qe{};
    qe.id = id;
    qe.len = static_cast<uint8_t>(len);
    if (len > 0 && payload != nullptr) {
        memcpy(qe.data, payload, len);
    }

    /// non-blocking: drop when full
    std::lock_guard<std::mutex> lk(_mtx);
    if (_queue.size() >= QUEUE_LENGTH) {
        ++_dropped;
        return false;
    }
    _queue.push_back(qe);
    return true;
}

uint16_t EventBus::dispatch(uint16_t maxEvents) {
#if EVENTBUS_PROFILE
    const uint64_t tDispatch0 = micros64();
#endif
    uint16_t dispatched = 0;

    for (uint16_t i = 0; i < maxEvents; i++) {
        QueuedEvent qe;
        {
            std::lock_guard<std::mutex> lk(_mtx);
            if (_queue.empty()) break;
            qe = _queue.front();
            _queue.pop_front();
        }

        dispatchOne(qe);
        dispatched++;
    }

#if EVENTBUS_PROFILE
    const uint64_t dt = micros64() - tDispatch0;
    if (dispatched > 0 && dt > EVENTBUS_DISPATCH_WARN_US && canWarnNow()) {
        Log::warn(LOG_TAG_CORE, "dispatch slow: %u events dt=%lu us", (unsigned)dispatched, (unsigned long)dt);
    }
#endif
    return dispatched;
}

uint32_t EventBus::dropped() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _dropped;
}

void EventBus::dispatchOne(const QueuedEvent& qe) {
    Event e;
    e.id = qe.id;
    e.payload = (qe.len > 0) ? qe.data : nullptr;
    e.len = qe.len;

    uint16_t count;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        count = _count;
    }

    for (uint16_t i = 0; i < count; i++) {
        if (_subs[i].id == qe.id && _subs[i].cb != nullptr) {

#if EVENTBUS_PROFILE
            const uint64_t t0 = micros64();
#endif

            _subs[i].cb(e, _subs[i].user);

#if EVENTBUS_PROFILE
            const uint64_t dt = micros64() - t0;
            if (dt > EVENTBUS_HANDLER_WARN_US && canWarnNow()) {
                Log::warn(LOG_TAG_CORE, "slow handler: event=%u user=%p dt=%lu us",
                     (unsigned)qe.id,
                     _subs[i].user,
                     (unsigned long)dt);
            }
#endif
        }
    }
}
