#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <condition_variable>
#include <deque>
#include <mutex>

/**
 * @brief Bounded queue-based log hub for producers and consumers.
 */
class LogHub {
public:
    /** @brief Initialize the log queue with a given length. */
    void init(size_t queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking, drops when full). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitMs). */
    bool dequeue(LogEntry& out, uint32_t waitMs);
    /** @brief Number of entries dropped because the queue was full. */
    uint32_t dropped() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<LogEntry> q_;
    size_t cap_ = 0;
    uint32_t dropped_ = 0;
};
