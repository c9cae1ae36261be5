/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"
#include <chrono>
#define LOG_TAG_CORE "LogHubMg"

void LogHub::init(size_t queueLen) {
    std::lock_guard<std::mutex> lk(mtx_);
    cap_ = queueLen;
    q_.clear();
}

bool LogHub::enqueue(const LogEntry& e) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (cap_ == 0) return false;
        if (q_.size() >= cap_) {  ///< non-blocking: drop
            ++dropped_;
            return false;
        }
        q_.push_back(e);
    }
    cv_.notify_one();
    return true;
}

bool LogHub::dequeue(LogEntry& out, uint32_t waitMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!cv_.wait_for(lk, std::chrono::milliseconds(waitMs), [this] { return !q_.empty(); })) {
        return false;
    }
    out = q_.front();
    q_.pop_front();
    return true;
}

uint32_t LogHub::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}
