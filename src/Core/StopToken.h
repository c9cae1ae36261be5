#pragma once
/**
 * @file StopToken.h
 * @brief Cooperative cancellation token for module task loops.
 */
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdint.h>

/**
 * @brief Wakeable sleep shared between a task loop and its owner.
 *
 * `waitFor()` returns as soon as `requestStop()` or `wake()` is called,
 * so stopping a task never waits for a full poll interval.
 */
class StopToken {
public:
    /** @brief Clear the stop flag before (re)starting a task. */
    void reset() {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = false;
        wake_ = false;
    }

    /** @brief Request the loop to exit and wake it. */
    void requestStop() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    /** @brief Interrupt the current wait without stopping. */
    void wake() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            wake_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return stop_;
    }

    /**
     * @brief Sleep up to `ms` milliseconds.
     * @return true when stop was requested.
     */
    bool waitFor(uint32_t ms) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return stop_ || wake_; });
        wake_ = false;
        return stop_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool wake_ = false;
};
