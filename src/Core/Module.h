#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "Runtime.h"
#include "ServiceRegistry.h"
#include "StopToken.h"
#include "Core/SystemLimits.h"

#include <atomic>
#include <mutex>
#include <thread>

/**
 * @brief Base class for active modules backed by a worker thread.
 */
class Module {
public:
    Module() = default;
    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    /**
     * @brief Virtual destructor.
     *
     * A module owning a task must call stopTask() in its own destructor: by the time
     * this one runs the derived part is gone and loop() can no longer be called.
     * The call here only joins a thread that has already left loop().
     */
    virtual ~Module() { stopTask(); }

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief Task name for this module (diagnostics). */
    virtual const char* taskName() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Initialize module and register services/config. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once all persistent config values are loaded. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief Main module loop called from the module task. */
    virtual void loop() = 0;

    /** @brief Whether this module owns a task. */
    virtual bool hasTask() const { return true; }
    /** @brief Whether ModuleManager starts the task at boot (false: the owner starts it). */
    virtual bool autoStart() const { return true; }

    /**
     * @brief Create and start the task for this module.
     * @return false if the task is already running or the module has none.
     */
    bool startTask() {
        std::lock_guard<std::mutex> lk(taskMtx_);
        if (!hasTask() || running_.load()) return false;
        if (thread_.joinable()) thread_.join();
        stop_.reset();
        running_.store(true);
        thread_ = std::thread(&Module::taskEntry_, this);
        return true;
    }

    /**
     * @brief Request the task to stop and join it.
     * @return false if the task was not running.
     */
    bool stopTask() {
        std::lock_guard<std::mutex> lk(taskMtx_);
        if (!thread_.joinable()) return false;
        if (thread_.get_id() == std::this_thread::get_id()) return false;
        const bool wasRunning = running_.load();
        stop_.requestStop();
        thread_.join();
        running_.store(false);
        return wasRunning;
    }

    /** @brief Whether the task loop is currently alive. */
    bool isTaskRunning() const { return running_.load(); }

protected:
    /**
     * @brief Sleep inside `loop()` up to `ms`.
     * @return false when the task must exit.
     */
    bool waitOrStop(uint32_t ms) { return !stop_.waitFor(ms); }
    /** @brief Interrupt the current `waitOrStop` early. */
    void wakeTask() { stop_.wake(); }
    bool stopRequested() const { return stop_.stopRequested(); }

private:
    StopToken stop_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex taskMtx_;

    void taskEntry_() {
        while (!stop_.stopRequested()) {
            loop();
            if (stop_.waitFor(Limits::ModuleLoopDelayMs)) break;
        }
        running_.store(false);
    }
};
