#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"

/**
 * @brief Active module consuming log hub entries and fanning them out to sinks.
 */
class LogDispatcherModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~LogDispatcherModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }
    /** @brief Task name. */
    const char* taskName() const override { return "LogDispatch"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Wire hub and sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Drain one entry (waits up to 100 ms). */
    void loop() override;

    /** @brief Write every queued entry synchronously (shutdown path). */
    void flush();

private:
    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;

    void writeToSinks_(const LogEntry& e);
};
