#pragma once
/**
 * @file LogConsoleSinkModule.h
 * @brief Console (stderr) log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"
#include "Core/ConfigKeys.h"

#include <mutex>

/**
 * @brief Passive module that writes log entries to the console.
 */
class LogConsoleSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.console"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register the console log sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Format one entry as `[ts][L][tag] msg` (no colour). */
    static void formatLine(const LogEntry& e, char* out, size_t outLen);

private:
    uint8_t minLevel_ = 1;  ///< LogLevel::Info
    bool colors_ = false;
    std::mutex writeMtx_;

    ConfigVariable<uint8_t,0> minLevelVar {
        CFG_KEY(ConfigKeys::Log::MinLevel),"min_level","log",ConfigType::UInt8,
        &minLevel_,ConfigPersistence::Persistent,0
    };

    static void write_(void* ctx, const LogEntry& e);
};
