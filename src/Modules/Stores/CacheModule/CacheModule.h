#pragma once
/**
 * @file CacheModule.h
 * @brief Module exposing the fast key/value cache (Redis or memory).
 */
#include "Core/ModulePassive.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "CacheBackend.h"

#include <memory>

/** @brief Cache configuration values. */
struct CacheConfig {
    char backend[16] = "memory";
    char host[64] = "127.0.0.1";
    int32_t port = 6379;
    char password[64] = "";
    int32_t db = 0;
    int32_t timeoutMs = 2000;
    char keyPrefix[32] = "irriflow:";
};

/**
 * @brief Passive module registering the `cache` service.
 *
 * The service table is registered during init; the backend itself is
 * created once configuration is loaded. Calls made before that fail.
 */
class CacheModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "cache"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Build the configured backend and ping it. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Use an externally owned backend (tests). Call before init. */
    void setBackendOverride(CacheBackend* backend) { override_ = backend; }

private:
    CacheConfig cfgData_;
    std::unique_ptr<CacheBackend> owned_;
    CacheBackend* override_ = nullptr;
    CacheBinding binding_{};
    CacheService svc_{};

    ConfigVariable<char,0> backendVar {
        CFG_KEY(ConfigKeys::Cache::Backend),"backend","cache",ConfigType::CharArray,
        (char*)cfgData_.backend,ConfigPersistence::Runtime,sizeof(cfgData_.backend)
    };
    ConfigVariable<char,0> hostVar {
        CFG_KEY(ConfigKeys::Cache::Host),"host","cache",ConfigType::CharArray,
        (char*)cfgData_.host,ConfigPersistence::Runtime,sizeof(cfgData_.host)
    };
    ConfigVariable<int32_t,0> portVar {
        CFG_KEY(ConfigKeys::Cache::Port),"port","cache",ConfigType::Int32,
        &cfgData_.port,ConfigPersistence::Runtime,0
    };
    ConfigVariable<char,0> passVar {
        CFG_KEY(ConfigKeys::Cache::Password),"password","cache",ConfigType::CharArray,
        (char*)cfgData_.password,ConfigPersistence::Runtime,sizeof(cfgData_.password)
    };
    ConfigVariable<int32_t,0> dbVar {
        CFG_KEY(ConfigKeys::Cache::Db),"db","cache",ConfigType::Int32,
        &cfgData_.db,ConfigPersistence::Runtime,0
    };
    ConfigVariable<int32_t,0> timeoutVar {
        CFG_KEY(ConfigKeys::Cache::TimeoutMs),"timeout_ms","cache",ConfigType::Int32,
        &cfgData_.timeoutMs,ConfigPersistence::Runtime,0
    };
    ConfigVariable<char,0> prefixVar {
        CFG_KEY(ConfigKeys::Cache::KeyPrefix),"key_prefix","cache",ConfigType::CharArray,
        (char*)cfgData_.keyPrefix,ConfigPersistence::Runtime,sizeof(cfgData_.keyPrefix)
    };
};
