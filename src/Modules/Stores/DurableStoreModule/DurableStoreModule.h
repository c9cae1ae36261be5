#pragma once
/**
 * @file DurableStoreModule.h
 * @brief Module exposing the durable JSON store (Firebase RTDB or memory).
 */
#include "Core/ModulePassive.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "DurableBackend.h"

#include <memory>

/** @brief Durable store configuration values. */
struct DurableStoreConfig {
    char backend[16] = "memory";
    char url[Limits::Gateway::Url] = "";
    char secret[128] = "";
    int32_t timeoutMs = 10000;
};

/**
 * @brief Passive module registering the `store` service.
 */
class DurableStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "store"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Build the configured backend. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Use an externally owned backend (tests). Call before init. */
    void setBackendOverride(DurableBackend* backend) { override_ = backend; }

private:
    DurableStoreConfig cfgData_;
    std::unique_ptr<DurableBackend> owned_;
    DurableBackend* override_ = nullptr;
    DurableBackend* active_ = nullptr;
    DurableStoreService svc_{};

    ConfigVariable<char,0> backendVar {
        CFG_KEY(ConfigKeys::Store::Backend),"backend","store",ConfigType::CharArray,
        (char*)cfgData_.backend,ConfigPersistence::Runtime,sizeof(cfgData_.backend)
    };
    ConfigVariable<char,0> urlVar {
        CFG_KEY(ConfigKeys::Store::Url),"url","store",ConfigType::CharArray,
        (char*)cfgData_.url,ConfigPersistence::Runtime,sizeof(cfgData_.url)
    };
    ConfigVariable<char,0> secretVar {
        CFG_KEY(ConfigKeys::Store::Secret),"secret","store",ConfigType::CharArray,
        (char*)cfgData_.secret,ConfigPersistence::Runtime,sizeof(cfgData_.secret)
    };
    ConfigVariable<int32_t,0> timeoutVar {
        CFG_KEY(ConfigKeys::Store::TimeoutMs),"timeout_ms","store",ConfigType::Int32,
        &cfgData_.timeoutMs,ConfigPersistence::Runtime,0
    };
};
