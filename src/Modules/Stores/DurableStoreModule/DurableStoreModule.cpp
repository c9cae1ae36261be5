/**
 * @file DurableStoreModule.cpp
 * @brief Implementation file.
 */
#include "DurableStoreModule.h"
#include "FirebaseStore.h"
#include "MemoryStore.h"
#define LOG_TAG "StoreMod"
#include "Core/ModuleLog.h"

#include <cstdlib>
#include <cstring>

void DurableStoreModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(backendVar);
    cfg.registerVar(urlVar);
    cfg.registerVar(secretVar);
    cfg.registerVar(timeoutVar);

    active_ = nullptr;
    svc_ = makeDurableStoreService(&active_);
    services.add("store", &svc_);
}

void DurableStoreModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry&)
{
    const char* envSecret = getenv("IRRIFLOW_STORE_SECRET");
    if (envSecret && envSecret[0] != '\0') {
        (void)cfg.set(secretVar, envSecret);
    }

    if (override_) {
        active_ = override_;
        LOGI("store backend=%s (external)", active_->name());
        return;
    }

    if (strcmp(cfgData_.backend, "firebase") == 0) {
        if (cfgData_.url[0] == '\0') {
            LOGE("store backend firebase without url, using memory");
            owned_.reset(new MemoryStore());
        } else {
            FirebaseConfig fc;
            fc.url = cfgData_.url;
            fc.secret = cfgData_.secret;
            fc.timeoutMs = cfgData_.timeoutMs > 0 ? (uint32_t)cfgData_.timeoutMs : 10000U;
            owned_.reset(new FirebaseStore(fc));
        }
    } else {
        if (strcmp(cfgData_.backend, "memory") != 0) {
            LOGW("unknown store backend '%s', using memory", cfgData_.backend);
        }
        owned_.reset(new MemoryStore());
    }
    active_ = owned_.get();
    LOGI("store backend=%s", active_->name());
}
