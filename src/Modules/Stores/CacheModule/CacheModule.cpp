/**
 * @file CacheModule.cpp
 * @brief Implementation file.
 */
#include "CacheModule.h"
#include "MemoryCache.h"
#include "RedisCache.h"
#define LOG_TAG "CacheMod"
#include "Core/ModuleLog.h"

#include <cstdlib>
#include <cstring>

void CacheModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(backendVar);
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(passVar);
    cfg.registerVar(dbVar);
    cfg.registerVar(timeoutVar);
    cfg.registerVar(prefixVar);

    binding_.backend = nullptr;
    binding_.prefix = cfgData_.keyPrefix;
    svc_ = makeCacheService(&binding_);
    services.add("cache", &svc_);
}

void CacheModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry&)
{
    const char* envPass = getenv("IRRIFLOW_REDIS_PASSWORD");
    if (envPass && envPass[0] != '\0') {
        (void)cfg.set(passVar, envPass);
    }

    if (override_) {
        binding_.backend = override_;
        LOGI("cache backend=%s (external) prefix='%s'", override_->name(), cfgData_.keyPrefix);
        return;
    }

    if (strcmp(cfgData_.backend, "redis") == 0) {
        RedisConfig rc;
        rc.host = cfgData_.host;
        rc.port = cfgData_.port;
        rc.password = cfgData_.password;
        rc.db = cfgData_.db;
        rc.timeoutMs = cfgData_.timeoutMs > 0 ? (uint32_t)cfgData_.timeoutMs : 2000U;
        owned_.reset(new RedisCache(rc));
    } else {
        if (strcmp(cfgData_.backend, "memory") != 0) {
            LOGW("unknown cache backend '%s', using memory", cfgData_.backend);
        }
        owned_.reset(new MemoryCache());
    }
    binding_.backend = owned_.get();

    if (binding_.backend->ping()) {
        LOGI("cache backend=%s ready prefix='%s'", binding_.backend->name(), cfgData_.keyPrefix);
    } else {
        LOGW("cache backend=%s not reachable yet (will retry on use)", binding_.backend->name());
    }
}
