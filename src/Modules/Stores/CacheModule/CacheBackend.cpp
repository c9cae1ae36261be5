/**
 * @file CacheBackend.cpp
 * @brief Implementation file.
 */
#include "CacheBackend.h"

#include <string.h>

namespace {

std::string prefixed(const CacheBinding* b, const char* key)
{
    std::string k(b->prefix ? b->prefix : "");
    k += key ? key : "";
    return k;
}

bool svcGet(void* ctx, const char* key, std::string* out, bool* found)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    if (!b->backend || !key || !out) return false;
    bool f = false;
    const bool ok = b->backend->get(prefixed(b, key).c_str(), *out, f);
    if (found) *found = ok && f;
    return ok;
}

bool svcSet(void* ctx, const char* key, const char* value, uint32_t ttlSec)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    if (!b->backend || !key || !value) return false;
    return b->backend->set(prefixed(b, key).c_str(), value, ttlSec);
}

bool svcDel(void* ctx, const char* key)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    if (!b->backend || !key) return false;
    return b->backend->del(prefixed(b, key).c_str());
}

bool svcListPush(void* ctx, const char* key, const char* value, uint32_t maxLen)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    if (!b->backend || !key || !value) return false;
    return b->backend->listPush(prefixed(b, key).c_str(), value, maxLen);
}

uint16_t svcListRead(void* ctx, const char* key, uint16_t limit, CacheListVisitor visit, void* user)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    if (!b->backend || !key || !visit || limit == 0) return 0;
    std::vector<std::string> items;
    if (!b->backend->listRange(prefixed(b, key).c_str(), limit, items)) return 0;
    uint16_t n = 0;
    for (const std::string& it : items) {
        ++n;
        if (!visit(user, it.c_str())) break;
    }
    return n;
}

bool svcIsAvailable(void* ctx)
{
    auto* b = static_cast<CacheBinding*>(ctx);
    return b->backend && b->backend->ping();
}

}  // namespace

CacheService makeCacheService(CacheBinding* binding)
{
    return CacheService{svcGet, svcSet, svcDel, svcListPush, svcListRead, svcIsAvailable, binding};
}
