/**
 * @file DurableBackend.cpp
 * @brief Implementation file.
 */
#include "DurableBackend.h"

#include <stdio.h>

std::string normalizeStorePath(const char* path)
{
    std::string out;
    if (!path) return out;
    bool pendingSep = false;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            pendingSep = !out.empty();
            continue;
        }
        if (pendingSep) {
            out += '/';
            pendingSep = false;
        }
        out += *p;
    }
    return out;
}

namespace {

DurableBackend* backendOf(void* ctx)
{
    DurableBackend** slot = static_cast<DurableBackend**>(ctx);
    return slot ? *slot : nullptr;
}

bool svcSet(void* ctx, const char* path, const char* json)
{
    DurableBackend* b = backendOf(ctx);
    if (!b || !path || !json) return false;
    return b->set(path, json);
}

bool svcGet(void* ctx, const char* path, std::string* outJson, bool* found)
{
    DurableBackend* b = backendOf(ctx);
    if (found) *found = false;
    if (!b || !path || !outJson) return false;
    bool f = false;
    const bool ok = b->get(path, *outJson, f);
    if (found) *found = ok && f;
    return ok;
}

bool svcUpdate(void* ctx, const char* path, const char* jsonObject)
{
    DurableBackend* b = backendOf(ctx);
    if (!b || !path || !jsonObject) return false;
    return b->update(path, jsonObject);
}

bool svcPush(void* ctx, const char* path, const char* json, char* keyOut, size_t keyLen)
{
    DurableBackend* b = backendOf(ctx);
    if (!b || !path || !json) return false;
    std::string key;
    if (!b->push(path, json, key)) return false;
    if (keyOut && keyLen > 0) snprintf(keyOut, keyLen, "%s", key.c_str());
    return true;
}

bool svcGetLast(void* ctx, const char* path, uint16_t limit, std::string* outJson)
{
    DurableBackend* b = backendOf(ctx);
    if (!b || !path || !outJson) return false;
    return b->getLast(path, limit, *outJson);
}

bool svcRemove(void* ctx, const char* path)
{
    DurableBackend* b = backendOf(ctx);
    if (!b || !path) return false;
    return b->remove(path);
}

}  // namespace

DurableStoreService makeDurableStoreService(DurableBackend** backendSlot)
{
    return DurableStoreService{svcSet, svcGet, svcUpdate, svcPush, svcGetLast, svcRemove, backendSlot};
}
