#pragma once
/**
 * @file ICache.h
 * @brief Fast key/value cache service interface (current state and recent history).
 */
#include <stdint.h>
#include <string>

/** @brief Visitor for list reads, newest first. Return false to stop early. */
using CacheListVisitor = bool (*)(void* user, const char* value);

/**
 * @brief Cache operations exposed by CacheModule.
 *
 * Keys are logical (`pump:state`); the module adds its configured prefix.
 * Every call returns false when the backend is unreachable.
 */
struct CacheService {
    bool (*get)(void* ctx, const char* key, std::string* out, bool* found);
    /** @brief ttlSec 0 = no expiry. */
    bool (*set)(void* ctx, const char* key, const char* value, uint32_t ttlSec);
    bool (*del)(void* ctx, const char* key);
    /** @brief Prepend to a list and trim it to maxLen entries (maxLen 0 = unbounded). */
    bool (*listPush)(void* ctx, const char* key, const char* value, uint32_t maxLen);
    /** @brief Visit up to `limit` newest entries; returns the number visited. */
    uint16_t (*listRead)(void* ctx, const char* key, uint16_t limit, CacheListVisitor visit, void* user);
    bool (*isAvailable)(void* ctx);
    void* ctx;
};
