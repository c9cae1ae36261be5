#pragma once
/**
 * @file CacheBackend.h
 * @brief Cache backend abstraction (Redis or in-process memory).
 */
#include <stdint.h>
#include <string>
#include <vector>

#include "Core/Services/ICache.h"

/**
 * @brief Storage strategy behind CacheService.
 *
 * Keys passed here are already prefixed. Implementations are thread-safe.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /** @brief Backend name for logs (`redis`, `memory`). */
    virtual const char* name() const = 0;

    virtual bool get(const char* key, std::string& out, bool& found) = 0;
    virtual bool set(const char* key, const char* value, uint32_t ttlSec) = 0;
    virtual bool del(const char* key) = 0;
    /** @brief LPUSH then trim to maxLen (0 = unbounded). */
    virtual bool listPush(const char* key, const char* value, uint32_t maxLen) = 0;
    /** @brief Newest `limit` entries, newest first. */
    virtual bool listRange(const char* key, uint16_t limit, std::vector<std::string>& out) = 0;
    virtual bool ping() = 0;
};

/**
 * @brief Bind a CacheService table to a backend, prefixing every key.
 *
 * `prefix` must outlive the returned service (module config buffer).
 */
struct CacheBinding {
    CacheBackend* backend = nullptr;
    const char* prefix = "";
};

/** @brief Build a service table whose ctx is `binding`. */
CacheService makeCacheService(CacheBinding* binding);
