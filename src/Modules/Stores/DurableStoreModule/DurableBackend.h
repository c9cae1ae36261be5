#pragma once
/**
 * @file DurableBackend.h
 * @brief Durable JSON tree backend abstraction (Firebase RTDB or memory).
 */
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "Core/Services/IDurableStore.h"

/**
 * @brief Storage strategy behind DurableStoreService.
 *
 * Paths are `/`-separated without leading slash. Implementations are thread-safe.
 */
class DurableBackend {
public:
    virtual ~DurableBackend() = default;

    virtual const char* name() const = 0;

    virtual bool set(const char* path, const char* json) = 0;
    virtual bool get(const char* path, std::string& outJson, bool& found) = 0;
    virtual bool update(const char* path, const char* jsonObject) = 0;
    virtual bool push(const char* path, const char* json, std::string& keyOut) = 0;
    /** @brief Last `limit` children by key order as `{key: value}`; `{}` when empty. */
    virtual bool getLast(const char* path, uint16_t limit, std::string& outJson) = 0;
    virtual bool remove(const char* path) = 0;
};

/** @brief Strip leading/trailing `/` and collapse empty segments. */
std::string normalizeStorePath(const char* path);

/** @brief Build a service table whose ctx is `backend` (may be null until configured). */
DurableStoreService makeDurableStoreService(DurableBackend** backendSlot);
