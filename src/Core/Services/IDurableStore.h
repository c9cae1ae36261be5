#pragma once
/**
 * @file IDurableStore.h
 * @brief Durable hierarchical JSON store service interface (history and snapshots).
 */
#include <stddef.h>
#include <stdint.h>
#include <string>

/**
 * @brief Path-addressed JSON document store exposed by DurableStoreModule.
 *
 * Paths use `/` separators (`pump/state`, `irrigation_events`).
 */
struct DurableStoreService {
    /** @brief Replace the document at path. */
    bool (*set)(void* ctx, const char* path, const char* json);
    /** @brief Read the document at path; `found` false when absent. */
    bool (*get)(void* ctx, const char* path, std::string* outJson, bool* found);
    /** @brief Merge the members of a JSON object into path. */
    bool (*update)(void* ctx, const char* path, const char* jsonObject);
    /** @brief Append under path with a generated, time-ordered key. */
    bool (*push)(void* ctx, const char* path, const char* json, char* keyOut, size_t keyLen);
    /** @brief Read the `limit` last children (by key order) as one JSON object. */
    bool (*getLast)(void* ctx, const char* path, uint16_t limit, std::string* outJson);
    bool (*remove)(void* ctx, const char* path);
    void* ctx;
};
