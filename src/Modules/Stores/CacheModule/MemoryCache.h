#pragma once
/**
 * @file MemoryCache.h
 * @brief In-process cache backend (single instance deployments and tests).
 */
#include "CacheBackend.h"

#include <deque>
#include <map>
#include <mutex>

/**
 * @brief Map-backed cache with TTL evaluated against `Clock::nowEpochMs()`.
 */
class MemoryCache : public CacheBackend {
public:
    const char* name() const override { return "memory"; }

    bool get(const char* key, std::string& out, bool& found) override;
    bool set(const char* key, const char* value, uint32_t ttlSec) override;
    bool del(const char* key) override;
    bool listPush(const char* key, const char* value, uint32_t maxLen) override;
    bool listRange(const char* key, uint16_t limit, std::vector<std::string>& out) override;
    bool ping() override { return true; }

    /** @brief Number of live string keys (expired ones excluded). */
    size_t size();

private:
    struct Entry {
        std::string value;
        uint64_t expiresAtMs = 0;  ///< 0 = never
    };

    std::mutex mtx_;
    std::map<std::string, Entry> values_;
    std::map<std::string, std::deque<std::string>> lists_;

    bool expired_(const Entry& e, uint64_t nowMs) const;
};
