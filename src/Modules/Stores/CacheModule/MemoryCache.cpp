/**
 * @file MemoryCache.cpp
 * @brief Implementation file.
 */
#include "MemoryCache.h"
#include "Core/Runtime.h"

bool MemoryCache::expired_(const Entry& e, uint64_t nowMs) const
{
    return e.expiresAtMs != 0 && nowMs >= e.expiresAtMs;
}

bool MemoryCache::get(const char* key, std::string& out, bool& found)
{
    std::lock_guard<std::mutex> lk(mtx_);
    found = false;
    auto it = values_.find(key);
    if (it == values_.end()) return true;
    if (expired_(it->second, Clock::nowEpochMs())) {
        values_.erase(it);
        return true;
    }
    out = it->second.value;
    found = true;
    return true;
}

bool MemoryCache::set(const char* key, const char* value, uint32_t ttlSec)
{
    std::lock_guard<std::mutex> lk(mtx_);
    Entry& e = values_[key];
    e.value = value;
    e.expiresAtMs = (ttlSec > 0) ? Clock::nowEpochMs() + (uint64_t)ttlSec * 1000ULL : 0;
    return true;
}

bool MemoryCache::del(const char* key)
{
    std::lock_guard<std::mutex> lk(mtx_);
    values_.erase(key);
    lists_.erase(key);
    return true;
}

bool MemoryCache::listPush(const char* key, const char* value, uint32_t maxLen)
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::deque<std::string>& l = lists_[key];
    l.push_front(value);
    if (maxLen > 0) {
        while (l.size() > maxLen) l.pop_back();
    }
    return true;
}

bool MemoryCache::listRange(const char* key, uint16_t limit, std::vector<std::string>& out)
{
    std::lock_guard<std::mutex> lk(mtx_);
    out.clear();
    auto it = lists_.find(key);
    if (it == lists_.end()) return true;
    for (const std::string& v : it->second) {
        if (out.size() >= limit) break;
        out.push_back(v);
    }
    return true;
}

size_t MemoryCache::size()
{
    std::lock_guard<std::mutex> lk(mtx_);
    const uint64_t now = Clock::nowEpochMs();
    size_t n = 0;
    for (const auto& kv : values_) {
        if (!expired_(kv.second, now)) ++n;
    }
    return n;
}
