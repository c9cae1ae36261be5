/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"
#define LOG_TAG_CORE "LogSinkR"

bool LogSinkRegistry::add(LogSinkService sink) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (n >= MAX_SINKS) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}
