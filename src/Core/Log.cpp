/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include "Core/Runtime.h"
#include <atomic>
#include <cstring>
#include <stdarg.h>
#include <stdio.h>

namespace {
    std::atomic<const LogHubService*> g_hub{nullptr};

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        const LogHubService* hub = g_hub.load();
        if (!hub || !hub->enqueue || !fmt) return;

        LogEntry e{};
        e.ts_ms = millis();
        e.lvl = lvl;

        if (tag) {
            strncpy(e.tag, tag, LOG_TAG_MAX - 1);
        } else {
            strncpy(e.tag, "-", LOG_TAG_MAX - 1);
        }

        vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);
        hub->enqueue(hub->ctx, e);
    }
}

void Log::setHub(const LogHubService* hub) {
    g_hub.store(hub);
}

const LogHubService* Log::hub() {
    return g_hub.load();
}

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}

void Log::critical(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Critical, tag, fmt, ap);
    va_end(ap);
}
