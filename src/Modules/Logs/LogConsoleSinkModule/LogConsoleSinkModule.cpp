/**
 * @file LogConsoleSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSinkModule.h"
#include "Core/Runtime.h"

#include <stdio.h>
#include <time.h>
#include <unistd.h>

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:    return "D";
        case LogLevel::Info:     return "I";
        case LogLevel::Warn:     return "W";
        case LogLevel::Error:    return "E";
        case LogLevel::Critical: return "C";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:    return "\x1b[90m";
        case LogLevel::Info:     return "\x1b[32m";
        case LogLevel::Warn:     return "\x1b[33m";
        case LogLevel::Error:    return "\x1b[31m";
        case LogLevel::Critical: return "\x1b[35m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

static void formatUptime(char *out, size_t outSize, uint32_t ms)
{
    uint32_t s   = ms / 1000;
    uint32_t m   = s / 60;
    uint32_t h   = m / 60;

    uint32_t hh  = h % 24;
    uint32_t mm  = m % 60;
    uint32_t ss  = s % 60;
    uint32_t mmm = ms % 1000;

    snprintf(out, outSize, "%02lu:%02lu:%02lu.%03lu",
             (unsigned long)hh,
             (unsigned long)mm,
             (unsigned long)ss,
             (unsigned long)mmm);
}

void LogConsoleSinkModule::formatLine(const LogEntry& e, char* out, size_t outLen)
{
    char ts[48];
    if (Clock::isWallTimeValid()) {
        const uint64_t nowMs = Clock::nowEpochMs();
        struct tm t{};
        Clock::toLocalTm(nowMs, t);
        snprintf(ts, sizeof(ts),
                 "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                 t.tm_year + 1900,
                 t.tm_mon + 1,
                 t.tm_mday,
                 t.tm_hour,
                 t.tm_min,
                 t.tm_sec,
                 (unsigned)(nowMs % 1000));
    } else {
        formatUptime(ts, sizeof(ts), e.ts_ms);
    }

    snprintf(out, outLen, "[%s][%s][%s] %s", ts, lvlStr(e.lvl), e.tag, e.msg);
}

void LogConsoleSinkModule::write_(void* ctx, const LogEntry& e) {
    auto* self = static_cast<LogConsoleSinkModule*>(ctx);
    if ((uint8_t)e.lvl < self->minLevel_) return;

    char line[LOG_MSG_MAX + 80];
    formatLine(e, line, sizeof(line));

    std::lock_guard<std::mutex> lk(self->writeMtx_);
    if (self->colors_) {
        fprintf(stderr, "%s%s%s\n", lvlColor(e.lvl), line, colorReset());
    } else {
        fprintf(stderr, "%s\n", line);
    }
}

void LogConsoleSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(minLevelVar);
    colors_ = isatty(fileno(stderr)) != 0;

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = write_;
    sink.ctx = this;

    sinks->add(sinks->ctx, sink);
}
