/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// the LogHub object travels as the hub service ctx
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) return;

    _hub = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::writeToSinks_(const LogEntry& e) {
    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        waitOrStop(1000);
        return;
    }

    LogEntry e;
    if (_hub->dequeue(e, 100)) {
        writeToSinks_(e);
    }
}

void LogDispatcherModule::flush() {
    if (!_hub || !_sinkReg) return;
    LogEntry e;
    while (_hub->dequeue(e, 0)) {
        writeToSinks_(e);
    }
}
