/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"


void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    services.add("eventbus", &_svc);

    LOGI("EventBusService registered");
    /// Broadcast system started (no payload)
    _bus.post(EventId::SystemStarted, nullptr, 0);
}

void EventBusModule::loop() {
    /// Dispatch queued events; sleep only when the queue drained.
    if (_bus.dispatch(8) == 0) {
        waitOrStop(5);
    }
}
