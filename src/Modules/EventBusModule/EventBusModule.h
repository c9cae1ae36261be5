#pragma once
/**
 * @file EventBusModule.h
 * @brief Active module hosting the EventBus dispatch loop.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Active module that owns the EventBus instance.
 */
class EventBusModule : public Module {
public:
    /** @brief Stops the task while the derived object is still alive. */
    ~EventBusModule() override { stopTask(); }

    /** @brief Module id. */
    const char* moduleId() const override { return "eventbus"; }
    /** @brief Task name. */
    const char* taskName() const override { return "EventBus"; }

    /** @brief EventBus depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }
    /** @brief Initialize and register EventBus service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Dispatch events from the queue. */
    void loop() override;

    /** @brief Direct access for tests and the composition root. */
    EventBus& bus() { return _bus; }

private:
    EventBus _bus;
    EventBusService _svc { &_bus };
};
