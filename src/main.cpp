/**
 * @file main.cpp
 * @brief Service entry point and module wiring.
 */
#include "Core/ConfigStore.h"
#include "Core/HttpClient.h"
#include "Core/Log.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/Logs/LogConsoleSinkModule/LogConsoleSinkModule.h"
// Stores Modules
#include "Modules/Stores/CacheModule/CacheModule.h"
#include "Modules/Stores/DurableStoreModule/DurableStoreModule.h"
// Network modules
#include "Modules/Network/GatewayModule/GatewayModule.h"
#include "Modules/Network/GatewayModule/MqttFeedChannel.h"
// Irrigation modules
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/EnvironmentModule/EnvironmentModule.h"
#include "Modules/PumpModule/PumpModule.h"
#include "Modules/IrrigationSchedulerModule/IrrigationSchedulerModule.h"
#include "Modules/DecisionModule/DecisionModule.h"
#include "Modules/OrchestratorModule/OrchestratorModule.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

#define LOG_TAG_MAIN "Main"

static ConfigStore registry;
static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule              logHubModule;
static LogDispatcherModule       logDispatcherModule;
static LogConsoleSinkModule      logConsoleSinkModule;
static EventBusModule            eventBusModule;
static CacheModule               cacheModule;
static DurableStoreModule        durableStoreModule;
static GatewayModule             gatewayModule;
static EnvironmentModule         environmentModule;
static PumpModule                pumpModule;
static IrrigationSchedulerModule schedulerModule;
static DecisionModule            decisionModule;
static OrchestratorModule        orchestratorModule;

static volatile std::sig_atomic_t gStopRequested = 0;

static void onSignal(int)
{
    gStopRequested = 1;
}

static void logLifecycle(const char* what, const LifecycleResult& r)
{
    for (uint8_t i = 0; i < r.count; ++i) {
        const ComponentResult& c = r.components[i];
        if (c.success) Log::info(LOG_TAG_MAIN, "%s %s: %s", what, c.name, c.message);
        else Log::warn(LOG_TAG_MAIN, "%s %s: %s", what, c.name, c.message);
    }
}

int main(int argc, char** argv)
{
    const char* bootstrapPath = (argc > 1) ? argv[1] : "config/irriflow.json";
    const char* storagePath = (argc > 2) ? argv[2] : "irriflow.state.json";

    if (!HttpClient::globalInit()) {
        std::fprintf(stderr, "http client init failed\n");
        return 1;
    }
    if (!MqttFeedChannel::libInit()) {
        std::fprintf(stderr, "mqtt library init failed\n");
        HttpClient::globalCleanup();
        return 1;
    }

    registry.setBootstrapPath(bootstrapPath);
    registry.setStoragePath(storagePath);

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logConsoleSinkModule);
    moduleManager.add(&eventBusModule);
    moduleManager.add(&cacheModule);
    moduleManager.add(&durableStoreModule);
    moduleManager.add(&gatewayModule);
    moduleManager.add(&environmentModule);
    moduleManager.add(&pumpModule);
    moduleManager.add(&schedulerModule);
    moduleManager.add(&decisionModule);
    moduleManager.add(&orchestratorModule);

    if (!moduleManager.initAll(registry, services)) {
        std::fprintf(stderr, "module init failed\n");
        moduleManager.stopAll();
        MqttFeedChannel::libCleanup();
        HttpClient::globalCleanup();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    logLifecycle("start", orchestratorModule.start());
    Log::info(LOG_TAG_MAIN, "irriflow running (config=%s state=%s)", bootstrapPath, storagePath);

    while (!gStopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Log::info(LOG_TAG_MAIN, "shutdown requested");
    logLifecycle("stop", orchestratorModule.stop());
    if (!registry.savePersistent()) Log::warn(LOG_TAG_MAIN, "config state not saved");
    moduleManager.stopAll();

    MqttFeedChannel::libCleanup();
    HttpClient::globalCleanup();
    return 0;
}
