#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 8192;
/** @brief JSON capacity for the persisted config state file (`ConfigStore::loadPersistent`). */
constexpr size_t JsonConfigStateBuf = 4096;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 128;
/** @brief Maximum persisted config key length (without null terminator) enforced by `CFG_KEY`. */
constexpr size_t MaxCfgKeyLen = 15;
/** @brief Log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint16_t LogQueueLen = 256;
/** @brief Event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint16_t EventQueueLen = 32;
/** @brief Default idle delay in ms between two `Module::loop` calls. */
constexpr uint32_t ModuleLoopDelayMs = 10;

/** @brief Feed gateway limits (pub/sub topic, REST payloads, handler table). */
namespace Gateway {
/** @brief Account / username buffer length (`GatewayModule` config). */
constexpr size_t Account = 64;
/** @brief API key buffer length (`GatewayModule` config). */
constexpr size_t ApiKey = 96;
/** @brief Host / URL buffer length (`GatewayModule` config). */
constexpr size_t Url = 160;
/** @brief Feed key buffer length (`FeedTypes.h`). */
constexpr size_t FeedKey = 64;
/** @brief Feed value buffer length (`FeedReading::value`). */
constexpr size_t FeedValue = 96;
/** @brief Pub/sub topic buffer length (`formatFeedTopic`). */
constexpr size_t Topic = 192;
/** @brief Maximum inbound handlers registered on `GatewayClient`. */
constexpr uint8_t MaxHandlers = 16;
/** @brief Maximum provisioned feed keys remembered by `GatewayClient`. */
constexpr uint8_t MaxProvisioned = 32;
/** @brief Maximum items returned by one history read. */
constexpr uint16_t MaxHistory = 100;
/** @brief Connect timeout in ms before forcing a reconnect (`GatewayModule::loop`). */
constexpr uint32_t ConnectTimeoutMs = 15000;
/** @brief Loop delay in ms of the gateway connection task. */
constexpr uint32_t LoopDelayMs = 250;
}  // namespace Gateway

/** @brief Environment sampler capacities. */
namespace Environment {
/** @brief Soil moisture samples kept in memory for trend analysis (`EnvironmentModule`). */
constexpr uint16_t SoilHistory = 96;
/** @brief JSON capacity for one cached sensor reading. */
constexpr size_t JsonReadingBuf = 256;
}  // namespace Environment

/** @brief Irrigation domain capacities. */
namespace Irrigation {
/** @brief Maximum number of schedule entries held by `IrrigationSchedulerModule`. */
constexpr uint8_t MaxSchedules = 32;
/** @brief Maximum events returned by one history read (`PumpModule`). */
constexpr uint16_t MaxHistoryRead = 100;
/** @brief JSON capacity for one schedule / event / decision document. */
constexpr size_t JsonItemBuf = 1024;
/** @brief JSON capacity for the full schedule collection document. */
constexpr size_t JsonCollectionBuf = 16384;
/** @brief Free-form details buffer length carried by events. */
constexpr size_t Details = 192;
/** @brief Message buffer length carried by structured results. */
constexpr size_t Message = 128;
}  // namespace Irrigation

}  // namespace Limits
