#pragma once
/**
 * @file ConfigKeys.h
 * @brief Centralized persisted key constants used by ConfigStore-registered variables.
 */

namespace ConfigKeys {

/** @brief Config schema version key written alongside persisted values. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker of the state file.

namespace Log {
constexpr char MinLevel[] = "log_min"; // Console sink minimum level.
}  // namespace Log

namespace Cache {
constexpr char Backend[] = "cch_backend"; // Cache backend name (redis|memory).
constexpr char Host[] = "cch_host"; // Redis host.
constexpr char Port[] = "cch_port"; // Redis TCP port.
constexpr char Password[] = "cch_pass"; // Redis AUTH password.
constexpr char Db[] = "cch_db"; // Redis logical database index.
constexpr char TimeoutMs[] = "cch_tmo"; // Redis socket timeout in ms.
constexpr char KeyPrefix[] = "cch_prefix"; // Prefix prepended to every cache key.
}  // namespace Cache

namespace Store {
constexpr char Backend[] = "sto_backend"; // Durable store backend name (firebase|memory).
constexpr char Url[] = "sto_url"; // Realtime database base URL.
constexpr char Secret[] = "sto_secret"; // Realtime database auth secret.
constexpr char TimeoutMs[] = "sto_tmo"; // HTTP timeout in ms.
}  // namespace Store

namespace Gateway {
constexpr char Enabled[] = "gw_en"; // Gateway enabled flag.
constexpr char Account[] = "gw_account"; // Platform account (username).
constexpr char ApiKey[] = "gw_key"; // Platform API key.
constexpr char MqttHost[] = "gw_mqhost"; // Pub/sub broker host.
constexpr char MqttPort[] = "gw_mqport"; // Pub/sub broker port.
constexpr char RestBase[] = "gw_rest"; // REST API base URL.
constexpr char ClientId[] = "gw_clientid"; // Pub/sub client id (empty = generated).
constexpr char MaxRetries[] = "gw_retries"; // REST attempts for transient failures.
constexpr char RetryDelayMs[] = "gw_retryms"; // Fixed delay between REST attempts.
constexpr char ReconnectMs[] = "gw_reconms"; // Delay before a pub/sub reconnect.
constexpr char AutoCreate[] = "gw_autocreate"; // Create missing feeds on use.
constexpr char HttpTimeoutMs[] = "gw_httptmo"; // REST request timeout in ms.
}  // namespace Gateway

namespace Pump {
constexpr char FeedKey[] = "pmp_feed"; // Pump control feed key.
constexpr char MaxRuntimeS[] = "pmp_maxrun"; // Maximum run time per activation.
constexpr char MinIntervalS[] = "pmp_minint"; // Cooldown between OFF and next ON.
constexpr char FlowRateLps[] = "pmp_flow"; // Pump flow rate in litres per second.
constexpr char DefaultDurationS[] = "pmp_defdur"; // Duration used when 0 is requested.
constexpr char HistoryMax[] = "pmp_histmax"; // Cached irrigation event list length.
constexpr char StatusIntervalS[] = "pmp_status"; // Reconciliation tick period.
}  // namespace Pump

namespace Environment {
constexpr char MaxAgeS[] = "env_maxage"; // Age after which a reading is stale.
constexpr char CollectIntervalS[] = "env_collect"; // Sampling period in seconds.
constexpr char SoilFeed[] = "env_soil"; // Soil moisture feed key.
constexpr char TempFeed[] = "env_temp"; // Temperature feed key.
constexpr char HumidityFeed[] = "env_hum"; // Humidity feed key.
constexpr char LightFeed[] = "env_light"; // Light feed key.
}  // namespace Environment

namespace Decision {
constexpr char Enabled[] = "dec_en"; // Autonomous irrigation enabled flag.
constexpr char MinIntervalS[] = "dec_minint"; // Minimum seconds between two recorded decisions.
constexpr char CheckIntervalS[] = "dec_chkint"; // Decision loop tick period in seconds.
constexpr char LightS[] = "dec_light"; // Light irrigation duration in seconds.
constexpr char NormalS[] = "dec_normal"; // Normal irrigation duration in seconds.
constexpr char HeavyS[] = "dec_heavy"; // Heavy irrigation duration in seconds.
constexpr char AiMinConfidence[] = "dec_aiconf"; // AI override minimum confidence.
constexpr char SoilMin[] = "dec_soilmin"; // Soil moisture critical minimum (%).
constexpr char SoilMax[] = "dec_soilmax"; // Soil moisture critical maximum (%).
constexpr char SoilOptMin[] = "dec_soilomin"; // Soil moisture optimal range low bound (%).
constexpr char SoilOptMax[] = "dec_soilomax"; // Soil moisture optimal range high bound (%).
}  // namespace Decision

namespace Orchestrator {
constexpr char AiEnabled[] = "orc_aien"; // AI recommendation ingestion enabled flag.
constexpr char AllowedSources[] = "orc_aisrc"; // Comma separated recommendation source allow-list.
}  // namespace Orchestrator

namespace Scheduler {
constexpr char CheckIntervalS[] = "sch_chkint"; // Schedule poll period in seconds.
}  // namespace Scheduler

}  // namespace ConfigKeys
