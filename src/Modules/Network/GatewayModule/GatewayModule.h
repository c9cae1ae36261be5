#pragma once
/**
 * @file GatewayModule.h
 * @brief Feed platform gateway module (pub/sub connection task + GatewayService).
 */
#include "Core/Module.h"
#include "Core/ConfigKeys.h"
#include "Core/Services/Services.h"
#include "GatewayClient.h"
#include "MqttFeedChannel.h"
#include "RestFeedApi.h"

/** @brief Gateway configuration values. */
struct GatewayConfig {
    bool enabled = true;
    char account[Limits::Gateway::Account] = "";
    char apiKey[Limits::Gateway::ApiKey] = "";
    char mqttHost[64] = "io.adafruit.com";
    int32_t mqttPort = 1883;
    char restBase[Limits::Gateway::Url] = "https://io.adafruit.com/api/v2";
    char clientId[48] = "";
    int32_t maxRetries = 3;
    int32_t retryDelayMs = 1000;
    int32_t reconnectDelayMs = 5000;
    bool autoCreate = true;
    int32_t httpTimeoutMs = 10000;
};

/** @brief Pub/sub connection state. */
enum class GatewayState : uint8_t { Disabled, Connecting, Connected, ErrorWait };

/**
 * @brief Active module owning the gateway client and its transports.
 *
 * The task runs the pub/sub connection state machine; service calls run on
 * the caller's thread.
 */
class GatewayModule : public Module {
public:
    GatewayModule();
    ~GatewayModule() override;

    /** @brief Module id. */
    const char* moduleId() const override { return "gateway"; }
    /** @brief Task name. */
    const char* taskName() const override { return "gateway"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    GatewayState state() const { return state_; }
    GatewayClient& client() { return client_; }

private:
    GatewayConfig cfgData_;
    GatewayState state_ = GatewayState::Disabled;
    uint32_t stateTs_ = 0;
    bool configured_ = false;

    RestFeedApi rest_;
    MqttFeedChannel mqtt_;
    GatewayClient client_;
    GatewayService svc_{};

    ConfigVariable<bool,0> enabledVar {
        CFG_KEY(ConfigKeys::Gateway::Enabled),"enabled","gateway",ConfigType::Bool,
        &cfgData_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> accountVar {
        CFG_KEY(ConfigKeys::Gateway::Account),"account","gateway",ConfigType::CharArray,
        (char*)cfgData_.account,ConfigPersistence::Runtime,sizeof(cfgData_.account)
    };
    ConfigVariable<char,0> apiKeyVar {
        CFG_KEY(ConfigKeys::Gateway::ApiKey),"api_key","gateway",ConfigType::CharArray,
        (char*)cfgData_.apiKey,ConfigPersistence::Runtime,sizeof(cfgData_.apiKey)
    };
    ConfigVariable<char,0> mqttHostVar {
        CFG_KEY(ConfigKeys::Gateway::MqttHost),"mqtt_host","gateway",ConfigType::CharArray,
        (char*)cfgData_.mqttHost,ConfigPersistence::Runtime,sizeof(cfgData_.mqttHost)
    };
    ConfigVariable<int32_t,0> mqttPortVar {
        CFG_KEY(ConfigKeys::Gateway::MqttPort),"mqtt_port","gateway",ConfigType::Int32,
        &cfgData_.mqttPort,ConfigPersistence::Runtime,0
    };
    ConfigVariable<char,0> restBaseVar {
        CFG_KEY(ConfigKeys::Gateway::RestBase),"rest_base","gateway",ConfigType::CharArray,
        (char*)cfgData_.restBase,ConfigPersistence::Runtime,sizeof(cfgData_.restBase)
    };
    ConfigVariable<char,0> clientIdVar {
        CFG_KEY(ConfigKeys::Gateway::ClientId),"client_id","gateway",ConfigType::CharArray,
        (char*)cfgData_.clientId,ConfigPersistence::Runtime,sizeof(cfgData_.clientId)
    };
    ConfigVariable<int32_t,0> maxRetriesVar {
        CFG_KEY(ConfigKeys::Gateway::MaxRetries),"max_retries","gateway",ConfigType::Int32,
        &cfgData_.maxRetries,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> retryDelayVar {
        CFG_KEY(ConfigKeys::Gateway::RetryDelayMs),"retry_delay_ms","gateway",ConfigType::Int32,
        &cfgData_.retryDelayMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> reconnectVar {
        CFG_KEY(ConfigKeys::Gateway::ReconnectMs),"reconnect_delay_ms","gateway",ConfigType::Int32,
        &cfgData_.reconnectDelayMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool,0> autoCreateVar {
        CFG_KEY(ConfigKeys::Gateway::AutoCreate),"auto_create","gateway",ConfigType::Bool,
        &cfgData_.autoCreate,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> httpTimeoutVar {
        CFG_KEY(ConfigKeys::Gateway::HttpTimeoutMs),"http_timeout_ms","gateway",ConfigType::Int32,
        &cfgData_.httpTimeoutMs,ConfigPersistence::Runtime,0
    };

    void setState_(GatewayState s);
    bool startChannel_();

    static void onInbound_(void* user, const char* feedKey, const char* payload);
    static void onConnection_(void* user, bool connected);

    static bool svcEnsureFeed_(void* ctx, const char* feedKey);
    static bool svcEnsureGroup_(void* ctx, const char* groupKey, const char* name);
    static uint8_t svcInitializeFeeds_(void* ctx, const char* const* feedKeys, uint8_t count);
    static bool svcPublish_(void* ctx, const char* feedKey, const char* value);
    static bool svcGetLatest_(void* ctx, const char* feedKey, FeedReading* out);
    static uint16_t svcGetHistory_(void* ctx, const char* feedKey, uint16_t limit, FeedReading* out, uint16_t max);
    static bool svcRegisterHandler_(void* ctx, const char* feedKey, FeedHandlerFn fn, void* user);
    static bool svcSetSwitch_(void* ctx, const char* feedKey, bool on);
    static FeedSwitchState svcSwitchState_(void* ctx, const char* feedKey);
    static bool svcIsPubSubConnected_(void* ctx);
    static FeedTransport svcLastTransport_(void* ctx);
};
