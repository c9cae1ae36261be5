/**
 * @file GatewayModule.cpp
 * @brief Implementation file.
 */
#include "GatewayModule.h"
#include "Core/Runtime.h"
#define LOG_TAG "GatewayM"
#include "Core/ModuleLog.h"

#include <cstdlib>
#include <vector>

GatewayModule::GatewayModule() : client_(&rest_, &mqtt_) {}

GatewayModule::~GatewayModule()
{
    stopTask();
    mqtt_.end();
}

static const char* stateStr(GatewayState s)
{
    switch (s) {
    case GatewayState::Disabled: return "disabled";
    case GatewayState::Connecting: return "connecting";
    case GatewayState::Connected: return "connected";
    case GatewayState::ErrorWait: return "error_wait";
    }
    return "?";
}

void GatewayModule::setState_(GatewayState s)
{
    if (state_ != s) LOGD("state %s -> %s", stateStr(state_), stateStr(s));
    state_ = s;
    stateTs_ = millis();
}

bool GatewayModule::svcEnsureFeed_(void* ctx, const char* feedKey)
{
    return static_cast<GatewayModule*>(ctx)->client_.ensureFeed(feedKey) == GatewayStatus::Ok;
}

bool GatewayModule::svcEnsureGroup_(void* ctx, const char* groupKey, const char* name)
{
    return static_cast<GatewayModule*>(ctx)->client_.ensureGroup(groupKey, name) == GatewayStatus::Ok;
}

uint8_t GatewayModule::svcInitializeFeeds_(void* ctx, const char* const* feedKeys, uint8_t count)
{
    return static_cast<GatewayModule*>(ctx)->client_.initializeFeeds(feedKeys, count);
}

bool GatewayModule::svcPublish_(void* ctx, const char* feedKey, const char* value)
{
    return static_cast<GatewayModule*>(ctx)->client_.publish(feedKey, value);
}

bool GatewayModule::svcGetLatest_(void* ctx, const char* feedKey, FeedReading* out)
{
    if (!out) return false;
    return static_cast<GatewayModule*>(ctx)->client_.getLatest(feedKey, *out);
}

uint16_t GatewayModule::svcGetHistory_(void* ctx, const char* feedKey, uint16_t limit, FeedReading* out, uint16_t max)
{
    if (!out || max == 0) return 0;
    std::vector<FeedReading> items;
    static_cast<GatewayModule*>(ctx)->client_.getHistory(feedKey, limit < max ? limit : max, items);
    uint16_t n = 0;
    for (const FeedReading& r : items) {
        if (n >= max) break;
        out[n++] = r;
    }
    return n;
}

bool GatewayModule::svcRegisterHandler_(void* ctx, const char* feedKey, FeedHandlerFn fn, void* user)
{
    return static_cast<GatewayModule*>(ctx)->client_.registerHandler(feedKey, fn, user);
}

bool GatewayModule::svcSetSwitch_(void* ctx, const char* feedKey, bool on)
{
    return static_cast<GatewayModule*>(ctx)->client_.setSwitch(feedKey, on);
}

FeedSwitchState GatewayModule::svcSwitchState_(void* ctx, const char* feedKey)
{
    return static_cast<GatewayModule*>(ctx)->client_.switchState(feedKey);
}

bool GatewayModule::svcIsPubSubConnected_(void* ctx)
{
    return static_cast<GatewayModule*>(ctx)->client_.isPubSubConnected();
}

FeedTransport GatewayModule::svcLastTransport_(void* ctx)
{
    return static_cast<GatewayModule*>(ctx)->client_.lastTransport();
}

void GatewayModule::onInbound_(void* user, const char* feedKey, const char* payload)
{
    static_cast<GatewayModule*>(user)->client_.dispatchInbound(feedKey, payload);
}

void GatewayModule::onConnection_(void* user, bool connected)
{
    GatewayModule* self = static_cast<GatewayModule*>(user);
    if (connected) self->client_.onPubSubConnected();
    self->wakeTask();
}

void GatewayModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(accountVar);
    cfg.registerVar(apiKeyVar);
    cfg.registerVar(mqttHostVar);
    cfg.registerVar(mqttPortVar);
    cfg.registerVar(restBaseVar);
    cfg.registerVar(clientIdVar);
    cfg.registerVar(maxRetriesVar);
    cfg.registerVar(retryDelayVar);
    cfg.registerVar(reconnectVar);
    cfg.registerVar(autoCreateVar);
    cfg.registerVar(httpTimeoutVar);

    svc_ = GatewayService{
        svcEnsureFeed_, svcEnsureGroup_, svcInitializeFeeds_, svcPublish_, svcGetLatest_,
        svcGetHistory_, svcRegisterHandler_, svcSetSwitch_, svcSwitchState_,
        svcIsPubSubConnected_, svcLastTransport_, this
    };
    services.add("gateway", &svc_);

    mqtt_.setInboundSink(&GatewayModule::onInbound_, this);
    mqtt_.setConnectionListener(&GatewayModule::onConnection_, this);
}

void GatewayModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry&)
{
    const char* envKey = getenv("IRRIFLOW_GATEWAY_KEY");
    if (envKey && envKey[0] != '\0') (void)cfg.set(apiKeyVar, envKey);
    const char* envAccount = getenv("IRRIFLOW_GATEWAY_ACCOUNT");
    if (envAccount && envAccount[0] != '\0') (void)cfg.set(accountVar, envAccount);

    GatewayClientConfig gc;
    gc.maxRetries = (uint8_t)((cfgData_.maxRetries > 0 && cfgData_.maxRetries < 20) ? cfgData_.maxRetries : 3);
    gc.retryDelayMs = cfgData_.retryDelayMs >= 0 ? (uint32_t)cfgData_.retryDelayMs : 1000U;
    gc.autoCreate = cfgData_.autoCreate;
    client_.configure(gc);

    RestFeedConfig rc;
    rc.baseUrl = cfgData_.restBase;
    rc.account = cfgData_.account;
    rc.apiKey = cfgData_.apiKey;
    rc.timeoutMs = cfgData_.httpTimeoutMs > 0 ? (uint32_t)cfgData_.httpTimeoutMs : 10000U;
    rest_.configure(rc);

    configured_ = cfgData_.account[0] != '\0' && cfgData_.apiKey[0] != '\0';
    if (!configured_) {
        LOGW("account or api key missing, gateway calls will fail");
    } else {
        LOGI("account=%s broker=%s:%ld rest=%s retries=%u/%lums",
             cfgData_.account, cfgData_.mqttHost, (long)cfgData_.mqttPort, cfgData_.restBase,
             (unsigned)gc.maxRetries, (unsigned long)gc.retryDelayMs);
    }
}

bool GatewayModule::startChannel_()
{
    MqttChannelConfig mc;
    mc.host = cfgData_.mqttHost;
    mc.port = cfgData_.mqttPort;
    mc.account = cfgData_.account;
    mc.apiKey = cfgData_.apiKey;
    mc.clientId = cfgData_.clientId;
    if (!mqtt_.begin(mc)) return false;
    return mqtt_.start();
}

void GatewayModule::loop()
{
    if (!cfgData_.enabled || !configured_) {
        if (state_ != GatewayState::Disabled) {
            mqtt_.end();
            setState_(GatewayState::Disabled);
            LOGI("pub/sub disabled");
        }
        (void)waitOrStop(1000);
        return;
    }

    switch (state_) {
    case GatewayState::Disabled:
        if (startChannel_()) {
            setState_(GatewayState::Connecting);
        } else {
            setState_(GatewayState::ErrorWait);
        }
        break;
    case GatewayState::Connecting:
        if (mqtt_.ready()) {
            setState_(GatewayState::Connected);
        } else if (millis() - stateTs_ > Limits::Gateway::ConnectTimeoutMs) {
            const int rc = mqtt_.lastConnectResult();
            if (rc > 0) {
                LOGW("connect failed: %s", MqttFeedChannel::connackStr(rc));
            } else {
                LOGW("connect timeout");
            }
            mqtt_.stop();
            setState_(GatewayState::ErrorWait);
        }
        break;
    case GatewayState::Connected:
        if (!mqtt_.ready()) {
            LOGW("pub/sub connection lost, retry in %ldms", (long)cfgData_.reconnectDelayMs);
            mqtt_.stop();
            setState_(GatewayState::ErrorWait);
        }
        break;
    case GatewayState::ErrorWait:
        if (millis() - stateTs_ >= (uint32_t)(cfgData_.reconnectDelayMs > 0 ? cfgData_.reconnectDelayMs : 0)) {
            if (startChannel_()) {
                setState_(GatewayState::Connecting);
            } else {
                setState_(GatewayState::ErrorWait);
            }
        }
        break;
    }

    (void)waitOrStop(Limits::Gateway::LoopDelayMs);
}
