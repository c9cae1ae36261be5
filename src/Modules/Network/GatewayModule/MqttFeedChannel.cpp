/**
 * @file MqttFeedChannel.cpp
 * @brief Implementation file.
 */
#include "MqttFeedChannel.h"
#include "FeedCodec.h"
#define LOG_TAG "GwMqtt"
#include "Core/ModuleLog.h"

#include <mosquitto.h>

#include <exception>
#include <string.h>

MqttFeedChannel::~MqttFeedChannel()
{
    end();
}

bool MqttFeedChannel::libInit()
{
    return mosquitto_lib_init() == MOSQ_ERR_SUCCESS;
}

void MqttFeedChannel::libCleanup()
{
    mosquitto_lib_cleanup();
}

const char* MqttFeedChannel::connackStr(int rc)
{
    switch (rc) {
    case 0: return "accepted";
    case 1: return "incorrect protocol";
    case 2: return "client id rejected";
    case 3: return "server unavailable";
    case 4: return "bad username/password";
    case 5: return "not authorized";
    default: return "unknown error";
    }
}

bool MqttFeedChannel::begin(const MqttChannelConfig& cfg)
{
    end();
    host_ = cfg.host ? cfg.host : "";
    port_ = cfg.port;
    account_ = cfg.account ? cfg.account : "";
    keepAliveSec_ = cfg.keepAliveSec > 0 ? cfg.keepAliveSec : 60;

    const char* id = (cfg.clientId && cfg.clientId[0] != '\0') ? cfg.clientId : nullptr;
    mosq_ = mosquitto_new(id, true, this);
    if (!mosq_) {
        LOGE("mosquitto_new failed");
        return false;
    }
    if (!account_.empty()) {
        const int rc = mosquitto_username_pw_set(mosq_, account_.c_str(), cfg.apiKey ? cfg.apiKey : "");
        if (rc != MOSQ_ERR_SUCCESS) {
            LOGE("credentials rejected by client: %s", mosquitto_strerror(rc));
            end();
            return false;
        }
    }
    mosquitto_connect_callback_set(mosq_, &MqttFeedChannel::onConnectStatic_);
    mosquitto_disconnect_callback_set(mosq_, &MqttFeedChannel::onDisconnectStatic_);
    mosquitto_message_callback_set(mosq_, &MqttFeedChannel::onMessageStatic_);
    return true;
}

bool MqttFeedChannel::start()
{
    if (!mosq_) return false;
    if (loopRunning_) stop();

    int rc = mosquitto_connect_async(mosq_, host_.c_str(), (int)port_, keepAliveSec_);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGW("connect %s:%ld failed: %s", host_.c_str(), (long)port_, mosquitto_strerror(rc));
        return false;
    }
    rc = mosquitto_loop_start(mosq_);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGE("network thread not started: %s", mosquitto_strerror(rc));
        (void)mosquitto_disconnect(mosq_);
        return false;
    }
    loopRunning_ = true;
    LOGI("connecting to %s:%ld", host_.c_str(), (long)port_);
    return true;
}

void MqttFeedChannel::stop()
{
    if (!mosq_) return;
    const bool wasConnected = connected_.exchange(false);
    (void)mosquitto_disconnect(mosq_);
    if (loopRunning_) {
        (void)mosquitto_loop_stop(mosq_, true);
        loopRunning_ = false;
    }
    if (wasConnected) notifyConnection_(false);
}

void MqttFeedChannel::end()
{
    if (!mosq_) return;
    stop();
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
}

GatewayStatus MqttFeedChannel::write(const char* feedKey, const char* value)
{
    if (!mosq_ || !connected_.load()) return GatewayStatus::Transient;
    char topic[Limits::Gateway::Topic];
    if (!formatFeedTopic(topic, sizeof(topic), account_.c_str(), feedKey)) return GatewayStatus::Failed;

    const int rc = mosquitto_publish(mosq_, nullptr, topic, (int)strlen(value), value, 0, false);
    switch (rc) {
    case MOSQ_ERR_SUCCESS: return GatewayStatus::Ok;
    case MOSQ_ERR_NO_CONN:
    case MOSQ_ERR_CONN_LOST:
    case MOSQ_ERR_NOMEM:
        LOGW("publish %s: %s", topic, mosquitto_strerror(rc));
        return GatewayStatus::Transient;
    default:
        LOGW("publish %s: %s", topic, mosquitto_strerror(rc));
        return GatewayStatus::Failed;
    }
}

bool MqttFeedChannel::subscribe(const char* feedKey)
{
    if (!mosq_ || !connected_.load()) return false;
    char topic[Limits::Gateway::Topic];
    if (!formatFeedTopic(topic, sizeof(topic), account_.c_str(), feedKey)) return false;
    const int rc = mosquitto_subscribe(mosq_, nullptr, topic, 0);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGW("subscribe %s: %s", topic, mosquitto_strerror(rc));
        return false;
    }
    LOGI("subscribed %s", topic);
    return true;
}

void MqttFeedChannel::setInboundSink(FeedInboundSink sink, void* user)
{
    std::lock_guard<std::mutex> lk(cbMtx_);
    sink_ = sink;
    sinkUser_ = user;
}

void MqttFeedChannel::setConnectionListener(FeedConnectionListener listener, void* user)
{
    std::lock_guard<std::mutex> lk(cbMtx_);
    listener_ = listener;
    listenerUser_ = user;
}

void MqttFeedChannel::notifyConnection_(bool connected)
{
    FeedConnectionListener fn;
    void* user;
    {
        std::lock_guard<std::mutex> lk(cbMtx_);
        fn = listener_;
        user = listenerUser_;
    }
    if (fn) fn(user, connected);
}

void MqttFeedChannel::onConnectStatic_(struct mosquitto*, void* obj, int rc)
{
    MqttFeedChannel* self = static_cast<MqttFeedChannel*>(obj);
    if (!self) return;
    self->lastConnack_.store(rc);
    if (rc != 0) {
        LOGE("connection refused (%d): %s", rc, connackStr(rc));
        self->connected_.store(false);
        return;
    }
    LOGI("connected as %s", self->account_.c_str());
    self->connected_.store(true);
    self->notifyConnection_(true);
}

void MqttFeedChannel::onDisconnectStatic_(struct mosquitto*, void* obj, int rc)
{
    MqttFeedChannel* self = static_cast<MqttFeedChannel*>(obj);
    if (!self) return;
    const bool wasConnected = self->connected_.exchange(false);
    if (rc != 0) {
        LOGW("unexpected disconnect (%d): %s", rc, mosquitto_strerror(rc));
    } else {
        LOGI("disconnected");
    }
    if (wasConnected) self->notifyConnection_(false);
}

void MqttFeedChannel::onMessageStatic_(struct mosquitto*, void* obj, const struct mosquitto_message* msg)
{
    MqttFeedChannel* self = static_cast<MqttFeedChannel*>(obj);
    if (!self || !msg || !msg->topic) return;

    char feedKey[Limits::Gateway::FeedKey];
    if (!feedKeyFromTopic(msg->topic, feedKey, sizeof(feedKey))) {
        LOGD("ignored topic %s", msg->topic);
        return;
    }
    char payload[Limits::Gateway::FeedValue];
    const size_t len = (msg->payloadlen > 0) ? (size_t)msg->payloadlen : 0U;
    if (len >= sizeof(payload)) {
        LOGW("oversize payload on %s (%u bytes) dropped", feedKey, (unsigned)len);
        return;
    }
    if (len > 0) memcpy(payload, msg->payload, len);
    payload[len] = '\0';

    FeedInboundSink sink;
    void* user;
    {
        std::lock_guard<std::mutex> lk(self->cbMtx_);
        sink = self->sink_;
        user = self->sinkUser_;
    }
    if (!sink) return;
    try {
        sink(user, feedKey, payload);
    } catch (const std::exception& e) {
        LOGE("inbound %s: %s", feedKey, e.what());
    }
}
