#pragma once
/**
 * @file MqttFeedChannel.h
 * @brief Pub/sub feed channel over libmosquitto.
 */
#include <atomic>
#include <mutex>
#include <string>

#include "FeedPorts.h"

struct mosquitto;
struct mosquitto_message;

/** @brief Broker endpoint and credentials. */
struct MqttChannelConfig {
    const char* host = "io.adafruit.com";
    int32_t port = 1883;
    const char* account = "";    ///< username and topic prefix
    const char* apiKey = "";     ///< password
    const char* clientId = "";   ///< empty = generated by the library
    int keepAliveSec = 60;
};

/**
 * @brief Topic `{account}/feeds/{key}` channel.
 *
 * The network loop runs on the library thread (`mosquitto_loop_start`).
 * Reconnection is driven by the owner through `start`/`stop`.
 */
class MqttFeedChannel : public FeedPubSub {
public:
    MqttFeedChannel() = default;
    ~MqttFeedChannel() override;

    MqttFeedChannel(const MqttFeedChannel&) = delete;
    MqttFeedChannel& operator=(const MqttFeedChannel&) = delete;

    /** @brief Process-wide library init/cleanup. */
    static bool libInit();
    static void libCleanup();

    /** @brief Create the client handle. */
    bool begin(const MqttChannelConfig& cfg);
    /** @brief Non-blocking connect and start the network thread. */
    bool start();
    /** @brief Disconnect and join the network thread. */
    void stop();
    /** @brief stop() and destroy the handle. */
    void end();

    const char* name() const override { return "mqtt"; }
    bool ready() const override { return connected_.load(); }
    GatewayStatus write(const char* feedKey, const char* value) override;

    bool subscribe(const char* feedKey) override;
    void setInboundSink(FeedInboundSink sink, void* user) override;
    void setConnectionListener(FeedConnectionListener listener, void* user) override;

    /** @brief Last CONNACK code (0 accepted). */
    int lastConnectResult() const { return lastConnack_.load(); }
    /** @brief Meaning of a CONNACK return code. */
    static const char* connackStr(int rc);

private:
    struct mosquitto* mosq_ = nullptr;
    std::string host_;
    int32_t port_ = 1883;
    std::string account_;
    int keepAliveSec_ = 60;
    bool loopRunning_ = false;

    std::atomic<bool> connected_{false};
    std::atomic<int> lastConnack_{-1};

    std::mutex cbMtx_;
    FeedInboundSink sink_ = nullptr;
    void* sinkUser_ = nullptr;
    FeedConnectionListener listener_ = nullptr;
    void* listenerUser_ = nullptr;

    static void onConnectStatic_(struct mosquitto*, void* obj, int rc);
    static void onDisconnectStatic_(struct mosquitto*, void* obj, int rc);
    static void onMessageStatic_(struct mosquitto*, void* obj, const struct mosquitto_message* msg);

    void notifyConnection_(bool connected);
};
