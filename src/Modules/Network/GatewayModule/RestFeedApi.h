#pragma once
/**
 * @file RestFeedApi.h
 * @brief Feed platform REST API (Adafruit IO v2 style) over HttpClient.
 */
#include <string>

#include "Core/HttpClient.h"
#include "FeedPorts.h"

/** @brief REST endpoint and credentials. */
struct RestFeedConfig {
    const char* baseUrl = "https://io.adafruit.com/api/v2";
    const char* account = "";
    const char* apiKey = "";
    uint32_t timeoutMs = 10000;
};

/**
 * @brief `{base}/{account}/feeds|groups/...` authenticated with `X-AIO-Key`.
 */
class RestFeedApi : public FeedRestApi {
public:
    void configure(const RestFeedConfig& cfg);

    const char* name() const override { return "rest"; }
    bool ready() const override;
    GatewayStatus write(const char* feedKey, const char* value) override;

    GatewayStatus getFeed(const char* feedKey) override;
    GatewayStatus createFeed(const char* feedKey, const char* name,
                             const char* description, const char* groupKey) override;
    GatewayStatus getGroup(const char* groupKey) override;
    GatewayStatus createGroup(const char* groupKey, const char* name) override;
    GatewayStatus readLast(const char* feedKey, FeedReading& out) override;
    GatewayStatus readRange(const char* feedKey, uint16_t limit, std::vector<FeedReading>& out) override;

    /** @brief Map a transport outcome / HTTP status to a GatewayStatus. */
    static GatewayStatus classify(bool sent, long httpStatus);

private:
    std::string baseUrl_;
    std::string account_;
    std::string apiKey_;
    HttpClient http_;

    std::string url_(const char* suffix) const;
    GatewayStatus call_(HttpMethod method, const std::string& url, const char* body,
                        HttpResponse& out, const char* what);
};
