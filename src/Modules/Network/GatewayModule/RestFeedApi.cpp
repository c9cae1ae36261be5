/**
 * @file RestFeedApi.cpp
 * @brief Implementation file.
 */
#include "RestFeedApi.h"
#include "FeedCodec.h"
#define LOG_TAG "GwRest"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>

void RestFeedApi::configure(const RestFeedConfig& cfg)
{
    baseUrl_ = cfg.baseUrl ? cfg.baseUrl : "";
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    account_ = cfg.account ? cfg.account : "";
    apiKey_ = cfg.apiKey ? cfg.apiKey : "";
    http_.setTimeoutMs(cfg.timeoutMs);
}

bool RestFeedApi::ready() const
{
    return !baseUrl_.empty() && !account_.empty() && !apiKey_.empty();
}

GatewayStatus RestFeedApi::classify(bool sent, long httpStatus)
{
    if (!sent) return GatewayStatus::Transient;
    if (httpStatus >= 200 && httpStatus < 300) return GatewayStatus::Ok;
    if (httpStatus == 401 || httpStatus == 403) return GatewayStatus::Unauthorized;
    if (httpStatus == 404) return GatewayStatus::NotFound;
    if (httpStatus == 429 || httpStatus >= 500) return GatewayStatus::Transient;
    return GatewayStatus::Failed;
}

std::string RestFeedApi::url_(const char* suffix) const
{
    std::string u = baseUrl_;
    u += '/';
    u += account_;
    u += suffix;
    return u;
}

GatewayStatus RestFeedApi::call_(HttpMethod method, const std::string& url, const char* body,
                                 HttpResponse& out, const char* what)
{
    if (!ready()) return GatewayStatus::Failed;
    const HttpHeader headers[] = {
        {"X-AIO-Key", apiKey_.c_str()},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    const bool sent = http_.request(method, url.c_str(), headers, 3, body, out);
    const GatewayStatus st = classify(sent, out.status);
    if (st != GatewayStatus::Ok && st != GatewayStatus::NotFound) {
        if (sent) {
            LOGW("%s -> HTTP %ld (%s)", what, out.status, gatewayStatusStr(st));
        } else {
            LOGW("%s -> %s", what, out.error);
        }
    }
    return st;
}

GatewayStatus RestFeedApi::write(const char* feedKey, const char* value)
{
    StaticJsonDocument<256> doc;
    doc["value"] = value;
    std::string body;
    serializeJson(doc, body);
    HttpResponse r;
    return call_(HttpMethod::Post, url_((std::string("/feeds/") + feedKey + "/data").c_str()),
                 body.c_str(), r, "write");
}

GatewayStatus RestFeedApi::getFeed(const char* feedKey)
{
    HttpResponse r;
    return call_(HttpMethod::Get, url_((std::string("/feeds/") + feedKey).c_str()), nullptr, r, "getFeed");
}

GatewayStatus RestFeedApi::createFeed(const char* feedKey, const char* name,
                                      const char* description, const char* groupKey)
{
    StaticJsonDocument<512> doc;
    JsonObject feed = doc.createNestedObject("feed");
    feed["name"] = name;
    feed["key"] = feedKey;
    if (description && description[0] != '\0') feed["description"] = description;
    std::string body;
    serializeJson(doc, body);

    std::string suffix = "/feeds";
    if (groupKey && groupKey[0] != '\0') {
        suffix += "?group_key=";
        suffix += HttpClient::urlEncode(groupKey);
    }
    HttpResponse r;
    return call_(HttpMethod::Post, url_(suffix.c_str()), body.c_str(), r, "createFeed");
}

GatewayStatus RestFeedApi::getGroup(const char* groupKey)
{
    HttpResponse r;
    return call_(HttpMethod::Get, url_((std::string("/groups/") + groupKey).c_str()), nullptr, r, "getGroup");
}

GatewayStatus RestFeedApi::createGroup(const char* groupKey, const char* name)
{
    StaticJsonDocument<256> doc;
    JsonObject group = doc.createNestedObject("group");
    group["name"] = name;
    group["key"] = groupKey;
    std::string body;
    serializeJson(doc, body);
    HttpResponse r;
    return call_(HttpMethod::Post, url_("/groups"), body.c_str(), r, "createGroup");
}

namespace {

bool readingFromJson(JsonObjectConst o, const char* feedKey, FeedReading& out)
{
    if (o.isNull()) return false;
    char value[Limits::Gateway::FeedValue];
    JsonVariantConst v = o["value"];
    if (v.isNull()) return false;
    if (v.is<const char*>()) {
        snprintf(value, sizeof(value), "%s", v.as<const char*>());
    } else {
        serializeJson(v, value, sizeof(value));
    }
    const char* key = o["feed_key"] | feedKey;
    fillFeedReading(out, key, o["id"] | "", value, o["created_at"] | "");
    return true;
}

}  // namespace

GatewayStatus RestFeedApi::readLast(const char* feedKey, FeedReading& out)
{
    HttpResponse r;
    const GatewayStatus st = call_(HttpMethod::Get,
                                   url_((std::string("/feeds/") + feedKey + "/data/last").c_str()),
                                   nullptr, r, "readLast");
    if (st != GatewayStatus::Ok) return st;

    DynamicJsonDocument doc(2048);
    if (deserializeJson(doc, r.body)) {
        LOGW("readLast %s: unparsable body", feedKey);
        return GatewayStatus::Failed;
    }
    if (!readingFromJson(doc.as<JsonObjectConst>(), feedKey, out)) return GatewayStatus::Failed;
    return GatewayStatus::Ok;
}

GatewayStatus RestFeedApi::readRange(const char* feedKey, uint16_t limit, std::vector<FeedReading>& out)
{
    out.clear();
    std::string suffix = std::string("/feeds/") + feedKey + "/data?limit=" + std::to_string(limit);
    HttpResponse r;
    const GatewayStatus st = call_(HttpMethod::Get, url_(suffix.c_str()), nullptr, r, "readRange");
    if (st != GatewayStatus::Ok) return st;

    DynamicJsonDocument doc(r.body.size() * 2 + 1024);
    if (deserializeJson(doc, r.body) || !doc.is<JsonArray>()) {
        LOGW("readRange %s: unparsable body", feedKey);
        return GatewayStatus::Failed;
    }
    for (JsonObjectConst o : doc.as<JsonArrayConst>()) {
        FeedReading fr;
        if (readingFromJson(o, feedKey, fr)) out.push_back(fr);
        if (out.size() >= limit) break;
    }
    return GatewayStatus::Ok;
}
