/**
 * @file FirebaseStore.cpp
 * @brief Implementation file.
 */
#include "FirebaseStore.h"
#define LOG_TAG "Firebase"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>

#include <chrono>
#include <thread>

FirebaseStore::FirebaseStore(const FirebaseConfig& cfg)
    : baseUrl_(cfg.url ? cfg.url : ""),
      secret_(cfg.secret ? cfg.secret : ""),
      maxRetries_(cfg.maxRetries > 0 ? cfg.maxRetries : 1),
      retryDelayMs_(cfg.retryDelayMs)
{
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    http_.setTimeoutMs(cfg.timeoutMs);
}

std::string FirebaseStore::buildUrl(const char* path, const char* extraQuery) const
{
    std::string url = baseUrl_;
    url += '/';
    url += normalizeStorePath(path);
    url += ".json";
    char sep = '?';
    if (!secret_.empty()) {
        url += sep;
        url += "auth=";
        url += HttpClient::urlEncode(secret_.c_str());
        sep = '&';
    }
    if (extraQuery && extraQuery[0] != '\0') {
        url += sep;
        url += extraQuery;
    }
    return url;
}

bool FirebaseStore::exchange_(HttpMethod method, const char* path, const std::string& url, const char* body, HttpResponse& out)
{
    static const HttpHeader kJson[] = {{"Content-Type", "application/json"}};
    for (uint8_t attempt = 1; attempt <= maxRetries_; ++attempt) {
        out = HttpResponse{};
        const bool sent = http_.request(method, url.c_str(), kJson, 1, body, out);
        if (sent && out.status >= 200 && out.status < 300) return true;

        const bool retryable = !sent || out.status >= 500 || out.status == 429;
        if (sent) {
            LOGW("%s /%s -> HTTP %ld (attempt %u/%u)",
                 httpMethodStr(method), path, out.status, (unsigned)attempt, (unsigned)maxRetries_);
        } else {
            LOGW("%s /%s failed: %s (attempt %u/%u)",
                 httpMethodStr(method), path, out.error, (unsigned)attempt, (unsigned)maxRetries_);
        }
        if (!retryable) return false;
        if (attempt < maxRetries_ && retryDelayMs_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(retryDelayMs_));
        }
    }
    LOGE("%s /%s gave up after %u attempts", httpMethodStr(method), path, (unsigned)maxRetries_);
    return false;
}

bool FirebaseStore::set(const char* path, const char* json)
{
    HttpResponse r;
    return exchange_(HttpMethod::Put, path, buildUrl(path), json, r);
}

bool FirebaseStore::get(const char* path, std::string& outJson, bool& found)
{
    found = false;
    HttpResponse r;
    if (!exchange_(HttpMethod::Get, path, buildUrl(path), nullptr, r)) return false;
    if (r.body.empty() || r.body == "null") return true;
    outJson.swap(r.body);
    found = true;
    return true;
}

bool FirebaseStore::update(const char* path, const char* jsonObject)
{
    HttpResponse r;
    return exchange_(HttpMethod::Patch, path, buildUrl(path), jsonObject, r);
}

bool FirebaseStore::push(const char* path, const char* json, std::string& keyOut)
{
    HttpResponse r;
    if (!exchange_(HttpMethod::Post, path, buildUrl(path), json, r)) return false;

    StaticJsonDocument<256> doc;
    if (deserializeJson(doc, r.body)) {
        LOGW("push: unexpected reply '%s'", r.body.c_str());
        return false;
    }
    const char* name = doc["name"] | "";
    if (name[0] == '\0') return false;
    keyOut = name;
    return true;
}

bool FirebaseStore::getLast(const char* path, uint16_t limit, std::string& outJson)
{
    std::string query = "orderBy=";
    query += HttpClient::urlEncode("\"$key\"");
    if (limit > 0) {
        query += "&limitToLast=";
        query += std::to_string(limit);
    }
    HttpResponse r;
    if (!exchange_(HttpMethod::Get, path, buildUrl(path, query.c_str()), nullptr, r)) return false;
    if (r.body.empty() || r.body == "null") {
        outJson = "{}";
        return true;
    }
    outJson.swap(r.body);
    return true;
}

bool FirebaseStore::remove(const char* path)
{
    HttpResponse r;
    return exchange_(HttpMethod::Delete, path, buildUrl(path), nullptr, r);
}
