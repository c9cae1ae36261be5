/**
 * @file HttpClient.cpp
 * @brief Implementation file.
 */
#include "Core/HttpClient.h"
#include "Core/Log.h"

#include <curl/curl.h>
#include <cstdio>
#include <cstring>

#define LOG_TAG_CORE "HttpClnt"

namespace {

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/// RAII holder for the per-request handles.
struct CurlRequest {
    CURL* easy = nullptr;
    curl_slist* headers = nullptr;
    CurlRequest() : easy(curl_easy_init()) {}
    ~CurlRequest() {
        if (headers) curl_slist_free_all(headers);
        if (easy) curl_easy_cleanup(easy);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;
};

}  // namespace

const char* httpMethodStr(HttpMethod m)
{
    switch (m) {
    case HttpMethod::Get: return "GET";
    case HttpMethod::Post: return "POST";
    case HttpMethod::Put: return "PUT";
    case HttpMethod::Patch: return "PATCH";
    case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

bool HttpClient::globalInit()
{
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        Log::error(LOG_TAG_CORE, "curl_global_init failed: %s", curl_easy_strerror(rc));
        return false;
    }
    return true;
}

void HttpClient::globalCleanup()
{
    curl_global_cleanup();
}

bool HttpClient::request(HttpMethod method,
                         const char* url,
                         const HttpHeader* headers,
                         size_t headerCount,
                         const char* body,
                         HttpResponse& out) const
{
    out.status = 0;
    out.body.clear();
    out.error[0] = '\0';

    if (!url || url[0] == '\0') {
        snprintf(out.error, sizeof(out.error), "empty url");
        return false;
    }

    CurlRequest req;
    if (!req.easy) {
        snprintf(out.error, sizeof(out.error), "curl_easy_init failed");
        return false;
    }

    char line[512];
    for (size_t i = 0; i < headerCount; ++i) {
        if (!headers[i].name || !headers[i].value) continue;
        snprintf(line, sizeof(line), "%s: %s", headers[i].name, headers[i].value);
        req.headers = curl_slist_append(req.headers, line);
    }
    if (body) {
        req.headers = curl_slist_append(req.headers, "Content-Type: application/json");
    }
    req.headers = curl_slist_append(req.headers, "Accept: application/json");

    curl_easy_setopt(req.easy, CURLOPT_URL, url);
    curl_easy_setopt(req.easy, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(req.easy, CURLOPT_TIMEOUT_MS, (long)timeoutMs_);
    curl_easy_setopt(req.easy, CURLOPT_CONNECTTIMEOUT_MS, (long)timeoutMs_);
    curl_easy_setopt(req.easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.easy, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(req.easy, CURLOPT_WRITEDATA, &out.body);

    switch (method) {
    case HttpMethod::Get:
        curl_easy_setopt(req.easy, CURLOPT_HTTPGET, 1L);
        break;
    case HttpMethod::Post:
        curl_easy_setopt(req.easy, CURLOPT_POST, 1L);
        break;
    default:
        curl_easy_setopt(req.easy, CURLOPT_CUSTOMREQUEST, httpMethodStr(method));
        break;
    }
    if (body) {
        curl_easy_setopt(req.easy, CURLOPT_POSTFIELDS, body);
        curl_easy_setopt(req.easy, CURLOPT_POSTFIELDSIZE, (long)strlen(body));
    }

    const CURLcode rc = curl_easy_perform(req.easy);
    if (rc != CURLE_OK) {
        snprintf(out.error, sizeof(out.error), "%s", curl_easy_strerror(rc));
        Log::debug(LOG_TAG_CORE, "%s failed: %s", httpMethodStr(method), out.error);
        return false;
    }

    curl_easy_getinfo(req.easy, CURLINFO_RESPONSE_CODE, &out.status);
    return true;
}

std::string HttpClient::urlEncode(const char* s)
{
    std::string out;
    if (!s) return out;
    static const char kHex[] = "0123456789ABCDEF";
    for (const unsigned char* p = (const unsigned char*)s; *p; ++p) {
        const unsigned char c = *p;
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}
