#pragma once
/**
 * @file HttpClient.h
 * @brief Blocking HTTP(S) request wrapper over libcurl.
 */
#include <stddef.h>
#include <stdint.h>
#include <string>

/** @brief HTTP verbs used by the REST backends. */
enum class HttpMethod : uint8_t { Get, Post, Put, Patch, Delete };

/** @brief Single request header. */
struct HttpHeader {
    const char* name;
    const char* value;
};

/** @brief Response of a completed exchange. */
struct HttpResponse {
    long status = 0;          ///< 0 when the transport failed
    std::string body;
    char error[128] = {0};    ///< transport error text (status == 0)
};

/**
 * @brief Stateless HTTP client; each request uses its own easy handle.
 *
 * Call `HttpClient::globalInit()` once before any worker thread starts.
 */
class HttpClient {
public:
    /** @brief Process-wide libcurl initialization. */
    static bool globalInit();
    /** @brief Process-wide libcurl cleanup. */
    static void globalCleanup();

    /** @brief Total request timeout in milliseconds. */
    void setTimeoutMs(uint32_t ms) { timeoutMs_ = ms; }
    uint32_t timeoutMs() const { return timeoutMs_; }

    /**
     * @brief Perform one request.
     * @return false on transport failure (DNS, TLS, timeout); HTTP error statuses return true.
     */
    bool request(HttpMethod method,
                 const char* url,
                 const HttpHeader* headers,
                 size_t headerCount,
                 const char* body,
                 HttpResponse& out) const;

    /** @brief Percent-encode a query value. */
    static std::string urlEncode(const char* s);

private:
    uint32_t timeoutMs_ = 10000;
};

/** @brief Verb name (`GET`, `POST`, ...). */
const char* httpMethodStr(HttpMethod m);
