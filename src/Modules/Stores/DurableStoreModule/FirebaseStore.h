#pragma once
/**
 * @file FirebaseStore.h
 * @brief Firebase Realtime Database REST backend.
 */
#include "DurableBackend.h"
#include "Core/HttpClient.h"

/** @brief Connection parameters for FirebaseStore. */
struct FirebaseConfig {
    const char* url = "";       ///< `https://<project>.firebaseio.com`
    const char* secret = "";    ///< database secret or ID token, empty for open rules
    uint32_t timeoutMs = 10000;
    uint8_t maxRetries = 3;
    uint32_t retryDelayMs = 1000;
};

/**
 * @brief RTDB REST client: PUT/GET/PATCH/POST/DELETE on `{url}/{path}.json`.
 *
 * Transport errors and 5xx answers are retried with a fixed delay.
 */
class FirebaseStore : public DurableBackend {
public:
    explicit FirebaseStore(const FirebaseConfig& cfg);

    const char* name() const override { return "firebase"; }

    bool set(const char* path, const char* json) override;
    bool get(const char* path, std::string& outJson, bool& found) override;
    bool update(const char* path, const char* jsonObject) override;
    bool push(const char* path, const char* json, std::string& keyOut) override;
    bool getLast(const char* path, uint16_t limit, std::string& outJson) override;
    bool remove(const char* path) override;

    /** @brief Build `{url}/{path}.json?auth=...[&extraQuery]`. */
    std::string buildUrl(const char* path, const char* extraQuery = nullptr) const;

private:
    std::string baseUrl_;
    std::string secret_;
    uint8_t maxRetries_;
    uint32_t retryDelayMs_;
    HttpClient http_;

    bool exchange_(HttpMethod method, const char* path, const std::string& url, const char* body, HttpResponse& out);
};
