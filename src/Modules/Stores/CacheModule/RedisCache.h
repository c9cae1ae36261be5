#pragma once
/**
 * @file RedisCache.h
 * @brief Redis cache backend over a single RESP/TCP connection.
 */
#include "CacheBackend.h"
#include "RespCodec.h"

#include <mutex>

/** @brief Connection parameters for RedisCache. */
struct RedisConfig {
    const char* host = "127.0.0.1";
    int32_t port = 6379;
    const char* password = "";
    int32_t db = 0;
    uint32_t timeoutMs = 2000;
};

/**
 * @brief Blocking Redis client (GET/SET/DEL/LPUSH/LTRIM/LRANGE/PING).
 *
 * The connection is opened lazily, authenticated and switched to the
 * configured db; a failed exchange closes it and is retried once on a
 * fresh connection.
 */
class RedisCache : public CacheBackend, private RespReader {
public:
    explicit RedisCache(const RedisConfig& cfg);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    const char* name() const override { return "redis"; }

    bool get(const char* key, std::string& out, bool& found) override;
    bool set(const char* key, const char* value, uint32_t ttlSec) override;
    bool del(const char* key) override;
    bool listPush(const char* key, const char* value, uint32_t maxLen) override;
    bool listRange(const char* key, uint16_t limit, std::vector<std::string>& out) override;
    bool ping() override;

    /** @brief Last transport/protocol error text. */
    const char* lastError() const { return lastError_; }

private:
    RedisConfig cfg_;
    std::mutex mtx_;
    int fd_ = -1;
    std::string rxBuf_;
    size_t rxPos_ = 0;
    char lastError_[128] = {0};

    bool connect_();
    void close_();
    bool sendAll_(const std::string& data);
    bool fill_();
    bool exchange_(const std::vector<std::string>& args, RespReply& reply);
    /// exchange_ with one reconnect attempt on transport failure
    bool command_(const std::vector<std::string>& args, RespReply& reply);

    // RespReader
    bool readLine(std::string& line) override;
    bool readExact(size_t n, std::string& out) override;
};
