/**
 * @file RedisCache.cpp
 * @brief Implementation file.
 */
#include "RedisCache.h"
#define LOG_TAG "RedisCch"
#include "Core/ModuleLog.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

RedisCache::RedisCache(const RedisConfig& cfg) : cfg_(cfg) {}

RedisCache::~RedisCache()
{
    close_();
}

void RedisCache::close_()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    rxBuf_.clear();
    rxPos_ = 0;
}

bool RedisCache::connect_()
{
    close_();

    char portStr[8];
    snprintf(portStr, sizeof(portStr), "%d", (int)cfg_.port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = getaddrinfo(cfg_.host, portStr, &hints, &res);
    if (gai != 0 || !res) {
        snprintf(lastError_, sizeof(lastError_), "resolve %s: %s", cfg_.host, gai_strerror(gai));
        return false;
    }

    timeval tv{};
    tv.tv_sec = cfg_.timeoutMs / 1000;
    tv.tv_usec = (cfg_.timeoutMs % 1000) * 1000;

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        snprintf(lastError_, sizeof(lastError_), "connect %s:%d: %s", cfg_.host, (int)cfg_.port, strerror(errno));
        ::close(fd);
    }
    freeaddrinfo(res);
    if (fd_ < 0) return false;

    RespReply reply;
    if (cfg_.password && cfg_.password[0] != '\0') {
        if (!exchange_({"AUTH", cfg_.password}, reply) || !reply.isOk()) {
            snprintf(lastError_, sizeof(lastError_), "AUTH rejected");
            LOGE("Redis authentication failed");
            close_();
            return false;
        }
    }
    if (cfg_.db != 0) {
        if (!exchange_({"SELECT", std::to_string(cfg_.db)}, reply) || !reply.isOk()) {
            snprintf(lastError_, sizeof(lastError_), "SELECT %d rejected", (int)cfg_.db);
            close_();
            return false;
        }
    }
    LOGI("connected to %s:%d db=%d", cfg_.host, (int)cfg_.port, (int)cfg_.db);
    return true;
}

bool RedisCache::sendAll_(const std::string& data)
{
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            snprintf(lastError_, sizeof(lastError_), "send: %s", strerror(errno));
            return false;
        }
        off += (size_t)n;
    }
    return true;
}

bool RedisCache::fill_()
{
    if (rxPos_ > 0 && rxPos_ >= rxBuf_.size()) {
        rxBuf_.clear();
        rxPos_ = 0;
    }
    char tmp[4096];
    for (;;) {
        const ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            snprintf(lastError_, sizeof(lastError_), "recv: %s", n == 0 ? "closed" : strerror(errno));
            return false;
        }
        rxBuf_.append(tmp, (size_t)n);
        return true;
    }
}

bool RedisCache::readLine(std::string& line)
{
    for (;;) {
        const size_t crlf = rxBuf_.find("\r\n", rxPos_);
        if (crlf != std::string::npos) {
            line.assign(rxBuf_, rxPos_, crlf - rxPos_);
            rxPos_ = crlf + 2;
            return true;
        }
        if (!fill_()) return false;
    }
}

bool RedisCache::readExact(size_t n, std::string& out)
{
    while (rxBuf_.size() - rxPos_ < n) {
        if (!fill_()) return false;
    }
    out.assign(rxBuf_, rxPos_, n);
    rxPos_ += n;
    return true;
}

bool RedisCache::exchange_(const std::vector<std::string>& args, RespReply& reply)
{
    if (fd_ < 0) return false;
    std::string wire;
    respEncodeCommand(args, wire);
    if (!sendAll_(wire)) return false;
    if (!respParseReply(*this, reply)) {
        if (lastError_[0] == '\0') snprintf(lastError_, sizeof(lastError_), "protocol error");
        return false;
    }
    if (rxPos_ >= rxBuf_.size()) {
        rxBuf_.clear();
        rxPos_ = 0;
    }
    return true;
}

bool RedisCache::command_(const std::vector<std::string>& args, RespReply& reply)
{
    lastError_[0] = '\0';
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (fd_ < 0 && !connect_()) continue;
        if (exchange_(args, reply)) {
            if (reply.type == RespReply::Type::Error) {
                LOGW("%s -> %s", args.empty() ? "?" : args[0].c_str(), reply.str.c_str());
                return false;
            }
            return true;
        }
        close_();
    }
    LOGW("%s failed: %s", args.empty() ? "?" : args[0].c_str(), lastError_);
    return false;
}

bool RedisCache::get(const char* key, std::string& out, bool& found)
{
    std::lock_guard<std::mutex> lk(mtx_);
    found = false;
    RespReply r;
    if (!command_({"GET", key}, r)) return false;
    if (r.type == RespReply::Type::Nil) return true;
    if (r.type != RespReply::Type::Bulk) return false;
    out.swap(r.str);
    found = true;
    return true;
}

bool RedisCache::set(const char* key, const char* value, uint32_t ttlSec)
{
    std::lock_guard<std::mutex> lk(mtx_);
    RespReply r;
    if (ttlSec > 0) {
        if (!command_({"SET", key, value, "EX", std::to_string(ttlSec)}, r)) return false;
    } else {
        if (!command_({"SET", key, value}, r)) return false;
    }
    return r.isOk();
}

bool RedisCache::del(const char* key)
{
    std::lock_guard<std::mutex> lk(mtx_);
    RespReply r;
    return command_({"DEL", key}, r) && r.type == RespReply::Type::Integer;
}

bool RedisCache::listPush(const char* key, const char* value, uint32_t maxLen)
{
    std::lock_guard<std::mutex> lk(mtx_);
    RespReply r;
    if (!command_({"LPUSH", key, value}, r) || r.type != RespReply::Type::Integer) return false;
    if (maxLen == 0) return true;
    if (!command_({"LTRIM", key, "0", std::to_string(maxLen - 1)}, r)) return false;
    return r.isOk();
}

bool RedisCache::listRange(const char* key, uint16_t limit, std::vector<std::string>& out)
{
    std::lock_guard<std::mutex> lk(mtx_);
    out.clear();
    if (limit == 0) return true;
    RespReply r;
    if (!command_({"LRANGE", key, "0", std::to_string(limit - 1)}, r)) return false;
    if (r.type == RespReply::Type::Nil) return true;
    if (r.type != RespReply::Type::Array) return false;
    for (RespReply& e : r.elements) {
        if (e.type == RespReply::Type::Bulk) out.push_back(std::move(e.str));
    }
    return true;
}

bool RedisCache::ping()
{
    std::lock_guard<std::mutex> lk(mtx_);
    RespReply r;
    return command_({"PING"}, r) && r.type == RespReply::Type::Status && r.str == "PONG";
}
