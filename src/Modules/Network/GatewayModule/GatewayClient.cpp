/**
 * @file GatewayClient.cpp
 * @brief Implementation file.
 */
#include "GatewayClient.h"
#include "FeedCodec.h"
#define LOG_TAG "GwClient"
#include "Core/ModuleLog.h"

#include <chrono>
#include <exception>
#include <stdio.h>
#include <string.h>
#include <thread>

GatewayClient::GatewayClient(FeedRestApi* rest, FeedPubSub* pubsub)
    : rest_(rest), pubsub_(pubsub), delayFn_(&GatewayClient::sleepDefault_)
{
}

void GatewayClient::sleepDefault_(void*, uint32_t ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void GatewayClient::configure(const GatewayClientConfig& cfg)
{
    std::lock_guard<std::mutex> lk(mtx_);
    cfg_ = cfg;
    if (cfg_.maxRetries == 0) cfg_.maxRetries = 1;
}

void GatewayClient::setDelayHook(GatewayDelayFn fn, void* ctx)
{
    std::lock_guard<std::mutex> lk(mtx_);
    delayFn_ = fn ? fn : &GatewayClient::sleepDefault_;
    delayCtx_ = ctx;
}

template <typename Op>
GatewayStatus GatewayClient::withRetry_(const char* what, const char* key, Op op)
{
    uint8_t attempts;
    uint32_t delayMs;
    GatewayDelayFn delayFn;
    void* delayCtx;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        attempts = cfg_.maxRetries;
        delayMs = cfg_.retryDelayMs;
        delayFn = delayFn_;
        delayCtx = delayCtx_;
    }

    GatewayStatus st = GatewayStatus::Failed;
    for (uint8_t attempt = 1; attempt <= attempts; ++attempt) {
        st = op();
        if (st == GatewayStatus::Unauthorized) {
            LOGC("%s %s: credentials rejected by the platform", what, key ? key : "");
            return st;
        }
        if (st != GatewayStatus::Transient) return st;
        if (attempt < attempts) {
            LOGW("%s %s: transient failure, retry in %lums (%u/%u)",
                 what, key ? key : "", (unsigned long)delayMs, (unsigned)attempt, (unsigned)attempts);
            delayFn(delayCtx, delayMs);
        }
    }
    LOGE("%s %s: gave up after %u attempts", what, key ? key : "", (unsigned)attempts);
    return st;
}

void GatewayClient::rememberProvisioned_(const char* feedKey)
{
    std::lock_guard<std::mutex> lk(mtx_);
    for (const std::string& k : provisioned_) {
        if (k == feedKey) return;
    }
    if (provisioned_.size() >= Limits::Gateway::MaxProvisioned) {
        provisioned_.erase(provisioned_.begin());
    }
    provisioned_.emplace_back(feedKey);
}

bool GatewayClient::isProvisioned(const char* feedKey) const
{
    if (!feedKey) return false;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const std::string& k : provisioned_) {
        if (k == feedKey) return true;
    }
    return false;
}

void GatewayClient::setLastTransport_(FeedTransport t)
{
    std::lock_guard<std::mutex> lk(mtx_);
    lastTransport_ = t;
}

FeedTransport GatewayClient::lastTransport() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return lastTransport_;
}

bool GatewayClient::isPubSubConnected() const
{
    return pubsub_ && pubsub_->ready();
}

GatewayStatus GatewayClient::ensureGroup(const char* groupKey, const char* name)
{
    if (!groupKey || groupKey[0] == '\0') return GatewayStatus::Failed;
    if (!rest_) return GatewayStatus::Failed;

    GatewayStatus st = withRetry_("getGroup", groupKey, [&]() { return rest_->getGroup(groupKey); });
    if (st != GatewayStatus::NotFound) return st;

    LOGI("group %s not found, creating", groupKey);
    const char* display = (name && name[0] != '\0') ? name : groupKey;
    st = withRetry_("createGroup", groupKey, [&]() { return rest_->createGroup(groupKey, display); });
    if (st == GatewayStatus::Ok) LOGI("group %s created", groupKey);
    return st;
}

GatewayStatus GatewayClient::ensureFeed(const char* feedKey, const char* name,
                                        const char* description, const char* groupKey)
{
    if (!feedKey || feedKey[0] == '\0') return GatewayStatus::Failed;
    if (isProvisioned(feedKey)) return GatewayStatus::Ok;
    if (!rest_) return GatewayStatus::Failed;

    GatewayStatus st = withRetry_("getFeed", feedKey, [&]() { return rest_->getFeed(feedKey); });
    if (st == GatewayStatus::Ok) {
        rememberProvisioned_(feedKey);
        return st;
    }
    if (st != GatewayStatus::NotFound) return st;

    if (groupKey && groupKey[0] != '\0') {
        const GatewayStatus gst = ensureGroup(groupKey, groupKey);
        if (gst == GatewayStatus::Unauthorized) return gst;
        if (gst != GatewayStatus::Ok) {
            LOGW("feed %s: group %s unavailable (%s), creating ungrouped",
                 feedKey, groupKey, gatewayStatusStr(gst));
            groupKey = nullptr;
        }
    }

    LOGI("feed %s not found, creating", feedKey);
    const char* display = (name && name[0] != '\0') ? name : feedKey;
    const char* desc = description ? description : "";
    st = withRetry_("createFeed", feedKey, [&]() {
        return rest_->createFeed(feedKey, display, desc, groupKey);
    });
    if (st == GatewayStatus::Ok) {
        rememberProvisioned_(feedKey);
        LOGI("feed %s created", feedKey);
    }
    return st;
}

uint8_t GatewayClient::initializeFeeds(const char* const* feedKeys, uint8_t count)
{
    if (!feedKeys) return 0;
    uint8_t ok = 0;
    uint8_t failed = 0;
    for (uint8_t i = 0; i < count; ++i) {
        if (!feedKeys[i]) continue;
        const GatewayStatus st = ensureFeed(feedKeys[i]);
        if (st == GatewayStatus::Ok) {
            ++ok;
        } else {
            ++failed;
            LOGE("feed %s not provisioned (%s)", feedKeys[i], gatewayStatusStr(st));
            if (st == GatewayStatus::Unauthorized) break;
        }
    }
    if (failed == 0) {
        LOGI("feeds provisioned: %u/%u", (unsigned)ok, (unsigned)count);
    } else {
        LOGW("feeds provisioned: %u/%u (%u failed)", (unsigned)ok, (unsigned)count, (unsigned)failed);
    }
    return ok;
}

bool GatewayClient::publish(const char* feedKey, const char* value)
{
    if (!feedKey || !value) return false;

    if (pubsub_ && pubsub_->ready()) {
        const GatewayStatus st = pubsub_->write(feedKey, value);
        if (st == GatewayStatus::Ok) {
            setLastTransport_(FeedTransport::PubSub);
            LOGD("%s <- %s (%s)", feedKey, value, pubsub_->name());
            return true;
        }
        LOGW("%s publish failed (%s), falling back to REST", pubsub_->name(), gatewayStatusStr(st));
    } else if (pubsub_) {
        LOGD("%s not connected, using REST for %s", pubsub_->name(), feedKey);
    }

    if (!rest_ || !rest_->ready()) {
        LOGE("publish %s: no transport available", feedKey);
        return false;
    }

    GatewayStatus st = withRetry_("write", feedKey, [&]() { return rest_->write(feedKey, value); });
    bool autoCreate;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        autoCreate = cfg_.autoCreate;
    }
    if (st == GatewayStatus::NotFound && autoCreate) {
        if (ensureFeed(feedKey) == GatewayStatus::Ok) {
            st = withRetry_("write", feedKey, [&]() { return rest_->write(feedKey, value); });
        }
    }
    if (st != GatewayStatus::Ok) return false;

    setLastTransport_(FeedTransport::Rest);
    LOGD("%s <- %s (%s)", feedKey, value, rest_->name());
    return true;
}

bool GatewayClient::getLatest(const char* feedKey, FeedReading& out)
{
    if (!feedKey || !rest_) return false;

    GatewayStatus st = withRetry_("readLast", feedKey, [&]() { return rest_->readLast(feedKey, out); });
    if (st == GatewayStatus::Ok) return true;

    if (st == GatewayStatus::NotFound) {
        bool autoCreate;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            autoCreate = cfg_.autoCreate;
        }
        if (autoCreate && !isProvisioned(feedKey)) (void)ensureFeed(feedKey);
        return false;
    }
    if (st == GatewayStatus::Unauthorized) return false;

    std::vector<FeedReading> items;
    st = withRetry_("readRange", feedKey, [&]() { return rest_->readRange(feedKey, 1, items); });
    if (st != GatewayStatus::Ok || items.empty()) return false;
    out = items.front();
    return true;
}

uint16_t GatewayClient::getHistory(const char* feedKey, uint16_t limit, std::vector<FeedReading>& out)
{
    out.clear();
    if (!feedKey || !rest_ || limit == 0) return 0;
    if (limit > Limits::Gateway::MaxHistory) limit = Limits::Gateway::MaxHistory;

    const GatewayStatus st = withRetry_("readRange", feedKey, [&]() {
        return rest_->readRange(feedKey, limit, out);
    });
    if (st == GatewayStatus::NotFound) {
        bool autoCreate;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            autoCreate = cfg_.autoCreate;
        }
        if (autoCreate) (void)ensureFeed(feedKey);
    }
    if (st != GatewayStatus::Ok) {
        out.clear();
        return 0;
    }
    if (out.size() > limit) out.resize(limit);
    return (uint16_t)out.size();
}

bool GatewayClient::registerHandler(const char* feedKey, FeedHandlerFn fn, void* user)
{
    if (!feedKey || feedKey[0] == '\0' || !fn) return false;
    if (strlen(feedKey) >= Limits::Gateway::FeedKey) return false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (handlerCount_ >= Limits::Gateway::MaxHandlers) {
            LOGE("handler table full, %s not registered", feedKey);
            return false;
        }
        Handler& h = handlers_[handlerCount_++];
        snprintf(h.feedKey, sizeof(h.feedKey), "%s", feedKey);
        h.fn = fn;
        h.user = user;
    }

    if (pubsub_ && pubsub_->ready()) {
        if (!pubsub_->subscribe(feedKey)) {
            LOGW("subscribe %s failed, retried on next connect", feedKey);
        }
    } else {
        LOGD("handler %s registered, subscribe deferred to connect", feedKey);
    }
    return true;
}

uint8_t GatewayClient::handlerCount() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return handlerCount_;
}

void GatewayClient::onPubSubConnected()
{
    if (!pubsub_) return;
    Handler copy[Limits::Gateway::MaxHandlers];
    uint8_t n;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        n = handlerCount_;
        for (uint8_t i = 0; i < n; ++i) copy[i] = handlers_[i];
    }
    uint8_t subscribed = 0;
    for (uint8_t i = 0; i < n; ++i) {
        bool dup = false;
        for (uint8_t j = 0; j < i; ++j) {
            if (strcmp(copy[j].feedKey, copy[i].feedKey) == 0) { dup = true; break; }
        }
        if (dup) continue;
        if (pubsub_->subscribe(copy[i].feedKey)) {
            ++subscribed;
        } else {
            LOGW("resubscribe %s failed", copy[i].feedKey);
        }
    }
    LOGI("pub/sub connected, %u feed(s) subscribed", (unsigned)subscribed);
}

void GatewayClient::dispatchInbound(const char* feedKey, const char* payload)
{
    if (!feedKey) return;
    Handler copy[Limits::Gateway::MaxHandlers];
    uint8_t n = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (uint8_t i = 0; i < handlerCount_; ++i) {
            if (strcmp(handlers_[i].feedKey, feedKey) == 0) copy[n++] = handlers_[i];
        }
    }
    if (n == 0) {
        LOGD("inbound %s: no handler", feedKey);
        return;
    }
    for (uint8_t i = 0; i < n; ++i) {
        try {
            copy[i].fn(copy[i].user, feedKey, payload ? payload : "");
        } catch (const std::exception& e) {
            LOGE("handler for %s threw: %s", feedKey, e.what());
        } catch (...) {
            LOGE("handler for %s threw", feedKey);
        }
    }
}

bool GatewayClient::setSwitch(const char* feedKey, bool on)
{
    if (!feedKey) return false;
    bool autoCreate;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        autoCreate = cfg_.autoCreate;
    }
    if (autoCreate) {
        const GatewayStatus st = ensureFeed(feedKey);
        if (st == GatewayStatus::Unauthorized) return false;
        if (st != GatewayStatus::Ok) {
            LOGW("switch %s: feed not confirmed (%s), publishing anyway", feedKey, gatewayStatusStr(st));
        }
    }
    return publish(feedKey, on ? "1" : "0");
}

FeedSwitchState GatewayClient::switchState(const char* feedKey)
{
    FeedReading r;
    if (!getLatest(feedKey, r)) return FeedSwitchState::Unknown;
    return parseSwitchValue(r.value);
}
