/**
 * @file MemoryStore.cpp
 * @brief Implementation file.
 */
#include "MemoryStore.h"
#include "Core/Runtime.h"
#define LOG_TAG "MemStore"
#include "Core/ModuleLog.h"

#include <ArduinoJson.h>

#include <stdio.h>
#include <vector>

namespace {

bool isDescendant(const std::string& key, const std::string& path)
{
    if (path.empty()) return true;
    return key.size() > path.size() &&
           key.compare(0, path.size(), path) == 0 &&
           key[path.size()] == '/';
}

}  // namespace

void MemoryStore::eraseSubtree_(const std::string& path)
{
    if (path.empty()) {
        leaves_.clear();
        return;
    }
    leaves_.erase(path);
    const std::string prefix = path + "/";
    auto it = leaves_.lower_bound(prefix);
    while (it != leaves_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = leaves_.erase(it);
    }
    // An ancestor stored as a leaf is replaced by the new subtree.
    for (size_t pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        leaves_.erase(path.substr(0, pos));
    }
}

bool MemoryStore::setLocked_(const std::string& path, const char* json)
{
    DynamicJsonDocument doc(strlen(json) * 2 + 256);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        LOGW("set %s: invalid json (%s)", path.c_str(), err.c_str());
        return false;
    }
    eraseSubtree_(path);
    if (doc.isNull()) return true;  // writing null deletes, as in RTDB
    std::string text;
    serializeJson(doc, text);
    leaves_[path] = text;
    return true;
}

bool MemoryStore::set(const char* path, const char* json)
{
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    return setLocked_(p, json);
}

bool MemoryStore::composeLocked_(const std::string& path, std::string& out, bool& found)
{
    found = false;
    auto exact = leaves_.find(path);
    if (exact != leaves_.end()) {
        out = exact->second;
        found = true;
        return true;
    }

    size_t total = 0;
    std::vector<std::pair<std::string, const std::string*>> subs;
    for (auto it = leaves_.begin(); it != leaves_.end(); ++it) {
        if (!isDescendant(it->first, path)) continue;
        const std::string rel = path.empty() ? it->first : it->first.substr(path.size() + 1);
        subs.emplace_back(rel, &it->second);
        total += it->first.size() + it->second.size();
    }
    if (subs.empty()) return true;

    DynamicJsonDocument doc(total * 3 + 1024);
    JsonObject root = doc.to<JsonObject>();
    for (const auto& s : subs) {
        JsonObject cur = root;
        size_t start = 0;
        for (;;) {
            const size_t slash = s.first.find('/', start);
            if (slash == std::string::npos) break;
            const std::string seg = s.first.substr(start, slash - start);
            JsonObject next = cur[seg].as<JsonObject>();
            if (next.isNull()) next = cur.createNestedObject(seg);
            cur = next;
            start = slash + 1;
        }
        DynamicJsonDocument leaf(s.second->size() * 2 + 128);
        if (deserializeJson(leaf, *s.second)) continue;
        cur[s.first.substr(start)].set(leaf.as<JsonVariantConst>());
    }
    if (doc.overflowed()) {
        LOGE("get %s: document overflow", path.c_str());
        return false;
    }
    out.clear();
    serializeJson(doc, out);
    found = true;
    return true;
}

bool MemoryStore::get(const char* path, std::string& outJson, bool& found)
{
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    return composeLocked_(p, outJson, found);
}

bool MemoryStore::update(const char* path, const char* jsonObject)
{
    DynamicJsonDocument doc(strlen(jsonObject) * 2 + 256);
    if (deserializeJson(doc, jsonObject) || !doc.is<JsonObject>()) {
        LOGW("update %s: object expected", path);
        return false;
    }
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
        std::string child = p.empty() ? std::string(kv.key().c_str()) : p + "/" + kv.key().c_str();
        child = normalizeStorePath(child.c_str());
        std::string text;
        serializeJson(kv.value(), text);
        if (!setLocked_(child, text.c_str())) return false;
    }
    return true;
}

bool MemoryStore::push(const char* path, const char* json, std::string& keyOut)
{
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    const uint64_t nowMs = Clock::nowEpochMs();
    if (nowMs <= lastPushMs_) {
        ++pushSeq_;
    } else {
        lastPushMs_ = nowMs;
        pushSeq_ = 0;
    }
    char key[32];
    snprintf(key, sizeof(key), "-%013llu%05u", (unsigned long long)lastPushMs_, (unsigned)pushSeq_);
    keyOut = key;
    return setLocked_(p.empty() ? keyOut : p + "/" + keyOut, json);
}

bool MemoryStore::getLast(const char* path, uint16_t limit, std::string& outJson)
{
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);

    std::vector<std::string> children;
    for (auto it = leaves_.begin(); it != leaves_.end(); ++it) {
        if (!isDescendant(it->first, p)) continue;
        const std::string rel = p.empty() ? it->first : it->first.substr(p.size() + 1);
        const std::string child = rel.substr(0, rel.find('/'));
        if (children.empty() || children.back() != child) children.push_back(child);
    }

    const size_t first = (limit > 0 && children.size() > limit) ? children.size() - limit : 0;
    outJson = "{";
    bool any = false;
    for (size_t i = first; i < children.size(); ++i) {
        std::string value;
        bool found = false;
        const std::string childPath = p.empty() ? children[i] : p + "/" + children[i];
        if (!composeLocked_(childPath, value, found) || !found) continue;
        StaticJsonDocument<128> keyDoc;
        keyDoc.set(children[i].c_str());
        std::string keyJson;
        serializeJson(keyDoc, keyJson);
        if (any) outJson += ',';
        outJson += keyJson;
        outJson += ':';
        outJson += value;
        any = true;
    }
    outJson += '}';
    return true;
}

bool MemoryStore::remove(const char* path)
{
    const std::string p = normalizeStorePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    eraseSubtree_(p);
    return true;
}

size_t MemoryStore::leafCount()
{
    std::lock_guard<std::mutex> lk(mtx_);
    return leaves_.size();
}
