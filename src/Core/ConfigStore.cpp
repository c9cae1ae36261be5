/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"

#include <ArduinoJson.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#define LOG_TAG_CORE "CfgStore"

namespace {

bool readFile(const char* path, std::string& out, bool* missing)
{
    if (missing) *missing = false;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        if (missing) *missing = true;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return !in.bad();
}

bool isMaskedName(const char* name)
{
    if (!name) return false;
    return strcmp(name, "pass") == 0 ||
           strcmp(name, "password") == 0 ||
           strcmp(name, "key") == 0 ||
           strcmp(name, "api_key") == 0 ||
           strcmp(name, "token") == 0 ||
           strcmp(name, "secret") == 0;
}

void putValue(JsonObject obj, const char* name, const ConfigMeta& m, bool mask)
{
    switch (m.type) {
    case ConfigType::Int32:  obj[name] = *(int32_t*)m.valuePtr; break;
    case ConfigType::UInt8:  obj[name] = *(uint8_t*)m.valuePtr; break;
    case ConfigType::Bool:   obj[name] = *(bool*)m.valuePtr; break;
    case ConfigType::Float:  obj[name] = *(float*)m.valuePtr; break;
    case ConfigType::Double: obj[name] = *(double*)m.valuePtr; break;
    case ConfigType::CharArray:
        if (mask && isMaskedName(m.name)) {
            obj[name] = "***";
        } else {
            obj[name] = (char*)m.valuePtr;  ///< char* => copied into the document
        }
        break;
    }
}

/// Writes v into the meta storage. Returns true when the stored value changed.
bool assignValue(const ConfigMeta& m, JsonVariantConst v, bool* typeError)
{
    *typeError = false;
    switch (m.type) {
    case ConfigType::Int32: {
        if (!v.is<double>()) { *typeError = true; return false; }
        const int32_t nv = v.as<int32_t>();
        if (*(int32_t*)m.valuePtr == nv) return false;
        *(int32_t*)m.valuePtr = nv;
        return true;
    }
    case ConfigType::UInt8: {
        if (!v.is<double>()) { *typeError = true; return false; }
        const uint8_t nv = v.as<uint8_t>();
        if (*(uint8_t*)m.valuePtr == nv) return false;
        *(uint8_t*)m.valuePtr = nv;
        return true;
    }
    case ConfigType::Bool: {
        if (!v.is<bool>()) { *typeError = true; return false; }
        const bool nv = v.as<bool>();
        if (*(bool*)m.valuePtr == nv) return false;
        *(bool*)m.valuePtr = nv;
        return true;
    }
    case ConfigType::Float: {
        if (!v.is<double>()) { *typeError = true; return false; }
        const float nv = v.as<float>();
        if (*(float*)m.valuePtr == nv) return false;
        *(float*)m.valuePtr = nv;
        return true;
    }
    case ConfigType::Double: {
        if (!v.is<double>()) { *typeError = true; return false; }
        const double nv = v.as<double>();
        if (*(double*)m.valuePtr == nv) return false;
        *(double*)m.valuePtr = nv;
        return true;
    }
    case ConfigType::CharArray: {
        if (!v.is<const char*>() || m.size == 0) { *typeError = true; return false; }
        const char* s = v.as<const char*>();
        size_t len = strlen(s);
        if (len >= m.size) len = m.size - 1;
        char* dst = (char*)m.valuePtr;
        /// compare before writing to avoid unnecessary events
        if (strncmp(dst, s, len) == 0 && dst[len] == '\0') return false;
        memcpy(dst, s, len);
        dst[len] = '\0';
        return true;
    }
    }
    return false;
}

}  // namespace

void ConfigStore::setBootstrapPath(const char* path)
{
    snprintf(_bootstrapPath, sizeof(_bootstrapPath), "%s", path ? path : "");
}

void ConfigStore::setStoragePath(const char* path)
{
    snprintf(_storagePath, sizeof(_storagePath), "%s", path ? path : "");
}

void ConfigStore::notifyChanged(const char* key)
{
    if (!_eventBus || !key) return;

    ConfigChangedPayload p{};
    strncpy(p.key, key, sizeof(p.key) - 1);
    p.key[sizeof(p.key) - 1] = '\0';

    if (!_eventBus->post(EventId::ConfigChanged, &p, sizeof(p))) {
        Log::warn(LOG_TAG_CORE, "ConfigChanged dropped (%s)", p.key);
    }
}

void ConfigStore::persistIfNeeded_(ConfigPersistence persistence, const char* key)
{
    if (persistence != ConfigPersistence::Persistent || !key) return;
    if (_storagePath[0] == '\0') return;
    if (!writeStateFile_()) {
        Log::error(LOG_TAG_CORE, "persist failed for %s", key);
    }
}

const ConfigMeta* ConfigStore::findByKey_(const char* key) const
{
    if (!key) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (_meta[i].key && strcmp(_meta[i].key, key) == 0) return &_meta[i];
    }
    return nullptr;
}

bool ConfigStore::writeStateFile_()
{
    std::lock_guard<std::mutex> lk(_fileMtx);
    if (_storagePath[0] == '\0') return false;

    DynamicJsonDocument doc(Limits::JsonConfigStateBuf);
    JsonObject root = doc.to<JsonObject>();
    root["cfg_ver"] = STATE_VERSION;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.key) continue;
        putValue(root, m.key, m, false);
    }
    if (doc.overflowed()) {
        Log::error(LOG_TAG_CORE, "state document overflow");
        return false;
    }

    std::string tmpPath = std::string(_storagePath) + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            Log::error(LOG_TAG_CORE, "cannot open %s", tmpPath.c_str());
            return false;
        }
        serializeJsonPretty(doc, out);
        out.flush();
        if (!out.good()) {
            Log::error(LOG_TAG_CORE, "write failed: %s", tmpPath.c_str());
            return false;
        }
    }
    if (std::rename(tmpPath.c_str(), _storagePath) != 0) {
        Log::error(LOG_TAG_CORE, "rename failed: %s", _storagePath);
        return false;
    }
    _writeTotal.fetch_add(1U, std::memory_order_relaxed);
    return true;
}

bool ConfigStore::loadPersistent()
{
    bool ok = true;

    if (_bootstrapPath[0] != '\0') {
        std::string text;
        bool missing = false;
        if (readFile(_bootstrapPath, text, &missing)) {
            if (!applyJson_(text.c_str(), false, "bootstrap")) ok = false;
        } else if (missing) {
            Log::warn(LOG_TAG_CORE, "bootstrap file not found: %s (defaults used)", _bootstrapPath);
        } else {
            Log::error(LOG_TAG_CORE, "cannot read bootstrap file %s", _bootstrapPath);
            ok = false;
        }
    }

    if (_storagePath[0] == '\0') return ok;

    std::string text;
    bool missing = false;
    {
        std::lock_guard<std::mutex> lk(_fileMtx);
        if (!readFile(_storagePath, text, &missing)) {
            if (missing) {
                Log::debug(LOG_TAG_CORE, "no state file yet (%s)", _storagePath);
                return ok;
            }
            Log::error(LOG_TAG_CORE, "cannot read state file %s", _storagePath);
            return false;
        }
    }

    DynamicJsonDocument doc(Limits::JsonConfigStateBuf);
    DeserializationError err = deserializeJson(doc, text);
    if (err) {
        Log::error(LOG_TAG_CORE, "state file parse error: %s", err.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    const uint32_t ver = root["cfg_ver"] | 0U;
    if (ver > STATE_VERSION) {
        Log::warn(LOG_TAG_CORE, "state file version %lu newer than %lu, ignored",
                  (unsigned long)ver, (unsigned long)STATE_VERSION);
        return ok;
    }

    uint16_t loaded = 0;
    for (JsonPairConst kv : root) {
        const char* key = kv.key().c_str();
        if (strcmp(key, "cfg_ver") == 0) continue;
        const ConfigMeta* m = findByKey_(key);
        if (!m || m->persistence != ConfigPersistence::Persistent) {
            Log::debug(LOG_TAG_CORE, "state key ignored: %s", key);
            continue;
        }
        bool typeError = false;
        assignValue(*m, kv.value(), &typeError);
        if (typeError) {
            Log::warn(LOG_TAG_CORE, "state key %s has wrong type", key);
            continue;
        }
        ++loaded;
    }
    Log::debug(LOG_TAG_CORE, "loadPersistent: %u values from %s", (unsigned)loaded, _storagePath);
    return ok;
}

bool ConfigStore::savePersistent()
{
    Log::debug(LOG_TAG_CORE, "savePersistent: vars=%u", (unsigned)_metaCount);
    return writeStateFile_();
}

bool ConfigStore::erasePersistent()
{
    std::lock_guard<std::mutex> lk(_fileMtx);
    if (_storagePath[0] == '\0') return false;
    if (std::remove(_storagePath) != 0) {
        Log::warn(LOG_TAG_CORE, "erase: nothing removed at %s", _storagePath);
        return false;
    }
    Log::info(LOG_TAG_CORE, "persisted config erased");
    return true;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    DynamicJsonDocument doc(Limits::JsonConfigApplyBuf);
    JsonObject root = doc.to<JsonObject>();
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObject mod = root[m.module];
        if (mod.isNull()) mod = root.createNestedObject(m.module);
        putValue(mod, m.name, m, true);
    }

    const size_t need = measureJson(doc);
    serializeJson(doc, out, outLen);
    return !doc.overflowed() && need < outLen;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    DynamicJsonDocument doc(Limits::JsonConfigStateBuf);
    JsonObject root = doc.to<JsonObject>();
    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;
        putValue(root, m.name, m, true);
        any = true;
    }

    const size_t need = measureJson(doc);
    serializeJson(doc, out, outLen);
    if (truncated) *truncated = doc.overflowed() || need >= outLen;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    return applyJson_(json, true, "patch");
}

bool ConfigStore::applyJson_(const char* json, bool persist, const char* origin)
{
    if (!json) return false;
    Log::debug(LOG_TAG_CORE, "applyJson(%s): start", origin);

    DynamicJsonDocument doc(Limits::JsonConfigApplyBuf);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::error(LOG_TAG_CORE, "applyJson(%s): parse error %s", origin, err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        Log::error(LOG_TAG_CORE, "applyJson(%s): root is not an object", origin);
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    bool ok = true;
    bool persistNeeded = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObjectConst mod = root[m.module].as<JsonObjectConst>();
        if (mod.isNull()) continue;
        JsonVariantConst v = mod[m.name];
        if (v.isNull()) continue;

        bool typeError = false;
        const bool changed = assignValue(m, v, &typeError);
        if (typeError) {
            Log::warn(LOG_TAG_CORE, "applyJson(%s): %s.%s has wrong type", origin, m.module, m.name);
            ok = false;
            continue;
        }
        if (!changed) continue;

        Log::debug(LOG_TAG_CORE, "applyJson(%s): changed %s.%s", origin, m.module, m.name);
        if (m.persistence == ConfigPersistence::Persistent && m.key) persistNeeded = true;
        notifyChanged(m.key ? m.key : m.name);
    }

    if (persist && persistNeeded && _storagePath[0] != '\0') {
        if (!writeStateFile_()) ok = false;
    }
    Log::debug(LOG_TAG_CORE, "applyJson(%s): done", origin);
    return ok;
}
