#pragma once
/**
 * @file ConfigStore.h
 * @brief Configuration registry with JSON bootstrap, JSON-file persistence and export.
 */

// ConfigStore = typed configuration registry.
//
// Load order at boot (ModuleManager::initAll, after every module registered its vars):
//   compiled defaults -> bootstrap file (`setBootstrapPath`) -> state file (`setStoragePath`)
// so values changed at runtime (persistent vars) win over the bootstrap file.
//
// When a config value changes (set() or applyJson()), an EventId::ConfigChanged
// event is posted on the EventBus.

#include <atomic>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <mutex>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;
    static constexpr uint32_t STATE_VERSION = 1;

    ConfigStore() = default;

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief JSON file applied at boot as `{module:{name:value}}` (optional). */
    void setBootstrapPath(const char* path);
    /** @brief JSON file holding persisted values keyed by config key (optional). */
    void setStoragePath(const char* path);

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    void registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Apply the bootstrap file then the persisted state file. */
    bool loadPersistent();
    /** @brief Save every persistent value into the state file. */
    bool savePersistent();
    /** @brief Remove the state file (persisted values fall back to bootstrap on next boot). */
    bool erasePersistent();

    /** @brief Serialize all registered config to JSON (`{module:{name:value}}`). */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /** @brief Apply JSON patch `{module:{name:value}}` to registered config variables. */
    bool applyJson(const char* json);

    /** @brief Number of successful state file writes since boot. */
    uint32_t persistWriteCount() const { return _writeTotal.load(); }

private:
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS]{};
    uint16_t _metaCount = 0;

    char _bootstrapPath[256] = {0};
    char _storagePath[256] = {0};
    mutable std::mutex _fileMtx;

    void notifyChanged(const char* key);
    void persistIfNeeded_(ConfigPersistence persistence, const char* key);
    bool applyJson_(const char* json, bool persist, const char* origin);
    bool writeStateFile_();

    const ConfigMeta* findByKey_(const char* key) const;

    std::atomic<uint32_t> _writeTotal{0};
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
void ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::error(LOG_TAG_CORE, "config table full, dropping %s.%s",
                   var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return;
    }
    if (var.key && strlen(var.key) > Limits::MaxCfgKeyLen) {
        Log::warn(LOG_TAG_CORE, "config key too long (%s)", var.key);
        return;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.key         = var.key;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;

    if (*(var.value) == value) return true;
    *(var.value) = value;

    var.notify();
    persistIfNeeded_(var.persistence, var.key);
    notifyChanged(var.key ? var.key : var.jsonName);
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';

    var.notify();
    persistIfNeeded_(var.persistence, var.key);
    notifyChanged(var.key ? var.key : var.jsonName);
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
