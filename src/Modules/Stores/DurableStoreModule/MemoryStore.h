#pragma once
/**
 * @file MemoryStore.h
 * @brief In-process durable store backend (tests and single-node setups).
 */
#include "DurableBackend.h"

#include <map>
#include <mutex>

/**
 * @brief Flat map of leaf path -> JSON text.
 *
 * Reading an inner path rebuilds the nested object from its descendants.
 * Writing a path replaces the whole subtree.
 */
class MemoryStore : public DurableBackend {
public:
    const char* name() const override { return "memory"; }

    bool set(const char* path, const char* json) override;
    bool get(const char* path, std::string& outJson, bool& found) override;
    bool update(const char* path, const char* jsonObject) override;
    bool push(const char* path, const char* json, std::string& keyOut) override;
    bool getLast(const char* path, uint16_t limit, std::string& outJson) override;
    bool remove(const char* path) override;

    /** @brief Number of stored leaves. */
    size_t leafCount();

private:
    std::mutex mtx_;
    std::map<std::string, std::string> leaves_;
    uint64_t lastPushMs_ = 0;
    uint32_t pushSeq_ = 0;

    void eraseSubtree_(const std::string& path);
    bool setLocked_(const std::string& path, const char* json);
    bool composeLocked_(const std::string& path, std::string& out, bool& found);
};
