#include "registry.hpp"
#include "../util.hpp"
#include <iostream>

namespace chatmem {

MemoryRegistry::MemoryRegistry(const MemoryConfig& config,
                               std::shared_ptr<Summarizer> summarizer)
    : config_(config), summarizer_(std::move(summarizer)) {
    validate_memory_config(config_);
    if (!summarizer_) {
        throw ConfigError("memory registry requires a summarizer");
    }
}

std::shared_ptr<SummaryBufferMemory> MemoryRegistry::get(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(session_id);
    if (it != slots_.end()) {
        it->second.last_active = epoch_seconds();
        return it->second.memory;
    }

    Slot slot;
    slot.memory = std::make_shared<SummaryBufferMemory>(config_, summarizer_);
    slot.last_active = epoch_seconds();
    auto [inserted, _] = slots_.emplace(session_id, std::move(slot));
    std::cerr << "[memory] New session: " << session_id << "\n";
    return inserted->second.memory;
}

std::shared_ptr<SummaryBufferMemory> MemoryRegistry::find(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(session_id);
    if (it == slots_.end()) return nullptr;
    it->second.last_active = epoch_seconds();
    return it->second.memory;
}

void MemoryRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(session_id);
}

void MemoryRegistry::evict_idle(uint64_t max_idle_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();

    for (auto it = slots_.begin(); it != slots_.end(); ) {
        if ((now - it->second.last_active) > max_idle_seconds) {
            std::cerr << "[memory] Evicting idle session: " << it->first << "\n";
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

MemorySnapshot MemoryRegistry::empty_snapshot() const {
    MemorySnapshot snap;
    snap.max_pairs = config_.max_pairs;
    snap.eviction_batch_size = config_.eviction_batch_size;
    return snap;
}

std::vector<std::string> MemoryRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, _] : slots_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace chatmem
