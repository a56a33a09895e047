#pragma once
#include "summary_buffer.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace chatmem {

constexpr const char* kDefaultSession = "default";

// One summary-buffer memory per session id. The registry mutex only guards
// the map; each engine serializes its own operations. Engines are shared so
// a caller keeps its engine alive across remove() or evict_idle().
class MemoryRegistry {
public:
    // Validates `config` once; throws ConfigError before any session exists.
    MemoryRegistry(const MemoryConfig& config, std::shared_ptr<Summarizer> summarizer);

    // Get or create the memory for a session
    std::shared_ptr<SummaryBufferMemory> get(const std::string& session_id);

    // Existing memory or nullptr
    std::shared_ptr<SummaryBufferMemory> find(const std::string& session_id);

    // Remove a session
    void remove(const std::string& session_id);

    // Drop sessions untouched for longer than max_idle_seconds
    void evict_idle(uint64_t max_idle_seconds = 3600);

    // List active session IDs
    std::vector<std::string> list() const;

    const MemoryConfig& config() const { return config_; }

    // Snapshot of a session that holds nothing yet
    MemorySnapshot empty_snapshot() const;

private:
    struct Slot {
        std::shared_ptr<SummaryBufferMemory> memory;
        uint64_t last_active = 0;
    };

    MemoryConfig config_;
    std::shared_ptr<Summarizer> summarizer_;
    std::unordered_map<std::string, Slot> slots_;
    mutable std::mutex mutex_;
};

} // namespace chatmem
