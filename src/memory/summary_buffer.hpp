#pragma once
#include "turn.hpp"
#include "summarizer.hpp"
#include "../config.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatmem {

// Rejected memory settings; fatal when building an engine.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Throws ConfigError unless max_pairs >= 1 and 1 <= eviction_batch_size <= max_pairs
void validate_memory_config(const MemoryConfig& config);

// Deterministic stand-in for a summary when the summarizer fails:
// a bounded prefix of the evicted dialogue.
std::string fallback_fragment(const std::vector<Turn>& evicted, size_t max_chars);

// Consistent copy of an engine's state
struct MemorySnapshot {
    std::string summary;
    std::vector<Turn> turns;
    uint32_t max_pairs = 0;
    uint32_t eviction_batch_size = 0;
    uint64_t turns_recorded = 0;
    uint64_t evictions = 0;
    uint64_t fallbacks = 0;
};

// Keeps the most recent max_pairs turns verbatim and folds older ones into
// a rolling summary. All operations take one mutex for their full duration,
// including the summarizer call made while evicting.
class SummaryBufferMemory {
public:
    SummaryBufferMemory(const MemoryConfig& config,
                        std::shared_ptr<Summarizer> summarizer);

    SummaryBufferMemory(const SummaryBufferMemory&) = delete;
    SummaryBufferMemory& operator=(const SummaryBufferMemory&) = delete;

    // Append a turn, then evict and summarize until back under capacity.
    // Summarizer failures are absorbed; this does not throw for valid input.
    void record_turn(const std::string& user_text, const std::string& assistant_text);

    // Summary entry (if any), then user/assistant entries oldest first
    std::vector<ContextEntry> get_context() const;

    // Drop all turns and the summary
    void clear();

    MemorySnapshot snapshot() const;

    size_t size() const;
    std::string summary() const;
    const MemoryConfig& config() const { return config_; }

private:
    void evict_oldest();
    void merge(const std::string& fragment);
    void maybe_recompress();

    const MemoryConfig config_;
    std::shared_ptr<Summarizer> summarizer_;

    mutable std::mutex mutex_;
    std::deque<Turn> turns_;
    std::string summary_;
    uint64_t next_sequence_ = 1;
    uint64_t turns_recorded_ = 0;
    uint64_t evictions_ = 0;
    uint64_t fallbacks_ = 0;
};

} // namespace chatmem
