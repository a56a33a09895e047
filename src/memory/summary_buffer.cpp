#include "summary_buffer.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>

namespace chatmem {

void validate_memory_config(const MemoryConfig& config) {
    if (config.max_pairs == 0) {
        throw ConfigError("memory.max_pairs must be at least 1");
    }
    if (config.eviction_batch_size == 0 || config.eviction_batch_size > config.max_pairs) {
        throw ConfigError("memory.eviction_batch_size must be between 1 and max_pairs (" +
                          std::to_string(config.max_pairs) + "), got " +
                          std::to_string(config.eviction_batch_size));
    }
}

std::string fallback_fragment(const std::vector<Turn>& evicted, size_t max_chars) {
    return "Previous conversation included discussion about: " +
           utf8_truncate(render_turns(evicted), max_chars) + "...";
}

static const MemoryConfig& checked(const MemoryConfig& config) {
    validate_memory_config(config);
    return config;
}

SummaryBufferMemory::SummaryBufferMemory(const MemoryConfig& config,
                                         std::shared_ptr<Summarizer> summarizer)
    : config_(checked(config)), summarizer_(std::move(summarizer)) {
    if (!summarizer_) {
        throw ConfigError("memory engine requires a summarizer");
    }
}

void SummaryBufferMemory::record_turn(const std::string& user_text,
                                      const std::string& assistant_text) {
    std::lock_guard<std::mutex> lock(mutex_);

    turns_.push_back(Turn{user_text, assistant_text, next_sequence_++});
    turns_recorded_++;

    // Each pass removes at least one turn, so this terminates
    while (turns_.size() > config_.max_pairs) {
        evict_oldest();
    }
}

void SummaryBufferMemory::evict_oldest() {
    size_t count = std::min<size_t>(config_.eviction_batch_size, turns_.size());
    std::vector<Turn> evicted(std::make_move_iterator(turns_.begin()),
                              std::make_move_iterator(turns_.begin() + static_cast<std::ptrdiff_t>(count)));
    turns_.erase(turns_.begin(), turns_.begin() + static_cast<std::ptrdiff_t>(count));
    evictions_++;

    std::string fragment;
    try {
        fragment = summarizer_->summarize(summary_, evicted);
    } catch (const SummarizerError& e) {
        std::cerr << "[memory] Summarizer failed (" << summarizer_error_kind(e.kind())
                  << "): " << e.what() << "; using fallback\n";
    } catch (const std::exception& e) {
        std::cerr << "[memory] Summarizer failed: " << e.what() << "; using fallback\n";
    }

    if (fragment.empty()) {
        fragment = fallback_fragment(evicted, config_.fallback_chars);
        fallbacks_++;
    }

    merge(fragment);
    std::cerr << "[memory] Evicted turns " << evicted.front().sequence << ".."
              << evicted.back().sequence << ", summary now "
              << summary_.size() << " chars\n";

    maybe_recompress();
}

void SummaryBufferMemory::merge(const std::string& fragment) {
    if (summary_.empty()) {
        summary_ = fragment;
    } else {
        summary_ += config_.separator;
        summary_ += fragment;
    }
}

void SummaryBufferMemory::maybe_recompress() {
    if (config_.recompress_chars == 0 || summary_.size() <= config_.recompress_chars) return;

    try {
        std::string condensed = summarizer_->summarize(summary_, {});
        if (!condensed.empty()) {
            std::cerr << "[memory] Recompressed summary " << summary_.size()
                      << " -> " << condensed.size() << " chars\n";
            summary_ = std::move(condensed);
        }
    } catch (const std::exception& e) {
        std::cerr << "[memory] Summary recompression failed: " << e.what()
                  << "; keeping " << summary_.size() << " chars\n";
    }
}

std::vector<ContextEntry> SummaryBufferMemory::get_context() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ContextEntry> entries;
    entries.reserve(turns_.size() * 2 + 1);
    if (!summary_.empty()) {
        entries.emplace_back(SummaryEntry{summary_});
    }
    for (const auto& turn : turns_) {
        entries.emplace_back(UserEntry{turn.user_text});
        entries.emplace_back(AssistantEntry{turn.assistant_text});
    }
    return entries;
}

void SummaryBufferMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
    summary_.clear();
}

MemorySnapshot SummaryBufferMemory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MemorySnapshot snap;
    snap.summary = summary_;
    snap.turns.assign(turns_.begin(), turns_.end());
    snap.max_pairs = config_.max_pairs;
    snap.eviction_batch_size = config_.eviction_batch_size;
    snap.turns_recorded = turns_recorded_;
    snap.evictions = evictions_;
    snap.fallbacks = fallbacks_;
    return snap;
}

size_t SummaryBufferMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::string SummaryBufferMemory::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

} // namespace chatmem
