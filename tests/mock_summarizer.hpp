#pragma once
#include "memory/summarizer.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace chatmem {

// Records every call; returns "S1", "S2", ... unless told to fail
class ScriptedSummarizer : public Summarizer {
public:
    struct Call {
        std::string prior_summary;
        std::vector<Turn> evicted;
    };

    std::vector<Call> calls;
    bool fail = false;
    SummarizerError::Kind fail_kind = SummarizerError::Kind::Provider;

    std::string summarize(const std::string& prior_summary,
                          const std::vector<Turn>& evicted) override {
        calls.push_back({prior_summary, evicted});
        if (fail) {
            throw SummarizerError(fail_kind, "scripted failure");
        }
        return "S" + std::to_string(calls.size());
    }
};

// Sleeps before answering; used to exercise timeouts
class SlowSummarizer : public Summarizer {
public:
    explicit SlowSummarizer(std::chrono::milliseconds delay) : delay_(delay) {}

    std::atomic<int> finished{0};

    std::string summarize(const std::string&, const std::vector<Turn>&) override {
        std::this_thread::sleep_for(delay_);
        finished++;
        return "slow summary";
    }

private:
    std::chrono::milliseconds delay_;
};

} // namespace chatmem
