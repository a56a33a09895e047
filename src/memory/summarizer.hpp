#pragma once
#include "turn.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace chatmem {

class Provider;

class SummarizerError : public std::runtime_error {
public:
    enum class Kind { Timeout, Transport, Provider };

    SummarizerError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* summarizer_error_kind(SummarizerError::Kind kind);

// Condenses evicted turns into a short prose fragment. Implementations may
// throw; the memory engine treats any exception as a failed attempt.
// With an empty `evicted` list the call condenses `prior_summary` itself.
class Summarizer {
public:
    virtual ~Summarizer() = default;

    virtual std::string summarize(const std::string& prior_summary,
                                  const std::vector<Turn>& evicted) = 0;
};

// Summarizes through a chat provider, which it keeps alive.
class LlmSummarizer : public Summarizer {
public:
    LlmSummarizer(std::shared_ptr<Provider> provider, std::string model, double temperature);

    std::string summarize(const std::string& prior_summary,
                          const std::vector<Turn>& evicted) override;

    // Prompt sent for a given call (exposed for tests)
    static std::string build_prompt(const std::string& prior_summary,
                                    const std::vector<Turn>& evicted);

private:
    std::shared_ptr<Provider> provider_;
    std::string model_;
    double temperature_;
};

// Runs another summarizer on a worker thread and gives up after `timeout`.
// A call that times out keeps running and its result is dropped; the
// destructor joins every worker still in flight.
class TimeoutSummarizer : public Summarizer {
public:
    TimeoutSummarizer(std::shared_ptr<Summarizer> inner,
                      std::chrono::milliseconds timeout);
    ~TimeoutSummarizer() override;

    TimeoutSummarizer(const TimeoutSummarizer&) = delete;
    TimeoutSummarizer& operator=(const TimeoutSummarizer&) = delete;

    std::string summarize(const std::string& prior_summary,
                          const std::vector<Turn>& evicted) override;

    // Workers started and not yet joined
    size_t pending_workers() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joins finished workers; workers_mutex_ must be held
    void reap_finished();

    std::shared_ptr<Summarizer> inner_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace chatmem
