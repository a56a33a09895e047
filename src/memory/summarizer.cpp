#include "summarizer.hpp"
#include "../provider.hpp"
#include "../util.hpp"
#include <future>
#include <iostream>
#include <thread>

namespace chatmem {

const char* summarizer_error_kind(SummarizerError::Kind kind) {
    switch (kind) {
        case SummarizerError::Kind::Timeout: return "timeout";
        case SummarizerError::Kind::Transport: return "transport";
        case SummarizerError::Kind::Provider: return "provider";
    }
    return "provider";
}

// ── LlmSummarizer ────────────────────────────────────────────────

static const char* kSummaryPrefix = "Previous conversation summary: ";

LlmSummarizer::LlmSummarizer(std::shared_ptr<Provider> provider, std::string model,
                             double temperature)
    : provider_(std::move(provider)), model_(std::move(model)), temperature_(temperature) {
    if (!provider_) {
        throw std::invalid_argument("LlmSummarizer requires a provider");
    }
}

std::string LlmSummarizer::build_prompt(const std::string& prior_summary,
                                        const std::vector<Turn>& evicted) {
    if (evicted.empty()) {
        return "Condense the following conversation summary into a shorter one. "
               "Keep names, facts and preferences the user shared.\n\n"
               + prior_summary + "\n\nSummary:";
    }

    std::string prompt;
    if (!prior_summary.empty()) {
        prompt += "Earlier parts of the conversation were already summarized as:\n\n"
                + prior_summary + "\n\nDo not repeat that summary.\n\n";
    }
    prompt += "Please provide a concise summary of this conversation:\n\n"
            + render_turns(evicted) + "\n\nSummary:";
    return prompt;
}

std::string LlmSummarizer::summarize(const std::string& prior_summary,
                                     const std::vector<Turn>& evicted) {
    std::string reply;
    try {
        reply = provider_->chat_simple("", build_prompt(prior_summary, evicted),
                                       model_, temperature_);
    } catch (const ProviderError& e) {
        throw SummarizerError(e.transport_failure() ? SummarizerError::Kind::Transport
                                                    : SummarizerError::Kind::Provider,
                              e.what());
    } catch (const std::exception& e) {
        throw SummarizerError(SummarizerError::Kind::Provider, e.what());
    }

    reply = trim(reply);
    if (reply.empty()) {
        throw SummarizerError(SummarizerError::Kind::Provider,
                              provider_->provider_name() + " returned an empty summary");
    }
    return kSummaryPrefix + reply;
}

// ── TimeoutSummarizer ────────────────────────────────────────────

TimeoutSummarizer::TimeoutSummarizer(std::shared_ptr<Summarizer> inner,
                                     std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {
    if (!inner_) {
        throw std::invalid_argument("TimeoutSummarizer requires a summarizer");
    }
}

TimeoutSummarizer::~TimeoutSummarizer() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

void TimeoutSummarizer::reap_finished() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t TimeoutSummarizer::pending_workers() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

std::string TimeoutSummarizer::summarize(const std::string& prior_summary,
                                         const std::vector<Turn>& evicted) {
    // The task owns copies of its inputs and shares the inner summarizer
    auto task = std::make_shared<std::packaged_task<std::string()>>(
        [inner = inner_, prior_summary, evicted]() {
            return inner->summarize(prior_summary, evicted);
        });
    std::future<std::string> result = task->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        reap_finished();
        workers_.push_back(Worker{std::thread([task, done]() {
            (*task)();
            done->store(true);
        }), done});
    }

    if (result.wait_for(timeout_) != std::future_status::ready) {
        std::cerr << "[summarizer] No result after " << timeout_.count()
                  << " ms, abandoning call\n";
        throw SummarizerError(SummarizerError::Kind::Timeout,
                              "summarizer timed out after " +
                              std::to_string(timeout_.count()) + " ms");
    }
    return result.get();
}

} // namespace chatmem
