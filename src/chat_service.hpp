#pragma once
#include "config.hpp"
#include "provider.hpp"
#include "memory/registry.hpp"
#include <string>
#include <vector>

namespace chatmem {

constexpr const char* kSummaryContextPrefix = "Context from previous conversation: ";

// Turn memory context entries into provider messages
std::vector<ChatMessage> context_to_messages(const std::vector<ContextEntry>& context);

// Answers one user message per call: system prompt + session memory + input
// go to the provider, and the exchange is recorded in that session's memory.
class ChatService {
public:
    ChatService(Provider& provider, MemoryRegistry& memories, const Config& config);

    // Provider failures propagate and leave memory untouched
    std::string process(const std::string& session_id, const std::string& user_message);

    // Messages that process() would send for this input
    std::vector<ChatMessage> build_messages(const SummaryBufferMemory& memory,
                                            const std::string& user_message) const;

    void set_model(const std::string& model) { model_ = model; }
    const std::string& model() const { return model_; }
    std::string provider_name() const { return provider_.provider_name(); }

    MemoryRegistry& memories() { return memories_; }

private:
    Provider& provider_;
    MemoryRegistry& memories_;
    std::string system_prompt_;
    std::string model_;
    double temperature_;
};

} // namespace chatmem
