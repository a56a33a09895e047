#include "chat_service.hpp"
#include <iostream>

namespace chatmem {

std::vector<ChatMessage> context_to_messages(const std::vector<ContextEntry>& context) {
    std::vector<ChatMessage> messages;
    messages.reserve(context.size());
    for (const auto& entry : context) {
        if (const auto* s = std::get_if<SummaryEntry>(&entry)) {
            messages.push_back({Role::Assistant, kSummaryContextPrefix + s->text});
        } else if (const auto* u = std::get_if<UserEntry>(&entry)) {
            messages.push_back({Role::User, u->text});
        } else if (const auto* a = std::get_if<AssistantEntry>(&entry)) {
            messages.push_back({Role::Assistant, a->text});
        }
    }
    return messages;
}

ChatService::ChatService(Provider& provider, MemoryRegistry& memories, const Config& config)
    : provider_(provider)
    , memories_(memories)
    , system_prompt_(config.system_prompt)
    , model_(config.model)
    , temperature_(config.temperature)
{}

std::vector<ChatMessage> ChatService::build_messages(const SummaryBufferMemory& memory,
                                                     const std::string& user_message) const {
    std::vector<ChatMessage> messages;
    if (!system_prompt_.empty()) {
        messages.push_back({Role::System, system_prompt_});
    }
    auto history = context_to_messages(memory.get_context());
    messages.insert(messages.end(), history.begin(), history.end());
    messages.push_back({Role::User, user_message});
    return messages;
}

std::string ChatService::process(const std::string& session_id,
                                 const std::string& user_message) {
    auto memory = memories_.get(session_id);
    auto messages = build_messages(*memory, user_message);

    ChatResponse response = provider_.chat(messages, model_, temperature_);
    std::string reply = response.content.value_or("");
    if (reply.empty()) {
        reply = "[No response]";
    }

    memory->record_turn(user_message, reply);
    std::cerr << "[chat] " << session_id << ": " << messages.size()
              << " messages in, " << response.usage.total_tokens << " tokens\n";
    return reply;
}

} // namespace chatmem
