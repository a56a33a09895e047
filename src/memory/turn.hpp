#pragma once
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace chatmem {

// One user/assistant exchange. sequence is assigned by the engine at record
// time and is strictly increasing within an engine.
struct Turn {
    std::string user_text;
    std::string assistant_text;
    uint64_t sequence = 0;
};

// ── Context entries ──────────────────────────────────────────────

struct SummaryEntry { std::string text; };
struct UserEntry { std::string text; };
struct AssistantEntry { std::string text; };

using ContextEntry = std::variant<SummaryEntry, UserEntry, AssistantEntry>;

// "summary", "user" or "assistant"
const char* entry_type(const ContextEntry& entry);

const std::string& entry_text(const ContextEntry& entry);

// Render turns as "User: ...\nAssistant: ...\n\n" blocks
std::string render_turns(const std::vector<Turn>& turns);

} // namespace chatmem
