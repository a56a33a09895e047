#include "turn.hpp"

namespace chatmem {

namespace {

struct EntryType {
    const char* operator()(const SummaryEntry&) const { return "summary"; }
    const char* operator()(const UserEntry&) const { return "user"; }
    const char* operator()(const AssistantEntry&) const { return "assistant"; }
};

} // namespace

const char* entry_type(const ContextEntry& entry) {
    return std::visit(EntryType{}, entry);
}

const std::string& entry_text(const ContextEntry& entry) {
    return std::visit([](const auto& e) -> const std::string& { return e.text; }, entry);
}

std::string render_turns(const std::vector<Turn>& turns) {
    std::string out;
    for (const auto& turn : turns) {
        out += "User: ";
        out += turn.user_text;
        out += "\nAssistant: ";
        out += turn.assistant_text;
        out += "\n\n";
    }
    return out;
}

} // namespace chatmem
