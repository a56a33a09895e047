#include "server/chat_api.hpp"
#include "util.hpp"
#include <iostream>

using json = nlohmann::json;

namespace chatmem {

// ── JSON views ──────────────────────────────────────────────────

json memory_details_json(const MemorySnapshot& snap) {
    json recent = json::array();
    for (const auto& turn : snap.turns) {
        recent.push_back({
            {"user", preview(turn.user_text, kDetailPreviewChars)},
            {"ai", preview(turn.assistant_text, kDetailPreviewChars)}
        });
    }
    return {
        {"summary", snap.summary.empty() ? "No summary yet" : snap.summary},
        {"recent_message_pairs", snap.turns.size()},
        {"recent_messages", recent},
        {"has_summary", !snap.summary.empty()},
        {"max_message_pairs", snap.max_pairs}
    };
}

json memory_stats_json(const MemorySnapshot& snap) {
    std::string structure = std::to_string(snap.turns.size()) + " recent message pairs";
    if (!snap.summary.empty()) structure = "Summary + " + structure;
    return {
        {"current_summary", snap.summary.empty() ? "No summary yet" : snap.summary},
        {"recent_messages_count", snap.turns.size() * 2},
        {"memory_structure", structure},
        {"turns_recorded", snap.turns_recorded},
        {"evictions", snap.evictions},
        {"fallbacks", snap.fallbacks}
    };
}

json memory_raw_json(const MemorySnapshot& snap) {
    json recent = json::array();
    for (const auto& turn : snap.turns) {
        recent.push_back({
            {"sequence", turn.sequence},
            {"user", turn.user_text},
            {"ai", turn.assistant_text}
        });
    }
    return {
        {"summary", snap.summary},
        {"recent_messages", recent},
        {"max_message_pairs", snap.max_pairs},
        {"eviction_batch_size", snap.eviction_batch_size},
        {"memory_approach", "Summary buffer with turn-count eviction"}
    };
}

json context_json(const std::vector<ContextEntry>& context) {
    json entries = json::array();
    for (const auto& entry : context) {
        entries.push_back({{"type", entry_type(entry)}, {"content", entry_text(entry)}});
    }
    return {{"entries", entries}};
}

// ── Routing ─────────────────────────────────────────────────────

ChatApi::ChatApi(ChatService& chat, MemoryRegistry& memories)
    : chat_(chat), memories_(memories) {}

static std::string session_of(const ServerRequest& req, const json* body) {
    std::string session = req.query_param("session");
    if (session.empty() && body && body->is_object() &&
        body->contains("session_id") && (*body)["session_id"].is_string()) {
        session = (*body)["session_id"].get<std::string>();
    }
    return session.empty() ? kDefaultSession : session;
}

void ChatApi::attach(HttpServer& server) {
    server.route("POST", "/chat", [this](const ServerRequest& r) { return handle_chat(r); });
    server.route("GET", "/memory/stats", [this](const ServerRequest& r) { return handle_stats(r); });
    server.route("GET", "/memory/raw", [this](const ServerRequest& r) { return handle_raw(r); });
    server.route("GET", "/memory/context",
                 [this](const ServerRequest& r) { return handle_context(r); });
    server.route("POST", "/memory/clear", [this](const ServerRequest& r) { return handle_clear(r); });
}

MemorySnapshot ChatApi::snapshot_of(const std::string& session_id) {
    auto memory = memories_.find(session_id);
    return memory ? memory->snapshot() : memories_.empty_snapshot();
}

ServerResponse ChatApi::handle_chat(const ServerRequest& req) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error& e) {
        return json_error(400, std::string("Invalid JSON: ") + e.what());
    }
    if (!body.is_object() || !body.contains("query") || !body["query"].is_string()) {
        return json_error(400, "Missing string field: query");
    }

    std::string session = session_of(req, &body);
    std::string query = body["query"].get<std::string>();

    std::string reply;
    try {
        reply = chat_.process(session, query);
    } catch (const std::exception& e) {
        std::cerr << "[server] /chat failed for " << session << ": " << e.what() << "\n";
        return json_error(500, std::string("Error: ") + e.what());
    }

    return json_response(200, {
        {"response", reply},
        {"memory_details", memory_details_json(memories_.get(session)->snapshot())}
    });
}

ServerResponse ChatApi::handle_stats(const ServerRequest& req) {
    return json_response(200, memory_stats_json(snapshot_of(session_of(req, nullptr))));
}

ServerResponse ChatApi::handle_raw(const ServerRequest& req) {
    return json_response(200, memory_raw_json(snapshot_of(session_of(req, nullptr))));
}

ServerResponse ChatApi::handle_context(const ServerRequest& req) {
    auto memory = memories_.find(session_of(req, nullptr));
    return json_response(200, context_json(memory ? memory->get_context()
                                                  : std::vector<ContextEntry>{}));
}

ServerResponse ChatApi::handle_clear(const ServerRequest& req) {
    if (auto memory = memories_.find(session_of(req, nullptr))) {
        memory->clear();
    }
    return json_response(200, {{"message", "Memory cleared successfully"}});
}

} // namespace chatmem
