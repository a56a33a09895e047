#pragma once
#include "server/http_server.hpp"
#include "chat_service.hpp"
#include "memory/registry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace chatmem {

// Longest user/assistant text shown per turn in /chat memory details
constexpr size_t kDetailPreviewChars = 100;

// JSON views of a memory snapshot
nlohmann::json memory_details_json(const MemorySnapshot& snap);
nlohmann::json memory_stats_json(const MemorySnapshot& snap);
nlohmann::json memory_raw_json(const MemorySnapshot& snap);
nlohmann::json context_json(const std::vector<ContextEntry>& context);

// HTTP endpoints over the chat service and the session memories:
//   POST /chat            {"query": "..."}
//   GET  /memory/stats
//   GET  /memory/raw
//   GET  /memory/context
//   POST /memory/clear
// The session comes from ?session= or a "session_id" body field. Only
// /chat creates a session; the /memory endpoints report unknown sessions
// as empty.
class ChatApi {
public:
    ChatApi(ChatService& chat, MemoryRegistry& memories);

    // Register every endpoint on `server`
    void attach(HttpServer& server);

    ServerResponse handle_chat(const ServerRequest& req);
    ServerResponse handle_stats(const ServerRequest& req);
    ServerResponse handle_raw(const ServerRequest& req);
    ServerResponse handle_context(const ServerRequest& req);
    ServerResponse handle_clear(const ServerRequest& req);

private:
    MemorySnapshot snapshot_of(const std::string& session_id);

    ChatService& chat_;
    MemoryRegistry& memories_;
};

} // namespace chatmem
