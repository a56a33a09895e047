#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chatmem {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

// Summary-buffer memory settings. Validated when an engine is built.
struct MemoryConfig {
    uint32_t max_pairs = 3;             // turns kept verbatim
    uint32_t eviction_batch_size = 2;   // oldest turns folded per eviction
    std::string separator = "\n\n";     // between merged summary fragments
    uint32_t fallback_chars = 200;      // raw-text prefix when summarizing fails
    uint32_t summarizer_timeout_ms = 30000; // 0 = wait forever
    uint32_t recompress_chars = 0;      // 0 = never re-summarize the summary
    std::string summary_model;          // empty = use the chat model
    double summary_temperature = 0.3;
};

struct ServerConfig {
    std::string listen = "127.0.0.1:8000";
    uint32_t max_body = 65536;
};

struct Config {
    std::string provider = "gemini";
    std::string model = "gemini-2.5-flash";
    double temperature = 0.5;
    std::string system_prompt =
        "You are a friendly educational assistant that remembers conversation history. "
        "You can recall details about the user from both recent messages and summarized "
        "older conversations. Always try to reference previous context when relevant.";

    std::unordered_map<std::string, ProviderEntry> providers;

    MemoryConfig memory;
    ServerConfig server;

    // Load from ~/.chatmem/config.json + env vars
    static Config load();

    // Parse a config document; absent or mistyped keys keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides
    void apply_env();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = provider default)
    std::string base_url_for(const std::string& provider) const;

    // Model used for summarization calls
    const std::string& summary_model() const {
        return memory.summary_model.empty() ? model : memory.summary_model;
    }
};

} // namespace chatmem
