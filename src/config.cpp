#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace chatmem {

nlohmann::json Config::defaults_json() {
    Config d;
    return {
        {"provider", d.provider},
        {"model", d.model},
        {"temperature", d.temperature},
        {"system_prompt", d.system_prompt},
        {"providers", {
            {"gemini", {{"api_key", ""}, {"base_url", ""}}},
            {"openai", {{"api_key", ""}, {"base_url", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434/v1"}}}
        }},
        {"memory", {
            {"max_pairs", d.memory.max_pairs},
            {"eviction_batch_size", d.memory.eviction_batch_size},
            {"separator", d.memory.separator},
            {"fallback_chars", d.memory.fallback_chars},
            {"summarizer_timeout_ms", d.memory.summarizer_timeout_ms},
            {"recompress_chars", d.memory.recompress_chars},
            {"summary_model", d.memory.summary_model},
            {"summary_temperature", d.memory.summary_temperature}
        }},
        {"server", {
            {"listen", d.server.listen},
            {"max_body", d.server.max_body}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Values that do not fit in 32 bits keep the default
static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    auto value = obj[key].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << value << "\n";
        return;
    }
    out = static_cast<uint32_t>(value);
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "provider", cfg.provider);
    read_string(j, "model", cfg.model);
    read_string(j, "system_prompt", cfg.system_prompt);
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        read_u32(m, "max_pairs", cfg.memory.max_pairs);
        read_u32(m, "eviction_batch_size", cfg.memory.eviction_batch_size);
        read_string(m, "separator", cfg.memory.separator);
        read_u32(m, "fallback_chars", cfg.memory.fallback_chars);
        read_u32(m, "summarizer_timeout_ms", cfg.memory.summarizer_timeout_ms);
        read_u32(m, "recompress_chars", cfg.memory.recompress_chars);
        read_string(m, "summary_model", cfg.memory.summary_model);
        if (m.contains("summary_temperature") && m["summary_temperature"].is_number())
            cfg.memory.summary_temperature = m["summary_temperature"].get<double>();
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_u32(s, "max_body", cfg.server.max_body);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.chatmem/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("GEMINI_API_KEY"))
        providers["gemini"].api_key = v;
    if (const char* v = std::getenv("GEMINI_API_BASE"))
        providers["gemini"].base_url = v;
    if (const char* v = std::getenv("GEMINI_MODEL_NAME")) {
        if (provider == "gemini") model = v;
    }
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("CHATMEM_LISTEN"))
        server.listen = v;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace chatmem
