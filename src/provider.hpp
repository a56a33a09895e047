#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace chatmem {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    TokenUsage usage;
    std::string model;
};

// Raised by providers when a request fails. status() is the HTTP status,
// or 0 when the request never got a response.
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& what, long status)
        : std::runtime_error(what), status_(status) {}

    long status() const { return status_; }
    bool transport_failure() const { return status_ == 0; }

private:
    long status_;
};

// Abstract base class for LLM providers
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature) = 0;

    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration
struct Config;

// Factory: create the named provider from its config entry.
// Throws std::invalid_argument for unknown or unconfigured providers.
std::shared_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          std::shared_ptr<HttpClient> http);

} // namespace chatmem
