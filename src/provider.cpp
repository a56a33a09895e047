#include "provider.hpp"
#include "config.hpp"
#include "providers/openai.hpp"

namespace chatmem {

std::shared_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          std::shared_ptr<HttpClient> http) {
    auto it = config.providers.find(name);
    if (it == config.providers.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    const auto& entry = it->second;

    // Every backend speaks the OpenAI chat-completions format; only OpenAI
    // itself has a usable default base URL.
    if (entry.base_url.empty() && name != "openai") {
        throw std::invalid_argument("No base_url configured for provider " + name);
    }
    if (entry.api_key.empty() && name != "ollama") {
        throw std::invalid_argument("No API key configured for provider " + name);
    }

    return std::make_shared<OpenAIProvider>(name, entry.api_key, std::move(http),
                                            entry.base_url);
}

} // namespace chatmem
