#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace chatmem {

// OpenAI chat-completions client. Also serves Gemini and Ollama through
// their OpenAI-compatible endpoints; `name` only labels errors and status.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(std::string name, const std::string& api_key,
                   std::shared_ptr<HttpClient> http, const std::string& base_url);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    std::string provider_name() const override { return name_; }

    const std::string& base_url() const { return base_url_; }

protected:
    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::string& model,
                                 double temperature) const;
    std::vector<Header> build_headers() const;

private:
    nlohmann::json post_completion(const nlohmann::json& request);

    std::string name_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
    std::string base_url_;
};

} // namespace chatmem
