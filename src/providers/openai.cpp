#include "openai.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace chatmem {

OpenAIProvider::OpenAIProvider(std::string name, const std::string& api_key,
                               std::shared_ptr<HttpClient> http, const std::string& base_url)
    : name_(std::move(name)), api_key_(api_key), http_(std::move(http)),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    if (!http_) {
        throw std::invalid_argument(name_ + " provider requires an HTTP client");
    }
}

json OpenAIProvider::build_request(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   double temperature) const {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }
    return headers;
}

json OpenAIProvider::post_completion(const json& request) {
    HttpRequest post;
    post.url = base_url_ + "/chat/completions";
    post.body = request.dump();
    post.headers = build_headers();

    HttpResult result = http_->send(post);
    if (!result.delivered()) {
        throw ProviderError(name_ + " request to " + post.url + " failed: " +
                            result.transport_error, 0);
    }
    if (!result.ok()) {
        throw ProviderError(name_ + " API error (HTTP " + std::to_string(result.status) +
                            "): " + result.body, result.status);
    }

    try {
        return json::parse(result.body);
    } catch (const json::parse_error& e) {
        throw ProviderError(name_ + " returned invalid JSON: " + e.what(), result.status);
    }
}

ChatResponse OpenAIProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    auto resp = post_completion(build_request(messages, model, temperature));

    ChatResponse result;
    result.model = resp.value("model", model);

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message")) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = usage.value("prompt_tokens", 0u);
        result.usage.completion_tokens = usage.value("completion_tokens", 0u);
        result.usage.total_tokens = usage.value("total_tokens", 0u);
    }

    return result;
}

std::string OpenAIProvider::chat_simple(const std::string& system_prompt,
                                        const std::string& message,
                                        const std::string& model,
                                        double temperature) {
    std::vector<ChatMessage> msgs;
    if (!system_prompt.empty()) {
        msgs.push_back({Role::System, system_prompt});
    }
    msgs.push_back({Role::User, message});
    return chat(msgs, model, temperature).content.value_or("");
}

} // namespace chatmem
