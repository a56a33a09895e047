#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "providers/openai.hpp"
#include <memory>
#include <stdexcept>

using namespace chatmem;

// ── role_to_string / ProviderError ──────────────────────────────

TEST_CASE("role_to_string: all roles", "[provider]") {
    REQUIRE(std::string(role_to_string(Role::System)) == "system");
    REQUIRE(std::string(role_to_string(Role::User)) == "user");
    REQUIRE(std::string(role_to_string(Role::Assistant)) == "assistant");
}

TEST_CASE("ProviderError: status 0 means transport failure", "[provider]") {
    ProviderError transport("no route", 0);
    ProviderError http("bad request", 400);
    REQUIRE(transport.transport_failure());
    REQUIRE_FALSE(http.transport_failure());
    REQUIRE(http.status() == 400);
}

// ── HttpResult ──────────────────────────────────────────────────

TEST_CASE("HttpResult: delivered and ok", "[provider][http]") {
    HttpResult r;
    r.status = 200;
    REQUIRE(r.delivered());
    REQUIRE(r.ok());

    r.status = 503;
    REQUIRE(r.delivered());
    REQUIRE_FALSE(r.ok());

    r.transport_error = "connection refused";
    REQUIRE_FALSE(r.delivered());
    REQUIRE_FALSE(r.ok());
}

// ── OpenAIProvider ──────────────────────────────────────────────

TEST_CASE("OpenAIProvider: chat posts completion request", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({
        "model": "gpt-4o",
        "choices": [{"message": {"role": "assistant", "content": "Hello!"}}],
        "usage": {"prompt_tokens": 10, "completion_tokens": 5, "total_tokens": 15}
    })");

    OpenAIProvider provider("openai", "test-key", http, "");
    auto result = provider.chat({{Role::System, "Be brief."}, {Role::User, "Hi"}}, "gpt-4o", 0.7);

    REQUIRE(http->sent.size() == 1);
    REQUIRE(http->last().url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(http->header("Authorization") == "Bearer test-key");
    REQUIRE(http->header("Content-Type") == "application/json");

    auto body = http->last_json();
    REQUIRE(body["model"] == "gpt-4o");
    REQUIRE(body["temperature"] == 0.7);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["content"] == "Hi");

    REQUIRE(result.content.value_or("") == "Hello!");
    REQUIRE(result.model == "gpt-4o");
    REQUIRE(result.usage.prompt_tokens == 10);
    REQUIRE(result.usage.completion_tokens == 5);
    REQUIRE(result.usage.total_tokens == 15);
}

TEST_CASE("OpenAIProvider: custom base_url loses trailing slash", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": [{"message": {"content": "ok"}}]})");

    OpenAIProvider provider("gemini", "key", http,
                            "https://generativelanguage.googleapis.com/v1beta/openai/");
    provider.chat({{Role::User, "x"}}, "gemini-2.5-flash", 0.5);

    REQUIRE(http->last().url ==
            "https://generativelanguage.googleapis.com/v1beta/openai/chat/completions");
    REQUIRE(provider.provider_name() == "gemini");
}

TEST_CASE("OpenAIProvider: no Authorization header without key", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": [{"message": {"content": "ok"}}]})");

    OpenAIProvider provider("ollama", "", http, "http://localhost:11434/v1");
    provider.chat({{Role::User, "x"}}, "llama3", 0.5);

    REQUIRE(http->header("Authorization").empty());
}

TEST_CASE("OpenAIProvider: requires an HTTP client", "[provider][openai]") {
    REQUIRE_THROWS_AS(OpenAIProvider("openai", "key", nullptr, ""), std::invalid_argument);
}

TEST_CASE("OpenAIProvider: HTTP error carries the status", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(429, R"({"error": {"message": "rate limited"}})");

    OpenAIProvider provider("openai", "key", http, "");
    try {
        provider.chat({{Role::User, "x"}}, "gpt-4o", 0.5);
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.status() == 429);
        REQUIRE_FALSE(e.transport_failure());
        REQUIRE(std::string(e.what()).find("HTTP 429") != std::string::npos);
    }
}

TEST_CASE("OpenAIProvider: transport error keeps its reason", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->fail_transport("Could not resolve host");

    OpenAIProvider provider("openai", "key", http, "");
    try {
        provider.chat({{Role::User, "x"}}, "gpt-4o", 0.5);
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.transport_failure());
        REQUIRE(std::string(e.what()).find("Could not resolve host") != std::string::npos);
    }
}

TEST_CASE("OpenAIProvider: invalid JSON body throws", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, "not json");

    OpenAIProvider provider("openai", "key", http, "");
    REQUIRE_THROWS_AS(provider.chat({{Role::User, "x"}}, "gpt-4o", 0.5), ProviderError);
}

TEST_CASE("OpenAIProvider: missing choices yields no content", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": []})");

    OpenAIProvider provider("openai", "key", http, "");
    auto result = provider.chat({{Role::User, "x"}}, "gpt-4o", 0.5);
    REQUIRE_FALSE(result.content.has_value());
    REQUIRE(result.model == "gpt-4o");
}

TEST_CASE("OpenAIProvider: chat_simple sends a single user message", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": [{"message": {"content": "A summary."}}]})");

    OpenAIProvider provider("openai", "key", http, "");
    REQUIRE(provider.chat_simple("", "Summarize this", "gpt-4o", 0.3) == "A summary.");

    auto body = http->last_json();
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");
}

TEST_CASE("OpenAIProvider: chat_simple with system prompt and null content", "[provider][openai]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": [{"message": {"content": null}}]})");

    OpenAIProvider provider("openai", "key", http, "");
    REQUIRE(provider.chat_simple("sys", "msg", "gpt-4o", 0.3).empty());

    auto body = http->last_json();
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["content"] == "sys");
}

// ── create_provider ─────────────────────────────────────────────

TEST_CASE("create_provider: builds configured backends", "[provider]") {
    auto http = std::make_shared<MockHttpClient>();
    Config cfg;
    cfg.providers["gemini"] = {"g-key", "https://gemini.example/v1"};
    cfg.providers["openai"] = {"o-key", ""};
    cfg.providers["ollama"] = {"", "http://localhost:11434/v1"};

    REQUIRE(create_provider("gemini", cfg, http)->provider_name() == "gemini");
    REQUIRE(create_provider("openai", cfg, http)->provider_name() == "openai");
    REQUIRE(create_provider("ollama", cfg, http)->provider_name() == "ollama");
}

TEST_CASE("create_provider: provider keeps its HTTP client alive", "[provider]") {
    auto http = std::make_shared<MockHttpClient>();
    http->reply(200, R"({"choices": [{"message": {"content": "still here"}}]})");
    std::weak_ptr<MockHttpClient> watch = http;

    Config cfg;
    cfg.providers["openai"] = {"o-key", ""};
    auto provider = create_provider("openai", cfg, http);
    http.reset();

    REQUIRE_FALSE(watch.expired());
    REQUIRE(provider->chat_simple("", "x", "gpt-4o", 0.3) == "still here");
    provider.reset();
    REQUIRE(watch.expired());
}

TEST_CASE("create_provider: unknown or incomplete providers throw", "[provider]") {
    auto http = std::make_shared<MockHttpClient>();
    Config cfg;
    cfg.providers["gemini"] = {"", "https://gemini.example/v1"};
    cfg.providers["ollama"] = {"", ""};

    REQUIRE_THROWS_AS(create_provider("nope", cfg, http), std::invalid_argument);
    REQUIRE_THROWS_AS(create_provider("gemini", cfg, http), std::invalid_argument);
    REQUIRE_THROWS_AS(create_provider("ollama", cfg, http), std::invalid_argument);
}
