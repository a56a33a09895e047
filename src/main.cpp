#include "config.hpp"
#include "provider.hpp"
#include "http.hpp"
#include "chat_service.hpp"
#include "memory/registry.hpp"
#include "memory/summarizer.hpp"
#include "server/chat_api.hpp"
#include "server/http_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

// Raises the shutdown flag on scope exit so in-flight transfers abort
// before the objects they use are torn down.
struct ShutdownOnExit {
    ~ShutdownOnExit() { g_shutdown.store(true); }
};

static void print_usage() {
    std::cout << "Usage: chatmem [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --serve              Run the HTTP API\n"
              << "  --listen HOST:PORT   Address for --serve (default from config)\n"
              << "  --provider NAME      Use specific provider (gemini, openai, ollama)\n"
              << "  --model NAME         Use specific model\n"
              << "  --session ID         Memory session for -m and the REPL\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /context             Show what the model sees from memory\n"
              << "  /stats               Show memory statistics\n"
              << "  /clear               Clear conversation memory\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  GEMINI_API_KEY       API key for Gemini\n"
              << "  GEMINI_API_BASE      OpenAI-compatible base URL for Gemini\n"
              << "  GEMINI_MODEL_NAME    Gemini model (default: gemini-2.5-flash)\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434/v1)\n"
              << "  CHATMEM_LISTEN       Listen address for --serve\n";
}

static void print_context(chatmem::SummaryBufferMemory& memory) {
    auto context = memory.get_context();
    if (context.empty()) {
        std::cout << "(memory is empty)\n";
        return;
    }
    for (const auto& entry : context) {
        std::cout << "[" << chatmem::entry_type(entry) << "] "
                  << chatmem::entry_text(entry) << "\n";
    }
}

static void print_stats(chatmem::SummaryBufferMemory& memory) {
    auto snap = memory.snapshot();
    std::cout << "Recent turns: " << snap.turns.size() << "/" << snap.max_pairs << "\n"
              << "Summary: " << (snap.summary.empty() ? "none" :
                                 std::to_string(snap.summary.size()) + " chars") << "\n"
              << "Turns recorded: " << snap.turns_recorded << "\n"
              << "Evictions: " << snap.evictions
              << " (" << snap.fallbacks << " fallback)\n";
}

static int run_server(chatmem::ChatService& chat, chatmem::MemoryRegistry& memories,
                      const chatmem::Config& config) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    chatmem::ChatApi api(chat, memories);
    chatmem::HttpServer server(config.server.listen, config.server.max_body);
    api.attach(server);

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    uint64_t ticks = 0;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        // Periodic idle-session eviction (~every 10 minutes)
        if (++ticks % 3000 == 0) {
            memories.evict_idle(3600);
        }
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

static int run_repl(chatmem::ChatService& chat, chatmem::MemoryRegistry& memories,
                    const std::string& session) {
    std::cout << "chatmem: conversation with summary-buffer memory\n"
              << "Provider: " << chat.provider_name()
              << " | Model: " << chat.model() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    auto memory = memories.get(session);
    std::string line;
    while (true) {
        std::cout << "chatmem> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/context") {
                print_context(*memory);
            } else if (line == "/stats") {
                print_stats(*memory);
            } else if (line == "/clear") {
                memory->clear();
                std::cout << "Memory cleared.\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /context  Show memory context\n"
                          << "  /stats    Show memory statistics\n"
                          << "  /clear    Clear conversation memory\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        try {
            std::string response = chat.process(session, line);
            std::cout << "\n" << response << "\n\n";
        } catch (const std::exception& e) {
            std::cout << "\nError calling provider: " << e.what() << "\n\n";
        }
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string model_name;
    std::string listen;
    std::string session = chatmem::kDefaultSession;
    bool serve = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--serve") == 0) {
            serve = true;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    chatmem::http_init();
    chatmem::http_set_abort_flag(&g_shutdown);
    auto config = chatmem::Config::load();

    // CLI args override config and environment
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;
    if (!listen.empty()) config.server.listen = listen;

    int rc = 0;
    {
        auto http_client = std::make_shared<chatmem::CurlHttpClient>();
        std::shared_ptr<chatmem::Provider> provider;
        try {
            provider = chatmem::create_provider(config.provider, config, http_client);
        } catch (const std::exception& e) {
            std::cerr << "Error creating provider: " << e.what() << "\n";
            chatmem::http_cleanup();
            return 1;
        }

        std::shared_ptr<chatmem::Summarizer> summarizer =
            std::make_shared<chatmem::LlmSummarizer>(
                provider, config.summary_model(), config.memory.summary_temperature);
        if (config.memory.summarizer_timeout_ms > 0) {
            summarizer = std::make_shared<chatmem::TimeoutSummarizer>(
                summarizer, std::chrono::milliseconds(config.memory.summarizer_timeout_ms));
        }

        // Throws ConfigError on bad memory settings (caught below as fatal)
        chatmem::MemoryRegistry memories(config.memory, summarizer);
        chatmem::ChatService chat(*provider, memories, config);
        ShutdownOnExit abort_pending_summaries;

        if (serve) {
            rc = run_server(chat, memories, config);
        } else if (!message.empty()) {
            std::cout << chat.process(session, message) << '\n';
        } else {
            rc = run_repl(chat, memories, session);
        }
    }

    chatmem::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
