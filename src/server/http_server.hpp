#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace chatmem {

// A parsed inbound HTTP request
struct ServerRequest {
    std::string method;
    std::string path;                                  // without the query string
    std::map<std::string, std::string> query_params;   // URL-decoded
    std::map<std::string, std::string> headers;        // names lowercased
    std::string body;

    // Query parameter value, or "" if absent
    std::string query_param(const std::string& key) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

ServerResponse json_response(int status, const nlohmann::json& body);

// {"detail": "..."} with the given status
ServerResponse json_error(int status, const std::string& detail);

// JSON API server for local use or behind a reverse proxy. Requests are
// served one at a time on a background thread and every response closes
// the connection. Routes are matched on exact path, then method.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // listen_addr: "host:port"; bodies larger than max_body get 413
    HttpServer(std::string listen_addr, uint32_t max_body);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register before start()
    void route(const std::string& method, const std::string& path, Handler handler);

    // 404 for an unknown path, 405 for a known path with another method,
    // 500 when the handler throws
    ServerResponse dispatch(const ServerRequest& req) const;

    // Bind and start serving. Returns false and sets error on failure.
    bool start(std::string& error);
    void stop();
    bool running() const { return running_.load(); }

private:
    struct Route {
        std::string method;
        std::string path;
        Handler handler;
    };

    void serve_loop();
    void serve_client(int fd) const;

    std::string listen_addr_;
    uint32_t max_body_;
    std::vector<Route> routes_;

    int listen_fd_ = -1;
    int wake_fds_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// "host:port" with a numeric port in 1..65535
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Request line and header block (without the blank line). False if malformed.
bool parse_request_head(const std::string& head, ServerRequest& req);

// %XX escapes and '+' as space
std::string url_decode(const std::string& s);

std::map<std::string, std::string> parse_query_string(const std::string& qs);

} // namespace chatmem
