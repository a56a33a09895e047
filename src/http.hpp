#pragma once
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace chatmem {

// Process-wide libcurl setup; call once around the lifetime of all clients.
void http_init();
void http_cleanup();

// Transfers poll this flag and abort once it becomes true.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// One outbound JSON POST
struct HttpRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 120;
};

// Outcome of a POST. When the exchange never completed (DNS, connect,
// timeout, abort) `transport_error` says why and `status` is meaningless.
struct HttpResult {
    long status = 0;
    std::string body;
    std::string transport_error;

    bool delivered() const { return transport_error.empty(); }
    bool ok() const { return delivered() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResult send(const HttpRequest& request) = 0;
};

// One easy handle per call; a single instance may be shared across threads.
class CurlHttpClient : public HttpClient {
public:
    HttpResult send(const HttpRequest& request) override;
};

} // namespace chatmem
