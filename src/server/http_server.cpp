#include "server/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chatmem {

namespace {

constexpr size_t kMaxHeadBytes = 16 * 1024;
constexpr int kPollIntervalMs = 1000;
constexpr time_t kClientTimeoutSec = 10;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

void write_response(int fd, const ServerResponse& resp) {
    std::string wire = "HTTP/1.1 " + std::to_string(resp.status) + " " +
                       status_text(resp.status) + "\r\n";
    wire += "Content-Type: " + resp.content_type + "\r\n";
    wire += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    wire += "Connection: close\r\n\r\n";
    wire += resp.body;

    const char* data = wire.data();
    size_t left = wire.size();
    while (left > 0) {
        ssize_t n = ::send(fd, data, left, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        data += n;
        left -= static_cast<size_t>(n);
    }
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Reads the head and the announced body. On failure `reject` holds the
// response to send; status 0 means the peer went away and nothing is sent.
bool read_request(int fd, uint32_t max_body, ServerRequest& req, ServerResponse& reject) {
    std::string buf;
    char chunk[1024];
    size_t head_end;
    while ((head_end = buf.find("\r\n\r\n")) == std::string::npos) {
        if (buf.size() > kMaxHeadBytes) {
            reject = json_error(431, "Request headers too large");
            return false;
        }
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            reject.status = 0;
            return false;
        }
        buf.append(chunk, static_cast<size_t>(n));
    }

    if (!parse_request_head(buf.substr(0, head_end), req)) {
        reject = json_error(400, "Malformed request");
        return false;
    }

    size_t length = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        if (!all_digits(it->second) || it->second.size() > 12) {
            reject = json_error(400, "Invalid Content-Length");
            return false;
        }
        length = static_cast<size_t>(std::stoull(it->second));
    }
    if (length > max_body) {
        reject = json_error(413, "Request body exceeds " + std::to_string(max_body) + " bytes");
        return false;
    }

    req.body = buf.substr(head_end + 4);
    while (req.body.size() < length) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            reject = json_error(400, "Incomplete request body");
            return false;
        }
        req.body.append(chunk, static_cast<size_t>(n));
    }
    req.body.resize(length);
    return true;
}

} // namespace

// ── Responses ───────────────────────────────────────────────────

ServerResponse json_response(int status, const nlohmann::json& body) {
    return ServerResponse{status, "application/json", body.dump()};
}

ServerResponse json_error(int status, const std::string& detail) {
    return json_response(status, {{"detail", detail}});
}

// ── Parsing ─────────────────────────────────────────────────────

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> params;
    for (const auto& part : split(qs, '&')) {
        if (part.empty()) continue;
        auto eq = part.find('=');
        std::string key = url_decode(part.substr(0, eq));
        params[key] = eq == std::string::npos ? "" : url_decode(part.substr(eq + 1));
    }
    return params;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it == query_params.end() ? std::string() : it->second;
}

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string digits = addr.substr(colon + 1);
    if (!all_digits(digits) || digits.size() > 5) return false;
    unsigned long value = std::stoul(digits);
    if (value == 0 || value > 65535) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool parse_request_head(const std::string& head, ServerRequest& req) {
    auto line_end = head.find("\r\n");
    std::string request_line = head.substr(0, line_end);

    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == 0 || sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (request_line.compare(sp2 + 1, 5, "HTTP/") != 0) return false;

    req.method = request_line.substr(0, sp1);
    std::string target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    auto q = target.find('?');
    req.path = target.substr(0, q);
    if (q != std::string::npos) req.query_params = parse_query_string(target.substr(q + 1));

    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

// ── HttpServer ──────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body)
    : listen_addr_(std::move(listen_addr)), max_body_(max_body) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    routes_.push_back(Route{method, path, std::move(handler)});
}

ServerResponse HttpServer::dispatch(const ServerRequest& req) const {
    bool known_path = false;
    for (const auto& r : routes_) {
        if (r.path != req.path) continue;
        known_path = true;
        if (r.method != req.method) continue;
        try {
            return r.handler(req);
        } catch (const std::exception& e) {
            std::cerr << "[server] " << req.method << " " << req.path
                      << " failed: " << e.what() << "\n";
            return json_error(500, "Internal Server Error");
        }
    }
    return known_path ? json_error(405, "Method Not Allowed") : json_error(404, "Not Found");
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        return false;
    }

    auto fail = [this, &error](const std::string& what) {
        error = what + ": " + std::strerror(errno);
        close_fd(listen_fd_);
        close_fd(wake_fds_[0]);
        close_fd(wake_fds_[1]);
        return false;
    };

    if (::pipe(wake_fds_) != 0) return fail("pipe failed");
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) return fail("socket failed");

    int on = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#ifdef SO_NOSIGPIPE
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on));
#endif

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        return fail("bind to " + listen_addr_ + " failed");
    }
    if (::listen(listen_fd_, SOMAXCONN) != 0) return fail("listen failed");

    running_.store(true);
    thread_ = std::thread([this]() { serve_loop(); });
    std::cerr << "[server] Listening on " << listen_addr_ << "\n";
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    char wake = 1;
    if (::write(wake_fds_[1], &wake, 1) < 0) {
        std::cerr << "[server] Wake-up write failed: " << std::strerror(errno) << "\n";
    }
    if (thread_.joinable()) thread_.join();

    close_fd(listen_fd_);
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
    std::cerr << "[server] Stopped\n";
}

void HttpServer::serve_loop() {
    pollfd watched[2] = {{listen_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}};

    while (running_.load()) {
        watched[0].revents = 0;
        watched[1].revents = 0;
        if (::poll(watched, 2, kPollIntervalMs) <= 0) continue;
        if (watched[1].revents & POLLIN) return;
        if (!(watched[0].revents & POLLIN)) continue;

        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) continue;

        timeval timeout{kClientTimeoutSec, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        serve_client(client);
        close_fd(client);
    }
}

void HttpServer::serve_client(int fd) const {
    ServerRequest req;
    ServerResponse reject;
    if (!read_request(fd, max_body_, req, reject)) {
        if (reject.status != 0) write_response(fd, reject);
        return;
    }
    write_response(fd, dispatch(req));
}

} // namespace chatmem
