#include "http.hpp"

#include <curl/curl.h>
#include <memory>

namespace chatmem {

namespace {

const std::atomic<bool>* g_abort_flag = nullptr;

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t collect_body(char* data, size_t size, size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
}

int check_abort(void* flag, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* abort = static_cast<const std::atomic<bool>*>(flag);
    return (abort && abort->load(std::memory_order_relaxed)) ? 1 : 0;
}

HeaderList to_curl_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        curl_slist* grown = curl_slist_append(list, (name + ": " + value).c_str());
        if (!grown) break;
        list = grown;
    }
    return HeaderList(list);
}

} // namespace

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

HttpResult CurlHttpClient::send(const HttpRequest& request) {
    HttpResult result;

    EasyHandle easy(curl_easy_init());
    if (!easy) {
        result.transport_error = "could not create curl handle";
        return result;
    }
    HeaderList headers = to_curl_headers(request.headers);
    char error_buf[CURL_ERROR_SIZE] = {0};

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &result.body);
    if (g_abort_flag) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, check_abort);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, g_abort_flag);
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        result.transport_error = error_buf[0] ? error_buf : curl_easy_strerror(rc);
        result.body.clear();
        return result;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.status);
    return result;
}

} // namespace chatmem
