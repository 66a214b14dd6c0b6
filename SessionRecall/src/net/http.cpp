#include "../../include/recall/net/http.hpp"

#include <curl/curl.h>

#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

constexpr long kDefaultTimeoutMs = 15000;

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("[http] curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

long resolve_timeout(long timeout_ms) {
    return timeout_ms > 0 ? timeout_ms : kDefaultTimeoutMs;
}

} // namespace

namespace recall::net {

std::string post_json(const std::string& url,
                      const std::string& body,
                      const HeaderList& headers,
                      long timeout_ms) {
    CurlGlobal global_guard;

    const long resolved_timeout = resolve_timeout(timeout_ms);

    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("[http] curl_easy_init failed");
    }

    std::string response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);
    if (!header_list) {
        throw std::runtime_error("[http] failed to build request headers");
    }
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        raw_list = curl_slist_append(header_list.get(), line.c_str());
        if (!raw_list) {
            throw std::runtime_error("[http] failed to build request headers");
        }
    }
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());

    const CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << curl_easy_strerror(code);
        throw std::runtime_error(oss.str());
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << status;
        throw std::runtime_error(oss.str());
    }

    return response;
}

} // namespace recall::net
