#include "readiness_probe.hpp"

#include "../logger.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

#include <curl/curl.h>
#include <log4cplus/loggingmacros.h>

namespace taskbridge::supervisor {

namespace {

constexpr auto kCancelCheckSlice = std::chrono::milliseconds(50);

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG4CPLUS_ERROR(process_logger(), "curl_global_init failed: " << curl_easy_strerror(rc));
        }
    });
}

class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return handle_; }

private:
    CURL* handle_;
};

// Common options for a short loopback transfer. Returns false when no handle could be created.
bool prepare(const CurlHandle& curl, const std::string& url, std::chrono::milliseconds timeout) {
    if (!curl.get()) {
        LOG4CPLUS_ERROR(process_logger(), "curl_easy_init failed");
        return false;
    }
    const long timeout_ms = std::max<long>(1, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    return true;
}

} // namespace

std::string Endpoint::url() const {
    return "http://" + host + ":" + std::to_string(port);
}

bool tcp_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    ensure_curl_initialized();
    CurlHandle curl;
    if (!prepare(curl, endpoint.url(), timeout)) {
        return false;
    }
    curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        LOG4CPLUS_TRACE(process_logger(), "connect to " << endpoint.url() << ": " << curl_easy_strerror(rc));
        return false;
    }
    return true;
}

std::optional<int> http_get(const Endpoint& endpoint, const std::string& path, std::chrono::milliseconds timeout) {
    ensure_curl_initialized();
    CurlHandle curl;
    if (!prepare(curl, endpoint.url() + (path.empty() ? std::string("/") : path), timeout)) {
        return std::nullopt;
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        LOG4CPLUS_TRACE(process_logger(), "GET " << endpoint.url() << path << ": " << curl_easy_strerror(rc));
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status == 0) {
        return std::nullopt;
    }
    return static_cast<int>(status);
}

bool probe_once(const Endpoint& endpoint, std::chrono::milliseconds attempt_timeout) {
    if (endpoint.http_path.empty()) {
        return tcp_probe(endpoint, attempt_timeout);
    }
    auto status = http_get(endpoint, endpoint.http_path, attempt_timeout);
    return status && *status == 200;
}

ReadinessResult wait_until_ready(const std::function<bool()>& probe, const ProbePolicy& policy,
                                 const std::atomic<bool>& cancelled) {
    auto deadline = std::chrono::steady_clock::now() + policy.timeout;

    while (true) {
        if (cancelled.load()) {
            return ReadinessResult::Cancelled;
        }
        if (probe()) {
            return ReadinessResult::Ready;
        }

        auto wake = std::min(std::chrono::steady_clock::now() + policy.interval, deadline);
        for (auto now = std::chrono::steady_clock::now(); now < wake; now = std::chrono::steady_clock::now()) {
            if (cancelled.load()) {
                return ReadinessResult::Cancelled;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kCancelCheckSlice, wake - now));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return cancelled.load() ? ReadinessResult::Cancelled : ReadinessResult::TimedOut;
        }
    }
}

} // namespace taskbridge::supervisor
