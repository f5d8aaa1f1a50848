#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace taskbridge::supervisor {

struct Endpoint {
    std::string host = "127.0.0.1";
    int port = 0;
    std::string http_path; // empty: a TCP connect is enough

    std::string url() const;
};

struct ProbePolicy {
    std::chrono::milliseconds interval{500};
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds attempt_timeout{1000};
};

enum class ReadinessResult {
    Ready,
    TimedOut,
    Cancelled,
};

bool tcp_probe(const Endpoint& endpoint, std::chrono::milliseconds timeout);

/// Issues GET `path` and returns the HTTP status code, or nullopt when the
/// server could not be reached or answered garbage.
std::optional<int> http_get(const Endpoint& endpoint, const std::string& path, std::chrono::milliseconds timeout);

/// TCP connect, then GET endpoint.http_path expecting 200 when a path is set.
bool probe_once(const Endpoint& endpoint, std::chrono::milliseconds attempt_timeout);

/**
 * Bounded-retry readiness loop shared by every job kind: calls `probe`
 * every policy.interval until it succeeds, policy.timeout elapses, or
 * `cancelled` is set.
 */
ReadinessResult wait_until_ready(const std::function<bool()>& probe, const ProbePolicy& policy,
                                 const std::atomic<bool>& cancelled);

} // namespace taskbridge::supervisor
