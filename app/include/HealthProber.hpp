/*
 * Reachability and auth checks for inference backends
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HEALTH_PROBER_HPP
#define HEALTH_PROBER_HPP

#include "BackendTypes.hpp"
#include "HttpClient.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * Result of a single probe
 */
struct ProbeResult {
    std::string address;
    HealthStatus status{HealthStatus::Offline};
    std::string detail;
    int http_status{0};

    bool online() const { return status == HealthStatus::Online; }
};

struct ProbeTarget {
    std::string address;
    std::optional<std::string> credential;
};

/**
 * Probes backends with one bounded GET each. Never retries.
 */
class HealthProber {
public:
    static constexpr int kDefaultProbeTimeoutMs = 2500;
    static constexpr int kDefaultLocalDaemonTimeoutMs = 1000;

    explicit HealthProber(HttpClient http_client = nullptr,
                          int probe_timeout_ms = kDefaultProbeTimeoutMs,
                          int local_daemon_timeout_ms = kDefaultLocalDaemonTimeoutMs);

    /**
     * GET {address}/v1/models; any 2xx means online.
     */
    ProbeResult probe(const std::string& address,
                      const std::optional<std::string>& credential = std::nullopt) const;

    /**
     * Probe every target concurrently. Results keep the input order.
     */
    std::vector<ProbeResult> probe_all(const std::vector<ProbeTarget>& targets) const;

    /**
     * Ask a local daemon for its installed models via {address}/api/tags.
     * @return The model count, or nullopt if the listing is not available
     */
    std::optional<std::size_t> count_local_daemon_models(const std::string& address) const;

    int probe_timeout_ms() const { return probe_timeout_ms_; }

private:
    static constexpr const char* kModelsEndpoint = "/v1/models";
    static constexpr const char* kLocalDaemonTagsEndpoint = "/api/tags";

    HttpClient http_client_;
    int probe_timeout_ms_;
    int local_daemon_timeout_ms_;
};

#endif // HEALTH_PROBER_HPP
