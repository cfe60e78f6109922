/*
 * Health prober implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HealthProber.hpp"
#include "Logger.hpp"

#include <future>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

HealthProber::HealthProber(HttpClient http_client, int probe_timeout_ms, int local_daemon_timeout_ms)
    : http_client_(http_client ? std::move(http_client) : make_curl_http_client())
    , probe_timeout_ms_(probe_timeout_ms)
    , local_daemon_timeout_ms_(local_daemon_timeout_ms)
{}

ProbeResult HealthProber::probe(const std::string& address,
                                const std::optional<std::string>& credential) const
{
    ProbeResult result;
    result.address = address;

    HttpRequest request;
    request.url = join_url(address, kModelsEndpoint);
    request.method = "GET";
    request.headers = json_headers(credential);
    request.timeout_ms = probe_timeout_ms_;

    const HttpResponse response = http_client_(request);
    result.http_status = response.status_code;

    if (response.success()) {
        result.status = HealthStatus::Online;
        result.detail = "OK";
    } else if (response.status_code == 0) {
        result.status = HealthStatus::Offline;
        result.detail = "Could not connect to server";
        if (!response.error.empty()) {
            result.detail += ": " + response.error;
        }
    } else {
        result.status = HealthStatus::Offline;
        result.detail = "Server responded with status " + std::to_string(response.status_code);
    }

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        if (result.online()) {
            logger->info("Backend {} is online", address);
        } else {
            logger->warn("Backend {} is offline: {}", address, result.detail);
        }
    }

    return result;
}

std::vector<ProbeResult> HealthProber::probe_all(const std::vector<ProbeTarget>& targets) const
{
    std::vector<std::future<ProbeResult>> pending;
    pending.reserve(targets.size());
    for (const auto& target : targets) {
        pending.push_back(std::async(std::launch::async, [this, target] {
            return probe(target.address, target.credential);
        }));
    }

    std::vector<ProbeResult> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

std::optional<std::size_t> HealthProber::count_local_daemon_models(const std::string& address) const
{
    HttpRequest request;
    request.url = join_url(address, kLocalDaemonTagsEndpoint);
    request.method = "GET";
    request.timeout_ms = local_daemon_timeout_ms_;

    const HttpResponse response = http_client_(request);
    if (!response.success()) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->debug("{} does not expose a local daemon model listing", address);
        }
        return std::nullopt;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(response.body);
    std::string errors;
    if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors)) {
        return std::nullopt;
    }

    if (!root.isObject() || !root["models"].isArray()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(root["models"].size());
}
