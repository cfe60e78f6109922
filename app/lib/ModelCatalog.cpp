/*
 * Model catalog implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ModelCatalog.hpp"
#include "BackendRegistry.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <future>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

ModelCatalog::ModelCatalog(HttpClient http_client, int fetch_timeout_ms)
    : http_client_(http_client ? std::move(http_client) : make_curl_http_client())
    , fetch_timeout_ms_(fetch_timeout_ms)
{}

std::optional<ModelList> ModelCatalog::parse_models_response(const std::string& body,
                                                             const std::string& address)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(body);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors)) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Failed to parse model list from {}: {}", address, errors);
        }
        return std::nullopt;
    }

    ModelList models;
    if (!root.isObject() || !root["data"].isArray()) {
        return models;
    }

    for (const auto& item : root["data"]) {
        if (!item.isObject() || !item["id"].isString()) {
            continue;
        }
        Model model;
        model.name = item["id"].asString();
        model.server = address;
        if (model.name.empty()) {
            continue;
        }
        if (item["parameter_size"].isString()) {
            model.parameter_size = item["parameter_size"].asString();
        }
        model.multimodal = item["multimodal"].isBool() && item["multimodal"].asBool();
        model.pro = item["pro"].isBool() && item["pro"].asBool();
        models.push_back(std::move(model));
    }
    return models;
}

ModelList ModelCatalog::fetch_from(const std::string& address,
                                   const std::optional<std::string>& credential) const
{
    HttpRequest request;
    request.url = join_url(address, kModelsEndpoint);
    request.method = "GET";
    request.headers = json_headers(credential);
    request.timeout_ms = fetch_timeout_ms_;

    const HttpResponse response = http_client_(request);
    if (!response.success()) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Model listing from {} failed (status: {}) {}",
                         address, response.status_code, response.error);
        }
        return {};
    }

    auto models = parse_models_response(response.body, address);
    if (!models) {
        return {};
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->debug("Fetched {} models from {}", models->size(), address);
    }
    return std::move(*models);
}

ModelList ModelCatalog::refresh(const std::vector<std::string>& active_addresses,
                                const BackendRegistry& registry)
{
    std::uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticket = ++next_ticket_;
    }
    return run_refresh(ticket, collect_targets(active_addresses, registry));
}

ModelList ModelCatalog::refresh(const BackendRegistry& registry)
{
    std::uint64_t ticket = 0;
    std::vector<FetchTarget> targets;
    {
        // The active set is read under the same lock that hands out the
        // ticket, so a later ticket never carries an older view.
        std::lock_guard<std::mutex> lock(mutex_);
        targets = collect_targets(registry.active_addresses(), registry);
        ticket = ++next_ticket_;
    }
    return run_refresh(ticket, std::move(targets));
}

std::vector<ModelCatalog::FetchTarget>
ModelCatalog::collect_targets(const std::vector<std::string>& addresses,
                              const BackendRegistry& registry)
{
    std::vector<FetchTarget> targets;
    targets.reserve(addresses.size());
    for (const auto& address : addresses) {
        FetchTarget target;
        target.address = address;
        if (auto backend = registry.find(address)) {
            target.credential = backend->credential;
        }
        targets.push_back(std::move(target));
    }
    return targets;
}

ModelList ModelCatalog::run_refresh(std::uint64_t ticket, std::vector<FetchTarget> targets)
{
    std::vector<std::future<ModelList>> pending;
    pending.reserve(targets.size());
    for (const auto& target : targets) {
        pending.push_back(std::async(std::launch::async, [this, target] {
            return fetch_from(target.address, target.credential);
        }));
    }

    ModelList merged;
    for (auto& future : pending) {
        ModelList part = future.get();
        merged.insert(merged.end(),
                      std::make_move_iterator(part.begin()),
                      std::make_move_iterator(part.end()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ticket > applied_ticket_) {
        applied_ticket_ = ticket;
        models_ = std::move(merged);
        ++generation_;
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->info("Model catalog refreshed: {} models from {} backends",
                         models_.size(), targets.size());
        }
    } else if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->debug("Discarding stale catalog refresh #{} (applied #{})", ticket, applied_ticket_);
    }
    return models_;
}

ModelList ModelCatalog::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return models_;
}

std::optional<Model> ModelCatalog::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const Model& m) { return m.name == name; });
    if (it == models_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<Model> ModelCatalog::find(const std::string& name, const std::string& server) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const Model& m) { return m.name == name && m.server == server; });
    if (it == models_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::uint64_t ModelCatalog::generation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}
