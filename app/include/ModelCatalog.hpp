/*
 * Merged model catalog across all active backends
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef MODEL_CATALOG_HPP
#define MODEL_CATALOG_HPP

#include "BackendTypes.hpp"
#include "HttpClient.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class BackendRegistry;

/**
 * Aggregates GET {address}/v1/models over every active backend.
 *
 * A backend that cannot be reached or answers with a malformed payload
 * contributes nothing; it never blanks out models from the others.
 * Refreshes run their per-backend fetches concurrently and merge them in
 * the order the addresses were given. When refreshes overlap, the one that
 * started last wins: an older refresh finishing afterwards is discarded.
 */
class ModelCatalog {
public:
    static constexpr int kDefaultFetchTimeoutMs = 10000;

    explicit ModelCatalog(HttpClient http_client = nullptr,
                          int fetch_timeout_ms = kDefaultFetchTimeoutMs);

    /**
     * Re-aggregate the catalog.
     * @param active_addresses Addresses to query, in registration order
     * @param registry Source of each backend's credential
     * @return The catalog as it stands after this refresh
     */
    ModelList refresh(const std::vector<std::string>& active_addresses,
                      const BackendRegistry& registry);

    /**
     * Re-aggregate over the registry's current active set. The set is read
     * atomically with the refresh ticket.
     */
    ModelList refresh(const BackendRegistry& registry);

    /**
     * Last applied aggregation. Never blocks on network I/O.
     */
    ModelList current() const;

    /**
     * First model with this name in catalog order.
     */
    std::optional<Model> find(const std::string& name) const;

    std::optional<Model> find(const std::string& name, const std::string& server) const;

    /**
     * Number of refreshes applied so far.
     */
    std::uint64_t generation() const;

    /**
     * Fetch and parse one backend's model list. Failures yield an empty list.
     */
    ModelList fetch_from(const std::string& address,
                         const std::optional<std::string>& credential) const;

    /**
     * Map an OpenAI-style {"data": [...]} listing to models owned by address.
     * @return nullopt when the body is not valid JSON
     */
    static std::optional<ModelList> parse_models_response(const std::string& body,
                                                          const std::string& address);

private:
    static constexpr const char* kModelsEndpoint = "/v1/models";

    struct FetchTarget {
        std::string address;
        std::optional<std::string> credential;
    };

    static std::vector<FetchTarget> collect_targets(const std::vector<std::string>& addresses,
                                                    const BackendRegistry& registry);
    ModelList run_refresh(std::uint64_t ticket, std::vector<FetchTarget> targets);

    HttpClient http_client_;
    int fetch_timeout_ms_;

    mutable std::mutex mutex_;
    ModelList models_;
    std::uint64_t next_ticket_{0};
    std::uint64_t applied_ticket_{0};
    std::uint64_t generation_{0};
};

#endif // MODEL_CATALOG_HPP
