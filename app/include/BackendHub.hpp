/*
 * Backend hub: the single entry point collaborators talk to
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BACKEND_HUB_HPP
#define BACKEND_HUB_HPP

#include "BackendRegistry.hpp"
#include "CompletionRouter.hpp"
#include "HealthProber.hpp"
#include "HubObserver.hpp"
#include "KeyValueStore.hpp"
#include "ModelCatalog.hpp"
#include "UsageTracker.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Settings;

/**
 * Owns the registry, prober, catalog, tracker and router and keeps them in
 * step with each other.
 *
 * Any change to the active address set re-aggregates the catalog. Custom
 * backends are persisted in the key-value store under "custom-servers" after
 * every change, and collaborators learn about state changes through
 * HubObserver callbacks.
 */
class BackendHub {
public:
    static constexpr const char* kCustomServersKey = "custom-servers";

    /**
     * @param settings Addresses and timeouts
     * @param store Persistence for custom backends and the quota figure;
     *              nullptr keeps state in memory only
     * @param http_client Transport; nullptr uses libcurl
     */
    BackendHub(const Settings& settings, KeyValueStorePtr store, HttpClient http_client = nullptr);
    ~BackendHub() = default;

    BackendHub(const BackendHub&) = delete;
    BackendHub& operator=(const BackendHub&) = delete;

    void add_observer(HubObserverPtr observer);
    void remove_observer(const HubObserverPtr& observer);

    /**
     * Restore custom backends saved by a previous run. Records without an
     * address and duplicates are skipped.
     * @return Number of backends restored
     */
    std::size_t load_persisted();

    bool add_custom_backend(const std::string& address,
                            const std::optional<std::string>& credential = std::nullopt);
    bool remove_custom_backend(const std::string& address);
    bool toggle_backend(const std::string& address);
    bool set_backend_credential(const std::string& address,
                                const std::optional<std::string>& credential);

    /**
     * Enable or disable the cloud backend. Enabling fetches the quota.
     * @return false when enabling is refused because there is no session
     */
    bool set_cloud_enabled(bool enabled);
    bool set_local_enabled(bool enabled);

    /**
     * Start (token) or end (nullopt / empty) a cloud session. A new token
     * becomes the cloud backend's credential and starts a fresh quota session,
     * fetched right away when the cloud backend is enabled.
     */
    void set_session_token(const std::optional<std::string>& token);
    std::optional<std::string> session_token() const;

    /**
     * Probe one backend and record the verdict.
     */
    ProbeResult check_backend(const std::string& address);

    /**
     * Probe every local and custom backend concurrently. The catalog is
     * refreshed at most once for the whole sweep.
     */
    std::vector<ProbeResult> check_all_backends();

    ModelList refresh_models();

    /**
     * Refresh the cloud quota. When the cloud backend is disabled or there is
     * no session the snapshot is cleared instead.
     */
    QuotaRefreshResult refresh_quota();

    /**
     * Route a completion. The hub's session token is used when the request
     * carries none.
     */
    CompletionResponse send(CompletionRequest request);

    ConnectivityStatus connectivity() const;

    const BackendRegistry& registry() const { return registry_; }
    const ModelCatalog& catalog() const { return catalog_; }
    const UsageTracker& usage_tracker() const { return tracker_; }
    const HealthProber& prober() const { return prober_; }

private:
    class RefreshBatch;

    void on_membership_changed();
    void persist_custom_backends() const;
    void update_connectivity();
    ConnectivityStatus compute_connectivity(const std::vector<Backend>& backends) const;
    std::vector<HubObserverPtr> observers_snapshot() const;

    KeyValueStorePtr store_;
    HttpClient http_client_;

    BackendRegistry registry_;
    HealthProber prober_;
    ModelCatalog catalog_;
    UsageTracker tracker_;
    CompletionRouter router_;

    mutable std::mutex mutex_;
    std::optional<std::string> session_token_;
    ConnectivityStatus last_connectivity_{ConnectivityStatus::Unchecked};
    std::vector<HubObserverPtr> observers_;

    std::atomic<int> batch_depth_{0};
    std::atomic<bool> refresh_pending_{false};
};

#endif // BACKEND_HUB_HPP
