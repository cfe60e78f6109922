/*
 * Notifications the hub sends to its collaborators
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HUB_OBSERVER_HPP
#define HUB_OBSERVER_HPP

#include "BackendTypes.hpp"
#include "UsageTracker.hpp"
#include <memory>
#include <optional>
#include <string>

/**
 * Override the notifications you care about. Callbacks run on the thread
 * that caused the change, with no hub lock held.
 */
class HubObserver {
public:
    virtual ~HubObserver() = default;

    virtual void on_health_changed(const Backend& /*backend*/) {}
    virtual void on_catalog_changed(const ModelList& /*models*/) {}
    virtual void on_connectivity_changed(ConnectivityStatus /*status*/) {}
    virtual void on_quota_changed(const std::optional<QuotaSnapshot>& /*snapshot*/) {}

    /**
     * Fires at most once per session, when a metered plan reaches 50% use.
     */
    virtual void on_quota_threshold_crossed(const QuotaSnapshot& /*snapshot*/) {}

    virtual void on_session_expired() {}

    /**
     * The local daemon is online but has no models installed.
     */
    virtual void on_empty_local_catalog(const std::string& /*address*/) {}
};

using HubObserverPtr = std::shared_ptr<HubObserver>;

#endif // HUB_OBSERVER_HPP
