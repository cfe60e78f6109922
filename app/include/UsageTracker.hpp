/*
 * Quota and session tracking for the metered cloud backend
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef USAGE_TRACKER_HPP
#define USAGE_TRACKER_HPP

#include "HttpClient.hpp"
#include "KeyValueStore.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>

/**
 * Cloud plan names. Plus, Pro and Max are not metered for upsell purposes.
 */
enum class QuotaTier {
    Free,
    Plus,
    Pro,
    Max,
    Unknown,
};

QuotaTier quota_tier_from_string(const std::string& value);
const char* to_string(QuotaTier tier);

struct QuotaSnapshot {
    int used{0};
    int remaining{0};
    int limit{0};
    QuotaTier tier{QuotaTier::Free};
    std::string tier_name;

    bool metered() const
    {
        return tier != QuotaTier::Plus && tier != QuotaTier::Pro && tier != QuotaTier::Max;
    }

    /**
     * Fraction of the limit consumed, or nullopt when there is no limit.
     */
    std::optional<double> utilization() const
    {
        if (limit <= 0) {
            return std::nullopt;
        }
        return static_cast<double>(limit - remaining) / static_cast<double>(limit);
    }
};

enum class QuotaRefreshStatus {
    Ok,
    SessionExpired,
    Unavailable,
};

struct QuotaRefreshResult {
    QuotaRefreshStatus status{QuotaRefreshStatus::Unavailable};
    std::optional<QuotaSnapshot> snapshot;
    int http_status{0};
    std::string error_message;
};

/**
 * Keeps the last quota snapshot of the cloud backend and a persisted
 * "remaining" figure that is decremented optimistically on dispatch.
 */
class UsageTracker {
public:
    struct Callbacks {
        std::function<void(const std::optional<QuotaSnapshot>&)> on_quota_changed;
        std::function<void(const QuotaSnapshot&)> on_threshold_crossed;
        std::function<void()> on_session_expired;
    };

    static constexpr double kUpgradePromptThreshold = 0.5;
    static constexpr const char* kRemainingKey = "quota-remaining";

    UsageTracker(std::string quota_url,
                 KeyValueStorePtr store,
                 HttpClient http_client = nullptr);

    void set_callbacks(Callbacks callbacks);

    /**
     * Query the quota endpoint with the session token.
     * 200 stores a snapshot and persists "remaining"; 401 sets the sticky
     * session-expired flag; anything else leaves the snapshot unavailable.
     */
    QuotaRefreshResult refresh(const std::string& token);

    /**
     * Decrement the cached remaining figure by one. No-op without one.
     */
    void optimistic_decrement();

    /**
     * Mark the session as expired, e.g. after a 401 from the cloud backend.
     */
    void mark_session_expired();

    /**
     * Start a new session: forget the snapshot, the expired flag and the
     * one-shot upgrade prompt.
     */
    void reset_session();

    /**
     * Drop the snapshot when the cloud backend is no longer in use.
     */
    void clear_snapshot();

    std::optional<QuotaSnapshot> snapshot() const;
    std::optional<int> cached_remaining() const;
    bool session_expired() const;
    bool upgrade_prompt_fired() const;

    /**
     * Parse {used, remaining, limit, tier}.
     */
    static std::optional<QuotaSnapshot> parse_quota_response(const std::string& body);

private:
    // Returns true when the one-shot upgrade prompt must fire now.
    bool check_threshold_locked(const QuotaSnapshot& snapshot);

    std::string quota_url_;
    KeyValueStorePtr store_;
    HttpClient http_client_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    std::optional<QuotaSnapshot> snapshot_;
    bool session_expired_{false};
    bool upgrade_prompt_fired_{false};
};

#endif // USAGE_TRACKER_HPP
