/*
 * Usage tracker implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "UsageTracker.hpp"
#include "Logger.hpp"

#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

std::optional<int> parse_int(const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

QuotaTier quota_tier_from_string(const std::string& value)
{
    if (value == "free") return QuotaTier::Free;
    if (value == "plus") return QuotaTier::Plus;
    if (value == "pro") return QuotaTier::Pro;
    if (value == "max") return QuotaTier::Max;
    return QuotaTier::Unknown;
}

const char* to_string(QuotaTier tier)
{
    switch (tier) {
        case QuotaTier::Free: return "free";
        case QuotaTier::Plus: return "plus";
        case QuotaTier::Pro: return "pro";
        case QuotaTier::Max: return "max";
        case QuotaTier::Unknown: break;
    }
    return "unknown";
}

UsageTracker::UsageTracker(std::string quota_url, KeyValueStorePtr store, HttpClient http_client)
    : quota_url_(std::move(quota_url))
    , store_(store ? std::move(store) : std::make_shared<InMemoryStore>())
    , http_client_(http_client ? std::move(http_client) : make_curl_http_client())
{}

void UsageTracker::set_callbacks(Callbacks callbacks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = std::move(callbacks);
}

std::optional<QuotaSnapshot> UsageTracker::parse_quota_response(const std::string& body)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(body);
    std::string errors;
    if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors) || !root.isObject()) {
        return std::nullopt;
    }

    if (!root["remaining"].isInt() || !root["limit"].isInt()) {
        return std::nullopt;
    }

    QuotaSnapshot snapshot;
    snapshot.remaining = root["remaining"].asInt();
    snapshot.limit = root["limit"].asInt();
    snapshot.used = root["used"].isInt() ? root["used"].asInt() : snapshot.limit - snapshot.remaining;
    snapshot.tier_name = root["tier"].isString() ? root["tier"].asString() : "free";
    snapshot.tier = quota_tier_from_string(snapshot.tier_name);
    return snapshot;
}

bool UsageTracker::check_threshold_locked(const QuotaSnapshot& snapshot)
{
    if (upgrade_prompt_fired_ || !snapshot.metered()) {
        return false;
    }
    const auto utilization = snapshot.utilization();
    if (!utilization || *utilization < kUpgradePromptThreshold) {
        return false;
    }
    upgrade_prompt_fired_ = true;

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Quota usage reached {:.1f}% ({}/{} left), prompting for upgrade",
                     *utilization * 100.0, snapshot.remaining, snapshot.limit);
    }
    return true;
}

QuotaRefreshResult UsageTracker::refresh(const std::string& token)
{
    QuotaRefreshResult result;

    HttpRequest request;
    request.url = quota_url_;
    request.method = "GET";
    request.headers = json_headers(token);

    const HttpResponse response = http_client_(request);
    result.http_status = response.status_code;

    Callbacks callbacks;
    bool fire_threshold = false;
    bool fire_expired = false;

    if (response.status_code == 200) {
        auto snapshot = parse_quota_response(response.body);
        if (snapshot) {
            std::lock_guard<std::mutex> lock(mutex_);
            store_->set(kRemainingKey, std::to_string(snapshot->remaining));
            snapshot_ = snapshot;
            session_expired_ = false;
            fire_threshold = check_threshold_locked(*snapshot);
            callbacks = callbacks_;
            result.status = QuotaRefreshStatus::Ok;
            result.snapshot = snapshot;
        } else {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot_.reset();
            callbacks = callbacks_;
            result.status = QuotaRefreshStatus::Unavailable;
            result.error_message = "Malformed quota response";
        }
    } else if (response.status_code == 401) {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_.reset();
        fire_expired = !session_expired_;
        session_expired_ = true;
        callbacks = callbacks_;
        result.status = QuotaRefreshStatus::SessionExpired;
        result.error_message = "Session expired";
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_.reset();
        callbacks = callbacks_;
        result.status = QuotaRefreshStatus::Unavailable;
        result.error_message = response.status_code == 0
            ? "Could not reach quota endpoint: " + response.error
            : "Quota endpoint returned HTTP " + std::to_string(response.status_code);
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        if (result.status == QuotaRefreshStatus::Ok) {
            logger->debug("Quota: {}/{} remaining (tier: {})",
                          result.snapshot->remaining, result.snapshot->limit, result.snapshot->tier_name);
        } else if (result.status == QuotaRefreshStatus::SessionExpired) {
            logger->warn("Session expired. Quota check failed with 401.");
        } else {
            logger->error("Failed to fetch quota: {}", result.error_message);
        }
    }

    if (callbacks.on_quota_changed) {
        callbacks.on_quota_changed(result.snapshot);
    }
    if (fire_threshold && callbacks.on_threshold_crossed) {
        callbacks.on_threshold_crossed(*result.snapshot);
    }
    if (fire_expired && callbacks.on_session_expired) {
        callbacks.on_session_expired();
    }
    return result;
}

void UsageTracker::optimistic_decrement()
{
    Callbacks callbacks;
    std::optional<QuotaSnapshot> snapshot;
    bool fire_threshold = false;
    {
        // The cached figure is read, decremented and written back as one step.
        std::lock_guard<std::mutex> lock(mutex_);
        const auto stored = store_->get(kRemainingKey);
        if (!stored) {
            return;
        }
        const auto current = parse_int(*stored);
        if (!current) {
            return;
        }

        const int updated = *current > 0 ? *current - 1 : 0;
        store_->set(kRemainingKey, std::to_string(updated));

        if (snapshot_) {
            snapshot_->remaining = updated;
            fire_threshold = check_threshold_locked(*snapshot_);
        }
        snapshot = snapshot_;
        callbacks = callbacks_;
    }

    if (callbacks.on_quota_changed) {
        callbacks.on_quota_changed(snapshot);
    }
    if (fire_threshold && callbacks.on_threshold_crossed) {
        callbacks.on_threshold_crossed(*snapshot);
    }
}

void UsageTracker::mark_session_expired()
{
    Callbacks callbacks;
    bool fire = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fire = !session_expired_;
        session_expired_ = true;
        snapshot_.reset();
        callbacks = callbacks_;
    }
    if (fire && callbacks.on_session_expired) {
        callbacks.on_session_expired();
    }
}

void UsageTracker::reset_session()
{
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.reset();
    session_expired_ = false;
    upgrade_prompt_fired_ = false;
}

void UsageTracker::clear_snapshot()
{
    Callbacks callbacks;
    bool had_snapshot = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        had_snapshot = snapshot_.has_value();
        snapshot_.reset();
        session_expired_ = false;
        callbacks = callbacks_;
    }
    if (had_snapshot && callbacks.on_quota_changed) {
        callbacks.on_quota_changed(std::nullopt);
    }
}

std::optional<QuotaSnapshot> UsageTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::optional<int> UsageTracker::cached_remaining() const
{
    const auto stored = store_->get(kRemainingKey);
    if (!stored) {
        return std::nullopt;
    }
    return parse_int(*stored);
}

bool UsageTracker::session_expired() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_expired_;
}

bool UsageTracker::upgrade_prompt_fired() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return upgrade_prompt_fired_;
}
