/*
 * Backend hub implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BackendHub.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <algorithm>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * Collapses the catalog refreshes triggered by a series of registry changes
 * into one refresh when the outermost batch ends.
 */
class BackendHub::RefreshBatch {
public:
    explicit RefreshBatch(BackendHub& hub) : hub_(hub) { ++hub_.batch_depth_; }

    ~RefreshBatch()
    {
        if (--hub_.batch_depth_ == 0 && hub_.refresh_pending_.exchange(false)) {
            hub_.refresh_models();
        }
    }

    RefreshBatch(const RefreshBatch&) = delete;
    RefreshBatch& operator=(const RefreshBatch&) = delete;

private:
    BackendHub& hub_;
};

BackendHub::BackendHub(const Settings& settings, KeyValueStorePtr store, HttpClient http_client)
    : store_(store ? std::move(store) : std::make_shared<InMemoryStore>())
    , http_client_(http_client ? std::move(http_client) : make_curl_http_client())
    , registry_(settings.get_cloud_address(), settings.get_local_address())
    , prober_(http_client_, settings.get_probe_timeout_ms(), settings.get_local_daemon_timeout_ms())
    , catalog_(http_client_, settings.get_catalog_timeout_ms())
    , tracker_(settings.get_quota_url(), store_, http_client_)
    , router_(catalog_, registry_, &tracker_, http_client_)
{
    registry_.set_membership_listener([this] { on_membership_changed(); });

    UsageTracker::Callbacks callbacks;
    callbacks.on_quota_changed = [this](const std::optional<QuotaSnapshot>& snapshot) {
        for (const auto& observer : observers_snapshot()) {
            observer->on_quota_changed(snapshot);
        }
    };
    callbacks.on_threshold_crossed = [this](const QuotaSnapshot& snapshot) {
        for (const auto& observer : observers_snapshot()) {
            observer->on_quota_threshold_crossed(snapshot);
        }
    };
    callbacks.on_session_expired = [this] {
        for (const auto& observer : observers_snapshot()) {
            observer->on_session_expired();
        }
    };
    tracker_.set_callbacks(std::move(callbacks));

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Backend hub ready (cloud: {}, local: {})",
                     registry_.cloud_address(), registry_.local_address());
    }
}

void BackendHub::add_observer(HubObserverPtr observer)
{
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void BackendHub::remove_observer(const HubObserverPtr& observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::vector<HubObserverPtr> BackendHub::observers_snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_;
}

void BackendHub::on_membership_changed()
{
    if (batch_depth_.load() > 0) {
        refresh_pending_ = true;
        return;
    }
    refresh_models();
}

std::size_t BackendHub::load_persisted()
{
    const auto stored = store_->get(kCustomServersKey);
    if (!stored) {
        return 0;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream stored_stream(*stored);
    std::string errors;
    if (!Json::parseFromStream(reader_builder, stored_stream, &root, &errors) || !root.isArray()) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->error("Ignoring unreadable '{}' entry: {}", kCustomServersKey, errors);
        }
        return 0;
    }

    RefreshBatch batch(*this);
    std::size_t restored = 0;
    for (const auto& record : root) {
        if (!record.isObject() || !record["address"].isString()) {
            continue;
        }
        const std::string address = record["address"].asString();

        std::optional<std::string> credential;
        if (record["apiKey"].isString() && !record["apiKey"].asString().empty()) {
            credential = record["apiKey"].asString();
        }
        if (!registry_.add(address, credential)) {
            continue;
        }
        if (record["enabled"].isBool() && !record["enabled"].asBool()) {
            registry_.set_enabled(address, false);
        }
        ++restored;
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Restored {} custom backend(s)", restored);
    }
    return restored;
}

void BackendHub::persist_custom_backends() const
{
    Json::Value records(Json::arrayValue);
    for (const auto& backend : registry_.custom_backends()) {
        Json::Value record(Json::objectValue);
        record["address"] = backend.address;
        record["enabled"] = backend.enabled;
        record["status"] = to_string(backend.health);
        if (backend.credential) {
            record["apiKey"] = *backend.credential;
        }
        records.append(record);
    }

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    if (!store_->set(kCustomServersKey, Json::writeString(writer_builder, records))) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->error("Failed to persist custom backends");
        }
    }
}

bool BackendHub::add_custom_backend(const std::string& address,
                                    const std::optional<std::string>& credential)
{
    if (!registry_.add(address, credential)) {
        return false;
    }
    persist_custom_backends();
    update_connectivity();
    return true;
}

bool BackendHub::remove_custom_backend(const std::string& address)
{
    if (!registry_.remove(address)) {
        return false;
    }
    persist_custom_backends();
    update_connectivity();
    return true;
}

bool BackendHub::toggle_backend(const std::string& address)
{
    const auto role = registry_.role_of(address);
    if (!role) {
        return false;
    }
    if (*role == BackendRole::Cloud) {
        const auto cloud = registry_.find(registry_.cloud_address());
        return set_cloud_enabled(!(cloud && cloud->enabled));
    }

    registry_.toggle(address);
    if (*role == BackendRole::Custom) {
        persist_custom_backends();
    }
    update_connectivity();
    return true;
}

bool BackendHub::set_backend_credential(const std::string& address,
                                        const std::optional<std::string>& credential)
{
    const auto role = registry_.role_of(address);
    if (!role) {
        return false;
    }
    if (*role == BackendRole::Cloud) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("The cloud backend uses the session token; set_session_token() replaces it");
        }
        return false;
    }

    registry_.set_credential(address, credential);
    if (*role == BackendRole::Custom) {
        persist_custom_backends();
    }
    return true;
}

bool BackendHub::set_cloud_enabled(bool enabled)
{
    if (enabled && !registry_.cloud_authenticated()) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Cannot enable the cloud backend without a session");
        }
        return false;
    }

    registry_.set_enabled(registry_.cloud_address(), enabled);
    if (!enabled) {
        tracker_.clear_snapshot();
    }
    update_connectivity();
    if (enabled) {
        refresh_quota();
    }
    return true;
}

bool BackendHub::set_local_enabled(bool enabled)
{
    if (!registry_.set_enabled(registry_.local_address(), enabled)) {
        return false;
    }
    update_connectivity();
    return true;
}

void BackendHub::set_session_token(const std::optional<std::string>& token)
{
    const bool signed_in = token && !token->empty();
    bool new_session = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (signed_in) {
            new_session = session_token_ != token;
            session_token_ = token;
        } else {
            session_token_.reset();
        }
    }

    if (signed_in) {
        if (new_session) {
            tracker_.reset_session();
        }
        registry_.set_credential(registry_.cloud_address(), token);
        registry_.set_cloud_authenticated(true);
    } else {
        registry_.set_cloud_authenticated(false);
        registry_.set_credential(registry_.cloud_address(), std::nullopt);
        tracker_.clear_snapshot();
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info(signed_in ? "Cloud session started" : "Cloud session ended");
    }
    update_connectivity();

    const auto cloud = registry_.find(registry_.cloud_address());
    if (signed_in && cloud && cloud->enabled) {
        refresh_quota();
    }
}

std::optional<std::string> BackendHub::session_token() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_token_;
}

ProbeResult BackendHub::check_backend(const std::string& address)
{
    const auto backend = registry_.find(address);
    if (!backend) {
        ProbeResult result;
        result.address = address;
        result.detail = "Unknown backend";
        return result;
    }

    const ProbeResult result = prober_.probe(backend->address, backend->credential);
    registry_.set_health(backend->address, result.status, result.detail);

    if (const auto updated = registry_.find(backend->address)) {
        for (const auto& observer : observers_snapshot()) {
            observer->on_health_changed(*updated);
        }
    }

    if (backend->role == BackendRole::Local && result.online()) {
        const auto installed = prober_.count_local_daemon_models(backend->address);
        if (installed && *installed == 0) {
            if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
                logger->warn("Local daemon at {} has no models installed", backend->address);
            }
            for (const auto& observer : observers_snapshot()) {
                observer->on_empty_local_catalog(backend->address);
            }
        }
    }

    if (backend->role == BackendRole::Custom) {
        persist_custom_backends();
    }
    update_connectivity();
    return result;
}

std::vector<ProbeResult> BackendHub::check_all_backends()
{
    std::vector<ProbeTarget> targets;
    for (const auto& backend : registry_.list()) {
        if (backend.role == BackendRole::Cloud) {
            continue;
        }
        targets.push_back({backend.address, backend.credential});
    }

    const std::vector<ProbeResult> results = prober_.probe_all(targets);

    {
        RefreshBatch batch(*this);
        for (const auto& result : results) {
            registry_.set_health(result.address, result.status, result.detail);
        }
    }

    bool custom_changed = false;
    for (const auto& result : results) {
        const auto backend = registry_.find(result.address);
        if (!backend) {
            continue;
        }
        for (const auto& observer : observers_snapshot()) {
            observer->on_health_changed(*backend);
        }
        custom_changed = custom_changed || backend->role == BackendRole::Custom;

        if (backend->role == BackendRole::Local && result.online()) {
            const auto installed = prober_.count_local_daemon_models(backend->address);
            if (installed && *installed == 0) {
                for (const auto& observer : observers_snapshot()) {
                    observer->on_empty_local_catalog(backend->address);
                }
            }
        }
    }

    if (custom_changed) {
        persist_custom_backends();
    }
    update_connectivity();

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        const auto online = std::count_if(results.begin(), results.end(),
                                          [](const ProbeResult& r) { return r.online(); });
        logger->info("Health sweep: {}/{} backend(s) online", online, results.size());
    }
    return results;
}

ModelList BackendHub::refresh_models()
{
    const std::uint64_t before = catalog_.generation();
    ModelList models = catalog_.refresh(registry_);

    // A refresh superseded by a newer one leaves the generation untouched.
    if (catalog_.generation() != before) {
        for (const auto& observer : observers_snapshot()) {
            observer->on_catalog_changed(models);
        }
    }
    return models;
}

QuotaRefreshResult BackendHub::refresh_quota()
{
    const auto cloud = registry_.find(registry_.cloud_address());
    const auto token = session_token();
    if (!cloud || !cloud->enabled || !registry_.cloud_authenticated() || !token) {
        tracker_.clear_snapshot();
        QuotaRefreshResult result;
        result.status = QuotaRefreshStatus::Unavailable;
        result.error_message = "Cloud backend not in use";
        return result;
    }
    return tracker_.refresh(*token);
}

CompletionResponse BackendHub::send(CompletionRequest request)
{
    if (!request.session_token) {
        request.session_token = session_token();
    }

    CompletionResponse response = router_.send(request);

    if (response.error == CompletionError::Unauthorized &&
        registry_.role_of(response.server) == BackendRole::Cloud) {
        tracker_.mark_session_expired();
    }
    return response;
}

ConnectivityStatus BackendHub::compute_connectivity(const std::vector<Backend>& backends) const
{
    const bool authenticated = registry_.cloud_authenticated();
    bool local_online = false;
    bool cloud_in_use = false;
    bool custom_online = false;
    bool has_custom = false;
    bool custom_checked = false;

    for (const auto& backend : backends) {
        switch (backend.role) {
            case BackendRole::Cloud:
                cloud_in_use = backend.enabled && authenticated;
                break;
            case BackendRole::Local:
                local_online = backend.enabled && backend.health == HealthStatus::Online;
                break;
            case BackendRole::Custom:
                has_custom = true;
                custom_online = custom_online ||
                    (backend.enabled && backend.health == HealthStatus::Online);
                custom_checked = custom_checked || backend.health != HealthStatus::Unchecked;
                break;
        }
    }

    if (local_online || cloud_in_use || custom_online) {
        return ConnectivityStatus::Online;
    }
    if (!has_custom || custom_checked) {
        return ConnectivityStatus::Offline;
    }
    return ConnectivityStatus::Unchecked;
}

ConnectivityStatus BackendHub::connectivity() const
{
    return compute_connectivity(registry_.list());
}

void BackendHub::update_connectivity()
{
    const ConnectivityStatus status = connectivity();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status == last_connectivity_) {
            return;
        }
        last_connectivity_ = status;
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Connectivity is now {}", to_string(status));
    }
    for (const auto& observer : observers_snapshot()) {
        observer->on_connectivity_changed(status);
    }
}
