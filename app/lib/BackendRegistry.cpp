/*
 * Backend registry implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BackendRegistry.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>

BackendRegistry::BackendRegistry(const std::string& cloud_address, const std::string& local_address)
    : cloud_address_(normalize_address(cloud_address))
    , local_address_(normalize_address(local_address))
{
    Entry cloud;
    cloud.backend.address = cloud_address_;
    cloud.backend.role = BackendRole::Cloud;
    cloud.backend.enabled = false;
    entries_.push_back(std::move(cloud));

    if (local_address_ != cloud_address_) {
        Entry local;
        local.backend.address = local_address_;
        local.backend.role = BackendRole::Local;
        local.backend.enabled = true;
        entries_.push_back(std::move(local));
    }
}

std::string BackendRegistry::normalize_address(const std::string& address)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    std::string result = address;
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

BackendRegistry::Entry* BackendRegistry::find_entry_locked(const std::string& address)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.backend.address == address; });
    return it == entries_.end() ? nullptr : &*it;
}

const BackendRegistry::Entry* BackendRegistry::find_entry_locked(const std::string& address) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.backend.address == address; });
    return it == entries_.end() ? nullptr : &*it;
}

bool BackendRegistry::derive_membership_locked(const Entry& entry) const
{
    if (!entry.backend.enabled) {
        return false;
    }
    if (entry.backend.role == BackendRole::Cloud) {
        return cloud_authenticated_;
    }
    return entry.backend.health == HealthStatus::Online;
}

bool BackendRegistry::refresh_membership_locked(Entry& entry)
{
    const bool active = derive_membership_locked(entry);
    if (active == entry.active) {
        return false;
    }
    entry.active = active;

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("{} {} the active set", entry.backend.address,
                     active ? "joined" : "left");
    }
    return true;
}

void BackendRegistry::notify_membership_changed() const
{
    MembershipListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = membership_listener_;
    }
    if (listener) {
        listener();
    }
}

bool BackendRegistry::add(const std::string& address, const std::optional<std::string>& credential)
{
    const std::string normalized = normalize_address(address);
    if (normalized.empty()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (find_entry_locked(normalized)) {
            return false;
        }

        Entry entry;
        entry.backend.address = normalized;
        entry.backend.role = BackendRole::Custom;
        entry.backend.enabled = true;
        entry.backend.health = HealthStatus::Unchecked;
        if (credential && !credential->empty()) {
            entry.backend.credential = credential;
        }
        entries_.push_back(std::move(entry));
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Registered backend: {}", normalized);
    }
    return true;
}

bool BackendRegistry::remove(const std::string& address)
{
    const std::string normalized = normalize_address(address);
    bool was_active = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.backend.address == normalized; });
        if (it == entries_.end()) {
            return false;
        }
        if (it->backend.role != BackendRole::Custom) {
            if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
                logger->warn("Cannot remove fixed {} backend: {}", to_string(it->backend.role), normalized);
            }
            return false;
        }
        was_active = it->active;
        entries_.erase(it);
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Unregistered backend: {}", normalized);
    }
    if (was_active) {
        notify_membership_changed();
    }
    return true;
}

bool BackendRegistry::toggle(const std::string& address)
{
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = find_entry_locked(normalize_address(address));
        if (!entry) {
            return false;
        }
        entry->backend.enabled = !entry->backend.enabled;
        changed = refresh_membership_locked(*entry);
    }
    if (changed) {
        notify_membership_changed();
    }
    return true;
}

bool BackendRegistry::set_enabled(const std::string& address, bool enabled)
{
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = find_entry_locked(normalize_address(address));
        if (!entry) {
            return false;
        }
        entry->backend.enabled = enabled;
        changed = refresh_membership_locked(*entry);
    }
    if (changed) {
        notify_membership_changed();
    }
    return true;
}

bool BackendRegistry::set_credential(const std::string& address,
                                     const std::optional<std::string>& credential)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_entry_locked(normalize_address(address));
    if (!entry) {
        return false;
    }
    if (credential && !credential->empty()) {
        entry->backend.credential = credential;
    } else {
        entry->backend.credential.reset();
    }
    return true;
}

bool BackendRegistry::set_health(const std::string& address, HealthStatus status,
                                 const std::string& detail)
{
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = find_entry_locked(normalize_address(address));
        if (!entry) {
            return false;
        }
        entry->backend.health = status;
        entry->backend.detail = detail;
        changed = refresh_membership_locked(*entry);
    }
    if (changed) {
        notify_membership_changed();
    }
    return true;
}

void BackendRegistry::set_cloud_authenticated(bool authenticated)
{
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cloud_authenticated_ = authenticated;
        if (Entry* cloud = find_entry_locked(cloud_address_)) {
            changed = refresh_membership_locked(*cloud);
        }
    }
    if (changed) {
        notify_membership_changed();
    }
}

bool BackendRegistry::cloud_authenticated() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cloud_authenticated_;
}

std::vector<Backend> BackendRegistry::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Backend> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.backend);
    }
    return result;
}

std::vector<Backend> BackendRegistry::custom_backends() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Backend> result;
    for (const auto& entry : entries_) {
        if (entry.backend.role == BackendRole::Custom) {
            result.push_back(entry.backend);
        }
    }
    return result;
}

std::optional<Backend> BackendRegistry::find(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (const Entry* entry = find_entry_locked(normalize_address(address))) {
        return entry->backend;
    }
    return std::nullopt;
}

std::optional<BackendRole> BackendRegistry::role_of(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (const Entry* entry = find_entry_locked(normalize_address(address))) {
        return entry->backend.role;
    }
    return std::nullopt;
}

std::vector<std::string> BackendRegistry::active_addresses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.active) {
            result.push_back(entry.backend.address);
        }
    }
    return result;
}

bool BackendRegistry::is_active(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* entry = find_entry_locked(normalize_address(address));
    return entry && entry->active;
}

void BackendRegistry::set_membership_listener(MembershipListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    membership_listener_ = std::move(listener);
}
