/*
 * Registry of inference backends and the active address set
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BACKEND_REGISTRY_HPP
#define BACKEND_REGISTRY_HPP

#include "BackendTypes.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Holds every known backend in registration order.
 *
 * The registry performs no I/O. Each backend is either part of the active
 * address set (eligible for discovery and routing) or not:
 * - cloud: enabled and the caller is authenticated
 * - local/custom: enabled and the last health check said online
 *
 * Whenever a mutation changes the active set, the membership listener is
 * called after the registry lock has been released.
 */
class BackendRegistry {
public:
    using MembershipListener = std::function<void()>;

    /**
     * Construct with the two fixed backends. The local daemon starts
     * enabled, the cloud backend starts disabled.
     * @param cloud_address Base URL of the metered cloud backend
     * @param local_address Base URL of the local daemon
     */
    BackendRegistry(const std::string& cloud_address, const std::string& local_address);

    /**
     * Add a custom backend (enabled, unchecked).
     * @return false if the address is empty or already registered
     */
    bool add(const std::string& address,
             const std::optional<std::string>& credential = std::nullopt);

    /**
     * Remove a custom backend and retract it from the active set.
     * @return false if unknown or one of the fixed backends
     */
    bool remove(const std::string& address);

    /**
     * Flip the enabled flag and re-derive active-set membership.
     */
    bool toggle(const std::string& address);

    bool set_enabled(const std::string& address, bool enabled);

    /**
     * Replace the stored credential; an empty string clears it.
     */
    bool set_credential(const std::string& address, const std::optional<std::string>& credential);

    /**
     * Record a health verdict and re-derive active-set membership.
     */
    bool set_health(const std::string& address, HealthStatus status,
                    const std::string& detail = "");

    void set_cloud_authenticated(bool authenticated);
    bool cloud_authenticated() const;

    std::vector<Backend> list() const;
    std::vector<Backend> custom_backends() const;
    std::optional<Backend> find(const std::string& address) const;
    std::optional<BackendRole> role_of(const std::string& address) const;

    /**
     * Active addresses in registration order.
     */
    std::vector<std::string> active_addresses() const;
    bool is_active(const std::string& address) const;

    const std::string& cloud_address() const { return cloud_address_; }
    const std::string& local_address() const { return local_address_; }

    void set_membership_listener(MembershipListener listener);

    /**
     * Trim whitespace and trailing slashes.
     */
    static std::string normalize_address(const std::string& address);

private:
    struct Entry {
        Backend backend;
        bool active{false};
    };

    Entry* find_entry_locked(const std::string& address);
    const Entry* find_entry_locked(const std::string& address) const;
    bool derive_membership_locked(const Entry& entry) const;
    bool refresh_membership_locked(Entry& entry);
    void notify_membership_changed() const;

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::string cloud_address_;
    std::string local_address_;
    bool cloud_authenticated_{false};
    MembershipListener membership_listener_;
};

#endif // BACKEND_REGISTRY_HPP
