/*
 * Value types shared by the registry, catalog and router
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BACKEND_TYPES_HPP
#define BACKEND_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * Role a backend plays in the hub. All roles speak the same protocol.
 */
enum class BackendRole {
    Cloud,      // the single metered cloud service
    Local,      // the single local daemon
    Custom,     // user-added endpoint
};

/**
 * Last-known health of a backend
 */
enum class HealthStatus {
    Unchecked,  // never probed
    Online,     // last probe answered with 2xx
    Offline,    // last probe failed
};

/**
 * Connectivity derived from all backends combined
 */
enum class ConnectivityStatus {
    Unchecked,
    Online,
    Offline,
};

/**
 * An OpenAI-compatible endpoint known to the registry
 */
struct Backend {
    std::string address;                     // unique key, base URL
    std::optional<std::string> credential;   // bearer token
    bool enabled{true};
    HealthStatus health{HealthStatus::Unchecked};
    BackendRole role{BackendRole::Custom};
    std::string detail;                      // message from the last probe
};

/**
 * A model advertised by a backend. Names are unique within one backend only.
 */
struct Model {
    std::string name;
    std::string server;                      // owning backend address
    bool multimodal{false};
    bool pro{false};
    std::optional<std::string> parameter_size;

    bool operator==(const Model& other) const
    {
        return name == other.name && server == other.server &&
               multimodal == other.multimodal && pro == other.pro &&
               parameter_size == other.parameter_size;
    }
    bool operator!=(const Model& other) const { return !(*this == other); }
};

using ModelList = std::vector<Model>;

inline const char* to_string(HealthStatus status)
{
    switch (status) {
        case HealthStatus::Online: return "online";
        case HealthStatus::Offline: return "offline";
        case HealthStatus::Unchecked: break;
    }
    return "unchecked";
}

inline const char* to_string(BackendRole role)
{
    switch (role) {
        case BackendRole::Cloud: return "cloud";
        case BackendRole::Local: return "local";
        case BackendRole::Custom: break;
    }
    return "custom";
}

inline const char* to_string(ConnectivityStatus status)
{
    switch (status) {
        case ConnectivityStatus::Online: return "online";
        case ConnectivityStatus::Offline: return "offline";
        case ConnectivityStatus::Unchecked: break;
    }
    return "unchecked";
}

#endif // BACKEND_TYPES_HPP
