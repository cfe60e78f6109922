/*
 * Hub configuration loaded from config.ini
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "IniConfig.hpp"
#include <string>

class Settings
{
public:
    static constexpr const char* kDefaultCloudAddress = "https://api.observer-ai.com:443";
    static constexpr const char* kDefaultLocalAddress = "http://localhost:3838";
    static constexpr const char* kDefaultQuotaUrl = "https://api.observer-ai.com/quota";

    /**
     * @param config_path Explicit config.ini path; empty uses define_config_path()
     */
    explicit Settings(std::string config_path = "");

    bool load();
    bool save();

    std::string get_cloud_address() const;
    void set_cloud_address(const std::string& address);

    std::string get_local_address() const;
    void set_local_address(const std::string& address);

    std::string get_quota_url() const;
    void set_quota_url(const std::string& url);

    int get_probe_timeout_ms() const;
    void set_probe_timeout_ms(int value);

    int get_local_daemon_timeout_ms() const;
    int get_catalog_timeout_ms() const;

    /**
     * JSON file holding custom backends and the cached quota figure.
     */
    std::string get_state_file() const;
    void set_state_file(const std::string& path);

    std::string get_log_level() const;

    static std::string define_config_path();
    std::string get_config_dir() const;
    const std::string& get_config_path() const { return config_path; }

private:
    std::string config_path;
    std::string config_dir;
    IniConfig config;

    std::string cloud_address;
    std::string local_address;
    std::string quota_url;
    int probe_timeout_ms;
    int local_daemon_timeout_ms;
    int catalog_timeout_ms;
    std::string state_file;
    std::string log_level;
};

#endif // SETTINGS_HPP
