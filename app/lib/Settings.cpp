/*
 * Hub configuration implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Settings.hpp"
#include "HealthProber.hpp"
#include "Logger.hpp"
#include "ModelCatalog.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace {

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args)
{
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

int parse_int_or(const std::string& value, int fallback)
{
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return fallback;
}

} // namespace

Settings::Settings(std::string path)
    : config_path(path.empty() ? define_config_path() : std::move(path)),
      cloud_address(kDefaultCloudAddress),
      local_address(kDefaultLocalAddress),
      quota_url(kDefaultQuotaUrl),
      probe_timeout_ms(HealthProber::kDefaultProbeTimeoutMs),
      local_daemon_timeout_ms(HealthProber::kDefaultLocalDaemonTimeoutMs),
      catalog_timeout_ms(ModelCatalog::kDefaultFetchTimeoutMs),
      log_level("info")
{
    config_dir = std::filesystem::path(config_path).parent_path().string();

    try {
        if (!config_dir.empty() && !std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    state_file = (std::filesystem::path(config_dir) / "state.json").string();
}

std::string Settings::define_config_path()
{
    const std::string app_name = "InferenceHub";
    if (const char* override_root = std::getenv("INFERENCE_HUB_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / app_name / "config.ini").string();
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return std::string(app_data) + "\\" + app_name + "\\config.ini";
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + app_name + "/config.ini";
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + app_name + "/config.ini";
    }
#endif
    return "config.ini";
}

std::string Settings::get_config_dir() const
{
    return config_dir;
}

bool Settings::load()
{
    if (!std::filesystem::exists(config_path)) {
        settings_log(spdlog::level::info, "No config file at {}, using defaults", config_path);
        return false;
    }
    if (!config.load(config_path)) {
        return false;
    }

    cloud_address = config.getValue("backends", "cloud_address", cloud_address);
    local_address = config.getValue("backends", "local_address", local_address);
    quota_url = config.getValue("backends", "quota_url", quota_url);

    probe_timeout_ms = parse_int_or(config.getValue("network", "probe_timeout_ms"), probe_timeout_ms);
    local_daemon_timeout_ms = parse_int_or(config.getValue("network", "local_daemon_timeout_ms"),
                                           local_daemon_timeout_ms);
    catalog_timeout_ms = parse_int_or(config.getValue("network", "catalog_timeout_ms"), catalog_timeout_ms);

    state_file = config.getValue("storage", "state_file", state_file);
    log_level = config.getValue("logging", "level", log_level);
    return true;
}

bool Settings::save()
{
    config.setValue("backends", "cloud_address", cloud_address);
    config.setValue("backends", "local_address", local_address);
    config.setValue("backends", "quota_url", quota_url);
    config.setValue("network", "probe_timeout_ms", std::to_string(probe_timeout_ms));
    config.setValue("network", "local_daemon_timeout_ms", std::to_string(local_daemon_timeout_ms));
    config.setValue("network", "catalog_timeout_ms", std::to_string(catalog_timeout_ms));
    config.setValue("storage", "state_file", state_file);
    config.setValue("logging", "level", log_level);
    return config.save(config_path);
}

std::string Settings::get_cloud_address() const
{
    return env_or("INFERENCE_HUB_CLOUD_ADDRESS", cloud_address);
}

void Settings::set_cloud_address(const std::string& address)
{
    cloud_address = address;
}

std::string Settings::get_local_address() const
{
    return env_or("INFERENCE_HUB_LOCAL_ADDRESS", local_address);
}

void Settings::set_local_address(const std::string& address)
{
    local_address = address;
}

std::string Settings::get_quota_url() const
{
    return quota_url;
}

void Settings::set_quota_url(const std::string& url)
{
    quota_url = url;
}

int Settings::get_probe_timeout_ms() const
{
    return probe_timeout_ms;
}

void Settings::set_probe_timeout_ms(int value)
{
    probe_timeout_ms = value;
}

int Settings::get_local_daemon_timeout_ms() const
{
    return local_daemon_timeout_ms;
}

int Settings::get_catalog_timeout_ms() const
{
    return catalog_timeout_ms;
}

std::string Settings::get_state_file() const
{
    return state_file;
}

void Settings::set_state_file(const std::string& path)
{
    state_file = path;
}

std::string Settings::get_log_level() const
{
    return log_level;
}
