/*
 * Key-value store implementations
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "KeyValueStore.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

std::optional<std::string> InMemoryStore::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryStore::set(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

bool InMemoryStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

JsonFileStore::JsonFileStore(std::string path)
    : path_(std::move(path))
{
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
}

void JsonFileStore::load_locked()
{
    std::ifstream file(path_);
    if (!file.is_open()) {
        return;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(reader_builder, file, &root, &errors) || !root.isObject()) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->error("Ignoring unreadable state file {}: {}", path_, errors);
        }
        return;
    }

    for (const auto& key : root.getMemberNames()) {
        if (root[key].isString()) {
            values_[key] = root[key].asString();
        }
    }
}

bool JsonFileStore::save_locked() const
{
    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    Json::Value root(Json::objectValue);
    for (const auto& [key, value] : values_) {
        root[key] = value;
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->error("Failed to open state file for writing: {}", path_);
        }
        return false;
    }

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "  ";
    file << Json::writeString(writer_builder, root) << "\n";
    return static_cast<bool>(file);
}

std::optional<std::string> JsonFileStore::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonFileStore::set(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return save_locked();
}

bool JsonFileStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (values_.erase(key) == 0) {
        return false;
    }
    return save_locked();
}
