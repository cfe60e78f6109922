/*
 * Small key-value persistence for hub state
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef KEY_VALUE_STORE_HPP
#define KEY_VALUE_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * String-to-string store. Values survive as long as the implementation
 * persists them; nothing stronger is promised.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

using KeyValueStorePtr = std::shared_ptr<IKeyValueStore>;

/**
 * Process-lifetime store
 */
class InMemoryStore : public IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
 * Store backed by a single JSON object on disk. The whole file is
 * rewritten on every change.
 */
class JsonFileStore : public IKeyValueStore {
public:
    explicit JsonFileStore(std::string path);

    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    const std::string& path() const { return path_; }

private:
    void load_locked();
    bool save_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

#endif // KEY_VALUE_STORE_HPP
