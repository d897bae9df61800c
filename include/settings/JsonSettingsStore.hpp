#pragma once
#include "ISettingsStore.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

// Settings kept in one JSON document on disk:
//   { "installation_id": "...", "settings": {...}, "api_keys": {...} }
// Every change is written to <path>.tmp and renamed over the file; a
// change that cannot be saved leaves the in-memory state untouched.
class JsonSettingsStore : public ISettingsStore {
public:
    explicit JsonSettingsStore(std::string path);

    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;

    std::optional<std::string> apiKey(const std::string& keyName) const override;
    bool setApiKey(const std::string& keyName, const std::string& value) override;

    std::string installationId() override;

    const std::string& path() const { return path_; }

private:
    void loadLocked();
    // Writes next to disk and adopts it only if the write succeeded
    bool commitLocked(nlohmann::json next);
    bool writeLocked(const nlohmann::json& doc);
    static std::string randomHexId(size_t bytes);

    std::string        path_;
    nlohmann::json     doc_;
    mutable std::mutex mtx_;
};
