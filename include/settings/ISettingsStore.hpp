#pragma once
#include <optional>
#include <string>

// Persistent key/value settings for this installation.
// Implementations must be safe to call from any thread.
class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;

    // API keys live in their own section and are never logged
    virtual std::optional<std::string> apiKey(const std::string& keyName) const = 0;
    virtual bool setApiKey(const std::string& keyName, const std::string& value) = 0;

    // Random id created on first use and kept for the life of the install.
    // Feeds the token validator as the file identity.
    virtual std::string installationId() = 0;
};
