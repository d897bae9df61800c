#include "settings/JsonSettingsStore.hpp"
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

JsonSettingsStore::JsonSettingsStore(std::string path)
    : path_(std::move(path))
{
    std::lock_guard lock(mtx_);
    loadLocked();
}

// ── Persistence ──────────────────────────────────────────────────────────

void JsonSettingsStore::loadLocked() {
    doc_ = nlohmann::json::object();

    std::ifstream f(path_);
    if (!f.is_open()) {
        spdlog::info("Settings: {} not found, starting empty", path_);
        return;
    }

    try {
        f >> doc_;
        if (!doc_.is_object()) {
            spdlog::warn("Settings: {} is not a JSON object, ignoring it", path_);
            doc_ = nlohmann::json::object();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Settings: failed to parse {}: {}", path_, e.what());
        doc_ = nlohmann::json::object();
    }
}

bool JsonSettingsStore::commitLocked(nlohmann::json next) {
    if (!writeLocked(next)) return false;
    doc_ = std::move(next);
    return true;
}

bool JsonSettingsStore::writeLocked(const nlohmann::json& doc) {
    const std::string tmp = path_ + ".tmp";

    try {
        fs::path dir = fs::path(path_).parent_path();
        if (!dir.empty()) fs::create_directories(dir);

        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                spdlog::error("Settings: cannot write {}", tmp);
                return false;
            }
            out << doc.dump(2);
            if (!out.good()) {
                spdlog::error("Settings: write to {} failed", tmp);
                return false;
            }
        }

        fs::rename(tmp, path_);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("Settings: saving {} failed: {}", path_, e.what());
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    } catch (const nlohmann::json::exception& e) {
        // dump() rejects strings that are not valid UTF-8
        spdlog::error("Settings: cannot serialise {}: {}", path_, e.what());
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

// ── Values ───────────────────────────────────────────────────────────────

std::optional<std::string> JsonSettingsStore::get(const std::string& key) const {
    std::lock_guard lock(mtx_);
    auto it = doc_.find("settings");
    if (it == doc_.end() || !it->is_object()) return std::nullopt;
    auto v = it->find(key);
    if (v == it->end() || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

bool JsonSettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mtx_);
    auto next = doc_;
    next["settings"][key] = value;
    return commitLocked(std::move(next));
}

std::optional<std::string> JsonSettingsStore::apiKey(const std::string& keyName) const {
    std::lock_guard lock(mtx_);
    auto it = doc_.find("api_keys");
    if (it == doc_.end() || !it->is_object()) return std::nullopt;
    auto v = it->find(keyName);
    if (v == it->end() || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

bool JsonSettingsStore::setApiKey(const std::string& keyName,
                                  const std::string& value) {
    std::lock_guard lock(mtx_);
    auto next = doc_;
    next["api_keys"][keyName] = value;
    bool ok = commitLocked(std::move(next));
    if (ok) spdlog::info("Settings: stored {}", keyName);
    return ok;
}

std::string JsonSettingsStore::installationId() {
    std::lock_guard lock(mtx_);

    auto it = doc_.find("installation_id");
    if (it != doc_.end() && it->is_string() && !it->get<std::string>().empty())
        return it->get<std::string>();

    // Kept for the life of the process even when it cannot be persisted,
    // so the token stays stable until restart.
    std::string id = randomHexId(16);
    auto next = doc_;
    next["installation_id"] = id;
    if (commitLocked(next)) {
        spdlog::info("Settings: created installation id");
    } else {
        spdlog::warn("Settings: installation id not persisted, tokens will "
                     "change on restart");
        doc_ = std::move(next);
    }
    return id;
}

std::string JsonSettingsStore::randomHexId(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
        throw std::runtime_error("RAND_bytes failed generating installation id");

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (unsigned char b : buf) {
        out += hex[b >> 4];
        out += hex[b & 0x0f];
    }
    return out;
}
