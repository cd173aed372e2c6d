#pragma once

#include "ports/ISharingStateStore.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace geoshare {

/**
 * @brief Keeps the sharing choice in a small JSON file next to the client.
 *
 * The file holds {"userId": "...", "sharingEnabled": true}. Writes go to a
 * temporary file that replaces the old one, so a crash never leaves half a record.
 */
class FileSharingStateStore : public ports::ISharingStateStore {
public:
    explicit FileSharingStateStore(std::string path) : path_(std::move(path)) {}

    std::optional<ports::PersistedSharingState> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream file(path_);
        if (!file.is_open()) {
            return std::nullopt;
        }

        try {
            auto json = nlohmann::json::parse(file);
            if (!json.is_object() || !json.contains("userId") || !json["userId"].is_string() ||
                !json.contains("sharingEnabled") || !json["sharingEnabled"].is_boolean()) {
                std::cerr << "[State] Ignoring unrecognised state file " << path_ << std::endl;
                return std::nullopt;
            }

            ports::PersistedSharingState state;
            state.userId = json["userId"].get<std::string>();
            state.sharingEnabled = json["sharingEnabled"].get<bool>();
            return state;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[State] Could not parse " << path_ << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    bool save(const ports::PersistedSharingState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json json;
        json["userId"] = state.userId;
        json["sharingEnabled"] = state.sharingEnabled;

        std::string temporary = path_ + ".tmp";
        {
            std::ofstream file(temporary, std::ios::trunc);
            if (!file.is_open()) {
                std::cerr << "[State] Could not write " << temporary << std::endl;
                return false;
            }
            file << json.dump(2) << std::endl;
            if (!file) {
                std::cerr << "[State] Could not write " << temporary << std::endl;
                return false;
            }
        }

        if (std::rename(temporary.c_str(), path_.c_str()) != 0) {
            std::cerr << "[State] Could not replace " << path_ << std::endl;
            std::remove(temporary.c_str());
            return false;
        }
        return true;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace geoshare
