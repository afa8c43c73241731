/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace chartkeeper::infrastructure {

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.storagePath = (PathUtils::GetCacheHome() / "chartkeeper" / "artifacts").string();
    config.stateDir = (PathUtils::GetDataHome() / "chartkeeper" / "resources").string();
    config.secretsDir = (PathUtils::GetConfigHome() / "chartkeeper" / "secrets").string();
    return config;
}

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config = Defaults();
    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[ConfigLoader] " << configPath << " not found, using defaults" << std::endl;
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.storagePath = j.value("storagePath", config.storagePath);
        config.storageHostname = j.value("storageHostname", config.storageHostname);
        config.stateDir = j.value("stateDir", config.stateDir);
        config.secretsDir = j.value("secretsDir", config.secretsDir);
        config.concurrency = j.value("concurrency", config.concurrency);
        config.defaultInterval = std::chrono::seconds(j.value("defaultInterval", config.defaultInterval.count()));
        config.defaultTimeout = std::chrono::seconds(j.value("defaultTimeout", config.defaultTimeout.count()));
        config.retryInterval = std::chrono::seconds(j.value("retryInterval", config.retryInterval.count()));
        config.serveArtifacts = j.value("serveArtifacts", config.serveArtifacts);
        config.listenAddress = j.value("listenAddress", config.listenAddress);
        config.listenPort = j.value("listenPort", config.listenPort);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return Defaults();
    }

    if (config.concurrency < 1) config.concurrency = 1;
    return config;
}

bool ConfigLoader::Save(const std::string& configPath, const AppConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Keep keys written by other tools.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["storagePath"] = config.storagePath;
    j["storageHostname"] = config.storageHostname;
    j["stateDir"] = config.stateDir;
    j["secretsDir"] = config.secretsDir;
    j["concurrency"] = config.concurrency;
    j["defaultInterval"] = config.defaultInterval.count();
    j["defaultTimeout"] = config.defaultTimeout.count();
    j["retryInterval"] = config.retryInterval.count();
    j["serveArtifacts"] = config.serveArtifacts;
    j["listenAddress"] = config.listenAddress;
    j["listenPort"] = config.listenPort;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return f.good();
}

} // namespace chartkeeper::infrastructure
