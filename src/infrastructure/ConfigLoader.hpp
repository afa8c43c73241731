/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the host configuration (settings.json).
 *
 * Provides a unified way to access storage, state and scheduling settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <chrono>

namespace chartkeeper::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective configuration of the host process.
 */
struct AppConfig {
    std::string storagePath;                                 ///< Artifact storage root.
    std::string storageHostname = "http://localhost:9090";   ///< Public base URL of the storage root.
    std::string stateDir;                                    ///< Resource documents.
    std::string secretsDir;                                  ///< Secret documents.
    int concurrency = 2;                                     ///< Reconcile workers.
    std::chrono::seconds defaultInterval{600};
    std::chrono::seconds defaultTimeout{60};
    std::chrono::seconds retryInterval{30};
    bool serveArtifacts = false;
    std::string listenAddress = "0.0.0.0";
    int listenPort = 9090;
};

class ConfigLoader {
public:
    /**
     * @brief Configuration with every directory under the XDG homes.
     */
    static AppConfig Defaults();

    /**
     * @brief Reads settings.json on top of the defaults.
     *
     * Missing keys keep their default value. A missing or malformed file is
     * reported on stderr and yields the defaults.
     * @param configPath Path to settings.json.
     */
    static AppConfig Load(const std::string& configPath);

    /**
     * @brief Writes the configuration to settings.json, preserving unknown keys if possible.
     * @return false if the file could not be written.
     */
    static bool Save(const std::string& configPath, const AppConfig& config);
};

} // namespace chartkeeper::infrastructure
