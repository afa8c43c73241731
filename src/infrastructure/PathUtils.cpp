#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace chartkeeper::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgHome(const char* variable, const fs::path& fallbackUnderHome) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / fallbackUnderHome;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgHome("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgHome("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgHome("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / "chartkeeper" / "settings.json";
}

} // namespace chartkeeper::infrastructure
