// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace chartkeeper::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    static std::filesystem::path GetDefaultConfigFile();
};

} // namespace chartkeeper::infrastructure
