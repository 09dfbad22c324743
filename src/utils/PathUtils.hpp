#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace takeout::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) / "TakeoutImporter" : fs::current_path() / "TakeoutImporter";
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" / "TakeoutImporter"
                    : fs::current_path() / "TakeoutImporter";
#else
        const char* configHome = std::getenv("XDG_CONFIG_HOME");
        if (configHome && *configHome) {
            return fs::path(configHome) / "takeout-importer";
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".config" / "takeout-importer" : fs::current_path() / "takeout-importer";
#endif
    }

    static fs::path getConfigPath(const fs::path& dataDir) {
        return dataDir / "config.json";
    }

    static fs::path getStatePath(const fs::path& dataDir) {
        return dataDir / "state.json";
    }

    static fs::path getDownloadsPath(const fs::path& dataDir) {
        return dataDir / "downloads";
    }

    static fs::path getLogsPath(const fs::path& dataDir) {
        return dataDir / "logs";
    }

    static fs::path getLockPath(const fs::path& dataDir) {
        return dataDir / ".lock";
    }
};

} // namespace takeout::utils
