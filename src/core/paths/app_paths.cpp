#include "app_paths.h"

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace hm {
namespace paths {

namespace {

const char* APP_NAME = "hydromat";

Path getHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return Path(home);
    }
    // Fallback: look up home dir from passwd entry
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return Path(pw->pw_dir);
    }
    log::error("Paths", "Cannot determine home directory: $HOME unset and getpwuid failed");
    return fs::temp_directory_path();
}

} // namespace

const char* getAppName() {
    return APP_NAME;
}

Path getConfigDir() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return Path(xdgConfig) / APP_NAME;
    }
    return getHomeDir() / ".config" / APP_NAME;
}

Path getConfigFilePath() {
    return getConfigDir() / "config.json";
}

Path getDataDir() {
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && xdgData[0] != '\0') {
        return Path(xdgData) / APP_NAME;
    }
    return getHomeDir() / ".local" / "share" / APP_NAME;
}

Path getDatabasePath() {
    return getDataDir() / "hydromat_tools.db";
}

Path getDocumentsDir() {
    return getDataDir() / "pdfs";
}

Path getJobLogDir() {
    return getDataDir() / "logs";
}

Path getLogPath() {
    return getJobLogDir() / "hydromat.log";
}

bool ensureDirectoriesExist() {
    bool success = true;

    auto ensureDir = [&success](const Path& path, const char* name) {
        if (!file::createDirectories(path)) {
            log::errorf("Paths", "Failed to create %s directory: %s", name, path.string().c_str());
            success = false;
        } else {
            log::debugf("Paths", "Ensured %s directory: %s", name, path.string().c_str());
        }
    };

    ensureDir(getConfigDir(), "config");
    ensureDir(getDataDir(), "data");
    ensureDir(getDocumentsDir(), "documents");
    ensureDir(getJobLogDir(), "log");

    return success;
}

} // namespace paths
} // namespace hm
