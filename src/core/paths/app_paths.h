#pragma once

#include "../types.h"

namespace hm {
namespace paths {

// Application directories (XDG Base Directory layout)
// Config: $XDG_CONFIG_HOME/hydromat or ~/.config/hydromat
// Data:   $XDG_DATA_HOME/hydromat   or ~/.local/share/hydromat

// Configuration directory (config.json)
Path getConfigDir();

// Configuration file path
Path getConfigFilePath();

// Data directory (database, documents, logs)
Path getDataDir();

// Default database file path
Path getDatabasePath();

// Default directory for profile PDF documents
Path getDocumentsDir();

// Directory for job configuration sheets
Path getJobLogDir();

// Log file path
Path getLogPath();

// Ensure all application directories exist
bool ensureDirectoriesExist();

// Get application name (used in paths)
const char* getAppName();

} // namespace paths
} // namespace hm
