#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace hm {

// Edit capability of the session
enum class AccessMode : int {
    ReadOnly = 0,
    FullAccess = 1,
};

// "read_only" / "full_access"
const char* accessModeToString(AccessMode mode);
std::optional<AccessMode> parseAccessMode(std::string_view text);

// Application configuration, persisted as JSON (config.json in the config directory).
// Owned by the application; nothing reads it through a global.
class Config {
  public:
    Config();
    explicit Config(Path filePath);

    // Load/save configuration.
    // A missing file keeps the defaults and succeeds; an unreadable or malformed
    // file logs an error, keeps the defaults and returns false.
    bool load();
    bool save() const;

    // JSON text form (used by load/save)
    std::string toJsonString() const;
    bool fromJsonString(const std::string& text);

    const Path& filePath() const { return m_filePath; }

    // [security]
    AccessMode getAccessMode() const { return m_accessMode; }
    void setAccessMode(AccessMode mode) { m_accessMode = mode; }

    // [database] empty means the default under the data directory
    Path getDatabasePath() const;
    void setDatabasePath(const Path& path) { m_databasePath = path; }

    // [documents] profile PDF directory, empty means default
    Path getDocumentsDir() const;
    void setDocumentsDir(const Path& path) { m_documentsDir = path; }

    // [tools] defaults offered for new profiles and tools
    f64 getDefaultFeedRate() const { return m_defaultFeedRate; }
    void setDefaultFeedRate(f64 rate) { m_defaultFeedRate = rate; }

    int getDefaultKnivesCount() const { return m_defaultKnivesCount; }
    void setDefaultKnivesCount(int count) { m_defaultKnivesCount = count; }

    int getDefaultSetNumber() const { return m_defaultSetNumber; }
    void setDefaultSetNumber(int number) { m_defaultSetNumber = number; }

    // [heads] operator labels for heads 1..10
    const std::vector<std::string>& getHeadNames() const { return m_headNames; }
    void setHeadName(int head, const std::string& name);

    // [logging] level maps to log::Level (0=Debug .. 3=Error)
    int getLogLevel() const { return m_logLevel; }
    void setLogLevel(int level) { m_logLevel = level; }

    bool getLogToFile() const { return m_logToFile; }
    void setLogToFile(bool v) { m_logToFile = v; }

    // Empty means the default log path
    Path getLogFilePath() const;
    void setLogFilePath(const Path& p) { m_logFilePath = p; }

  private:
    Path m_filePath;

    AccessMode m_accessMode = AccessMode::ReadOnly;
    Path m_databasePath;
    Path m_documentsDir;

    f64 m_defaultFeedRate = 30.0;
    int m_defaultKnivesCount = 6;
    int m_defaultSetNumber = 1;

    std::vector<std::string> m_headNames;

    int m_logLevel = 1; // Info
    bool m_logToFile = false;
    Path m_logFilePath;
};

} // namespace hm
