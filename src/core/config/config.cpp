#include "config.h"

#include <nlohmann/json.hpp>

#include "../paths/app_paths.h"
#include "../tools/head_layout.h"
#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace hm {

namespace {

using json = nlohmann::json;

// Typed readers: a key of the wrong type is reported and the current value kept

void readString(const json& section, const char* key, std::string& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& v = section[key];
    if (v.is_string()) {
        out = v.get<std::string>();
    } else {
        log::warningf("Config", "Ignoring '%s': expected a string", key);
    }
}

void readPath(const json& section, const char* key, Path& out) {
    std::string text = out.string();
    readString(section, key, text);
    out = Path(text);
}

void readInt(const json& section, const char* key, int& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& v = section[key];
    if (v.is_number_integer()) {
        out = v.get<int>();
    } else {
        log::warningf("Config", "Ignoring '%s': expected an integer", key);
    }
}

void readDouble(const json& section, const char* key, f64& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& v = section[key];
    if (v.is_number()) {
        out = v.get<f64>();
    } else {
        log::warningf("Config", "Ignoring '%s': expected a number", key);
    }
}

void readBool(const json& section, const char* key, bool& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& v = section[key];
    if (v.is_boolean()) {
        out = v.get<bool>();
    } else {
        log::warningf("Config", "Ignoring '%s': expected true/false", key);
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    if (root.contains(name) && root[name].is_object()) {
        return root[name];
    }
    return empty;
}

} // namespace

const char* accessModeToString(AccessMode mode) {
    return mode == AccessMode::FullAccess ? "full_access" : "read_only";
}

std::optional<AccessMode> parseAccessMode(std::string_view text) {
    if (text == "read_only") {
        return AccessMode::ReadOnly;
    }
    if (text == "full_access") {
        return AccessMode::FullAccess;
    }
    return std::nullopt;
}

Config::Config() : Config(paths::getConfigFilePath()) {}

Config::Config(Path filePath)
    : m_filePath(std::move(filePath)), m_headNames(HeadLayout::defaultHeadNames()) {}

Path Config::getDatabasePath() const {
    return m_databasePath.empty() ? paths::getDatabasePath() : m_databasePath;
}

Path Config::getDocumentsDir() const {
    return m_documentsDir.empty() ? paths::getDocumentsDir() : m_documentsDir;
}

Path Config::getLogFilePath() const {
    return m_logFilePath.empty() ? paths::getLogPath() : m_logFilePath;
}

void Config::setHeadName(int head, const std::string& name) {
    if (HeadLayout::isValidHead(head) && !name.empty()) {
        m_headNames[static_cast<usize>(head - 1)] = name;
    }
}

bool Config::load() {
    if (!file::exists(m_filePath)) {
        log::info("Config", "No config file found, using defaults");
        return true;
    }

    auto content = file::readText(m_filePath);
    if (!content) {
        log::error("Config", "Failed to read config file");
        return false;
    }

    if (!fromJsonString(*content)) {
        log::errorf("Config", "Malformed config file %s, using defaults",
                    m_filePath.string().c_str());
        return false;
    }

    log::infof("Config", "Loaded %s", m_filePath.string().c_str());
    return true;
}

bool Config::save() const {
    if (!file::createDirectories(m_filePath.parent_path())) {
        log::error("Config", "Failed to create config directory");
        return false;
    }

    if (!file::writeText(m_filePath, toJsonString())) {
        log::errorf("Config", "Failed to write %s", m_filePath.string().c_str());
        return false;
    }

    log::debugf("Config", "Saved %s", m_filePath.string().c_str());
    return true;
}

std::string Config::toJsonString() const {
    json names = json::object();
    for (usize i = 0; i < m_headNames.size(); ++i) {
        names[std::to_string(i + 1)] = m_headNames[i];
    }

    json j{
        {"security", {{"mode", accessModeToString(m_accessMode)}}},
        {"database", {{"path", m_databasePath.string()}}},
        {"documents", {{"dir", m_documentsDir.string()}}},
        {"tools",
         {
             {"default_feed_rate", m_defaultFeedRate},
             {"default_knives_count", m_defaultKnivesCount},
             {"default_set_number", m_defaultSetNumber},
         }},
        {"heads", {{"names", names}}},
        {"logging",
         {
             {"level", m_logLevel},
             {"to_file", m_logToFile},
             {"file", m_logFilePath.string()},
         }},
    };
    return j.dump(2);
}

bool Config::fromJsonString(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    // Parse into a copy so a rejected file leaves this instance untouched
    Config parsed(m_filePath);

    const auto& security = sectionOf(j, "security");
    std::string mode = accessModeToString(parsed.m_accessMode);
    readString(security, "mode", mode);
    if (auto m = parseAccessMode(mode)) {
        parsed.m_accessMode = *m;
    } else {
        log::warningf("Config", "Unknown security mode '%s', using read_only", mode.c_str());
    }

    readPath(sectionOf(j, "database"), "path", parsed.m_databasePath);
    readPath(sectionOf(j, "documents"), "dir", parsed.m_documentsDir);

    const auto& tools = sectionOf(j, "tools");
    readDouble(tools, "default_feed_rate", parsed.m_defaultFeedRate);
    readInt(tools, "default_knives_count", parsed.m_defaultKnivesCount);
    readInt(tools, "default_set_number", parsed.m_defaultSetNumber);

    const auto& heads = sectionOf(j, "heads");
    const auto& names = sectionOf(heads, "names");
    for (int head = 1; head <= HeadLayout::HEAD_COUNT; ++head) {
        std::string name;
        readString(names, std::to_string(head).c_str(), name);
        parsed.setHeadName(head, name);
    }

    const auto& logging = sectionOf(j, "logging");
    readInt(logging, "level", parsed.m_logLevel);
    readBool(logging, "to_file", parsed.m_logToFile);
    readPath(logging, "file", parsed.m_logFilePath);

    *this = std::move(parsed);
    return true;
}

} // namespace hm
