#pragma once

// Hydromat - Application Class
// Owns configuration, the database connection, the event bus and the
// services built on them. Front ends (the CLI, a GUI host) drive it.

#include <memory>
#include <string>

#include "../core/types.h"

namespace hm {

class Config;
class Database;
class EventBus;
class AccessController;
class DocumentStore;
class ProfileService;
class ToolService;
class AssignmentService;
class SizeService;
struct Permissions;
struct ProfileDraft;
struct ToolDraft;

// Overrides applied on top of the configuration file
struct AppOptions {
    Path configPath;   // empty: <config dir>/config.json
    Path databasePath; // empty: from configuration
    bool verbose = false;
};

class Application {
  public:
    Application();
    explicit Application(AppOptions options);
    ~Application();

    // Disable copy
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Disable move (services hold references into the application)
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    // Load configuration, set up logging, open and migrate the database
    bool init();
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    Config& config() { return *m_config; }
    Database& database() { return *m_database; }
    EventBus& events() { return *m_events; }
    AccessController& access() { return *m_access; }
    DocumentStore& documents() { return *m_documents; }
    ProfileService& profiles() { return *m_profileService; }
    ToolService& tools() { return *m_toolService; }
    AssignmentService& assignments() { return *m_assignmentService; }
    SizeService& sizes() { return *m_sizeService; }

    // Current edit rights, to pass into mutating service calls
    Permissions permissions() const;

    // Drafts pre-filled with the configured defaults for new records
    ProfileDraft newProfileDraft(const std::string& name) const;
    ToolDraft newToolDraft(i64 profileId) const;

    // Append the profile's head setup to the job log directory
    bool logJob(i64 profileId, const std::string& action);

  private:
    void setupLogging();

    AppOptions m_options;
    bool m_initialized = false;

    std::unique_ptr<Config> m_config;
    std::unique_ptr<Database> m_database;
    std::unique_ptr<EventBus> m_events;
    std::unique_ptr<AccessController> m_access;
    std::unique_ptr<DocumentStore> m_documents;

    std::unique_ptr<ProfileService> m_profileService;
    std::unique_ptr<ToolService> m_toolService;
    std::unique_ptr<AssignmentService> m_assignmentService;
    std::unique_ptr<SizeService> m_sizeService;
};

} // namespace hm
