// Hydromat - Application Class

#include "application.h"

#include "../core/config/config.h"
#include "../core/database/database.h"
#include "../core/database/schema.h"
#include "../core/events/event_bus.h"
#include "../core/paths/app_paths.h"
#include "../core/security/access_control.h"
#include "../core/services/assignment_service.h"
#include "../core/services/profile_service.h"
#include "../core/services/size_service.h"
#include "../core/services/tool_service.h"
#include "../core/storage/document_store.h"
#include "../core/tools/head_layout.h"
#include "../core/utils/file_utils.h"
#include "../core/utils/log.h"

namespace hm {

Application::Application() = default;

Application::Application(AppOptions options) : m_options(std::move(options)) {}

Application::~Application() {
    shutdown();
}

bool Application::init() {
    if (m_initialized)
        return true;

    if (!paths::ensureDirectoriesExist()) {
        log::warning("App", "Could not create all application directories");
    }

    m_config = m_options.configPath.empty() ? std::make_unique<Config>()
                                            : std::make_unique<Config>(m_options.configPath);
    if (!m_config->load()) {
        log::warning("App", "Using default configuration");
    }
    setupLogging();

    Path dbPath =
        m_options.databasePath.empty() ? m_config->getDatabasePath() : m_options.databasePath;
    if (!file::createDirectories(dbPath.parent_path())) {
        log::errorf("App", "Cannot create database directory %s",
                    dbPath.parent_path().string().c_str());
        return false;
    }

    m_database = std::make_unique<Database>();
    if (!m_database->open(dbPath)) {
        log::errorf("App", "Failed to open database %s", dbPath.string().c_str());
        return false;
    }
    if (!Schema::initialize(*m_database)) {
        log::error("App", "Failed to initialize database schema");
        return false;
    }

    m_events = std::make_unique<EventBus>();
    m_access = std::make_unique<AccessController>(*m_config, *m_events);

    m_documents = std::make_unique<DocumentStore>(m_config->getDocumentsDir());
    int orphans = m_documents->cleanupOrphanedTempFiles();
    if (orphans > 0) {
        log::infof("App", "Removed %d interrupted document write(s)", orphans);
    }

    m_profileService = std::make_unique<ProfileService>(*m_database, *m_events, *m_documents);
    m_toolService = std::make_unique<ToolService>(*m_database, *m_events);
    m_assignmentService = std::make_unique<AssignmentService>(
        *m_database, *m_events, HeadLayout(m_config->getHeadNames()));
    m_sizeService = std::make_unique<SizeService>(*m_database);

    log::infof("App", "Database %s ready (schema v%d), mode: %s", dbPath.string().c_str(),
               Schema::getVersion(*m_database), m_access->modeText().c_str());

    m_initialized = true;
    return true;
}

void Application::shutdown() {
    if (!m_initialized)
        return;

    // Services reference the database; release them first
    m_sizeService.reset();
    m_assignmentService.reset();
    m_toolService.reset();
    m_profileService.reset();
    m_documents.reset();
    m_access.reset();
    m_events.reset();

    if (m_database) {
        m_database->close();
        m_database.reset();
    }

    log::closeLogFile();
    m_initialized = false;
}

Permissions Application::permissions() const {
    return m_access ? m_access->permissions() : Permissions::readOnly();
}

ProfileDraft Application::newProfileDraft(const std::string& name) const {
    ProfileDraft draft;
    draft.name = name;
    draft.feedRate = m_config->getDefaultFeedRate();
    return draft;
}

ToolDraft Application::newToolDraft(i64 profileId) const {
    ToolDraft draft;
    draft.profileId = profileId;
    draft.knivesCount = m_config->getDefaultKnivesCount();
    draft.setNumber = m_config->getDefaultSetNumber();
    return draft;
}

bool Application::logJob(i64 profileId, const std::string& action) {
    return m_assignmentService->writeJobLog(paths::getJobLogDir(), profileId, action).has_value();
}

void Application::setupLogging() {
    auto level = m_options.verbose ? log::Level::Debug : log::levelFromInt(m_config->getLogLevel());
    log::setLevel(level);

    if (m_config->getLogToFile()) {
        Path logPath = m_config->getLogFilePath();
        if (!file::createDirectories(logPath.parent_path()) ||
            !log::setLogFile(logPath.string())) {
            log::warningf("App", "Cannot log to %s, console only", logPath.string().c_str());
        }
    }
}

} // namespace hm
