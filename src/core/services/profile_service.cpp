#include "profile_service.h"

#include "../events/event_bus.h"
#include "../events/event_types.h"
#include "../storage/document_store.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {

ProfileService::ProfileService(Database& db, EventBus& events, DocumentStore& documents)
    : m_db(db), m_events(events), m_documents(documents), m_profiles(db), m_tools(db),
      m_sizes(db) {}

ServiceResult ProfileService::validateName(std::string_view name, i64 selfId) {
    if (name.empty()) {
        return ServiceResult::fail(ServiceError::Validation, "Profile name must not be empty");
    }
    auto existing = m_profiles.findByName(name);
    if (existing && existing->id != selfId) {
        return ServiceResult::fail(ServiceError::Validation,
                                   "Profile '" + std::string(name) + "' already exists");
    }
    return ServiceResult::ok();
}

CreateResult ProfileService::createProfile(const Permissions& perms, const ProfileDraft& draft) {
    if (!perms.canEdit) {
        return CreateResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    std::string name = str::trim(draft.name);
    auto nameCheck = validateName(name, 0);
    if (!nameCheck.success) {
        return CreateResult::fail(nameCheck.errorCode, nameCheck.error);
    }
    if (draft.feedRate <= 0.0) {
        return CreateResult::fail(ServiceError::Validation,
                                  "Feed rate must be positive, got " +
                                      str::formatDecimal(draft.feedRate));
    }
    if (draft.pdfData && !DocumentStore::isPdf(*draft.pdfData)) {
        return CreateResult::fail(ServiceError::Validation, "Not a PDF document");
    }

    ProfileRecord record;
    record.name = name;
    record.description = draft.description;
    record.feedRate = draft.feedRate;
    record.materialSizeId = draft.materialSizeId;
    record.previewImage = draft.previewImage;

    auto id = m_profiles.insert(record);
    if (!id) {
        return CreateResult::fail(ServiceError::Storage,
                                  "Failed to create profile: " + m_db.lastError());
    }

    // The stored file name carries the id, so the PDF goes in after the row
    if (draft.pdfData) {
        auto saved = m_documents.saveProfilePdf(*id, *draft.pdfData, draft.pdfFilename);
        if (!saved.success || !m_profiles.updatePdfPath(*id, saved.path.string())) {
            std::string error = saved.success ? m_db.lastError() : saved.error;
            if (!m_profiles.remove(*id)) {
                log::errorf("ProfileService", "Could not roll back profile %lld",
                            static_cast<long long>(*id));
            }
            m_documents.deleteProfilePdfs(*id);
            return CreateResult::fail(ServiceError::Storage, "Failed to store PDF: " + error);
        }
    }

    log::infof("ProfileService", "Created profile '%s' (id %lld)", name.c_str(),
               static_cast<long long>(*id));
    m_events.publish(ProfileCreated{*id, name});
    return CreateResult::ok(*id);
}

ServiceResult ProfileService::updateProfile(const Permissions& perms, i64 profileId,
                                            const ProfileUpdate& update) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    auto current = m_profiles.findById(profileId);
    if (!current) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Profile " + std::to_string(profileId) + " not found");
    }

    ProfileRecord record = *current;
    if (update.name) {
        record.name = str::trim(*update.name);
        auto nameCheck = validateName(record.name, profileId);
        if (!nameCheck.success) {
            return nameCheck;
        }
    }
    if (update.description) {
        record.description = *update.description;
    }
    if (update.feedRate) {
        if (*update.feedRate <= 0.0) {
            return ServiceResult::fail(ServiceError::Validation,
                                       "Feed rate must be positive, got " +
                                           str::formatDecimal(*update.feedRate));
        }
        record.feedRate = *update.feedRate;
    }
    if (update.changeMaterialSize) {
        record.materialSizeId = update.materialSizeId;
    }
    if (update.changePreview) {
        record.previewImage = update.previewImage;
    }

    switch (update.pdf) {
        case PdfChange::Keep:
            break;
        case PdfChange::Replace: {
            auto saved = m_documents.saveProfilePdf(profileId, update.pdfData, update.pdfFilename);
            if (!saved.success) {
                ServiceError code = DocumentStore::isPdf(update.pdfData) ? ServiceError::Storage
                                                                         : ServiceError::Validation;
                return ServiceResult::fail(code, saved.error);
            }
            record.pdfPath = saved.path.string();
            break;
        }
        case PdfChange::Remove:
            m_documents.deleteProfilePdfs(profileId);
            record.pdfPath.reset();
            break;
    }

    if (!m_profiles.update(record)) {
        return ServiceResult::fail(ServiceError::Storage,
                                   "Failed to update profile: " + m_db.lastError());
    }

    log::infof("ProfileService", "Updated profile %lld", static_cast<long long>(profileId));
    m_events.publish(ProfileUpdated{profileId, record.name});
    return ServiceResult::ok();
}

ServiceResult ProfileService::deleteProfile(const Permissions& perms, i64 profileId) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    if (!m_profiles.exists(profileId)) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Profile " + std::to_string(profileId) + " not found");
    }

    if (!m_profiles.remove(profileId)) {
        return ServiceResult::fail(ServiceError::Storage,
                                   "Failed to delete profile: " + m_db.lastError());
    }

    int removed = m_documents.deleteProfilePdfs(profileId);
    if (removed > 0) {
        log::infof("ProfileService", "Removed %d PDF file(s) of profile %lld", removed,
                   static_cast<long long>(profileId));
    }

    if (m_currentProfileId == profileId) {
        m_currentProfileId.reset();
    }

    log::infof("ProfileService", "Deleted profile %lld", static_cast<long long>(profileId));
    m_events.publish(ProfileDeleted{profileId});
    return ServiceResult::ok();
}

std::optional<ProfileRecord> ProfileService::getProfile(i64 profileId) {
    return m_profiles.findById(profileId);
}

std::optional<ProfileRecord> ProfileService::getProfileByName(std::string_view name) {
    return m_profiles.findByName(name);
}

std::vector<ProfileRecord> ProfileService::getAllProfiles() {
    return m_profiles.findAll();
}

std::vector<ProfileRecord> ProfileService::searchProfiles(std::string_view term) {
    return m_profiles.search(term);
}

std::optional<ByteBuffer> ProfileService::getProfilePdf(i64 profileId) {
    auto profile = m_profiles.findById(profileId);
    if (!profile || !profile->pdfPath) {
        return std::nullopt;
    }
    return m_documents.loadProfilePdf(profileId, Path(*profile->pdfPath));
}

bool ProfileService::hasPdf(i64 profileId) {
    auto profile = m_profiles.findById(profileId);
    return profile && profile->pdfPath && !profile->pdfPath->empty();
}

bool ProfileService::setCurrentProfile(i64 profileId) {
    if (!m_profiles.exists(profileId)) {
        log::warningf("ProfileService", "Cannot select missing profile %lld",
                      static_cast<long long>(profileId));
        return false;
    }
    m_currentProfileId = profileId;
    m_events.publish(CurrentProfileChanged{profileId});
    return true;
}

void ProfileService::clearCurrentProfile() {
    m_currentProfileId.reset();
}

std::optional<ProfileRecord> ProfileService::currentProfile() {
    if (!m_currentProfileId) {
        return std::nullopt;
    }
    return m_profiles.findById(*m_currentProfileId);
}

ProfileStatistics ProfileService::getStatistics(i64 profileId) {
    ProfileStatistics stats;
    for (const auto& tool : m_tools.findForProfile(profileId)) {
        ++stats.totalTools;
        ++stats.byPosition[static_cast<size_t>(tool.position) - 1];
        ++stats.byType[static_cast<size_t>(tool.toolType)];
        stats.totalKnives += tool.knivesCount;
    }
    return stats;
}

std::string ProfileService::materialSizeDisplay(i64 profileId) {
    auto profile = m_profiles.findById(profileId);
    return profile ? m_sizes.materialSizeDisplay(*profile) : "";
}

std::string ProfileService::productSizesDisplay(i64 profileId) {
    return m_sizes.productSizesDisplay(profileId);
}

} // namespace hm
