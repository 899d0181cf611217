#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../database/profile_repository.h"
#include "../database/tool_repository.h"
#include "../security/access_control.h"
#include "service_result.h"
#include "size_service.h"

namespace hm {

class DocumentStore;
class EventBus;

struct ProfileDraft {
    std::string name;
    std::string description;
    f64 feedRate = 30.0; // m/min
    std::optional<i64> materialSizeId;
    std::optional<ByteBuffer> previewImage;

    // Optional drawing stored beside the database
    std::optional<ByteBuffer> pdfData;
    std::string pdfFilename;
};

// What an update does with the attached PDF
enum class PdfChange {
    Keep,
    Replace,
    Remove,
};

struct ProfileUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<f64> feedRate;

    bool changeMaterialSize = false;
    std::optional<i64> materialSizeId; // nullopt with changeMaterialSize clears it

    bool changePreview = false;
    std::optional<ByteBuffer> previewImage;

    PdfChange pdf = PdfChange::Keep;
    ByteBuffer pdfData; // for Replace
    std::string pdfFilename;
};

struct ProfileStatistics {
    int totalTools = 0;
    std::array<int, 4> byPosition{}; // indexed by ToolPosition value - 1
    std::array<int, 2> byType{};     // indexed by ToolType value
    int totalKnives = 0;

    int countFor(ToolPosition position) const {
        return byPosition[static_cast<size_t>(position) - 1];
    }
    int countFor(ToolType type) const { return byType[static_cast<size_t>(type)]; }
};

// Profile CRUD, PDF attachment and the session's current profile
class ProfileService {
  public:
    ProfileService(Database& db, EventBus& events, DocumentStore& documents);

    CreateResult createProfile(const Permissions& perms, const ProfileDraft& draft);
    ServiceResult updateProfile(const Permissions& perms, i64 profileId,
                                const ProfileUpdate& update);

    // Tools, assignments and size variants go with the profile
    ServiceResult deleteProfile(const Permissions& perms, i64 profileId);

    std::optional<ProfileRecord> getProfile(i64 profileId);
    std::optional<ProfileRecord> getProfileByName(std::string_view name);
    std::vector<ProfileRecord> getAllProfiles();
    std::vector<ProfileRecord> searchProfiles(std::string_view term);

    std::optional<ByteBuffer> getProfilePdf(i64 profileId);
    bool hasPdf(i64 profileId);

    // Selection is session state, allowed in read-only mode
    bool setCurrentProfile(i64 profileId);
    void clearCurrentProfile();
    std::optional<i64> currentProfileId() const { return m_currentProfileId; }
    std::optional<ProfileRecord> currentProfile();

    ProfileStatistics getStatistics(i64 profileId);

    std::string materialSizeDisplay(i64 profileId);
    std::string productSizesDisplay(i64 profileId);

  private:
    ServiceResult validateName(std::string_view name, i64 selfId);

    Database& m_db;
    EventBus& m_events;
    DocumentStore& m_documents;
    ProfileRepository m_profiles;
    ToolRepository m_tools;
    SizeService m_sizes;

    std::optional<i64> m_currentProfileId;
};

} // namespace hm
