#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../database/assignment_repository.h"
#include "../database/profile_repository.h"
#include "../database/tool_repository.h"
#include "../security/access_control.h"
#include "service_result.h"

namespace hm {

class EventBus;

// Input for a new tool. Position and type are the names accepted by
// ToolCodeGenerator ("Bottom".."Left", "Straight"/"Profile").
struct ToolDraft {
    i64 profileId = 0;
    std::string position;
    std::string toolType;
    int setNumber = 1;
    int knivesCount = 6;
    std::string templateId;
    std::string status = "ready";
    std::string notes;
    std::optional<ByteBuffer> photo;
};

// Partial update: only engaged fields change
struct ToolUpdate {
    std::optional<i64> profileId;
    std::optional<std::string> position;
    std::optional<std::string> toolType;
    std::optional<int> setNumber;
    std::optional<int> knivesCount;
    std::optional<std::string> templateId;
    std::optional<std::string> status;
    std::optional<std::string> notes;

    // Photo sub-operation; photo == nullopt with changePhoto clears the set photo
    bool changePhoto = false;
    std::optional<ByteBuffer> photo;
};

struct ToolCreateResult {
    bool success = false;
    ServiceError errorCode = ServiceError::None;
    std::string error;
    i64 toolId = 0;
    std::string code;
};

// fieldsUpdated and photoUpdated report each sub-operation separately:
// a rejected photo edit still leaves field changes applied.
struct ToolUpdateResult {
    bool success = false;
    bool fieldsUpdated = false;
    bool photoUpdated = false;
    ServiceError errorCode = ServiceError::None;
    std::string error;
    std::string code;
};

// Set statistics of one profile
struct ToolSetInfo {
    std::string prefix;
    std::vector<ToolRecord> members; // ascending id, first member owns the photo
};

// Tool lifecycle: code generation, uniqueness, set photo rule, in-use guard
class ToolService {
  public:
    static constexpr int MIN_KNIVES = 1;
    static constexpr int MAX_KNIVES = 99;

    ToolService(Database& db, EventBus& events);

    ToolCreateResult createTool(const Permissions& perms, const ToolDraft& draft);
    ToolUpdateResult updateTool(const Permissions& perms, i64 toolId, const ToolUpdate& update);
    ServiceResult deleteTool(const Permissions& perms, i64 toolId);

    std::optional<ToolRecord> getTool(i64 toolId);
    std::optional<ToolRecord> getToolByCode(std::string_view code);
    std::optional<ToolRecord> getToolByTemplateId(std::string_view templateId);
    std::vector<ToolRecord> getToolsForProfile(i64 profileId);
    std::vector<ToolRecord> getToolsForPosition(i64 profileId, ToolPosition position);
    std::vector<ToolRecord> getSetMembers(i64 toolId);
    std::vector<ToolSetInfo> getSetsForProfile(i64 profileId);
    bool isFirstInSet(i64 toolId);
    bool isToolAssigned(i64 toolId);

    static bool isValidStatus(std::string_view status);

  private:
    Database& m_db;
    EventBus& m_events;
    ToolRepository m_tools;
    ProfileRepository m_profiles;
    AssignmentRepository m_assignments;
};

} // namespace hm
