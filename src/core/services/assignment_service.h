#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../database/assignment_repository.h"
#include "../database/profile_repository.h"
#include "../database/tool_repository.h"
#include "../security/access_control.h"
#include "../tools/head_layout.h"
#include "service_result.h"
#include "size_service.h"

namespace hm {

class EventBus;

struct AssignmentRequest {
    i64 profileId = 0;
    int headNumber = 0;
    i64 toolId = 0;
    std::optional<i64> rpm;
    std::optional<f64> passDepth; // mm
    std::string workMaterial;
    std::string remarks;
};

// positionMismatch and otherHeads are advisory: the assignment is stored
// regardless and the caller decides whether to warn.
struct AssignResult {
    bool success = false;
    ServiceError errorCode = ServiceError::None;
    std::string error;
    i64 assignmentId = 0;
    bool positionMismatch = false;
    std::optional<ToolPosition> requiredPosition;
    std::vector<int> otherHeads; // heads of the same profile already holding the tool
};

// One spindle head as shown on the machine setup sheet
struct HeadSlot {
    int headNumber = 0;
    std::string name;
    ToolPosition requiredPosition = ToolPosition::Bottom;
    std::optional<AssignmentRecord> assignment;
    std::optional<ToolRecord> tool;
    bool positionMismatch = false;
};

class AssignmentService {
  public:
    static constexpr i64 MIN_RPM = 1000;
    static constexpr i64 MAX_RPM = 8000;
    static constexpr f64 MIN_PASS_DEPTH = 0.1;
    static constexpr f64 MAX_PASS_DEPTH = 10.0;

    AssignmentService(Database& db, EventBus& events, HeadLayout layout = HeadLayout());

    AssignResult assignTool(const Permissions& perms, const AssignmentRequest& request);
    ServiceResult clearAssignment(const Permissions& perms, i64 profileId, int headNumber);

    std::map<int, AssignmentRecord> getAssignments(i64 profileId);
    std::optional<AssignmentRecord> getAssignment(i64 profileId, int headNumber);

    // All HEAD_COUNT heads in order, assigned or not
    std::vector<HeadSlot> getHeadSlots(i64 profileId);

    // Append the current setup of the profile to the monthly job log in dir.
    // Returns the file written.
    std::optional<Path> writeJobLog(const Path& dir, i64 profileId,
                                    const std::string& action = "JOB",
                                    std::time_t when = std::time(nullptr));

    const HeadLayout& layout() const { return m_layout; }
    void setLayout(const HeadLayout& layout) { m_layout = layout; }

  private:
    Database& m_db;
    EventBus& m_events;
    HeadLayout m_layout;
    AssignmentRepository m_assignments;
    ToolRepository m_tools;
    ProfileRepository m_profiles;
    SizeService m_sizes;
};

} // namespace hm
