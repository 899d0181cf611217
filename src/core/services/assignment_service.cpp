#include "assignment_service.h"

#include <algorithm>
#include <cmath>

#include "../events/event_bus.h"
#include "../events/event_types.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"
#include "job_log.h"

namespace hm {

namespace {

AssignResult assignFail(ServiceError code, const std::string& error) {
    AssignResult r;
    r.errorCode = code;
    r.error = error;
    return r;
}

} // namespace

AssignmentService::AssignmentService(Database& db, EventBus& events, HeadLayout layout)
    : m_db(db), m_events(events), m_layout(std::move(layout)), m_assignments(db), m_tools(db),
      m_profiles(db), m_sizes(db) {}

AssignResult AssignmentService::assignTool(const Permissions& perms,
                                           const AssignmentRequest& request) {
    if (!perms.canEdit) {
        return assignFail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    auto required = HeadLayout::requiredPosition(request.headNumber);
    if (!required) {
        return assignFail(ServiceError::Validation,
                          "Head number must be 1-" + std::to_string(HeadLayout::HEAD_COUNT) +
                              ", got " + std::to_string(request.headNumber));
    }
    if (request.rpm && (*request.rpm < MIN_RPM || *request.rpm > MAX_RPM)) {
        return assignFail(ServiceError::Validation,
                          "RPM must be " + std::to_string(MIN_RPM) + "-" +
                              std::to_string(MAX_RPM) + ", got " + std::to_string(*request.rpm));
    }
    if (request.passDepth &&
        (!std::isfinite(*request.passDepth) || *request.passDepth < MIN_PASS_DEPTH ||
         *request.passDepth > MAX_PASS_DEPTH)) {
        return assignFail(ServiceError::Validation,
                          "Pass depth must be 0.1-10.0 mm, got " +
                              str::formatDecimal(*request.passDepth));
    }

    if (!m_profiles.exists(request.profileId)) {
        return assignFail(ServiceError::NotFound,
                          "Profile " + std::to_string(request.profileId) + " not found");
    }
    auto tool = m_tools.findById(request.toolId);
    if (!tool) {
        return assignFail(ServiceError::NotFound,
                          "Tool " + std::to_string(request.toolId) + " not found");
    }
    if (tool->profileId != request.profileId) {
        return assignFail(ServiceError::Validation,
                          "Tool " + tool->code + " belongs to profile " +
                              std::to_string(tool->profileId) + ", not " +
                              std::to_string(request.profileId));
    }

    AssignResult result;
    result.requiredPosition = required;
    result.positionMismatch = tool->position != *required;

    for (int head : m_assignments.findHeadsForTool(request.profileId, request.toolId)) {
        if (head != request.headNumber) {
            result.otherHeads.push_back(head);
        }
    }

    AssignmentRecord record;
    record.profileId = request.profileId;
    record.toolId = request.toolId;
    record.headNumber = request.headNumber;
    record.rpm = request.rpm;
    record.passDepth = request.passDepth;
    record.workMaterial = request.workMaterial;
    record.remarks = request.remarks;

    auto id = m_assignments.replace(record);
    if (!id) {
        return assignFail(ServiceError::Storage,
                          "Failed to assign tool to head " + std::to_string(request.headNumber) +
                              ": " + m_db.lastError());
    }

    if (result.positionMismatch) {
        log::warningf("AssignmentService", "Head %d expects %s, tool %s is %s",
                      request.headNumber, toString(*required), tool->code.c_str(),
                      toString(tool->position));
    }
    log::infof("AssignmentService", "Assigned %s to head %d of profile %lld", tool->code.c_str(),
               request.headNumber, static_cast<long long>(request.profileId));

    result.success = true;
    result.assignmentId = *id;
    m_events.publish(ToolAssigned{request.profileId, request.headNumber, request.toolId,
                                  result.positionMismatch, result.otherHeads});
    return result;
}

ServiceResult AssignmentService::clearAssignment(const Permissions& perms, i64 profileId,
                                                 int headNumber) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    if (!HeadLayout::isValidHead(headNumber)) {
        return ServiceResult::fail(ServiceError::Validation,
                                   "Head number must be 1-" +
                                       std::to_string(HeadLayout::HEAD_COUNT) + ", got " +
                                       std::to_string(headNumber));
    }
    if (!m_assignments.findByHead(profileId, headNumber)) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Head " + std::to_string(headNumber) + " has no tool assigned");
    }
    if (!m_assignments.clear(profileId, headNumber)) {
        return ServiceResult::fail(ServiceError::Storage,
                                   "Failed to clear head " + std::to_string(headNumber) + ": " +
                                       m_db.lastError());
    }

    m_events.publish(AssignmentCleared{profileId, headNumber});
    return ServiceResult::ok();
}

std::map<int, AssignmentRecord> AssignmentService::getAssignments(i64 profileId) {
    std::map<int, AssignmentRecord> byHead;
    for (auto& assignment : m_assignments.findForProfile(profileId)) {
        int head = assignment.headNumber;
        byHead.emplace(head, std::move(assignment));
    }
    return byHead;
}

std::optional<AssignmentRecord> AssignmentService::getAssignment(i64 profileId, int headNumber) {
    if (!HeadLayout::isValidHead(headNumber)) {
        return std::nullopt;
    }
    return m_assignments.findByHead(profileId, headNumber);
}

std::vector<HeadSlot> AssignmentService::getHeadSlots(i64 profileId) {
    auto assignments = getAssignments(profileId);

    std::vector<HeadSlot> slots;
    slots.reserve(HeadLayout::HEAD_COUNT);
    for (int head = 1; head <= HeadLayout::HEAD_COUNT; ++head) {
        HeadSlot slot;
        slot.headNumber = head;
        slot.name = m_layout.headName(head);
        slot.requiredPosition = *HeadLayout::requiredPosition(head);

        auto it = assignments.find(head);
        if (it != assignments.end()) {
            slot.assignment = it->second;
            slot.tool = m_tools.findById(it->second.toolId);
            if (slot.tool) {
                slot.positionMismatch = slot.tool->position != slot.requiredPosition;
            }
        }
        slots.push_back(std::move(slot));
    }
    return slots;
}

std::optional<Path> AssignmentService::writeJobLog(const Path& dir, i64 profileId,
                                                   const std::string& action, std::time_t when) {
    auto profile = m_profiles.findById(profileId);
    if (!profile) {
        log::errorf("AssignmentService", "Cannot log job: profile %lld not found",
                    static_cast<long long>(profileId));
        return std::nullopt;
    }

    JobSheet sheet;
    sheet.profileName = profile->name;
    sheet.feedRate = profile->feedRate;
    sheet.materialSize = m_sizes.materialSizeDisplay(*profile);
    sheet.productSize = m_sizes.productSizesDisplay(profileId);

    for (const auto& slot : getHeadSlots(profileId)) {
        JobLogRow row;
        row.headNumber = slot.headNumber;
        if (slot.assignment && slot.tool) {
            row.toolType = toString(slot.tool->toolType);
            row.toolCode = slot.tool->code;
            row.rpm = slot.assignment->rpm;
            row.passDepth = slot.assignment->passDepth;
        }
        sheet.rows.push_back(std::move(row));
    }

    return joblog::write(dir, sheet, action, when);
}

} // namespace hm
