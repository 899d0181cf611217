#include "tool_service.h"

#include <algorithm>

#include "../events/event_bus.h"
#include "../events/event_types.h"
#include "../loaders/image_inspector.h"
#include "../utils/log.h"

namespace hm {

namespace {

constexpr const char* kSetOwnershipMessage =
    "Image can only be updated for the first tool in the set";

std::string knivesMessage(int count) {
    return "Knives count must be " + std::to_string(ToolService::MIN_KNIVES) + "-" +
           std::to_string(ToolService::MAX_KNIVES) + ", got " + std::to_string(count);
}

ToolCreateResult createFail(ServiceError code, const std::string& error) {
    ToolCreateResult r;
    r.errorCode = code;
    r.error = error;
    return r;
}

} // namespace

ToolService::ToolService(Database& db, EventBus& events)
    : m_db(db), m_events(events), m_tools(db), m_profiles(db), m_assignments(db) {}

bool ToolService::isValidStatus(std::string_view status) {
    return status == "ready" || status == "worn" || status == "in_service";
}

ToolCreateResult ToolService::createTool(const Permissions& perms, const ToolDraft& draft) {
    if (!perms.canEdit) {
        return createFail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    std::string code;
    try {
        code = ToolCodeGenerator::generate(draft.profileId, draft.position, draft.toolType,
                                           draft.setNumber);
    } catch (const ToolCodeError& e) {
        return createFail(ServiceError::Validation, e.what());
    }

    if (draft.knivesCount < MIN_KNIVES || draft.knivesCount > MAX_KNIVES) {
        return createFail(ServiceError::Validation, knivesMessage(draft.knivesCount));
    }
    if (!isValidStatus(draft.status)) {
        return createFail(ServiceError::Validation, "Invalid status: " + draft.status);
    }

    auto photoCheck = ImageInspector::validatePhoto(draft.photo);
    if (!photoCheck.valid) {
        return createFail(ServiceError::Validation, photoCheck.message);
    }

    if (!m_profiles.exists(draft.profileId)) {
        return createFail(ServiceError::NotFound,
                          "Profile " + std::to_string(draft.profileId) + " not found");
    }

    if (m_tools.codeExists(code)) {
        return createFail(ServiceError::DuplicateCode, "Tool with code " + code + " already exists");
    }

    ToolRecord record;
    record.profileId = draft.profileId;
    record.position = *parsePosition(draft.position);
    record.toolType = *parseToolType(draft.toolType);
    record.setNumber = draft.setNumber;
    record.code = code;
    record.knivesCount = draft.knivesCount;
    record.templateId = draft.templateId;
    record.status = draft.status;
    record.notes = draft.notes;
    record.photo = draft.photo;
    if (record.photo && record.photo->empty()) {
        record.photo.reset();
    }

    auto id = m_tools.insertWithPhotoInheritance(record);
    if (!id) {
        return createFail(ServiceError::Storage, "Failed to save tool " + code + ": " +
                                                     m_db.lastError());
    }

    log::infof("ToolService", "Created tool %s (id %lld)", code.c_str(),
               static_cast<long long>(*id));
    m_events.publish(ToolCreated{*id, draft.profileId, code});

    ToolCreateResult result;
    result.success = true;
    result.toolId = *id;
    result.code = code;
    return result;
}

ToolUpdateResult ToolService::updateTool(const Permissions& perms, i64 toolId,
                                         const ToolUpdate& update) {
    ToolUpdateResult result;
    auto fail = [&result](ServiceError code, const std::string& error) {
        result.success = false;
        result.errorCode = code;
        result.error = error;
        return result;
    };

    if (!perms.canEdit) {
        return fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    auto original = m_tools.findById(toolId);
    if (!original) {
        return fail(ServiceError::NotFound, "Tool " + std::to_string(toolId) + " not found");
    }

    ToolRecord updated = *original;
    result.code = original->code;

    bool identityChanged = (update.profileId && *update.profileId != original->profileId) ||
                           (update.position && *update.position != toString(original->position)) ||
                           (update.toolType && *update.toolType != toString(original->toolType)) ||
                           (update.setNumber && *update.setNumber != original->setNumber);

    if (identityChanged) {
        i64 profileId = update.profileId.value_or(original->profileId);
        std::string position = update.position.value_or(toString(original->position));
        std::string toolType = update.toolType.value_or(toString(original->toolType));
        int setNumber = update.setNumber.value_or(original->setNumber);

        try {
            updated.code = ToolCodeGenerator::generate(profileId, position, toolType, setNumber);
        } catch (const ToolCodeError& e) {
            return fail(ServiceError::Validation, e.what());
        }

        if (profileId != original->profileId && !m_profiles.exists(profileId)) {
            return fail(ServiceError::NotFound,
                        "Profile " + std::to_string(profileId) + " not found");
        }
        if (profileId != original->profileId && m_assignments.countForTool(toolId) > 0) {
            return fail(ServiceError::ToolInUse,
                        "Cannot move tool to another profile: The tool is assigned to a head. "
                        "Please remove it from the head first.");
        }
        if (m_tools.codeExists(updated.code, toolId)) {
            return fail(ServiceError::DuplicateCode,
                        "Tool with code " + updated.code + " already exists");
        }

        updated.profileId = profileId;
        updated.position = *parsePosition(position);
        updated.toolType = *parseToolType(toolType);
        updated.setNumber = setNumber;
    }

    if (update.knivesCount) {
        if (*update.knivesCount < MIN_KNIVES || *update.knivesCount > MAX_KNIVES) {
            return fail(ServiceError::Validation, knivesMessage(*update.knivesCount));
        }
        updated.knivesCount = *update.knivesCount;
    }
    if (update.status) {
        if (!isValidStatus(*update.status)) {
            return fail(ServiceError::Validation, "Invalid status: " + *update.status);
        }
        updated.status = *update.status;
    }
    if (update.templateId) {
        updated.templateId = *update.templateId;
    }
    if (update.notes) {
        updated.notes = *update.notes;
    }

    if (update.changePhoto) {
        auto photoCheck = ImageInspector::validatePhoto(update.photo);
        if (!photoCheck.valid) {
            return fail(ServiceError::Validation, photoCheck.message);
        }
    }

    bool fieldsChanged = updated.profileId != original->profileId ||
                         updated.code != original->code ||
                         updated.knivesCount != original->knivesCount ||
                         updated.templateId != original->templateId ||
                         updated.status != original->status || updated.notes != original->notes;

    bool joinsOtherSet =
        ToolCodeGenerator::setPrefix(updated.code) != ToolCodeGenerator::setPrefix(original->code);

    if (fieldsChanged) {
        bool stored = joinsOtherSet ? m_tools.updateAndJoinSet(updated) : m_tools.update(updated);
        if (!stored) {
            return fail(ServiceError::Storage, "Failed to update tool " + original->code + ": " +
                                                   m_db.lastError());
        }
        result.fieldsUpdated = true;
        result.code = updated.code;
        log::infof("ToolService", "Updated tool %lld (%s)", static_cast<long long>(toolId),
                   updated.code.c_str());
    }

    if (update.changePhoto) {
        std::optional<ByteBuffer> photo = update.photo;
        if (photo && photo->empty()) {
            photo.reset();
        }

        switch (m_tools.updatePhotoForSet(toolId, photo)) {
            case PhotoWriteResult::Updated:
                result.photoUpdated = true;
                break;
            case PhotoWriteResult::NotFirstInSet:
                result.errorCode = ServiceError::SetOwnership;
                result.error = kSetOwnershipMessage;
                break;
            case PhotoWriteResult::NotFound:
                result.errorCode = ServiceError::NotFound;
                result.error = "Tool " + std::to_string(toolId) + " not found";
                break;
            case PhotoWriteResult::StorageError:
                result.errorCode = ServiceError::Storage;
                result.error = "Failed to write set photo: " + m_db.lastError();
                break;
        }
    }

    result.success = result.errorCode == ServiceError::None;

    if (result.fieldsUpdated || result.photoUpdated) {
        m_events.publish(ToolUpdated{toolId, updated.profileId, updated.code, result.photoUpdated});
    }
    return result;
}

ServiceResult ToolService::deleteTool(const Permissions& perms, i64 toolId) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }

    auto tool = m_tools.findById(toolId);
    if (!tool) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Tool " + std::to_string(toolId) + " not found");
    }

    if (m_assignments.countForTool(toolId) > 0) {
        return ServiceResult::fail(ServiceError::ToolInUse,
                                   "Cannot delete tool: The tool is assigned to a head. "
                                   "Please remove it from the head first.");
    }

    if (!m_tools.remove(toolId)) {
        return ServiceResult::fail(ServiceError::Storage,
                                   "Failed to delete tool " + tool->code + ": " + m_db.lastError());
    }

    log::infof("ToolService", "Deleted tool %s", tool->code.c_str());
    m_events.publish(ToolDeleted{toolId, tool->profileId, tool->code});
    return ServiceResult::ok();
}

std::optional<ToolRecord> ToolService::getTool(i64 toolId) {
    return m_tools.findById(toolId);
}

std::optional<ToolRecord> ToolService::getToolByCode(std::string_view code) {
    if (!ToolCodeGenerator::validateCode(code)) {
        return std::nullopt;
    }
    return m_tools.findByCode(code);
}

std::optional<ToolRecord> ToolService::getToolByTemplateId(std::string_view templateId) {
    if (templateId.empty()) {
        return std::nullopt;
    }
    return m_tools.findByTemplateId(templateId);
}

std::vector<ToolRecord> ToolService::getToolsForProfile(i64 profileId) {
    return m_tools.findForProfile(profileId);
}

std::vector<ToolRecord> ToolService::getToolsForPosition(i64 profileId, ToolPosition position) {
    return m_tools.findForPosition(profileId, position);
}

std::vector<ToolRecord> ToolService::getSetMembers(i64 toolId) {
    auto tool = m_tools.findById(toolId);
    if (!tool) {
        return {};
    }
    return m_tools.findSetMembers(tool->profileId, ToolCodeGenerator::setPrefix(tool->code));
}

std::vector<ToolSetInfo> ToolService::getSetsForProfile(i64 profileId) {
    std::vector<ToolSetInfo> sets;
    // Tools come back ordered by code, so members of one set are adjacent
    for (const auto& tool : m_tools.findForProfile(profileId)) {
        std::string prefix = ToolCodeGenerator::setPrefix(tool.code);
        if (sets.empty() || sets.back().prefix != prefix) {
            sets.push_back(ToolSetInfo{prefix, {}});
        }
        sets.back().members.push_back(tool);
    }
    for (auto& set : sets) {
        std::sort(set.members.begin(), set.members.end(),
                  [](const ToolRecord& a, const ToolRecord& b) { return a.id < b.id; });
    }
    return sets;
}

bool ToolService::isFirstInSet(i64 toolId) {
    return m_tools.isFirstInSet(toolId);
}

bool ToolService::isToolAssigned(i64 toolId) {
    return m_assignments.countForTool(toolId) > 0;
}

} // namespace hm
