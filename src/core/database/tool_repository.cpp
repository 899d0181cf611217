#include "tool_repository.h"

#include "../utils/log.h"

namespace hm {

namespace {

constexpr const char* kToolColumns = "id, profile_id, position, tool_type, set_number, code, "
                                     "knives_count, template_id, status, notes, photo";

std::string selectTools(const char* whereClause) {
    return std::string("SELECT ") + kToolColumns + " FROM tools " + whereClause;
}

long long asLL(i64 value) {
    return static_cast<long long>(value);
}

} // namespace

ToolRepository::ToolRepository(Database& db) : m_db(db) {}

std::optional<i64> ToolRepository::insert(const ToolRecord& tool) {
    auto stmt = m_db.prepare(R"(
        INSERT INTO tools (
            profile_id, position, tool_type, set_number, code,
            knives_count, template_id, status, notes, photo
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindInt(1, tool.profileId) ||
        !stmt.bindText(2, toString(tool.position)) ||
        !stmt.bindText(3, toString(tool.toolType)) ||
        !stmt.bindInt(4, tool.setNumber) ||
        !stmt.bindText(5, tool.code) ||
        !stmt.bindInt(6, tool.knivesCount) ||
        !stmt.bindText(7, tool.templateId) ||
        !stmt.bindText(8, tool.status) ||
        !stmt.bindText(9, tool.notes) ||
        !stmt.bindOptionalBlob(10, tool.photo)) {
        log::error("ToolRepo", "Failed to bind insert parameters");
        return std::nullopt;
    }

    if (!stmt.execute()) {
        log::errorf("ToolRepo", "Failed to insert tool %s: %s", tool.code.c_str(),
                    m_db.lastError().c_str());
        return std::nullopt;
    }

    return m_db.lastInsertId();
}

std::optional<i64> ToolRepository::insertWithPhotoInheritance(const ToolRecord& tool) {
    Transaction txn(m_db);
    if (!txn.isActive()) {
        return std::nullopt;
    }

    auto check = m_db.prepare("SELECT 1 FROM profiles WHERE id = ?");
    if (!check.isValid() || !check.bindInt(1, tool.profileId) || !check.step()) {
        log::errorf("ToolRepo", "Profile %lld does not exist", asLL(tool.profileId));
        return std::nullopt;
    }

    ToolRecord toInsert = tool;
    std::string prefix = ToolCodeGenerator::setPrefix(tool.code);
    if (!prefix.empty()) {
        auto first = findFirstInSet(tool.profileId, prefix);
        if (first && first->photo) {
            toInsert.photo = first->photo;
            log::debugf("ToolRepo", "Tool %s inherits photo from set leader %s",
                        tool.code.c_str(), first->code.c_str());
        }
    }

    auto id = insert(toInsert);
    if (!id) {
        return std::nullopt;
    }

    if (!txn.commit()) {
        log::errorf("ToolRepo", "Failed to commit insert of %s", tool.code.c_str());
        return std::nullopt;
    }

    return id;
}

std::optional<ToolRecord> ToolRepository::findById(i64 id) {
    auto stmt = m_db.prepare(selectTools("WHERE id = ?"));
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToTool(stmt);
    }
    return std::nullopt;
}

std::optional<ToolRecord> ToolRepository::findByCode(std::string_view code) {
    auto stmt = m_db.prepare(selectTools("WHERE code = ?"));
    if (!stmt.isValid() || !stmt.bindText(1, std::string(code))) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToTool(stmt);
    }
    return std::nullopt;
}

std::optional<ToolRecord> ToolRepository::findByTemplateId(std::string_view templateId) {
    auto stmt = m_db.prepare(selectTools("WHERE template_id = ? ORDER BY id ASC LIMIT 1"));
    if (!stmt.isValid() || !stmt.bindText(1, std::string(templateId))) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToTool(stmt);
    }
    return std::nullopt;
}

std::vector<ToolRecord> ToolRepository::findAll() {
    auto stmt = m_db.prepare(selectTools("ORDER BY code ASC"));
    return collect(stmt);
}

std::vector<ToolRecord> ToolRepository::findForProfile(i64 profileId) {
    auto stmt = m_db.prepare(selectTools("WHERE profile_id = ? ORDER BY code ASC"));
    if (!stmt.isValid() || !stmt.bindInt(1, profileId)) {
        return {};
    }
    return collect(stmt);
}

std::vector<ToolRecord> ToolRepository::findForPosition(i64 profileId, ToolPosition position) {
    auto stmt =
        m_db.prepare(selectTools("WHERE profile_id = ? AND position = ? ORDER BY code ASC"));
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) ||
        !stmt.bindText(2, toString(position))) {
        return {};
    }
    return collect(stmt);
}

i64 ToolRepository::count() {
    auto stmt = m_db.prepare("SELECT COUNT(*) FROM tools");
    if (stmt.isValid() && stmt.step()) {
        return stmt.getInt(0);
    }
    return 0;
}

i64 ToolRepository::countForProfile(i64 profileId) {
    auto stmt = m_db.prepare("SELECT COUNT(*) FROM tools WHERE profile_id = ?");
    if (stmt.isValid() && stmt.bindInt(1, profileId) && stmt.step()) {
        return stmt.getInt(0);
    }
    return 0;
}

bool ToolRepository::codeExists(std::string_view code, i64 excludeId) {
    auto stmt = m_db.prepare("SELECT 1 FROM tools WHERE code = ? AND id != ?");
    if (!stmt.isValid() || !stmt.bindText(1, std::string(code)) || !stmt.bindInt(2, excludeId)) {
        return false;
    }
    return stmt.step();
}

std::vector<ToolRecord> ToolRepository::findSetMembers(i64 profileId,
                                                       std::string_view setPrefix) {
    auto stmt = m_db.prepare(
        selectTools("WHERE profile_id = ? AND substr(code, 1, 5) = ? ORDER BY id ASC"));
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) ||
        !stmt.bindText(2, std::string(setPrefix))) {
        return {};
    }
    return collect(stmt);
}

std::optional<ToolRecord> ToolRepository::findFirstInSet(i64 profileId,
                                                         std::string_view setPrefix) {
    auto stmt = m_db.prepare(
        selectTools("WHERE profile_id = ? AND substr(code, 1, 5) = ? ORDER BY id ASC LIMIT 1"));
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) ||
        !stmt.bindText(2, std::string(setPrefix))) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToTool(stmt);
    }
    return std::nullopt;
}

bool ToolRepository::isFirstInSet(i64 toolId) {
    auto tool = findById(toolId);
    if (!tool) {
        return false;
    }

    auto first = findFirstInSet(tool->profileId, ToolCodeGenerator::setPrefix(tool->code));
    return first && first->id == tool->id;
}

bool ToolRepository::update(const ToolRecord& tool) {
    auto stmt = m_db.prepare(R"(
        UPDATE tools SET
            profile_id = ?,
            position = ?,
            tool_type = ?,
            set_number = ?,
            code = ?,
            knives_count = ?,
            template_id = ?,
            status = ?,
            notes = ?
        WHERE id = ?
    )");

    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindInt(1, tool.profileId) ||
        !stmt.bindText(2, toString(tool.position)) ||
        !stmt.bindText(3, toString(tool.toolType)) ||
        !stmt.bindInt(4, tool.setNumber) ||
        !stmt.bindText(5, tool.code) ||
        !stmt.bindInt(6, tool.knivesCount) ||
        !stmt.bindText(7, tool.templateId) ||
        !stmt.bindText(8, tool.status) ||
        !stmt.bindText(9, tool.notes) ||
        !stmt.bindInt(10, tool.id)) {
        log::error("ToolRepo", "Failed to bind update parameters");
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("ToolRepo", "Failed to update tool %lld: %s", asLL(tool.id),
                    m_db.lastError().c_str());
        return false;
    }

    return m_db.changesCount() > 0;
}

bool ToolRepository::updateAndJoinSet(const ToolRecord& tool) {
    Transaction txn(m_db);
    if (!txn.isActive()) {
        return false;
    }

    auto current = findById(tool.id);
    if (!current || !update(tool)) {
        return false;
    }

    std::string prefix = ToolCodeGenerator::setPrefix(tool.code);
    auto first = findFirstInSet(tool.profileId, prefix);
    if (!first) {
        return false;
    }

    // The first member's photo wins; the moved tool keeps its own only when it leads
    const std::optional<ByteBuffer>& photo = first->id == tool.id ? current->photo : first->photo;

    auto stmt =
        m_db.prepare("UPDATE tools SET photo = ? WHERE profile_id = ? AND substr(code, 1, 5) = ?");
    if (!stmt.isValid() || !stmt.bindOptionalBlob(1, photo) ||
        !stmt.bindInt(2, tool.profileId) || !stmt.bindText(3, prefix)) {
        log::error("ToolRepo", "Failed to bind set photo parameters");
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("ToolRepo", "Failed to align photos of set %s: %s", prefix.c_str(),
                    m_db.lastError().c_str());
        return false;
    }

    if (!txn.commit()) {
        log::errorf("ToolRepo", "Failed to commit move of tool %lld to set %s", asLL(tool.id),
                    prefix.c_str());
        return false;
    }

    log::debugf("ToolRepo", "Tool %s joined set %s (leader %s)", tool.code.c_str(),
                prefix.c_str(), first->code.c_str());
    return true;
}

PhotoWriteResult ToolRepository::updatePhotoForSet(i64 toolId,
                                                   const std::optional<ByteBuffer>& photo) {
    Transaction txn(m_db);
    if (!txn.isActive()) {
        return PhotoWriteResult::StorageError;
    }

    auto tool = findById(toolId);
    if (!tool) {
        return PhotoWriteResult::NotFound;
    }

    std::string prefix = ToolCodeGenerator::setPrefix(tool->code);
    auto first = findFirstInSet(tool->profileId, prefix);
    if (!first || first->id != tool->id) {
        log::warningf("ToolRepo", "Photo edit rejected for %s: not the first tool of its set",
                      tool->code.c_str());
        return PhotoWriteResult::NotFirstInSet;
    }

    auto stmt =
        m_db.prepare("UPDATE tools SET photo = ? WHERE profile_id = ? AND substr(code, 1, 5) = ?");
    if (!stmt.isValid()) {
        return PhotoWriteResult::StorageError;
    }

    if (!stmt.bindOptionalBlob(1, photo) || !stmt.bindInt(2, tool->profileId) ||
        !stmt.bindText(3, prefix)) {
        log::error("ToolRepo", "Failed to bind photo parameters");
        return PhotoWriteResult::StorageError;
    }

    if (!stmt.execute()) {
        log::errorf("ToolRepo", "Failed to write set photo: %s", m_db.lastError().c_str());
        return PhotoWriteResult::StorageError;
    }

    int members = m_db.changesCount();
    if (!txn.commit()) {
        return PhotoWriteResult::StorageError;
    }

    log::debugf("ToolRepo", "Photo of set %s written to %d tool(s)", prefix.c_str(), members);
    return PhotoWriteResult::Updated;
}

bool ToolRepository::remove(i64 id) {
    auto stmt = m_db.prepare("DELETE FROM tools WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("ToolRepo", "Failed to delete tool %lld: %s", asLL(id),
                    m_db.lastError().c_str());
        return false;
    }

    return m_db.changesCount() > 0;
}

std::vector<ToolRecord> ToolRepository::collect(Statement& stmt) {
    std::vector<ToolRecord> results;
    if (!stmt.isValid()) {
        return results;
    }

    while (stmt.step()) {
        auto tool = rowToTool(stmt);
        if (tool) {
            results.push_back(std::move(*tool));
        }
    }
    return results;
}

std::optional<ToolRecord> ToolRepository::rowToTool(Statement& stmt) {
    ToolRecord tool;
    tool.id = stmt.getInt(0);
    tool.profileId = stmt.getInt(1);

    std::string positionText = stmt.getText(2);
    std::string typeText = stmt.getText(3);
    auto position = parsePosition(positionText);
    auto type = parseToolType(typeText);
    if (!position || !type) {
        log::errorf("ToolRepo", "Tool %lld has unknown position '%s' or type '%s'; row skipped",
                    asLL(tool.id), positionText.c_str(), typeText.c_str());
        return std::nullopt;
    }
    tool.position = *position;
    tool.toolType = *type;

    tool.setNumber = static_cast<int>(stmt.getInt(4));
    tool.code = stmt.getText(5);
    tool.knivesCount = static_cast<int>(stmt.getInt(6));
    tool.templateId = stmt.getText(7);
    tool.status = stmt.getText(8);
    tool.notes = stmt.getText(9);
    tool.photo = stmt.getOptionalBlob(10);
    return tool;
}

} // namespace hm
