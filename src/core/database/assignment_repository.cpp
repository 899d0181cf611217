#include "assignment_repository.h"

#include "../utils/log.h"

namespace hm {

namespace {

constexpr const char* kAssignmentSelect = R"(
    SELECT a.id, a.profile_id, a.tool_id, a.head_number, a.rpm, a.pass_depth,
           a.work_material, a.remarks, t.code
    FROM tool_assignments a
    LEFT JOIN tools t ON t.id = a.tool_id
)";

} // namespace

AssignmentRepository::AssignmentRepository(Database& db) : m_db(db) {}

std::optional<i64> AssignmentRepository::replace(const AssignmentRecord& assignment) {
    Transaction txn(m_db);
    if (!txn.isActive()) {
        return std::nullopt;
    }

    auto del = m_db.prepare("DELETE FROM tool_assignments WHERE profile_id = ? AND head_number = ?");
    if (!del.isValid() || !del.bindInt(1, assignment.profileId) ||
        !del.bindInt(2, assignment.headNumber)) {
        return std::nullopt;
    }
    if (!del.execute()) {
        log::errorf("AssignmentRepo", "Failed to clear head %d: %s", assignment.headNumber,
                    m_db.lastError().c_str());
        return std::nullopt;
    }

    auto ins = m_db.prepare(R"(
        INSERT INTO tool_assignments (
            profile_id, tool_id, head_number, rpm, pass_depth, work_material, remarks
        ) VALUES (?, ?, ?, ?, ?, ?, ?)
    )");
    if (!ins.isValid()) {
        return std::nullopt;
    }

    if (!ins.bindInt(1, assignment.profileId) ||
        !ins.bindInt(2, assignment.toolId) ||
        !ins.bindInt(3, assignment.headNumber) ||
        !ins.bindOptionalInt(4, assignment.rpm) ||
        !ins.bindOptionalDouble(5, assignment.passDepth) ||
        !ins.bindText(6, assignment.workMaterial) ||
        !ins.bindText(7, assignment.remarks)) {
        log::error("AssignmentRepo", "Failed to bind insert parameters");
        return std::nullopt;
    }

    if (!ins.execute()) {
        log::errorf("AssignmentRepo", "Failed to assign head %d: %s", assignment.headNumber,
                    m_db.lastError().c_str());
        return std::nullopt;
    }

    i64 id = m_db.lastInsertId();
    if (!txn.commit()) {
        log::error("AssignmentRepo", "Failed to commit assignment");
        return std::nullopt;
    }

    return id;
}

bool AssignmentRepository::clear(i64 profileId, int headNumber) {
    auto stmt =
        m_db.prepare("DELETE FROM tool_assignments WHERE profile_id = ? AND head_number = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) || !stmt.bindInt(2, headNumber)) {
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("AssignmentRepo", "Failed to clear head %d: %s", headNumber,
                    m_db.lastError().c_str());
        return false;
    }

    return m_db.changesCount() > 0;
}

std::optional<AssignmentRecord> AssignmentRepository::findByHead(i64 profileId, int headNumber) {
    auto stmt = m_db.prepare(std::string(kAssignmentSelect) +
                             " WHERE a.profile_id = ? AND a.head_number = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) || !stmt.bindInt(2, headNumber)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToAssignment(stmt);
    }
    return std::nullopt;
}

std::vector<AssignmentRecord> AssignmentRepository::findForProfile(i64 profileId) {
    std::vector<AssignmentRecord> results;

    auto stmt = m_db.prepare(std::string(kAssignmentSelect) +
                             " WHERE a.profile_id = ? ORDER BY a.head_number ASC");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId)) {
        return results;
    }

    while (stmt.step()) {
        results.push_back(rowToAssignment(stmt));
    }
    return results;
}

std::vector<int> AssignmentRepository::findHeadsForTool(i64 profileId, i64 toolId) {
    std::vector<int> heads;

    auto stmt = m_db.prepare(
        "SELECT head_number FROM tool_assignments WHERE profile_id = ? AND tool_id = ?"
        " ORDER BY head_number ASC");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId) || !stmt.bindInt(2, toolId)) {
        return heads;
    }

    while (stmt.step()) {
        heads.push_back(static_cast<int>(stmt.getInt(0)));
    }
    return heads;
}

i64 AssignmentRepository::countForTool(i64 toolId) {
    auto stmt = m_db.prepare("SELECT COUNT(*) FROM tool_assignments WHERE tool_id = ?");
    if (stmt.isValid() && stmt.bindInt(1, toolId) && stmt.step()) {
        return stmt.getInt(0);
    }
    return 0;
}

i64 AssignmentRepository::countForProfile(i64 profileId) {
    auto stmt = m_db.prepare("SELECT COUNT(*) FROM tool_assignments WHERE profile_id = ?");
    if (stmt.isValid() && stmt.bindInt(1, profileId) && stmt.step()) {
        return stmt.getInt(0);
    }
    return 0;
}

AssignmentRecord AssignmentRepository::rowToAssignment(Statement& stmt) {
    AssignmentRecord a;
    a.id = stmt.getInt(0);
    a.profileId = stmt.getInt(1);
    a.toolId = stmt.getInt(2);
    a.headNumber = static_cast<int>(stmt.getInt(3));
    a.rpm = stmt.getOptionalInt(4);
    a.passDepth = stmt.getOptionalDouble(5);
    a.workMaterial = stmt.getText(6);
    a.remarks = stmt.getText(7);
    a.toolCode = stmt.getText(8);
    return a;
}

} // namespace hm
