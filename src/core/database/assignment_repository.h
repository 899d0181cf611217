#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../types.h"
#include "database.h"

namespace hm {

// Binding of one tool to one spindle head of a profile
struct AssignmentRecord {
    i64 id = 0;
    i64 profileId = 0;
    i64 toolId = 0;
    int headNumber = 0;
    std::optional<i64> rpm;
    std::optional<f64> passDepth; // mm
    std::string workMaterial;
    std::string remarks;

    // Joined from tools on read; ignored on write
    std::string toolCode;
};

// Repository for head assignments. At most one row per (profile, head).
class AssignmentRepository {
  public:
    explicit AssignmentRepository(Database& db);

    // Delete any row for (profile, head) and insert the new one in one transaction.
    // On failure the previous assignment is left in place.
    std::optional<i64> replace(const AssignmentRecord& assignment);

    // Remove the assignment of one head; false when the head was empty
    bool clear(i64 profileId, int headNumber);

    std::optional<AssignmentRecord> findByHead(i64 profileId, int headNumber);
    std::vector<AssignmentRecord> findForProfile(i64 profileId);

    // Heads of the profile currently holding the tool, ascending
    std::vector<int> findHeadsForTool(i64 profileId, i64 toolId);

    i64 countForTool(i64 toolId);
    i64 countForProfile(i64 profileId);

  private:
    static AssignmentRecord rowToAssignment(Statement& stmt);

    Database& m_db;
};

} // namespace hm
