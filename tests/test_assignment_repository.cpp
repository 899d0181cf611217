// Hydromat - Assignment Repository Tests

#include <gtest/gtest.h>

#include "core/database/assignment_repository.h"
#include "core/database/database.h"
#include "core/database/schema.h"
#include "core/database/tool_repository.h"
#include "test_helpers.h"

using hm::ToolPosition;
using hm::ToolType;
using hm_test::makeTool;

namespace {

class AssignmentRepoTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(m_db.open(":memory:"));
        ASSERT_TRUE(hm::Schema::initialize(m_db));
        for (int i = 1; i <= 5; ++i) {
            ASSERT_EQ(hm_test::addProfile(m_db, "Profile " + std::to_string(i)), i);
        }
        hm::ToolRepository tools(m_db);
        m_toolX = tools.insert(makeTool(5, ToolPosition::Right, ToolType::Profile, 1)).value_or(0);
        m_toolY = tools.insert(makeTool(5, ToolPosition::Left, ToolType::Profile, 1)).value_or(0);
        ASSERT_GT(m_toolX, 0);
        ASSERT_GT(m_toolY, 0);
    }

    static hm::AssignmentRecord assignment(hm::i64 profileId, int head, hm::i64 toolId) {
        hm::AssignmentRecord a;
        a.profileId = profileId;
        a.headNumber = head;
        a.toolId = toolId;
        return a;
    }

    int rowsFor(hm::i64 profileId, int head) {
        auto stmt = m_db.prepare(
            "SELECT COUNT(*) FROM tool_assignments WHERE profile_id = ? AND head_number = ?");
        if (!stmt.bindInt(1, profileId) || !stmt.bindInt(2, head) || !stmt.step()) {
            return -1;
        }
        return static_cast<int>(stmt.getInt(0));
    }

    hm::Database m_db;
    hm::i64 m_toolX = 0;
    hm::i64 m_toolY = 0;
};

} // namespace

TEST_F(AssignmentRepoTest, Replace_InsertsAndReadsBack) {
    hm::AssignmentRepository repo(m_db);
    auto a = assignment(5, 3, m_toolX);
    a.rpm = 6000;
    a.passDepth = 2.5;
    a.workMaterial = "Pine";
    a.remarks = "new knives";
    ASSERT_TRUE(repo.replace(a).has_value());

    auto found = repo.findByHead(5, 3);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->toolId, m_toolX);
    EXPECT_EQ(found->rpm, 6000);
    EXPECT_EQ(found->passDepth, 2.5);
    EXPECT_EQ(found->workMaterial, "Pine");
    EXPECT_EQ(found->remarks, "new knives");
    EXPECT_EQ(found->toolCode, "311005");
}

TEST_F(AssignmentRepoTest, Replace_OptionalFieldsStayAbsent) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 1, m_toolX)).has_value());

    auto found = repo.findByHead(5, 1);
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->rpm.has_value());
    EXPECT_FALSE(found->passDepth.has_value());
}

TEST_F(AssignmentRepoTest, Replace_SameHeadLeavesExactlyOneRow) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolY)).has_value());

    EXPECT_EQ(rowsFor(5, 3), 1);
    auto found = repo.findByHead(5, 3);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->toolId, m_toolY);
}

TEST_F(AssignmentRepoTest, Replace_FailedInsertKeepsPrevious) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());

    // Unknown tool violates the foreign key: the delete must roll back too
    EXPECT_FALSE(repo.replace(assignment(5, 3, 9999)).has_value());

    EXPECT_EQ(rowsFor(5, 3), 1);
    EXPECT_EQ(repo.findByHead(5, 3)->toolId, m_toolX);
}

TEST_F(AssignmentRepoTest, Replace_InvalidHeadRejectedBySchema) {
    hm::AssignmentRepository repo(m_db);
    EXPECT_FALSE(repo.replace(assignment(5, 11, m_toolX)).has_value());
    EXPECT_EQ(repo.countForProfile(5), 0);
}

TEST_F(AssignmentRepoTest, SameToolOnSeveralHeads) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());
    ASSERT_TRUE(repo.replace(assignment(5, 5, m_toolX)).has_value());

    auto heads = repo.findHeadsForTool(5, m_toolX);
    ASSERT_EQ(heads.size(), 2u);
    EXPECT_EQ(heads[0], 3);
    EXPECT_EQ(heads[1], 5);
    EXPECT_EQ(repo.countForTool(m_toolX), 2);
}

TEST_F(AssignmentRepoTest, FindForProfile_OrderedByHead) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 6, m_toolY)).has_value());
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());
    ASSERT_TRUE(repo.replace(assignment(4, 1, m_toolX)).has_value());

    auto rows = repo.findForProfile(5);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].headNumber, 3);
    EXPECT_EQ(rows[1].headNumber, 6);
}

TEST_F(AssignmentRepoTest, Clear) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());

    EXPECT_TRUE(repo.clear(5, 3));
    EXPECT_FALSE(repo.findByHead(5, 3).has_value());
    EXPECT_FALSE(repo.clear(5, 3));
}

TEST_F(AssignmentRepoTest, ToolDelete_CascadesToAssignments) {
    hm::AssignmentRepository repo(m_db);
    ASSERT_TRUE(repo.replace(assignment(5, 3, m_toolX)).has_value());

    hm::ToolRepository tools(m_db);
    ASSERT_TRUE(tools.remove(m_toolX));
    EXPECT_EQ(repo.countForProfile(5), 0);
}
