// Hydromat - Document Store Tests

#include <gtest/gtest.h>

#include "core/storage/document_store.h"
#include "core/utils/file_utils.h"
#include "test_helpers.h"

namespace {

class DocumentStoreTest : public ::testing::Test {
  protected:
    DocumentStoreTest() : m_tmp("document_store"), m_store(m_tmp / "pdfs") {}

    hm_test::TempDir m_tmp;
    hm::DocumentStore m_store;
};

hm::ByteBuffer otherPdf() {
    auto pdf = hm_test::minimalPdf();
    pdf.push_back('\n');
    return pdf;
}

} // namespace

TEST(DocumentStoreNames, ProfilePrefix) {
    EXPECT_EQ(hm::DocumentStore::profilePrefix(7), "profile_0007");
    EXPECT_EQ(hm::DocumentStore::profilePrefix(12345), "profile_12345");
}

TEST(DocumentStoreNames, MakeFilenameSafe) {
    EXPECT_EQ(hm::DocumentStore::makeFilenameSafe("Skirting Board.pdf"), "Skirting Board");
    EXPECT_EQ(hm::DocumentStore::makeFilenameSafe("/tmp/a:b*?c.pdf"), "a_b_c");
    EXPECT_EQ(hm::DocumentStore::makeFilenameSafe("__-draft-__.pdf"), "draft");
    EXPECT_EQ(hm::DocumentStore::makeFilenameSafe(std::string(80, 'x') + ".pdf"),
              std::string(50, 'x'));
}

TEST(DocumentStoreNames, IsPdf) {
    EXPECT_TRUE(hm::DocumentStore::isPdf(hm_test::minimalPdf()));
    EXPECT_FALSE(hm::DocumentStore::isPdf(hm_test::tinyPng()));
    EXPECT_FALSE(hm::DocumentStore::isPdf({}));
}

TEST_F(DocumentStoreTest, Save_DefaultName) {
    auto result = m_store.saveProfilePdf(7, hm_test::minimalPdf());

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(result.unchanged);
    EXPECT_EQ(result.path.filename(), "profile_0007.pdf");
    EXPECT_EQ(hm::file::readBinary(result.path).value_or(hm::ByteBuffer{}),
              hm_test::minimalPdf());
}

TEST_F(DocumentStoreTest, Save_UsesOriginalName) {
    auto result = m_store.saveProfilePdf(7, hm_test::minimalPdf(), "Ogee drawing.pdf");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.path.filename(), "profile_0007_Ogee drawing.pdf");
}

TEST_F(DocumentStoreTest, Save_RejectsNonPdf) {
    auto result = m_store.saveProfilePdf(7, hm_test::tinyPng());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Not a PDF document");

    auto empty = m_store.saveProfilePdf(7, {});
    EXPECT_FALSE(empty.success);
}

TEST_F(DocumentStoreTest, Save_IdenticalIsUnchanged) {
    ASSERT_TRUE(m_store.saveProfilePdf(3, hm_test::minimalPdf()).success);

    auto again = m_store.saveProfilePdf(3, hm_test::minimalPdf());
    ASSERT_TRUE(again.success);
    EXPECT_TRUE(again.unchanged);
}

TEST_F(DocumentStoreTest, Save_ReplacesOldPdf) {
    ASSERT_TRUE(m_store.saveProfilePdf(3, hm_test::minimalPdf(), "first.pdf").success);
    auto second = m_store.saveProfilePdf(3, otherPdf(), "second.pdf");
    ASSERT_TRUE(second.success);

    auto pdfs = m_store.findProfilePdfs(3);
    ASSERT_EQ(pdfs.size(), 1u);
    EXPECT_EQ(pdfs[0].filename(), "profile_0003_second.pdf");
}

TEST_F(DocumentStoreTest, Save_WithoutNameKeepsExistingName) {
    ASSERT_TRUE(m_store.saveProfilePdf(3, hm_test::minimalPdf(), "drawing.pdf").success);
    auto second = m_store.saveProfilePdf(3, otherPdf());
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.path.filename(), "profile_0003_drawing.pdf");
    EXPECT_EQ(m_store.loadProfilePdf(3).value_or(hm::ByteBuffer{}), otherPdf());
}

TEST_F(DocumentStoreTest, FindProfilePdfs_DoesNotMatchLongerIds) {
    ASSERT_TRUE(m_store.saveProfilePdf(7, hm_test::minimalPdf()).success);
    ASSERT_TRUE(m_store.saveProfilePdf(71, hm_test::minimalPdf()).success);

    EXPECT_EQ(m_store.findProfilePdfs(7).size(), 1u);
    EXPECT_EQ(m_store.findProfilePdfs(71).size(), 1u);
}

TEST_F(DocumentStoreTest, Load_ExplicitPathThenFallback) {
    auto saved = m_store.saveProfilePdf(5, hm_test::minimalPdf());
    ASSERT_TRUE(saved.success);

    EXPECT_TRUE(m_store.loadProfilePdf(5, saved.path).has_value());
    EXPECT_TRUE(m_store.loadProfilePdf(5, hm::Path(m_tmp / "moved.pdf")).has_value());
    EXPECT_FALSE(m_store.loadProfilePdf(6).has_value());
}

TEST_F(DocumentStoreTest, DeleteProfilePdfs) {
    ASSERT_TRUE(m_store.saveProfilePdf(5, hm_test::minimalPdf()).success);
    ASSERT_TRUE(m_store.saveProfilePdf(6, hm_test::minimalPdf()).success);

    EXPECT_EQ(m_store.deleteProfilePdfs(5), 1);
    EXPECT_TRUE(m_store.findProfilePdfs(5).empty());
    EXPECT_EQ(m_store.findProfilePdfs(6).size(), 1u);
}

TEST_F(DocumentStoreTest, DeleteProfilePdf_RejectsForeignFile) {
    auto saved = m_store.saveProfilePdf(6, hm_test::minimalPdf());
    ASSERT_TRUE(saved.success);

    EXPECT_FALSE(m_store.deleteProfilePdf(5, saved.path));
    EXPECT_TRUE(hm::file::exists(saved.path));
    EXPECT_TRUE(m_store.deleteProfilePdf(6, saved.path));
}

TEST_F(DocumentStoreTest, CleanupOrphanedTempFiles) {
    ASSERT_TRUE(hm::file::createDirectories(m_store.root() / ".tmp"));
    ASSERT_TRUE(hm::file::writeText(m_store.root() / ".tmp" / "profile_0001.pdf.part", "x"));

    EXPECT_EQ(m_store.cleanupOrphanedTempFiles(), 1);
    EXPECT_EQ(m_store.cleanupOrphanedTempFiles(), 0);
}
