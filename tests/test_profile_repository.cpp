// Hydromat - Profile Repository Tests

#include <gtest/gtest.h>

#include "core/database/database.h"
#include "core/database/profile_repository.h"
#include "core/database/schema.h"
#include "core/database/size_repository.h"
#include "test_helpers.h"

namespace {

class ProfileRepoTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(m_db.open(":memory:"));
        ASSERT_TRUE(hm::Schema::initialize(m_db));
    }

    static hm::ProfileRecord profile(const std::string& name) {
        hm::ProfileRecord p;
        p.name = name;
        return p;
    }

    hm::Database m_db;
};

} // namespace

TEST_F(ProfileRepoTest, Insert_ReturnsId) {
    hm::ProfileRepository repo(m_db);
    auto id = repo.insert(profile("Skirting 90"));
    ASSERT_TRUE(id.has_value());
    EXPECT_GT(*id, 0);
    EXPECT_TRUE(repo.exists(*id));
    EXPECT_EQ(repo.count(), 1);
}

TEST_F(ProfileRepoTest, FindById_ReadsAllFields) {
    hm::ProfileRepository repo(m_db);
    auto p = profile("Architrave");
    p.description = "Ogee, pine";
    p.feedRate = 18.5;
    p.previewImage = hm_test::tinyPng();
    p.pdfPath = "/docs/profile_0001.pdf";

    auto id = repo.insert(p);
    ASSERT_TRUE(id.has_value());

    auto found = repo.findById(*id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Architrave");
    EXPECT_EQ(found->description, "Ogee, pine");
    EXPECT_DOUBLE_EQ(found->feedRate, 18.5);
    EXPECT_FALSE(found->materialSizeId.has_value());
    EXPECT_EQ(found->previewImage, hm_test::tinyPng());
    EXPECT_EQ(found->pdfPath, "/docs/profile_0001.pdf");
    EXPECT_FALSE(found->createdAt.empty());
}

TEST_F(ProfileRepoTest, Insert_DuplicateNameFails) {
    hm::ProfileRepository repo(m_db);
    ASSERT_TRUE(repo.insert(profile("Dado")).has_value());
    EXPECT_FALSE(repo.insert(profile("Dado")).has_value());
}

TEST_F(ProfileRepoTest, FindByName) {
    hm::ProfileRepository repo(m_db);
    ASSERT_TRUE(repo.insert(profile("Dado")).has_value());
    EXPECT_TRUE(repo.findByName("Dado").has_value());
    EXPECT_FALSE(repo.findByName("dado rail").has_value());
}

TEST_F(ProfileRepoTest, FindAll_OrderedByName) {
    hm::ProfileRepository repo(m_db);
    ASSERT_TRUE(repo.insert(profile("Tongue")).has_value());
    ASSERT_TRUE(repo.insert(profile("Bead")).has_value());
    ASSERT_TRUE(repo.insert(profile("Groove")).has_value());

    auto all = repo.findAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "Bead");
    EXPECT_EQ(all[1].name, "Groove");
    EXPECT_EQ(all[2].name, "Tongue");
}

TEST_F(ProfileRepoTest, Search_NameAndDescription) {
    hm::ProfileRepository repo(m_db);
    auto a = profile("Skirting 90");
    a.description = "pine";
    auto b = profile("Cladding");
    b.description = "larch, 100% heartwood";
    ASSERT_TRUE(repo.insert(a).has_value());
    ASSERT_TRUE(repo.insert(b).has_value());

    EXPECT_EQ(repo.search("skirt").size(), 1u);
    EXPECT_EQ(repo.search("larch").size(), 1u);
    // '%' is matched literally
    EXPECT_EQ(repo.search("100%").size(), 1u);
    EXPECT_EQ(repo.search("0% h").size(), 1u);
    EXPECT_EQ(repo.search("oak").size(), 0u);
}

TEST_F(ProfileRepoTest, Update) {
    hm::ProfileRepository repo(m_db);
    auto id = repo.insert(profile("Old"));
    ASSERT_TRUE(id.has_value());

    auto p = *repo.findById(*id);
    p.name = "New";
    p.feedRate = 12.0;
    ASSERT_TRUE(repo.update(p));

    auto found = repo.findById(*id);
    EXPECT_EQ(found->name, "New");
    EXPECT_DOUBLE_EQ(found->feedRate, 12.0);
}

TEST_F(ProfileRepoTest, UpdatePdfPath_SetAndClear) {
    hm::ProfileRepository repo(m_db);
    auto id = repo.insert(profile("P"));
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(repo.updatePdfPath(*id, std::string("/tmp/a.pdf")));
    EXPECT_EQ(repo.findById(*id)->pdfPath, "/tmp/a.pdf");

    ASSERT_TRUE(repo.updatePdfPath(*id, std::nullopt));
    EXPECT_FALSE(repo.findById(*id)->pdfPath.has_value());
}

TEST_F(ProfileRepoTest, MaterialSizeDelete_SetsNull) {
    hm::SizeRepository sizes(m_db);
    hm::MaterialSizeRecord size;
    size.width = 100;
    size.thickness = 20;
    auto sizeId = sizes.insertMaterialSize(size);
    ASSERT_TRUE(sizeId.has_value());

    hm::ProfileRepository repo(m_db);
    auto p = profile("P");
    p.materialSizeId = sizeId;
    auto id = repo.insert(p);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(repo.findById(*id)->materialSizeId, sizeId);

    ASSERT_TRUE(sizes.removeMaterialSize(*sizeId));
    EXPECT_FALSE(repo.findById(*id)->materialSizeId.has_value());
}

TEST_F(ProfileRepoTest, Remove) {
    hm::ProfileRepository repo(m_db);
    auto id = repo.insert(profile("Gone"));
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(repo.remove(*id));
    EXPECT_FALSE(repo.exists(*id));
    EXPECT_FALSE(repo.remove(*id));
}
