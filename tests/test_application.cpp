// Hydromat - Application Tests

#include <gtest/gtest.h>

#include "app/application.h"
#include "core/config/config.h"
#include "core/services/profile_service.h"
#include "core/services/tool_service.h"
#include "test_helpers.h"

#include <cstdlib>
#include <string>

namespace {

// Application with XDG dirs and config under a temp directory, new-record
// defaults changed from the built-in ones
class ApplicationTest : public ::testing::Test {
  protected:
    void SetUp() override {
        saveEnv("XDG_CONFIG_HOME", m_savedConfig, m_hadConfig);
        saveEnv("XDG_DATA_HOME", m_savedData, m_hadData);
        setenv("XDG_CONFIG_HOME", (m_dir / "config").c_str(), 1);
        setenv("XDG_DATA_HOME", (m_dir / "data").c_str(), 1);

        hm::Config config(m_dir / "hydromat.json");
        config.setAccessMode(hm::AccessMode::FullAccess);
        config.setDefaultFeedRate(22.5);
        config.setDefaultKnivesCount(4);
        config.setDefaultSetNumber(3);
        ASSERT_TRUE(config.save());

        m_options.configPath = m_dir / "hydromat.json";
        m_options.databasePath = m_dir / "tools.db";
    }

    void TearDown() override {
        restoreEnv("XDG_CONFIG_HOME", m_savedConfig, m_hadConfig);
        restoreEnv("XDG_DATA_HOME", m_savedData, m_hadData);
    }

    hm_test::TempDir m_dir{"application"};
    hm::AppOptions m_options;

  private:
    static void saveEnv(const char* name, std::string& value, bool& had) {
        const char* v = std::getenv(name);
        had = v != nullptr;
        value = had ? v : "";
    }

    static void restoreEnv(const char* name, const std::string& value, bool had) {
        if (had) {
            setenv(name, value.c_str(), 1);
        } else {
            unsetenv(name);
        }
    }

    std::string m_savedConfig;
    std::string m_savedData;
    bool m_hadConfig = false;
    bool m_hadData = false;
};

} // namespace

TEST_F(ApplicationTest, Drafts_UseConfiguredDefaults) {
    hm::Application app(m_options);
    ASSERT_TRUE(app.init());

    auto profile = app.newProfileDraft("Ogee 70");
    EXPECT_EQ(profile.name, "Ogee 70");
    EXPECT_DOUBLE_EQ(profile.feedRate, 22.5);

    auto tool = app.newToolDraft(7);
    EXPECT_EQ(tool.profileId, 7);
    EXPECT_EQ(tool.knivesCount, 4);
    EXPECT_EQ(tool.setNumber, 3);
}

TEST_F(ApplicationTest, CreateFromDrafts) {
    hm::Application app(m_options);
    ASSERT_TRUE(app.init());
    ASSERT_TRUE(app.permissions().canEdit);

    auto created = app.profiles().createProfile(app.permissions(), app.newProfileDraft("Ogee 70"));
    ASSERT_TRUE(created.success) << created.error;
    EXPECT_DOUBLE_EQ(app.profiles().getProfile(created.id)->feedRate, 22.5);

    auto draft = app.newToolDraft(created.id);
    draft.position = "Top";
    draft.toolType = "Profile";
    auto tool = app.tools().createTool(app.permissions(), draft);
    ASSERT_TRUE(tool.success) << tool.error;
    EXPECT_EQ(tool.code, "210013");
    EXPECT_EQ(app.tools().getTool(tool.toolId)->knivesCount, 4);
}
