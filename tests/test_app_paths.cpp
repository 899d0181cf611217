// Hydromat - App Paths Tests

#include <gtest/gtest.h>

#include "core/paths/app_paths.h"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

namespace {

// Points XDG dirs at a temp location for the lifetime of the fixture
class AppPathsTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_root = std::filesystem::temp_directory_path() / "hm_test_app_paths";
        std::filesystem::remove_all(m_root);
        saveEnv("XDG_CONFIG_HOME", m_savedConfig, m_hadConfig);
        saveEnv("XDG_DATA_HOME", m_savedData, m_hadData);
        setenv("XDG_CONFIG_HOME", (m_root / "config").c_str(), 1);
        setenv("XDG_DATA_HOME", (m_root / "data").c_str(), 1);
    }

    void TearDown() override {
        restoreEnv("XDG_CONFIG_HOME", m_savedConfig, m_hadConfig);
        restoreEnv("XDG_DATA_HOME", m_savedData, m_hadData);
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    std::filesystem::path m_root;

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

TEST_F(AppPathsTest, ConfigDir_FollowsXdg) {
    EXPECT_EQ(hm::paths::getConfigDir(), m_root / "config" / "hydromat");
    EXPECT_EQ(hm::paths::getConfigFilePath().filename(), "config.json");
}

TEST_F(AppPathsTest, DataDir_FollowsXdg) {
    EXPECT_EQ(hm::paths::getDataDir(), m_root / "data" / "hydromat");
}

TEST_F(AppPathsTest, DataFilesLiveUnderDataDir) {
    auto data = hm::paths::getDataDir();
    EXPECT_EQ(hm::paths::getDatabasePath(), data / "hydromat_tools.db");
    EXPECT_EQ(hm::paths::getDocumentsDir(), data / "pdfs");
    EXPECT_EQ(hm::paths::getJobLogDir(), data / "logs");
    EXPECT_EQ(hm::paths::getLogPath().parent_path(), data / "logs");
}

TEST_F(AppPathsTest, EmptyXdgFallsBackToHome) {
    setenv("XDG_DATA_HOME", "", 1);
    auto dir = hm::paths::getDataDir();
    EXPECT_TRUE(dir.is_absolute());
    EXPECT_EQ(dir.filename(), "hydromat");
    EXPECT_EQ(dir.parent_path().filename(), "share");
}

TEST_F(AppPathsTest, GetAppName) {
    EXPECT_STREQ(hm::paths::getAppName(), "hydromat");
}

TEST_F(AppPathsTest, EnsureDirectoriesExist) {
    EXPECT_TRUE(hm::paths::ensureDirectoriesExist());

    EXPECT_TRUE(std::filesystem::is_directory(hm::paths::getConfigDir()));
    EXPECT_TRUE(std::filesystem::is_directory(hm::paths::getDataDir()));
    EXPECT_TRUE(std::filesystem::is_directory(hm::paths::getDocumentsDir()));
    EXPECT_TRUE(std::filesystem::is_directory(hm::paths::getJobLogDir()));
}
