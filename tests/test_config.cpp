#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("sharesync_config_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto p = test_dir / name;
        std::ofstream(p) << content;
        return p;
    }
};

TEST_F(ConfigTest, FullProfile) {
    auto path = write_file("sharesync.yaml", R"(
name: semester
destination: /home/u/fhnw
sources:
  - /mnt/data/course_a
  - /mnt/data/course_b/
mode: mirror
direction: remote_to_local
retry_count: 5
bandwidth_limit: 800
follow_symlinks: true
rules:
  exclude: ["*.tmp", "build/"]
  exclude_hidden: false
  extensions: [".pdf"]
  min_size: 1
  max_size: 1000000
repo_pull:
  enabled: true
  path: /home/u/oop
post_script:
  path: /home/u/bin/after.sh
)");

    auto result = Config::load_profile(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& p = result.value.profile();
    EXPECT_EQ(p.name, "semester");
    EXPECT_EQ(p.destination, "/home/u/fhnw");
    ASSERT_EQ(p.sources.size(), 2u);
    EXPECT_EQ(p.mode, SyncMode::Mirror);
    EXPECT_EQ(p.retry_count.value(), 5);
    EXPECT_EQ(p.bandwidth_limit_kbs.value(), 800);
    EXPECT_TRUE(p.follow_symlinks);
    EXPECT_EQ(p.rules.exclude_patterns.size(), 2u);
    EXPECT_FALSE(p.rules.exclude_hidden);
    EXPECT_EQ(p.rules.max_file_size.value(), 1000000);
    EXPECT_TRUE(p.repo_pull_enabled);
    EXPECT_EQ(p.repo_path, "/home/u/oop");
    // enabled defaults to true when a path is given
    EXPECT_TRUE(p.post_script_enabled);
    EXPECT_EQ(result.value.profile_path(), path);
}

TEST_F(ConfigTest, MinimalProfileDefaults) {
    auto path = write_file("sharesync.yaml", "destination: /home/u/x\nsources: /mnt/data/a\n");
    auto result = Config::load_profile(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& p = result.value.profile();
    EXPECT_EQ(p.name, test_dir.filename().string());
    EXPECT_EQ(p.mode, SyncMode::Update);
    EXPECT_EQ(p.direction, SyncDirection::RemoteToLocal);
    EXPECT_TRUE(p.requires_vpn);
    EXPECT_TRUE(p.rules.exclude_hidden);
    EXPECT_FALSE(p.retry_count.has_value());
    EXPECT_FALSE(p.repo_pull_enabled);
    ASSERT_EQ(p.sources.size(), 1u);
}

TEST_F(ConfigTest, UnknownModeIsAnError) {
    auto path = write_file("sharesync.yaml", "destination: /x\nsources: [/a]\nmode: sideways\n");
    auto result = Config::load_profile(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("sideways"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    auto path = write_file("sharesync.yaml", "sources: [a, b\n");
    EXPECT_TRUE(Config::load_profile(path).is_err());
}

TEST_F(ConfigTest, MissingProfile) {
    auto result = Config::load_profile(test_dir / "nope.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, BuildJobFromProfile) {
    auto path = write_file("sharesync.yaml", R"(
name: semester
destination: /home/u/fhnw
sources: [/mnt/data/course_a/, /mnt/data/course_b]
requires_smb: false
)");
    auto config = Config::load_profile(path);
    ASSERT_TRUE(config.is_ok());

    SyncJob job = build_sync_job(config.value);
    EXPECT_EQ(job.name, "semester");
    ASSERT_EQ(job.transfers.size(), 2u);

    const auto& a = job.transfers[0];
    EXPECT_EQ(a.source.path, "/mnt/data/course_a");
    EXPECT_EQ(a.destination.path, (fs::path("/home/u/fhnw") / "course_a").string());
    EXPECT_TRUE(a.source.is_remote);
    EXPECT_TRUE(a.source.requires_vpn);
    EXPECT_FALSE(a.source.requires_smb);
    EXPECT_FALSE(a.destination.is_remote);
    EXPECT_EQ(a.retry_count, 3);
}

TEST_F(ConfigTest, LocalToRemoteMakesDestinationRemote) {
    auto path = write_file("sharesync.yaml",
                           "destination: /mnt/data/upload\nsources: [/home/u/work]\n"
                           "direction: local_to_remote\n");
    auto config = Config::load_profile(path);
    ASSERT_TRUE(config.is_ok());

    SyncJob job = build_sync_job(config.value);
    ASSERT_EQ(job.transfers.size(), 1u);
    EXPECT_FALSE(job.transfers[0].source.is_remote);
    EXPECT_TRUE(job.transfers[0].destination.is_remote);
}

TEST_F(ConfigTest, SaveThenLoad) {
    ProfileConfig p;
    p.name = "saved";
    p.destination = "/home/u/dst";
    p.sources = {"/mnt/data/a"};
    p.mode = SyncMode::Additive;
    p.retry_count = 1;
    p.rules.file_extensions = {".pdf"};

    auto path = test_dir / "sharesync.yaml";
    ASSERT_TRUE(save_profile(p, path).is_ok());

    auto loaded = Config::load_profile(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.profile().mode, SyncMode::Additive);
    EXPECT_EQ(loaded.value.profile().retry_count.value(), 1);
    EXPECT_EQ(loaded.value.profile().rules.file_extensions, p.rules.file_extensions);
    EXPECT_FALSE(loaded.value.profile().repo_pull_enabled);
}

TEST_F(ConfigTest, MigrateLegacyConfig) {
    auto legacy = write_file("config.txt", R"(# old settings
destination = /home/u/fhnw
source_paths = /mnt/data/a, /mnt/data/b
max_rsync_retries = 4
enable_git_pull = yes
oop_repo_path = /home/u/oop
enable_swegl_script = false
swegl_script_path = /home/u/swegl.sh
)");
    auto profile_path = test_dir / "sharesync.yaml";

    auto result = migrate_legacy_config(legacy, profile_path);
    ASSERT_TRUE(result.is_ok()) << result.error;

    auto loaded = Config::load_profile(profile_path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    const auto& p = loaded.value.profile();
    EXPECT_EQ(p.destination, "/home/u/fhnw");
    ASSERT_EQ(p.sources.size(), 2u);
    EXPECT_EQ(p.sources[1], "/mnt/data/b");
    EXPECT_EQ(p.retry_count.value(), 4);
    EXPECT_TRUE(p.repo_pull_enabled);
    EXPECT_FALSE(p.post_script_enabled);
    EXPECT_EQ(p.post_script_path, "/home/u/swegl.sh");
}

TEST_F(ConfigTest, MigrateRefusesToOverwrite) {
    auto legacy = write_file("config.txt", "destination=/x\nsource_paths=/a\n");
    auto profile_path = write_file("sharesync.yaml", "name: keep\n");
    auto result = migrate_legacy_config(legacy, profile_path);
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, MigrateNeedsSources) {
    auto legacy = write_file("config.txt", "destination=/x\n");
    EXPECT_TRUE(migrate_legacy_config(legacy, test_dir / "sharesync.yaml").is_err());
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(expand_home("~/x"), (platform::home_dir() / "x").string());
    EXPECT_EQ(expand_home("/abs"), "/abs");
    EXPECT_EQ(expand_home(""), "");
}
