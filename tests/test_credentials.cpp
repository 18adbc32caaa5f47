#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

class CredentialsTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("sharesync_creds_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(CredentialsTest, SetGetRemove) {
    CredentialManager creds(test_dir / "credentials");
    EXPECT_TRUE(creds.get("user").is_err());

    ASSERT_TRUE(creds.set("user", "alice").is_ok());
    auto user = creds.get("user");
    ASSERT_TRUE(user.is_ok());
    EXPECT_EQ(user.value, "alice");

    ASSERT_TRUE(creds.remove("user").is_ok());
    EXPECT_TRUE(creds.get("user").is_err());
    EXPECT_TRUE(creds.remove("user").is_err());
}

TEST_F(CredentialsTest, ValuesMayContainEquals) {
    CredentialManager creds(test_dir / "credentials");
    ASSERT_TRUE(creds.set("password", "a=b=c").is_ok());
    EXPECT_EQ(creds.get("password").value, "a=b=c");
}

TEST_F(CredentialsTest, MultiLineValuesRejected) {
    CredentialManager creds(test_dir / "credentials");
    EXPECT_TRUE(creds.set("password", "line1\nline2").is_err());
    EXPECT_TRUE(creds.set("bad=key", "v").is_err());
}

TEST_F(CredentialsTest, LoginRoundTrip) {
    CredentialManager creds(test_dir / "credentials");
    EXPECT_TRUE(creds.load_login().is_err());

    ASSERT_TRUE(creds.store_login({"alice", "s3cret"}).is_ok());
    auto login = creds.load_login();
    ASSERT_TRUE(login.is_ok());
    EXPECT_EQ(login.value.username, "alice");
    EXPECT_EQ(login.value.password, "s3cret");

    auto listed = creds.list();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_TRUE(listed[0].has_value);
}

TEST_F(CredentialsTest, LoginWithoutPassword) {
    CredentialManager creds(test_dir / "credentials");
    ASSERT_TRUE(creds.set(CRED_USER, "bob").is_ok());
    auto login = creds.load_login();
    ASSERT_TRUE(login.is_ok());
    EXPECT_TRUE(login.value.password.empty());
}

#ifndef _WIN32
TEST_F(CredentialsTest, FileIsPrivate) {
    CredentialManager creds(test_dir / "credentials");
    ASSERT_TRUE(creds.set("user", "alice").is_ok());

    struct stat st {};
    ASSERT_EQ(stat((test_dir / "credentials").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600);
}
#endif
