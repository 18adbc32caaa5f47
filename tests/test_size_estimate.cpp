#include <gtest/gtest.h>
#include <sync/size_estimate.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(GlobMatch, NamePatternMatchesAnyDepth) {
    EXPECT_TRUE(matches_glob("notes.tmp", "*.tmp"));
    EXPECT_TRUE(matches_glob("week1/notes.tmp", "*.tmp"));
    EXPECT_FALSE(matches_glob("week1/notes.pdf", "*.tmp"));
}

TEST(GlobMatch, SlashPatternsAreAnchored) {
    EXPECT_TRUE(matches_glob("build/out.o", "build/*"));
    EXPECT_FALSE(matches_glob("src/build/out.o", "build/*"));
    EXPECT_TRUE(matches_glob("src/build/out.o", "**/build/*"));
    EXPECT_TRUE(matches_glob("a.txt", "/a.txt"));
}

TEST(GlobMatch, DirectoryPatternCoversContents) {
    EXPECT_TRUE(matches_glob("cache/a/b.bin", "cache/"));
    EXPECT_TRUE(matches_glob("src/cache/b.bin", "cache"));
    EXPECT_TRUE(matches_glob("build/x/y.o", "/build"));
    EXPECT_FALSE(matches_glob("src/build/y.o", "/build"));
}

TEST(GlobMatch, SingleStarStaysInComponent) {
    EXPECT_FALSE(matches_glob("a/b/c.txt", "a/*.txt"));
    EXPECT_TRUE(matches_glob("a/b/c.txt", "a/**.txt"));
}

TEST(GlobMatch, QuestionMarkAndLiterals) {
    EXPECT_TRUE(matches_glob("v1.pdf", "v?.pdf"));
    EXPECT_FALSE(matches_glob("v1xpdf", "v?.pdf"));
    EXPECT_FALSE(matches_glob("x", ""));
}

class SizeEstimateTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("sharesync_estimate_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        write_file("slides.pdf", 100);
        write_file("week1/notes.pdf", 50);
        write_file("week1/scratch.tmp", 10);
        write_file(".hidden/secret.pdf", 7);
        write_file("big.mp4", 5000);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel, size_t bytes) {
        auto full = test_dir / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << std::string(bytes, 'x');
    }

    SyncSpec make_spec() {
        SyncSpec spec;
        spec.source.path = test_dir.string();
        spec.destination.path = "/unused";
        return spec;
    }
};

TEST_F(SizeEstimateTest, HiddenExcludedByDefault) {
    auto r = estimate_transfer_size(make_spec());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.file_count, 4u);
    EXPECT_EQ(r.value.total_bytes, 5160u);
    EXPECT_EQ(r.value.skipped, 1u);
    EXPECT_TRUE(r.value.complete);
}

TEST_F(SizeEstimateTest, ExtensionsAndExcludes) {
    auto spec = make_spec();
    spec.rules.file_extensions = {".pdf"};
    spec.rules.exclude_hidden = false;
    auto r = estimate_transfer_size(spec);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.file_count, 3u);
    EXPECT_EQ(r.value.total_bytes, 157u);

    spec.rules.exclude_patterns = {".hidden/"};
    r = estimate_transfer_size(spec);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.file_count, 2u);
    EXPECT_EQ(r.value.total_bytes, 150u);
}

TEST_F(SizeEstimateTest, IncludeOverridesExclude) {
    auto spec = make_spec();
    spec.rules.include_patterns = {"*.tmp"};
    spec.rules.exclude_patterns = {"week1/*"};
    auto r = estimate_transfer_size(spec);
    ASSERT_TRUE(r.is_ok());
    // slides.pdf, big.mp4, scratch.tmp
    EXPECT_EQ(r.value.file_count, 3u);
}

TEST_F(SizeEstimateTest, SizeBounds) {
    auto spec = make_spec();
    spec.rules.min_file_size = 20;
    spec.rules.max_file_size = 1000;
    auto r = estimate_transfer_size(spec);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.file_count, 2u);
    EXPECT_EQ(r.value.total_bytes, 150u);
}

TEST_F(SizeEstimateTest, MissingSourceIsAnError) {
    auto spec = make_spec();
    spec.source.path = (test_dir / "gone").string();
    EXPECT_TRUE(estimate_transfer_size(spec).is_err());
}
