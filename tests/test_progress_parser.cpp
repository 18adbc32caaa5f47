#include <gtest/gtest.h>
#include <sync/progress_parser.hpp>

TEST(ProgressParser, RsyncCheckCounter) {
    ProgressParser p(CopyTool::Rsync);
    auto r = p.parse("      1,234,567  45%  1.23MB/s    0:00:01 (xfr#3, to-chk=30/40)");
    EXPECT_EQ(r.kind, LineKind::Progress);
    EXPECT_EQ(r.percent, 25);
}

TEST(ProgressParser, RsyncIncrementalRecursionCounter) {
    ProgressParser p(CopyTool::Rsync);
    auto r = p.parse("  32,768 100%  1.00MB/s  0:00:00 (xfr#1, ir-chk=1000/1001)");
    EXPECT_EQ(r.kind, LineKind::Progress);
    EXPECT_EQ(r.percent, 0);
}

TEST(ProgressParser, RsyncPerFileLineIsIgnored) {
    ProgressParser p(CopyTool::Rsync);
    EXPECT_EQ(p.parse("     524,288  50%  2.00MB/s    0:00:00").kind, LineKind::Ignored);
}

TEST(ProgressParser, RsyncFileNameIsText) {
    ProgressParser p(CopyTool::Rsync);
    auto r = p.parse("lecture01/slides.pdf");
    EXPECT_EQ(r.kind, LineKind::Text);
    EXPECT_EQ(r.percent, -1);
}

TEST(ProgressParser, RegressionIsIgnored) {
    ProgressParser p(CopyTool::Rsync);
    EXPECT_EQ(p.parse("x (xfr#1, to-chk=5/10)").percent, 50);
    EXPECT_EQ(p.parse("x (xfr#2, to-chk=8/10)").kind, LineKind::Ignored);
    EXPECT_EQ(p.last(), 50);
    EXPECT_EQ(p.parse("x (xfr#3, to-chk=0/10)").percent, 100);
}

TEST(ProgressParser, ResetAllowsLowerValues) {
    ProgressParser p(CopyTool::Rsync);
    p.parse("x (xfr#1, to-chk=1/10)");
    p.reset();
    auto r = p.parse("x (xfr#1, to-chk=9/10)");
    EXPECT_EQ(r.kind, LineKind::Progress);
    EXPECT_EQ(r.percent, 10);
}

TEST(ProgressParser, RsyncMalformedCounter) {
    ProgressParser p(CopyTool::Rsync);
    EXPECT_EQ(p.parse("x (to-chk=11/10)").kind, LineKind::Ignored);
    EXPECT_EQ(p.parse("x (to-chk=0/0)").kind, LineKind::Ignored);
}

TEST(ProgressParser, RobocopyPercentLines) {
    ProgressParser p(CopyTool::Robocopy);
    EXPECT_EQ(p.parse("  12.5%").percent, 12);
    EXPECT_EQ(p.parse("100%").percent, 100);
}

TEST(ProgressParser, RobocopyOutOfRangeIgnored) {
    ProgressParser p(CopyTool::Robocopy);
    EXPECT_EQ(p.parse(" 150%").kind, LineKind::Ignored);
}

TEST(ProgressParser, RobocopyOtherLinesAreText) {
    ProgressParser p(CopyTool::Robocopy);
    EXPECT_EQ(p.parse("      New File       1024    notes.txt").kind, LineKind::Text);
}
