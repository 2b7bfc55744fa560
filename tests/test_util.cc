#include "test_helpers.h"


class UtilTest : public ScratchTest {};


TEST(TimeTest, ParsesTheFormsWeWriteAndTheFormsPeopleType) {
    time_t expected = 1673784000;     // 2023-01-15 12:00:00 UTC

    EXPECT_EQ(utc2time("2023-01-15T12:00:00Z"), expected);
    EXPECT_EQ(utc2time("2023-01-15_12-00-00"), expected);
    EXPECT_EQ(utc2time("2023-01-15 12:00:00"), expected);
    EXPECT_EQ(utc2time("  2023-01-15T12:00:00  "), expected);
    EXPECT_EQ(utc2time("2023-01-15"), expected - 12 * 3600);
}


TEST(TimeTest, RejectsNonsense) {
    EXPECT_EQ(utc2time(""), -1);
    EXPECT_EQ(utc2time("yesterday"), -1);
    EXPECT_EQ(utc2time("2023-13-01"), -1);
    EXPECT_EQ(utc2time("2023-02-29T00:00:00Z"), -1);
    EXPECT_EQ(utc2time("2023-01-15T25:00:00Z"), -1);
    EXPECT_EQ(utc2time("2023-01-15 12:00"), -1);
}


TEST(TimeTest, FormatsAsUtc) {
    EXPECT_EQ(time2utc(1673784000), "2023-01-15T12:00:00Z");
    EXPECT_EQ(time2utc(1673784000, ID_TIME_FORMAT), "2023-01-15_12-00-00");
    EXPECT_EQ(utc2time(time2utc(1700000000)), 1700000000);
}


TEST(TimeTest, DayAgeIsFractional) {
    EXPECT_DOUBLE_EQ(dayAge(0, SECS_PER_DAY), 1.0);
    EXPECT_DOUBLE_EQ(dayAge(0, SECS_PER_DAY / 2), 0.5);
    EXPECT_DOUBLE_EQ(dayAge(SECS_PER_DAY, 0), -1.0);
}


TEST(TimeTest, FixedPoint) {
    EXPECT_EQ(fixedPoint(10.04), "10.0");
    EXPECT_EQ(fixedPoint(0.25, 2), "0.25");
    EXPECT_EQ(fixedPoint(7, 0), "7");
}


TEST(PathTest, SlashConcat) {
    EXPECT_EQ(slashConcat("/backups", "a"), "/backups/a");
    EXPECT_EQ(slashConcat("/backups/", "/a"), "/backups/a");
    EXPECT_EQ(slashConcat("/backups", "a", "backup_manifest"), "/backups/a/backup_manifest");
}


TEST(PathTest, PathSplit) {
    auto ps = pathSplit("/backups/2023-01-15_12-00-00_full");
    EXPECT_EQ(ps.dir, "/backups");
    EXPECT_EQ(ps.file, "2023-01-15_12-00-00_full");

    ps = pathSplit("/backups/2023-01-15_12-00-00_full/");
    EXPECT_EQ(ps.dir, "/backups");
    EXPECT_EQ(ps.file, "2023-01-15_12-00-00_full");

    ps = pathSplit("/backups/chainbackups.meta");
    EXPECT_EQ(ps.file_base, "chainbackups");
    EXPECT_EQ(ps.file_ext, "meta");

    ps = pathSplit("relative");
    EXPECT_EQ(ps.dir, ".");
    EXPECT_EQ(ps.file, "relative");

    EXPECT_EQ(pathSplit("/top").dir, "/");
}


TEST(StringTest, SplitOnSpaceHonorsQuotes) {
    EXPECT_EQ(string2vectorOnSpace("--checkpoint=fast  --label 'nightly run'", true, true),
        (vector<string>{"--checkpoint=fast", "--label", "nightly run"}));
    EXPECT_EQ(string2vectorOnSpace("a\\ b c", false, true), (vector<string>{"a b", "c"}));
    EXPECT_TRUE(string2vectorOnSpace("", true, true).empty());
}


TEST(StringTest, TrimAndPlural) {
    EXPECT_EQ(trimSpace("  30 \t"), "30");
    EXPECT_EQ(trimQuotes("\"quoted\""), "quoted");
    EXPECT_EQ(plural(1, "backup"), "1 backup");
    EXPECT_EQ(plural(3, "backup"), "3 backups");
    EXPECT_EQ(commafy("a\nb\n"), "a, b");
}


TEST(StringTest, MD5) {
    EXPECT_EQ(MD5string(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(MD5string("/backups"), MD5string("/backups"));
    EXPECT_NE(MD5string("/backups"), MD5string("/backups/"));
}


TEST_F(UtilTest, MkdirpAndRmrf) {
    string deep = slashConcat(scratch, "a/b/c");
    EXPECT_EQ(mkdirp(deep), 0);
    EXPECT_TRUE(isDirectory(deep));
    EXPECT_EQ(mkdirp(deep), 0);

    writeFile(slashConcat(deep, "file"), "x");
    writeFile(slashConcat(scratch, "a/file"), "y");
    EXPECT_EQ(dirEntryCount(slashConcat(scratch, "a")), 2);

    // contents only
    EXPECT_TRUE(rmrf(slashConcat(scratch, "a"), false));
    EXPECT_TRUE(isDirectory(slashConcat(scratch, "a")));
    EXPECT_EQ(dirEntryCount(slashConcat(scratch, "a")), 0);

    EXPECT_TRUE(rmrf(slashConcat(scratch, "a")));
    EXPECT_FALSE(exists(slashConcat(scratch, "a")));
}


TEST_F(UtilTest, MkdirpFailsUnderAFile) {
    writeFile(slashConcat(scratch, "plain"), "x");
    EXPECT_NE(mkdirp(slashConcat(scratch, "plain/sub")), 0);
}


TEST_F(UtilTest, DirEntryCountOfMissingDirectory) {
    EXPECT_EQ(dirEntryCount(slashConcat(scratch, "missing")), -1);
    EXPECT_EQ(dirEntryCount(root), 0);
    EXPECT_FALSE(isDirectory(slashConcat(scratch, "missing")));
}
