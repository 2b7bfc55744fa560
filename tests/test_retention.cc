#include "test_helpers.h"
#include "Retention.h"


class RetentionTest : public ScratchTest {
protected:
    PruneSummary prune(int keepFull, int keepInc) {
        ChainCache cache(root);
        return pruneBackups(cache, {keepFull, keepInc}, now);
    }
};


TEST_F(RetentionTest, ExpiredFullTakesItsIncrementalsWithIt) {
    auto full = makeFull(now - 45 * DAY);
    auto inc = makeInc(now - 44 * DAY, full, full);
    auto current = makeFull(now - DAY);

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.removed, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, ExpiredIncrementalsGoAsASet) {
    auto full = makeFull(now - 20 * DAY);
    auto inc1 = makeInc(now - 10 * DAY, full, full);
    auto inc2 = makeInc(now - 9 * DAY, inc1, full);
    auto current = makeFull(now - DAY);

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.removed, 2u);
    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc1)));
    EXPECT_FALSE(exists(pathOf(inc2)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, MostRecentChainIsAlwaysKept) {
    auto full = makeFull(now - 5 * DAY);
    auto inc = makeInc(now - 2 * DAY, full, full);

    auto summary = prune(0, 0);

    EXPECT_EQ(summary.removed, 0u);
    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_TRUE(exists(pathOf(inc)));
}


TEST_F(RetentionTest, LongTermChainLosesIncrementalOnceSuperseded) {
    auto full = makeFull(now - 200 * DAY);
    auto inc = makeInc(now - 20 * DAY, full, full);
    auto newer = makeFull(now - 3 * DAY);

    prune(365, 14);

    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc)));
    EXPECT_TRUE(exists(pathOf(newer)));
}


TEST_F(RetentionTest, ShortWindowRemovesWholeChain) {
    auto full = makeFull(now - 20 * DAY);
    auto inc = makeInc(now - 19 * DAY, full, full);
    auto current = makeFull(now - DAY);

    prune(14, 14);

    EXPECT_FALSE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, OldIncrementalRemovedWhileInvalidSiblingIsQuarantined) {
    auto full = makeFull(now - 10 * DAY);
    auto inc = makeInc(now - 9 * DAY, full, full);
    string sibling = makeBackupId(now - 8 * DAY, INCREMENTAL);
    mkdirp(pathOf(sibling));
    writeFile(slashConcat(pathOf(sibling), RECORD_FILENAME), "not a record\n");
    auto current = makeFull(now - DAY);

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.removed, 1u);
    EXPECT_EQ(summary.quarantined, 1u);
    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc)));
    EXPECT_FALSE(exists(pathOf(sibling)));
    EXPECT_TRUE(exists(pathOf(QUARANTINE_PREFIX + sibling)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, MislinkedFullIsQuarantinedNotDeleted) {
    auto full = makeFull(now - 20 * DAY);
    auto inc = makeInc(now - 10 * DAY, full, full);

    // a full whose record claims membership in the older chain, with an incremental of its own
    auto stray = makeFull(now - 9 * DAY);
    writeRecord(pathOf(stray), BackupRecord(stray, now - 9 * DAY, FULL, "", full));
    auto strayInc = makeInc(now - 8 * DAY, stray, stray);
    auto current = makeFull(now - DAY);

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.removed, 1u);
    EXPECT_EQ(summary.quarantined, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_FALSE(exists(pathOf(inc)));
    EXPECT_FALSE(exists(pathOf(stray)));
    EXPECT_TRUE(exists(pathOf(QUARANTINE_PREFIX + stray)));
    EXPECT_TRUE(exists(pathOf(strayInc)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, FailureInOneChainDoesNotStopTheOthers) {
    auto stuck = makeFull(now - 60 * DAY);
    auto stuckInc = makeInc(now - 59 * DAY, stuck, stuck);
    auto expired = makeFull(now - 45 * DAY);
    auto expiredInc = makeInc(now - 44 * DAY, expired, expired);
    auto current = makeFull(now - DAY);

    // a file where the removal work directory would go makes the rename fail
    writeFile(pathOf(stuck) + ".tmp." + to_string(GLOBALS.pid), "in the way");

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.removed, 3u);
    EXPECT_TRUE(exists(pathOf(stuck)));
    EXPECT_FALSE(exists(pathOf(stuckInc)));
    EXPECT_FALSE(exists(pathOf(expired)));
    EXPECT_FALSE(exists(pathOf(expiredInc)));
    EXPECT_TRUE(exists(pathOf(current)));
}


TEST_F(RetentionTest, SecondRunDeletesNothing) {
    auto full = makeFull(now - 45 * DAY);
    makeInc(now - 44 * DAY, full, full);
    auto mid = makeFull(now - 20 * DAY);
    makeInc(now - 10 * DAY, mid, mid);
    makeFull(now - DAY);

    auto first = prune(30, 7);
    EXPECT_EQ(first.removed, 3u);

    auto second = prune(30, 7);
    EXPECT_EQ(second.removed, 0u);
    EXPECT_EQ(second.quarantined, 0u);
    EXPECT_EQ(dirEntryCount(root), 2);
}


TEST_F(RetentionTest, OrphanedChainIsNeverDeleted) {
    auto full = makeFull(now - 300 * DAY);
    auto inc = makeInc(now - 299 * DAY, full, full);
    rmrf(pathOf(full));
    makeFull(now - DAY);

    auto summary = prune(30, 7);

    EXPECT_EQ(summary.removed, 0u);
    EXPECT_TRUE(exists(pathOf(inc)));
}


TEST_F(RetentionTest, TestModeChangesNothing) {
    auto full = makeFull(now - 45 * DAY);
    auto inc = makeInc(now - 44 * DAY, full, full);
    string junk = "2023-01-01_00-00-00_full";
    mkdirp(pathOf(junk));
    makeFull(now - DAY);
    setFlags({"--quiet", "--test"});

    testing::internal::CaptureStdout();
    auto summary = prune(30, 7);
    string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(summary.removed, 2u);
    EXPECT_TRUE(exists(pathOf(full)));
    EXPECT_TRUE(exists(pathOf(inc)));
    EXPECT_TRUE(exists(pathOf(junk)));
    EXPECT_NE(output.find("would have deleted"), string::npos);
    EXPECT_NE(output.find("would have quarantined"), string::npos);
}


TEST_F(RetentionTest, RemovalLeavesNoWorkDirectories) {
    auto full = makeFull(now - 45 * DAY);
    makeInc(now - 44 * DAY, full, full);
    makeFull(now - DAY);

    prune(30, 7);

    ChainCache cache(root);
    EXPECT_TRUE(cache.inProcess.empty());
    EXPECT_EQ(cache.records.size(), 1u);
}


TEST_F(RetentionTest, DecisionsArePureAndOrdered) {
    auto old = makeFull(now - 45 * DAY);
    auto mid = makeFull(now - 20 * DAY);
    makeInc(now - 10 * DAY, mid, mid);
    auto fresh = makeFull(now - 15 * DAY);
    makeInc(now - 3 * DAY, fresh, fresh);
    auto current = makeFull(now - DAY);

    ChainCache cache(root);
    auto decisions = decideRetention(cache, now, {30, 7});

    ASSERT_EQ(decisions.size(), 4u);
    EXPECT_EQ(decisions[0].chainStart, old);
    EXPECT_EQ(decisions[0].verdict, DELETE_WHOLE);
    EXPECT_LT(decisions[0].oldestIncAgeDays, 0);
    EXPECT_EQ(decisions[1].chainStart, mid);
    EXPECT_EQ(decisions[1].verdict, KEEP_FULL_ONLY);
    EXPECT_EQ(decisions[2].chainStart, fresh);
    EXPECT_EQ(decisions[2].verdict, KEEP_WHOLE);
    EXPECT_EQ(decisions[3].chainStart, current);
    EXPECT_EQ(decisions[3].verdict, KEEP_WHOLE);
    EXPECT_TRUE(decisions[3].current);

    // nothing touched
    EXPECT_TRUE(exists(pathOf(old)));
    EXPECT_EQ(verdict2string(decisions[1].verdict), "keep full only");
}


TEST_F(RetentionTest, AgeComparisonIsStrictlyGreater) {
    auto edge = makeFull(now - 30 * DAY);
    makeFull(now - DAY);

    ChainCache cache(root);
    auto decisions = decideRetention(cache, now, {30, 7});

    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[0].chainStart, edge);
    EXPECT_EQ(decisions[0].verdict, KEEP_WHOLE);
}
