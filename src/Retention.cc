#include <stdio.h>
#include <unistd.h>
#include <algorithm>

#include "Retention.h"
#include "Quarantine.h"
#include "colors.h"
#include "debug.h"


string verdict2string(ChainVerdict verdict) {
    switch (verdict) {
        case KEEP_WHOLE:      return "keep";
        case KEEP_FULL_ONLY:  return "keep full only";
        case DELETE_WHOLE:    return "delete";
    }

    return "unknown";
}


vector<ChainDecision> decideRetention(const ChainCache &cache, time_t now, const RetentionPolicy &policy) {
    vector<ChainDecision> decisions;
    auto current = cache.mostRecentChain();

    for (auto &chain: cache.chains) {
        if (chain.orphaned)
            continue;

        ChainDecision decision;
        decision.chainStart = chain.start;
        decision.current = (&chain == current);
        decision.fullAgeDays = dayAge(chain.startTime, now);
        decision.oldestIncAgeDays = -1;

        for (auto &member: chain.members)
            if (member != chain.start)
                decision.oldestIncAgeDays = max(decision.oldestIncAgeDays, dayAge(cache.records.at(member).timestamp, now));

        string ageText = "full " + fixedPoint(decision.fullAgeDays) + " days";
        if (decision.oldestIncAgeDays >= 0)
            ageText += ", oldest incremental " + fixedPoint(decision.oldestIncAgeDays) + " days";

        if (decision.current) {
            decision.verdict = KEEP_WHOLE;
            decision.reason = "most recent chain";
        }
        else if (decision.fullAgeDays > policy.keepFullDays) {
            decision.verdict = DELETE_WHOLE;
            decision.reason = ageText + " > keep_full " + to_string(policy.keepFullDays);
        }
        else if (decision.oldestIncAgeDays >= 0 && decision.oldestIncAgeDays > policy.keepIncrementalDays) {
            decision.verdict = KEEP_FULL_ONLY;
            decision.reason = ageText + " > keep_incremental " + to_string(policy.keepIncrementalDays);
        }
        else {
            decision.verdict = KEEP_WHOLE;
            decision.reason = ageText + " within retention";
        }

        decisions.push_back(decision);
    }

    return decisions;
}


/*
 Take a backup out of its chain with a rename first so that a partially
 removed directory can never be mistaken for a backup.  Whatever rmrf() leaves
 behind is a work directory the next scan cleans up.
 */
static bool removeBackup(string path, string reason) {
    string workDir = path + ".tmp." + to_string(GLOBALS.pid);

    if (GLOBALS.cli.count(CLI_TEST)) {
        cout << YELLOW << " TESTMODE: would have deleted " << path << " (" << reason << ")" << RESET << endl;
        return true;
    }

    if (rename(path.c_str(), workDir.c_str())) {
        log("error: unable to remove " + path + errtext());
        SCREENERR("error: unable to remove " << path << errtext());
        return false;
    }

    if (!rmrf(workDir)) {
        log("error: unable to finish removing " + path + " (left as " + workDir + ")" + errtext());
        SCREENERR("error: unable to finish removing " << path << " (left as " << workDir << ")");
        return false;
    }

    NOTQUIET && cout << "\t• removed " << path << endl;
    log("removed " + path + " (" + reason + ")");
    DEBUG(D_prune) DFMT("completed removal of " << path);
    return true;
}


PruneSummary pruneBackups(ChainCache &cache, const RetentionPolicy &policy, time_t now) {
    PruneSummary summary = {0, 0, 0};

    auto quarantine = quarantineBackups(cache);
    summary.quarantined = quarantine.moved;
    summary.failed += quarantine.failed;

    for (auto &decision: decideRetention(cache, now, policy)) {
        DEBUG(D_prune) DFMT(decision.chainStart << ": " << verdict2string(decision.verdict) << " (" << decision.reason << ")");

        if (decision.verdict == KEEP_WHOLE)
            continue;

        auto chain = cache.findChain(decision.chainStart);
        if (chain == NULL)
            continue;

        // newest incremental first, the full last; only the chain's own full is ever a candidate
        vector<string> doomed;
        for (auto it = chain->members.rbegin(); it != chain->members.rend(); ++it) {
            if (*it == chain->start)
                continue;

            if (cache.records.at(*it).isFull()) {
                log("warning: " + *it + " is a full backup inside chain " + chain->start + "; not removing it");
                continue;
            }

            doomed.push_back(*it);
        }

        if (decision.verdict == DELETE_WHOLE)
            doomed.push_back(chain->start);

        for (auto &id: doomed) {
            if (!removeBackup(cache.pathOf(id), decision.reason)) {
                ++summary.failed;
                log("error: stopped pruning chain " + chain->start + " after a failure");
                break;
            }

            ++summary.removed;
        }
    }

    if (summary.removed || summary.quarantined)
        log("prune complete in " + cache.getBaseDir() + ": " + plural(summary.removed, "backup") + " removed, " +
            to_string(summary.quarantined) + " quarantined" + (summary.failed ? ", " + to_string(summary.failed) + " failed" : ""));

    if (!GLOBALS.cli.count(CLI_TEST))
        cache.scan();

    return summary;
}
