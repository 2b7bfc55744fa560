#ifndef RETENTION_H
#define RETENTION_H

#include <string>
#include <vector>
#include <time.h>
#include "ChainCache.h"


using namespace std;

struct RetentionPolicy {
    int keepFullDays;
    int keepIncrementalDays;
};

enum ChainVerdict { KEEP_WHOLE, KEEP_FULL_ONLY, DELETE_WHOLE };

struct ChainDecision {
    string chainStart;
    ChainVerdict verdict;
    double fullAgeDays;
    double oldestIncAgeDays;        // -1 when the chain has no incrementals
    bool current;                   // the most recent chain
    string reason;
};

struct PruneSummary {
    unsigned int removed;
    unsigned int failed;
    unsigned int quarantined;
};

string verdict2string(ChainVerdict verdict);

// pure: no filesystem access.  orphaned chains get no decision at all.
vector<ChainDecision> decideRetention(const ChainCache &cache, time_t now, const RetentionPolicy &policy);

// quarantine, then apply decisions.  the cache is rescanned afterwards.
PruneSummary pruneBackups(ChainCache &cache, const RetentionPolicy &policy, time_t now);

#endif
