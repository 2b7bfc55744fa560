#ifndef CHAINCACHE_H
#define CHAINCACHE_H

#include <string>
#include <vector>
#include <map>
#include "BackupRecord.h"
#include "util_generic.h"
#include "globals.h"


using namespace std;


/* A chain is every valid record sharing a chain_start.  Members are ids into
   ChainCache::records, ordered by id (which is creation order). */
struct Chain {
    string start;
    vector<string> members;
    time_t startTime;           // the full's timestamp; earliest member if orphaned
    bool orphaned;
    string problem;             // why it's orphaned

    Chain() : startTime(0), orphaned(false) {}
};


struct CorruptEntry {
    string path;
    string reason;
};


class ChainCache {
private:
    string baseDir;

    void loadEntry(string path, string name, struct stat &statData);
    void buildChains();

public:
    map<string, BackupRecord> records;      // valid records by id
    vector<CorruptEntry> corrupt;
    vector<string> quarantined;
    vector<string> inProcess;
    vector<Chain> chains;                   // ascending by startTime, then id

    void scan(string dir = "");
    string getBaseDir() const { return baseDir; }
    string pathOf(string id) const { return slashConcat(baseDir, id); }

    const BackupRecord* findRecord(string id) const;
    const Chain* findChain(string start) const;
    const Chain* mostRecentChain() const;
    const BackupRecord* newestRecord() const;

    ChainCache(string dir = "");
};

#endif
