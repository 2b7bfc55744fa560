#include <algorithm>
#include <set>
#include <dirent.h>
#include <unistd.h>
#include <string.h>
#include <pcre++.h>

#include "ChainCache.h"
#include "exception.h"
#include "colors.h"
#include "debug.h"

using namespace pcrepp;


ChainCache::ChainCache(string dir) {
    baseDir = dir;

    if (dir.length())
        scan();
}


void ChainCache::loadEntry(string path, string name, struct stat &statData) {
    Pcre workRE(WORKDIR_REGEX);
    Pcre idRE(ID_REGEX);

    if (name.find(QUARANTINE_PREFIX) == 0) {
        DEBUG(D_scan) DFMT("quarantined " << name);
        quarantined.push_back(path);
        return;
    }

    // an in-process backup or a deletion that was interrupted
    if (workRE.search(name)) {
        inProcess.push_back(path);

        if (GLOBALS.startupTime - statData.st_mtime > ABANDONED_SECS) {
            if (GLOBALS.cli.count(CLI_TEST))
                cout << YELLOW << " TESTMODE: would have cleaned up abandoned work directory " + path + " (" + timeDiff(mktimeval(statData.st_mtime)) + ")" << RESET << endl;
            else
                if (rmrf(path))
                    log("warning: cleaned up abandoned work directory " + path + " (" + timeDiff(mktimeval(statData.st_mtime)) + ")");
                else
                    log("error: unable to remove abandoned work directory " + path + " (running as uid " + to_string(geteuid()) + ")");
        }

        return;
    }

    auto result = readRecord(path);

    switch (result.status) {
        case rsValid:
            records.insert(records.end(), pair<string, BackupRecord>(name, result.record));
            break;

        case rsCorrupt:
            corrupt.push_back({path, result.reason});
            break;

        case rsAbsent:
            // only a name that claims to be a backup is missing its record
            if (idRE.search(name))
                corrupt.push_back({path, "no " RECORD_FILENAME " found"});
            else
                DEBUG(D_scan) DFMT("skipping " << name << " (not a backup)");
            break;
    }
}


/*
 Group records by chain_start and flag orphans, gaps and branching.
 Only orphaning changes how a chain is treated; the others are reported.
 */
void ChainCache::buildChains() {
    map<string, Chain> byStart;

    for (auto &[id, record]: records) {
        auto &chain = byStart[record.chainStart];
        chain.start = record.chainStart;
        chain.members.push_back(id);     // map order keeps these sorted by id
    }

    for (auto &[start, chain]: byStart) {
        auto full = findRecord(start);

        if (full == NULL)
            chain.problem = "chain start " + start + " not found";
        else if (!full->isFull())
            chain.problem = "chain start " + start + " is not a full backup";
        else if (full->chainStart != start)
            chain.problem = "chain start " + start + " belongs to chain " + full->chainStart;

        if (chain.problem.length()) {
            chain.orphaned = true;
            chain.startTime = records.at(chain.members.front()).timestamp;
            for (auto &member: chain.members)
                chain.startTime = min(chain.startTime, records.at(member).timestamp);

            log("error: orphaned chain in " + baseDir + ": " + chain.problem + " (" + plural(chain.members.size(), "backup") + " left untouched)");
            SCREENERR("error: orphaned chain: " << chain.problem);
        }
        else
            chain.startTime = full->timestamp;

        set<string> parents;
        for (auto &member: chain.members) {
            auto &record = records.at(member);

            if (record.isFull()) {
                if (member != start) {
                    log("warning: " + member + " is a second full backup in chain " + start);
                    NOTQUIET && cout << YELLOW << "\t• warning: " << member << " is a second full backup in chain " << start << RESET << endl;
                }
                continue;
            }

            auto parent = findRecord(record.parent);
            if (parent == NULL || parent->chainStart != start) {
                log("warning: gap in chain " + start + ": parent " + record.parent + " of " + member + " is missing");
                NOTQUIET && cout << YELLOW << "\t• warning: gap in chain " << start << " before " << member << RESET << endl;
            }

            if (!parents.insert(record.parent).second) {
                log("warning: chain " + start + " branches at " + record.parent + " (unsupported)");
                NOTQUIET && cout << YELLOW << "\t• warning: chain " << start << " branches at " << record.parent << RESET << endl;
            }
        }

        chains.push_back(chain);
    }

    sort(chains.begin(), chains.end(), [](const Chain &a, const Chain &b) {
        return (a.startTime == b.startTime ? a.start < b.start : a.startTime < b.startTime);
    });

    DEBUG(D_chain) {
        for (auto &chain: chains)
            DFMT(chain.start << ": " << plural(chain.members.size(), "member") << (chain.orphaned ? " (orphaned)" : ""));
    }
}


// immediate subdirectories of the backup root only; backups themselves aren't descended into
void ChainCache::scan(string dir) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    timer scanTimer;

    if (dir.length())
        baseDir = dir;

    records.clear();
    corrupt.clear();
    quarantined.clear();
    inProcess.clear();
    chains.clear();

    scanTimer.start();

    if ((dirPtr = opendir(baseDir.c_str())) == NULL)
        throw CBException("unable to read backup directory " + baseDir + errtext(), EXIT_CONFIG);

    vector<string> names;
    while ((dirEntry = readdir(dirPtr)) != NULL)
        if (strcmp(dirEntry->d_name, ".") && strcmp(dirEntry->d_name, ".."))
            names.push_back(dirEntry->d_name);

    closedir(dirPtr);
    sort(names.begin(), names.end());

    for (auto &name: names) {
        string path = slashConcat(baseDir, name);
        struct stat statData;

        if (mystat(path, &statData) || !S_ISDIR(statData.st_mode)) {
            DEBUG(D_scan) DFMT("skipping " << name << " (not a directory)");
            continue;
        }

        loadEntry(path, name, statData);
    }

    buildChains();
    scanTimer.stop();

    DEBUG(D_scan) DFMT(baseDir << ": " << plural(records.size(), "valid backup") << ", " << corrupt.size() << " corrupt, " <<
        quarantined.size() << " quarantined, " << plural(chains.size(), "chain") << " in " << scanTimer.elapsed(5));
}


const BackupRecord* ChainCache::findRecord(string id) const {
    auto it = records.find(id);
    return (it == records.end() ? NULL : &it->second);
}


const Chain* ChainCache::findChain(string start) const {
    for (auto &chain: chains)
        if (chain.start == start)
            return &chain;

    return NULL;
}


const Chain* ChainCache::mostRecentChain() const {
    for (auto it = chains.rbegin(); it != chains.rend(); ++it)
        if (!it->orphaned)
            return &*it;

    return NULL;
}


// newest by timestamp, ties broken by id
const BackupRecord* ChainCache::newestRecord() const {
    const BackupRecord *newest = NULL;

    for (auto &[id, record]: records)
        if (newest == NULL || record.timestamp > newest->timestamp ||
            (record.timestamp == newest->timestamp && id > newest->id))
            newest = &record;

    return newest;
}
