
#include <map>
#include <vector>
#include <math.h>

#include "statistics.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"

using namespace std;


static string verdictColor(ChainVerdict verdict) {
    return (verdict == DELETE_WHOLE ? RED : verdict == KEEP_FULL_ONLY ? YELLOW : GREEN);
}


static void displaySectionIntro(const ChainCache &cache, const RetentionPolicy &policy) {
    auto line = horizontalLine(72);

    string introSummary = line + "\n";
    introSummary += "Directory: " + cache.getBaseDir() + "\n";
    introSummary += plural(cache.records.size(), "backup") + " in " + plural(cache.chains.size(), "chain") + "\n";
    introSummary += "Retention: chains " + to_string(policy.keepFullDays) + " days, incrementals " + to_string(policy.keepIncrementalDays) + " days\n";

    for (auto &path: cache.inProcess)
        introSummary += YELLOW + path + RESET + " (in process)\n";

    cout << introSummary << line << endl;
}


/*
 One block per chain, oldest first:

    2023-01-14_12-00-00_full                 full    12.0d
      2023-01-15_12-00-00_incremental        inc     11.0d
    → keep (most recent chain)
 */
void listChains(const ChainCache &cache, const RetentionPolicy &policy, time_t now) {
    map<string, ChainDecision> decisions;

    for (auto &decision: decideRetention(cache, now, policy))
        decisions.insert(decisions.end(), pair<string, ChainDecision>(decision.chainStart, decision));

    displaySectionIntro(cache, policy);

    for (auto &chain: cache.chains) {
        cout << endl;

        for (auto &member: chain.members) {
            auto &record = cache.records.at(member);
            string age = fixedPoint(dayAge(record.timestamp, now)) + "d";

            cout << (member == chain.start ? "  " : "    ") << blockp(member, member == chain.start ? -40 : -38)
                << blockp(record.isFull() ? "full" : "inc", -6) << blockp(age, 8) << endl;
        }

        if (chain.orphaned)
            cout << "  " << RED << "→ orphaned, left untouched: " << chain.problem << RESET << endl;
        else {
            auto decision = decisions.find(chain.start);
            if (decision != decisions.end())
                cout << "  " << verdictColor(decision->second.verdict) << "→ " << verdict2string(decision->second.verdict)
                    << " (" << decision->second.reason << ")" << RESET << endl;
        }
    }

    if (cache.corrupt.size() || cache.quarantined.size())
        cout << endl << horizontalLine(72) << endl;

    for (auto &entry: cache.corrupt)
        cout << YELLOW << "corrupt: " << entry.path << " (" << entry.reason << "), will be quarantined" << RESET << endl;

    for (auto &path: cache.quarantined)
        cout << "quarantined: " << path << endl;

    if (!cache.chains.size())
        cout << "\n(no backups found)" << endl;
}
