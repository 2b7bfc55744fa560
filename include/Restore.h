#ifndef RESTORE_H
#define RESTORE_H

#include <string>
#include <vector>
#include <time.h>
#include "ChainCache.h"


using namespace std;

/* buildRestoreChain() walks parent links from the target back to its full
   backup and returns the directories full first, target last.  Anything short
   of a complete, consistent chain throws CBException(EXIT_BROKEN_CHAIN). */
vector<string> buildRestoreChain(string targetPath);

// a path to a backup or a bare id under the backup root
string resolveTarget(const ChainCache &cache, string target);

// newest valid backup at or before 'when' that isn't in an orphaned chain
string resolveTargetAt(const ChainCache &cache, time_t when);

void performRestore(const vector<string> &chain, string restoreDir, string pgBinDir, bool force, string recoveryTarget = "");

#endif
