#ifndef BACKUP_H
#define BACKUP_H

#include <string>
#include <time.h>
#include "BackupConfig.h"
#include "ChainCache.h"


using namespace std;

struct BackupPlan {
    BackupKind kind;
    string parent;
    string chainStart;
    string reason;
};

BackupPlan planBackup(const ChainCache &cache, time_t now, int fullIntervalDays, bool forceFull);

// takes the backup and returns its directory ("" in test mode)
string performBackup(BackupConfig &config, ChainCache &cache, bool forceFull);

#endif
