#ifndef BACKUPRECORD_H
#define BACKUPRECORD_H

#include <string>
#include <time.h>
#include "globals.h"


using namespace std;

enum BackupKind { FULL, INCREMENTAL };

// outcome of reading a record file; rsAbsent is not an error
enum RecordStatus { rsValid, rsAbsent, rsCorrupt };


class BackupRecord {
public:
    string id;              // directory name, "<UTC time>_<kind>"
    time_t timestamp;
    BackupKind kind;
    string parent;          // empty for a full
    string chainStart;      // id of the full that begins the chain

    bool isFull() const { return kind == FULL; }
    string kindName() const;
    string record2string() const;

    BackupRecord(string anId = "", time_t when = 0, BackupKind aKind = FULL, string aParent = "", string aChainStart = "");
};


struct RecordRead {
    RecordStatus status;
    BackupRecord record;
    string reason;          // why it's corrupt
};


string makeBackupId(time_t when, BackupKind kind);
bool string2kind(string text, BackupKind &kind);

RecordRead readRecord(string backupDir);
void writeRecord(string backupDir, const BackupRecord &record);

#endif
