#include <fstream>
#include <sstream>
#include <set>
#include <errno.h>
#include <unistd.h>
#include <stdio.h>
#include <pcre++.h>

#include "BackupRecord.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"

using namespace pcrepp;


BackupRecord::BackupRecord(string anId, time_t when, BackupKind aKind, string aParent, string aChainStart) {
    id = anId;
    timestamp = when;
    kind = aKind;
    parent = aParent;
    chainStart = aChainStart;
}


string BackupRecord::kindName() const {
    return (kind == FULL ? "full" : "incremental");
}


string BackupRecord::record2string() const {
    string result = "# chainbackups backup record\n";

    result += blockp("timestamp:", -14) + time2utc(timestamp) + "\n";
    result += blockp("kind:", -14) + kindName() + "\n";
    result += blockp("parent:", -14) + parent + "\n";
    result += blockp("chain_start:", -14) + chainStart + "\n";

    return result;
}


string makeBackupId(time_t when, BackupKind kind) {
    return time2utc(when, ID_TIME_FORMAT) + (kind == FULL ? "_full" : "_incremental");
}


bool string2kind(string text, BackupKind &kind) {
    if (text == "full")
        kind = FULL;
    else if (text == "incremental")
        kind = INCREMENTAL;
    else
        return false;

    return true;
}


static RecordRead corrupt(BackupRecord &record, string reason) {
    DEBUG(D_meta) DFMT(record.id << ": " << reason);
    return {rsCorrupt, record, reason};
}


RecordRead readRecord(string backupDir) {
    string recordFilename = slashConcat(backupDir, RECORD_FILENAME);
    BackupRecord record(pathSplit(backupDir).file);
    struct stat statBuf;

    if (mystat(recordFilename, &statBuf)) {
        if (errno == ENOENT || errno == ENOTDIR) {
            DEBUG(D_meta) DFMT(record.id << ": no record");
            return {rsAbsent, record, ""};
        }

        return corrupt(record, "unable to stat " + recordFilename + errtext());
    }

    if (!S_ISREG(statBuf.st_mode))
        return corrupt(record, recordFilename + " is not a regular file");

    ifstream recordFile;
    recordFile.open(recordFilename);

    if (!recordFile.is_open())
        return corrupt(record, "unable to read " + recordFilename + errtext());

    Pcre reBlank(RE_BLANK);
    Pcre reLine("^\\s*(\\w+)\\s*[:=]\\s*(.*?)\\s*$");
    set<string> seen;
    string dataLine;
    unsigned int line = 0;

    while (getline(recordFile, dataLine)) {
        ++line;

        if (reBlank.search(dataLine))
            continue;

        if (!reLine.search(dataLine) || reLine.matches() < 2)
            return corrupt(record, "unparsable line " + to_string(line));

        string key = reLine.get_match(0);
        string value = reLine.get_match(1);

        if (!seen.insert(key).second)
            return corrupt(record, "duplicate " + key + " on line " + to_string(line));

        if (key == "timestamp") {
            record.timestamp = utc2time(value);
            if (record.timestamp == -1)
                return corrupt(record, "invalid timestamp '" + value + "'");
        }
        else if (key == "kind") {
            if (!string2kind(value, record.kind))
                return corrupt(record, "unknown kind '" + value + "'");
        }
        else if (key == "parent")
            record.parent = value;
        else if (key == "chain_start")
            record.chainStart = value;
        else
            return corrupt(record, "unknown key '" + key + "' on line " + to_string(line));
    }

    if (recordFile.bad())
        return corrupt(record, "read error on " + recordFilename);

    if (!seen.count("timestamp"))
        return corrupt(record, "missing timestamp");

    if (!seen.count("kind"))
        return corrupt(record, "missing kind");

    if (!record.chainStart.length())
        return corrupt(record, "missing chain_start");

    if (record.isFull() && record.parent.length())
        return corrupt(record, "full backup with parent " + record.parent);

    if (!record.isFull() && !record.parent.length())
        return corrupt(record, "incremental backup without a parent");

    if (record.isFull() && record.chainStart != record.id)
        return corrupt(record, "full backup with chain_start " + record.chainStart);

    DEBUG(D_meta) DFMT(record.id << ": " << record.kindName() << ", chain " << record.chainStart);
    return {rsValid, record, ""};
}


void writeRecord(string backupDir, const BackupRecord &record) {
    string recordFilename = slashConcat(backupDir, RECORD_FILENAME);
    string tempFilename = recordFilename + ".tmp." + to_string(GLOBALS.pid);

    ofstream recordFile;
    recordFile.open(tempFilename);

    if (!recordFile.is_open())
        throw CBException("unable to create " + tempFilename + errtext());

    recordFile << record.record2string();
    recordFile.flush();

    if (!recordFile.good()) {
        recordFile.close();
        unlink(tempFilename.c_str());
        throw CBException("unable to write " + tempFilename);
    }

    recordFile.close();

    if (rename(tempFilename.c_str(), recordFilename.c_str())) {
        string err = "unable to rename " + tempFilename + " to " + recordFilename + errtext();
        unlink(tempFilename.c_str());
        throw CBException(err);
    }

    DEBUG(D_meta) DFMT("wrote " << recordFilename);
}
