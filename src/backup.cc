#include <fstream>
#include <sstream>
#include <unistd.h>
#include <stdio.h>
#include <pcre++.h>

#include "backup.h"
#include "ToolExec.h"
#include "exception.h"
#include "colors.h"
#include "debug.h"

using namespace pcrepp;


BackupPlan planBackup(const ChainCache &cache, time_t now, int fullIntervalDays, bool forceFull) {
    BackupPlan plan = {FULL, "", "", ""};

    if (forceFull) {
        plan.reason = "full backup requested";
        return plan;
    }

    auto newest = cache.newestRecord();
    if (newest == NULL) {
        plan.reason = "no previous backup";
        return plan;
    }

    auto chain = cache.findChain(newest->chainStart);
    if (chain == NULL || chain->orphaned) {
        plan.reason = "newest backup " + newest->id + " is in an orphaned chain";
        return plan;
    }

    auto full = cache.findRecord(newest->chainStart);
    if (full == NULL) {
        plan.reason = "chain start " + newest->chainStart + " is unreadable";
        return plan;
    }

    if (!exists(slashConcat(cache.pathOf(newest->id), MANIFEST_FILENAME))) {
        plan.reason = "no " MANIFEST_FILENAME " in " + newest->id;
        return plan;
    }

    auto age = dayAge(full->timestamp, now);
    if (age >= fullIntervalDays) {
        plan.reason = "last full is " + fixedPoint(age) + " days old (full_interval " + to_string(fullIntervalDays) + ")";
        return plan;
    }

    plan.kind = INCREMENTAL;
    plan.parent = newest->id;
    plan.chainStart = newest->chainStart;
    plan.reason = "incremental on " + newest->id;
    return plan;
}


static void abandonBackup(string workDir, string message, string toolOutput = "") {
    if (exists(workDir) && !rmrf(workDir))
        log("error: unable to remove failed backup " + workDir + errtext());

    GLOBALS.interruptFilename = "";
    log("error: backup failed: " + message + (toolOutput.length() ? " (" + toolOutput + ")" : ""));
    throw CBException("backup failed: " + message + (toolOutput.length() ? "\n" + toolOutput : ""), EXIT_BACKUP);
}


// the manifest's Backup-Mode, when present, has to agree with what we asked for
static string manifestMode(string manifestFilename) {
    ifstream manifest;
    manifest.open(manifestFilename);

    if (!manifest.is_open())
        return "";

    stringstream buffer;
    buffer << manifest.rdbuf();
    manifest.close();

    Pcre modeRE("\"Backup-Mode\"\\s*:\\s*\"(\\w+)\"");
    if (modeRE.search(buffer.str()) && modeRE.matches())
        return modeRE.get_match(0);

    return "";
}


string performBackup(BackupConfig &config, ChainCache &cache, bool forceFull) {
    time_t now = time(NULL);
    auto plan = planBackup(cache, now, config.settings[sInterval].ivalue(), forceFull);

    // ids must be strictly ascending
    auto newest = cache.newestRecord();
    while (newest != NULL && now <= newest->timestamp) {
        sleep(1);
        now = time(NULL);
    }

    BackupRecord record(makeBackupId(now, plan.kind), now, plan.kind, plan.parent, plan.kind == FULL ? "" : plan.chainStart);
    if (record.isFull())
        record.chainStart = record.id;

    string finalDir = cache.pathOf(record.id);
    string workDir = finalDir + ".tmp." + to_string(GLOBALS.pid);

    vector<string> args = {"--pgdata=" + workDir, "--format=p", "--verbose"};
    if (!record.isFull())
        args.push_back("--incremental=" + slashConcat(cache.pathOf(record.parent), MANIFEST_FILENAME));

    for (auto &opt: string2vectorOnSpace(config.settings[sPgOpts].value, true, true))
        args.push_back(opt);

    ToolExec tool(slashConcat(config.settings[sPgBin].value, "pg_basebackup"), args);
    DEBUG(D_backup) DFMT(record.kindName() << " backup: " << plan.reason);

    if (GLOBALS.cli.count(CLI_TEST)) {
        cout << YELLOW << " TESTMODE: would have taken a " << record.kindName() << " backup (" << plan.reason << ") via " << tool.commandLine() << RESET << endl;
        return "";
    }

    if (exists(finalDir))
        throw CBException(log("error: backup " + finalDir + " already exists"), EXIT_BACKUP);

    NOTQUIET && cout << "\t• starting " << record.kindName() << " backup " << record.id << " (" << plan.reason << ")" << endl;
    log("starting " + record.kindName() + " backup " + record.id + " (" + plan.reason + ")");

    timer backupTimer;
    backupTimer.start();
    GLOBALS.interruptFilename = workDir;

    auto status = tool.execute();
    backupTimer.stop();

    if (status)
        abandonBackup(workDir, "pg_basebackup exited with " + to_string(status), trimSpace(tool.errorOutput()));

    if (dirEntryCount(workDir) <= 0)
        abandonBackup(workDir, "pg_basebackup produced no data");

    string manifestFilename = slashConcat(workDir, MANIFEST_FILENAME);
    if (!exists(manifestFilename))
        abandonBackup(workDir, "pg_basebackup produced no " MANIFEST_FILENAME);

    string mode = manifestMode(manifestFilename);
    if (mode.length() && mode != record.kindName())
        abandonBackup(workDir, MANIFEST_FILENAME " reports a " + mode + " backup, expected " + record.kindName());

    try {
        writeRecord(workDir, record);
    }
    catch (CBException &e) {
        abandonBackup(workDir, e.detail());
    }

    if (rename(workDir.c_str(), finalDir.c_str()))
        abandonBackup(workDir, "unable to rename " + workDir + " to " + finalDir + errtext());

    GLOBALS.interruptFilename = "";

    NOTQUIET && cout << "\t• completed " << record.kindName() << " backup " << finalDir << " in " << backupTimer.elapsed() << endl;
    log("completed " + record.kindName() + " backup " + finalDir + " in " + backupTimer.elapsed() +
        (record.isFull() ? "" : " (parent " + record.parent + ")"));

    cache.scan();
    return finalDir;
}
