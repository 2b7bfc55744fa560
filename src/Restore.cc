#include <set>
#include <list>
#include <unistd.h>

#include "Restore.h"
#include "ToolExec.h"
#include "exception.h"
#include "colors.h"
#include "debug.h"


static void broken(string message) {
    log("error: broken restore chain: " + message);
    throw CBException("broken restore chain: " + message, EXIT_BROKEN_CHAIN);
}


vector<string> buildRestoreChain(string targetPath) {
    while (targetPath.length() > 1 && targetPath.back() == '/')
        targetPath.pop_back();

    string root = pathSplit(targetPath).dir;
    list<pair<string, BackupRecord>> chain;
    set<string> seen;
    string current = targetPath;

    if (pathSplit(targetPath).file.find(QUARANTINE_PREFIX) == 0)
        broken(targetPath + " is quarantined");

    while (true) {
        if (!isDirectory(current))
            broken(current + " does not exist");

        auto result = readRecord(current);

        if (result.status == rsAbsent)
            broken("no " RECORD_FILENAME " in " + current);

        if (result.status == rsCorrupt)
            broken(current + " has a corrupt record (" + result.reason + ")");

        if (!seen.insert(result.record.id).second)
            broken("cycle at " + result.record.id);

        DEBUG(D_restore) DFMT(result.record.id << " (" << result.record.kindName() << ")" <<
            (result.record.parent.length() ? " -> " + result.record.parent : ""));

        chain.push_front({current, result.record});

        if (!result.record.parent.length())
            break;

        current = slashConcat(root, result.record.parent);
    }

    auto &full = chain.front().second;
    if (!full.isFull())
        broken(full.id + " starts the chain but isn't a full backup");

    vector<string> paths;
    const BackupRecord *previous = NULL;

    for (auto &[path, record]: chain) {
        if (record.chainStart != full.id)
            broken(record.id + " names chain start " + record.chainStart + " but the chain begins at " + full.id);

        if (previous != NULL && record.timestamp <= previous->timestamp)
            broken(record.id + " is not newer than its parent " + previous->id);

        paths.push_back(path);
        previous = &record;
    }

    return paths;
}


string resolveTarget(const ChainCache &cache, string target) {
    if (target.find('/') == string::npos && isDirectory(cache.pathOf(target)))
        return cache.pathOf(target);

    if (isDirectory(target))
        return target;

    log("error: restore target " + target + " not found");
    throw CBException("restore target " + target + " not found", EXIT_BROKEN_CHAIN);
}


string resolveTargetAt(const ChainCache &cache, time_t when) {
    set<string> orphans;
    const BackupRecord *best = NULL;

    for (auto &chain: cache.chains)
        if (chain.orphaned)
            orphans.insert(chain.members.begin(), chain.members.end());

    for (auto &[id, record]: cache.records) {
        if (orphans.count(id) || record.timestamp > when)
            continue;

        if (best == NULL || record.timestamp > best->timestamp || (record.timestamp == best->timestamp && id > best->id))
            best = &record;
    }

    if (best == NULL) {
        log("error: no backup found at or before " + time2utc(when));
        throw CBException("no backup found at or before " + time2utc(when), EXIT_BROKEN_CHAIN);
    }

    DEBUG(D_restore) DFMT(time2utc(when) << " resolves to " << best->id);
    return cache.pathOf(best->id);
}


void performRestore(const vector<string> &chain, string restoreDir, string pgBinDir, bool force, string recoveryTarget) {
    if (chain.empty())
        throw CBException("nothing to restore", EXIT_BROKEN_CHAIN);

    NOTQUIET && cout << "\t• restore chain:" << endl;
    for (auto &path: chain)
        NOTQUIET && cout << "\t    " << path << endl;

    if (dirEntryCount(restoreDir) > 0) {
        if (!force)
            throw CBException("restore directory " + restoreDir + " is not empty (use --force to clear it)", EXIT_RESTORE);

        if (GLOBALS.cli.count(CLI_TEST))
            cout << YELLOW << " TESTMODE: would have cleared " << restoreDir << RESET << endl;
        else {
            if (!rmrf(restoreDir, false))
                throw CBException("unable to clear restore directory " + restoreDir + errtext(), EXIT_RESTORE);

            log("cleared restore directory " + restoreDir);
        }
    }

    vector<string> args = {"-o", restoreDir};
    args.insert(args.end(), chain.begin(), chain.end());
    ToolExec tool(slashConcat(pgBinDir, "pg_combinebackup"), args);

    if (GLOBALS.cli.count(CLI_TEST)) {
        cout << YELLOW << " TESTMODE: would have run " << tool.commandLine() << RESET << endl;
        return;
    }

    if (mkdirp(restoreDir))
        throw CBException("unable to create restore directory " + restoreDir + errtext(), EXIT_RESTORE);

    timer restoreTimer;
    restoreTimer.start();
    NOTQUIET && cout << "\t• combining " << plural(chain.size(), "backup") << " into " << restoreDir << endl;

    auto status = tool.execute();
    restoreTimer.stop();

    if (status) {
        string output = trimSpace(tool.errorOutput());
        log("error: pg_combinebackup exited with " + to_string(status) + (output.length() ? ": " + output : ""));
        throw CBException("pg_combinebackup failed (exit " + to_string(status) + ")" + (output.length() ? "\n" + output : ""), EXIT_RESTORE);
    }

    if (dirEntryCount(restoreDir) <= 0)
        throw CBException(log("error: pg_combinebackup left " + restoreDir + " empty"), EXIT_RESTORE);

    log("restored " + chain.back() + " into " + restoreDir + " (" + plural(chain.size(), "backup") + ", " + restoreTimer.elapsed() + ")");

    if (NOTQUIET) {
        cout << "\t• restore complete in " << restoreTimer.elapsed() << endl << endl;
        cout << "A complete data directory has been created in " << restoreDir << "." << endl;
        cout << "To finish recovery:" << endl;
        cout << "1. Set the recovery target in " << slashConcat(restoreDir, "postgresql.conf") << ", for example:" << endl;
        cout << "   recovery_target_time = '" << (recoveryTarget.length() ? recoveryTarget : time2utc(time(NULL), "%Y-%m-%d %H:%M:%S")) << "'" << endl;
        cout << "   recovery_target_action = 'promote'" << endl;
        cout << "2. touch " << slashConcat(restoreDir, "recovery.signal") << endl;
        cout << "3. chown -R postgres:postgres " << restoreDir << endl;
        cout << "4. Start PostgreSQL on the new data directory." << endl;
    }
}
