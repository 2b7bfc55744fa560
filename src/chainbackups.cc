/*
 * Copyright (C) 2023 Rick Ennis
 * This file is part of chainbackups.
 *
 * chainbackups is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * chainbackups is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with chainbackups.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  chainbackups
 *
 *  chainbackups manages PostgreSQL full + incremental backup chains:
 *
 *  1. Backups
 *
 *     pg_basebackup is run into a work directory under the backup root.  Each
 *     backup gets a small record (chainbackups.meta) naming its kind, its parent
 *     and the full backup that starts its chain.  A new chain is started when the
 *     current full is older than full_interval days.
 *
 *  2. Pruning
 *
 *     Chains other than the most recent are deleted whole once their full is older
 *     than keep_full days; a kept chain loses all of its incrementals at once when
 *     the oldest is older than keep_incremental days.  Backups with a corrupt or
 *     missing record are renamed to Invalid_<name> and never deleted.
 *
 *  3. Restore
 *
 *     The chain ending at a chosen backup is rebuilt from parent links and handed
 *     to pg_combinebackup.
 */

#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <iostream>
#include <fstream>

#include "syslog.h"
#include "unistd.h"

#include "BackupConfig.h"
#include "ChainCache.h"
#include "Retention.h"
#include "Restore.h"
#include "backup.h"
#include "colors.h"
#include "cxxopts.hpp"
#include "debug.h"
#include "exception.h"
#include "globalsdef.h"
#include "help.h"
#include "statistics.h"
#include "util_generic.h"


void sigTermHandler(int sig) {
    string reason = (sig > 0 ? "interrupt" : "error");

    if (GLOBALS.interruptFilename.length()) {
        log("operation aborted on " + reason + (sig > 0 ? ", signal " + to_string(sig) : "") + " (" +
            GLOBALS.interruptFilename + ")");

        cerr << "\n" << reason << ": aborting backup, cleaning up " << GLOBALS.interruptFilename << "... ";

        if (isDirectory(GLOBALS.interruptFilename))
            rmrf(GLOBALS.interruptFilename);

        cerr << "done." << endl;
    }
    else
        if (sig > 0)
            log("operation aborted on " + reason + " (signal " + to_string(sig) + ")");

    if (GLOBALS.interruptLock.length()) unlink(GLOBALS.interruptLock.c_str());

    exit(sig > 0 ? 128 + sig : EXIT_GENERAL);
}


// remove any in-process work directory and the lock, then exit with 'code'
void cleanupAndExit(int code) {
    if (GLOBALS.interruptFilename.length() && isDirectory(GLOBALS.interruptFilename) && !rmrf(GLOBALS.interruptFilename))
        log("error: unable to remove " + GLOBALS.interruptFilename + errtext());

    if (GLOBALS.interruptLock.length())
        unlink(GLOBALS.interruptLock.c_str());

    exit(code);
}


/*
 Take the lock for the backup directory.  A live holder wins unless --force;
 a holder that's gone, or that's held it more than a day, is taken over.
 */
void acquireLock(BackupConfig &config) {
    auto [pid, lockTime] = config.getLockPID();

    if (pid && pid != GLOBALS.pid) {
        if (!kill(pid, 0)) {
            if (GLOBALS.cli.count(CLI_FORCE)) {
                kill(pid, SIGTERM);
                NOTQUIET && cerr << "previous lock (running as pid " << pid << ") released due to --force" << endl;
                log("previous lock (pid " + to_string(pid) + ") on " + config.settings[sDirectory].value + " released due to --force");
            }
            else if (GLOBALS.startupTime - lockTime < LOCK_MAX_SECS) {
                log("skipped run due to lock on " + config.settings[sDirectory].value + " while previous invocation is still running (pid " + to_string(pid) + ")");
                throw CBException(config.settings[sDirectory].value + " is locked while a previous invocation is still running (pid " +
                    to_string(pid) + "); use --force to take over", EXIT_LOCKED);
            }
            else {
                kill(pid, SIGTERM);
                log("warning: abandoning previous lock because its over 24 hours old (pid " + to_string(pid) + ")");
            }
        }
        else
            log("abandoning previous lock because pid " + to_string(pid) + " has vanished");
    }

    GLOBALS.interruptLock = config.setLockPID(GLOBALS.pid);
}


int runCommand(string command, vector<string> &args, BackupConfig &config) {
    RetentionPolicy policy = config.retentionPolicy();
    string backupDir = config.settings[sDirectory].value;

    if (command == CMD_LIST) {
        ChainCache cache(backupDir);
        listChains(cache, policy, time(NULL));
        return EXIT_OK;
    }

    if (command == CMD_BACKUP || command == CMD_PRUNE) {
        if (!GLOBALS.cli.count(CLI_TEST) && mkdirp(backupDir))
            throw CBException("unable to create backup directory " + backupDir + errtext(), EXIT_CONFIG);

        acquireLock(config);
        ChainCache cache(backupDir);

        if (command == CMD_BACKUP) {
            performBackup(config, cache, GLOBALS.cli.count(CLI_FULL));

            if (GLOBALS.cli.count(CLI_NOPRUNE)) {
                DEBUG(D_prune) DFMT("skipping prune due to --" << CLI_NOPRUNE);
                return EXIT_OK;
            }
        }

        auto summary = pruneBackups(cache, policy, time(NULL));
        NOTQUIET && cout << "\t• prune: " << plural(summary.removed, "backup") << " removed, " << summary.quarantined << " quarantined"
            << (summary.failed ? ", " + to_string(summary.failed) + " failed" : "") << endl;

        return (summary.failed ? EXIT_PRUNE_PARTIAL : EXIT_OK);
    }

    if (command == CMD_RESTORE) {
        if (args.size() > 1 && GLOBALS.cli.count(CLI_AT))
            throw CBException("restore takes a target or --at, not both", EXIT_USAGE);

        if (args.size() < 2 && !GLOBALS.cli.count(CLI_AT))
            throw CBException("restore requires a target backup or --at \"YYYY-MM-DD HH:MM:SS\"", EXIT_USAGE);

        acquireLock(config);
        ChainCache cache(backupDir);
        string target;
        string recoveryTarget;

        if (GLOBALS.cli.count(CLI_AT)) {
            recoveryTarget = GLOBALS.cli[CLI_AT].as<string>();
            auto when = utc2time(recoveryTarget);

            if (when == -1)
                throw CBException("unable to parse --" + string(CLI_AT) + " '" + recoveryTarget + "' (expected YYYY-MM-DD HH:MM:SS)", EXIT_USAGE);

            target = resolveTargetAt(cache, when);
        }
        else
            target = resolveTarget(cache, args[1]);

        NOTQUIET && cout << "\t• restoring " << target << endl;
        auto chain = buildRestoreChain(target);
        performRestore(chain, config.settings[sRestoreDir].value, config.settings[sPgBin].value, GLOBALS.cli.count(CLI_FORCE), recoveryTarget);
        return EXIT_OK;
    }

    throw CBException("unknown command '" + command + "'\nUse --help for a list of options.", EXIT_USAGE);
}


/*******************************************************************************
 * main(argc, argv)
 *
 * Main entry point -- where all the magic happens.
 *******************************************************************************/
int main(int argc, char *argv[]) {
    timer AppTimer;
    AppTimer.start();

    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);

    GLOBALS.statsCount = 0;
    GLOBALS.pid = getpid();
    GLOBALS.color = true;

    // default directories
    GLOBALS.confDir = CONF_DIR;
    GLOBALS.cacheDir = CACHE_DIR;

    // overwrite with env vars (if any)
    string temp;
    temp = cppgetenv("CB_CONFDIR");
    if (temp.length()) GLOBALS.confDir = temp;

    temp = cppgetenv("CB_CACHEDIR");
    if (temp.length()) GLOBALS.cacheDir = temp;

    temp = cppgetenv("CB_LOGDIR");
    if (temp.length()) GLOBALS.logDir = temp;

    time(&GLOBALS.startupTime);
    openlog("chainbackups", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("chainbackups", "Manage PostgreSQL full + incremental backup chains");

    options.add_options()(string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        string("t,") + CLI_TEST, "Test only mode", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        string("f,") + CLI_FORCE, "Force various things", cxxopts::value<bool>()->default_value("false"))(
        CLI_LIST, "List chains", cxxopts::value<bool>()->default_value("false"))(
        CLI_FULL, "Force a full backup", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOPRUNE, "Disable pruning", cxxopts::value<bool>()->default_value("false"))(
        CLI_SAVE, "Save config", cxxopts::value<bool>()->default_value("false"))(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_AT, "Restore point in time", cxxopts::value<std::string>())(
        CLI_DIR, "Backup directory", cxxopts::value<std::string>())(
        CLI_RESTOREDIR, "Restore directory", cxxopts::value<std::string>())(
        CLI_INTERVAL, "Full backup interval days", cxxopts::value<std::string>())(
        CLI_KEEPFULL, "Keep chains days", cxxopts::value<std::string>())(
        CLI_KEEPINC, "Keep incrementals days", cxxopts::value<std::string>())(
        CLI_PGBIN, "PostgreSQL bin directory", cxxopts::value<std::string>())(
        CLI_PGOPTS, "Extra pg_basebackup options", cxxopts::value<std::string>())(
        CLI_CONFDIR, "Configuration directory", cxxopts::value<std::string>())(
        CLI_CACHEDIR, "Cache directory", cxxopts::value<std::string>())(
        CLI_LOGDIR, "Log directory", cxxopts::value<std::string>())(
        CLI_COMMAND, "Command", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({CLI_COMMAND});

    try {
        options.allow_unrecognised_options();  // to support -v...
        GLOBALS.cli = options.parse(argc, argv);
        GLOBALS.color = !(GLOBALS.cli[CLI_QUIET].as<bool>() || GLOBALS.cli[CLI_NOCOLOR].as<bool>());

        if (GLOBALS.cli.count(CLI_CONFDIR))
            GLOBALS.confDir = GLOBALS.cli[CLI_CONFDIR].as<string>();

        if (GLOBALS.cli.count(CLI_CACHEDIR))
            GLOBALS.cacheDir = GLOBALS.cli[CLI_CACHEDIR].as<string>();

        if (GLOBALS.cli.count(CLI_LOGDIR))
            GLOBALS.logDir = GLOBALS.cli[CLI_LOGDIR].as<string>();

        /* Enable selective debugging
         * (code taken from Exim MTA - Philip Hazel)
         */
        GLOBALS.debugSelector = 0;
        for (auto uarg : GLOBALS.cli.unmatched()) {
            if (uarg == "--vv") {
                GLOBALS.debugSelector = D_all;
                continue;
            }
            else if (uarg.length() > 2) {
                string op = uarg.substr(2, 1);

                if (uarg.substr(0, 2) == "-v" && (op == "=" || op == "-" || op == "+")) {
                    unsigned int selector = D_default;
                    string remainder = uarg.substr(2, string::npos);
                    uschar *usc = (uschar *)remainder.c_str();

                    if (!decode_bits(&selector, 1, debug_notall, usc, debug_options, ndebug_options))
                        exit(EXIT_USAGE);

                    GLOBALS.debugSelector = selector;
                    continue;
                }
            }
            else if (uarg == "-v") {
                GLOBALS.debugSelector = D_default;
                continue;
            }

            /* ----------------------------------- */

            SCREENERR("error: unrecognized parameter " << uarg
                      << "\nUse --help for a list of options.");
            exit(EXIT_USAGE);
        }
    }
    catch (cxxopts::exceptions::exception &e) {
        cerr << "chainbackups: " << e.what() << endl;
        exit(EXIT_USAGE);
    }

    if (GLOBALS.cli.count(CLI_DEFAULTS)) {
        showHelp(hDefaults);
        exit(EXIT_OK);
    }

    if (GLOBALS.cli.count(CLI_HELP)) {
        showHelp(hOptions);
        exit(EXIT_OK);
    }

    if (GLOBALS.cli.count(CLI_VERSION)) {
        cout << "chainbackups " << VERSION << "\n";
        cout << "(c) 2023 released under GPLv3." << endl;
        exit(EXIT_OK);
    }

    vector<string> args;
    if (GLOBALS.cli.count(CLI_COMMAND))
        args = GLOBALS.cli[CLI_COMMAND].as<vector<string>>();

    if (GLOBALS.cli.count(CLI_LIST))
        args.insert(args.begin(), CMD_LIST);

    if (!args.size() && !GLOBALS.cli.count(CLI_SAVE)) {
        showHelp(hSyntax);
        exit(EXIT_USAGE);
    }

    if (args.size() > (args.size() && args[0] == CMD_RESTORE ? 2u : 1u)) {
        SCREENERR("error: unexpected argument " << args.back() << "\nUse --help for a list of options.");
        exit(EXIT_USAGE);
    }

    int result = EXIT_OK;

    try {
        DEBUG(D_config) DFMT("confdir " << GLOBALS.confDir << ", cachedir " << GLOBALS.cacheDir);
        BackupConfig config;
        config.resolve(GLOBALS.confDir, GLOBALS.cli);

        DEBUG(D_config) config.fullDump();

        if (GLOBALS.cli.count(CLI_SAVE))
            config.saveConfig();

        if (args.size())
            result = runCommand(args[0], args, config);

        if (GLOBALS.interruptLock.length())
            GLOBALS.interruptLock = config.setLockPID(0);
    }
    catch (CBException &e) {
        log("aborting due to " + commafy(e.detail()));
        SCREENERR("error: " << e.detail());
        cleanupAndExit(e.exitCode());
    }
    catch (std::exception &e) {
        log("aborting due to unexpected error: " + string(e.what()));
        SCREENERR("error: " << e.what());
        cleanupAndExit(EXIT_GENERAL);
    }

    AppTimer.stop();
    DEBUG(D_any) DFMT("completed in " << AppTimer.elapsed(3) << " with " << plural(GLOBALS.statsCount, "stat") << ", exit " << result);

    return result;
}
