
#include <iostream>
#include <string>
#include "help.h"
#include "BackupConfig.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind) {
    switch (kind) {
        case hDefaults: {
            BackupConfig config;
            cout << "Configuration defaults:" << endl;

            char buffer[200];
            for (auto &cfg: config.settings) {
                snprintf(buffer, sizeof(buffer), "   %-18s %-28s env %s", cfg.display_name.c_str(), cfg.value.length() ? cfg.value.c_str() : "(none)", cfg.envVar.c_str());
                cout << buffer << endl;
            }
            break;
        }

        case hOptions: {
            string helpText = "chainbackups [options] <command>\n\n"
            + string(BOLDBLUE) + "COMMANDS" + string(RESET) + "\n"
            + "   backup              Take a full or incremental backup, then prune.\n"
            + "   prune               Quarantine corrupt backups and apply retention.\n"
            + "   restore [target]    Rebuild a data directory from the chain ending at target (a path or backup id).\n"
            + "   list, -0            Show chains, quarantined entries and what retention would do now.\n\n"
            + string(BOLDBLUE) + "BACKUP" + string(RESET) + "\n"
            + "   --full              Force a full backup.\n"
            + "   --full_interval [d] Start a new chain when the current full is d days old (default 14).\n"
            + "   --noprune           Skip the prune that normally follows a backup.\n"
            + "   --pg_bin_dir [dir]  Directory holding pg_basebackup and pg_combinebackup.\n"
            + "   --pg_options [opts] Extra options passed to pg_basebackup.\n"
            + "\n" + string(BOLDBLUE) + "RETENTION\n" + RESET
            + "   --keep_full [d]     Remove whole chains whose full is older than d days (default 30).\n"
            + "   --keep_incremental [d]\n"
            + "                       Remove a chain's incrementals once the oldest is older than d days (default 7).\n"
            + "                       The most recent chain is always kept whole.\n"
            + "\n" + string(BOLDBLUE) + "RESTORE\n" + RESET
            + "   --at [time]         Restore the newest backup at or before 'YYYY-MM-DD HH:MM:SS' (UTC).\n"
            + "   --restore_dir [dir] Directory to build the restored data directory in.\n"
            + "\n" + string(BOLDBLUE) + "GENERAL\n" + RESET
            + "   --directory [dir]   Backup root directory.\n"
            + "   --save              Save the specified settings to the config file.\n"
            + "   --confdir [dir]     Use dir for the configuration directory (default " + CONF_DIR + ")\n"
            + "   --cachedir [dir]    Use dir for the lock directory (default " + CACHE_DIR + ")\n"
            + "   --logdir [dir]      Use dir for the log directory (MacOS only, default /var/log)\n\n"
            + "   --nocolor           Disable color output\n"
            + "   -t, --test          Run in test mode. Nothing is created, renamed or deleted.\n"
            + "   -q, --quiet         Quiet mode -- limit output, for use in scripts.\n"
            + "   -v[options]         Verbose debugging output; -v+exec adds a category, --vv enables all.\n"
            + "   --defaults          Display the default settings\n"
            + "   -f, --force         Take over an existing lock; let restore clear a non-empty restore directory\n"
            + "   -V, --version       Show the version\n";

            cout << helpText;
        }

        break;

        case hSyntax:
        default:
            cout << R"END(chainbackups takes PostgreSQL full and incremental backups with pg_basebackup,
groups them into chains, prunes them by age and restores any of them with
pg_combinebackup.

    • Use "chainbackups --help" for options.

    • Commands: backup, prune, restore <target>, list.)END" << endl;
        break;
    }
}
