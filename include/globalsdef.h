
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.2"

#include "cxxopts.hpp"
#include "colors.h"
#include <set>
#include <string>

/*
 Adding a commandline option vs adding a config setting.

 All settings have CLI options but not all CLI options have an equivalent setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in chainbackups.cc

 (B) To add a config setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add a map entry between the defined const and the enum in Setting.cc
    (4) add it to the settings vector with its default and env var in BackupConfig::BackupConfig()
    (5) do everything under the CLI option list above because you need a matching CLI option to
        override the config setting

 Settings are accessed as config.settings[ENUM].value or config.settings[ENUM].ivalue().
 After BackupConfig::resolve() the value already reflects the config file, the environment
 and any CLI override, in that order.
 */


#define CONF_DIR "/etc/chainbackups"
#define CACHE_DIR "/var/chainbackups/cache"
#define TMP_OUTPUT_DIR "/tmp/chainbackups_output"
#define CONF_FILENAME "chainbackups.conf"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl
#define DFMTNOPREFIX(x) cerr << GREEN << x << RESET << endl

#define NOTQUIET (!GLOBALS.cli.count(CLI_QUIET))
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

#define SECS_PER_DAY (60*60*24)
#define ABANDONED_SECS (60*60*5)
#define LOCK_MAX_SECS (60*60*24)

// backup ids are "<UTC time>_<kind>"
#define ID_TIME_FORMAT "%Y-%m-%d_%H-%M-%S"
#define ISO_TIME_FORMAT "%Y-%m-%dT%H:%M:%SZ"
#define ID_REGEX "^(\\d{4})-(\\d{2})-(\\d{2})_(\\d{2})-(\\d{2})-(\\d{2})_"
#define WORKDIR_REGEX "\\.tmp\\.\\d+$"
#define QUARANTINE_PREFIX "Invalid_"
#define RECORD_FILENAME "chainbackups.meta"
#define MANIFEST_FILENAME "backup_manifest"

/* CLI_ and RE_
 * The CLI_ constants are commandline switches while the RE_ are regex patterns
 * that match lines of config files.  Every setting has both (--keep_full & keep_full:). */

// commands
#define CMD_BACKUP "backup"
#define CMD_PRUNE "prune"
#define CMD_RESTORE "restore"
#define CMD_LIST "list"

// define commandline options
#define CLI_LIST "0"
#define CLI_DIR "directory"
#define CLI_RESTOREDIR "restore_dir"
#define CLI_INTERVAL "full_interval"
#define CLI_KEEPFULL "keep_full"
#define CLI_KEEPINC "keep_incremental"
#define CLI_PGBIN "pg_bin_dir"
#define CLI_PGOPTS "pg_options"
#define CLI_FULL "full"
#define CLI_AT "at"
#define CLI_NOPRUNE "noprune"
#define CLI_TEST "test"
#define CLI_QUIET "quiet"
#define CLI_NOCOLOR "nocolor"
#define CLI_FORCE "force"
#define CLI_SAVE "save"
#define CLI_DEFAULTS "defaults"
#define CLI_HELP "help"
#define CLI_VERSION "version"
#define CLI_CONFDIR "confdir"
#define CLI_CACHEDIR "cachedir"
#define CLI_LOGDIR "logdir"
#define CLI_COMMAND "command"

// conf file regexes
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_DIR "(dir|directory|backup_dir)"
#define RE_RESTOREDIR "(restore_dir|restore)"
#define RE_INTERVAL "(full_interval|full_backup_interval_days)"
#define RE_KEEPFULL "(keep_full|keep_full_days)"
#define RE_KEEPINC "(keep_incremental|keep_incremental_days)"
#define RE_PGBIN "(pg_bin_dir|pgbin)"
#define RE_PGOPTS "(pg_options)"

// environment overrides
#define ENV_DIR "BACKUP_DIR"
#define ENV_RESTOREDIR "RESTORE_DIR"
#define ENV_INTERVAL "FULL_BACKUP_INTERVAL_DAYS"
#define ENV_KEEPFULL "KEEP_FULL_DAYS"
#define ENV_KEEPINC "KEEP_INCREMENTAL_DAYS"
#define ENV_PGBIN "PG_BIN_DIR"
#define ENV_PGOPTS "PG_BASEBACKUP_OPTIONS"

#define MILLION 1000000

using namespace std;

enum helpType { hDefaults, hOptions, hSyntax };

// process exit status, one per failure class
enum exitCode {
    EXIT_OK = 0,
    EXIT_GENERAL = 1,
    EXIT_USAGE = 2,
    EXIT_CONFIG = 3,
    EXIT_LOCKED = 4,
    EXIT_BACKUP = 5,
    EXIT_BROKEN_CHAIN = 6,
    EXIT_RESTORE = 7,
    EXIT_PRUNE_PARTIAL = 8
};

struct global_vars {
    unsigned int debugSelector;
    time_t startupTime;
    unsigned long statsCount;
    int pid;
    cxxopts::ParseResult cli;
    bool color;
    string logDir;
    string confDir;
    string cacheDir;
    string interruptFilename;
    string interruptLock;
};

#endif

