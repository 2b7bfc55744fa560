#include <fstream>
#include <sys/stat.h>
#include <stdio.h>
#include <unistd.h>
#include <pcre++.h>

#include "BackupConfig.h"
#include "Setting.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"

using namespace pcrepp;


BackupConfig::BackupConfig() {
    config_filename = "";

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_DIR, RE_DIR, STRING, "/backups", ENV_DIR));
    settings.insert(settings.end(), Setting(CLI_RESTOREDIR, RE_RESTOREDIR, STRING, "/restore", ENV_RESTOREDIR));
    settings.insert(settings.end(), Setting(CLI_INTERVAL, RE_INTERVAL, INT, "14", ENV_INTERVAL));
    settings.insert(settings.end(), Setting(CLI_KEEPFULL, RE_KEEPFULL, INT, "30", ENV_KEEPFULL));
    settings.insert(settings.end(), Setting(CLI_KEEPINC, RE_KEEPINC, INT, "7", ENV_KEEPINC));
    settings.insert(settings.end(), Setting(CLI_PGBIN, RE_PGBIN, STRING, "/usr/lib/postgresql/17/bin", ENV_PGBIN));
    settings.insert(settings.end(), Setting(CLI_PGOPTS, RE_PGOPTS, STRING, "", ENV_PGOPTS));
}


static void applyValue(Setting &setting, string value, string source) {
    if (!setting.validate(value)) {
        string msg = "invalid value '" + value + "' for " + setting.display_name + " from " + source + " (expected a non-negative number of days)";
        log("error: " + msg);
        throw CBException(msg, EXIT_CONFIG);
    }

    setting.value = setting.data_type == INT ? trimSpace(value) : value;
    setting.source = source;
    DEBUG(D_config) DFMT(setting.display_name << " = " << setting.value << " (" << source << ")");
}


/*
 loadConfig() returns false when there's no config file; it's optional.
 anything wrong inside one that exists is a configuration error.
 */
bool BackupConfig::loadConfig(string filename) {
    ifstream configFile;

    if (!exists(filename)) {
        DEBUG(D_config) DFMT("no config file at " << filename);
        return false;
    }

    configFile.open(filename);
    if (!configFile.is_open())
        throw CBException(log("error: unable to read " + filename + errtext()), EXIT_CONFIG);

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;
    unsigned int line = 0;

    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                applyValue(setting, setting.regex.get_match(2), filename + " line " + to_string(line));
                identified = true;
                break;
            }
        }

        if (!identified) {
            configFile.close();
            log("error: unrecognized setting on line " + to_string(line) + " of " + filename);
            throw CBException("unrecognized setting on line " + to_string(line) + " of " + filename + "\n    " + dataLine, EXIT_CONFIG);
        }
    }

    configFile.close();
    DEBUG(D_config) DFMT("successfully parsed config from " << filename);

    return true;
}


void BackupConfig::loadEnvironment() {
    for (auto &setting: settings) {
        if (!setting.envVar.length())
            continue;

        string value = cppgetenv(setting.envVar);
        if (value.length())
            applyValue(setting, value, "environment variable " + setting.envVar);
    }
}


void BackupConfig::loadCommandLine(const cxxopts::ParseResult &cli) {
    for (auto &setting: settings)
        if (cli.count(setting.display_name))
            applyValue(setting, cli[setting.display_name].as<string>(), "option --" + setting.display_name);
}


// defaults, then the config file, then the environment, then the command line
void BackupConfig::resolve(string confDir, const cxxopts::ParseResult &cli) {
    loadConfig(slashConcat(confDir, CONF_FILENAME));
    loadEnvironment();
    loadCommandLine(cli);
}


RetentionPolicy BackupConfig::retentionPolicy() {
    return { settings[sKeepFull].ivalue(), settings[sKeepInc].ivalue() };
}


void BackupConfig::saveConfig() {
    ifstream oldFile;
    ofstream newFile;

    if (!config_filename.length())
        config_filename = slashConcat(GLOBALS.confDir, CONF_FILENAME);

    NOTQUIET && cout << "\t• saving settings to " << config_filename << endl;
    mkdirp(GLOBALS.confDir);

    // open existing and new config files
    string temp_filename = config_filename + ".tmp." + to_string(GLOBALS.pid);
    oldFile.open(config_filename);
    newFile.open(temp_filename);

    if (!newFile.is_open()) {
        log("error: unable to create " + temp_filename + " (directory not writable?)");
        throw CBException("unable to create " + temp_filename + " (directory not writable?)\n" +
            "The location can be overridden via --confdir or the environment variable CB_CONFDIR.", EXIT_CONFIG);
    }

    string usersDelimiter = ": ";
    for (auto &setting: settings)
        setting.seen = false;

    if (oldFile.is_open()) {
        Pcre reBlank(RE_BLANK);
        string dataLine;

        // loop through lines of the existing config file
        while (getline(oldFile, dataLine)) {

            // compare the line against each of the config settings until there's a match
            bool identified = false;
            if (!reBlank.search(dataLine)) {

                for (auto &setting: settings) {
                    if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                        usersDelimiter = setting.regex.get_match(1);

                        newFile << setting.regex.get_match(0) << setting.regex.get_match(1) << setting.value <<
                            (setting.regex.matches() > 3 ? setting.regex.get_match(3) : "") << endl;
                        setting.seen = identified = true;
                        break;
                    }
                }

                // comment out unrecognized settings
                if (!identified) {
                    newFile << "# " << dataLine << "       # unknown setting?" << endl;
                    continue;
                }
            }

            // add the line as is (likely a comment or blank line)
            if (!identified)
                newFile << dataLine << endl;
        }

        oldFile.close();

        // settings that weren't in the existing config get added if they differ from the defaults
        for (auto &setting: settings)
            if (!setting.seen && (setting.value != setting.defaultValue))
                newFile << setting.display_name << usersDelimiter << setting.value << endl;
    }
    else {
        // completely new config, first time being written
        string commentLine = "#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#-#\n";
        newFile << commentLine << "# chainbackups, created " << time2utc(time(NULL), "%Y-%m-%d") << "\n" << commentLine << "\n";

        newFile << commentLine << "# Locations\n" << commentLine << "\n";
        newFile << settings[sDirectory].confPrint();
        newFile << settings[sRestoreDir].confPrint();
        newFile << settings[sPgBin].confPrint();
        newFile << settings[sPgOpts].confPrint("--checkpoint=fast") << "\n\n";

        newFile << commentLine << "# Schedule & retention (days)\n" << commentLine << "\n";
        newFile << settings[sInterval].confPrint();
        newFile << settings[sKeepFull].confPrint();
        newFile << settings[sKeepInc].confPrint();
    }

    newFile.close();

    if (rename(temp_filename.c_str(), config_filename.c_str())) {
        string err = "unable to save " + config_filename + errtext();
        unlink(temp_filename.c_str());
        throw CBException(log("error: " + err), EXIT_CONFIG);
    }

    log("saved settings to " + config_filename);
}


void BackupConfig::fullDump() {
    char buffer[400];

    for (auto &setting: settings) {
        snprintf(buffer, sizeof(buffer), "   %-18s %-30s (%s)", setting.display_name.c_str(), setting.value.c_str(), setting.source.c_str());
        cout << buffer << endl;
    }
}


string BackupConfig::lockFilename() {
    return slashConcat(GLOBALS.cacheDir, MD5string(settings[sDirectory].value) + ".lock");
}


tuple<int, time_t> BackupConfig::getLockPID() {
    ifstream lockFile;
    lockFile.open(lockFilename());

    if (lockFile.is_open()) {
        long pid = 0;
        long startTime = 0;

        lockFile >> pid >> startTime;
        lockFile.close();

        // an unreadable lock is treated as abandoned
        if (pid > 0)
            return {(int)pid, (time_t)startTime};
    }

    return {0, 0};
}


string BackupConfig::setLockPID(unsigned int pid) {
    string lockName = lockFilename();
    mkdirp(GLOBALS.cacheDir);

    if (pid) {
        ofstream lockFile;
        lockFile.open(lockName);

        if (lockFile.is_open()) {
            lockFile << to_string(pid) << endl;
            lockFile << to_string(GLOBALS.startupTime) << endl;
            lockFile.close();
            DEBUG(D_lock) DFMT("locked " << settings[sDirectory].value << " via " << lockName);
            return lockName;
        }

        log("error: unable to save lock to " + lockName + " (directory not writable?)");
        throw CBException("unable to create " + lockName + " (use --cachedir or CB_CACHEDIR to relocate it)", EXIT_LOCKED);
    }

    unlink(lockName.c_str());
    DEBUG(D_lock) DFMT("released " << lockName);
    return "";
}
