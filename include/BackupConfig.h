#ifndef BACKUPCONFIG_H
#define BACKUPCONFIG_H

#include <vector>
#include <string>
#include <tuple>
#include <pcre++.h>
#include "Setting.h"
#include "Retention.h"


using namespace std;
using namespace pcrepp;


class BackupConfig {

public:
    string config_filename;
    vector<Setting> settings;

    BackupConfig();

    bool loadConfig(string filename);
    void loadEnvironment();
    void loadCommandLine(const cxxopts::ParseResult &cli);
    void resolve(string confDir, const cxxopts::ParseResult &cli);
    void saveConfig();
    void fullDump();

    RetentionPolicy retentionPolicy();

    string lockFilename();
    string setLockPID(unsigned int pid);
    tuple<int, time_t> getLockPID();
};

#endif
