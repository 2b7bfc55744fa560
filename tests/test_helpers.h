#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <gtest/gtest.h>

#include "cxxopts.hpp"
#include "globals.h"
#include "BackupRecord.h"
#include "util_generic.h"
#include "exception.h"

using namespace std;


#define DAY SECS_PER_DAY


// parse a set of flags into GLOBALS.cli the way main() would
inline void setFlags(vector<string> flags) {
    cxxopts::Options options("chainbackups_tests");
    options.add_options()(CLI_TEST, "", cxxopts::value<bool>()->default_value("false"))(
        CLI_QUIET, "", cxxopts::value<bool>()->default_value("false"))(
        CLI_FORCE, "", cxxopts::value<bool>()->default_value("false"))(
        CLI_DIR, "", cxxopts::value<string>())(
        CLI_KEEPFULL, "", cxxopts::value<string>())(
        CLI_KEEPINC, "", cxxopts::value<string>())(
        CLI_INTERVAL, "", cxxopts::value<string>());

    vector<string> storage = {"chainbackups_tests"};
    storage.insert(storage.end(), flags.begin(), flags.end());

    vector<const char*> argv;
    for (auto &s: storage)
        argv.push_back(s.c_str());

    GLOBALS.cli = options.parse((int)argv.size(), argv.data());
}


inline void writeFile(string filename, string content) {
    ofstream f(filename);
    f << content;
}


inline string readFile(string filename) {
    ifstream f(filename);
    stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}


/* A scratch directory per test with the process globals pointed at it.
   Output is quiet unless a test asks for something else. */
class ScratchTest : public ::testing::Test {
protected:
    string scratch;
    string root;
    time_t now;

    void SetUp() override {
        char tmpl[] = "/tmp/chainbackups_test.XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        scratch = tmpl;
        root = slashConcat(scratch, "backups");
        ASSERT_EQ(mkdirp(root), 0);

        now = time(NULL);
        GLOBALS.pid = getpid();
        GLOBALS.startupTime = now;
        GLOBALS.color = false;
        GLOBALS.debugSelector = 0;
        GLOBALS.cacheDir = slashConcat(scratch, "cache");
        GLOBALS.confDir = slashConcat(scratch, "conf");
        GLOBALS.interruptFilename = "";
        GLOBALS.interruptLock = "";
        setFlags({"--quiet"});
    }

    void TearDown() override {
        rmrf(scratch);
        GLOBALS.cli = cxxopts::ParseResult();
    }

    // a backup directory with a record, a manifest and some data
    string makeBackup(time_t when, BackupKind kind, string parent = "", string chainStart = "") {
        string id = makeBackupId(when, kind);
        string dir = slashConcat(root, id);

        EXPECT_EQ(mkdirp(slashConcat(dir, "base")), 0);
        writeFile(slashConcat(dir, "base/16384"), "data");
        writeFile(slashConcat(dir, MANIFEST_FILENAME), string("{ \"Backup-Mode\": \"") + (kind == FULL ? "full" : "incremental") + "\" }\n");
        writeRecord(dir, BackupRecord(id, when, kind, parent, kind == FULL ? id : chainStart));

        return id;
    }

    string makeFull(time_t when) {
        return makeBackup(when, FULL);
    }

    string makeInc(time_t when, string parent, string chainStart) {
        return makeBackup(when, INCREMENTAL, parent, chainStart);
    }

    string pathOf(string id) {
        return slashConcat(root, id);
    }

    // scripts standing in for pg_basebackup and pg_combinebackup
    string makePgBin() {
        string bin = slashConcat(scratch, "pgbin");
        mkdirp(bin);

        writeFile(slashConcat(bin, "pg_basebackup"),
            "#!/bin/sh\n"
            "bin=$(dirname \"$0\")\n"
            "echo \"$@\" >> \"$bin/basebackup.args\"\n"
            "[ -f \"$bin/fail\" ] && { echo 'simulated failure' >&2; exit 1; }\n"
            "dir=''; mode=full\n"
            "for a in \"$@\"; do\n"
            "  case \"$a\" in\n"
            "    --pgdata=*) dir=\"${a#--pgdata=}\" ;;\n"
            "    --incremental=*) mode=incremental\n"
            "      [ -f \"${a#--incremental=}\" ] || { echo \"no manifest ${a#--incremental=}\" >&2; exit 3; } ;;\n"
            "  esac\n"
            "done\n"
            "[ -f \"$bin/empty\" ] && { mkdir -p \"$dir\"; exit 0; }\n"
            "mkdir -p \"$dir/base\" && echo data > \"$dir/base/16384\"\n"
            "[ -f \"$bin/nomanifest\" ] || printf '{ \"Backup-Mode\": \"%s\" }\\n' \"$mode\" > \"$dir/backup_manifest\"\n"
            "echo 'pg_basebackup: base backup completed' >&2\n");

        writeFile(slashConcat(bin, "pg_combinebackup"),
            "#!/bin/sh\n"
            "bin=$(dirname \"$0\")\n"
            "out=''\n"
            "rm -f \"$bin/combine.args\"\n"
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -o) out=\"$2\"; shift 2 ;;\n"
            "    *) echo \"$1\" >> \"$bin/combine.args\"; shift ;;\n"
            "  esac\n"
            "done\n"
            "[ -f \"$bin/fail\" ] && { echo 'combine failed' >&2; exit 2; }\n"
            "mkdir -p \"$out\" && echo 17 > \"$out/PG_VERSION\"\n");

        chmod(slashConcat(bin, "pg_basebackup").c_str(), 0755);
        chmod(slashConcat(bin, "pg_combinebackup").c_str(), 0755);
        return bin;
    }
};

#endif
