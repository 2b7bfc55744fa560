#include <stdio.h>
#include <fcntl.h>
#include <errno.h>
#include <unistd.h>

#include "Quarantine.h"
#include "colors.h"
#include "debug.h"


/*
 Rename without ever replacing an existing entry.  Returns 0, or -1 with errno
 set (EEXIST when the target is taken).  Linux gets this atomically from
 renameat2(); elsewhere, or on filesystems that don't support the flag, it's
 a check-then-rename.
 */
static int renameNoReplace(string from, string to) {
#ifdef __linux__
    if (!renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE))
        return 0;

    if (errno != EINVAL && errno != ENOSYS)
        return -1;

    DEBUG(D_quarantine) DFMT("renameat2 unsupported here, falling back to rename");
#endif

    if (exists(to)) {
        errno = EEXIST;
        return -1;
    }

    return rename(from.c_str(), to.c_str());
}


string quarantineEntry(string path, string reason) {
    auto ps = pathSplit(path);

    if (ps.file.find(QUARANTINE_PREFIX) == 0) {
        DEBUG(D_quarantine) DFMT(ps.file << " is already quarantined");
        return path;
    }

    string base = slashConcat(ps.dir, QUARANTINE_PREFIX + ps.file);
    string target = base;
    string suffix = "_" + to_string(time(NULL));
    unsigned int attempt = 0;

    if (GLOBALS.cli.count(CLI_TEST)) {
        cout << YELLOW << " TESTMODE: would have quarantined " << path << " as " << target << RESET << endl;
        return target;
    }

    while (renameNoReplace(path, target)) {
        if (errno != EEXIST || attempt > 100) {
            string err = "error: unable to quarantine " + path + errtext();
            log(err);
            SCREENERR(err);
            return "";
        }

        target = base + suffix + (attempt ? "_" + to_string(attempt) : "");
        ++attempt;
        DEBUG(D_quarantine) DFMT("target taken, trying " << target);
    }

    NOTQUIET && cout << YELLOW << "\t• quarantined " << path << " as " << pathSplit(target).file << RESET << endl;
    log("warning: quarantined " + path + " as " + target + (reason.length() ? " (" + reason + ")" : ""));
    return target;
}


QuarantineResult quarantineBackups(const ChainCache &cache) {
    QuarantineResult result = {0, 0};

    for (auto &entry: cache.corrupt) {
        log("warning: corrupt backup " + entry.path + ": " + entry.reason);
        DEBUG(D_quarantine) DFMT(entry.path << ": " << entry.reason);

        if (quarantineEntry(entry.path, entry.reason).length())
            ++result.moved;
        else
            ++result.failed;
    }

    return result;
}
