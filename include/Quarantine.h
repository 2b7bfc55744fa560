#ifndef QUARANTINE_H
#define QUARANTINE_H

#include <string>
#include "ChainCache.h"


using namespace std;

struct QuarantineResult {
    unsigned int moved;
    unsigned int failed;
};

// rename one entry to Invalid_<name>; returns the new path or "" on failure
string quarantineEntry(string path, string reason = "");

QuarantineResult quarantineBackups(const ChainCache &cache);

#endif
