/* decode_bits() follows the selector parsing of:
 * Exim - an Internet mail transport agent
 * Copyright (c) University of Cambridge 1995 - 2018
 * Copyright (c) The Exim Maintainers 2015 - 2021
 */

#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <stdlib.h>
#include <string>
#include <algorithm>

#include "debug.h"

using namespace std;

#define BITWORDSIZE 32

bit_table debug_options[] = {   // alphabetical, for the binary search
  { "all",          Di_all },
  { "backup",       Di_backup },
  { "chain",        Di_chain },
  { "config",       Di_config },
  { "exec",         Di_exec },
  { "lock",         Di_lock },
  { "meta",         Di_meta },
  { "prune",        Di_prune },
  { "quarantine",   Di_quarantine },
  { "restore",      Di_restore },
  { "scan",         Di_scan },
};

// categories "+all" leaves off
int debug_notall[] = {
  -1
};

int ndebug_options = sizeof(debug_options) / sizeof(*debug_options);


static void setBit(unsigned int *selector, int bit, bool on) {
    if (on)
        selector[bit / BITWORDSIZE] |= (1U << (bit % BITWORDSIZE));
    else
        selector[bit / BITWORDSIZE] &= ~(1U << (bit % BITWORDSIZE));
}


bool decode_bits(unsigned int *selector, size_t selsize, int *notall,
  uschar *parsestring, bit_table *options, int count) {

    if (!parsestring)
        return true;

    string selection = (const char*)parsestring;

    if (selection.length() && selection[0] == '=') {
        char *end;
        memset(selector, 0, sizeof(*selector) * selsize);
        *selector = (unsigned int)strtoul(selection.c_str() + 1, &end, 0);

        if (selection.length() > 1 && !*end)
            return true;

        fprintf(stderr, "unknown debugging selection: %s\n", selection.c_str());
        return false;
    }

    size_t pos = 0;
    while (true) {
        while (pos < selection.length() && isspace(selection[pos]))
            ++pos;

        if (pos >= selection.length())
            return true;

        if (selection[pos] != '+' && selection[pos] != '-') {
            fprintf(stderr, "unknown debugging flag (should be + or -): %s\n", selection.c_str() + pos);
            return false;
        }

        bool adding = selection[pos++] == '+';
        size_t start = pos;
        while (pos < selection.length() && (isalnum(selection[pos]) || selection[pos] == '_'))
            ++pos;

        string name = selection.substr(start, pos - start);
        bit_table *end = options + count;
        bit_table *match = lower_bound(options, end, name,
            [](const bit_table &entry, const string &key) { return strcmp(entry.name, key.c_str()) < 0; });

        if (match == end || name != match->name) {
            fprintf(stderr, "unknown debugging selection: %c%s\n", adding ? '+' : '-', name.c_str());
            return false;
        }

        if (match->bit == Di_all) {
            memset(selector, adding ? 0xff : 0, sizeof(*selector) * selsize);

            if (adding)
                for (; *notall != -1; ++notall)
                    setBit(selector, *notall, false);
        }
        else
            setBit(selector, match->bit, adding);
    }
}
