#ifndef DEBUG_H
#define DEBUG_H

/*
 Selective debugging in the manner of Philip Hazel's Exim Mail Transport Agent.

    -v              the default categories
    -v+restore      add a category (or -v-scan to drop one)
    -v=0x30         raw selector bits
    --vv            everything
 */

#include <sys/types.h>
#include "globals.h"

typedef unsigned char uschar;

#define BIT(n) (1UL << (n))

/* IOTA numbers the bits from their line position so a category can be
   added anywhere in the list below without renumbering by hand. */
#define IOTA(iota)      (__LINE__ - iota)
#define IOTA_INIT(zero) (__LINE__ - zero + 1)

#define DEBUG_BIT(name) Di_##name = IOTA(Di_iota), D_##name = (int)BIT(Di_##name)

// must match the debug_options table in debug.cc
enum {
  Di_all        = -1,
  Di_v          = 0,

  Di_iota = IOTA_INIT(1),
  DEBUG_BIT(backup),               /* 1 */
  DEBUG_BIT(chain),
  DEBUG_BIT(config),
  DEBUG_BIT(exec),
  DEBUG_BIT(lock),
  DEBUG_BIT(meta),
  DEBUG_BIT(prune),
  DEBUG_BIT(quarantine),
  DEBUG_BIT(restore),
  DEBUG_BIT(scan),
};

#define D_all                        0xffffffff
#define D_any                        (D_all)

// scan & meta fire once per directory; exec echoes tool plumbing
#define D_default                    (D_all & \
                                       ~(D_config           | \
                                         D_scan             | \
                                         D_meta             | \
                                         D_exec))

#define DEBUG(x)      if (GLOBALS.debugSelector & (x))


typedef struct bit_table {
  const char *name;
  int bit;
} bit_table;

extern bit_table debug_options[];
extern int debug_notall[];
extern int ndebug_options;

/* apply "+name-name..." or "=bits" to the selector.  returns false (with the
   offending text on stderr) on an unknown category or a malformed selector */
bool decode_bits(unsigned int *selector, size_t selsize, int *notall,
  uschar *parsestring, bit_table *options, int count);

#endif
