#ifndef STATISTICS_H
#define STATISTICS_H

#include <time.h>

#include "globals.h"
#include "ChainCache.h"
#include "Retention.h"


void listChains(const ChainCache &cache, const RetentionPolicy &policy, time_t now);


#endif
