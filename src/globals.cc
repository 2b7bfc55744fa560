#include "globals.h"

struct global_vars GLOBALS;
