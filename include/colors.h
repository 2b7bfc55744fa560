
#ifndef COLORS_H
#define COLORS_H

// color only when it's enabled and we're not quiet
#define ifcolor(x) (GLOBALS.color && NOTQUIET ? x : "")

#define RESET       ifcolor("\033[0m")
#define RED         ifcolor("\033[31m")
#define GREEN       ifcolor("\033[32m")
#define YELLOW      ifcolor("\033[33m")
#define BLUE        ifcolor("\033[34m")
#define MAGENTA     ifcolor("\033[35m")
#define CYAN        ifcolor("\033[36m")
#define BOLDRED     ifcolor("\033[1m\033[31m")
#define BOLDGREEN   ifcolor("\033[1m\033[32m")
#define BOLDYELLOW  ifcolor("\033[1m\033[33m")
#define BOLDBLUE    ifcolor("\033[1m\033[34m")

#endif

