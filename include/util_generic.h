#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "pcre++.h"
#include "globals.h"

using namespace pcrepp;
using namespace std;


/*
 * logging & error text
 */

// syslog (LOCAL1) or, on macOS, <logdir>/chainbackups.log; returns its argument
string log(string message);

// " - <strerror(errno)>"
string errtext(bool format = true);


/*
 * strings
 */

string cppgetenv(string variable);
string plural(size_t number, string text);
string commafy(string data);
string trimSpace(const string &s);
string trimQuotes(string s, bool unEscape = false);

// split on whitespace; quoted or backslash-escaped spaces stay inside their word
vector<string> string2vectorOnSpace(string data, bool trimQ = false, bool unEscape = false);

string horizontalLine(int length);
string blockp(string data, int width);
string MD5string(string data);


/*
 * time
 */

#define mytimersub(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec - (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec - (uvp)->tv_usec; \
        if ((vvp)->tv_usec < 0) {                         \
            (vvp)->tv_sec--;                              \
            (vvp)->tv_usec += MILLION;                    \
        }                                                 \
    } while (0)

struct timeval mktimeval(time_t secs);

// "3 days, 2 hours"
string timeDiffSingle(struct timeval duration, int maxUnits = 2, int precision = 2);
string timeDiff(struct timeval start, struct timeval end = mktimeval(GLOBALS.startupTime), int maxUnits = 2, int precision = 2);

// time2utc() formats in UTC; utc2time() returns -1 when the text doesn't parse
string time2utc(time_t when, string format = ISO_TIME_FORMAT);
time_t utc2time(string text);

// fractional days from then to now
double dayAge(time_t then, time_t now);

// "%.<precision>f"
string fixedPoint(double value, int precision = 1);


// accumulates wall time across start()/stop() pairs
class timer {
    struct timeval startTime;
    struct timeval spentTime;

    public:
        void start() { gettimeofday(&startTime, NULL); }
        void stop() {
            struct timeval endTime, lap;
            gettimeofday(&endTime, NULL);
            mytimersub(&endTime, &startTime, &lap);

            spentTime.tv_sec += lap.tv_sec;
            spentTime.tv_usec += lap.tv_usec;
            if (spentTime.tv_usec >= MILLION) {
                ++spentTime.tv_sec;
                spentTime.tv_usec -= MILLION;
            }
        }

        time_t seconds() { return spentTime.tv_sec; }
        string elapsed(int precision = 2) { return timeDiffSingle(spentTime, 3, precision); }

    timer() { startTime.tv_sec = startTime.tv_usec = spentTime.tv_sec = spentTime.tv_usec = 0; }
};


/*
 * paths & filesystem
 */

struct s_pathSplit {
    string dir;
    string file;
    string file_base;
    string file_ext;
};

// a trailing slash is ignored: "/backups/x/" splits as "/backups" + "x"
s_pathSplit pathSplit(string path);

string slashConcat(string str1, string str2, string str3 = "");

// 0 on success (including when it already exists), -1 with errno set
int mkdirp(string dir, mode_t mode = 0775);

// rm -rf; with includeTopDir false only the contents go
bool rmrf(string directory, bool includeTopDir = true);

bool exists(const std::string& name);
bool isDirectory(string path);

// entries in a directory besides . and ..; -1 if it can't be opened
long dirEntryCount(string dir);

int mystat(string filename, struct stat *buf);
int mylstat(string filename, struct stat *buf);

#endif
