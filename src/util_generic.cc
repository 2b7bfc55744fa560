#include <iostream>
#include <fstream>
#include <dirent.h>
#include <unistd.h>
#include <time.h>
#include <math.h>
#include <string.h>
#include <errno.h>
#include <syslog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>
#include <pwd.h>
#include <vector>
#include <list>
#include <map>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"

using namespace pcrepp;


string log(string message) {
#ifdef __APPLE__
    if (!GLOBALS.logDir.length()) {
        string defaultDir = "/var/log";

        ofstream logFile;
        logFile.open(defaultDir + "/chainbackups.log", ios::app);
        if (logFile.is_open()) {
            logFile.close();
            GLOBALS.logDir = defaultDir;
        }
        else {
            struct passwd *pw = getpwuid(getuid());
            GLOBALS.logDir = string(pw->pw_dir);
        }
    }

    char timeStamp[100];
    time_t now = time(NULL);
    strftime(timeStamp, sizeof(timeStamp), "%b %d %Y %H:%M:%S ", localtime(&now));

    ofstream logFile;
    logFile.open(GLOBALS.logDir + "/chainbackups.log", ios::app);

    if (logFile.is_open()) {
        logFile << string(timeStamp) << "[" << to_string(GLOBALS.pid) << "] " << commafy(message) << endl;
        logFile.close();
    }
#else
    syslog(message.find("error") == 0 ? LOG_ERR : (message.find("warning") == 0 ? LOG_WARNING : LOG_NOTICE), "%s", commafy(message).c_str());
#endif

    return message;
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


string cppgetenv(string variable) {
    char *c = getenv(variable.c_str());
    return (c == NULL ? "" : c);
}


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


// newlines become ", " so multi-line messages stay on one log line
string commafy(string data) {
    if (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos = 0;
    while ((pos = data.find("\n", pos)) != string::npos) {
        data.replace(pos, 1, ", ");
        pos += 2;
    }

    return data;
}


string trimSpace(const string &s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == string::npos)
        return "";

    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}


string trimQuotes(string s, bool unEscape) {
    Pcre regA("^([\'\"]+)");
    string result = s;

    if (regA.search(s) && regA.matches()) {
        string openQuotes = regA.get_match(0);
        string closeQuotes = openQuotes;
        reverse(closeQuotes.begin(), closeQuotes.end());

        Pcre regB("^" + openQuotes + "(.*)" + closeQuotes + "$");
        if (regB.search(s) && regB.matches())
            result = regB.get_match(0);
    }

    if (unEscape)
        result.erase(remove(result.begin(), result.end(), '\\'), result.end());

    return result;
}


vector<string> string2vectorOnSpace(string data, bool trimQ, bool unEscape) {
    Pcre wordRE("((?:([\'\"]).+?(?<!\\\\)\\g2)|(?:\\S|(?:(?<=\\\\)\\s))+)", "g");
    vector<string> result;
    int pos = 0;

    while (pos <= (int)data.length() && wordRE.search(data, pos)) {
        pos = wordRE.get_match_end(0) + 1;
        string word = wordRE.get_match(0);

        if (unEscape)
            word.erase(remove(word.begin(), word.end(), '\\'), word.end());

        result.push_back(trimQ ? trimQuotes(word) : word);
    }

    return result;
}


string horizontalLine(int length) {
    string line;

    for (int x = 0; x < length; ++x)
        line += "━";

    return line;
}


// printf-style padding: negative widths left-justify
string blockp(string data, int width) {
    char cstr[2000];
    snprintf(cstr, sizeof(cstr), string(string("%") + to_string(width) + "s").c_str(), data.c_str());
    return(cstr);
}


string MD5string(string data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    EVP_MD_CTX *context = EVP_MD_CTX_new();
    EVP_DigestInit_ex(context, EVP_md5(), NULL);
    EVP_DigestUpdate(context, data.c_str(), data.length());
    EVP_DigestFinal_ex(context, digest, &digestLen);
    EVP_MD_CTX_free(context);

    string result;
    char hex[3];
    for (unsigned int i = 0; i < digestLen; i++) {
        snprintf(hex, sizeof(hex), "%02x", digest[i]);
        result += hex;
    }

    return result;
}


struct timeval mktimeval(time_t secs) { struct timeval t; t.tv_sec = secs; t.tv_usec = 0; return t; }


string timeDiffSingle(struct timeval duration, int maxUnits, int precision) {
    auto secs = duration.tv_sec;
    auto us = duration.tv_usec;
    auto offset = secs;
    int unitsUsed = 0;
    string result;
    map<unsigned long, string> units {
        { 31556952, "year" },
        { 2592000, "month" },
        { 604800, "week" },
        { 86400, "day" },
        { 3600, "hour" },
        { 60, "minute" },
        { 1, "second" } };

    for (auto unit_it = units.rbegin(); unit_it != units.rend(); ++unit_it) {
        if (offset >= (time_t)unit_it->first) {
            unsigned long value = floor(offset / unit_it->first);
            offset %= unit_it->first;
            result += (result.length() ? ", " : "") + plural(value, unit_it->second);

            if (++unitsUsed == maxUnits)
                break;
        }
    }

    // under a minute, show the fractional seconds too
    if (secs < 60 && us) {
        char decimalSecs[50];
        snprintf(decimalSecs, sizeof(decimalSecs), "%.*f seconds", precision, secs + 1.0 * us / MILLION);
        result = decimalSecs;
    }

    return(result.length() ? result : "0 seconds");
}


string timeDiff(struct timeval start, struct timeval end, int maxUnits, int precision) {
    struct timeval diffTime;
    mytimersub(&end, &start, &diffTime);

    return timeDiffSingle(diffTime, maxUnits, precision);
}


string time2utc(time_t when, string format) {
    struct tm t;
    char buffer[100];

    gmtime_r(&when, &t);
    strftime(buffer, sizeof(buffer), format.c_str(), &t);
    return buffer;
}


/*
 Accepts the forms we write and the forms people type:
    2023-01-15T12:00:00Z    (record timestamps)
    2023-01-15_12-00-00     (backup ids)
    2023-01-15 12:00:00     (--at)
    2023-01-15              (midnight)
 All are taken as UTC.
 */
time_t utc2time(string text) {
    Pcre regEx("^\\s*(\\d{4})-(\\d{2})-(\\d{2})(?:[T _](\\d{2})[:-](\\d{2})[:-](\\d{2}))?Z?\\s*$");

    if (!regEx.search(text) || regEx.matches() < 3)
        return -1;

    struct tm t;
    memset(&t, 0, sizeof(t));

    t.tm_year = stoi(regEx.get_match(0)) - 1900;
    t.tm_mon  = stoi(regEx.get_match(1)) - 1;
    t.tm_mday = stoi(regEx.get_match(2));

    if (regEx.matches() > 5) {
        t.tm_hour = stoi(regEx.get_match(3));
        t.tm_min = stoi(regEx.get_match(4));
        t.tm_sec = stoi(regEx.get_match(5));
    }

    struct tm check = t;
    time_t result = timegm(&t);

    // timegm() normalizes out-of-range fields (Feb 30 -> Mar 2); reject those
    if (result == -1 || t.tm_mday != check.tm_mday || t.tm_mon != check.tm_mon ||
        t.tm_hour != check.tm_hour || t.tm_min != check.tm_min || t.tm_sec != check.tm_sec)
        return -1;

    return result;
}


double dayAge(time_t then, time_t now) {
    return difftime(now, then) / SECS_PER_DAY;
}


string fixedPoint(double value, int precision) {
    char buffer[50];
    snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}


s_pathSplit pathSplit(string path) {
    s_pathSplit s;

    while (path.length() > 1 && path.back() == '/')
        path.pop_back();

    auto pos = path.rfind("/");
    if (pos == string::npos) {
        s.dir = ".";
        s.file = path;
    }
    else {
        s.dir = pos ? path.substr(0, pos) : "/";
        s.file = path.substr(pos + 1);
    }

    pos = s.file.rfind(".");
    if (pos == string::npos || !pos)
        s.file_base = s.file;
    else {
        s.file_base = s.file.substr(0, pos);
        s.file_ext = s.file.substr(pos + 1);
    }

    return s;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1.back() == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;

    if (!dir.length() || !mystat(dir, &statBuf))
        return 0;

    string path = dir[0] == '/' ? "" : ".";
    size_t start = 0;

    while (start <= dir.length()) {
        auto slash = dir.find('/', start);
        auto component = dir.substr(start, slash == string::npos ? string::npos : slash - start);
        start = slash == string::npos ? dir.length() + 1 : slash + 1;

        if (!component.length())
            continue;

        path += "/" + component;

        if (mystat(path, &statBuf) == -1 && mkdir(path.c_str(), mode) && errno != EEXIST)
            return -1;
    }

    return 0;
}


/*
 rmrf() walks the tree breadth-first, unlinking files as it finds them.
 Directories are queued and removed once the walk is done, deepest first, so
 each is empty by the time rmdir() gets to it.  Symlinks are removed, never
 followed.
 */
bool rmrf(string directory, bool includeTopDir) {
    list<string> toRead = { directory };
    list<string> dirsToRemove;
    struct stat statData;

    if (mylstat(directory, &statData)) {
        log("error: unable to remove " + directory + errtext());
        return false;
    }

    if (!S_ISDIR(statData.st_mode))
        return (!includeTopDir || !unlink(directory.c_str()));

    while (!toRead.empty()) {
        string dir = toRead.front();
        toRead.pop_front();

        DIR *dirPtr = opendir(dir.c_str());
        if (dirPtr == NULL) {
            log("error: unable to open " + dir + errtext());
            return false;
        }

        struct dirent *dirEntry;
        while ((dirEntry = readdir(dirPtr)) != NULL) {
            if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                continue;

            string entry = slashConcat(dir, dirEntry->d_name);

            if (mylstat(entry, &statData)) {
                closedir(dirPtr);
                return false;
            }

            if (S_ISDIR(statData.st_mode))
                toRead.push_back(entry);
            else if (unlink(entry.c_str())) {
                log("error: unable to remove " + entry + errtext());
                closedir(dirPtr);
                return false;
            }
        }

        closedir(dirPtr);

        if (includeTopDir || dir != directory)
            dirsToRemove.push_front(dir);
    }

    for (auto &dir: dirsToRemove)
        if (rmdir(dir.c_str())) {
            log("error: unable to remove " + dir + errtext());
            return false;
        }

    return true;
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


bool isDirectory(string path) {
    struct stat statBuffer;
    return (!mystat(path, &statBuffer) && S_ISDIR(statBuffer.st_mode));
}


long dirEntryCount(string dir) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    long count = 0;

    if ((dirPtr = opendir(dir.c_str())) == NULL)
        return -1;

    while ((dirEntry = readdir(dirPtr)) != NULL)
        if (strcmp(dirEntry->d_name, ".") && strcmp(dirEntry->d_name, ".."))
            ++count;

    closedir(dirPtr);
    return count;
}


int mystat(string filename, struct stat *buf) {
    ++GLOBALS.statsCount;
    return (stat(filename.c_str(), buf));
}


int mylstat(string filename, struct stat *buf) {
    ++GLOBALS.statsCount;
    return (lstat(filename.c_str(), buf));
}
