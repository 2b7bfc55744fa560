#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <map>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

enum SetType { INT, STRING };
enum SetSpecifier { sDirectory, sRestoreDir, sInterval, sKeepFull, sKeepInc, sPgBin, sPgOpts };

extern map<string, int>settingMap;

class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string value;
        string defaultValue;
        string envVar;
        string source;          // where the current value came from
        Pcre regex;
        bool seen;

        int ivalue() { return stoi(value); }
        bool validate(string candidate);
        string confPrint(string sample = "");
        Setting(string name, string pattern, enum SetType setType, string defaultVal, string env = "");
};

#endif
