
#include "Setting.h"
#include "globals.h"

map<string, int>settingMap =
{{ CLI_DIR, sDirectory },
    { CLI_RESTOREDIR, sRestoreDir },
    { CLI_INTERVAL, sInterval },
    { CLI_KEEPFULL, sKeepFull },
    { CLI_KEEPINC, sKeepInc },
    { CLI_PGBIN, sPgBin },
    { CLI_PGOPTS, sPgOpts }
    };



Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal, string env) {
    regex = Pcre("^\\s*" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    envVar = env;
    source = "default";
    seen = false;
}


// INT settings are day counts: digits only, no sign
bool Setting::validate(string candidate) {
    if (data_type != INT)
        return true;

    Pcre reDigits("^\\d{1,9}$");
    return reDigits.search(trimSpace(candidate));
}


string Setting::confPrint(string sample) {
    bool isDef = value == defaultValue;

    return(blockp((isDef ? "#" : "") + display_name + ":", -20) +
        (isDef && sample.length() ? blockp(sample, -28) + "  # example" :
         (blockp(value, -28) + (isDef ? "  # default" : ""))) + "\n");
}
