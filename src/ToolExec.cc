#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <string.h>
#include <errno.h>
#include <vector>
#include "util_generic.h"
#include "colors.h"
#include "globals.h"
#include "ToolExec.h"
#include "debug.h"


using namespace std;


ToolExec::ToolExec(string prog, vector<string> arguments) {
    program = prog;
    args = arguments;
    outputDir = string(TMP_OUTPUT_DIR) + "/pid_" + to_string(getpid());
    outputFilename = slashConcat(outputDir, pathSplit(program).file + ".output");
}


ToolExec::~ToolExec() {
    if (exists(outputFilename))
        unlink(outputFilename.c_str());

    rmdir(outputDir.c_str());
}


string ToolExec::commandLine() {
    string result = program;

    for (auto &arg: args)
        result += " " + (arg.find(' ') == string::npos ? arg : "'" + arg + "'");

    return result;
}


int ToolExec::execute() {
    if (access(program.c_str(), X_OK)) {
        string msg = "error: unable to execute " + program + errtext();
        log(msg);
        SCREENERR(msg);
        return -1;
    }

    mkdirp(outputDir);
    DEBUG(D_exec) DFMT("executing [" << commandLine() << "], output to " << outputFilename);

    vector<char*> argv;
    argv.push_back((char*)program.c_str());
    for (auto &arg: args)
        argv.push_back((char*)arg.c_str());
    argv.push_back(NULL);

    pid_t childPID = fork();

    if (childPID < 0) {
        log("error: unable to fork for " + program + errtext());
        return -1;
    }

    // CHILD
    if (!childPID) {
        int outFd = open(outputFilename.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (outFd >= 0) {
            DUP2(outFd, 1);
            DUP2(outFd, 2);
            close(outFd);
        }

        int nullFd = open("/dev/null", O_RDONLY);
        if (nullFd >= 0) {
            DUP2(nullFd, 0);
            close(nullFd);
        }

        execv(program.c_str(), argv.data());

        cerr << "exec of " << program << " failed: " << strerror(errno) << endl;
        _exit(127);
    }

    // PARENT
    int status;
    while (waitpid(childPID, &status, 0) < 0)
        if (errno != EINTR) {
            log("error: lost track of " + program + " (pid " + to_string(childPID) + ")" + errtext());
            return -1;
        }

    int result = WIFEXITED(status) ? WEXITSTATUS(status) : (WIFSIGNALED(status) ? 128 + WTERMSIG(status) : -1);
    DEBUG(D_exec) DFMT(pathSplit(program).file << " exited with " << result);

    return result;
}


string ToolExec::errorOutput() {
    ifstream outFile;
    outFile.open(outputFilename);

    if (!outFile.is_open())
        return "";

    stringstream buffer;
    buffer << outFile.rdbuf();
    outFile.close();

    return buffer.str();
}
