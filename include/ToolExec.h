#ifndef TOOL_EXEC_H
#define TOOL_EXEC_H

#include <string>
#include <vector>

/****************************************************************
 * ToolExec
 *
 * Run an external program (pg_basebackup, pg_combinebackup) with
 * an explicit argv, no shell involved.  The child's stdout and
 * stderr are captured to a file under TMP_OUTPUT_DIR so a failure
 * can be reported with whatever the tool had to say.
 *
 * Example:
 *
 * ToolExec t("/usr/bin/pg_combinebackup", {"-o", "/restore", "/backups/a"});
 * if (t.execute())
 *     cerr << t.errorOutput();
 *
 */

using namespace std;


class ToolExec {
    string program;
    vector<string> args;
    string outputDir;
    string outputFilename;

    public:
        ToolExec(string prog, vector<string> arguments);
        ~ToolExec();

        /* execute() forks, execs and waits.  it returns the child's exit status,
         * 128 + signal if the child was killed, or -1 if it couldn't be started. */
        int execute();

        string commandLine();
        string errorOutput();
};


#endif
