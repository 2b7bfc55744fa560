#include "test_helpers.h"
#include <signal.h>
#include "ToolExec.h"


class ToolExecTest : public ScratchTest {
protected:
    string script(string name, string body) {
        string filename = slashConcat(scratch, name);
        writeFile(filename, "#!/bin/sh\n" + body);
        chmod(filename.c_str(), 0755);
        return filename;
    }
};


TEST_F(ToolExecTest, ReportsExitStatus) {
    ToolExec ok(script("ok", "exit 0\n"), {});
    EXPECT_EQ(ok.execute(), 0);

    ToolExec failing(script("failing", "exit 3\n"), {});
    EXPECT_EQ(failing.execute(), 3);
}


TEST_F(ToolExecTest, CapturesStdoutAndStderr) {
    ToolExec tool(script("talker", "echo \"args: $*\"\necho 'to stderr' >&2\n"), {"-o", "/restore", "two words"});

    EXPECT_EQ(tool.execute(), 0);
    string output = tool.errorOutput();
    EXPECT_NE(output.find("args: -o /restore two words"), string::npos);
    EXPECT_NE(output.find("to stderr"), string::npos);
}


TEST_F(ToolExecTest, ArgumentsAreNotShellExpanded) {
    string marker = slashConcat(scratch, "marker");
    ToolExec tool(script("quiet", "exit 0\n"), {"; touch " + marker});

    EXPECT_EQ(tool.execute(), 0);
    EXPECT_FALSE(exists(marker));
}


TEST_F(ToolExecTest, MissingProgramCannotStart) {
    ToolExec tool(slashConcat(scratch, "nonexistent"), {});
    EXPECT_EQ(tool.execute(), -1);
}


TEST_F(ToolExecTest, KilledProgramReportsSignal) {
    ToolExec tool(script("suicide", "kill -TERM $$\nsleep 5\n"), {});
    EXPECT_EQ(tool.execute(), 128 + SIGTERM);
}


TEST_F(ToolExecTest, CommandLineQuotesSpaces) {
    ToolExec tool("/usr/bin/pg_combinebackup", {"-o", "/restore dir", "/backups/a"});
    EXPECT_EQ(tool.commandLine(), "/usr/bin/pg_combinebackup -o '/restore dir' /backups/a");
}


TEST_F(ToolExecTest, OutputIsCleanedUp) {
    string outputDir = string(TMP_OUTPUT_DIR) + "/pid_" + to_string(getpid());
    {
        ToolExec tool(script("ok", "echo hi\n"), {});
        tool.execute();
        EXPECT_TRUE(exists(slashConcat(outputDir, "ok.output")));
    }
    EXPECT_FALSE(exists(slashConcat(outputDir, "ok.output")));
}
