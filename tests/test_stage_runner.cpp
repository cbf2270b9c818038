#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "core/stage.h"
#include "core/workdir.h"
#include "engines/stage_runner.h"
#include "gtest/gtest.h"
#include "tests/common_tools.h"
#include "utils/exceptions.h"
#include "utils/signals.h"

using namespace assertp4;
using namespace std;
using namespace std::chrono;

namespace fs = std::filesystem;

namespace assertp4_tests {

StageSpec shell_spec(const string & script, milliseconds timeout = seconds(10))
{
  StageSpec spec;
  spec.stage = NATIVE_COMPILE;
  spec.argv = { "/bin/sh", "-c", script };
  spec.timeout = timeout;
  return spec;
}

class StageRunnerUnitTests : public ::testing::Test
{
 protected:
  StageRunnerUnitTests() : runner(milliseconds(500)) {}

  ProcessStageRunner runner;
};

TEST_F(StageRunnerUnitTests, CapturesBothStreams)
{
  StageResult r = runner.run(shell_spec("echo to-out; echo to-err >&2"));
  EXPECT_EQ(r.status, STAGE_OK);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.out, "to-out\n");
  EXPECT_EQ(r.err, "to-err\n");
  EXPECT_EQ(r.combined(), "to-out\nto-err\n");
}

TEST_F(StageRunnerUnitTests, NonZeroExitIsFailed)
{
  StageResult r = runner.run(shell_spec("echo 'syntax error' >&2; exit 3"));
  EXPECT_EQ(r.status, STAGE_FAILED);
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.err, "syntax error\n");
}

TEST_F(StageRunnerUnitTests, KilledBySignalIsFailed)
{
  StageResult r = runner.run(shell_spec("kill -KILL $$"));
  EXPECT_EQ(r.status, STAGE_FAILED);
  EXPECT_EQ(r.exit_code, 128 + SIGKILL);
}

TEST_F(StageRunnerUnitTests, LargeOutputOnBothPipes)
{
  // a megabyte on stderr before anything on stdout: reading stdout to
  // the end first would block forever
  const string script =
      "head -c 1048576 /dev/zero | tr '\\000' e >&2; "
      "head -c 1048576 /dev/zero | tr '\\000' o";
  StageResult r = runner.run(shell_spec(script, seconds(30)));
  ASSERT_EQ(r.status, STAGE_OK);
  EXPECT_EQ(r.out.size(), 1048576u);
  EXPECT_EQ(r.err.size(), 1048576u);
  EXPECT_EQ(r.out.find_first_not_of('o'), string::npos);
  EXPECT_EQ(r.err.find_first_not_of('e'), string::npos);
}

TEST_F(StageRunnerUnitTests, InterleavedLargeOutput)
{
  const string script =
      "(head -c 1048576 /dev/zero | tr '\\000' e >&2) & "
      "head -c 1048576 /dev/zero | tr '\\000' o; wait";
  StageResult r = runner.run(shell_spec(script, seconds(30)));
  ASSERT_EQ(r.status, STAGE_OK);
  EXPECT_EQ(r.out.size(), 1048576u);
  EXPECT_EQ(r.err.size(), 1048576u);
}

TEST_F(StageRunnerUnitTests, StdinIsEmpty)
{
  StageResult r = runner.run(shell_spec("cat; echo done"));
  EXPECT_EQ(r.status, STAGE_OK);
  EXPECT_EQ(r.out, "done\n");
}

TEST_F(StageRunnerUnitTests, TimeoutKeepsPartialOutput)
{
  const auto before = steady_clock::now();
  StageResult r =
      runner.run(shell_spec("echo partial; sleep 30", milliseconds(500)));
  const auto elapsed = steady_clock::now() - before;

  EXPECT_EQ(r.status, STAGE_TIMED_OUT);
  EXPECT_TRUE(r.timed_out());
  EXPECT_EQ(r.exit_code, -1);
  EXPECT_EQ(r.out, "partial\n");
  EXPECT_LT(elapsed, seconds(10));
}

TEST_F(StageRunnerUnitTests, TimeoutKillsDescendants)
{
  StageResult r =
      runner.run(shell_spec("sleep 30 & echo $!; wait", milliseconds(500)));
  ASSERT_EQ(r.status, STAGE_TIMED_OUT);
  ASSERT_FALSE(r.out.empty());
  const int descendant = std::stoi(r.out);

  // the orphan is reaped by init, give it a moment
  bool alive = true;
  for (int i = 0; i < 50 && alive; ++i) {
    alive = process_alive(descendant);
    if (alive) std::this_thread::sleep_for(milliseconds(100));
  }
  EXPECT_FALSE(alive);
}

TEST_F(StageRunnerUnitTests, MissingProgramThrows)
{
  StageSpec spec = shell_spec("");
  spec.argv = { "/nonexistent/assertp4-tool", "--version" };
  EXPECT_THROW(runner.run(spec), AssertP4Exception);
}

TEST_F(StageRunnerUnitTests, MissingProgramOnPathThrows)
{
  StageSpec spec = shell_spec("");
  spec.argv = { "assertp4-no-such-program-on-path" };
  EXPECT_THROW(runner.run(spec), AssertP4Exception);
}

TEST_F(StageRunnerUnitTests, EmptyCommandThrows)
{
  StageSpec spec = shell_spec("");
  spec.argv.clear();
  EXPECT_THROW(runner.run(spec), AssertP4Exception);
}

TEST_F(StageRunnerUnitTests, RunsInGivenDirectory)
{
  WorkDir scratch(default_work_root());
  StageSpec spec = shell_spec("pwd -P");
  spec.cwd = scratch.path();
  StageResult r = runner.run(spec);
  ASSERT_EQ(r.status, STAGE_OK);
  ASSERT_FALSE(r.out.empty());
  EXPECT_EQ(fs::path(r.out.substr(0, r.out.size() - 1)),
            fs::canonical(scratch.path()));
}

TEST_F(StageRunnerUnitTests, MissingDirectoryThrows)
{
  StageSpec spec = shell_spec("true");
  spec.cwd = "/nonexistent/assertp4-dir";
  EXPECT_THROW(runner.run(spec), AssertP4Exception);
}

TEST_F(StageRunnerUnitTests, TerminationSignalInterruptsRun)
{
  install_interrupt_handlers();
  clear_interrupt();

  StageSpec spec = shell_spec("kill -TERM $PPID; sleep 30", seconds(20));
  const auto before = steady_clock::now();
  int sig = 0;
  try {
    runner.run(spec);
  }
  catch (InterruptedException & e) {
    sig = e.signal_number();
  }
  const auto elapsed = steady_clock::now() - before;

  EXPECT_EQ(sig, SIGTERM);
  EXPECT_LT(elapsed, seconds(10));

  clear_interrupt();
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
}

TEST(StageNameTests, Spelling)
{
  EXPECT_EQ(to_string(FRONTEND_COMPILE), "p4c");
  EXPECT_EQ(to_string(IR_TRANSLATE), "p4-to-c");
  EXPECT_EQ(to_string(NATIVE_COMPILE), "clang");
  EXPECT_EQ(to_string(SYMBOLIC_EXECUTION), "klee");
  EXPECT_EQ(to_string(STAGE_TIMED_OUT), "timed out");
}

}  // namespace assertp4_tests
