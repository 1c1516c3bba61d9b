#include "../mocks.hpp"

#include <lemu/emulator/launcher.hpp>

#include <fstream>
#include <future>

#include <sys/wait.h>

#include <gtest/gtest.h>

class ProcessLauncherTest : public ::testing::Test {
protected:
  launcher::LaunchSpec spec(const std::string& script)
  {
    launcher::LaunchSpec spec;
    spec.function = "echo";
    spec.executable = "/bin/sh";
    spec.arguments = {"-c", script};
    spec.working_directory = workspace.root.string();
    spec.environment.variables["PATH"] = "/usr/bin:/bin";
    spec.environment.variables["GREETING"] = "hello";
    return spec;
  }

  TemporaryWorkspace workspace;
  launcher::ProcessLauncher launcher;
};

TEST_F(ProcessLauncherTest, ExitStatus)
{
  Slot<int> status;
  auto proc = launcher.launch(spec("exit 7"), [&status](int code) { status.set(std::move(code)); });

  ASSERT_TRUE(status.ready());
  int code = status.get();
  ASSERT_TRUE(WIFEXITED(code));
  EXPECT_EQ(WEXITSTATUS(code), 7);
  EXPECT_FALSE(proc->running());
}

TEST_F(ProcessLauncherTest, EnvironmentAndLogFile)
{
  auto log = workspace.root / "echo.log";
  auto s = spec("echo \"$GREETING $(pwd)\"; echo \"home=$HOME\"");
  s.log_file = log.string();

  Slot<int> status;
  auto proc = launcher.launch(s, [&status](int code) { status.set(std::move(code)); });
  ASSERT_TRUE(status.ready());

  std::ifstream in{log};
  std::string line;
  std::getline(in, line);
  EXPECT_EQ(line, "hello " + workspace.root.string());
  // Only the launch environment reaches the child.
  std::getline(in, line);
  EXPECT_EQ(line, "home=");
}

TEST_F(ProcessLauncherTest, Terminate)
{
  std::atomic<int> calls{0};
  int status = 0;
  auto proc = launcher.launch(spec("sleep 30"), [&](int code) {
    status = code;
    calls++;
  });
  EXPECT_TRUE(proc->running());

  proc->terminate(std::chrono::milliseconds{500});
  // The exit callback has finished once terminate returns.
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(proc->running());
  ASSERT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGTERM);

  // Terminating again is a no-op.
  proc->terminate(std::chrono::milliseconds{500});
  EXPECT_EQ(calls, 1);
}

TEST_F(ProcessLauncherTest, KillAfterGrace)
{
  int status = 0;
  auto proc = launcher.launch(spec("trap '' TERM; sleep 30"), [&](int code) { status = code; });

  // Give the shell time to install the trap.
  std::this_thread::sleep_for(std::chrono::milliseconds{200});
  proc->terminate(std::chrono::milliseconds{100});
  ASSERT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST_F(ProcessLauncherTest, MissingExecutable)
{
  Slot<int> status;
  auto s = spec("");
  s.executable = (workspace.root / "missing").string();
  auto proc = launcher.launch(s, [&status](int code) { status.set(std::move(code)); });

  ASSERT_TRUE(status.ready());
  int code = status.get();
  ASSERT_TRUE(WIFEXITED(code));
  EXPECT_EQ(WEXITSTATUS(code), 127);
}
