#include <lib/util/src/util.h>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace {

using pgagent::read_result_t;

// false once the process is gone or only a zombie is left
bool process_running(pid_t pid) {
  std::ifstream in(fmt::format("/proc/{}/stat", pid));
  std::string stat;
  if (!in || !std::getline(in, stat)) {
    return false;
  }
  auto pos = stat.rfind(')');
  return pos != std::string::npos && pos + 2 < stat.size() && stat[pos + 2] != 'Z';
}

TEST(Utils, RunCommand) {
  auto out = pgagent::run_command("echo hello world");
  EXPECT_EQ(out.result, read_result_t::success);
  EXPECT_EQ(out.output, "hello world\n");
}

TEST(Utils, RunCommandTimeoutAfterInput) {
  auto out = pgagent::run_command("echo foo; sleep 1; echo bar", 10);
  EXPECT_EQ(out.result, read_result_t::timeout);
  EXPECT_TRUE(out.output.empty());
}

TEST(Utils, RunCommandNotFound) {
  auto out = pgagent::run_command("/bin/does-not-exist 2>/dev/null");
  EXPECT_EQ(out.result, read_result_t::success);
  EXPECT_EQ(out.exit_status, 127);
  EXPECT_TRUE(out.output.empty());
}

TEST(Utils, RunCommandTimeoutKillsDescendants) {
  auto pid_file = std::filesystem::temp_directory_path() /
                  fmt::format("pgagent-utils-test-{}.pid", getpid());
  std::filesystem::remove(pid_file);

  // the shell forks sleep and waits for it, like it does for psql
  auto cmd = fmt::format("sleep 7 & echo $! > {}; wait",
                         pgagent::shell_quote(pid_file.string()));
  auto out = pgagent::run_command(cmd.c_str(), 300);
  EXPECT_EQ(out.result, read_result_t::timeout);

  pid_t sleep_pid = 0;
  {
    std::ifstream in(pid_file);
    in >> sleep_pid;
  }
  std::filesystem::remove(pid_file);
  ASSERT_GT(sleep_pid, 0);

  auto running = true;
  for (auto i = 0; i < 100 && running; ++i) {
    running = process_running(sleep_pid);
    if (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
  EXPECT_FALSE(running) << "sleep (pid=" << sleep_pid << ") survived the timeout";
}

TEST(Utils, RunCommandExitStatus) {
  auto out = pgagent::run_command("echo 42; exit 3");
  EXPECT_EQ(out.result, read_result_t::success);
  EXPECT_EQ(out.exit_status, 3);
  EXPECT_EQ(out.output, "42\n");

  out = pgagent::run_command("true");
  EXPECT_EQ(out.result, read_result_t::success);
  EXPECT_EQ(out.exit_status, 0);
  EXPECT_TRUE(out.output.empty());
}

TEST(Utils, RunCommandTimeout) {
  auto out = pgagent::run_command("sleep 4", 10);
  EXPECT_EQ(out.result, read_result_t::timeout);
  EXPECT_EQ(out.exit_status, -1);
}

TEST(Utils, CanExecute) {
  EXPECT_TRUE(pgagent::can_execute("echo"));
  EXPECT_FALSE(pgagent::can_execute("program-does-not-exist"));
  EXPECT_FALSE(pgagent::can_execute(""));
}

TEST(Utils, CanExecuteFullPath) {
  EXPECT_TRUE(pgagent::can_execute("/bin/sh"));
  EXPECT_FALSE(pgagent::can_execute("/bin/pr-does-not-exist"));
}

TEST(Utils, ShellQuote) {
  EXPECT_EQ(pgagent::shell_quote("simple"), "'simple'");
  EXPECT_EQ(pgagent::shell_quote("datname = 'db'"), "'datname = '\\''db'\\'''");

  auto out = pgagent::run_command(
      fmt::format("printf '%s' {}", pgagent::shell_quote("it's $HOME")).c_str());
  EXPECT_EQ(out.output, "it's $HOME");
}

TEST(Utils, ParseTags) {
  auto tags = pgagent::parse_tags("nf.app=pg,nf.cluster=pg-main, bad,=empty,key=");
  std::unordered_map<std::string, std::string> expected{{"nf.app", "pg"},
                                                        {"nf.cluster", "pg-main"}};
  EXPECT_EQ(tags, expected);
  EXPECT_TRUE(pgagent::parse_tags("").empty());
}

TEST(Utils, ReadFile) {
  auto lines = pgagent::read_file("lib/config/test/resources/agent.conf");
  ASSERT_TRUE(lines.has_value());
  EXPECT_FALSE(lines->empty());
  EXPECT_EQ(lines->at(0), "# test configuration");

  EXPECT_FALSE(pgagent::read_file("lib/config/test/resources/missing.conf").has_value());
}

}  // namespace
