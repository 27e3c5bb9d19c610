#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <thread>
#include <mutex>
#include <string>
#include <vector>
#include <cstdlib>
#include <unistd.h>
#include "../core/process.hpp"

namespace fs = std::filesystem;

class RecordingSink : public OutputSink {
public:
  void writeLine(const std::string& text) override {
    std::lock_guard<std::mutex> lock(mutex);
    lines.push_back(text);
  }
  void writeErrorLine(const std::string& text) override {
    std::lock_guard<std::mutex> lock(mutex);
    errorLines.push_back(text);
  }
  void show() override {}
  void showAndActivate() override {}

  std::mutex mutex;
  std::vector<std::string> lines;
  std::vector<std::string> errorLines;
};

class ProcessTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir = fs::temp_directory_path() / ("pipfront_process_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    unsetenv("PIPFRONT_TEST_VAR");
    fs::remove_all(test_dir);
  }

  ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.arguments = {"-c", script};
    return spec;
  }

  fs::path test_dir;
};

TEST_F(ProcessTest, ReportsExitCode) {
  EXPECT_EQ(runProcess(shell("exit 0")).get().exitCode, 0);
  EXPECT_EQ(runProcess(shell("exit 3")).get().exitCode, 3);
}

TEST_F(ProcessTest, SignalTerminationMapsAbove128) {
  ProcessResult result = runProcess(shell("kill -9 $$")).get();
  EXPECT_EQ(result.exitCode, 128 + 9);
}

TEST_F(ProcessTest, CapturesStdoutLinesWithoutSink) {
  ProcessResult result = runProcess(shell("printf 'alpha\\nbeta\\r\\ngamma'")).get();

  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_TRUE(result.stderrLines.empty());
}

TEST_F(ProcessTest, RoutesStreamsToSink) {
  RecordingSink sink;

  ProcessResult result = runProcess(shell("echo out; echo err 1>&2; echo more"), &sink).get();

  EXPECT_EQ(sink.lines, (std::vector<std::string>{"out", "more"}));
  EXPECT_EQ(sink.errorLines, (std::vector<std::string>{"err"}));
  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"out", "more"}));
  EXPECT_EQ(result.stderrLines, (std::vector<std::string>{"err"}));
}

TEST_F(ProcessTest, CapturesLargeOutput) {
  ProcessResult result = runProcess(shell("i=0; while [ $i -lt 5000 ]; do echo line$i; i=$((i+1)); done")).get();

  ASSERT_EQ(result.stdoutLines.size(), 5000u);
  EXPECT_EQ(result.stdoutLines.front(), "line0");
  EXPECT_EQ(result.stdoutLines.back(), "line4999");
}

TEST_F(ProcessTest, AppliesEnvironmentOverrides) {
  ProcessSpec spec = shell("echo \"$PIPFRONT_TEST_VAR\"");
  spec.environmentOverrides = {{"PIPFRONT_TEST_VAR", "hello"}};

  ProcessResult result = runProcess(spec).get();

  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"hello"}));
}

TEST_F(ProcessTest, OverrideReplacesInheritedValue) {
  setenv("PIPFRONT_TEST_VAR", "inherited", 1);

  ProcessResult inherited = runProcess(shell("echo \"$PIPFRONT_TEST_VAR\"")).get();
  EXPECT_EQ(inherited.stdoutLines, (std::vector<std::string>{"inherited"}));

  ProcessSpec spec = shell("echo \"$PIPFRONT_TEST_VAR\"");
  spec.environmentOverrides = {{"PIPFRONT_TEST_VAR", "override"}};
  ProcessResult overridden = runProcess(spec).get();
  EXPECT_EQ(overridden.stdoutLines, (std::vector<std::string>{"override"}));
}

TEST_F(ProcessTest, RunsInWorkingDirectory) {
  ProcessSpec spec = shell("pwd -P");
  spec.workingDirectory = test_dir;

  ProcessResult result = runProcess(spec).get();

  ASSERT_EQ(result.stdoutLines.size(), 1u);
  EXPECT_EQ(fs::path(result.stdoutLines[0]), fs::canonical(test_dir));
}

TEST_F(ProcessTest, RelativeExecutableResolvedBeforeChangingDirectory) {
  fs::path script = test_dir / "tool.sh";
  std::ofstream file(script);
  file << "#!/bin/sh\necho ran\n";
  file.close();
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);

  fs::path original_cwd = fs::current_path();
  fs::current_path(test_dir);

  ProcessSpec spec;
  spec.executable = "./tool.sh";
  spec.workingDirectory = fs::temp_directory_path();
  ProcessResult result = runProcess(spec).get();

  fs::current_path(original_cwd);
  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"ran"}));
}

TEST_F(ProcessTest, MissingExecutableIsNotRunnable) {
  ProcessSpec spec;
  spec.executable = (test_dir / "missing").string();

  EXPECT_THROW(runProcess(spec), NotRunnableError);
}

TEST_F(ProcessTest, NonExecutableFileIsNotRunnable) {
  fs::path script = test_dir / "plain.txt";
  std::ofstream file(script);
  file << "echo hi\n";
  file.close();
  fs::permissions(script, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
      fs::perm_options::remove);

  ProcessSpec spec;
  spec.executable = script.string();

  EXPECT_THROW(runProcess(spec), NotRunnableError);
}

TEST_F(ProcessTest, UnknownBareNameIsNotRunnable) {
  ProcessSpec spec;
  spec.executable = "pipfront-no-such-program";

  EXPECT_THROW(runProcess(spec), NotRunnableError);
}

TEST_F(ProcessTest, MissingWorkingDirectoryIsNotRunnable) {
  ProcessSpec spec = shell("exit 0");
  spec.workingDirectory = test_dir / "missing";

  EXPECT_THROW(runProcess(spec), NotRunnableError);
}

TEST_F(ProcessTest, BareNameIsResolvedFromPath) {
  std::string resolved = resolveExecutable("sh");

  ASSERT_FALSE(resolved.empty());
  EXPECT_TRUE(fs::path(resolved).is_absolute());
}

TEST_F(ProcessTest, PreQuotedArgumentsAreUnquotedWhenQuoteArgsIsOff) {
  ProcessSpec spec = shell("echo \"$1\"");
  spec.arguments.push_back("sh");
  spec.arguments.push_back("\"with space\"");
  spec.quoteArgs = false;

  ProcessResult result = runProcess(spec).get();

  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"with space"}));
}

TEST_F(ProcessTest, RawArgumentsArePassedVerbatimWhenQuoteArgsIsOn) {
  ProcessSpec spec = shell("echo \"$1\"");
  spec.arguments.push_back("sh");
  spec.arguments.push_back("\"with space\"");
  spec.quoteArgs = true;

  ProcessResult result = runProcess(spec).get();

  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"\"with space\""}));
}

TEST_F(ProcessTest, InvisibleProcessReadsEmptyStdin) {
  ProcessSpec spec = shell("if read line; then echo got; else echo eof; fi");
  spec.visible = false;

  ProcessResult result = runProcess(spec).get();

  EXPECT_EQ(result.stdoutLines, (std::vector<std::string>{"eof"}));
}

TEST_F(ProcessTest, CancellationTerminatesRunningProcess) {
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();

  auto future = runProcess(shell("sleep 30"), nullptr, token);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  token.cancel();

  EXPECT_THROW(future.get(), OperationCanceled);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessTest, CancelledTokenSpawnsNothing) {
  CancellationToken token;
  token.cancel();
  fs::path marker = test_dir / "marker";

  auto future = runProcess(shell("touch '" + marker.string() + "'"), nullptr, token);

  EXPECT_THROW(future.get(), OperationCanceled);
  EXPECT_FALSE(fs::exists(marker));
}

TEST_F(ProcessTest, FormatCommandLineQuotesWhenRequested) {
  ProcessSpec spec;
  spec.executable = "/usr/bin/python3";
  spec.arguments = {"-c", "import sys; print(1)"};
  spec.quoteArgs = true;
  EXPECT_EQ(formatCommandLine(spec), "/usr/bin/python3 -c \"import sys; print(1)\"");

  spec.quoteArgs = false;
  spec.arguments = {"\"/my env/pip-script.py\"", "freeze"};
  EXPECT_EQ(formatCommandLine(spec), "/usr/bin/python3 \"/my env/pip-script.py\" freeze");
}

TEST_F(ProcessTest, EnvironmentOverridesAreAppendedOnce) {
  setenv("PIPFRONT_TEST_VAR", "inherited", 1);

  auto env = buildEnvironment({{"PIPFRONT_TEST_VAR", "new"}});

  int count = 0;
  for (const auto& entry : env) {
    if (entry.rfind("PIPFRONT_TEST_VAR=", 0) == 0) {
      ++count;
      EXPECT_EQ(entry, "PIPFRONT_TEST_VAR=new");
    }
  }
  EXPECT_EQ(count, 1);
}
