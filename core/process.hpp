#ifndef PROCESS_HPP
#define PROCESS_HPP

#include "./core.hpp"
#include "./collaborators.hpp"
#include <string>
#include <vector>
#include <utility>
#include <future>
#include <filesystem>

struct ProcessSpec {
  std::string executable;
  std::vector<std::string> arguments;
  std::filesystem::path workingDirectory;
  std::vector<std::pair<std::string, std::string>> environmentOverrides;
  bool visible = false;
  // When false, arguments may already be quoted with quoteSingleArgument()
  // and one enclosing pair of quotes is removed before exec.
  bool quoteArgs = true;
  bool elevate = false;
};

struct ProcessResult {
  int exitCode = -1;
  std::vector<std::string> stdoutLines;
  std::vector<std::string> stderrLines;
};

// Absolute path of an executable, searching PATH for bare names.
// Returns an empty string when nothing runnable is found.
std::string resolveExecutable(const std::string& executable);

std::string formatCommandLine(const ProcessSpec& spec);
std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides);

// Validates the request synchronously (NotRunnableError) and then runs the
// process on a worker thread. The sink, when given, must outlive the future.
// The future throws OperationCanceled if the token is cancelled while the
// process runs and SpawnError if pipe/fork fail.
std::future<ProcessResult> runProcess(const ProcessSpec& spec,
    OutputSink* sink = nullptr,
    CancellationToken token = CancellationToken());

#endif
