#include "./locator.hpp"

namespace fs = std::filesystem;

const std::string TOOL_MODULE = "pip";

const std::vector<ToolCandidate>& toolCandidates() {
#ifdef _WIN32
  static const std::vector<ToolCandidate> candidates = {
    {fs::path("Scripts") / "pip-script.py", true},
    {"pip-script.py", true},
    {fs::path("Scripts") / "pip.exe", false},
    {"pip.exe", false},
  };
#else
  static const std::vector<ToolCandidate> candidates = {
    {fs::path("bin") / "pip-script.py", true},
    {"pip-script.py", true},
    {fs::path("bin") / "pip", false},
    {"pip", false},
  };
#endif
  return candidates;
}

ToolInvocation resolveToolInvocation(const InterpreterConfiguration& config) {
  ToolInvocation invocation;

  for (const auto& candidate : toolCandidates()) {
    fs::path toolPath = config.prefixPath / candidate.relativePath;
    std::error_code ec;
    if (!fs::is_regular_file(toolPath, ec)) continue;

    DebugLog("Found package tool at " + toolPath.string());
    if (candidate.isScript) {
      invocation.executablePath = config.interpreterPath.string();
      invocation.leadingArguments = {quoteSingleArgument(toolPath.string())};
      invocation.requiresInterpreterPrefix = true;
    } else {
      invocation.executablePath = toolPath.string();
      invocation.requiresInterpreterPrefix = false;
    }
    return invocation;
  }

  DebugLog("No package tool under " + config.prefixPath.string() + ", using -m " + TOOL_MODULE);
  invocation.executablePath = config.interpreterPath.string();
  invocation.leadingArguments = {"-m", TOOL_MODULE};
  invocation.requiresInterpreterPrefix = true;
  return invocation;
}

std::vector<std::string> buildToolArguments(const ToolInvocation& invocation, const std::vector<std::string>& args) {
  std::vector<std::string> result = invocation.leadingArguments;
  for (const auto& arg : args) {
    if (!arg.empty()) result.push_back(arg);
  }
  return result;
}
