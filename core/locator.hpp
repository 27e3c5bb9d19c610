#ifndef LOCATOR_HPP
#define LOCATOR_HPP

#include "./core.hpp"
#include <string>
#include <vector>
#include <filesystem>

struct ToolCandidate {
  std::filesystem::path relativePath;
  bool isScript;
};

struct ToolInvocation {
  std::string executablePath;
  std::vector<std::string> leadingArguments;
  bool requiresInterpreterPrefix = false;
};

// Relative to the prefix directory, in probing order.
const std::vector<ToolCandidate>& toolCandidates();

ToolInvocation resolveToolInvocation(const InterpreterConfiguration& config);
std::vector<std::string> buildToolArguments(const ToolInvocation& invocation, const std::vector<std::string>& args);

#endif
