#include "./core.hpp"
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

static std::atomic<bool> g_debugMode{false};

void setDebugMode(bool enabled) {
  g_debugMode = enabled;
}

bool isDebugEnabled() {
  return g_debugMode;
}

void DebugLog(const std::string& msg) {
  if (g_debugMode) {
    std::cout << "[DEBUG] " << msg << std::endl;
  }
}

Version Version::parse(const std::string& text) {
  std::string trimmed = trimString(text);
  Version version;

  size_t dot = trimmed.find('.');
  std::string majorPart = trimmed.substr(0, dot);
  std::string minorPart;
  if (dot != std::string::npos) {
    size_t next = trimmed.find('.', dot + 1);
    minorPart = trimmed.substr(dot + 1, next == std::string::npos ? std::string::npos : next - dot - 1);
  }

  auto isNumber = [](const std::string& s) {
    return !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
  };

  if (!isNumber(majorPart) || (dot != std::string::npos && !isNumber(minorPart))) {
    throw std::invalid_argument("Invalid version string: '" + text + "'");
  }

  version.major = std::stoi(majorPart);
  version.minor = minorPart.empty() ? 0 : std::stoi(minorPart);
  return version;
}

std::string Version::toString() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

bool InterpreterConfiguration::isRunnable() const {
  return !interpreterPath.empty() && isExecutableFile(interpreterPath);
}

void InterpreterConfiguration::throwIfNotRunnable() const {
  if (!isRunnable()) {
    throw NotRunnableError("Interpreter is not runnable: '" + interpreterPath.string() + "'");
  }
}

bool isExecutableFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  return access(path.c_str(), X_OK) == 0;
}

std::string trimString(const std::string& str) {
  if (str.empty()) return "";

  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";

  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::string quoteSingleArgument(const std::string& arg) {
  if (arg.empty()) return "\"\"";
  if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"') return arg;
  if (arg.find_first_of(" \t\"") == std::string::npos) return arg;

  std::string quoted = "\"";
  for (char c : arg) {
    if (c == '"' || c == '\\') quoted += '\\';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string unquoteArgument(const std::string& arg) {
  if (arg.size() < 2 || arg.front() != '"' || arg.back() != '"') return arg;

  std::string inner;
  for (size_t i = 1; i + 1 < arg.size(); ++i) {
    if (arg[i] == '\\' && i + 2 < arg.size() && (arg[i + 1] == '"' || arg[i + 1] == '\\')) {
      ++i;
    }
    inner += arg[i];
  }
  return inner;
}
