#ifndef CORE_HPP
#define CORE_HPP

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <stdexcept>
#include <filesystem>

struct Version {
  int major = 0;
  int minor = 0;

  static Version parse(const std::string& text);
  std::string toString() const;

  bool operator==(const Version& other) const = default;
  auto operator<=>(const Version& other) const = default;
};

struct InterpreterConfiguration {
  std::filesystem::path prefixPath;
  std::filesystem::path libraryPath;
  std::filesystem::path interpreterPath;
  Version version;

  bool isRunnable() const;
  void throwIfNotRunnable() const;
};

class NotRunnableError : public std::runtime_error {
public:
  explicit NotRunnableError(const std::string& what) : std::runtime_error(what) {}
};

class SpawnError : public std::runtime_error {
public:
  explicit SpawnError(const std::string& what) : std::runtime_error(what) {}
};

class OperationCanceled : public std::runtime_error {
public:
  OperationCanceled() : std::runtime_error("Operation canceled") {}
};

// Shared flag; copies observe the same cancellation.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { flag_->store(true); }
  bool isCancelled() const { return flag_->load(); }
  void throwIfCancelled() const {
    if (isCancelled()) throw OperationCanceled();
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

void setDebugMode(bool enabled);
bool isDebugEnabled();
void DebugLog(const std::string& msg);

std::string trimString(const std::string& str);
std::vector<std::string> splitLines(const std::string& text);
std::string quoteSingleArgument(const std::string& arg);
std::string unquoteArgument(const std::string& arg);
bool isExecutableFile(const std::filesystem::path& path);

#endif
