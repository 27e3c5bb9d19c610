#include "./process.hpp"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kTerminateGraceMs = 2000;

// Owns a spawned child and its pipes. Descriptors are closed and the child
// is reaped on every path out of the owning scope.
class ScopedProcess {
public:
  ScopedProcess() = default;
  ScopedProcess(const ScopedProcess&) = delete;
  ScopedProcess& operator=(const ScopedProcess&) = delete;

  ~ScopedProcess() {
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
    if (pid_ > 0 && !reaped_) {
      kill(pid_, SIGKILL);
      int status = 0;
      while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
  }

  void spawn(const std::vector<std::string>& argv,
      const std::vector<std::string>& envp,
      const fs::path& workingDirectory,
      bool visible) {
    int outPipe[2];
    int errPipe[2];

    if (pipe2(outPipe, O_CLOEXEC) != 0) {
      throw SpawnError(std::string("Failed to create stdout pipe: ") + strerror(errno));
    }
    stdoutFd_ = outPipe[0];

    if (pipe2(errPipe, O_CLOEXEC) != 0) {
      int err = errno;
      close(outPipe[1]);
      throw SpawnError(std::string("Failed to create stderr pipe: ") + strerror(err));
    }
    stderrFd_ = errPipe[0];

    // Everything the child touches is prepared before fork.
    std::vector<char*> execArgs;
    for (const auto& arg : argv) execArgs.push_back(const_cast<char*>(arg.c_str()));
    execArgs.push_back(nullptr);

    std::vector<char*> execEnv;
    for (const auto& entry : envp) execEnv.push_back(const_cast<char*>(entry.c_str()));
    execEnv.push_back(nullptr);

    std::string cwd = workingDirectory.string();

    pid_t pid = fork();
    if (pid == 0) {
      if (!visible) {
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
          dup2(devNull, STDIN_FILENO);
          close(devNull);
        }
      }
      dup2(outPipe[1], STDOUT_FILENO);
      dup2(errPipe[1], STDERR_FILENO);

      if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        const char msg[] = "pipfront: cannot change to working directory\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
      }

      execve(execArgs[0], execArgs.data(), execEnv.data());

      const char msg[] = "pipfront: exec failed\n";
      ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
      (void)ignored;
      _exit(127);
    }

    int forkErr = errno;
    close(outPipe[1]);
    close(errPipe[1]);

    if (pid < 0) {
      throw SpawnError(std::string("Failed to fork: ") + strerror(forkErr));
    }

    pid_ = pid;
    DebugLog("Child PID = " + std::to_string(pid_));
  }

  int wait(OutputSink* sink, const CancellationToken& token, ProcessResult& result) {
    std::string outBuffer;
    std::string errBuffer;

    while (stdoutFd_ >= 0 || stderrFd_ >= 0) {
      if (token.isCancelled()) {
        DebugLog("Cancellation requested, terminating PID " + std::to_string(pid_));
        terminate();
        throw OperationCanceled();
      }

      struct pollfd fds[2];
      nfds_t count = 0;
      if (stdoutFd_ >= 0) fds[count++] = {stdoutFd_, POLLIN, 0};
      if (stderrFd_ >= 0) fds[count++] = {stderrFd_, POLLIN, 0};

      int ready = poll(fds, count, kPollIntervalMs);
      if (ready < 0) {
        if (errno == EINTR) continue;
        throw SpawnError(std::string("poll failed: ") + strerror(errno));
      }
      if (ready == 0) continue;

      for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) continue;
        bool isStdout = fds[i].fd == stdoutFd_;
        int& fd = isStdout ? stdoutFd_ : stderrFd_;
        std::string& buffer = isStdout ? outBuffer : errBuffer;

        if (!readChunk(fd, buffer)) {
          closeFd(fd);
          if (!buffer.empty()) {
            deliverLine(buffer, isStdout, sink, result);
            buffer.clear();
          }
          continue;
        }

        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
          deliverLine(buffer.substr(0, newline), isStdout, sink, result);
          buffer.erase(0, newline + 1);
        }
      }
    }

    return reap(token);
  }

private:
  static void closeFd(int& fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  // False on EOF or unrecoverable read error.
  static bool readChunk(int fd, std::string& buffer) {
    char chunk[4096];
    ssize_t n;
    do {
      n = read(fd, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);

    if (n <= 0) return false;
    buffer.append(chunk, static_cast<size_t>(n));
    return true;
  }

  static void deliverLine(std::string line, bool isStdout, OutputSink* sink, ProcessResult& result) {
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (isStdout) {
      if (sink) sink->writeLine(line);
      result.stdoutLines.push_back(std::move(line));
    } else {
      if (sink) sink->writeErrorLine(line);
      result.stderrLines.push_back(std::move(line));
    }
  }

  static int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
  }

  // Streams are closed but the child may still be running.
  int reap(const CancellationToken& token) {
    int status = 0;
    while (true) {
      pid_t r = waitpid(pid_, &status, WNOHANG);
      if (r == pid_) break;
      if (r < 0) {
        if (errno == EINTR) continue;
        reaped_ = true;
        throw SpawnError(std::string("waitpid failed: ") + strerror(errno));
      }
      if (token.isCancelled()) {
        terminate();
        throw OperationCanceled();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs / 10));
    }
    reaped_ = true;
    return decodeStatus(status);
  }

  void terminate() {
    if (pid_ <= 0 || reaped_) return;

    kill(pid_, SIGTERM);
    int status = 0;
    for (int waited = 0; waited < kTerminateGraceMs; waited += kPollIntervalMs) {
      pid_t r = waitpid(pid_, &status, WNOHANG);
      if (r == pid_ || (r < 0 && errno != EINTR)) {
        reaped_ = true;
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    kill(pid_, SIGKILL);
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    reaped_ = true;
  }

  pid_t pid_ = -1;
  int stdoutFd_ = -1;
  int stderrFd_ = -1;
  bool reaped_ = false;
};

std::vector<std::string> buildArgv(const ProcessSpec& spec, const std::string& resolved, const std::string& sudoPath) {
  std::vector<std::string> argv;
  if (!sudoPath.empty()) {
    argv.push_back(sudoPath);
    argv.push_back("--");
  }
  argv.push_back(resolved);
  for (const auto& arg : spec.arguments) {
    argv.push_back(spec.quoteArgs ? arg : unquoteArgument(arg));
  }
  return argv;
}

} // anonymous namespace

std::string resolveExecutable(const std::string& executable) {
  if (executable.empty()) return "";

  if (executable.find('/') != std::string::npos) {
    std::error_code ec;
    fs::path absolute = fs::absolute(executable, ec);
    if (ec || !isExecutableFile(absolute)) return "";
    return absolute.string();
  }

  const char* pathEnv = std::getenv("PATH");
  if (!pathEnv) return "";

  std::string paths = pathEnv;
  size_t start = 0;
  while (start <= paths.size()) {
    size_t end = paths.find(':', start);
    if (end == std::string::npos) end = paths.size();
    std::string dir = paths.substr(start, end - start);
    if (dir.empty()) dir = ".";

    fs::path candidate = fs::path(dir) / executable;
    if (isExecutableFile(candidate)) {
      std::error_code ec;
      fs::path absolute = fs::absolute(candidate, ec);
      return ec ? candidate.string() : absolute.string();
    }
    start = end + 1;
  }
  return "";
}

std::string formatCommandLine(const ProcessSpec& spec) {
  std::string cmd = quoteSingleArgument(spec.executable);
  for (const auto& arg : spec.arguments) {
    cmd += " " + (spec.quoteArgs ? quoteSingleArgument(arg) : arg);
  }
  return cmd;
}

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string item = *entry;
    std::string key = item.substr(0, item.find('='));

    bool overridden = false;
    for (const auto& [name, value] : overrides) {
      if (name == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) env.push_back(item);
  }

  for (const auto& [name, value] : overrides) {
    env.push_back(name + "=" + value);
  }
  return env;
}

std::future<ProcessResult> runProcess(const ProcessSpec& spec, OutputSink* sink, CancellationToken token) {
  std::string resolved = resolveExecutable(spec.executable);
  if (resolved.empty()) {
    throw NotRunnableError("Executable not found or not runnable: '" + spec.executable + "'");
  }

  std::error_code ec;
  if (!spec.workingDirectory.empty() && !fs::is_directory(spec.workingDirectory, ec)) {
    throw NotRunnableError("Working directory does not exist: '" + spec.workingDirectory.string() + "'");
  }

  std::string sudoPath;
  if (spec.elevate && geteuid() != 0) {
    sudoPath = resolveExecutable("sudo");
    if (sudoPath.empty()) {
      throw NotRunnableError("Elevation requested but sudo is not available");
    }
  }

  std::vector<std::string> argv = buildArgv(spec, resolved, sudoPath);
  std::vector<std::string> envp = buildEnvironment(spec.environmentOverrides);
  fs::path workingDirectory = spec.workingDirectory;
  bool visible = spec.visible;

  DebugLog(std::string("Running: ") + (sudoPath.empty() ? "" : "sudo -- ") + formatCommandLine(spec));

  return std::async(std::launch::async,
      [argv = std::move(argv), envp = std::move(envp), workingDirectory, visible, sink, token]() {
        token.throwIfCancelled();

        ProcessResult result;
        ScopedProcess process;
        process.spawn(argv, envp, workingDirectory, visible);
        result.exitCode = process.wait(sink, token, result);

        DebugLog("Process '" + argv.front() + "' exited with code " + std::to_string(result.exitCode));
        return result;
      });
}
