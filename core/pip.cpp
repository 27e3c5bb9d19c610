#include "./pip.hpp"
#include "./locator.hpp"
#include "./process.hpp"
#include <functional>
#include <optional>
#include <regex>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::vector<std::pair<std::string, std::string>> UNBUFFERED_ENV = {
  {"PYTHONUNBUFFERED", "1"}
};

const std::regex TOOL_VERSION_REGEX("pip ([0-9.]+)");
const std::regex PACKAGE_NAME_REGEX("^([a-z0-9_]+)(-.+)?", std::regex::icase);

struct StatusMessages {
  std::string starting;
  std::string succeeded;
  std::string failed;
};

StatusMessages installMessages(const std::string& package) {
  return {"Installing '" + package + "'",
    "Successfully installed '" + package + "'",
    "Failed to install '" + package + "'"};
}

StatusMessages uninstallMessages(const std::string& package) {
  return {"Uninstalling '" + package + "'",
    "Successfully uninstalled '" + package + "'",
    "Failed to uninstall '" + package + "'"};
}

StatusMessages toolMessages() {
  return {"Installing pip", "Successfully installed pip", "Failed to install pip"};
}

void applyShowPolicy(OutputSink* output, const PreferenceSource& prefs) {
  if (prefs.showOutputWindowForInstalls()) {
    output->showAndActivate();
  } else {
    output->show();
  }
}

void reportStart(OutputSink* output, const PreferenceSource& prefs, const StatusMessages& messages) {
  if (!output) return;
  output->writeLine(messages.starting);
  applyShowPolicy(output, prefs);
}

void reportResult(OutputSink* output, const PreferenceSource& prefs, const StatusMessages& messages, int exitCode) {
  if (!output) return;
  if (exitCode == 0) {
    output->writeLine(messages.succeeded);
  } else {
    output->writeLine(messages.failed + ". Exit code " + std::to_string(exitCode));
  }
  applyShowPolicy(output, prefs);
}

std::string insecureArgument(const InterpreterConfiguration& config, OutputSink* output) {
  if (isSecureInstall(config)) return "";

  if (output) {
    output->writeErrorLine("Using '--insecure' option for Python 2.5.");
  }
  return "--insecure";
}

std::future<ProcessResult> runTool(const InterpreterConfiguration& config,
    OutputSink* output,
    bool elevate,
    const std::vector<std::string>& args,
    const CancellationToken& token) {
  config.throwIfNotRunnable();

  ToolInvocation invocation = resolveToolInvocation(config);

  ProcessSpec spec;
  spec.executable = invocation.executablePath;
  spec.arguments = buildToolArguments(invocation, args);
  spec.workingDirectory = config.prefixPath;
  spec.environmentOverrides = UNBUFFERED_ENV;
  spec.visible = false;
  spec.quoteArgs = false;
  spec.elevate = elevate;

  return runProcess(spec, output, token);
}

// Waits for a launched process. Launch failures are reported on the sink and
// count as a failed run, so callers always get to write a terminal status.
int runReported(OutputSink* output, const std::function<std::future<ProcessResult>()>& launch) {
  try {
    return launch().get().exitCode;
  } catch (const OperationCanceled&) {
    throw;
  } catch (const std::exception& e) {
    DebugLog(std::string("Launch failed: ") + e.what());
    if (output) {
      output->writeErrorLine(e.what());
    }
    return -1;
  }
}

PackageSet probeToolVersion(const InterpreterConfiguration& config, const CancellationToken& token) {
  PackageSet seed;
  try {
    ProcessResult result = runTool(config, nullptr, false, {"--version"}, token).get();
    if (result.exitCode != 0) {
      DebugLog("pip --version exited with code " + std::to_string(result.exitCode));
      return seed;
    }

    for (const auto& line : result.stdoutLines) {
      std::smatch match;
      if (std::regex_search(line, match, TOOL_VERSION_REGEX)) {
        seed.insert("pip==" + match[1].str());
      }
    }
  } catch (const OperationCanceled&) {
    throw;
  } catch (const std::exception& e) {
    DebugLog(std::string("pip --version could not run: ") + e.what());
  }
  return seed;
}

std::optional<PackageSet> freezeWithTool(const InterpreterConfiguration& config,
    const PackageSet& seed,
    const CancellationToken& token) {
  try {
    ProcessResult result = runTool(config, nullptr, false, {"freeze"}, token).get();
    if (result.exitCode != 0) {
      DebugLog("pip freeze exited with code " + std::to_string(result.exitCode));
      return std::nullopt;
    }

    PackageSet packages = seed;
    for (const auto& line : result.stdoutLines) {
      std::string entry = trimString(line);
      if (!entry.empty()) packages.insert(entry);
    }
    return packages;
  } catch (const OperationCanceled&) {
    throw;
  } catch (const std::exception& e) {
    DebugLog(std::string("pip freeze could not run: ") + e.what());
    return std::nullopt;
  }
}

// Names only; versions cannot be recovered reliably from directory names.
std::optional<PackageSet> scanSitePackages(const InterpreterConfiguration& config) {
  PackageSet packages;
  fs::path packagesPath = config.libraryPath / "site-packages";

  try {
    for (const auto& entry : fs::directory_iterator(packagesPath)) {
      if (!entry.is_directory()) continue;

      std::string name = entry.path().filename().string();
      std::smatch match;
      if (std::regex_search(name, match, PACKAGE_NAME_REGEX)) {
        packages.insert(match[1].str());
      }
    }
  } catch (const std::exception& e) {
    DebugLog("Scan of " + packagesPath.string() + " failed: " + e.what());
    packages.clear();
  }
  return packages;
}

std::string escapeForPythonLiteral(const std::string& text) {
  std::string escaped;
  for (char c : text) {
    if (c == '\\' || c == '\'') escaped += '\\';
    escaped += c;
  }
  return escaped;
}

} // anonymous namespace

std::future<PackageSet> freezePackages(const InterpreterConfiguration& config, CancellationToken token) {
  return std::async(std::launch::async, [config, token]() {
    PackageSet seed = probeToolVersion(config, token);

    std::vector<std::function<std::optional<PackageSet>()>> strategies = {
      [&]() { return freezeWithTool(config, seed, token); },
      [&]() { return scanSitePackages(config); },
    };

    for (const auto& strategy : strategies) {
      token.throwIfCancelled();
      std::optional<PackageSet> packages = strategy();
      if (packages) return *packages;
    }
    return PackageSet();
  });
}

std::future<bool> isPackageInstalled(const InterpreterConfiguration& config,
    const std::string& packageSpec,
    CancellationToken token) {
  return std::async(std::launch::async, [config, packageSpec, token]() {
    if (!config.isRunnable()) {
      return false;
    }

    std::string code = "import pkg_resources; pkg_resources.require('" +
      escapeForPythonLiteral(packageSpec) + "')";

    ProcessSpec spec;
    spec.executable = config.interpreterPath.string();
    spec.arguments = {"-c", code};
    spec.workingDirectory = config.prefixPath;
    spec.environmentOverrides = UNBUFFERED_ENV;
    spec.visible = false;
    spec.quoteArgs = true;

    try {
      return runProcess(spec, nullptr, token).get().exitCode == 0;
    } catch (const OperationCanceled&) {
      throw;
    } catch (const std::exception& e) {
      DebugLog(std::string("Installed check failed to run: ") + e.what());
      return false;
    }
  });
}

bool isToolInstalledInLibrary(const InterpreterConfiguration& config) {
  std::error_code ec;
  for (const fs::path& dir : {config.libraryPath, config.libraryPath / "site-packages"}) {
    if (fs::is_directory(dir / "pip", ec) || fs::is_regular_file(dir / "pip.py", ec)) {
      return true;
    }
  }
  return false;
}

bool isSecureInstall(const InterpreterConfiguration& config) {
  return config.version > Version{2, 5};
}

std::future<bool> installPackage(const InterpreterConfiguration& config,
    const std::string& package,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token) {
  config.throwIfNotRunnable();

  return std::async(std::launch::async, [config, package, elevate, output, &prefs, token]() {
    StatusMessages messages = installMessages(package);
    reportStart(output, prefs, messages);

    std::string insecure = insecureArgument(config, output);
    int exitCode = runReported(output, [&]() {
      return runTool(config, output, elevate, {"install", insecure, package}, token);
    });

    reportResult(output, prefs, messages, exitCode);
    return exitCode == 0;
  });
}

std::future<bool> installPackageEnsuringTool(const InterpreterConfiguration& config,
    const std::string& package,
    ConfirmationGate* gate,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const fs::path& bootstrapScript,
    CancellationToken token) {
  config.throwIfNotRunnable();

  return std::async(std::launch::async, [=, &prefs]() {
    if (gate && !isToolInstalledInLibrary(config)) {
      try {
        queryInstallTool(config, *gate, "pip is not installed for this interpreter. Install it now?",
            false, elevate, output, prefs, bootstrapScript, token).get();
      } catch (const OperationCanceled&) {
        DebugLog("pip installation declined, skipping install of " + package);
        return false;
      }
    }

    return installPackage(config, package, elevate, output, prefs, token).get();
  });
}

std::future<bool> uninstallPackage(const InterpreterConfiguration& config,
    const std::string& package,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token) {
  config.throwIfNotRunnable();

  return std::async(std::launch::async, [config, package, elevate, output, &prefs, token]() {
    StatusMessages messages = uninstallMessages(package);
    reportStart(output, prefs, messages);

    int exitCode = runReported(output, [&]() {
      return runTool(config, output, elevate, {"uninstall", "-y", package}, token);
    });

    reportResult(output, prefs, messages, exitCode);
    return exitCode == 0;
  });
}

std::future<bool> installTool(const InterpreterConfiguration& config,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const fs::path& bootstrapScript,
    CancellationToken token) {
  config.throwIfNotRunnable();

  std::error_code ec;
  if (!fs::is_regular_file(bootstrapScript, ec)) {
    throw NotRunnableError("Bootstrap script not found: '" + bootstrapScript.string() + "'");
  }

  return std::async(std::launch::async, [config, elevate, output, &prefs, bootstrapScript, token]() {
    StatusMessages messages = toolMessages();
    reportStart(output, prefs, messages);

    ProcessSpec spec;
    spec.executable = config.interpreterPath.string();
    spec.arguments = {fs::absolute(bootstrapScript).string()};
    spec.workingDirectory = config.prefixPath;
    spec.visible = false;
    spec.quoteArgs = true;
    spec.elevate = elevate || prefs.elevateToolInstalls();

    int exitCode = runReported(output, [&]() { return runProcess(spec, output, token); });

    reportResult(output, prefs, messages, exitCode);
    return exitCode == 0;
  });
}

std::future<bool> queryInstallPackage(const InterpreterConfiguration& config,
    const std::string& package,
    ConfirmationGate& gate,
    const std::string& message,
    bool checkInstalled,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token) {
  config.throwIfNotRunnable();

  return std::async(std::launch::async, [=, &gate, &prefs]() {
    if (checkInstalled && isPackageInstalled(config, package, token).get()) {
      DebugLog(package + " is already installed");
      return true;
    }

    if (gate.confirm(message) == ConfirmResult::Cancel) {
      throw OperationCanceled();
    }
    token.throwIfCancelled();

    return installPackage(config, package, elevate, output, prefs, token).get();
  });
}

std::future<bool> queryInstallTool(const InterpreterConfiguration& config,
    ConfirmationGate& gate,
    const std::string& message,
    bool checkInstalled,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const fs::path& bootstrapScript,
    CancellationToken token) {
  config.throwIfNotRunnable();

  return std::async(std::launch::async, [=, &gate, &prefs]() {
    if (checkInstalled && isToolInstalledInLibrary(config)) {
      DebugLog("pip is already installed in " + config.libraryPath.string());
      return true;
    }

    if (gate.confirm(message) == ConfirmResult::Cancel) {
      throw OperationCanceled();
    }
    token.throwIfCancelled();

    return installTool(config, elevate, output, prefs, bootstrapScript, token).get();
  });
}
