#include <simpleargumentsparser.hpp>
#include "../core/core.hpp"
#include "../core/collaborators.hpp"
#include "../core/config.hpp"
#include "../core/pip.hpp"
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <iomanip>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

CLI cli;
CancellationToken g_cancel;

void Verbose(std::string msg);
void Debug(std::string msg);
void Warning(std::string msg);
void Error(std::string msg);
void ShowHelp();
AppConfig LoadConfiguration(bool& fromFile, fs::path& configPath);
int RunCommand(const std::string& command, const AppConfig& config, const PreferenceSource& prefs, bool verbose);

void onInterrupt(int) {
  g_cancel.cancel();
}

int main(int argc, char* argv[]) {
  cli = parseCLI(argc, argv);

  bool verbose = cli.s["v"] || cli.c["verbose"];
  bool debug = cli.s["d"] || cli.c["debug"];

  setDebugMode(debug);

  if (cli.c["version"]) {
    std::cout << cli.color["bold"]["cyan"]("pipfront V1.0.0") << std::endl;
    return 0;
  }

  if (cli.s["h"] || cli.c["help"] || cli.noArgs || cli.o.empty()) {
    ShowHelp();
    return 0;
  }

  if (verbose) Verbose("Verbose mode enabled");
  if (debug) Debug("Debug mode enabled");

  std::signal(SIGINT, onInterrupt);

  try {
    bool fromFile = false;
    fs::path configPath;
    AppConfig config = LoadConfiguration(fromFile, configPath);

    std::unique_ptr<PreferenceSource> prefs;
    if (fromFile) {
      prefs = std::make_unique<FilePreferenceSource>(configPath);
    } else {
      prefs = std::make_unique<FixedPreferenceSource>(config.showOutputWindowForInstalls, config.elevateToolInstalls);
    }

    if (verbose) {
      Verbose("Interpreter: " + config.interpreter.interpreterPath.string() +
          " (Python " + config.interpreter.version.toString() + ")");
      Verbose("Prefix: " + config.interpreter.prefixPath.string());
      Verbose("Library: " + config.interpreter.libraryPath.string());
    }

    return RunCommand(cli.o[0].first, config, *prefs, verbose);
  }
  catch (const OperationCanceled&) {
    Warning("Operation canceled");
    return 130;
  }
  catch (const NotRunnableError& e) {
    std::cout << cli.color["red"]("[-] Error: " + std::string(e.what())) << std::endl;
    return 2;
  }
  catch (const ConfigError& e) {
    Error(e.what());
  }
  catch (const std::exception& e) {
    Error(e.what());
  }

  return 1;
}

AppConfig LoadConfiguration(bool& fromFile, fs::path& configPath) {
  AppConfig config;
  config.bootstrapScript = defaultBootstrapScript();

  configPath = cli.c["config"] ? fs::path(cli.c["config"].toString()) : fs::path(DEFAULT_CONFIG_FILE);
  fromFile = fs::exists(configPath);

  if (fromFile) {
    Debug("Loading configuration from " + configPath.string());
    config = loadConfigFile(configPath);
  } else if (cli.c["config"]) {
    throw ConfigError("Config file not found: '" + configPath.string() + "'");
  }

  if (cli.c["python"]) {
    config.interpreter.interpreterPath = cli.c["python"].toString();
    if (!fromFile) {
      config.interpreter.prefixPath.clear();
      config.interpreter.libraryPath.clear();
    }
  }
  if (cli.c["py-version"]) {
    try {
      config.interpreter.version = Version::parse(cli.c["py-version"].toString());
    } catch (const std::logic_error& e) {
      throw ConfigError(e.what());
    }
  }
  if (cli.c["prefix"]) config.interpreter.prefixPath = cli.c["prefix"].toString();
  if (cli.c["lib"]) config.interpreter.libraryPath = cli.c["lib"].toString();
  if (cli.c["bootstrap"]) config.bootstrapScript = cli.c["bootstrap"].toString();

  if (config.interpreter.interpreterPath.empty()) {
    throw ConfigError("No interpreter configured. Use --config <file> or --python <path> --py-version <X.Y>");
  }
  if (!fromFile && !cli.c["py-version"]) {
    throw ConfigError("--py-version is required when no config file is used");
  }

  completeInterpreterConfiguration(config.interpreter);
  return config;
}

int RunCommand(const std::string& command, const AppConfig& config, const PreferenceSource& prefs, bool verbose) {
  const InterpreterConfiguration& interpreter = config.interpreter;
  bool elevate = static_cast<bool>(cli.c["elevate"]);
  bool check = static_cast<bool>(cli.c["check"]);

  std::unique_ptr<ConfirmationGate> gate;
  if (cli.s["y"] || cli.c["yes"]) {
    gate = std::make_unique<FixedConfirmationGate>(ConfirmResult::Proceed);
  } else {
    gate = std::make_unique<ConsoleConfirmationGate>();
  }

  ConsoleOutputSink output;

  if (command == "freeze") {
    PackageSet packages = freezePackages(interpreter, g_cancel).get();
    for (const auto& package : packages) {
      std::cout << package << std::endl;
    }
    if (verbose) Verbose(std::to_string(packages.size()) + " packages");
    return 0;
  }
  else if (command == "install") {
    if (cli.o.size() < 2) {
      Error("Usage: install <package> [--check] [--yes] [--elevate]");
    }
    std::string package = cli.o[1].first;
    bool ok;
    if (check) {
      ok = queryInstallPackage(interpreter, package, *gate, "Install '" + package + "'?",
          true, elevate, &output, prefs, g_cancel).get();
    } else {
      ok = installPackageEnsuringTool(interpreter, package, gate.get(), elevate, &output,
          prefs, config.bootstrapScript, g_cancel).get();
    }
    return ok ? 0 : 1;
  }
  else if (command == "uninstall") {
    if (cli.o.size() < 2) {
      Error("Usage: uninstall <package> [--elevate]");
    }
    bool ok = uninstallPackage(interpreter, cli.o[1].first, elevate, &output, prefs, g_cancel).get();
    return ok ? 0 : 1;
  }
  else if (command == "install-pip") {
    bool ok = queryInstallTool(interpreter, *gate, "Install pip for " + interpreter.interpreterPath.string() + "?",
        check, elevate, &output, prefs, config.bootstrapScript, g_cancel).get();
    return ok ? 0 : 1;
  }
  else if (command == "is-installed") {
    if (cli.o.size() < 2) {
      Error("Usage: is-installed <package[==version]>");
    }
    std::string spec = cli.o[1].first;
    bool installed = isPackageInstalled(interpreter, spec, g_cancel).get();
    if (installed) {
      std::cout << cli.color["green"]("[+] " + spec + " is installed") << std::endl;
    } else {
      std::cout << cli.color["yellow"]("[!] " + spec + " is not installed") << std::endl;
    }
    return installed ? 0 : 1;
  }

  Error("Unknown command: " + command);
  return 1;
}

void ShowHelp() {
  auto bold = cli.color["bold"];
  auto cyan = cli.color["cyan"];
  auto dim = cli.color["dim"];

  std::cout << "\n" << bold["cyan"]("PIPFRONT") << " - pip front-end for Python environments\n" << std::endl;

  std::cout << bold["white"]("USAGE:") << std::endl;
  std::cout << "  ./pipfront <command> [arguments] [options]\n" << std::endl;

  std::cout << bold["white"]("COMMANDS:") << std::endl;
  std::cout << std::left << std::setw(40) << "  freeze" << "List installed packages" << std::endl;
  std::cout << std::left << std::setw(40) << "  install <package>" << "Install a package (offers to install pip)" << std::endl;
  std::cout << std::left << std::setw(40) << "  uninstall <package>" << "Uninstall a package" << std::endl;
  std::cout << std::left << std::setw(40) << "  install-pip" << "Install pip with the bootstrap script" << std::endl;
  std::cout << std::left << std::setw(40) << "  is-installed <package[==version]>" << "Exit 0 when the requirement is satisfied" << std::endl;

  std::cout << "\n" << bold["white"]("OPTIONS:") << std::endl;
  std::cout << std::left << std::setw(40) << "  -h, --help" << "Show this help" << std::endl;
  std::cout << std::left << std::setw(40) << "  -v, --verbose" << "Show more information" << std::endl;
  std::cout << std::left << std::setw(40) << "  -d, --debug" << "Show debug logs" << std::endl;
  std::cout << std::left << std::setw(40) << "  -y, --yes" << "Answer yes to confirmation prompts" << std::endl;
  std::cout << std::left << std::setw(40) << "  --check" << "Skip install when already present" << std::endl;
  std::cout << std::left << std::setw(40) << "  --elevate" << "Run pip through sudo" << std::endl;
  std::cout << std::left << std::setw(40) << "  --config <file>" << "Config file (default ./pipfront.json)" << std::endl;
  std::cout << std::left << std::setw(40) << "  --python <path>" << "Interpreter executable" << std::endl;
  std::cout << std::left << std::setw(40) << "  --py-version <X.Y>" << "Interpreter version" << std::endl;
  std::cout << std::left << std::setw(40) << "  --prefix <dir>" << "Environment prefix" << std::endl;
  std::cout << std::left << std::setw(40) << "  --lib <dir>" << "Library directory containing site-packages" << std::endl;
  std::cout << std::left << std::setw(40) << "  --bootstrap <file>" << "pip bootstrap script" << std::endl;
  std::cout << std::left << std::setw(40) << "  --version" << "Show version" << std::endl;

  std::cout << "\n" << dim["yellow"]("Examples:") << std::endl;
  std::cout << "  " << cyan("./pipfront freeze --python /opt/venv/bin/python --py-version 3.11") << std::endl;
  std::cout << "  " << cyan("./pipfront install requests==2.28.1 --yes") << std::endl;
  std::cout << "  " << cyan("./pipfront uninstall numpy --config env.json") << std::endl;
  std::cout << "  " << cyan("./pipfront is-installed 'six>=1.16'") << std::endl;
  std::cout << std::endl;
}

void Verbose(std::string msg) {
  std::cout << cli.color["green"]("[+] " + msg) << std::endl;
}

void Debug(std::string msg) {
  if (!isDebugEnabled()) return;
  std::cout << cli.color["blue"]("[DEBUG] " + msg) << std::endl;
}

void Warning(std::string msg) {
  std::cout << cli.color["yellow"]("[!] " + msg) << std::endl;
}

void Error(std::string msg) {
  std::cout << cli.color["red"]("[-] Error: " + msg) << std::endl;
  std::exit(1);
}
