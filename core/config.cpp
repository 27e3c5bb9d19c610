#include "./config.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

#ifndef PIPFRONT_DATA_DIR
#define PIPFRONT_DATA_DIR "./scripts"
#endif

namespace {

constexpr unsigned kConfigParseFlags = rapidjson::kParseDefaultFlags |
  rapidjson::kParseCommentsFlag |
  rapidjson::kParseTrailingCommasFlag;

std::string readFile(const fs::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot open config file: '" + path.string() + "'");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string getString(const rapidjson::Value& object, const char* name) {
  if (!object.HasMember(name)) return "";
  if (!object[name].IsString()) {
    throw ConfigError(std::string("Config key '") + name + "' must be a string");
  }
  return object[name].GetString();
}

bool getBool(const rapidjson::Value& object, const char* name, bool fallback) {
  if (!object.HasMember(name)) return fallback;
  if (!object[name].IsBool()) {
    throw ConfigError(std::string("Config key '") + name + "' must be a boolean");
  }
  return object[name].GetBool();
}

} // anonymous namespace

fs::path defaultBootstrapScript() {
  return fs::path(PIPFRONT_DATA_DIR) / "pip_bootstrap.py";
}

fs::path defaultPrefixPath(const fs::path& interpreter) {
  fs::path binDir = interpreter.parent_path();
  if (binDir.filename() == "bin" || binDir.filename() == "Scripts") {
    return binDir.parent_path();
  }
  return binDir;
}

fs::path defaultLibraryPath(const fs::path& prefix, const Version& version) {
#ifdef _WIN32
  (void)version;
  return prefix / "Lib";
#else
  return prefix / "lib" / ("python" + version.toString());
#endif
}

void completeInterpreterConfiguration(InterpreterConfiguration& interpreter) {
  if (interpreter.prefixPath.empty()) {
    interpreter.prefixPath = defaultPrefixPath(interpreter.interpreterPath);
  }
  if (interpreter.libraryPath.empty()) {
    interpreter.libraryPath = defaultLibraryPath(interpreter.prefixPath, interpreter.version);
  }
}

AppConfig parseConfig(const std::string& json) {
  rapidjson::Document doc;
  rapidjson::ParseResult ok = doc.Parse<kConfigParseFlags>(json.c_str());
  if (!ok) {
    throw ConfigError("Config parse error at offset " + std::to_string(ok.Offset()) +
        ": " + rapidjson::GetParseError_En(ok.Code()));
  }
  if (!doc.IsObject()) {
    throw ConfigError("Config root must be an object");
  }

  AppConfig config;
  config.bootstrapScript = defaultBootstrapScript();

  if (!doc.HasMember("interpreter") || !doc["interpreter"].IsObject()) {
    throw ConfigError("Config is missing the 'interpreter' object");
  }
  const rapidjson::Value& interpreter = doc["interpreter"];

  std::string executable = getString(interpreter, "executable");
  if (executable.empty()) {
    throw ConfigError("Config is missing 'interpreter.executable'");
  }
  std::string version = getString(interpreter, "version");
  if (version.empty()) {
    throw ConfigError("Config is missing 'interpreter.version'");
  }

  config.interpreter.interpreterPath = executable;
  try {
    config.interpreter.version = Version::parse(version);
  } catch (const std::logic_error& e) {
    throw ConfigError(e.what());
  }
  config.interpreter.prefixPath = getString(interpreter, "prefix");
  config.interpreter.libraryPath = getString(interpreter, "library");
  completeInterpreterConfiguration(config.interpreter);

  if (doc.HasMember("preferences")) {
    const rapidjson::Value& prefs = doc["preferences"];
    if (!prefs.IsObject()) {
      throw ConfigError("Config key 'preferences' must be an object");
    }
    config.showOutputWindowForInstalls = getBool(prefs, "showOutputWindowForInstalls", true);
    config.elevateToolInstalls = getBool(prefs, "elevateToolInstalls", false);
  }

  std::string bootstrap = getString(doc, "bootstrapScript");
  if (!bootstrap.empty()) {
    config.bootstrapScript = bootstrap;
  }

  DebugLog("Loaded config: interpreter=" + config.interpreter.interpreterPath.string() +
      ", prefix=" + config.interpreter.prefixPath.string() +
      ", library=" + config.interpreter.libraryPath.string() +
      ", version=" + config.interpreter.version.toString());
  return config;
}

AppConfig loadConfigFile(const fs::path& path) {
  return parseConfig(readFile(path));
}

bool FilePreferenceSource::showOutputWindowForInstalls() const {
  return readFlag("showOutputWindowForInstalls", true);
}

bool FilePreferenceSource::elevateToolInstalls() const {
  return readFlag("elevateToolInstalls", false);
}

bool FilePreferenceSource::readFlag(const char* name, bool fallback) const {
  std::ifstream file(path_);
  if (!file.is_open()) return fallback;

  std::stringstream buffer;
  buffer << file.rdbuf();

  rapidjson::Document doc;
  rapidjson::ParseResult ok = doc.Parse<kConfigParseFlags>(buffer.str().c_str());
  if (!ok || !doc.IsObject()) {
    DebugLog("Preferences unreadable in " + path_.string() + ", using default for " + name);
    return fallback;
  }

  if (!doc.HasMember("preferences") || !doc["preferences"].IsObject()) return fallback;
  const rapidjson::Value& prefs = doc["preferences"];
  if (!prefs.HasMember(name) || !prefs[name].IsBool()) return fallback;
  return prefs[name].GetBool();
}
