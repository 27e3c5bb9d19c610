#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "./core.hpp"
#include "./collaborators.hpp"
#include <string>
#include <filesystem>

const std::string DEFAULT_CONFIG_FILE = "./pipfront.json";

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct AppConfig {
  InterpreterConfiguration interpreter;
  bool showOutputWindowForInstalls = true;
  bool elevateToolInstalls = false;
  std::filesystem::path bootstrapScript;
};

std::filesystem::path defaultBootstrapScript();
std::filesystem::path defaultLibraryPath(const std::filesystem::path& prefix, const Version& version);
std::filesystem::path defaultPrefixPath(const std::filesystem::path& interpreter);

AppConfig parseConfig(const std::string& json);
AppConfig loadConfigFile(const std::filesystem::path& path);

// Fills prefix and library from the executable and version when missing.
void completeInterpreterConfiguration(InterpreterConfiguration& interpreter);

// Re-reads the configuration file on every query.
class FilePreferenceSource : public PreferenceSource {
public:
  explicit FilePreferenceSource(std::filesystem::path path) : path_(std::move(path)) {}

  bool showOutputWindowForInstalls() const override;
  bool elevateToolInstalls() const override;

private:
  bool readFlag(const char* name, bool fallback) const;

  std::filesystem::path path_;
};

#endif
