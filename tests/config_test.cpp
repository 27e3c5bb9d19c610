#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <string>
#include <unistd.h>
#include "../core/config.hpp"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir = fs::temp_directory_path() / ("pipfront_config_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    fs::remove_all(test_dir);
  }

  fs::path writeConfig(const std::string& content) {
    fs::path path = test_dir / "pipfront.json";
    std::ofstream file(path);
    file << content;
    file.close();
    return path;
  }

  fs::path test_dir;
};

TEST_F(ConfigTest, ParsesFullConfiguration) {
  AppConfig config = parseConfig(R"({
    "interpreter": {
      "prefix": "/opt/venv",
      "library": "/opt/venv/lib/python3.11",
      "executable": "/opt/venv/bin/python",
      "version": "3.11"
    },
    "preferences": {
      "showOutputWindowForInstalls": false,
      "elevateToolInstalls": true
    },
    "bootstrapScript": "/usr/share/pipfront/pip_bootstrap.py"
  })");

  EXPECT_EQ(config.interpreter.prefixPath, fs::path("/opt/venv"));
  EXPECT_EQ(config.interpreter.libraryPath, fs::path("/opt/venv/lib/python3.11"));
  EXPECT_EQ(config.interpreter.interpreterPath, fs::path("/opt/venv/bin/python"));
  EXPECT_EQ(config.interpreter.version, (Version{3, 11}));
  EXPECT_FALSE(config.showOutputWindowForInstalls);
  EXPECT_TRUE(config.elevateToolInstalls);
  EXPECT_EQ(config.bootstrapScript, fs::path("/usr/share/pipfront/pip_bootstrap.py"));
}

TEST_F(ConfigTest, DerivesPrefixAndLibraryFromExecutable) {
  AppConfig config = parseConfig(R"({
    "interpreter": { "executable": "/opt/venv/bin/python", "version": "3.11.4" }
  })");

  EXPECT_EQ(config.interpreter.prefixPath, fs::path("/opt/venv"));
  EXPECT_EQ(config.interpreter.libraryPath, fs::path("/opt/venv/lib/python3.11"));
  EXPECT_TRUE(config.showOutputWindowForInstalls);
  EXPECT_FALSE(config.elevateToolInstalls);
  EXPECT_EQ(config.bootstrapScript, defaultBootstrapScript());
}

TEST_F(ConfigTest, ExecutableOutsideBinUsesItsDirectory) {
  EXPECT_EQ(defaultPrefixPath("/usr/local/python3"), fs::path("/usr/local"));
  EXPECT_EQ(defaultPrefixPath("/opt/py/bin/python3"), fs::path("/opt/py"));
}

TEST_F(ConfigTest, AcceptsCommentsAndTrailingCommas) {
  AppConfig config = parseConfig(R"({
    // interpreter used by the build machine
    "interpreter": { "executable": "/usr/bin/python3", "version": "3.10", },
  })");

  EXPECT_EQ(config.interpreter.version, (Version{3, 10}));
}

TEST_F(ConfigTest, MalformedJsonReportsOffset) {
  try {
    parseConfig("{ \"interpreter\": ");
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("offset"), std::string::npos);
  }
}

TEST_F(ConfigTest, MissingInterpreterIsAnError) {
  EXPECT_THROW(parseConfig("{}"), ConfigError);
  EXPECT_THROW(parseConfig("[]"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"interpreter": {"version": "3.11"}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"interpreter": {"executable": "/usr/bin/python3"}})"), ConfigError);
}

TEST_F(ConfigTest, WrongTypesAreErrors) {
  EXPECT_THROW(parseConfig(R"({"interpreter": {"executable": 3, "version": "3.11"}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"interpreter": {"executable": "/p", "version": "3.11"},
      "preferences": {"elevateToolInstalls": "yes"}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"interpreter": {"executable": "/p", "version": "3.11"},
      "preferences": true})"), ConfigError);
}

TEST_F(ConfigTest, InvalidVersionIsAnError) {
  EXPECT_THROW(parseConfig(R"({"interpreter": {"executable": "/p", "version": "three"}})"), ConfigError);
}

TEST_F(ConfigTest, LoadsFromFile) {
  fs::path path = writeConfig(R"({"interpreter": {"executable": "/usr/bin/python3", "version": "2.7"}})");

  AppConfig config = loadConfigFile(path);

  EXPECT_EQ(config.interpreter.version, (Version{2, 7}));
  EXPECT_EQ(config.interpreter.prefixPath, fs::path("/usr"));
}

TEST_F(ConfigTest, MissingFileIsAnError) {
  EXPECT_THROW(loadConfigFile(test_dir / "missing.json"), ConfigError);
}

TEST_F(ConfigTest, FilePreferencesAreReadOnEveryQuery) {
  fs::path path = writeConfig(R"({"preferences": {"showOutputWindowForInstalls": true}})");
  FilePreferenceSource prefs(path);

  EXPECT_TRUE(prefs.showOutputWindowForInstalls());

  writeConfig(R"({"preferences": {"showOutputWindowForInstalls": false, "elevateToolInstalls": true}})");

  EXPECT_FALSE(prefs.showOutputWindowForInstalls());
  EXPECT_TRUE(prefs.elevateToolInstalls());
}

TEST_F(ConfigTest, FilePreferencesFallBackToDefaults) {
  FilePreferenceSource missing(test_dir / "missing.json");
  EXPECT_TRUE(missing.showOutputWindowForInstalls());
  EXPECT_FALSE(missing.elevateToolInstalls());

  FilePreferenceSource broken(writeConfig("{ not json"));
  EXPECT_TRUE(broken.showOutputWindowForInstalls());
  EXPECT_FALSE(broken.elevateToolInstalls());
}

TEST_F(ConfigTest, VersionParsing) {
  EXPECT_EQ(Version::parse("3.11.4"), (Version{3, 11}));
  EXPECT_EQ(Version::parse(" 2.5 "), (Version{2, 5}));
  EXPECT_EQ(Version::parse("3"), (Version{3, 0}));
  EXPECT_EQ(Version::parse("3.10").toString(), "3.10");
  EXPECT_THROW(Version::parse(""), std::invalid_argument);
  EXPECT_THROW(Version::parse("3.x"), std::invalid_argument);
}

TEST_F(ConfigTest, VersionOrdering) {
  EXPECT_LT((Version{2, 5}), (Version{2, 6}));
  EXPECT_LT((Version{2, 7}), (Version{3, 0}));
  EXPECT_GT((Version{3, 10}), (Version{3, 9}));
}

TEST_F(ConfigTest, RunnableRequiresExecutableInterpreter) {
  InterpreterConfiguration config;
  EXPECT_FALSE(config.isRunnable());
  EXPECT_THROW(config.throwIfNotRunnable(), NotRunnableError);

  config.interpreterPath = test_dir / "python";
  EXPECT_FALSE(config.isRunnable());

  std::ofstream(config.interpreterPath) << "#!/bin/sh\n";
  fs::permissions(config.interpreterPath, fs::perms::owner_all, fs::perm_options::add);
  EXPECT_TRUE(config.isRunnable());
  EXPECT_NO_THROW(config.throwIfNotRunnable());
}
