#ifndef PIP_HPP
#define PIP_HPP

#include "./core.hpp"
#include "./collaborators.hpp"
#include <string>
#include <set>
#include <future>
#include <filesystem>

using PackageSet = std::set<std::string>;

// Operations run on their own thread. Sinks, gates and preference sources
// are borrowed and must outlive the returned future.

// Installed packages as "name==version" lines from the package tool, or bare
// names from a site-packages scan when the tool cannot be used. Never throws
// except OperationCanceled.
std::future<PackageSet> freezePackages(const InterpreterConfiguration& config,
    CancellationToken token = CancellationToken());

// Requires setuptools (pkg_resources) in the target environment; without it
// every package reports as not installed.
std::future<bool> isPackageInstalled(const InterpreterConfiguration& config,
    const std::string& packageSpec,
    CancellationToken token = CancellationToken());

bool isToolInstalledInLibrary(const InterpreterConfiguration& config);

// False for Python 2.5 and earlier, which lack ssl support by default.
bool isSecureInstall(const InterpreterConfiguration& config);

std::future<bool> installPackage(const InterpreterConfiguration& config,
    const std::string& package,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token = CancellationToken());

// Offers to bootstrap pip through the gate first when the library has no
// pip module. Declining resolves to false without installing.
std::future<bool> installPackageEnsuringTool(const InterpreterConfiguration& config,
    const std::string& package,
    ConfirmationGate* gate,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const std::filesystem::path& bootstrapScript,
    CancellationToken token = CancellationToken());

std::future<bool> uninstallPackage(const InterpreterConfiguration& config,
    const std::string& package,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token = CancellationToken());

std::future<bool> installTool(const InterpreterConfiguration& config,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const std::filesystem::path& bootstrapScript,
    CancellationToken token = CancellationToken());

// The future throws OperationCanceled when the gate answers Cancel.
std::future<bool> queryInstallPackage(const InterpreterConfiguration& config,
    const std::string& package,
    ConfirmationGate& gate,
    const std::string& message,
    bool checkInstalled,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    CancellationToken token = CancellationToken());

std::future<bool> queryInstallTool(const InterpreterConfiguration& config,
    ConfirmationGate& gate,
    const std::string& message,
    bool checkInstalled,
    bool elevate,
    OutputSink* output,
    const PreferenceSource& prefs,
    const std::filesystem::path& bootstrapScript,
    CancellationToken token = CancellationToken());

#endif
