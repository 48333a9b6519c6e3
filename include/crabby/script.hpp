#pragma once

#include <crabby/result.hpp>
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace crabby {

// Package lifecycle events, in the order they run for one package.
inline constexpr const char* kPackageLifecycle[] = {"preinstall", "install", "postinstall"};
// The project itself additionally runs "prepare" last.
inline constexpr const char* kRootLifecycle[] = {"preinstall", "install", "postinstall", "prepare"};

struct ScriptContext {
    std::string package_name;
    std::string package_version;
    std::filesystem::path package_dir;
    // Prepended to PATH, nearest first
    std::vector<std::filesystem::path> bin_dirs;
    int timeout_seconds = 600;
    const std::atomic<bool>* cancel = nullptr;
};

struct ScriptOutcome {
    int exit_code = 0;
    std::string output;   // stdout followed by stderr
};

// Runs one lifecycle command. A non-zero exit is reported through
// ScriptOutcome; errors are reserved for failing to run at all.
class ScriptRunner {
public:
    virtual ~ScriptRunner() = default;
    virtual Result<ScriptOutcome> run(const std::string& event,
                                      const std::string& command,
                                      const ScriptContext& context) = 0;
};

// "/bin/sh -c <command>" in the package directory with the npm_* variables
// scripts commonly expect.
class ShellScriptRunner : public ScriptRunner {
public:
    Result<ScriptOutcome> run(const std::string& event,
                              const std::string& command,
                              const ScriptContext& context) override;
};

} // namespace crabby
