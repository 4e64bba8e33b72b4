#pragma once

#include <string>
#include <utility>
#include <vector>

struct WorkerSettings;

/// A fully resolved worker invocation
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env; // overrides on top of ours

    /// "program arg1 arg2 ..." for logs and the `locate` command
    std::string to_string() const;
};

struct LocateResult {
    bool success = false;
    CommandSpec command;
    std::string source;  // which candidate matched: "bundle", "dev-bundle", ...
    std::string error;
};

/// Everything the locator is allowed to look at. Tests build this by hand;
/// the daemon uses from_process().
struct LocatorEnvironment {
    std::string resource_dir;   // packaged application resources
    std::string cwd;
    std::string exe_path;       // path of the running supervisor binary
    std::string override_dir;   // explicit worker root
    int port = 3838;

    std::string interpreter = "node";
    std::string runtime_name = "node";
    std::string bundle_marker = "engram-bundle.cjs";
    std::string entry_script = "bin/engram.js";
    std::string arch = "x86_64";

    static LocatorEnvironment from_process(const WorkerSettings& settings);
};

class ExecutableLocator {
public:
    explicit ExecutableLocator(LocatorEnvironment env);

    /// Resolve the worker command line. Candidates, first match wins:
    ///   1. packaged bundle in <resource_dir>/resources or <resource_dir>
    ///   2. development bundle in <cwd>/resources
    ///   3. worker source tree found walking up from the executable
    ///   4. worker source tree at the override directory
    ///   5. worker source tree at the current directory
    LocateResult locate() const;

    const LocatorEnvironment& environment() const { return env_; }

    /// Host architecture as reported by uname ("x86_64", "aarch64", ...)
    static std::string detect_arch();
    /// Absolute path of the running binary, empty if unknown
    static std::string self_path();

private:
    LocatorEnvironment env_;

    bool has_bundle(const std::string& dir) const;
    bool has_entry_script(const std::string& dir) const;

    CommandSpec bundle_command(const std::string& dir) const;
    CommandSpec script_command(const std::string& root) const;

    std::string arch_suffix() const;
    std::string native_arch_dir() const;
};
