#include "supervisor/executable_locator.hpp"
#include "core/config.hpp"

#include <sys/utsname.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool path_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

} // namespace

std::string CommandSpec::to_string() const {
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        out += arg;
    }
    return out;
}

LocatorEnvironment LocatorEnvironment::from_process(const WorkerSettings& settings) {
    LocatorEnvironment env;
    env.resource_dir = settings.resource_dir;
    env.override_dir = settings.override_dir;
    env.port = settings.port;
    env.interpreter = settings.interpreter;
    env.runtime_name = settings.runtime_name;
    env.bundle_marker = settings.bundle_marker;
    env.entry_script = settings.entry_script;
    env.exe_path = ExecutableLocator::self_path();
    env.arch = ExecutableLocator::detect_arch();

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) env.cwd = cwd.string();

    return env;
}

ExecutableLocator::ExecutableLocator(LocatorEnvironment env) : env_(std::move(env)) {}

std::string ExecutableLocator::detect_arch() {
    struct utsname uts;
    if (uname(&uts) == 0) {
        std::string machine(uts.machine);
        if (machine == "x86_64" || machine == "amd64") {
            return "x86_64";
        }
        if (machine == "aarch64" || machine == "arm64") {
            return "aarch64";
        }
        return machine;
    }
    return "x86_64";
}

std::string ExecutableLocator::self_path() {
    std::error_code ec;
    auto p = fs::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return p.string();
}

// ── Candidate checks ────────────────────────────────────────

bool ExecutableLocator::has_bundle(const std::string& dir) const {
    return !dir.empty() && path_exists(fs::path(dir) / env_.bundle_marker);
}

bool ExecutableLocator::has_entry_script(const std::string& dir) const {
    return !dir.empty() && path_exists(fs::path(dir) / env_.entry_script);
}

LocateResult ExecutableLocator::locate() const {
    LocateResult result;

    // Packaged builds copy resources into a "resources" subdirectory,
    // but some packagers flatten them
    if (!env_.resource_dir.empty()) {
        std::string sub = (fs::path(env_.resource_dir) / "resources").string();
        for (const auto& dir : {sub, env_.resource_dir}) {
            if (has_bundle(dir)) {
                result.success = true;
                result.command = bundle_command(dir);
                result.source = "bundle";
                return result;
            }
        }
    }

    if (!env_.cwd.empty()) {
        std::string dev = (fs::path(env_.cwd) / "resources").string();
        if (has_bundle(dev)) {
            result.success = true;
            result.command = bundle_command(dev);
            result.source = "dev-bundle";
            return result;
        }
    }

    // Walk up from the executable looking for the worker source tree
    if (!env_.exe_path.empty()) {
        fs::path dir = fs::path(env_.exe_path).parent_path();
        while (!dir.empty()) {
            if (has_entry_script(dir.string())) {
                result.success = true;
                result.command = script_command(dir.string());
                result.source = "exe-ancestor";
                return result;
            }
            fs::path parent = dir.parent_path();
            if (parent == dir) break;
            dir = parent;
        }
    }

    if (has_entry_script(env_.override_dir)) {
        result.success = true;
        result.command = script_command(env_.override_dir);
        result.source = "override";
        return result;
    }

    if (has_entry_script(env_.cwd)) {
        result.success = true;
        result.command = script_command(env_.cwd);
        result.source = "cwd";
        return result;
    }

    result.error = "Could not locate the worker. Ensure " + env_.entry_script +
                   " or " + env_.bundle_marker + " is accessible.";
    return result;
}

// ── Command construction ────────────────────────────────────

std::string ExecutableLocator::arch_suffix() const {
#ifdef __APPLE__
    return env_.arch + "-apple-darwin";
#else
    return env_.arch + "-unknown-linux-gnu";
#endif
}

std::string ExecutableLocator::native_arch_dir() const {
    if (env_.arch == "aarch64") return "arm64";
    if (env_.arch == "x86_64") return "x64";
    return env_.arch;
}

CommandSpec ExecutableLocator::bundle_command(const std::string& dir) const {
    fs::path base(dir);
    fs::path modules = base / "node_modules";
#ifdef __APPLE__
    fs::path native_libs = modules / "onnxruntime-node" / "bin" / "napi-v3" / "darwin" / native_arch_dir();
    const char* lib_var = "DYLD_LIBRARY_PATH";
#else
    fs::path native_libs = modules / "onnxruntime-node" / "bin" / "napi-v3" / "linux" / native_arch_dir();
    const char* lib_var = "LD_LIBRARY_PATH";
#endif

    CommandSpec cmd;
    cmd.program = (base / (env_.runtime_name + "-" + arch_suffix())).string();
    cmd.args = {(base / env_.bundle_marker).string(),
                "start", "--port", std::to_string(env_.port)};
    cmd.env.emplace_back("NODE_PATH", modules.string());
    cmd.env.emplace_back(lib_var, native_libs.string());
    return cmd;
}

CommandSpec ExecutableLocator::script_command(const std::string& root) const {
    CommandSpec cmd;
    cmd.program = env_.interpreter;
    cmd.args = {(fs::path(root) / env_.entry_script).string(),
                "start", "--port", std::to_string(env_.port)};
    return cmd;
}
