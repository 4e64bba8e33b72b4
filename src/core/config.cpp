#include "core/config.hpp"
#include "core/logging.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/sidekeep";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/sidekeep";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::socket_path() const {
    if (!config_.socket_path.empty()) return config_.socket_path;
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/sidekeep.sock";
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Worker section
        if (auto worker = root["worker"]) {
            auto& w = config_.worker;
            w.host = worker["host"].as<std::string>(w.host);
            w.port = worker["port"].as<int>(w.port);
            w.resource_dir = expand_home(worker["resource_dir"].as<std::string>(w.resource_dir));
            w.override_dir = expand_home(worker["override_dir"].as<std::string>(w.override_dir));
            w.interpreter = worker["interpreter"].as<std::string>(w.interpreter);
            w.runtime_name = worker["runtime_name"].as<std::string>(w.runtime_name);
            w.bundle_marker = worker["bundle_marker"].as<std::string>(w.bundle_marker);
            w.entry_script = worker["entry_script"].as<std::string>(w.entry_script);
        }

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            auto& s = config_.supervisor;
            s.max_restart_attempts = sup["max_restart_attempts"].as<int>(s.max_restart_attempts);
            s.grace_period_ms = sup["grace_period_ms"].as<int>(s.grace_period_ms);
            s.backoff_unit_ms = sup["backoff_unit_ms"].as<int>(s.backoff_unit_ms);
            s.restart_cooldown_ms = sup["restart_cooldown_ms"].as<int>(s.restart_cooldown_ms);
            s.adopt_probe_timeout_ms = sup["adopt_probe_timeout_ms"].as<int>(s.adopt_probe_timeout_ms);
            s.health_initial_delay_ms = sup["health_initial_delay_ms"].as<int>(s.health_initial_delay_ms);
            s.health_interval_ms = sup["health_interval_ms"].as<int>(s.health_interval_ms);
            s.health_timeout_ms = sup["health_timeout_ms"].as<int>(s.health_timeout_ms);
            s.status_timeout_ms = sup["status_timeout_ms"].as<int>(s.status_timeout_ms);
            s.kill_grace_ms = sup["kill_grace_ms"].as<int>(s.kill_grace_ms);
        }

        // Log section
        if (auto log = root["log"]) {
            config_.log.level = log["level"].as<std::string>(config_.log.level);
            config_.log.file = expand_home(log["file"].as<std::string>(config_.log.file));
        }

        if (auto ipc = root["ipc"]) {
            config_.socket_path = expand_home(ipc["socket_path"].as<std::string>(config_.socket_path));
        }

        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        get_logger("config")->warn("Ignoring malformed config {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    return save_to(config_path());
}

bool Config::save_to(const std::string& path) const {
    if (path.empty()) return false;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        const auto& w = config_.worker;
        const auto& s = config_.supervisor;

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Worker section
        out << YAML::Key << "worker" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << w.host;
        out << YAML::Key << "port" << YAML::Value << w.port;
        out << YAML::Key << "resource_dir" << YAML::Value << w.resource_dir;
        out << YAML::Key << "override_dir" << YAML::Value << w.override_dir;
        out << YAML::Key << "interpreter" << YAML::Value << w.interpreter;
        out << YAML::Key << "runtime_name" << YAML::Value << w.runtime_name;
        out << YAML::Key << "bundle_marker" << YAML::Value << w.bundle_marker;
        out << YAML::Key << "entry_script" << YAML::Value << w.entry_script;
        out << YAML::EndMap;

        // Supervisor section
        out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_restart_attempts" << YAML::Value << s.max_restart_attempts;
        out << YAML::Key << "grace_period_ms" << YAML::Value << s.grace_period_ms;
        out << YAML::Key << "backoff_unit_ms" << YAML::Value << s.backoff_unit_ms;
        out << YAML::Key << "restart_cooldown_ms" << YAML::Value << s.restart_cooldown_ms;
        out << YAML::Key << "adopt_probe_timeout_ms" << YAML::Value << s.adopt_probe_timeout_ms;
        out << YAML::Key << "health_initial_delay_ms" << YAML::Value << s.health_initial_delay_ms;
        out << YAML::Key << "health_interval_ms" << YAML::Value << s.health_interval_ms;
        out << YAML::Key << "health_timeout_ms" << YAML::Value << s.health_timeout_ms;
        out << YAML::Key << "status_timeout_ms" << YAML::Value << s.status_timeout_ms;
        out << YAML::Key << "kill_grace_ms" << YAML::Value << s.kill_grace_ms;
        out << YAML::EndMap;

        // Log section
        out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log.level;
        out << YAML::Key << "file" << YAML::Value << config_.log.file;
        out << YAML::EndMap;

        out << YAML::Key << "ipc" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "socket_path" << YAML::Value << config_.socket_path;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception& e) {
        get_logger("config")->error("Cannot save config {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
