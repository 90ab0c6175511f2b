#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <set>

namespace fs = std::filesystem;

static const std::set<std::string> KNOWN_KEYS = {
    "destination",
    "transport_args",
    "base_flags",
    "preserve_relative_paths",
    "extra_flags",
    "install_default_keybindings",
};

// Accepts either a sequence of scalars or a single scalar (one-element list).
static std::vector<std::string> read_string_list(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> out;
    if (node.IsNull()) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error(fmt::format("'{}' must be a list of strings", key));
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw std::runtime_error(fmt::format("'{}' entries must be strings", key));
        }
        out.push_back(item.as<std::string>());
    }
    return out;
}

static std::string read_scalar(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw std::runtime_error(fmt::format("'{}' must be a string", key));
    }
    return node.as<std::string>();
}

static bool read_bool(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw std::runtime_error(fmt::format("'{}' must be true or false", key));
    }
    return node.as<bool>();
}

Config::Config() {
    transfer_.destination = PLACEHOLDER_DESTINATION;
    transfer_.base_flags = {"-avhP", "--progress"};
    transfer_.preserve_relative_paths = false;
    transfer_.install_default_keybindings = true;
}

Result<void> Config::overlay(const std::string& yaml_text, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(fmt::format("{}: top level must be a mapping", origin));
        }

        for (const auto& kv : root) {
            auto key = kv.first.as<std::string>();
            if (KNOWN_KEYS.count(key) == 0) {
                return Result<void>::Err(fmt::format("{}: unknown config key '{}'", origin, key));
            }
        }

        TransferConfig t = transfer_;
        if (root["destination"]) {
            t.destination = read_scalar(root["destination"], "destination");
        }
        if (root["transport_args"]) {
            t.transport_args = read_string_list(root["transport_args"], "transport_args");
        }
        if (root["base_flags"]) {
            t.base_flags = read_string_list(root["base_flags"], "base_flags");
        }
        if (root["preserve_relative_paths"]) {
            t.preserve_relative_paths = read_bool(root["preserve_relative_paths"],
                                                  "preserve_relative_paths");
        }
        if (root["extra_flags"]) {
            t.extra_flags = read_string_list(root["extra_flags"], "extra_flags");
        }
        if (root["install_default_keybindings"]) {
            t.install_default_keybindings = read_bool(root["install_default_keybindings"],
                                                      "install_default_keybindings");
        }
        transfer_ = std::move(t);
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("{}: {}", origin, e.what()));
    } catch (const std::runtime_error& e) {
        return Result<void>::Err(fmt::format("{}: {}", origin, e.what()));
    }
}

bool Config::destination_is_set() const {
    return !transfer_.destination.empty() &&
           transfer_.destination != PLACEHOLDER_DESTINATION;
}

Config Config::with_destination(const std::string& destination) const {
    Config copy = *this;
    copy.transfer_.destination = destination;
    return copy;
}

Config Config::with_overrides(const TransferOverrides& overrides) const {
    Config copy = *this;
    for (const auto& flag : overrides.extra_flags) {
        copy.transfer_.extra_flags.push_back(flag);
    }
    return copy;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".marksync";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_local_config_path(const fs::path& dir) {
    return dir / "marksync.yaml";
}

static Result<std::string> read_text_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err("Cannot read config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    auto r = config.overlay(yaml_text, "<config>");
    if (r.is_err()) return Result<Config>::Err(r.error, ErrorKind::InvalidConfig);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    auto text = read_text_file(path);
    if (text.is_err()) return Result<Config>::Err(text.error, ErrorKind::InvalidConfig);

    auto r = config.overlay(text.value, path.string());
    if (r.is_err()) return Result<Config>::Err(r.error, ErrorKind::InvalidConfig);

    marksync_log("config: loaded " + path.string());
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load(const fs::path& dir) {
    auto global = load_global();
    if (global.is_err()) return global;

    Config config = global.value;
    fs::path local = get_local_config_path(dir);
    if (!fs::exists(local)) {
        return Result<Config>::Ok(config);
    }

    auto text = read_text_file(local);
    if (text.is_err()) return Result<Config>::Err(text.error, ErrorKind::InvalidConfig);

    auto r = config.overlay(text.value, local.string());
    if (r.is_err()) return Result<Config>::Err(r.error, ErrorKind::InvalidConfig);

    marksync_log("config: applied overlay " + local.string());
    return Result<Config>::Ok(config);
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# marksync configuration

# REQUIRED: remote target passed to rsync as the last argument
destination: "destination_user@destination_host:/path/to/destination/"

# Arguments for the remote shell: rsync -e 'ssh <args...>'
transport_args: []

# Base rsync flags
base_flags: ["-avhP", "--progress"]

# Pass --relative to rsync
preserve_relative_paths: false

# Extra rsync flags, appended after the base flags
extra_flags: []

# mm toggle mark, mu upload, mC clear marks, mU upload and remove sources
install_default_keybindings: true
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}
