#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".fleetsh";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

fs::path get_default_inventory_path() {
    return get_config_dir() / "inventory.yaml";
}

std::optional<ErrorPolicy> parse_error_policy(const std::string& value) {
    if (value == "skip") return ErrorPolicy::kSkip;
    if (value == "raise") return ErrorPolicy::kRaise;
    return std::nullopt;
}

// Scalar string with surrounding whitespace removed; nullopt when the key
// is absent or blank.
static std::optional<std::string> stripped(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return std::nullopt;
    std::string value = node.as<std::string>();
    trim(value);
    if (value.empty()) return std::nullopt;
    return value;
}

class ConfigParser {
public:
    static Config parse(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) return config;
        if (!root.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "top level must be a map");
        }

        config.ssh_user_ = stripped(root["ssh_user"]);
        config.ssh_attribute_ = stripped(root["ssh_attribute"]);
        config.ssh_gateway_ = stripped(root["ssh_gateway"]);
        config.identity_file_ = stripped(root["identity_file"]);
        if (!config.identity_file_) {
            config.identity_file_ = stripped(root["ssh_identity_file"]);
        }
        config.inventory_ = stripped(root["inventory"]);

        if (root["ssh_port"]) {
            config.ssh_port_ = root["ssh_port"].as<int>();
        }
        if (root["host_key_verify"]) {
            config.host_key_verify_ = root["host_key_verify"].as<bool>();
        }
        if (root["concurrency"]) {
            config.concurrency_ = root["concurrency"].as<int>();
        }
        if (auto policy = stripped(root["on_error"])) {
            config.on_error_ = parse_error_policy(*policy);
            if (!config.on_error_) {
                throw YAML::Exception(YAML::Mark::null_mark(),
                                      "on_error must be 'skip' or 'raise', got '" + *policy + "'");
            }
        }

        const YAML::Node tmux = root["tmux"] ? root["tmux"] : root["ssh_tmux"];
        if (tmux && tmux.IsMap()) {
            config.tmux_.pane_layout = tmux["pane_layout"].as<std::string>(config.tmux_.pane_layout);
            config.tmux_.use_panes = tmux["use_panes"].as<bool>(config.tmux_.use_panes);
            config.tmux_.sync_panes = tmux["sync_panes"].as<bool>(config.tmux_.sync_panes);
            config.tmux_.sync_panes_key = tmux["sync_panes_key"].as<std::string>(config.tmux_.sync_panes_key);
        }

        return config;
    }
};

Result<Config> Config::load() {
    return load_from(get_config_path());
}

Result<Config> Config::load_from(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(ConfigParser::parse(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(ConfigParser::parse(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
