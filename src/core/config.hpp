#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults only (placeholder destination, -avhP --progress).
    Config();

    // Load global config from ~/.marksync/config.yaml
    static Result<Config> load_global();

    // Load a single config file on top of the defaults
    static Result<Config> load_file(const fs::path& path);

    // Load global then overlay ./marksync.yaml (keys present in the overlay win)
    static Result<Config> load(const fs::path& dir = fs::current_path());

    // Parse YAML text on top of the defaults
    static Result<Config> parse(const std::string& yaml_text);

    const TransferConfig& transfer() const { return transfer_; }

    // False while the destination is empty or still the shipped placeholder.
    bool destination_is_set() const;

    // Derived copies; the receiver is never modified.
    Config with_destination(const std::string& destination) const;
    Config with_overrides(const TransferOverrides& overrides) const;

private:
    TransferConfig transfer_;

    // Apply the keys present in yaml_text; origin names the source in errors.
    Result<void> overlay(const std::string& yaml_text, const std::string& origin);
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_local_config_path(const fs::path& dir = fs::current_path());

// Create default global config (never overwrites)
Result<void> create_default_global_config();
