// Engine configuration definition and YAML I/O declarations
#pragma once

#include <string>

namespace pw {

struct EngineConfig {
    std::string loaded_config_path;
    // 0 = std::thread::hardware_concurrency()
    int worker_threads = 0;
    // Rows per parallel band; 0 splits the image evenly across the workers.
    int rows_per_task = 0;
    std::string default_async_mode = "row";
    std::string default_edge_strategy = "constant";
    double kernel_border_value = 0.0;
    double default_gamma = 2.2;
    bool log_timing = false;
};

// Default config file name, created on first use when missing.
inline constexpr const char* kDefaultConfigPath = "pixelweave.yaml";

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "pixelweave.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, EngineConfig& config);

} // namespace pw
