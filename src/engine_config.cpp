// Engine configuration YAML read/write implementation
#include "engine_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "engine/async_filter.hpp"
#include "filter/kernel.hpp"
#include "pw_types.hpp" // for pw::fs alias

namespace pw {

namespace {

// 非法的枚举名保留原值并给出警告
void read_async_mode(const YAML::Node& node, std::string& out) {
    auto s = node.as<std::string>();
    if (async_mode_from_name(s)) {
        out = s;
    } else {
        std::cerr << "Warning: unknown default_async_mode '" << s << "', keeping '" << out << "'." << std::endl;
    }
}

void read_edge_strategy(const YAML::Node& node, std::string& out) {
    auto s = node.as<std::string>();
    if (edge_strategy_from_name(s)) {
        out = s;
    } else {
        std::cerr << "Warning: unknown default_edge_strategy '" << s << "', keeping '" << out << "'." << std::endl;
    }
}

} // namespace

bool write_config_to_file(const EngineConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Pixelweave engine configuration.";
    root["worker_threads"] = config.worker_threads;
    root["rows_per_task"] = config.rows_per_task;
    root["default_async_mode"] = config.default_async_mode;
    root["default_edge_strategy"] = config.default_edge_strategy;
    root["kernel_border_value"] = config.kernel_border_value;
    root["default_gamma"] = config.default_gamma;
    root["log_timing"] = config.log_timing;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, EngineConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        // 先解析到副本，全部成功后才覆盖 config
        EngineConfig parsed = config;
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["worker_threads"]) parsed.worker_threads = root["worker_threads"].as<int>();
            if (root["rows_per_task"]) parsed.rows_per_task = root["rows_per_task"].as<int>();
            if (root["default_async_mode"]) read_async_mode(root["default_async_mode"], parsed.default_async_mode);
            if (root["default_edge_strategy"]) read_edge_strategy(root["default_edge_strategy"], parsed.default_edge_strategy);
            if (root["kernel_border_value"]) parsed.kernel_border_value = root["kernel_border_value"].as<double>();
            if (root["default_gamma"]) parsed.default_gamma = root["default_gamma"].as<double>();
            if (root["log_timing"]) parsed.log_timing = root["log_timing"].as<bool>();
            if (parsed.worker_threads < 0) parsed.worker_threads = 0;
            if (parsed.rows_per_task < 0) parsed.rows_per_task = 0;
            config = parsed;
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const YAML::Exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == kDefaultConfigPath) {
        std::cout << "Configuration file '" << kDefaultConfigPath << "' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, kDefaultConfigPath)) {
            config.loaded_config_path = fs::absolute(kDefaultConfigPath).string();
        } else {
            std::cerr << "Warning: Could not write '" << kDefaultConfigPath << "'." << std::endl;
        }
    }
}

} // namespace pw
