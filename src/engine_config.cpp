// Engine configuration YAML read/write implementation
#include "engine_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace mf {

LinearizationMode linearization_mode_from_name(const std::string& name) {
    if (name == "topological" || name == "t") return LinearizationMode::Topological;
    if (name == "full" || name == "f") return LinearizationMode::FullTraversal;
    throw GraphError(GraphErrc::InvalidParameter, "Unknown linearization mode '" + name + "'");
}

ColorSpace color_space_from_name(const std::string& name) {
    if (name == "srgb") return ColorSpace::Srgb;
    if (name == "linear") return ColorSpace::Linear;
    throw GraphError(GraphErrc::InvalidParameter, "Unknown color space '" + name + "'");
}

bool write_config_to_file(const EngineConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Matforge engine configuration.";
    root["parent_size"] = config.parent_size;
    root["linearization_mode"] = config.linearization_mode;
    root["stack_limit"] = config.stack_limit;
    root["timing_decay"] = config.timing_decay;
    root["thumbnail_size"] = config.thumbnail_size;
    root["memory_budget_mb"] = config.memory_budget_mb;
    root["export_bit_depth"] = config.export_bit_depth;
    root["export_color_space"] = config.export_color_space;
    root["export_dir"] = config.export_dir;
    root["quiet"] = config.quiet;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, EngineConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["parent_size"]) config.parent_size = root["parent_size"].as<std::uint32_t>();
            if (root["linearization_mode"]) config.linearization_mode = root["linearization_mode"].as<std::string>();
            if (root["stack_limit"]) config.stack_limit = root["stack_limit"].as<std::size_t>();
            if (root["timing_decay"]) config.timing_decay = root["timing_decay"].as<double>();
            if (root["thumbnail_size"]) config.thumbnail_size = root["thumbnail_size"].as<std::uint32_t>();
            if (root["memory_budget_mb"]) config.memory_budget_mb = root["memory_budget_mb"].as<std::size_t>();
            if (root["export_bit_depth"]) config.export_bit_depth = root["export_bit_depth"].as<int>();
            if (root["export_color_space"]) config.export_color_space = root["export_color_space"].as<std::string>();
            if (root["export_dir"]) config.export_dir = root["export_dir"].as<std::string>();
            if (root["quiet"]) config.quiet = root["quiet"].as<bool>();

            // 无效的枚举值回退到默认值
            try {
                linearization_mode_from_name(config.linearization_mode);
            } catch (const GraphError& e) {
                std::cerr << "Warning: " << e.what() << ". Using 'topological'." << std::endl;
                config.linearization_mode = "topological";
            }
            try {
                color_space_from_name(config.export_color_space);
            } catch (const GraphError& e) {
                std::cerr << "Warning: " << e.what() << ". Using 'srgb'." << std::endl;
                config.export_color_space = "srgb";
            }
            if (!config.quiet) std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const YAML::Exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "matforge.yaml") {
        std::cout << "Configuration file 'matforge.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "matforge.yaml")) {
            config.loaded_config_path = fs::absolute("matforge.yaml").string();
        } else {
            std::cerr << "Warning: Could not write default configuration to 'matforge.yaml'." << std::endl;
        }
    }
}

} // namespace mf
