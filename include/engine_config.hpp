// Engine configuration definition and YAML I/O declarations
#pragma once

#include <cstdint>
#include <string>

#include "mf_types.hpp"
#include "program.hpp"

namespace mf {

struct EngineConfig {
    std::string loaded_config_path;
    std::uint32_t parent_size = 1024;
    // "topological" or "full"
    std::string linearization_mode = "topological";
    std::size_t stack_limit = 256;
    double timing_decay = 0.85;
    std::uint32_t thumbnail_size = 128;
    // Memory budget of the software compute backend, in MiB.
    std::size_t memory_budget_mb = 1024;
    int export_bit_depth = 8;
    // "srgb" or "linear"
    std::string export_color_space = "srgb";
    std::string export_dir = "out";
    bool quiet = false;
};

// Parse the linearization mode name. Throws GraphError(InvalidParameter).
MATFORGE_API LinearizationMode linearization_mode_from_name(const std::string& name);
// Parse the color space name. Throws GraphError(InvalidParameter).
MATFORGE_API ColorSpace color_space_from_name(const std::string& name);

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
MATFORGE_API bool write_config_to_file(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "matforge.yaml" and does not exist, create it with defaults.
MATFORGE_API void load_or_create_config(const std::string& config_path, EngineConfig& config);

} // namespace mf
