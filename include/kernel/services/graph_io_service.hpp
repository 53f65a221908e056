#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "layer_stack.hpp"
#include "mf_types.hpp"

namespace mf {

struct NodeDescription {
    std::string name;
    // 原子算子类型；为空时 graph 指向被调用的子图
    std::string type;
    std::string graph;
    YAML::Node parameters;
    int size = 0;
    bool absolute_size = false;
};

struct ConnectionDescription {
    std::string from_node;
    std::string from_socket;
    std::string to_node;
    std::string to_socket;
};

// 子图对外暴露的参数：name -> node:field，带默认值
struct ExposedParameterDescription {
    std::string name;
    std::string node;
    std::string field;
    YAML::Node value;
};

struct GraphDescription {
    std::string name;
    std::vector<NodeDescription> nodes;
    std::vector<ConnectionDescription> connections;
    std::vector<ExposedParameterDescription> exposed;
};

struct MaskDescription {
    NodeDescription op;
    float opacity = 1.0f;
    BlendMode blend_mode = BlendMode::Mix;
    bool enabled = true;
};

struct LayerDescription {
    LayerType kind = LayerType::Fill;
    NodeDescription op;
    std::map<MaterialChannel, std::string> outputs;
    std::map<std::string, MaterialChannel> inputs;
    float opacity = 1.0f;
    BlendMode blend_mode = BlendMode::Mix;
    bool enabled = true;
    std::vector<MaskDescription> masks;
};

struct LayerStackDescription {
    std::string name;
    std::vector<LayerDescription> layers;
};

struct ImageDescription {
    std::filesystem::path path;
    ColorSpace color_space = ColorSpace::Srgb;
};

struct GraphDocument {
    std::vector<ImageDescription> images;
    // 按依赖顺序：被调用的子图写在调用者之前
    std::vector<GraphDescription> graphs;
    std::vector<LayerStackDescription> layer_stacks;
};

/**
 * @brief 读取 YAML 图描述文件。
 *
 * 文件根是一个 map，包含可选的 images / graphs / layer_stacks 三个序列。
 * 连接写作 `from: node:socket` 与 `to: node:socket`。只负责解析，不修改任何图；
 * 由 Kernel::load_document 按描述重建图与层栈。
 */
class GraphIOService {
 public:
  // @throws GraphError(Io) 文件无法读取；GraphError(InvalidYaml) 结构错误
  GraphDocument load(const std::filesystem::path& yaml_path) const;
  GraphDocument parse(const YAML::Node& root, const std::filesystem::path& base_dir = {}) const;
};

}  // namespace mf
