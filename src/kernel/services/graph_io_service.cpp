#include "kernel/services/graph_io_service.hpp"

#include "kernel/param_utils.hpp"

namespace mf {

namespace {

std::pair<std::string, std::string> split_socket(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "Expected 'node:socket' but got '" + text + "'");
  }
  return {text.substr(0, colon), text.substr(colon + 1)};
}

MaterialChannel parse_channel(const std::string& name) {
  auto channel = channel_from_name(name);
  if (!channel) {
    throw GraphError(GraphErrc::InvalidYaml, "Unknown material channel '" + name + "'");
  }
  return *channel;
}

BlendMode parse_blend_mode(const YAML::Node& n) {
  const std::string name = as_str(n, "blend_mode", "mix");
  auto mode = blend_mode_from_name(name);
  if (!mode) {
    throw GraphError(GraphErrc::InvalidYaml, "Unknown blend_mode '" + name + "'");
  }
  return *mode;
}

NodeDescription parse_node(const YAML::Node& n) {
  if (!n.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "Node entry is not a map.");
  }
  NodeDescription desc;
  desc.name = as_str(n, "name");
  desc.type = as_str(n, "type");
  desc.graph = as_str(n, "graph");
  if (desc.type.empty() == desc.graph.empty()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "Node '" + desc.name + "' needs exactly one of 'type' or 'graph'");
  }
  if (n["parameters"]) desc.parameters = n["parameters"];
  desc.size = as_int_flexible(n, "size", 0);
  desc.absolute_size = as_bool_flexible(n, "absolute_size", false);
  return desc;
}

GraphDescription parse_graph(const YAML::Node& n) {
  GraphDescription graph;
  graph.name = as_str(n, "name");
  if (graph.name.empty()) {
    throw GraphError(GraphErrc::InvalidYaml, "Graph entry without a name.");
  }
  if (n["nodes"]) {
    for (const auto& node : n["nodes"]) graph.nodes.push_back(parse_node(node));
  }
  if (n["connections"]) {
    for (const auto& c : n["connections"]) {
      auto from = split_socket(as_str(c, "from"));
      auto to = split_socket(as_str(c, "to"));
      graph.connections.push_back({from.first, from.second, to.first, to.second});
    }
  }
  if (n["exposed"]) {
    for (const auto& p : n["exposed"]) {
      auto target = split_socket(as_str(p, "parameter"));
      ExposedParameterDescription exposed;
      exposed.name = as_str(p, "name", target.second);
      exposed.node = target.first;
      exposed.field = target.second;
      exposed.value = p["default"] ? YAML::Clone(p["default"]) : YAML::Node();
      graph.exposed.push_back(std::move(exposed));
    }
  }
  return graph;
}

LayerDescription parse_layer(const YAML::Node& n) {
  LayerDescription layer;
  const std::string kind = as_str(n, "kind", "fill");
  if (kind == "fill") {
    layer.kind = LayerType::Fill;
  } else if (kind == "fx") {
    layer.kind = LayerType::Fx;
  } else {
    throw GraphError(GraphErrc::InvalidYaml, "Unknown layer kind '" + kind + "'");
  }
  layer.op = parse_node(n);
  if (n["outputs"]) {
    for (const auto& kv : n["outputs"]) {
      layer.outputs[parse_channel(kv.first.as<std::string>())] = kv.second.as<std::string>();
    }
  }
  if (n["inputs"]) {
    for (const auto& kv : n["inputs"]) {
      layer.inputs[kv.first.as<std::string>()] = parse_channel(kv.second.as<std::string>());
    }
  }
  layer.opacity = static_cast<float>(as_double_flexible(n, "opacity", 1.0));
  layer.blend_mode = parse_blend_mode(n);
  layer.enabled = as_bool_flexible(n, "enabled", true);
  if (n["masks"]) {
    for (const auto& m : n["masks"]) {
      MaskDescription mask;
      mask.op = parse_node(m);
      mask.opacity = static_cast<float>(as_double_flexible(m, "opacity", 1.0));
      mask.blend_mode = parse_blend_mode(m);
      mask.enabled = as_bool_flexible(m, "enabled", true);
      layer.masks.push_back(std::move(mask));
    }
  }
  return layer;
}

}  // namespace

GraphDocument GraphIOService::load(const std::filesystem::path& yaml_path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path.string());
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " +
                                        yaml_path.string() + ": " + e.what());
  }
  return parse(root, yaml_path.parent_path());
}

GraphDocument GraphIOService::parse(const YAML::Node& root,
                                    const std::filesystem::path& base_dir) const {
  if (!root.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "YAML root is not a map.");
  }
  GraphDocument doc;
  try {
    if (root["images"]) {
      for (const auto& img : root["images"]) {
        ImageDescription desc;
        std::filesystem::path path = as_str(img, "path");
        if (path.empty()) {
          throw GraphError(GraphErrc::InvalidYaml, "Image entry without a path.");
        }
        desc.path = path.is_relative() && !base_dir.empty() ? base_dir / path : path;
        const std::string cs = as_str(img, "color_space", "srgb");
        if (cs == "srgb") desc.color_space = ColorSpace::Srgb;
        else if (cs == "linear") desc.color_space = ColorSpace::Linear;
        else throw GraphError(GraphErrc::InvalidYaml, "Unknown color space '" + cs + "'");
        doc.images.push_back(std::move(desc));
      }
    }
    if (root["graphs"]) {
      for (const auto& g : root["graphs"]) doc.graphs.push_back(parse_graph(g));
    }
    if (root["layer_stacks"]) {
      for (const auto& s : root["layer_stacks"]) {
        LayerStackDescription stack;
        stack.name = as_str(s, "name");
        if (stack.name.empty()) {
          throw GraphError(GraphErrc::InvalidYaml, "Layer stack entry without a name.");
        }
        if (s["layers"]) {
          for (const auto& l : s["layers"]) stack.layers.push_back(parse_layer(l));
        }
        doc.layer_stacks.push_back(std::move(stack));
      }
    }
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml, std::string("Malformed graph document: ") + e.what());
  }
  return doc;
}

}  // namespace mf
