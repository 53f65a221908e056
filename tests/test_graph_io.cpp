#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "engine_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/services/graph_io_service.hpp"

namespace {

using mf::GraphErrc;

template <typename Fn>
GraphErrc error_code(Fn&& fn) {
  try {
    fn();
  } catch (const mf::GraphError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a GraphError";
  return GraphErrc::Unknown;
}

const char* kDocument = R"(
graphs:
  - name: detail
    nodes:
      - {name: noise, type: perlin_noise, parameters: {octaves: 3}}
      - {name: soften, type: blur, parameters: {sigma: 8}}
      - {name: height, type: output, parameters: {output_type: displacement}}
    connections:
      - {from: "noise:noise", to: "soften:image"}
      - {from: "soften:blurred", to: "height:data"}
    exposed:
      - {name: sigma, parameter: "soften:sigma", default: 8}
  - name: material
    nodes:
      - {name: call, graph: detail, parameters: {sigma: 2}}
      - {name: out, type: output, parameters: {output_type: displacement}}
    connections:
      - {from: "call:height", to: "out:data"}
layer_stacks:
  - name: stack
    layers:
      - {type: value, parameters: {value: 0.3}, outputs: {rgh: value}}
      - kind: fx
        type: blur
        inputs: {image: roughness}
        outputs: {roughness: blurred}
        opacity: 0.5
        blend_mode: multiply
        masks:
          - {type: perlin_noise, opacity: 0.8}
)";

class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::string& name) : path_(mf::fs::temp_directory_path() / name) {
    mf::fs::remove_all(path_);
    mf::fs::create_directories(path_);
  }
  ~ScopedTempDir() {
    std::error_code ec;
    mf::fs::remove_all(path_, ec);
  }
  const mf::fs::path& path() const { return path_; }

 private:
  mf::fs::path path_;
};

}  // namespace

TEST(EngineConfigTest, WritesAndReloadsConfig) {
  ScopedTempDir dir("matforge_config_test");
  const std::string path = (dir.path() / "engine.yaml").string();

  mf::EngineConfig config;
  config.parent_size = 512;
  config.linearization_mode = "full";
  config.stack_limit = 16;
  config.export_bit_depth = 16;
  config.export_color_space = "linear";
  config.quiet = true;
  ASSERT_TRUE(mf::write_config_to_file(config, path));

  mf::EngineConfig loaded;
  mf::load_or_create_config(path, loaded);
  EXPECT_EQ(loaded.parent_size, 512u);
  EXPECT_EQ(loaded.linearization_mode, "full");
  EXPECT_EQ(loaded.stack_limit, 16u);
  EXPECT_EQ(loaded.export_bit_depth, 16);
  EXPECT_EQ(loaded.export_color_space, "linear");
  EXPECT_TRUE(loaded.quiet);
  EXPECT_FALSE(loaded.loaded_config_path.empty());
}

TEST(EngineConfigTest, InvalidEnumValuesFallBackToDefaults) {
  ScopedTempDir dir("matforge_config_fallback");
  const std::string path = (dir.path() / "engine.yaml").string();
  {
    std::ofstream out(path);
    out << "linearization_mode: sideways\nexport_color_space: cmyk\nquiet: true\nparent_size: 256\n";
  }

  mf::EngineConfig loaded;
  mf::load_or_create_config(path, loaded);
  EXPECT_EQ(loaded.linearization_mode, "topological");
  EXPECT_EQ(loaded.export_color_space, "srgb");
  EXPECT_EQ(loaded.parent_size, 256u);

  EXPECT_EQ(mf::linearization_mode_from_name("f"), mf::LinearizationMode::FullTraversal);
  EXPECT_EQ(error_code([] { mf::linearization_mode_from_name("sideways"); }), GraphErrc::InvalidParameter);
}

TEST(GraphIOServiceTest, ParsesGraphsAndLayerStacks) {
  auto doc = mf::GraphIOService().parse(YAML::Load(kDocument));
  ASSERT_EQ(doc.graphs.size(), 2u);
  ASSERT_EQ(doc.layer_stacks.size(), 1u);

  const auto& detail = doc.graphs[0];
  EXPECT_EQ(detail.name, "detail");
  ASSERT_EQ(detail.nodes.size(), 3u);
  EXPECT_EQ(detail.nodes[1].type, "blur");
  ASSERT_EQ(detail.connections.size(), 2u);
  EXPECT_EQ(detail.connections[1].from_node, "soften");
  EXPECT_EQ(detail.connections[1].to_socket, "data");
  ASSERT_EQ(detail.exposed.size(), 1u);
  EXPECT_EQ(detail.exposed[0].field, "sigma");
  EXPECT_EQ(detail.exposed[0].value.as<int>(), 8);

  EXPECT_EQ(doc.graphs[1].nodes[0].graph, "detail");

  const auto& layers = doc.layer_stacks[0].layers;
  ASSERT_EQ(layers.size(), 2u);
  EXPECT_EQ(layers[0].kind, mf::LayerType::Fill);
  EXPECT_EQ(layers[0].outputs.at(mf::MaterialChannel::Roughness), "value");
  EXPECT_EQ(layers[1].kind, mf::LayerType::Fx);
  EXPECT_EQ(layers[1].inputs.at("image"), mf::MaterialChannel::Roughness);
  EXPECT_FLOAT_EQ(layers[1].opacity, 0.5f);
  EXPECT_EQ(layers[1].blend_mode, mf::BlendMode::Multiply);
  ASSERT_EQ(layers[1].masks.size(), 1u);
  EXPECT_FLOAT_EQ(layers[1].masks[0].opacity, 0.8f);
}

TEST(GraphIOServiceTest, RejectsMalformedDocuments) {
  mf::GraphIOService io;
  EXPECT_EQ(error_code([&] { io.parse(YAML::Load("- just a list")); }), GraphErrc::InvalidYaml);
  EXPECT_EQ(error_code([&] { io.parse(YAML::Load("graphs: [{nodes: []}]")); }), GraphErrc::InvalidYaml);
  EXPECT_EQ(error_code([&] { io.parse(YAML::Load("graphs: [{name: g, nodes: [{name: n}]}]")); }),
            GraphErrc::InvalidYaml);
  EXPECT_EQ(error_code([&] {
              io.parse(YAML::Load("graphs: [{name: g, connections: [{from: a, to: 'b:c'}]}]"));
            }),
            GraphErrc::InvalidYaml);
  EXPECT_EQ(error_code([&] {
              io.parse(YAML::Load("layer_stacks: [{name: s, layers: [{type: value, outputs: {gloss: value}}]}]"));
            }),
            GraphErrc::InvalidYaml);
  EXPECT_EQ(error_code([&] { io.load("/nonexistent/matforge/graph.yaml"); }), GraphErrc::Io);
}

TEST(GraphIOServiceTest, KernelBuildsParsedDocument) {
  mf::EngineConfig config;
  config.parent_size = 64;
  config.quiet = true;
  mf::Kernel kernel(config);

  ASSERT_TRUE(kernel.apply_document(mf::GraphIOService().parse(YAML::Load(kDocument))))
      << kernel.last_error("document")->message;
  EXPECT_EQ(kernel.list_graphs(), (std::vector<std::string>{"detail", "material", "stack"}));

  const auto* material = kernel.graph("material");
  ASSERT_NE(material, nullptr);
  const auto& call = std::get<mf::ComplexOperator>(material->node("call").op);
  EXPECT_EQ(call.parameters.at("sigma").value.as<int>(), 2);

  const auto* stack = kernel.layer_stack("stack");
  ASSERT_NE(stack, nullptr);
  ASSERT_EQ(stack->layers().size(), 2u);
  EXPECT_EQ(stack->layers()[1].masks.size(), 1u);
  EXPECT_NE(kernel.program("stack"), nullptr);

  // 重复构建同名图失败，错误码来自出错的那一步
  EXPECT_FALSE(kernel.apply_document(mf::GraphIOService().parse(YAML::Load(kDocument))));
  EXPECT_EQ(kernel.last_error("document")->code, GraphErrc::Duplicate);
}
