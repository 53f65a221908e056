#include <gtest/gtest.h>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

#include "node_graph.hpp"

namespace {

using mf::GraphErrc;
using mf::ImageType;
using mf::NodeGraph;

constexpr std::uint32_t kParent = 256;

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

template <typename T>
std::size_t count_events(const mf::GraphEvents& events) {
  return std::count_if(events.begin(), events.end(),
                       [](const mf::GraphEvent& e) { return std::holds_alternative<T>(e); });
}

nlohmann::json dump_program(const mf::Program& program) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& i : program.instructions) out.push_back(mf::describe(i));
  return out;
}

std::size_t count_executes(const mf::Program& program) {
  return std::count_if(program.instructions.begin(), program.instructions.end(),
                       [](const mf::Instruction& i) { return std::holds_alternative<mf::instr::Execute>(i); });
}

}  // namespace

TEST(NodeGraphTest, AddNodeGeneratesUniqueNames) {
  NodeGraph g("mat");
  auto a = g.add_node(mf::AtomicOperator(mf::Value{}), kParent);
  auto b = g.add_node(mf::AtomicOperator(mf::Value{}), kParent);
  EXPECT_EQ(a.first, "value.1");
  EXPECT_EQ(b.first, "value.2");

  // NodeAdded 加上唯一的输出 socket
  ASSERT_EQ(a.second.size(), 2u);
  const auto& added = std::get<mf::graph_events::NodeAdded>(a.second[0]);
  EXPECT_EQ(added.node, mf::node_resource("mat", "value.1"));
  EXPECT_EQ(added.size, kParent);

  EXPECT_EQ(error_code([&] { g.add_node(mf::AtomicOperator(mf::Rgb{}), kParent, "value.1"); }),
            GraphErrc::Duplicate);
}

TEST(NodeGraphTest, NodeSizeFollowsParentOrAbsoluteSize) {
  mf::Node n{mf::AtomicOperator(mf::Value{})};
  EXPECT_EQ(n.node_size(512), 512u);
  n.size = 1;
  EXPECT_EQ(n.node_size(512), 1024u);
  n.size = -1;
  EXPECT_EQ(n.node_size(512), 256u);
  n.size = -10;
  EXPECT_EQ(n.node_size(64), mf::kMinImageSize);
  n.absolute_size = true;
  n.size = 4;
  EXPECT_EQ(n.node_size(512), 32u);
  n.size = 20;
  EXPECT_EQ(n.node_size(512), mf::kMaxImageSize);
}

TEST(NodeGraphTest, ConnectingMonomorphicOutputResolvesPolymorphicNode) {
  NodeGraph g("mat");
  auto rgb = g.add_node(mf::AtomicOperator(mf::Rgb{}), kParent).first;
  auto blend = g.add_node(mf::AtomicOperator(mf::Blend{}), kParent).first;

  EXPECT_FALSE(g.socket_type(blend, "color").has_value());
  auto events = g.connect_sockets(rgb, "color", blend, "background");

  // color / background / foreground 共享同一个类型变量
  EXPECT_EQ(count_events<mf::graph_events::SocketMonomorphized>(events), 3u);
  EXPECT_EQ(count_events<mf::graph_events::ConnectedSockets>(events), 1u);
  EXPECT_EQ(g.socket_type(blend, "foreground"), ImageType::Rgb);
  EXPECT_EQ(g.socket_type(blend, "color"), ImageType::Rgb);

  // 灰度输出不能再连到已经是 RGB 的输入，图保持不变
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  EXPECT_EQ(error_code([&] { g.connect_sockets(value, "value", blend, "foreground"); }), GraphErrc::TypeMismatch);
  EXPECT_EQ(g.edges().size(), 1u);
}

TEST(NodeGraphTest, DisconnectingLastConstraintDemonomorphizes) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blur = g.add_node(mf::AtomicOperator(mf::Blur{}), kParent).first;
  g.connect_sockets(value, "value", blur, "image");
  ASSERT_EQ(g.socket_type(blur, "blurred"), ImageType::Grayscale);

  auto events = g.disconnect_sink_socket(blur, "image");
  EXPECT_EQ(count_events<mf::graph_events::DisconnectedSockets>(events), 1u);
  EXPECT_EQ(count_events<mf::graph_events::SocketDemonomorphized>(events), 2u);
  EXPECT_FALSE(g.socket_type(blur, "blurred").has_value());
  EXPECT_TRUE(g.disconnect_sink_socket(blur, "image").empty());
}

TEST(NodeGraphTest, RejectsInvalidConnections) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blend_a = g.add_node(mf::AtomicOperator(mf::Blend{}), kParent).first;
  auto blend_b = g.add_node(mf::AtomicOperator(mf::Blend{}), kParent).first;
  auto blur_a = g.add_node(mf::AtomicOperator(mf::Blur{}), kParent).first;
  auto blur_b = g.add_node(mf::AtomicOperator(mf::Blur{}), kParent).first;

  EXPECT_EQ(error_code([&] { g.connect_sockets(blend_a, "color", blend_a, "background"); }),
            GraphErrc::SelfConnection);
  EXPECT_EQ(error_code([&] { g.connect_sockets(blend_a, "background", blend_b, "foreground"); }),
            GraphErrc::SinkToSink);
  EXPECT_EQ(error_code([&] { g.connect_sockets(blend_a, "color", blend_b, "foreground"); }),
            GraphErrc::PolymorphicConnection);
  EXPECT_EQ(error_code([&] { g.connect_sockets(value, "missing", blend_b, "foreground"); }), GraphErrc::NotFound);

  g.connect_sockets(value, "value", blur_a, "image");
  g.connect_sockets(blur_a, "blurred", blur_b, "image");
  EXPECT_EQ(error_code([&] { g.connect_sockets(blur_b, "blurred", blur_a, "image"); }), GraphErrc::Cycle);
  EXPECT_EQ(g.edges().size(), 2u);
}

TEST(NodeGraphTest, RemoveAndRenameNodeKeepEdgesConsistent) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blur = g.add_node(mf::AtomicOperator(mf::Blur{}), kParent).first;
  auto out = g.add_node(mf::AtomicOperator(mf::Output{mf::OutputType::Roughness}), kParent, "rough").first;
  g.connect_sockets(value, "value", blur, "image");
  g.connect_sockets(blur, "blurred", out, "data");

  auto renamed = g.rename_node(blur, "soften");
  ASSERT_EQ(renamed.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<mf::graph_events::NodeRenamed>(renamed[0]));
  EXPECT_TRUE(g.has_node("soften"));
  EXPECT_EQ(g.edges()[0].sink_node, "soften");

  auto removed = g.remove_node("soften");
  EXPECT_EQ(count_events<mf::graph_events::DisconnectedSockets>(removed), 2u);
  EXPECT_TRUE(std::holds_alternative<mf::graph_events::NodeRemoved>(removed.back()));
  EXPECT_TRUE(g.edges().empty());
  EXPECT_EQ(error_code([&] { g.remove_node("soften"); }), GraphErrc::NotFound);
}

TEST(NodeGraphTest, LinearizesChainInExecutionOrder) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blur = g.add_node(mf::AtomicOperator(mf::Blur{}), kParent).first;
  auto out = g.add_node(mf::AtomicOperator(mf::Output{mf::OutputType::Roughness}), kParent, "rough").first;
  g.connect_sockets(value, "value", blur, "image");
  g.connect_sockets(blur, "blurred", out, "data");

  auto program = g.linearize(mf::LinearizationMode::Topological);
  ASSERT_TRUE(program.has_value());

  const nlohmann::json expected = {
      "execute node:/mat/value.1",
      "thumbnail node:/mat/value.1:value",
      "move node:/mat/value.1:value -> node:/mat/blur.1:image",
      "execute node:/mat/blur.1",
      "thumbnail node:/mat/blur.1:blurred",
      "move node:/mat/blur.1:blurred -> node:/mat/rough:data",
      "execute node:/mat/rough",
  };
  EXPECT_EQ(dump_program(*program), expected) << dump_program(*program).dump(2);
  EXPECT_EQ(program->execution_steps(), 3u);

  const auto& uses = program->use_points;
  EXPECT_EQ(uses.at(mf::node_resource("mat", "value.1")).creation, 1u);
  EXPECT_EQ(uses.at(mf::node_resource("mat", "value.1")).last, 1u);
  EXPECT_EQ(uses.at(mf::node_resource("mat", "blur.1")).creation, 2u);
  EXPECT_EQ(uses.at(mf::node_resource("mat", "blur.1")).last, 2u);

  auto retained = program->retention_set_at(2);
  EXPECT_EQ(std::count(retained.begin(), retained.end(), mf::node_resource("mat", "blur.1")), 1);
  EXPECT_EQ(std::count(retained.begin(), retained.end(), mf::node_resource("mat", "value.1")), 0);
}

TEST(NodeGraphTest, FullTraversalReexecutesSharedUpstream) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blend = g.add_node(mf::AtomicOperator(mf::Blend{}), kParent).first;
  auto out = g.add_node(mf::AtomicOperator(mf::Output{mf::OutputType::Displacement}), kParent).first;
  g.connect_sockets(value, "value", blend, "background");
  g.connect_sockets(value, "value", blend, "foreground");
  g.connect_sockets(blend, "color", out, "data");

  auto topo = g.linearize(mf::LinearizationMode::Topological);
  auto full = g.linearize(mf::LinearizationMode::FullTraversal);
  ASSERT_TRUE(topo && full);
  EXPECT_EQ(count_executes(*topo), 3u);
  EXPECT_EQ(count_executes(*full), 4u);
  EXPECT_EQ(topo->use_points.at(mf::node_resource("mat", value)).last, 1u);
  EXPECT_EQ(full->use_points.at(mf::node_resource("mat", value)).creation, 2u);
}

TEST(NodeGraphTest, UnconnectedRequiredInputHasNoLinearization) {
  NodeGraph g("mat");
  auto value = g.add_node(mf::AtomicOperator(mf::Value{}), kParent).first;
  auto blend = g.add_node(mf::AtomicOperator(mf::Blend{}), kParent).first;
  auto out = g.add_node(mf::AtomicOperator(mf::Output{}), kParent).first;
  g.connect_sockets(value, "value", blend, "background");
  g.connect_sockets(blend, "color", out, "data");

  EXPECT_FALSE(g.linearize(mf::LinearizationMode::Topological).has_value());

  // 没有输入的输出节点直接跳过
  NodeGraph empty("empty");
  empty.add_node(mf::AtomicOperator(mf::Output{}), kParent);
  auto program = empty.linearize(mf::LinearizationMode::Topological);
  ASSERT_TRUE(program.has_value());
  EXPECT_TRUE(program->instructions.empty());
}

TEST(NodeGraphTest, ComplexOperatorExposesInputAndOutputNodes) {
  NodeGraph g("detail");
  g.add_node(mf::AtomicOperator(mf::Input{ImageType::Grayscale}), kParent, "height");
  g.add_node(mf::AtomicOperator(mf::Output{mf::OutputType::Albedo}), kParent, "color");

  auto op = g.as_complex_operator();
  EXPECT_EQ(op.graph, mf::graph_resource("detail"));
  ASSERT_EQ(op.inputs.count("height"), 1u);
  ASSERT_EQ(op.outputs.count("color"), 1u);
  EXPECT_EQ(op.inputs.at("height").second, mf::node_resource("detail", "height"));
  EXPECT_EQ(op.outputs.at("color").first.concrete(), ImageType::Rgb);

  NodeGraph caller("mat");
  auto call = caller.add_node(mf::Operator(op), kParent).first;
  EXPECT_EQ(call, "detail.1");
  EXPECT_EQ(caller.socket_type(call, "color"), ImageType::Rgb);
}

TEST(NodeGraphTest, SetParameterValidatesField) {
  NodeGraph g("mat");
  auto noise = g.add_node(mf::AtomicOperator(mf::PerlinNoise{}), kParent).first;
  g.set_parameter(noise, "octaves", YAML::Node(4));
  const auto& op = std::get<mf::PerlinNoise>(std::get<mf::AtomicOperator>(g.node(noise).op));
  EXPECT_EQ(op.octaves, 4);

  EXPECT_EQ(error_code([&] { g.set_parameter(noise, "sigma", YAML::Node(1.0)); }), GraphErrc::InvalidParameter);
  EXPECT_EQ(std::get<mf::PerlinNoise>(std::get<mf::AtomicOperator>(g.node(noise).op)).octaves, 4);
}
