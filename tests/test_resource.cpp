#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "resource.hpp"

namespace {

template <typename Fn>
mf::GraphErrc error_code(Fn&& fn) {
  try {
    fn();
  } catch (const mf::GraphError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a GraphError";
  return mf::GraphErrc::Unknown;
}

}  // namespace

TEST(ResourceTest, SocketResourceRoundTripsThroughText) {
  using mf::SocketResource;

  auto socket = SocketResource::parse("node:/material/noise.1:noise");
  EXPECT_EQ(socket.path(), "/material/noise.1");
  EXPECT_EQ(socket.socket_name(), "noise");
  EXPECT_EQ(socket.to_string(), "node:/material/noise.1:noise");
  EXPECT_EQ(socket.socket_node(), mf::node_resource("material", "noise.1"));
  EXPECT_EQ(socket.socket_node().node_graph(), mf::graph_resource("material"));
}

TEST(ResourceTest, NodeHelpersBuildChildResources) {
  auto node = mf::graph_resource("mat").graph_node("blend.2");
  EXPECT_EQ(node.to_string(), "node:/mat/blend.2");
  EXPECT_EQ(node.file(), "blend.2");
  EXPECT_EQ(node.directory(), "mat");

  auto param = node.node_parameter("mix");
  EXPECT_EQ(param.to_string(), "node:/mat/blend.2:mix");
  EXPECT_EQ(param.parameter_field(), "mix");
  EXPECT_EQ(param.parameter_node(), node);
}

TEST(ResourceTest, ImageResourceUsesFileName) {
  mf::ImageResource img("tiles.png");
  EXPECT_EQ(img.path(), "/tiles.png");
  EXPECT_EQ(img.file(), "tiles.png");
  EXPECT_EQ(img.to_string(), "img:/tiles.png");
  EXPECT_EQ(mf::ImageResource::parse("img:/tiles.png"), img);
}

TEST(ResourceTest, RejectsMalformedText) {
  using mf::GraphErrc;

  EXPECT_EQ(error_code([] { mf::SocketResource::parse("graph:/mat"); }), GraphErrc::InvalidResource);
  EXPECT_EQ(error_code([] { mf::NodeResource::parse("node:/mat/n:out"); }), GraphErrc::InvalidResource);
  EXPECT_EQ(error_code([] { mf::SocketResource::parse("node:/mat/n"); }), GraphErrc::InvalidResource);
  EXPECT_EQ(error_code([] { mf::GraphResource::parse("graph:"); }), GraphErrc::InvalidResource);
}

TEST(ResourceTest, EqualResourcesHashTogether) {
  std::unordered_set<mf::NodeResource> set;
  set.insert(mf::node_resource("g", "a"));
  set.insert(mf::NodeResource::parse("node:/g/a"));
  set.insert(mf::node_resource("g", "b"));
  EXPECT_EQ(set.size(), 2u);

  EXPECT_TRUE(mf::node_resource("g", "a") < mf::node_resource("g", "b"));
  EXPECT_NE(mf::node_resource("g", "a").node_socket("x"), mf::node_resource("g", "a").node_socket("y"));
}
