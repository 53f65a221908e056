#include <gtest/gtest.h>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

#include "layer_stack.hpp"

namespace {

using mf::GraphErrc;
using mf::LayerStack;
using mf::MaterialChannel;

constexpr std::uint32_t kParent = 128;

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

nlohmann::json dump_program(const mf::Program& program) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& i : program.instructions) out.push_back(mf::describe(i));
  return out;
}

// value -> roughness, perlin noise -> displacement, blur FX on displacement
class LayerStackTest : public ::testing::Test {
 protected:
  void SetUp() override {
    stack.push_fill(mf::AtomicOperator(mf::Value{}), {{MaterialChannel::Roughness, "value"}}, kParent);
    stack.push_fill(mf::AtomicOperator(mf::PerlinNoise{}), {{MaterialChannel::Displacement, "noise"}}, kParent);
    stack.push_fx(mf::AtomicOperator(mf::Blur{}), {{"image", MaterialChannel::Displacement}},
                  {{MaterialChannel::Displacement, "blurred"}}, kParent);
  }

  LayerStack stack{"mat"};
};

}  // namespace

TEST(LayerStackRulesTest, RejectsInvalidLayers) {
  LayerStack stack("mat");
  EXPECT_EQ(error_code([&] {
              stack.push_fx(mf::AtomicOperator(mf::Blur{}), {}, {{MaterialChannel::Displacement, "blurred"}}, kParent);
            }),
            GraphErrc::InvalidParameter);
  EXPECT_EQ(error_code([&] { stack.push_fill(mf::AtomicOperator(mf::Blur{}), {}, kParent); }),
            GraphErrc::InvalidParameter);
  EXPECT_EQ(error_code([&] {
              stack.push_fill(mf::AtomicOperator(mf::Rgb{}), {{MaterialChannel::Roughness, "color"}}, kParent);
            }),
            GraphErrc::TypeMismatch);
  EXPECT_TRUE(stack.layers().empty());

  auto pushed = stack.push_fill(mf::AtomicOperator(mf::Rgb{}), {{MaterialChannel::Albedo, "color"}}, kParent);
  EXPECT_EQ(pushed.first, "rgb.1");
  EXPECT_EQ(stack.output_channels().count(MaterialChannel::Albedo), 1u);
}

TEST(LayerStackRulesTest, NamesNodesAfterLayerAndChannel) {
  LayerStack stack("mat");
  EXPECT_EQ(stack.blend_resource("blur.1", MaterialChannel::Displacement).to_string(), "node:/mat/blur.1.blend.disp");
  EXPECT_EQ(stack.mask_resource("blur.1", "value.1").to_string(), "node:/mat/blur.1.mask.value.1");
  EXPECT_EQ(stack.mask_blend_resource("blur.1", "value.1").to_string(), "node:/mat/blur.1.mask.value.1.blend");
  EXPECT_EQ(stack.output_resource(MaterialChannel::Roughness).to_string(), "node:/mat/output.rgh");
  EXPECT_EQ(mf::channel_from_name("nor"), MaterialChannel::Normal);
  EXPECT_EQ(mf::channel_from_name("metallic"), MaterialChannel::Metallic);
  EXPECT_FALSE(mf::channel_from_name("specular").has_value());
}

TEST_F(LayerStackTest, LinearizesLayersIntoChannelBlends) {
  auto program = stack.linearize();
  ASSERT_TRUE(program.has_value());

  const nlohmann::json expected = {
      "execute node:/mat/value.1",
      "thumbnail node:/mat/value.1:value",
      "execute node:/mat/perlin_noise.1",
      "thumbnail node:/mat/perlin_noise.1:noise",
      "move node:/mat/perlin_noise.1:noise -> node:/mat/blur.1:image",
      "execute node:/mat/blur.1",
      "thumbnail node:/mat/blur.1:blurred",
      "move node:/mat/perlin_noise.1:noise -> node:/mat/blur.1.blend.disp:background",
      "move node:/mat/blur.1:blurred -> node:/mat/blur.1.blend.disp:foreground",
      "execute node:/mat/blur.1.blend.disp",
      "move node:/mat/blur.1.blend.disp:color -> node:/mat/output.disp:data",
      "execute node:/mat/output.disp",
      "move node:/mat/value.1:value -> node:/mat/output.rgh:data",
      "execute node:/mat/output.rgh",
  };
  EXPECT_EQ(dump_program(*program), expected) << dump_program(*program).dump(2);

  // value.1 一直保留到 roughness 输出
  const auto& value_use = program->use_points.at(stack.layer_resource("value.1"));
  EXPECT_EQ(value_use.creation, 1u);
  EXPECT_EQ(value_use.last, 8u);
  const auto& noise_use = program->use_points.at(stack.layer_resource("perlin_noise.1"));
  EXPECT_EQ(noise_use.creation, 2u);
  EXPECT_EQ(noise_use.last, 4u);
}

TEST_F(LayerStackTest, DisabledLayerIsSkipped) {
  stack.set_enabled("blur.1", false);
  auto program = stack.linearize();
  ASSERT_TRUE(program.has_value());
  EXPECT_EQ(dump_program(*program)[4], "move node:/mat/perlin_noise.1:noise -> node:/mat/output.disp:data");
  EXPECT_EQ(program->execution_steps(), 4u);
}

TEST_F(LayerStackTest, MaskedLayerBlendsThroughMask) {
  auto mask = stack.push_mask("blur.1", mf::AtomicOperator(mf::Value{}), kParent);
  EXPECT_EQ(mask.first, "value.1");

  auto program = stack.linearize();
  ASSERT_TRUE(program.has_value());
  const auto described = dump_program(*program);
  auto contains = [&](const std::string& line) {
    return std::find(described.begin(), described.end(), line) != described.end();
  };
  EXPECT_TRUE(contains("execute node:/mat/blur.1.mask.value.1"));
  EXPECT_TRUE(contains("move node:/mat/blur.1.mask.value.1:value -> node:/mat/blur.1.blend.disp:mask"));

  const auto blend = stack.blend_resource("blur.1", MaterialChannel::Displacement);
  bool masked_blend = false;
  for (const auto& i : program->instructions) {
    const auto* exec = std::get_if<mf::instr::Execute>(&i);
    if (exec && exec->node == blend) masked_blend = std::holds_alternative<mf::BlendMasked>(exec->op);
  }
  EXPECT_TRUE(masked_blend);

  // 有输入的遮罩不能放在最底部
  LayerStack other("other");
  other.push_fill(mf::AtomicOperator(mf::Value{}), {{MaterialChannel::Roughness, "value"}}, kParent);
  EXPECT_EQ(error_code([&] { other.push_mask("value.1", mf::AtomicOperator(mf::Blur{}), kParent); }),
            GraphErrc::InvalidParameter);
}

TEST_F(LayerStackTest, RemoveEmitsEventsForAllOwnedNodes) {
  stack.push_mask("blur.1", mf::AtomicOperator(mf::Value{}), kParent);
  auto events = stack.remove("blur.1");
  // 层本身、5 个通道混合、遮罩与遮罩混合
  EXPECT_EQ(events.size(), 1u + mf::all_material_channels().size() + 2u);
  EXPECT_TRUE(std::all_of(events.begin(), events.end(), [](const mf::GraphEvent& e) {
    return std::holds_alternative<mf::graph_events::NodeRemoved>(e);
  }));
  EXPECT_FALSE(stack.has_layer("blur.1"));
  EXPECT_EQ(error_code([&] { stack.remove("blur.1"); }), GraphErrc::NotFound);
}

TEST_F(LayerStackTest, FxLayerNeedsWriterUnderneath) {
  ASSERT_TRUE(stack.move_down("blur.1"));
  EXPECT_FALSE(stack.linearize().has_value());

  // FX 层不能成为最底层
  EXPECT_FALSE(stack.move_down("blur.1"));
  EXPECT_FALSE(stack.move_up("value.1"));
  EXPECT_EQ(stack.layers()[1].name, "blur.1");

  ASSERT_TRUE(stack.move_up("blur.1"));
  EXPECT_TRUE(stack.linearize().has_value());
}

TEST_F(LayerStackTest, OpacityFeedsBlendMix) {
  stack.set_opacity("blur.1", 0.25f);
  stack.set_blend_mode("blur.1", mf::BlendMode::Multiply);
  auto program = stack.linearize();
  ASSERT_TRUE(program.has_value());

  const auto blend = stack.blend_resource("blur.1", MaterialChannel::Displacement);
  for (const auto& i : program->instructions) {
    const auto* exec = std::get_if<mf::instr::Execute>(&i);
    if (!exec || exec->node != blend) continue;
    const auto& op = std::get<mf::Blend>(exec->op);
    EXPECT_FLOAT_EQ(op.mix, 0.25f);
    EXPECT_EQ(op.blend_mode, mf::BlendMode::Multiply);
    EXPECT_TRUE(op.clamp_output);
  }
}
