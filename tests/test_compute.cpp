#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "gpu/cpu_compute_backend.hpp"
#include "kernel/kernel.hpp"

namespace {

using mf::InterpretationErrc;
namespace ce = mf::compute_events;

mf::EngineConfig test_config() {
  mf::EngineConfig config;
  config.parent_size = 64;
  config.quiet = true;
  return config;
}

template <typename T>
std::vector<T> events_of(const std::vector<mf::ComputeEvent>& events) {
  std::vector<T> out;
  for (const auto& e : events) {
    if (const auto* ev = std::get_if<T>(&e)) out.push_back(*ev);
  }
  return out;
}

class ComputeTest : public ::testing::Test {
 protected:
  void SetUp() override { build(); }

  // 可在构造 Kernel 之前对后端做准备（例如禁用 pipeline）
  template <typename Prepare>
  void build(Prepare&& prepare) {
    auto backend = std::make_unique<mf::CpuComputeBackend>();
    prepare(*backend);
    backend_ = backend.get();
    kernel_ = std::make_unique<mf::Kernel>(std::move(backend), test_config());
  }
  void build() {
    build([](mf::CpuComputeBackend&) {});
  }

  // g: value.1 -> rough
  void build_value_chain(float value) {
    ASSERT_TRUE(kernel_->add_graph("g"));
    YAML::Node params;
    params["value"] = value;
    ASSERT_EQ(kernel_->add_node("g", "value", params), std::optional<std::string>("value.1"));
    ASSERT_TRUE(kernel_->add_node("g", "output", YAML::Load("{output_type: roughness}"), "rough").has_value());
    ASSERT_TRUE(kernel_->connect("g", "value.1", "value", "rough", "data"));
  }

  double output_mean(const ce::OutputReady& ready) const {
    return cv::mean(backend_->pixels(ready.image.image))[0];
  }

  mf::CpuComputeBackend* backend_ = nullptr;
  std::unique_ptr<mf::Kernel> kernel_;
};

}  // namespace

TEST_F(ComputeTest, RunsChainAndReportsOutput) {
  build_value_chain(0.25f);
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report.has_value());
  ASSERT_TRUE(report->ok()) << report->error->what();
  EXPECT_EQ(report->steps, 4u);

  auto ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].node, mf::node_resource("g", "rough"));
  EXPECT_EQ(ready[0].output_type, mf::OutputType::Roughness);
  EXPECT_EQ(ready[0].size, 64u);
  EXPECT_NEAR(output_mean(ready[0]), 0.25, 1e-6);

  EXPECT_EQ(events_of<ce::ThumbnailCreated>(report->events).size(), 2u);
  EXPECT_TRUE(std::holds_alternative<ce::VramUsage>(report->events.back()));

  auto counters = backend_->counters();
  EXPECT_EQ(counters.dispatches, 1u);
  EXPECT_EQ(counters.dispatches_by_shader["value"], 1u);
}

TEST_F(ComputeTest, UnchangedGraphIsNotRecomputed) {
  build_value_chain(0.25f);
  auto first = kernel_->compute("g");
  ASSERT_TRUE(first && first->ok());
  backend_->reset_counters();

  auto second = kernel_->compute("g");
  ASSERT_TRUE(second && second->ok());
  EXPECT_GT(second->seq, first->seq);
  EXPECT_EQ(backend_->counters().dispatches, 0u);
  EXPECT_EQ(backend_->counters().thumbnails, 0u);
  EXPECT_TRUE(events_of<ce::OutputReady>(second->events).empty());
}

TEST_F(ComputeTest, ParameterChangeRecomputes) {
  build_value_chain(0.25f);
  ASSERT_TRUE(kernel_->compute("g"));
  backend_->reset_counters();

  ASSERT_TRUE(kernel_->set_parameter("g", "value.1", "value", YAML::Node(0.75)));
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report && report->ok());
  EXPECT_EQ(backend_->counters().dispatches, 1u);
  auto ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_NEAR(output_mean(ready[0]), 0.75, 1e-6);

  EXPECT_FALSE(kernel_->set_parameter("g", "value.1", "sigma", YAML::Node(1.0)));
  EXPECT_EQ(kernel_->last_error("g")->code, mf::GraphErrc::InvalidParameter);
}

TEST_F(ComputeTest, BlendMixesBackgroundAndForeground) {
  ASSERT_TRUE(kernel_->add_graph("g"));
  ASSERT_TRUE(kernel_->add_node("g", "value", YAML::Load("{value: 0.2}"), "low"));
  ASSERT_TRUE(kernel_->add_node("g", "value", YAML::Load("{value: 0.6}"), "high"));
  ASSERT_TRUE(kernel_->add_node("g", "blend", YAML::Load("{blend_mode: mix, mix: 0.5}"), "mix"));
  ASSERT_TRUE(kernel_->add_node("g", "output", YAML::Load("{output_type: displacement}"), "disp"));
  ASSERT_TRUE(kernel_->connect("g", "low", "value", "mix", "background"));
  ASSERT_TRUE(kernel_->connect("g", "high", "value", "mix", "foreground"));
  ASSERT_TRUE(kernel_->connect("g", "mix", "color", "disp", "data"));

  auto report = kernel_->compute("g");
  ASSERT_TRUE(report && report->ok());
  auto ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_NEAR(output_mean(ready[0]), 0.4, 1e-5);
  EXPECT_EQ(backend_->counters().dispatches_by_shader["blend"], 1u);
}

TEST_F(ComputeTest, RetriesOnceAfterAllocationFailure) {
  build_value_chain(0.5f);
  backend_->inject_allocation_failures(1);
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->ok());
  EXPECT_EQ(events_of<ce::OutputReady>(report->events).size(), 1u);
  EXPECT_FALSE(kernel_->last_error("g").has_value());
}

TEST_F(ComputeTest, RepeatedAllocationFailureIsHardOom) {
  build_value_chain(0.5f);
  backend_->inject_allocation_failures(10);
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report.has_value());
  ASSERT_FALSE(report->ok());
  EXPECT_EQ(report->error->code(), InterpretationErrc::HardOOM);

  auto err = kernel_->last_error("g");
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->interpretation, InterpretationErrc::HardOOM);
}

TEST_F(ComputeTest, MissingPipelineReportsMissingShader) {
  build([](mf::CpuComputeBackend& backend) { backend.disable_pipeline("value"); });
  const auto& failed = kernel_->manager().failed_shaders();
  EXPECT_NE(std::find(failed.begin(), failed.end(), "value"), failed.end());

  build_value_chain(0.5f);
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report.has_value());
  ASSERT_FALSE(report->ok());
  EXPECT_EQ(report->error->code(), InterpretationErrc::MissingShader);
}

TEST_F(ComputeTest, ComputeNeedsGraphAndLinearization) {
  EXPECT_FALSE(kernel_->compute("missing").has_value());
  EXPECT_EQ(kernel_->last_error("missing")->code, mf::GraphErrc::NotFound);

  ASSERT_TRUE(kernel_->add_graph("g"));
  ASSERT_TRUE(kernel_->add_node("g", "value"));
  ASSERT_TRUE(kernel_->add_node("g", "blend"));
  ASSERT_TRUE(kernel_->add_node("g", "output"));
  ASSERT_TRUE(kernel_->connect("g", "value.1", "value", "blend.1", "background"));
  ASSERT_TRUE(kernel_->connect("g", "blend.1", "color", "output.1", "data"));
  EXPECT_EQ(kernel_->program("g"), nullptr);
  EXPECT_FALSE(kernel_->compute("g").has_value());
  EXPECT_EQ(kernel_->last_error("g")->code, mf::GraphErrc::Linearization);

  ASSERT_TRUE(kernel_->connect("g", "value.1", "value", "blend.1", "foreground"));
  ASSERT_NE(kernel_->program("g"), nullptr);
  auto report = kernel_->compute("g");
  ASSERT_TRUE(report && report->ok());
}

TEST_F(ComputeTest, ViewSocketIsReportedWhenUpdated) {
  build_value_chain(0.5f);
  EXPECT_FALSE(kernel_->set_view_socket("g", "value.1", "missing"));
  ASSERT_TRUE(kernel_->set_view_socket("g", "value.1", "value"));

  auto first = kernel_->compute("g");
  ASSERT_TRUE(first && first->ok());
  auto views = events_of<ce::SocketViewReady>(first->events);
  ASSERT_EQ(views.size(), 1u);
  EXPECT_EQ(views[0].socket.to_string(), "node:/g/value.1:value");

  auto second = kernel_->compute("g");
  ASSERT_TRUE(second && second->ok());
  EXPECT_TRUE(events_of<ce::SocketViewReady>(second->events).empty());
}

TEST_F(ComputeTest, ParentSizeChangeReallocatesImages) {
  build_value_chain(0.5f);
  ASSERT_TRUE(kernel_->compute("g"));
  kernel_->set_parent_size(128);

  auto report = kernel_->compute("g");
  ASSERT_TRUE(report && report->ok());
  auto ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].size, 128u);
  EXPECT_EQ(backend_->pixels(ready[0].image.image).rows, 128);
}

TEST_F(ComputeTest, LayerStackBlendsByOpacity) {
  ASSERT_TRUE(kernel_->add_layer_stack("mat"));

  mf::NodeDescription low;
  low.type = "value";
  low.parameters = YAML::Load("{value: 0.2}");
  mf::NodeDescription high = low;
  high.parameters = YAML::Load("{value: 0.6}");

  auto bottom = kernel_->push_fill_layer("mat", low, {{mf::MaterialChannel::Roughness, "value"}});
  auto top = kernel_->push_fill_layer("mat", high, {{mf::MaterialChannel::Roughness, "value"}});
  ASSERT_TRUE(bottom && top);
  EXPECT_EQ(*top, "value.2");
  ASSERT_TRUE(kernel_->set_layer_opacity("mat", *top, 0.5f));

  auto report = kernel_->compute("mat");
  ASSERT_TRUE(report && report->ok());
  auto ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].node.to_string(), "node:/mat/output.rgh");
  EXPECT_NEAR(output_mean(ready[0]), 0.4, 1e-5);

  // 顶层禁用后直接输出底层
  ASSERT_TRUE(kernel_->set_layer_enabled("mat", *top, false));
  report = kernel_->compute("mat");
  ASSERT_TRUE(report && report->ok());
  ready = events_of<ce::OutputReady>(report->events);
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_NEAR(output_mean(ready[0]), 0.2, 1e-5);
}
