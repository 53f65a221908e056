#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "gpu/cpu_compute_backend.hpp"
#include "kernel/kernel.hpp"

namespace ce = mf::compute_events;

// Helper for asserting conditions
void mf_assert(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "Assertion failed: " << message << std::endl;
    std::exit(1);
  }
}

struct Harness {
  mf::CpuComputeBackend* backend = nullptr;
  std::unique_ptr<mf::Kernel> kernel;
};

Harness make_harness(std::size_t stack_limit = 256) {
  mf::EngineConfig config;
  config.parent_size = 64;
  config.stack_limit = stack_limit;
  config.quiet = true;
  Harness h;
  auto backend = std::make_unique<mf::CpuComputeBackend>();
  h.backend = backend.get();
  h.kernel = std::make_unique<mf::Kernel>(std::move(backend), config);
  return h;
}

// 返回 node 的 OutputReady 图像均值；没有该事件时返回 NaN
double output_mean(const Harness& h, const mf::ComputeManager::RunReport& report, const std::string& node) {
  for (const auto& ev : report.events) {
    const auto* ready = std::get_if<ce::OutputReady>(&ev);
    if (ready && ready->node.to_string() == node) {
      return cv::mean(h.backend->pixels(ready->image.image))[0];
    }
  }
  return std::nan("");
}

bool near(double a, double b) { return std::abs(a - b) < 1e-5; }

// detail: v -> result，v:value 暴露为 level
void build_detail(mf::Kernel& kernel, const std::string& name) {
  mf_assert(kernel.add_graph(name), "add graph " + name);
  mf_assert(kernel.add_node(name, "value", YAML::Load("{value: 0.1}"), "v").has_value(), "add v");
  mf_assert(kernel.add_node(name, "output", YAML::Load("{output_type: roughness}"), "result").has_value(),
            "add result");
  mf_assert(kernel.connect(name, "v", "value", "result", "data"), "connect v -> result");
  mf_assert(kernel.expose_parameter(name, "level", "v", "value", YAML::Node(0.1)), "expose level");
}

void build_caller(mf::Kernel& kernel, const std::string& name, const std::string& callee) {
  mf_assert(kernel.add_graph(name), "add graph " + name);
  auto call = kernel.add_complex_node(name, callee, "call");
  mf_assert(call.has_value(), "add complex node calling " + callee);
  mf_assert(kernel.add_node(name, "output", YAML::Load("{output_type: roughness}"), "out").has_value(), "add out");
  mf_assert(kernel.connect(name, "call", "result", "out", "data"), "connect call -> out");
}

void test_complex_call_with_exposed_parameter() {
  std::cout << "--- Running test: test_complex_call_with_exposed_parameter ---\n";
  Harness h = make_harness();
  build_detail(*h.kernel, "detail");
  build_caller(*h.kernel, "material", "detail");
  mf_assert(h.kernel->set_parameter("material", "call", "level", YAML::Node(0.7)), "set exposed level");

  const mf::Program* program = h.kernel->program("material");
  mf_assert(program != nullptr, "material has a program");
  bool has_call = false;
  for (const auto& i : program->instructions) {
    if (mf::describe(i) == "call node:/material/call (graph:/detail)") has_call = true;
  }
  mf_assert(has_call, "program calls detail");

  auto report = h.kernel->compute("material");
  mf_assert(report && report->ok(), "material computes");
  mf_assert(near(output_mean(h, *report, "node:/material/out"), 0.7), "substituted value reaches the caller");

  // 未修改时整个调用被跳过
  h.backend->reset_counters();
  report = h.kernel->compute("material");
  mf_assert(report && report->ok(), "second run");
  mf_assert(h.backend->counters().dispatches == 0, "unchanged call is skipped");

  mf_assert(h.kernel->set_parameter("material", "call", "level", YAML::Node(0.3)), "change level");
  report = h.kernel->compute("material");
  mf_assert(report && report->ok(), "third run");
  mf_assert(near(output_mean(h, *report, "node:/material/out"), 0.3), "changed parameter recomputes the callee");

  // 子图本身不受调用者的覆盖影响
  report = h.kernel->compute("detail");
  mf_assert(report && report->ok(), "detail computes");
  mf_assert(near(output_mean(h, *report, "node:/detail/result"), 0.1), "callee keeps its own value");

  mf_assert(h.kernel->expose_parameter("detail", "level", "v", "value", YAML::Node(0.2)) == false,
            "exposing the same name twice fails");
  mf_assert(h.kernel->last_error("detail")->code == mf::GraphErrc::Duplicate, "duplicate exposure error");
  std::cout << "PASS\n";
}

void test_recursion_is_detected() {
  std::cout << "--- Running test: test_recursion_is_detected ---\n";
  Harness h = make_harness();
  auto& k = *h.kernel;
  mf_assert(k.add_graph("a") && k.add_graph("b"), "add graphs");
  mf_assert(k.add_node("a", "output", {}, "out").has_value(), "a:out");
  mf_assert(k.add_node("b", "output", {}, "result").has_value(), "b:result");

  mf_assert(k.add_complex_node("b", "a", "inner").has_value(), "b calls a");
  mf_assert(k.connect("b", "inner", "out", "result", "data"), "b wires a");
  mf_assert(k.add_complex_node("a", "b", "inner").has_value(), "a calls b");
  mf_assert(k.connect("a", "inner", "result", "out", "data"), "a wires b");

  auto report = k.compute("a");
  mf_assert(report.has_value(), "run starts");
  mf_assert(!report->ok(), "run fails");
  mf_assert(report->error->code() == mf::InterpretationErrc::RecursionDetected, "recursion detected");
  mf_assert(k.last_error("a")->interpretation == mf::InterpretationErrc::RecursionDetected, "error recorded");
  std::cout << "PASS\n";
}

// c0 是 value -> result，ci 调用 c(i-1)
void build_call_chain(mf::Kernel& k, int depth) {
  mf_assert(k.add_graph("c0"), "add c0");
  mf_assert(k.add_node("c0", "value", YAML::Load("{value: 0.6}"), "v").has_value(), "c0:v");
  mf_assert(k.add_node("c0", "output", {}, "result").has_value(), "c0:result");
  mf_assert(k.connect("c0", "v", "value", "result", "data"), "c0 wiring");
  for (int i = 1; i <= depth; ++i) {
    const std::string name = "c" + std::to_string(i);
    const std::string callee = "c" + std::to_string(i - 1);
    mf_assert(k.add_graph(name), "add " + name);
    mf_assert(k.add_complex_node(name, callee, "call").has_value(), name + " calls " + callee);
    mf_assert(k.add_node(name, "output", {}, "result").has_value(), name + ":result");
    mf_assert(k.connect(name, "call", "result", "result", "data"), name + " wiring");
  }
}

void test_stack_limit() {
  std::cout << "--- Running test: test_stack_limit ---\n";
  {
    Harness h = make_harness(2);
    build_call_chain(*h.kernel, 3);
    auto report = h.kernel->compute("c3");
    mf_assert(report && !report->ok(), "deep chain fails");
    mf_assert(report->error->code() == mf::InterpretationErrc::StackLimitReached, "stack limit reached");
  }
  {
    Harness h = make_harness(8);
    build_call_chain(*h.kernel, 3);
    auto report = h.kernel->compute("c3");
    mf_assert(report && report->ok(), "chain within limit succeeds");
    mf_assert(near(output_mean(h, *report, "node:/c3/result"), 0.6), "value travels through every call");
  }
  std::cout << "PASS\n";
}

void test_rename_and_remove_graph() {
  std::cout << "--- Running test: test_rename_and_remove_graph ---\n";
  Harness h = make_harness();
  auto& k = *h.kernel;
  build_detail(k, "detail");
  build_caller(k, "material", "detail");

  mf_assert(k.rename_graph("detail", "fine"), "rename detail");
  mf_assert(!k.has_graph("detail") && k.has_graph("fine"), "graph renamed");
  const auto& call = std::get<mf::ComplexOperator>(k.graph("material")->node("call").op);
  mf_assert(call.graph == mf::graph_resource("fine"), "caller follows the rename");
  mf_assert(k.program("fine") != nullptr, "program follows the rename");

  auto report = k.compute("material");
  mf_assert(report && report->ok(), "caller still computes");
  mf_assert(near(output_mean(h, *report, "node:/material/out"), 0.1), "renamed callee result");

  mf_assert(!k.rename_graph("fine", "material"), "rename onto an existing graph fails");
  mf_assert(!k.remove_graph("fine"), "called graph cannot be removed");
  mf_assert(k.last_error("fine")->code == mf::GraphErrc::InvalidParameter, "refusal recorded");

  mf_assert(k.remove_node("material", "call"), "remove caller node");
  mf_assert(k.remove_graph("fine"), "graph removed once unused");
  mf_assert(k.program("fine") == nullptr, "program dropped");
  mf_assert(!k.compute("fine").has_value(), "removed graph cannot run");
  std::cout << "PASS\n";
}

void test_layer_stack_mask() {
  std::cout << "--- Running test: test_layer_stack_mask ---\n";
  Harness h = make_harness();
  auto& k = *h.kernel;
  mf_assert(k.add_layer_stack("mat"), "add stack");

  mf::NodeDescription base;
  base.type = "value";
  base.parameters = YAML::Load("{value: 0.2}");
  mf::NodeDescription top = base;
  top.parameters = YAML::Load("{value: 1.0}");
  mf::NodeDescription mask = base;
  mask.parameters = YAML::Load("{value: 0.25}");

  mf_assert(k.push_fill_layer("mat", base, {{mf::MaterialChannel::Roughness, "value"}}).has_value(), "base layer");
  auto upper = k.push_fill_layer("mat", top, {{mf::MaterialChannel::Roughness, "value"}});
  mf_assert(upper.has_value(), "top layer");
  mf_assert(k.push_mask("mat", *upper, mask).has_value(), "mask on top layer");

  auto report = k.compute("mat");
  mf_assert(report && report->ok(), "stack computes");
  // 0.2 + (1.0 - 0.2) * 0.25
  mf_assert(near(output_mean(h, *report, "node:/mat/output.rgh"), 0.4), "mask drives the blend");
  mf_assert(h.backend->counters().dispatches_by_shader["blend_masked"] == 1, "masked blend used");

  mf_assert(!k.move_layer_down("mat", "value.1"), "bottom layer cannot move down");
  mf_assert(k.move_layer_down("mat", *upper), "fill layer moves down");
  report = k.compute("mat");
  mf_assert(report && report->ok(), "reordered stack computes");
  // 带遮罩的 value.2 移到底部后直接写入通道，value.1 覆盖在上面
  mf_assert(near(output_mean(h, *report, "node:/mat/output.rgh"), 0.2), "order changes the result");
  std::cout << "PASS\n";
}

void test_exports_and_images() {
  std::cout << "--- Running test: test_exports_and_images ---\n";
  const mf::fs::path dir = mf::fs::temp_directory_path() / "matforge_scenarios";
  mf::fs::remove_all(dir);
  mf::fs::create_directories(dir);
  const mf::fs::path tile = dir / "tile.png";
  mf_assert(cv::imwrite(tile.string(), cv::Mat(48, 48, CV_8UC3, cv::Scalar::all(255))), "write tile.png");

  Harness h = make_harness();
  auto& k = *h.kernel;
  mf_assert(!k.add_image((dir / "missing.png").string(), mf::ColorSpace::Srgb).has_value(), "missing image");
  auto image = k.add_image(tile.string(), mf::ColorSpace::Linear);
  mf_assert(image.has_value() && image->to_string() == "img:/tile.png", "image registered by file name");

  mf_assert(k.add_graph("g"), "add g");
  mf_assert(k.add_node("g", "image", YAML::Load("{resource: tile.png}"), "tile").has_value(), "image node");
  mf_assert(k.add_node("g", "output", YAML::Load("{output_type: albedo}"), "albedo").has_value(), "albedo");
  mf_assert(k.connect("g", "tile", "image", "albedo", "data"), "connect tile -> albedo");

  mf_assert(!k.set_export("g", "tile", mf::ExportSpec{dir / "bad.png", 8, mf::ColorSpace::Srgb}),
            "only output nodes export");
  mf_assert(k.set_export("g", "albedo", mf::ExportSpec{dir / "albedo.png", 8, mf::ColorSpace::Srgb}),
            "export albedo");

  auto report = k.compute("g");
  mf_assert(report && report->ok(), "image graph computes");
  bool sized = false;
  for (const auto& ev : report->events) {
    const auto* ready = std::get_if<ce::OutputReady>(&ev);
    if (ready) sized = ready->size == 48;
  }
  mf_assert(sized, "image node follows the source dimensions");
  mf_assert(near(output_mean(h, *report, "node:/g/albedo"), 1.0), "white tile uploads as 1.0");

  mf_assert(k.wait_for_exports(std::chrono::seconds(10)), "exports finish");
  mf_assert(mf::fs::exists(dir / "albedo.png"), "albedo.png written");
  cv::Mat written = cv::imread((dir / "albedo.png").string(), cv::IMREAD_UNCHANGED);
  mf_assert(!written.empty() && written.rows == 48, "exported image has the node size");

  mf::fs::remove_all(dir);
  std::cout << "PASS\n";
}

void test_linearization_mode_switch() {
  std::cout << "--- Running test: test_linearization_mode_switch ---\n";
  Harness h = make_harness();
  auto& k = *h.kernel;
  mf_assert(k.add_graph("g"), "add g");
  mf_assert(k.add_node("g", "value").has_value(), "value");
  mf_assert(k.add_node("g", "blend").has_value(), "blend");
  mf_assert(k.add_node("g", "output").has_value(), "output");
  mf_assert(k.connect("g", "value.1", "value", "blend.1", "background"), "bg");
  mf_assert(k.connect("g", "value.1", "value", "blend.1", "foreground"), "fg");
  mf_assert(k.connect("g", "blend.1", "color", "output.1", "data"), "out");

  mf_assert(k.program("g")->execution_steps() == 3, "topological executes value once");
  mf_assert(k.set_linearization_mode(mf::LinearizationMode::FullTraversal), "switch mode");
  mf_assert(k.program("g")->execution_steps() == 4, "full traversal executes value per edge");
  mf_assert(k.config().linearization_mode == "full", "config follows the mode");

  auto report = k.compute("g");
  mf_assert(report && report->ok(), "full traversal computes");
  std::cout << "PASS\n";
}

int main() {
  test_complex_call_with_exposed_parameter();
  test_recursion_is_detected();
  test_stack_limit();
  test_rename_and_remove_graph();
  test_layer_stack_mask();
  test_exports_and_images();
  test_linearization_mode_switch();
  std::cout << "All scenario tests passed." << std::endl;
  return 0;
}
