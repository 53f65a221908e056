// Matforge kernel: multi-graph Kernel facade
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "engine_config.hpp"
#include "gpu/compute_backend.hpp"
#include "kernel/compute_manager.hpp"
#include "kernel/services/graph_io_service.hpp"
#include "layer_stack.hpp"
#include "node_graph.hpp"

namespace mf {

/**
 * @brief 编辑与计算的统一入口。
 *
 * 持有所有节点图与层栈、计算后端以及 ComputeManager。每次编辑之后：
 * 把产生的 GraphEvent 交给 ComputeManager，重新线性化被编辑的图并安装
 * Program，再把该图作为复杂算子的新定义传播给所有调用者（逐级向上）。
 *
 * 失败的操作返回 false / std::nullopt，错误信息通过 last_error(name) 查询。
 */
class MATFORGE_API Kernel {
public:
    struct LastError {
        GraphErrc code = GraphErrc::Unknown;
        std::optional<InterpretationErrc> interpretation;
        std::string message;
    };

    explicit Kernel(const EngineConfig& config = {});
    // 使用外部提供的后端（例如带故障注入的 CpuComputeBackend）
    Kernel(std::unique_ptr<ComputeBackend> backend, const EngineConfig& config = {});

    // --- 图与层栈 ---
    bool add_graph(const std::string& name);
    bool add_layer_stack(const std::string& name);
    bool remove_graph(const std::string& name);
    bool rename_graph(const std::string& from, const std::string& to);
    std::vector<std::string> list_graphs() const;
    bool has_graph(const std::string& name) const;
    const NodeGraph* graph(const std::string& name) const;
    const LayerStack* layer_stack(const std::string& name) const;

    // 读取 YAML 描述文件，依次注册图像、建立图与层栈
    bool load_document(const std::string& yaml_path);
    bool apply_document(const GraphDocument& doc);

    // --- 节点编辑 ---
    std::optional<std::string> add_node(const std::string& graph, const std::string& type,
                                        const YAML::Node& parameters = {}, const std::string& name = "");
    std::optional<std::string> add_complex_node(const std::string& graph, const std::string& callee,
                                                const std::string& name = "");
    bool remove_node(const std::string& graph, const std::string& node);
    bool rename_node(const std::string& graph, const std::string& from, const std::string& to);
    bool resize_node(const std::string& graph, const std::string& node, int size, bool absolute);
    bool set_parameter(const std::string& graph, const std::string& node, const std::string& field,
                       const YAML::Node& value);
    bool connect(const std::string& graph, const std::string& from_node, const std::string& from_socket,
                 const std::string& to_node, const std::string& to_socket);
    bool disconnect(const std::string& graph, const std::string& node, const std::string& socket);
    // 把子图内部参数暴露为复杂算子的参数
    bool expose_parameter(const std::string& graph, const std::string& name, const std::string& node,
                          const std::string& field, const YAML::Node& default_value);

    // --- 层编辑 ---
    std::optional<std::string> push_fill_layer(const std::string& stack, const NodeDescription& op,
                                               const std::map<MaterialChannel, std::string>& outputs);
    std::optional<std::string> push_fx_layer(const std::string& stack, const NodeDescription& op,
                                             const std::map<std::string, MaterialChannel>& inputs,
                                             const std::map<MaterialChannel, std::string>& outputs);
    std::optional<std::string> push_mask(const std::string& stack, const std::string& layer,
                                         const NodeDescription& op);
    bool remove_layer(const std::string& stack, const std::string& layer);
    bool move_layer_up(const std::string& stack, const std::string& layer);
    bool move_layer_down(const std::string& stack, const std::string& layer);
    bool set_layer_opacity(const std::string& stack, const std::string& layer, float opacity);
    bool set_layer_blend_mode(const std::string& stack, const std::string& layer, BlendMode mode);
    bool set_layer_enabled(const std::string& stack, const std::string& layer, bool enabled);
    bool set_layer_output(const std::string& stack, const std::string& layer, MaterialChannel channel,
                          const std::string& socket);
    bool set_layer_input(const std::string& stack, const std::string& layer, const std::string& socket,
                         MaterialChannel channel);
    bool set_layer_parameter(const std::string& stack, const std::string& layer, const std::string& field,
                             const YAML::Node& value);

    // --- 计算 ---
    std::optional<ImageResource> add_image(const std::string& path, ColorSpace color_space);
    bool set_linearization_mode(LinearizationMode mode);
    void set_parent_size(std::uint32_t size);
    bool set_export(const std::string& graph, const std::string& node, ExportSpec spec);
    void clear_exports();
    bool set_view_socket(const std::string& graph, const std::string& node, const std::string& socket);
    void clear_view_socket();

    /**
     * @brief 运行一次完整的解释。
     * @return 图不存在或当前没有有效的线性化时返回 std::nullopt；解释失败时
     *         报告中带有错误，同时记录到 last_error。
     */
    std::optional<ComputeManager::RunReport> compute(const std::string& name);
    bool wait_for_exports(std::chrono::milliseconds timeout);

    const Program* program(const std::string& name) const;
    std::vector<ComputeEvent> drain_events() { return manager_.drain_events(); }
    std::optional<LastError> last_error(const std::string& name) const;

    const EngineConfig& config() const { return config_; }
    ComputeManager& manager() { return manager_; }
    ComputeBackend& backend() { return *backend_; }

private:
    struct ExposedParameter {
        std::string node;
        std::string field;
        YAML::Node value;
    };

    template <typename Fn>
    bool guarded(const std::string& name, Fn&& fn);
    void record_error(const std::string& name, GraphErrc code, const std::string& message);

    NodeGraph& graph_mut(const std::string& name);
    LayerStack& stack_mut(const std::string& name);
    Operator make_operator(const NodeDescription& desc) const;
    ComplexOperator complex_operator_of(const std::string& graph) const;

    // 失败时抛出 GraphError，错误码取自出错的那一步
    void build_document(const GraphDocument& doc);
    void apply(const GraphEvents& events);
    // 重新线性化 name 并把新定义逐级传播给调用者
    void commit(const std::string& name);
    void relinearize(const std::string& name);
    void propagate(const std::string& callee, std::set<std::string>& visited);

    EngineConfig config_;
    LinearizationMode mode_;
    // 后端必须比 manager_ 活得更久
    std::unique_ptr<ComputeBackend> backend_;
    ComputeManager manager_;
    GraphIOService io_service_;
    std::map<std::string, NodeGraph> graphs_;
    std::map<std::string, LayerStack> stacks_;
    std::map<std::string, std::map<std::string, ExposedParameter>> exposed_;
    std::map<std::string, LastError> last_error_;
};

} // namespace mf
