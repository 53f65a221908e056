#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "graph_events.hpp"
#include "mf_types.hpp"
#include "operators.hpp"
#include "program.hpp"
#include "resource.hpp"

namespace mf {

constexpr std::uint32_t kMinImageSize = 32;
constexpr std::uint32_t kMaxImageSize = 16384;

inline std::uint32_t clamp_image_size(std::int64_t size) {
    if (size < kMinImageSize) return kMinImageSize;
    if (size > kMaxImageSize) return kMaxImageSize;
    return static_cast<std::uint32_t>(size);
}

struct Node {
    Operator op;
    // 绝对模式下为 2 << size，相对模式下为 parent << size / parent >> -size
    int size = 0;
    bool absolute_size = false;
    // 已确定的类型变量
    std::map<TypeVariable, ImageType> type_variables;

    std::uint32_t node_size(std::uint32_t parent) const;
    std::optional<ImageType> resolve(const OperatorType& ty) const;
};

struct Edge {
    std::string source_node;
    std::string source_socket;
    std::string sink_node;
    std::string sink_socket;
};

/**
 * @brief NodeGraph 管理一个算子节点图：节点增删、连接、类型单态化与线性化。
 *
 * 主要功能：
 * - 节点管理：add_node / remove_node / rename_node / resize_node / set_parameter。
 * - 连接管理：connect_sockets / disconnect_sink_socket。连接时解析多态 socket
 *   的类型变量，断开最后一条约束边时撤销绑定。
 * - 线性化：linearize 把图编译成 Program（指令序列 + 使用窗口）。
 * - 作为复杂算子导出：as_complex_operator。
 *
 * 所有编辑都返回一批 GraphEvent；编辑失败抛出 GraphError 且图保持不变。
 */
class NodeGraph {
public:
    explicit NodeGraph(std::string name);

    const std::string& name() const { return name_; }
    // 只改名称；节点资源随之变化，调用方负责通知计算侧
    void rename(std::string name) { name_ = std::move(name); }
    GraphResource resource() const { return graph_resource(name_); }
    NodeResource node_resource(const std::string& node) const { return mf::node_resource(name_, node); }

    // 返回新节点名与事件。name 为空时按算子默认名生成唯一名称。
    std::pair<std::string, GraphEvents> add_node(Operator op, std::uint32_t parent_size,
                                                 const std::string& name = "");
    GraphEvents remove_node(const std::string& name);
    GraphEvents rename_node(const std::string& from, const std::string& to);
    GraphEvents resize_node(const std::string& name, int size, bool absolute, std::uint32_t parent_size);
    GraphEvents set_parameter(const std::string& node, const std::string& field, const YAML::Node& value);

    /**
     * @brief 连接 from_node 的输出到 to_node 的输入。
     *
     * 单态 -> 多态：绑定多态一侧的类型变量并通知共享该变量的所有 socket。
     * 目标输入已有连接时先断开。
     *
     * @throws GraphError SelfConnection / SinkToSink / TypeMismatch /
     *         PolymorphicConnection / NotFound
     */
    GraphEvents connect_sockets(const std::string& from_node, const std::string& from_socket,
                                const std::string& to_node, const std::string& to_socket);
    GraphEvents disconnect_sink_socket(const std::string& node, const std::string& socket);

    // 替换所有调用 graph 的复杂算子节点，保留各自已设置的参数值
    GraphEvents update_complex_operators(const GraphResource& graph, const ComplexOperator& op);

    /**
     * @brief 将图编译成 Program。
     * @return 任一被遍历节点存在未连接的必需输入时返回 std::nullopt。
     */
    std::optional<Program> linearize(LinearizationMode mode) const;

    // 以 Input/Output 节点作为调用接口，导出为复杂算子
    ComplexOperator as_complex_operator(const std::map<std::string, ParamSubstitution>& exposed = {}) const;

    bool has_node(const std::string& name) const { return nodes_.count(name) != 0; }
    const Node& node(const std::string& name) const;
    const std::unordered_map<std::string, Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const std::vector<std::string>& output_nodes() const { return outputs_; }

    // 返回 socket 当前的具体类型（多态且未绑定时为空）
    std::optional<ImageType> socket_type(const std::string& node, const std::string& socket) const;
    bool all_node_inputs_connected(const std::string& node) const;

private:
    Node& node_mut(const std::string& name);
    GraphEvents set_type_variable(const std::string& node, TypeVariable var, std::optional<ImageType> ty);
    GraphEvents disconnect_edge(std::size_t index);
    bool variable_constrained(const std::string& node, TypeVariable var) const;
    std::vector<const Edge*> incoming(const std::string& node) const;
    GraphEvents connect_unchecked(const std::string& from_node, const std::string& from_socket,
                                  const std::string& to_node, const std::string& to_socket);

    std::string name_;
    std::unordered_map<std::string, Node> nodes_;
    std::vector<Edge> edges_;
    std::vector<std::string> outputs_;
    // 同名节点的编号计数
    std::unordered_map<std::string, int> name_counters_;
};

} // namespace mf
