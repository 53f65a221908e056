#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "graph_events.hpp"
#include "mf_types.hpp"
#include "node_graph.hpp"
#include "operators.hpp"
#include "program.hpp"
#include "resource.hpp"

namespace mf {

enum class LayerType { Fill, Fx };

// 混合参数。输出总是被 clamp。
struct BlendOptions {
    float opacity = 1.0f;
    BlendMode blend_mode = BlendMode::Mix;
    bool enabled = true;

    Blend blend_operator() const { return Blend{blend_mode, opacity, 16.0f, true}; }
};

// 遮罩：单通道层，取算子的第一个输出
struct Mask {
    std::string name;
    Node node;
    std::string output_socket;
    BlendOptions blend;
};

/**
 * @brief 一个层上的遮罩序列。
 *
 * 两个及以上的遮罩依次用各自的 Blend 合成；有输入的遮罩以下方遮罩的结果为输入，
 * 因此不能放在最底部。
 */
class MaskStack {
public:
    bool empty() const { return stack_.empty(); }
    std::size_t size() const { return stack_.size(); }
    const std::vector<Mask>& masks() const { return stack_; }
    std::vector<Mask>& masks() { return stack_; }

    // @throws GraphError(InvalidParameter) 有输入的遮罩放在最底部
    void push(Mask mask);
    bool remove(const std::string& name);
    bool move_up(const std::string& name);
    bool move_down(const std::string& name);

    Mask* find(const std::string& name);
    const Mask* find(const std::string& name) const;

private:
    std::vector<Mask> stack_;
};

struct Layer {
    std::string name;
    std::string title;
    LayerType type = LayerType::Fill;
    Node node;
    // 材质通道 -> 层的输出 socket
    std::map<MaterialChannel, std::string> output_sockets;
    // FX 层的输入 socket -> 取其当前结果的通道
    std::map<std::string, MaterialChannel> input_sockets;
    std::set<MaterialChannel> channels;
    BlendOptions blend;
    MaskStack masks;

    bool has_masks() const { return !masks.empty(); }
    // masked 时使用 BlendMasked，遮罩代替 opacity 作为混合系数
    AtomicOperator blend_operator(bool masked) const;
};

/**
 * @brief 层栈：节点图之外的另一种编辑视图，按层的顺序合成每个材质通道。
 *
 * 每个通道维护一个"当前结果"socket。第一个写入该通道的层直接成为当前结果，
 * 之后的层通过合成出来的 Blend 节点与之混合。最后为每个有写入者的通道追加
 * 一个虚拟 Output 节点。
 *
 * 资源命名：
 * - 层：`<stack>/<layer>`
 * - 通道混合：`<stack>/<layer>.blend.<channel>`
 * - 遮罩：`<stack>/<layer>.mask.<mask>`，遮罩混合：`<stack>/<layer>.mask.<mask>.blend`
 * - 输出：`<stack>/output.<channel>`
 *
 * 与 NodeGraph 相同，每个编辑返回一批 GraphEvent。
 */
class LayerStack {
public:
    explicit LayerStack(std::string name);

    const std::string& name() const { return name_; }
    void rename(std::string name) { name_ = std::move(name); }
    GraphResource resource() const { return graph_resource(name_); }

    NodeResource layer_resource(const std::string& layer) const;
    NodeResource blend_resource(const std::string& layer, MaterialChannel channel) const;
    NodeResource mask_resource(const std::string& layer, const std::string& mask) const;
    NodeResource mask_blend_resource(const std::string& layer, const std::string& mask) const;
    NodeResource output_resource(MaterialChannel channel) const;

    // 所有通道的虚拟 Output 节点
    GraphEvents output_node_events(std::uint32_t parent_size) const;
    // 父尺寸变化后栈内所有节点的 NodeResized
    GraphEvents resize_events(std::uint32_t parent_size) const;
    // 是否有层或遮罩调用了 graph
    bool calls(const GraphResource& graph) const;

    /**
     * @brief 压入一个填充层。算子不能有输入，输出必须是具体类型。
     * @param outputs 通道 -> 输出 socket；映射到的通道自动启用
     * @throws GraphError InvalidParameter / TypeMismatch / NotFound
     */
    std::pair<std::string, GraphEvents> push_fill(Operator op, const std::map<MaterialChannel, std::string>& outputs,
                                                  std::uint32_t parent_size, const std::string& base_name = "");

    /**
     * @brief 压入一个 FX 层，其输入取自下方各通道的当前结果。
     *
     * 未在 inputs 中给出的输入 socket 默认读取 displacement 通道。多态 socket
     * 的类型变量由所读通道的图像类型确定。
     *
     * @throws GraphError(InvalidParameter) 栈为空时
     */
    std::pair<std::string, GraphEvents> push_fx(Operator op, const std::map<std::string, MaterialChannel>& inputs,
                                                const std::map<MaterialChannel, std::string>& outputs,
                                                std::uint32_t parent_size, const std::string& base_name = "");

    // 返回遮罩名（不含层前缀）
    std::pair<std::string, GraphEvents> push_mask(const std::string& layer, Operator op, std::uint32_t parent_size,
                                                  const std::string& base_name = "");

    GraphEvents remove(const std::string& layer);
    GraphEvents remove_mask(const std::string& layer, const std::string& mask);
    // 清空所有层（输出节点保留）
    GraphEvents reset();

    // 向栈顶 / 栈底移动一位，已在边界时返回 false
    bool move_up(const std::string& layer);
    bool move_down(const std::string& layer);
    bool move_mask_up(const std::string& layer, const std::string& mask);
    bool move_mask_down(const std::string& layer, const std::string& mask);

    void set_title(const std::string& layer, const std::string& title);
    // 把层的 socket 映射到通道并启用该通道
    void set_output(const std::string& layer, MaterialChannel channel, const std::string& socket);
    void set_output_channel(const std::string& layer, MaterialChannel channel, bool visible);
    GraphEvents set_input(const std::string& layer, const std::string& socket, MaterialChannel channel);
    void set_opacity(const std::string& layer, float opacity);
    void set_blend_mode(const std::string& layer, BlendMode mode);
    void set_enabled(const std::string& layer, bool enabled);
    GraphEvents set_parameter(const std::string& layer, const std::string& field, const YAML::Node& value);

    void set_mask_opacity(const std::string& layer, const std::string& mask, float opacity);
    void set_mask_blend_mode(const std::string& layer, const std::string& mask, BlendMode mode);
    void set_mask_enabled(const std::string& layer, const std::string& mask, bool enabled);
    GraphEvents set_mask_parameter(const std::string& layer, const std::string& mask, const std::string& field,
                                   const YAML::Node& value);

    GraphEvents update_complex_operators(const GraphResource& graph, const ComplexOperator& op);

    /**
     * @brief 把层栈编译成 Program。线性化模式对层栈无意义。
     * @return FX 层读取的通道下方没有任何写入者时返回 std::nullopt。
     */
    std::optional<Program> linearize() const;

    // 所有层写入的通道的并集
    std::set<MaterialChannel> output_channels() const;

    bool has_layer(const std::string& layer) const;
    const Layer& layer(const std::string& name) const;
    const std::vector<Layer>& layers() const { return layers_; }

private:
    Layer& layer_mut(const std::string& name);
    std::size_t index_of(const std::string& name) const;
    std::string next_free_name(const std::string& base) const;
    std::pair<std::string, GraphEvents> push_layer(Layer layer, const std::string& base_name, std::uint32_t parent_size);
    GraphEvents node_events(const NodeResource& res, const Node& node, std::uint32_t parent_size) const;
    GraphEvents mask_removed_events(const std::string& layer, const Mask& mask) const;

    std::string name_;
    std::vector<Layer> layers_;
};

} // namespace mf
