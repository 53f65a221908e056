#include "layer_stack.hpp"

#include <algorithm>

namespace mf {

namespace ev = graph_events;

namespace {

ImageType channel_image_type(MaterialChannel channel) {
    return output_image_type(channel_output_type(channel));
}

// 按 FX 层输入所读通道确定类型变量。返回发生变化的变量。
std::vector<TypeVariable> resolve_input_variables(Layer& layer) {
    std::map<TypeVariable, ImageType> resolved;
    const auto inputs = operator_inputs(layer.node.op);
    for (const auto& kv : layer.input_sockets) {
        auto it = inputs.find(kv.first);
        if (it == inputs.end() || !it->second.type.polymorphic) continue;
        const ImageType ty = channel_image_type(kv.second);
        auto [pos, inserted] = resolved.emplace(it->second.type.variable, ty);
        if (!inserted && pos->second != ty) {
            throw GraphError(GraphErrc::TypeMismatch,
                             "Inputs of layer '" + layer.name + "' sharing a type read channels of different types");
        }
    }

    std::vector<TypeVariable> changed;
    for (const auto& kv : resolved) {
        auto it = layer.node.type_variables.find(kv.first);
        if (it == layer.node.type_variables.end() || it->second != kv.second) changed.push_back(kv.first);
    }
    layer.node.type_variables = std::move(resolved);
    return changed;
}

std::optional<ImageType> socket_type_of(const Node& node, const std::string& socket) {
    const auto outputs = operator_outputs(node.op);
    auto it = outputs.find(socket);
    if (it == outputs.end()) return std::nullopt;
    return node.resolve(it->second.type);
}

void check_output_channel(const Node& node, const std::string& owner, MaterialChannel channel,
                          const std::string& socket) {
    const auto outputs = operator_outputs(node.op);
    auto it = outputs.find(socket);
    if (it == outputs.end()) {
        throw GraphError(GraphErrc::NotFound, "No output socket '" + socket + "' on layer '" + owner + "'");
    }
    auto ty = node.resolve(it->second.type);
    if (!ty || *ty != channel_image_type(channel)) {
        throw GraphError(GraphErrc::TypeMismatch,
                         "Socket '" + socket + "' of layer '" + owner + "' cannot write channel '" +
                             channel_short_name(channel) + "'");
    }
}

// 保留已设置的参数值，其余部分取新的定义
ComplexOperator merge_complex(const ComplexOperator& old, const ComplexOperator& updated) {
    ComplexOperator merged = updated;
    for (auto& kv : merged.parameters) {
        auto it = old.parameters.find(kv.first);
        if (it != old.parameters.end()) kv.second.value = YAML::Clone(it->second.value);
    }
    return merged;
}

struct Emitter {
    Program& program;
    std::size_t step = 0;

    void created(const NodeResource& res) { program.use_points[res].creation = step; }
    void used(const NodeResource& res) {
        auto it = program.use_points.find(res);
        if (it != program.use_points.end()) {
            it->second.last = step;
        } else {
            program.use_points.emplace(res, UsePoint{0, step});
        }
    }
    void push(Instruction instruction) { program.instructions.push_back(std::move(instruction)); }

    // 执行一个层或遮罩的算子。inputs 为 (socket, 上游输出)。
    void run_operator(const NodeResource& res, const Operator& op,
                      const std::vector<std::pair<std::string, SocketResource>>& inputs) {
        if (const auto* atomic = std::get_if<AtomicOperator>(&op)) {
            for (const auto& in : inputs) {
                used(in.second.socket_node());
                push(instr::Move{in.second, res.node_socket(in.first)});
            }
            push(instr::Execute{res, *atomic});
        } else {
            const auto& complex = std::get<ComplexOperator>(op);
            for (const auto& in : inputs) {
                auto it = complex.inputs.find(in.first);
                if (it == complex.inputs.end()) continue;
                used(in.second.socket_node());
                push(instr::Copy{in.second, it->second.second.node_socket("data")});
            }
            push(instr::Call{res, complex});
            for (const auto& kv : complex.outputs) {
                push(instr::Copy{kv.second.second.node_socket("data"), res.node_socket(kv.first)});
            }
        }
        const auto outputs = operator_outputs(op);
        if (!outputs.empty()) push(instr::Thumbnail{res.node_socket(outputs.begin()->first)});
        created(res);
    }

    // 将 foreground 与 background 混合到 blend 节点，返回其输出
    SocketResource blend(const NodeResource& blend_res, const SocketResource& background,
                         const SocketResource& foreground, const std::optional<SocketResource>& mask,
                         AtomicOperator op) {
        used(foreground.socket_node());
        used(background.socket_node());
        if (mask) used(mask->socket_node());
        push(instr::Move{background, blend_res.node_socket("background")});
        push(instr::Move{foreground, blend_res.node_socket("foreground")});
        if (mask) push(instr::Move{*mask, blend_res.node_socket("mask")});
        push(instr::Execute{blend_res, std::move(op)});
        created(blend_res);
        return blend_res.node_socket("color");
    }
};

} // namespace

void MaskStack::push(Mask mask) {
    if (stack_.empty() && !operator_inputs(mask.node.op).empty()) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Mask '" + mask.name + "' has inputs and cannot be the bottom mask");
    }
    stack_.push_back(std::move(mask));
}

bool MaskStack::remove(const std::string& name) {
    auto it = std::find_if(stack_.begin(), stack_.end(), [&](const Mask& m) { return m.name == name; });
    if (it == stack_.end()) return false;
    stack_.erase(it);
    return true;
}

bool MaskStack::move_up(const std::string& name) {
    for (std::size_t i = 0; i + 1 < stack_.size(); ++i) {
        if (stack_[i].name != name) continue;
        if (i == 0 && !operator_inputs(stack_[1].node.op).empty()) return false;
        std::swap(stack_[i], stack_[i + 1]);
        return true;
    }
    return false;
}

bool MaskStack::move_down(const std::string& name) {
    for (std::size_t i = 1; i < stack_.size(); ++i) {
        if (stack_[i].name != name) continue;
        if (i == 1 && !operator_inputs(stack_[1].node.op).empty()) return false;
        std::swap(stack_[i], stack_[i - 1]);
        return true;
    }
    return false;
}

Mask* MaskStack::find(const std::string& name) {
    for (auto& m : stack_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

const Mask* MaskStack::find(const std::string& name) const {
    for (const auto& m : stack_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

AtomicOperator Layer::blend_operator(bool masked) const {
    if (masked) return BlendMasked{blend.blend_mode, 16.0f, true};
    return blend.blend_operator();
}

LayerStack::LayerStack(std::string name) : name_(std::move(name)) {}

NodeResource LayerStack::layer_resource(const std::string& layer) const {
    return node_resource(name_, layer);
}

NodeResource LayerStack::blend_resource(const std::string& layer, MaterialChannel channel) const {
    return node_resource(name_, layer + ".blend." + channel_short_name(channel));
}

NodeResource LayerStack::mask_resource(const std::string& layer, const std::string& mask) const {
    return node_resource(name_, layer + ".mask." + mask);
}

NodeResource LayerStack::mask_blend_resource(const std::string& layer, const std::string& mask) const {
    return node_resource(name_, layer + ".mask." + mask + ".blend");
}

NodeResource LayerStack::output_resource(MaterialChannel channel) const {
    return node_resource(name_, std::string("output.") + channel_short_name(channel));
}

GraphEvents LayerStack::output_node_events(std::uint32_t parent_size) const {
    GraphEvents events;
    for (auto channel : all_material_channels()) {
        events.push_back(ev::NodeAdded{output_resource(channel), clamp_image_size(parent_size)});
    }
    return events;
}

GraphEvents LayerStack::resize_events(std::uint32_t parent_size) const {
    const std::uint32_t size = clamp_image_size(parent_size);
    GraphEvents events;
    for (const auto& layer : layers_) {
        events.push_back(ev::NodeResized{layer_resource(layer.name), layer.node.node_size(parent_size),
                                         !layer.node.absolute_size});
        for (auto channel : all_material_channels()) {
            events.push_back(ev::NodeResized{blend_resource(layer.name, channel), size, true});
        }
        for (const auto& mask : layer.masks.masks()) {
            events.push_back(ev::NodeResized{mask_resource(layer.name, mask.name), mask.node.node_size(parent_size),
                                             !mask.node.absolute_size});
            events.push_back(ev::NodeResized{mask_blend_resource(layer.name, mask.name), size, true});
        }
    }
    for (auto channel : all_material_channels()) {
        events.push_back(ev::NodeResized{output_resource(channel), size, true});
    }
    return events;
}

bool LayerStack::calls(const GraphResource& graph) const {
    auto calls_graph = [&](const Node& node) {
        const auto* complex = std::get_if<ComplexOperator>(&node.op);
        return complex && complex->graph == graph;
    };
    for (const auto& layer : layers_) {
        if (calls_graph(layer.node)) return true;
        for (const auto& mask : layer.masks.masks()) {
            if (calls_graph(mask.node)) return true;
        }
    }
    return false;
}

bool LayerStack::has_layer(const std::string& layer) const {
    return std::any_of(layers_.begin(), layers_.end(), [&](const Layer& l) { return l.name == layer; });
}

std::size_t LayerStack::index_of(const std::string& name) const {
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i].name == name) return i;
    }
    throw GraphError(GraphErrc::NotFound, "Layer '" + name + "' not found in stack '" + name_ + "'");
}

const Layer& LayerStack::layer(const std::string& name) const {
    return layers_[index_of(name)];
}

Layer& LayerStack::layer_mut(const std::string& name) {
    return layers_[index_of(name)];
}

std::string LayerStack::next_free_name(const std::string& base) const {
    for (int i = 1;; ++i) {
        std::string name = base + "." + std::to_string(i);
        if (!has_layer(name)) return name;
    }
}

GraphEvents LayerStack::node_events(const NodeResource& res, const Node& node, std::uint32_t parent_size) const {
    const std::uint32_t size = node.node_size(parent_size);
    const bool external = std::holds_alternative<AtomicOperator>(node.op) &&
                          has_external_data(std::get<AtomicOperator>(node.op));
    GraphEvents events;
    events.push_back(ev::NodeAdded{res, size});
    for (const auto& kv : operator_outputs(node.op)) {
        OperatorType ty = kv.second.type;
        if (auto resolved = node.resolve(ty)) ty = OperatorType::monomorphic(*resolved);
        events.push_back(ev::OutputSocketAdded{res.node_socket(kv.first), ty, external, size});
    }
    return events;
}

std::pair<std::string, GraphEvents> LayerStack::push_layer(Layer layer, const std::string& base_name,
                                                           std::uint32_t parent_size) {
    layer.name = next_free_name(base_name.empty() ? default_name(layer.node.op) : base_name);
    if (layer.title.empty()) layer.title = operator_title(layer.node.op);
    for (const auto& kv : layer.output_sockets) {
        check_output_channel(layer.node, layer.name, kv.first, kv.second);
        layer.channels.insert(kv.first);
    }

    GraphEvents events = node_events(layer_resource(layer.name), layer.node, parent_size);
    const std::uint32_t size = clamp_image_size(parent_size);
    for (auto channel : all_material_channels()) {
        auto blend = blend_resource(layer.name, channel);
        events.push_back(ev::NodeAdded{blend, size});
        events.push_back(ev::OutputSocketAdded{blend.node_socket("color"),
                                               OperatorType::monomorphic(channel_image_type(channel)), false, size});
    }

    std::string name = layer.name;
    layers_.push_back(std::move(layer));
    return {name, std::move(events)};
}

std::pair<std::string, GraphEvents> LayerStack::push_fill(Operator op,
                                                          const std::map<MaterialChannel, std::string>& outputs,
                                                          std::uint32_t parent_size, const std::string& base_name) {
    if (!operator_inputs(op).empty()) {
        throw GraphError(GraphErrc::InvalidParameter, "Fill layer operator '" + default_name(op) + "' has inputs");
    }
    for (const auto& kv : operator_outputs(op)) {
        if (kv.second.type.polymorphic) {
            throw GraphError(GraphErrc::InvalidParameter,
                             "Fill layer operator '" + default_name(op) + "' has a polymorphic output");
        }
    }
    Layer layer;
    layer.type = LayerType::Fill;
    layer.node = Node{std::move(op)};
    layer.output_sockets = outputs;
    return push_layer(std::move(layer), base_name, parent_size);
}

std::pair<std::string, GraphEvents> LayerStack::push_fx(Operator op,
                                                        const std::map<std::string, MaterialChannel>& inputs,
                                                        const std::map<MaterialChannel, std::string>& outputs,
                                                        std::uint32_t parent_size, const std::string& base_name) {
    if (layers_.empty()) {
        throw GraphError(GraphErrc::InvalidParameter, "FX layer requires a layer underneath");
    }
    Layer layer;
    layer.type = LayerType::Fx;
    layer.node = Node{std::move(op)};
    for (const auto& kv : operator_inputs(layer.node.op)) {
        auto it = inputs.find(kv.first);
        layer.input_sockets[kv.first] = it != inputs.end() ? it->second : MaterialChannel::Displacement;
    }
    for (const auto& kv : inputs) {
        if (!layer.input_sockets.count(kv.first)) {
            throw GraphError(GraphErrc::NotFound, "No input socket '" + kv.first + "' on FX operator");
        }
    }
    layer.name = base_name;
    resolve_input_variables(layer);
    layer.output_sockets = outputs;
    return push_layer(std::move(layer), base_name, parent_size);
}

std::pair<std::string, GraphEvents> LayerStack::push_mask(const std::string& layer_name, Operator op,
                                                          std::uint32_t parent_size, const std::string& base_name) {
    Layer& layer = layer_mut(layer_name);
    const auto inputs = operator_inputs(op);
    const auto outputs = operator_outputs(op);
    if (inputs.size() > 1 || outputs.empty()) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Mask operator '" + default_name(op) + "' needs at most one input and an output");
    }

    Mask mask;
    mask.node = Node{std::move(op)};
    mask.output_socket = outputs.begin()->first;
    if (!inputs.empty()) {
        // 输入是下方遮罩的灰度结果
        const auto& decl = inputs.begin()->second.type;
        if (decl.polymorphic) mask.node.type_variables[decl.variable] = ImageType::Grayscale;
    }
    auto out_ty = mask.node.resolve(outputs.begin()->second.type);
    if (!out_ty || *out_ty != ImageType::Grayscale) {
        throw GraphError(GraphErrc::TypeMismatch, "Mask operator '" + default_name(mask.node.op) +
                                                      "' must produce a grayscale image");
    }

    const std::string base = base_name.empty() ? default_name(mask.node.op) : base_name;
    for (int i = 1;; ++i) {
        mask.name = base + "." + std::to_string(i);
        if (!layer.masks.find(mask.name)) break;
    }
    layer.masks.push(mask);

    GraphEvents events = node_events(mask_resource(layer_name, mask.name), mask.node, parent_size);
    auto blend = mask_blend_resource(layer_name, mask.name);
    const std::uint32_t size = clamp_image_size(parent_size);
    events.push_back(ev::NodeAdded{blend, size});
    events.push_back(ev::OutputSocketAdded{blend.node_socket("color"),
                                           OperatorType::monomorphic(ImageType::Grayscale), false, size});
    return {mask.name, std::move(events)};
}

GraphEvents LayerStack::mask_removed_events(const std::string& layer, const Mask& mask) const {
    return {ev::NodeRemoved{mask_resource(layer, mask.name)}, ev::NodeRemoved{mask_blend_resource(layer, mask.name)}};
}

GraphEvents LayerStack::remove(const std::string& layer_name) {
    const std::size_t index = index_of(layer_name);
    const Layer& layer = layers_[index];
    GraphEvents events;
    events.push_back(ev::NodeRemoved{layer_resource(layer.name)});
    for (auto channel : all_material_channels()) {
        events.push_back(ev::NodeRemoved{blend_resource(layer.name, channel)});
    }
    for (const auto& mask : layer.masks.masks()) {
        auto more = mask_removed_events(layer.name, mask);
        events.insert(events.end(), more.begin(), more.end());
    }
    layers_.erase(layers_.begin() + static_cast<std::ptrdiff_t>(index));
    return events;
}

GraphEvents LayerStack::remove_mask(const std::string& layer_name, const std::string& mask_name) {
    Layer& layer = layer_mut(layer_name);
    const Mask* mask = layer.masks.find(mask_name);
    if (!mask) {
        throw GraphError(GraphErrc::NotFound, "Mask '" + mask_name + "' not found on layer '" + layer_name + "'");
    }
    GraphEvents events = mask_removed_events(layer_name, *mask);
    layer.masks.remove(mask_name);
    return events;
}

GraphEvents LayerStack::reset() {
    GraphEvents events;
    while (!layers_.empty()) {
        auto more = remove(layers_.back().name);
        events.insert(events.end(), more.begin(), more.end());
    }
    return events;
}

bool LayerStack::move_up(const std::string& layer) {
    const std::size_t i = index_of(layer);
    if (i + 1 >= layers_.size()) return false;
    // FX 层不能成为最底层
    if (i == 0 && layers_[1].type == LayerType::Fx) return false;
    std::swap(layers_[i], layers_[i + 1]);
    return true;
}

bool LayerStack::move_down(const std::string& layer) {
    const std::size_t i = index_of(layer);
    if (i == 0) return false;
    if (i == 1 && layers_[1].type == LayerType::Fx) return false;
    std::swap(layers_[i], layers_[i - 1]);
    return true;
}

bool LayerStack::move_mask_up(const std::string& layer, const std::string& mask) {
    return layer_mut(layer).masks.move_up(mask);
}

bool LayerStack::move_mask_down(const std::string& layer, const std::string& mask) {
    return layer_mut(layer).masks.move_down(mask);
}

void LayerStack::set_title(const std::string& layer, const std::string& title) {
    layer_mut(layer).title = title;
}

void LayerStack::set_output(const std::string& layer_name, MaterialChannel channel, const std::string& socket) {
    Layer& layer = layer_mut(layer_name);
    check_output_channel(layer.node, layer_name, channel, socket);
    layer.output_sockets[channel] = socket;
    layer.channels.insert(channel);
}

void LayerStack::set_output_channel(const std::string& layer_name, MaterialChannel channel, bool visible) {
    Layer& layer = layer_mut(layer_name);
    if (visible) layer.channels.insert(channel);
    else layer.channels.erase(channel);
}

GraphEvents LayerStack::set_input(const std::string& layer_name, const std::string& socket, MaterialChannel channel) {
    Layer& layer = layer_mut(layer_name);
    if (layer.type != LayerType::Fx || !layer.input_sockets.count(socket)) {
        throw GraphError(GraphErrc::NotFound, "No input socket '" + socket + "' on layer '" + layer_name + "'");
    }

    Layer updated = layer;
    updated.input_sockets[socket] = channel;
    const auto changed = resolve_input_variables(updated);
    // 类型变化后不再匹配的通道映射被丢弃
    for (auto it = updated.output_sockets.begin(); it != updated.output_sockets.end();) {
        auto ty = socket_type_of(updated.node, it->second);
        if (!ty || *ty != channel_image_type(it->first)) {
            updated.channels.erase(it->first);
            it = updated.output_sockets.erase(it);
        } else {
            ++it;
        }
    }

    GraphEvents events;
    const auto res = layer_resource(layer_name);
    for (const auto& kv : operator_outputs(updated.node.op)) {
        const auto& decl = kv.second.type;
        if (!decl.polymorphic) continue;
        if (std::find(changed.begin(), changed.end(), decl.variable) == changed.end()) continue;
        events.push_back(ev::SocketMonomorphized{res.node_socket(kv.first), *updated.node.resolve(decl)});
    }
    layer = std::move(updated);
    return events;
}

void LayerStack::set_opacity(const std::string& layer, float opacity) {
    layer_mut(layer).blend.opacity = opacity;
}

void LayerStack::set_blend_mode(const std::string& layer, BlendMode mode) {
    layer_mut(layer).blend.blend_mode = mode;
}

void LayerStack::set_enabled(const std::string& layer, bool enabled) {
    layer_mut(layer).blend.enabled = enabled;
}

GraphEvents LayerStack::set_parameter(const std::string& layer, const std::string& field, const YAML::Node& value) {
    Layer& l = layer_mut(layer);
    Operator updated = l.node.op;
    mf::set_parameter(updated, field, value);
    l.node.op = std::move(updated);
    return {};
}

namespace {
Mask& mask_in(Layer& layer, const std::string& mask) {
    Mask* m = layer.masks.find(mask);
    if (!m) throw GraphError(GraphErrc::NotFound, "Mask '" + mask + "' not found on layer '" + layer.name + "'");
    return *m;
}
} // namespace

void LayerStack::set_mask_opacity(const std::string& layer, const std::string& mask, float opacity) {
    mask_in(layer_mut(layer), mask).blend.opacity = opacity;
}

void LayerStack::set_mask_blend_mode(const std::string& layer, const std::string& mask, BlendMode mode) {
    mask_in(layer_mut(layer), mask).blend.blend_mode = mode;
}

void LayerStack::set_mask_enabled(const std::string& layer, const std::string& mask, bool enabled) {
    mask_in(layer_mut(layer), mask).blend.enabled = enabled;
}

GraphEvents LayerStack::set_mask_parameter(const std::string& layer, const std::string& mask,
                                           const std::string& field, const YAML::Node& value) {
    Mask& m = mask_in(layer_mut(layer), mask);
    Operator updated = m.node.op;
    mf::set_parameter(updated, field, value);
    m.node.op = std::move(updated);
    return {};
}

GraphEvents LayerStack::update_complex_operators(const GraphResource& graph, const ComplexOperator& op) {
    GraphEvents events;
    auto update = [&](const NodeResource& res, Node& node) -> bool {
        auto* complex = std::get_if<ComplexOperator>(&node.op);
        if (!complex || complex->graph != graph) return false;
        const auto old_outputs = operator_outputs(*complex);
        ComplexOperator merged = merge_complex(*complex, op);
        node.op = merged;
        for (const auto& kv : operator_outputs(merged)) {
            if (!old_outputs.count(kv.first)) {
                events.push_back(ev::OutputSocketAdded{res.node_socket(kv.first), kv.second.type, false, 0});
            }
        }
        events.push_back(ev::ComplexOperatorUpdated{res, merged});
        return true;
    };

    for (auto& layer : layers_) {
        if (update(layer_resource(layer.name), layer.node)) {
            const auto inputs = operator_inputs(layer.node.op);
            const auto outputs = operator_outputs(layer.node.op);
            for (auto it = layer.input_sockets.begin(); it != layer.input_sockets.end();) {
                it = inputs.count(it->first) ? std::next(it) : layer.input_sockets.erase(it);
            }
            if (layer.type == LayerType::Fx) {
                for (const auto& kv : inputs) layer.input_sockets.emplace(kv.first, MaterialChannel::Displacement);
            }
            for (auto it = layer.output_sockets.begin(); it != layer.output_sockets.end();) {
                if (outputs.count(it->second)) {
                    ++it;
                } else {
                    layer.channels.erase(it->first);
                    it = layer.output_sockets.erase(it);
                }
            }
        }
        for (auto& mask : layer.masks.masks()) update(mask_resource(layer.name, mask.name), mask.node);
    }
    return events;
}

std::set<MaterialChannel> LayerStack::output_channels() const {
    std::set<MaterialChannel> channels;
    for (const auto& layer : layers_) channels.insert(layer.channels.begin(), layer.channels.end());
    return channels;
}

std::optional<Program> LayerStack::linearize() const {
    Program program;
    Emitter emit{program};
    std::map<MaterialChannel, SocketResource> front;

    for (const auto& layer : layers_) {
        if (!layer.blend.enabled || layer.channels.empty()) continue;
        ++emit.step;

        const auto res = layer_resource(layer.name);
        std::vector<std::pair<std::string, SocketResource>> inputs;
        for (const auto& kv : layer.input_sockets) {
            auto it = front.find(kv.second);
            if (it == front.end()) return std::nullopt;
            inputs.emplace_back(kv.first, it->second);
        }
        emit.run_operator(res, layer.node.op, inputs);

        // 遮罩：依次执行并合成，最上面的结果作为通道混合的 mask
        std::optional<SocketResource> mask_socket;
        for (const auto& mask : layer.masks.masks()) {
            if (!mask.blend.enabled) continue;
            ++emit.step;
            const auto mask_res = mask_resource(layer.name, mask.name);
            std::vector<std::pair<std::string, SocketResource>> mask_inputs;
            for (const auto& kv : operator_inputs(mask.node.op)) {
                if (!mask_socket) return std::nullopt;
                mask_inputs.emplace_back(kv.first, *mask_socket);
            }
            emit.run_operator(mask_res, mask.node.op, mask_inputs);

            const auto output = mask_res.node_socket(mask.output_socket);
            if (mask_socket) {
                ++emit.step;
                mask_socket = emit.blend(mask_blend_resource(layer.name, mask.name), *mask_socket, output,
                                         std::nullopt, mask.blend.blend_operator());
            } else {
                mask_socket = output;
            }
        }

        for (const auto& kv : layer.output_sockets) {
            const MaterialChannel channel = kv.first;
            if (!layer.channels.count(channel)) continue;
            const auto socket = res.node_socket(kv.second);

            auto it = front.find(channel);
            if (it == front.end()) {
                front.emplace(channel, socket);
                continue;
            }
            ++emit.step;
            it->second = emit.blend(blend_resource(layer.name, channel), it->second, socket, mask_socket,
                                    layer.blend_operator(mask_socket.has_value()));
        }
    }

    for (auto channel : all_material_channels()) {
        ++emit.step;
        auto it = front.find(channel);
        if (it == front.end()) continue;
        const auto output = output_resource(channel);
        emit.used(it->second.socket_node());
        emit.push(instr::Move{it->second, output.node_socket("data")});
        emit.push(instr::Execute{output, Output{channel_output_type(channel)}});
    }
    return program;
}

} // namespace mf
