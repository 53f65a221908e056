// Matforge kernel: Kernel implementation
#include "kernel/kernel.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "gpu/cpu_compute_backend.hpp"

namespace mf {

Kernel::Kernel(const EngineConfig& config)
    : Kernel(std::make_unique<CpuComputeBackend>(config.memory_budget_mb << 20, config.thumbnail_size), config) {}

Kernel::Kernel(std::unique_ptr<ComputeBackend> backend, const EngineConfig& config)
    : config_(config),
      mode_(linearization_mode_from_name(config.linearization_mode)),
      backend_(std::move(backend)),
      manager_(*backend_, config.parent_size, config.stack_limit) {
    manager_.set_quiet(config_.quiet);
    manager_.sockets().set_timing_decay(config_.timing_decay);
}

template <typename Fn>
bool Kernel::guarded(const std::string& name, Fn&& fn) {
    try {
        fn();
        last_error_.erase(name);
        return true;
    } catch (const GraphError& ge) {
        last_error_[name] = {ge.code(), std::nullopt, ge.what()};
    } catch (const InterpretationError& ie) {
        last_error_[name] = {GraphErrc::Unknown, ie.code(), ie.what()};
    } catch (const YAML::Exception& e) {
        last_error_[name] = {GraphErrc::InvalidYaml, std::nullopt, e.what()};
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "std::exception while editing '" << name << "': " << e.what();
        last_error_[name] = {GraphErrc::Unknown, std::nullopt, ss.str()};
    }
    return false;
}

void Kernel::record_error(const std::string& name, GraphErrc code, const std::string& message) {
    last_error_[name] = {code, std::nullopt, message};
}

std::optional<Kernel::LastError> Kernel::last_error(const std::string& name) const {
    auto it = last_error_.find(name);
    if (it == last_error_.end()) return std::nullopt;
    return it->second;
}

NodeGraph& Kernel::graph_mut(const std::string& name) {
    auto it = graphs_.find(name);
    if (it == graphs_.end()) throw GraphError(GraphErrc::NotFound, "Graph '" + name + "' not found");
    return it->second;
}

LayerStack& Kernel::stack_mut(const std::string& name) {
    auto it = stacks_.find(name);
    if (it == stacks_.end()) throw GraphError(GraphErrc::NotFound, "Layer stack '" + name + "' not found");
    return it->second;
}

ComplexOperator Kernel::complex_operator_of(const std::string& graph) const {
    auto it = graphs_.find(graph);
    if (it == graphs_.end()) {
        throw GraphError(GraphErrc::NotFound, "Called graph '" + graph + "' not found");
    }
    const NodeGraph& g = it->second;
    std::map<std::string, ParamSubstitution> substitutions;
    auto ex = exposed_.find(graph);
    if (ex != exposed_.end()) {
        for (const auto& kv : ex->second) {
            substitutions[kv.first] = ParamSubstitution{g.node_resource(kv.second.node).node_parameter(kv.second.field),
                                                        YAML::Clone(kv.second.value)};
        }
    }
    return g.as_complex_operator(substitutions);
}

Operator Kernel::make_operator(const NodeDescription& desc) const {
    if (!desc.type.empty()) return atomic_operator_from_yaml(desc.type, desc.parameters);
    ComplexOperator op = complex_operator_of(desc.graph);
    if (desc.parameters && desc.parameters.IsMap()) {
        for (const auto& kv : desc.parameters) {
            mf::set_parameter(op, kv.first.as<std::string>(), kv.second);
        }
    }
    return op;
}

void Kernel::apply(const GraphEvents& events) {
    if (!events.empty()) manager_.process_events(events);
}

void Kernel::relinearize(const std::string& name) {
    std::optional<Program> program;
    if (auto it = graphs_.find(name); it != graphs_.end()) {
        program = it->second.linearize(mode_);
    } else if (auto st = stacks_.find(name); st != stacks_.end()) {
        program = st->second.linearize();
    } else {
        return;
    }

    if (program) {
        manager_.install_program(graph_resource(name), std::move(*program));
        return;
    }
    manager_.remove_program(graph_resource(name));
    if (!config_.quiet) {
        std::cerr << "Warning: graph '" << name << "' has no valid linearization (unconnected inputs)." << std::endl;
    }
}

void Kernel::commit(const std::string& name) {
    relinearize(name);
    std::set<std::string> visited{name};
    propagate(name, visited);
}

void Kernel::propagate(const std::string& callee, std::set<std::string>& visited) {
    if (!graphs_.count(callee)) return;
    const GraphResource res = graph_resource(callee);
    const ComplexOperator op = complex_operator_of(callee);

    for (auto& kv : graphs_) {
        GraphEvents events = kv.second.update_complex_operators(res, op);
        if (events.empty()) continue;
        apply(events);
        relinearize(kv.first);
        // 调用者的结果同样失效，继续向它的调用者传播
        if (visited.insert(kv.first).second) propagate(kv.first, visited);
    }
    for (auto& kv : stacks_) {
        GraphEvents events = kv.second.update_complex_operators(res, op);
        if (events.empty()) continue;
        apply(events);
        relinearize(kv.first);
    }
}

// --- 图与层栈 ---

bool Kernel::add_graph(const std::string& name) {
    return guarded(name, [&] {
        if (name.empty()) throw GraphError(GraphErrc::InvalidParameter, "Graph name must not be empty");
        if (has_graph(name)) throw GraphError(GraphErrc::Duplicate, "Graph '" + name + "' already exists");
        graphs_.emplace(name, NodeGraph(name));
        commit(name);
    });
}

bool Kernel::add_layer_stack(const std::string& name) {
    return guarded(name, [&] {
        if (name.empty()) throw GraphError(GraphErrc::InvalidParameter, "Layer stack name must not be empty");
        if (has_graph(name)) throw GraphError(GraphErrc::Duplicate, "Graph '" + name + "' already exists");
        auto it = stacks_.emplace(name, LayerStack(name)).first;
        apply(it->second.output_node_events(manager_.parent_size()));
        relinearize(name);
    });
}

bool Kernel::remove_graph(const std::string& name) {
    return guarded(name, [&] {
        const GraphResource res = graph_resource(name);
        for (const auto& kv : graphs_) {
            if (kv.first == name) continue;
            for (const auto& node : kv.second.nodes()) {
                const auto* complex = std::get_if<ComplexOperator>(&node.second.op);
                if (complex && complex->graph == res) {
                    throw GraphError(GraphErrc::InvalidParameter,
                                     "Graph '" + name + "' is still called by '" + kv.first + "'");
                }
            }
        }
        for (const auto& kv : stacks_) {
            if (kv.second.calls(res)) {
                throw GraphError(GraphErrc::InvalidParameter,
                                 "Graph '" + name + "' is still called by layer stack '" + kv.first + "'");
            }
        }

        GraphEvents events;
        if (auto it = graphs_.find(name); it != graphs_.end()) {
            for (const auto& node : it->second.nodes()) {
                events.push_back(graph_events::NodeRemoved{it->second.node_resource(node.first)});
            }
            graphs_.erase(it);
            exposed_.erase(name);
        } else {
            LayerStack& stack = stack_mut(name);
            events = stack.reset();
            for (auto channel : all_material_channels()) {
                events.push_back(graph_events::NodeRemoved{stack.output_resource(channel)});
            }
            stacks_.erase(name);
        }
        apply(events);
        manager_.remove_program(res);
    });
}

bool Kernel::rename_graph(const std::string& from, const std::string& to) {
    return guarded(from, [&] {
        if (to.empty()) throw GraphError(GraphErrc::InvalidParameter, "Graph name must not be empty");
        if (!has_graph(from)) throw GraphError(GraphErrc::NotFound, "Graph '" + from + "' not found");
        if (has_graph(to)) throw GraphError(GraphErrc::Duplicate, "Graph '" + to + "' already exists");

        manager_.rename_graph(graph_resource(from), graph_resource(to));
        if (graphs_.count(from)) {
            auto handle = graphs_.extract(from);
            handle.key() = to;
            handle.mapped().rename(to);
            graphs_.insert(std::move(handle));
            if (auto ex = exposed_.find(from); ex != exposed_.end()) {
                auto params = std::move(ex->second);
                exposed_.erase(ex);
                exposed_[to] = std::move(params);
            }

            // 调用者仍指向旧名称，替换为新定义
            const ComplexOperator op = complex_operator_of(to);
            for (auto& kv : graphs_) apply(kv.second.update_complex_operators(graph_resource(from), op));
            for (auto& kv : stacks_) apply(kv.second.update_complex_operators(graph_resource(from), op));
        } else {
            auto handle = stacks_.extract(from);
            handle.key() = to;
            handle.mapped().rename(to);
            stacks_.insert(std::move(handle));
        }
        commit(to);
    });
}

std::vector<std::string> Kernel::list_graphs() const {
    std::vector<std::string> names;
    for (const auto& kv : graphs_) names.push_back(kv.first);
    for (const auto& kv : stacks_) names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

bool Kernel::has_graph(const std::string& name) const {
    return graphs_.count(name) != 0 || stacks_.count(name) != 0;
}

const NodeGraph* Kernel::graph(const std::string& name) const {
    auto it = graphs_.find(name);
    return it == graphs_.end() ? nullptr : &it->second;
}

const LayerStack* Kernel::layer_stack(const std::string& name) const {
    auto it = stacks_.find(name);
    return it == stacks_.end() ? nullptr : &it->second;
}

// --- 文档 ---

void Kernel::build_document(const GraphDocument& doc) {
    // 公共接口失败时把记录下来的错误重新抛出
    auto check = [this](bool ok, const std::string& name) {
        if (ok) return;
        auto err = last_error(name);
        if (!err) throw GraphError(GraphErrc::Unknown, "Failed to build '" + name + "'");
        throw GraphError(err->code, err->message);
    };

    for (const auto& img : doc.images) {
        check(add_image(img.path.string(), img.color_space).has_value(), img.path.string());
    }

    for (const auto& g : doc.graphs) {
        check(add_graph(g.name), g.name);
        for (const auto& n : g.nodes) {
            std::optional<std::string> added;
            if (!n.type.empty()) {
                added = add_node(g.name, n.type, n.parameters, n.name);
            } else {
                added = add_complex_node(g.name, n.graph, n.name);
                if (added && n.parameters && n.parameters.IsMap()) {
                    for (const auto& kv : n.parameters) {
                        check(set_parameter(g.name, *added, kv.first.as<std::string>(), kv.second), g.name);
                    }
                }
            }
            check(added.has_value(), g.name);
            if (n.size != 0 || n.absolute_size) check(resize_node(g.name, *added, n.size, n.absolute_size), g.name);
        }
        for (const auto& c : g.connections) {
            check(connect(g.name, c.from_node, c.from_socket, c.to_node, c.to_socket), g.name);
        }
        for (const auto& p : g.exposed) {
            check(expose_parameter(g.name, p.name, p.node, p.field, p.value), g.name);
        }
    }

    for (const auto& s : doc.layer_stacks) {
        check(add_layer_stack(s.name), s.name);
        for (const auto& l : s.layers) {
            std::optional<std::string> layer = l.kind == LayerType::Fill
                                                   ? push_fill_layer(s.name, l.op, l.outputs)
                                                   : push_fx_layer(s.name, l.op, l.inputs, l.outputs);
            check(layer.has_value(), s.name);
            check(set_layer_opacity(s.name, *layer, l.opacity), s.name);
            check(set_layer_blend_mode(s.name, *layer, l.blend_mode), s.name);
            check(set_layer_enabled(s.name, *layer, l.enabled), s.name);
            for (const auto& m : l.masks) {
                auto mask = push_mask(s.name, *layer, m.op);
                check(mask.has_value(), s.name);
                LayerStack& stack = stack_mut(s.name);
                stack.set_mask_opacity(*layer, *mask, m.opacity);
                stack.set_mask_blend_mode(*layer, *mask, m.blend_mode);
                stack.set_mask_enabled(*layer, *mask, m.enabled);
            }
        }
        relinearize(s.name);
    }
}

bool Kernel::load_document(const std::string& yaml_path) {
    return guarded(yaml_path, [&] { build_document(io_service_.load(yaml_path)); });
}

bool Kernel::apply_document(const GraphDocument& doc) {
    return guarded("document", [&] { build_document(doc); });
}

// --- 节点编辑 ---

std::optional<std::string> Kernel::add_node(const std::string& graph, const std::string& type,
                                            const YAML::Node& parameters, const std::string& name) {
    std::optional<std::string> result;
    guarded(graph, [&] {
        NodeDescription desc;
        desc.type = type;
        desc.parameters = parameters;
        auto added = graph_mut(graph).add_node(make_operator(desc), manager_.parent_size(), name);
        apply(added.second);
        commit(graph);
        result = added.first;
    });
    return result;
}

std::optional<std::string> Kernel::add_complex_node(const std::string& graph, const std::string& callee,
                                                    const std::string& name) {
    std::optional<std::string> result;
    guarded(graph, [&] {
        NodeDescription desc;
        desc.graph = callee;
        auto added = graph_mut(graph).add_node(make_operator(desc), manager_.parent_size(), name);
        apply(added.second);
        commit(graph);
        result = added.first;
    });
    return result;
}

bool Kernel::remove_node(const std::string& graph, const std::string& node) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).remove_node(node));
        if (auto ex = exposed_.find(graph); ex != exposed_.end()) {
            for (auto it = ex->second.begin(); it != ex->second.end();) {
                if (it->second.node == node) it = ex->second.erase(it);
                else ++it;
            }
        }
        commit(graph);
    });
}

bool Kernel::rename_node(const std::string& graph, const std::string& from, const std::string& to) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).rename_node(from, to));
        if (auto ex = exposed_.find(graph); ex != exposed_.end()) {
            for (auto& kv : ex->second) {
                if (kv.second.node == from) kv.second.node = to;
            }
        }
        commit(graph);
    });
}

bool Kernel::resize_node(const std::string& graph, const std::string& node, int size, bool absolute) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).resize_node(node, size, absolute, manager_.parent_size()));
    });
}

bool Kernel::set_parameter(const std::string& graph, const std::string& node, const std::string& field,
                           const YAML::Node& value) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).set_parameter(node, field, value));
        commit(graph);
    });
}

bool Kernel::connect(const std::string& graph, const std::string& from_node, const std::string& from_socket,
                     const std::string& to_node, const std::string& to_socket) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).connect_sockets(from_node, from_socket, to_node, to_socket));
        commit(graph);
    });
}

bool Kernel::disconnect(const std::string& graph, const std::string& node, const std::string& socket) {
    return guarded(graph, [&] {
        apply(graph_mut(graph).disconnect_sink_socket(node, socket));
        commit(graph);
    });
}

bool Kernel::expose_parameter(const std::string& graph, const std::string& name, const std::string& node,
                              const std::string& field, const YAML::Node& default_value) {
    return guarded(graph, [&] {
        const NodeGraph& g = graph_mut(graph);
        const Node& target = g.node(node);
        const auto* atomic = std::get_if<AtomicOperator>(&target.op);
        if (!atomic) {
            throw GraphError(GraphErrc::InvalidParameter,
                             "Only parameters of atomic nodes can be exposed ('" + node + "')");
        }
        if (!default_value || default_value.IsNull()) {
            throw GraphError(GraphErrc::InvalidParameter, "Exposed parameter '" + name + "' needs a default value");
        }
        // 先在副本上试写一次，字段或取值无效时直接报错
        AtomicOperator candidate = *atomic;
        mf::set_parameter(candidate, field, default_value);

        auto& params = exposed_[graph];
        if (params.count(name)) {
            throw GraphError(GraphErrc::Duplicate, "Parameter '" + name + "' is already exposed");
        }
        params[name] = ExposedParameter{node, field, YAML::Clone(default_value)};
        commit(graph);
    });
}

// --- 层编辑 ---

std::optional<std::string> Kernel::push_fill_layer(const std::string& stack, const NodeDescription& op,
                                                   const std::map<MaterialChannel, std::string>& outputs) {
    std::optional<std::string> result;
    guarded(stack, [&] {
        auto pushed = stack_mut(stack).push_fill(make_operator(op), outputs, manager_.parent_size(), op.name);
        apply(pushed.second);
        relinearize(stack);
        result = pushed.first;
    });
    return result;
}

std::optional<std::string> Kernel::push_fx_layer(const std::string& stack, const NodeDescription& op,
                                                 const std::map<std::string, MaterialChannel>& inputs,
                                                 const std::map<MaterialChannel, std::string>& outputs) {
    std::optional<std::string> result;
    guarded(stack, [&] {
        auto pushed = stack_mut(stack).push_fx(make_operator(op), inputs, outputs, manager_.parent_size(), op.name);
        apply(pushed.second);
        relinearize(stack);
        result = pushed.first;
    });
    return result;
}

std::optional<std::string> Kernel::push_mask(const std::string& stack, const std::string& layer,
                                             const NodeDescription& op) {
    std::optional<std::string> result;
    guarded(stack, [&] {
        auto pushed = stack_mut(stack).push_mask(layer, make_operator(op), manager_.parent_size(), op.name);
        apply(pushed.second);
        relinearize(stack);
        result = pushed.first;
    });
    return result;
}

bool Kernel::remove_layer(const std::string& stack, const std::string& layer) {
    return guarded(stack, [&] {
        apply(stack_mut(stack).remove(layer));
        relinearize(stack);
    });
}

bool Kernel::move_layer_up(const std::string& stack, const std::string& layer) {
    return guarded(stack, [&] {
        if (!stack_mut(stack).move_up(layer)) {
            throw GraphError(GraphErrc::InvalidParameter, "Layer '" + layer + "' cannot be moved up");
        }
        relinearize(stack);
    });
}

bool Kernel::move_layer_down(const std::string& stack, const std::string& layer) {
    return guarded(stack, [&] {
        if (!stack_mut(stack).move_down(layer)) {
            throw GraphError(GraphErrc::InvalidParameter, "Layer '" + layer + "' cannot be moved down");
        }
        relinearize(stack);
    });
}

bool Kernel::set_layer_opacity(const std::string& stack, const std::string& layer, float opacity) {
    return guarded(stack, [&] {
        stack_mut(stack).set_opacity(layer, opacity);
        relinearize(stack);
    });
}

bool Kernel::set_layer_blend_mode(const std::string& stack, const std::string& layer, BlendMode mode) {
    return guarded(stack, [&] {
        stack_mut(stack).set_blend_mode(layer, mode);
        relinearize(stack);
    });
}

bool Kernel::set_layer_enabled(const std::string& stack, const std::string& layer, bool enabled) {
    return guarded(stack, [&] {
        stack_mut(stack).set_enabled(layer, enabled);
        relinearize(stack);
    });
}

bool Kernel::set_layer_output(const std::string& stack, const std::string& layer, MaterialChannel channel,
                              const std::string& socket) {
    return guarded(stack, [&] {
        stack_mut(stack).set_output(layer, channel, socket);
        relinearize(stack);
    });
}

bool Kernel::set_layer_input(const std::string& stack, const std::string& layer, const std::string& socket,
                             MaterialChannel channel) {
    return guarded(stack, [&] {
        apply(stack_mut(stack).set_input(layer, socket, channel));
        relinearize(stack);
    });
}

bool Kernel::set_layer_parameter(const std::string& stack, const std::string& layer, const std::string& field,
                                 const YAML::Node& value) {
    return guarded(stack, [&] {
        apply(stack_mut(stack).set_parameter(layer, field, value));
        relinearize(stack);
    });
}

// --- 计算 ---

std::optional<ImageResource> Kernel::add_image(const std::string& path, ColorSpace color_space) {
    std::optional<ImageResource> result;
    guarded(path, [&] {
        if (!fs::exists(path)) throw GraphError(GraphErrc::NotFound, "Image file '" + path + "' not found");
        result = manager_.add_image_resource(path, color_space);
    });
    return result;
}

bool Kernel::set_linearization_mode(LinearizationMode mode) {
    if (mode == mode_) return true;
    mode_ = mode;
    config_.linearization_mode = mode == LinearizationMode::Topological ? "topological" : "full";
    for (const auto& kv : graphs_) relinearize(kv.first);
    return true;
}

void Kernel::set_parent_size(std::uint32_t size) {
    const std::uint32_t clamped = clamp_image_size(size);
    if (clamped == manager_.parent_size()) return;
    config_.parent_size = clamped;
    for (auto& kv : graphs_) {
        GraphEvents events;
        for (const auto& node : kv.second.nodes()) {
            auto more = kv.second.resize_node(node.first, node.second.size, node.second.absolute_size, clamped);
            events.insert(events.end(), more.begin(), more.end());
        }
        apply(events);
    }
    for (const auto& kv : stacks_) apply(kv.second.resize_events(clamped));
    manager_.set_parent_size(clamped);
}

bool Kernel::set_export(const std::string& graph, const std::string& node, ExportSpec spec) {
    return guarded(graph, [&] {
        if (auto it = graphs_.find(graph); it != graphs_.end()) {
            const Node& n = it->second.node(node);
            const auto* atomic = std::get_if<AtomicOperator>(&n.op);
            if (!atomic || !is_output(*atomic)) {
                throw GraphError(GraphErrc::InvalidParameter, "Node '" + node + "' is not an output node");
            }
            manager_.set_export(it->second.node_resource(node), std::move(spec));
            return;
        }
        // 层栈按通道名导出
        const LayerStack& stack = stack_mut(graph);
        auto channel = channel_from_name(node);
        if (!channel) throw GraphError(GraphErrc::NotFound, "Unknown material channel '" + node + "'");
        manager_.set_export(stack.output_resource(*channel), std::move(spec));
    });
}

void Kernel::clear_exports() {
    manager_.clear_exports();
}

bool Kernel::set_view_socket(const std::string& graph, const std::string& node, const std::string& socket) {
    return guarded(graph, [&] {
        if (!has_graph(graph)) throw GraphError(GraphErrc::NotFound, "Graph '" + graph + "' not found");
        const SocketResource res = node_resource(graph, node).node_socket(socket);
        if (!manager_.sockets().is_known_output(res)) {
            throw GraphError(GraphErrc::NotFound, "Output socket '" + res.to_string() + "' not found");
        }
        manager_.set_view_socket(res);
    });
}

void Kernel::clear_view_socket() {
    manager_.set_view_socket(std::nullopt);
}

std::optional<ComputeManager::RunReport> Kernel::compute(const std::string& name) {
    if (!has_graph(name)) {
        record_error(name, GraphErrc::NotFound, "Graph '" + name + "' not found");
        return std::nullopt;
    }
    if (!manager_.programs().find(graph_resource(name))) {
        record_error(name, GraphErrc::Linearization,
                     "Graph '" + name + "' has no valid linearization (unconnected inputs)");
        return std::nullopt;
    }

    auto report = manager_.run(graph_resource(name));
    if (report.error) {
        last_error_[name] = {GraphErrc::Unknown, report.error->code(), report.error->what()};
    } else {
        last_error_.erase(name);
    }
    return report;
}

bool Kernel::wait_for_exports(std::chrono::milliseconds timeout) {
    return manager_.exporter().wait_idle(timeout);
}

const Program* Kernel::program(const std::string& name) const {
    auto handle = manager_.programs().find(graph_resource(name));
    if (!handle) return nullptr;
    return &manager_.programs().get(*handle);
}

} // namespace mf
