#include "node_graph.hpp"

#include <algorithm>
#include <unordered_set>

namespace mf {

namespace ev = graph_events;

std::uint32_t Node::node_size(std::uint32_t parent) const {
    std::int64_t s;
    if (absolute_size) {
        s = std::int64_t(2) << std::max(size, 0);
    } else if (size >= 0) {
        s = std::int64_t(parent) << size;
    } else {
        s = std::int64_t(parent) >> -size;
    }
    return clamp_image_size(s);
}

std::optional<ImageType> Node::resolve(const OperatorType& ty) const {
    if (!ty.polymorphic) return ty.image;
    auto it = type_variables.find(ty.variable);
    if (it == type_variables.end()) return std::nullopt;
    return it->second;
}

NodeGraph::NodeGraph(std::string name) : name_(std::move(name)) {}

const Node& NodeGraph::node(const std::string& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        throw GraphError(GraphErrc::NotFound, "Node '" + name + "' not found in graph '" + name_ + "'");
    }
    return it->second;
}

Node& NodeGraph::node_mut(const std::string& name) {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        throw GraphError(GraphErrc::NotFound, "Node '" + name + "' not found in graph '" + name_ + "'");
    }
    return it->second;
}

std::pair<std::string, GraphEvents> NodeGraph::add_node(Operator op, std::uint32_t parent_size,
                                                        const std::string& name) {
    std::string node_name = name;
    if (node_name.empty()) {
        const std::string base = default_name(op);
        do {
            node_name = base + "." + std::to_string(++name_counters_[base]);
        } while (nodes_.count(node_name));
    } else if (nodes_.count(node_name)) {
        throw GraphError(GraphErrc::Duplicate, "Node '" + node_name + "' already exists in graph '" + name_ + "'");
    }

    Node node{std::move(op)};
    const std::uint32_t size = node.node_size(parent_size);
    const bool external = std::holds_alternative<AtomicOperator>(node.op) &&
                          has_external_data(std::get<AtomicOperator>(node.op));

    GraphEvents events;
    auto res = node_resource(node_name);
    events.push_back(ev::NodeAdded{res, size});
    for (const auto& kv : operator_outputs(node.op)) {
        events.push_back(ev::OutputSocketAdded{res.node_socket(kv.first), kv.second.type, external, size});
    }

    if (const auto* atomic = std::get_if<AtomicOperator>(&node.op); atomic && is_output(*atomic)) {
        outputs_.push_back(node_name);
    }
    nodes_.emplace(node_name, std::move(node));
    return {node_name, std::move(events)};
}

GraphEvents NodeGraph::remove_node(const std::string& name) {
    node(name);
    GraphEvents events;
    // 倒序删除，避免索引失效
    for (std::size_t i = edges_.size(); i-- > 0;) {
        if (i >= edges_.size()) continue;
        if (edges_[i].sink_node == name || edges_[i].source_node == name) {
            auto more = disconnect_edge(i);
            events.insert(events.end(), more.begin(), more.end());
        }
    }
    nodes_.erase(name);
    outputs_.erase(std::remove(outputs_.begin(), outputs_.end(), name), outputs_.end());
    events.push_back(ev::NodeRemoved{node_resource(name)});
    return events;
}

GraphEvents NodeGraph::rename_node(const std::string& from, const std::string& to) {
    node(from);
    if (from == to) return {};
    if (nodes_.count(to)) {
        throw GraphError(GraphErrc::Duplicate, "Node '" + to + "' already exists in graph '" + name_ + "'");
    }
    auto handle = nodes_.extract(from);
    handle.key() = to;
    nodes_.insert(std::move(handle));
    for (auto& e : edges_) {
        if (e.source_node == from) e.source_node = to;
        if (e.sink_node == from) e.sink_node = to;
    }
    std::replace(outputs_.begin(), outputs_.end(), from, to);
    return {ev::NodeRenamed{node_resource(from), node_resource(to)}};
}

GraphEvents NodeGraph::resize_node(const std::string& name, int size, bool absolute,
                                   std::uint32_t parent_size) {
    Node& n = node_mut(name);
    n.size = size;
    n.absolute_size = absolute;
    return {ev::NodeResized{node_resource(name), n.node_size(parent_size), !absolute}};
}

GraphEvents NodeGraph::set_parameter(const std::string& node, const std::string& field,
                                     const YAML::Node& value) {
    Node& n = node_mut(node);
    // 先在副本上修改，失败时节点保持不变
    Operator updated = n.op;
    mf::set_parameter(updated, field, value);
    n.op = std::move(updated);
    return {};
}

std::optional<ImageType> NodeGraph::socket_type(const std::string& node_name,
                                                const std::string& socket) const {
    const Node& n = node(node_name);
    auto outs = operator_outputs(n.op);
    auto it = outs.find(socket);
    if (it != outs.end()) return n.resolve(it->second.type);
    auto ins = operator_inputs(n.op);
    auto jt = ins.find(socket);
    if (jt != ins.end()) return n.resolve(jt->second.type);
    throw GraphError(GraphErrc::NotFound, "Socket '" + socket + "' not found on node '" + node_name + "'");
}

std::vector<const Edge*> NodeGraph::incoming(const std::string& node_name) const {
    std::vector<const Edge*> out;
    for (const auto& e : edges_) {
        if (e.sink_node == node_name) out.push_back(&e);
    }
    std::sort(out.begin(), out.end(),
              [](const Edge* a, const Edge* b) { return a->sink_socket < b->sink_socket; });
    return out;
}

bool NodeGraph::all_node_inputs_connected(const std::string& node_name) const {
    const auto in = incoming(node_name);
    for (const auto& kv : operator_inputs(node(node_name).op)) {
        if (kv.second.optional) continue;
        bool connected = std::any_of(in.begin(), in.end(),
                                     [&](const Edge* e) { return e->sink_socket == kv.first; });
        if (!connected) return false;
    }
    return true;
}

GraphEvents NodeGraph::connect_sockets(const std::string& from_node, const std::string& from_socket,
                                       const std::string& to_node, const std::string& to_socket) {
    // 在副本上完成整个操作，失败时原图不受影响
    NodeGraph scratch(*this);
    GraphEvents events = scratch.connect_unchecked(from_node, from_socket, to_node, to_socket);
    *this = std::move(scratch);
    return events;
}

GraphEvents NodeGraph::connect_unchecked(const std::string& from_node, const std::string& from_socket,
                                         const std::string& to_node, const std::string& to_socket) {
    if (from_node == to_node) {
        throw GraphError(GraphErrc::SelfConnection, "Cannot connect node '" + from_node + "' to itself");
    }
    const Node& src = node(from_node);
    const Node& dst = node(to_node);

    const auto src_outputs = operator_outputs(src.op);
    auto src_it = src_outputs.find(from_socket);
    if (src_it == src_outputs.end()) {
        if (operator_inputs(src.op).count(from_socket)) {
            throw GraphError(GraphErrc::SinkToSink,
                             "Cannot connect sink '" + from_node + ":" + from_socket + "' to another sink");
        }
        throw GraphError(GraphErrc::NotFound, "No output socket '" + from_socket + "' on '" + from_node + "'");
    }
    const auto dst_inputs = operator_inputs(dst.op);
    auto dst_it = dst_inputs.find(to_socket);
    if (dst_it == dst_inputs.end()) {
        throw GraphError(GraphErrc::NotFound, "No input socket '" + to_socket + "' on '" + to_node + "'");
    }

    // 目标若已是源的上游则会成环
    std::vector<std::string> frontier{to_node};
    std::unordered_set<std::string> seen;
    while (!frontier.empty()) {
        std::string current = frontier.back();
        frontier.pop_back();
        if (current == from_node) {
            throw GraphError(GraphErrc::Cycle,
                             "Connecting '" + from_node + "' to '" + to_node + "' would create a cycle");
        }
        if (!seen.insert(current).second) continue;
        for (const auto& e : edges_) {
            if (e.source_node == current) frontier.push_back(e.sink_node);
        }
    }

    const OperatorType src_decl = src_it->second.type;
    const OperatorType dst_decl = dst_it->second.type;

    GraphEvents events;
    for (std::size_t i = 0; i < edges_.size(); ++i) {
        if (edges_[i].sink_node == to_node && edges_[i].sink_socket == to_socket) {
            events = disconnect_edge(i);
            break;
        }
    }

    auto src_ty = node(from_node).resolve(src_decl);
    auto dst_ty = node(to_node).resolve(dst_decl);
    if (src_ty && dst_ty) {
        if (*src_ty != *dst_ty) {
            throw GraphError(GraphErrc::TypeMismatch,
                             "Type mismatch connecting " + from_node + ":" + from_socket + " (" +
                                 image_type_name(*src_ty) + ") to " + to_node + ":" + to_socket + " (" +
                                 image_type_name(*dst_ty) + ")");
        }
    } else if (src_ty) {
        auto more = set_type_variable(to_node, dst_decl.variable, *src_ty);
        events.insert(events.end(), more.begin(), more.end());
    } else if (dst_ty) {
        auto more = set_type_variable(from_node, src_decl.variable, *dst_ty);
        events.insert(events.end(), more.begin(), more.end());
    } else {
        throw GraphError(GraphErrc::PolymorphicConnection,
                         "Cannot connect two unresolved polymorphic sockets " + from_node + ":" +
                             from_socket + " and " + to_node + ":" + to_socket);
    }

    edges_.push_back(Edge{from_node, from_socket, to_node, to_socket});
    events.push_back(ev::ConnectedSockets{node_resource(from_node).node_socket(from_socket),
                                          node_resource(to_node).node_socket(to_socket)});
    return events;
}

GraphEvents NodeGraph::disconnect_sink_socket(const std::string& node_name, const std::string& socket) {
    node(node_name);
    for (std::size_t i = 0; i < edges_.size(); ++i) {
        if (edges_[i].sink_node == node_name && edges_[i].sink_socket == socket) {
            return disconnect_edge(i);
        }
    }
    return {};
}

GraphEvents NodeGraph::disconnect_edge(std::size_t index) {
    const Edge edge = edges_[index];
    edges_.erase(edges_.begin() + static_cast<std::ptrdiff_t>(index));

    GraphEvents events;
    events.push_back(ev::DisconnectedSockets{node_resource(edge.source_node).node_socket(edge.source_socket),
                                             node_resource(edge.sink_node).node_socket(edge.sink_socket)});

    auto release = [&](const std::string& node_name, const SocketMap& sockets, const std::string& socket) {
        auto it = sockets.find(socket);
        if (it == sockets.end() || !it->second.type.polymorphic) return;
        const TypeVariable var = it->second.type.variable;
        if (!node(node_name).type_variables.count(var)) return;
        if (variable_constrained(node_name, var)) return;
        auto more = set_type_variable(node_name, var, std::nullopt);
        events.insert(events.end(), more.begin(), more.end());
    };
    release(edge.sink_node, operator_inputs(node(edge.sink_node).op), edge.sink_socket);
    release(edge.source_node, operator_outputs(node(edge.source_node).op), edge.source_socket);
    return events;
}

bool NodeGraph::variable_constrained(const std::string& node_name, TypeVariable var) const {
    const Node& n = node(node_name);
    const auto ins = operator_inputs(n.op);
    const auto outs = operator_outputs(n.op);
    auto shares = [var](const SocketMap& sockets, const std::string& socket) {
        auto it = sockets.find(socket);
        return it != sockets.end() && it->second.type.polymorphic && it->second.type.variable == var;
    };
    for (const auto& e : edges_) {
        if (e.sink_node == node_name && shares(ins, e.sink_socket)) return true;
        if (e.source_node == node_name && shares(outs, e.source_socket)) return true;
    }
    return false;
}

GraphEvents NodeGraph::set_type_variable(const std::string& node_name, TypeVariable var,
                                         std::optional<ImageType> ty) {
    Node& n = node_mut(node_name);
    if (ty) {
        n.type_variables[var] = *ty;
    } else {
        n.type_variables.erase(var);
    }

    GraphEvents events;
    auto res = node_resource(node_name);
    auto notify = [&](const SocketMap& sockets) {
        for (const auto& kv : sockets) {
            if (!kv.second.type.polymorphic || kv.second.type.variable != var) continue;
            if (ty) {
                events.push_back(ev::SocketMonomorphized{res.node_socket(kv.first), *ty});
            } else {
                events.push_back(ev::SocketDemonomorphized{res.node_socket(kv.first)});
            }
        }
    };
    notify(operator_outputs(n.op));
    notify(operator_inputs(n.op));
    return events;
}

GraphEvents NodeGraph::update_complex_operators(const GraphResource& graph, const ComplexOperator& op) {
    GraphEvents events;
    std::vector<std::string> callers;
    for (const auto& kv : nodes_) {
        const auto* complex = std::get_if<ComplexOperator>(&kv.second.op);
        if (complex && complex->graph == graph) callers.push_back(kv.first);
    }
    std::sort(callers.begin(), callers.end());

    for (const auto& name : callers) {
        Node& n = nodes_.at(name);
        const auto& old = std::get<ComplexOperator>(n.op);
        ComplexOperator updated = op;
        for (auto& kv : updated.parameters) {
            auto it = old.parameters.find(kv.first);
            if (it != old.parameters.end()) kv.second.value = YAML::Clone(it->second.value);
        }
        const auto old_outputs = operator_outputs(old);
        n.op = updated;

        // 丢弃指向已不存在 socket 的连接
        const auto new_inputs = operator_inputs(updated);
        const auto new_outputs = operator_outputs(updated);
        for (std::size_t i = edges_.size(); i-- > 0;) {
            if (i >= edges_.size()) continue;
            const Edge& e = edges_[i];
            bool stale = (e.sink_node == name && !new_inputs.count(e.sink_socket)) ||
                         (e.source_node == name && !new_outputs.count(e.source_socket));
            if (stale) {
                auto more = disconnect_edge(i);
                events.insert(events.end(), more.begin(), more.end());
            }
        }

        auto res = node_resource(name);
        for (const auto& kv : new_outputs) {
            if (!old_outputs.count(kv.first)) {
                events.push_back(ev::OutputSocketAdded{res.node_socket(kv.first), kv.second.type, false, 0});
            }
        }
        events.push_back(ev::ComplexOperatorUpdated{res, updated});
    }
    return events;
}

ComplexOperator NodeGraph::as_complex_operator(const std::map<std::string, ParamSubstitution>& exposed) const {
    ComplexOperator op;
    op.graph = resource();
    op.title = name_;
    op.parameters = exposed;
    for (const auto& kv : nodes_) {
        const auto* atomic = std::get_if<AtomicOperator>(&kv.second.op);
        if (!atomic) continue;
        if (const auto* input = std::get_if<Input>(atomic)) {
            op.inputs[kv.first] = {OperatorType::monomorphic(input->type), node_resource(kv.first)};
        } else if (const auto* output = std::get_if<Output>(atomic)) {
            op.outputs[kv.first] = {OperatorType::monomorphic(output_image_type(output->output_type)),
                                    node_resource(kv.first)};
        }
    }
    return op;
}

std::optional<Program> NodeGraph::linearize(LinearizationMode mode) const {
    struct Label {
        std::string source_socket;
        std::string sink_node;
        std::string sink_socket;
    };
    enum class Action { Traverse, Visit, Use };
    struct Item {
        std::string node;
        Action action;
        std::optional<Label> label;
    };

    std::vector<Item> stack;
    for (auto it = outputs_.rbegin(); it != outputs_.rend(); ++it) {
        if (!incoming(*it).empty()) stack.push_back(Item{*it, Action::Traverse, std::nullopt});
    }

    Program program;
    std::size_t step = 0;

    while (!stack.empty()) {
        Item item = std::move(stack.back());
        stack.pop_back();

        switch (item.action) {
            case Action::Traverse: {
                if (!all_node_inputs_connected(item.node)) return std::nullopt;
                const auto in = incoming(item.node);
                stack.push_back(Item{item.node, Action::Visit, item.label});
                for (auto it = in.rbegin(); it != in.rend(); ++it) {
                    stack.push_back(Item{(*it)->source_node, Action::Use, std::nullopt});
                }
                for (auto it = in.rbegin(); it != in.rend(); ++it) {
                    stack.push_back(Item{(*it)->source_node, Action::Traverse,
                                         Label{(*it)->source_socket, item.node, (*it)->sink_socket}});
                }
                break;
            }
            case Action::Visit: {
                const Node& n = nodes_.at(item.node);
                const auto res = node_resource(item.node);

                if (!program.use_points.count(res) || mode == LinearizationMode::FullTraversal) {
                    ++step;
                    if (const auto* atomic = std::get_if<AtomicOperator>(&n.op)) {
                        program.instructions.push_back(instr::Execute{res, *atomic});
                    } else {
                        const auto& complex = std::get<ComplexOperator>(n.op);
                        for (const auto& kv : complex.inputs) {
                            program.instructions.push_back(
                                instr::Copy{res.node_socket(kv.first), kv.second.second.node_socket("data")});
                        }
                        program.instructions.push_back(instr::Call{res, complex});
                        for (const auto& kv : complex.outputs) {
                            program.instructions.push_back(
                                instr::Copy{kv.second.second.node_socket("data"), res.node_socket(kv.first)});
                        }
                    }
                    program.use_points[res].creation = step;

                    const auto outs = operator_outputs(n.op);
                    if (!outs.empty()) {
                        program.instructions.push_back(instr::Thumbnail{res.node_socket(outs.begin()->first)});
                    }
                }

                if (item.label) {
                    program.instructions.push_back(
                        instr::Move{res.node_socket(item.label->source_socket),
                                    node_resource(item.label->sink_node).node_socket(item.label->sink_socket)});
                }
                break;
            }
            case Action::Use: {
                const auto res = node_resource(item.node);
                auto it = program.use_points.find(res);
                if (it != program.use_points.end()) {
                    it->second.last = step;
                } else {
                    program.use_points.emplace(res, UsePoint{0, step});
                }
                break;
            }
        }
    }

    return program;
}

} // namespace mf
