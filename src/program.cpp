#include "program.hpp"

#include <sstream>
#include <type_traits>

namespace mf {

bool is_call_skippable(const Instruction& i) {
    if (std::holds_alternative<instr::Thumbnail>(i)) return true;
    if (const auto* exec = std::get_if<instr::Execute>(&i)) return is_output(exec->op);
    return false;
}

std::string describe(const Instruction& i) {
    std::ostringstream ss;
    std::visit([&ss](auto&& in) {
        using T = std::decay_t<decltype(in)>;
        if constexpr (std::is_same_v<T, instr::Move>) {
            ss << "move " << in.from << " -> " << in.to;
        } else if constexpr (std::is_same_v<T, instr::Execute>) {
            ss << "execute " << in.node;
        } else if constexpr (std::is_same_v<T, instr::Call>) {
            ss << "call " << in.node << " (" << in.op.graph << ")";
        } else if constexpr (std::is_same_v<T, instr::Copy>) {
            ss << "copy " << in.from << " -> " << in.to;
        } else if constexpr (std::is_same_v<T, instr::Thumbnail>) {
            ss << "thumbnail " << in.socket;
        }
    }, i);
    return ss.str();
}

std::vector<NodeResource> Program::retention_set_at(std::size_t step) const {
    std::vector<NodeResource> out;
    for (const auto& kv : use_points) {
        if (kv.second.creation <= step && step <= kv.second.last) out.push_back(kv.first);
    }
    return out;
}

std::size_t Program::execution_steps() const {
    std::size_t n = 0;
    for (const auto& i : instructions) {
        if (is_execution_step(i)) ++n;
    }
    return n;
}

ProgramHandle ProgramArena::install(const GraphResource& graph, Program program) {
    auto it = by_graph_.find(graph);
    if (it != by_graph_.end()) {
        slots_[it->second] = std::move(program);
        return it->second;
    }
    ProgramHandle handle;
    if (!free_.empty()) {
        handle = free_.back();
        free_.pop_back();
        slots_[handle] = std::move(program);
    } else {
        handle = slots_.size();
        slots_.emplace_back(std::move(program));
    }
    by_graph_[graph] = handle;
    return handle;
}

std::optional<ProgramHandle> ProgramArena::find(const GraphResource& graph) const {
    auto it = by_graph_.find(graph);
    if (it == by_graph_.end()) return std::nullopt;
    return it->second;
}

const Program& ProgramArena::get(ProgramHandle handle) const {
    if (handle >= slots_.size() || !slots_[handle]) {
        throw GraphError(GraphErrc::NotFound, "No program installed at handle " + std::to_string(handle));
    }
    return *slots_[handle];
}

bool ProgramArena::remove(const GraphResource& graph) {
    auto it = by_graph_.find(graph);
    if (it == by_graph_.end()) return false;
    slots_[it->second].reset();
    free_.push_back(it->second);
    by_graph_.erase(it);
    return true;
}

void ProgramArena::rename(const GraphResource& from, const GraphResource& to) {
    auto it = by_graph_.find(from);
    if (it == by_graph_.end()) return;
    ProgramHandle handle = it->second;
    by_graph_.erase(it);
    remove(to);
    by_graph_[to] = handle;
}

void ProgramArena::clear() {
    slots_.clear();
    by_graph_.clear();
    free_.clear();
}

} // namespace mf
