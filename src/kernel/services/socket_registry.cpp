#include "kernel/services/socket_registry.hpp"

#include <algorithm>

namespace mf {

std::uint32_t GroupSize::allocation_size() const {
    std::int64_t size = allocated ? *allocated : ideal;
    if (size < 32) return 32;
    if (size > 16384) return 16384;
    return static_cast<std::uint32_t>(size);
}

bool GroupSize::ensure_allocation_size(std::uint32_t parent_size, std::uint32_t frame_size) {
    if (!scalable || parent_size == 0) return false;
    const double ratio = static_cast<double>(ideal) / static_cast<double>(parent_size);
    auto target = static_cast<std::int64_t>(ratio * frame_size);
    target = std::min<std::int64_t>(std::max<std::int64_t>(target, 32), 16384);
    if (static_cast<std::uint32_t>(target) == allocation_size()) return false;
    allocated = static_cast<std::uint32_t>(target);
    return true;
}

SocketRegistry::SocketRegistry(ComputeBackend& backend) : backend_(backend) {}

SocketRegistry::~SocketRegistry() {
    clear();
}

void SocketRegistry::destroy_group_images(SocketGroup& group) {
    for (auto& kv : group.typed_outputs) {
        backend_.destroy_image(kv.second.image);
    }
    group.typed_outputs.clear();
    if (group.thumbnail) {
        backend_.return_thumbnail(*group.thumbnail);
        group.thumbnail.reset();
    }
}

SocketGroup& SocketRegistry::ensure_group_exists(const NodeResource& node, std::uint32_t size) {
    auto it = groups_.find(node);
    if (it != groups_.end()) return it->second;
    SocketGroup group;
    group.size.ideal = size;
    group.timing = Ema(timing_decay_);
    return groups_.emplace(node, std::move(group)).first->second;
}

bool SocketRegistry::has_group(const NodeResource& node) const {
    return groups_.count(node) != 0;
}

SocketGroup* SocketRegistry::find(const NodeResource& node) {
    auto it = groups_.find(node);
    return it == groups_.end() ? nullptr : &it->second;
}

const SocketGroup* SocketRegistry::find(const NodeResource& node) const {
    auto it = groups_.find(node);
    return it == groups_.end() ? nullptr : &it->second;
}

SocketGroup& SocketRegistry::group(const NodeResource& node) {
    auto* g = find(node);
    if (!g) throw GraphError(GraphErrc::NotFound, "No socket group for " + node.to_string());
    return *g;
}

const SocketGroup& SocketRegistry::group(const NodeResource& node) const {
    const auto* g = find(node);
    if (!g) throw GraphError(GraphErrc::NotFound, "No socket group for " + node.to_string());
    return *g;
}

std::vector<SocketResource> SocketRegistry::remove_group(const NodeResource& node) {
    std::vector<SocketResource> removed;
    auto it = groups_.find(node);
    if (it == groups_.end()) return removed;
    for (const auto& kv : it->second.typed_outputs) removed.push_back(node.node_socket(kv.first));
    destroy_group_images(it->second);
    groups_.erase(it);
    // 指向被删除节点的输入绑定一并失效
    for (auto& kv : groups_) {
        for (auto in = kv.second.inputs.begin(); in != kv.second.inputs.end();) {
            if (in->second.socket_node() == node) in = kv.second.inputs.erase(in);
            else ++in;
        }
    }
    return removed;
}

void SocketRegistry::rename_group(const NodeResource& from, const NodeResource& to) {
    auto it = groups_.find(from);
    if (it == groups_.end()) return;
    SocketGroup group = std::move(it->second);
    groups_.erase(it);
    groups_[to] = std::move(group);
    for (auto& kv : groups_) {
        for (auto& in : kv.second.inputs) {
            if (in.second.socket_node() == from) in.second = to.node_socket(in.second.socket_name());
        }
    }
}

void SocketRegistry::rename_graph(const GraphResource& from, const GraphResource& to) {
    const std::string prefix = from.path() + "/";
    std::vector<NodeResource> affected;
    for (const auto& kv : groups_) {
        if (kv.first.path().compare(0, prefix.size(), prefix) == 0) affected.push_back(kv.first);
    }
    for (const auto& node : affected) {
        rename_group(node, NodeResource(to.path() + "/" + node.path().substr(prefix.size())));
    }
}

std::vector<NodeResource> SocketRegistry::known_groups() const {
    std::vector<NodeResource> out;
    out.reserve(groups_.size());
    for (const auto& kv : groups_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void SocketRegistry::clear() {
    for (auto& kv : groups_) destroy_group_images(kv.second);
    groups_.clear();
}

void SocketRegistry::add_output_socket(const SocketResource& socket, std::optional<ImageType> type,
                                       std::uint32_t size, bool transfer_dst) {
    auto& g = ensure_group_exists(socket.socket_node(), size);
    g.known_outputs.insert(socket.socket_name());
    if (!type) return;
    auto existing = g.typed_outputs.find(socket.socket_name());
    if (existing != g.typed_outputs.end()) backend_.destroy_image(existing->second.image);
    TypedOutput out;
    out.type = *type;
    out.transfer_dst = transfer_dst;
    out.image = backend_.create_image(g.size.allocation_size(), *type, transfer_dst);
    g.typed_outputs[socket.socket_name()] = out;
}

bool SocketRegistry::is_known_output(const SocketResource& socket) const {
    const auto* g = find(socket.socket_node());
    return g && g->known_outputs.count(socket.socket_name()) != 0;
}

bool SocketRegistry::monomorphize_output(const SocketResource& socket, ImageType type) {
    auto& g = group(socket.socket_node());
    auto it = g.typed_outputs.find(socket.socket_name());
    if (it != g.typed_outputs.end()) {
        if (it->second.type == type) return false;
        backend_.destroy_image(it->second.image);
        g.typed_outputs.erase(it);
    }
    TypedOutput out;
    out.type = type;
    out.image = backend_.create_image(g.size.allocation_size(), type, false);
    g.typed_outputs[socket.socket_name()] = out;
    g.force = true;
    return true;
}

bool SocketRegistry::remove_output_image(const SocketResource& socket) {
    auto* g = find(socket.socket_node());
    if (!g) return false;
    auto it = g->typed_outputs.find(socket.socket_name());
    if (it == g->typed_outputs.end()) return false;
    backend_.destroy_image(it->second.image);
    g->typed_outputs.erase(it);
    g->force = true;
    return true;
}

std::optional<TypedOutput> SocketRegistry::output(const SocketResource& socket) const {
    const auto* g = find(socket.socket_node());
    if (!g) return std::nullopt;
    auto it = g->typed_outputs.find(socket.socket_name());
    if (it == g->typed_outputs.end()) return std::nullopt;
    return it->second;
}

std::optional<std::uint64_t> SocketRegistry::output_updated(const SocketResource& socket) const {
    const auto* g = find(socket.socket_node());
    if (!g) return std::nullopt;
    auto it = g->typed_outputs.find(socket.socket_name());
    if (it == g->typed_outputs.end()) return g->seq;
    return it->second.seq;
}

bool SocketRegistry::connect_input(const SocketResource& from, const SocketResource& to) {
    auto& g = group(to.socket_node());
    auto it = g.inputs.find(to.socket_name());
    if (it != g.inputs.end() && it->second == from) return false;
    g.inputs[to.socket_name()] = from;
    g.force = true;
    return true;
}

void SocketRegistry::disconnect_input(const SocketResource& to) {
    auto* g = find(to.socket_node());
    if (!g) return;
    if (g->inputs.erase(to.socket_name())) g->force = true;
}

std::optional<SocketResource> SocketRegistry::input_binding(const SocketResource& to) const {
    const auto* g = find(to.socket_node());
    if (!g) return std::nullopt;
    auto it = g->inputs.find(to.socket_name());
    if (it == g->inputs.end()) return std::nullopt;
    return it->second;
}

std::optional<TypedOutput> SocketRegistry::input_source(const SocketResource& to) const {
    auto from = input_binding(to);
    if (!from) return std::nullopt;
    return output(*from);
}

std::optional<std::uint64_t> SocketRegistry::input_updated(const SocketResource& to) const {
    auto from = input_binding(to);
    if (!from) return std::nullopt;
    return output_updated(*from);
}

bool SocketRegistry::force(const NodeResource& node) const {
    const auto* g = find(node);
    return g && g->force;
}

void SocketRegistry::set_force(const NodeResource& node) {
    if (auto* g = find(node)) g->force = true;
}

void SocketRegistry::force_all() {
    for (auto& kv : groups_) kv.second.force = true;
}

void SocketRegistry::set_outputs_updated(const NodeResource& node, std::uint64_t seq) {
    auto& g = group(node);
    g.seq = seq;
    g.force = false;
    for (auto& kv : g.typed_outputs) {
        kv.second.seq = seq;
        kv.second.copied_from.reset();
    }
}

void SocketRegistry::set_output_copied(const SocketResource& socket, std::uint64_t seq,
                                       const SocketResource& source) {
    auto& g = group(socket.socket_node());
    auto it = g.typed_outputs.find(socket.socket_name());
    if (it == g.typed_outputs.end()) {
        throw GraphError(GraphErrc::NotFound, "No output image for " + socket.to_string());
    }
    it->second.seq = seq;
    it->second.copied_from = source;
    g.seq = std::max(g.seq, seq);
    g.force = false;
}

void SocketRegistry::set_outputs_sequence(const NodeResource& node, std::uint64_t seq) {
    auto& g = group(node);
    for (auto& kv : g.typed_outputs) kv.second.seq = seq;
}

void SocketRegistry::free_images(const NodeResource& node) {
    auto* g = find(node);
    if (!g) return;
    for (auto& kv : g->typed_outputs) backend_.release(kv.second.image);
    g->force = true;
}

void SocketRegistry::reinit_output_images(const NodeResource& node, std::uint32_t size) {
    auto& g = group(node);
    for (auto& kv : g.typed_outputs) {
        backend_.destroy_image(kv.second.image);
        kv.second.image = backend_.create_image(size, kv.second.type, kv.second.transfer_dst);
    }
    g.force = true;
}

bool SocketRegistry::resize(const NodeResource& node, std::uint32_t size, bool scalable) {
    auto& g = group(node);
    bool changed = g.size.ideal != size || g.size.scalable != scalable;
    g.size.ideal = size;
    g.size.scalable = scalable;
    if (changed) g.size.allocated.reset();
    return changed;
}

bool SocketRegistry::ensure_thumbnail(const NodeResource& node, ImageType type) {
    auto& g = group(node);
    if (g.thumbnail) return false;
    g.thumbnail = backend_.new_thumbnail(type);
    return true;
}

std::optional<ThumbnailHandle> SocketRegistry::clear_thumbnail(const NodeResource& node) {
    auto* g = find(node);
    if (!g || !g->thumbnail) return std::nullopt;
    auto thumbnail = *g->thumbnail;
    backend_.return_thumbnail(thumbnail);
    g->thumbnail.reset();
    g->thumbnail_seq = 0;
    return thumbnail;
}

void SocketRegistry::update_timing(const NodeResource& node, double seconds) {
    if (auto* g = find(node)) g->timing.update(seconds);
}

} // namespace mf
