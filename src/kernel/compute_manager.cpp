#include "kernel/compute_manager.hpp"

#include <iostream>
#include <type_traits>

namespace mf {

ComputeManager::ComputeManager(ComputeBackend& backend, std::uint32_t parent_size, std::size_t stack_limit)
    : backend_(backend), sockets_(backend), parent_size_(parent_size), stack_limit_(stack_limit) {
    failed_shaders_ = shaders_.load(backend_);
    for (const auto& name : failed_shaders_) {
        std::cerr << "Warning: failed to create pipeline for shader '" << name << "'." << std::endl;
    }
}

void ComputeManager::process_events(const GraphEvents& events) {
    std::vector<ComputeEvent> out;
    for (const auto& ev : events) process_event(ev, out);
    if (!out.empty()) events_.push_all(std::move(out));
}

void ComputeManager::process_event(const GraphEvent& event, std::vector<ComputeEvent>& out) {
    std::visit([&](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, graph_events::NodeAdded>) {
            sockets_.ensure_group_exists(e.node, e.size);
        } else if constexpr (std::is_same_v<T, graph_events::OutputSocketAdded>) {
            if (auto ty = e.type.concrete()) {
                sockets_.add_output_socket(e.socket, *ty, e.size, e.external_data);
                out.push_back(compute_events::SocketCreated{e.socket, *ty});
            } else {
                sockets_.add_output_socket(e.socket, std::nullopt, e.size, e.external_data);
            }
        } else if constexpr (std::is_same_v<T, graph_events::SocketMonomorphized>) {
            if (sockets_.is_known_output(e.socket) && sockets_.monomorphize_output(e.socket, e.type)) {
                out.push_back(compute_events::SocketCreated{e.socket, e.type});
            }
        } else if constexpr (std::is_same_v<T, graph_events::SocketDemonomorphized>) {
            if (sockets_.remove_output_image(e.socket)) {
                if (sockets_.clear_thumbnail(e.socket.socket_node())) {
                    out.push_back(compute_events::ThumbnailDestroyed{e.socket.socket_node()});
                }
                out.push_back(compute_events::SocketDestroyed{e.socket});
            }
        } else if constexpr (std::is_same_v<T, graph_events::NodeRemoved>) {
            if (sockets_.clear_thumbnail(e.node)) out.push_back(compute_events::ThumbnailDestroyed{e.node});
            for (auto& socket : sockets_.remove_group(e.node)) {
                out.push_back(compute_events::SocketDestroyed{std::move(socket)});
            }
            exports_.erase(e.node);
            if (view_socket_ && view_socket_->socket.socket_node() == e.node) view_socket_.reset();
        } else if constexpr (std::is_same_v<T, graph_events::NodeRenamed>) {
            sockets_.rename_group(e.from, e.to);
            auto it = exports_.find(e.from);
            if (it != exports_.end()) {
                ExportSpec spec = it->second;
                exports_.erase(it);
                exports_[e.to] = spec;
            }
            if (view_socket_ && view_socket_->socket.socket_node() == e.from) {
                view_socket_->socket = e.to.node_socket(view_socket_->socket.socket_name());
            }
        } else if constexpr (std::is_same_v<T, graph_events::NodeResized>) {
            if (sockets_.has_group(e.node) && sockets_.resize(e.node, e.size, e.scalable)) {
                sockets_.reinit_output_images(e.node, sockets_.group(e.node).size.allocation_size());
            }
        } else if constexpr (std::is_same_v<T, graph_events::DisconnectedSockets>) {
            sockets_.disconnect_input(e.to);
        } else if constexpr (std::is_same_v<T, graph_events::ComplexOperatorUpdated>) {
            sockets_.set_force(e.node);
        }
    }, event);
}

void ComputeManager::install_program(const GraphResource& graph, Program program) {
    programs_.install(graph, std::move(program));
}

bool ComputeManager::remove_program(const GraphResource& graph) {
    return programs_.remove(graph);
}

void ComputeManager::rename_graph(const GraphResource& from, const GraphResource& to) {
    programs_.rename(from, to);
    sockets_.rename_graph(from, to);
}

ComputeManager::RunReport ComputeManager::run(const GraphResource& graph) {
    RunReport report;
    InterpreterContext ctx{backend_, sockets_, external_images_, shaders_, programs_,
                           view_socket_, exports_, exporter_};
    try {
        Interpreter interpreter(ctx, seq_, graph, parent_size_, stack_limit_);
        while (auto step = interpreter.step()) {
            for (auto& ev : step->events) report.events.push_back(std::move(ev));
            if (!step->ok()) {
                report.error = step->error;
                break;
            }
            report.steps++;
        }
        seq_ = interpreter.seq();
    } catch (const InterpretationError& e) {
        report.error = e;
    }
    report.seq = seq_;

    const auto usage = backend_.usage();
    report.events.push_back(compute_events::VramUsage{usage.bytes_used, usage.bytes_budget});

    if (report.error) {
        std::cerr << "Error: interpretation of " << graph << " failed ("
                  << interpretation_errc_name(report.error->code()) << "): " << report.error->what() << std::endl;
    } else if (!quiet_) {
        std::cout << "Interpreted " << graph << ": " << report.steps << " steps, seq " << report.seq << "."
                  << std::endl;
    }

    events_.push_all(report.events);
    return report;
}

void ComputeManager::set_view_socket(std::optional<SocketResource> socket) {
    if (socket) view_socket_ = ViewSocket{*socket, std::nullopt};
    else view_socket_.reset();
}

std::optional<SocketResource> ComputeManager::view_socket() const {
    if (!view_socket_) return std::nullopt;
    return view_socket_->socket;
}

void ComputeManager::set_parent_size(std::uint32_t size) {
    if (size == parent_size_) return;
    parent_size_ = size;
    sockets_.force_all();
}

void ComputeManager::set_export(const NodeResource& node, ExportSpec spec) {
    exports_[node] = std::move(spec);
}

void ComputeManager::clear_exports() {
    exports_.clear();
}

ImageResource ComputeManager::add_image_resource(const fs::path& path, ColorSpace color_space) {
    ImageResource res(path.filename().string());
    external_images_.add_image(res, path, color_space);
    events_.push(compute_events::ImageResourceAdded{res, color_space, false});
    return res;
}

bool ComputeManager::set_image_color_space(const ImageResource& res, ColorSpace color_space) {
    return external_images_.set_color_space(res, color_space);
}

bool ComputeManager::pack_image(const ImageResource& res) {
    return external_images_.pack(res);
}

void ComputeManager::reset() {
    sockets_.clear();
    programs_.clear();
    exports_.clear();
    view_socket_.reset();
    seq_ = 0;
}

} // namespace mf
