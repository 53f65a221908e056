#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "graph_events.hpp"
#include "gpu/compute_backend.hpp"
#include "kernel/compute_events.hpp"
#include "kernel/interpreter.hpp"
#include "kernel/services/compute_event_service.hpp"
#include "kernel/services/export_service.hpp"
#include "kernel/services/external_image_service.hpp"
#include "kernel/services/shader_library.hpp"
#include "kernel/services/socket_registry.hpp"
#include "program.hpp"

namespace mf {

/**
 * @brief 计算侧的总管：消费图事件维护 socket 注册表，持有已安装的 Program，
 *        并在 run() 中驱动解释器直到结束。
 *
 * 产生的计算事件既返回给调用者，也写入 ComputeEventService 供前端 drain。
 */
class MATFORGE_API ComputeManager {
public:
    struct RunReport {
        std::vector<ComputeEvent> events;
        std::optional<InterpretationError> error;
        std::size_t steps = 0;
        std::uint64_t seq = 0;
        bool ok() const { return !error.has_value(); }
    };

    ComputeManager(ComputeBackend& backend, std::uint32_t parent_size = kDefaultGroupSize,
                   std::size_t stack_limit = Interpreter::kDefaultStackLimit);

    void process_events(const GraphEvents& events);
    void install_program(const GraphResource& graph, Program program);
    bool remove_program(const GraphResource& graph);
    void rename_graph(const GraphResource& from, const GraphResource& to);

    RunReport run(const GraphResource& graph);

    void set_view_socket(std::optional<SocketResource> socket);
    std::optional<SocketResource> view_socket() const;
    void set_parent_size(std::uint32_t size);
    std::uint32_t parent_size() const { return parent_size_; }
    void set_stack_limit(std::size_t limit) { stack_limit_ = limit; }
    void set_quiet(bool quiet) { quiet_ = quiet; }

    void set_export(const NodeResource& node, ExportSpec spec);
    void clear_exports();

    ImageResource add_image_resource(const fs::path& path, ColorSpace color_space);
    bool set_image_color_space(const ImageResource& res, ColorSpace color_space);
    bool pack_image(const ImageResource& res);

    // 丢弃所有图像与 Program，序号归零
    void reset();

    std::vector<ComputeEvent> drain_events() { return events_.drain(); }
    std::uint64_t seq() const { return seq_; }
    const std::vector<std::string>& failed_shaders() const { return failed_shaders_; }

    SocketRegistry& sockets() { return sockets_; }
    const SocketRegistry& sockets() const { return sockets_; }
    const ProgramArena& programs() const { return programs_; }
    const ShaderLibrary& shaders() const { return shaders_; }
    ExternalImageService& external_images() { return external_images_; }
    ExportService& exporter() { return exporter_; }
    ComputeBackend& backend() { return backend_; }

private:
    void process_event(const GraphEvent& event, std::vector<ComputeEvent>& out);

    ComputeBackend& backend_;
    SocketRegistry sockets_;
    ShaderLibrary shaders_;
    ProgramArena programs_;
    ExternalImageService external_images_;
    ExportService exporter_;
    ComputeEventService events_;
    std::vector<std::string> failed_shaders_;
    std::unordered_map<NodeResource, ExportSpec> exports_;
    std::optional<ViewSocket> view_socket_;
    std::uint64_t seq_ = 0;
    std::uint32_t parent_size_;
    std::size_t stack_limit_;
    bool quiet_ = true;
};

} // namespace mf
