#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gpu/compute_backend.hpp"
#include "kernel/compute_events.hpp"
#include "kernel/services/export_service.hpp"
#include "kernel/services/external_image_service.hpp"
#include "kernel/services/shader_library.hpp"
#include "kernel/services/socket_registry.hpp"
#include "program.hpp"

namespace mf {

enum class InterpretationErrc {
    Allocator = 1,
    OutOfMemory,
    HardOOM,
    RecursionDetected,
    StackLimitReached,
    UnknownCall,
    MissingShader,
    Pipeline,
    ExternalImage,
    ExternalImageRead,
    Upload,
    Download,
    Export,
};

const char* interpretation_errc_name(InterpretationErrc code);

struct MATFORGE_API InterpretationError : public std::runtime_error {
    InterpretationError(InterpretationErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    InterpretationErrc code() const noexcept { return code_; }
    bool is_out_of_memory() const noexcept { return code_ == InterpretationErrc::OutOfMemory; }
private:
    InterpretationErrc code_;
};

// 节点 -> 该节点上生效的参数覆盖
using SubstitutionMap = std::unordered_map<NodeResource, std::vector<ParamSubstitution>>;

// 栈帧中的一条指令。skipped_after 为紧随其后、被调用时过滤掉的执行步数，
// 执行完这条指令后一并计入 step，使 step 始终与完整 Program 的编号一致
struct FrameInstruction {
    Instruction instruction;
    std::size_t skipped_after = 0;
};

/**
 * @brief 调用栈中的一帧：剩余指令队列、当前 step 与共享的 Program / 参数覆盖。
 *
 * step 是完整 Program 中已完成的执行步数；队首指令执行成功后才出队。
 */
struct StackFrame {
    GraphResource graph;
    ProgramHandle program = 0;
    std::size_t step = 0;
    std::deque<FrameInstruction> instructions;
    std::shared_ptr<const SubstitutionMap> substitutions;
    std::uint32_t frame_size = 0;
    std::optional<NodeResource> caller;
    std::chrono::steady_clock::time_point start_time;
};

// 视图 socket 与它最后一次发送 SocketViewReady 时的序号
struct ViewSocket {
    SocketResource socket;
    std::optional<std::uint64_t> last_seq;
};

// 解释器运行期间借用的全部状态
struct InterpreterContext {
    ComputeBackend& backend;
    SocketRegistry& sockets;
    ExternalImageService& external_images;
    const ShaderLibrary& shaders;
    const ProgramArena& programs;
    std::optional<ViewSocket>& view_socket;
    const std::unordered_map<NodeResource, ExportSpec>& exports;
    ExportService& exporter;
};

/**
 * @brief 逐条执行 Program 指令的解释器。
 *
 * 每次 step() 执行栈顶帧的一条指令并返回产生的事件与当前序号；栈空后返回
 * std::nullopt。Call 指令把子图的 Program 压栈（过滤掉被调用时不需要的
 * 指令），同一个图已在栈中时报告 RecursionDetected。
 *
 * 内存不足时先调用 cleanup() 释放不在任何栈帧保留集合中的节点图像，然后
 * 重试同一条指令一次；再次失败即 HardOOM。任何错误都会终止解释。
 */
class MATFORGE_API Interpreter {
public:
    static constexpr std::size_t kDefaultStackLimit = 256;

    enum class State { Running, Calling, Returning, Terminated };

    struct Step {
        std::vector<ComputeEvent> events;
        std::uint64_t seq = 0;
        std::optional<InterpretationError> error;
        bool ok() const { return !error.has_value(); }
    };

    /**
     * @param seq 上一次解释结束时的序号，本次从 seq + 1 开始
     * @throws InterpretationError(UnknownCall) graph 没有已安装的 Program
     */
    Interpreter(InterpreterContext ctx, std::uint64_t seq, const GraphResource& graph,
                std::uint32_t parent_size, std::size_t stack_limit = kDefaultStackLimit);

    std::optional<Step> step();

    State state() const { return state_; }
    std::size_t depth() const { return frames_.size(); }
    std::uint64_t seq() const { return seq_; }
    const std::vector<StackFrame>& frames() const { return frames_; }

    // 所有栈帧在各自当前 step 的保留集合的并集，另加正在进行的子图调用
    // 所涉及的节点（参见 retain_call_boundary）
    std::unordered_set<NodeResource> retention_set() const;
    // 释放保留集合之外的全部节点图像
    void cleanup();

private:
    std::optional<StackFrame> make_frame(const GraphResource& graph, std::uint32_t frame_size,
                                         std::shared_ptr<const SubstitutionMap> substitutions,
                                         std::optional<NodeResource> caller) const;
    void retain_call_boundary(const StackFrame& frame, std::unordered_set<NodeResource>& keep) const;
    std::vector<ComputeEvent> interpret(const Instruction& instruction, std::uint32_t frame_size,
                                        const SubstitutionMap& substitutions);

    void execute_move(const instr::Move& move);
    std::vector<ComputeEvent> execute_copy(const instr::Copy& copy);
    std::vector<ComputeEvent> execute_call(const instr::Call& call, std::uint32_t frame_size);
    std::vector<ComputeEvent> execute_thumbnail(const instr::Thumbnail& thumbnail);
    std::vector<ComputeEvent> execute(const NodeResource& node, const AtomicOperator& op,
                                      std::uint32_t frame_size);
    void execute_atomic(const NodeResource& node, const AtomicOperator& op, std::uint32_t frame_size);
    void execute_image(const NodeResource& node, const Image& op);
    void execute_svg(const NodeResource& node, const Svg& op, std::uint32_t frame_size);
    void execute_input(const NodeResource& node);
    std::vector<ComputeEvent> execute_output(const NodeResource& node, const Output& op);
    void export_output(const NodeResource& node, ImageHandle image, ImageType type);
    std::optional<ComputeEvent> process_view_socket(const SocketResource& socket);

    void ensure_allocation(const NodeResource& node, std::uint32_t frame_size);
    bool ensure_backed(ImageHandle image);
    bool needs_recompute(const NodeResource& node, std::uint64_t hash, const SocketMap& inputs) const;

    InterpreterContext ctx_;
    std::uint64_t seq_;
    std::uint32_t parent_size_;
    std::size_t stack_limit_;
    std::vector<StackFrame> frames_;
    State state_ = State::Running;
};

} // namespace mf
