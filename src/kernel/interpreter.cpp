#include "kernel/interpreter.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

#include "adapter/buffer_adapter_opencv.hpp"

namespace mf {

namespace {

InterpretationError from_backend_error(const BackendError& e) {
    switch (e.code()) {
        case BackendErrc::OutOfMemory: return InterpretationError(InterpretationErrc::OutOfMemory, e.what());
        case BackendErrc::Upload: return InterpretationError(InterpretationErrc::Upload, e.what());
        case BackendErrc::Pipeline: return InterpretationError(InterpretationErrc::Pipeline, e.what());
        case BackendErrc::Download: return InterpretationError(InterpretationErrc::Download, e.what());
        default: return InterpretationError(InterpretationErrc::Allocator, e.what());
    }
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::uint64_t combine_hash(std::uint64_t a, std::uint64_t b) {
    return a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
}

// 一次 dispatch 期间的中间图像，离开作用域即销毁
class IntermediateImages {
public:
    explicit IntermediateImages(ComputeBackend& backend) : backend_(backend) {}
    ~IntermediateImages() {
        for (auto image : images_) backend_.destroy_image(image);
    }
    IntermediateImages(const IntermediateImages&) = delete;
    IntermediateImages& operator=(const IntermediateImages&) = delete;

    ImageHandle create(std::uint32_t size, ImageType type) {
        images_.push_back(backend_.create_image(size, type, false));
        return images_.back();
    }

private:
    ComputeBackend& backend_;
    std::vector<ImageHandle> images_;
};

} // namespace

const char* interpretation_errc_name(InterpretationErrc code) {
    switch (code) {
        case InterpretationErrc::Allocator: return "allocator";
        case InterpretationErrc::OutOfMemory: return "out_of_memory";
        case InterpretationErrc::HardOOM: return "hard_oom";
        case InterpretationErrc::RecursionDetected: return "recursion_detected";
        case InterpretationErrc::StackLimitReached: return "stack_limit_reached";
        case InterpretationErrc::UnknownCall: return "unknown_call";
        case InterpretationErrc::MissingShader: return "missing_shader";
        case InterpretationErrc::Pipeline: return "pipeline";
        case InterpretationErrc::ExternalImage: return "external_image";
        case InterpretationErrc::ExternalImageRead: return "external_image_read";
        case InterpretationErrc::Upload: return "upload";
        case InterpretationErrc::Download: return "download";
        case InterpretationErrc::Export: return "export";
    }
    return "unknown";
}

Interpreter::Interpreter(InterpreterContext ctx, std::uint64_t seq, const GraphResource& graph,
                         std::uint32_t parent_size, std::size_t stack_limit)
    : ctx_(ctx), seq_(seq + 1), parent_size_(parent_size), stack_limit_(stack_limit) {
    auto frame = make_frame(graph, parent_size, std::make_shared<const SubstitutionMap>(), std::nullopt);
    if (frame) {
        frame->start_time = std::chrono::steady_clock::now();
        frames_.push_back(std::move(*frame));
    } else {
        state_ = State::Terminated;
    }
}

std::optional<StackFrame> Interpreter::make_frame(const GraphResource& graph, std::uint32_t frame_size,
                                                  std::shared_ptr<const SubstitutionMap> substitutions,
                                                  std::optional<NodeResource> caller) const {
    auto handle = ctx_.programs.find(graph);
    if (!handle) {
        throw InterpretationError(InterpretationErrc::UnknownCall,
                                  "No linearization available for " + graph.to_string());
    }
    const Program& program = ctx_.programs.get(*handle);

    StackFrame frame;
    frame.graph = graph;
    frame.program = *handle;
    frame.substitutions = std::move(substitutions);
    frame.frame_size = frame_size;
    for (const auto& instruction : program.instructions) {
        // 被调用的子图不生成缩略图，也不处理自身的 Output 节点；
        // 被过滤的 Output 仍占一个执行步，否则 step 会落后于使用窗口
        if (caller && is_call_skippable(instruction)) {
            if (!is_execution_step(instruction)) continue;
            if (frame.instructions.empty()) frame.step += 1;
            else frame.instructions.back().skipped_after += 1;
            continue;
        }
        frame.instructions.push_back(FrameInstruction{instruction, 0});
    }
    frame.caller = std::move(caller);
    if (frame.instructions.empty()) return std::nullopt;
    return frame;
}

std::optional<Interpreter::Step> Interpreter::step() {
    if (frames_.empty()) {
        state_ = State::Terminated;
        return std::nullopt;
    }

    Step result;
    if (frames_.size() > stack_limit_) {
        frames_.clear();
        state_ = State::Terminated;
        result.seq = seq_;
        result.error = InterpretationError(InterpretationErrc::StackLimitReached,
                                           "Call stack exceeded " + std::to_string(stack_limit_) + " frames");
        return result;
    }

    const std::size_t depth = frames_.size() - 1;
    // 指令留在队首直到执行成功，重试前的 cleanup() 仍能看到它
    const FrameInstruction entry = frames_[depth].instructions.front();
    const Instruction& instruction = entry.instruction;
    auto substitutions = frames_[depth].substitutions;
    const auto frame_size = frames_[depth].frame_size;
    state_ = State::Running;

    try {
        result.events = interpret(instruction, frame_size, *substitutions);
    } catch (const InterpretationError& e) {
        if (!e.is_out_of_memory()) {
            result.error = e;
        } else {
            std::cerr << "Warning: out of memory during '" << describe(instruction)
                      << "', releasing unused images and retrying." << std::endl;
            cleanup();
            try {
                result.events = interpret(instruction, frame_size, *substitutions);
            } catch (const InterpretationError& retry) {
                if (retry.is_out_of_memory()) {
                    result.error = InterpretationError(InterpretationErrc::HardOOM, retry.what());
                } else {
                    result.error = retry;
                }
            }
        }
    }

    result.seq = seq_;
    if (result.error) {
        frames_.clear();
        state_ = State::Terminated;
        return result;
    }

    frames_[depth].instructions.pop_front();
    if (is_execution_step(instruction)) frames_[depth].step += 1;
    frames_[depth].step += entry.skipped_after;
    const bool called = frames_.size() > depth + 1;

    bool returned = false;
    while (!frames_.empty() && frames_.back().instructions.empty()) {
        StackFrame finished = std::move(frames_.back());
        frames_.pop_back();
        if (finished.caller) {
            ctx_.sockets.update_timing(*finished.caller, seconds_since(finished.start_time));
        }
        returned = true;
    }

    if (frames_.empty()) state_ = State::Terminated;
    else if (called && !returned) state_ = State::Calling;
    else if (returned) state_ = State::Returning;
    else state_ = State::Running;
    return result;
}

std::unordered_set<NodeResource> Interpreter::retention_set() const {
    std::unordered_set<NodeResource> keep;
    for (const auto& frame : frames_) {
        for (auto& node : ctx_.programs.get(frame.program).retention_set_at(frame.step)) {
            keep.insert(std::move(node));
        }
        retain_call_boundary(frame, keep);
    }
    return keep;
}

// 从队首的 Copy 一直到下一条 Call：拷入的子图 Input 节点要活到 Call 执行，
// 拷出的子图内部来源要活到 Copy 完成，它们都不在当前 step 的保留集合中
void Interpreter::retain_call_boundary(const StackFrame& frame, std::unordered_set<NodeResource>& keep) const {
    for (const auto& entry : frame.instructions) {
        if (const auto* copy = std::get_if<instr::Copy>(&entry.instruction)) {
            keep.insert(copy->to.socket_node());
            if (ctx_.sockets.output(copy->from)) {
                keep.insert(copy->from.socket_node());
            } else if (auto binding = ctx_.sockets.input_binding(copy->from)) {
                keep.insert(binding->socket_node());
            }
            continue;
        }
        if (const auto* call = std::get_if<instr::Call>(&entry.instruction)) {
            keep.insert(call->node);
            for (const auto& kv : call->op.inputs) keep.insert(kv.second.second);
        }
        break;
    }
}

void Interpreter::cleanup() {
    auto keep = retention_set();
    for (const auto& node : ctx_.sockets.known_groups()) {
        if (!keep.count(node)) ctx_.sockets.free_images(node);
    }
}

std::vector<ComputeEvent> Interpreter::interpret(const Instruction& instruction, std::uint32_t frame_size,
                                                 const SubstitutionMap& substitutions) {
    try {
        return std::visit([&](auto&& in) -> std::vector<ComputeEvent> {
            using T = std::decay_t<decltype(in)>;
            if constexpr (std::is_same_v<T, instr::Move>) {
                execute_move(in);
                return {};
            } else if constexpr (std::is_same_v<T, instr::Execute>) {
                AtomicOperator op = in.op;
                auto it = substitutions.find(in.node);
                if (it != substitutions.end()) {
                    for (const auto& s : it->second) s.substitute(op);
                }
                return execute(in.node, op, frame_size);
            } else if constexpr (std::is_same_v<T, instr::Call>) {
                return execute_call(in, frame_size);
            } else if constexpr (std::is_same_v<T, instr::Copy>) {
                return execute_copy(in);
            } else {
                return execute_thumbnail(in);
            }
        }, instruction);
    } catch (const BackendError& e) {
        throw from_backend_error(e);
    } catch (const GraphError& e) {
        throw InterpretationError(InterpretationErrc::Pipeline, e.what());
    }
}

void Interpreter::execute_move(const instr::Move& move) {
    ctx_.sockets.connect_input(move.from, move.to);
}

bool Interpreter::ensure_backed(ImageHandle image) {
    return ctx_.backend.ensure_backed(image);
}

void Interpreter::ensure_allocation(const NodeResource& node, std::uint32_t frame_size) {
    auto& g = ctx_.sockets.group(node);
    if (g.size.ensure_allocation_size(parent_size_, frame_size)) {
        ctx_.sockets.reinit_output_images(node, g.size.allocation_size());
    }
}

bool Interpreter::needs_recompute(const NodeResource& node, std::uint64_t hash, const SocketMap& inputs) const {
    const auto& g = ctx_.sockets.group(node);
    if (g.force) return true;
    if (!g.last_hash || *g.last_hash != hash) return true;
    for (const auto& kv : inputs) {
        auto updated = ctx_.sockets.input_updated(node.node_socket(kv.first));
        if (updated && *updated > g.seq) return true;
    }
    return false;
}

std::vector<ComputeEvent> Interpreter::execute_copy(const instr::Copy& copy) {
    std::vector<ComputeEvent> events;

    // 来源可以是输出 socket，也可以是已绑定的输入 socket
    SocketResource source = copy.from;
    auto src = ctx_.sockets.output(source);
    if (!src) {
        auto binding = ctx_.sockets.input_binding(copy.from);
        if (!binding) {
            throw InterpretationError(InterpretationErrc::Pipeline,
                                      "Copy source " + copy.from.to_string() + " is not available");
        }
        source = *binding;
        src = ctx_.sockets.output(source);
        if (!src) {
            throw InterpretationError(InterpretationErrc::Pipeline,
                                      "Copy source " + source.to_string() + " has no image");
        }
    }
    const std::uint64_t from_seq = ctx_.sockets.output_updated(source).value_or(0);

    auto dst = ctx_.sockets.output(copy.to);
    if (!dst) {
        throw InterpretationError(InterpretationErrc::Pipeline,
                                  "Copy destination " + copy.to.to_string() + " has no image");
    }
    const bool fresh = ensure_backed(dst->image);
    const auto& g = ctx_.sockets.group(copy.to.socket_node());
    if (!fresh && !g.force && dst->seq >= from_seq && dst->copied_from == source) {
        return events;
    }

    ctx_.backend.copy_image(src->image, dst->image);
    ctx_.sockets.set_output_copied(copy.to, seq_, source);
    if (auto ev = process_view_socket(copy.to)) events.push_back(std::move(*ev));
    return events;
}

std::vector<ComputeEvent> Interpreter::execute_call(const instr::Call& call, std::uint32_t frame_size) {
    const auto& node = call.node;
    const auto& op = call.op;
    ensure_allocation(node, frame_size);

    auto& g = ctx_.sockets.group(node);
    const std::uint64_t hash = parameter_hash(op);
    bool inputs_updated = false;
    for (const auto& kv : op.inputs) {
        auto outer = ctx_.sockets.input_updated(node.node_socket(kv.first));
        auto inner = ctx_.sockets.output_updated(kv.second.second.node_socket("data"));
        if ((outer && *outer > g.seq) || (inner && *inner > g.seq)) inputs_updated = true;
    }
    if (!g.force && g.last_hash == hash && !inputs_updated) {
        // 子图没有重新执行：输出序号不超过子图内部 Output 节点看到的最新序号
        std::uint64_t inner_seq = 0;
        for (const auto& kv : op.outputs) {
            auto updated = ctx_.sockets.input_updated(kv.second.second.node_socket("data"));
            inner_seq = std::max(inner_seq, updated.value_or(0));
        }
        ctx_.sockets.set_outputs_sequence(node, std::min(seq_, inner_seq));
        return {};
    }

    for (auto& kv : g.typed_outputs) ensure_backed(kv.second.image);

    for (const auto& frame : frames_) {
        if (frame.graph == op.graph) {
            throw InterpretationError(InterpretationErrc::RecursionDetected,
                                      "Recursive call of " + op.graph.to_string() + " from " + node.to_string());
        }
    }

    auto substitutions = std::make_shared<SubstitutionMap>();
    for (const auto& kv : op.parameters) {
        (*substitutions)[kv.second.resource.parameter_node()].push_back(kv.second);
    }
    auto frame = make_frame(op.graph, g.size.allocation_size(), substitutions, node);

    g.last_hash = hash;
    g.force = false;
    seq_ += 1;
    g.seq = seq_;
    if (frame) {
        frame->start_time = std::chrono::steady_clock::now();
        frames_.push_back(std::move(*frame));
    }
    return {};
}

std::vector<ComputeEvent> Interpreter::execute_thumbnail(const instr::Thumbnail& thumbnail) {
    std::vector<ComputeEvent> events;
    const auto node = thumbnail.socket.socket_node();
    auto out = ctx_.sockets.output(thumbnail.socket);
    if (!out || !ctx_.backend.is_backed(out->image)) return events;

    auto& g = ctx_.sockets.group(node);
    const std::uint64_t socket_seq = out->seq;
    if (g.thumbnail && g.thumbnail_seq >= socket_seq) return events;

    const bool created = ctx_.sockets.ensure_thumbnail(node, out->type);
    ctx_.backend.generate_thumbnail(out->image, *g.thumbnail);
    g.thumbnail_seq = seq_;
    if (created) events.push_back(compute_events::ThumbnailCreated{node, *g.thumbnail});
    events.push_back(compute_events::ThumbnailUpdated{node});
    return events;
}

std::vector<ComputeEvent> Interpreter::execute(const NodeResource& node, const AtomicOperator& op,
                                               std::uint32_t frame_size) {
    std::vector<ComputeEvent> events = std::visit([&](auto&& o) -> std::vector<ComputeEvent> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Image>) {
            execute_image(node, o);
        } else if constexpr (std::is_same_v<T, Svg>) {
            execute_svg(node, o, frame_size);
        } else if constexpr (std::is_same_v<T, Input>) {
            execute_input(node);
        } else if constexpr (std::is_same_v<T, Output>) {
            return execute_output(node, o);
        } else {
            execute_atomic(node, op, frame_size);
        }
        return {};
    }, op);

    for (const auto& kv : operator_outputs(op)) {
        if (auto ev = process_view_socket(node.node_socket(kv.first))) events.push_back(std::move(*ev));
    }
    return events;
}

void Interpreter::execute_atomic(const NodeResource& node, const AtomicOperator& op, std::uint32_t frame_size) {
    ensure_allocation(node, frame_size);
    const SocketMap inputs = operator_inputs(op);
    const SocketMap outputs = operator_outputs(op);

    bool fresh = false;
    for (const auto& kv : outputs) {
        auto out = ctx_.sockets.output(node.node_socket(kv.first));
        if (!out) {
            throw InterpretationError(InterpretationErrc::Pipeline,
                                      "Missing output image for " + node.node_socket(kv.first).to_string());
        }
        fresh |= ensure_backed(out->image);
    }

    const std::uint64_t hash = parameter_hash(op);
    if (!fresh && !needs_recompute(node, hash, inputs)) return;

    const auto shader = shader_name(op);
    const ShaderDescription* description = shader ? ctx_.shaders.find(*shader) : nullptr;
    if (!description) {
        throw InterpretationError(InterpretationErrc::MissingShader,
                                  "No shader loaded for " + node.to_string());
    }

    const auto start = std::chrono::steady_clock::now();
    auto& g = ctx_.sockets.group(node);
    const std::uint32_t size = g.size.allocation_size();

    PassBindings bindings;
    std::uint32_t occupancy = 0;
    for (std::size_t i = 0; i < description->inputs.size(); ++i) {
        const auto& name = description->inputs[i];
        auto src = ctx_.sockets.input_source(node.node_socket(name));
        if (src && ctx_.backend.is_backed(src->image)) {
            bindings.inputs[name] = src->image;
            occupancy |= 1u << i;
            continue;
        }
        auto spec = inputs.find(name);
        if (spec == inputs.end() || !spec->second.optional) {
            throw InterpretationError(InterpretationErrc::Pipeline,
                                      "Input " + node.node_socket(name).to_string() + " has no backed image");
        }
    }
    for (const auto& kv : outputs) {
        bindings.outputs[kv.first] = ctx_.sockets.output(node.node_socket(kv.first))->image;
    }

    IntermediateImages intermediates(ctx_.backend);
    for (const auto& spec : description->intermediates) {
        ImageType type = ImageType::Grayscale;
        if (spec.type) {
            type = *spec.type;
        } else if (auto out = ctx_.sockets.output(node.node_socket(spec.type_from_output))) {
            type = out->type;
        }
        ImageHandle image = intermediates.create(size, type);
        ensure_backed(image);
        bindings.intermediates[spec.name] = image;
    }

    ComputePass pass;
    pass.shader = *shader;
    pass.uniforms = uniform_bytes(op);
    pass.occupancy = occupancy;
    pass.size = size;
    ctx_.backend.run_pass(pass, bindings);

    g.last_hash = hash;
    ctx_.sockets.set_outputs_updated(node, seq_);
    ctx_.sockets.update_timing(node, seconds_since(start));
}

void Interpreter::execute_image(const NodeResource& node, const Image& op) {
    ExternalImage* image = ctx_.external_images.find(op.resource);
    if (!image) {
        throw InterpretationError(InterpretationErrc::ExternalImage,
                                  "Unknown external image " + op.resource.to_string());
    }
    const auto socket = node.node_socket("image");
    auto out = ctx_.sockets.output(socket);
    if (!out) {
        throw InterpretationError(InterpretationErrc::Pipeline, "Missing output image for " + socket.to_string());
    }

    auto& g = ctx_.sockets.group(node);
    const std::uint64_t hash = combine_hash(parameter_hash(AtomicOperator(op)), image->hash());
    if (!g.force && g.last_hash == hash && !image->needs_loading() && ctx_.backend.is_backed(out->image)) {
        return;
    }

    const auto start = std::chrono::steady_clock::now();
    const cv::Mat* pixels = nullptr;
    try {
        pixels = &image->ensure_loaded();
    } catch (const GraphError& e) {
        throw InterpretationError(InterpretationErrc::ExternalImageRead, e.what());
    }

    // 图像节点的尺寸跟随源图像，不随栈帧缩放
    if (ctx_.sockets.resize(node, image->dimensions, false)) {
        ctx_.sockets.reinit_output_images(node, g.size.allocation_size());
        out = ctx_.sockets.output(socket);
    }
    ensure_backed(out->image);
    ctx_.backend.upload(out->image, fromCvMat(*pixels));

    g.last_hash = hash;
    ctx_.sockets.set_outputs_updated(node, seq_);
    ctx_.sockets.update_timing(node, seconds_since(start));
}

void Interpreter::execute_svg(const NodeResource& node, const Svg& op, std::uint32_t frame_size) {
    ensure_allocation(node, frame_size);
    const auto socket = node.node_socket("image");
    auto out = ctx_.sockets.output(socket);
    if (!out) {
        throw InterpretationError(InterpretationErrc::Pipeline, "Missing output image for " + socket.to_string());
    }
    const bool fresh = ensure_backed(out->image);

    auto& g = ctx_.sockets.group(node);
    const std::uint32_t size = g.size.allocation_size();
    const std::uint64_t hash = combine_hash(parameter_hash(AtomicOperator(op)), size);
    if (!fresh && !g.force && g.last_hash == hash) return;

    const auto start = std::chrono::steady_clock::now();
    cv::Mat pixels;
    try {
        pixels = ctx_.external_images.rasterize_svg(op.resource, size);
    } catch (const GraphError& e) {
        if (e.code() == GraphErrc::Io) throw InterpretationError(InterpretationErrc::ExternalImageRead, e.what());
        throw InterpretationError(InterpretationErrc::ExternalImage, e.what());
    }
    ctx_.backend.upload(out->image, fromCvMat(pixels));

    g.last_hash = hash;
    ctx_.sockets.set_outputs_updated(node, seq_);
    ctx_.sockets.update_timing(node, seconds_since(start));
}

void Interpreter::execute_input(const NodeResource& node) {
    const auto start = std::chrono::steady_clock::now();
    auto& g = ctx_.sockets.group(node);
    for (auto& kv : g.typed_outputs) ensure_backed(kv.second.image);
    ctx_.sockets.update_timing(node, seconds_since(start));
}

std::vector<ComputeEvent> Interpreter::execute_output(const NodeResource& node, const Output& op) {
    std::vector<ComputeEvent> events;
    const auto data = node.node_socket("data");
    auto binding = ctx_.sockets.input_binding(data);
    auto src = ctx_.sockets.input_source(data);
    if (!binding || !src) {
        throw InterpretationError(InterpretationErrc::Pipeline, "Output " + node.to_string() + " has no input");
    }

    auto& g = ctx_.sockets.group(node);
    const std::uint64_t hash = parameter_hash(AtomicOperator(op));
    const std::uint64_t input_seq = ctx_.sockets.input_updated(data).value_or(0);
    const bool up_to_date = !g.force && g.last_hash == hash && input_seq <= g.seq;

    if (!up_to_date) {
        const bool created = ctx_.sockets.ensure_thumbnail(node, output_image_type(op.output_type));
        ctx_.backend.generate_thumbnail(src->image, *g.thumbnail);
        const std::uint32_t size = ctx_.sockets.group(binding->socket_node()).size.allocation_size();
        events.push_back(compute_events::OutputReady{node, ctx_.backend.view(src->image), size, op.output_type});

        g.last_hash = hash;
        ctx_.sockets.set_outputs_updated(node, seq_);
        g.thumbnail_seq = seq_;
        if (created) events.push_back(compute_events::ThumbnailCreated{node, *g.thumbnail});
        events.push_back(compute_events::ThumbnailUpdated{node});
    }

    if (ctx_.exports.count(node)) export_output(node, src->image, src->type);
    return events;
}

void Interpreter::export_output(const NodeResource& node, ImageHandle image, ImageType type) {
    const ExportSpec& spec = ctx_.exports.at(node);
    cv::Mat converted;
    try {
        converted = ExportService::convert(ctx_.backend.download(image), type, spec.bit_depth, spec.color_space);
    } catch (const GraphError& e) {
        throw InterpretationError(InterpretationErrc::Export, e.what());
    }
    ctx_.exporter.write_async(std::move(converted), spec.path);
}

std::optional<ComputeEvent> Interpreter::process_view_socket(const SocketResource& socket) {
    auto& view = ctx_.view_socket;
    if (!view || view->socket != socket) return std::nullopt;
    auto out = ctx_.sockets.output(socket);
    if (!out || !ctx_.backend.is_backed(out->image)) return std::nullopt;
    if (view->last_seq && out->seq <= *view->last_seq) return std::nullopt;

    view->last_seq = out->seq;
    const std::uint32_t size = ctx_.sockets.group(socket.socket_node()).size.allocation_size();
    return ComputeEvent(compute_events::SocketViewReady{socket, ctx_.backend.view(out->image), size, out->type});
}

} // namespace mf
