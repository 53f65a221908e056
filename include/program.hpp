#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "operators.hpp"
#include "resource.hpp"

namespace mf {

enum class LinearizationMode {
    // 每个节点只执行一次，扇出通过 Move 复用
    Topological,
    // 每条入边都重新执行上游节点
    FullTraversal,
};

namespace instr {
// 将输入绑定到已有输出，不做任何 GPU 工作
struct Move {
    SocketResource from;
    SocketResource to;
};
struct Execute {
    NodeResource node;
    AtomicOperator op;
};
struct Call {
    NodeResource node;
    ComplexOperator op;
};
struct Copy {
    SocketResource from;
    SocketResource to;
};
struct Thumbnail {
    SocketResource socket;
};
} // namespace instr

using Instruction = std::variant<instr::Move, instr::Execute, instr::Call, instr::Copy, instr::Thumbnail>;

// Execute 与 Call 推进栈帧的 step 计数
inline bool is_execution_step(const Instruction& i) {
    return std::holds_alternative<instr::Execute>(i) || std::holds_alternative<instr::Call>(i);
}

// 被调用的子图中不需要执行的指令
bool is_call_skippable(const Instruction& i);

std::string describe(const Instruction& i);

struct UsePoint {
    std::size_t creation = 0;
    std::size_t last = std::numeric_limits<std::size_t>::max();
};

/**
 * @brief 一次线性化的结果：有序指令序列加上每个节点资源的使用窗口。
 *
 * 安装到 ProgramArena 之后只读，多个栈帧可同时引用同一个 Program。
 */
struct Program {
    std::vector<Instruction> instructions;
    std::unordered_map<NodeResource, UsePoint> use_points;

    // 使用窗口 [creation, last] 覆盖 step 的所有资源
    std::vector<NodeResource> retention_set_at(std::size_t step) const;
    std::size_t execution_steps() const;
};

using ProgramHandle = std::size_t;

class ProgramArena {
public:
    // 同一个图重复安装时复用原槽位，句柄保持不变
    ProgramHandle install(const GraphResource& graph, Program program);
    std::optional<ProgramHandle> find(const GraphResource& graph) const;
    const Program& get(ProgramHandle handle) const;
    bool remove(const GraphResource& graph);
    void rename(const GraphResource& from, const GraphResource& to);
    void clear();
    std::size_t size() const { return by_graph_.size(); }

private:
    std::vector<std::optional<Program>> slots_;
    std::unordered_map<GraphResource, ProgramHandle> by_graph_;
    std::vector<ProgramHandle> free_;
};

} // namespace mf
