#pragma once
#include <cstdint>
#include <variant>
#include <vector>

#include "operators.hpp"
#include "resource.hpp"

namespace mf {

// 图 / 层栈编辑产生的事件，由 ComputeManager 消费以维护 socket 注册表。
namespace graph_events {
struct NodeAdded {
    NodeResource node;
    std::uint32_t size = 0;
};
struct NodeRemoved {
    NodeResource node;
};
struct NodeRenamed {
    NodeResource from;
    NodeResource to;
};
struct NodeResized {
    NodeResource node;
    std::uint32_t size = 0;
    bool scalable = true;
};
struct OutputSocketAdded {
    SocketResource socket;
    OperatorType type;
    bool external_data = false;
    std::uint32_t size = 0;
};
struct SocketMonomorphized {
    SocketResource socket;
    ImageType type;
};
struct SocketDemonomorphized {
    SocketResource socket;
};
struct ConnectedSockets {
    SocketResource from;
    SocketResource to;
};
struct DisconnectedSockets {
    SocketResource from;
    SocketResource to;
};
struct ComplexOperatorUpdated {
    NodeResource node;
    ComplexOperator op;
};
} // namespace graph_events

using GraphEvent = std::variant<graph_events::NodeAdded, graph_events::NodeRemoved,
                                graph_events::NodeRenamed, graph_events::NodeResized,
                                graph_events::OutputSocketAdded, graph_events::SocketMonomorphized,
                                graph_events::SocketDemonomorphized, graph_events::ConnectedSockets,
                                graph_events::DisconnectedSockets,
                                graph_events::ComplexOperatorUpdated>;

using GraphEvents = std::vector<GraphEvent>;

} // namespace mf
