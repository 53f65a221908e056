#pragma once
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "gpu/compute_backend.hpp"
#include "mf_types.hpp"
#include "resource.hpp"

namespace mf {

// 计算侧向前端发出的事件
namespace compute_events {
struct OutputReady {
    NodeResource node;
    BackendImageView image;
    std::uint32_t size = 0;
    OutputType output_type = OutputType::Value;
};
struct ThumbnailCreated {
    NodeResource node;
    ThumbnailHandle thumbnail = 0;
};
struct ThumbnailUpdated {
    NodeResource node;
};
struct ThumbnailDestroyed {
    NodeResource node;
};
struct SocketViewReady {
    SocketResource socket;
    BackendImageView image;
    std::uint32_t size = 0;
    ImageType type = ImageType::Grayscale;
};
struct SocketCreated {
    SocketResource socket;
    ImageType type = ImageType::Grayscale;
};
struct SocketDestroyed {
    SocketResource socket;
};
struct ImageResourceAdded {
    ImageResource resource;
    ColorSpace color_space = ColorSpace::Srgb;
    bool packed = false;
};
struct VramUsage {
    std::size_t bytes_used = 0;
    std::size_t bytes_budget = 0;
};
} // namespace compute_events

using ComputeEvent = std::variant<compute_events::OutputReady, compute_events::ThumbnailCreated,
                                  compute_events::ThumbnailUpdated, compute_events::ThumbnailDestroyed,
                                  compute_events::SocketViewReady, compute_events::SocketCreated,
                                  compute_events::SocketDestroyed, compute_events::ImageResourceAdded,
                                  compute_events::VramUsage>;

const char* compute_event_name(const ComputeEvent& ev);

} // namespace mf
