#include "kernel/services/compute_event_service.hpp"

#include <iterator>
#include <type_traits>

namespace mf {

void ComputeEventService::push(ComputeEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(std::move(event));
}

void ComputeEventService::push_all(std::vector<ComputeEvent> events) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.insert(buffer_.end(), std::make_move_iterator(events.begin()),
                   std::make_move_iterator(events.end()));
}

std::vector<ComputeEvent> ComputeEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComputeEvent> out;
    out.swap(buffer_);
    return out;
}

const char* compute_event_name(const ComputeEvent& ev) {
    return std::visit([](auto&& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, compute_events::OutputReady>) return "output_ready";
        else if constexpr (std::is_same_v<T, compute_events::ThumbnailCreated>) return "thumbnail_created";
        else if constexpr (std::is_same_v<T, compute_events::ThumbnailUpdated>) return "thumbnail_updated";
        else if constexpr (std::is_same_v<T, compute_events::ThumbnailDestroyed>) return "thumbnail_destroyed";
        else if constexpr (std::is_same_v<T, compute_events::SocketViewReady>) return "socket_view_ready";
        else if constexpr (std::is_same_v<T, compute_events::SocketCreated>) return "socket_created";
        else if constexpr (std::is_same_v<T, compute_events::SocketDestroyed>) return "socket_destroyed";
        else if constexpr (std::is_same_v<T, compute_events::ImageResourceAdded>) return "image_resource_added";
        else return "vram_usage";
    }, ev);
}

} // namespace mf
