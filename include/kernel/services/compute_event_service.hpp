#pragma once

#include <mutex>
#include <vector>

#include "kernel/compute_events.hpp"

namespace mf {

class ComputeEventService {
 public:
  void push(ComputeEvent event);
  void push_all(std::vector<ComputeEvent> events);
  std::vector<ComputeEvent> drain();

 private:
  std::mutex mutex_;
  std::vector<ComputeEvent> buffer_;
};

}  // namespace mf
