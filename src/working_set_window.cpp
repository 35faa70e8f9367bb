#include "working_set_window.hpp"

#include <algorithm>

namespace memsched {

WorkingSetWindow::WorkingSetWindow(size_t capacity)
    : capacity_{std::max<size_t>(1, capacity)} {}

uint32_t WorkingSetWindow::reference_count(uint32_t page) const {
  auto it = counts_.find(page);
  return it == counts_.end() ? 0 : it->second;
}

void WorkingSetWindow::evict_oldest() {
  uint32_t oldest = window_.front();
  window_.pop_front();
  auto it = counts_.find(oldest);
  if (it == counts_.end()) {
    return;
  }
  if (it->second <= 1) {
    counts_.erase(it);
  } else {
    --it->second;
  }
}

bool WorkingSetWindow::reference(uint32_t page) {
  bool fault = !contains(page);
  if (window_.size() >= capacity_) {
    evict_oldest();
  }
  window_.push_back(page);
  ++counts_[page];
  return fault;
}

}  // namespace memsched
