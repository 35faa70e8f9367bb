#ifndef MEMSCHED_WORKING_SET_WINDOW_H_
#define MEMSCHED_WORKING_SET_WINDOW_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>

namespace memsched {

// Bounded FIFO of the most recent page references. A page is resident
// while at least one of its references is still inside the window.
class WorkingSetWindow {
 public:
  explicit WorkingSetWindow(size_t capacity);

  // Records one reference, evicting the oldest when full.
  // Returns true when the page was not resident (a page fault).
  bool reference(uint32_t page);

  bool contains(uint32_t page) const { return counts_.count(page) > 0; }
  uint32_t reference_count(uint32_t page) const;

  size_t working_set_size() const { return counts_.size(); }
  size_t size() const { return window_.size(); }
  size_t capacity() const { return capacity_; }

 private:
  void evict_oldest();

  size_t capacity_;
  std::deque<uint32_t> window_;
  std::unordered_map<uint32_t, uint32_t> counts_;  // page -> references in window, never 0
};

}  // namespace memsched

#endif
