#include "round_robin.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

#include "numeric.hpp"

namespace memsched {

namespace {

double lookup(const TickMap& map, const std::string& pid, double fallback) {
  auto it = map.find(pid);
  return it == map.end() ? fallback : it->second;
}

// FIFO of pids with O(1) membership.
class ReadyQueue {
 public:
  bool contains(const std::string& pid) const { return members_.count(pid) > 0; }
  bool empty() const { return queue_.empty(); }

  void push(const std::string& pid) {
    if (members_.insert(pid).second) {
      queue_.push_back(pid);
    }
  }

  std::string pop() {
    std::string pid = std::move(queue_.front());
    queue_.pop_front();
    members_.erase(pid);
    return pid;
  }

 private:
  std::deque<std::string> queue_;
  std::unordered_set<std::string> members_;
};

}  // namespace

Timeline simulate_round_robin(const std::vector<std::string>& pids,
                              const TickMap& bursts, const TickMap& quanta,
                              const TickMap& arrivals) {
  std::unordered_map<std::string, int64_t> remaining;
  std::unordered_map<std::string, int64_t> arrival;
  std::unordered_map<std::string, int64_t> quantum;
  for (const auto& pid : pids) {
    remaining[pid] = clamp_non_negative_int(lookup(bursts, pid, 0.0));
    arrival[pid] = clamp_non_negative_int(lookup(arrivals, pid, 0.0));
    quantum[pid] = clamp_positive_int(lookup(quanta, pid, 1.0));
  }

  std::vector<std::pair<int64_t, std::string>> pending;
  pending.reserve(pids.size());
  for (const auto& pid : pids) {
    pending.emplace_back(arrival[pid], pid);
  }
  std::sort(pending.begin(), pending.end());

  size_t next_arrival = 0;
  int64_t now = 0;
  Timeline timeline;
  ReadyQueue ready;

  auto admit_arrivals = [&](int64_t t) {
    while (next_arrival < pending.size() && pending[next_arrival].first <= t) {
      const std::string& pid = pending[next_arrival].second;
      if (remaining[pid] > 0) {
        ready.push(pid);
      }
      ++next_arrival;
    }
  };

  // Idle CPU: skip ahead until something runnable arrives. Zero-burst
  // arrivals are consumed without being queued, so this may take several hops.
  auto jump_to_next_arrival = [&]() {
    while (ready.empty() && next_arrival < pending.size()) {
      now = std::max(now, pending[next_arrival].first);
      admit_arrivals(now);
    }
  };

  admit_arrivals(now);
  jump_to_next_arrival();

  while (!ready.empty()) {
    std::string pid = ready.pop();
    if (remaining[pid] <= 0) {
      admit_arrivals(now);
      jump_to_next_arrival();
      continue;
    }

    int64_t use = std::max<int64_t>(1, std::min(quantum[pid], remaining[pid]));
    timeline.push_back(Slice{pid, now, now + use});
    remaining[pid] -= use;
    now += use;

    admit_arrivals(now);
    if (remaining[pid] > 0) {
      ready.push(pid);
    }

    if (ready.empty()) {
      // Anything already arrived but not queued gets another chance.
      for (const auto& p : pids) {
        if (remaining[p] > 0 && arrival[p] <= now) {
          ready.push(p);
        }
      }
      jump_to_next_arrival();
    }
  }

  return timeline;
}

}  // namespace memsched
