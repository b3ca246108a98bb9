// node_context.cpp
#include "node_context.hpp"
#include "crdt_errors.hpp"

#include <chrono>

NodeContext::NodeContext(CrdtActorId actor, uint64_t clock) : actor_(std::move(actor)) {
  if (actor_.empty()) {
    throw InvalidArgument("Actor id must not be empty");
  }
  clock_.set_time(clock);
}

uint64_t NodeContext::tick() {
  std::lock_guard<std::mutex> lock(mutex_);
  return clock_.tick();
}

uint64_t NodeContext::tick_n(uint64_t n) {
  std::lock_guard<std::mutex> lock(mutex_);
  return clock_.tick_n(n);
}

void NodeContext::observe(uint64_t remote_clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_.observe(remote_clock);
}

uint64_t NodeContext::clock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clock_.current_time();
}

bool NodeContext::rewind(uint64_t expected, uint64_t to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (clock_.current_time() != expected) {
    return false;
  }
  clock_.set_time(to);
  return true;
}

int64_t NodeContext::wall_time_ms() const {
  WallClock clock;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    clock = wall_clock_;
  }
  if (clock) {
    return clock();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void NodeContext::set_wall_clock(WallClock clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  wall_clock_ = std::move(clock);
}
