// node_context.hpp
#ifndef NODE_CONTEXT_HPP
#define NODE_CONTEXT_HPP

#include "crdt.hpp"

#include <functional>
#include <mutex>

/// Identity and Lamport clock of one node.
///
/// Every component of a node shares one context; nothing about the actor or the clock is
/// process-wide, so several nodes can live in one process (as the tests do).
class NodeContext {
public:
  /// Milliseconds since the epoch. Replaceable for tests.
  using WallClock = std::function<int64_t()>;

  explicit NodeContext(CrdtActorId actor, uint64_t clock = 0);

  const CrdtActorId &actor() const { return actor_; }

  /// Next clock value for a local event.
  uint64_t tick();

  /// Reserves `n` consecutive clock values and returns the first.
  uint64_t tick_n(uint64_t n);

  /// Moves the clock past a remotely observed value.
  void observe(uint64_t remote_clock);

  uint64_t clock() const;

  /// Undoes ticks of an aborted transaction: moves the clock back to `to` only if it still reads
  /// `expected`, i.e. nobody ticked in between.
  bool rewind(uint64_t expected, uint64_t to);

  int64_t wall_time_ms() const;
  void set_wall_clock(WallClock clock);

private:
  CrdtActorId actor_;
  mutable std::mutex mutex_;
  LogicalClock clock_;
  WallClock wall_clock_;
};

#endif // NODE_CONTEXT_HPP
