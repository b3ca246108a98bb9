// node_config.hpp
#ifndef NODE_CONFIG_HPP
#define NODE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

struct StoreConfig {
  /// Compact a document (snapshot + log truncation) once its log holds this many deltas. 0 disables.
  size_t compact_after_deltas = 0;
};

struct SyncConfig {
  /// Outbound deltas per peer before LWW/counter coalescing kicks in and backpressure is reported.
  size_t max_queue_depth = 1024;

  /// Deltas per DeltaBatch message.
  size_t max_batch = 64;

  /// Reconnect delay for attempt n is min(backoff_base * 2^n, backoff_max).
  std::chrono::milliseconds backoff_base{500};
  std::chrono::milliseconds backoff_max{30000};

  /// Receive timeout of a peer worker thread between queue checks.
  std::chrono::milliseconds poll_interval{50};

  /// A steady peer re-sends its handshake this often; the answer repairs anything lost in transit.
  std::chrono::milliseconds anti_entropy_interval{5000};
};

struct ReconciliationConfig {
  std::chrono::milliseconds interval{std::chrono::minutes(10)};

  /// How long a round waits for each committee member's vote.
  std::chrono::milliseconds vote_timeout{2000};
};

struct NodeConfig {
  /// Path of the SQLite database; ":memory:" keeps everything in memory.
  std::string database_path = ":memory:";

  StoreConfig store;
  SyncConfig sync;
  ReconciliationConfig reconciliation;
};

#endif // NODE_CONFIG_HPP
