// peer_manager.hpp
#ifndef PEER_MANAGER_HPP
#define PEER_MANAGER_HPP

#include "sync_protocol.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

/// Keeps one PeerConnection per discovered node and feeds it every delta the store accepts.
///
/// Two ways to drive it:
/// - start(): a discovery thread plus one worker thread per peer; stop() (or the destructor)
///   says goodbye to every peer and joins them.
/// - poll(): one non-blocking round over discovery and every connection on the calling thread,
///   with an explicit time so backoff can be tested without sleeping.
///
/// Local deltas reach the connections by message passing: the store's delta listener only pushes
/// them onto each peer's outbound queue.
class PeerManager {
public:
  using Clock = PeerConnection::Clock;

  PeerManager(DocumentStore &store, std::shared_ptr<SyncTransport> transport, SyncConfig config = {});
  ~PeerManager();

  PeerManager(const PeerManager &) = delete;
  PeerManager &operator=(const PeerManager &) = delete;

  const CrdtNodeId &node_id() const { return transport_->node_id(); }

  /// Creates connections for newly reachable nodes and hands inbound links to them.
  void discover();

  void poll(Clock::time_point now = Clock::now());

  void start();
  void stop();
  bool running() const { return running_.load(); }

  CrdtVector<CrdtNodeId> peers() const;
  std::optional<PeerState> peer_state(const CrdtNodeId &peer) const;
  std::optional<PeerStats> peer_stats(const CrdtNodeId &peer) const;

  /// Deltas waiting for `peer`, 0 for unknown peers.
  size_t queued(const CrdtNodeId &peer) const;

  /// Whether any peer's outbound queue is past its bound.
  bool backpressured() const;

private:
  DocumentStore &store_;
  std::shared_ptr<SyncTransport> transport_;
  SyncConfig config_;
  SubscriptionId listener_;

  mutable std::mutex peers_mutex_;
  CrdtSortedMap<CrdtNodeId, std::shared_ptr<PeerConnection>> peers_;
  CrdtVector<std::thread> workers_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread discovery_thread_;

  std::shared_ptr<PeerConnection> connection_for(const CrdtNodeId &peer);
  std::shared_ptr<PeerConnection> find(const CrdtNodeId &peer) const;
  CrdtVector<std::shared_ptr<PeerConnection>> connections() const;
  void dispatch(const Delta &delta);
  void run_worker(std::shared_ptr<PeerConnection> connection);
  void run_discovery();
  void idle();
};

#endif // PEER_MANAGER_HPP
