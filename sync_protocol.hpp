// sync_protocol.hpp
#ifndef SYNC_PROTOCOL_HPP
#define SYNC_PROTOCOL_HPP

#include "document_store.hpp"
#include "node_config.hpp"
#include "sync_transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <variant>

constexpr uint32_t CRDT_SYNC_PROTOCOL_VERSION = 1;

// -----------------------------------------
// Wire messages
// -----------------------------------------

/// First message on every link, in both directions. Re-sent periodically as anti-entropy.
struct HandshakeMessage {
  uint32_t version = CRDT_SYNC_PROTOCOL_VERSION;
  CrdtNodeId node;
  CrdtActorId actor;
  CrdtStateVectors state_vectors;

  bool operator==(const HandshakeMessage &) const = default;
};

/// Deltas of one document. Every delta must name `ref`.
struct DeltaBatchMessage {
  DocumentRef ref;
  CrdtVector<Delta> deltas;

  bool operator==(const DeltaBatchMessage &) const = default;
};

/// Confirms a DeltaBatch or Snapshot; `up_to_clock` is the highest delta clock applied (0 for snapshots).
struct AckMessage {
  DocumentRef ref;
  uint64_t up_to_clock = 0;

  bool operator==(const AckMessage &) const = default;
};

/// Full document state for a peer that is behind a truncated log.
struct SnapshotMessage {
  DocumentRef ref;
  CrdtBytes snapshot;

  bool operator==(const SnapshotMessage &) const = default;
};

/// Clean close.
struct GoodbyeMessage {
  std::string reason;

  bool operator==(const GoodbyeMessage &) const = default;
};

/// The alternative index is the wire tag.
using SyncMessage = std::variant<HandshakeMessage, DeltaBatchMessage, AckMessage, SnapshotMessage, GoodbyeMessage>;

CrdtBytes encode_message(const SyncMessage &message);

/// @throws DeserializeCorruption for truncated or malformed input
SyncMessage decode_message(const CrdtBytes &bytes);

// -----------------------------------------
// Outbound queue
// -----------------------------------------

/// Deltas waiting to be sent to one peer, oldest first.
///
/// The queue is bounded only softly: once it holds `max_depth` deltas, a new delta supersedes the
/// queued LWW assignments to the same field with lower stamps and the queued counter entries of
/// the same writer it dominates. Emptied deltas are folded into their successor on the actor's
/// chain. Ops of every other strategy are never dropped, so the queue can grow past the bound;
/// backpressured() reports that.
///
/// Thread-safe.
class OutboundQueue {
public:
  explicit OutboundQueue(size_t max_depth);

  /// Queues a delta; a delta already queued (same document, actor and clock) is ignored.
  void push(const Delta &delta);

  /// Removes the oldest deltas, up to `max`, as long as they belong to the same document.
  CrdtVector<Delta> pop_batch(size_t max);

  /// Puts an unsent batch back at the front.
  void requeue_front(CrdtVector<Delta> batch);

  /// Drops deltas the peer already has. Returns how many were dropped.
  size_t discard_covered(const CrdtStateVectors &peer);

  size_t size() const;
  bool empty() const;

  /// Whether the queue holds more deltas than its bound after coalescing.
  bool backpressured() const;

  /// Ops removed by coalescing so far.
  uint64_t coalesced() const;

  void clear();

private:
  size_t max_depth_;
  mutable std::mutex mutex_;
  std::deque<Delta> deltas_;
  uint64_t coalesced_ = 0;

  void coalesce_locked(const Delta &incoming);
  void fold_empty_locked();
};

// -----------------------------------------
// Backoff
// -----------------------------------------

/// Exponential reconnect delay: attempt n waits min(base * 2^n, max).
class Backoff {
public:
  Backoff(std::chrono::milliseconds base, std::chrono::milliseconds max);

  /// Delay before the next attempt; counts the attempt.
  std::chrono::milliseconds next();

  void reset() { attempts_ = 0; }
  uint32_t attempts() const { return attempts_; }

private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  uint32_t attempts_ = 0;
};

// -----------------------------------------
// Peer connection
// -----------------------------------------

enum class PeerState { Discovering, Handshaking, Syncing, Steady, Disconnected, Partitioned, Reconnecting };

const char *to_string(PeerState state);

struct PeerStats {
  uint64_t deltas_sent = 0;
  uint64_t deltas_received = 0;
  uint64_t snapshots_sent = 0;
  uint64_t snapshots_received = 0;
  uint64_t acks_received = 0;
  uint64_t reconnects = 0;
  uint64_t conflicts_skipped = 0; // remote deltas dropped for an immutable conflict
};

/// Sync session with one peer, driven by step().
///
/// States:
/// - Discovering: waiting for the first link. The node with the lower id dials, the other one
///   waits for the inbound channel.
/// - Handshaking / Reconnecting: link up, our Handshake sent, waiting for the peer's.
/// - Syncing: the deltas (or snapshots) the peer lacks were sent; waiting for their acks.
/// - Steady: caught up; new local deltas stream from the outbound queue.
/// - Partitioned: the link broke and the peer is not reachable. Disconnected: the link broke (or
///   the peer said goodbye) while the peer is still reachable, or the peer was banned.
///
/// After the backoff delay a broken link moves to Reconnecting, which redoes the handshake. A
/// peer that sends anything the schema cannot accept (or undecodable bytes) is banned: the rest of
/// its batch is discarded and it stays Disconnected.
///
/// Thread Safety:
/// enqueue() may be called from any thread. step(), attach() and close() serialize on an internal
/// mutex, so one worker thread (or a polling test) drives the connection.
class PeerConnection {
public:
  using Clock = std::chrono::steady_clock;

  PeerConnection(DocumentStore &store, SyncTransport &transport, CrdtNodeId peer, const SyncConfig &config);
  ~PeerConnection();

  PeerConnection(const PeerConnection &) = delete;
  PeerConnection &operator=(const PeerConnection &) = delete;

  const CrdtNodeId &peer() const { return peer_; }
  PeerState state() const { return state_.load(); }
  bool banned() const { return banned_.load(); }
  bool initiator() const { return initiator_; }

  /// Whether a link is currently up.
  bool linked() const { return linked_.load(); }

  /// Queues a delta unless the peer is known to have it.
  void enqueue(const Delta &delta);

  /// Hands over a channel the peer dialed. Replaces any current link.
  void attach(std::unique_ptr<SyncChannel> channel);

  /// Does one round of work: connects when due, receives for up to `wait`, sends what is queued.
  void step(Clock::time_point now, std::chrono::milliseconds wait);

  /// Says goodbye and drops the link; no reconnect is attempted afterwards.
  void close(const std::string &reason);

  size_t queued() const { return queue_.size(); }
  bool backpressured() const { return queue_.backpressured(); }
  PeerStats stats() const;

private:
  DocumentStore &store_;
  SyncTransport &transport_;
  CrdtNodeId peer_;
  SyncConfig config_;
  bool initiator_;

  std::mutex mutex_; // held by step/attach/close
  std::unique_ptr<SyncChannel> channel_;
  std::atomic<PeerState> state_{PeerState::Discovering};
  std::atomic<bool> banned_{false};
  std::atomic<bool> linked_{false};
  bool closed_ = false;
  bool ever_connected_ = false;
  Backoff backoff_;
  Clock::time_point next_attempt_{};
  Clock::time_point next_resync_{};
  size_t pending_acks_ = 0;

  OutboundQueue queue_;

  mutable std::mutex known_mutex_;
  CrdtStateVectors known_; // what the peer is known to hold

  mutable std::mutex stats_mutex_;
  PeerStats stats_;

  void connect_locked(Clock::time_point now);
  void begin_session_locked(std::unique_ptr<SyncChannel> channel, Clock::time_point now);
  void send_locked(const SyncMessage &message);
  void receive_locked(Clock::time_point now, std::chrono::milliseconds wait);
  void handle_locked(SyncMessage message, Clock::time_point now);
  void handle_handshake_locked(const HandshakeMessage &handshake, Clock::time_point now);
  void handle_batch_locked(const DeltaBatchMessage &batch);
  void send_catch_up_locked(const CrdtStateVectors &peer);
  void flush_locked();
  void link_failed_locked(const std::string &what, Clock::time_point now);
  void ban_locked(const std::string &why);
  void mark_known(const Delta &delta);
  void drop_channel_locked();
  void set_state(PeerState state);

  template <typename F> void count(F &&f) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    f(stats_);
  }
};

#endif // SYNC_PROTOCOL_HPP
