// sync_protocol.cpp
#include "sync_protocol.hpp"
#include "crdt_codec.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"

#include <algorithm>

// -----------------------------------------
// Wire messages
// -----------------------------------------

namespace {

void encode_state_vectors(ByteWriter &w, const CrdtStateVectors &svs) {
  w.put_varint(svs.size());
  for (const auto &[ref, sv] : svs) {
    encode(w, ref);
    encode(w, sv);
  }
}

CrdtStateVectors decode_state_vectors(ByteReader &r) {
  CrdtStateVectors svs;
  size_t count = r.get_count();
  for (size_t i = 0; i < count; ++i) {
    DocumentRef ref = decode_ref(r);
    svs.insert_or_assign(std::move(ref), decode_version_vector(r));
  }
  return svs;
}

} // namespace

CrdtBytes encode_message(const SyncMessage &message) {
  ByteWriter w;
  w.put_u8(static_cast<uint8_t>(message.index()));
  if (const auto *handshake = std::get_if<HandshakeMessage>(&message)) {
    w.put_varint(handshake->version);
    w.put_string(handshake->node);
    w.put_string(handshake->actor);
    encode_state_vectors(w, handshake->state_vectors);
  } else if (const auto *batch = std::get_if<DeltaBatchMessage>(&message)) {
    encode(w, batch->ref);
    w.put_varint(batch->deltas.size());
    for (const auto &delta : batch->deltas) {
      encode(w, delta);
    }
  } else if (const auto *ack = std::get_if<AckMessage>(&message)) {
    encode(w, ack->ref);
    w.put_varint(ack->up_to_clock);
  } else if (const auto *snapshot = std::get_if<SnapshotMessage>(&message)) {
    encode(w, snapshot->ref);
    w.put_bytes(snapshot->snapshot);
  } else {
    w.put_string(std::get<GoodbyeMessage>(message).reason);
  }
  return w.take();
}

SyncMessage decode_message(const CrdtBytes &bytes) {
  ByteReader r(bytes);
  uint8_t tag = r.get_u8();
  SyncMessage message;
  switch (tag) {
  case 0: {
    HandshakeMessage handshake;
    uint64_t version = r.get_varint();
    if (version > UINT32_MAX) {
      throw DeserializeCorruption("Handshake version out of range");
    }
    handshake.version = static_cast<uint32_t>(version);
    handshake.node = r.get_string();
    handshake.actor = r.get_string();
    handshake.state_vectors = decode_state_vectors(r);
    message = std::move(handshake);
    break;
  }
  case 1: {
    DeltaBatchMessage batch;
    batch.ref = decode_ref(r);
    size_t count = r.get_count();
    batch.deltas.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      batch.deltas.push_back(decode_delta(r));
    }
    message = std::move(batch);
    break;
  }
  case 2: {
    AckMessage ack;
    ack.ref = decode_ref(r);
    ack.up_to_clock = r.get_varint();
    message = std::move(ack);
    break;
  }
  case 3: {
    SnapshotMessage snapshot;
    snapshot.ref = decode_ref(r);
    snapshot.snapshot = r.get_bytes();
    message = std::move(snapshot);
    break;
  }
  case 4:
    message = GoodbyeMessage{r.get_string()};
    break;
  default:
    throw DeserializeCorruption("Unknown sync message tag " + std::to_string(tag));
  }
  r.expect_end();
  return message;
}

// -----------------------------------------
// Outbound queue
// -----------------------------------------

OutboundQueue::OutboundQueue(size_t max_depth) : max_depth_(max_depth) {}

void OutboundQueue::push(const Delta &delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool queued = std::any_of(deltas_.begin(), deltas_.end(), [&](const Delta &d) {
    return d.clock == delta.clock && d.actor == delta.actor && d.ref == delta.ref;
  });
  if (queued) {
    return;
  }
  bool over = deltas_.size() >= max_depth_;
  if (over) {
    coalesce_locked(delta);
  }
  deltas_.push_back(delta);
  if (over) {
    fold_empty_locked();
  }
}

void OutboundQueue::coalesce_locked(const Delta &incoming) {
  for (const auto &op : incoming.ops) {
    if (op.strategy == CrdtStrategy::Lww) {
      CrdtStamp stamp = op.stamp(incoming.actor);
      for (auto &queued : deltas_) {
        if (queued.ref != incoming.ref) {
          continue;
        }
        coalesced_ += std::erase_if(queued.ops, [&](const FieldOp &old) {
          return old.strategy == CrdtStrategy::Lww && old.path == op.path && old.stamp(queued.actor) < stamp;
        });
      }
    } else if (op.strategy == CrdtStrategy::PnCounter) {
      const auto &counter = std::get<CounterOp>(op.op);
      for (auto &queued : deltas_) {
        if (queued.ref != incoming.ref) {
          continue;
        }
        coalesced_ += std::erase_if(queued.ops, [&](const FieldOp &old) {
          if (old.strategy != CrdtStrategy::PnCounter || old.path != op.path) {
            return false;
          }
          const auto &old_counter = std::get<CounterOp>(old.op);
          return old_counter.actor == counter.actor && old_counter.increments <= counter.increments &&
                 old_counter.decrements <= counter.decrements;
        });
      }
    }
  }
}

void OutboundQueue::fold_empty_locked() {
  // An emptied delta leaves the queue only when its successor on the chain is queued too; the
  // successor takes over its predecessor link. Otherwise it stays as an op-less link.
  for (auto it = deltas_.begin(); it != deltas_.end();) {
    if (!it->empty()) {
      ++it;
      continue;
    }
    auto successor = std::find_if(std::next(it), deltas_.end(), [&](const Delta &d) {
      return d.ref == it->ref && d.actor == it->actor && d.prev == it->clock;
    });
    if (successor == deltas_.end()) {
      ++it;
      continue;
    }
    successor->prev = it->prev;
    it = deltas_.erase(it);
  }
}

CrdtVector<Delta> OutboundQueue::pop_batch(size_t max) {
  std::lock_guard<std::mutex> lock(mutex_);
  CrdtVector<Delta> batch;
  while (!deltas_.empty() && batch.size() < max && (batch.empty() || deltas_.front().ref == batch.front().ref)) {
    batch.push_back(std::move(deltas_.front()));
    deltas_.pop_front();
  }
  return batch;
}

void OutboundQueue::requeue_front(CrdtVector<Delta> batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = batch.rbegin(); it != batch.rend(); ++it) {
    deltas_.push_front(std::move(*it));
  }
}

size_t OutboundQueue::discard_covered(const CrdtStateVectors &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::erase_if(deltas_, [&](const Delta &delta) {
    auto it = peer.find(delta.ref);
    return it != peer.end() && covers(it->second, delta);
  });
}

size_t OutboundQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deltas_.size();
}

bool OutboundQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deltas_.empty();
}

bool OutboundQueue::backpressured() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deltas_.size() > max_depth_;
}

uint64_t OutboundQueue::coalesced() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return coalesced_;
}

void OutboundQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  deltas_.clear();
}

// -----------------------------------------
// Backoff
// -----------------------------------------

Backoff::Backoff(std::chrono::milliseconds base, std::chrono::milliseconds max) : base_(base), max_(max) {}

std::chrono::milliseconds Backoff::next() {
  uint32_t shift = std::min<uint32_t>(attempts_, 20);
  ++attempts_;
  return std::min(max_, base_ * (int64_t{1} << shift));
}

// -----------------------------------------
// Peer connection
// -----------------------------------------

const char *to_string(PeerState state) {
  switch (state) {
  case PeerState::Discovering:
    return "discovering";
  case PeerState::Handshaking:
    return "handshaking";
  case PeerState::Syncing:
    return "syncing";
  case PeerState::Steady:
    return "steady";
  case PeerState::Disconnected:
    return "disconnected";
  case PeerState::Partitioned:
    return "partitioned";
  case PeerState::Reconnecting:
    return "reconnecting";
  }
  return "unknown";
}

PeerConnection::PeerConnection(DocumentStore &store, SyncTransport &transport, CrdtNodeId peer,
                               const SyncConfig &config)
    : store_(store), transport_(transport), peer_(std::move(peer)), config_(config),
      initiator_(transport.node_id() < peer_), backoff_(config.backoff_base, config.backoff_max),
      queue_(config.max_queue_depth) {}

PeerConnection::~PeerConnection() = default;

void PeerConnection::enqueue(const Delta &delta) {
  if (banned_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(known_mutex_);
    auto it = known_.find(delta.ref);
    if (it != known_.end() && covers(it->second, delta)) {
      return;
    }
  }
  queue_.push(delta);
}

void PeerConnection::attach(std::unique_ptr<SyncChannel> channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || banned_) {
    channel->close();
    return;
  }
  auto now = Clock::now();
  try {
    begin_session_locked(std::move(channel), now);
  } catch (const NetworkTransient &e) {
    link_failed_locked(e.what(), now);
  }
}

void PeerConnection::step(Clock::time_point now, std::chrono::milliseconds wait) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || banned_) {
    return;
  }

  switch (state()) {
  case PeerState::Discovering:
  case PeerState::Reconnecting:
    if (!channel_) {
      connect_locked(now);
    }
    break;
  case PeerState::Disconnected:
  case PeerState::Partitioned:
    if (now >= next_attempt_) {
      set_state(PeerState::Reconnecting);
      connect_locked(now);
    }
    break;
  default:
    break;
  }
  if (!channel_) {
    return;
  }

  try {
    receive_locked(now, wait);
    if (!channel_) {
      return;
    }
    if (state() == PeerState::Syncing && pending_acks_ == 0) {
      set_state(PeerState::Steady);
      backoff_.reset();
    }
    if (state() == PeerState::Steady) {
      flush_locked();
      if (now >= next_resync_) {
        next_resync_ = now + config_.anti_entropy_interval;
        send_locked(HandshakeMessage{CRDT_SYNC_PROTOCOL_VERSION, transport_.node_id(), store_.context().actor(),
                                     store_.state_vectors()});
      }
    }
  } catch (const NetworkTransient &e) {
    link_failed_locked(e.what(), now);
  } catch (const ProtocolViolation &e) {
    ban_locked(e.what());
  } catch (const DeserializeCorruption &e) {
    ban_locked(e.what());
  } catch (const StorageError &e) {
    // Local failure: drop the link, whatever was not persisted is re-sent after the handshake
    CRDT_LOG_ERROR("sync", "storage failure while syncing with " << peer_ << ": " << e.what());
    link_failed_locked(e.what(), now);
  }
}

void PeerConnection::close(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  if (!channel_) {
    return;
  }
  try {
    send_locked(GoodbyeMessage{reason});
  } catch (const NetworkTransient &e) {
    CRDT_LOG_DEBUG("sync", "goodbye to " << peer_ << " not delivered: " << e.what());
  }
  drop_channel_locked();
  set_state(PeerState::Disconnected);
}

PeerStats PeerConnection::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void PeerConnection::connect_locked(Clock::time_point now) {
  if (!initiator_) {
    // The peer dials; attach() starts the session
    return;
  }
  try {
    begin_session_locked(transport_.dial(peer_), now);
  } catch (const NetworkTransient &e) {
    link_failed_locked(e.what(), now);
  }
}

void PeerConnection::begin_session_locked(std::unique_ptr<SyncChannel> channel, Clock::time_point now) {
  if (channel_) {
    channel_->close();
  }
  channel_ = std::move(channel);
  linked_ = true;
  pending_acks_ = 0;
  {
    // Whatever was in flight on the old link may be lost; the handshake tells the truth
    std::lock_guard<std::mutex> lock(known_mutex_);
    known_.clear();
  }
  if (ever_connected_) {
    count([](PeerStats &s) { ++s.reconnects; });
    set_state(PeerState::Reconnecting);
  } else {
    set_state(PeerState::Handshaking);
  }
  ever_connected_ = true;
  next_resync_ = now + config_.anti_entropy_interval;
  send_locked(
      HandshakeMessage{CRDT_SYNC_PROTOCOL_VERSION, transport_.node_id(), store_.context().actor(), store_.state_vectors()});
}

void PeerConnection::send_locked(const SyncMessage &message) { channel_->send(encode_message(message)); }

void PeerConnection::receive_locked(Clock::time_point now, std::chrono::milliseconds wait) {
  auto message = channel_->receive(wait);
  size_t handled = 0;
  while (message) {
    handle_locked(decode_message(*message), now);
    if (!channel_ || ++handled >= config_.max_batch) {
      break;
    }
    message = channel_->receive(std::chrono::milliseconds(0));
  }
}

void PeerConnection::handle_locked(SyncMessage message, Clock::time_point now) {
  PeerState current = state();
  bool awaiting_handshake = current == PeerState::Handshaking || current == PeerState::Reconnecting;

  if (const auto *handshake = std::get_if<HandshakeMessage>(&message)) {
    handle_handshake_locked(*handshake, now);
    return;
  }
  if (awaiting_handshake) {
    throw ProtocolViolation("Peer " + peer_ + " sent data before its handshake");
  }

  if (const auto *batch = std::get_if<DeltaBatchMessage>(&message)) {
    handle_batch_locked(*batch);
  } else if (const auto *ack = std::get_if<AckMessage>(&message)) {
    if (pending_acks_ > 0) {
      --pending_acks_;
    }
    count([](PeerStats &s) { ++s.acks_received; });
    CRDT_LOG_DEBUG("sync", peer_ << " acked " << to_string(ack->ref) << " up to " << ack->up_to_clock);
  } else if (const auto *snapshot = std::get_if<SnapshotMessage>(&message)) {
    try {
      store_.merge_snapshot(snapshot->ref, snapshot->snapshot);
    } catch (const ImmutableConflict &e) {
      CRDT_LOG_WARN("sync", "snapshot of " << to_string(snapshot->ref) << " from " << peer_ << " skipped: " << e.what());
      count([](PeerStats &s) { ++s.conflicts_skipped; });
    }
    count([](PeerStats &s) { ++s.snapshots_received; });
    send_locked(AckMessage{snapshot->ref, 0});
  } else {
    const auto &goodbye = std::get<GoodbyeMessage>(message);
    CRDT_LOG_INFO("sync", "peer " << peer_ << " said goodbye: " << goodbye.reason);
    drop_channel_locked();
    pending_acks_ = 0;
    set_state(PeerState::Disconnected);
    next_attempt_ = now + backoff_.next();
  }
}

void PeerConnection::handle_handshake_locked(const HandshakeMessage &handshake, Clock::time_point now) {
  if (handshake.version != CRDT_SYNC_PROTOCOL_VERSION) {
    throw ProtocolViolation("Peer " + peer_ + " speaks protocol version " + std::to_string(handshake.version));
  }
  if (handshake.node != peer_) {
    throw ProtocolViolation("Peer " + peer_ + " identified itself as " + handshake.node);
  }
  {
    std::lock_guard<std::mutex> lock(known_mutex_);
    for (const auto &[ref, sv] : handshake.state_vectors) {
      vv_merge(known_[ref], sv);
    }
  }
  size_t dropped = queue_.discard_covered(handshake.state_vectors);
  if (dropped > 0) {
    CRDT_LOG_DEBUG("sync", "dropped " << dropped << " queued deltas " << peer_ << " already has");
  }

  send_catch_up_locked(handshake.state_vectors);

  PeerState current = state();
  if (current == PeerState::Handshaking || current == PeerState::Reconnecting) {
    CRDT_LOG_INFO("sync", "handshake with " << peer_ << " (actor " << handshake.actor << ") done, "
                                            << pending_acks_ << " messages to catch up");
    set_state(PeerState::Syncing);
    next_resync_ = now + config_.anti_entropy_interval;
  }
}

void PeerConnection::handle_batch_locked(const DeltaBatchMessage &batch) {
  for (const auto &delta : batch.deltas) {
    if (delta.ref != batch.ref) {
      throw ProtocolViolation("Batch for " + to_string(batch.ref) + " carries a delta for " + to_string(delta.ref));
    }
  }
  // One bad delta discards the whole batch
  store_.validate_remote(batch.deltas);

  uint64_t highest = 0;
  for (const auto &delta : batch.deltas) {
    // Before applying, so the delta is not echoed back to this peer
    mark_known(delta);
    try {
      store_.apply_remote(delta);
    } catch (const ImmutableConflict &e) {
      CRDT_LOG_WARN("sync", "delta from " << peer_ << " skipped: " << e.what());
      count([](PeerStats &s) { ++s.conflicts_skipped; });
    }
    highest = std::max(highest, delta.clock);
  }
  count([&](PeerStats &s) { s.deltas_received += batch.deltas.size(); });
  send_locked(AckMessage{batch.ref, highest});
}

void PeerConnection::send_catch_up_locked(const CrdtStateVectors &peer) {
  static const CrdtStateVector nothing;
  for (const auto &[ref, local] : store_.state_vectors()) {
    auto it = peer.find(ref);
    const CrdtStateVector &seen = it == peer.end() ? nothing : it->second;

    // Also run when `seen` covers `local`: deltas logged ahead of our own chain may still be news
    auto deltas = store_.deltas_since(ref, seen);
    if (!deltas) {
      send_locked(SnapshotMessage{ref, store_.snapshot(ref)});
      ++pending_acks_;
      count([](PeerStats &s) { ++s.snapshots_sent; });
      std::lock_guard<std::mutex> lock(known_mutex_);
      vv_merge(known_[ref], local);
      continue;
    }

    for (size_t start = 0; start < deltas->size(); start += config_.max_batch) {
      size_t end = std::min(deltas->size(), start + config_.max_batch);
      DeltaBatchMessage batch{ref, CrdtVector<Delta>(deltas->begin() + start, deltas->begin() + end)};
      send_locked(batch);
      ++pending_acks_;
      for (const auto &delta : batch.deltas) {
        mark_known(delta);
      }
      count([&](PeerStats &s) { s.deltas_sent += batch.deltas.size(); });
    }
  }
}

void PeerConnection::flush_locked() {
  while (true) {
    CrdtVector<Delta> batch = queue_.pop_batch(config_.max_batch);
    if (batch.empty()) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(known_mutex_);
      auto it = known_.find(batch.front().ref);
      if (it != known_.end()) {
        std::erase_if(batch, [&](const Delta &delta) { return covers(it->second, delta); });
      }
    }
    if (batch.empty()) {
      continue;
    }

    DocumentRef ref = batch.front().ref;
    try {
      send_locked(DeltaBatchMessage{ref, batch});
    } catch (const NetworkTransient &) {
      queue_.requeue_front(std::move(batch));
      throw;
    }
    ++pending_acks_;
    for (const auto &delta : batch) {
      mark_known(delta);
    }
    count([&](PeerStats &s) { s.deltas_sent += batch.size(); });
  }
}

void PeerConnection::link_failed_locked(const std::string &what, Clock::time_point now) {
  if (channel_) {
    drop_channel_locked();
  }
  pending_acks_ = 0;

  CrdtVector<CrdtNodeId> reachable = transport_.discover();
  bool visible = std::find(reachable.begin(), reachable.end(), peer_) != reachable.end();
  set_state(visible ? PeerState::Disconnected : PeerState::Partitioned);

  auto delay = backoff_.next();
  next_attempt_ = now + delay;
  CRDT_LOG_WARN("sync", "link to " << peer_ << " failed (" << what << "), " << to_string(state()) << ", retry in "
                                   << delay.count() << "ms");
}

void PeerConnection::ban_locked(const std::string &why) {
  CRDT_LOG_ERROR("sync", "disconnecting " << peer_ << " for a protocol violation: " << why);
  banned_ = true;
  if (channel_) {
    try {
      send_locked(GoodbyeMessage{"protocol violation"});
    } catch (const NetworkTransient &e) {
      CRDT_LOG_DEBUG("sync", "goodbye to " << peer_ << " not delivered: " << e.what());
    }
    drop_channel_locked();
  }
  pending_acks_ = 0;
  queue_.clear();
  set_state(PeerState::Disconnected);
}

void PeerConnection::mark_known(const Delta &delta) {
  // Only a delta continuing the known chain extends it; one that arrives ahead leaves a gap
  std::lock_guard<std::mutex> lock(known_mutex_);
  auto &seen = known_[delta.ref][delta.actor];
  if (delta.prev <= seen) {
    seen = std::max(seen, delta.clock);
  }
}

void PeerConnection::drop_channel_locked() {
  channel_->close();
  channel_.reset();
  linked_ = false;
}

void PeerConnection::set_state(PeerState state) {
  PeerState previous = state_.exchange(state);
  if (previous != state) {
    CRDT_LOG_DEBUG("sync", "peer " << peer_ << ": " << to_string(previous) << " -> " << to_string(state));
  }
}
