// peer_manager.cpp
#include "peer_manager.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"

PeerManager::PeerManager(DocumentStore &store, std::shared_ptr<SyncTransport> transport, SyncConfig config)
    : store_(store), transport_(std::move(transport)), config_(config) {
  if (!transport_) {
    throw InvalidArgument("PeerManager needs a transport");
  }
  listener_ = store_.add_delta_listener([this](const Delta &delta, DeltaSource) { dispatch(delta); });
}

PeerManager::~PeerManager() {
  stop();
  store_.remove_delta_listener(listener_);
  for (const auto &connection : connections()) {
    connection->close("shutdown");
  }
}

void PeerManager::discover() {
  for (const auto &peer : transport_->discover()) {
    connection_for(peer);
  }
  while (auto channel = transport_->accept()) {
    auto connection = connection_for(channel->remote_node());
    connection->attach(std::move(channel));
  }
}

void PeerManager::poll(Clock::time_point now) {
  discover();
  for (const auto &connection : connections()) {
    connection->step(now, std::chrono::milliseconds(0));
  }
}

void PeerManager::start() {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  if (running_.exchange(true)) {
    return;
  }
  for (const auto &[_, connection] : peers_) {
    workers_.emplace_back(&PeerManager::run_worker, this, connection);
  }
  discovery_thread_ = std::thread(&PeerManager::run_discovery, this);
  CRDT_LOG_INFO("sync", "node " << node_id() << " started syncing");
}

void PeerManager::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  wake_cv_.notify_all();
  if (discovery_thread_.joinable()) {
    discovery_thread_.join();
  }
  CrdtVector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    workers.swap(workers_);
  }
  for (auto &worker : workers) {
    worker.join();
  }
  CRDT_LOG_INFO("sync", "node " << node_id() << " stopped syncing");
}

CrdtVector<CrdtNodeId> PeerManager::peers() const {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  CrdtVector<CrdtNodeId> result;
  for (const auto &[peer, _] : peers_) {
    result.push_back(peer);
  }
  return result;
}

std::optional<PeerState> PeerManager::peer_state(const CrdtNodeId &peer) const {
  auto connection = find(peer);
  if (!connection) {
    return std::nullopt;
  }
  return connection->state();
}

std::optional<PeerStats> PeerManager::peer_stats(const CrdtNodeId &peer) const {
  auto connection = find(peer);
  if (!connection) {
    return std::nullopt;
  }
  return connection->stats();
}

size_t PeerManager::queued(const CrdtNodeId &peer) const {
  auto connection = find(peer);
  return connection ? connection->queued() : 0;
}

bool PeerManager::backpressured() const {
  for (const auto &connection : connections()) {
    if (connection->backpressured()) {
      return true;
    }
  }
  return false;
}

std::shared_ptr<PeerConnection> PeerManager::connection_for(const CrdtNodeId &peer) {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  auto it = peers_.find(peer);
  if (it != peers_.end()) {
    return it->second;
  }
  auto connection = std::make_shared<PeerConnection>(store_, *transport_, peer, config_);
  peers_.emplace(peer, connection);
  CRDT_LOG_INFO("sync", "node " << node_id() << " discovered " << peer);

  if (running_) {
    workers_.emplace_back(&PeerManager::run_worker, this, connection);
  }
  return connection;
}

std::shared_ptr<PeerConnection> PeerManager::find(const CrdtNodeId &peer) const {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  auto it = peers_.find(peer);
  return it == peers_.end() ? nullptr : it->second;
}

CrdtVector<std::shared_ptr<PeerConnection>> PeerManager::connections() const {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  CrdtVector<std::shared_ptr<PeerConnection>> result;
  for (const auto &[_, connection] : peers_) {
    result.push_back(connection);
  }
  return result;
}

void PeerManager::dispatch(const Delta &delta) {
  for (const auto &connection : connections()) {
    connection->enqueue(delta);
  }
}

void PeerManager::run_worker(std::shared_ptr<PeerConnection> connection) {
  while (running_) {
    try {
      connection->step(Clock::now(), config_.poll_interval);
    } catch (const CrdtException &e) {
      CRDT_LOG_ERROR("sync", "worker for " << connection->peer() << " failed: " << e.what());
    }
    if (!connection->linked()) {
      idle();
    }
  }
}

void PeerManager::run_discovery() {
  while (running_) {
    try {
      discover();
    } catch (const CrdtException &e) {
      CRDT_LOG_ERROR("sync", "discovery failed: " << e.what());
    }
    idle();
  }
}

void PeerManager::idle() {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  wake_cv_.wait_for(lock, config_.poll_interval, [this] { return !running_; });
}
