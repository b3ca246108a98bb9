// sync_transport.cpp
#include "sync_transport.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"

#include <deque>

namespace {

/// Both directions of one link. Guarded by the network mutex.
struct Pipe {
  CrdtNodeId ends[2];
  std::deque<CrdtBytes> inbox[2]; // inbox[i] is read by ends[i]
  bool closed = false;

  void close() {
    closed = true;
    inbox[0].clear();
    inbox[1].clear();
  }
};

} // namespace

struct MemoryNetwork::Shared {
  mutable std::mutex mutex;
  std::condition_variable cv;

  CrdtSortedSet<CrdtNodeId> attached;
  CrdtSortedMap<CrdtNodeId, size_t> group_of; // empty when not partitioned
  bool partitioned = false;
  size_t next_group = 0;

  CrdtVector<std::weak_ptr<Pipe>> pipes;
  CrdtSortedMap<CrdtNodeId, std::deque<std::shared_ptr<Pipe>>> pending; // dialed, not yet accepted

  uint64_t delivered = 0;

  bool reachable_locked(const CrdtNodeId &a, const CrdtNodeId &b) const {
    if (!attached.contains(a) || !attached.contains(b)) {
      return false;
    }
    if (!partitioned) {
      return true;
    }
    return group_of.at(a) == group_of.at(b);
  }

  /// Breaks every link whose ends can no longer reach each other.
  void break_links_locked() {
    std::erase_if(pipes, [](const std::weak_ptr<Pipe> &weak) { return weak.expired(); });
    for (const auto &weak : pipes) {
      auto pipe = weak.lock();
      if (pipe && !pipe->closed && !reachable_locked(pipe->ends[0], pipe->ends[1])) {
        pipe->close();
      }
    }
    for (auto &[node, queue] : pending) {
      std::erase_if(queue, [](const std::shared_ptr<Pipe> &pipe) { return pipe->closed; });
    }
    cv.notify_all();
  }

  size_t group_for_locked(const CrdtNodeId &node) {
    auto [it, inserted] = group_of.try_emplace(node, next_group);
    if (inserted) {
      ++next_group;
    }
    return it->second;
  }
};

namespace {

class MemoryChannel : public SyncChannel {
public:
  MemoryChannel(std::shared_ptr<MemoryNetwork::Shared> shared, std::shared_ptr<Pipe> pipe, int side)
      : shared_(std::move(shared)), pipe_(std::move(pipe)), side_(side) {}

  ~MemoryChannel() override { close(); }

  const CrdtNodeId &remote_node() const override { return pipe_->ends[1 - side_]; }

  void send(const CrdtBytes &message) override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (pipe_->closed) {
      throw NetworkTransient("Link to " + remote_node() + " is down");
    }
    pipe_->inbox[1 - side_].push_back(message);
    shared_->cv.notify_all();
  }

  std::optional<CrdtBytes> receive(std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    auto &inbox = pipe_->inbox[side_];
    shared_->cv.wait_for(lock, timeout, [&] { return !inbox.empty() || pipe_->closed; });
    if (pipe_->closed) {
      throw NetworkTransient("Link to " + remote_node() + " is down");
    }
    if (inbox.empty()) {
      return std::nullopt;
    }
    CrdtBytes message = std::move(inbox.front());
    inbox.pop_front();
    ++shared_->delivered;
    return message;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!pipe_->closed) {
      pipe_->close();
      shared_->cv.notify_all();
    }
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return !pipe_->closed;
  }

private:
  std::shared_ptr<MemoryNetwork::Shared> shared_;
  std::shared_ptr<Pipe> pipe_;
  int side_;
};

class MemoryTransport : public SyncTransport {
public:
  MemoryTransport(std::shared_ptr<MemoryNetwork::Shared> shared, CrdtNodeId node)
      : shared_(std::move(shared)), node_(std::move(node)) {}

  const CrdtNodeId &node_id() const override { return node_; }

  CrdtVector<CrdtNodeId> discover() override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    CrdtVector<CrdtNodeId> result;
    for (const auto &other : shared_->attached) {
      if (other != node_ && shared_->reachable_locked(node_, other)) {
        result.push_back(other);
      }
    }
    return result;
  }

  std::unique_ptr<SyncChannel> dial(const CrdtNodeId &peer) override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (peer == node_ || !shared_->reachable_locked(node_, peer)) {
      throw NetworkTransient("Cannot reach " + peer + " from " + node_);
    }
    auto pipe = std::make_shared<Pipe>();
    pipe->ends[0] = node_;
    pipe->ends[1] = peer;
    shared_->pipes.push_back(pipe);
    shared_->pending[peer].push_back(pipe);
    return std::make_unique<MemoryChannel>(shared_, pipe, 0);
  }

  std::unique_ptr<SyncChannel> accept() override {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    auto it = shared_->pending.find(node_);
    if (it == shared_->pending.end() || it->second.empty()) {
      return nullptr;
    }
    auto pipe = std::move(it->second.front());
    it->second.pop_front();
    return std::make_unique<MemoryChannel>(shared_, std::move(pipe), 1);
  }

private:
  std::shared_ptr<MemoryNetwork::Shared> shared_;
  CrdtNodeId node_;
};

} // namespace

MemoryNetwork::MemoryNetwork() : shared_(std::make_shared<Shared>()) {}

MemoryNetwork::~MemoryNetwork() {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->attached.clear();
  shared_->break_links_locked();
}

std::shared_ptr<SyncTransport> MemoryNetwork::attach(const CrdtNodeId &node) {
  if (node.empty()) {
    throw InvalidArgument("Node id must not be empty");
  }
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (!shared_->attached.insert(node).second) {
    throw InvalidArgument("Node " + node + " is already attached");
  }
  if (shared_->partitioned) {
    shared_->group_for_locked(node);
  }
  return std::make_shared<MemoryTransport>(shared_, node);
}

void MemoryNetwork::detach(const CrdtNodeId &node) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->attached.erase(node);
  shared_->group_of.erase(node);
  shared_->pending.erase(node);
  shared_->break_links_locked();
}

void MemoryNetwork::partition(const CrdtVector<CrdtVector<CrdtNodeId>> &groups) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->group_of.clear();
  shared_->next_group = 0;
  for (const auto &group : groups) {
    size_t index = shared_->next_group++;
    for (const auto &node : group) {
      shared_->group_of[node] = index;
    }
  }
  for (const auto &node : shared_->attached) {
    shared_->group_for_locked(node);
  }
  shared_->partitioned = true;
  shared_->break_links_locked();
  CRDT_LOG_INFO("network", "partitioned into " << shared_->next_group << " groups");
}

void MemoryNetwork::heal() {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->partitioned = false;
  shared_->group_of.clear();
  shared_->next_group = 0;
  CRDT_LOG_INFO("network", "partition healed");
}

bool MemoryNetwork::reachable(const CrdtNodeId &a, const CrdtNodeId &b) const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->reachable_locked(a, b);
}

uint64_t MemoryNetwork::messages_delivered() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->delivered;
}
