// sync_transport.hpp
#ifndef SYNC_TRANSPORT_HPP
#define SYNC_TRANSPORT_HPP

#include "crdt.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/// Network address of a node. Distinct from the CRDT actor id a node writes as.
using CrdtNodeId = std::string;

/// Bidirectional, message-oriented link to one peer.
///
/// Messages arrive in order and unmodified or not at all. Every I/O failure is reported as
/// NetworkTransient; the connection is unusable afterwards.
class SyncChannel {
public:
  virtual ~SyncChannel() = default;

  virtual const CrdtNodeId &remote_node() const = 0;

  /// @throws NetworkTransient if the link is down
  virtual void send(const CrdtBytes &message) = 0;

  /// Waits up to `timeout` for the next message; nullopt when none arrived in time.
  /// @throws NetworkTransient if the link is down
  virtual std::optional<CrdtBytes> receive(std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

/// Discovery and connection establishment for one node.
class SyncTransport {
public:
  virtual ~SyncTransport() = default;

  virtual const CrdtNodeId &node_id() const = 0;

  /// Nodes currently reachable from this one.
  virtual CrdtVector<CrdtNodeId> discover() = 0;

  /// Opens a channel to `peer`.
  /// @throws NetworkTransient if the peer is unreachable
  virtual std::unique_ptr<SyncChannel> dial(const CrdtNodeId &peer) = 0;

  /// Next inbound channel another node dialed, or nullptr if none is waiting.
  virtual std::unique_ptr<SyncChannel> accept() = 0;
};

/// In-process network connecting any number of nodes, with partition simulation.
///
/// Every attached node gets a SyncTransport. partition() splits the nodes into groups that
/// cannot reach each other: links crossing a group boundary break immediately (messages in flight
/// are lost) and dialing across it fails until heal().
///
/// Thread Safety:
/// All methods, and all methods of the transports and channels it hands out, may be called
/// concurrently.
class MemoryNetwork {
public:
  MemoryNetwork();
  ~MemoryNetwork();

  MemoryNetwork(const MemoryNetwork &) = delete;
  MemoryNetwork &operator=(const MemoryNetwork &) = delete;

  /// @throws InvalidArgument if `node` is empty or already attached
  std::shared_ptr<SyncTransport> attach(const CrdtNodeId &node);

  /// Takes a node off the network, breaking its links.
  void detach(const CrdtNodeId &node);

  /// Nodes not named in any group form one more group each.
  void partition(const CrdtVector<CrdtVector<CrdtNodeId>> &groups);
  void heal();

  bool reachable(const CrdtNodeId &a, const CrdtNodeId &b) const;

  /// Messages handed to a receiver so far.
  uint64_t messages_delivered() const;

  struct Shared;

private:
  std::shared_ptr<Shared> shared_;
};

#endif // SYNC_TRANSPORT_HPP
