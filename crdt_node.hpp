// crdt_node.hpp
#ifndef CRDT_NODE_HPP
#define CRDT_NODE_HPP

#include "document_storage.hpp"
#include "document_store.hpp"
#include "ledger.hpp"
#include "node_config.hpp"
#include "peer_manager.hpp"
#include "reconciliation.hpp"

#include <functional>
#include <memory>

/// One complete replica: storage, identity, document store, ledger, sync and (optionally) a seat
/// running reconciliation rounds, all built from a NodeConfig.
///
/// Construction opens the database, restores the persisted identity and loads every document.
/// Corrupted documents are skipped and listed in load_report().
class CrdtNode {
public:
  using SchemaSetup = std::function<void(SchemaRegistry &)>;

  /// `transport` may be null for a node that never syncs. `actor` only applies to a fresh database;
  /// empty means a generated UUID.
  /// @throws StorageError if the database cannot be opened
  CrdtNode(NodeConfig config, std::shared_ptr<SyncTransport> transport, const SchemaSetup &schemas = {},
           const CrdtActorId &actor = "");
  ~CrdtNode();

  CrdtNode(const CrdtNode &) = delete;
  CrdtNode &operator=(const CrdtNode &) = delete;

  const NodeConfig &config() const { return config_; }
  NodeContext &context() { return *ctx_; }
  DocumentStore &store() { return *store_; }
  Ledger &ledger() { return *ledger_; }
  const LoadReport &load_report() const { return load_report_; }

  /// @throws InvalidArgument when the node has no transport
  PeerManager &sync();
  bool has_sync() const { return sync_ != nullptr; }

  /// Makes this node the one that applies reconciliation rounds, with the given committee.
  /// @throws InvalidArgument for fewer than 4 members
  void enable_reconciliation(CrdtVector<std::shared_ptr<CommitteeMember>> committee);
  ReconciliationScheduler *reconciliation() { return scheduler_.get(); }

  /// Starts the sync workers and, if enabled, the reconciliation timer.
  void start();
  void stop();

private:
  NodeConfig config_;
  SchemaRegistry schemas_;
  std::unique_ptr<DocumentStorage> storage_;
  std::unique_ptr<NodeContext> ctx_;
  std::unique_ptr<DocumentStore> store_;
  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<PeerManager> sync_;
  std::unique_ptr<ReconciliationEngine> engine_;
  std::unique_ptr<ReconciliationScheduler> scheduler_;
  LoadReport load_report_;
};

#endif // CRDT_NODE_HPP
