// document_store.hpp
#ifndef DOCUMENT_STORE_HPP
#define DOCUMENT_STORE_HPP

#include "document.hpp"
#include "document_storage.hpp"
#include "node_config.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

using SubscriptionId = uint64_t;
using SubscriptionCallback = std::function<void(const DocumentView &)>;

enum class DeltaSource { Local, Remote };

/// Observes every delta the store accepts; the sync layer forwards them to peers.
using DeltaListener = std::function<void(const Delta &, DeltaSource)>;

using WriteFn = std::function<void(DocumentWriter &)>;

class DocumentStore;

/// Handle passed to a transaction body.
///
/// Writers hold their document's lock until the transaction ends. Reads of a document already
/// written in this transaction see the staged state.
class StoreTransaction {
public:
  StoreTransaction(const StoreTransaction &) = delete;
  StoreTransaction &operator=(const StoreTransaction &) = delete;

  DocumentWriter &writer(const DocumentRef &ref);
  DocumentView read(const DocumentRef &ref);

private:
  friend class DocumentStore;

  struct Entry {
    std::shared_ptr<Document> document;
    std::unique_lock<std::mutex> lock;
    std::unique_ptr<DocumentWriter> writer;
  };

  explicit StoreTransaction(DocumentStore &store) : store_(store) {}

  DocumentStore &store_;
  CrdtVector<Entry> entries_; // in first-touch order
};

/// Result of a cold start.
struct LoadReport {
  size_t loaded = 0;
  CrdtVector<DocumentRef> corrupted; // failed to decode; skipped
};

/// Owns the local replicas of all documents.
///
/// Every document has its own mutex: mutations of one document are serialized, mutations of
/// different documents run independently. Transactions are serialized with each other. Local
/// calls never block on the network.
///
/// Subscribers and delta listeners run synchronously on the calling thread after the document
/// locks are released, so they may read the store (but a subscriber that mutates the document it
/// is notified for recurses).
class DocumentStore {
public:
  DocumentStore(NodeContext &ctx, const SchemaRegistry &schemas, StoreConfig config = {},
                DocumentStorage *storage = nullptr, std::shared_ptr<FieldCipher> cipher = nullptr);

  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;

  NodeContext &context() const { return ctx_; }
  const SchemaRegistry &schemas() const { return schemas_; }

  /// Creates a document (an empty `id` gets a fresh UUID) and applies `initial`.
  /// Creating an existing document only applies `initial`.
  /// @throws SchemaError if the namespace is unknown
  DocumentRef create(const std::string &ns, const std::string &id, const WriteFn &initial = {});

  bool contains(const DocumentRef &ref) const;

  /// @throws DocumentNotFound
  DocumentView read(const DocumentRef &ref) const;

  /// Runs `fn` against the latest state and commits its writes as one delta. The document is
  /// created on first write. Subscribers have been notified when this returns.
  /// Returns an empty delta if `fn` wrote nothing.
  Delta mutate(const DocumentRef &ref, const WriteFn &fn);

  /// Merges a delta received from a peer. Applying a delta twice is a no-op.
  /// @returns whether the materialized state changed
  /// @throws ProtocolViolation for unknown namespaces, unknown fields or strategy mismatches
  /// @throws ImmutableConflict when the delta would overwrite a set-once value
  bool apply_remote(const Delta &delta);

  /// Checks a whole batch of remote deltas against the schema without applying any, so a batch
  /// with one bad delta can be refused entirely. Immutable conflicts are left to apply_remote().
  /// @throws ProtocolViolation for the first delta the schema cannot accept
  void validate_remote(const CrdtVector<Delta> &deltas) const;

  /// All-or-nothing batch across documents. When `fn` throws nothing is applied and the exception
  /// propagates. Each touched document yields one delta and one notification.
  ///
  /// `fn` must only write through the StoreTransaction: calling mutate() or transaction() on this
  /// store from inside it throws InvalidArgument.
  CrdtVector<Delta> transaction(const std::function<void(StoreTransaction &)> &fn);

  SubscriptionId subscribe(const DocumentRef &ref, SubscriptionCallback callback);
  void unsubscribe(SubscriptionId id);

  SubscriptionId add_delta_listener(DeltaListener listener);
  void remove_delta_listener(SubscriptionId id);

  // Sync support

  CrdtStateVector state_vector(const DocumentRef &ref) const;
  CrdtStateVectors state_vectors() const;

  /// Deltas a peer at `peer` is missing, or nullopt when the log was truncated past it and the
  /// peer needs snapshot() instead.
  std::optional<CrdtVector<Delta>> deltas_since(const DocumentRef &ref, const CrdtStateVector &peer) const;

  CrdtBytes snapshot(const DocumentRef &ref) const;

  /// Joins an encoded full-document state.
  /// @throws DeserializeCorruption, ProtocolViolation, ImmutableConflict
  bool merge_snapshot(const DocumentRef &ref, const CrdtBytes &bytes);

  // Maintenance

  /// Persists a snapshot and truncates the operation log.
  void compact(const DocumentRef &ref);

  /// Collects unreferenced tombstones of the document's sequence fields.
  size_t gc_tombstones(const DocumentRef &ref);

  size_t log_size(const DocumentRef &ref) const;

  /// Documents of a namespace (all namespaces when empty), sorted.
  CrdtVector<DocumentRef> documents(const std::string &ns = "") const;

  /// Rebuilds every persisted document. Undecodable documents are reported and skipped.
  LoadReport load();

private:
  friend class StoreTransaction;

  NodeContext &ctx_;
  const SchemaRegistry &schemas_;
  StoreConfig config_;
  DocumentStorage *storage_;
  std::shared_ptr<FieldCipher> cipher_;

  mutable std::mutex documents_mutex_;
  CrdtSortedMap<DocumentRef, std::shared_ptr<Document>> documents_;

  std::mutex transaction_mutex_;
  // Thread running a transaction body, if any
  std::atomic<std::thread::id> transaction_owner_{};

  mutable std::mutex subscribers_mutex_;
  std::atomic<SubscriptionId> next_subscription_{1};
  CrdtSortedMap<SubscriptionId, std::pair<DocumentRef, SubscriptionCallback>> subscribers_;
  CrdtSortedMap<SubscriptionId, DeltaListener> listeners_;

  std::shared_ptr<Document> find(const DocumentRef &ref) const;
  std::shared_ptr<Document> get(const DocumentRef &ref) const;
  std::shared_ptr<Document> get_or_create(const DocumentRef &ref);

  bool has_subscribers(const DocumentRef &ref) const;
  void notify(const CrdtVector<DocumentView> &views, const CrdtVector<Delta> &deltas, DeltaSource source);
  void maybe_compact(const DocumentRef &ref);
};

#endif // DOCUMENT_STORE_HPP
