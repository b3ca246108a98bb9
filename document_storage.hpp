// document_storage.hpp
#ifndef DOCUMENT_STORAGE_HPP
#define DOCUMENT_STORAGE_HPP

#include "delta.hpp"

#include <sqlite3.h>

#include <mutex>
#include <optional>
#include <string>

/// Persisted identity of the local node.
struct NodeIdentity {
  CrdtActorId actor;
  uint64_t clock = 0; // highest clock ever handed out; a restarted node continues after it
};

/// Raw persisted form of one document, decoded by the store.
struct StoredDocument {
  DocumentRef ref;
  std::optional<CrdtBytes> snapshot;
  CrdtVector<CrdtBytes> operations; // encoded deltas, ordered by (clock, actor)
};

/// SQLite persistence of operation logs, materialized snapshots and node identity.
///
/// Layout:
/// - `_crdt_node`: a single row with the actor id and the highest handed out clock
/// - `documents`: one row per document with its latest snapshot (NULL until the first compaction)
/// - `operations`: the append-only delta log, keyed by (namespace, id, actor, clock)
///
/// Loading a document means decoding its snapshot and replaying the logged deltas on top of it.
///
/// Thread Safety:
/// All access to the connection is serialized by an internal mutex, so one instance can be shared
/// by the store, the sync workers and the reconciliation timer.
///
/// Error Handling:
/// Every SQLite failure throws StorageError. Multi-row writes run inside one SQLite transaction
/// and are rolled back on failure.
class DocumentStorage {
public:
  /// Opens (or creates) the database at `path`. ":memory:" gives a private in-memory database.
  /// @throws StorageError if the database cannot be opened or the tables cannot be created
  explicit DocumentStorage(const char *path);

  ~DocumentStorage();

  DocumentStorage(const DocumentStorage &) = delete;
  DocumentStorage &operator=(const DocumentStorage &) = delete;

  /// Returns the persisted identity, creating one with a fresh UUID actor on first use.
  NodeIdentity load_or_create_identity();

  /// Same, but with a caller chosen actor id for a fresh database.
  NodeIdentity load_or_create_identity(const CrdtActorId &actor);

  /// Registers a document that has no operations yet.
  void ensure_document(const DocumentRef &ref);

  /// Appends deltas and raises the persisted clock in one SQLite transaction.
  void append(const CrdtVector<Delta> &deltas, uint64_t clock);

  /// Replaces the snapshot of a document.
  void save_snapshot(const DocumentRef &ref, const CrdtBytes &snapshot);

  /// Deletes logged deltas covered by `upto`.
  void truncate_operations(const DocumentRef &ref, const CrdtStateVector &upto);

  size_t operation_count(const DocumentRef &ref);

  CrdtVector<StoredDocument> load_all();

private:
  /// RAII wrapper for sqlite3_stmt
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  /// Rolls back unless commit() was reached.
  class SqlTransaction {
  public:
    explicit SqlTransaction(DocumentStorage &storage);
    ~SqlTransaction();
    void commit();

  private:
    DocumentStorage &storage_;
    bool done_;
  };

  sqlite3 *db_;
  std::mutex mutex_;

  NodeIdentity identity_locked(const CrdtActorId &fresh_actor);
  void insert_document_locked(const DocumentRef &ref);

  sqlite3_stmt *prepare(const char *sql);
  void bind_text(sqlite3_stmt *stmt, int index, const std::string &value);
  void bind_blob(sqlite3_stmt *stmt, int index, const CrdtBytes &value);
  void step_done(sqlite3_stmt *stmt, const char *what);
  void exec_or_throw(const char *sql);
  std::string get_error() const;
};

#endif // DOCUMENT_STORAGE_HPP
