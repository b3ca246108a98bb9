// document_storage.cpp
#include "document_storage.hpp"
#include "crdt_codec.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"
#include "crdt_uuid.hpp"

DocumentStorage::DocumentStorage(const char *path) : db_(nullptr) {
  int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    sqlite3_close(db_);
    throw StorageError(error);
  }

  try {
    exec_or_throw("PRAGMA journal_mode=WAL");
    exec_or_throw("PRAGMA synchronous=NORMAL");

    exec_or_throw("CREATE TABLE IF NOT EXISTS _crdt_node ("
                  "id INTEGER PRIMARY KEY CHECK (id = 1), "
                  "actor TEXT NOT NULL, "
                  "clock INTEGER NOT NULL)");

    exec_or_throw("CREATE TABLE IF NOT EXISTS documents ("
                  "namespace TEXT NOT NULL, "
                  "id TEXT NOT NULL, "
                  "snapshot BLOB, "
                  "PRIMARY KEY (namespace, id))");

    exec_or_throw("CREATE TABLE IF NOT EXISTS operations ("
                  "namespace TEXT NOT NULL, "
                  "id TEXT NOT NULL, "
                  "actor TEXT NOT NULL, "
                  "clock INTEGER NOT NULL, "
                  "payload BLOB NOT NULL, "
                  "PRIMARY KEY (namespace, id, actor, clock))");
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

DocumentStorage::~DocumentStorage() {
  if (db_) {
    sqlite3_close(db_);
  }
}

// -----------------------------------------
// Identity
// -----------------------------------------

NodeIdentity DocumentStorage::load_or_create_identity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_locked(generate_uuid());
}

NodeIdentity DocumentStorage::load_or_create_identity(const CrdtActorId &actor) {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_locked(actor);
}

NodeIdentity DocumentStorage::identity_locked(const CrdtActorId &fresh_actor) {
  {
    Statement stmt(prepare("SELECT actor, clock FROM _crdt_node WHERE id = 1"));
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
      NodeIdentity identity;
      identity.actor = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0));
      identity.clock = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
      return identity;
    }
    if (rc != SQLITE_DONE) {
      throw StorageError("Failed to read node identity: " + get_error());
    }
  }

  Statement stmt(prepare("INSERT INTO _crdt_node (id, actor, clock) VALUES (1, ?, 0)"));
  bind_text(stmt.get(), 1, fresh_actor);
  step_done(stmt.get(), "create node identity");
  CRDT_LOG_INFO("storage", "created node identity " << fresh_actor);
  return NodeIdentity{fresh_actor, 0};
}

// -----------------------------------------
// Writes
// -----------------------------------------

void DocumentStorage::insert_document_locked(const DocumentRef &ref) {
  Statement stmt(prepare("INSERT OR IGNORE INTO documents (namespace, id, snapshot) VALUES (?, ?, NULL)"));
  bind_text(stmt.get(), 1, ref.ns);
  bind_text(stmt.get(), 2, ref.id);
  step_done(stmt.get(), "insert document");
}

void DocumentStorage::ensure_document(const DocumentRef &ref) {
  std::lock_guard<std::mutex> lock(mutex_);
  insert_document_locked(ref);
}

void DocumentStorage::append(const CrdtVector<Delta> &deltas, uint64_t clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqlTransaction tx(*this);

  for (const auto &delta : deltas) {
    insert_document_locked(delta.ref);

    Statement stmt(prepare("INSERT OR IGNORE INTO operations (namespace, id, actor, clock, payload) "
                           "VALUES (?, ?, ?, ?, ?)"));
    bind_text(stmt.get(), 1, delta.ref.ns);
    bind_text(stmt.get(), 2, delta.ref.id);
    bind_text(stmt.get(), 3, delta.actor);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(delta.clock));
    bind_blob(stmt.get(), 5, encode_delta(delta));
    step_done(stmt.get(), "append operation");
  }

  Statement stmt(prepare("UPDATE _crdt_node SET clock = max(clock, ?) WHERE id = 1"));
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(clock));
  step_done(stmt.get(), "update node clock");

  tx.commit();
}

void DocumentStorage::save_snapshot(const DocumentRef &ref, const CrdtBytes &snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare("INSERT INTO documents (namespace, id, snapshot) VALUES (?, ?, ?) "
                         "ON CONFLICT (namespace, id) DO UPDATE SET snapshot = excluded.snapshot"));
  bind_text(stmt.get(), 1, ref.ns);
  bind_text(stmt.get(), 2, ref.id);
  bind_blob(stmt.get(), 3, snapshot);
  step_done(stmt.get(), "save snapshot");
}

void DocumentStorage::truncate_operations(const DocumentRef &ref, const CrdtStateVector &upto) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqlTransaction tx(*this);
  for (const auto &[actor, clock] : upto) {
    Statement stmt(prepare("DELETE FROM operations WHERE namespace = ? AND id = ? AND actor = ? AND clock <= ?"));
    bind_text(stmt.get(), 1, ref.ns);
    bind_text(stmt.get(), 2, ref.id);
    bind_text(stmt.get(), 3, actor);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(clock));
    step_done(stmt.get(), "truncate operations");
  }
  tx.commit();
}

// -----------------------------------------
// Reads
// -----------------------------------------

size_t DocumentStorage::operation_count(const DocumentRef &ref) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(prepare("SELECT COUNT(*) FROM operations WHERE namespace = ? AND id = ?"));
  bind_text(stmt.get(), 1, ref.ns);
  bind_text(stmt.get(), 2, ref.id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw StorageError("Failed to count operations: " + get_error());
  }
  return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

CrdtVector<StoredDocument> DocumentStorage::load_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  CrdtVector<StoredDocument> result;

  {
    Statement stmt(prepare("SELECT namespace, id, snapshot FROM documents ORDER BY namespace, id"));
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
      StoredDocument doc;
      doc.ref.ns = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0));
      doc.ref.id = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 1));
      if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
        const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt.get(), 2));
        int size = sqlite3_column_bytes(stmt.get(), 2);
        doc.snapshot = CrdtBytes(blob, blob + size);
      }
      result.push_back(std::move(doc));
    }
    if (rc != SQLITE_DONE) {
      throw StorageError("Failed to load documents: " + get_error());
    }
  }

  Statement stmt(prepare("SELECT payload FROM operations WHERE namespace = ? AND id = ? ORDER BY clock, actor"));
  for (auto &doc : result) {
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    bind_text(stmt.get(), 1, doc.ref.ns);
    bind_text(stmt.get(), 2, doc.ref.id);
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
      const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt.get(), 0));
      int size = sqlite3_column_bytes(stmt.get(), 0);
      doc.operations.emplace_back(blob, blob + size);
    }
    if (rc != SQLITE_DONE) {
      throw StorageError("Failed to load operations of " + to_string(doc.ref) + ": " + get_error());
    }
  }
  return result;
}

// -----------------------------------------
// Helpers
// -----------------------------------------

DocumentStorage::SqlTransaction::SqlTransaction(DocumentStorage &storage) : storage_(storage), done_(false) {
  storage_.exec_or_throw("BEGIN IMMEDIATE");
}

DocumentStorage::SqlTransaction::~SqlTransaction() {
  if (!done_) {
    // Destructor must not throw; report instead
    char *err_msg = nullptr;
    if (sqlite3_exec(storage_.db_, "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
      CRDT_LOG_ERROR("storage", "rollback failed: " << (err_msg ? err_msg : "unknown error"));
    }
    sqlite3_free(err_msg);
  }
}

void DocumentStorage::SqlTransaction::commit() {
  storage_.exec_or_throw("COMMIT");
  done_ = true;
}

sqlite3_stmt *DocumentStorage::prepare(const char *sql) {
  sqlite3_stmt *stmt;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw StorageError("Failed to prepare statement: " + get_error());
  }
  return stmt;
}

void DocumentStorage::bind_text(sqlite3_stmt *stmt, int index, const std::string &value) {
  if (sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw StorageError("Failed to bind text parameter: " + get_error());
  }
}

void DocumentStorage::bind_blob(sqlite3_stmt *stmt, int index, const CrdtBytes &value) {
  // A zero-length blob with a null pointer would bind NULL
  static const uint8_t empty = 0;
  const void *data = value.empty() ? static_cast<const void *>(&empty) : value.data();
  if (sqlite3_bind_blob(stmt, index, data, static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw StorageError("Failed to bind blob parameter: " + get_error());
  }
}

void DocumentStorage::step_done(sqlite3_stmt *stmt, const char *what) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    throw StorageError(std::string("Failed to ") + what + ": " + get_error());
  }
}

void DocumentStorage::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw StorageError(error);
  }
}

std::string DocumentStorage::get_error() const { return sqlite3_errmsg(db_); }
