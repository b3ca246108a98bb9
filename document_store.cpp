// document_store.cpp
#include "document_store.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"
#include "crdt_uuid.hpp"

namespace {

/// Hands the clock values of an aborted mutation back, provided they were the most recent ones
/// and nobody else ticked in between.
void release_ticks(NodeContext &ctx, const CrdtVector<const DocumentWriter *> &writers) {
  uint64_t ticks = 0;
  uint64_t first = UINT64_MAX;
  uint64_t last = 0;
  for (const auto *writer : writers) {
    if (writer->ticks() == 0) {
      continue;
    }
    ticks += writer->ticks();
    first = std::min(first, writer->first_tick());
    last = std::max(last, writer->last_tick());
  }
  if (ticks > 0 && last - first + 1 == ticks) {
    ctx.rewind(last, first - 1);
  }
}

uint64_t highest_clock(const DocumentSnapshot &snapshot) {
  uint64_t highest = 0;
  for (const auto &[_, clock] : snapshot.state_vector) {
    highest = std::max(highest, clock);
  }
  for (const auto &[_, state] : snapshot.fields) {
    highest = std::max(highest, max_clock(state));
  }
  return highest;
}

} // namespace

// -----------------------------------------
// StoreTransaction
// -----------------------------------------

DocumentWriter &StoreTransaction::writer(const DocumentRef &ref) {
  for (auto &entry : entries_) {
    if (entry.document->ref() == ref) {
      return *entry.writer;
    }
  }
  Entry entry;
  entry.document = store_.get_or_create(ref);
  entry.lock = std::unique_lock<std::mutex>(entry.document->mutex());
  entry.writer = std::make_unique<DocumentWriter>(ref, entry.document->schema(), entry.document->fields(),
                                                  store_.ctx_, store_.cipher_);
  entries_.push_back(std::move(entry));
  return *entries_.back().writer;
}

DocumentView StoreTransaction::read(const DocumentRef &ref) {
  for (auto &entry : entries_) {
    if (entry.document->ref() == ref) {
      return entry.writer->view();
    }
  }
  return store_.read(ref);
}

// -----------------------------------------
// DocumentStore
// -----------------------------------------

DocumentStore::DocumentStore(NodeContext &ctx, const SchemaRegistry &schemas, StoreConfig config,
                             DocumentStorage *storage, std::shared_ptr<FieldCipher> cipher)
    : ctx_(ctx), schemas_(schemas), config_(config), storage_(storage), cipher_(std::move(cipher)) {}

std::shared_ptr<Document> DocumentStore::find(const DocumentRef &ref) const {
  std::lock_guard<std::mutex> lock(documents_mutex_);
  auto it = documents_.find(ref);
  return it == documents_.end() ? nullptr : it->second;
}

std::shared_ptr<Document> DocumentStore::get(const DocumentRef &ref) const {
  auto doc = find(ref);
  if (!doc) {
    throw DocumentNotFound(to_string(ref));
  }
  return doc;
}

std::shared_ptr<Document> DocumentStore::get_or_create(const DocumentRef &ref) {
  std::lock_guard<std::mutex> lock(documents_mutex_);
  auto it = documents_.find(ref);
  if (it != documents_.end()) {
    return it->second;
  }
  if (ref.id.empty()) {
    throw InvalidArgument("Document id must not be empty (namespace " + ref.ns + ")");
  }
  auto doc = std::make_shared<Document>(ref, schemas_.get(ref.ns));
  documents_.emplace(ref, doc);
  return doc;
}

DocumentRef DocumentStore::create(const std::string &ns, const std::string &id, const WriteFn &initial) {
  schemas_.get(ns);
  DocumentRef ref(ns, id.empty() ? generate_uuid() : id);
  auto doc = get_or_create(ref);
  {
    std::lock_guard<std::mutex> lock(doc->mutex());
    if (!doc->live()) {
      if (storage_) {
        storage_->ensure_document(ref);
      }
      doc->mark_live();
    }
  }
  if (initial) {
    mutate(ref, initial);
  }
  return ref;
}

bool DocumentStore::contains(const DocumentRef &ref) const {
  auto doc = find(ref);
  if (!doc) {
    return false;
  }
  std::lock_guard<std::mutex> lock(doc->mutex());
  return doc->live();
}

DocumentView DocumentStore::read(const DocumentRef &ref) const {
  auto doc = get(ref);
  std::lock_guard<std::mutex> lock(doc->mutex());
  if (!doc->live()) {
    throw DocumentNotFound(to_string(ref));
  }
  return doc->view(cipher_);
}

Delta DocumentStore::mutate(const DocumentRef &ref, const WriteFn &fn) {
  if (transaction_owner_.load() == std::this_thread::get_id()) {
    throw InvalidArgument("Cannot mutate " + to_string(ref) + " inside a transaction, write through it instead");
  }
  auto doc = get_or_create(ref);
  Delta delta;
  CrdtVector<DocumentView> views;
  {
    std::lock_guard<std::mutex> lock(doc->mutex());
    DocumentWriter writer(ref, doc->schema(), doc->fields(), ctx_, cipher_);
    try {
      fn(writer);
      delta = writer.delta();
      delta.prev = doc->head(delta.actor);
      if (!delta.empty() && storage_) {
        storage_->append({delta}, ctx_.clock());
      }
    } catch (...) {
      release_ticks(ctx_, {&writer});
      throw;
    }
    if (delta.empty()) {
      return delta;
    }
    doc->commit_local(delta, writer.take_staged());
    if (has_subscribers(ref)) {
      views.push_back(doc->view(cipher_));
    }
  }

  CRDT_LOG_DEBUG("store", "local delta " << to_string(ref) << " @" << delta.clock << " (" << delta.ops.size()
                                         << " ops)");
  notify(views, {delta}, DeltaSource::Local);
  maybe_compact(ref);
  return delta;
}

bool DocumentStore::apply_remote(const Delta &delta) {
  if (!schemas_.find(delta.ref.ns)) {
    throw ProtocolViolation("Delta for unknown namespace " + delta.ref.ns);
  }
  if (delta.ref.id.empty()) {
    throw ProtocolViolation("Delta without document id in namespace " + delta.ref.ns);
  }

  auto doc = get_or_create(delta.ref);
  bool changed = false;
  CrdtVector<DocumentView> views;
  {
    std::lock_guard<std::mutex> lock(doc->mutex());
    if (doc->has_delta(delta)) {
      return false;
    }
    doc->validate_remote(delta);
    ctx_.observe(delta.clock);
    if (storage_) {
      storage_->append({delta}, ctx_.clock());
    }
    changed = doc->apply_remote(delta);
    if (changed && has_subscribers(delta.ref)) {
      views.push_back(doc->view(cipher_));
    }
  }

  CRDT_LOG_DEBUG("store", "remote delta " << to_string(delta.ref) << " from " << delta.actor << " @" << delta.clock
                                          << (changed ? "" : " (no-op)"));
  notify(views, {delta}, DeltaSource::Remote);
  maybe_compact(delta.ref);
  return changed;
}

void DocumentStore::validate_remote(const CrdtVector<Delta> &deltas) const {
  for (const auto &delta : deltas) {
    auto schema = schemas_.find(delta.ref.ns);
    if (!schema) {
      throw ProtocolViolation("Delta for unknown namespace " + delta.ref.ns);
    }
    if (delta.ref.id.empty()) {
      throw ProtocolViolation("Delta without document id in namespace " + delta.ref.ns);
    }
    if (auto doc = find(delta.ref)) {
      std::lock_guard<std::mutex> lock(doc->mutex());
      doc->validate_remote(delta, false);
    } else {
      Document(delta.ref, schema).validate_remote(delta, false);
    }
  }
}

CrdtVector<Delta> DocumentStore::transaction(const std::function<void(StoreTransaction &)> &fn) {
  if (transaction_owner_.load() == std::this_thread::get_id()) {
    throw InvalidArgument("Transactions cannot be nested");
  }
  std::lock_guard<std::mutex> serial(transaction_mutex_);
  StoreTransaction tx(*this);
  CrdtVector<Delta> deltas;
  CrdtVector<DocumentView> views;

  try {
    transaction_owner_ = std::this_thread::get_id();
    fn(tx);
    transaction_owner_ = std::thread::id();
    for (auto &entry : tx.entries_) {
      if (!entry.writer->empty()) {
        Delta delta = entry.writer->delta();
        delta.prev = entry.document->head(delta.actor);
        deltas.push_back(std::move(delta));
      }
    }
    if (storage_ && !deltas.empty()) {
      storage_->append(deltas, ctx_.clock());
    }
  } catch (...) {
    transaction_owner_ = std::thread::id();
    CrdtVector<const DocumentWriter *> writers;
    for (const auto &entry : tx.entries_) {
      writers.push_back(entry.writer.get());
    }
    release_ticks(ctx_, writers);
    throw;
  }

  size_t next = 0;
  for (auto &entry : tx.entries_) {
    if (entry.writer->empty()) {
      continue;
    }
    entry.document->commit_local(deltas[next++], entry.writer->take_staged());
    if (has_subscribers(entry.document->ref())) {
      views.push_back(entry.document->view(cipher_));
    }
  }
  tx.entries_.clear();

  CRDT_LOG_DEBUG("store", "transaction committed " << deltas.size() << " deltas");
  notify(views, deltas, DeltaSource::Local);
  for (const auto &delta : deltas) {
    maybe_compact(delta.ref);
  }
  return deltas;
}

// -----------------------------------------
// Subscriptions
// -----------------------------------------

SubscriptionId DocumentStore::subscribe(const DocumentRef &ref, SubscriptionCallback callback) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  SubscriptionId id = next_subscription_++;
  subscribers_.emplace(id, std::make_pair(ref, std::move(callback)));
  return id;
}

void DocumentStore::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  subscribers_.erase(id);
}

SubscriptionId DocumentStore::add_delta_listener(DeltaListener listener) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  SubscriptionId id = next_subscription_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void DocumentStore::remove_delta_listener(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  listeners_.erase(id);
}

bool DocumentStore::has_subscribers(const DocumentRef &ref) const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  for (const auto &[_, entry] : subscribers_) {
    if (entry.first == ref) {
      return true;
    }
  }
  return false;
}

void DocumentStore::notify(const CrdtVector<DocumentView> &views, const CrdtVector<Delta> &deltas,
                           DeltaSource source) {
  CrdtVector<DeltaListener> listeners;
  CrdtVector<std::pair<DocumentRef, SubscriptionCallback>> subscribers;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (const auto &[_, listener] : listeners_) {
      listeners.push_back(listener);
    }
    for (const auto &[_, entry] : subscribers_) {
      subscribers.push_back(entry);
    }
  }

  for (const auto &delta : deltas) {
    for (const auto &listener : listeners) {
      listener(delta, source);
    }
  }
  for (const auto &view : views) {
    for (const auto &[ref, callback] : subscribers) {
      if (ref == view.ref()) {
        callback(view);
      }
    }
  }
}

// -----------------------------------------
// Sync support
// -----------------------------------------

CrdtStateVector DocumentStore::state_vector(const DocumentRef &ref) const {
  auto doc = find(ref);
  if (!doc) {
    return {};
  }
  std::lock_guard<std::mutex> lock(doc->mutex());
  return doc->state_vector();
}

CrdtStateVectors DocumentStore::state_vectors() const {
  CrdtVector<std::shared_ptr<Document>> docs;
  {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    for (const auto &[_, doc] : documents_) {
      docs.push_back(doc);
    }
  }
  CrdtStateVectors result;
  for (const auto &doc : docs) {
    std::lock_guard<std::mutex> lock(doc->mutex());
    if (doc->live()) {
      result.emplace(doc->ref(), doc->state_vector());
    }
  }
  return result;
}

std::optional<CrdtVector<Delta>> DocumentStore::deltas_since(const DocumentRef &ref,
                                                             const CrdtStateVector &peer) const {
  auto doc = find(ref);
  if (!doc) {
    return CrdtVector<Delta>{};
  }
  std::lock_guard<std::mutex> lock(doc->mutex());
  return doc->log().since(peer);
}

CrdtBytes DocumentStore::snapshot(const DocumentRef &ref) const {
  auto doc = get(ref);
  std::lock_guard<std::mutex> lock(doc->mutex());
  return encode_snapshot(doc->snapshot());
}

bool DocumentStore::merge_snapshot(const DocumentRef &ref, const CrdtBytes &bytes) {
  if (!schemas_.find(ref.ns)) {
    throw ProtocolViolation("Snapshot for unknown namespace " + ref.ns);
  }
  DocumentSnapshot incoming = decode_snapshot(bytes);

  auto doc = get_or_create(ref);
  bool changed = false;
  CrdtVector<DocumentView> views;
  {
    std::lock_guard<std::mutex> lock(doc->mutex());
    changed = doc->merge_snapshot(incoming);
    if (!changed) {
      return false;
    }
    ctx_.observe(highest_clock(incoming));
    if (storage_) {
      storage_->save_snapshot(ref, encode_snapshot(doc->snapshot()));
    }
    if (has_subscribers(ref)) {
      views.push_back(doc->view(cipher_));
    }
  }

  CRDT_LOG_INFO("store", "merged snapshot of " << to_string(ref));
  notify(views, {}, DeltaSource::Remote);
  return true;
}

// -----------------------------------------
// Maintenance
// -----------------------------------------

void DocumentStore::compact(const DocumentRef &ref) {
  auto doc = get(ref);
  std::lock_guard<std::mutex> lock(doc->mutex());
  DocumentSnapshot snapshot = doc->snapshot();
  if (storage_) {
    storage_->save_snapshot(ref, encode_snapshot(snapshot));
    storage_->truncate_operations(ref, snapshot.state_vector);
  }
  size_t dropped = doc->log().size();
  doc->truncate_log();
  CRDT_LOG_INFO("store", "compacted " << to_string(ref) << ", dropped " << dropped << " logged deltas");
}

void DocumentStore::maybe_compact(const DocumentRef &ref) {
  if (config_.compact_after_deltas == 0 || log_size(ref) < config_.compact_after_deltas) {
    return;
  }
  compact(ref);
}

size_t DocumentStore::gc_tombstones(const DocumentRef &ref) {
  auto doc = get(ref);
  std::lock_guard<std::mutex> lock(doc->mutex());
  return doc->garbage_collect();
}

size_t DocumentStore::log_size(const DocumentRef &ref) const {
  auto doc = find(ref);
  if (!doc) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(doc->mutex());
  return doc->log().size();
}

CrdtVector<DocumentRef> DocumentStore::documents(const std::string &ns) const {
  CrdtVector<std::shared_ptr<Document>> docs;
  {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    for (const auto &[ref, doc] : documents_) {
      if (ns.empty() || ref.ns == ns) {
        docs.push_back(doc);
      }
    }
  }
  CrdtVector<DocumentRef> result;
  for (const auto &doc : docs) {
    std::lock_guard<std::mutex> lock(doc->mutex());
    if (doc->live()) {
      result.push_back(doc->ref());
    }
  }
  return result;
}

LoadReport DocumentStore::load() {
  LoadReport report;
  if (!storage_) {
    return report;
  }

  for (auto &stored : storage_->load_all()) {
    auto schema = schemas_.find(stored.ref.ns);
    if (!schema) {
      CRDT_LOG_ERROR("store", "cannot load " << to_string(stored.ref) << ": unknown namespace");
      report.corrupted.push_back(stored.ref);
      continue;
    }

    try {
      auto doc = std::make_shared<Document>(stored.ref, schema);
      uint64_t highest = 0;
      if (stored.snapshot) {
        DocumentSnapshot snapshot = decode_snapshot(*stored.snapshot);
        doc->merge_snapshot(snapshot);
        highest = highest_clock(snapshot);
      }
      for (const auto &bytes : stored.operations) {
        Delta delta = decode_delta(bytes);
        if (delta.ref != stored.ref) {
          throw DeserializeCorruption("Logged delta belongs to " + to_string(delta.ref));
        }
        if (doc->has_delta(delta) || covers(doc->state_vector(), delta)) {
          continue;
        }
        doc->validate_remote(delta);
        doc->apply_remote(delta);
        highest = std::max(highest, delta.clock);
      }
      doc->mark_live();
      ctx_.observe(highest);

      std::lock_guard<std::mutex> lock(documents_mutex_);
      documents_.insert_or_assign(stored.ref, doc);
      ++report.loaded;
    } catch (const CrdtException &e) {
      CRDT_LOG_ERROR("store", "cannot load " << to_string(stored.ref) << ": " << e.what());
      report.corrupted.push_back(stored.ref);
    }
  }

  CRDT_LOG_INFO("store", "loaded " << report.loaded << " documents, " << report.corrupted.size() << " corrupted");
  return report;
}
