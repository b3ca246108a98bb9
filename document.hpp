// document.hpp
#ifndef DOCUMENT_HPP
#define DOCUMENT_HPP

#include "crdt_codec.hpp"
#include "delta.hpp"
#include "node_context.hpp"
#include "schema.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

using CrdtFieldMap = CrdtSortedMap<std::string, CrdtFieldState>;

/// Opaque encryption collaborator for personal fields.
///
/// The engine only ever stores and replicates the ciphertext. `key` names the sealed value
/// ("namespace/id#path") so an implementation can derive per-field keys.
class FieldCipher {
public:
  virtual ~FieldCipher() = default;
  virtual CrdtBytes encrypt(const std::string &key, const CrdtBytes &plaintext) = 0;
  virtual CrdtBytes decrypt(const std::string &key, const CrdtBytes &ciphertext) = 0;
};

/// Immutable copy of a document's materialized state.
///
/// Getters check the requested shape against the schema and throw SchemaError on mismatch.
/// Numeric fields with a declared lower bound are clamped to it when read.
class DocumentView {
public:
  DocumentView(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema, CrdtFieldMap fields,
               CrdtStateVector state_vector, std::shared_ptr<FieldCipher> cipher = nullptr);

  const DocumentRef &ref() const { return ref_; }
  const DocumentSchema &schema() const { return *schema_; }
  const CrdtFieldMap &fields() const { return fields_; }
  const CrdtStateVector &state_vector() const { return state_vector_; }

  /// Raw state of a field, nullptr if it was never written.
  const CrdtFieldState *state(const std::string &path) const;

  /// Value of an LWW or immutable field; monostate when unset.
  CrdtScalar get(const std::string &path) const;

  std::optional<int64_t> get_int(const std::string &path) const;
  std::optional<std::string> get_string(const std::string &path) const;

  /// OR-Set members.
  CrdtVector<std::string> get_set(const std::string &path) const;
  bool set_contains(const std::string &path, const std::string &element) const;

  int64_t get_counter(const std::string &path) const;

  /// RGA elements in order.
  CrdtVector<CrdtScalar> get_list(const std::string &path) const;

  /// Concurrent values of an MV register, sorted.
  CrdtVector<CrdtScalar> get_values(const std::string &path) const;

  std::string get_text(const std::string &path) const;
  CrdtVector<PeritextSpan> get_spans(const std::string &path) const;

  /// Decrypts a personal field through the cipher. nullopt when unset.
  std::optional<CrdtBytes> open_sealed(const std::string &path) const;

  /// Deterministic encoding of the materialized state; equal on converged replicas.
  CrdtBytes canonical() const;

private:
  DocumentRef ref_;
  std::shared_ptr<const DocumentSchema> schema_;
  CrdtFieldMap fields_;
  CrdtStateVector state_vector_;
  std::shared_ptr<FieldCipher> cipher_;

  const CrdtFieldState *checked(const std::string &path, CrdtStrategy a, std::optional<CrdtStrategy> b = {}) const;
};

/// Collects the operations of one mutation.
///
/// Each operation takes the next clock value of the node, is applied to a private copy of the
/// touched field right away (so later operations of the same mutation see it), and is recorded
/// for the delta. Nothing reaches the document until the store commits.
class DocumentWriter {
public:
  DocumentWriter(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema, const CrdtFieldMap &committed,
                 NodeContext &ctx, std::shared_ptr<FieldCipher> cipher);

  DocumentWriter(const DocumentWriter &) = delete;
  DocumentWriter &operator=(const DocumentWriter &) = delete;

  const DocumentRef &ref() const { return ref_; }

  /// LWW or immutable assignment. Repeated LWW writes to a field within one mutation keep only the
  /// last one in the delta.
  void set(const std::string &path, const CrdtScalar &value);

  /// Encrypts `plaintext` and stores the ciphertext in a personal field.
  void set_sealed(const std::string &path, const CrdtBytes &plaintext);

  /// OR-Set add; returns the fresh tag.
  std::string add(const std::string &path, const std::string &element);

  /// OR-Set remove of every currently observed tag. Returns false if the element is absent.
  bool remove(const std::string &path, const std::string &element);

  void increment(const std::string &path, uint64_t amount = 1);
  void decrement(const std::string &path, uint64_t amount = 1);

  /// RGA insert before the visible element at `index` (index == size appends).
  CrdtStamp insert(const std::string &path, size_t index, const CrdtScalar &value);
  CrdtStamp push_back(const std::string &path, const CrdtScalar &value);
  void remove_at(const std::string &path, size_t index);

  /// MV-register write superseding every value observed so far.
  void mv_set(const std::string &path, const CrdtScalar &value);

  void text_insert(const std::string &path, size_t index, const std::string &text);
  void text_remove(const std::string &path, size_t index, size_t length);

  /// Formats visible bytes [start, end). A monostate value clears the mark.
  void mark(const std::string &path, size_t start, size_t end, const std::string &name, const CrdtScalar &value);

  /// State including the writes made so far.
  DocumentView view() const;

  bool empty() const { return ops_.empty(); }

  /// Delta of everything written; `clock` is the highest clock consumed.
  Delta delta() const;

  /// Touched fields with the writes applied; leaves the writer empty.
  CrdtFieldMap take_staged() { return std::move(staged_); }

  /// Clock values consumed so far: how many, and the lowest and highest of them.
  uint64_t ticks() const { return ticks_; }
  uint64_t first_tick() const { return first_tick_; }
  uint64_t last_tick() const { return last_tick_; }

private:
  DocumentRef ref_;
  std::shared_ptr<const DocumentSchema> schema_;
  const CrdtFieldMap &committed_;
  NodeContext &ctx_;
  std::shared_ptr<FieldCipher> cipher_;
  CrdtFieldMap staged_;
  CrdtVector<FieldOp> ops_;
  uint64_t ticks_ = 0;
  uint64_t first_tick_ = 0;
  uint64_t last_tick_ = 0;

  uint64_t next_clock(uint64_t n = 1);
  CrdtFieldState &touch(const std::string &path, CrdtStrategy expected);
  void record(const std::string &path, CrdtStrategy strategy, uint64_t clock, CrdtOp op);
};

/// Arena of applied deltas, indexed by (actor, clock).
///
/// Truncation drops a prefix per actor once it is captured by a snapshot; peers behind the
/// truncation point are served the snapshot instead.
class OperationLog {
public:
  bool contains(const CrdtActorId &actor, uint64_t clock) const;

  /// Returns false if the delta is already present.
  bool append(const Delta &delta);

  /// Deltas a peer at `peer` lacks, ordered by (clock, actor). nullopt when part of them were
  /// truncated away.
  std::optional<CrdtVector<Delta>> since(const CrdtStateVector &peer) const;

  /// Moves `sv[actor]` forward over logged deltas that continue the chain. Returns whether it moved.
  bool advance(CrdtStateVector &sv, const CrdtActorId &actor) const;

  CrdtVector<CrdtActorId> actors() const;

  /// Drops every delta covered by `upto` and remembers the truncation point; deltas up to it are
  /// only available as a snapshot from then on.
  void truncate(const CrdtStateVector &upto);

  size_t size() const { return size_; }
  const CrdtStateVector &truncated() const { return truncated_; }

  /// Every retained delta, ordered by (clock, actor).
  CrdtVector<Delta> all() const;

private:
  CrdtSortedMap<CrdtActorId, CrdtSortedMap<uint64_t, Delta>> by_actor_;
  CrdtStateVector truncated_;
  size_t size_ = 0;
};

/// One replicated document: materialized fields, state vector and operation log.
///
/// The store serializes access through mutex(); none of the methods lock by themselves.
class Document {
public:
  Document(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema);

  std::mutex &mutex() const { return mutex_; }

  const DocumentRef &ref() const { return ref_; }
  const std::shared_ptr<const DocumentSchema> &schema() const { return schema_; }
  const CrdtFieldMap &fields() const { return fields_; }
  const CrdtStateVector &state_vector() const { return state_vector_; }
  const OperationLog &log() const { return log_; }

  /// A document exists once it was created explicitly or received its first write. Placeholders
  /// left behind by an aborted mutation stay invisible.
  bool live() const { return live_; }
  void mark_live() { live_ = true; }

  /// Whether the delta was applied already: it lies inside the state vector or was logged ahead of it.
  bool has_delta(const Delta &delta) const { return covers(state_vector_, delta) || log_.contains(delta.actor, delta.clock); }

  /// Clock of the latest delta of `actor` on the gap-free chain, 0 if none.
  uint64_t head(const CrdtActorId &actor) const;

  /// Throws ProtocolViolation for deltas the schema cannot accept and, with `check_immutables`,
  /// ImmutableConflict for deltas that would overwrite a set-once value. Does not modify anything.
  void validate_remote(const Delta &delta, bool check_immutables = true) const;

  /// Merges a validated delta. Returns whether the materialized state changed.
  bool apply_remote(const Delta &delta);

  /// Installs the staged fields of a local mutation and logs its delta.
  void commit_local(const Delta &delta, CrdtFieldMap staged);

  DocumentSnapshot snapshot() const { return DocumentSnapshot{fields_, state_vector_}; }

  /// Joins a full remote state. Throws ProtocolViolation or ImmutableConflict before changing anything.
  bool merge_snapshot(const DocumentSnapshot &snapshot);

  /// Drops every logged delta; the snapshot now carries them.
  void truncate_log() { log_.truncate(state_vector_); }

  /// Runs tombstone collection on every sequence field.
  size_t garbage_collect();

  DocumentView view(std::shared_ptr<FieldCipher> cipher) const;

private:
  DocumentRef ref_;
  std::shared_ptr<const DocumentSchema> schema_;
  CrdtFieldMap fields_;
  CrdtStateVector state_vector_;
  OperationLog log_;
  bool live_ = false;
  mutable std::mutex mutex_;

  void advance_all();
};

#endif // DOCUMENT_HPP
