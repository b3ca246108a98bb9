// delta.hpp
#ifndef DELTA_HPP
#define DELTA_HPP

#include "crdt_field.hpp"

#include <compare>
#include <string>

/// Identifies a document: `(namespace, id)`.
struct DocumentRef {
  std::string ns;
  std::string id;

  DocumentRef() = default;
  DocumentRef(std::string n, std::string i) : ns(std::move(n)), id(std::move(i)) {}

  auto operator<=>(const DocumentRef &other) const = default;
  bool operator==(const DocumentRef &other) const = default;
};

std::string to_string(const DocumentRef &ref);

/// One field operation inside a delta.
struct FieldOp {
  std::string path;      // dotted field path, e.g. "profile.display_name"
  CrdtStrategy strategy; // must match the schema of the receiving side
  uint64_t clock;        // logical clock of this op; the op's stamp is (clock, delta.actor)
  CrdtOp op;

  CrdtStamp stamp(const CrdtActorId &actor) const { return CrdtStamp(clock, actor); }

  bool operator==(const FieldOp &other) const = default;
};

/// Unit of replication: the ops one actor produced in one mutation of one document.
///
/// `clock` is the highest clock the delta consumed. The deltas of one actor for one document form
/// a chain: `prev` is the clock of the actor's previous delta for the document (0 for the first).
/// A replica's state vector only advances along that chain, so it always names a gap-free prefix
/// even when deltas arrive out of order.
struct Delta {
  DocumentRef ref;
  CrdtActorId actor;
  uint64_t clock = 0;
  uint64_t prev = 0;
  CrdtVector<FieldOp> ops;

  bool empty() const { return ops.empty(); }

  bool operator==(const Delta &other) const = default;
};

/// Highest clock consumed by one op (a text insert run consumes one per byte).
uint64_t last_clock(const FieldOp &op);

/// Per-document state vector: actor -> highest clock seen.
using CrdtStateVector = CrdtVersionVector;

/// State vectors of many documents, as exchanged in a sync handshake.
using CrdtStateVectors = CrdtSortedMap<DocumentRef, CrdtStateVector>;

/// Whether `sv` already includes `delta`.
inline bool covers(const CrdtStateVector &sv, const Delta &delta) {
  auto it = sv.find(delta.actor);
  return it != sv.end() && it->second >= delta.clock;
}

#endif // DELTA_HPP
