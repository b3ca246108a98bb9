// crdt_field.hpp
#ifndef CRDT_FIELD_HPP
#define CRDT_FIELD_HPP

#include "crdt.hpp"
#include "peritext.hpp"
#include "rga.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

/// Merge strategy of a field. The numeric values index CrdtFieldState and are part of the wire format.
enum class CrdtStrategy : uint8_t {
  Immutable = 0,
  Lww = 1,
  OrSet = 2,
  PnCounter = 3,
  Rga = 4,
  MvRegister = 5,
  Peritext = 6,
};

constexpr uint8_t CRDT_STRATEGY_COUNT = 7;

/// Annotation name as emitted by the schema compiler ("lww", "or_set", ...).
const char *to_string(CrdtStrategy strategy);

/// Parses an annotation name; nullopt when it is not recognized.
std::optional<CrdtStrategy> parse_strategy(std::string_view name);

/// State of one field. Alternatives are in CrdtStrategy order.
using CrdtFieldState = std::variant<ImmutableValue, LwwRegister, OrSet, PnCounter, RgaSequence, MvRegister, PeritextDoc>;

CrdtFieldState make_field_state(CrdtStrategy strategy);

inline CrdtStrategy strategy_of(const CrdtFieldState &state) { return static_cast<CrdtStrategy>(state.index()); }

// -----------------------------------------
// Operations
// -----------------------------------------

/// Assigns a scalar (LWW and Immutable fields).
struct SetOp {
  CrdtScalar value;
  bool operator==(const SetOp &) const = default;
};

struct OrSetAddOp {
  std::string element;
  std::string tag; // fresh, globally unique
  bool operator==(const OrSetAddOp &) const = default;
};

struct OrSetRemoveOp {
  std::string element;
  CrdtVector<std::string> tags; // tags observed at remove time
  bool operator==(const OrSetRemoveOp &) const = default;
};

/// Carries the writer's absolute accumulators, so replaying it is harmless.
struct CounterOp {
  CrdtActorId actor;
  uint64_t increments;
  uint64_t decrements;
  bool operator==(const CounterOp &) const = default;
};

struct SeqInsertOp {
  CrdtStamp id;
  std::optional<CrdtStamp> left;
  CrdtScalar value;
  bool operator==(const SeqInsertOp &) const = default;
};

struct SeqRemoveOp {
  CrdtStamp id;
  bool operator==(const SeqRemoveOp &) const = default;
};

struct MvSetOp {
  CrdtScalar value;
  CrdtVersionVector version;
  bool operator==(const MvSetOp &) const = default;
};

struct TextInsertOp {
  CrdtStamp first;
  std::optional<CrdtStamp> left;
  std::string text;
  bool operator==(const TextInsertOp &) const = default;
};

struct TextRemoveOp {
  CrdtVector<CrdtStamp> ids;
  bool operator==(const TextRemoveOp &) const = default;
};

struct TextMarkOp {
  PeritextMark mark;
  bool operator==(const TextMarkOp &) const = default;
};

/// Strategy-specific operation payload of a delta. The alternative index is the wire tag.
using CrdtOp = std::variant<SetOp, OrSetAddOp, OrSetRemoveOp, CounterOp, SeqInsertOp, SeqRemoveOp, MvSetOp, TextInsertOp,
                            TextRemoveOp, TextMarkOp>;

/// Whether `op` is meaningful for a field of `strategy`.
bool op_allowed(CrdtStrategy strategy, const CrdtOp &op);

/// Converts an operation into the singleton state it denotes.
///
/// `stamp` is the (clock, actor) of the delta carrying the operation.
CrdtFieldState op_to_state(CrdtStrategy strategy, const CrdtOp &op, const CrdtStamp &stamp);

/// Applies an operation by merging its singleton state into `state`.
///
/// Throws ProtocolViolation when the operation does not belong to the field's strategy and
/// ImmutableConflict on a conflicting immutable write. Returns whether the state changed.
bool apply_op(CrdtFieldState &state, const CrdtOp &op, const CrdtStamp &stamp);

/// Joins two states of the same strategy. Throws ProtocolViolation on a strategy mismatch.
bool merge_field(CrdtFieldState &into, const CrdtFieldState &other);

/// Highest clock referenced anywhere inside a state; used to advance the local clock after a snapshot merge.
uint64_t max_clock(const CrdtFieldState &state);

#endif // CRDT_FIELD_HPP
