// crdt.hpp
#ifndef CRDT_HPP
#define CRDT_HPP

#include <cstdint>

// Define this if you want to override the default collection types
// Basically define these before including this header and ensure this define is set before this header is included
// in any other files that include this file.
// Every collection used for CRDT state must iterate in a deterministic order: encoded snapshots
// and materialized views are compared byte for byte across replicas.
#ifndef CRDT_COLLECTIONS_DEFINED
#include <map>
#include <set>
#include <string>
#include <vector>

template <typename T> using CrdtVector = std::vector<T>;

template <typename K, typename V, typename Comparator = std::less<K>> using CrdtSortedMap = std::map<K, V, Comparator>;

template <typename T, typename Comparator = std::less<T>> using CrdtSortedSet = std::set<T, Comparator>;

/// Pseudonymous identifier of one logical writer (device or session).
using CrdtActorId = std::string;
#endif

#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/// Opaque binary payload (sealed personal fields, encoded records).
using CrdtBytes = std::vector<uint8_t>;

/// Value held by scalar registers and sequence elements.
///
/// The alternative order is part of the wire format and of the LWW tie-break on equal stamps.
using CrdtScalar = std::variant<std::monostate, bool, int64_t, double, std::string, CrdtBytes>;

/// Human readable rendering of a scalar, for logs and debugging.
std::string scalar_to_string(const CrdtScalar &value);

/// Tag carried by every operation: `(logical clock, actor)`.
///
/// Ordered lexicographically, clock first. Two stamps are equal only for the same write.
struct CrdtStamp {
  uint64_t clock = 0;
  CrdtActorId actor;

  CrdtStamp() = default;
  CrdtStamp(uint64_t c, CrdtActorId a) : clock(c), actor(std::move(a)) {}

  bool is_null() const { return clock == 0 && actor.empty(); }

  auto operator<=>(const CrdtStamp &other) const = default;
  bool operator==(const CrdtStamp &other) const = default;
};

std::string to_string(const CrdtStamp &stamp);

/// Represents a logical clock for maintaining causality.
class LogicalClock {
public:
  LogicalClock() : time_(0) {}

  /// Increments the clock for a local event.
  constexpr uint64_t tick() { return ++time_; }

  /// Reserves `n` consecutive values for a run of local events and returns the first one.
  constexpr uint64_t tick_n(uint64_t n) {
    uint64_t first = time_ + 1;
    time_ += n;
    return first;
  }

  /// Updates the clock based on a received time.
  constexpr uint64_t update(uint64_t received_time) {
    time_ = std::max(time_, received_time);
    return ++time_;
  }

  /// Moves the clock forward to at least `received_time` without consuming a value.
  constexpr void observe(uint64_t received_time) { time_ = std::max(time_, received_time); }

  /// Sets the logical clock to a specific time.
  constexpr void set_time(uint64_t t) { time_ = t; }

  /// Retrieves the current time.
  constexpr uint64_t current_time() const { return time_; }

private:
  uint64_t time_;
};

/// Per-actor highest clock observed.
using CrdtVersionVector = CrdtSortedMap<CrdtActorId, uint64_t>;

/// True when `a` has seen everything `b` has seen.
bool vv_covers(const CrdtVersionVector &a, const CrdtVersionVector &b);

/// True when `a` covers `b` and the two differ.
bool vv_dominates(const CrdtVersionVector &a, const CrdtVersionVector &b);

/// Pointwise maximum, written into `into`. Returns whether `into` changed.
bool vv_merge(CrdtVersionVector &into, const CrdtVersionVector &other);

// -----------------------------------------
// Register and set strategies
// -----------------------------------------

/// Last-write-wins register. Higher stamp wins; equal stamps fall back to the larger value.
struct LwwRegister {
  CrdtScalar value;
  CrdtStamp stamp;

  bool is_set() const { return !stamp.is_null(); }
  bool operator==(const LwwRegister &other) const = default;
};

/// Set-once register. A second, different value is a schema violation.
struct ImmutableValue {
  CrdtScalar value;
  CrdtStamp stamp;

  bool is_set() const { return !stamp.is_null(); }
  bool operator==(const ImmutableValue &other) const = default;
};

/// Observed-remove set with add-wins semantics.
///
/// Each add contributes a fresh tag; a remove tombstones the tags it observed. An element is present
/// while at least one of its tags is not tombstoned, so an add concurrent with a remove survives.
struct OrSet {
  CrdtSortedMap<std::string, CrdtSortedSet<std::string>> adds;
  CrdtSortedSet<std::string> removed;

  bool contains(const std::string &element) const;

  /// Tags of `element` that are still live; a remove must reference these.
  CrdtVector<std::string> live_tags(const std::string &element) const;

  /// Present elements in sorted order.
  CrdtVector<std::string> elements() const;

  bool operator==(const OrSet &other) const = default;
};

/// Positive-negative counter with per-actor monotonic accumulators.
struct PnCounter {
  CrdtSortedMap<CrdtActorId, uint64_t> increments;
  CrdtSortedMap<CrdtActorId, uint64_t> decrements;

  int64_t value() const;
  uint64_t increments_of(const CrdtActorId &actor) const;
  uint64_t decrements_of(const CrdtActorId &actor) const;

  bool operator==(const PnCounter &other) const = default;
};

/// One concurrent value of a multi-value register.
struct MvEntry {
  CrdtScalar value;
  CrdtVersionVector version;

  bool operator==(const MvEntry &other) const = default;
};

/// Multi-value register: keeps every causally concurrent write until a later write dominates them.
struct MvRegister {
  CrdtVector<MvEntry> entries; // kept sorted by (version, value)

  CrdtVector<CrdtScalar> values() const;

  /// Union of the versions of all current entries; a new write must dominate it.
  CrdtVersionVector observed() const;

  bool operator==(const MvRegister &other) const = default;
};

// Merge functions: commutative, associative and idempotent. Each returns whether `into` changed.

bool merge_into(LwwRegister &into, const LwwRegister &other);

/// Throws ImmutableConflict when both sides hold different values.
bool merge_into(ImmutableValue &into, const ImmutableValue &other);

bool merge_into(OrSet &into, const OrSet &other);
bool merge_into(PnCounter &into, const PnCounter &other);
bool merge_into(MvRegister &into, const MvRegister &other);

/// Pure form of merge_into for any strategy state.
template <typename T> T merge(const T &a, const T &b) {
  T result = a;
  merge_into(result, b);
  return result;
}

#endif // CRDT_HPP
