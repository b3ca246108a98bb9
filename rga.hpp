// rga.hpp
#ifndef RGA_HPP
#define RGA_HPP

#include "crdt.hpp"

#include <cstddef>
#include <optional>

// -----------------------------------------
// RgaElement Definition
// -----------------------------------------

// Represents an element of a replicated growable array
struct RgaElement {
  CrdtStamp id;                  // Globally unique: (clock, actor) of the insert
  std::optional<CrdtStamp> left; // Left neighbour at insertion time, nullopt for the head
  CrdtScalar value;

  bool operator==(const RgaElement &other) const = default;
};

// -----------------------------------------
// RgaSequence Class Definition
// -----------------------------------------

/// Ordered sequence CRDT.
///
/// Every element remembers the element it was inserted after. Elements sharing the same left
/// neighbour are placed in descending id order, so a new insert (whose clock exceeds every clock
/// its writer has observed) lands directly after its neighbour, and concurrent inserts at the same
/// place order identically on every replica.
///
/// Removal only tombstones an id. A tombstone may arrive before its element; it is kept and applied
/// once the element shows up. An element whose left neighbour is unknown is held back from the
/// order until the neighbour arrives.
class RgaSequence {
public:
  RgaSequence() = default;

  /// Adds an element. Returns false if the id is already known.
  bool integrate(const RgaElement &element);

  /// Tombstones an id. Returns false if it was already tombstoned.
  bool remove(const CrdtStamp &id);

  /// Union of elements and tombstones.
  bool merge(const RgaSequence &other);

  /// Visible values in order.
  CrdtVector<CrdtScalar> values() const;

  /// Ids in order, optionally including tombstoned elements.
  CrdtVector<CrdtStamp> ordered_ids(bool include_tombstones) const;

  /// Id of the visible element at `index`, if any.
  std::optional<CrdtStamp> id_at(size_t index) const;

  const RgaElement *find(const CrdtStamp &id) const;

  bool is_removed(const CrdtStamp &id) const { return removed_.contains(id); }

  /// Number of visible elements.
  size_t size() const;

  /// Elements whose left neighbour has not arrived yet.
  size_t pending_count() const;

  /// Drops tombstoned elements that no other element references.
  ///
  /// Only safe once every replica has seen the tombstones; otherwise a late insert referencing a
  /// collected element would stay hidden.
  size_t garbage_collect();

  const CrdtSortedMap<CrdtStamp, RgaElement> &elements() const { return elements_; }
  const CrdtSortedSet<CrdtStamp> &tombstones() const { return removed_; }

  bool operator==(const RgaSequence &other) const {
    return elements_ == other.elements_ && removed_ == other.removed_;
  }

private:
  CrdtSortedMap<CrdtStamp, RgaElement> elements_;
  CrdtSortedSet<CrdtStamp> removed_;

  // Cached traversal order (all reachable ids, tombstones included)
  mutable CrdtVector<CrdtStamp> order_cache_;
  mutable bool order_dirty_ = true;

  const CrdtVector<CrdtStamp> &order() const;
};

bool merge_into(RgaSequence &into, const RgaSequence &other);

#endif // RGA_HPP
