// peritext.hpp
#ifndef PERITEXT_HPP
#define PERITEXT_HPP

#include "rga.hpp"

#include <cstddef>
#include <optional>
#include <string>

/// A formatting mark anchored on two characters (both inclusive).
///
/// Marks are grow-only. Removing formatting is a newer mark with a null value.
struct PeritextMark {
  CrdtStamp id;
  CrdtStamp start;
  CrdtStamp end;
  std::string name; // e.g. "bold", "link"
  CrdtScalar value; // std::monostate clears the mark

  bool operator==(const PeritextMark &other) const = default;
};

/// A formatted run over visible text, [start, end) in bytes.
struct PeritextSpan {
  size_t start;
  size_t end;
  std::string name;
  CrdtScalar value;

  bool operator==(const PeritextSpan &other) const = default;
};

/// Rich text CRDT.
///
/// Characters live in an RgaSequence (one element per byte, an insert run takes consecutive clock
/// values). For every character and mark name the covering mark with the highest id wins, and
/// neighbouring characters with the same winner are coalesced into one span.
class PeritextDoc {
public:
  PeritextDoc() = default;

  /// Inserts `text` after `left`; character i gets id (first.clock + i, first.actor).
  bool insert_run(const CrdtStamp &first, const std::optional<CrdtStamp> &left, const std::string &text);

  bool remove(const CrdtVector<CrdtStamp> &ids);

  bool add_mark(const PeritextMark &mark);

  bool merge(const PeritextDoc &other);

  /// Visible text.
  std::string text() const;

  /// Formatting spans over the visible text, sorted by (start, name).
  CrdtVector<PeritextSpan> spans() const;

  /// Id of the visible character at byte `index`.
  std::optional<CrdtStamp> char_id_at(size_t index) const { return chars_.id_at(index); }

  /// Ids of the visible characters in [start, start + length).
  CrdtVector<CrdtStamp> char_ids(size_t start, size_t length) const;

  size_t size() const { return chars_.size(); }

  const RgaSequence &chars() const { return chars_; }
  const CrdtSortedMap<CrdtStamp, PeritextMark> &marks() const { return marks_; }

  bool operator==(const PeritextDoc &other) const = default;

private:
  RgaSequence chars_;
  CrdtSortedMap<CrdtStamp, PeritextMark> marks_;
};

bool merge_into(PeritextDoc &into, const PeritextDoc &other);

#endif // PERITEXT_HPP
