// peritext.cpp
#include "peritext.hpp"

bool PeritextDoc::insert_run(const CrdtStamp &first, const std::optional<CrdtStamp> &left, const std::string &text) {
  bool changed = false;
  std::optional<CrdtStamp> previous = left;
  for (size_t i = 0; i < text.size(); ++i) {
    CrdtStamp id(first.clock + i, first.actor);
    changed |= chars_.integrate(RgaElement{id, previous, CrdtScalar(std::string(1, text[i]))});
    previous = id;
  }
  return changed;
}

bool PeritextDoc::remove(const CrdtVector<CrdtStamp> &ids) {
  bool changed = false;
  for (const auto &id : ids) {
    changed |= chars_.remove(id);
  }
  return changed;
}

bool PeritextDoc::add_mark(const PeritextMark &mark) { return marks_.try_emplace(mark.id, mark).second; }

bool PeritextDoc::merge(const PeritextDoc &other) {
  bool changed = chars_.merge(other.chars_);
  for (const auto &[id, mark] : other.marks_) {
    changed |= add_mark(mark);
  }
  return changed;
}

std::string PeritextDoc::text() const {
  std::string result;
  for (const auto &value : chars_.values()) {
    if (const auto *s = std::get_if<std::string>(&value)) {
      result += *s;
    }
  }
  return result;
}

CrdtVector<CrdtStamp> PeritextDoc::char_ids(size_t start, size_t length) const {
  CrdtVector<CrdtStamp> visible = chars_.ordered_ids(false);
  CrdtVector<CrdtStamp> result;
  for (size_t i = start; i < visible.size() && i < start + length; ++i) {
    result.push_back(visible[i]);
  }
  return result;
}

CrdtVector<PeritextSpan> PeritextDoc::spans() const {
  CrdtVector<PeritextSpan> result;
  if (marks_.empty()) {
    return result;
  }

  // Marks are anchored on characters, tombstoned ones included, so resolve against the full order
  CrdtVector<CrdtStamp> all = chars_.ordered_ids(true);
  CrdtSortedMap<CrdtStamp, size_t> position;
  for (size_t i = 0; i < all.size(); ++i) {
    position.emplace(all[i], i);
  }

  // Ascending id iteration: a later mark overwrites an earlier one on the characters they share
  CrdtSortedMap<std::string, CrdtVector<const PeritextMark *>> winners;
  for (const auto &[id, mark] : marks_) {
    auto start_it = position.find(mark.start);
    auto end_it = position.find(mark.end);
    if (start_it == position.end() || end_it == position.end()) {
      continue; // anchors not delivered yet
    }
    size_t from = std::min(start_it->second, end_it->second);
    size_t to = std::max(start_it->second, end_it->second);
    auto &slots = winners[mark.name];
    slots.resize(all.size(), nullptr);
    for (size_t p = from; p <= to; ++p) {
      slots[p] = &mark;
    }
  }

  for (const auto &[name, slots] : winners) {
    std::optional<PeritextSpan> open;
    size_t visible_index = 0;
    for (size_t p = 0; p < all.size(); ++p) {
      if (chars_.is_removed(all[p])) {
        continue;
      }
      const PeritextMark *mark = slots[p];
      bool formatted = mark != nullptr && !std::holds_alternative<std::monostate>(mark->value);
      if (open && (!formatted || open->value != mark->value)) {
        result.push_back(*open);
        open.reset();
      }
      if (formatted) {
        if (open) {
          open->end = visible_index + 1;
        } else {
          open = PeritextSpan{visible_index, visible_index + 1, name, mark->value};
        }
      }
      ++visible_index;
    }
    if (open) {
      result.push_back(*open);
    }
  }

  std::sort(result.begin(), result.end(), [](const PeritextSpan &a, const PeritextSpan &b) {
    if (a.start != b.start)
      return a.start < b.start;
    return a.name < b.name;
  });
  return result;
}

bool merge_into(PeritextDoc &into, const PeritextDoc &other) { return into.merge(other); }
