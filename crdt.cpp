// crdt.cpp
#include "crdt.hpp"
#include "crdt_errors.hpp"

#include <iomanip>
#include <sstream>

std::string scalar_to_string(const CrdtScalar &value) {
  std::ostringstream oss;
  switch (value.index()) {
  case 0:
    return "null";
  case 1:
    return std::get<bool>(value) ? "true" : "false";
  case 2:
    return std::to_string(std::get<int64_t>(value));
  case 3:
    oss << std::setprecision(17) << std::get<double>(value);
    return oss.str();
  case 4:
    return std::get<std::string>(value);
  case 5: {
    // Encode as hex
    oss << "BLOB:";
    for (uint8_t byte : std::get<CrdtBytes>(value)) {
      oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }
  }
  return "";
}

std::string to_string(const CrdtStamp &stamp) { return "(" + std::to_string(stamp.clock) + ", " + stamp.actor + ")"; }

bool vv_covers(const CrdtVersionVector &a, const CrdtVersionVector &b) {
  for (const auto &[actor, clock] : b) {
    auto it = a.find(actor);
    if (it == a.end() || it->second < clock) {
      return false;
    }
  }
  return true;
}

bool vv_dominates(const CrdtVersionVector &a, const CrdtVersionVector &b) { return a != b && vv_covers(a, b); }

bool vv_merge(CrdtVersionVector &into, const CrdtVersionVector &other) {
  bool changed = false;
  for (const auto &[actor, clock] : other) {
    auto [it, inserted] = into.try_emplace(actor, clock);
    if (inserted) {
      changed = true;
    } else if (it->second < clock) {
      it->second = clock;
      changed = true;
    }
  }
  return changed;
}

// LWW

bool merge_into(LwwRegister &into, const LwwRegister &other) {
  if (!other.is_set()) {
    return false;
  }
  if (!into.is_set() || into.stamp < other.stamp || (into.stamp == other.stamp && into.value < other.value)) {
    into = other;
    return true;
  }
  return false;
}

// Immutable

bool merge_into(ImmutableValue &into, const ImmutableValue &other) {
  if (!other.is_set()) {
    return false;
  }
  if (!into.is_set()) {
    into = other;
    return true;
  }
  if (into.value != other.value) {
    throw ImmutableConflict("Conflicting writes to immutable value: " + scalar_to_string(into.value) + " at " +
                            to_string(into.stamp) + " vs " + scalar_to_string(other.value) + " at " +
                            to_string(other.stamp));
  }
  // Same value written twice: keep the earliest stamp so both replicas agree. The view is unchanged.
  if (other.stamp < into.stamp) {
    into.stamp = other.stamp;
  }
  return false;
}

// OR-Set

bool OrSet::contains(const std::string &element) const {
  auto it = adds.find(element);
  if (it == adds.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [&](const std::string &tag) { return !removed.contains(tag); });
}

CrdtVector<std::string> OrSet::live_tags(const std::string &element) const {
  CrdtVector<std::string> tags;
  auto it = adds.find(element);
  if (it != adds.end()) {
    for (const auto &tag : it->second) {
      if (!removed.contains(tag)) {
        tags.push_back(tag);
      }
    }
  }
  return tags;
}

CrdtVector<std::string> OrSet::elements() const {
  CrdtVector<std::string> result;
  for (const auto &[element, _] : adds) {
    if (contains(element)) {
      result.push_back(element);
    }
  }
  return result;
}

bool merge_into(OrSet &into, const OrSet &other) {
  bool changed = false;
  for (const auto &[element, tags] : other.adds) {
    auto &local = into.adds[element];
    for (const auto &tag : tags) {
      changed |= local.insert(tag).second;
    }
  }
  for (const auto &tag : other.removed) {
    changed |= into.removed.insert(tag).second;
  }
  return changed;
}

// PN-Counter

int64_t PnCounter::value() const {
  int64_t total = 0;
  for (const auto &[_, amount] : increments) {
    total += static_cast<int64_t>(amount);
  }
  for (const auto &[_, amount] : decrements) {
    total -= static_cast<int64_t>(amount);
  }
  return total;
}

uint64_t PnCounter::increments_of(const CrdtActorId &actor) const {
  auto it = increments.find(actor);
  return it == increments.end() ? 0 : it->second;
}

uint64_t PnCounter::decrements_of(const CrdtActorId &actor) const {
  auto it = decrements.find(actor);
  return it == decrements.end() ? 0 : it->second;
}

bool merge_into(PnCounter &into, const PnCounter &other) {
  bool changed = vv_merge(into.increments, other.increments);
  changed |= vv_merge(into.decrements, other.decrements);
  return changed;
}

// MV-Register

CrdtVector<CrdtScalar> MvRegister::values() const {
  CrdtVector<CrdtScalar> result;
  result.reserve(entries.size());
  for (const auto &entry : entries) {
    result.push_back(entry.value);
  }
  return result;
}

CrdtVersionVector MvRegister::observed() const {
  CrdtVersionVector result;
  for (const auto &entry : entries) {
    vv_merge(result, entry.version);
  }
  return result;
}

bool merge_into(MvRegister &into, const MvRegister &other) {
  CrdtVector<MvEntry> combined = into.entries;
  for (const auto &entry : other.entries) {
    if (std::find(combined.begin(), combined.end(), entry) == combined.end()) {
      combined.push_back(entry);
    }
  }

  CrdtVector<MvEntry> kept;
  for (const auto &candidate : combined) {
    bool dominated = std::any_of(combined.begin(), combined.end(),
                                 [&](const MvEntry &other_entry) { return vv_dominates(other_entry.version, candidate.version); });
    if (!dominated) {
      kept.push_back(candidate);
    }
  }

  std::sort(kept.begin(), kept.end(), [](const MvEntry &a, const MvEntry &b) {
    if (a.version != b.version)
      return a.version < b.version;
    return a.value < b.value;
  });

  if (kept == into.entries) {
    return false;
  }
  into.entries = std::move(kept);
  return true;
}
