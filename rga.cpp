// rga.cpp
#include "rga.hpp"

bool RgaSequence::integrate(const RgaElement &element) {
  auto [it, inserted] = elements_.try_emplace(element.id, element);
  if (!inserted) {
    return false;
  }
  order_dirty_ = true;
  return true;
}

bool RgaSequence::remove(const CrdtStamp &id) {
  if (!removed_.insert(id).second) {
    return false;
  }
  order_dirty_ = true;
  return true;
}

bool RgaSequence::merge(const RgaSequence &other) {
  bool changed = false;
  for (const auto &[id, element] : other.elements_) {
    changed |= integrate(element);
  }
  for (const auto &id : other.removed_) {
    changed |= remove(id);
  }
  return changed;
}

const CrdtVector<CrdtStamp> &RgaSequence::order() const {
  if (!order_dirty_) {
    return order_cache_;
  }

  // Children lists come out ascending because elements_ iterates in id order
  CrdtVector<CrdtStamp> heads;
  CrdtSortedMap<CrdtStamp, CrdtVector<CrdtStamp>> children;
  for (const auto &[id, element] : elements_) {
    if (element.left.has_value()) {
      children[*element.left].push_back(id);
    } else {
      heads.push_back(id);
    }
  }

  // Pre-order walk, larger ids first among siblings
  order_cache_.clear();
  order_cache_.reserve(elements_.size());
  CrdtVector<CrdtStamp> stack(heads.begin(), heads.end());
  while (!stack.empty()) {
    CrdtStamp id = std::move(stack.back());
    stack.pop_back();
    auto child_it = children.find(id);
    if (child_it != children.end()) {
      stack.insert(stack.end(), child_it->second.begin(), child_it->second.end());
    }
    order_cache_.push_back(std::move(id));
  }

  order_dirty_ = false;
  return order_cache_;
}

CrdtVector<CrdtScalar> RgaSequence::values() const {
  CrdtVector<CrdtScalar> result;
  for (const auto &id : order()) {
    if (!removed_.contains(id)) {
      result.push_back(elements_.at(id).value);
    }
  }
  return result;
}

CrdtVector<CrdtStamp> RgaSequence::ordered_ids(bool include_tombstones) const {
  if (include_tombstones) {
    return order();
  }
  CrdtVector<CrdtStamp> result;
  for (const auto &id : order()) {
    if (!removed_.contains(id)) {
      result.push_back(id);
    }
  }
  return result;
}

std::optional<CrdtStamp> RgaSequence::id_at(size_t index) const {
  size_t visible = 0;
  for (const auto &id : order()) {
    if (removed_.contains(id)) {
      continue;
    }
    if (visible == index) {
      return id;
    }
    ++visible;
  }
  return std::nullopt;
}

const RgaElement *RgaSequence::find(const CrdtStamp &id) const {
  auto it = elements_.find(id);
  return it == elements_.end() ? nullptr : &it->second;
}

size_t RgaSequence::size() const {
  size_t visible = 0;
  for (const auto &id : order()) {
    if (!removed_.contains(id)) {
      ++visible;
    }
  }
  return visible;
}

size_t RgaSequence::pending_count() const { return elements_.size() - order().size(); }

size_t RgaSequence::garbage_collect() {
  CrdtSortedSet<CrdtStamp> referenced;
  for (const auto &[_, element] : elements_) {
    if (element.left.has_value()) {
      referenced.insert(*element.left);
    }
  }

  size_t collected = 0;
  for (auto it = elements_.begin(); it != elements_.end();) {
    if (removed_.contains(it->first) && !referenced.contains(it->first)) {
      it = elements_.erase(it);
      ++collected;
    } else {
      ++it;
    }
  }
  if (collected > 0) {
    order_dirty_ = true;
  }
  return collected;
}

bool merge_into(RgaSequence &into, const RgaSequence &other) { return into.merge(other); }
