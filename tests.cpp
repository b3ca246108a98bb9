// tests.cpp
#include "crdt.hpp"
#include "crdt_errors.hpp"
#include "crdt_field.hpp"
#include "test_helpers.hpp"

#include <random>

namespace {

LwwRegister lww(const CrdtScalar &value, uint64_t clock, const CrdtActorId &actor) {
  return LwwRegister{value, CrdtStamp(clock, actor)};
}

OrSet set_with(const CrdtVector<std::pair<std::string, std::string>> &element_tags) {
  OrSet set;
  for (const auto &[element, tag] : element_tags) {
    set.adds[element].insert(tag);
  }
  return set;
}

PnCounter counter(const CrdtActorId &actor, uint64_t inc, uint64_t dec) {
  PnCounter c;
  if (inc > 0)
    c.increments[actor] = inc;
  if (dec > 0)
    c.decrements[actor] = dec;
  return c;
}

MvRegister mv(const CrdtScalar &value, const CrdtVersionVector &version) {
  MvRegister r;
  r.entries.push_back(MvEntry{value, version});
  return r;
}

/// merge(a, b) == merge(b, a), merge(merge(a, b), c) == merge(a, merge(b, c)), merge(a, a) == a
template <typename T> void check_merge_laws(const T &a, const T &b, const T &c) {
  ASSERT_TRUE(merge(a, b) == merge(b, a));
  ASSERT_TRUE(merge(merge(a, b), c) == merge(a, merge(b, c)));
  ASSERT_TRUE(merge(a, a) == a);
  T twice = merge(a, b);
  ASSERT_FALSE(merge_into(twice, b));
}

} // namespace

// LWW

TEST(lww_higher_stamp_wins) {
  LwwRegister older = lww(std::string("old"), 3, "a");
  LwwRegister newer = lww(std::string("new"), 4, "a");
  ASSERT_TRUE(merge(older, newer).value == CrdtScalar(std::string("new")));
  ASSERT_TRUE(merge(newer, older).value == CrdtScalar(std::string("new")));
}

TEST(lww_equal_clock_breaks_tie_on_actor) {
  // Same clock on two writers: the lexicographically larger actor wins on both replicas
  LwwRegister node_a = lww(std::string("x"), 5, "A");
  LwwRegister node_b = lww(std::string("y"), 5, "B");

  LwwRegister on_a = node_a;
  merge_into(on_a, node_b);
  LwwRegister on_b = node_b;
  merge_into(on_b, node_a);

  ASSERT_TRUE(on_a == on_b);
  ASSERT_TRUE(on_a.value == CrdtScalar(std::string("y")));
}

TEST(lww_equal_stamp_falls_back_to_value) {
  LwwRegister a = lww(int64_t(1), 7, "n");
  LwwRegister b = lww(int64_t(2), 7, "n");
  ASSERT_TRUE(merge(a, b) == merge(b, a));
  ASSERT_TRUE(merge(a, b).value == CrdtScalar(int64_t(2)));
}

TEST(lww_merge_laws) {
  check_merge_laws(lww(std::string("a"), 1, "x"), lww(std::string("b"), 2, "y"), lww(std::string("c"), 2, "z"));
  check_merge_laws(LwwRegister{}, lww(int64_t(4), 9, "y"), lww(3.5, 9, "x"));
}

// Immutable

TEST(immutable_set_once) {
  ImmutableValue unset;
  ImmutableValue first{std::string("alice"), CrdtStamp(2, "a")};
  ASSERT_TRUE(merge(unset, first) == first);

  ImmutableValue same{std::string("alice"), CrdtStamp(1, "b")};
  ImmutableValue merged = merge(first, same);
  ASSERT_TRUE(merged.value == CrdtScalar(std::string("alice")));
  ASSERT_TRUE(merge(first, same) == merge(same, first));

  ImmutableValue other{std::string("bob"), CrdtStamp(3, "b")};
  ImmutableValue target = first;
  ASSERT_THROWS(merge_into(target, other), ImmutableConflict);
  ASSERT_TRUE(target == first);
}

// OR-Set

TEST(or_set_union_of_disjoint_offline_adds) {
  OrSet node1;
  OrSet node2;
  for (int i = 0; i < 500; ++i) {
    node1.adds["item-" + std::to_string(i)].insert("tag-1-" + std::to_string(i));
    node2.adds["item-" + std::to_string(500 + i)].insert("tag-2-" + std::to_string(i));
  }

  OrSet on1 = node1;
  merge_into(on1, node2);
  OrSet on2 = node2;
  merge_into(on2, node1);

  ASSERT_EQ(on1.elements().size(), 1000u);
  ASSERT_TRUE(on1 == on2);
}

TEST(or_set_add_wins_over_concurrent_remove) {
  OrSet base = set_with({{"apple", "t1"}});

  // Replica A removes the tag it observed; replica B concurrently re-adds with a fresh tag
  CrdtFieldState state_a = base;
  apply_op(state_a, OrSetRemoveOp{"apple", {"t1"}}, CrdtStamp(2, "a"));
  CrdtFieldState state_b = base;
  apply_op(state_b, OrSetAddOp{"apple", "t2"}, CrdtStamp(2, "b"));

  ASSERT_FALSE(std::get<OrSet>(state_a).contains("apple"));
  ASSERT_TRUE(merge_field(state_a, state_b));
  ASSERT_TRUE(std::get<OrSet>(state_a).contains("apple"));
  ASSERT_EQ(std::get<OrSet>(state_a).live_tags("apple").size(), 1u);
}

TEST(or_set_merge_laws) {
  OrSet a = set_with({{"x", "1"}, {"y", "2"}});
  OrSet b = set_with({{"x", "3"}});
  b.removed.insert("1");
  OrSet c = set_with({{"z", "4"}});
  c.removed.insert("3");
  check_merge_laws(a, b, c);
}

// PN-Counter

TEST(pn_counter_converges_in_any_order) {
  CrdtVector<PnCounter> updates = {counter("a", 10, 0), counter("b", 10, 0), counter("c", 10, 0), counter("a", 10, 5)};

  std::mt19937 rng(42);
  for (int round = 0; round < 20; ++round) {
    std::shuffle(updates.begin(), updates.end(), rng);
    PnCounter total;
    for (const auto &u : updates) {
      merge_into(total, u);
    }
    ASSERT_EQ(total.value(), 25);
  }
}

TEST(pn_counter_op_replay_is_harmless) {
  CrdtFieldState state = PnCounter{};
  CounterOp op{"a", 7, 2};
  ASSERT_TRUE(apply_op(state, op, CrdtStamp(1, "a")));
  ASSERT_FALSE(apply_op(state, op, CrdtStamp(1, "a")));
  ASSERT_EQ(std::get<PnCounter>(state).value(), 5);
}

TEST(pn_counter_merge_laws) { check_merge_laws(counter("a", 3, 1), counter("b", 2, 0), counter("a", 5, 0)); }

// MV-Register

TEST(mv_register_keeps_concurrent_values) {
  MvRegister a = mv(std::string("red"), {{"a", 1}});
  MvRegister b = mv(std::string("blue"), {{"b", 1}});
  MvRegister merged = merge(a, b);
  ASSERT_EQ(merged.values().size(), 2u);

  // A write that observed both supersedes them
  MvRegister resolved = mv(std::string("purple"), {{"a", 1}, {"b", 2}});
  merge_into(merged, resolved);
  ASSERT_EQ(merged.values().size(), 1u);
  ASSERT_TRUE(merged.values().front() == CrdtScalar(std::string("purple")));
}

TEST(mv_register_merge_laws) {
  check_merge_laws(mv(int64_t(1), {{"a", 1}}), mv(int64_t(2), {{"b", 1}}), mv(int64_t(3), {{"a", 1}, {"b", 1}, {"c", 1}}));
}

// Version vectors

TEST(version_vector_ordering) {
  CrdtVersionVector a = {{"x", 2}, {"y", 1}};
  CrdtVersionVector b = {{"x", 1}};
  ASSERT_TRUE(vv_covers(a, b));
  ASSERT_TRUE(vv_dominates(a, b));
  ASSERT_FALSE(vv_covers(b, a));
  ASSERT_FALSE(vv_dominates(a, a));

  CrdtVersionVector c = {{"z", 4}};
  ASSERT_TRUE(vv_merge(c, a));
  ASSERT_FALSE(vv_merge(c, a));
  ASSERT_EQ(c.size(), 3u);
}

TEST(logical_clock) {
  LogicalClock clock;
  ASSERT_EQ(clock.tick(), 1u);
  ASSERT_EQ(clock.tick_n(3), 2u);
  ASSERT_EQ(clock.current_time(), 4u);
  ASSERT_EQ(clock.update(10), 11u);
  clock.observe(5);
  ASSERT_EQ(clock.current_time(), 11u);
}

// Field dispatch

TEST(op_rejected_for_wrong_strategy) {
  CrdtFieldState state = make_field_state(CrdtStrategy::PnCounter);
  ASSERT_FALSE(op_allowed(CrdtStrategy::PnCounter, SetOp{int64_t(1)}));
  ASSERT_THROWS(apply_op(state, SetOp{int64_t(1)}, CrdtStamp(1, "a")), ProtocolViolation);

  CrdtFieldState other = make_field_state(CrdtStrategy::OrSet);
  ASSERT_THROWS(merge_field(state, other), ProtocolViolation);
}

TEST(strategy_names) {
  for (uint8_t i = 0; i < CRDT_STRATEGY_COUNT; ++i) {
    auto strategy = static_cast<CrdtStrategy>(i);
    ASSERT_TRUE(parse_strategy(to_string(strategy)) == strategy);
  }
  ASSERT_FALSE(parse_strategy("last_writer").has_value());
}

int main() {
  std::cout << "Running CRDT value tests..." << std::endl << std::endl;

  RUN_TEST(lww_higher_stamp_wins);
  RUN_TEST(lww_equal_clock_breaks_tie_on_actor);
  RUN_TEST(lww_equal_stamp_falls_back_to_value);
  RUN_TEST(lww_merge_laws);
  RUN_TEST(immutable_set_once);
  RUN_TEST(or_set_union_of_disjoint_offline_adds);
  RUN_TEST(or_set_add_wins_over_concurrent_remove);
  RUN_TEST(or_set_merge_laws);
  RUN_TEST(pn_counter_converges_in_any_order);
  RUN_TEST(pn_counter_op_replay_is_harmless);
  RUN_TEST(pn_counter_merge_laws);
  RUN_TEST(mv_register_keeps_concurrent_values);
  RUN_TEST(mv_register_merge_laws);
  RUN_TEST(version_vector_ordering);
  RUN_TEST(logical_clock);
  RUN_TEST(op_rejected_for_wrong_strategy);
  RUN_TEST(strategy_names);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
