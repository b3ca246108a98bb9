// test_rga.cpp
#include "rga.hpp"
#include "test_helpers.hpp"

namespace {

CrdtScalar str(const char *s) { return CrdtScalar(std::string(s)); }

std::string joined(const RgaSequence &seq) {
  std::string out;
  for (const auto &value : seq.values()) {
    out += std::get<std::string>(value);
  }
  return out;
}

} // namespace

TEST(append_in_order) {
  RgaSequence seq;
  ASSERT_TRUE(seq.integrate({CrdtStamp(1, "a"), std::nullopt, str("h")}));
  ASSERT_TRUE(seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("i")}));
  ASSERT_FALSE(seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("i")}));
  ASSERT_EQ(joined(seq), "hi");
  ASSERT_EQ(seq.size(), 2u);
  ASSERT_TRUE(seq.id_at(1) == CrdtStamp(2, "a"));
  ASSERT_FALSE(seq.id_at(2).has_value());
}

TEST(insert_after_places_directly_after_neighbour) {
  RgaSequence seq;
  seq.integrate({CrdtStamp(1, "a"), std::nullopt, str("a")});
  seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("c")});
  // Inserted later between the two: higher clock than the existing sibling, so it sorts first
  seq.integrate({CrdtStamp(3, "a"), CrdtStamp(1, "a"), str("b")});
  ASSERT_EQ(joined(seq), "abc");
}

TEST(concurrent_inserts_order_identically) {
  RgaElement root{CrdtStamp(1, "a"), std::nullopt, str("x")};
  RgaElement from_a{CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("A")};
  RgaElement from_b{CrdtStamp(2, "b"), CrdtStamp(1, "a"), str("B")};

  RgaSequence r1;
  r1.integrate(root);
  r1.integrate(from_a);
  r1.integrate(from_b);

  RgaSequence r2;
  r2.integrate(from_b);
  r2.integrate(root);
  r2.integrate(from_a);

  ASSERT_EQ(joined(r1), joined(r2));
  // Descending id among siblings: (2, b) before (2, a)
  ASSERT_EQ(joined(r1), "xBA");
  ASSERT_TRUE(r1 == r2);
}

TEST(element_waits_for_its_left_neighbour) {
  RgaSequence seq;
  seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("y")});
  ASSERT_EQ(seq.size(), 0u);
  ASSERT_EQ(seq.pending_count(), 1u);

  seq.integrate({CrdtStamp(1, "a"), std::nullopt, str("x")});
  ASSERT_EQ(seq.pending_count(), 0u);
  ASSERT_EQ(joined(seq), "xy");
}

TEST(tombstone_before_element) {
  RgaSequence seq;
  ASSERT_TRUE(seq.remove(CrdtStamp(1, "a")));
  ASSERT_FALSE(seq.remove(CrdtStamp(1, "a")));
  seq.integrate({CrdtStamp(1, "a"), std::nullopt, str("gone")});
  seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("kept")});
  ASSERT_EQ(joined(seq), "kept");
  ASSERT_TRUE(seq.is_removed(CrdtStamp(1, "a")));
  ASSERT_EQ(seq.ordered_ids(true).size(), 2u);
  ASSERT_EQ(seq.ordered_ids(false).size(), 1u);
}

TEST(merge_is_commutative_and_idempotent) {
  RgaSequence a;
  a.integrate({CrdtStamp(1, "a"), std::nullopt, str("1")});
  a.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("2")});
  a.remove(CrdtStamp(1, "a"));

  RgaSequence b;
  b.integrate({CrdtStamp(1, "a"), std::nullopt, str("1")});
  b.integrate({CrdtStamp(3, "b"), CrdtStamp(1, "a"), str("3")});

  RgaSequence ab = a;
  merge_into(ab, b);
  RgaSequence ba = b;
  merge_into(ba, a);
  ASSERT_TRUE(ab == ba);
  ASSERT_EQ(joined(ab), joined(ba));
  ASSERT_EQ(joined(ab), "32");

  ASSERT_FALSE(merge_into(ab, b));
}

TEST(garbage_collect_drops_unreferenced_tombstones) {
  RgaSequence seq;
  seq.integrate({CrdtStamp(1, "a"), std::nullopt, str("a")});
  seq.integrate({CrdtStamp(2, "a"), CrdtStamp(1, "a"), str("b")});
  seq.integrate({CrdtStamp(3, "a"), CrdtStamp(2, "a"), str("c")});
  seq.remove(CrdtStamp(1, "a")); // referenced by (2, a)
  seq.remove(CrdtStamp(3, "a")); // referenced by nobody

  ASSERT_EQ(seq.garbage_collect(), 1u);
  ASSERT_TRUE(seq.find(CrdtStamp(3, "a")) == nullptr);
  ASSERT_TRUE(seq.find(CrdtStamp(1, "a")) != nullptr);
  ASSERT_EQ(joined(seq), "b");
}

int main() {
  std::cout << "Running RGA tests..." << std::endl << std::endl;

  RUN_TEST(append_in_order);
  RUN_TEST(insert_after_places_directly_after_neighbour);
  RUN_TEST(concurrent_inserts_order_identically);
  RUN_TEST(element_waits_for_its_left_neighbour);
  RUN_TEST(tombstone_before_element);
  RUN_TEST(merge_is_commutative_and_idempotent);
  RUN_TEST(garbage_collect_drops_unreferenced_tombstones);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
