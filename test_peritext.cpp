// test_peritext.cpp
#include "peritext.hpp"
#include "test_helpers.hpp"

namespace {

PeritextMark bold(uint64_t clock, const CrdtActorId &actor, const CrdtStamp &start, const CrdtStamp &end,
                  const CrdtScalar &value = CrdtScalar(true)) {
  return PeritextMark{CrdtStamp(clock, actor), start, end, "bold", value};
}

} // namespace

TEST(insert_run_takes_consecutive_ids) {
  PeritextDoc doc;
  ASSERT_TRUE(doc.insert_run(CrdtStamp(10, "a"), std::nullopt, "hello"));
  ASSERT_EQ(doc.text(), "hello");
  ASSERT_TRUE(doc.char_id_at(0) == CrdtStamp(10, "a"));
  ASSERT_TRUE(doc.char_id_at(4) == CrdtStamp(14, "a"));
  ASSERT_EQ(doc.char_ids(1, 3).size(), 3u);
  ASSERT_FALSE(doc.insert_run(CrdtStamp(10, "a"), std::nullopt, "hello"));
}

TEST(concurrent_inserts_converge) {
  PeritextDoc base;
  base.insert_run(CrdtStamp(1, "a"), std::nullopt, "ac");

  PeritextDoc a = base;
  a.insert_run(CrdtStamp(3, "a"), CrdtStamp(1, "a"), "b");
  PeritextDoc b = base;
  b.insert_run(CrdtStamp(3, "b"), CrdtStamp(2, "a"), "d");

  PeritextDoc ab = a;
  merge_into(ab, b);
  PeritextDoc ba = b;
  merge_into(ba, a);
  ASSERT_TRUE(ab == ba);
  ASSERT_EQ(ab.text(), "abcd");
}

TEST(remove_characters) {
  PeritextDoc doc;
  doc.insert_run(CrdtStamp(1, "a"), std::nullopt, "hello world");
  ASSERT_TRUE(doc.remove(doc.char_ids(5, 6)));
  ASSERT_EQ(doc.text(), "hello");
  ASSERT_EQ(doc.size(), 5u);
}

TEST(mark_produces_span) {
  PeritextDoc doc;
  doc.insert_run(CrdtStamp(1, "a"), std::nullopt, "hello world");
  ASSERT_TRUE(doc.add_mark(bold(20, "a", CrdtStamp(1, "a"), CrdtStamp(5, "a"))));

  auto spans = doc.spans();
  ASSERT_EQ(spans.size(), 1u);
  ASSERT_EQ(spans[0].start, 0u);
  ASSERT_EQ(spans[0].end, 5u);
  ASSERT_EQ(spans[0].name, "bold");
}

TEST(later_mark_wins_per_character) {
  PeritextDoc doc;
  doc.insert_run(CrdtStamp(1, "a"), std::nullopt, "abcdef");
  doc.add_mark(bold(20, "a", CrdtStamp(1, "a"), CrdtStamp(6, "a")));
  // Clears bold on "cd"
  doc.add_mark(bold(21, "b", CrdtStamp(3, "a"), CrdtStamp(4, "a"), CrdtScalar(std::monostate{})));

  auto spans = doc.spans();
  ASSERT_EQ(spans.size(), 2u);
  ASSERT_EQ(spans[0].start, 0u);
  ASSERT_EQ(spans[0].end, 2u);
  ASSERT_EQ(spans[1].start, 4u);
  ASSERT_EQ(spans[1].end, 6u);
}

TEST(adjacent_equal_marks_coalesce) {
  PeritextDoc doc;
  doc.insert_run(CrdtStamp(1, "a"), std::nullopt, "abcd");
  doc.add_mark(bold(10, "a", CrdtStamp(1, "a"), CrdtStamp(2, "a")));
  doc.add_mark(bold(11, "b", CrdtStamp(3, "a"), CrdtStamp(4, "a")));

  auto spans = doc.spans();
  ASSERT_EQ(spans.size(), 1u);
  ASSERT_EQ(spans[0].end, 4u);
}

TEST(marks_merge_in_any_order) {
  PeritextDoc base;
  base.insert_run(CrdtStamp(1, "a"), std::nullopt, "text");

  PeritextDoc a = base;
  a.add_mark(bold(10, "a", CrdtStamp(1, "a"), CrdtStamp(2, "a")));
  PeritextDoc b = base;
  b.add_mark(PeritextMark{CrdtStamp(10, "b"), CrdtStamp(2, "a"), CrdtStamp(4, "a"), "italic", CrdtScalar(true)});

  PeritextDoc ab = a;
  merge_into(ab, b);
  PeritextDoc ba = b;
  merge_into(ba, a);
  ASSERT_TRUE(ab.spans() == ba.spans());
  ASSERT_EQ(ab.spans().size(), 2u);
  ASSERT_FALSE(merge_into(ab, ba));
}

TEST(mark_waits_for_its_anchors) {
  PeritextDoc doc;
  doc.add_mark(bold(10, "a", CrdtStamp(1, "a"), CrdtStamp(2, "a")));
  ASSERT_TRUE(doc.spans().empty());
  doc.insert_run(CrdtStamp(1, "a"), std::nullopt, "ab");
  ASSERT_EQ(doc.spans().size(), 1u);
}

int main() {
  std::cout << "Running Peritext tests..." << std::endl << std::endl;

  RUN_TEST(insert_run_takes_consecutive_ids);
  RUN_TEST(concurrent_inserts_converge);
  RUN_TEST(remove_characters);
  RUN_TEST(mark_produces_span);
  RUN_TEST(later_mark_wins_per_character);
  RUN_TEST(adjacent_equal_marks_coalesce);
  RUN_TEST(marks_merge_in_any_order);
  RUN_TEST(mark_waits_for_its_anchors);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
