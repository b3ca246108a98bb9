// test_codec.cpp
#include "crdt_codec.hpp"
#include "crdt_errors.hpp"
#include "sync_protocol.hpp"
#include "test_helpers.hpp"

#include <limits>

namespace {

Delta sample_delta() {
  Delta delta;
  delta.ref = DocumentRef("notes", "n1");
  delta.actor = "actor-1";
  delta.clock = 42;
  delta.prev = 17;
  delta.ops = {
      FieldOp{"title", CrdtStrategy::Lww, 30, SetOp{std::string("hello")}},
      FieldOp{"score", CrdtStrategy::Lww, 31, SetOp{int64_t(-7)}},
      FieldOp{"tags", CrdtStrategy::OrSet, 32, OrSetAddOp{"red", "tag-1"}},
      FieldOp{"tags", CrdtStrategy::OrSet, 33, OrSetRemoveOp{"blue", {"tag-2", "tag-3"}}},
      FieldOp{"likes", CrdtStrategy::PnCounter, 34, CounterOp{"actor-1", 10, 3}},
      FieldOp{"items", CrdtStrategy::Rga, 35, SeqInsertOp{CrdtStamp(35, "actor-1"), CrdtStamp(2, "x"), 2.5}},
      FieldOp{"items", CrdtStrategy::Rga, 36, SeqRemoveOp{CrdtStamp(2, "x")}},
      FieldOp{"status", CrdtStrategy::MvRegister, 37, MvSetOp{true, {{"actor-1", 37}, {"x", 4}}}},
      FieldOp{"body", CrdtStrategy::Peritext, 38, TextInsertOp{CrdtStamp(38, "actor-1"), std::nullopt, "abc"}},
      FieldOp{"body", CrdtStrategy::Peritext, 41, TextRemoveOp{{CrdtStamp(39, "actor-1")}}},
      FieldOp{"body", CrdtStrategy::Peritext, 42,
              TextMarkOp{PeritextMark{CrdtStamp(42, "actor-1"), CrdtStamp(38, "actor-1"), CrdtStamp(40, "actor-1"),
                                      "link", std::string("https://example.org")}}},
      FieldOp{"secret", CrdtStrategy::Lww, 40, SetOp{CrdtBytes{0, 1, 255}}},
  };
  return delta;
}

} // namespace

TEST(varint_edges) {
  ByteWriter w;
  w.put_varint(0);
  w.put_varint(127);
  w.put_varint(128);
  w.put_varint(std::numeric_limits<uint64_t>::max());
  w.put_svarint(-1);
  w.put_svarint(std::numeric_limits<int64_t>::min());
  w.put_svarint(std::numeric_limits<int64_t>::max());
  w.put_f64(-0.125);

  ByteReader r(w.data());
  ASSERT_EQ(r.get_varint(), 0u);
  ASSERT_EQ(r.get_varint(), 127u);
  ASSERT_EQ(r.get_varint(), 128u);
  ASSERT_EQ(r.get_varint(), std::numeric_limits<uint64_t>::max());
  ASSERT_EQ(r.get_svarint(), -1);
  ASSERT_EQ(r.get_svarint(), std::numeric_limits<int64_t>::min());
  ASSERT_EQ(r.get_svarint(), std::numeric_limits<int64_t>::max());
  ASSERT_EQ(r.get_f64(), -0.125);
  ASSERT_TRUE(r.at_end());
}

TEST(small_values_stay_small) {
  ByteWriter w;
  w.put_varint(100);
  w.put_svarint(-50);
  ASSERT_EQ(w.data().size(), 2u);
}

TEST(delta_round_trip) {
  Delta delta = sample_delta();
  CrdtBytes bytes = encode_delta(delta);
  ASSERT_TRUE(decode_delta(bytes) == delta);
  // Deterministic
  ASSERT_TRUE(encode_delta(decode_delta(bytes)) == bytes);
}

TEST(truncated_delta_is_rejected) {
  CrdtBytes bytes = encode_delta(sample_delta());
  for (size_t cut : {size_t(0), size_t(1), bytes.size() / 2, bytes.size() - 1}) {
    CrdtBytes truncated(bytes.begin(), bytes.begin() + cut);
    ASSERT_THROWS(decode_delta(truncated), DeserializeCorruption);
  }
}

TEST(trailing_bytes_are_rejected) {
  CrdtBytes bytes = encode_delta(sample_delta());
  bytes.push_back(0);
  ASSERT_THROWS(decode_delta(bytes), DeserializeCorruption);
}

TEST(oversized_count_is_rejected) {
  ByteWriter w;
  w.put_varint(1u << 30); // claims a billion elements
  ByteReader r(w.data());
  ASSERT_THROWS(r.get_count(), DeserializeCorruption);

  ByteWriter overlong;
  for (int i = 0; i < 11; ++i) {
    overlong.put_u8(0xff);
  }
  ByteReader r2(overlong.data());
  ASSERT_THROWS(r2.get_varint(), DeserializeCorruption);
}

TEST(unknown_variant_tag_is_rejected) {
  ByteWriter w;
  w.put_u8(200);
  ByteReader r(w.data());
  ASSERT_THROWS(decode_scalar(r), DeserializeCorruption);

  ByteReader r2(w.data());
  ASSERT_THROWS(decode_op(r2), DeserializeCorruption);
}

TEST(snapshot_round_trip) {
  DocumentSnapshot snapshot;
  OrSet tags;
  tags.adds["a"].insert("t1");
  tags.removed.insert("t0");
  PnCounter likes;
  likes.increments["x"] = 5;
  RgaSequence items;
  items.integrate({CrdtStamp(1, "x"), std::nullopt, std::string("first")});
  items.remove(CrdtStamp(1, "x"));
  PeritextDoc body;
  body.insert_run(CrdtStamp(3, "x"), std::nullopt, "hi");
  body.add_mark(PeritextMark{CrdtStamp(5, "x"), CrdtStamp(3, "x"), CrdtStamp(4, "x"), "bold", true});

  snapshot.fields["author"] = ImmutableValue{std::string("x"), CrdtStamp(1, "x")};
  snapshot.fields["title"] = LwwRegister{std::string("t"), CrdtStamp(2, "x")};
  snapshot.fields["tags"] = tags;
  snapshot.fields["likes"] = likes;
  snapshot.fields["items"] = items;
  snapshot.fields["status"] = MvRegister{{MvEntry{int64_t(1), {{"x", 6}}}}};
  snapshot.fields["body"] = body;
  snapshot.state_vector = {{"x", 6}, {"y", 2}};

  CrdtBytes bytes = encode_snapshot(snapshot);
  ASSERT_TRUE(decode_snapshot(bytes) == snapshot);

  CrdtBytes truncated(bytes.begin(), bytes.end() - 1);
  ASSERT_THROWS(decode_snapshot(truncated), DeserializeCorruption);
}

TEST(sync_messages_round_trip) {
  CrdtStateVectors svs;
  svs[DocumentRef("notes", "n1")] = {{"a", 3}};
  CrdtVector<SyncMessage> messages = {
      HandshakeMessage{CRDT_SYNC_PROTOCOL_VERSION, "node-1", "actor-1", svs},
      DeltaBatchMessage{DocumentRef("notes", "n1"), {sample_delta()}},
      AckMessage{DocumentRef("notes", "n1"), 42},
      SnapshotMessage{DocumentRef("notes", "n1"), CrdtBytes{1, 2, 3}},
      GoodbyeMessage{"shutdown"},
  };
  for (const auto &message : messages) {
    CrdtBytes bytes = encode_message(message);
    ASSERT_TRUE(decode_message(bytes) == message);
  }

  ASSERT_THROWS(decode_message(CrdtBytes{}), DeserializeCorruption);
  ASSERT_THROWS(decode_message(CrdtBytes{9}), DeserializeCorruption);
}

int main() {
  std::cout << "Running codec tests..." << std::endl << std::endl;

  RUN_TEST(varint_edges);
  RUN_TEST(small_values_stay_small);
  RUN_TEST(delta_round_trip);
  RUN_TEST(truncated_delta_is_rejected);
  RUN_TEST(trailing_bytes_are_rejected);
  RUN_TEST(oversized_count_is_rejected);
  RUN_TEST(unknown_variant_tag_is_rejected);
  RUN_TEST(snapshot_round_trip);
  RUN_TEST(sync_messages_round_trip);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
