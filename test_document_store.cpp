// test_document_store.cpp
#include "crdt_errors.hpp"
#include "document_store.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <tuple>

namespace {

/// Stand-in for the application's encryption: flips bits so ciphertext differs from plaintext.
class XorCipher : public FieldCipher {
public:
  CrdtBytes encrypt(const std::string &, const CrdtBytes &plaintext) override { return flip(plaintext); }
  CrdtBytes decrypt(const std::string &, const CrdtBytes &ciphertext) override { return flip(ciphertext); }

private:
  static CrdtBytes flip(CrdtBytes bytes) {
    for (auto &b : bytes) {
      b ^= 0x5a;
    }
    return bytes;
  }
};

struct Fixture {
  SchemaRegistry schemas;
  Fixture() { register_notes_schema(schemas); }
};

DocumentRef note(const std::string &id) { return DocumentRef(NOTES_NS, id); }

std::string text_of(const CrdtScalar &value) { return std::get<std::string>(value); }

} // namespace

TEST(create_and_read) {
  Fixture f;
  TestNode a("a", f.schemas);
  DocumentRef ref = a.store.create(NOTES_NS, "n1", [](DocumentWriter &w) {
    w.set("author", std::string("alice"));
    w.set("title", std::string("Groceries"));
    w.set("profile.name", std::string("Alice"));
  });

  ASSERT_TRUE(a.store.contains(ref));
  DocumentView view = a.store.read(ref);
  ASSERT_EQ(view.get_string("author").value_or(""), "alice");
  ASSERT_EQ(view.get_string("title").value_or(""), "Groceries");
  ASSERT_EQ(view.get_string("profile.name").value_or(""), "Alice");
  ASSERT_FALSE(view.get_int("score").has_value());

  DocumentRef generated = a.store.create(NOTES_NS, "");
  ASSERT_EQ(generated.id.size(), 36u);
  ASSERT_TRUE(a.store.contains(generated));
  ASSERT_EQ(a.store.documents(NOTES_NS).size(), 2u);
}

TEST(unknown_documents_and_namespaces) {
  Fixture f;
  TestNode a("a", f.schemas);
  ASSERT_THROWS(a.store.read(note("missing")), DocumentNotFound);
  ASSERT_THROWS(a.store.create("nope", "x"), SchemaError);
  ASSERT_THROWS(a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("unknown", int64_t(1)); }), SchemaError);
  ASSERT_THROWS(a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("title"); }), SchemaError);
  // The aborted writes left nothing behind
  ASSERT_FALSE(a.store.contains(note("n1")));
  ASSERT_EQ(a.ctx.clock(), 0u);
}

TEST(mutate_produces_one_chained_delta) {
  Fixture f;
  TestNode a("a", f.schemas);
  Delta first = a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("title", std::string("t"));
    w.add("tags", "x");
    w.increment("likes", 2);
  });
  ASSERT_EQ(first.ops.size(), 3u);
  ASSERT_EQ(first.clock, 3u);
  ASSERT_EQ(first.prev, 0u);
  ASSERT_EQ(first.actor, "a");

  Delta second = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("u")); });
  ASSERT_EQ(second.prev, first.clock);
  ASSERT_EQ(a.store.state_vector(note("n1")).at("a"), second.clock);
  ASSERT_EQ(a.store.log_size(note("n1")), 2u);

  Delta nothing = a.store.mutate(note("n1"), [](DocumentWriter &) {});
  ASSERT_TRUE(nothing.empty());
  ASSERT_EQ(a.store.log_size(note("n1")), 2u);
}

TEST(repeated_lww_write_keeps_last_op) {
  Fixture f;
  TestNode a("a", f.schemas);
  Delta delta = a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("title", std::string("draft"));
    w.set("title", std::string("final"));
    ASSERT_EQ(w.view().get_string("title").value_or(""), "final");
  });
  ASSERT_EQ(delta.ops.size(), 1u);
  ASSERT_EQ(a.store.read(note("n1")).get_string("title").value_or(""), "final");
}

TEST(lww_tie_on_equal_clock_resolves_by_actor) {
  Fixture f;
  TestNode a("A", f.schemas);
  TestNode b("B", f.schemas);
  a.ctx.observe(4);
  b.ctx.observe(4);

  Delta from_a = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("x")); });
  Delta from_b = b.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("y")); });
  ASSERT_EQ(from_a.clock, 5u);
  ASSERT_EQ(from_b.clock, 5u);

  a.store.apply_remote(from_b);
  b.store.apply_remote(from_a);
  ASSERT_EQ(a.store.read(note("n1")).get_string("title").value_or(""), "y");
  ASSERT_EQ(b.store.read(note("n1")).get_string("title").value_or(""), "y");
  ASSERT_TRUE(a.store.read(note("n1")).canonical() == b.store.read(note("n1")).canonical());
}

TEST(apply_remote_is_idempotent) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  Delta delta = a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.increment("likes", 5);
    w.push_back("items", std::string("milk"));
  });

  ASSERT_TRUE(b.store.apply_remote(delta));
  ASSERT_FALSE(b.store.apply_remote(delta));
  ASSERT_EQ(b.store.read(note("n1")).get_counter("likes"), 5);
  ASSERT_EQ(b.store.read(note("n1")).get_list("items").size(), 1u);
  ASSERT_EQ(b.store.log_size(note("n1")), 1u);
  // Observing the remote clock keeps local clocks ahead of it
  ASSERT_TRUE(b.ctx.clock() >= delta.clock);
}

TEST(invalid_remote_deltas_are_protocol_violations) {
  Fixture f;
  TestNode b("b", f.schemas);

  Delta unknown_field{note("n1"), "a", 1, 0, {FieldOp{"nope", CrdtStrategy::Lww, 1, SetOp{int64_t(1)}}}};
  ASSERT_THROWS(b.store.apply_remote(unknown_field), ProtocolViolation);

  Delta wrong_strategy{note("n1"), "a", 1, 0, {FieldOp{"likes", CrdtStrategy::Lww, 1, SetOp{int64_t(1)}}}};
  ASSERT_THROWS(b.store.apply_remote(wrong_strategy), ProtocolViolation);

  Delta unknown_ns{DocumentRef("nope", "x"), "a", 1, 0, {}};
  ASSERT_THROWS(b.store.apply_remote(unknown_ns), ProtocolViolation);

  Delta forged_counter{note("n1"), "a", 1, 0, {FieldOp{"likes", CrdtStrategy::PnCounter, 1, CounterOp{"b", 100, 0}}}};
  ASSERT_THROWS(b.store.apply_remote(forged_counter), ProtocolViolation);

  Delta clock_too_low{note("n1"), "a", 1, 0, {FieldOp{"title", CrdtStrategy::Lww, 3, SetOp{std::string("t")}}}};
  ASSERT_THROWS(b.store.apply_remote(clock_too_low), ProtocolViolation);

  Delta bad_chain{note("n1"), "a", 3, 3, {FieldOp{"title", CrdtStrategy::Lww, 3, SetOp{std::string("t")}}}};
  ASSERT_THROWS(b.store.apply_remote(bad_chain), ProtocolViolation);

  ASSERT_FALSE(b.store.contains(note("n1")));
}

TEST(immutable_conflict_leaves_document_intact) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  Delta from_a = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("author", std::string("alice")); });
  b.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("author", std::string("bob"));
    w.set("title", std::string("mine"));
  });

  ASSERT_THROWS(b.store.apply_remote(from_a), ImmutableConflict);
  DocumentView view = b.store.read(note("n1"));
  ASSERT_EQ(view.get_string("author").value_or(""), "bob");
  ASSERT_EQ(view.get_string("title").value_or(""), "mine");

  // Writing the same value again is fine, a different one is not
  b.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("author", std::string("bob")); });
  ASSERT_THROWS(b.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("author", std::string("carol")); }),
                ImmutableConflict);
}

TEST(out_of_order_deltas_fill_the_chain) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  Delta d1 = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes", 1); });
  Delta d2 = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes", 1); });
  Delta d3 = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("three")); });
  ASSERT_EQ(d2.prev, d1.clock);
  ASSERT_EQ(d3.prev, d2.clock);

  ASSERT_TRUE(b.store.apply_remote(d3));
  // Applied, but the state vector cannot claim d1 and d2
  ASSERT_EQ(b.store.read(note("n1")).get_string("title").value_or(""), "three");
  ASSERT_FALSE(b.store.state_vector(note("n1")).contains("a"));
  ASSERT_FALSE(b.store.apply_remote(d3));

  b.store.apply_remote(d1);
  ASSERT_EQ(b.store.state_vector(note("n1")).at("a"), d1.clock);
  b.store.apply_remote(d2);
  ASSERT_EQ(b.store.state_vector(note("n1")).at("a"), d3.clock);
  ASSERT_EQ(b.store.read(note("n1")).get_counter("likes"), 2);

  // A third replica that has nothing gets all three from b
  auto missing = b.store.deltas_since(note("n1"), {});
  ASSERT_TRUE(missing.has_value());
  ASSERT_EQ(missing->size(), 3u);
}

TEST(ahead_deltas_are_still_offered) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  Delta d1 = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes", 1); });
  Delta d2 = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes", 1); });
  (void)d1;
  b.store.apply_remote(d2);

  // b's state vector is empty for "a", yet d2 is logged and must be handed on
  auto offered = b.store.deltas_since(note("n1"), {});
  ASSERT_EQ(offered->size(), 1u);
  ASSERT_TRUE(offered->front() == d2);
}

TEST(subscriptions_fire_on_changes_only) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  int calls = 0;
  std::string seen;
  SubscriptionId id = b.store.subscribe(note("n1"), [&](const DocumentView &view) {
    ++calls;
    seen = view.get_string("title").value_or("");
  });

  Delta delta = a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("remote")); });
  b.store.apply_remote(delta);
  ASSERT_EQ(calls, 1);
  ASSERT_EQ(seen, "remote");

  b.store.apply_remote(delta);
  ASSERT_EQ(calls, 1);

  b.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("local")); });
  ASSERT_EQ(calls, 2);
  ASSERT_EQ(seen, "local");

  b.store.mutate(note("other"), [](DocumentWriter &w) { w.set("title", std::string("x")); });
  ASSERT_EQ(calls, 2);

  b.store.unsubscribe(id);
  b.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("title", std::string("after")); });
  ASSERT_EQ(calls, 2);
}

TEST(delta_listeners_see_local_and_remote_deltas) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  CrdtVector<DeltaSource> sources;
  b.store.add_delta_listener([&](const Delta &, DeltaSource source) { sources.push_back(source); });

  b.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); });
  b.store.apply_remote(a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); }));
  ASSERT_EQ(sources.size(), 2u);
  ASSERT_TRUE(sources[0] == DeltaSource::Local);
  ASSERT_TRUE(sources[1] == DeltaSource::Remote);
}

TEST(transaction_is_all_or_nothing) {
  Fixture f;
  TestNode a("a", f.schemas);
  a.store.create(NOTES_NS, "n1", [](DocumentWriter &w) { w.set("title", std::string("before")); });
  uint64_t clock = a.ctx.clock();
  int notified = 0;
  a.store.subscribe(note("n1"), [&](const DocumentView &) { ++notified; });

  ASSERT_THROWS(a.store.transaction([](StoreTransaction &tx) {
    tx.writer(note("n1")).set("title", std::string("during"));
    tx.writer(note("n2")).set("title", std::string("new"));
    throw InvalidArgument("abort");
  }),
                InvalidArgument);
  ASSERT_EQ(a.store.read(note("n1")).get_string("title").value_or(""), "before");
  ASSERT_FALSE(a.store.contains(note("n2")));
  ASSERT_EQ(a.ctx.clock(), clock);
  ASSERT_EQ(notified, 0);

  CrdtVector<Delta> deltas = a.store.transaction([](StoreTransaction &tx) {
    tx.writer(note("n1")).set("title", std::string("after"));
    tx.writer(note("n1")).increment("likes", 3);
    tx.writer(note("n2")).set("title", std::string("new"));
    ASSERT_EQ(tx.read(note("n1")).get_counter("likes"), 3);
  });
  ASSERT_EQ(deltas.size(), 2u);
  ASSERT_EQ(deltas[0].ops.size(), 2u);
  ASSERT_EQ(notified, 1);
  ASSERT_EQ(a.store.read(note("n2")).get_string("title").value_or(""), "new");
}

TEST(store_writes_inside_a_transaction_are_refused) {
  Fixture f;
  TestNode a("a", f.schemas);
  a.store.create(NOTES_NS, "n1", [](DocumentWriter &w) { w.set("title", std::string("before")); });

  ASSERT_THROWS(a.store.transaction([&](StoreTransaction &tx) {
    tx.writer(note("n1")).set("title", std::string("during"));
    a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); });
  }),
                InvalidArgument);
  ASSERT_THROWS(a.store.transaction([&](StoreTransaction &) { a.store.transaction([](StoreTransaction &) {}); }),
                InvalidArgument);
  ASSERT_EQ(a.store.read(note("n1")).get_string("title").value_or(""), "before");
  ASSERT_EQ(a.store.read(note("n1")).get_counter("likes"), 0);

  // Writes after the transaction are unaffected
  a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); });
  ASSERT_EQ(a.store.read(note("n1")).get_counter("likes"), 1);
}

TEST(all_strategies_converge) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("author", std::string("alice"));
    w.text_insert("body", 0, "hello world");
    w.push_back("items", std::string("milk"));
    w.add("tags", "shared");
  });
  sync_pair(a.store, b.store);

  a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("title", std::string("from a"));
    w.add("tags", "red");
    w.remove("tags", "shared");
    w.increment("likes", 10);
    w.insert("items", 0, std::string("eggs"));
    w.mv_set("status", std::string("open"));
    w.text_insert("body", 5, ",");
    w.mark("body", 0, 5, "bold", true);
  });
  b.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.set("title", std::string("from b"));
    w.add("tags", "shared");
    w.add("tags", "blue");
    w.decrement("likes", 3);
    w.push_back("items", std::string("bread"));
    w.remove_at("items", 0);
    w.mv_set("status", std::string("closed"));
    w.text_remove("body", 6, 5);
    w.text_insert("body", 6, "there");
  });

  sync_pair(a.store, b.store);
  sync_pair(b.store, a.store);

  DocumentView va = a.store.read(note("n1"));
  DocumentView vb = b.store.read(note("n1"));
  ASSERT_TRUE(va.canonical() == vb.canonical());
  ASSERT_TRUE(va.state_vector() == vb.state_vector());

  ASSERT_EQ(va.get_counter("likes"), 7);
  // b re-added "shared" with a fresh tag while a removed the tags it had seen
  ASSERT_TRUE(va.set_contains("tags", "shared"));
  ASSERT_EQ(va.get_set("tags").size(), 3u);
  ASSERT_EQ(va.get_values("status").size(), 2u);
  CrdtVector<CrdtScalar> items = va.get_list("items");
  ASSERT_EQ(items.size(), 2u);
  ASSERT_EQ(text_of(items[0]), "eggs");
  ASSERT_EQ(text_of(items[1]), "bread");
  ASSERT_EQ(va.get_text("body"), "hello, there");
  ASSERT_EQ(va.get_spans("body").size(), 1u);

  // A write after seeing both values resolves the multi-value register
  a.store.mutate(note("n1"), [](DocumentWriter &w) { w.mv_set("status", std::string("merged")); });
  sync_pair(a.store, b.store);
  ASSERT_EQ(b.store.read(note("n1")).get_values("status").size(), 1u);
}

TEST(or_set_union_across_offline_nodes) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  a.store.mutate(note("n1"), [](DocumentWriter &w) {
    for (int i = 0; i < 500; ++i) {
      w.add("tags", "a-" + std::to_string(i));
    }
  });
  b.store.mutate(note("n1"), [](DocumentWriter &w) {
    for (int i = 0; i < 500; ++i) {
      w.add("tags", "b-" + std::to_string(i));
    }
  });
  sync_pair(a.store, b.store);
  sync_pair(b.store, a.store);
  ASSERT_EQ(a.store.read(note("n1")).get_set("tags").size(), 1000u);
  ASSERT_EQ(b.store.read(note("n1")).get_set("tags").size(), 1000u);
}

TEST(pn_counter_scenario_in_any_order) {
  Fixture f;
  TestNode x("x", f.schemas);
  TestNode y("y", f.schemas);
  TestNode z("z", f.schemas);
  CrdtVector<Delta> deltas = {
      x.store.mutate(note("c"), [](DocumentWriter &w) { w.increment("likes", 10); }),
      y.store.mutate(note("c"), [](DocumentWriter &w) { w.increment("likes", 10); }),
      z.store.mutate(note("c"), [](DocumentWriter &w) { w.increment("likes", 10); }),
      x.store.mutate(note("c"), [](DocumentWriter &w) { w.decrement("likes", 5); }),
  };

  auto by_origin = [](const Delta &l, const Delta &r) { return std::tie(l.actor, l.clock) < std::tie(r.actor, r.clock); };
  std::sort(deltas.begin(), deltas.end(), by_origin);
  do {
    TestNode replica("r", f.schemas);
    for (const auto &delta : deltas) {
      replica.store.apply_remote(delta);
    }
    ASSERT_EQ(replica.store.read(note("c")).get_counter("likes"), 25);
  } while (std::next_permutation(deltas.begin(), deltas.end(), by_origin));
}

TEST(numeric_bound_clamps_on_read) {
  Fixture f;
  TestNode a("a", f.schemas);
  ASSERT_THROWS(a.store.mutate(note("n1"), [](DocumentWriter &w) { w.set("score", int64_t(-5)); }), InvalidArgument);

  Delta remote{note("n1"), "evil", 1, 0, {FieldOp{"score", CrdtStrategy::Lww, 1, SetOp{int64_t(-5)}}}};
  a.store.apply_remote(remote);
  ASSERT_EQ(a.store.read(note("n1")).get_int("score").value_or(-1), 0);
}

TEST(compaction_serves_snapshots) {
  Fixture f;
  TestNode a("a", f.schemas);
  TestNode b("b", f.schemas);
  for (int i = 0; i < 5; ++i) {
    a.store.mutate(note("n1"), [&](DocumentWriter &w) {
      w.increment("likes");
      w.push_back("items", std::string("item-") + std::to_string(i));
    });
  }
  a.store.compact(note("n1"));
  ASSERT_EQ(a.store.log_size(note("n1")), 0u);
  ASSERT_FALSE(a.store.deltas_since(note("n1"), {}).has_value());
  ASSERT_TRUE(a.store.deltas_since(note("n1"), a.store.state_vector(note("n1")))->empty());

  sync_pair(a.store, b.store);
  ASSERT_TRUE(b.store.read(note("n1")).canonical() == a.store.read(note("n1")).canonical());
  ASSERT_FALSE(b.store.merge_snapshot(note("n1"), a.store.snapshot(note("n1"))));

  // Writes after compaction flow as deltas again
  a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); });
  sync_pair(a.store, b.store);
  ASSERT_EQ(b.store.read(note("n1")).get_counter("likes"), 6);
}

TEST(automatic_compaction) {
  Fixture f;
  StoreConfig config;
  config.compact_after_deltas = 3;
  TestNode a("a", f.schemas, config);
  for (int i = 0; i < 3; ++i) {
    a.store.mutate(note("n1"), [](DocumentWriter &w) { w.increment("likes"); });
  }
  ASSERT_EQ(a.store.log_size(note("n1")), 0u);
  ASSERT_EQ(a.store.read(note("n1")).get_counter("likes"), 3);
}

TEST(corrupt_snapshot_is_rejected) {
  Fixture f;
  TestNode a("a", f.schemas);
  ASSERT_THROWS(a.store.merge_snapshot(note("n1"), CrdtBytes{1, 2}), DeserializeCorruption);
  ASSERT_FALSE(a.store.contains(note("n1")));
}

TEST(tombstone_collection) {
  Fixture f;
  TestNode a("a", f.schemas);
  a.store.mutate(note("n1"), [](DocumentWriter &w) {
    w.push_back("items", std::string("a"));
    w.push_back("items", std::string("b"));
  });
  a.store.mutate(note("n1"), [](DocumentWriter &w) { w.remove_at("items", 1); });
  ASSERT_EQ(a.store.gc_tombstones(note("n1")), 1u);
  ASSERT_EQ(a.store.read(note("n1")).get_list("items").size(), 1u);
}

TEST(sealed_personal_fields) {
  Fixture f;
  NodeContext ctx("a");
  DocumentStore store(ctx, f.schemas, {}, nullptr, std::make_shared<XorCipher>());
  CrdtBytes plaintext = {'p', 'i', 'n'};
  store.mutate(note("n1"), [&](DocumentWriter &w) { w.set_sealed("secret", plaintext); });

  DocumentView view = store.read(note("n1"));
  ASSERT_TRUE(std::get<CrdtBytes>(view.get("secret")) != plaintext);
  ASSERT_TRUE(view.open_sealed("secret") == plaintext);
  ASSERT_THROWS(view.open_sealed("title"), SchemaError);
  ASSERT_THROWS(store.mutate(note("n1"), [](DocumentWriter &w) { w.set("secret", std::string("plain")); }),
                SchemaError);

  // Without a cipher nothing can be sealed
  TestNode plain("b", f.schemas);
  ASSERT_THROWS(plain.store.mutate(note("n1"), [&](DocumentWriter &w) { w.set_sealed("secret", plaintext); }),
                InvalidArgument);
}

int main() {
  std::cout << "Running document store tests..." << std::endl << std::endl;
  CrdtLog::set_level(CrdtLogLevel::Warn);

  RUN_TEST(create_and_read);
  RUN_TEST(unknown_documents_and_namespaces);
  RUN_TEST(mutate_produces_one_chained_delta);
  RUN_TEST(repeated_lww_write_keeps_last_op);
  RUN_TEST(lww_tie_on_equal_clock_resolves_by_actor);
  RUN_TEST(apply_remote_is_idempotent);
  RUN_TEST(invalid_remote_deltas_are_protocol_violations);
  RUN_TEST(immutable_conflict_leaves_document_intact);
  RUN_TEST(out_of_order_deltas_fill_the_chain);
  RUN_TEST(ahead_deltas_are_still_offered);
  RUN_TEST(subscriptions_fire_on_changes_only);
  RUN_TEST(delta_listeners_see_local_and_remote_deltas);
  RUN_TEST(transaction_is_all_or_nothing);
  RUN_TEST(store_writes_inside_a_transaction_are_refused);
  RUN_TEST(all_strategies_converge);
  RUN_TEST(or_set_union_across_offline_nodes);
  RUN_TEST(pn_counter_scenario_in_any_order);
  RUN_TEST(numeric_bound_clamps_on_read);
  RUN_TEST(compaction_serves_snapshots);
  RUN_TEST(automatic_compaction);
  RUN_TEST(corrupt_snapshot_is_rejected);
  RUN_TEST(tombstone_collection);
  RUN_TEST(sealed_personal_fields);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
