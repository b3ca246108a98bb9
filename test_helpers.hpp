// test_helpers.hpp
#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "crdt_log.hpp"
#include "document_store.hpp"
#include "ledger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                                                 \
  do {                                                                                                                 \
    std::cout << "Running test: " << #name << "...";                                                                   \
    test_##name();                                                                                                     \
    std::cout << " PASSED" << std::endl;                                                                               \
  } while (0)

#define ASSERT_EQ(a, b)                                                                                                \
  do {                                                                                                                 \
    if ((a) != (b)) {                                                                                                  \
      std::cerr << "Assertion failed: " << #a << " == " << #b << " (got " << (a) << " and " << (b) << ")"            \
                << " at " << __FILE__ << ":" << __LINE__ << std::endl;                                                 \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl;              \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_THROWS(expr, type)                                                                                      \
  do {                                                                                                                 \
    bool thrown_ = false;                                                                                              \
    try {                                                                                                              \
      expr;                                                                                                            \
    } catch (const type &) {                                                                                           \
      thrown_ = true;                                                                                                  \
    }                                                                                                                  \
    if (!thrown_) {                                                                                                    \
      std::cerr << "Expected " << #type << " from " << #expr << " at " << __FILE__ << ":" << __LINE__ << std::endl;  \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

constexpr const char *NOTES_NS = "notes";

/// A namespace with one field per strategy.
inline void register_notes_schema(SchemaRegistry &registry) {
  registry.add(DocumentSchema::from_metadata(NOTES_NS, {
                                                           {"author", "string", "immutable", std::nullopt, false},
                                                           {"title", "string", "lww", std::nullopt, false},
                                                           {"score", "int", "lww", 0, false},
                                                           {"profile.name", "string", "lww", std::nullopt, false},
                                                           {"secret", "bytes", "lww", std::nullopt, true},
                                                           {"tags", "set<string>", "or_set", std::nullopt, false},
                                                           {"likes", "int", "pn_counter", std::nullopt, false},
                                                           {"items", "list<string>", "rga", std::nullopt, false},
                                                           {"status", "string", "mv_register", std::nullopt, false},
                                                           {"body", "text", "peritext", std::nullopt, false},
                                                       }));
}

/// One replica: its context and its store.
struct TestNode {
  NodeContext ctx;
  DocumentStore store;

  TestNode(const CrdtActorId &actor, const SchemaRegistry &schemas, StoreConfig config = {},
           DocumentStorage *storage = nullptr)
      : ctx(actor), store(ctx, schemas, config, storage) {}
};

/// One replica running the ledger, with a settable wall clock.
struct LedgerNode {
  SchemaRegistry schemas;
  NodeContext ctx;
  DocumentStore store;
  Ledger ledger;
  std::atomic<int64_t> wall_ms{1000000};

  explicit LedgerNode(const CrdtActorId &actor) : ctx(actor), store(ctx, schemas), ledger(store) {
    Ledger::register_schemas(schemas);
    ctx.set_wall_clock([this] { return wall_ms.load(); });
  }
};

/// Applies every delta of `from` that `to` is missing, for every document.
inline void sync_pair(DocumentStore &from, DocumentStore &to) {
  for (const auto &[ref, _] : from.state_vectors()) {
    auto deltas = from.deltas_since(ref, to.state_vector(ref));
    if (!deltas) {
      to.merge_snapshot(ref, from.snapshot(ref));
      continue;
    }
    for (const auto &delta : *deltas) {
      to.apply_remote(delta);
    }
  }
}

/// Collects log lines while alive; restores the default sink afterwards.
class LogCapture {
public:
  explicit LogCapture(CrdtLogLevel level = CrdtLogLevel::Debug) : previous_(CrdtLog::level()) {
    CrdtLog::set_level(level);
    CrdtLog::set_sink([this](CrdtLogLevel, const std::string &component, const std::string &message) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_ += component + ": " + message + "\n";
    });
  }

  ~LogCapture() {
    CrdtLog::set_sink({});
    CrdtLog::set_level(previous_);
  }

  bool contains(const std::string &text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.find(text) != std::string::npos;
  }

private:
  CrdtLogLevel previous_;
  mutable std::mutex mutex_;
  std::string lines_;
};

#endif // TEST_HELPERS_HPP
