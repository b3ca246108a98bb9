// test_reconciliation.cpp
#include "crdt_errors.hpp"
#include "reconciliation.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <thread>

using namespace std::chrono_literals;

namespace {

LedgerTransaction pending(const std::string &id, int64_t amount, int64_t created_at) {
  LedgerTransaction tx;
  tx.id = id;
  tx.from = "alice";
  tx.to = "bob";
  tx.amount = amount;
  tx.created_at = created_at;
  return tx;
}

/// Votes whatever it likes: admits every pending transaction and proposes a huge escrow.
class LyingMember : public CommitteeMember {
public:
  LyingMember(std::string id, const Ledger &ledger) : id_(std::move(id)), ledger_(ledger) {}

  const std::string &id() const override { return id_; }

  std::optional<AdmissionPlan> vote_admission(const std::string &account) override {
    AdmissionPlan plan;
    plan.account = account;
    plan.escrow = 1000000;
    for (const auto &tx : ledger_.pending_transactions()) {
      if (tx.from == account) {
        plan.admitted.push_back(tx.id);
        plan.admitted_amount += tx.amount;
      }
    }
    return plan;
  }

  std::optional<EscrowProposal> vote_escrow(const std::string &account) override {
    return EscrowProposal{account, 1000000, ReputationTier::Premium, 1000000};
  }

  void commit_admission(const AdmissionPlan &) override {}

private:
  std::string id_;
  const Ledger &ledger_;
};

/// Never answers within any reasonable vote timeout.
class SilentMember : public CommitteeMember {
public:
  explicit SilentMember(std::string id) : id_(std::move(id)) {}

  const std::string &id() const override { return id_; }

  std::optional<AdmissionPlan> vote_admission(const std::string &) override {
    std::this_thread::sleep_for(300ms);
    return std::nullopt;
  }

  std::optional<EscrowProposal> vote_escrow(const std::string &) override {
    std::this_thread::sleep_for(300ms);
    return std::nullopt;
  }

  void commit_admission(const AdmissionPlan &) override {}

private:
  std::string id_;
};

/// Fails every vote with an engine error.
class BrokenMember : public CommitteeMember {
public:
  explicit BrokenMember(std::string id) : id_(std::move(id)) {}

  const std::string &id() const override { return id_; }
  std::optional<AdmissionPlan> vote_admission(const std::string &) override { throw StorageError("disk gone"); }
  std::optional<EscrowProposal> vote_escrow(const std::string &) override { throw StorageError("disk gone"); }
  void commit_admission(const AdmissionPlan &) override { throw StorageError("disk gone"); }

private:
  std::string id_;
};

/// Answers long after the vote timeout, reading its replica only then.
class SlowMember : public CommitteeMember {
public:
  SlowMember(std::string id, const Ledger &ledger, std::atomic<int> &late_reads)
      : id_(std::move(id)), ledger_(ledger), late_reads_(late_reads) {}

  const std::string &id() const override { return id_; }

  std::optional<AdmissionPlan> vote_admission(const std::string &account) override {
    std::this_thread::sleep_for(300ms);
    AdmissionPlan plan;
    plan.account = account;
    plan.escrow = static_cast<int64_t>(ledger_.pending_transactions().size());
    ++late_reads_;
    return plan;
  }

  std::optional<EscrowProposal> vote_escrow(const std::string &) override { return std::nullopt; }
  void commit_admission(const AdmissionPlan &) override {}

private:
  std::string id_;
  const Ledger &ledger_;
  std::atomic<int> &late_reads_;
};

CrdtVector<std::shared_ptr<CommitteeMember>> honest(const Ledger &ledger, size_t n) {
  CrdtVector<std::shared_ptr<CommitteeMember>> members;
  for (size_t i = 0; i < n; ++i) {
    members.push_back(std::make_shared<LocalCommitteeMember>("member-" + std::to_string(i), ledger));
  }
  return members;
}

ReconciliationConfig short_timeout() {
  ReconciliationConfig config;
  config.vote_timeout = 100ms;
  return config;
}

/// Two replicas of one ledger that each accepted a 300 spend of alice's 500 escrow while offline,
/// then exchanged their documents.
struct DoubleSpend {
  LedgerNode a{"a"};
  LedgerNode b{"b"};
  std::string first;
  std::string second;

  DoubleSpend() {
    a.ledger.open_account("alice", 1000, ReputationTier::Trusted, "alice");
    a.ledger.open_account("bob", 0, ReputationTier::Trusted, "bob");
    a.ledger.open_account("carol", 0, ReputationTier::Trusted, "carol");
    sync_pair(a.store, b.store);

    a.wall_ms = 2000000;
    b.wall_ms = 2000500;
    first = a.ledger.spend("alice", "bob", 300);
    second = b.ledger.spend("alice", "carol", 300);
    sync_pair(a.store, b.store);
    sync_pair(b.store, a.store);
    a.wall_ms = 3000000;
  }
};

} // namespace

TEST(admission_follows_creation_order) {
  AdmissionPlan plan = plan_admission("alice", 500,
                                      {pending("t3", 100, 30), pending("t2", 300, 20), pending("t1", 300, 10)});
  ASSERT_TRUE(plan.admitted == CrdtVector<std::string>{"t1"});
  // t3 would fit, but nothing after the first rejection is admitted
  ASSERT_TRUE((plan.rejected == CrdtVector<std::string>{"t2", "t3"}));
  ASSERT_EQ(plan.admitted_amount, 300);
  ASSERT_EQ(plan.escrow, 500);
}

TEST(admission_breaks_time_ties_by_id) {
  AdmissionPlan plan = plan_admission("alice", 300, {pending("b", 300, 10), pending("a", 300, 10)});
  ASSERT_TRUE(plan.admitted == CrdtVector<std::string>{"a"});
  ASSERT_TRUE(plan.rejected == CrdtVector<std::string>{"b"});

  AdmissionPlan exact = plan_admission("alice", 500, {pending("x", 200, 1), pending("y", 300, 2)});
  ASSERT_EQ(exact.admitted.size(), 2u);
  ASSERT_TRUE(exact.rejected.empty());

  AdmissionPlan none = plan_admission("alice", 0, {});
  ASSERT_TRUE(none.admitted.empty());
}

TEST(malformed_transactions_use_no_escrow) {
  LedgerTransaction negative = pending("neg", -100000, 5);
  LedgerTransaction self = pending("self", 100, 6);
  self.to = "alice";
  AdmissionPlan plan = plan_admission("alice", 500, {negative, self, pending("t1", 300, 10), pending("t2", 200, 20)});
  ASSERT_TRUE((plan.admitted == CrdtVector<std::string>{"t1", "t2"}));
  ASSERT_TRUE((plan.rejected == CrdtVector<std::string>{"neg", "self"}));
  ASSERT_EQ(plan.admitted_amount, 500);
  ASSERT_FALSE(negative.well_formed());
  ASSERT_FALSE(self.well_formed());
  ASSERT_TRUE(pending("ok", 1, 1).well_formed());
}

TEST(replicated_malformed_transactions_are_rejected) {
  LedgerNode a("a");
  LedgerNode b("b");
  a.ledger.open_account("alice", 1000, ReputationTier::Trusted, "alice");
  a.ledger.open_account("bob", 0, ReputationTier::Trusted, "bob");
  sync_pair(a.store, b.store);

  // Documents no spend() would write, forged directly on b
  auto forge = [&](const std::string &id, const std::string &to, int64_t amount) {
    b.store.mutate(Ledger::transaction_ref(id), [&](DocumentWriter &w) {
      w.set("id", id);
      w.set("from", std::string("alice"));
      w.set("to", to);
      w.set("amount", amount);
      w.set("created_at", int64_t(1));
      w.set("status", std::string(to_string(TransactionStatus::Pending)));
    });
  };
  forge("evil", "bob", -100000);
  forge("loop", "alice", 100);
  sync_pair(b.store, a.store);
  ASSERT_EQ(a.ledger.pending_transactions().size(), 2u);

  LogCapture capture(CrdtLogLevel::Warn);
  ReconciliationEngine engine(a.ledger, honest(a.ledger, 4));
  RoundReport report = engine.run_round();
  ASSERT_TRUE(report.confirmed.empty());
  ASSERT_TRUE((report.rejected == CrdtVector<std::string>{"evil", "loop"}));
  ASSERT_TRUE(report.deferred.empty());
  ASSERT_TRUE(capture.contains("rejected malformed transaction evil"));

  ASSERT_TRUE(a.ledger.transaction("evil").status == TransactionStatus::Rejected);
  ASSERT_TRUE(a.ledger.transaction("loop").status == TransactionStatus::Rejected);
  ASSERT_EQ(a.ledger.account("alice").confirmed_balance, 1000);
  ASSERT_EQ(a.ledger.account("bob").confirmed_balance, 0);
  ASSERT_EQ(a.ledger.account("bob").pending_credits, 0);
  ASSERT_EQ(report.escrow.at("alice"), 500);

  // The committee write refuses them too
  LedgerTransaction evil = a.ledger.transaction("evil");
  evil.status = TransactionStatus::Pending;
  ASSERT_THROWS(a.store.transaction([&](StoreTransaction &tx) { Ledger::confirm(tx, evil, 1); }), InvalidArgument);
  ASSERT_EQ(a.ledger.account("alice").confirmed_balance, 1000);
}

TEST(committee_size_and_quorum) {
  LedgerNode node("a");
  ASSERT_THROWS(ReconciliationEngine(node.ledger, honest(node.ledger, 3)), InvalidArgument);

  auto with_null = honest(node.ledger, 4);
  with_null[2] = nullptr;
  ASSERT_THROWS(ReconciliationEngine(node.ledger, with_null), InvalidArgument);

  ReconciliationEngine four(node.ledger, honest(node.ledger, 4));
  ASSERT_EQ(four.max_faulty(), 1u);
  ASSERT_EQ(four.quorum(), 3u);
  ReconciliationEngine seven(node.ledger, honest(node.ledger, 7));
  ASSERT_EQ(seven.max_faulty(), 2u);
  ASSERT_EQ(seven.quorum(), 5u);
  ReconciliationEngine ten(node.ledger, honest(node.ledger, 10));
  ASSERT_EQ(ten.quorum(), 7u);
}

TEST(offline_double_spend_is_resolved) {
  DoubleSpend setup;
  LogCapture capture(CrdtLogLevel::Warn);
  ReconciliationEngine engine(setup.a.ledger, honest(setup.a.ledger, 4));
  RoundReport report = engine.run_round();

  ASSERT_EQ(report.round, 1u);
  ASSERT_EQ(report.quorum, 3u);
  ASSERT_TRUE(report.confirmed == CrdtVector<std::string>{setup.first});
  ASSERT_TRUE(report.rejected == CrdtVector<std::string>{setup.second});
  ASSERT_TRUE(report.deferred.empty());
  ASSERT_TRUE(capture.contains("double spend by alice"));

  Ledger &ledger = setup.a.ledger;
  ASSERT_TRUE(ledger.transaction(setup.first).status == TransactionStatus::Confirmed);
  ASSERT_TRUE(ledger.transaction(setup.second).status == TransactionStatus::Rejected);
  ASSERT_EQ(ledger.account("alice").confirmed_balance, 700);
  ASSERT_EQ(ledger.account("bob").confirmed_balance, 300);
  ASSERT_EQ(ledger.account("carol").confirmed_balance, 0);
  ASSERT_EQ(ledger.account("carol").pending_credits, 0);

  // Next period: half of 700 at the Trusted multiplier
  ASSERT_EQ(report.escrow.at("alice"), 350);
  ASSERT_EQ(report.escrow.at("bob"), 150);
  ASSERT_EQ(ledger.account("alice").local_escrow, 350);
  ASSERT_EQ(ledger.account("alice").allocated_escrow, 350);
  ASSERT_EQ(ledger.account("alice").last_reconciliation, 3000000);

  // The decision replicates like any other write
  sync_pair(setup.a.store, setup.b.store);
  ASSERT_TRUE(setup.b.ledger.transaction(setup.second).status == TransactionStatus::Rejected);
  ASSERT_EQ(setup.b.ledger.account("alice").confirmed_balance, 700);

  RoundReport again = engine.run_round();
  ASSERT_EQ(again.round, 2u);
  ASSERT_TRUE(again.confirmed.empty());
  ASSERT_TRUE(again.rejected.empty());
}

TEST(one_byzantine_member_is_outvoted) {
  DoubleSpend setup;
  auto committee = honest(setup.a.ledger, 3);
  committee.push_back(std::make_shared<LyingMember>("liar", setup.a.ledger));
  ReconciliationEngine engine(setup.a.ledger, committee);

  RoundReport report = engine.run_round();
  ASSERT_EQ(report.confirmed.size(), 1u);
  ASSERT_EQ(report.rejected.size(), 1u);
  ASSERT_EQ(report.escrow.at("alice"), 350);
}

TEST(too_many_faulty_members_defer_the_account) {
  DoubleSpend setup;
  auto committee = honest(setup.a.ledger, 2);
  committee.push_back(std::make_shared<LyingMember>("liar-1", setup.a.ledger));
  committee.push_back(std::make_shared<LyingMember>("liar-2", setup.a.ledger));
  ReconciliationEngine engine(setup.a.ledger, committee);

  RoundReport report = engine.run_round();
  ASSERT_TRUE(report.deferred_account("alice"));
  ASSERT_TRUE(report.confirmed.empty());
  ASSERT_EQ(report.deferred.front().reason.find("Quorum not reached"), 0u);
  // Nothing about alice changed; her spends wait for the next round
  ASSERT_EQ(setup.a.ledger.pending_transactions().size(), 2u);
  ASSERT_EQ(setup.a.ledger.account("alice").allocated_escrow, 500);
  ASSERT_FALSE(report.escrow.count("alice"));
}

TEST(inconsistent_plan_is_refused) {
  DoubleSpend setup;
  CrdtVector<std::shared_ptr<CommitteeMember>> committee;
  for (int i = 0; i < 4; ++i) {
    committee.push_back(std::make_shared<LyingMember>("liar-" + std::to_string(i), setup.a.ledger));
  }
  ReconciliationEngine engine(setup.a.ledger, committee);

  // The agreed plan claims an escrow alice was never granted
  RoundReport report = engine.run_round();
  ASSERT_TRUE(report.deferred_account("alice"));
  ASSERT_TRUE(report.confirmed.empty());
  ASSERT_EQ(report.deferred.front().reason.find("Double spend by alice"), 0u);
  ASSERT_TRUE(setup.a.ledger.transaction(setup.first).status == TransactionStatus::Pending);
  ASSERT_TRUE(setup.a.ledger.transaction(setup.second).status == TransactionStatus::Pending);
  ASSERT_EQ(setup.a.ledger.account("alice").confirmed_balance, 1000);
}

TEST(silent_and_failing_members_are_tolerated) {
  DoubleSpend setup;
  auto committee = honest(setup.a.ledger, 3);
  committee.push_back(std::make_shared<SilentMember>("silent"));
  ReconciliationEngine engine(setup.a.ledger, committee, short_timeout());
  LogCapture capture(CrdtLogLevel::Warn);
  RoundReport report = engine.run_round();
  ASSERT_EQ(report.confirmed.size(), 1u);
  ASSERT_TRUE(capture.contains("silent timed out"));

  DoubleSpend other;
  auto committee2 = honest(other.a.ledger, 3);
  committee2.push_back(std::make_shared<BrokenMember>("broken"));
  ReconciliationEngine engine2(other.a.ledger, committee2, short_timeout());
  RoundReport report2 = engine2.run_round();
  ASSERT_EQ(report2.confirmed.size(), 1u);
  ASSERT_EQ(report2.rejected.size(), 1u);
}

TEST(member_remembers_committed_plans) {
  DoubleSpend setup;
  // b's replica has not seen the round's outcome yet
  LocalCommitteeMember member("m", setup.b.ledger);
  AdmissionPlan before = *member.vote_admission("alice");
  ASSERT_EQ(before.admitted.size(), 1u);
  ASSERT_EQ(before.rejected.size(), 1u);

  member.commit_admission(before);
  AdmissionPlan after = *member.vote_admission("alice");
  ASSERT_TRUE(after.admitted.empty());
  ASSERT_TRUE(after.rejected.empty());

  // The balance it proposes escrow for already accounts for the admitted spend
  EscrowProposal proposal = *member.vote_escrow("alice");
  ASSERT_EQ(proposal.confirmed_balance, 700);
  ASSERT_EQ(proposal.escrow, 350);
  ASSERT_FALSE(member.vote_admission("nobody").has_value());
  ASSERT_FALSE(member.vote_escrow("nobody").has_value());
}

TEST(member_forgets_settled_transactions) {
  DoubleSpend setup;
  LocalCommitteeMember member("m", setup.b.ledger);
  member.commit_admission(*member.vote_admission("alice"));
  ASSERT_EQ(member.tracked(), 2u);

  // Still Pending on b: kept
  member.vote_escrow("alice");
  ASSERT_EQ(member.tracked(), 2u);

  ReconciliationEngine engine(setup.a.ledger, honest(setup.a.ledger, 4));
  engine.run_round();
  sync_pair(setup.a.store, setup.b.store);

  AdmissionPlan plan = *member.vote_admission("alice");
  ASSERT_EQ(member.tracked(), 0u);
  ASSERT_TRUE(plan.admitted.empty());
  ASSERT_TRUE(plan.rejected.empty());
  ASSERT_EQ(member.vote_escrow("alice")->escrow, 350);
}

TEST(late_votes_finish_before_the_engine_goes_away) {
  DoubleSpend setup;
  std::atomic<int> late_reads{0};
  {
    auto committee = honest(setup.a.ledger, 3);
    committee.push_back(std::make_shared<SlowMember>("slow", setup.a.ledger, late_reads));
    ReconciliationEngine engine(setup.a.ledger, committee, short_timeout());
    RoundReport report = engine.run_round();
    ASSERT_EQ(report.confirmed.size(), 1u);
    ASSERT_EQ(late_reads.load(), 0);
    ASSERT_EQ(engine.late_votes(), 1u);
  }
  // The destructor joined the late vote while the ledger was still alive
  ASSERT_EQ(late_reads.load(), 1);
}

TEST(scheduler_runs_rounds) {
  DoubleSpend setup;
  ReconciliationEngine engine(setup.a.ledger, honest(setup.a.ledger, 4));
  ReconciliationScheduler scheduler(engine, 20ms);
  ASSERT_FALSE(scheduler.last_report().has_value());

  RoundReport report = scheduler.trigger();
  ASSERT_EQ(report.confirmed.size(), 1u);
  ASSERT_EQ(scheduler.rounds(), 1u);

  scheduler.start();
  for (int i = 0; i < 200 && scheduler.rounds() < 3; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  scheduler.stop();
  ASSERT_TRUE(scheduler.rounds() >= 3);
  ASSERT_TRUE(scheduler.last_report()->confirmed.empty());
}

int main() {
  std::cout << "Running reconciliation tests..." << std::endl << std::endl;
  CrdtLog::set_level(CrdtLogLevel::Error);

  RUN_TEST(admission_follows_creation_order);
  RUN_TEST(admission_breaks_time_ties_by_id);
  RUN_TEST(malformed_transactions_use_no_escrow);
  RUN_TEST(replicated_malformed_transactions_are_rejected);
  RUN_TEST(committee_size_and_quorum);
  RUN_TEST(offline_double_spend_is_resolved);
  RUN_TEST(one_byzantine_member_is_outvoted);
  RUN_TEST(too_many_faulty_members_defer_the_account);
  RUN_TEST(inconsistent_plan_is_refused);
  RUN_TEST(silent_and_failing_members_are_tolerated);
  RUN_TEST(member_remembers_committed_plans);
  RUN_TEST(member_forgets_settled_transactions);
  RUN_TEST(late_votes_finish_before_the_engine_goes_away);
  RUN_TEST(scheduler_runs_rounds);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
