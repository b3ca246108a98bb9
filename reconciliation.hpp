// reconciliation.hpp
#ifndef RECONCILIATION_HPP
#define RECONCILIATION_HPP

#include "ledger.hpp"
#include "node_config.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

/// Which pending transactions of one sender are confirmed in a round.
struct AdmissionPlan {
  std::string account;
  int64_t escrow = 0; // allocated escrow the plan was computed against
  CrdtVector<std::string> admitted;
  CrdtVector<std::string> rejected;
  int64_t admitted_amount = 0;

  bool operator==(const AdmissionPlan &) const = default;
};

/// Admits `pending` (transactions sent by `account`) in (created_at, id) order while the running
/// total stays within `escrow`. The first transaction that does not fit and every later one are
/// rejected. Transactions that are not well formed are always rejected and use no escrow.
AdmissionPlan plan_admission(const std::string &account, int64_t escrow, CrdtVector<LedgerTransaction> pending);

/// Escrow grant a member proposes for the next period.
struct EscrowProposal {
  std::string account;
  int64_t confirmed_balance = 0;
  ReputationTier tier = ReputationTier::New;
  int64_t escrow = 0;

  bool operator==(const EscrowProposal &) const = default;
};

/// One member of the reconciliation committee.
///
/// Votes are computed independently from the member's own replica. nullopt abstains (the member
/// does not know the account yet). A Byzantine member may return anything, or nothing in time.
class CommitteeMember {
public:
  virtual ~CommitteeMember() = default;

  virtual const std::string &id() const = 0;

  virtual std::optional<AdmissionPlan> vote_admission(const std::string &account) = 0;
  virtual std::optional<EscrowProposal> vote_escrow(const std::string &account) = 0;

  /// Told the plan that reached quorum, so later votes never admit the same transaction again.
  virtual void commit_admission(const AdmissionPlan &plan) = 0;
};

/// Honest member backed by a node's ledger replica.
///
/// Until its replica catches up with the confirmations of a round, it accounts for the
/// transactions it saw committed itself: they are left out of later admission plans and applied
/// to the balance it proposes escrow for.
class LocalCommitteeMember : public CommitteeMember {
public:
  LocalCommitteeMember(std::string id, const Ledger &ledger);

  const std::string &id() const override { return id_; }

  std::optional<AdmissionPlan> vote_admission(const std::string &account) override;
  std::optional<EscrowProposal> vote_escrow(const std::string &account) override;
  void commit_admission(const AdmissionPlan &plan) override;

  /// Committed transactions this member still tracks because its replica shows them Pending.
  size_t tracked() const;

private:
  std::string id_;
  const Ledger &ledger_;

  mutable std::mutex mutex_;
  CrdtSortedSet<std::string> admitted_;
  CrdtSortedSet<std::string> rejected_;

  /// Forgets transactions the replica already shows Confirmed or Rejected.
  void prune_locked();
};

struct DeferredAccount {
  std::string account;
  std::string reason;
};

/// Outcome of one round.
struct RoundReport {
  uint64_t round = 0;
  int64_t started_at = 0;
  size_t committee_size = 0;
  size_t quorum = 0;
  CrdtVector<std::string> confirmed;
  CrdtVector<std::string> rejected; // over-escrow spends
  CrdtVector<DeferredAccount> deferred;
  CrdtSortedMap<std::string, int64_t> escrow; // new grants by account

  bool deferred_account(const std::string &account) const;
};

/// Periodic BFT reconciliation of the ledger.
///
/// A committee of n >= 3f+1 members (n >= 4) tolerates f Byzantine members; every decision needs
/// 2f+1 identical votes. A round:
/// 1. collects every Pending transaction of the local replica and groups it by sender;
/// 2. per sender, asks every member for its admission plan (in parallel, each with the vote
///    timeout) and applies the plan backed by a quorum in one store transaction: confirmed
///    transactions move the amount, rejected ones release the receiver's pending credit;
/// 3. per account not deferred in step 2, votes the escrow of the next period the same way and
///    writes it to `local_escrow` and `allocated_escrow`.
///
/// An account without quorum is deferred: nothing of it changes and its transactions stay
/// Pending for the next round. Accounts are independent of each other.
class ReconciliationEngine {
public:
  /// @throws InvalidArgument for fewer than 4 members
  ReconciliationEngine(Ledger &ledger, CrdtVector<std::shared_ptr<CommitteeMember>> committee,
                       ReconciliationConfig config = {});

  /// Joins the threads of votes that missed their timeout.
  ~ReconciliationEngine();

  ReconciliationEngine(const ReconciliationEngine &) = delete;
  ReconciliationEngine &operator=(const ReconciliationEngine &) = delete;

  size_t committee_size() const { return committee_.size(); }
  size_t max_faulty() const { return (committee_.size() - 1) / 3; }
  size_t quorum() const { return 2 * max_faulty() + 1; }

  RoundReport run_round();

  /// Vote threads still running past their timeout.
  size_t late_votes() const;

private:
  struct Voter {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  Ledger &ledger_;
  CrdtVector<std::shared_ptr<CommitteeMember>> committee_;
  ReconciliationConfig config_;
  std::mutex round_mutex_;
  uint64_t rounds_ = 0;

  mutable std::mutex voters_mutex_;
  CrdtVector<Voter> late_voters_;

  template <typename T>
  T agree(const std::string &account, const char *what,
          const std::function<std::optional<T>(CommitteeMember &)> &vote);

  /// Joins finished voters; keeps the others in late_voters_.
  void retire(CrdtVector<Voter> voters);

  void admit(const std::string &account, int64_t now, RoundReport &report);
  void reallocate(const std::string &account, int64_t now, RoundReport &report);
};

/// Runs rounds on a timer thread.
class ReconciliationScheduler {
public:
  ReconciliationScheduler(ReconciliationEngine &engine, std::chrono::milliseconds interval);
  ~ReconciliationScheduler();

  ReconciliationScheduler(const ReconciliationScheduler &) = delete;
  ReconciliationScheduler &operator=(const ReconciliationScheduler &) = delete;

  void start();
  void stop();

  /// Runs a round now, on the calling thread.
  RoundReport trigger();

  std::optional<RoundReport> last_report() const;
  uint64_t rounds() const;

private:
  ReconciliationEngine &engine_;
  std::chrono::milliseconds interval_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool running_ = false;
  std::thread thread_;
  std::optional<RoundReport> last_report_;
  uint64_t rounds_ = 0;

  void run();
  void record(RoundReport report);
};

#endif // RECONCILIATION_HPP
