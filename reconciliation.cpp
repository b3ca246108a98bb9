// reconciliation.cpp
#include "reconciliation.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"

#include <algorithm>
#include <future>
#include <tuple>

AdmissionPlan plan_admission(const std::string &account, int64_t escrow, CrdtVector<LedgerTransaction> pending) {
  std::sort(pending.begin(), pending.end(), [](const LedgerTransaction &a, const LedgerTransaction &b) {
    return std::tie(a.created_at, a.id) < std::tie(b.created_at, b.id);
  });

  AdmissionPlan plan;
  plan.account = account;
  plan.escrow = escrow;
  bool exhausted = false;
  for (const auto &tx : pending) {
    if (!tx.well_formed()) {
      plan.rejected.push_back(tx.id);
    } else if (!exhausted && plan.admitted_amount + tx.amount <= escrow) {
      plan.admitted.push_back(tx.id);
      plan.admitted_amount += tx.amount;
    } else {
      exhausted = true;
      plan.rejected.push_back(tx.id);
    }
  }
  return plan;
}

bool RoundReport::deferred_account(const std::string &account) const {
  return std::any_of(deferred.begin(), deferred.end(),
                     [&](const DeferredAccount &d) { return d.account == account; });
}

// -----------------------------------------
// LocalCommitteeMember
// -----------------------------------------

LocalCommitteeMember::LocalCommitteeMember(std::string id, const Ledger &ledger)
    : id_(std::move(id)), ledger_(ledger) {}

std::optional<AdmissionPlan> LocalCommitteeMember::vote_admission(const std::string &account) {
  if (!ledger_.store().contains(Ledger::account_ref(account))) {
    return std::nullopt;
  }
  Account state = ledger_.account(account);

  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked();
  CrdtVector<LedgerTransaction> pending;
  for (auto &tx : ledger_.pending_transactions()) {
    if (tx.from == account && !admitted_.count(tx.id) && !rejected_.count(tx.id)) {
      pending.push_back(std::move(tx));
    }
  }
  return plan_admission(account, state.allocated_escrow, std::move(pending));
}

std::optional<EscrowProposal> LocalCommitteeMember::vote_escrow(const std::string &account) {
  if (!ledger_.store().contains(Ledger::account_ref(account))) {
    return std::nullopt;
  }
  Account state = ledger_.account(account);
  int64_t balance = state.confirmed_balance;

  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked();
  // Confirmations this replica has not received yet
  for (const auto &id : admitted_) {
    if (!ledger_.store().contains(Ledger::transaction_ref(id))) {
      return std::nullopt;
    }
    LedgerTransaction tx = ledger_.transaction(id);
    if (tx.from == account) {
      balance -= tx.amount;
    } else if (tx.to == account) {
      balance += tx.amount;
    }
  }

  EscrowProposal proposal;
  proposal.account = account;
  proposal.confirmed_balance = balance;
  proposal.tier = state.tier;
  proposal.escrow = escrow_allocation(balance, state.tier);
  return proposal;
}

void LocalCommitteeMember::commit_admission(const AdmissionPlan &plan) {
  std::lock_guard<std::mutex> lock(mutex_);
  admitted_.insert(plan.admitted.begin(), plan.admitted.end());
  rejected_.insert(plan.rejected.begin(), plan.rejected.end());
}

size_t LocalCommitteeMember::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return admitted_.size() + rejected_.size();
}

void LocalCommitteeMember::prune_locked() {
  auto settled = [this](const std::string &id) {
    return ledger_.store().contains(Ledger::transaction_ref(id)) &&
           ledger_.transaction(id).status != TransactionStatus::Pending;
  };
  std::erase_if(admitted_, settled);
  std::erase_if(rejected_, settled);
}

// -----------------------------------------
// ReconciliationEngine
// -----------------------------------------

ReconciliationEngine::ReconciliationEngine(Ledger &ledger, CrdtVector<std::shared_ptr<CommitteeMember>> committee,
                                           ReconciliationConfig config)
    : ledger_(ledger), committee_(std::move(committee)), config_(config) {
  if (committee_.size() < 4) {
    throw InvalidArgument("A reconciliation committee needs at least 4 members, got " +
                          std::to_string(committee_.size()));
  }
  for (const auto &member : committee_) {
    if (!member) {
      throw InvalidArgument("Null committee member");
    }
  }
}

ReconciliationEngine::~ReconciliationEngine() {
  std::lock_guard<std::mutex> lock(voters_mutex_);
  if (!late_voters_.empty()) {
    CRDT_LOG_INFO("reconcile", "waiting for " << late_voters_.size() << " late votes");
  }
  for (auto &voter : late_voters_) {
    voter.thread.join();
  }
}

size_t ReconciliationEngine::late_votes() const {
  std::lock_guard<std::mutex> lock(voters_mutex_);
  return static_cast<size_t>(
      std::count_if(late_voters_.begin(), late_voters_.end(), [](const Voter &v) { return !v.done->load(); }));
}

void ReconciliationEngine::retire(CrdtVector<Voter> voters) {
  std::lock_guard<std::mutex> lock(voters_mutex_);
  for (auto &voter : voters) {
    late_voters_.push_back(std::move(voter));
  }
  std::erase_if(late_voters_, [](Voter &voter) {
    if (!voter.done->load()) {
      return false;
    }
    voter.thread.join();
    return true;
  });
}

template <typename T>
T ReconciliationEngine::agree(const std::string &account, const char *what,
                              const std::function<std::optional<T>(CommitteeMember &)> &vote) {
  // Each vote runs on its own thread so a member that never answers costs one timeout, not the round.
  // A late thread is kept and joined once it finishes, at the latest when the engine is destroyed.
  CrdtVector<std::pair<std::string, std::future<std::optional<T>>>> ballots;
  CrdtVector<Voter> voters;
  for (const auto &member : committee_) {
    std::packaged_task<std::optional<T>()> task([member, vote] { return vote(*member); });
    ballots.emplace_back(member->id(), task.get_future());
    auto done = std::make_shared<std::atomic<bool>>(false);
    voters.push_back({std::thread([task = std::move(task), done]() mutable {
                        task();
                        done->store(true);
                      }),
                      done});
  }

  const auto deadline = std::chrono::steady_clock::now() + config_.vote_timeout;
  CrdtVector<std::pair<T, size_t>> tally;
  for (auto &[member, ballot] : ballots) {
    if (ballot.wait_until(deadline) != std::future_status::ready) {
      CRDT_LOG_WARN("reconcile", member << " timed out on " << what << " vote for " << account);
      continue;
    }
    std::optional<T> choice;
    try {
      choice = ballot.get();
    } catch (const std::exception &e) {
      CRDT_LOG_WARN("reconcile", member << " failed its " << what << " vote for " << account << ": " << e.what());
      continue;
    }
    if (!choice) {
      CRDT_LOG_DEBUG("reconcile", member << " abstained on " << what << " for " << account);
      continue;
    }
    auto it = std::find_if(tally.begin(), tally.end(), [&](const auto &entry) { return entry.first == *choice; });
    if (it == tally.end()) {
      tally.emplace_back(std::move(*choice), 1);
    } else {
      ++it->second;
    }
  }
  retire(std::move(voters));

  size_t best = 0;
  for (auto &[choice, votes] : tally) {
    if (votes >= quorum()) {
      return choice;
    }
    best = std::max(best, votes);
  }
  throw QuorumNotReached(account, best, quorum());
}

RoundReport ReconciliationEngine::run_round() {
  std::lock_guard<std::mutex> lock(round_mutex_);

  RoundReport report;
  report.round = ++rounds_;
  report.started_at = ledger_.store().context().wall_time_ms();
  report.committee_size = committee_size();
  report.quorum = quorum();

  CrdtSortedSet<std::string> senders;
  for (const auto &tx : ledger_.pending_transactions()) {
    senders.insert(tx.from);
  }

  for (const auto &account : senders) {
    try {
      admit(account, report.started_at, report);
    } catch (const CrdtException &e) {
      CRDT_LOG_WARN("reconcile", "deferring " << account << ": " << e.what());
      report.deferred.push_back({account, e.what()});
    }
  }

  for (const auto &account : ledger_.accounts()) {
    if (report.deferred_account(account)) {
      continue;
    }
    try {
      reallocate(account, report.started_at, report);
    } catch (const CrdtException &e) {
      CRDT_LOG_WARN("reconcile", "deferring escrow of " << account << ": " << e.what());
      report.deferred.push_back({account, e.what()});
    }
  }

  CRDT_LOG_INFO("reconcile", "round " << report.round << ": " << report.confirmed.size() << " confirmed, "
                                      << report.rejected.size() << " rejected, " << report.deferred.size()
                                      << " deferred");
  return report;
}

void ReconciliationEngine::admit(const std::string &account, int64_t now, RoundReport &report) {
  AdmissionPlan plan = agree<AdmissionPlan>(
      account, "admission", [account](CommitteeMember &member) { return member.vote_admission(account); });
  if (plan.account != account) {
    throw ProtocolViolation("Admission plan for " + plan.account + " returned for " + account);
  }

  DocumentStore &store = ledger_.store();
  auto local = [&](const std::string &id) -> std::optional<LedgerTransaction> {
    if (!store.contains(Ledger::transaction_ref(id))) {
      return std::nullopt;
    }
    LedgerTransaction tx = ledger_.transaction(id);
    if (tx.from != account || tx.status != TransactionStatus::Pending ||
        (tx.well_formed() && !store.contains(Ledger::account_ref(tx.to)))) {
      return std::nullopt;
    }
    return tx;
  };

  CrdtVector<LedgerTransaction> admitted;
  CrdtVector<LedgerTransaction> rejected;
  int64_t total = 0;
  for (const auto &id : plan.admitted) {
    auto tx = local(id);
    if (!tx) {
      throw DocumentNotFound("pending transaction " + id + " of " + account);
    }
    if (!tx->well_formed()) {
      throw ProtocolViolation("Admission plan for " + account + " admits malformed transaction " + id);
    }
    total += tx->amount;
    admitted.push_back(std::move(*tx));
  }
  for (const auto &id : plan.rejected) {
    auto tx = local(id);
    if (!tx) {
      throw DocumentNotFound("pending transaction " + id + " of " + account);
    }
    rejected.push_back(std::move(*tx));
  }
  // Only this engine grants escrow, so the local allocation is authoritative
  int64_t granted = ledger_.account(account).allocated_escrow;
  if (total != plan.admitted_amount || total > plan.escrow || plan.escrow > granted) {
    throw DoubleSpendDetected(account, total, std::min(plan.escrow, granted));
  }

  store.transaction([&](StoreTransaction &tx) {
    for (const auto &t : admitted) {
      Ledger::confirm(tx, t, now);
    }
    for (const auto &t : rejected) {
      Ledger::reject(tx, t, now);
    }
  });

  for (const auto &member : committee_) {
    try {
      member->commit_admission(plan);
    } catch (const CrdtException &e) {
      CRDT_LOG_WARN("reconcile", member->id() << " failed to record the plan for " << account << ": " << e.what());
    }
  }

  for (const auto &t : admitted) {
    report.confirmed.push_back(t.id);
  }
  for (const auto &t : rejected) {
    if (t.well_formed()) {
      CRDT_LOG_WARN("reconcile", "double spend by " << account << ": rejected " << t.id << " (" << t.amount
                                                    << ") over escrow " << plan.escrow);
    } else {
      CRDT_LOG_WARN("reconcile", "rejected malformed transaction " << t.id << " of " << account << " (amount "
                                                                   << t.amount << ", to '" << t.to << "')");
    }
    report.rejected.push_back(t.id);
  }
}

void ReconciliationEngine::reallocate(const std::string &account, int64_t now, RoundReport &report) {
  EscrowProposal proposal = agree<EscrowProposal>(
      account, "escrow", [account](CommitteeMember &member) { return member.vote_escrow(account); });
  if (proposal.account != account || proposal.escrow < 0) {
    throw ProtocolViolation("Invalid escrow proposal for " + account);
  }

  ledger_.store().transaction(
      [&](StoreTransaction &tx) { Ledger::grant_escrow(tx, account, proposal.escrow, now); });
  report.escrow[account] = proposal.escrow;
  CRDT_LOG_DEBUG("reconcile", "escrow of " << account << " is " << proposal.escrow);
}

// -----------------------------------------
// ReconciliationScheduler
// -----------------------------------------

ReconciliationScheduler::ReconciliationScheduler(ReconciliationEngine &engine, std::chrono::milliseconds interval)
    : engine_(engine), interval_(interval) {}

ReconciliationScheduler::~ReconciliationScheduler() { stop(); }

void ReconciliationScheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread(&ReconciliationScheduler::run, this);
}

void ReconciliationScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

RoundReport ReconciliationScheduler::trigger() {
  RoundReport report = engine_.run_round();
  record(report);
  return report;
}

std::optional<RoundReport> ReconciliationScheduler::last_report() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_report_;
}

uint64_t ReconciliationScheduler::rounds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rounds_;
}

void ReconciliationScheduler::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }
    lock.unlock();
    try {
      record(engine_.run_round());
    } catch (const CrdtException &e) {
      CRDT_LOG_ERROR("reconcile", "round failed: " << e.what());
    }
    lock.lock();
  }
}

void ReconciliationScheduler::record(RoundReport report) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_report_ = std::move(report);
  ++rounds_;
}
