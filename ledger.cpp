// ledger.cpp
#include "ledger.hpp"
#include "crdt_codec.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"
#include "crdt_uuid.hpp"

namespace {

const char *const TIER_NAMES[] = {"new", "trusted", "verified", "premium"};
const char *const STATUS_NAMES[] = {"pending", "confirmed", "rejected"};

// Escrow multipliers in quarters: 0.25, 1.0, 1.5, 2.0
const int64_t TIER_QUARTERS[] = {1, 4, 6, 8};

} // namespace

const char *to_string(ReputationTier tier) { return TIER_NAMES[static_cast<uint8_t>(tier)]; }

std::optional<ReputationTier> parse_reputation_tier(std::string_view name) {
  for (uint8_t i = 0; i < 4; ++i) {
    if (name == TIER_NAMES[i]) {
      return static_cast<ReputationTier>(i);
    }
  }
  return std::nullopt;
}

int64_t escrow_allocation(int64_t confirmed_balance, ReputationTier tier) {
  if (confirmed_balance <= 0) {
    return 0;
  }
  // balance / 2 * quarters / 4, computed as balance * quarters / 8 to round once
  return confirmed_balance * TIER_QUARTERS[static_cast<uint8_t>(tier)] / 8;
}

const char *to_string(TransactionStatus status) { return STATUS_NAMES[static_cast<uint8_t>(status)]; }

std::optional<TransactionStatus> parse_transaction_status(std::string_view name) {
  for (uint8_t i = 0; i < 3; ++i) {
    if (name == STATUS_NAMES[i]) {
      return static_cast<TransactionStatus>(i);
    }
  }
  return std::nullopt;
}

std::string encode_trust(const TrustConnection &connection) {
  ByteWriter w;
  w.put_string(connection.peer_id);
  w.put_svarint(connection.trust_limit);
  w.put_svarint(connection.total_exchanged);
  w.put_svarint(connection.reputation);
  const CrdtBytes &bytes = w.data();
  return std::string(bytes.begin(), bytes.end());
}

TrustConnection decode_trust(const std::string &element) {
  ByteReader r(reinterpret_cast<const uint8_t *>(element.data()), element.size());
  TrustConnection connection;
  connection.peer_id = r.get_string();
  connection.trust_limit = r.get_svarint();
  connection.total_exchanged = r.get_svarint();
  connection.reputation = r.get_svarint();
  r.expect_end();
  return connection;
}

// -----------------------------------------
// Schemas
// -----------------------------------------

void Ledger::register_schemas(SchemaRegistry &registry) {
  registry.add(DocumentSchema::from_metadata(LEDGER_ACCOUNT_NS,
                                             {
                                                 {"owner", "string", "immutable", std::nullopt, false},
                                                 {"confirmed_balance", "int", "pn_counter", 0, false},
                                                 {"local_escrow", "int", "lww", 0, false},
                                                 {"allocated_escrow", "int", "lww", 0, false},
                                                 {"pending_credits", "int", "pn_counter", std::nullopt, false},
                                                 {"transaction_history", "list<TxRef>", "rga", std::nullopt, false},
                                                 {"trust_connections", "set<TrustConnection>", "or_set", std::nullopt, false},
                                                 {"reputation_tier", "enum", "lww", std::nullopt, false},
                                                 {"last_reconciliation", "int", "lww", std::nullopt, false},
                                             }));

  registry.add(DocumentSchema::from_metadata(LEDGER_TRANSACTION_NS,
                                             {
                                                 {"id", "string", "immutable", std::nullopt, false},
                                                 {"from", "string", "immutable", std::nullopt, false},
                                                 {"to", "string", "immutable", std::nullopt, false},
                                                 {"amount", "int", "immutable", std::nullopt, false},
                                                 {"created_at", "int", "immutable", std::nullopt, false},
                                                 {"status", "enum", "lww", std::nullopt, false},
                                                 {"confirmed_at", "int", "lww", std::nullopt, false},
                                                 {"memo", "string", "lww", std::nullopt, false},
                                             }));
}

// -----------------------------------------
// Read models
// -----------------------------------------

Account Ledger::account_from(const DocumentView &view) {
  Account account;
  account.id = view.ref().id;
  account.owner = view.get_string("owner").value_or("");
  account.confirmed_balance = view.get_counter("confirmed_balance");
  account.local_escrow = std::min(view.get_int("local_escrow").value_or(0), account.confirmed_balance);
  account.allocated_escrow = view.get_int("allocated_escrow").value_or(0);
  account.pending_credits = view.get_counter("pending_credits");
  for (const auto &entry : view.get_list("transaction_history")) {
    if (const auto *id = std::get_if<std::string>(&entry)) {
      account.transaction_history.push_back(*id);
    }
  }
  for (const auto &element : view.get_set("trust_connections")) {
    account.trust_connections.push_back(decode_trust(element));
  }
  auto tier = view.get_string("reputation_tier");
  account.tier = tier ? parse_reputation_tier(*tier).value_or(ReputationTier::New) : ReputationTier::New;
  account.last_reconciliation = view.get_int("last_reconciliation").value_or(0);
  return account;
}

LedgerTransaction Ledger::transaction_from(const DocumentView &view) {
  LedgerTransaction tx;
  tx.id = view.get_string("id").value_or(view.ref().id);
  tx.from = view.get_string("from").value_or("");
  tx.to = view.get_string("to").value_or("");
  tx.amount = view.get_int("amount").value_or(0);
  tx.created_at = view.get_int("created_at").value_or(0);
  auto status = view.get_string("status");
  if (status) {
    auto parsed = parse_transaction_status(*status);
    if (!parsed) {
      throw SchemaError("Transaction " + tx.id + " has unknown status " + *status);
    }
    tx.status = *parsed;
  }
  tx.confirmed_at = view.get_int("confirmed_at");
  tx.memo = view.get_string("memo").value_or("");
  return tx;
}

// -----------------------------------------
// Ledger
// -----------------------------------------

Ledger::Ledger(DocumentStore &store) : store_(store) {}

std::string Ledger::open_account(const std::string &owner, int64_t initial_balance, ReputationTier tier,
                                 const std::string &id) {
  if (owner.empty()) {
    throw InvalidArgument("Account owner must not be empty");
  }
  if (initial_balance < 0) {
    throw InvalidArgument("Initial balance must not be negative");
  }
  int64_t escrow = escrow_allocation(initial_balance, tier);
  int64_t now = store_.context().wall_time_ms();

  DocumentRef ref = store_.create(LEDGER_ACCOUNT_NS, id, [&](DocumentWriter &w) {
    w.set("owner", owner);
    if (initial_balance > 0) {
      w.increment("confirmed_balance", static_cast<uint64_t>(initial_balance));
    }
    w.set("local_escrow", escrow);
    w.set("allocated_escrow", escrow);
    w.set("reputation_tier", std::string(to_string(tier)));
    w.set("last_reconciliation", now);
  });
  CRDT_LOG_INFO("ledger", "opened account " << ref.id << " for " << owner << " with " << initial_balance
                                            << ", escrow " << escrow);
  return ref.id;
}

std::string Ledger::spend(const std::string &from, const std::string &to, int64_t amount, const std::string &memo) {
  if (amount <= 0) {
    throw InvalidArgument("Spend amount must be positive");
  }
  if (from == to) {
    throw InvalidArgument("Cannot spend to the same account");
  }

  const DocumentRef sender = account_ref(from);
  const DocumentRef receiver = account_ref(to);
  const std::string id = generate_uuid();

  store_.transaction([&](StoreTransaction &tx) {
    Account account = account_from(tx.read(sender));
    tx.read(receiver);
    if (amount > account.local_escrow) {
      throw InsufficientEscrow(account.local_escrow, amount);
    }

    DocumentWriter &s = tx.writer(sender);
    s.set("local_escrow", account.local_escrow - amount);
    s.push_back("transaction_history", id);

    DocumentWriter &t = tx.writer(transaction_ref(id));
    t.set("id", id);
    t.set("from", from);
    t.set("to", to);
    t.set("amount", amount);
    t.set("created_at", store_.context().wall_time_ms());
    t.set("status", std::string(to_string(TransactionStatus::Pending)));
    if (!memo.empty()) {
      t.set("memo", memo);
    }

    DocumentWriter &r = tx.writer(receiver);
    r.increment("pending_credits", static_cast<uint64_t>(amount));
    r.push_back("transaction_history", id);
  });

  CRDT_LOG_INFO("ledger", "spend " << id << ": " << from << " -> " << to << " " << amount);
  return id;
}

Account Ledger::account(const std::string &id) const { return account_from(store_.read(account_ref(id))); }

LedgerTransaction Ledger::transaction(const std::string &id) const {
  return transaction_from(store_.read(transaction_ref(id)));
}

CrdtVector<std::string> Ledger::accounts() const {
  CrdtVector<std::string> result;
  for (const auto &ref : store_.documents(LEDGER_ACCOUNT_NS)) {
    result.push_back(ref.id);
  }
  return result;
}

CrdtVector<LedgerTransaction> Ledger::transactions() const {
  CrdtVector<LedgerTransaction> result;
  for (const auto &ref : store_.documents(LEDGER_TRANSACTION_NS)) {
    result.push_back(transaction_from(store_.read(ref)));
  }
  return result;
}

CrdtVector<LedgerTransaction> Ledger::pending_transactions() const {
  CrdtVector<LedgerTransaction> result = transactions();
  std::erase_if(result, [](const LedgerTransaction &tx) { return tx.status != TransactionStatus::Pending; });
  return result;
}

std::string Ledger::add_trust(const std::string &account, const TrustConnection &connection) {
  if (connection.peer_id.empty()) {
    throw InvalidArgument("Trust connection needs a peer id");
  }
  const DocumentRef ref = account_ref(account);
  std::string tag;
  store_.transaction([&](StoreTransaction &tx) {
    tx.read(ref);
    tag = tx.writer(ref).add("trust_connections", encode_trust(connection));
  });
  return tag;
}

bool Ledger::remove_trust(const std::string &account, const std::string &peer_id) {
  const DocumentRef ref = account_ref(account);
  bool removed = false;
  store_.transaction([&](StoreTransaction &tx) {
    DocumentView view = tx.read(ref);
    CrdtVector<std::string> matching;
    for (const auto &element : view.get_set("trust_connections")) {
      if (decode_trust(element).peer_id == peer_id) {
        matching.push_back(element);
      }
    }
    DocumentWriter &w = tx.writer(ref);
    for (const auto &element : matching) {
      removed |= w.remove("trust_connections", element);
    }
  });
  return removed;
}

CrdtVector<TrustConnection> Ledger::trust_connections(const std::string &account) const {
  return this->account(account).trust_connections;
}

void Ledger::set_reputation_tier(const std::string &account, ReputationTier tier) {
  const DocumentRef ref = account_ref(account);
  store_.transaction([&](StoreTransaction &tx) {
    tx.read(ref);
    tx.writer(ref).set("reputation_tier", std::string(to_string(tier)));
  });
}

// -----------------------------------------
// Committee writes
// -----------------------------------------

void Ledger::confirm(StoreTransaction &tx, const LedgerTransaction &transaction, int64_t now) {
  if (!transaction.well_formed()) {
    throw InvalidArgument("Cannot confirm malformed transaction " + transaction.id);
  }
  auto amount = static_cast<uint64_t>(transaction.amount);
  tx.writer(account_ref(transaction.from)).decrement("confirmed_balance", amount);

  DocumentWriter &receiver = tx.writer(account_ref(transaction.to));
  receiver.increment("confirmed_balance", amount);
  receiver.decrement("pending_credits", amount);

  DocumentWriter &doc = tx.writer(transaction_ref(transaction.id));
  doc.set("status", std::string(to_string(TransactionStatus::Confirmed)));
  doc.set("confirmed_at", now);
}

void Ledger::reject(StoreTransaction &tx, const LedgerTransaction &transaction, int64_t now) {
  if (transaction.well_formed()) {
    tx.writer(account_ref(transaction.to)).decrement("pending_credits", static_cast<uint64_t>(transaction.amount));
  }

  DocumentWriter &doc = tx.writer(transaction_ref(transaction.id));
  doc.set("status", std::string(to_string(TransactionStatus::Rejected)));
  doc.set("confirmed_at", now);
}

void Ledger::grant_escrow(StoreTransaction &tx, const std::string &account, int64_t escrow, int64_t now) {
  DocumentWriter &w = tx.writer(account_ref(account));
  w.set("local_escrow", escrow);
  w.set("allocated_escrow", escrow);
  w.set("last_reconciliation", now);
}
