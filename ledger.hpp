// ledger.hpp
#ifndef LEDGER_HPP
#define LEDGER_HPP

#include "document_store.hpp"

#include <optional>
#include <string>
#include <string_view>

constexpr const char *LEDGER_ACCOUNT_NS = "ledger.account";
constexpr const char *LEDGER_TRANSACTION_NS = "ledger.transaction";

/// Standing of an account; scales the escrow it is granted.
enum class ReputationTier : uint8_t { New = 0, Trusted = 1, Verified = 2, Premium = 3 };

const char *to_string(ReputationTier tier);
std::optional<ReputationTier> parse_reputation_tier(std::string_view name);

/// Escrow granted for a period: confirmed_balance / 2 scaled by 0.25 (New), 1.0 (Trusted),
/// 1.5 (Verified) or 2.0 (Premium). Rounded down; never negative.
int64_t escrow_allocation(int64_t confirmed_balance, ReputationTier tier);

enum class TransactionStatus : uint8_t { Pending = 0, Confirmed = 1, Rejected = 2 };

const char *to_string(TransactionStatus status);
std::optional<TransactionStatus> parse_transaction_status(std::string_view name);

/// Member of an account's trust set.
struct TrustConnection {
  std::string peer_id;
  int64_t trust_limit = 0;
  int64_t total_exchanged = 0;
  int64_t reputation = 0;

  bool operator==(const TrustConnection &) const = default;
};

/// OR-Set element form of a trust connection (binary, deterministic).
std::string encode_trust(const TrustConnection &connection);

/// @throws DeserializeCorruption
TrustConnection decode_trust(const std::string &element);

/// Read model of a `ledger.account` document.
struct Account {
  std::string id;
  std::string owner;
  int64_t confirmed_balance = 0;
  int64_t local_escrow = 0; // clamped to [0, confirmed_balance]
  int64_t allocated_escrow = 0;
  int64_t pending_credits = 0;
  CrdtVector<std::string> transaction_history; // transaction ids
  CrdtVector<TrustConnection> trust_connections;
  ReputationTier tier = ReputationTier::New;
  int64_t last_reconciliation = 0;
};

/// Read model of a `ledger.transaction` document.
struct LedgerTransaction {
  std::string id;
  std::string from;
  std::string to;
  int64_t amount = 0;
  int64_t created_at = 0;
  TransactionStatus status = TransactionStatus::Pending;
  std::optional<int64_t> confirmed_at;
  std::string memo;

  /// False for documents no spend() could have written: a non-positive amount, a missing party or
  /// a self-transfer. Replicated documents are not trusted to be well formed.
  bool well_formed() const { return amount > 0 && !from.empty() && !to.empty() && from != to; }

  bool operator==(const LedgerTransaction &) const = default;
};

/// Mutual-credit accounts on top of the document store.
///
/// Spending is local and offline: it only checks the account's escrow on this replica. Escrow is
/// raised only by the reconciliation round, which is also the only writer of confirmed balances.
///
/// Thread Safety:
/// Every method runs as one store transaction or read, so concurrent calls are serialized by the
/// store.
class Ledger {
public:
  explicit Ledger(DocumentStore &store);

  /// Adds the `ledger.account` and `ledger.transaction` schemas.
  static void register_schemas(SchemaRegistry &registry);

  DocumentStore &store() const { return store_; }

  /// Creates an account holding `initial_balance`, with the escrow its tier grants. An empty `id`
  /// gets a fresh UUID.
  /// @throws InvalidArgument for an empty owner or a negative balance
  std::string open_account(const std::string &owner, int64_t initial_balance, ReputationTier tier,
                           const std::string &id = "");

  /// Spends from escrow. Writes, in one transaction: the reduced escrow, a Pending transaction,
  /// the recipient's pending credit and the history of both accounts.
  /// @returns the transaction id
  /// @throws InsufficientEscrow before anything is written if `amount` exceeds the local escrow
  /// @throws DocumentNotFound if either account is unknown
  /// @throws InvalidArgument for a non-positive amount or a self-transfer
  std::string spend(const std::string &from, const std::string &to, int64_t amount, const std::string &memo = "");

  /// @throws DocumentNotFound
  Account account(const std::string &id) const;
  LedgerTransaction transaction(const std::string &id) const;

  CrdtVector<std::string> accounts() const;
  CrdtVector<LedgerTransaction> transactions() const;
  CrdtVector<LedgerTransaction> pending_transactions() const;

  /// @returns the OR-Set tag of the new connection
  std::string add_trust(const std::string &account, const TrustConnection &connection);

  /// Removes every connection to `peer_id`. Returns false if there was none.
  bool remove_trust(const std::string &account, const std::string &peer_id);

  CrdtVector<TrustConnection> trust_connections(const std::string &account) const;

  void set_reputation_tier(const std::string &account, ReputationTier tier);

  // Committee writes, used by the reconciliation round inside its own transaction

  /// Moves the amount from sender to receiver and marks the transaction Confirmed.
  /// @throws InvalidArgument if the transaction is not well formed
  static void confirm(StoreTransaction &tx, const LedgerTransaction &transaction, int64_t now);

  /// Marks the transaction Rejected and releases the receiver's pending credit (none for a
  /// transaction that is not well formed).
  static void reject(StoreTransaction &tx, const LedgerTransaction &transaction, int64_t now);

  /// Writes a new escrow grant for the period.
  static void grant_escrow(StoreTransaction &tx, const std::string &account, int64_t escrow, int64_t now);

  static DocumentRef account_ref(const std::string &id) { return DocumentRef(LEDGER_ACCOUNT_NS, id); }
  static DocumentRef transaction_ref(const std::string &id) { return DocumentRef(LEDGER_TRANSACTION_NS, id); }

  static Account account_from(const DocumentView &view);
  static LedgerTransaction transaction_from(const DocumentView &view);

private:
  DocumentStore &store_;
};

#endif // LEDGER_HPP
