// crdt_errors.hpp
#ifndef CRDT_ERRORS_HPP
#define CRDT_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/// Classifies every failure the engine can report.
///
/// Local operations (mutate, spend, read) throw synchronously. The sync and
/// reconciliation tasks catch at their task boundary and turn the error into a
/// state transition (retry, disconnect, defer) instead of propagating it.
enum class CrdtErrorKind {
  ImmutableConflict,     // two different values for a set-once field; fatal for that write
  InsufficientEscrow,    // spend larger than local escrow; rejected before any mutation
  NetworkTransient,      // peer I/O failed; retried with backoff
  ProtocolViolation,     // peer sent a delta the schema cannot accept; peer is dropped
  QuorumNotReached,      // reconciliation deferred for an account
  DoubleSpendDetected,   // expected outcome, surfaced as a Rejected transaction
  DeserializeCorruption, // encoded bytes are truncated or malformed
  Schema,                // unrecognized strategy annotation or unknown field/namespace
  DocumentNotFound,
  Storage,               // SQLite failure
  InvalidArgument,
};

const char *to_string(CrdtErrorKind kind);

/// Base class for every exception thrown by the engine.
class CrdtException : public std::runtime_error {
public:
  CrdtException(CrdtErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

  CrdtErrorKind kind() const { return kind_; }

  /// Whether the caller may retry the same operation later.
  bool recoverable() const {
    return kind_ == CrdtErrorKind::InsufficientEscrow || kind_ == CrdtErrorKind::NetworkTransient ||
           kind_ == CrdtErrorKind::QuorumNotReached;
  }

private:
  CrdtErrorKind kind_;
};

class ImmutableConflict : public CrdtException {
public:
  explicit ImmutableConflict(const std::string &msg) : CrdtException(CrdtErrorKind::ImmutableConflict, msg) {}
};

class InsufficientEscrow : public CrdtException {
public:
  InsufficientEscrow(int64_t available, int64_t requested)
      : CrdtException(CrdtErrorKind::InsufficientEscrow, "Insufficient escrow: available " + std::to_string(available) +
                                                             ", requested " + std::to_string(requested)),
        available_(available), requested_(requested) {}

  int64_t available() const { return available_; }
  int64_t requested() const { return requested_; }

private:
  int64_t available_;
  int64_t requested_;
};

class NetworkTransient : public CrdtException {
public:
  explicit NetworkTransient(const std::string &msg) : CrdtException(CrdtErrorKind::NetworkTransient, msg) {}
};

class ProtocolViolation : public CrdtException {
public:
  explicit ProtocolViolation(const std::string &msg) : CrdtException(CrdtErrorKind::ProtocolViolation, msg) {}
};

class QuorumNotReached : public CrdtException {
public:
  QuorumNotReached(const std::string &account, size_t votes, size_t quorum)
      : CrdtException(CrdtErrorKind::QuorumNotReached, "Quorum not reached for " + account + ": " +
                                                           std::to_string(votes) + "/" + std::to_string(quorum)) {}
};

/// A sender's admitted transactions exceed the escrow it was granted.
class DoubleSpendDetected : public CrdtException {
public:
  DoubleSpendDetected(const std::string &account, int64_t admitted, int64_t escrow)
      : CrdtException(CrdtErrorKind::DoubleSpendDetected, "Double spend by " + account + ": admitted " +
                                                              std::to_string(admitted) + " against escrow " +
                                                              std::to_string(escrow)) {}
};

class DeserializeCorruption : public CrdtException {
public:
  explicit DeserializeCorruption(const std::string &msg) : CrdtException(CrdtErrorKind::DeserializeCorruption, msg) {}
};

class SchemaError : public CrdtException {
public:
  explicit SchemaError(const std::string &msg) : CrdtException(CrdtErrorKind::Schema, msg) {}
};

class DocumentNotFound : public CrdtException {
public:
  explicit DocumentNotFound(const std::string &ref) : CrdtException(CrdtErrorKind::DocumentNotFound, "Document not found: " + ref) {}
};

class StorageError : public CrdtException {
public:
  explicit StorageError(const std::string &msg) : CrdtException(CrdtErrorKind::Storage, msg) {}
};

class InvalidArgument : public CrdtException {
public:
  explicit InvalidArgument(const std::string &msg) : CrdtException(CrdtErrorKind::InvalidArgument, msg) {}
};

#endif // CRDT_ERRORS_HPP
