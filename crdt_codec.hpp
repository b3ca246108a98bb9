// crdt_codec.hpp
#ifndef CRDT_CODEC_HPP
#define CRDT_CODEC_HPP

#include "delta.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

// Compact binary encoding shared by persistence and the sync wire protocol.
//
// Integers are LEB128 varints (signed ones zigzag-mapped first), strings and byte blobs are
// length-prefixed, doubles are 8 bytes little-endian. Variant alternatives are written as a one
// byte tag equal to their index. Decoding never trusts a length: every read is bounds checked and
// any truncated or malformed input throws DeserializeCorruption.

class ByteWriter {
public:
  void put_u8(uint8_t value) { out_.push_back(value); }
  void put_varint(uint64_t value);
  void put_svarint(int64_t value);
  void put_f64(double value);
  void put_string(const std::string &value);
  void put_bytes(const CrdtBytes &value);

  const CrdtBytes &data() const { return out_; }
  CrdtBytes take() { return std::move(out_); }

private:
  CrdtBytes out_;
};

class ByteReader {
public:
  ByteReader(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}
  explicit ByteReader(const CrdtBytes &bytes) : ByteReader(bytes.data(), bytes.size()) {}

  uint8_t get_u8();
  uint64_t get_varint();
  int64_t get_svarint();
  double get_f64();
  std::string get_string();
  CrdtBytes get_bytes();

  /// Reads an element count and rejects counts that cannot fit in the remaining input.
  size_t get_count();

  bool at_end() const { return offset_ == size_; }
  size_t remaining() const { return size_ - offset_; }

  /// Throws DeserializeCorruption unless every byte was consumed.
  void expect_end() const;

private:
  const uint8_t *data_;
  size_t size_;
  size_t offset_;

  void need(size_t n) const;
};

void encode(ByteWriter &w, const CrdtScalar &value);
void encode(ByteWriter &w, const CrdtStamp &stamp);
void encode(ByteWriter &w, const std::optional<CrdtStamp> &stamp);
void encode(ByteWriter &w, const CrdtVersionVector &vv);
void encode(ByteWriter &w, const CrdtOp &op);
void encode(ByteWriter &w, const CrdtFieldState &state);
void encode(ByteWriter &w, const DocumentRef &ref);
void encode(ByteWriter &w, const Delta &delta);

CrdtScalar decode_scalar(ByteReader &r);
CrdtStamp decode_stamp(ByteReader &r);
std::optional<CrdtStamp> decode_optional_stamp(ByteReader &r);
CrdtVersionVector decode_version_vector(ByteReader &r);
CrdtOp decode_op(ByteReader &r);
CrdtFieldState decode_field_state(ByteReader &r);
DocumentRef decode_ref(ByteReader &r);
Delta decode_delta(ByteReader &r);

/// Whole-buffer helpers.
CrdtBytes encode_delta(const Delta &delta);
Delta decode_delta(const CrdtBytes &bytes);

/// Materialized document state: field states plus the state vector they reflect.
struct DocumentSnapshot {
  CrdtSortedMap<std::string, CrdtFieldState> fields;
  CrdtStateVector state_vector;

  bool operator==(const DocumentSnapshot &other) const = default;
};

CrdtBytes encode_snapshot(const DocumentSnapshot &snapshot);
DocumentSnapshot decode_snapshot(const CrdtBytes &bytes);

#endif // CRDT_CODEC_HPP
