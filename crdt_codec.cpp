// crdt_codec.cpp
#include "crdt_codec.hpp"
#include "crdt_errors.hpp"

#include <cstring>

namespace {

constexpr uint8_t SCALAR_TAG_COUNT = std::variant_size_v<CrdtScalar>;
constexpr uint8_t OP_TAG_COUNT = std::variant_size_v<CrdtOp>;
constexpr uint8_t SNAPSHOT_FORMAT_VERSION = 1;

void encode_rga(ByteWriter &w, const RgaSequence &seq) {
  w.put_varint(seq.elements().size());
  for (const auto &[id, element] : seq.elements()) {
    encode(w, id);
    encode(w, element.left);
    encode(w, element.value);
  }
  w.put_varint(seq.tombstones().size());
  for (const auto &id : seq.tombstones()) {
    encode(w, id);
  }
}

void encode_mark(ByteWriter &w, const PeritextMark &mark) {
  encode(w, mark.id);
  encode(w, mark.start);
  encode(w, mark.end);
  w.put_string(mark.name);
  encode(w, mark.value);
}

PeritextMark decode_mark(ByteReader &r) {
  PeritextMark mark;
  mark.id = decode_stamp(r);
  mark.start = decode_stamp(r);
  mark.end = decode_stamp(r);
  mark.name = r.get_string();
  mark.value = decode_scalar(r);
  return mark;
}

CrdtVector<std::string> decode_string_list(ByteReader &r) {
  size_t count = r.get_count();
  CrdtVector<std::string> result;
  result.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    result.push_back(r.get_string());
  }
  return result;
}

void encode_string_list(ByteWriter &w, const CrdtVector<std::string> &values) {
  w.put_varint(values.size());
  for (const auto &value : values) {
    w.put_string(value);
  }
}

CrdtSortedMap<CrdtActorId, uint64_t> decode_accumulators(ByteReader &r) {
  CrdtSortedMap<CrdtActorId, uint64_t> result;
  size_t count = r.get_count();
  for (size_t i = 0; i < count; ++i) {
    std::string actor = r.get_string();
    result[actor] = r.get_varint();
  }
  return result;
}

} // namespace

// -----------------------------------------
// ByteWriter / ByteReader
// -----------------------------------------

void ByteWriter::put_varint(uint64_t value) {
  do {
    uint8_t byte = value & 0x7F;
    value >>= 7;
    if (value != 0) {
      byte |= 0x80;
    }
    out_.push_back(byte);
  } while (value != 0);
}

void ByteWriter::put_svarint(int64_t value) {
  put_varint((static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63));
}

void ByteWriter::put_f64(double value) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  for (int i = 0; i < 8; ++i) {
    out_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
  }
}

void ByteWriter::put_string(const std::string &value) {
  put_varint(value.size());
  out_.insert(out_.end(), value.begin(), value.end());
}

void ByteWriter::put_bytes(const CrdtBytes &value) {
  put_varint(value.size());
  out_.insert(out_.end(), value.begin(), value.end());
}

void ByteReader::need(size_t n) const {
  if (n > size_ - offset_) {
    throw DeserializeCorruption("Unexpected end of input at offset " + std::to_string(offset_) + " (needed " +
                                std::to_string(n) + " bytes, " + std::to_string(size_ - offset_) + " left)");
  }
}

uint8_t ByteReader::get_u8() {
  need(1);
  return data_[offset_++];
}

uint64_t ByteReader::get_varint() {
  uint64_t value = 0;
  int shift = 0;
  while (true) {
    uint8_t byte = get_u8();
    if (shift == 63 && (byte & 0x7E) != 0) {
      throw DeserializeCorruption("Varint overflows 64 bits");
    }
    value |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0) {
      return value;
    }
    shift += 7;
    if (shift >= 64) {
      throw DeserializeCorruption("Varint longer than 10 bytes");
    }
  }
}

int64_t ByteReader::get_svarint() {
  uint64_t zigzag = get_varint();
  return static_cast<int64_t>((zigzag >> 1) ^ (~(zigzag & 1) + 1));
}

double ByteReader::get_f64() {
  need(8);
  uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) {
    bits |= static_cast<uint64_t>(data_[offset_++]) << (8 * i);
  }
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string ByteReader::get_string() {
  uint64_t length = get_varint();
  need(length);
  std::string value(reinterpret_cast<const char *>(data_ + offset_), length);
  offset_ += length;
  return value;
}

CrdtBytes ByteReader::get_bytes() {
  uint64_t length = get_varint();
  need(length);
  CrdtBytes value(data_ + offset_, data_ + offset_ + length);
  offset_ += length;
  return value;
}

size_t ByteReader::get_count() {
  uint64_t count = get_varint();
  // Every encoded element takes at least one byte
  if (count > remaining()) {
    throw DeserializeCorruption("Element count " + std::to_string(count) + " exceeds remaining input");
  }
  return static_cast<size_t>(count);
}

void ByteReader::expect_end() const {
  if (!at_end()) {
    throw DeserializeCorruption(std::to_string(size_ - offset_) + " trailing bytes");
  }
}

// -----------------------------------------
// Primitives
// -----------------------------------------

void encode(ByteWriter &w, const CrdtScalar &value) {
  w.put_u8(static_cast<uint8_t>(value.index()));
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          w.put_u8(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          w.put_svarint(v);
        } else if constexpr (std::is_same_v<T, double>) {
          w.put_f64(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          w.put_string(v);
        } else if constexpr (std::is_same_v<T, CrdtBytes>) {
          w.put_bytes(v);
        }
      },
      value);
}

CrdtScalar decode_scalar(ByteReader &r) {
  uint8_t tag = r.get_u8();
  switch (tag) {
  case 0:
    return std::monostate{};
  case 1: {
    uint8_t b = r.get_u8();
    if (b > 1) {
      throw DeserializeCorruption("Invalid bool byte " + std::to_string(b));
    }
    return b == 1;
  }
  case 2:
    return r.get_svarint();
  case 3:
    return r.get_f64();
  case 4:
    return r.get_string();
  case 5:
    return r.get_bytes();
  default:
    throw DeserializeCorruption("Unknown scalar tag " + std::to_string(tag) + " (expected < " +
                                std::to_string(SCALAR_TAG_COUNT) + ")");
  }
}

void encode(ByteWriter &w, const CrdtStamp &stamp) {
  w.put_varint(stamp.clock);
  w.put_string(stamp.actor);
}

CrdtStamp decode_stamp(ByteReader &r) {
  uint64_t clock = r.get_varint();
  return CrdtStamp(clock, r.get_string());
}

void encode(ByteWriter &w, const std::optional<CrdtStamp> &stamp) {
  w.put_u8(stamp.has_value() ? 1 : 0);
  if (stamp) {
    encode(w, *stamp);
  }
}

std::optional<CrdtStamp> decode_optional_stamp(ByteReader &r) {
  uint8_t present = r.get_u8();
  if (present == 0) {
    return std::nullopt;
  }
  if (present != 1) {
    throw DeserializeCorruption("Invalid optional flag " + std::to_string(present));
  }
  return decode_stamp(r);
}

void encode(ByteWriter &w, const CrdtVersionVector &vv) {
  w.put_varint(vv.size());
  for (const auto &[actor, clock] : vv) {
    w.put_string(actor);
    w.put_varint(clock);
  }
}

CrdtVersionVector decode_version_vector(ByteReader &r) {
  return decode_accumulators(r);
}

// -----------------------------------------
// Operations
// -----------------------------------------

void encode(ByteWriter &w, const CrdtOp &op) {
  w.put_u8(static_cast<uint8_t>(op.index()));
  std::visit(
      [&](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, SetOp>) {
          encode(w, o.value);
        } else if constexpr (std::is_same_v<T, OrSetAddOp>) {
          w.put_string(o.element);
          w.put_string(o.tag);
        } else if constexpr (std::is_same_v<T, OrSetRemoveOp>) {
          w.put_string(o.element);
          encode_string_list(w, o.tags);
        } else if constexpr (std::is_same_v<T, CounterOp>) {
          w.put_string(o.actor);
          w.put_varint(o.increments);
          w.put_varint(o.decrements);
        } else if constexpr (std::is_same_v<T, SeqInsertOp>) {
          encode(w, o.id);
          encode(w, o.left);
          encode(w, o.value);
        } else if constexpr (std::is_same_v<T, SeqRemoveOp>) {
          encode(w, o.id);
        } else if constexpr (std::is_same_v<T, MvSetOp>) {
          encode(w, o.value);
          encode(w, o.version);
        } else if constexpr (std::is_same_v<T, TextInsertOp>) {
          encode(w, o.first);
          encode(w, o.left);
          w.put_string(o.text);
        } else if constexpr (std::is_same_v<T, TextRemoveOp>) {
          w.put_varint(o.ids.size());
          for (const auto &id : o.ids) {
            encode(w, id);
          }
        } else if constexpr (std::is_same_v<T, TextMarkOp>) {
          encode_mark(w, o.mark);
        }
      },
      op);
}

CrdtOp decode_op(ByteReader &r) {
  uint8_t tag = r.get_u8();
  switch (tag) {
  case 0:
    return SetOp{decode_scalar(r)};
  case 1: {
    OrSetAddOp op;
    op.element = r.get_string();
    op.tag = r.get_string();
    return op;
  }
  case 2: {
    OrSetRemoveOp op;
    op.element = r.get_string();
    op.tags = decode_string_list(r);
    return op;
  }
  case 3: {
    CounterOp op;
    op.actor = r.get_string();
    op.increments = r.get_varint();
    op.decrements = r.get_varint();
    return op;
  }
  case 4: {
    SeqInsertOp op;
    op.id = decode_stamp(r);
    op.left = decode_optional_stamp(r);
    op.value = decode_scalar(r);
    return op;
  }
  case 5:
    return SeqRemoveOp{decode_stamp(r)};
  case 6: {
    MvSetOp op;
    op.value = decode_scalar(r);
    op.version = decode_version_vector(r);
    return op;
  }
  case 7: {
    TextInsertOp op;
    op.first = decode_stamp(r);
    op.left = decode_optional_stamp(r);
    op.text = r.get_string();
    return op;
  }
  case 8: {
    TextRemoveOp op;
    size_t count = r.get_count();
    for (size_t i = 0; i < count; ++i) {
      op.ids.push_back(decode_stamp(r));
    }
    return op;
  }
  case 9:
    return TextMarkOp{decode_mark(r)};
  default:
    throw DeserializeCorruption("Unknown operation tag " + std::to_string(tag) + " (expected < " +
                                std::to_string(OP_TAG_COUNT) + ")");
  }
}

// -----------------------------------------
// Field states
// -----------------------------------------

void encode(ByteWriter &w, const CrdtFieldState &state) {
  w.put_u8(static_cast<uint8_t>(state.index()));
  std::visit(
      [&](const auto &s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ImmutableValue> || std::is_same_v<T, LwwRegister>) {
          encode(w, s.value);
          encode(w, s.stamp);
        } else if constexpr (std::is_same_v<T, OrSet>) {
          w.put_varint(s.adds.size());
          for (const auto &[element, tags] : s.adds) {
            w.put_string(element);
            w.put_varint(tags.size());
            for (const auto &tag : tags) {
              w.put_string(tag);
            }
          }
          w.put_varint(s.removed.size());
          for (const auto &tag : s.removed) {
            w.put_string(tag);
          }
        } else if constexpr (std::is_same_v<T, PnCounter>) {
          encode(w, s.increments);
          encode(w, s.decrements);
        } else if constexpr (std::is_same_v<T, RgaSequence>) {
          encode_rga(w, s);
        } else if constexpr (std::is_same_v<T, MvRegister>) {
          w.put_varint(s.entries.size());
          for (const auto &entry : s.entries) {
            encode(w, entry.value);
            encode(w, entry.version);
          }
        } else if constexpr (std::is_same_v<T, PeritextDoc>) {
          encode_rga(w, s.chars());
          w.put_varint(s.marks().size());
          for (const auto &[id, mark] : s.marks()) {
            encode_mark(w, mark);
          }
        }
      },
      state);
}

CrdtFieldState decode_field_state(ByteReader &r) {
  uint8_t tag = r.get_u8();
  if (tag >= CRDT_STRATEGY_COUNT) {
    throw DeserializeCorruption("Unknown strategy tag " + std::to_string(tag));
  }

  switch (static_cast<CrdtStrategy>(tag)) {
  case CrdtStrategy::Immutable: {
    ImmutableValue v;
    v.value = decode_scalar(r);
    v.stamp = decode_stamp(r);
    return v;
  }
  case CrdtStrategy::Lww: {
    LwwRegister v;
    v.value = decode_scalar(r);
    v.stamp = decode_stamp(r);
    return v;
  }
  case CrdtStrategy::OrSet: {
    OrSet set;
    size_t elements = r.get_count();
    for (size_t i = 0; i < elements; ++i) {
      auto &tags = set.adds[r.get_string()];
      for (auto &tag_value : decode_string_list(r)) {
        tags.insert(std::move(tag_value));
      }
    }
    for (auto &tag_value : decode_string_list(r)) {
      set.removed.insert(std::move(tag_value));
    }
    return set;
  }
  case CrdtStrategy::PnCounter: {
    PnCounter counter;
    counter.increments = decode_accumulators(r);
    counter.decrements = decode_accumulators(r);
    return counter;
  }
  case CrdtStrategy::Rga: {
    RgaSequence seq;
    size_t elements = r.get_count();
    for (size_t i = 0; i < elements; ++i) {
      RgaElement element;
      element.id = decode_stamp(r);
      element.left = decode_optional_stamp(r);
      element.value = decode_scalar(r);
      seq.integrate(element);
    }
    size_t tombstones = r.get_count();
    for (size_t i = 0; i < tombstones; ++i) {
      seq.remove(decode_stamp(r));
    }
    return seq;
  }
  case CrdtStrategy::MvRegister: {
    MvRegister reg;
    size_t entries = r.get_count();
    for (size_t i = 0; i < entries; ++i) {
      MvEntry entry;
      entry.value = decode_scalar(r);
      entry.version = decode_version_vector(r);
      reg.entries.push_back(std::move(entry));
    }
    return reg;
  }
  case CrdtStrategy::Peritext: {
    PeritextDoc doc;
    size_t chars = r.get_count();
    for (size_t i = 0; i < chars; ++i) {
      CrdtStamp id = decode_stamp(r);
      std::optional<CrdtStamp> left = decode_optional_stamp(r);
      CrdtScalar value = decode_scalar(r);
      const auto *text = std::get_if<std::string>(&value);
      if (text == nullptr || text->size() != 1) {
        throw DeserializeCorruption("Peritext character " + to_string(id) + " is not a single byte");
      }
      doc.insert_run(id, left, *text);
    }
    size_t tombstones = r.get_count();
    CrdtVector<CrdtStamp> removed;
    for (size_t i = 0; i < tombstones; ++i) {
      removed.push_back(decode_stamp(r));
    }
    doc.remove(removed);
    size_t marks = r.get_count();
    for (size_t i = 0; i < marks; ++i) {
      doc.add_mark(decode_mark(r));
    }
    return doc;
  }
  }
  throw DeserializeCorruption("Unknown strategy tag " + std::to_string(tag));
}

// -----------------------------------------
// Deltas and snapshots
// -----------------------------------------

void encode(ByteWriter &w, const DocumentRef &ref) {
  w.put_string(ref.ns);
  w.put_string(ref.id);
}

DocumentRef decode_ref(ByteReader &r) {
  std::string ns = r.get_string();
  return DocumentRef(std::move(ns), r.get_string());
}

void encode(ByteWriter &w, const Delta &delta) {
  encode(w, delta.ref);
  w.put_string(delta.actor);
  w.put_varint(delta.clock);
  w.put_varint(delta.prev);
  w.put_varint(delta.ops.size());
  for (const auto &op : delta.ops) {
    w.put_string(op.path);
    w.put_u8(static_cast<uint8_t>(op.strategy));
    w.put_varint(op.clock);
    encode(w, op.op);
  }
}

Delta decode_delta(ByteReader &r) {
  Delta delta;
  delta.ref = decode_ref(r);
  delta.actor = r.get_string();
  delta.clock = r.get_varint();
  delta.prev = r.get_varint();
  size_t count = r.get_count();
  delta.ops.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    FieldOp op;
    op.path = r.get_string();
    uint8_t strategy = r.get_u8();
    if (strategy >= CRDT_STRATEGY_COUNT) {
      throw DeserializeCorruption("Unknown strategy tag " + std::to_string(strategy) + " on field " + op.path);
    }
    op.strategy = static_cast<CrdtStrategy>(strategy);
    op.clock = r.get_varint();
    op.op = decode_op(r);
    delta.ops.push_back(std::move(op));
  }
  return delta;
}

CrdtBytes encode_delta(const Delta &delta) {
  ByteWriter w;
  encode(w, delta);
  return w.take();
}

Delta decode_delta(const CrdtBytes &bytes) {
  ByteReader r(bytes);
  Delta delta = decode_delta(r);
  r.expect_end();
  return delta;
}

CrdtBytes encode_snapshot(const DocumentSnapshot &snapshot) {
  ByteWriter w;
  w.put_u8(SNAPSHOT_FORMAT_VERSION);
  encode(w, snapshot.state_vector);
  w.put_varint(snapshot.fields.size());
  for (const auto &[path, state] : snapshot.fields) {
    w.put_string(path);
    encode(w, state);
  }
  return w.take();
}

DocumentSnapshot decode_snapshot(const CrdtBytes &bytes) {
  ByteReader r(bytes);
  uint8_t version = r.get_u8();
  if (version != SNAPSHOT_FORMAT_VERSION) {
    throw DeserializeCorruption("Unsupported snapshot format version " + std::to_string(version));
  }
  DocumentSnapshot snapshot;
  snapshot.state_vector = decode_version_vector(r);
  size_t count = r.get_count();
  for (size_t i = 0; i < count; ++i) {
    std::string path = r.get_string();
    snapshot.fields.insert_or_assign(path, decode_field_state(r));
  }
  r.expect_end();
  return snapshot;
}
