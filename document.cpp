// document.cpp
#include "document.hpp"
#include "crdt_errors.hpp"
#include "crdt_uuid.hpp"

namespace {

std::string sealed_key(const DocumentRef &ref, const std::string &path) { return to_string(ref) + "#" + path; }

bool delta_order(const Delta &a, const Delta &b) {
  if (a.clock != b.clock)
    return a.clock < b.clock;
  return a.actor < b.actor;
}

CrdtScalar clamp(const CrdtScalar &value, const std::optional<int64_t> &min_value) {
  if (min_value) {
    if (const auto *i = std::get_if<int64_t>(&value)) {
      return std::max(*i, *min_value);
    }
  }
  return value;
}

} // namespace

// -----------------------------------------
// DocumentView
// -----------------------------------------

DocumentView::DocumentView(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema, CrdtFieldMap fields,
                           CrdtStateVector state_vector, std::shared_ptr<FieldCipher> cipher)
    : ref_(std::move(ref)), schema_(std::move(schema)), fields_(std::move(fields)),
      state_vector_(std::move(state_vector)), cipher_(std::move(cipher)) {}

const CrdtFieldState *DocumentView::state(const std::string &path) const {
  auto it = fields_.find(path);
  return it == fields_.end() ? nullptr : &it->second;
}

const CrdtFieldState *DocumentView::checked(const std::string &path, CrdtStrategy a,
                                            std::optional<CrdtStrategy> b) const {
  const FieldSchema &field = schema_->field(path);
  if (field.strategy != a && (!b || field.strategy != *b)) {
    throw SchemaError("Field " + to_string(ref_) + "." + path + " is " + to_string(field.strategy) + ", not " +
                      to_string(a));
  }
  return state(path);
}

CrdtScalar DocumentView::get(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::Lww, CrdtStrategy::Immutable);
  if (s == nullptr) {
    return std::monostate{};
  }
  if (const auto *lww = std::get_if<LwwRegister>(s)) {
    return clamp(lww->value, schema_->field(path).min_value);
  }
  return std::get<ImmutableValue>(*s).value;
}

std::optional<int64_t> DocumentView::get_int(const std::string &path) const {
  CrdtScalar value = get(path);
  if (std::holds_alternative<std::monostate>(value)) {
    return std::nullopt;
  }
  if (const auto *i = std::get_if<int64_t>(&value)) {
    return *i;
  }
  throw SchemaError("Field " + to_string(ref_) + "." + path + " does not hold an integer");
}

std::optional<std::string> DocumentView::get_string(const std::string &path) const {
  CrdtScalar value = get(path);
  if (std::holds_alternative<std::monostate>(value)) {
    return std::nullopt;
  }
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }
  throw SchemaError("Field " + to_string(ref_) + "." + path + " does not hold a string");
}

CrdtVector<std::string> DocumentView::get_set(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::OrSet);
  return s == nullptr ? CrdtVector<std::string>{} : std::get<OrSet>(*s).elements();
}

bool DocumentView::set_contains(const std::string &path, const std::string &element) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::OrSet);
  return s != nullptr && std::get<OrSet>(*s).contains(element);
}

int64_t DocumentView::get_counter(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::PnCounter);
  int64_t value = s == nullptr ? 0 : std::get<PnCounter>(*s).value();
  const auto &min_value = schema_->field(path).min_value;
  return min_value ? std::max(value, *min_value) : value;
}

CrdtVector<CrdtScalar> DocumentView::get_list(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::Rga);
  return s == nullptr ? CrdtVector<CrdtScalar>{} : std::get<RgaSequence>(*s).values();
}

CrdtVector<CrdtScalar> DocumentView::get_values(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::MvRegister);
  return s == nullptr ? CrdtVector<CrdtScalar>{} : std::get<MvRegister>(*s).values();
}

std::string DocumentView::get_text(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::Peritext);
  return s == nullptr ? std::string() : std::get<PeritextDoc>(*s).text();
}

CrdtVector<PeritextSpan> DocumentView::get_spans(const std::string &path) const {
  const CrdtFieldState *s = checked(path, CrdtStrategy::Peritext);
  return s == nullptr ? CrdtVector<PeritextSpan>{} : std::get<PeritextDoc>(*s).spans();
}

std::optional<CrdtBytes> DocumentView::open_sealed(const std::string &path) const {
  if (!schema_->field(path).personal) {
    throw SchemaError("Field " + to_string(ref_) + "." + path + " is not a personal field");
  }
  CrdtScalar value = get(path);
  if (std::holds_alternative<std::monostate>(value)) {
    return std::nullopt;
  }
  if (!cipher_) {
    throw InvalidArgument("No field cipher configured to open " + to_string(ref_) + "." + path);
  }
  return cipher_->decrypt(sealed_key(ref_, path), std::get<CrdtBytes>(value));
}

CrdtBytes DocumentView::canonical() const { return encode_snapshot(DocumentSnapshot{fields_, state_vector_}); }

// -----------------------------------------
// DocumentWriter
// -----------------------------------------

DocumentWriter::DocumentWriter(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema,
                               const CrdtFieldMap &committed, NodeContext &ctx, std::shared_ptr<FieldCipher> cipher)
    : ref_(std::move(ref)), schema_(std::move(schema)), committed_(committed), ctx_(ctx), cipher_(std::move(cipher)) {}

CrdtFieldState &DocumentWriter::touch(const std::string &path, CrdtStrategy expected) {
  const FieldSchema &field = schema_->field(path);
  if (field.strategy != expected) {
    throw SchemaError("Field " + to_string(ref_) + "." + path + " is " + to_string(field.strategy) + ", not " +
                      to_string(expected));
  }
  auto it = staged_.find(path);
  if (it != staged_.end()) {
    return it->second;
  }
  auto committed = committed_.find(path);
  if (committed != committed_.end()) {
    return staged_.emplace(path, committed->second).first->second;
  }
  return staged_.emplace(path, make_field_state(expected)).first->second;
}

uint64_t DocumentWriter::next_clock(uint64_t n) {
  uint64_t first = ctx_.tick_n(n);
  if (ticks_ == 0) {
    first_tick_ = first;
  }
  first_tick_ = std::min(first_tick_, first);
  last_tick_ = std::max(last_tick_, first + n - 1);
  ticks_ += n;
  return first;
}

void DocumentWriter::record(const std::string &path, CrdtStrategy strategy, uint64_t clock, CrdtOp op) {
  ops_.push_back(FieldOp{path, strategy, clock, std::move(op)});
}

void DocumentWriter::set(const std::string &path, const CrdtScalar &value) {
  const FieldSchema &field = schema_->field(path);
  if (field.strategy != CrdtStrategy::Lww && field.strategy != CrdtStrategy::Immutable) {
    throw SchemaError("Field " + to_string(ref_) + "." + path + " is " + to_string(field.strategy) +
                      ", set() needs lww or immutable");
  }
  if (field.personal && !std::holds_alternative<CrdtBytes>(value)) {
    throw SchemaError("Personal field " + to_string(ref_) + "." + path + " must be written with set_sealed()");
  }
  if (field.min_value) {
    const auto *i = std::get_if<int64_t>(&value);
    if (i != nullptr && *i < *field.min_value) {
      throw InvalidArgument("Value " + std::to_string(*i) + " below bound " + std::to_string(*field.min_value) +
                            " of " + to_string(ref_) + "." + path);
    }
  }

  CrdtFieldState &state = touch(path, field.strategy);
  uint64_t clock = next_clock();
  SetOp op{value};
  bool changed = apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  if (field.strategy == CrdtStrategy::Immutable) {
    if (changed) {
      record(path, field.strategy, clock, std::move(op));
    }
    return;
  }

  std::erase_if(ops_, [&](const FieldOp &o) { return o.path == path; });
  record(path, field.strategy, clock, std::move(op));
}

void DocumentWriter::set_sealed(const std::string &path, const CrdtBytes &plaintext) {
  if (!schema_->field(path).personal) {
    throw SchemaError("Field " + to_string(ref_) + "." + path + " is not a personal field");
  }
  if (!cipher_) {
    throw InvalidArgument("No field cipher configured to seal " + to_string(ref_) + "." + path);
  }
  set(path, cipher_->encrypt(sealed_key(ref_, path), plaintext));
}

std::string DocumentWriter::add(const std::string &path, const std::string &element) {
  CrdtFieldState &state = touch(path, CrdtStrategy::OrSet);
  uint64_t clock = next_clock();
  OrSetAddOp op{element, generate_uuid()};
  apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  std::string tag = op.tag;
  record(path, CrdtStrategy::OrSet, clock, std::move(op));
  return tag;
}

bool DocumentWriter::remove(const std::string &path, const std::string &element) {
  CrdtFieldState &state = touch(path, CrdtStrategy::OrSet);
  CrdtVector<std::string> tags = std::get<OrSet>(state).live_tags(element);
  if (tags.empty()) {
    return false;
  }
  uint64_t clock = next_clock();
  OrSetRemoveOp op{element, std::move(tags)};
  apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  record(path, CrdtStrategy::OrSet, clock, std::move(op));
  return true;
}

void DocumentWriter::increment(const std::string &path, uint64_t amount) {
  CrdtFieldState &state = touch(path, CrdtStrategy::PnCounter);
  if (amount == 0) {
    return;
  }
  const auto &counter = std::get<PnCounter>(state);
  const CrdtActorId &actor = ctx_.actor();
  CounterOp op{actor, counter.increments_of(actor) + amount, counter.decrements_of(actor)};
  uint64_t clock = next_clock();
  apply_op(state, op, CrdtStamp(clock, actor));
  std::erase_if(ops_, [&](const FieldOp &o) { return o.path == path; });
  record(path, CrdtStrategy::PnCounter, clock, std::move(op));
}

void DocumentWriter::decrement(const std::string &path, uint64_t amount) {
  CrdtFieldState &state = touch(path, CrdtStrategy::PnCounter);
  if (amount == 0) {
    return;
  }
  const auto &counter = std::get<PnCounter>(state);
  const CrdtActorId &actor = ctx_.actor();
  CounterOp op{actor, counter.increments_of(actor), counter.decrements_of(actor) + amount};
  uint64_t clock = next_clock();
  apply_op(state, op, CrdtStamp(clock, actor));
  std::erase_if(ops_, [&](const FieldOp &o) { return o.path == path; });
  record(path, CrdtStrategy::PnCounter, clock, std::move(op));
}

CrdtStamp DocumentWriter::insert(const std::string &path, size_t index, const CrdtScalar &value) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Rga);
  const auto &seq = std::get<RgaSequence>(state);
  if (index > seq.size()) {
    throw InvalidArgument("Insert index " + std::to_string(index) + " past end of " + path + " (size " +
                          std::to_string(seq.size()) + ")");
  }
  std::optional<CrdtStamp> left;
  if (index > 0) {
    left = seq.id_at(index - 1);
  }
  uint64_t clock = next_clock();
  SeqInsertOp op{CrdtStamp(clock, ctx_.actor()), left, value};
  apply_op(state, op, op.id);
  CrdtStamp id = op.id;
  record(path, CrdtStrategy::Rga, clock, std::move(op));
  return id;
}

CrdtStamp DocumentWriter::push_back(const std::string &path, const CrdtScalar &value) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Rga);
  return insert(path, std::get<RgaSequence>(state).size(), value);
}

void DocumentWriter::remove_at(const std::string &path, size_t index) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Rga);
  auto id = std::get<RgaSequence>(state).id_at(index);
  if (!id) {
    throw InvalidArgument("Remove index " + std::to_string(index) + " out of range for " + path);
  }
  uint64_t clock = next_clock();
  SeqRemoveOp op{*id};
  apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  record(path, CrdtStrategy::Rga, clock, std::move(op));
}

void DocumentWriter::mv_set(const std::string &path, const CrdtScalar &value) {
  CrdtFieldState &state = touch(path, CrdtStrategy::MvRegister);
  CrdtVersionVector version = std::get<MvRegister>(state).observed();
  uint64_t clock = next_clock();
  version[ctx_.actor()] = clock;
  MvSetOp op{value, std::move(version)};
  apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  record(path, CrdtStrategy::MvRegister, clock, std::move(op));
}

void DocumentWriter::text_insert(const std::string &path, size_t index, const std::string &text) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Peritext);
  const auto &doc = std::get<PeritextDoc>(state);
  if (index > doc.size()) {
    throw InvalidArgument("Text index " + std::to_string(index) + " past end of " + path);
  }
  if (text.empty()) {
    return;
  }
  std::optional<CrdtStamp> left;
  if (index > 0) {
    left = doc.char_id_at(index - 1);
  }
  uint64_t first = next_clock(text.size());
  TextInsertOp op{CrdtStamp(first, ctx_.actor()), left, text};
  apply_op(state, op, op.first);
  record(path, CrdtStrategy::Peritext, first, std::move(op));
}

void DocumentWriter::text_remove(const std::string &path, size_t index, size_t length) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Peritext);
  CrdtVector<CrdtStamp> ids = std::get<PeritextDoc>(state).char_ids(index, length);
  if (ids.size() != length) {
    throw InvalidArgument("Text range [" + std::to_string(index) + ", " + std::to_string(index + length) +
                          ") out of range for " + path);
  }
  if (ids.empty()) {
    return;
  }
  uint64_t clock = next_clock();
  TextRemoveOp op{std::move(ids)};
  apply_op(state, op, CrdtStamp(clock, ctx_.actor()));
  record(path, CrdtStrategy::Peritext, clock, std::move(op));
}

void DocumentWriter::mark(const std::string &path, size_t start, size_t end, const std::string &name,
                          const CrdtScalar &value) {
  CrdtFieldState &state = touch(path, CrdtStrategy::Peritext);
  const auto &doc = std::get<PeritextDoc>(state);
  if (start >= end || end > doc.size()) {
    throw InvalidArgument("Mark range [" + std::to_string(start) + ", " + std::to_string(end) +
                          ") invalid for text of size " + std::to_string(doc.size()));
  }
  uint64_t clock = next_clock();
  CrdtStamp id(clock, ctx_.actor());
  TextMarkOp op{PeritextMark{id, *doc.char_id_at(start), *doc.char_id_at(end - 1), name, value}};
  apply_op(state, op, id);
  record(path, CrdtStrategy::Peritext, clock, std::move(op));
}

DocumentView DocumentWriter::view() const {
  CrdtFieldMap fields = committed_;
  for (const auto &[path, state] : staged_) {
    fields.insert_or_assign(path, state);
  }
  return DocumentView(ref_, schema_, std::move(fields), {}, cipher_);
}

Delta DocumentWriter::delta() const {
  Delta delta;
  delta.ref = ref_;
  delta.actor = ctx_.actor();
  delta.ops = ops_;
  for (const auto &op : ops_) {
    delta.clock = std::max(delta.clock, last_clock(op));
  }
  return delta;
}

// -----------------------------------------
// OperationLog
// -----------------------------------------

bool OperationLog::contains(const CrdtActorId &actor, uint64_t clock) const {
  auto it = by_actor_.find(actor);
  return it != by_actor_.end() && it->second.contains(clock);
}

bool OperationLog::append(const Delta &delta) {
  if (!by_actor_[delta.actor].try_emplace(delta.clock, delta).second) {
    return false;
  }
  ++size_;
  return true;
}

std::optional<CrdtVector<Delta>> OperationLog::since(const CrdtStateVector &peer) const {
  CrdtVector<Delta> result;
  for (const auto &[actor, point] : truncated_) {
    auto seen_it = peer.find(actor);
    uint64_t seen = seen_it == peer.end() ? 0 : seen_it->second;
    if (seen < point) {
      return std::nullopt;
    }
  }
  for (const auto &[actor, entries] : by_actor_) {
    auto seen_it = peer.find(actor);
    uint64_t seen = seen_it == peer.end() ? 0 : seen_it->second;
    for (auto it = entries.upper_bound(seen); it != entries.end(); ++it) {
      result.push_back(it->second);
    }
  }
  std::sort(result.begin(), result.end(), delta_order);
  return result;
}

bool OperationLog::advance(CrdtStateVector &sv, const CrdtActorId &actor) const {
  auto log_it = by_actor_.find(actor);
  if (log_it == by_actor_.end()) {
    return false;
  }
  uint64_t &head = sv[actor];
  bool moved = false;
  for (auto it = log_it->second.upper_bound(head); it != log_it->second.end() && it->second.prev <= head; ++it) {
    head = it->first;
    moved = true;
  }
  if (head == 0) {
    sv.erase(actor);
  }
  return moved;
}

CrdtVector<CrdtActorId> OperationLog::actors() const {
  CrdtVector<CrdtActorId> result;
  for (const auto &[actor, _] : by_actor_) {
    result.push_back(actor);
  }
  return result;
}

void OperationLog::truncate(const CrdtStateVector &upto) {
  for (const auto &[actor, clock] : upto) {
    auto &point = truncated_[actor];
    point = std::max(point, clock);
    auto it = by_actor_.find(actor);
    if (it == by_actor_.end()) {
      continue;
    }
    auto &entries = it->second;
    auto end = entries.upper_bound(clock);
    size_ -= std::distance(entries.begin(), end);
    entries.erase(entries.begin(), end);
    if (entries.empty()) {
      by_actor_.erase(it);
    }
  }
}

CrdtVector<Delta> OperationLog::all() const {
  CrdtVector<Delta> result;
  result.reserve(size_);
  for (const auto &[_, entries] : by_actor_) {
    for (const auto &[clock, delta] : entries) {
      result.push_back(delta);
    }
  }
  std::sort(result.begin(), result.end(), delta_order);
  return result;
}

// -----------------------------------------
// Document
// -----------------------------------------

Document::Document(DocumentRef ref, std::shared_ptr<const DocumentSchema> schema)
    : ref_(std::move(ref)), schema_(std::move(schema)) {}

void Document::validate_remote(const Delta &delta, bool check_immutables) const {
  const std::string where = to_string(ref_);
  if (delta.ref != ref_) {
    throw ProtocolViolation("Delta for " + to_string(delta.ref) + " routed to " + where);
  }
  if (delta.actor.empty()) {
    throw ProtocolViolation("Delta for " + where + " has no actor");
  }

  uint64_t highest = 0;
  CrdtSortedMap<std::string, const CrdtScalar *> immutable_writes;
  for (const auto &op : delta.ops) {
    const FieldSchema *field = schema_->find(op.path);
    if (field == nullptr) {
      throw ProtocolViolation("Delta references unknown field " + where + "." + op.path);
    }
    if (op.strategy != field->strategy) {
      throw ProtocolViolation("Delta uses strategy " + std::string(to_string(op.strategy)) + " for " + where + "." +
                              op.path + ", schema says " + to_string(field->strategy));
    }
    if (!op_allowed(op.strategy, op.op) || op.clock == 0) {
      throw ProtocolViolation("Malformed operation on " + where + "." + op.path);
    }

    // Identifiers embedded in an op must be the op's own stamp, otherwise a peer could forge
    // elements or counter entries of another actor
    CrdtStamp stamp = op.stamp(delta.actor);
    bool forged = false;
    if (const auto *counter = std::get_if<CounterOp>(&op.op)) {
      forged = counter->actor != delta.actor;
    } else if (const auto *insert = std::get_if<SeqInsertOp>(&op.op)) {
      forged = insert->id != stamp;
    } else if (const auto *text = std::get_if<TextInsertOp>(&op.op)) {
      forged = text->first != stamp;
    } else if (const auto *mark = std::get_if<TextMarkOp>(&op.op)) {
      forged = mark->mark.id != stamp;
    } else if (const auto *add = std::get_if<OrSetAddOp>(&op.op)) {
      forged = add->tag.empty();
    }
    if (forged) {
      throw ProtocolViolation("Operation on " + where + "." + op.path + " carries a foreign identifier");
    }
    highest = std::max(highest, last_clock(op));

    if (check_immutables && op.strategy == CrdtStrategy::Immutable) {
      const CrdtScalar &value = std::get<SetOp>(op.op).value;
      auto [it, inserted] = immutable_writes.try_emplace(op.path, &value);
      if (!inserted && *it->second != value) {
        throw ImmutableConflict("Delta writes two values to immutable field " + where + "." + op.path);
      }
      auto existing = fields_.find(op.path);
      if (existing != fields_.end()) {
        const auto &current = std::get<ImmutableValue>(existing->second);
        if (current.is_set() && current.value != value) {
          throw ImmutableConflict("Immutable field " + where + "." + op.path + " already holds " +
                                  scalar_to_string(current.value) + ", remote write of " + scalar_to_string(value) +
                                  " by " + delta.actor + " rejected");
        }
      }
    }
  }
  // Coalescing in an outbound queue may drop the op that consumed the delta's clock, but no op
  // may lie beyond it
  if (highest > delta.clock || delta.clock == 0 || delta.prev >= delta.clock) {
    throw ProtocolViolation("Delta clock " + std::to_string(delta.clock) + " does not cover its operations (" +
                            std::to_string(highest) + ")");
  }
}

bool Document::apply_remote(const Delta &delta) {
  bool changed = false;
  for (const auto &op : delta.ops) {
    auto it = fields_.find(op.path);
    if (it == fields_.end()) {
      it = fields_.emplace(op.path, make_field_state(op.strategy)).first;
      changed = true;
    }
    changed |= apply_op(it->second, op.op, op.stamp(delta.actor));
  }
  log_.append(delta);
  log_.advance(state_vector_, delta.actor);
  live_ = true;
  return changed;
}

uint64_t Document::head(const CrdtActorId &actor) const {
  auto it = state_vector_.find(actor);
  return it == state_vector_.end() ? 0 : it->second;
}

void Document::advance_all() {
  for (const auto &actor : log_.actors()) {
    log_.advance(state_vector_, actor);
  }
}

void Document::commit_local(const Delta &delta, CrdtFieldMap staged) {
  // Fields touched without producing an op (a remove of an absent element) stay as they were
  for (const auto &op : delta.ops) {
    auto it = staged.find(op.path);
    if (it != staged.end()) {
      fields_.insert_or_assign(op.path, std::move(it->second));
      staged.erase(it);
    }
  }
  if (!delta.empty()) {
    log_.append(delta);
    log_.advance(state_vector_, delta.actor);
  }
  live_ = true;
}

bool Document::merge_snapshot(const DocumentSnapshot &snapshot) {
  const std::string where = to_string(ref_);
  CrdtFieldMap staged;
  bool changed = false;
  for (const auto &[path, state] : snapshot.fields) {
    const FieldSchema *field = schema_->find(path);
    if (field == nullptr) {
      throw ProtocolViolation("Snapshot references unknown field " + where + "." + path);
    }
    if (strategy_of(state) != field->strategy) {
      throw ProtocolViolation("Snapshot holds " + std::string(to_string(strategy_of(state))) + " state for " + where +
                              "." + path + ", schema says " + to_string(field->strategy));
    }
    auto existing = fields_.find(path);
    CrdtFieldState merged = existing == fields_.end() ? make_field_state(field->strategy) : existing->second;
    if (merge_field(merged, state) || existing == fields_.end()) {
      staged.emplace(path, std::move(merged));
      changed = true;
    }
  }

  // Deltas the snapshot carries that we never logged are only available as a snapshot from now on
  CrdtStateVector gained;
  for (const auto &[actor, clock] : snapshot.state_vector) {
    auto it = state_vector_.find(actor);
    if (it == state_vector_.end() || it->second < clock) {
      gained[actor] = clock;
    }
  }

  for (auto &[path, state] : staged) {
    fields_.insert_or_assign(path, std::move(state));
  }
  vv_merge(state_vector_, snapshot.state_vector);
  log_.truncate(gained);
  advance_all();
  live_ = true;
  return changed || !gained.empty();
}

size_t Document::garbage_collect() {
  size_t collected = 0;
  for (auto &[path, state] : fields_) {
    if (auto *seq = std::get_if<RgaSequence>(&state)) {
      collected += seq->garbage_collect();
    }
  }
  return collected;
}

DocumentView Document::view(std::shared_ptr<FieldCipher> cipher) const {
  return DocumentView(ref_, schema_, fields_, state_vector_, std::move(cipher));
}
