// crdt_field.cpp
#include "crdt_field.hpp"
#include "crdt_errors.hpp"

#include <array>

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::array<const char *, CRDT_STRATEGY_COUNT> STRATEGY_NAMES = {
    "immutable", "lww", "or_set", "pn_counter", "rga", "mv_register", "peritext",
};

} // namespace

const char *to_string(CrdtStrategy strategy) {
  auto index = static_cast<size_t>(strategy);
  return index < STRATEGY_NAMES.size() ? STRATEGY_NAMES[index] : "unknown";
}

std::optional<CrdtStrategy> parse_strategy(std::string_view name) {
  for (size_t i = 0; i < STRATEGY_NAMES.size(); ++i) {
    if (name == STRATEGY_NAMES[i]) {
      return static_cast<CrdtStrategy>(i);
    }
  }
  return std::nullopt;
}

CrdtFieldState make_field_state(CrdtStrategy strategy) {
  switch (strategy) {
  case CrdtStrategy::Immutable:
    return ImmutableValue{};
  case CrdtStrategy::Lww:
    return LwwRegister{};
  case CrdtStrategy::OrSet:
    return OrSet{};
  case CrdtStrategy::PnCounter:
    return PnCounter{};
  case CrdtStrategy::Rga:
    return RgaSequence{};
  case CrdtStrategy::MvRegister:
    return MvRegister{};
  case CrdtStrategy::Peritext:
    return PeritextDoc{};
  }
  throw SchemaError("Unknown strategy tag " + std::to_string(static_cast<int>(strategy)));
}

bool op_allowed(CrdtStrategy strategy, const CrdtOp &op) {
  switch (strategy) {
  case CrdtStrategy::Immutable:
  case CrdtStrategy::Lww:
    return std::holds_alternative<SetOp>(op);
  case CrdtStrategy::OrSet:
    return std::holds_alternative<OrSetAddOp>(op) || std::holds_alternative<OrSetRemoveOp>(op);
  case CrdtStrategy::PnCounter:
    return std::holds_alternative<CounterOp>(op);
  case CrdtStrategy::Rga:
    return std::holds_alternative<SeqInsertOp>(op) || std::holds_alternative<SeqRemoveOp>(op);
  case CrdtStrategy::MvRegister:
    return std::holds_alternative<MvSetOp>(op);
  case CrdtStrategy::Peritext:
    return std::holds_alternative<TextInsertOp>(op) || std::holds_alternative<TextRemoveOp>(op) ||
           std::holds_alternative<TextMarkOp>(op);
  }
  return false;
}

CrdtFieldState op_to_state(CrdtStrategy strategy, const CrdtOp &op, const CrdtStamp &stamp) {
  if (!op_allowed(strategy, op)) {
    throw ProtocolViolation(std::string("Operation tag ") + std::to_string(op.index()) + " is not valid for strategy " +
                            to_string(strategy));
  }

  return std::visit(
      overloaded{
          [&](const SetOp &set) -> CrdtFieldState {
            if (strategy == CrdtStrategy::Immutable) {
              return ImmutableValue{set.value, stamp};
            }
            return LwwRegister{set.value, stamp};
          },
          [&](const OrSetAddOp &add) -> CrdtFieldState {
            OrSet set;
            set.adds[add.element].insert(add.tag);
            return set;
          },
          [&](const OrSetRemoveOp &remove) -> CrdtFieldState {
            OrSet set;
            set.removed.insert(remove.tags.begin(), remove.tags.end());
            return set;
          },
          [&](const CounterOp &counter) -> CrdtFieldState {
            PnCounter state;
            if (counter.increments > 0) {
              state.increments[counter.actor] = counter.increments;
            }
            if (counter.decrements > 0) {
              state.decrements[counter.actor] = counter.decrements;
            }
            return state;
          },
          [&](const SeqInsertOp &insert) -> CrdtFieldState {
            RgaSequence seq;
            seq.integrate(RgaElement{insert.id, insert.left, insert.value});
            return seq;
          },
          [&](const SeqRemoveOp &remove) -> CrdtFieldState {
            RgaSequence seq;
            seq.remove(remove.id);
            return seq;
          },
          [&](const MvSetOp &set) -> CrdtFieldState {
            MvRegister reg;
            reg.entries.push_back(MvEntry{set.value, set.version});
            return reg;
          },
          [&](const TextInsertOp &insert) -> CrdtFieldState {
            PeritextDoc doc;
            doc.insert_run(insert.first, insert.left, insert.text);
            return doc;
          },
          [&](const TextRemoveOp &remove) -> CrdtFieldState {
            PeritextDoc doc;
            doc.remove(remove.ids);
            return doc;
          },
          [&](const TextMarkOp &mark) -> CrdtFieldState {
            PeritextDoc doc;
            doc.add_mark(mark.mark);
            return doc;
          },
      },
      op);
}

bool apply_op(CrdtFieldState &state, const CrdtOp &op, const CrdtStamp &stamp) {
  return merge_field(state, op_to_state(strategy_of(state), op, stamp));
}

bool merge_field(CrdtFieldState &into, const CrdtFieldState &other) {
  if (into.index() != other.index()) {
    throw ProtocolViolation(std::string("Cannot merge ") + to_string(strategy_of(other)) + " state into " +
                            to_string(strategy_of(into)) + " field");
  }
  return std::visit(
      [&](auto &local) -> bool {
        using T = std::decay_t<decltype(local)>;
        return merge_into(local, std::get<T>(other));
      },
      into);
}

uint64_t max_clock(const CrdtFieldState &state) {
  return std::visit(
      overloaded{
          [](const ImmutableValue &v) -> uint64_t { return v.stamp.clock; },
          [](const LwwRegister &v) -> uint64_t { return v.stamp.clock; },
          [](const OrSet &) -> uint64_t { return 0; },
          [](const PnCounter &) -> uint64_t { return 0; },
          [](const RgaSequence &seq) -> uint64_t {
            uint64_t result = 0;
            if (!seq.elements().empty()) {
              result = seq.elements().rbegin()->first.clock;
            }
            if (!seq.tombstones().empty()) {
              result = std::max(result, seq.tombstones().rbegin()->clock);
            }
            return result;
          },
          [](const MvRegister &reg) -> uint64_t {
            uint64_t result = 0;
            for (const auto &entry : reg.entries) {
              for (const auto &[_, clock] : entry.version) {
                result = std::max(result, clock);
              }
            }
            return result;
          },
          [](const PeritextDoc &doc) -> uint64_t {
            uint64_t result = 0;
            if (!doc.chars().elements().empty()) {
              result = doc.chars().elements().rbegin()->first.clock;
            }
            if (!doc.marks().empty()) {
              result = std::max(result, doc.marks().rbegin()->first.clock);
            }
            return result;
          },
      },
      state);
}
