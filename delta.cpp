// delta.cpp
#include "delta.hpp"

std::string to_string(const DocumentRef &ref) { return ref.ns + "/" + ref.id; }

uint64_t last_clock(const FieldOp &op) {
  if (const auto *insert = std::get_if<TextInsertOp>(&op.op)) {
    if (!insert->text.empty()) {
      return op.clock + insert->text.size() - 1;
    }
  }
  return op.clock;
}
