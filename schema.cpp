// schema.cpp
#include "schema.hpp"
#include "crdt_errors.hpp"

DocumentSchema::DocumentSchema(std::string ns, CrdtVector<FieldSchema> fields) : ns_(std::move(ns)) {
  if (ns_.empty()) {
    throw SchemaError("Schema namespace must not be empty");
  }
  for (auto &field : fields) {
    if (field.name.empty()) {
      throw SchemaError("Empty field name in namespace " + ns_);
    }
    if (field.min_value && field.strategy != CrdtStrategy::Lww && field.strategy != CrdtStrategy::PnCounter) {
      throw SchemaError("Field " + ns_ + "." + field.name + " declares a bound but is " + to_string(field.strategy));
    }
    if (field.personal && field.strategy != CrdtStrategy::Lww && field.strategy != CrdtStrategy::Immutable) {
      throw SchemaError("Personal field " + ns_ + "." + field.name + " must be lww or immutable");
    }
    std::string name = field.name;
    if (!fields_.emplace(name, std::move(field)).second) {
      throw SchemaError("Duplicate field " + ns_ + "." + name);
    }
  }
}

DocumentSchema DocumentSchema::from_metadata(const std::string &ns, const CrdtVector<FieldMetadata> &fields) {
  CrdtVector<FieldSchema> parsed;
  parsed.reserve(fields.size());
  for (const auto &meta : fields) {
    auto strategy = parse_strategy(meta.strategy);
    if (!strategy) {
      throw SchemaError("Unrecognized merge strategy '" + meta.strategy + "' on field " + ns + "." + meta.name);
    }
    parsed.push_back(FieldSchema{meta.name, meta.type, *strategy, meta.min_value, meta.personal});
  }
  return DocumentSchema(ns, std::move(parsed));
}

const FieldSchema *DocumentSchema::find(const std::string &path) const {
  auto it = fields_.find(path);
  return it == fields_.end() ? nullptr : &it->second;
}

const FieldSchema &DocumentSchema::field(const std::string &path) const {
  const FieldSchema *field = find(path);
  if (field == nullptr) {
    throw SchemaError("Unknown field " + ns_ + "." + path);
  }
  return *field;
}

void SchemaRegistry::add(DocumentSchema schema) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string ns = schema.ns();
  schemas_.insert_or_assign(ns, std::make_shared<const DocumentSchema>(std::move(schema)));
}

std::shared_ptr<const DocumentSchema> SchemaRegistry::find(const std::string &ns) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = schemas_.find(ns);
  return it == schemas_.end() ? nullptr : it->second;
}

std::shared_ptr<const DocumentSchema> SchemaRegistry::get(const std::string &ns) const {
  auto schema = find(ns);
  if (!schema) {
    throw SchemaError("Unknown namespace " + ns);
  }
  return schema;
}

CrdtVector<std::string> SchemaRegistry::namespaces() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CrdtVector<std::string> result;
  for (const auto &[ns, _] : schemas_) {
    result.push_back(ns);
  }
  return result;
}
