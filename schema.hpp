// schema.hpp
#ifndef SCHEMA_HPP
#define SCHEMA_HPP

#include "crdt_field.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

/// Field description as emitted by the schema compiler. `strategy` is the raw annotation text.
struct FieldMetadata {
  std::string name;
  std::string type; // "string", "int", "float", "bool", "bytes", "enum", "set<...>", ...
  std::string strategy;
  std::optional<int64_t> min_value;
  bool personal = false;
};

/// Validated field description.
struct FieldSchema {
  std::string name; // dotted path inside the document
  std::string type;
  CrdtStrategy strategy;
  std::optional<int64_t> min_value; // numeric lower bound applied when reading
  bool personal = false;            // stored sealed through a FieldCipher
};

/// Fields of one document namespace.
class DocumentSchema {
public:
  DocumentSchema(std::string ns, CrdtVector<FieldSchema> fields);

  /// Builds a schema from compiler metadata. Throws SchemaError on an unrecognized strategy
  /// annotation or a duplicated field name.
  static DocumentSchema from_metadata(const std::string &ns, const CrdtVector<FieldMetadata> &fields);

  const std::string &ns() const { return ns_; }
  const FieldSchema *find(const std::string &path) const;

  /// Like find(), but throws SchemaError for unknown fields.
  const FieldSchema &field(const std::string &path) const;

  const CrdtSortedMap<std::string, FieldSchema> &fields() const { return fields_; }

private:
  std::string ns_;
  CrdtSortedMap<std::string, FieldSchema> fields_;
};

/// Schemas by namespace. Registration is expected at startup; lookups are thread-safe.
class SchemaRegistry {
public:
  /// Adds or replaces the schema of a namespace.
  void add(DocumentSchema schema);

  /// Schema of `ns`, or nullptr when the namespace is unknown.
  std::shared_ptr<const DocumentSchema> find(const std::string &ns) const;

  /// Like find(), but throws SchemaError.
  std::shared_ptr<const DocumentSchema> get(const std::string &ns) const;

  CrdtVector<std::string> namespaces() const;

private:
  mutable std::mutex mutex_;
  CrdtSortedMap<std::string, std::shared_ptr<const DocumentSchema>> schemas_;
};

#endif // SCHEMA_HPP
