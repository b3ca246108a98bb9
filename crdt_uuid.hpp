// crdt_uuid.hpp
// UUID generation backed by libuuid.
//
// Used wherever an identifier must be unique across replicas without coordination:
// OR-Set add tags, transaction ids and freshly provisioned actor ids.

#ifndef CRDT_UUID_HPP
#define CRDT_UUID_HPP

#include <uuid/uuid.h>

#include <string>

inline std::string generate_uuid() {
  uuid_t uuid;
  uuid_generate(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}

#endif // CRDT_UUID_HPP
