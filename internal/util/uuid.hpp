#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace docstore::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 UUIDs. Document ids are name-based (version 5,
  SHA-1); staging object names are random (version 4).
*/

using UUID = std::array<uint8_t, 16>;

// RFC4122 appendix C namespaces
extern const UUID kNamespaceDns;
extern const UUID kNamespaceUrl;
extern const UUID kNamespaceOid;

UUID GenerateUUID();

// Version 5: SHA-1 over namespace bytes followed by the UTF-8 name.
UUID NameBasedUUID(const UUID& name_space, std::string_view name);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace docstore::util
