#include "uuid.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

namespace docstore::util {

const UUID kNamespaceDns = {0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
const UUID kNamespaceUrl = {0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
const UUID kNamespaceOid = {0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

void SetVersionAndVariant(UUID& id, uint8_t version) {
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | (version << 4));
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  SetVersionAndVariant(id, 4);
  return id;
}

UUID NameBasedUUID(const UUID& name_space, std::string_view name) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("uuid: failed to create digest context");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) || !EVP_DigestUpdate(ctx.get(), name_space.data(), name_space.size()) ||
      !EVP_DigestUpdate(ctx.get(), name.data(), name.size()) || !EVP_DigestFinal_ex(ctx.get(), digest, &digest_len)) {
    throw std::runtime_error("uuid: SHA-1 digest failed");
  }
  if (digest_len < 16) {
    throw std::runtime_error("uuid: SHA-1 digest too short");
  }

  UUID id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = digest[i];

  SetVersionAndVariant(id, 5);
  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

/*
  Accepts the canonical 8-4-4-4-12 form only.
*/
UUID FromString(const std::string& str) {
  if (str.size() != 36) {
    throw std::invalid_argument("invalid UUID string: " + str);
  }

  std::string hex;
  hex.reserve(32);
  for (size_t i = 0; i < str.size(); ++i) {
    const bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_position) {
      if (str[i] != '-') throw std::invalid_argument("invalid UUID string: " + str);
      continue;
    }
    if (HexNibble(str[i]) < 0) throw std::invalid_argument("invalid UUID string: " + str);
    hex.push_back(str[i]);
  }

  UUID id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[2 * i]) << 4) | HexNibble(hex[2 * i + 1]));

  return id;
}

} // namespace docstore::util
