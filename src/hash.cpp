#include "tether/hash.hpp"

// BLAKE3 is the only hash primitive. A digest written with one domain prefix
// never verifies under another, so a log record checksum can not be replayed
// as an entity digest.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace tether {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  const char* v = blake3_version();
  info.version = v ? v : "unknown";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string record_checksum(std::string_view canonical_record) {
  return hash_domain("log:", canonical_record);
}

std::string entity_digest(std::string_view snapshot_bytes) {
  return hash_domain("ent:", snapshot_bytes);
}

std::string journal_link(std::string_view entry_line) {
  return hash_domain("jrn:", entry_line);
}

std::string idempotency_digest(std::string_view key) {
  return hash_domain("idem:", key);
}

}  // namespace tether
