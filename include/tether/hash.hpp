#pragma once

// tether/hash.hpp: BLAKE3 digests with domain separation.
//
// Every persisted byte sequence that must survive a crash intact carries a
// digest computed here: offline log records, canonical entity snapshots and
// conflict journal links. Task ids derived from idempotency keys also come
// from this module so that resubmission maps to the same id on every node.
//
// Domain prefixes are part of the on-disk contract:
//   "log:"  offline log record checksum
//   "ent:"  canonical entity snapshot digest
//   "jrn:"  conflict journal chain link
//   "idem:" task idempotency key

#include <string>
#include <string_view>

namespace tether {

struct HashRuntimeInfo {
  std::string primitive{"blake3"};
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex of BLAKE3-256(payload).
std::string blake3_hex(std::string_view payload);

// BLAKE3-256(domain || payload) as hex.
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string record_checksum(std::string_view canonical_record);
std::string entity_digest(std::string_view snapshot_bytes);
std::string journal_link(std::string_view entry_line);
std::string idempotency_digest(std::string_view key);

}  // namespace tether
