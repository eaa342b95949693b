#pragma once

// tether/version.hpp: Version manifest for every persisted format.
//
// INVARIANT:
//   All constants are compile-time. Readers check the version recorded in a
//   file header before interpreting any record and fail with
//   ErrorCode::storage_corrupt on mismatch. A log written by a newer build is
//   never silently accepted.

#include <cstdint>
#include <string>

namespace tether {
namespace version {

constexpr const char* kSemver = "0.3.0";

// BLAKE3-256, hex encoded, domain-prefixed (see hash.hpp).
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Offline log: header line + NDJSON op/state records with "sum" checksums.
constexpr uint32_t OFFLINE_LOG_VERSION = 1;

// Canonical entity file: one JSON meta line followed by the snapshot bytes.
constexpr uint32_t ENTITY_FORMAT_VERSION = 1;

// Conflict journal: NDJSON with seq + prev chain link.
constexpr uint32_t CONFLICT_JOURNAL_VERSION = 1;

// Message bodies exchanged over ITransport (probe / dispatch / abort).
constexpr uint32_t WIRE_PROTOCOL_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t offline_log{OFFLINE_LOG_VERSION};
  uint32_t entity_format{ENTITY_FORMAT_VERSION};
  uint32_t conflict_journal{CONFLICT_JOURNAL_VERSION};
  uint32_t wire_protocol{WIRE_PROTOCOL_VERSION};
  std::string semver;
  std::string hash_primitive;
  bool        zstd_enabled{false};
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool        ok{true};
  std::string error_code;
  std::string description;
};

// Checks a format version read from disk against the compiled constant.
CompatibilityResult check_format(const std::string& format, uint32_t found, uint32_t expected);

}  // namespace version
}  // namespace tether
