#include "tether/version.hpp"

#include <sstream>

namespace tether {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver         = kSemver;
  m.hash_primitive = "blake3";
#if defined(TETHER_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"offline_log\":" << m.offline_log
    << ",\"entity_format\":" << m.entity_format
    << ",\"conflict_journal\":" << m.conflict_journal
    << ",\"wire_protocol\":" << m.wire_protocol
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << "}";
  return o.str();
}

CompatibilityResult check_format(const std::string& format, uint32_t found, uint32_t expected) {
  CompatibilityResult r;
  if (found != expected) {
    r.ok          = false;
    r.error_code  = "storage_corrupt";
    r.description = format + " version " + std::to_string(found) + " != supported version " +
                    std::to_string(expected);
  }
  return r;
}

}  // namespace version
}  // namespace tether
