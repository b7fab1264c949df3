#include "warden/version.hpp"

#include <sstream>

#include "warden/hash.hpp"

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "0.1.0"
#endif

namespace warden {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = WARDEN_VERSION;
  m.hash_primitive = "blake3";
  m.hash_library = blake3_library_version();
#if defined(WARDEN_WITH_ZSTD)
  m.zstd = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"dlq_entry\":" << m.dlq_entry
    << ",\"event_log\":" << m.event_log
    << ",\"snapshot\":" << m.snapshot
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_library\":\"" << m.hash_library << "\""
    << ",\"zstd\":" << (m.zstd ? "true" : "false")
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace warden
