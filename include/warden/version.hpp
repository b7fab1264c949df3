#pragma once

// warden/version.hpp — Version manifest for every persisted or emitted format.
//
// INVARIANT:
//   Format constants are compile-time. A reader that meets a newer version than
//   it was built with fails closed (the dead-letter codec returns
//   entry_corrupt) rather than guessing.

#include <cstdint>
#include <string>

namespace warden {
namespace version {

// ---------------------------------------------------------------------------
// DLQ_ENTRY_VERSION
// Envelope written by encode_dlq_entry(). Version 1: flat JSON, hex payload,
// optional zstd, BLAKE3 "dlq:" digest trailer.
// ---------------------------------------------------------------------------
constexpr uint32_t DLQ_ENTRY_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// One ControlEvent per line in WARDEN_EVENT_LOG. Adding a field is compatible;
// renaming or removing one requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// SNAPSHOT_VERSION
// Shape of AdmissionController::snapshot_json().
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_VERSION = 1;

struct VersionManifest {
  uint32_t dlq_entry{DLQ_ENTRY_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t snapshot{SNAPSHOT_VERSION};
  std::string semver;
  std::string hash_primitive;      // "blake3"
  std::string hash_library;        // version reported by the linked BLAKE3
  bool zstd{false};                // built with WARDEN_WITH_ZSTD
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace warden
