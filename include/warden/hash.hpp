#pragma once

// warden/hash.hpp — BLAKE3 digests and hex helpers.
//
// BLAKE3-256 is the only digest primitive. Digests guard encoded dead-letter
// entries against truncation and tampering in external storage. Domain
// prefixes ("dlq:") keep digests from different contexts from colliding.

#include <optional>
#include <string>
#include <string_view>

namespace warden {

// 64-char lowercase hex digest.
std::string blake3_hex(std::string_view payload);

// BLAKE3 over domain || payload, hex encoded.
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string hex_encode(std::string_view bytes);

// nullopt on odd length or a non-hex character.
std::optional<std::string> hex_decode(std::string_view hex);

// Version string reported by the linked BLAKE3 library.
std::string blake3_library_version();

}  // namespace warden
