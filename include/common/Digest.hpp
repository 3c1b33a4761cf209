#pragma once

#include <filesystem>
#include <string>

namespace rwd::common {

/// OpenSSL-backed hashing and random identifiers.
/// Class abbreviation: N/A (static interface)
class Digest {
 public:
  /// SHA-256 hash → 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

  /// SHA-256 of a file's full contents, streamed in fixed-size chunks.
  /// Throws std::runtime_error if the file cannot be read.
  static std::string sha256File(const std::filesystem::path& pathFile);

  /// iBytes cryptographically random bytes → 2*iBytes lowercase hex chars.
  static std::string randomHex(int iBytes);
};

}  // namespace rwd::common
