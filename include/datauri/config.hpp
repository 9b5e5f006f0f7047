/**
 * @file config.hpp
 * @brief Runtime configuration for builders, stream handling and logging
 */

#pragma once

#include <cstddef>
#include <string>

#include "data_uri.hpp"

namespace datauri {

/// Largest accepted copyBufferSize (16 MiB)
inline constexpr std::size_t kMaxCopyBufferSize = 16 * 1024 * 1024;

/**
 * @brief Tunables shared by builders and the command-line tool
 *
 * Loaded from JSON with keys "copyBufferSize", "base64ByDefault" and
 * "logLevel"; missing keys keep their defaults and unknown keys are ignored.
 * copyBufferSize must be an integer in [1, kMaxCopyBufferSize].
 */
struct CodecConfig {
  std::size_t copyBufferSize = kDefaultBufferSize;  ///< Stream chunk size
  bool base64ByDefault = true;   ///< Payload mode for byte builders
  std::string logLevel = "info";  ///< trace|debug|info|warn|error|critical|off

  /**
   * @brief Load configuration from a JSON file
   * @throws IoError if the file cannot be read or is not valid JSON
   */
  static CodecConfig fromFile(const std::string& path);

  /**
   * @brief Parse configuration from JSON text
   * @throws IoError if the text is not valid JSON or a value is out of range
   */
  static CodecConfig fromJsonString(const std::string& text);

  /**
   * @brief Push the log level to the shared logger
   */
  void apply() const;
};

}  // namespace datauri
