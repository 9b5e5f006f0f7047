/**
 * @file charset.hpp
 * @brief Charset registry used to interpret percent-encoded data URI payloads
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace datauri {

/**
 * @brief A named character encoding that converts bytes to and from code
 * points
 *
 * Decoding replaces malformed input with U+FFFD. Encoding replaces code points
 * the charset cannot represent with '?' (U+FFFD for the UTF-16 family).
 */
class Charset {
 public:
  enum class Id { UsAscii, Iso8859_1, Utf8, Utf16Be, Utf16Le, Utf16 };

  /**
   * @brief Look up a charset by canonical name or alias (case-insensitive)
   * @throws UnsupportedCharsetError if the name is unknown or empty
   */
  static Charset forName(std::string_view name);

  /**
   * @brief Check whether forName() would succeed
   */
  static bool isSupported(std::string_view name) noexcept;

  static Charset usAscii() noexcept { return Charset(Id::UsAscii); }
  static Charset utf8() noexcept { return Charset(Id::Utf8); }

  Id id() const noexcept { return id_; }

  /**
   * @brief Canonical charset name, e.g. "US-ASCII"
   */
  std::string_view name() const noexcept;

  std::u32string decode(std::span<const uint8_t> bytes) const;
  std::vector<uint8_t> encode(std::u32string_view text) const;

  bool operator==(const Charset& other) const noexcept {
    return id_ == other.id_;
  }

 private:
  explicit Charset(Id id) noexcept : id_(id) {}

  Id id_;
};

/**
 * @brief Decode UTF-8 text into code points (malformed input -> U+FFFD)
 */
std::u32string utf8ToCodePoints(std::string_view text);

/**
 * @brief Encode code points as UTF-8 text
 */
std::string codePointsToUtf8(std::u32string_view text);

}  // namespace datauri
