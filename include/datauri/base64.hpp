/**
 * @file base64.hpp
 * @brief Streaming standard base64 encoding and strict decoding for data URIs
 */

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace datauri {

/**
 * @brief Byte-oriented sink that appends ASCII characters to a string
 *
 * Each byte written is taken to be a base64 alphabet character already; the
 * appender does no validation. Slices are copied through a fixed staging
 * buffer so arbitrarily large slices never need a second full-size copy.
 */
class Base64Appender {
 public:
  static constexpr std::size_t kStagingSize = 1024;

  explicit Base64Appender(std::string& dest) noexcept : dest_(dest) {}

  Base64Appender(const Base64Appender&) = delete;
  Base64Appender& operator=(const Base64Appender&) = delete;

  void writeByte(uint8_t b) { dest_.push_back(static_cast<char>(b)); }

  void writeSlice(std::span<const uint8_t> bytes);

 private:
  std::string& dest_;
  std::array<char, kStagingSize> staging_{};
};

/**
 * @brief Incremental standard base64 encoder (RFC 4648, padded, no line
 * breaks) writing into a Base64Appender
 *
 * Output is identical to the one-shot encoding of all bytes passed to
 * update(), regardless of how the input is split.
 */
class Base64Encoder {
 public:
  explicit Base64Encoder(Base64Appender& sink) noexcept : sink_(sink) {}

  Base64Encoder(const Base64Encoder&) = delete;
  Base64Encoder& operator=(const Base64Encoder&) = delete;

  /**
   * @brief Encode more input
   * @throws std::logic_error if called after finish()
   */
  void update(std::span<const uint8_t> data);

  /**
   * @brief Flush the final partial group with padding
   */
  void finish();

 private:
  void encodeBlocks(std::span<const uint8_t> data);

  // Whole groups encoded per EVP_EncodeBlock call
  static constexpr std::size_t kChunkInput = 768;

  Base64Appender& sink_;
  std::array<uint8_t, 2> pending_{};
  std::size_t pendingSize_ = 0;
  bool finished_ = false;
};

/**
 * @brief Implementation for base64 encoding from span
 */
std::string base64EncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for data types suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode data as standard padded base64
 */
template <Base64Data T>
std::string base64Encode(const T& data) {
  return base64EncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode standard base64
 *
 * Padding is optional but must be well formed when present, and nothing may
 * follow it.
 *
 * @throws InvalidBase64Error on characters outside the alphabet, bad padding
 * or a dangling single character
 */
std::vector<uint8_t> base64Decode(std::string_view encoded);

}  // namespace datauri
