/**
 * @file url_codec.hpp
 * @brief application/x-www-form-urlencoded style codec for data URI payloads
 */

#pragma once

#include <string>
#include <string_view>

#include "charset.hpp"

namespace datauri {
namespace url_codec {

/**
 * @brief Characters copied verbatim by formEncode(): A-Z a-z 0-9 . - * _
 */
constexpr bool is_unreserved(char32_t c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '*' ||
         c == '_';
}

/**
 * @brief Decode a form-encoded payload into text
 *
 * '+' becomes a space. Each maximal run of %XX escapes is collected and
 * decoded with the given charset. Remaining characters are taken as UTF-8
 * URI text.
 *
 * @param encoded Encoded payload
 * @param charset Charset of the escaped bytes
 * @return Decoded code points
 * @throws InvalidPercentEncodingError on a truncated or non-hex escape
 */
std::u32string formDecode(std::string_view encoded, const Charset& charset);

/**
 * @brief Encode text as a form-encoded payload
 *
 * Unreserved characters are copied, space becomes '+', and every maximal run
 * of other characters is encoded with the charset and written as uppercase
 * %XX escapes.
 */
std::string formEncode(std::u32string_view text, const Charset& charset);

}  // namespace url_codec
}  // namespace datauri
