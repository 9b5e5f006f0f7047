#include "datauri/url_codec.hpp"

#include <cstdint>
#include <vector>

#include "datauri/error.hpp"
#include "datauri/logging.hpp"

namespace datauri {
namespace url_codec {

namespace {

constexpr std::string_view kHexDigits = "0123456789ABCDEF";

constexpr int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::u32string formDecode(std::string_view encoded, const Charset& charset) {
  std::u32string result;
  result.reserve(encoded.size());

  std::size_t i = 0;
  while (i < encoded.size()) {
    char c = encoded[i];
    if (c == '+') {
      result.push_back(U' ');
      ++i;
    } else if (c == '%') {
      std::vector<uint8_t> bytes;
      while (i < encoded.size() && encoded[i] == '%') {
        if (i + 2 >= encoded.size()) {
          DATAURI_LOG_ERROR("Incomplete trailing escape at offset {}", i);
          throw InvalidPercentEncodingError("incomplete trailing escape");
        }
        int hi = hex_value(encoded[i + 1]);
        int lo = hex_value(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
          DATAURI_LOG_ERROR("Illegal hex characters in escape at offset {}",
                            i);
          throw InvalidPercentEncodingError(
              "illegal hex characters in escape pattern");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        i += 3;
      }
      result.append(charset.decode(bytes));
    } else {
      std::size_t runEnd = encoded.find_first_of("+%", i);
      if (runEnd == std::string_view::npos) {
        runEnd = encoded.size();
      }
      result.append(utf8ToCodePoints(encoded.substr(i, runEnd - i)));
      i = runEnd;
    }
  }
  return result;
}

std::string formEncode(std::u32string_view text, const Charset& charset) {
  std::string result;
  result.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    char32_t c = text[i];
    if (is_unreserved(c)) {
      result.push_back(static_cast<char>(c));
      ++i;
    } else if (c == U' ') {
      result.push_back('+');
      ++i;
    } else {
      std::size_t runEnd = i;
      while (runEnd < text.size() && !is_unreserved(text[runEnd]) &&
             text[runEnd] != U' ') {
        ++runEnd;
      }
      for (uint8_t b : charset.encode(text.substr(i, runEnd - i))) {
        result.push_back('%');
        result.push_back(kHexDigits[b >> 4]);
        result.push_back(kHexDigits[b & 0x0F]);
      }
      i = runEnd;
    }
  }
  return result;
}

}  // namespace url_codec
}  // namespace datauri
