#include "datauri/charset.hpp"

#include <array>
#include <optional>

#include "datauri/logging.hpp"
#include "datauri/string_utils.hpp"

namespace datauri {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;
constexpr uint8_t kReplacementByte = '?';

struct CharsetAlias {
  std::string_view alias;  // lower case
  Charset::Id id;
};

constexpr std::array<CharsetAlias, 30> kAliases = {{
    {"us-ascii", Charset::Id::UsAscii},
    {"ascii", Charset::Id::UsAscii},
    {"iso646-us", Charset::Id::UsAscii},
    {"ansi_x3.4-1968", Charset::Id::UsAscii},
    {"cp367", Charset::Id::UsAscii},
    {"646", Charset::Id::UsAscii},
    {"iso-8859-1", Charset::Id::Iso8859_1},
    {"iso8859_1", Charset::Id::Iso8859_1},
    {"iso_8859_1", Charset::Id::Iso8859_1},
    {"latin1", Charset::Id::Iso8859_1},
    {"l1", Charset::Id::Iso8859_1},
    {"cp819", Charset::Id::Iso8859_1},
    {"819", Charset::Id::Iso8859_1},
    {"utf-8", Charset::Id::Utf8},
    {"utf8", Charset::Id::Utf8},
    {"utf-16be", Charset::Id::Utf16Be},
    {"utf_16be", Charset::Id::Utf16Be},
    {"x-utf-16be", Charset::Id::Utf16Be},
    {"unicodebigunmarked", Charset::Id::Utf16Be},
    {"utf-16le", Charset::Id::Utf16Le},
    {"utf_16le", Charset::Id::Utf16Le},
    {"x-utf-16le", Charset::Id::Utf16Le},
    {"unicodelittleunmarked", Charset::Id::Utf16Le},
    {"utf-16", Charset::Id::Utf16},
    {"utf_16", Charset::Id::Utf16},
    {"utf16", Charset::Id::Utf16},
    {"unicode", Charset::Id::Utf16},
    {"iso_646.irv:1991", Charset::Id::UsAscii},
    {"iso-ir-100", Charset::Id::Iso8859_1},
    {"csisolatin1", Charset::Id::Iso8859_1},
}};

std::optional<Charset::Id> lookup(std::string_view name) noexcept {
  for (const auto& entry : kAliases) {
    if (string_utils::iequals(entry.alias, name)) {
      return entry.id;
    }
  }
  return std::nullopt;
}

constexpr bool is_surrogate(char32_t cp) noexcept {
  return cp >= 0xD800 && cp <= 0xDFFF;
}

constexpr bool is_continuation(uint8_t b) noexcept { return (b & 0xC0) == 0x80; }

std::u32string decode_utf8(std::span<const uint8_t> bytes) {
  std::u32string result;
  result.reserve(bytes.size());

  std::size_t i = 0;
  while (i < bytes.size()) {
    uint8_t b0 = bytes[i];
    if (b0 < 0x80) {
      result.push_back(b0);
      ++i;
      continue;
    }

    std::size_t length = 0;
    char32_t cp = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      length = 2;
      cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
      length = 3;
      cp = b0 & 0x0F;
      if (b0 == 0xE0) lower = 0xA0;
      if (b0 == 0xED) upper = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
      length = 4;
      cp = b0 & 0x07;
      if (b0 == 0xF0) lower = 0x90;
      if (b0 == 0xF4) upper = 0x8F;
    } else {
      result.push_back(kReplacementChar);
      ++i;
      continue;
    }

    // Consume the longest valid prefix; a broken sequence yields one U+FFFD
    std::size_t consumed = 1;
    bool valid = true;
    for (; consumed < length; ++consumed) {
      if (i + consumed >= bytes.size()) {
        valid = false;
        break;
      }
      uint8_t b = bytes[i + consumed];
      uint8_t lo = consumed == 1 ? lower : 0x80;
      uint8_t hi = consumed == 1 ? upper : 0xBF;
      if (b < lo || b > hi) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (b & 0x3F);
    }

    result.push_back(valid ? cp : kReplacementChar);
    i += consumed;
  }
  return result;
}

void encode_utf8(char32_t cp, std::vector<uint8_t>& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<uint8_t>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<uint8_t>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<uint8_t>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<uint8_t>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
  }
}

std::u32string decode_utf16(std::span<const uint8_t> bytes, bool bigEndian) {
  std::u32string result;
  result.reserve(bytes.size() / 2);

  auto unit_at = [&](std::size_t i) -> char32_t {
    return bigEndian ? static_cast<char32_t>((bytes[i] << 8) | bytes[i + 1])
                     : static_cast<char32_t>((bytes[i + 1] << 8) | bytes[i]);
  };

  std::size_t i = 0;
  while (i + 1 < bytes.size()) {
    char32_t unit = unit_at(i);
    i += 2;
    if (unit >= 0xD800 && unit <= 0xDBFF) {
      if (i + 1 < bytes.size()) {
        char32_t low = unit_at(i);
        if (low >= 0xDC00 && low <= 0xDFFF) {
          result.push_back(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
          i += 2;
          continue;
        }
      }
      result.push_back(kReplacementChar);
    } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
      result.push_back(kReplacementChar);
    } else {
      result.push_back(unit);
    }
  }
  if (i < bytes.size()) {
    // Odd trailing byte
    result.push_back(kReplacementChar);
  }
  return result;
}

void encode_utf16_unit(char32_t unit, bool bigEndian,
                       std::vector<uint8_t>& out) {
  auto hi = static_cast<uint8_t>((unit >> 8) & 0xFF);
  auto lo = static_cast<uint8_t>(unit & 0xFF);
  if (bigEndian) {
    out.push_back(hi);
    out.push_back(lo);
  } else {
    out.push_back(lo);
    out.push_back(hi);
  }
}

void encode_utf16(std::u32string_view text, bool bigEndian,
                  std::vector<uint8_t>& out) {
  for (char32_t cp : text) {
    if (is_surrogate(cp) || cp > 0x10FFFF) {
      encode_utf16_unit(kReplacementChar, bigEndian, out);
    } else if (cp >= 0x10000) {
      char32_t v = cp - 0x10000;
      encode_utf16_unit(0xD800 + (v >> 10), bigEndian, out);
      encode_utf16_unit(0xDC00 + (v & 0x3FF), bigEndian, out);
    } else {
      encode_utf16_unit(cp, bigEndian, out);
    }
  }
}

}  // namespace

Charset Charset::forName(std::string_view name) {
  auto id = lookup(name);
  if (!id) {
    DATAURI_LOG_ERROR("Unsupported charset '{}'", name);
    throw UnsupportedCharsetError(name);
  }
  return Charset(*id);
}

bool Charset::isSupported(std::string_view name) noexcept {
  return lookup(name).has_value();
}

std::string_view Charset::name() const noexcept {
  switch (id_) {
    case Id::UsAscii:
      return "US-ASCII";
    case Id::Iso8859_1:
      return "ISO-8859-1";
    case Id::Utf8:
      return "UTF-8";
    case Id::Utf16Be:
      return "UTF-16BE";
    case Id::Utf16Le:
      return "UTF-16LE";
    case Id::Utf16:
      return "UTF-16";
  }
  return "US-ASCII";
}

std::u32string Charset::decode(std::span<const uint8_t> bytes) const {
  switch (id_) {
    case Id::UsAscii: {
      std::u32string result;
      result.reserve(bytes.size());
      for (uint8_t b : bytes) {
        result.push_back(b < 0x80 ? static_cast<char32_t>(b)
                                  : kReplacementChar);
      }
      return result;
    }
    case Id::Iso8859_1:
      return std::u32string(bytes.begin(), bytes.end());
    case Id::Utf8:
      return decode_utf8(bytes);
    case Id::Utf16Be:
      return decode_utf16(bytes, true);
    case Id::Utf16Le:
      return decode_utf16(bytes, false);
    case Id::Utf16:
      if (bytes.size() >= 2 && bytes[0] == 0xFE && bytes[1] == 0xFF) {
        return decode_utf16(bytes.subspan(2), true);
      }
      if (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xFE) {
        return decode_utf16(bytes.subspan(2), false);
      }
      return decode_utf16(bytes, true);
  }
  return {};
}

std::vector<uint8_t> Charset::encode(std::u32string_view text) const {
  std::vector<uint8_t> result;
  switch (id_) {
    case Id::UsAscii:
    case Id::Iso8859_1: {
      char32_t limit = id_ == Id::UsAscii ? 0x80 : 0x100;
      result.reserve(text.size());
      for (char32_t cp : text) {
        result.push_back(cp < limit ? static_cast<uint8_t>(cp)
                                    : kReplacementByte);
      }
      break;
    }
    case Id::Utf8:
      result.reserve(text.size());
      for (char32_t cp : text) {
        if (is_surrogate(cp) || cp > 0x10FFFF) {
          result.push_back(kReplacementByte);
        } else {
          encode_utf8(cp, result);
        }
      }
      break;
    case Id::Utf16Be:
      encode_utf16(text, true, result);
      break;
    case Id::Utf16Le:
      encode_utf16(text, false, result);
      break;
    case Id::Utf16:
      if (!text.empty()) {
        result.push_back(0xFE);
        result.push_back(0xFF);
        encode_utf16(text, true, result);
      }
      break;
  }
  return result;
}

std::u32string utf8ToCodePoints(std::string_view text) {
  return decode_utf8(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

std::string codePointsToUtf8(std::u32string_view text) {
  std::vector<uint8_t> bytes = Charset::utf8().encode(text);
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace datauri
