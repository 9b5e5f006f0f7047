#include "datauri/base64.hpp"

#include <openssl/evp.h>

#include "datauri/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace datauri {

static constexpr std::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

void Base64Appender::writeSlice(std::span<const uint8_t> bytes) {
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    std::size_t n = std::min(staging_.size(), bytes.size() - offset);
    for (std::size_t j = 0; j < n; ++j) {
      staging_[j] = static_cast<char>(bytes[offset + j]);
    }
    dest_.append(staging_.data(), n);
    offset += n;
  }
}

void Base64Encoder::encodeBlocks(std::span<const uint8_t> data) {
  // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
  std::array<uint8_t, kChunkInput / 3 * 4 + 1> out;
  while (!data.empty()) {
    std::size_t n = std::min(kChunkInput, data.size());
    int written = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(n));
    sink_.writeSlice({out.data(), static_cast<std::size_t>(written)});
    data = data.subspan(n);
  }
}

void Base64Encoder::update(std::span<const uint8_t> data) {
  if (finished_) {
    throw std::logic_error("Base64Encoder::update called after finish");
  }

  // Complete a group left over from the previous call
  if (pendingSize_ > 0) {
    while (pendingSize_ < 3 && !data.empty()) {
      if (pendingSize_ == 2) {
        std::array<uint8_t, 3> group = {pending_[0], pending_[1], data[0]};
        encodeBlocks(group);
        pendingSize_ = 0;
        data = data.subspan(1);
        break;
      }
      pending_[pendingSize_++] = data[0];
      data = data.subspan(1);
    }
    if (pendingSize_ > 0) {
      return;
    }
  }

  std::size_t whole = data.size() - data.size() % 3;
  encodeBlocks(data.first(whole));
  for (std::size_t i = whole; i < data.size(); ++i) {
    pending_[pendingSize_++] = data[i];
  }
}

void Base64Encoder::finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (pendingSize_ > 0) {
    encodeBlocks({pending_.data(), pendingSize_});
    pendingSize_ = 0;
  }
}

std::string base64EncodeImpl(std::span<const uint8_t> data) {
  std::string result;
  // Pre-allocate capacity for performance (base64 expansion factor ~1.33)
  result.reserve((data.size() + 2) / 3 * 4);

  Base64Appender appender(result);
  Base64Encoder encoder(appender);
  encoder.update(data);
  encoder.finish();
  return result;
}

[[noreturn]] static void fail_decode(const char* reason,
                                     [[maybe_unused]] std::size_t position) {
  DATAURI_LOG_ERROR("Invalid base64 data at offset {}: {}", position, reason);
  throw InvalidBase64Error(reason);
}

std::vector<uint8_t> base64Decode(std::string_view encoded) {
  // Create decode lookup table for performance (static to avoid repeated
  // initialization)
  static const std::array<int8_t, 256> decode_table = []() {
    std::array<int8_t, 256> table{};
    // Initialize all to -1 (invalid)
    for (size_t i = 0; i < 256; ++i) table[i] = -1;

    for (size_t i = 0; i < base64_chars.size(); ++i) {
      table[static_cast<unsigned char>(base64_chars[i])] =
          static_cast<int8_t>(i);
    }
    return table;
  }();

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);  // Reserve estimated size

  int val = 0, valb = -8;
  std::size_t groupSize = 0;  // characters seen in the current 4-char group
  std::size_t i = 0;
  for (; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      // Padding may only close a group of 2 (as "==") or 3 (as "=")
      if (groupSize == 2) {
        if (i + 1 >= encoded.size() || encoded[i + 1] != '=') {
          fail_decode("incomplete padding", i);
        }
        i += 2;
      } else if (groupSize == 3) {
        i += 1;
      } else {
        fail_decode("unexpected padding character", i);
      }
      groupSize = 0;
      break;
    }

    // Use lookup table for O(1) character validation and conversion
    int8_t decoded = decode_table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      fail_decode("invalid character in base64 string", i);
    }

    val = ((val << 6) + decoded) & 0xFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
    groupSize = (groupSize + 1) % 4;
  }

  if (i < encoded.size()) {
    fail_decode("data after padding", i);
  }
  if (groupSize == 1) {
    fail_decode("last unit does not have enough valid bits", i);
  }
  return result;
}

}  // namespace datauri
