/**
 * @file stream_reader.hpp
 * @brief Chunked draining of caller supplied input streams
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <ios>
#include <istream>
#include <span>
#include <vector>

#include "error.hpp"

namespace datauri {

/**
 * @brief Read a stream to its end, handing each chunk to consumer
 *
 * Read failures (badbit, or std::ios_base::failure raised with badbit set)
 * are rethrown as IoError. Reaching end of stream is never an error, even
 * when the stream has failbit in its exception mask.
 *
 * @param in Stream to drain
 * @param bufferSize Chunk size in bytes (0 is treated as 1)
 * @param consumer Callable taking std::span<const uint8_t>
 */
template <typename Consumer>
void readStream(std::istream& in, std::size_t bufferSize, Consumer&& consumer) {
  std::vector<char> buffer(bufferSize == 0 ? 1 : bufferSize);
  for (;;) {
    bool stopped = false;
    try {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    } catch (const std::ios_base::failure& e) {
      // A failbit mask turns the short read at end of stream into a throw
      if (in.bad()) {
        throw IoError(e.what());
      }
      stopped = true;
    } catch (const std::exception& e) {
      // Rethrown from the streambuf when badbit is in the exception mask
      if (!in.bad()) {
        throw;
      }
      throw IoError(e.what());
    }
    std::streamsize n = in.gcount();
    if (n > 0) {
      consumer(std::span<const uint8_t>(
          reinterpret_cast<const uint8_t*>(buffer.data()),
          static_cast<std::size_t>(n)));
    }
    if (stopped || !in) {
      break;
    }
  }
  if (in.bad()) {
    throw IoError("failed to read data stream");
  }
}

}  // namespace datauri
