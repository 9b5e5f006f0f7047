/**
 * @file data_uri.hpp
 * @brief RFC 2397 data URI decoding and encoding
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "charset.hpp"
#include "error.hpp"
#include "media_type.hpp"

namespace datauri {

inline constexpr std::string_view kDataScheme = "data";
inline constexpr std::string_view kBase64Marker = ";base64";
inline constexpr std::size_t kDefaultBufferSize = 4096;

/**
 * @brief Decoded content of a data URI together with its media type
 */
class DataUriBody {
 public:
  DataUriBody(MediaType mediaType, std::vector<uint8_t> content)
      : mediaType_(std::move(mediaType)), content_(std::move(content)) {}

  const MediaType& mediaType() const noexcept { return mediaType_; }
  const std::vector<uint8_t>& content() const noexcept { return content_; }

  /**
   * @brief Canonical media type string, e.g. "text/plain;charset=US-ASCII"
   */
  const std::string& contentType() const noexcept {
    return mediaType_.toString();
  }

  /**
   * @brief The media type's charset parameter, if any
   */
  std::optional<std::string> contentEncoding() const {
    return mediaType_.getCharset();
  }

  std::size_t contentLength() const noexcept { return content_.size(); }

  /**
   * @brief Open a readable stream over a copy of the decoded content
   */
  std::unique_ptr<std::istream> openStream() const;

  bool operator==(const DataUriBody& other) const {
    return mediaType_ == other.mediaType_ && content_ == other.content_;
  }

 private:
  MediaType mediaType_;
  std::vector<uint8_t> content_;
};

/**
 * @brief Charset used for percent-encoded payloads
 * @param mediaType Media type, or nullptr when absent
 * @return The media type's charset, or US-ASCII when absent
 * @throws UnsupportedCharsetError if the charset name is unknown
 */
Charset resolveCharset(const MediaType* mediaType);

/**
 * @brief Split off the scheme of a URI
 * @return Text before the first ':' or std::nullopt when there is none
 */
std::optional<std::string_view> schemeOf(std::string_view uri) noexcept;

/**
 * @brief Decode the body region [start, end) of a data URI
 *
 * The region starts right after "data:" and holds
 * [<mediatype>][;base64],<data>.
 *
 * @throws MissingCommaError if there is no ',' in the region
 * @throws InvalidMimeTypeError if the media type is malformed
 * @throws InvalidBase64Error if a base64 payload is malformed
 * @throws InvalidPercentEncodingError if a text payload has a bad escape
 * @throws UnsupportedCharsetError if the charset is unknown
 * @throws std::out_of_range if the region is outside uri
 */
DataUriBody decode(std::string_view uri, std::size_t start, std::size_t end);

/**
 * @brief Decode a complete "data:..." URI
 * @throws InvalidProtocolError if the scheme is not "data"
 */
DataUriBody decodeUri(std::string_view uri);

/**
 * @brief Non-throwing variant of decodeUri()
 */
DataUriResult<DataUriBody> tryDecodeUri(std::string_view uri);

/**
 * @brief Encode bytes as a data URI body (without the "data:" prefix)
 * @param mediaType Media type to emit, or std::nullopt to omit it
 * @param content Bytes to encode
 * @param useBase64 Emit ";base64," and a base64 payload; otherwise the bytes
 *        are read as text in the resolved charset and form-encoded
 */
std::string encode(const std::optional<MediaType>& mediaType,
                   std::span<const uint8_t> content, bool useBase64);

/**
 * @brief Encode a stream's content as a data URI body
 *
 * The stream is read to its end exactly once.
 *
 * @throws IoError if reading fails
 */
std::string encode(const std::optional<MediaType>& mediaType, std::istream& in,
                   bool useBase64,
                   std::size_t bufferSize = kDefaultBufferSize);

/**
 * @brief Encode UTF-8 text as a form-encoded data URI body
 *
 * The text is re-encoded in the resolved charset before escaping.
 */
std::string encodeText(const std::optional<MediaType>& mediaType,
                       std::string_view text);

std::string encodeUri(const std::optional<MediaType>& mediaType,
                      std::span<const uint8_t> content, bool useBase64);

std::string encodeUri(const std::optional<MediaType>& mediaType,
                      std::istream& in, bool useBase64,
                      std::size_t bufferSize = kDefaultBufferSize);

}  // namespace datauri
