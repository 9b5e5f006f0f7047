/**
 * @file builder.hpp
 * @brief Fluent construction of data URIs from text, bytes or streams
 */

#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "media_type.hpp"

namespace datauri {

class WithMediaType;

/**
 * @brief Builds "data:" URIs
 *
 * Stream sources are held by reference and read to the end when build() runs,
 * so read errors surface from build(). A stream can only be built once.
 */
class DataUriBuilder {
 public:
  /**
   * @brief Builder for UTF-8 text; the payload is always form-encoded
   */
  static DataUriBuilder fromText(std::string text,
                                 const CodecConfig& config = {});
  static DataUriBuilder fromText(std::istream& text,
                                 const CodecConfig& config = {});

  /**
   * @brief Builder for raw bytes; base64 unless configured otherwise
   */
  static DataUriBuilder fromBytes(std::vector<uint8_t> data,
                                  const CodecConfig& config = {});
  static DataUriBuilder fromBytes(std::istream& data,
                                  const CodecConfig& config = {});

  /**
   * @brief Choose base64 or form-encoded payload for byte sources
   *
   * Has no effect on text sources.
   */
  DataUriBuilder& withBase64Data(bool base64Data);

  /**
   * @brief Attach a media type
   * @throws InvalidMimeTypeError if mediaType cannot be parsed
   */
  WithMediaType withMediaType(const std::string& mediaType) const;

  /**
   * @brief Build the data URI without a media type
   * @throws IoError if reading a stream source fails
   */
  std::string build() const;

 private:
  friend class WithMediaType;

  enum class Source { Text, TextStream, Bytes, ByteStream };

  DataUriBuilder(Source source, const CodecConfig& config);

  std::string build(const std::optional<MediaType>& mediaType) const;

  Source source_;
  std::string text_;
  std::vector<uint8_t> bytes_;
  std::istream* stream_ = nullptr;
  std::size_t bufferSize_;
  bool base64Data_;
};

/**
 * @brief Builder stage that edits the media type before building
 *
 * The media type is re-created (and re-validated) by build().
 */
class WithMediaType {
 public:
  /**
   * @brief Set or remove a media type parameter
   * @param name Parameter name
   * @param value New value, or std::nullopt to remove the parameter
   * @return Reference to this stage for chaining
   */
  WithMediaType& withMediaTypeParameter(const std::string& name,
                                        std::optional<std::string> value);

  /**
   * @brief Set the charset parameter to the canonical name of charset
   * @throws UnsupportedCharsetError if the charset is not registered
   */
  WithMediaType& withCharset(const std::string& charset);

  /**
   * @brief Build the data URI
   * @throws InvalidMimeTypeError if the MIME type is invalid
   * @throws UnsupportedCharsetError if the charset is unknown
   * @throws IoError if reading a stream source fails
   */
  std::string build() const;

 private:
  friend class DataUriBuilder;

  WithMediaType(DataUriBuilder parent, const MediaType& mediaType);

  DataUriBuilder parent_;
  std::string mimeType_;
  MediaTypeParameters parameters_;
};

}  // namespace datauri
