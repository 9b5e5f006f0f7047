#include "datauri/data_uri.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "datauri/base64.hpp"
#include "datauri/logging.hpp"
#include "datauri/stream_reader.hpp"
#include "datauri/string_utils.hpp"
#include "datauri/url_codec.hpp"

namespace datauri {

namespace {

// Whitespace removed from base64 payloads: space, \t, \n, \v, \f, \r
constexpr bool is_base64_whitespace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

bool is_base64_data(std::string_view uri, std::size_t start,
                    std::size_t indexOfComma) noexcept {
  return indexOfComma >= start + kBase64Marker.size() &&
         uri.substr(indexOfComma - kBase64Marker.size(),
                    kBase64Marker.size()) == kBase64Marker;
}

std::vector<uint8_t> decode_payload(std::string_view payload,
                                    const MediaType& mediaType,
                                    bool base64Data) {
  if (base64Data) {
    std::string stripped;
    stripped.reserve(payload.size());
    std::copy_if(payload.begin(), payload.end(), std::back_inserter(stripped),
                 [](char c) { return !is_base64_whitespace(c); });
    return base64Decode(stripped);
  }

  Charset charset = resolveCharset(&mediaType);
  std::u32string text = url_codec::formDecode(payload, charset);
  return charset.encode(text);
}

std::string with_scheme(std::string body) {
  std::string uri;
  uri.reserve(kDataScheme.size() + 1 + body.size());
  uri.append(kDataScheme);
  uri.push_back(':');
  uri.append(body);
  return uri;
}

}  // namespace

std::unique_ptr<std::istream> DataUriBody::openStream() const {
  return std::make_unique<std::istringstream>(
      std::string(content_.begin(), content_.end()), std::ios::binary);
}

Charset resolveCharset(const MediaType* mediaType) {
  std::optional<std::string> name;
  if (mediaType != nullptr) {
    name = mediaType->getCharset();
  }
  return name ? Charset::forName(*name) : Charset::usAscii();
}

std::optional<std::string_view> schemeOf(std::string_view uri) noexcept {
  std::size_t colon = uri.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  return uri.substr(0, colon);
}

DataUriBody decode(std::string_view uri, std::size_t start, std::size_t end) {
  if (start > end || end > uri.size()) {
    throw std::out_of_range("decode: invalid region");
  }

  std::size_t indexOfComma = uri.find(',', start);
  if (indexOfComma == std::string_view::npos || indexOfComma >= end) {
    DATAURI_LOG_ERROR("No comma found in data URI body");
    throw MissingCommaError(uri);
  }

  bool base64Data = is_base64_data(uri, start, indexOfComma);
  std::size_t mediaTypeEnd =
      base64Data ? indexOfComma - kBase64Marker.size() : indexOfComma;

  MediaType mediaType = start == mediaTypeEnd
                            ? MediaType::defaultType()
                            : MediaType::parse(uri, start, mediaTypeEnd);

  std::string_view payload = uri.substr(indexOfComma + 1, end - indexOfComma - 1);
  std::vector<uint8_t> content = decode_payload(payload, mediaType, base64Data);

  DATAURI_LOG_DEBUG("Decoded data URI: media type '{}', base64 {}, {} bytes",
                    mediaType.toString(), base64Data, content.size());
  return DataUriBody(std::move(mediaType), std::move(content));
}

DataUriBody decodeUri(std::string_view uri) {
  auto scheme = schemeOf(uri);
  if (!scheme || !string_utils::iequals(*scheme, kDataScheme)) {
    std::string_view actual = scheme ? *scheme : std::string_view{};
    DATAURI_LOG_ERROR("Refusing to decode URI with scheme '{}'", actual);
    throw InvalidProtocolError(kDataScheme, actual);
  }
  return decode(uri, scheme->size() + 1, uri.size());
}

DataUriResult<DataUriBody> tryDecodeUri(std::string_view uri) {
  try {
    return decodeUri(uri);
  } catch (const DataUriError& e) {
    return DataUriResult<DataUriBody>::error(e);
  }
}

std::string encode(const std::optional<MediaType>& mediaType,
                   std::span<const uint8_t> content, bool useBase64) {
  std::string body;
  if (mediaType) {
    body.append(mediaType->toString());
  }

  if (useBase64) {
    body.reserve(body.size() + kBase64Marker.size() + 1 +
                 (content.size() + 2) / 3 * 4);
    body.append(kBase64Marker);
    body.push_back(',');
    Base64Appender appender(body);
    Base64Encoder encoder(appender);
    encoder.update(content);
    encoder.finish();
  } else {
    Charset charset = resolveCharset(mediaType ? &*mediaType : nullptr);
    body.push_back(',');
    body.append(url_codec::formEncode(charset.decode(content), charset));
  }

  DATAURI_LOG_DEBUG("Encoded {} bytes into data URI body of {} chars",
                    content.size(), body.size());
  return body;
}

std::string encode(const std::optional<MediaType>& mediaType, std::istream& in,
                   bool useBase64, std::size_t bufferSize) {
  if (!useBase64) {
    std::vector<uint8_t> content;
    readStream(in, bufferSize, [&](std::span<const uint8_t> chunk) {
      content.insert(content.end(), chunk.begin(), chunk.end());
    });
    return encode(mediaType, content, false);
  }

  std::string body;
  if (mediaType) {
    body.append(mediaType->toString());
  }
  body.append(kBase64Marker);
  body.push_back(',');

  Base64Appender appender(body);
  Base64Encoder encoder(appender);
  std::size_t total = 0;
  readStream(in, bufferSize, [&](std::span<const uint8_t> chunk) {
    encoder.update(chunk);
    total += chunk.size();
  });
  encoder.finish();

  DATAURI_LOG_DEBUG("Streamed {} bytes into base64 data URI body", total);
  return body;
}

std::string encodeText(const std::optional<MediaType>& mediaType,
                       std::string_view text) {
  Charset charset = resolveCharset(mediaType ? &*mediaType : nullptr);

  std::string body;
  if (mediaType) {
    body.append(mediaType->toString());
  }
  body.push_back(',');
  body.append(url_codec::formEncode(utf8ToCodePoints(text), charset));
  return body;
}

std::string encodeUri(const std::optional<MediaType>& mediaType,
                      std::span<const uint8_t> content, bool useBase64) {
  return with_scheme(encode(mediaType, content, useBase64));
}

std::string encodeUri(const std::optional<MediaType>& mediaType,
                      std::istream& in, bool useBase64,
                      std::size_t bufferSize) {
  return with_scheme(encode(mediaType, in, useBase64, bufferSize));
}

}  // namespace datauri
