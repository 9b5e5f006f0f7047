#include "datauri/builder.hpp"

#include "datauri/charset.hpp"
#include "datauri/data_uri.hpp"
#include "datauri/logging.hpp"
#include "datauri/stream_reader.hpp"

namespace datauri {

WithMediaType::WithMediaType(DataUriBuilder parent,
                             const MediaType& mediaType)
    : parent_(std::move(parent)),
      mimeType_(mediaType.mimeType()),
      parameters_(mediaType.parameters()) {}

WithMediaType& WithMediaType::withMediaTypeParameter(
    const std::string& name, std::optional<std::string> value) {
  if (value.has_value()) {
    parameters_.put(name, std::move(*value));
  } else {
    parameters_.remove(name);
  }
  return *this;
}

WithMediaType& WithMediaType::withCharset(const std::string& charset) {
  // Store the registry's name so aliases are written in canonical form
  return withMediaTypeParameter("charset",
                                std::string(Charset::forName(charset).name()));
}

std::string WithMediaType::build() const {
  return parent_.build(MediaType::create(mimeType_, parameters_));
}

DataUriBuilder::DataUriBuilder(Source source, const CodecConfig& config)
    : source_(source),
      bufferSize_(config.copyBufferSize),
      base64Data_(config.base64ByDefault) {}

DataUriBuilder DataUriBuilder::fromText(std::string text,
                                        const CodecConfig& config) {
  DataUriBuilder builder(Source::Text, config);
  builder.text_ = std::move(text);
  return builder;
}

DataUriBuilder DataUriBuilder::fromText(std::istream& text,
                                        const CodecConfig& config) {
  DataUriBuilder builder(Source::TextStream, config);
  builder.stream_ = &text;
  return builder;
}

DataUriBuilder DataUriBuilder::fromBytes(std::vector<uint8_t> data,
                                         const CodecConfig& config) {
  DataUriBuilder builder(Source::Bytes, config);
  builder.bytes_ = std::move(data);
  return builder;
}

DataUriBuilder DataUriBuilder::fromBytes(std::istream& data,
                                         const CodecConfig& config) {
  DataUriBuilder builder(Source::ByteStream, config);
  builder.stream_ = &data;
  return builder;
}

DataUriBuilder& DataUriBuilder::withBase64Data(bool base64Data) {
  base64Data_ = base64Data;
  return *this;
}

WithMediaType DataUriBuilder::withMediaType(const std::string& mediaType) const {
  return WithMediaType(*this, MediaType::parse(mediaType));
}

std::string DataUriBuilder::build() const { return build(std::nullopt); }

std::string DataUriBuilder::build(
    const std::optional<MediaType>& mediaType) const {
  std::string uri(kDataScheme);
  uri.push_back(':');

  switch (source_) {
    case Source::Text:
      uri.append(encodeText(mediaType, text_));
      break;
    case Source::TextStream: {
      std::string text;
      readStream(*stream_, bufferSize_, [&](std::span<const uint8_t> chunk) {
        text.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
      });
      uri.append(encodeText(mediaType, text));
      break;
    }
    case Source::Bytes:
      uri.append(encode(mediaType, bytes_, base64Data_));
      break;
    case Source::ByteStream:
      uri.append(encode(mediaType, *stream_, base64Data_, bufferSize_));
      break;
  }

  DATAURI_LOG_DEBUG("Built data URI of {} chars", uri.size());
  return uri;
}

}  // namespace datauri
