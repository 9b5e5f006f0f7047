#include "datauri/scheme_registry.hpp"

#include <stdexcept>

#include "datauri/logging.hpp"
#include "datauri/string_utils.hpp"

namespace datauri {

SchemeHandler dataSchemeHandler() {
  SchemeHandler handler;
  handler.decode = [](std::string_view uri, std::size_t start,
                      std::size_t end) { return decode(uri, start, end); };
  handler.encode = [](const std::optional<MediaType>& mediaType,
                      std::span<const uint8_t> content, bool useBase64) {
    return encode(mediaType, content, useBase64);
  };
  return handler;
}

SchemeRegistry::SchemeRegistry(bool withDataScheme) {
  if (withDataScheme) {
    registerHandler(kDataScheme, dataSchemeHandler());
  }
}

void SchemeRegistry::registerHandler(std::string_view scheme,
                                     SchemeHandler handler) {
  if (scheme.empty()) {
    throw std::invalid_argument("Scheme must not be empty");
  }
  if (!handler.decode || !handler.encode) {
    throw std::invalid_argument("Scheme handler must provide decode and encode");
  }
  handlers_[string_utils::to_lower(scheme)] = std::move(handler);
  DATAURI_LOG_DEBUG("Registered handler for scheme '{}'", scheme);
}

bool SchemeRegistry::unregisterHandler(std::string_view scheme) {
  return handlers_.erase(string_utils::to_lower(scheme)) > 0;
}

bool SchemeRegistry::contains(std::string_view scheme) const {
  return find(scheme) != nullptr;
}

const SchemeHandler* SchemeRegistry::find(std::string_view scheme) const {
  auto it = handlers_.find(string_utils::to_lower(scheme));
  return it == handlers_.end() ? nullptr : &it->second;
}

DataUriBody SchemeRegistry::open(std::string_view uri) const {
  auto scheme = schemeOf(uri);
  const SchemeHandler* handler = scheme ? find(*scheme) : nullptr;
  if (handler == nullptr) {
    std::string_view actual = scheme ? *scheme : std::string_view{};
    DATAURI_LOG_ERROR("No handler registered for scheme '{}'", actual);
    throw InvalidProtocolError(actual);
  }
  return handler->decode(uri, scheme->size() + 1, uri.size());
}

std::string SchemeRegistry::encode(std::string_view scheme,
                                   const std::optional<MediaType>& mediaType,
                                   std::span<const uint8_t> content,
                                   bool useBase64) const {
  const SchemeHandler* handler = find(scheme);
  if (handler == nullptr) {
    throw InvalidProtocolError(scheme);
  }
  std::string uri(scheme);
  uri.push_back(':');
  uri.append(handler->encode(mediaType, content, useBase64));
  return uri;
}

}  // namespace datauri
