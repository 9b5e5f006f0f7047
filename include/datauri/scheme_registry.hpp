/**
 * @file scheme_registry.hpp
 * @brief Registry mapping URI schemes to decode/encode handlers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "data_uri.hpp"

namespace datauri {

/**
 * @brief Decode and encode functions for one URI scheme
 */
struct SchemeHandler {
  /// Decode the body region [start, end) of a URI
  std::function<DataUriBody(std::string_view uri, std::size_t start,
                            std::size_t end)>
      decode;
  /// Encode content into a body (without "scheme:")
  std::function<std::string(const std::optional<MediaType>& mediaType,
                            std::span<const uint8_t> content, bool useBase64)>
      encode;
};

/**
 * @brief Handler for the "data" scheme backed by decode() and encode()
 */
SchemeHandler dataSchemeHandler();

/**
 * @brief Application-owned map from scheme name to handler
 *
 * Scheme names are compared case-insensitively.
 */
class SchemeRegistry {
 public:
  /**
   * @brief Create a registry, optionally pre-populated with "data"
   */
  explicit SchemeRegistry(bool withDataScheme = true);

  /**
   * @brief Register or replace the handler for scheme
   * @throws std::invalid_argument if scheme is empty or a function is missing
   */
  void registerHandler(std::string_view scheme, SchemeHandler handler);

  /**
   * @return True if a handler was removed
   */
  bool unregisterHandler(std::string_view scheme);

  bool contains(std::string_view scheme) const;

  const SchemeHandler* find(std::string_view scheme) const;

  /**
   * @brief Decode a full URI through the handler for its scheme
   * @throws InvalidProtocolError if the URI has no scheme or none is
   * registered for it
   */
  DataUriBody open(std::string_view uri) const;

  /**
   * @brief Encode content into a full "scheme:..." URI
   * @throws InvalidProtocolError if no handler is registered for scheme
   */
  std::string encode(std::string_view scheme,
                     const std::optional<MediaType>& mediaType,
                     std::span<const uint8_t> content, bool useBase64) const;

  std::size_t size() const noexcept { return handlers_.size(); }

 private:
  std::unordered_map<std::string, SchemeHandler> handlers_;  ///< Lower-case keys
};

}  // namespace datauri
