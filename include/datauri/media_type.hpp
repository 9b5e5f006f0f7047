/**
 * @file media_type.hpp
 * @brief MIME media type with ordered parameters (RFC 2397 mediatype part)
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"

namespace datauri {

/**
 * @brief Insertion-ordered parameter map with case-insensitive lookup
 *
 * Names are stored verbatim. put() on an existing name (exact match) replaces
 * the value in place and keeps its original position.
 */
class MediaTypeParameters {
 public:
  using value_type = std::pair<std::string, std::string>;
  using const_iterator = std::vector<value_type>::const_iterator;

  MediaTypeParameters() = default;
  MediaTypeParameters(std::initializer_list<value_type> init);

  /**
   * @brief Insert a parameter or replace the value of an existing one
   * @param name Parameter name (compared exactly)
   * @param value Parameter value, may be empty
   */
  void put(std::string name, std::string value);

  /**
   * @brief Remove a parameter by exact name
   * @return True if a parameter was removed
   */
  bool remove(std::string_view name);

  /**
   * @brief Exact-name lookup
   */
  [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

  /**
   * @brief Case-insensitive lookup
   *
   * When several names differ only in case, the value of the last one in
   * insertion order wins.
   */
  [[nodiscard]] std::optional<std::string> getIgnoreCase(
      std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool operator==(const MediaTypeParameters& other) const {
    return entries_ == other.entries_;
  }

 private:
  std::vector<value_type> entries_;
};

/**
 * @brief Immutable MIME media type: type/subtype plus ordered parameters
 *
 * The canonical string form is computed once at construction and returned by
 * toString(). Quoting used in a parsed input is not retained.
 */
class MediaType {
 public:
  /**
   * @brief The media type assumed when a data URI omits one
   * @return text/plain;charset=US-ASCII
   */
  static const MediaType& defaultType();

  /**
   * @brief Create a media type from a MIME type and parameters
   * @param mimeType MIME type, validated against the token grammar
   * @param parameters Parameters, not validated
   * @throws InvalidMimeTypeError if mimeType is not TOKEN+/TOKEN+
   */
  static MediaType create(std::string mimeType,
                          MediaTypeParameters parameters = {});

  /**
   * @brief Parse a media type string
   * @throws InvalidMimeTypeError if the MIME type part is invalid
   */
  static MediaType parse(std::string_view text);

  /**
   * @brief Parse the region [start, end) of a string
   * @throws InvalidMimeTypeError if the MIME type part is invalid
   * @throws std::out_of_range if the region is outside text
   */
  static MediaType parse(std::string_view text, std::size_t start,
                         std::size_t end);

  /**
   * @brief Check a MIME type against the TOKEN+/TOKEN+ grammar
   */
  static bool isValidMimeType(std::string_view mimeType) noexcept;

  const std::string& mimeType() const noexcept { return mimeType_; }
  const MediaTypeParameters& parameters() const noexcept {
    return parameters_;
  }

  /**
   * @brief Value of the charset parameter (case-insensitive), if any
   */
  [[nodiscard]] std::optional<std::string> getCharset() const;

  /**
   * @brief Canonical serialization, cached at construction
   */
  const std::string& toString() const noexcept { return canonicalForm_; }

  bool operator==(const MediaType& other) const {
    return mimeType_ == other.mimeType_ && parameters_ == other.parameters_;
  }

 private:
  MediaType(std::string mimeType, MediaTypeParameters parameters);

  static std::string format(const std::string& mimeType,
                            const MediaTypeParameters& parameters);

  std::string mimeType_;
  MediaTypeParameters parameters_;
  std::string canonicalForm_;
};

}  // namespace datauri
