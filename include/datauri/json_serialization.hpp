/**
 * @file json_serialization.hpp
 * @brief JSON serialization utilities for media types, decoded bodies and
 * configuration
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "config.hpp"
#include "data_uri.hpp"
#include "media_type.hpp"

namespace datauri {

/**
 * @brief JSON serialization utilities
 */
namespace json_serialization {

/**
 * @brief Convert MediaType to JSON
 *
 * Parameters are written as an array of [name, value] pairs so that their
 * order survives.
 */
void to_json(nlohmann::json& j, const MediaType& mediaType);

/**
 * @brief Parse MediaType from JSON produced by to_json()
 * @throws InvalidMimeTypeError if the MIME type is invalid
 * @throws nlohmann::json::exception if required fields are missing
 */
MediaType media_type_from_json(const nlohmann::json& j);

/**
 * @brief Convert DataUriBody to JSON (content as standard base64)
 */
void to_json(nlohmann::json& j, const DataUriBody& body);

void to_json(nlohmann::json& j, const CodecConfig& config);

/**
 * @brief Read CodecConfig fields present in j, keeping defaults otherwise
 */
void from_json(const nlohmann::json& j, CodecConfig& config);

/**
 * @brief Get pretty printed JSON string for a decoded body
 * @param body The body to serialize
 * @param indent Number of spaces to indent (default: 2)
 */
std::string to_pretty_json(const DataUriBody& body, int indent = 2);

/**
 * @brief Get compact JSON string for a decoded body
 */
std::string to_compact_json(const DataUriBody& body);

}  // namespace json_serialization

}  // namespace datauri
