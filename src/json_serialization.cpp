/**
 * @file json_serialization.cpp
 * @brief JSON serialization implementation
 */

#include "datauri/json_serialization.hpp"

#include <cstdint>

#include "datauri/base64.hpp"
#include "datauri/error.hpp"
#include "datauri/logging.hpp"

namespace datauri {
namespace json_serialization {

void to_json(nlohmann::json& j, const MediaType& mediaType) {
    j = nlohmann::json::object();
    j["mimeType"] = mediaType.mimeType();

    nlohmann::json params = nlohmann::json::array();
    for (const auto& [name, value] : mediaType.parameters()) {
        params.push_back(nlohmann::json::array({name, value}));
    }
    j["parameters"] = params;

    auto charset = mediaType.getCharset();
    if (charset.has_value()) {
        j["charset"] = charset.value();
    } else {
        j["charset"] = nullptr;
    }
    j["canonical"] = mediaType.toString();
}

MediaType media_type_from_json(const nlohmann::json& j) {
    MediaTypeParameters parameters;
    if (j.contains("parameters")) {
        for (const auto& pair : j.at("parameters")) {
            parameters.put(pair.at(0).get<std::string>(),
                           pair.at(1).get<std::string>());
        }
    }
    return MediaType::create(j.at("mimeType").get<std::string>(),
                             std::move(parameters));
}

void to_json(nlohmann::json& j, const DataUriBody& body) {
    j = nlohmann::json::object();
    to_json(j["mediaType"], body.mediaType());
    j["contentType"] = body.contentType();
    j["contentLength"] = body.contentLength();
    j["content"] = base64Encode(body.content());
}

void to_json(nlohmann::json& j, const CodecConfig& config) {
    j = nlohmann::json::object();
    j["copyBufferSize"] = config.copyBufferSize;
    j["base64ByDefault"] = config.base64ByDefault;
    j["logLevel"] = config.logLevel;
}

void from_json(const nlohmann::json& j, CodecConfig& config) {
    // json::value() throws type_error for anything but an object
    if (j.contains("copyBufferSize")) {
        const auto& size = j.at("copyBufferSize");
        // Negative numbers parse as signed and are rejected here
        if (!size.is_number_unsigned() || size.get<std::uint64_t>() == 0 ||
            size.get<std::uint64_t>() > kMaxCopyBufferSize) {
            DATAURI_LOG_ERROR("Rejecting copyBufferSize {}", size.dump());
            throw IoError("invalid configuration: copyBufferSize must be between 1 and " +
                          std::to_string(kMaxCopyBufferSize));
        }
        config.copyBufferSize = static_cast<std::size_t>(size.get<std::uint64_t>());
    }
    config.base64ByDefault = j.value("base64ByDefault", config.base64ByDefault);
    config.logLevel = j.value("logLevel", config.logLevel);
}

std::string to_pretty_json(const DataUriBody& body, int indent) {
    nlohmann::json j;
    to_json(j, body);
    return j.dump(indent);
}

std::string to_compact_json(const DataUriBody& body) {
    nlohmann::json j;
    to_json(j, body);
    return j.dump();
}

} // namespace json_serialization
} // namespace datauri
