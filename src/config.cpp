#include "datauri/config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "datauri/json_serialization.hpp"
#include "datauri/logging.hpp"

namespace datauri {

CodecConfig CodecConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throwIoError("open " + path);
  }
  std::ostringstream text;
  text << in.rdbuf();
  if (in.bad()) {
    throw IoError("failed to read " + path);
  }
  DATAURI_LOG_DEBUG("Loading configuration from {}", path);
  return fromJsonString(text.str());
}

CodecConfig CodecConfig::fromJsonString(const std::string& text) {
  CodecConfig config;
  try {
    json_serialization::from_json(nlohmann::json::parse(text), config);
  } catch (const nlohmann::json::exception& e) {
    throw IoError(std::string("invalid configuration: ") + e.what());
  }
  return config;
}

void CodecConfig::apply() const {
  logging::Logger::getInstance().setLogLevel(logLevel);
}

}  // namespace datauri
