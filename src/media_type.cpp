#include "datauri/media_type.hpp"

#include <algorithm>
#include <stdexcept>

#include "datauri/logging.hpp"
#include "datauri/string_utils.hpp"

namespace datauri {

namespace {

constexpr std::string_view kDefaultMimeType = "text/plain";
constexpr std::string_view kDefaultCharset = "US-ASCII";

constexpr bool is_token_char(char c) noexcept {
  if (c < '\x21' || c > '\x7e') {
    return false;
  }
  switch (c) {
    case '(':
    case ')':
    case '<':
    case '>':
    case '@':
    case ',':
    case ';':
    case ':':
    case '\\':
    case '"':
    case '/':
    case '[':
    case ']':
    case '?':
    case '=':
      return false;
    default:
      return true;
  }
}

void validate_mime_type(std::string_view mimeType) {
  if (!MediaType::isValidMimeType(mimeType)) {
    DATAURI_LOG_ERROR("Rejecting MIME type '{}'", mimeType);
    throw InvalidMimeTypeError(mimeType);
  }
}

/**
 * @brief Scanner states for a parameter value
 */
enum class ValueState {
  Plain,   ///< Outside quotes; an unquoted ';' ends the value
  Quoted,  ///< Inside double quotes; ';' is literal
  Escaped  ///< After a backslash; returns to the state it came from
};

/**
 * @brief Parse one parameter starting at start
 * @return Index just past the parameter (after its ';' if any)
 */
std::size_t parse_next_parameter(std::string_view params, std::size_t start,
                                 MediaTypeParameters& parameters) {
  std::size_t end = params.find_first_of("=;", start);
  if (end == std::string_view::npos) {
    end = params.size();
  }
  std::string name(string_utils::trim(params.substr(start, end - start)));
  if (end < params.size() && params[end] == '=') {
    ++end;
  }

  std::string value;
  value.reserve(params.size() - end);
  ValueState state = ValueState::Plain;
  ValueState resume = ValueState::Plain;

  std::size_t i = end;
  while (i < params.size()) {
    char c = params[i];
    if (state == ValueState::Escaped) {
      state = resume;
      if (c == '"' || c == '\\') {
        value.push_back(c);
        ++i;
        continue;
      }
      // Lone backslash: keep it and handle c in the restored state
      value.push_back('\\');
    }

    switch (c) {
      case '"':
        state = state == ValueState::Quoted ? ValueState::Plain
                                            : ValueState::Quoted;
        break;
      case '\\':
        resume = state;
        state = ValueState::Escaped;
        break;
      case ';':
        if (state == ValueState::Plain) {
          parameters.put(std::move(name),
                         std::string(string_utils::trim(value)));
          return i + 1;
        }
        value.push_back(c);
        break;
      default:
        value.push_back(c);
        break;
    }
    ++i;
  }
  if (state == ValueState::Escaped) {
    value.push_back('\\');
  }
  parameters.put(std::move(name), std::string(string_utils::trim(value)));
  return params.size();
}

MediaTypeParameters parse_parameters(std::string_view params) {
  MediaTypeParameters parameters;
  std::size_t start = 0;
  while (start < params.size()) {
    start = parse_next_parameter(params, start, parameters);
  }
  return parameters;
}

void append_value(std::string_view value, std::string& out) {
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
}

}  // namespace

MediaTypeParameters::MediaTypeParameters(
    std::initializer_list<value_type> init) {
  for (const auto& [name, value] : init) {
    put(name, value);
  }
}

void MediaTypeParameters::put(std::string name, std::string value) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const value_type& e) { return e.first == name; });
  if (it != entries_.end()) {
    it->second = std::move(value);
  } else {
    entries_.emplace_back(std::move(name), std::move(value));
  }
}

bool MediaTypeParameters::remove(std::string_view name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const value_type& e) { return e.first == name; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::optional<std::string> MediaTypeParameters::get(
    std::string_view name) const {
  for (const auto& [key, value] : entries_) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<std::string> MediaTypeParameters::getIgnoreCase(
    std::string_view name) const {
  std::optional<std::string> result;
  for (const auto& [key, value] : entries_) {
    if (string_utils::iequals(key, name)) {
      result = value;
    }
  }
  return result;
}

bool MediaTypeParameters::contains(std::string_view name) const {
  return get(name).has_value();
}

MediaType::MediaType(std::string mimeType, MediaTypeParameters parameters)
    : mimeType_(std::move(mimeType)),
      parameters_(std::move(parameters)),
      canonicalForm_(format(mimeType_, parameters_)) {}

const MediaType& MediaType::defaultType() {
  static const MediaType instance(
      std::string(kDefaultMimeType),
      MediaTypeParameters{{"charset", std::string(kDefaultCharset)}});
  return instance;
}

MediaType MediaType::create(std::string mimeType,
                            MediaTypeParameters parameters) {
  validate_mime_type(mimeType);
  return MediaType(std::move(mimeType), std::move(parameters));
}

MediaType MediaType::parse(std::string_view text) {
  return parse(text, 0, text.size());
}

MediaType MediaType::parse(std::string_view text, std::size_t start,
                           std::size_t end) {
  if (start > end || end > text.size()) {
    throw std::out_of_range("MediaType::parse: invalid region");
  }
  std::string_view region = text.substr(start, end - start);

  std::size_t semicolon = region.find(';');
  if (semicolon == std::string_view::npos) {
    validate_mime_type(region);
    return MediaType(std::string(region), {});
  }

  std::string_view mimeType = string_utils::trim(region.substr(0, semicolon));
  std::string_view params = string_utils::trim(region.substr(semicolon + 1));

  validate_mime_type(mimeType);
  MediaTypeParameters parameters = parse_parameters(params);
  DATAURI_LOG_TRACE("Parsed media type '{}' with {} parameter(s)", mimeType,
                    parameters.size());
  return MediaType(std::string(mimeType), std::move(parameters));
}

bool MediaType::isValidMimeType(std::string_view mimeType) noexcept {
  std::size_t slash = mimeType.find('/');
  if (slash == std::string_view::npos || slash == 0 ||
      slash + 1 == mimeType.size()) {
    return false;
  }
  std::string_view type = mimeType.substr(0, slash);
  std::string_view subtype = mimeType.substr(slash + 1);
  return std::all_of(type.begin(), type.end(), is_token_char) &&
         std::all_of(subtype.begin(), subtype.end(), is_token_char);
}

std::optional<std::string> MediaType::getCharset() const {
  return parameters_.getIgnoreCase("charset");
}

std::string MediaType::format(const std::string& mimeType,
                              const MediaTypeParameters& parameters) {
  std::string result = mimeType;
  for (const auto& [name, value] : parameters) {
    result.push_back(';');
    result.append(name);
    result.push_back('=');

    bool quote = value.find(';') != std::string::npos;
    if (quote) {
      result.push_back('"');
    }
    append_value(value, result);
    if (quote) {
      result.push_back('"');
    }
  }
  return result;
}

}  // namespace datauri
