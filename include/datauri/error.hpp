/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for data URI processing
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace datauri {

/**
 * @brief Error codes for programmatic error handling
 */
enum class DataUriErrorCode : uint32_t {
  SUCCESS = 0,
  INVALID_PROTOCOL = 1000,
  INVALID_MIME_TYPE = 1001,
  MISSING_COMMA = 1002,
  INVALID_BASE64 = 1003,
  INVALID_PERCENT_ENCODING = 1004,
  UNSUPPORTED_CHARSET = 2000,
  IO_ERROR = 3000
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(DataUriErrorCode code) noexcept {
  switch (code) {
    case DataUriErrorCode::SUCCESS:
      return "Success";
    case DataUriErrorCode::INVALID_PROTOCOL:
      return "Invalid protocol";
    case DataUriErrorCode::INVALID_MIME_TYPE:
      return "Invalid MIME type";
    case DataUriErrorCode::MISSING_COMMA:
      return "Missing comma";
    case DataUriErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case DataUriErrorCode::INVALID_PERCENT_ENCODING:
      return "Invalid percent encoding";
    case DataUriErrorCode::UNSUPPORTED_CHARSET:
      return "Unsupported charset";
    case DataUriErrorCode::IO_ERROR:
      return "Input/output error";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all data URI errors
 */
class DataUriError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit DataUriError(DataUriErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] DataUriErrorCode errorCode() const noexcept {
    return error_code_;
  }

 private:
  DataUriErrorCode error_code_;
};

/**
 * @brief Thrown when a URI does not use the expected scheme
 */
class InvalidProtocolError : public DataUriError {
 public:
  explicit InvalidProtocolError(std::string_view actual)
      : DataUriError(DataUriErrorCode::INVALID_PROTOCOL,
                     std::string("No handler for protocol '") +
                         std::string(actual) + "'") {}

  InvalidProtocolError(std::string_view expected, std::string_view actual)
      : DataUriError(DataUriErrorCode::INVALID_PROTOCOL,
                     std::string("Invalid protocol: expected '") +
                         std::string(expected) + "', got '" +
                         std::string(actual) + "'") {}
};

/**
 * @brief Thrown when a MIME type does not match type/subtype token grammar
 */
class InvalidMimeTypeError : public DataUriError {
 public:
  explicit InvalidMimeTypeError(std::string_view mimeType)
      : DataUriError(DataUriErrorCode::INVALID_MIME_TYPE,
                     std::string("Invalid MIME type: '") +
                         std::string(mimeType) + "'") {}
};

class MissingCommaError : public DataUriError {
 public:
  explicit MissingCommaError(std::string_view uri)
      : DataUriError(DataUriErrorCode::MISSING_COMMA,
                     std::string("Missing comma in data URI: ") +
                         std::string(uri)) {}
};

class InvalidBase64Error : public DataUriError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : DataUriError(
            DataUriErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

class InvalidPercentEncodingError : public DataUriError {
 public:
  explicit InvalidPercentEncodingError(std::string_view details)
      : DataUriError(DataUriErrorCode::INVALID_PERCENT_ENCODING,
                     std::string("Invalid percent encoding: ") +
                         std::string(details)) {}
};

/**
 * @brief Thrown when a charset name is not known to the charset registry
 */
class UnsupportedCharsetError : public DataUriError {
 public:
  explicit UnsupportedCharsetError(std::string_view charset)
      : DataUriError(DataUriErrorCode::UNSUPPORTED_CHARSET,
                     std::string("Unsupported charset: '") +
                         std::string(charset) + "'") {}
};

/**
 * @brief Exception for I/O errors from caller supplied streams and files
 */
class IoError : public DataUriError {
 public:
  explicit IoError(std::string_view details)
      : DataUriError(DataUriErrorCode::IO_ERROR,
                     std::string("Input/output error: ") +
                         std::string(details)) {}
};

/**
 * @brief Result type for error handling without exceptions
 */
template <typename T, typename E = DataUriError>
class Result {
 public:
  // Constructors
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  // Static factory methods
  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  // Query methods
  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws if error)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T& value() & {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  // Safe value access
  const T& valueOr(const T& defaultValue) const& noexcept {
    return isSuccess() ? std::get<T>(data_) : defaultValue;
  }

  // Error access
  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

  template <typename F>
  auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
    if (isSuccess()) {
      return Result<decltype(func(std::declval<T>())), E>::success(
          func(std::get<T>(data_)));
    }
    return Result<decltype(func(std::declval<T>())), E>::error(
        std::get<E>(data_));
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using DataUriResult = Result<T, DataUriError>;

/**
 * @brief Throw an IoError describing a failed OS level operation
 */
[[noreturn]] inline void throwIoError(const std::string& operation,
                                      int error_code = errno) {
  throw IoError(operation + ": " + std::strerror(error_code));
}

}  // namespace datauri
