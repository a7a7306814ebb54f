/*
 * Copyright 2025 Davide Faconti
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace PcdCodec {

/// Base class of every exception thrown by the library
class PcdError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// open / map / read / write failures of the file system
class IoError : public PcdError {
 public:
  IoError(const std::string& path, const std::string& message)
      : PcdError("I/O error on '" + path + "': " + message), path_(path) {}

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

/// Malformed or incomplete textual header
class HeaderError : public PcdError {
 public:
  HeaderError(const std::string& key, const std::string& message)
      : PcdError(key.empty() ? "Invalid PCD header: " + message : "Invalid PCD header [" + key + "]: " + message),
        key_(key) {}

  // offending key, empty when unknown
  const std::string& key() const {
    return key_;
  }

 private:
  std::string key_;
};

/// Invalid field schema (unknown type, size 0, duplicated names...)
class SchemaError : public PcdError {
 public:
  explicit SchemaError(const std::string& message) : PcdError("Invalid field schema: " + message) {}
};

/// Writer-side input inconsistency. Raised before any byte is written.
class ValidationError : public PcdError {
 public:
  explicit ValidationError(const std::string& message) : PcdError("Validation failed: " + message) {}
};

/// Errors found while decoding or encoding the payload
class PayloadError : public PcdError {
 public:
  enum class Kind {
    TRUNCATED,
    ROW_LENGTH_MISMATCH,
    PARSE_NUMBER,
    DECOMPRESS_SIZE_MISMATCH,
    COMPRESS_TOO_LARGE,
  };

  struct Context {
    std::optional<size_t> row;
    std::string field;
    std::optional<size_t> expected;
    std::optional<size_t> actual;
  };

  PayloadError(Kind kind, const std::string& message, Context context = {})
      : PcdError(formatMessage(kind, message, context)), kind_(kind), context_(std::move(context)) {}

  static PayloadError Truncated(const std::string& message, std::optional<size_t> row, size_t expected, size_t actual);

  static PayloadError RowLengthMismatch(size_t row, size_t expected_tokens, size_t actual_tokens);

  static PayloadError ParseNumber(size_t row, const std::string& field, const std::string& token);

  static PayloadError DecompressSizeMismatch(size_t expected, size_t actual);

  static PayloadError CompressTooLarge(size_t input_size);

  Kind kind() const {
    return kind_;
  }

  std::optional<size_t> row() const {
    return context_.row;
  }

  const std::string& field() const {
    return context_.field;
  }

  std::optional<size_t> expected() const {
    return context_.expected;
  }

  std::optional<size_t> actual() const {
    return context_.actual;
  }

 private:
  static std::string formatMessage(Kind kind, const std::string& message, const Context& context);

  Kind kind_;
  Context context_;
};

const char* ToString(PayloadError::Kind kind);

}  // namespace PcdCodec
