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

#include "pcdcodec/errors.hpp"

#include <sstream>

namespace PcdCodec {

const char* ToString(PayloadError::Kind kind) {
  switch (kind) {
    case PayloadError::Kind::TRUNCATED:
      return "truncated payload";
    case PayloadError::Kind::ROW_LENGTH_MISMATCH:
      return "row length mismatch";
    case PayloadError::Kind::PARSE_NUMBER:
      return "invalid number";
    case PayloadError::Kind::DECOMPRESS_SIZE_MISMATCH:
      return "decompressed size mismatch";
    case PayloadError::Kind::COMPRESS_TOO_LARGE:
      return "input too large to compress";
  }
  return "unknown";
}

std::string PayloadError::formatMessage(Kind kind, const std::string& message, const Context& context) {
  std::ostringstream ss;
  ss << "PCD payload error (" << ToString(kind) << ")";
  if (context.row) {
    ss << " at row " << *context.row;
  }
  if (!context.field.empty()) {
    ss << ", field '" << context.field << "'";
  }
  if (!message.empty()) {
    ss << ": " << message;
  }
  if (context.expected && context.actual) {
    ss << " (expected " << *context.expected << ", got " << *context.actual << ")";
  }
  return ss.str();
}

PayloadError PayloadError::Truncated(
    const std::string& message, std::optional<size_t> row, size_t expected, size_t actual) {
  Context ctx;
  ctx.row = row;
  ctx.expected = expected;
  ctx.actual = actual;
  return PayloadError(Kind::TRUNCATED, message, std::move(ctx));
}

PayloadError PayloadError::RowLengthMismatch(size_t row, size_t expected_tokens, size_t actual_tokens) {
  Context ctx;
  ctx.row = row;
  ctx.expected = expected_tokens;
  ctx.actual = actual_tokens;
  return PayloadError(Kind::ROW_LENGTH_MISMATCH, "wrong number of tokens", std::move(ctx));
}

PayloadError PayloadError::ParseNumber(size_t row, const std::string& field, const std::string& token) {
  Context ctx;
  ctx.row = row;
  ctx.field = field;
  return PayloadError(Kind::PARSE_NUMBER, "cannot parse token '" + token + "'", std::move(ctx));
}

PayloadError PayloadError::DecompressSizeMismatch(size_t expected, size_t actual) {
  Context ctx;
  ctx.expected = expected;
  ctx.actual = actual;
  return PayloadError(Kind::DECOMPRESS_SIZE_MISMATCH, "LZF block", std::move(ctx));
}

PayloadError PayloadError::CompressTooLarge(size_t input_size) {
  Context ctx;
  ctx.actual = input_size;
  return PayloadError(
      Kind::COMPRESS_TOO_LARGE, "LZF cannot compress " + std::to_string(input_size) + " bytes", std::move(ctx));
}

}  // namespace PcdCodec
