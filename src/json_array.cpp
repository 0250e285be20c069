/// @file json_array.cpp
/// @brief Implementation of JsonArrayDecoder and the JSON array encoder.

#include "ringrot/json_array.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <system_error>

#include <fmt/format.h>

namespace ringrot {

namespace {

constexpr double kPlainIntegerLimit = 1e21;
constexpr int64_t kExponentCap = 1000000;

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsHexDigit(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// @brief Value of a grammar-checked number token that does not fit a double.
///
/// The decimal order of the leading significant digit tells overflow
/// (+/-infinity, rejected later by the domain gate) from underflow (signed
/// zero).
double OutOfRangeValue(std::string_view token) {
  const bool negative = !token.empty() && token.front() == '-';
  size_t i = negative ? 1 : 0;

  int64_t int_digits = 0;
  int64_t first_nonzero = -1;
  int64_t digit_index = 0;
  for (; i < token.size() && IsDigit(token[i]); ++i, ++digit_index, ++int_digits) {
    if (first_nonzero < 0 && token[i] != '0') first_nonzero = digit_index;
  }
  if (i < token.size() && token[i] == '.') {
    for (++i; i < token.size() && IsDigit(token[i]); ++i, ++digit_index) {
      if (first_nonzero < 0 && token[i] != '0') first_nonzero = digit_index;
    }
  }

  int64_t exponent = 0;
  if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) {
      exp_negative = token[i] == '-';
      ++i;
    }
    for (; i < token.size() && IsDigit(token[i]); ++i) {
      if (exponent < kExponentCap) exponent = exponent * 10 + (token[i] - '0');
    }
    if (exp_negative) exponent = -exponent;
  }

  const bool overflow =
      first_nonzero >= 0 && int_digits - first_nonzero + exponent > 0;
  const double magnitude = overflow ? std::numeric_limits<double>::infinity() : 0.0;
  return negative ? -magnitude : magnitude;
}

}  // anonymous namespace

bool JsonArrayDecoder::Decode(std::string_view text,
                              std::vector<JsonElement>* elements) {
  CHECK(elements != nullptr);
  elements->clear();
  text_ = text;
  pos_ = 0;
  error_.clear();

  SkipWhitespace();
  if (AtEnd() || Peek() != '[') {
    return Fail("expected '['");
  }
  if (!ParseArray(elements, 1)) {
    elements->clear();
    return false;
  }
  SkipWhitespace();
  if (!AtEnd()) {
    elements->clear();
    return Fail("trailing characters after array");
  }
  return true;
}

bool JsonArrayDecoder::Fail(const char* what) {
  error_ = fmt::format("{} at offset {}", what, pos_);
  return false;
}

void JsonArrayDecoder::SkipWhitespace() {
  while (!AtEnd()) {
    const char c = Peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    ++pos_;
  }
}

bool JsonArrayDecoder::ParseArray(std::vector<JsonElement>* elements,
                                  int depth) {
  if (depth > kMaxDepth) {
    return Fail("nesting too deep");
  }
  ++pos_;  // '['
  SkipWhitespace();
  if (!AtEnd() && Peek() == ']') {
    ++pos_;
    return true;
  }

  while (true) {
    JsonElement element;
    if (!ParseValue(&element, depth)) {
      return false;
    }
    if (elements != nullptr) {
      elements->push_back(element);
    }
    SkipWhitespace();
    if (AtEnd()) {
      return Fail("unterminated array");
    }
    if (Peek() == ',') {
      ++pos_;
      continue;
    }
    if (Peek() == ']') {
      ++pos_;
      return true;
    }
    return Fail("expected ',' or ']'");
  }
}

bool JsonArrayDecoder::ParseObject(int depth) {
  if (depth > kMaxDepth) {
    return Fail("nesting too deep");
  }
  ++pos_;  // '{'
  SkipWhitespace();
  if (!AtEnd() && Peek() == '}') {
    ++pos_;
    return true;
  }

  while (true) {
    SkipWhitespace();
    if (AtEnd() || Peek() != '"') {
      return Fail("expected object key");
    }
    if (!ParseString()) {
      return false;
    }
    SkipWhitespace();
    if (AtEnd() || Peek() != ':') {
      return Fail("expected ':'");
    }
    ++pos_;
    JsonElement ignored;
    if (!ParseValue(&ignored, depth)) {
      return false;
    }
    SkipWhitespace();
    if (AtEnd()) {
      return Fail("unterminated object");
    }
    if (Peek() == ',') {
      ++pos_;
      continue;
    }
    if (Peek() == '}') {
      ++pos_;
      return true;
    }
    return Fail("expected ',' or '}'");
  }
}

bool JsonArrayDecoder::ParseValue(JsonElement* out, int depth) {
  SkipWhitespace();
  if (AtEnd()) {
    return Fail("unexpected end of input");
  }

  switch (Peek()) {
    case '[':
      out->kind = JsonKind::kArray;
      return ParseArray(nullptr, depth + 1);
    case '{':
      out->kind = JsonKind::kObject;
      return ParseObject(depth + 1);
    case '"':
      out->kind = JsonKind::kString;
      return ParseString();
    case 't':
      out->kind = JsonKind::kBool;
      return ParseLiteral("true");
    case 'f':
      out->kind = JsonKind::kBool;
      return ParseLiteral("false");
    case 'n':
      out->kind = JsonKind::kNull;
      return ParseLiteral("null");
    case 'N':
      out->kind = JsonKind::kNumber;
      out->number = std::numeric_limits<double>::quiet_NaN();
      return ParseLiteral("NaN");
    case 'I':
      out->kind = JsonKind::kNumber;
      out->number = std::numeric_limits<double>::infinity();
      return ParseLiteral("Infinity");
    default:
      break;
  }

  if (Peek() == '-' && text_.substr(pos_, 9) == "-Infinity") {
    out->kind = JsonKind::kNumber;
    out->number = -std::numeric_limits<double>::infinity();
    return ParseLiteral("-Infinity");
  }
  out->kind = JsonKind::kNumber;
  return ParseNumber(&out->number);
}

bool JsonArrayDecoder::ParseLiteral(std::string_view word) {
  if (text_.substr(pos_, word.size()) != word) {
    return Fail("invalid literal");
  }
  pos_ += word.size();
  return true;
}

bool JsonArrayDecoder::ParseString() {
  ++pos_;  // opening quote
  while (!AtEnd()) {
    const char c = Peek();
    if (c == '"') {
      ++pos_;
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return Fail("control character in string");
    }
    if (c != '\\') {
      ++pos_;
      continue;
    }

    ++pos_;
    if (AtEnd()) {
      break;
    }
    switch (Peek()) {
      case '"':
      case '\\':
      case '/':
      case 'b':
      case 'f':
      case 'n':
      case 'r':
      case 't':
        ++pos_;
        break;
      case 'u':
        ++pos_;
        for (int i = 0; i < 4; ++i) {
          if (AtEnd() || !IsHexDigit(Peek())) {
            return Fail("invalid unicode escape");
          }
          ++pos_;
        }
        break;
      default:
        return Fail("invalid escape");
    }
  }
  return Fail("unterminated string");
}

bool JsonArrayDecoder::ParseNumber(double* value) {
  const size_t start = pos_;

  if (!AtEnd() && Peek() == '-') {
    ++pos_;
  }
  if (AtEnd() || !IsDigit(Peek())) {
    return Fail("invalid number");
  }
  if (Peek() == '0') {
    ++pos_;
  } else {
    while (!AtEnd() && IsDigit(Peek())) ++pos_;
  }
  if (!AtEnd() && Peek() == '.') {
    ++pos_;
    if (AtEnd() || !IsDigit(Peek())) {
      return Fail("invalid fraction");
    }
    while (!AtEnd() && IsDigit(Peek())) ++pos_;
  }
  if (!AtEnd() && (Peek() == 'e' || Peek() == 'E')) {
    ++pos_;
    if (!AtEnd() && (Peek() == '+' || Peek() == '-')) {
      ++pos_;
    }
    if (AtEnd() || !IsDigit(Peek())) {
      return Fail("invalid exponent");
    }
    while (!AtEnd() && IsDigit(Peek())) ++pos_;
  }

  // The token is grammar-checked above; from_chars only converts it and does
  // not depend on the C locale.
  const std::string_view token = text_.substr(start, pos_ - start);
  const std::from_chars_result parsed =
      std::from_chars(token.data(), token.data() + token.size(), *value);
  if (parsed.ec == std::errc::result_out_of_range) {
    *value = OutOfRangeValue(token);
  } else if (parsed.ec != std::errc() || parsed.ptr != token.data() + token.size()) {
    return Fail("invalid number");
  }
  return true;
}

bool IsValidEntry(const JsonElement& element) {
  return element.kind == JsonKind::kNumber && std::isfinite(element.number);
}

std::optional<Table> ToTable(const std::vector<JsonElement>& elements) {
  Table table;
  table.reserve(elements.size());
  for (const JsonElement& element : elements) {
    if (!IsValidEntry(element)) {
      return std::nullopt;
    }
    table.push_back(element.number);
  }
  return table;
}

std::string EncodeJsonArray(const Table& table) {
  std::string out = "[";
  for (size_t i = 0; i < table.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    const double v = table[i];
    // Integral values below 1e21 print as plain digits; "{}" would switch
    // to exponent form from 1e16.
    if (std::trunc(v) == v && std::fabs(v) < kPlainIntegerLimit) {
      fmt::format_to(std::back_inserter(out), "{:.0f}", v);
    } else {
      fmt::format_to(std::back_inserter(out), "{}", v);
    }
  }
  out += ']';
  return out;
}

}  // namespace ringrot
