#pragma once

/// @file json_array.h
/// @brief Decoding of the textual array field into candidate table entries,
///        the numeric domain gate, and compact re-encoding.

#include "ringrot/defines.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringrot {

enum class JsonKind {
  kNumber,
  kBool,
  kNull,
  kString,
  kArray,
  kObject,
};

/// @brief One top-level element of a decoded array.
/// `number` is meaningful only for kNumber.
struct JsonElement {
  JsonKind kind = JsonKind::kNull;
  double number = 0.0;
};

/// @brief Recursive-descent reader for a single JSON array.
///
/// Accepts RFC 8259 JSON plus the `NaN`, `Infinity` and `-Infinity`
/// literals, which decode as non-finite numbers so the domain gate can
/// reject them. Nested arrays and objects are validated and reported by
/// kind only.
class JsonArrayDecoder {
 public:
  JsonArrayDecoder() = default;

  /// @brief Decode @p text, which must hold exactly one JSON array.
  /// @param elements Output, cleared first.
  /// @return True on success, false on failure (check Error()).
  bool Decode(std::string_view text, std::vector<JsonElement>* elements);

  /// @brief Get last error message.
  const std::string& Error() const { return error_; }

 private:
  static constexpr int kMaxDepth = 512;

  bool ParseValue(JsonElement* out, int depth);
  bool ParseArray(std::vector<JsonElement>* elements, int depth);
  bool ParseObject(int depth);
  bool ParseString();
  bool ParseNumber(double* value);
  bool ParseLiteral(std::string_view word);

  void SkipWhitespace();
  bool AtEnd() const { return pos_ >= text_.size(); }
  char Peek() const { return text_[pos_]; }
  bool Fail(const char* what);

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

/// @brief Domain gate: a finite number that is not a boolean.
bool IsValidEntry(const JsonElement& element);

/// @brief Apply IsValidEntry to every element.
/// @return The table when all elements pass, no value otherwise.
std::optional<Table> ToTable(const std::vector<JsonElement>& elements);

/// @brief Compact JSON encoding (no spaces), shortest round-trip numbers.
std::string EncodeJsonArray(const Table& table);

}  // namespace ringrot
