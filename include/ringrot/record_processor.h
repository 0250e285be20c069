#pragma once

/// @file record_processor.h
/// @brief Per-record pipeline (decode, gate, rotate, encode) and the batch
///        driver over a CSV stream.

#include "ringrot/config.h"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace ringrot {

/// @brief Outcome of one record. Invalid records carry "[]".
struct RecordResult {
  std::string json = "[]";
  bool is_valid = false;
};

/// @brief Decode, validate and rotate one textual array.
///
/// Every failure (malformed JSON, a non-numeric, boolean or non-finite
/// entry, an empty or non-square array) maps to {"[]", false}.
RecordResult ProcessJsonArray(std::string_view json_text);

/// @brief Counters of one batch run.
struct ProcessStats {
  size_t records = 0;  ///< Data records read (header excluded).
  size_t valid = 0;    ///< Records written with is_valid=true.
  size_t invalid = 0;  ///< Records written with is_valid=false.
  size_t skipped = 0;  ///< Records without a json field; no output row.
};

/// @brief Streams `id,json` records to `id,json,is_valid` records.
///
/// Per-record failures never stop the batch. Process() fails only when the
/// input cannot be parsed as CSV, the header lacks a required column, or
/// the output stream goes bad.
class RecordProcessor {
 public:
  explicit RecordProcessor(ProcessorConfig config = ProcessorConfig());

  /// @brief Run the whole batch.
  /// @return True on success, false on failure (check Error()).
  bool Process(std::istream& input, std::ostream& output);

  const ProcessStats& Stats() const { return stats_; }

  const ProcessorConfig& Config() const { return config_; }

  /// @brief Get last error message.
  const std::string& Error() const { return error_; }

 private:
  ProcessorConfig config_;
  ProcessStats stats_;
  std::string error_;
};

}  // namespace ringrot
