#pragma once

/// @file csv_io.h
/// @brief Delimited record reader and writer (RFC 4180 quoting).

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ringrot {

/// @brief Pulls one record at a time from a stream.
///
/// Quoted fields may hold delimiters, doubled quotes and line breaks.
/// Records end at LF, CRLF or a lone CR. Blank lines are skipped.
class CsvReader {
 public:
  explicit CsvReader(std::istream& input, char delimiter = ',');

  // Non-copyable
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  /// @brief Read the next record.
  /// @param fields Output, replaced with the record's fields.
  /// @return True when a record was read. False at end of input or on a
  ///         malformed record; Error() is non-empty only in the latter case.
  bool ReadRecord(std::vector<std::string>* fields);

  /// @brief Line on which the last returned record started (1-based).
  size_t RecordLine() const { return record_line_; }

  const std::string& Error() const { return error_; }

 private:
  /// @brief Consume a line break starting at @p c, counting lines.
  void ConsumeLineBreak(int c);

  std::istream& input_;
  char delimiter_;
  size_t line_ = 1;
  size_t record_line_ = 0;
  std::string error_;
};

/// @brief Writes records, quoting fields that need it.
class CsvWriter {
 public:
  explicit CsvWriter(std::ostream& output, char delimiter = ',');

  CsvWriter(const CsvWriter&) = delete;
  CsvWriter& operator=(const CsvWriter&) = delete;

  /// @return False when the underlying stream is in a failed state.
  bool WriteRecord(const std::vector<std::string>& fields);

  bool Flush();

  /// @brief True when @p field must be quoted: it holds the delimiter, a
  ///        quote or a line break, or starts with a space or tab.
  bool NeedsQuotes(std::string_view field) const;

 private:
  std::ostream& output_;
  char delimiter_;
  std::string line_;
};

}  // namespace ringrot
