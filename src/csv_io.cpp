/// @file csv_io.cpp
/// @brief Implementation of CsvReader and CsvWriter.

#include "ringrot/csv_io.h"

#include <fmt/format.h>

namespace ringrot {

CsvReader::CsvReader(std::istream& input, char delimiter)
    : input_(input), delimiter_(delimiter) {}

void CsvReader::ConsumeLineBreak(int c) {
  if (c == '\r' && input_.peek() == '\n') {
    input_.get();
  }
  ++line_;
}

bool CsvReader::ReadRecord(std::vector<std::string>* fields) {
  fields->clear();
  error_.clear();
  if (!input_.good()) {
    return false;
  }

  constexpr int kEof = std::char_traits<char>::eof();

  // Skip blank lines between records.
  int c = input_.get();
  while (c == '\n' || c == '\r') {
    ConsumeLineBreak(c);
    c = input_.get();
  }
  if (c == kEof) {
    return false;
  }

  record_line_ = line_;
  std::string field;
  bool quoted = false;
  bool at_field_start = true;

  while (true) {
    if (quoted) {
      if (c == kEof) {
        error_ = fmt::format("unterminated quoted field in record starting on line {}",
                             record_line_);
        fields->clear();
        return false;
      }
      if (c == '"') {
        if (input_.peek() == '"') {
          input_.get();
          field += '"';
        } else {
          quoted = false;
        }
      } else {
        if (c == '\n' || (c == '\r' && input_.peek() != '\n')) {
          ++line_;
        }
        field += static_cast<char>(c);
      }
      c = input_.get();
      continue;
    }

    if (c == kEof || c == '\n' || c == '\r') {
      fields->push_back(std::move(field));
      if (c != kEof) {
        ConsumeLineBreak(c);
      }
      return true;
    }

    if (c == static_cast<unsigned char>(delimiter_)) {
      fields->push_back(std::move(field));
      field.clear();
      at_field_start = true;
    } else if (c == '"' && at_field_start) {
      quoted = true;
      at_field_start = false;
    } else {
      field += static_cast<char>(c);
      at_field_start = false;
    }
    c = input_.get();
  }
}

CsvWriter::CsvWriter(std::ostream& output, char delimiter)
    : output_(output), delimiter_(delimiter) {}

bool CsvWriter::NeedsQuotes(std::string_view field) const {
  if (field.empty()) {
    return false;
  }
  if (field.front() == ' ' || field.front() == '\t') {
    return true;
  }
  for (const char c : field) {
    if (c == delimiter_ || c == '"' || c == '\n' || c == '\r') {
      return true;
    }
  }
  return false;
}

bool CsvWriter::WriteRecord(const std::vector<std::string>& fields) {
  line_.clear();
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line_ += delimiter_;
    }
    const std::string& field = fields[i];
    if (!NeedsQuotes(field)) {
      line_ += field;
      continue;
    }
    line_ += '"';
    for (const char c : field) {
      if (c == '"') {
        line_ += '"';
      }
      line_ += c;
    }
    line_ += '"';
  }
  line_ += '\n';
  output_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  return static_cast<bool>(output_);
}

bool CsvWriter::Flush() {
  output_.flush();
  return static_cast<bool>(output_);
}

}  // namespace ringrot
