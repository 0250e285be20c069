/// @file record_processor.cpp
/// @brief Implementation of the record pipeline and RecordProcessor.

#include "ringrot/record_processor.h"

#include "ringrot/csv_io.h"
#include "ringrot/json_array.h"
#include "ringrot/ring_rotator.h"
#include "ringrot/square_sizer.h"
#include "ringrot/table.h"

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

namespace ringrot {

namespace {

const std::vector<std::string> kOutputHeader = {"id", "json", "is_valid"};

/// @brief Dump a table at VLOG(2) when it is small enough to read.
void LogGrid(const char* label, const Table& table) {
  if (!VLOG_IS_ON(2)) {
    return;
  }
  const std::optional<size_t> side = SquareLen(table.size());
  if (!side || *side == 0 || *side > kMaxGridLogSide) {
    return;
  }
  VLOG(2) << label << " (" << *side << "x" << *side << "):\n"
          << FormatGrid(table, *side);
}

/// @brief Position of @p name in @p header, or header.size() when absent.
size_t ColumnIndex(const std::vector<std::string>& header,
                   const std::string& name) {
  return static_cast<size_t>(
      std::find(header.begin(), header.end(), name) - header.begin());
}

}  // anonymous namespace

RecordResult ProcessJsonArray(std::string_view json_text) {
  RecordResult result;

  JsonArrayDecoder decoder;
  std::vector<JsonElement> elements;
  if (!decoder.Decode(json_text, &elements)) {
    VLOG(1) << "rejected: malformed array (" << decoder.Error() << ")";
    return result;
  }

  std::optional<Table> table = ToTable(elements);
  if (!table) {
    VLOG(1) << "rejected: entry outside the numeric domain";
    return result;
  }

  LogGrid("before", *table);
  const RotateStatus status = RotateRight(*table);
  if (status != RotateStatus::kOk) {
    VLOG(1) << "rejected: " << RotateStatusName(status) << " (length "
            << table->size() << ")";
    return result;
  }
  LogGrid("after", *table);

  result.json = EncodeJsonArray(*table);
  result.is_valid = true;
  return result;
}

RecordProcessor::RecordProcessor(ProcessorConfig config)
    : config_(std::move(config)) {}

bool RecordProcessor::Process(std::istream& input, std::ostream& output) {
  stats_ = ProcessStats();
  error_.clear();

  CsvReader reader(input, config_.delimiter);
  CsvWriter writer(output, config_.delimiter);

  std::vector<std::string> header;
  if (!reader.ReadRecord(&header)) {
    error_ = reader.Error().empty() ? "input has no header row"
                                    : reader.Error();
    return false;
  }

  const size_t id_index = ColumnIndex(header, config_.id_column);
  const size_t json_index = ColumnIndex(header, config_.json_column);
  if (id_index == header.size() || json_index == header.size()) {
    error_ = fmt::format("input header must have '{}' and '{}' columns",
                         config_.id_column, config_.json_column);
    return false;
  }
  const size_t min_fields = std::max(id_index, json_index) + 1;

  if (!writer.WriteRecord(kOutputHeader)) {
    error_ = "failed to write output header";
    return false;
  }

  std::vector<std::string> fields;
  std::vector<std::string> row(kOutputHeader.size());
  while (reader.ReadRecord(&fields)) {
    ++stats_.records;
    if (fields.size() < min_fields) {
      LOG(WARNING) << "Skipping record on line " << reader.RecordLine()
                   << ": " << fields.size() << " field(s), expected at least "
                   << min_fields;
      ++stats_.skipped;
      continue;
    }

    VLOG(1) << "record '" << fields[id_index] << "' (line "
            << reader.RecordLine() << ")";
    const RecordResult result = ProcessJsonArray(fields[json_index]);
    if (result.is_valid) {
      ++stats_.valid;
    } else {
      ++stats_.invalid;
    }

    row[0] = std::move(fields[id_index]);
    row[1] = result.json;
    row[2] = result.is_valid ? "true" : "false";
    if (!writer.WriteRecord(row)) {
      error_ = fmt::format("failed to write output for record on line {}",
                           reader.RecordLine());
      return false;
    }
  }

  if (!reader.Error().empty()) {
    error_ = reader.Error();
    return false;
  }
  if (!writer.Flush()) {
    error_ = "failed to flush output";
    return false;
  }
  return true;
}

}  // namespace ringrot
