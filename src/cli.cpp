/// @file cli.cpp
/// @brief Implementation of RunCli.

#include "ringrot/cli.h"

#include "ringrot/record_processor.h"

#include <fstream>

namespace ringrot {

int RunCli(const CliOptions& options, std::istream& default_input,
           std::ostream& default_output) {
  if (options.delimiter.size() != 1) {
    LOG(ERROR) << "--delimiter must be exactly one character, got '"
               << options.delimiter << "'";
    return 1;
  }

  ProcessorConfig config;
  config.id_column = options.id_column;
  config.json_column = options.json_column;
  config.delimiter = options.delimiter[0];
  VLOG(1) << "config: " << config.toString();

  std::ifstream file_in;
  std::istream* in = &default_input;
  if (!options.input_path.empty() && options.input_path != "-") {
    file_in.open(options.input_path, std::ios::binary);
    if (!file_in.is_open()) {
      LOG(ERROR) << "Cannot open input file: " << options.input_path;
      return 1;
    }
    in = &file_in;
  }

  std::ofstream file_out;
  std::ostream* out = &default_output;
  if (!options.output_path.empty()) {
    file_out.open(options.output_path, std::ios::binary | std::ios::trunc);
    if (!file_out.is_open()) {
      LOG(ERROR) << "Cannot open output file: " << options.output_path;
      return 1;
    }
    out = &file_out;
  }

  RecordProcessor processor(config);
  if (!processor.Process(*in, *out)) {
    LOG(ERROR) << "Processing failed: " << processor.Error();
    return 1;
  }

  if (options.print_summary) {
    const ProcessStats& stats = processor.Stats();
    LOG(INFO) << fmt::format("{} record(s): {} valid, {} invalid, {} skipped",
                             stats.records, stats.valid, stats.invalid,
                             stats.skipped);
  }
  return 0;
}

}  // namespace ringrot
