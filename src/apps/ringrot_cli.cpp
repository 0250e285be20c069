/// @file ringrot_cli.cpp
/// @brief Command-line front end: rotates the square tables of an
///        `id,json` CSV file (or stdin) and writes `id,json,is_valid` CSV.

#include "ringrot/cli.h"
#include "ringrot/defines.h"

#include <iostream>

DEFINE_string(output, "", "Output CSV path. Empty writes to stdout.");
DEFINE_string(id_column, "id", "Name of the input column holding record identifiers.");
DEFINE_string(json_column, "json", "Name of the input column holding JSON arrays.");
DEFINE_string(delimiter, ",", "Single-character field delimiter.");
DEFINE_bool(print_summary, true, "Log record counts when the run finishes.");

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "Rotate square numerical tables inside a CSV file one step clockwise.\n"
      "Usage: ringrot [flags] [input.csv]\n"
      "Input: CSV with columns 'id' and 'json'; reads stdin when no file is "
      "given or the file is '-'.\n"
      "Output: CSV with columns 'id', 'json' and 'is_valid'.");
  FLAGS_logtostderr = true;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc > 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "ringrot_cli");
    google::ShutdownGoogleLogging();
    return 1;
  }

  ringrot::CliOptions options;
  options.input_path = argc == 2 ? argv[1] : "";
  options.output_path = FLAGS_output;
  options.id_column = FLAGS_id_column;
  options.json_column = FLAGS_json_column;
  options.delimiter = FLAGS_delimiter;
  options.print_summary = FLAGS_print_summary;

  const int rc = ringrot::RunCli(options, std::cin, std::cout);
  google::ShutdownGoogleLogging();
  gflags::ShutDownCommandLineFlags();
  return rc;
}
