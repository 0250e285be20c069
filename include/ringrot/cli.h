#pragma once

/// @file cli.h
/// @brief Command-line run: stream dispatch, config checks and exit codes.

#include <istream>
#include <ostream>
#include <string>

namespace ringrot {

/// @brief Options of one command-line run, filled from flags by main().
struct CliOptions {
  std::string input_path;   ///< Empty or "-" reads the default input.
  std::string output_path;  ///< Empty writes the default output.
  std::string id_column = "id";
  std::string json_column = "json";
  std::string delimiter = ",";  ///< Must be exactly one character.
  bool print_summary = true;    ///< Log record counts at INFO when done.
};

/// @brief Process one batch as the command-line tool does.
///
/// Only CSV is written to the output; diagnostics go through glog.
/// @param default_input Stream read when no input path is given.
/// @param default_output Stream written when no output path is given.
/// @return Process exit status: 0 on success, 1 when the input or output
///         cannot be opened, the options are invalid, or the batch fails.
int RunCli(const CliOptions& options, std::istream& default_input,
           std::ostream& default_output);

}  // namespace ringrot
