/// @file rotation_bench.cpp
/// @brief Throughput of RotateRight across table sizes and data patterns.
///
/// Demonstrates:
/// - Rotating sequential tables from 1x1 up to 100x100
/// - Rotating 10x10 tables filled with different value patterns
/// - Reporting ns per rotation and elements per second

#include "ringrot/ring_rotator.h"
#include "ringrot/stopw.h"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

DEFINE_int32(iterations, 20000, "Rotations timed per case.");
DEFINE_uint64(seed, 42, "Seed for the random pattern.");

using namespace ringrot;

namespace {

std::vector<int32_t> MakeTable(size_t n, const std::string& pattern) {
  const size_t size = n * n;
  std::vector<int32_t> data(size);
  std::mt19937_64 rng(FLAGS_seed);
  std::uniform_int_distribution<int32_t> uniform(0, 9999);

  for (size_t i = 0; i < size; ++i) {
    const auto x = static_cast<int32_t>(i + 1);
    if (pattern == "random") {
      data[i] = uniform(rng);
    } else if (pattern == "repeated") {
      data[i] = 42;
    } else if (pattern == "negative") {
      data[i] = -x;
    } else if (pattern == "mixed") {
      data[i] = (x % 2 == 0) ? x : -x;
    } else {
      data[i] = x;
    }
  }
  return data;
}

/// @brief Time FLAGS_iterations rotations of a fresh copy of @p input.
void BenchCase(const std::string& label, const std::vector<int32_t>& input) {
  std::vector<int32_t> work(input.size());
  int64_t checksum = 0;

  StopW timer;
  for (int32_t it = 0; it < FLAGS_iterations; ++it) {
    work = input;
    CHECK(RotateRight(work) == RotateStatus::kOk);
    checksum += work.front();
  }
  const double ns = timer.ElapsedNano();

  const double ns_per_call = ns / FLAGS_iterations;
  const double elems_per_sec =
      ns > 0 ? static_cast<double>(input.size()) * FLAGS_iterations / (ns / 1e9) : 0.0;
  std::cout << std::left << std::setw(24) << label << std::right
            << std::setw(12) << std::fixed << std::setprecision(1)
            << ns_per_call << " ns/call" << std::setw(16)
            << std::setprecision(0) << elems_per_sec << " elem/s"
            << "  (checksum " << checksum << ")" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  CHECK_GT(FLAGS_iterations, 0);

  std::cout << "=== rotation by size (" << FLAGS_iterations
            << " iterations) ===" << std::endl;
  for (size_t n : {1, 2, 3, 4, 5, 8, 10, 16, 25, 50, 100}) {
    BenchCase(fmt::format("rotate {}x{}", n, n), MakeTable(n, "sequential"));
  }

  std::cout << "\n=== rotation by pattern (10x10) ===" << std::endl;
  for (const char* pattern :
       {"sequential", "random", "repeated", "negative", "mixed"}) {
    BenchCase(fmt::format("pattern {}", pattern), MakeTable(10, pattern));
  }

  return 0;
}
