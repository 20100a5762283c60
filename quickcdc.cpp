#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_map>

#include "chunk_directory.hpp"
#include "quickcdc_test.hpp"

#include "cdc_algos/ae.hpp"
#include "utils/console_utils.hpp"

namespace constants {
  // Smallest acceptable value for the target chunk size.
  static constexpr uint64_t TARGET_MIN = 1;
  // Largest acceptable value for the target chunk size.
  static constexpr uint64_t TARGET_MAX = 268'435'456;
  // Largest acceptable value for the maximum chunk size.
  static constexpr uint64_t MAXIMUM_MAX = 1'073'741'824;

  static constexpr uint64_t DEFAULT_TARGET = 128'000;
  static constexpr uint64_t DEFAULT_MAX = 524'288;
}

static uint64_t parse_size_param(const std::string& name, const std::string& value) {
  uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    throw std::runtime_error("Bad " + name + ": " + value);
  }
  return parsed;
}

static int run(int argc, char* argv[]) {
  if (argc < 2) {
    print_to_console("Usage: {} <path> [--target=N] [--max=N] [--salt=N] [--threads=N] [--test] [--trace-out=PATH] [--trace-in=PATH]\n", std::string(argv[0]));
    return 1;
  }
  const std::string input_path{ argv[1] };

  std::unordered_map<std::string, std::string> cli_params;
  cli_params["threads"] = std::to_string(std::max(1u, std::thread::hardware_concurrency()));
  for (int param_idx = 2; param_idx < argc; param_idx++) {
    auto param = std::string(argv[param_idx]);
    if (param.starts_with("--threads=")) {
      constexpr auto opt_size = std::string_view("--threads=").size();
      const auto thread_count_str = param.substr(opt_size);
      if (parse_size_param("thread count", thread_count_str) != 0) {  // if 0 we just keep the auto-detected concurrency count
        cli_params["threads"] = thread_count_str;
      }
    }
    else if (param.starts_with("--target=")) {
      constexpr auto opt_size = std::string_view("--target=").size();
      cli_params["target_size"] = param.substr(opt_size);
    }
    else if (param.starts_with("--max=")) {
      constexpr auto opt_size = std::string_view("--max=").size();
      cli_params["max_size"] = param.substr(opt_size);
    }
    else if (param.starts_with("--salt=")) {
      constexpr auto opt_size = std::string_view("--salt=").size();
      cli_params["salt"] = param.substr(opt_size);
    }
    else if (param == "--test") {
      cli_params["test_mode"] = "true";
    }
    else if (param.starts_with("--trace-out=")) {
      constexpr auto opt_size = std::string_view("--trace-out=").size();
      cli_params["trace_out_file_path"] = param.substr(opt_size);
    }
    else if (param.starts_with("--trace-in=")) {
      constexpr auto opt_size = std::string_view("--trace-in=").size();
      cli_params["trace_in_file_path"] = param.substr(opt_size);
    }
    else {
      print_to_error("Bad arg: {}\n", param);
      return 1;
    }
  }

  const uint64_t target_size = cli_params["target_size"].empty() ? constants::DEFAULT_TARGET : parse_size_param("target size", cli_params["target_size"]);
  const uint64_t max_size = cli_params["max_size"].empty() ? constants::DEFAULT_MAX : parse_size_param("max size", cli_params["max_size"]);
  const uint64_t salt = cli_params["salt"].empty() ? Chunker::get_random_salt() : parse_size_param("salt", cli_params["salt"]);
  const uint64_t thread_count = parse_size_param("thread count", cli_params["threads"]);

  if (constants::TARGET_MIN > target_size || target_size > constants::TARGET_MAX) throw std::runtime_error("Bad target size");
  if (max_size <= target_size || max_size > constants::MAXIMUM_MAX) throw std::runtime_error("Bad maximum size");

  if (cli_params["test_mode"] == "true") {
    return quickcdc_test_mode(input_path, target_size, max_size, salt, cli_params);
  }
  if (!cli_params["trace_out_file_path"].empty() || !cli_params["trace_in_file_path"].empty()) {
    print_to_error("Chunk traces are only available in --test mode\n");
    return 1;
  }

  print_to_console("Processing files under path: {}\n", input_path);
  const auto start_time = std::chrono::high_resolution_clock::now();
  const auto result = chunk_directory(input_path, target_size, max_size, salt, thread_count);
  const auto end_time = std::chrono::high_resolution_clock::now();

  print_to_console("Duration: {} milliseconds\n", std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count());
  print_to_console("Files Processed: {}\n", result.files_processed);
  print_to_console("Paths Skipped: {}\n", result.paths_skipped);
  print_to_console("Chunks Processed: {}\n", result.stats.chunk_count);
  if (result.stats.chunk_count > 0) {
    print_to_console("Average Chunk Size: {}\n", result.stats.average_chunk_size());
  }
  print_to_console("Total Bytes Processed: {}\n", result.stats.total_size);
  print_to_console("Duplicate Chunk Bytes: {}\n", result.stats.deduped_size);
  return 0;
}

int main(int argc, char* argv[]) {
  try {
    return run(argc, argv);
  }
  catch (const std::exception& e) {
    print_to_error("{}\n", std::string(e.what()));
    return 1;
  }
}
