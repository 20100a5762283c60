#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk_directory.hpp"
#include "quickcdc_test.hpp"
#include "scratch_fixture.hpp"
#include "utils/chunks.hpp"

namespace {

constexpr uint64_t kTarget = 512;
constexpr uint64_t kMax = 2048;

}  // namespace

using ChunkDirectoryTests = ScratchFixture;

TEST_F(ChunkDirectoryTests, WalksNestedFilesAndSkipsTheRest) {
  const auto contents = ScratchRandomBytes(64 * 1024, 11);
  WriteFile("a.bin", contents);
  // Same bytes again, chunked the same way, so every chunk of it is a duplicate
  WriteFile("nested/deeper/copy.bin", contents);
  WriteFile("nested/empty.bin", {});
  std::filesystem::create_directory_symlink(GetScratchPath() / "nested", GetScratchPath() / "link_to_nested");

  for (const uint64_t thread_count : { 1, 4 }) {
    const auto result = chunk_directory(GetScratchPath(), kTarget, kMax, 0, thread_count);
    EXPECT_EQ(result.files_processed, 2) << thread_count;
    // The empty file and the directory symlink
    EXPECT_EQ(result.paths_skipped, 2) << thread_count;
    EXPECT_EQ(result.stats.total_size, 2 * contents.size()) << thread_count;
    EXPECT_EQ(result.stats.deduped_size, contents.size()) << thread_count;
    EXPECT_EQ(result.stats.unique_chunk_count() * 2, result.stats.chunk_count) << thread_count;
  }
}

TEST_F(ChunkDirectoryTests, WorkersAgreeWithSingleThread) {
  for (uint64_t i = 0; i < 12; i++) {
    WriteFile("dir" + std::to_string(i % 3) + "/file" + std::to_string(i) + ".bin", ScratchRandomBytes(3000 + i * 1500, i));
  }
  // A couple of whole file duplicates, spread over the workers
  WriteFile("dup1.bin", ScratchRandomBytes(3000, 0));
  WriteFile("dup2.bin", ScratchRandomBytes(4500, 1));

  const auto single = chunk_directory(GetScratchPath(), kTarget, kMax, 7, 1);
  const auto multi = chunk_directory(GetScratchPath(), kTarget, kMax, 7, 8);
  EXPECT_EQ(single.files_processed, 14);
  EXPECT_EQ(multi.files_processed, single.files_processed);
  EXPECT_EQ(multi.paths_skipped, 0);
  EXPECT_EQ(multi.stats.total_size, single.stats.total_size);
  EXPECT_EQ(multi.stats.chunk_count, single.stats.chunk_count);
  EXPECT_EQ(multi.stats.deduped_size, single.stats.deduped_size);
  EXPECT_EQ(multi.stats.unique_chunk_count(), single.stats.unique_chunk_count());
  EXPECT_GE(single.stats.deduped_size, 3000 + 4500);
}

TEST_F(ChunkDirectoryTests, SingleFileRoot) {
  const auto contents = ScratchRandomBytes(20'000, 5);
  const auto path = WriteFile("only.bin", contents);

  const auto result = chunk_directory(path, kTarget, kMax, 0, 4);
  EXPECT_EQ(result.files_processed, 1);
  EXPECT_EQ(result.paths_skipped, 0);
  EXPECT_EQ(result.stats.total_size, contents.size());
}

TEST_F(ChunkDirectoryTests, MissingRootThrows) {
  EXPECT_THROW(chunk_directory(GetScratchPath() / "missing", kTarget, kMax, 0, 1), std::runtime_error);
}

using TestModeTests = ScratchFixture;

TEST_F(TestModeTests, WrittenTraceVerifies) {
  const auto data_path = WriteFile("data.bin", ScratchRandomBytes(50'000, 21));
  const auto trace_path = GetScratchPath() / "trace.txt";

  std::unordered_map<std::string, std::string> write_params{ { "trace_out_file_path", trace_path.string() } };
  ASSERT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 3, write_params), 0);

  std::unordered_map<std::string, std::string> verify_params{ { "trace_in_file_path", trace_path.string() } };
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 3, verify_params), 0);
  // Other salt, other boundaries
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, ~3ull, verify_params), 1);
}

TEST_F(TestModeTests, EmptyTraceFailsAgainstNonEmptyFile) {
  const auto data_path = WriteFile("data.bin", ScratchRandomBytes(50'000, 22));
  const auto trace_path = WriteFile("empty_trace.txt", {});

  std::unordered_map<std::string, std::string> params{ { "trace_in_file_path", trace_path.string() } };
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 0, params), 1);
}

TEST_F(TestModeTests, BlankTraceFailsAgainstNonEmptyFile) {
  const auto data_path = WriteFile("data.bin", ScratchRandomBytes(50'000, 23));
  const auto trace_path = GetScratchPath() / "blank_trace.txt";
  {
    std::ofstream trace(trace_path);
    trace << "\n\n\r\n";
  }

  std::unordered_map<std::string, std::string> params{ { "trace_in_file_path", trace_path.string() } };
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 0, params), 1);
}

TEST_F(TestModeTests, EmptyTraceMatchesEmptyFile) {
  const auto data_path = WriteFile("data.bin", {});
  const auto trace_path = WriteFile("empty_trace.txt", {});

  std::unordered_map<std::string, std::string> params{ { "trace_in_file_path", trace_path.string() } };
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 0, params), 0);
}

TEST_F(TestModeTests, TruncatedTraceFails) {
  const auto data_path = WriteFile("data.bin", ScratchRandomBytes(50'000, 24));
  const auto trace_path = GetScratchPath() / "trace.txt";

  std::unordered_map<std::string, std::string> write_params{ { "trace_out_file_path", trace_path.string() } };
  ASSERT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 0, write_params), 0);

  std::vector<ChunkTrace> traces;
  {
    std::ifstream trace_in(trace_path);
    traces = read_chunk_traces(trace_in);
  }
  ASSERT_GT(traces.size(), 1);
  traces.pop_back();
  {
    std::ofstream trace_out(trace_path, std::ios::trunc);
    for (const auto& trace : traces) write_chunk_trace(trace_out, trace);
  }

  std::unordered_map<std::string, std::string> verify_params{ { "trace_in_file_path", trace_path.string() } };
  EXPECT_EQ(quickcdc_test_mode(data_path.string(), kTarget, kMax, 0, verify_params), 1);
}
