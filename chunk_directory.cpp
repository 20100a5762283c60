#include "chunk_directory.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "cdc_algos/ae.hpp"
#include "utils/console_utils.hpp"
#include "utils/io_utils.hpp"

static void collect_walk_entry(const std::filesystem::directory_entry& entry, std::vector<std::filesystem::path>& file_paths, DirectoryWalkResult& result) {
  std::error_code type_ec;
  // Real directories are just walked through. Symlinks are followed to see what they point at, but never descended into,
  // so a link to a directory is skipped like anything else that isn't a regular file.
  if (!entry.is_symlink(type_ec) && !type_ec && entry.is_directory(type_ec) && !type_ec) return;
  type_ec.clear();
  if (!entry.is_regular_file(type_ec) || type_ec) {
    result.paths_skipped++;
    return;
  }
  file_paths.emplace_back(entry.path());
}

DirectoryWalkResult chunk_directory(
  const std::filesystem::path& walk_root, uint64_t target_size, uint64_t max_size, uint64_t salt, uint64_t thread_count
) {
  DirectoryWalkResult result{};
  std::vector<std::filesystem::path> file_paths{};

  std::error_code ec;
  if (std::filesystem::is_regular_file(walk_root, ec)) {
    file_paths.emplace_back(walk_root);
  }
  else {
    auto dir_iter = std::filesystem::recursive_directory_iterator(walk_root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) throw std::runtime_error("Can't walk " + walk_root.string() + ": " + ec.message());
    for (; dir_iter != std::filesystem::recursive_directory_iterator(); dir_iter.increment(ec)) {
      if (ec) break;
      collect_walk_entry(*dir_iter, file_paths, result);
    }
    if (ec) {
      // The iterator can't be trusted to move past a failed entry, whatever was collected so far still gets chunked
      print_to_error("Stopped walking {}: {}\n", walk_root.string(), ec.message());
      result.paths_skipped++;
    }
  }

  std::mutex result_mutex;
  std::atomic<uint64_t> next_file_i = 0;
  std::exception_ptr worker_error{};
  auto chunk_files_loop = [&]() {
    while (true) {
      const uint64_t file_i = next_file_i.fetch_add(1);
      if (file_i >= file_paths.size()) return;

      ChunkStats file_stats{};
      bool skipped = false;
      try {
        const MappedFile file(file_paths[file_i]);
        if (file.empty()) {
          skipped = true;
        }
        else {
          auto chunker = Chunker::with_params(file.data(), target_size, max_size, salt);
          while (const auto chunk = chunker.next()) {
            file_stats.add(hash_chunk(*chunk), chunk->size(), chunker.last_cut_type());
          }
        }
      }
      catch (const std::exception& e) {
        print_to_error("Skipping {}: {}\n", file_paths[file_i].string(), std::string(e.what()));
        skipped = true;
      }

      std::scoped_lock lock(result_mutex);
      if (skipped) {
        result.paths_skipped++;
        continue;
      }
      result.stats.merge(file_stats);
      result.files_processed++;
    }
  };
  // Whatever escapes a worker stops every worker, and is rethrown once they are all joined
  auto chunk_files = [&]() {
    try {
      chunk_files_loop();
    }
    catch (...) {
      std::scoped_lock lock(result_mutex);
      if (!worker_error) worker_error = std::current_exception();
      next_file_i = file_paths.size();
    }
  };

  const auto worker_count = std::max<uint64_t>(1, std::min<uint64_t>(thread_count, file_paths.size()));
  std::vector<std::thread> workers{};
  for (uint64_t i = 1; i < worker_count; i++) {
    try {
      workers.emplace_back(chunk_files);
    }
    catch (const std::system_error& e) {
      // Fewer workers just means a slower walk
      print_to_error("Can't start worker thread: {}\n", std::string(e.what()));
      break;
    }
  }
  chunk_files();
  for (auto& worker : workers) worker.join();
  if (worker_error) std::rethrow_exception(worker_error);

  return result;
}
