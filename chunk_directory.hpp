#ifndef QCDC_CHUNK_DIRECTORY_H
#define QCDC_CHUNK_DIRECTORY_H

#include <cstdint>
#include <filesystem>

#include "utils/chunks.hpp"

struct DirectoryWalkResult {
  ChunkStats stats{};
  uint64_t files_processed = 0;
  uint64_t paths_skipped = 0;
};

// Chunks every regular file under walk_root (or walk_root itself if it is a file) over thread_count workers.
// Zero sized files, unreadable files and anything that isn't a regular file count as skipped paths.
// Throws std::runtime_error if walk_root can't be walked at all.
DirectoryWalkResult chunk_directory(
  const std::filesystem::path& walk_root, uint64_t target_size, uint64_t max_size, uint64_t salt, uint64_t thread_count
);

#endif
