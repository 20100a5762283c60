#ifndef QCDC_CHUNK_UTILS_H
#define QCDC_CHUNK_UTILS_H

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "cdc_algos/ae.hpp"

struct ChunkTrace {
  uint64_t offset;
  uint64_t size;
  uint64_t hash;

  bool operator==(const ChunkTrace&) const = default;
};

// XXH3 64bit hash of the chunk data, the fingerprint used for traces and dedup
uint64_t hash_chunk(std::span<const uint8_t> chunk);

// One "offset size hash" line per chunk. Throws std::runtime_error on a malformed line.
std::vector<ChunkTrace> read_chunk_traces(std::istream& trace_in);
ChunkTrace parse_chunk_trace(const std::string& line);
void write_chunk_trace(std::ostream& trace_out, const ChunkTrace& trace);

struct ChunkIndexEntry {
  uint64_t chunk_id;
  uint64_t size;
  uint64_t instances;
};

// Find first chunk and instance count by hash
using ChunkIndex = std::unordered_map<uint64_t, ChunkIndexEntry>;

class ChunkStats {
public:
  uint64_t total_size = 0;
  uint64_t chunk_count = 0;
  uint64_t deduped_size = 0;
  uint64_t max_size_cuts = 0;

  // Returns true if the chunk was seen before
  bool add(uint64_t hash, uint64_t chunk_size, std::optional<CutPointType> cut_type = std::nullopt);
  // Folds another set of stats into this one, chunks already known here count as duplicates
  void merge(const ChunkStats& other);

  uint64_t unique_chunk_count() const { return index.size(); }
  uint64_t average_chunk_size() const { return chunk_count == 0 ? 0 : total_size / chunk_count; }
  uint64_t size_after_dedup() const { return total_size - deduped_size; }
  const ChunkIndex& chunk_index() const { return index; }

private:
  ChunkIndex index{};
};

#endif
