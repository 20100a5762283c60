#include "chunks.hpp"

#include <charconv>
#include <stdexcept>
#include <string>

#include <xxhash.h>

uint64_t hash_chunk(std::span<const uint8_t> chunk) {
  return XXH3_64bits(chunk.data(), chunk.size());
}

namespace {
  uint64_t parse_trace_field(const std::string& line, size_t begin, size_t end) {
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(line.data() + begin, line.data() + end, value);
    if (ec != std::errc() || ptr != line.data() + end || begin == end) {
      throw std::runtime_error("Malformed chunk trace line: \"" + line + "\"");
    }
    return value;
  }
}

ChunkTrace parse_chunk_trace(const std::string& line) {
  const auto first_space_pos = line.find(' ');
  if (first_space_pos == std::string::npos) throw std::runtime_error("Malformed chunk trace line: \"" + line + "\"");
  const auto second_space_pos = line.find(' ', first_space_pos + 1);
  if (second_space_pos == std::string::npos) throw std::runtime_error("Malformed chunk trace line: \"" + line + "\"");

  return {
    parse_trace_field(line, 0, first_space_pos),
    parse_trace_field(line, first_space_pos + 1, second_space_pos),
    parse_trace_field(line, second_space_pos + 1, line.size())
  };
}

std::vector<ChunkTrace> read_chunk_traces(std::istream& trace_in) {
  std::vector<ChunkTrace> traces{};
  std::string line;
  while (std::getline(trace_in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    traces.emplace_back(parse_chunk_trace(line));
  }
  if (trace_in.bad()) throw std::runtime_error("Error reading chunk trace");
  return traces;
}

void write_chunk_trace(std::ostream& trace_out, const ChunkTrace& trace) {
  const std::string trace_line = std::to_string(trace.offset) + " " + std::to_string(trace.size) + " " + std::to_string(trace.hash) + "\n";
  trace_out.write(trace_line.c_str(), static_cast<std::streamsize>(trace_line.size()));
}

bool ChunkStats::add(uint64_t hash, uint64_t chunk_size, std::optional<CutPointType> cut_type) {
  total_size += chunk_size;
  if (cut_type == CutPointType::MAX_SIZE) max_size_cuts++;

  const auto [entry, inserted] = index.try_emplace(hash, ChunkIndexEntry{ chunk_count, chunk_size, 1 });
  chunk_count++;
  if (!inserted) {
    entry->second.instances++;
    deduped_size += chunk_size;
  }
  return !inserted;
}

void ChunkStats::merge(const ChunkStats& other) {
  for (const auto& [hash, other_entry] : other.index) {
    const auto [entry, inserted] = index.try_emplace(hash, ChunkIndexEntry{ chunk_count + other_entry.chunk_id, other_entry.size, 0 });
    // Every instance other had is a duplicate here if we already knew the chunk, otherwise all but the first one
    deduped_size += other_entry.size * (inserted ? other_entry.instances - 1 : other_entry.instances);
    entry->second.instances += other_entry.instances;
  }
  total_size += other.total_size;
  chunk_count += other.chunk_count;
  max_size_cuts += other.max_size_cuts;
}
