#ifndef QCDC_AE_H
#define QCDC_AE_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

enum CutPointType : uint8_t {
  AE_EXTREMUM,  // The maximum key held the leading edge of its window for window_size bytes
  MAX_SIZE,  // Forcibly cut because the data size reached the chunk max allowed size
  EOF_CUT  // Forcibly cut because the data span reached its EOF
};

struct CutPoint {
  CutPointType type;
  uint64_t offset;
};

enum class InvalidParametersReason : uint8_t {
  INSUFFICIENT_TARGET_SIZE,
  INSUFFICIENT_MAX_SIZE
};

class InvalidParameters : public std::invalid_argument {
public:
  InvalidParameters(InvalidParametersReason reason, const std::string& what) : std::invalid_argument(what), _reason(reason) {}

  InvalidParametersReason reason() const { return _reason; }

private:
  InvalidParametersReason _reason;
};

struct AE_WINDOW_POLICY {
  uint64_t window_size;
  uint64_t min_chunksize;  // Also the warp forward distance, nothing before it is ever compared
};

// Derives window size and warp distance from the target size only, so boundaries never depend on max_chunksize or salt.
AE_WINDOW_POLICY make_window_policy(uint64_t target_chunksize);

// Splits a borrowed buffer into content defined chunks using the Asymmetric Extremum algorithm, with a salted comparison key
// and a warp forward to the minimum chunk size. Chunks are views into the buffer, which must outlive the Chunker.
class Chunker {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::span<const uint8_t>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;
    explicit iterator(Chunker* _chunker) : chunker(_chunker) { advance(); }

    reference operator*() const { return *current; }
    pointer operator->() const { return &*current; }
    iterator& operator++() { advance(); return *this; }
    void operator++(int) { advance(); }

    bool operator==(const iterator& other) const { return chunker == other.chunker; }

  private:
    void advance() {
      current = chunker->next();
      if (!current.has_value()) chunker = nullptr;
    }

    Chunker* chunker = nullptr;
    std::optional<std::span<const uint8_t>> current{};
  };

  Chunker(std::span<const uint8_t> _data, uint64_t target_chunksize, uint64_t _max_chunksize, uint64_t salt);

  static Chunker with_params(std::span<const uint8_t> data, uint64_t target_chunksize, uint64_t max_chunksize, uint64_t salt);

  // A good (random) salt value, different boundaries for every call
  static uint64_t get_random_salt();

  // Returns the next chunk, or nothing once the whole buffer was consumed. Never restarts.
  std::optional<std::span<const uint8_t>> next();

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  uint64_t window_size() const { return policy.window_size; }
  uint64_t min_chunksize() const { return policy.min_chunksize; }
  uint64_t max_chunksize() const { return max_size; }
  uint64_t salt() const { return _salt; }
  uint64_t bytes_processed() const { return processed; }
  uint64_t bytes_remaining() const { return data.size() - processed; }
  std::optional<CutPointType> last_cut_type() const { return last_cut; }

private:
  std::span<const uint8_t> data;
  AE_WINDOW_POLICY policy;
  uint64_t max_size;
  uint64_t _salt;
  uint64_t processed = 0;
  std::optional<CutPointType> last_cut{};
};

#endif
