#include "ae_serial.hpp"

// Each step of the scan depends on the marker the previous one left, so there are no explicit vector ops here.
// It is still built once per Highway target so each CPU gets its own baseline instead of SSE2.
#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "cdc_algos/ae_serial.cpp"
#include <hwy/foreach_target.h>
#include <hwy/highway.h>

HWY_BEFORE_NAMESPACE();

namespace QCDC_SERIAL {
namespace HWY_NAMESPACE {

static constexpr uint64_t KEY_SIZE = sizeof(uint64_t);

// Comparison key: the 8 bytes starting at data[0] read as a big-endian integer, so the first byte is the most significant one
// on every host, then mixed with the salt.
HWY_INLINE uint64_t salted_key(const uint8_t* data, uint64_t salt) {
  uint64_t value = 0;
  for (uint64_t byte_i = 0; byte_i < KEY_SIZE; byte_i++) {
    value = (value << 8) | data[byte_i];
  }
  return value ^ salt;
}

static CutPoint find_ae_cut_point_serial_impl(
  std::span<const uint8_t> data,
  uint64_t window_size,
  uint64_t min_chunksize,
  uint64_t max_chunksize,
  uint64_t salt
) {
  const uint64_t size = data.size();

  // Under minimum chunk size remaining, this is the last chunk
  if (size <= min_chunksize) {
    return { CutPointType::EOF_CUT, size };
  }

  const auto forced_cut = [size, max_chunksize]() -> CutPoint {
    if (max_chunksize < size) return { CutPointType::MAX_SIZE, max_chunksize };
    return { CutPointType::EOF_CUT, size };
  };

  // Not even the marker at min_chunksize has a full key available
  if (size - min_chunksize < KEY_SIZE) {
    return forced_cut();
  }

  // Keys are only read up to here, so we never dereference anything beyond the end of data
  const uint64_t last_key_pos = size - KEY_SIZE;

  // Warp forward to min_chunksize, nothing before it can be a cut point
  uint64_t marker_pos = min_chunksize;
  uint64_t marker_key = salted_key(data.data() + marker_pos, salt);

  for (uint64_t i = min_chunksize + 1; i <= last_key_pos; i++) {
    // Max chunksize reached, force a cutpoint.
    // This generally happens when processing data that doesn't change (e.g. sparse files / all zeros).
    if (i == max_chunksize) {
      return { CutPointType::MAX_SIZE, i };
    }

    const uint64_t current_key = salted_key(data.data() + i, salt);
    if (current_key >= marker_key) {
      marker_pos = i;
      marker_key = current_key;
      continue;
    }

    // End of window reached without a new marker position, the extremum is at the leading edge of its window
    if (i == marker_pos + window_size) {
      return { CutPointType::AE_EXTREMUM, i };
    }
  }

  return forced_cut();
}

}
}

HWY_AFTER_NAMESPACE();

#if HWY_ONCE

namespace QCDC_SERIAL {
  HWY_EXPORT(find_ae_cut_point_serial_impl);
}

CutPoint find_ae_cut_point_serial(
  std::span<const uint8_t> data,
  uint64_t window_size,
  uint64_t min_chunksize,
  uint64_t max_chunksize,
  uint64_t salt
) {
  return HWY_DYNAMIC_DISPATCH(QCDC_SERIAL::find_ae_cut_point_serial_impl)(data, window_size, min_chunksize, max_chunksize, salt);
}

#endif
