#ifndef QCDC_AE_SERIAL_H
#define QCDC_AE_SERIAL_H

#include "ae.hpp"

// Precondition: data starts exactly at the previous cut point (or at the start of the buffer), min_chunksize < max_chunksize
// and window_size >= 1. The returned offset is relative to data.data() and is never 0 for non empty data.
CutPoint find_ae_cut_point_serial(
  std::span<const uint8_t> data,
  uint64_t window_size,
  uint64_t min_chunksize,
  uint64_t max_chunksize,
  uint64_t salt
);

#endif
