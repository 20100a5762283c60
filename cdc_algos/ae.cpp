#include "ae.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>

#include "cdc_algos/ae_serial.hpp"

AE_WINDOW_POLICY make_window_policy(uint64_t target_chunksize) {
  // Window size that would give target_chunksize on average for random data, see the AE paper. We keep only part of it
  // and warp forward over the rest, so the expected chunk size stays close to the target.
  const auto target_window_size = static_cast<uint64_t>(static_cast<double>(target_chunksize) / (std::numbers::e - 1.0));
  const auto window_size = std::max<uint64_t>(1, static_cast<uint64_t>(static_cast<double>(target_window_size) * 0.56));
  return { window_size, target_chunksize - target_window_size };
}

Chunker::Chunker(std::span<const uint8_t> _data, uint64_t target_chunksize, uint64_t _max_chunksize, uint64_t salt)
  : data(_data), policy(), max_size(_max_chunksize), _salt(salt) {
  if (target_chunksize < 1) {
    throw InvalidParameters(InvalidParametersReason::INSUFFICIENT_TARGET_SIZE, "Target chunk size must be at least 1");
  }
  if (max_size <= target_chunksize) {
    throw InvalidParameters(
      InvalidParametersReason::INSUFFICIENT_MAX_SIZE,
      "Max chunk size (" + std::to_string(max_size) + ") must be larger than target chunk size (" + std::to_string(target_chunksize) + ")"
    );
  }
  policy = make_window_policy(target_chunksize);
}

Chunker Chunker::with_params(std::span<const uint8_t> data, uint64_t target_chunksize, uint64_t max_chunksize, uint64_t salt) {
  return Chunker(data, target_chunksize, max_chunksize, salt);
}

uint64_t Chunker::get_random_salt() {
  std::random_device rd;
  std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) | rd());
  return rng();
}

std::optional<std::span<const uint8_t>> Chunker::next() {
  if (processed == data.size()) return std::nullopt;

  const auto remaining = data.subspan(processed);
  const CutPoint cut_point = find_ae_cut_point_serial(remaining, policy.window_size, policy.min_chunksize, max_size, _salt);

  processed += cut_point.offset;
  last_cut = cut_point.type;
  return remaining.first(cut_point.offset);
}
