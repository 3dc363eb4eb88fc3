// **********************************************************************
// sbridge/src/LaneDecomposer.cpp
// **********************************************************************
// S Magierowski Mar 2 2026

#include "LaneDecomposer.hpp"

namespace sbridge {

namespace {
inline uint64_t low_bits64(int n) { return n >= 64 ? ~0ull : ((1ull << n) - 1ull); }
inline uint32_t low_bits32(int n) { return n >= 32 ? ~0u : ((1u << n) - 1u); }
} // namespace

LaneDecomposer::LaneDecomposer(const BridgeConfig& cfg)
  : lanes_(cfg.lanes()),
    lane_bytes_(cfg.lane_bytes()),
    lane_bits_(cfg.lane_bits()),
    chip_width_(cfg.chip_width),
    bus_mask_(low_bits32(cfg.bus_bytes())),
    addr_mask_(low_bits32(cfg.chip_addr_width())),
    slice_mask_(low_bits64(cfg.chip_width)) {}

uint32_t LaneDecomposer::lane_mask(int lane) const {
  return low_bits32(lane_bytes_) << (lane * lane_bytes_);
}

int LaneDecomposer::select_lane(uint32_t mask) const {
  for (int l = 0; l < lanes_; ++l)
    if (mask & lane_mask(l)) return l;
  return 0;
}

uint32_t LaneDecomposer::next_mask(uint32_t mask) const {
  return mask & bus_mask_ & ~lane_mask(select_lane(mask));
}

uint32_t LaneDecomposer::lane_address(uint32_t base, int lane) const {
  const uint64_t a = ((uint64_t)base << lane_bits_) | (uint64_t)lane;
  return (uint32_t)a & addr_mask_;
}

uint64_t LaneDecomposer::lane_data(uint64_t payload, int lane) const {
  const int shift = lane * chip_width_;
  if (shift >= 64) return 0;
  return (payload >> shift) & slice_mask_;
}

uint32_t LaneDecomposer::lane_byte_enable(uint32_t mask, int lane) const {
  return ~(mask >> (lane * lane_bytes_)) & low_bits32(lane_bytes_);
}

uint64_t LaneDecomposer::merge_lane(uint64_t word, int lane, uint64_t slice) const {
  const int shift = lane * chip_width_;
  if (shift >= 64) return word;
  return (word & ~(slice_mask_ << shift)) | ((slice & slice_mask_) << shift);
}

int LaneDecomposer::pending_lanes(uint32_t mask) const {
  int n = 0;
  for (int l = 0; l < lanes_; ++l)
    if (mask & lane_mask(l)) ++n;
  return n;
}

} // namespace sbridge
