// **********************************************************************
// sbridge/include/LaneDecomposer.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Splits one bus word into chip-width lanes.  Masks are bus byte-select masks
(bit i = bus byte i); a lane is pending while any of its bytes is set.
Lanes always come out lowest index first.
*/
#pragma once
#include <cstdint>
#include "BridgeConfig.hpp"

namespace sbridge {

class LaneDecomposer {
public:
  explicit LaneDecomposer(const BridgeConfig& cfg);

  int      select_lane(uint32_t mask) const;        // lowest pending lane; 0 for an empty mask
  uint32_t next_mask(uint32_t mask) const;          // mask with select_lane(mask) cleared
  uint32_t lane_address(uint32_t base, int lane) const;
  uint64_t lane_data(uint64_t payload, int lane) const;
  uint32_t lane_byte_enable(uint32_t mask, int lane) const; // active-low, lane_bytes wide
  uint64_t merge_lane(uint64_t word, int lane, uint64_t slice) const;

  uint32_t lane_mask(int lane) const;               // bus sel bits belonging to lane
  int      pending_lanes(uint32_t mask) const;
  uint32_t bus_mask()   const { return bus_mask_; }
  int      lanes()      const { return lanes_; }

private:
  int      lanes_      = 1;
  int      lane_bytes_ = 4;
  int      lane_bits_  = 0;
  int      chip_width_ = 32;
  uint32_t bus_mask_   = 0xfu;
  uint32_t addr_mask_  = 0;
  uint64_t slice_mask_ = 0;
};

} // namespace sbridge
