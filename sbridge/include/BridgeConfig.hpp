// **********************************************************************
// sbridge/include/BridgeConfig.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Construction-time parameters of the bus-to-SRAM bridge.

  bus word (data_width) = lanes x chip word (chip_width)
  sel bit i             = bus byte i
  lane l                = bus bytes [l*lane_bytes, (l+1)*lane_bytes)

The chip address is the bus word address with the lane index appended in the
low bits (0, 1 or 2 bits for 1, 2 or 4 lanes).
*/
#pragma once
#include <string>

namespace sbridge {

struct BridgeConfig {
  int  addr_width       = 16;    // bus word-address bits
  int  data_width       = 32;    // bus data bits
  int  chip_width       = 8;     // data bits per chip access (one lane)
  bool byte_enables     = false; // chips have BE pins; otherwise bytes fold into per-chip CE lines

  // phase lengths in clock ticks
  int  read_active      = 3;
  int  read_turnaround  = 1;
  int  write_active     = 2;
  int  write_turnaround = 1;

  bool fast_read        = false; // chain back-to-back reads without turnaround
  bool lane_acks        = false; // ack every completed read lane, not just the last

  int  t_co             = 0;     // output latency to the chip pins (ticks)
  int  t_idelay         = 0;     // input latency of read data (ticks)

  // Empty string when the configuration is usable, otherwise the reason it is not.
  std::string check() const;

  int lanes()           const { return data_width / chip_width; }
  int lane_bytes()      const { return chip_width / 8; }
  int bus_bytes()       const { return data_width / 8; }
  int lane_bits()       const { return lanes() == 4 ? 2 : (lanes() == 2 ? 1 : 0); }
  int chip_addr_width() const { return addr_width + lane_bits(); }
  int chip_count()      const { return byte_enables ? 1 : lane_bytes(); }
  int be_width()        const { return byte_enables ? lane_bytes() : 0; }

  // Shortest read phase that still samples valid data from a chip with the
  // given access time once the round trip through both latency stages is paid.
  int min_read_active(int access_ticks) const { return access_ticks + t_co + t_idelay; }
};

} // namespace sbridge
