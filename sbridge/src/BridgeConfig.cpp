// **********************************************************************
// sbridge/src/BridgeConfig.cpp
// **********************************************************************
// S Magierowski Mar 2 2026

#include "BridgeConfig.hpp"

namespace sbridge {

std::string BridgeConfig::check() const {
  if (read_active <= 0)      return "read_active must be at least 1";
  if (read_turnaround <= 0)  return "read_turnaround must be at least 1";
  if (write_active <= 0)     return "write_active must be at least 1";
  if (write_turnaround <= 0) return "write_turnaround must be at least 1";
  if (fast_read && read_active == 1)
    return "fast_read needs read_active > 1 to see the following request";

  if (addr_width < 1 || addr_width > 32) return "addr_width must be in 1..32";
  if (data_width <= 0 || data_width > 64 || (data_width % 8) != 0)
    return "data_width must be a multiple of 8 no wider than 64";
  if (chip_width <= 0 || (chip_width % 8) != 0)
    return "chip_width must be a multiple of 8";
  if ((data_width % chip_width) != 0)
    return "data_width must be an integer multiple of chip_width";
  if (lanes() != 1 && lanes() != 2 && lanes() != 4)
    return "data_width/chip_width must give 1, 2 or 4 lanes";
  if (chip_addr_width() > 32) return "addr_width leaves no room for the lane index";

  if (t_co < 0 || t_idelay < 0) return "latencies cannot be negative";
  return std::string();
}

} // namespace sbridge
