// **********************************************************************
// sbridge/src/Diagnostics.cpp
// **********************************************************************
// S Magierowski Mar 4 2026

#include "Diagnostics.hpp"
#include "SramBridge.hpp"
#include "SramChip.hpp"
#include <iostream>

namespace sbridge {

void report_bridge_stats(const SramBridge& bridge, const SramChip& sram, uint64_t cycle) {
  const SequencerStats& s = bridge.core().sequencer().stats();
  const BridgeConfig&   c = bridge.core().config();

  // === 1) Configuration ===
  std::cout << "Bridge: " << c.data_width << "b bus -> " << c.lanes() << " x " << c.chip_width
            << "b lanes, " << (c.byte_enables ? "BE pins" : "CE per byte")
            << ", rd " << c.read_active << "+" << c.read_turnaround
            << " wr " << c.write_active << "+" << c.write_turnaround
            << (c.fast_read ? " fast-read" : "")
            << " tco=" << c.t_co << " tidelay=" << c.t_idelay << std::endl;

  // === 2) Traffic ===
  std::cout << "Cycle count: " << cycle
            << " reads=" << s.reads << " writes=" << s.writes
            << " lanes=" << s.lanes << " fast_chains=" << s.fast_chains
            << " busy=" << s.busy_ticks << " stall=" << bridge.stall_ticks()
            << " responses=" << bridge.responses() << " aborted=" << bridge.aborted() << std::endl;

  // === 3) Chip side ===
  std::cout << "SRAM: read_ticks=" << sram.read_ticks()
            << " write_commits=" << sram.write_commits()
            << " pulse_violations=" << sram.pulse_violations()
            << " contention=" << sram.contention() << std::endl;

  assert_always(sram.pulse_violations() == 0, "SRAM saw write pulses shorter than its write time");
  assert_always(sram.contention() == 0, "SRAM and bridge drove the data bus together");
}

} // namespace sbridge
