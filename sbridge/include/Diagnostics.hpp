// **********************************************************************
// sbridge/include/Diagnostics.hpp
// **********************************************************************
// S Magierowski Mar 4 2026
/*
End-of-run report for a bridge + SRAM pair.
*/
#pragma once
#include <cstdint>

class SramBridge;
class SramChip;

namespace sbridge {

// Prints controller and chip statistics, then checks the chip never saw a
// short write pulse or bus contention.
void report_bridge_stats(const SramBridge& bridge, const SramChip& sram, uint64_t cycle);

} // namespace sbridge
