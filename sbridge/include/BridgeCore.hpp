// **********************************************************************
// sbridge/include/BridgeCore.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
TimingSequencer plus the two fixed latency stages around it.

  ChipInput --[T_IDELAY]--> sequencer --[T_CO]--> pins()

With both depths at 0 the pins are the sequencer's registered frame.
*/
#pragma once
#include "BridgeConfig.hpp"
#include "ChipSignals.hpp"
#include "DelayLine.hpp"
#include "TimingSequencer.hpp"

namespace sbridge {

class BridgeCore {
public:
  explicit BridgeCore(const BridgeConfig& cfg);

  // One clock edge. rst is a synchronous reset pulse sampled on this edge.
  const BusOutput& tick(const BusInput& bus, const ChipInput& chip_in, bool rst = false);
  void reset(); // power-on reset: sequencer and both delay lines

  const ChipFrame&       pins()      const { return tco_.out(); }
  const BusOutput&       bus()       const { return seq_.bus(); }
  const TimingSequencer& sequencer() const { return seq_; }
  const BridgeConfig&    config()    const { return seq_.config(); }
  uint64_t               ticks()     const { return ticks_; }

private:
  TimingSequencer     seq_;
  DelayLine<ChipFrame> tco_;
  DelayLine<uint64_t>  idelay_;
  uint64_t            ticks_ = 0;
};

} // namespace sbridge
