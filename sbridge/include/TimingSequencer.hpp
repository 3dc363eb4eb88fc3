// **********************************************************************
// sbridge/include/TimingSequencer.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Cycle-accurate state machine that serializes one bus transaction into timed
chip accesses.  step() is one rising clock edge: it samples the bus request
and the chip data bus, then registers new chip pins and bus handshake outputs.

  Idle --rd--> Read ---(last lane)---> ReadTurnaround --> Idle
    |            ^ \__(fast_read, next rd present)__/
    |            +-- next lane
    +---wr--> WriteActive --> WriteTurnaround --(lanes left)--> WriteActive
                                     +--(done)--> Idle

Writes are acked when accepted (posted); reads when the last lane is captured.
*/
#pragma once
#include <cstdint>
#include "BridgeConfig.hpp"
#include "ChipSignals.hpp"
#include "LaneDecomposer.hpp"

namespace sbridge {

struct SequencerStats {
  uint64_t reads       = 0; // accepted read transactions
  uint64_t writes      = 0; // accepted write transactions
  uint64_t lanes       = 0; // chip accesses started
  uint64_t fast_chains = 0; // reads started straight out of a previous read
  uint64_t busy_ticks  = 0; // ticks spent outside Idle
};

class TimingSequencer {
public:
  enum class State { Idle, Read, ReadTurnaround, WriteActive, WriteTurnaround };

  explicit TimingSequencer(const BridgeConfig& cfg);

  void step(const BusInput& bus, uint64_t chip_data);
  void reset(); // synchronous reset pulse

  State            state()    const { return state_; }
  int              counter()  const { return counter_; }
  uint32_t         residual() const { return residual_; }
  int              lane()     const { return lane_; }
  const ChipFrame& frame()    const { return frame_; }
  const BusOutput& bus()      const { return out_; }
  const SequencerStats& stats() const { return stats_; }
  const BridgeConfig&   config() const { return cfg_; }
  const LaneDecomposer& decomposer() const { return dec_; }

  static const char* state_name(State s);

private:
  void accept(const BusInput& bus); // latch request and drive its first lane
  void drive_next_lane();           // drive lowest lane of residual_, then retire it
  void release();                   // all enables inactive, data bus released
  void capture(uint64_t chip_data); // store current lane's read slice

  BridgeConfig   cfg_;
  LaneDecomposer dec_;

  State     state_    = State::Idle;
  int       counter_  = 0;
  BusInput  req_{};          // latched request
  uint32_t  residual_ = 0;   // bytes still to be serviced
  int       lane_     = 0;   // lane currently on the pins
  uint64_t  rbuf_     = 0;   // read word being assembled

  ChipFrame frame_{};
  BusOutput out_{};
  SequencerStats stats_{};
};

} // namespace sbridge
