// **********************************************************************
// sbridge/src/BridgeCore.cpp
// **********************************************************************
// S Magierowski Mar 2 2026

#include "BridgeCore.hpp"

namespace sbridge {

BridgeCore::BridgeCore(const BridgeConfig& cfg)
  : seq_(cfg),
    tco_(cfg.t_co, idle_frame(cfg)),
    idelay_(cfg.t_idelay, 0ull) {
  reset();
}

void BridgeCore::reset() {
  seq_.reset();
  tco_.reset(seq_.frame());
  idelay_.reset(0ull);
  ticks_ = 0;
}

const BusOutput& BridgeCore::tick(const BusInput& bus, const ChipInput& chip_in, bool rst) {
  const uint64_t seen = idelay_.shift(chip_in.data); // sample through the input stage
  if (rst) seq_.reset();
  else     seq_.step(bus, seen);
  tco_.shift(seq_.frame());                          // launch toward the pins
  ++ticks_;
  return seq_.bus();
}

} // namespace sbridge
