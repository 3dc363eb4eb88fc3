// **********************************************************************
// sbridge/include/ChipSignals.hpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Signal bundles on both sides of the bridge, sampled/produced once per tick.

          +------------- bridge -------------+
BusInput  | cyc stb we adr dat sel    ce_n   |  ChipFrame (active-low controls)
--------->|                           oe_n   |----------->
BusOutput | stall ack dat             we_n   |
<---------|                           be_n   |  ChipInput (data bus from chips)
          |                           adr/dq |<-----------
          +----------------------------------+
*/
#pragma once
#include <cstdint>
#include "BridgeConfig.hpp"

namespace sbridge {

// Bus-side request lines (pipelined, split-transaction bus)
struct BusInput {
  bool     cyc     = false;
  bool     stb     = false;
  bool     we      = false;
  uint32_t address = 0;   // word address
  uint64_t data    = 0;   // write payload
  uint32_t sel     = 0;   // one bit per bus byte
  bool valid() const { return cyc && stb; }
};

// Bus-side response lines, registered
struct BusOutput {
  bool     stall     = false;
  bool     ack       = false;
  uint64_t read_data = 0;     // valid in the tick ack pulses for a read
  bool     last      = false; // ack closes the transaction (always set unless lane_acks)
  bool     accepted  = false; // the request presented this tick was latched
};

// Chip-side pins. Vectors hold one bit per physical chip (ce_n) or byte (be_n).
struct ChipFrame {
  uint32_t address    = 0;
  uint64_t data_out   = 0;
  bool     data_drive = false; // false: controller leaves the data bus high-impedance
  uint32_t ce_n       = 0;
  bool     oe_n       = true;
  bool     we_n       = true;
  uint32_t be_n       = 0;
};

// What the chips put on the data bus
struct ChipInput {
  uint64_t data   = 0;
  bool     driven = false;
};

// Frame with every enable inactive and the data bus released
inline ChipFrame idle_frame(const BridgeConfig& cfg) {
  ChipFrame f{};
  f.ce_n = (1u << cfg.chip_count()) - 1u;
  f.be_n = (1u << cfg.be_width()) - 1u;
  return f;
}

inline bool frame_active(const ChipFrame& f, const BridgeConfig& cfg) {
  const ChipFrame idle = idle_frame(cfg);
  return f.ce_n != idle.ce_n || !f.oe_n || !f.we_n || f.data_drive;
}

// Software interface for whatever sits on the chip side of the bridge.
// respond() is called once per tick with the frame currently on the pins.
class ChipPort {
public:
  virtual           ~ChipPort()                          = default;
  virtual ChipInput respond(const ChipFrame& pins)       = 0;
  virtual void      reset()                              = 0;
};

} // namespace sbridge
