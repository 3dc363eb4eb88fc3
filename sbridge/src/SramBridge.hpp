// **********************************************************************
// sbridge/src/SramBridge.hpp
// **********************************************************************
// S Magierowski Mar 3 2026
/*
Cascade wrapper around BridgeCore.

  --> in_bus_req   -> hold_ -> BridgeCore -> pins  --> ChipPort (SramChip)
  <-- out_bus_resp <- ack   <-            <- data  <--

A request popped from in_bus_req is held (cyc/stb asserted) until the core
reports it accepted, so the FIFO never runs ahead of the stall handshake.
*/

#pragma once
#include <cascade/Cascade.hpp>
#include "BusTypes.hpp"
#include "BridgeCore.hpp"

class SramBridge : public Component {
  DECLARE_COMPONENT(SramBridge);
public:
  SramBridge(std::string name, const sbridge::BridgeConfig& cfg, COMPONENT_CTOR);

  Clock(clk);

  // Bus side
  FifoInput (BusReq,  in_bus_req);
  FifoOutput(BusResp, out_bus_resp);

  void attach_chip(sbridge::ChipPort* chip) { chip_ = chip; }
  void pulse_reset() { reset_pending_ = true; } // synchronous reset on the next edge

  const sbridge::BridgeCore& core() const { return core_; }
  bool     quiet()       const; // nothing held, nothing in flight
  uint64_t stall_ticks() const { return stall_ticks_; }
  uint64_t responses()   const { return responses_; }
  uint64_t aborted()     const { return aborted_; }

  void update();
  void reset();

private:
  sbridge::BridgeCore core_;
  sbridge::ChipPort*  chip_ = nullptr;

  bool   hold_valid_    = false; // request presented on the bus lines
  BusReq hold_{};
  bool   inflight_      = false; // accepted read not answered yet
  u16    inflight_id_   = 0;
  bool   reset_pending_ = false;

  uint64_t stall_ticks_ = 0;
  uint64_t responses_   = 0;
  uint64_t aborted_     = 0;
};
