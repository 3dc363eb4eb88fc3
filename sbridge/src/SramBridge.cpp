// **********************************************************************
// sbridge/src/SramBridge.cpp
// **********************************************************************
// S Magierowski Mar 3 2026
/*
Each clock edge:
1) Let the chip answer the pins the core launched last edge.
2) Pull at most one new request off in_bus_req into the hold register.
3) Step the core with the held request on the bus lines.
4) Turn ack into a BusResp; drop the hold once the core accepted it.
*/

#include "SramBridge.hpp"

SramBridge::SramBridge(std::string /*name*/, const sbridge::BridgeConfig& cfg, IMPL_CTOR)
  : core_(cfg)
{
  UPDATE(update).reads(in_bus_req).writes(out_bus_resp);
}

bool SramBridge::quiet() const {
  return !hold_valid_ && !inflight_ && !core_.bus().stall &&
         core_.sequencer().state() == sbridge::TimingSequencer::State::Idle &&
         !sbridge::frame_active(core_.pins(), core_.config());
}

void SramBridge::update() {
  assert_always(chip_ != nullptr, "SramBridge requires an attached chip");

  // 1) chip side
  const sbridge::ChipInput chip_in = chip_->respond(core_.pins());

  if (reset_pending_) {
    trace("bridge: reset pulse in %s\n", sbridge::TimingSequencer::state_name(core_.sequencer().state()));
    if (hold_valid_ || inflight_) ++aborted_;
    hold_valid_    = false;
    inflight_      = false;
    reset_pending_ = false;
    core_.tick(sbridge::BusInput{}, chip_in, true);
    return;
  }

  // 2) present a request; only when a response slot is free for its ack
  if (!hold_valid_ && !in_bus_req.empty() && !out_bus_resp.full()) {
    hold_ = in_bus_req.pop();
    hold_valid_ = true;
  }

  sbridge::BusInput bus{};
  if (hold_valid_) {
    bus.cyc     = true;
    bus.stb     = true;
    bus.we      = (bool)hold_.write;
    bus.address = (uint32_t)hold_.addr;
    bus.data    = (uint64_t)hold_.wdata;
    bus.sel     = (uint32_t)hold_.sel;
  }

  // 3) clock the core
  const sbridge::BusOutput out = core_.tick(bus, chip_in);
  if (out.stall) ++stall_ticks_;

  // 4) responses; a fast-read chain acks the old read and accepts the new one on the same edge
  if (out.ack) {
    BusResp r{};
    if (out.accepted && bus.we) {
      r.id = hold_.id; r.write = true; r.rdata = 0; r.last = true;
    } else {
      assert_always(inflight_, "SramBridge: read ack with no read in flight");
      r.id = inflight_id_; r.write = false; r.rdata = (uint64_t)out.read_data; r.last = out.last;
      if (out.last) inflight_ = false;
    }
    assert_always(!out_bus_resp.full(), "SramBridge: response FIFO overflow");
    out_bus_resp.push(r);
    ++responses_;
    trace("bridge: ack id=%u %s data=0x%016llx%s\n", (unsigned)(uint16_t)r.id, (bool)r.write ? "wr" : "rd",
          (unsigned long long)(uint64_t)r.rdata, (bool)r.last ? "" : " (lane)");
  }
  if (out.accepted) {
    trace("bridge: accept id=%u %s adr=0x%x sel=0x%x\n", (unsigned)(uint16_t)hold_.id,
          bus.we ? "wr" : "rd", bus.address, bus.sel);
    if (!bus.we) {
      inflight_    = true;
      inflight_id_ = hold_.id;
    }
    hold_valid_ = false;
  }
}

// clear state; SRAM contents are left alone
void SramBridge::reset() {
  core_.reset();
  if (chip_) chip_->reset();
  hold_valid_    = false;
  inflight_      = false;
  reset_pending_ = false;
  stall_ticks_   = 0;
  responses_     = 0;
  aborted_       = 0;
}
