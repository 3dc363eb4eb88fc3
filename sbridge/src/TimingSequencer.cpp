// **********************************************************************
// sbridge/src/TimingSequencer.cpp
// **********************************************************************
// S Magierowski Mar 2 2026
/*
Every branch below is one row of the transition table.  Counters load
"phase length - 1" because the tick that enters a phase already counts as
its first cycle.  Turnarounds that end in Idle load one less again, since
the Idle tick itself can drive the next access.
*/

#include "TimingSequencer.hpp"
#include <cascade/Cascade.hpp>

namespace sbridge {

TimingSequencer::TimingSequencer(const BridgeConfig& cfg)
  : cfg_(cfg), dec_(cfg) {
  const std::string err = cfg_.check();
  assert_always(err.empty(), "TimingSequencer: bad configuration: %s", err.c_str());
  reset();
}

const char* TimingSequencer::state_name(State s) {
  switch (s) {
    case State::Idle:            return "Idle";
    case State::Read:            return "Read";
    case State::ReadTurnaround:  return "ReadTurnaround";
    case State::WriteActive:     return "WriteActive";
    case State::WriteTurnaround: return "WriteTurnaround";
    default:                     return "Unknown";
  }
}

void TimingSequencer::reset() {
  state_    = State::Idle;
  counter_  = 0;
  req_      = BusInput{};
  residual_ = 0;
  lane_     = 0;
  rbuf_     = 0;
  frame_    = idle_frame(cfg_);
  out_      = BusOutput{};
}

void TimingSequencer::release() {
  frame_.data_drive = false;
  frame_.oe_n = true;
  frame_.we_n = true;
  const ChipFrame idle = idle_frame(cfg_);
  frame_.ce_n = idle.ce_n;
  frame_.be_n = idle.be_n;
}

void TimingSequencer::drive_next_lane() {
  lane_ = dec_.select_lane(residual_);
  const uint32_t be_n = dec_.lane_byte_enable(residual_, lane_);

  frame_.address = dec_.lane_address(req_.address, lane_);
  if (cfg_.byte_enables) {          // one chip per lane, bytes picked by BE pins
    frame_.ce_n = 0;
    frame_.be_n = be_n;
  } else {                          // one chip per byte, bytes picked by their CE
    frame_.ce_n = be_n;
    frame_.be_n = 0;
  }
  if (req_.we) {
    frame_.data_out   = dec_.lane_data(req_.data, lane_);
    frame_.data_drive = true;
    frame_.we_n       = false;
    frame_.oe_n       = true;
  } else {
    frame_.data_drive = false;
    frame_.we_n       = true;
    frame_.oe_n       = false;
  }
  residual_ = dec_.next_mask(residual_);
  ++stats_.lanes;
}

void TimingSequencer::accept(const BusInput& bus) {
  req_      = bus;
  req_.sel  = bus.sel & dec_.bus_mask();
  residual_ = req_.sel;
  rbuf_     = 0;
  drive_next_lane();
  out_.stall    = true;
  out_.accepted = true;
  if (req_.we) {
    out_.ack  = true; // posted write
    out_.last = true;
    counter_  = cfg_.write_active - 1;
    state_    = State::WriteActive;
    ++stats_.writes;
  } else {
    counter_  = cfg_.read_active - 1;
    state_    = State::Read;
    ++stats_.reads;
  }
}

void TimingSequencer::capture(uint64_t chip_data) {
  rbuf_ = dec_.merge_lane(rbuf_, lane_, chip_data);
}

void TimingSequencer::step(const BusInput& bus, uint64_t chip_data) {
  out_.ack      = false;
  out_.last     = false;
  out_.accepted = false;
  if (state_ != State::Idle) ++stats_.busy_ticks;

  switch (state_) {
    case State::Idle:
      if (bus.valid()) {
        accept(bus);
      } else {
        release();
        out_.stall = false;
      }
      break;

    case State::Read:
      if (counter_ > 0) {
        --counter_;
        break;
      }
      capture(chip_data);
      if (residual_ != 0) {
        if (cfg_.lane_acks) {
          out_.ack       = true;
          out_.read_data = rbuf_;
        }
        drive_next_lane();
        counter_ = cfg_.read_active - 1;
        break;
      }
      out_.ack       = true;
      out_.last      = true;
      out_.read_data = rbuf_;
      if (cfg_.fast_read && bus.valid() && !bus.we) {
        accept(bus); // stays in Read, stall held
        ++stats_.fast_chains;
        break;
      }
      release();
      out_.stall = false;
      if (cfg_.read_turnaround == 1) {
        state_ = State::Idle;
      } else {
        counter_ = cfg_.read_turnaround - 2;
        state_   = State::ReadTurnaround;
      }
      break;

    case State::ReadTurnaround:
      if (counter_ > 0) --counter_;
      else              state_ = State::Idle;
      break;

    case State::WriteActive:
      if (counter_ > 0) {
        --counter_;
        break;
      }
      release();
      if (residual_ == 0 && cfg_.write_turnaround == 1) {
        out_.stall = false;
        state_ = State::Idle;
      } else {
        counter_ = residual_ == 0 ? cfg_.write_turnaround - 2 : cfg_.write_turnaround - 1;
        state_   = State::WriteTurnaround;
      }
      break;

    case State::WriteTurnaround:
      if (counter_ > 0) {
        --counter_;
        break;
      }
      if (residual_ == 0) {
        release();
        out_.stall = false;
        state_ = State::Idle;
      } else {
        drive_next_lane();
        counter_ = cfg_.write_active - 1;
        state_   = State::WriteActive;
      }
      break;
  }
}

} // namespace sbridge
