// **********************************************************************
// sbridge/src/SramChip.hpp
// **********************************************************************
// S Magierowski Mar 3 2026

/*
Behavioral asynchronous SRAM bank hanging off the bridge pins.

        +--- SramChip ---
 adr -->|
 ce_n ->|  reads : ce & oe & !we, data valid once the pins have been
 oe_n ->|          stable for access_ticks, before that 0xA5 filler
 we_n ->|  writes: ce & we, enabled bytes latched on the we release edge
 be_n ->|
 dq  <->|
        +----------------

Storage is flat: chip location a, byte b lives at a*lane_bytes + b, which is
also the bus byte address, so host helpers take plain bus byte addresses.
*/

#pragma once
#include <cstdint>
#include <vector>
#include "BridgeConfig.hpp"
#include "ChipSignals.hpp"

class SramChip : public sbridge::ChipPort {
public:
  SramChip(const sbridge::BridgeConfig& cfg, int access_ticks, int write_ticks);

  sbridge::ChipInput respond(const sbridge::ChipFrame& pins) override;
  void reset() override; // clears timing state only, contents survive

  // host/test helpers (bus byte addresses)
  uint64_t get_size() const { return mem_.size(); }
  void     write(uint64_t addr, const void* src, uint64_t bytes);
  void     read(uint64_t addr, void* dst, uint64_t bytes) const;
  uint64_t read_word(uint32_t word_addr) const;
  void     write_word(uint32_t word_addr, uint64_t data);

  uint64_t read_ticks()       const { return read_ticks_; }
  uint64_t write_commits()    const { return write_commits_; }
  uint64_t pulse_violations() const { return pulse_violations_; }
  uint64_t contention()       const { return contention_; }
  int      access_ticks()     const { return access_ticks_; }

  static constexpr uint8_t kFiller = 0xA5; // driven while access time has not elapsed

private:
  uint32_t selected_bytes(const sbridge::ChipFrame& pins) const;
  bool     same_access(const sbridge::ChipFrame& a, const sbridge::ChipFrame& b) const;
  void     commit_write();

  sbridge::BridgeConfig cfg_;
  int access_ticks_ = 1;
  int write_ticks_  = 1;
  std::vector<uint8_t> mem_;

  sbridge::ChipFrame last_{};
  int  stable_ = 0;

  // write pulse tracking
  bool     we_active_ = false;
  int      we_width_  = 0;
  uint32_t wr_addr_   = 0;
  uint64_t wr_data_   = 0;
  uint32_t wr_bytes_  = 0;

  uint64_t read_ticks_       = 0;
  uint64_t write_commits_    = 0;
  uint64_t pulse_violations_ = 0;
  uint64_t contention_       = 0;
};
