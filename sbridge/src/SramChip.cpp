// **********************************************************************
// sbridge/src/SramChip.cpp
// **********************************************************************
// S Magierowski Mar 3 2026

#include "SramChip.hpp"
#include <cascade/Cascade.hpp>
#include <cstring>

using sbridge::ChipFrame;
using sbridge::ChipInput;

SramChip::SramChip(const sbridge::BridgeConfig& cfg, int access_ticks, int write_ticks)
  : cfg_(cfg),
    access_ticks_(access_ticks < 1 ? 1 : access_ticks),
    write_ticks_(write_ticks < 1 ? 1 : write_ticks)
{
  const std::string err = cfg_.check();
  assert_always(err.empty(), "SramChip: bad configuration: %s", err.c_str());
  const uint64_t bytes = (1ull << cfg_.addr_width) * (uint64_t)cfg_.bus_bytes();
  assert_always(bytes <= 256ull * 1024 * 1024, "SramChip: %d address bits is more than 256MB of SRAM", cfg_.addr_width);
  mem_.resize((size_t)bytes);
  reset();
}

void SramChip::reset() {
  last_       = sbridge::idle_frame(cfg_);
  stable_     = 0;
  we_active_  = false;
  we_width_   = 0;
  wr_bytes_   = 0;
}

// bit b set when byte b of the addressed location is enabled
uint32_t SramChip::selected_bytes(const ChipFrame& pins) const {
  const uint32_t all = (1u << cfg_.lane_bytes()) - 1u;
  if (cfg_.byte_enables)
    return (pins.ce_n & 1u) ? 0u : (~pins.be_n & all);
  return ~pins.ce_n & all; // one 8-bit chip per byte
}

bool SramChip::same_access(const ChipFrame& a, const ChipFrame& b) const {
  return a.address == b.address && a.ce_n == b.ce_n && a.be_n == b.be_n &&
         a.oe_n == b.oe_n && a.we_n == b.we_n;
}

void SramChip::commit_write() {
  const uint64_t base = (uint64_t)wr_addr_ * (uint64_t)cfg_.lane_bytes();
  for (int b = 0; b < cfg_.lane_bytes(); ++b) {
    if (!(wr_bytes_ & (1u << b))) continue;
    if (base + (uint64_t)b < mem_.size())
      mem_[(size_t)(base + b)] = (uint8_t)(wr_data_ >> (8 * b));
  }
  ++write_commits_;
}

ChipInput SramChip::respond(const ChipFrame& pins) {
  stable_ = same_access(pins, last_) ? stable_ + 1 : 1;
  last_ = pins;

  const uint32_t bytes = selected_bytes(pins);

  // write pulse: latch while active, commit on release
  const bool writing = bytes != 0 && !pins.we_n;
  if (writing) {
    ++we_width_;
    wr_addr_  = pins.address;
    wr_data_  = pins.data_out;
    wr_bytes_ = bytes;
  } else if (we_active_) {
    if (we_width_ < write_ticks_) ++pulse_violations_;
    commit_write();
    we_width_ = 0;
  }
  we_active_ = writing;

  ChipInput in{};
  if (bytes == 0 || pins.oe_n || !pins.we_n) return in; // high-impedance

  in.driven = true;
  ++read_ticks_;
  if (pins.data_drive) ++contention_;
  const uint64_t base = (uint64_t)pins.address * (uint64_t)cfg_.lane_bytes();
  for (int b = 0; b < cfg_.lane_bytes(); ++b) {
    if (!(bytes & (1u << b))) continue;
    uint8_t v = kFiller;
    if (stable_ >= access_ticks_ && base + (uint64_t)b < mem_.size())
      v = mem_[(size_t)(base + b)];
    in.data |= (uint64_t)v << (8 * b);
  }
  return in;
}

// method: write to SRAM from the host, bounds-checked, no timing
void SramChip::write(uint64_t addr, const void* src, uint64_t bytes) {
  if (addr > mem_.size() || bytes > mem_.size() - addr) return;
  std::memcpy(&mem_[(size_t)addr], src, (size_t)bytes);
}

// method: read SRAM for the host; out-of-range bytes read as zero
void SramChip::read(uint64_t addr, void* dst, uint64_t bytes) const {
  if (addr > mem_.size() || bytes > mem_.size() - addr) {
    std::memset(dst, 0, (size_t)bytes);
    return;
  }
  std::memcpy(dst, mem_.data() + addr, (size_t)bytes);
}

uint64_t SramChip::read_word(uint32_t word_addr) const {
  uint64_t w = 0;
  const uint64_t base = (uint64_t)word_addr * (uint64_t)cfg_.bus_bytes();
  for (int b = 0; b < cfg_.bus_bytes(); ++b) {
    uint8_t v = 0;
    read(base + b, &v, 1);
    w |= (uint64_t)v << (8 * b);
  }
  return w;
}

void SramChip::write_word(uint32_t word_addr, uint64_t data) {
  const uint64_t base = (uint64_t)word_addr * (uint64_t)cfg_.bus_bytes();
  for (int b = 0; b < cfg_.bus_bytes(); ++b) {
    const uint8_t v = (uint8_t)(data >> (8 * b));
    write(base + b, &v, 1);
  }
}
