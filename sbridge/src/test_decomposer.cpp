// **********************************************************************
// sbridge/src/test_decomposer.cpp
// **********************************************************************
// S Magierowski Mar 5 2026
/*
Lane arithmetic and configuration checks.  No simulator needed; every check
is an assert_always so a failure stops the run with a message.
*/

#include "BridgeConfig.hpp"
#include "LaneDecomposer.hpp"
#include <cascade/Cascade.hpp>
#include <cstdio>

using sbridge::BridgeConfig;
using sbridge::LaneDecomposer;

static BridgeConfig lanes4() {
  BridgeConfig c;
  c.data_width = 32;
  c.chip_width = 8;
  return c;
}

// every non-empty mask drains in one step per pending lane, lanes strictly increasing
static void test_mask_drain() {
  const LaneDecomposer d(lanes4());
  for (uint32_t mask = 1; mask <= 0xf; ++mask) {
    uint32_t m = mask;
    int steps = 0;
    int prev = -1;
    while (m != 0) {
      const int lane = d.select_lane(m);
      assert_always(lane > prev, "mask 0x%x: lane %d after lane %d", mask, lane, prev);
      assert_always((m & d.lane_mask(lane)) != 0, "mask 0x%x: selected lane %d not pending", mask, lane);
      const uint32_t n = d.next_mask(m);
      assert_always(n == (m & ~d.lane_mask(lane)), "next_mask touched other lanes");
      prev = lane;
      m = n;
      ++steps;
    }
    assert_always(steps == __builtin_popcount(mask), "mask 0x%x drained in %d steps", mask, steps);
  }
}

static void test_lowest_lane_first() {
  const LaneDecomposer d(lanes4());
  assert_always(d.select_lane(0xc) == 2, "lanes {2,3}: first lane must be 2");
  assert_always(d.next_mask(0xc) == 0x8, "lanes {2,3}: residual must be {3}");
  assert_always(d.select_lane(0x8) == 3, "lane {3}: lane 3");
  assert_always(d.next_mask(0x8) == 0x0, "lane {3}: residual empty");
  assert_always(d.select_lane(0x0) == 0, "empty mask defaults to lane 0");
  assert_always(d.next_mask(0x0) == 0x0, "empty mask stays empty");
  assert_always(d.next_mask(0xf0 | 0x1) == 0x0, "sel bits above the bus width are dropped");
}

// 16-bit lanes: a lane is pending while either of its bytes is selected
static void test_wide_lanes() {
  BridgeConfig c;
  c.data_width = 32;
  c.chip_width = 16;
  const LaneDecomposer d(c);
  assert_always(d.lanes() == 2, "32/16 gives two lanes");
  assert_always(d.select_lane(0x4) == 1, "byte 2 belongs to lane 1");
  assert_always(d.next_mask(0x6) == 0x4, "byte 1 retires lane 0 only");
  assert_always(d.pending_lanes(0x9) == 2, "bytes 0 and 3 touch both lanes");
  assert_always(d.lane_byte_enable(0x4, 1) == 0x2, "byte 2 alone: lane 1 BE_n=0b10");
  assert_always(d.lane_byte_enable(0xf, 0) == 0x0, "full lane: BE_n all low");
  assert_always(d.lane_byte_enable(0x0, 0) == 0x3, "empty lane: BE_n all high");
}

static void test_addresses() {
  BridgeConfig c1;
  c1.data_width = 32; c1.chip_width = 32; c1.addr_width = 10;
  const LaneDecomposer d1(c1);
  assert_always(d1.lane_address(0x155, 0) == 0x155, "single lane keeps the word address");

  BridgeConfig c2;
  c2.data_width = 32; c2.chip_width = 16; c2.addr_width = 10;
  const LaneDecomposer d2(c2);
  assert_always(d2.lane_address(0x155, 0) == 0x2aa, "2 lanes: lane 0 in bit 0");
  assert_always(d2.lane_address(0x155, 1) == 0x2ab, "2 lanes: lane 1 in bit 0");

  BridgeConfig c4 = lanes4();
  c4.addr_width = 10;
  const LaneDecomposer d4(c4);
  for (int l = 0; l < 4; ++l)
    assert_always(d4.lane_address(0x3ff, l) == (0xffcu | (uint32_t)l), "4 lanes: lane %d in bits 1:0", l);
  assert_always(d4.lane_address(0x7ff, 1) == 0xffd, "address bits above addr_width are dropped");
}

static void test_data_slices() {
  const LaneDecomposer d(lanes4());
  const uint64_t w = 0xddccbbaaull;
  assert_always(d.lane_data(w, 0) == 0xaa, "lane 0 slice");
  assert_always(d.lane_data(w, 3) == 0xdd, "lane 3 slice");
  uint64_t r = 0;
  r = d.merge_lane(r, 2, 0x1cc); // stray bits above the lane are masked
  r = d.merge_lane(r, 0, 0xaa);
  assert_always(r == 0x00cc00aaull, "merge places slices at their lanes");
  r = d.merge_lane(r, 2, 0x11);
  assert_always(r == 0x001100aaull, "merge overwrites its own lane only");

  BridgeConfig c64;
  c64.data_width = 64; c64.chip_width = 64;
  const LaneDecomposer d64(c64);
  assert_always(d64.lane_data(~0ull, 0) == ~0ull, "64-bit single lane passes the whole word");
  assert_always(d64.merge_lane(0, 0, 0x0123456789abcdefull) == 0x0123456789abcdefull, "64-bit merge");
}

static void test_config_checks() {
  BridgeConfig ok;
  assert_always(ok.check().empty(), "defaults must be valid: %s", ok.check().c_str());

  BridgeConfig c = ok;
  c.read_active = 1; c.fast_read = true;
  assert_always(!c.check().empty(), "fast_read with read_active=1 must be rejected");
  c.read_active = 2;
  assert_always(c.check().empty(), "fast_read with read_active=2 is fine");

  int BridgeConfig::* const phases[] = {
    &BridgeConfig::read_active, &BridgeConfig::read_turnaround,
    &BridgeConfig::write_active, &BridgeConfig::write_turnaround };
  for (auto p : phases) {
    BridgeConfig z = ok;
    z.*p = 0;
    assert_always(!z.check().empty(), "zero phase length must be rejected");
    z.*p = -3;
    assert_always(!z.check().empty(), "negative phase length must be rejected");
  }

  c = ok; c.data_width = 32; c.chip_width = 24;
  assert_always(!c.check().empty(), "32/24 is not an integer number of lanes");
  c = ok; c.data_width = 64; c.chip_width = 8;
  assert_always(!c.check().empty(), "8 lanes are not supported");
  c = ok; c.chip_width = 12;
  assert_always(!c.check().empty(), "chip width must be whole bytes");
  c = ok; c.t_co = -1;
  assert_always(!c.check().empty(), "negative latency must be rejected");
  c = ok; c.addr_width = 31; // plus 2 lane bits
  assert_always(!c.check().empty(), "chip address wider than 32 bits must be rejected");

  c = ok; c.t_co = 1; c.t_idelay = 2;
  assert_always(c.min_read_active(2) == 5, "round trip adds both latencies");
}

int main() {
  test_mask_drain();
  test_lowest_lane_first();
  test_wide_lanes();
  test_addresses();
  test_data_slices();
  test_config_checks();
  printf("[PASS] test_decomposer\n");
  return 0;
}
