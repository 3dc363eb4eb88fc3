// **********************************************************************
// sbridge/src/test_bridge_sim.cpp
// **********************************************************************
// S Magierowski Mar 6 2026
/*
Testbench program.  Runs BusTester -> SramBridge -> SramChip under the
Cascade scheduler: masked stores, then a burst of back-to-back loads that
should chain through the fast-read path.
*/

#include "BusTester.hpp"
#include "Diagnostics.hpp"
#include "SramBridge.hpp"
#include "SramChip.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdint>
#include <iostream>
#include <vector>

int main() {
  sbridge::BridgeConfig cfg;
  cfg.addr_width       = 12;
  cfg.data_width       = 32;
  cfg.chip_width       = 8;
  cfg.read_active      = 3;
  cfg.read_turnaround  = 1;
  cfg.write_active     = 2;
  cfg.write_turnaround = 1;
  cfg.fast_read        = true;

  // bring up sim
  BusTester tester("tester");
  SramBridge bridge("bridge", cfg);
  SramChip sram(cfg, 2, 2);
  bridge.attach_chip(&sram);
  bridge.in_bus_req << tester.m_req;
  tester.m_resp << bridge.out_bus_resp;

  Clock clk;
  tester.clk << clk;
  bridge.clk << clk;
  clk.generateClock();

  Sim::init();
  Sim::reset();

  // words 0..7 preset, then stores with a rotating byte select
  const uint32_t N = 8;
  std::vector<uint64_t> expect(N);
  for (uint32_t i = 0; i < N; i++) {
    expect[i] = 0x01010101ull * (i + 1);
    sram.write_word(i, expect[i]);
  }
  const uint8_t sels[4] = {0xf, 0x3, 0xc, 0x9};
  for (uint32_t i = 0; i < N; i++) {
    const uint64_t d = 0xa0b0c0d0ull + i;
    const uint8_t  s = sels[i % 4];
    tester.enqueue_store(i, d, s);
    for (int b = 0; b < 4; b++)
      if (s & (1u << b)) {
        const uint64_t m = 0xffull << (8 * b);
        expect[i] = (expect[i] & ~m) | (d & m);
      }
  }
  for (uint32_t i = 0; i < N; i++) tester.enqueue_load(i);

  // run until every response is back
  while (!tester.done() && tester.cycle() < 10000) {
    Sim::run(1000);
  }
  if (!tester.done()) {
    std::cout << "Bridge stalled: " << tester.results().size() << " responses after "
              << tester.cycle() << " cycles" << std::endl;
    return 1;
  }

  // responses come back in issue order, one per transaction
  const auto& res = tester.results();
  if (res.size() != 2 * N) {
    std::cout << "Expected " << 2 * N << " responses, got " << res.size() << std::endl;
    return 1;
  }
  for (uint32_t i = 0; i < 2 * N; i++) {
    if (res[i].id != i || res[i].lane_resps != 1) {
      std::cout << "Response " << i << " out of order or split (id " << res[i].id << ")" << std::endl;
      return 1;
    }
    if (res[i].is_load != (i >= N)) {
      std::cout << "Response " << i << " has the wrong direction" << std::endl;
      return 1;
    }
  }
  for (uint32_t i = 0; i < N; i++) {
    const auto& e = res[N + i];
    if (e.rdata != expect[i]) {
      std::cout << "Error at word " << i << ": 0x" << std::hex << e.rdata
                << " != 0x" << expect[i] << std::dec << std::endl;
      return 1;
    }
    if (sram.read_word(i) != expect[i]) {
      std::cout << "SRAM word " << i << " not written as expected" << std::endl;
      return 1;
    }
  }

  const sbridge::SequencerStats& st = bridge.core().sequencer().stats();
  if (st.writes != N || st.reads != N) {
    std::cout << "Sequencer counted " << st.writes << " writes / " << st.reads << " reads" << std::endl;
    return 1;
  }
  if (st.fast_chains == 0) {
    std::cout << "Back-to-back loads never chained" << std::endl;
    return 1;
  }

  if (!bridge.quiet()) {
    std::cout << "Bridge not idle after the last response" << std::endl;
    return 1;
  }

  // synchronous reset while idle, then one more store/load through the same bridge
  bridge.pulse_reset();
  Sim::run(1000);
  tester.enqueue_store(20, 0x5a5a5a5aull, 0xf);
  tester.enqueue_load(20);
  while (!tester.done() && tester.cycle() < 20000) {
    Sim::run(1000);
  }
  if (!tester.done() || tester.results().back().rdata != 0x5a5a5a5aull || bridge.aborted() != 0) {
    std::cout << "Bridge did not recover cleanly from a reset pulse" << std::endl;
    return 1;
  }

  sbridge::report_bridge_stats(bridge, sram, tester.cycle());
  std::cout << "Bridge simulation successful!" << std::endl;
  return 0;
}
