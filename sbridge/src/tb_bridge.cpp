// **********************************************************************
// sbridge/src/tb_bridge.cpp
// **********************************************************************
// S Magierowski Mar 4 2026
/*
Testbench/simulator for the bus-to-SRAM bridge.

  BusTester ==> SramBridge --pins--> SramChip

Runs a random store/load-back pattern with random byte selects against a
shadow copy of memory, then prints statistics.
*/

#include <descore/Parameter.hpp>

#include "BridgeConfig.hpp"
#include "BusTester.hpp"
#include "Diagnostics.hpp"
#include "SramBridge.hpp"
#include "SramChip.hpp"
#include "util/FlatBinLoader.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdio>
#include <random>
#include <string>
#include <vector>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");
IntParameter(addr_width, 16, "Bus word-address bits");
IntParameter(data_width, 32, "Bus data bits");
IntParameter(chip_width, 8, "Chip data bits (one lane)");
BoolParameter(byte_enables, false, "Chips have byte-enable pins (otherwise one CE per byte)");
IntParameter(read_active, 3, "Read phase length in cycles");
IntParameter(read_turnaround, 1, "Cycles after a read before the bus is reused");
IntParameter(write_active, 2, "Write pulse length in cycles");
IntParameter(write_turnaround, 1, "Cycles after a write pulse before the bus is reused");
BoolParameter(fast_read, false, "Chain back-to-back reads without turnaround");
BoolParameter(lane_acks, false, "Ack every read lane instead of once per transaction");
IntParameter(t_co, 0, "Output latency to the chip pins in cycles");
IntParameter(t_idelay, 0, "Read data input latency in cycles");
IntParameter(access_ticks, 2, "SRAM access time in cycles");
IntParameter(write_ticks, 1, "SRAM minimum write pulse in cycles");
IntParameter(txns, 256, "Random store/load pairs to run");
IntParameter(window, 64, "Distinct word addresses touched by the random pattern");
IntParameter(seed, 1, "Random seed");
IntParameter(max_cycles, 1000000, "Give up after this many cycles");
StringParameter(image, "", "Flat binary to preload into SRAM");
IntParameter(image_addr, 0x0, "Bus byte address for the preloaded image");

// expected word after a masked store
static uint64_t merge_bytes(uint64_t old, uint64_t data, uint32_t sel, int bytes) {
  for (int b = 0; b < bytes; ++b) {
    if (!(sel & (1u << b))) continue;
    const uint64_t m = 0xffull << (8 * b);
    old = (old & ~m) | (data & m);
  }
  return old;
}

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  sbridge::BridgeConfig cfg;
  cfg.addr_width       = static_cast<int>(addr_width);
  cfg.data_width       = static_cast<int>(data_width);
  cfg.chip_width       = static_cast<int>(chip_width);
  cfg.byte_enables     = static_cast<bool>(byte_enables);
  cfg.read_active      = static_cast<int>(read_active);
  cfg.read_turnaround  = static_cast<int>(read_turnaround);
  cfg.write_active     = static_cast<int>(write_active);
  cfg.write_turnaround = static_cast<int>(write_turnaround);
  cfg.fast_read        = static_cast<bool>(fast_read);
  cfg.lane_acks        = static_cast<bool>(lane_acks);
  cfg.t_co             = static_cast<int>(t_co);
  cfg.t_idelay         = static_cast<int>(t_idelay);
  const std::string err = cfg.check();
  if (!err.empty()) {
    fprintf(stderr, "[CONFIG] %s\n", err.c_str());
    return 2;
  }
  assert_always(cfg.read_active >= cfg.min_read_active(static_cast<int>(access_ticks)),
                "read_active=%d cannot cover access time %d plus %d cycles of latency",
                cfg.read_active, static_cast<int>(access_ticks), cfg.t_co + cfg.t_idelay);

  // **************
  // Step 2: Create components
  // **************
  BusTester tester("tester");
  SramBridge bridge("bridge", cfg);
  SramChip sram(cfg, static_cast<int>(access_ticks), static_cast<int>(write_ticks));
  bridge.attach_chip(&sram);
  bridge.in_bus_req << tester.m_req;
  tester.m_resp << bridge.out_bus_resp;

  // **************
  // Step 3: Optional: list component instance names & exit
  // **************
  if (showcontexts) {
    Sim::dumpComponentNames();
    return 0;
  }

  // **************
  // Step 4: Hook clock and initialize & reset simulator
  // **************
  Clock clk;
  tester.clk << clk;
  bridge.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 5: Preload SRAM and build the script
  // **************
  std::string image_path = std::string(image);
  if (!image_path.empty()) {
    uint64_t nbytes = 0;
    bool ok = load_flat_bin(image_path, &sram, static_cast<uint64_t>(static_cast<int>(image_addr)), &nbytes);
    assert_always(ok, "Image load failed");
    printf("[LOAD] %llu bytes at 0x%x\n", (unsigned long long)nbytes, static_cast<int>(image_addr));
  }

  const int bus_bytes = cfg.bus_bytes();
  const uint32_t full_sel = (1u << bus_bytes) - 1u;
  const uint32_t words = 1u << (cfg.addr_width < 20 ? cfg.addr_width : 20);
  uint32_t span = static_cast<uint32_t>(static_cast<int>(window));
  if (span == 0 || span > words) span = words;

  std::mt19937_64 rng(static_cast<uint64_t>(static_cast<int>(seed)));
  std::vector<uint64_t> shadow(span);
  for (uint32_t a = 0; a < span; ++a) shadow[a] = sram.read_word(a);

  struct Expect { uint32_t addr; uint64_t value; };
  std::vector<Expect> loads;
  const uint64_t data_mask = cfg.data_width == 64 ? ~0ull : ((1ull << cfg.data_width) - 1ull);
  for (int i = 0; i < static_cast<int>(txns); ++i) {
    const uint32_t a   = static_cast<uint32_t>(rng() % span);
    const uint64_t d   = rng() & data_mask;
    uint32_t sel = static_cast<uint32_t>(rng()) & full_sel;
    if (sel == 0) sel = full_sel;
    tester.enqueue_store(a, d, static_cast<uint8_t>(sel));
    shadow[a] = merge_bytes(shadow[a], d, sel, bus_bytes);
    tester.enqueue_load(a, static_cast<uint8_t>(full_sel));
    loads.push_back(Expect{a, shadow[a]});
  }

  // **************
  // Step 6: Run simulation
  // **************
  while (!tester.done() && tester.cycle() < static_cast<uint64_t>(static_cast<int>(max_cycles))) {
    Sim::run(1000);
  }
  assert_always(tester.done(), "Bridge did not drain the script in %d cycles", static_cast<int>(max_cycles));

  // **************
  // Step 7: Check results and report
  // **************
  size_t li = 0;
  int mismatches = 0;
  for (const auto& e : tester.results()) {
    if (!e.is_load) continue;
    assert_always(li < loads.size(), "More load responses than loads issued");
    const Expect& x = loads[li++];
    if (e.rdata != x.value) {
      if (mismatches < 8)
        printf("[MISMATCH] id=%u adr=0x%x got=0x%016llx want=0x%016llx\n",
               e.id, x.addr, (unsigned long long)e.rdata, (unsigned long long)x.value);
      ++mismatches;
    }
  }
  assert_always(li == loads.size(), "Missing load responses");

  sbridge::report_bridge_stats(bridge, sram, tester.cycle());
  if (mismatches) {
    printf("[FAIL] %d of %zu loads mismatched\n", mismatches, loads.size());
    return 1;
  }
  printf("[PASS] %zu store/load pairs verified\n", loads.size());
  return 0;
}
