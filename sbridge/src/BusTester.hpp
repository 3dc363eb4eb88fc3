// **********************************************************************
// sbridge/src/BusTester.hpp
// **********************************************************************
// S Magierowski Mar 3 2026
/*
Scripted bus master for the bridge: issues one scripted op per cycle while
m_req has room and records every response with cycle stamps.
*/

#pragma once
#include <cascade/Cascade.hpp>
#include "BusTypes.hpp"
#include <vector>
#include <unordered_map>

class BusTester : public Component {
  DECLARE_COMPONENT(BusTester);
public:
  BusTester(std::string name, COMPONENT_CTOR);

  Clock(clk);

  // Bus master ports
  FifoOutput(BusReq,  m_req);
  FifoInput (BusResp, m_resp);

  // Scripted ops
  enum Kind : uint8_t { LOAD=0, STORE=1 };
  struct Op { Kind kind; uint32_t addr; uint64_t data; uint8_t sel; };

  // Result record (one per final response; lane responses only counted)
  struct Ev { uint16_t id; bool is_load; uint64_t sent_cyc; uint64_t resp_cyc; uint64_t rdata; int lane_resps; };

  // Host helpers to build scripts and inspect results
  void enqueue_store(uint32_t addr, uint64_t data, uint8_t sel=0xff);
  void enqueue_load(uint32_t addr, uint8_t sel=0xff);
  const std::vector<Ev>& results() const { return results_; }
  bool     done()  const { return pc_ == script_.size() && pending_.empty(); }
  uint64_t cycle() const { return cyc_; }

  void update_issue();   // reads internal state, writes m_req
  void update_retire();  // reads m_resp, writes internal state
  void reset();

private:
  uint64_t cyc_ = 0;

  std::vector<Op> script_;
  size_t pc_ = 0;

  uint16_t next_id_ = 0;
  struct Pending { bool is_load; uint64_t sent_cyc; int lane_resps; };
  std::unordered_map<uint16_t, Pending> pending_;

  std::vector<Ev> results_;
};
