// **********************************************************************
// sbridge/src/BusTester.cpp
// **********************************************************************
// S Magierowski Mar 3 2026

#include "BusTester.hpp"

using namespace Cascade;

BusTester::BusTester(std::string /*name*/, IMPL_CTOR) {
  UPDATE(update_issue).writes(m_req);
  UPDATE(update_retire).reads(m_resp);
}

void BusTester::enqueue_store(uint32_t addr, uint64_t data, uint8_t sel) {
  script_.push_back(Op{STORE, addr, data, sel});
}
void BusTester::enqueue_load(uint32_t addr, uint8_t sel) {
  script_.push_back(Op{LOAD, addr, 0ull, sel});
}

void BusTester::update_issue() {
  cyc_++;

  if (pc_ < script_.size() && !m_req.full()) {
    const Op &op = script_[pc_];
    BusReq r{};
    r.addr  = (u32)op.addr;
    r.sel   = (u8)op.sel;
    r.id    = (u16)next_id_++;
    if (op.kind == STORE) {
      r.write = true;
      r.wdata = (u64)op.data;
      pending_[r.id] = Pending{false, cyc_, 0};
    } else {
      r.write = false;
      pending_[r.id] = Pending{true, cyc_, 0};
    }
    trace("tester: issue id=%u %s adr=0x%x sel=0x%x\n", (unsigned)(uint16_t)r.id,
          op.kind == STORE ? "st" : "ld", op.addr, (unsigned)op.sel);
    m_req.push(r);
    pc_++;
  }
}

void BusTester::update_retire() {
  if (!m_resp.empty()) {
    auto rr = m_resp.pop();
    auto it = pending_.find((uint16_t)rr.id);
    if (it == pending_.end()) {
      trace("tester: response for unknown id=%u\n", (unsigned)(uint16_t)rr.id);
      return;
    }
    it->second.lane_resps++;
    if (!(bool)rr.last) return;
    Ev e{};
    e.id = (uint16_t)rr.id;
    e.is_load = it->second.is_load;
    e.sent_cyc = it->second.sent_cyc;
    e.resp_cyc = cyc_;
    e.rdata = (uint64_t)rr.rdata;
    e.lane_resps = it->second.lane_resps;
    results_.push_back(e);
    pending_.erase(it);
  }
}

void BusTester::reset() {
  cyc_ = 0;
  pc_ = 0;
  next_id_ = 0;
  results_.clear();
  pending_.clear();
}
