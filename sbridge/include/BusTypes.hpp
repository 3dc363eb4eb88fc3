// **********************************************************************
// sbridge/include/BusTypes.hpp
// **********************************************************************
// S Magierowski Mar 3 2026

#pragma once
#include <cascade/Cascade.hpp>

// Bus transaction packets carried on the bridge's FIFO ports.
// One request is one bus word; sel picks the participating bytes.
struct BusReq {
  u32  addr  = 0;     // word address
  u64  wdata = 0;     // write data
  u8   sel   = 0xff;  // byte select, bit i = byte i (bits above the bus width ignored)
  bit  write = false; // write=1 store, write=0 load
  u16  id    = 0;     // transaction id (master-provided)
};

struct BusResp {
  u64  rdata = 0;     // read data (zero for writes)
  u16  id    = 0;     // id of the request being answered
  bit  write = false; // answers a store
  bit  last  = true;  // final response of this transaction (clear only for per-lane read acks)
};
