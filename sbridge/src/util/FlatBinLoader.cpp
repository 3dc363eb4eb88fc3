// **********************************************************************
// sbridge/src/util/FlatBinLoader.cpp
// **********************************************************************
// S Magierowski Mar 4 2026

#include "FlatBinLoader.hpp"
#include "SramChip.hpp"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

bool load_flat_bin(const std::string& path, SramChip* sram, uint64_t base_addr, uint64_t* bytes_loaded_out) {
  if (!sram) return false;
  std::ifstream f(path, std::ios::binary); // open file in binary mode
  if (!f) return false;

  std::vector<uint8_t> buf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>()); // slurp file into buf[]
  if (buf.empty()) return false;

  // image must fit entirely, no partial loads
  if (base_addr > sram->get_size() || buf.size() > sram->get_size() - base_addr) return false;

  sram->write(base_addr, buf.data(), buf.size());

  if (bytes_loaded_out) *bytes_loaded_out = (uint64_t)buf.size();
  return true;
}
