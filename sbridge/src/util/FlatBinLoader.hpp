// **********************************************************************
// sbridge/src/util/FlatBinLoader.hpp
// **********************************************************************
// S Magierowski Mar 4 2026

#pragma once

#include <cstdint>
#include <string>

class SramChip; // forward decl (SramChip.hpp defines it)

/*
Load a flat binary image into the SRAM bank at a bus byte address.
- Bytes land exactly as in the file (little-endian bus words).
- Fails without writing anything if the image does not fit.
- Returns true on success; optionally writes the number of file bytes loaded.
*/
bool load_flat_bin(const std::string& path, SramChip* sram, uint64_t base_addr, uint64_t* bytes_loaded_out = nullptr);
