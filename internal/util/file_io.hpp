#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace miner::util {

/*
  Atomic write:
      write <path>.tmp -> fsync -> rename

  Readers never observe a partially written file at `path`. Throws
  std::runtime_error on any I/O failure; the temporary file is removed.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view contents);

// nullopt if the file does not exist or cannot be read
std::optional<std::string> ReadFile(const std::filesystem::path& path);

std::uint64_t Fnv1a64(std::string_view data);
std::string   Fnv1a64Hex(std::string_view data);

} // namespace miner::util
