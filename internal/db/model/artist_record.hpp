#pragma once

#include <cstdint>
#include <string>

namespace miner::db::model {

struct ArtistRecord {
  std::int64_t id = 0;

  // unique
  std::string name;
};

} // namespace miner::db::model
