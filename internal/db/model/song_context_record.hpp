#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace miner::db::model {

using Embedding = std::vector<float>;

/*
  Enrichment attached to a song (one row per song).

  Vectors are stored natively by postgres (pgvector) and as JSON text
  by sqlite. The narrative and transcript vectors are absent when the
  corresponding text was empty; the combined vector is always present.
*/

struct SongContextRecord {
  std::int64_t song_id = 0;

  std::string              visual_description;
  std::string              transcript;
  std::vector<std::string> emotional_tags;

  std::optional<Embedding> visual_vector;
  std::optional<Embedding> transcript_vector;
  Embedding                combined_vector;

  // epoch ms
  std::uint64_t updated_at_ms = 0;
};

} // namespace miner::db::model
