#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace miner::db::model {

/*
  Song row.

  yt_video_id is the external key every upsert is keyed on; id is the
  backend-assigned surrogate used by SongContext.
*/

struct SongRecord {
  std::int64_t id = 0;
  std::string  yt_video_id;

  std::string  title;
  std::int32_t duration_seconds = 0;

  std::string album;
  std::string movie;
  std::string language;
  std::string country;

  std::vector<std::string> cast;
  std::string              music_director;
  std::string              lyricist;
  std::string              official_lyrics;
  std::vector<std::string> singers;
  std::string              summary;

  std::int64_t artist_id = 0;
};

} // namespace miner::db::model
