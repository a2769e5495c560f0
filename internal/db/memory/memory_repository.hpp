#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace miner::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertArtist(Transaction&, model::ArtistRecord&) override;
  std::optional<model::ArtistRecord> GetArtistByName(Transaction&, const std::string&) override;

  Result                           UpsertSong(Transaction&, model::SongRecord&) override;
  std::optional<model::SongRecord> GetSongByVideoId(Transaction&, const std::string&) override;

  Result                                  UpsertSongContext(Transaction&, const model::SongContextRecord&) override;
  std::optional<model::SongContextRecord> GetSongContext(Transaction&, std::int64_t) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ArtistRecord>       artists; // by name
    std::unordered_map<std::string, model::SongRecord>         songs;   // by yt_video_id
    std::unordered_map<std::int64_t, model::SongContextRecord> contexts;

    std::int64_t next_artist_id = 1;
    std::int64_t next_song_id   = 1;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace miner::db::memory
