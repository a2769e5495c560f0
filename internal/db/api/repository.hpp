#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artist_record.hpp"
#include "internal/db/model/song_context_record.hpp"
#include "internal/db/model/song_record.hpp"

namespace miner::db {

/*
  Repository abstraction over the song store.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Upserts are idempotent on the natural key:
      Artist      -> name
      Song        -> yt_video_id
      SongContext -> song_id
    and overwrite every other column on conflict
  - Upserts assign the surrogate id back into the record
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Artist
  // ---------------------------------------------------------------------

  virtual Result UpsertArtist(Transaction&, model::ArtistRecord&) = 0;

  virtual std::optional<model::ArtistRecord> GetArtistByName(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Song
  // ---------------------------------------------------------------------

  virtual Result UpsertSong(Transaction&, model::SongRecord&) = 0;

  virtual std::optional<model::SongRecord> GetSongByVideoId(Transaction&, const std::string& yt_video_id) = 0;

  // ---------------------------------------------------------------------
  // SongContext
  // ---------------------------------------------------------------------

  virtual Result UpsertSongContext(Transaction&, const model::SongContextRecord&) = 0;

  virtual std::optional<model::SongContextRecord> GetSongContext(Transaction&, std::int64_t song_id) = 0;
};

} // namespace miner::db
