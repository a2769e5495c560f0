#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace miner::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertArtist(Transaction&, model::ArtistRecord&) override;
  std::optional<model::ArtistRecord> GetArtistByName(Transaction&, const std::string&) override;

  Result                           UpsertSong(Transaction&, model::SongRecord&) override;
  std::optional<model::SongRecord> GetSongByVideoId(Transaction&, const std::string&) override;

  Result                                  UpsertSongContext(Transaction&, const model::SongContextRecord&) override;
  std::optional<model::SongContextRecord> GetSongContext(Transaction&, std::int64_t) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace miner::db::postgres
