#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace miner::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertArtist(Transaction&, model::ArtistRecord&) override;
  std::optional<model::ArtistRecord> GetArtistByName(Transaction&, const std::string&) override;

  Result                           UpsertSong(Transaction&, model::SongRecord&) override;
  std::optional<model::SongRecord> GetSongByVideoId(Transaction&, const std::string&) override;

  Result                                  UpsertSongContext(Transaction&, const model::SongContextRecord&) override;
  std::optional<model::SongContextRecord> GetSongContext(Transaction&, std::int64_t) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace miner::db::sqlite
