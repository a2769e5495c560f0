#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/codec.hpp"

namespace miner::db::sqlite {

using miner::db::ErrorCode;
using miner::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalEmbedding(sqlite3_stmt* st, int idx, const std::optional<model::Embedding>& v) {
  if (v) {
    BindText(st, idx, sql::EncodeEmbedding(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Artist
// ------------------------------------------------------------------

Result SqliteRepository::UpsertArtist(Transaction& t, model::ArtistRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO \"Artist\"(name) VALUES(?) "
      "ON CONFLICT(name) DO UPDATE SET name=excluded.name RETURNING id;";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  r.id = ColI64(st.get(), 0);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ArtistRecord> SqliteRepository::GetArtistByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT id,name FROM \"Artist\" WHERE name=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ArtistRecord r;
  r.id   = ColI64(st.get(), 0);
  r.name = ColText(st.get(), 1);
  return r;
}

// ------------------------------------------------------------------
// Song
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSong(Transaction& t, model::SongRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO \"Song\"(\"ytVideoId\",title,\"durationSeconds\",album,movie,language,country,\"cast\","
      "\"musicDirector\",lyricist,\"officialLyrics\",singers,summary,\"artistId\") "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(\"ytVideoId\") DO UPDATE SET title=excluded.title, \"durationSeconds\"=excluded.\"durationSeconds\", "
      "album=excluded.album, movie=excluded.movie, language=excluded.language, country=excluded.country, "
      "\"cast\"=excluded.\"cast\", \"musicDirector\"=excluded.\"musicDirector\", lyricist=excluded.lyricist, "
      "\"officialLyrics\"=excluded.\"officialLyrics\", singers=excluded.singers, summary=excluded.summary, "
      "\"artistId\"=excluded.\"artistId\" "
      "RETURNING id;";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.yt_video_id);
  BindText(st.get(), 2, r.title);
  BindI64(st.get(), 3, r.duration_seconds);
  BindText(st.get(), 4, r.album);
  BindText(st.get(), 5, r.movie);
  BindText(st.get(), 6, r.language);
  BindText(st.get(), 7, r.country);
  BindText(st.get(), 8, sql::EncodeStringList(r.cast));
  BindText(st.get(), 9, r.music_director);
  BindText(st.get(), 10, r.lyricist);
  BindText(st.get(), 11, r.official_lyrics);
  BindText(st.get(), 12, sql::EncodeStringList(r.singers));
  BindText(st.get(), 13, r.summary);
  BindI64(st.get(), 14, r.artist_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  r.id = ColI64(st.get(), 0);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SongRecord> SqliteRepository::GetSongByVideoId(Transaction& t, const std::string& yt_video_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT id,\"ytVideoId\",title,\"durationSeconds\",album,movie,language,country,\"cast\","
      "\"musicDirector\",lyricist,\"officialLyrics\",singers,summary,\"artistId\" "
      "FROM \"Song\" WHERE \"ytVideoId\"=?;";

  auto st = Prepare(db, sql);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, yt_video_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::SongRecord r;
  r.id               = ColI64(st.get(), 0);
  r.yt_video_id      = ColText(st.get(), 1);
  r.title            = ColText(st.get(), 2);
  r.duration_seconds = static_cast<std::int32_t>(ColI64(st.get(), 3));
  r.album            = ColText(st.get(), 4);
  r.movie            = ColText(st.get(), 5);
  r.language         = ColText(st.get(), 6);
  r.country          = ColText(st.get(), 7);
  r.cast             = sql::DecodeStringList(ColText(st.get(), 8)).value_or(std::vector<std::string>{});
  r.music_director   = ColText(st.get(), 9);
  r.lyricist         = ColText(st.get(), 10);
  r.official_lyrics  = ColText(st.get(), 11);
  r.singers          = sql::DecodeStringList(ColText(st.get(), 12)).value_or(std::vector<std::string>{});
  r.summary          = ColText(st.get(), 13);
  r.artist_id        = ColI64(st.get(), 14);
  return r;
}

// ------------------------------------------------------------------
// SongContext
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSongContext(Transaction& t, const model::SongContextRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO \"SongContext\"(\"songId\",\"visualDescription\",transcript,\"emotionalTags\","
      "\"visualVector\",\"transcriptVector\",\"combinedVector\",\"updatedAt\") "
      "VALUES(?,?,?,?,?,?,?,?) "
      "ON CONFLICT(\"songId\") DO UPDATE SET \"visualDescription\"=excluded.\"visualDescription\", "
      "transcript=excluded.transcript, \"emotionalTags\"=excluded.\"emotionalTags\", "
      "\"visualVector\"=excluded.\"visualVector\", \"transcriptVector\"=excluded.\"transcriptVector\", "
      "\"combinedVector\"=excluded.\"combinedVector\", \"updatedAt\"=excluded.\"updatedAt\";";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.song_id);
  BindText(st.get(), 2, r.visual_description);
  BindText(st.get(), 3, r.transcript);
  BindText(st.get(), 4, sql::EncodeStringList(r.emotional_tags));
  BindOptionalEmbedding(st.get(), 5, r.visual_vector);
  BindOptionalEmbedding(st.get(), 6, r.transcript_vector);
  BindText(st.get(), 7, sql::EncodeEmbedding(r.combined_vector));
  BindI64(st.get(), 8, static_cast<std::int64_t>(r.updated_at_ms));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SongContextRecord> SqliteRepository::GetSongContext(Transaction& t, std::int64_t song_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT \"songId\",\"visualDescription\",transcript,\"emotionalTags\",\"visualVector\","
      "\"transcriptVector\",\"combinedVector\",\"updatedAt\" FROM \"SongContext\" WHERE \"songId\"=?;";

  auto st = Prepare(db, sql);
  if (!st) return std::nullopt;

  BindI64(st.get(), 1, song_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::SongContextRecord r;
  r.song_id            = ColI64(st.get(), 0);
  r.visual_description = ColText(st.get(), 1);
  r.transcript         = ColText(st.get(), 2);
  r.emotional_tags     = sql::DecodeStringList(ColText(st.get(), 3)).value_or(std::vector<std::string>{});
  if (!ColIsNull(st.get(), 4)) r.visual_vector = sql::DecodeEmbedding(ColText(st.get(), 4));
  if (!ColIsNull(st.get(), 5)) r.transcript_vector = sql::DecodeEmbedding(ColText(st.get(), 5));
  r.combined_vector = sql::DecodeEmbedding(ColText(st.get(), 6)).value_or(model::Embedding{});
  r.updated_at_ms   = static_cast<std::uint64_t>(ColI64(st.get(), 7));
  return r;
}

} // namespace miner::db::sqlite
