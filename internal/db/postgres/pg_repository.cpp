#include "pg_repository.hpp"

#include "internal/db/sql/codec.hpp"

namespace miner::db::postgres {

namespace {

std::optional<std::string> OptionalVector(const std::optional<model::Embedding>& v) {
  if (!v) return std::nullopt;
  return sql::EncodeEmbedding(*v);
}

std::vector<std::string> TextArray(const pqxx::field& f) {
  if (f.is_null()) return {};
  return sql::DecodePgTextArray(f.c_str()).value_or(std::vector<std::string>{});
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::foreign_key_violation*>(&e) ||
      dynamic_cast<const pqxx::not_null_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertArtist(Transaction& t, model::ArtistRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_artist", r.name);
    r.id     = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArtistRecord> PgRepository::GetArtistByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_artist_by_name", name);
  if (res.empty()) return std::nullopt;

  model::ArtistRecord r;
  r.id   = res[0][0].as<std::int64_t>();
  r.name = res[0][1].c_str();
  return r;
}

Result PgRepository::UpsertSong(Transaction& t, model::SongRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_song", r.yt_video_id, r.title, r.duration_seconds, r.album, r.movie, r.language, r.country,
                                          sql::EncodePgTextArray(r.cast), r.music_director, r.lyricist, r.official_lyrics,
                                          sql::EncodePgTextArray(r.singers), r.summary, r.artist_id);
    r.id     = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SongRecord> PgRepository::GetSongByVideoId(Transaction& t, const std::string& yt_video_id) {
  auto res = TX(t).Work().exec_prepared("get_song_by_video_id", yt_video_id);
  if (res.empty()) return std::nullopt;

  const auto&       row = res[0];
  model::SongRecord r;
  r.id               = row[0].as<std::int64_t>();
  r.yt_video_id      = row[1].c_str();
  r.title            = row[2].c_str();
  r.duration_seconds = row[3].as<std::int32_t>();
  r.album            = Text(row[4]);
  r.movie            = Text(row[5]);
  r.language         = Text(row[6]);
  r.country          = Text(row[7]);
  r.cast             = TextArray(row[8]);
  r.music_director   = Text(row[9]);
  r.lyricist         = Text(row[10]);
  r.official_lyrics  = Text(row[11]);
  r.singers          = TextArray(row[12]);
  r.summary          = Text(row[13]);
  r.artist_id        = row[14].as<std::int64_t>();
  return r;
}

Result PgRepository::UpsertSongContext(Transaction& t, const model::SongContextRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_song_context", r.song_id, r.visual_description, r.transcript, sql::EncodePgTextArray(r.emotional_tags),
                               OptionalVector(r.visual_vector), OptionalVector(r.transcript_vector), sql::EncodeEmbedding(r.combined_vector),
                               static_cast<std::int64_t>(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SongContextRecord> PgRepository::GetSongContext(Transaction& t, std::int64_t song_id) {
  auto res = TX(t).Work().exec_prepared("get_song_context", song_id);
  if (res.empty()) return std::nullopt;

  const auto&              row = res[0];
  model::SongContextRecord r;
  r.song_id            = row[0].as<std::int64_t>();
  r.visual_description = Text(row[1]);
  r.transcript         = Text(row[2]);
  r.emotional_tags     = TextArray(row[3]);
  if (!row[4].is_null()) r.visual_vector = sql::DecodeEmbedding(row[4].c_str());
  if (!row[5].is_null()) r.transcript_vector = sql::DecodeEmbedding(row[5].c_str());
  r.combined_vector = sql::DecodeEmbedding(Text(row[6])).value_or(model::Embedding{});
  r.updated_at_ms   = row[7].as<std::uint64_t>();
  return r;
}

} // namespace miner::db::postgres
