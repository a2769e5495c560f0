#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace miner::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertArtist(Transaction& t, model::ArtistRecord& r) {
  if (r.name.empty()) return Result::Err(ErrorCode::ConstraintViolation, "artist name must not be empty");

  auto& s  = TX(t).Mutable();
  auto  it = s.artists.find(r.name);
  if (it != s.artists.end()) {
    r.id = it->second.id;
    return Result::Ok();
  }

  r.id = s.next_artist_id++;
  s.artists.emplace(r.name, r);
  return Result::Ok();
}

std::optional<model::ArtistRecord> MemoryRepository::GetArtistByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.artists.find(name);
  if (it == s.artists.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertSong(Transaction& t, model::SongRecord& r) {
  if (r.yt_video_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "song key must not be empty");

  auto& s = TX(t).Mutable();

  bool artist_exists = false;
  for (const auto& [_, artist] : s.artists) {
    if (artist.id == r.artist_id) {
      artist_exists = true;
      break;
    }
  }
  if (!artist_exists) return Result::Err(ErrorCode::ConstraintViolation, "artist does not exist");

  auto it = s.songs.find(r.yt_video_id);
  if (it != s.songs.end()) {
    r.id       = it->second.id;
    it->second = r;
    return Result::Ok();
  }

  r.id = s.next_song_id++;
  s.songs.emplace(r.yt_video_id, r);
  return Result::Ok();
}

std::optional<model::SongRecord> MemoryRepository::GetSongByVideoId(Transaction& t, const std::string& yt_video_id) {
  const auto& s  = TX(t).View();
  auto        it = s.songs.find(yt_video_id);
  if (it == s.songs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertSongContext(Transaction& t, const model::SongContextRecord& r) {
  auto& s = TX(t).Mutable();

  bool song_exists = false;
  for (const auto& [_, song] : s.songs) {
    if (song.id == r.song_id) {
      song_exists = true;
      break;
    }
  }
  if (!song_exists) return Result::Err(ErrorCode::ConstraintViolation, "song does not exist");

  s.contexts[r.song_id] = r;
  return Result::Ok();
}

std::optional<model::SongContextRecord> MemoryRepository::GetSongContext(Transaction& t, std::int64_t song_id) {
  const auto& s  = TX(t).View();
  auto        it = s.contexts.find(song_id);
  if (it == s.contexts.end()) return std::nullopt;
  return it->second;
}

} // namespace miner::db::memory
