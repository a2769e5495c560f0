#include "pg_pool.hpp"

namespace miner::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_artist",
               "INSERT INTO \"Artist\"(name) VALUES($1) "
               "ON CONFLICT(name) DO UPDATE SET name=EXCLUDED.name RETURNING id");

  conn.prepare("get_artist_by_name", "SELECT id, name FROM \"Artist\" WHERE name=$1");

  conn.prepare("upsert_song",
               "INSERT INTO \"Song\"(\"ytVideoId\",title,\"durationSeconds\",album,movie,language,country,\"cast\","
               "\"musicDirector\",lyricist,\"officialLyrics\",singers,summary,\"artistId\") "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8::text[],$9,$10,$11,$12::text[],$13,$14) "
               "ON CONFLICT(\"ytVideoId\") DO UPDATE SET title=EXCLUDED.title, \"durationSeconds\"=EXCLUDED.\"durationSeconds\", "
               "album=EXCLUDED.album, movie=EXCLUDED.movie, language=EXCLUDED.language, country=EXCLUDED.country, "
               "\"cast\"=EXCLUDED.\"cast\", \"musicDirector\"=EXCLUDED.\"musicDirector\", lyricist=EXCLUDED.lyricist, "
               "\"officialLyrics\"=EXCLUDED.\"officialLyrics\", singers=EXCLUDED.singers, summary=EXCLUDED.summary, "
               "\"artistId\"=EXCLUDED.\"artistId\" RETURNING id");

  conn.prepare("get_song_by_video_id",
               "SELECT id,\"ytVideoId\",title,\"durationSeconds\",album,movie,language,country,\"cast\"::text,"
               "\"musicDirector\",lyricist,\"officialLyrics\",singers::text,summary,\"artistId\" "
               "FROM \"Song\" WHERE \"ytVideoId\"=$1");

  conn.prepare("upsert_song_context",
               "INSERT INTO \"SongContext\"(\"songId\",\"visualDescription\",transcript,\"emotionalTags\","
               "\"visualVector\",\"transcriptVector\",\"combinedVector\",\"updatedAt\") "
               "VALUES($1,$2,$3,$4::text[],$5::vector,$6::vector,$7::vector,to_timestamp($8::bigint / 1000.0)) "
               "ON CONFLICT(\"songId\") DO UPDATE SET \"visualDescription\"=EXCLUDED.\"visualDescription\", "
               "transcript=EXCLUDED.transcript, \"emotionalTags\"=EXCLUDED.\"emotionalTags\", "
               "\"visualVector\"=EXCLUDED.\"visualVector\", \"transcriptVector\"=EXCLUDED.\"transcriptVector\", "
               "\"combinedVector\"=EXCLUDED.\"combinedVector\", \"updatedAt\"=EXCLUDED.\"updatedAt\"");

  conn.prepare("get_song_context",
               "SELECT \"songId\",\"visualDescription\",transcript,\"emotionalTags\"::text,\"visualVector\"::text,"
               "\"transcriptVector\"::text,\"combinedVector\"::text,"
               "(extract(epoch FROM \"updatedAt\") * 1000)::bigint "
               "FROM \"SongContext\" WHERE \"songId\"=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace miner::db::postgres
