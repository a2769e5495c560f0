#include "migrations.hpp"

namespace miner::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS \"Artist\" (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS \"Song\" (id INTEGER PRIMARY KEY AUTOINCREMENT, \"ytVideoId\" TEXT NOT NULL UNIQUE, title TEXT NOT NULL, "
      "\"durationSeconds\" INTEGER NOT NULL DEFAULT 0, album TEXT, movie TEXT, language TEXT, country TEXT, \"cast\" TEXT NOT NULL DEFAULT '[]', "
      "\"musicDirector\" TEXT, lyricist TEXT, \"officialLyrics\" TEXT, singers TEXT NOT NULL DEFAULT '[]', summary TEXT, "
      "\"artistId\" INTEGER NOT NULL REFERENCES \"Artist\"(id));",
      "CREATE TABLE IF NOT EXISTS \"SongContext\" (id INTEGER PRIMARY KEY AUTOINCREMENT, \"songId\" INTEGER NOT NULL UNIQUE REFERENCES \"Song\"(id) ON DELETE CASCADE, "
      "\"visualDescription\" TEXT, transcript TEXT, \"emotionalTags\" TEXT NOT NULL DEFAULT '[]', \"visualVector\" TEXT, \"transcriptVector\" TEXT, "
      "\"combinedVector\" TEXT NOT NULL, \"updatedAt\" INTEGER NOT NULL);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE EXTENSION IF NOT EXISTS vector;",
      "CREATE TABLE IF NOT EXISTS \"Artist\" (id SERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS \"Song\" (id SERIAL PRIMARY KEY, \"ytVideoId\" TEXT NOT NULL UNIQUE, title TEXT NOT NULL, "
      "\"durationSeconds\" INTEGER NOT NULL DEFAULT 0, album TEXT, movie TEXT, language TEXT, country TEXT, \"cast\" TEXT[] NOT NULL DEFAULT '{}', "
      "\"musicDirector\" TEXT, lyricist TEXT, \"officialLyrics\" TEXT, singers TEXT[] NOT NULL DEFAULT '{}', summary TEXT, "
      "\"artistId\" INTEGER NOT NULL REFERENCES \"Artist\"(id));",
      "CREATE TABLE IF NOT EXISTS \"SongContext\" (id SERIAL PRIMARY KEY, \"songId\" INTEGER NOT NULL UNIQUE REFERENCES \"Song\"(id) ON DELETE CASCADE, "
      "\"visualDescription\" TEXT, transcript TEXT, \"emotionalTags\" TEXT[] NOT NULL DEFAULT '{}', \"visualVector\" vector, \"transcriptVector\" vector, "
      "\"combinedVector\" vector NOT NULL, \"updatedAt\" TIMESTAMPTZ NOT NULL DEFAULT now());",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace miner::db::sql
