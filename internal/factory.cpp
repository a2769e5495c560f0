#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/collaborators/command_collaborators.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if MINER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MINER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace miner::factory {

namespace {

#if MINER_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if MINER_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const miner::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if MINER_DB_SQLITE
    std::shared_ptr<db::sqlite::SqliteDB> sqlite_db;
    try {
      sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
      SqliteMigrationExecutor executor(*sqlite_db);
      db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    } catch (const util::StoreUnavailable&) {
      throw;
    } catch (const std::exception& e) {
      throw util::StoreUnavailable("sqlite schema bootstrap failed: " + std::string(e.what()));
    }
    MINER_LOG_INFO("opened sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::StoreUnavailable("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MINER_DB_POSTGRES
    const auto& pg              = database.postgres();
    const auto  max_connections = pg.max_connections() > 0 ? pg.max_connections() : 4;
    try {
      {
        // pooled connections prepare statements against the schema, so
        // the schema comes first on a connection of its own
        pqxx::connection    conn(pg.connection_uri());
        pqxx::work          tx(conn);
        PgMigrationExecutor executor(tx);
        db::sql::RunMigrations(executor, db::sql::PostgresSchema());
        tx.commit();
      }
      auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_connections);
      MINER_LOG_INFO("opened postgres store");
      return std::make_shared<db::postgres::PgRepository>(std::move(pool));
    } catch (const std::exception& e) {
      throw util::StoreUnavailable("postgres store unavailable: " + std::string(e.what()));
    }
#else
    throw util::StoreUnavailable("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_memory()) {
    MINER_LOG_WARN("using in-memory store; synced rows are lost at exit");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  throw util::StoreUnavailable("no database configured (set database in the config file, MINER_DB_URL or DATABASE_URL)");
}

collaborators::Collaborators BuildCollaborators(const miner::runtime::config::RuntimeConfig& config, const collaborators::CommandContext& context,
                                                pipeline::ProgressReporter& progress) {
  const auto& tools = config.collaborators();

  collaborators::Collaborators c;
  c.source_fetcher  = std::make_shared<collaborators::CommandSourceFetcher>(tools.source_fetch(), context, progress);
  c.speech_to_text  = std::make_shared<collaborators::CommandSpeechToText>(tools.speech_to_text(), context);
  c.text_generator  = std::make_shared<collaborators::CommandTextGenerator>(tools.text_generation(), context);
  c.vision_narrator = std::make_shared<collaborators::CommandVisionNarrator>(tools.vision(), context);
  c.embedder        = std::make_shared<collaborators::CommandEmbedder>(tools.embedding(), context);
  return c;
}

} // namespace miner::factory
