#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/collaborators/collaborators.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/artifact_cache.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::sync {

// Opens the store; throws util::StoreUnavailable when it cannot.
using RepositoryProvider = std::function<std::shared_ptr<db::Repository>()>;

// Everything one sync writes, assembled before the transaction opens.
struct SyncPlan {
  db::model::ArtistRecord      artist;
  db::model::SongRecord        song;
  db::model::SongContextRecord context;
};

/*
  Sync engine.

  Reads whatever artifacts exist for a run, fills required fields from
  the source information, computes embeddings and upserts

      Artist (by name) -> Song (by ytVideoId) -> SongContext (by songId)

  inside one transaction. Any failure rolls the whole transaction back
  and is reported as PRG:DB Sync:Failed:100; it never throws.
*/
class SyncEngine {
 public:
  SyncEngine(RepositoryProvider repositories, std::shared_ptr<collaborators::Embedder> embedder, pipeline::ProgressReporter& progress);

  bool Sync(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source);

  // Artifact merge without embeddings or store access.
  static SyncPlan Plan(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source);

  static std::string CombinedText(const std::string& title, const std::string& summary, const std::string& narrative, const std::string& transcript);

 private:
  void Embed(SyncPlan& plan, const std::string& summary);
  void Write(db::Repository& repository, SyncPlan& plan);

  RepositoryProvider                       repositories_;
  std::shared_ptr<collaborators::Embedder> embedder_;
  pipeline::ProgressReporter&              progress_;
};

} // namespace miner::sync
