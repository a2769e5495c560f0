#pragma once

#include <string>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/progress_reporter.hpp"

namespace miner::stages {

/*
  Turns streamed generator chunks into PRG percentages.

  The generator gives no length up front, so progress is chunks seen
  over an estimate, reported every `every` chunks and capped at 99 until
  the stage completes.
*/
class StreamProgress {
 public:
  StreamProgress(pipeline::ProgressReporter& progress, std::string label, double estimated_chunks, int every);

  void OnChunk();

  collaborators::ChunkCallback Callback();

  int Chunks() const {
    return chunks_;
  }

 private:
  pipeline::ProgressReporter& progress_;
  std::string                 label_;
  double                      estimated_chunks_;
  int                         every_;
  int                         chunks_ = 0;
};

} // namespace miner::stages
