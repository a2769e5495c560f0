#include "stream_progress.hpp"

#include <algorithm>

namespace miner::stages {

StreamProgress::StreamProgress(pipeline::ProgressReporter& progress, std::string label, double estimated_chunks, int every)
    : progress_(progress), label_(std::move(label)), estimated_chunks_(std::max(estimated_chunks, 1.0)), every_(std::max(every, 1)) {
}

void StreamProgress::OnChunk() {
  ++chunks_;
  if (chunks_ % every_ != 0) return;

  const double percent = std::min(chunks_ / estimated_chunks_ * 100.0, 99.0);
  progress_.Emit(label_, static_cast<int>(percent), 100);
}

collaborators::ChunkCallback StreamProgress::Callback() {
  return [this](std::string_view) { OnChunk(); };
}

} // namespace miner::stages
