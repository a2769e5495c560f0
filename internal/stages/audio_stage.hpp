#pragma once

#include <filesystem>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::stages {

/*
  Audio stage: speech-to-text, hallucination clean-up, then
  transliteration to Latin script for languages written otherwise.

  Transcription errors propagate. A failed or empty transliteration keeps
  the cleaned transcript. An empty transcript is returned as-is and
  counts as no result upstream.
*/
v1::Transcript ProcessAudio(collaborators::SpeechToText& speech, collaborators::TextGenerator& generator, const std::filesystem::path& audio,
                            pipeline::ProgressReporter& progress);

} // namespace miner::stages
