#pragma once

#include <filesystem>
#include <string>

namespace miner::pipeline {

/*
  Fixed on-disk layout of one run:

    <output_root>/<run_key>/
      metadata.json
      transcript.txt
      video_narrative.txt
      emotions.json
      audio.mp3
      video.mp4
*/
struct RunPaths {
  std::filesystem::path folder;
  std::filesystem::path metadata;
  std::filesystem::path transcript;
  std::filesystem::path narrative;
  std::filesystem::path emotions;
  std::filesystem::path audio;
  std::filesystem::path video;

  static RunPaths For(const std::filesystem::path& output_root, const std::string& run_key) {
    RunPaths paths;
    paths.folder     = output_root / run_key;
    paths.metadata   = paths.folder / "metadata.json";
    paths.transcript = paths.folder / "transcript.txt";
    paths.narrative  = paths.folder / "video_narrative.txt";
    paths.emotions   = paths.folder / "emotions.json";
    paths.audio      = paths.folder / "audio.mp3";
    paths.video      = paths.folder / "video.mp4";
    return paths;
  }
};

} // namespace miner::pipeline
