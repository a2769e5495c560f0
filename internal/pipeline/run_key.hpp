#pragma once

#include <string>
#include <string_view>

namespace miner::pipeline {

/*
  Derives the run key (external media id) from a source URL.

    https://www.youtube.com/watch?v=abc123&t=4  -> abc123
    https://youtu.be/abc123?si=x                 -> abc123
    abc123                                       -> abc123

  Throws util::FatalRunError when no usable key can be derived: the key
  becomes a directory name, so it may not be empty, '.', '..' or contain
  path separators.
*/
std::string ResolveRunKey(std::string_view url);

} // namespace miner::pipeline
