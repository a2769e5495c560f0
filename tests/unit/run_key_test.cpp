#include "internal/pipeline/run_key.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using miner::pipeline::ResolveRunKey;

bool Rejects(std::string_view url) {
  try {
    ResolveRunKey(url);
  } catch (const miner::util::FatalRunError&) {
    return true;
  }
  return false;
}

void TestWatchUrls() {
  assert(ResolveRunKey("https://www.youtube.com/watch?v=abc123") == "abc123");
  assert(ResolveRunKey("https://www.youtube.com/watch?v=abc123&t=42") == "abc123");
  assert(ResolveRunKey("https://www.youtube.com/watch?feature=share&v=xyz_9-Q#t=1") == "xyz_9-Q");
}

void TestShortAndPathUrls() {
  assert(ResolveRunKey("https://youtu.be/abc123?si=tracking") == "abc123");
  assert(ResolveRunKey("https://example.com/media/clip42/") == "clip42");
  assert(ResolveRunKey("local-id") == "local-id");
}

void TestUnusableKeysAreFatal() {
  assert(Rejects(""));
  assert(Rejects("https://www.youtube.com/watch?v="));
  assert(Rejects("https://example.com/.."));
  assert(Rejects("https://www.youtube.com/watch?v=../etc"));
  assert(Rejects("https://www.youtube.com/watch?v=a\\b"));
}

} // namespace

int main() {
  TestWatchUrls();
  TestShortAndPathUrls();
  TestUnusableKeysAreFatal();

  std::cout << "miner_unit_run_key: pass\n";
  return 0;
}
