#include "internal/db/sql/codec.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace miner::db::sql;

void TestStringListJson() {
  const std::vector<std::string> values{"Singer A", "quote \" inside"};
  assert(DecodeStringList(EncodeStringList(values)) == values);
  assert(EncodeStringList({}) == "[]");

  assert(DecodeStringList("")->empty());
  assert(!DecodeStringList("[1, 2]"));
  assert(!DecodeStringList("not json"));
}

void TestEmbeddingJson() {
  const auto decoded = DecodeEmbedding("[0.5, 1, -2.25]");
  assert(decoded);
  assert(decoded->size() == 3);
  assert((*decoded)[0] == 0.5f && (*decoded)[1] == 1.0f && (*decoded)[2] == -2.25f);

  assert(!DecodeEmbedding("[\"x\"]"));
  assert(DecodeEmbedding(EncodeEmbedding({0.25f, 0.75f})) == (miner::db::model::Embedding{0.25f, 0.75f}));
}

void TestPgTextArray() {
  assert(EncodePgTextArray({}) == "{}");
  assert(EncodePgTextArray({"a", "b \"c\"", "d\\e"}) == R"({"a","b \"c\"","d\\e"})");

  assert(DecodePgTextArray("{}")->empty());
  assert(DecodePgTextArray(R"({plain,"with,comma","esc \"q\""})") == (std::vector<std::string>{"plain", "with,comma", "esc \"q\""}));
  assert(!DecodePgTextArray(R"({"open})"));
  assert(!DecodePgTextArray("plain"));
}

} // namespace

int main() {
  TestStringListJson();
  TestEmbeddingJson();
  TestPgTextArray();

  std::cout << "miner_unit_codec: pass\n";
  return 0;
}
