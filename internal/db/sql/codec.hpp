#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/song_context_record.hpp"

namespace miner::db::sql {

/*
  Column encodings shared by the SQL backends.

  sqlite   -> JSON text for lists and vectors
  postgres -> text[] literals and pgvector literals ("[1,2,3]")

  Decoders return nullopt on malformed input instead of throwing; the
  repository maps that to Corruption.
*/

std::string                             EncodeStringList(const std::vector<std::string>& values);
std::optional<std::vector<std::string>> DecodeStringList(const std::string& json);

std::string                      EncodeEmbedding(const model::Embedding& values);
std::optional<model::Embedding> DecodeEmbedding(const std::string& json);

// {"a","b \"c\""}
std::string EncodePgTextArray(const std::vector<std::string>& values);
std::optional<std::vector<std::string>> DecodePgTextArray(const std::string& literal);

} // namespace miner::db::sql
