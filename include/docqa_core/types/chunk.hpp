#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docqa_core {

// A span of document text plus where it came from. Immutable once produced by
// the indexer.
struct Chunk {
  std::string text;
  std::string source;
  std::optional<int> page;
  std::optional<std::string> clause_number;
};

}  // namespace docqa_core
