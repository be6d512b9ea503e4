#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/result.hpp"

namespace fnpipe::results {

/*
  Persists result sets as results-<seq>.yaml under a directory, one
  FunctionResultList document per invocation. Creates the directory when
  missing. Throws PersistenceError on any I/O failure.
*/
class ResultsWriter {
 public:
  explicit ResultsWriter(std::filesystem::path directory);

  void Write(const std::vector<model::ResultSet>& result_sets) const;

  static std::string FileNameFor(const model::ResultSet& result_set);

 private:
  std::filesystem::path directory_;
};

} // namespace fnpipe::results
