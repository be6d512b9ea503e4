#include "results_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>

#include "internal/model/resource_list_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fnpipe::results {

namespace {

using fnpipe::util::PersistenceError;

YAML::Node ResultListDocument(const model::ResultSet& result_set) {
  const YAML::Node body = model::ResultSetToNode(result_set);

  YAML::Node document(YAML::NodeType::Map);
  document["apiVersion"]       = model::kResourceListApiVersion;
  document["kind"]             = "FunctionResultList";
  document["metadata"]["name"] = model::StringScalar(result_set.name);
  document["sequence"]         = result_set.sequence;
  document["exitCode"]         = result_set.exit_code;
  document["items"]            = body["items"];
  return document;
}

} // namespace

ResultsWriter::ResultsWriter(std::filesystem::path directory) : directory_(std::move(directory)) {
}

std::string ResultsWriter::FileNameFor(const model::ResultSet& result_set) {
  return "results-" + std::to_string(result_set.sequence) + ".yaml";
}

void ResultsWriter::Write(const std::vector<model::ResultSet>& result_sets) const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw PersistenceError("cannot create results directory " + directory_.string() + ": " + ec.message());
  }

  for (const auto& result_set : result_sets) {
    const auto    path = directory_ / FileNameFor(result_set);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot open " + path.string() + " for writing");
    }
    out << model::EmitDocument(ResultListDocument(result_set));
    out.close();
    if (!out) {
      throw PersistenceError("failed to write " + path.string());
    }
  }

  FNPIPE_LOG_DEBUG("results written", {observability::StringField("dir", directory_.string()),
                                        observability::IntField("count", static_cast<std::int64_t>(result_sets.size()))});
}

} // namespace fnpipe::results
