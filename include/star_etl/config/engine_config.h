#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <star_etl/generation/executor.h>
#include <star_etl/output/serializer.h>
#include <star_etl/template/template_engine.h>

namespace star_etl {

// Engine configuration
//
// JSON file form (every key optional, unknown keys ignored):
//   {
//     "search_directories": ["data", "/srv/etl/sources"],
//     "null_policy": "sentinel",          // or "skip"
//     "template_cache_capacity": 16384,
//     "blank_node_prefix": "r",
//     "vectorized_subjects": true,
//     "emit_run_metadata": false,
//     "output_format": "nquads"           // or "trig"
//   }
struct EngineConfig {
    std::vector<std::string> search_directories;
    NullPolicy null_policy = NullPolicy::Sentinel;
    size_t template_cache_capacity = 16384;
    std::string blank_node_prefix = "r";
    bool vectorized_subjects = true;
    bool emit_run_metadata = false;
    OutputFormat output_format = OutputFormat::NQuads;

    // base_directory: directory of the mapping document
    ExecutorOptions ToExecutorOptions(const std::string& base_directory) const;
};

// Wrong value types and invalid values are Invalid
arrow::Result<EngineConfig> ParseEngineConfig(const std::string& json_text);

// IOError if the file cannot be read
arrow::Result<EngineConfig> LoadEngineConfig(const std::string& path);

} // namespace star_etl
