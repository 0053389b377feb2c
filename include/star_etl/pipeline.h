#pragma once

#include <string>
#include <vector>
#include <arrow/result.h>
#include <star_etl/config/engine_config.h>
#include <star_etl/generation/run_report.h>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/rdf/term.h>

namespace star_etl {

struct PipelineResult {
    MappingSpec spec;
    std::vector<Statement> statements;
    RunReport report;
};

// Parses the mapping file, runs both generation passes with sources resolved
// against the mapping's directory, and appends run metadata when configured.
//
// Fails with MalformedSpecification / UnsupportedConstruct from the parser,
// IOError for a missing mapping file, or Invalid for bad options.
arrow::Result<PipelineResult> RunMappingFile(const std::string& mapping_path,
                                             const EngineConfig& config);

// Output path when none is given: the first target's access path (relative
// to the mapping directory), else <mapping dir>/output/<stem>_output.<ext>
std::string DefaultOutputPath(const std::string& mapping_path,
                              const MappingSpec& spec,
                              OutputFormat format);

} // namespace star_etl
