#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <arrow/status.h>
#include <star_etl/util/errors.h>

namespace star_etl {

// Recovered problem of a run
struct RunIssue {
    ErrorKind kind;
    std::string map_name;
    std::optional<int64_t> row;   // set for row-level issues
    std::string message;
};

// Counters and recovered issues of one generation run
struct RunReport {
    size_t sources_loaded = 0;
    size_t rows_processed = 0;   // rows of each distinct source, counted once
    size_t rows_skipped = 0;
    size_t maps_skipped = 0;
    size_t base_triples = 0;
    size_t reifiers = 0;
    size_t annotation_statements = 0;
    size_t metadata_statements = 0;
    std::vector<RunIssue> issues;

    // Records a recovered failure; plain statuses count as RowEvaluationError
    void AddIssue(const arrow::Status& status, const std::string& map_name,
                  std::optional<int64_t> row = std::nullopt);

    size_t CountIssues(ErrorKind kind) const;

    // One-line-per-counter summary for the CLI
    std::string Summary() const;

    // Machine-readable report (nlohmann/json)
    std::string ToJson(int indent = 2) const;
};

} // namespace star_etl
