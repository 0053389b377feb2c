#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <arrow/result.h>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/source/source_table.h>

namespace star_etl {

// Source-to-rows cache of one run
//
// Each distinct source (normalized resolved path + format + iterator) is
// loaded at most once; failures are remembered so every map reading a broken
// source gets the same SourceUnavailable without a second read.
class SourceCache {
public:
    // base_directory: directory of the mapping document ("" = cwd)
    explicit SourceCache(std::string base_directory = "",
                         std::vector<std::string> search_directories = {});

    // Serves the given rows for every source reference whose name or path
    // equals `name`, without touching the filesystem
    void Register(const std::string& name, std::shared_ptr<SourceTable> table);

    // Absolute path as-is; relative paths against the base directory, then
    // each search directory. SourceUnavailable if nothing exists.
    arrow::Result<std::string> ResolvePath(const SourceReference& reference) const;

    arrow::Result<std::shared_ptr<const SourceTable>> Get(const SourceReference& reference);

    // Distinct sources successfully loaded so far
    size_t loaded_count() const { return tables_.size(); }

private:
    std::string base_directory_;
    std::vector<std::string> search_directories_;
    std::unordered_map<std::string, std::shared_ptr<const SourceTable>> tables_;
    std::unordered_map<std::string, arrow::Status> failures_;
    std::unordered_map<std::string, std::shared_ptr<SourceTable>> registered_;
};

} // namespace star_etl
