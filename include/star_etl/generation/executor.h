#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <arrow/result.h>
#include <star_etl/generation/join_resolver.h>
#include <star_etl/generation/run_report.h>
#include <star_etl/generation/triple_cache.h>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/rdf/term.h>
#include <star_etl/source/source_cache.h>
#include <star_etl/template/template_engine.h>

namespace star_etl {

struct ExecutorOptions {
    // Pass 1 map order by name; empty = document order. Maps not listed run
    // after the listed ones, in document order.
    std::vector<std::string> map_order;

    // Directory relative source paths are resolved against first
    std::string base_directory;
    std::vector<std::string> search_directories;

    // Subject IRIs computed per column instead of per row
    bool vectorized_subjects = true;

    // Reifier labels: <prefix>1, <prefix>2, ...
    std::string blank_node_prefix = "r";

    TemplateEngineOptions template_options;
};

struct GenerationResult {
    std::vector<Statement> statements;   // generation order
    RunReport report;
};

// Two-pass generation over a parsed mapping
//
// Pass 1 runs every template-subject map: one base triple per declared type
// and per predicate-object rule, each recorded in the triple cache with its
// origin row. Pass 2 runs every quoted map: each annotation row is joined
// against the sealed cache and every match gets a fresh reifier linked with
// rdf:reifies plus one statement per annotation rule.
//
// A row contributes either all of its statements or none. Row and join
// failures are recorded in the report; only invalid options fail the run.
//
// Usage:
//   GenerationExecutor executor(spec, options);
//   ARROW_ASSIGN_OR_RAISE(auto result, executor.Run());
class GenerationExecutor {
public:
    explicit GenerationExecutor(const MappingSpec& spec,
                                ExecutorOptions options = ExecutorOptions());

    // Rows served for a source name or path instead of reading a file
    void RegisterSource(const std::string& name, std::shared_ptr<SourceTable> table);

    // Each call is an independent run with fresh caches
    arrow::Result<GenerationResult> Run();

    // Cache of the last run (sealed after Run)
    const TripleCache& cache() const { return cache_; }

private:
    // Per-run state
    struct RunState {
        std::unique_ptr<SourceCache> sources;
        std::unique_ptr<TemplateEngine> engine;
        std::unordered_map<std::string, ParentRowIndex> parent_indexes;
        std::unordered_set<const SourceTable*> loaded_sources;
        uint64_t next_reifier = 1;
        GenerationResult result;
    };

    arrow::Result<std::vector<const TriplesMap*>> OrderedMaps() const;

    arrow::Result<std::shared_ptr<const SourceTable>> LoadSource(const SourceReference& source,
                                                                 RunState* state);

    // Pass 1
    arrow::Status RunTemplateMap(const TriplesMap& map, RunState* state);
    arrow::Result<std::vector<Statement>> EvaluateRow(const TriplesMap& map,
                                                      const Row& row,
                                                      const std::vector<std::string>* subjects,
                                                      RunState* state);
    arrow::Result<std::vector<Term>> ResolveReference(const ReferenceObject& reference,
                                                      const Row& row,
                                                      RunState* state);
    arrow::Result<std::vector<Term>> InstantiateSubjects(const TriplesMap& map,
                                                         const Row& row,
                                                         RunState* state);

    // Pass 2
    arrow::Status RunQuotedMap(const TriplesMap& map, RunState* state);
    arrow::Result<std::vector<Statement>> AnnotateRow(const TriplesMap& map,
                                                      const Row& row,
                                                      const std::vector<const CacheEntry*>& matches,
                                                      RunState* state);

    // Graph terms of a rule: its own graphs, else the map's, else the default graph
    arrow::Result<std::vector<std::optional<Term>>> InstantiateGraphs(const TriplesMap& map,
                                                                      const std::vector<Template>& rule_graphs,
                                                                      const Row& row,
                                                                      RunState* state);

    const MappingSpec& spec_;
    ExecutorOptions options_;
    std::unordered_map<std::string, std::shared_ptr<SourceTable>> registered_;
    TripleCache cache_;
};

} // namespace star_etl
