#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <arrow/result.h>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/rdf/term.h>
#include <star_etl/source/source_table.h>
#include <star_etl/util/lru_cache.h>

namespace star_etl {

// What to do with a reference to an absent (missing, null or empty) value
enum class NullPolicy {
    Sentinel,   // substitute "unknown"
    Skip        // the rule referencing it emits nothing
};

struct TemplateEngineOptions {
    NullPolicy null_policy = NullPolicy::Sentinel;
    size_t cache_capacity = 16384;   // entries per memo table
};

// Instantiates templates against rows
//
// IRI instantiation sanitizes every substituted value (bytes outside
// [A-Za-z0-9_.-] become '_'), then expands a known prefix and finally
// resolves scheme-less results against the base IRI. Literal instantiation
// substitutes raw values. Absent values become the sentinel "unknown".
//
// Sanitize and expansion results are memoized in bounded LRU tables owned by
// the engine.
class TemplateEngine {
public:
    static constexpr std::string_view kSentinel = "unknown";

    TemplateEngine(const PrefixTable& prefixes,
                   std::string base_iri = "",
                   std::unordered_map<std::string, std::string> external = {},
                   TemplateEngineOptions options = TemplateEngineOptions());

    // Replaces every byte outside [A-Za-z0-9_.-] with '_'. Idempotent.
    static std::string SanitizeValue(std::string_view value);

    // Memoized SanitizeValue
    std::string Sanitize(std::string_view value);

    // prefix:local -> namespace + local; absolute IRIs and unknown prefixes
    // unchanged; scheme-less values resolved against the base IRI (memoized)
    std::string ExpandIri(std::string_view value);

    // True if any reference of the template has no usable value in the row
    bool HasAbsentValue(const Template& tmpl, const Row& row) const;

    // Applies the null policy: false if the template must not be evaluated
    bool ShouldEvaluate(const Template& tmpl, const Row& row) const {
        return options_.null_policy == NullPolicy::Sentinel || !HasAbsentValue(tmpl, row);
    }

    // IRI or literal term from a template
    arrow::Result<Term> Instantiate(const Template& tmpl, const Row& row, ObjectKind kind);

    // Object term including datatype and language. An IRI object that is a
    // single $(col) whose value carries a scheme and forms a valid IRI keeps
    // that value (prefix-expanded) instead of the sanitized rendering.
    arrow::Result<Term> InstantiateObject(const TermObject& object, const Row& row);

    // IRI strings for every row of the table, identical to row-by-row
    // Instantiate(..., ObjectKind::Iri). Column lookups happen once.
    std::vector<std::string> InstantiateColumn(const Template& tmpl, const SourceTable& table);

    // Raw substitution without sanitizing or expansion
    std::string RenderLiteral(const Template& tmpl, const Row& row) const;

    const TemplateEngineOptions& options() const { return options_; }

    uint64_t cache_hits() const { return sanitize_cache_.Hits() + expand_cache_.Hits(); }
    uint64_t cache_misses() const { return sanitize_cache_.Misses() + expand_cache_.Misses(); }

private:
    // Value of a reference: the row cell, else $(_name) from the external
    // map; std::nullopt if absent or empty
    std::optional<std::string_view> Lookup(const std::string& name, const Row& row) const;
    std::optional<std::string_view> External(const std::string& name) const;

    // Shared by the row and column paths; values are aligned with the
    // template's reference segments
    std::string RenderIri(const Template& tmpl,
                          const std::vector<std::optional<std::string_view>>& values);

    const PrefixTable& prefixes_;
    std::string base_iri_;
    std::unordered_map<std::string, std::string> external_;
    TemplateEngineOptions options_;

    LRUCache<std::string, std::string> sanitize_cache_;
    LRUCache<std::string, std::string> expand_cache_;
};

// True if the value starts with a URI scheme ("http:", "ex:", "urn:")
bool HasUriScheme(std::string_view value);

// Rejects empty IRIs and IRIs with whitespace, control characters or <>"{}|^`\\
arrow::Status ValidateIri(const std::string& iri);

} // namespace star_etl
