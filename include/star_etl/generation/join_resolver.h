#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include <star_etl/generation/triple_cache.h>
#include <star_etl/source/source_table.h>

namespace star_etl {

// Index from join-key value to cached triples
//
// Build is O(n) over the cache. Entries whose key column is absent or empty
// are never indexed. With a subject namespace only triples whose subject IRI
// starts with it are indexed.
class JoinIndex {
public:
    // Keyed by the value of `left_key` in each entry's origin row
    static JoinIndex BuildByKey(const TripleCache& cache,
                                const std::string& left_key,
                                const std::optional<std::string>& subject_namespace);

    // Keyed by origin row index, restricted to one map and one source table
    static JoinIndex BuildByRow(const TripleCache& cache,
                                const std::string& map_name,
                                const SourceTable* table,
                                const std::optional<std::string>& subject_namespace);

    // Matches in cache order; empty (never an error) when nothing matches
    const std::vector<const CacheEntry*>& Lookup(std::string_view value) const;

    size_t key_count() const { return index_.size(); }
    size_t entry_count() const { return entry_count_; }

private:
    void Add(std::string key, const CacheEntry* entry);

    absl::flat_hash_map<std::string, std::vector<const CacheEntry*>> index_;
    size_t entry_count_ = 0;
};

// Rows of a parent source indexed by one or more join columns, used to
// resolve referencing object maps
class ParentRowIndex {
public:
    static ParentRowIndex Build(const SourceTable& table,
                                const std::vector<std::string>& key_columns);

    // Parent row indices whose key columns equal the given values
    const std::vector<int64_t>& Lookup(const std::vector<std::string_view>& values) const;

    size_t key_count() const { return index_.size(); }

private:
    static std::string MakeKey(const std::vector<std::string_view>& values);

    absl::flat_hash_map<std::string, std::vector<int64_t>> index_;
};

} // namespace star_etl
