#pragma once

#include <string>
#include <vector>
#include <arrow/status.h>
#include <star_etl/rdf/term.h>
#include <star_etl/source/source_table.h>

namespace star_etl {

// Base triple with its origin
struct CacheEntry {
    std::string map_name;
    Row row;
    Triple triple;
};

// Inter-pass store of every base triple generated in Pass 1
//
// Append-only until Seal(); Pass 2 only reads it. Entries keep insertion
// order, so index lookups return matches in generation order.
class TripleCache {
public:
    TripleCache() = default;

    // Invalid once sealed
    arrow::Status Insert(std::string map_name, Row row, Triple triple);

    void Seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    const std::vector<CacheEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void Clear() {
        entries_.clear();
        sealed_ = false;
    }

private:
    std::vector<CacheEntry> entries_;
    bool sealed_ = false;
};

} // namespace star_etl
