#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <arrow/status.h>

namespace star_etl {

// Prefix table: short name -> namespace IRI
//
// Keeps declaration order for serialization; lookups are hashed.
class PrefixTable {
public:
    PrefixTable() = default;

    // Fails with Invalid on a duplicate prefix
    arrow::Status Add(const std::string& prefix, const std::string& ns);

    // No-op if the prefix is already declared
    void AddIfAbsent(const std::string& prefix, const std::string& ns);

    bool Contains(std::string_view prefix) const;
    std::optional<std::string> Lookup(std::string_view prefix) const;

    // "prefix:local" with a known prefix -> namespace + local.
    // Anything else (absolute IRIs, unknown prefixes, no colon) is returned
    // unchanged.
    std::string Expand(std::string_view value) const;

    // Inverse of Expand for serialization: longest matching namespace wins.
    // Returns std::nullopt if no namespace matches.
    std::optional<std::pair<std::string, std::string>> Compact(std::string_view iri) const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace star_etl
