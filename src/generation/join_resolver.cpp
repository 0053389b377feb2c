#include <star_etl/generation/join_resolver.h>

#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

bool InNamespace(const CacheEntry& entry, const std::optional<std::string>& subject_namespace) {
    if (!subject_namespace.has_value()) {
        return true;
    }
    const Term& subject = entry.triple.subject;
    return subject.IsIRI() && subject.lexical.compare(0, subject_namespace->size(),
                                                      *subject_namespace) == 0;
}

} // namespace

void JoinIndex::Add(std::string key, const CacheEntry* entry) {
    index_[std::move(key)].push_back(entry);
    ++entry_count_;
}

JoinIndex JoinIndex::BuildByKey(const TripleCache& cache,
                                const std::string& left_key,
                                const std::optional<std::string>& subject_namespace) {
    JoinIndex index;
    for (const auto& entry : cache.entries()) {
        if (!InNamespace(entry, subject_namespace)) {
            continue;
        }
        auto value = entry.row.Get(left_key);
        if (!value.has_value() || value->empty()) {
            continue;
        }
        index.Add(std::string(*value), &entry);
    }

    STAR_ETL_LOG_JOIN("Join index on '" << left_key << "': " << index.entry_count()
                      << " of " << cache.size() << " cached triples, "
                      << index.key_count() << " distinct keys"
                      << (subject_namespace ? " (namespace " + *subject_namespace + ")" : ""));
    return index;
}

JoinIndex JoinIndex::BuildByRow(const TripleCache& cache,
                                const std::string& map_name,
                                const SourceTable* table,
                                const std::optional<std::string>& subject_namespace) {
    JoinIndex index;
    for (const auto& entry : cache.entries()) {
        if (entry.map_name != map_name || entry.row.table.get() != table ||
            !InNamespace(entry, subject_namespace)) {
            continue;
        }
        index.Add(std::to_string(entry.row.index), &entry);
    }

    STAR_ETL_LOG_JOIN("Row index for map '" << map_name << "': " << index.entry_count()
                      << " cached triples over " << index.key_count() << " rows");
    return index;
}

const std::vector<const CacheEntry*>& JoinIndex::Lookup(std::string_view value) const {
    static const std::vector<const CacheEntry*> kEmpty;
    auto it = index_.find(value);
    return it == index_.end() ? kEmpty : it->second;
}

std::string ParentRowIndex::MakeKey(const std::vector<std::string_view>& values) {
    std::string key;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            key.push_back('\x1f');
        }
        key.append(values[i]);
    }
    return key;
}

ParentRowIndex ParentRowIndex::Build(const SourceTable& table,
                                     const std::vector<std::string>& key_columns) {
    ParentRowIndex index;

    std::vector<int> columns;
    for (const auto& name : key_columns) {
        int column = table.ColumnIndex(name);
        if (column < 0) {
            return index;
        }
        columns.push_back(column);
    }

    std::vector<std::string_view> values(columns.size());
    for (int64_t row = 0; row < table.num_rows(); ++row) {
        bool complete = true;
        for (size_t i = 0; i < columns.size(); ++i) {
            auto value = table.Value(columns[i], row);
            if (!value.has_value() || value->empty()) {
                complete = false;
                break;
            }
            values[i] = *value;
        }
        if (complete) {
            index.index_[MakeKey(values)].push_back(row);
        }
    }
    return index;
}

const std::vector<int64_t>& ParentRowIndex::Lookup(const std::vector<std::string_view>& values) const {
    static const std::vector<int64_t> kEmpty;
    auto it = index_.find(MakeKey(values));
    return it == index_.end() ? kEmpty : it->second;
}

} // namespace star_etl
