#include <star_etl/source/source_cache.h>

#include <filesystem>
#include <sstream>
#include <star_etl/source/row_source.h>
#include <star_etl/util/errors.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace fs = std::filesystem;

SourceCache::SourceCache(std::string base_directory,
                         std::vector<std::string> search_directories)
    : base_directory_(std::move(base_directory))
    , search_directories_(std::move(search_directories)) {}

void SourceCache::Register(const std::string& name, std::shared_ptr<SourceTable> table) {
    registered_[name] = std::move(table);
}

arrow::Result<std::string> SourceCache::ResolvePath(const SourceReference& reference) const {
    std::error_code ec;
    fs::path path(reference.path);

    if (path.is_absolute()) {
        if (fs::exists(path, ec)) {
            return path.lexically_normal().string();
        }
        return SourceUnavailable(reference.path, "file not found");
    }

    std::vector<fs::path> candidates;
    candidates.push_back(base_directory_.empty() ? path : fs::path(base_directory_) / path);
    for (const auto& dir : search_directories_) {
        candidates.push_back(fs::path(dir) / path);
    }

    for (const auto& candidate : candidates) {
        if (fs::exists(candidate, ec)) {
            fs::path normalized = fs::weakly_canonical(candidate, ec);
            return (ec ? candidate.lexically_normal() : normalized).string();
        }
    }

    std::ostringstream searched;
    for (size_t i = 0; i < candidates.size(); ++i) {
        searched << (i > 0 ? ", " : "") << candidates[i].string();
    }
    return SourceUnavailable(reference.path, "file not found (searched: " + searched.str() + ")");
}

arrow::Result<std::shared_ptr<const SourceTable>> SourceCache::Get(const SourceReference& reference) {
    for (const auto* name : {&reference.name, &reference.path}) {
        auto it = registered_.find(*name);
        if (it != registered_.end()) {
            return std::shared_ptr<const SourceTable>(it->second);
        }
    }

    auto resolved = ResolvePath(reference);
    if (!resolved.ok()) {
        return resolved.status();
    }
    const std::string key = *resolved + "|" + reference.format + "|" + reference.iterator;

    auto cached = tables_.find(key);
    if (cached != tables_.end()) {
        STAR_ETL_LOG_SOURCE("Source cache hit: " << key);
        return cached->second;
    }
    auto failed = failures_.find(key);
    if (failed != failures_.end()) {
        return failed->second;
    }

    auto loaded = [&]() -> arrow::Result<std::shared_ptr<SourceTable>> {
        ARROW_ASSIGN_OR_RAISE(auto source, MakeRowSource(reference, *resolved));
        return source->Load();
    }();
    if (!loaded.ok()) {
        failures_.emplace(key, loaded.status());
        return loaded.status();
    }

    std::shared_ptr<const SourceTable> table = *std::move(loaded);
    tables_.emplace(key, table);
    return table;
}

} // namespace star_etl
