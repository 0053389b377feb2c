#include <star_etl/generation/triple_cache.h>

namespace star_etl {

arrow::Status TripleCache::Insert(std::string map_name, Row row, Triple triple) {
    if (sealed_) {
        return arrow::Status::Invalid("Triple cache is sealed; cannot insert from map '",
                                      map_name, "'");
    }
    entries_.push_back(CacheEntry{std::move(map_name), std::move(row), std::move(triple)});
    return arrow::Status::OK();
}

} // namespace star_etl
