#include <star_etl/mapping/mapping_spec.h>

namespace star_etl {

std::string Author::DisplayName() const {
    if (!name.empty()) {
        return name;
    }
    if (!webid.empty()) {
        return webid;
    }
    return email;
}

const TriplesMap* MappingSpec::FindMap(const std::string& name) const {
    for (const auto& tm : triples_maps) {
        if (tm.name == name) {
            return &tm;
        }
    }
    return nullptr;
}

const SourceReference* MappingSpec::FindSource(const std::string& name) const {
    for (const auto& source : sources) {
        if (source.name == name) {
            return &source;
        }
    }
    return nullptr;
}

size_t MappingSpec::CountQuotedMaps() const {
    size_t count = 0;
    for (const auto& tm : triples_maps) {
        if (tm.IsQuoted()) {
            ++count;
        }
    }
    return count;
}

} // namespace star_etl
