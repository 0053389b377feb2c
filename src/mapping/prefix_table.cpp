#include <star_etl/mapping/prefix_table.h>

namespace star_etl {

arrow::Status PrefixTable::Add(const std::string& prefix, const std::string& ns) {
    if (index_.count(prefix) > 0) {
        return arrow::Status::Invalid("Duplicate prefix '", prefix, "'");
    }
    index_.emplace(prefix, entries_.size());
    entries_.emplace_back(prefix, ns);
    return arrow::Status::OK();
}

void PrefixTable::AddIfAbsent(const std::string& prefix, const std::string& ns) {
    if (index_.count(prefix) == 0) {
        index_.emplace(prefix, entries_.size());
        entries_.emplace_back(prefix, ns);
    }
}

bool PrefixTable::Contains(std::string_view prefix) const {
    return index_.count(std::string(prefix)) > 0;
}

std::optional<std::string> PrefixTable::Lookup(std::string_view prefix) const {
    auto it = index_.find(std::string(prefix));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].second;
}

std::string PrefixTable::Expand(std::string_view value) const {
    size_t colon = value.find(':');
    if (colon == std::string_view::npos) {
        return std::string(value);
    }
    // scheme://authority is always absolute
    if (value.substr(colon + 1, 2) == "//") {
        return std::string(value);
    }

    auto it = index_.find(std::string(value.substr(0, colon)));
    if (it == index_.end()) {
        return std::string(value);
    }

    std::string expanded = entries_[it->second].second;
    expanded.append(value.substr(colon + 1));
    return expanded;
}

std::optional<std::pair<std::string, std::string>> PrefixTable::Compact(
    std::string_view iri) const {

    const std::pair<std::string, std::string>* best = nullptr;
    for (const auto& entry : entries_) {
        const std::string& ns = entry.second;
        if (ns.empty() || iri.size() < ns.size() || iri.substr(0, ns.size()) != ns) {
            continue;
        }
        if (best == nullptr || ns.size() > best->second.size()) {
            best = &entry;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return std::make_pair(best->first, std::string(iri.substr(best->second.size())));
}

} // namespace star_etl
