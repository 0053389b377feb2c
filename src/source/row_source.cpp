#include <star_etl/source/row_source.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <nlohmann/json.hpp>
#include <star_etl/util/errors.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

using json = nlohmann::json;

arrow::Result<std::shared_ptr<arrow::Table>> ReadCsvAsText(const std::string& path) {
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();

    // Probe the header to learn the column names
    ARROW_ASSIGN_OR_RAISE(auto probe_file, arrow::io::ReadableFile::Open(path));
    ARROW_ASSIGN_OR_RAISE(
        auto probe,
        arrow::csv::StreamingReader::Make(
            arrow::io::default_io_context(),
            probe_file,
            read_options,
            parse_options,
            convert_options));
    std::shared_ptr<arrow::Schema> schema = probe->schema();
    ARROW_RETURN_NOT_OK(probe->Close());

    for (const auto& field : schema->fields()) {
        convert_options.column_types[field->name()] = arrow::utf8();
    }
    convert_options.strings_can_be_null = false;

    ARROW_ASSIGN_OR_RAISE(auto input_file, arrow::io::ReadableFile::Open(path));
    ARROW_ASSIGN_OR_RAISE(
        auto reader,
        arrow::csv::TableReader::Make(
            arrow::io::default_io_context(),
            input_file,
            read_options,
            parse_options,
            convert_options));

    return reader->Read();
}

struct PathStep {
    enum class Kind { Key, Wildcard, Index };

    Kind kind;
    std::string key;
    size_t index = 0;
};

arrow::Result<std::vector<PathStep>> ParseJsonPath(const std::string& path) {
    std::vector<PathStep> steps;
    if (path.empty() || path == "$") {
        return steps;
    }
    if (path[0] != '$') {
        return arrow::Status::Invalid("JSONPath must start with '$': ", path);
    }

    size_t pos = 1;
    while (pos < path.size()) {
        char c = path[pos];
        if (c == '.') {
            if (pos + 1 < path.size() && path[pos + 1] == '.') {
                return arrow::Status::NotImplemented("Recursive descent is not supported: ", path);
            }
            ++pos;
            size_t end = path.find_first_of(".[", pos);
            if (end == std::string::npos) {
                end = path.size();
            }
            std::string key = path.substr(pos, end - pos);
            if (key.empty()) {
                return arrow::Status::Invalid("Empty key in JSONPath: ", path);
            }
            if (key == "*") {
                steps.push_back({PathStep::Kind::Wildcard, "", 0});
            } else {
                steps.push_back({PathStep::Kind::Key, std::move(key), 0});
            }
            pos = end;
        } else if (c == '[') {
            size_t close = path.find(']', pos);
            if (close == std::string::npos) {
                return arrow::Status::Invalid("Unterminated '[' in JSONPath: ", path);
            }
            std::string inner = path.substr(pos + 1, close - pos - 1);
            if (inner == "*") {
                steps.push_back({PathStep::Kind::Wildcard, "", 0});
            } else if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') &&
                       inner.back() == inner.front()) {
                steps.push_back({PathStep::Kind::Key, inner.substr(1, inner.size() - 2), 0});
            } else if (!inner.empty() && inner.find_first_not_of("0123456789") == std::string::npos) {
                errno = 0;
                char* end = nullptr;
                unsigned long long index = std::strtoull(inner.c_str(), &end, 10);
                if (errno == ERANGE || *end != '\0' ||
                    index > std::numeric_limits<size_t>::max()) {
                    return arrow::Status::Invalid("JSONPath index out of range [", inner, "]");
                }
                steps.push_back({PathStep::Kind::Index, "", static_cast<size_t>(index)});
            } else {
                return arrow::Status::NotImplemented("Unsupported JSONPath selector [", inner, "]");
            }
            pos = close + 1;
        } else {
            return arrow::Status::Invalid("Unexpected '", std::string(1, c), "' in JSONPath: ", path);
        }
    }
    return steps;
}

void Collect(const json& node, const std::vector<PathStep>& steps, size_t i,
             std::vector<const json*>* out) {
    if (i == steps.size()) {
        out->push_back(&node);
        return;
    }
    const PathStep& step = steps[i];
    switch (step.kind) {
        case PathStep::Kind::Key:
            if (node.is_object()) {
                auto it = node.find(step.key);
                if (it != node.end()) {
                    Collect(*it, steps, i + 1, out);
                }
            }
            break;
        case PathStep::Kind::Index:
            if (node.is_array() && step.index < node.size()) {
                Collect(node[step.index], steps, i + 1, out);
            }
            break;
        case PathStep::Kind::Wildcard:
            if (node.is_array() || node.is_object()) {
                for (const auto& child : node) {
                    Collect(child, steps, i + 1, out);
                }
            }
            break;
    }
}

std::optional<std::string> ScalarText(const json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

using FlatRow = std::vector<std::pair<std::string, std::optional<std::string>>>;

void Flatten(const json& value, const std::string& key, FlatRow* row) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            Flatten(it.value(), key.empty() ? it.key() : key + "." + it.key(), row);
        }
        return;
    }
    if (value.is_array()) {
        bool primitives = true;
        for (const auto& item : value) {
            if (item.is_structured()) {
                primitives = false;
                break;
            }
        }
        if (primitives) {
            row->emplace_back(key, value.dump());
            return;
        }
        for (size_t i = 0; i < value.size(); ++i) {
            Flatten(value[i], key + "." + std::to_string(i), row);
        }
        return;
    }
    row->emplace_back(key, ScalarText(value));
}

} // namespace

arrow::Result<std::shared_ptr<SourceTable>> CsvRowSource::Load() {
    STAR_ETL_LOG_SOURCE("Reading " << Describe());
    auto table = ReadCsvAsText(path_);
    if (!table.ok()) {
        return SourceUnavailable(path_, table.status().message());
    }
    auto rows = SourceTable::FromArrowTable(*table);
    if (!rows.ok()) {
        return SourceUnavailable(path_, rows.status().message());
    }
    STAR_ETL_LOG_SOURCE("Loaded " << (*rows)->num_rows() << " rows, "
                        << (*rows)->num_columns() << " columns from " << path_);
    return rows;
}

arrow::Result<std::shared_ptr<SourceTable>> JsonRowSource::Load() {
    STAR_ETL_LOG_SOURCE("Reading " << Describe());
    std::ifstream in(path_);
    if (!in) {
        return SourceUnavailable(path_, "cannot open file");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto rows = ParseJsonRows(buffer.str(), iterator_);
    if (!rows.ok()) {
        return SourceUnavailable(path_, rows.status().message());
    }
    STAR_ETL_LOG_SOURCE("Loaded " << (*rows)->num_rows() << " rows from " << path_);
    return rows;
}

arrow::Result<std::shared_ptr<SourceTable>> ParseJsonRows(const std::string& text,
                                                          const std::string& iterator) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return arrow::Status::Invalid("JSON parse error: ", e.what());
    }

    ARROW_ASSIGN_OR_RAISE(auto steps, ParseJsonPath(iterator));
    std::vector<const json*> matches;
    Collect(document, steps, 0, &matches);

    // A path ending on an array (rather than [*]) iterates its elements
    bool expand_arrays = steps.empty() || steps.back().kind != PathStep::Kind::Wildcard;
    std::vector<const json*> items;
    for (const json* match : matches) {
        if (expand_arrays && match->is_array()) {
            for (const auto& element : *match) {
                items.push_back(&element);
            }
        } else {
            items.push_back(match);
        }
    }

    std::vector<std::string> columns;
    std::unordered_map<std::string, size_t> column_index;
    std::vector<FlatRow> flat_rows;
    for (const json* item : items) {
        if (item->is_null()) {
            continue;
        }
        FlatRow row;
        if (item->is_object()) {
            Flatten(*item, "", &row);
        } else if (item->is_array()) {
            Flatten(*item, "value", &row);
        } else {
            row.emplace_back("value", ScalarText(*item));
        }
        for (const auto& cell : row) {
            if (column_index.emplace(cell.first, columns.size()).second) {
                columns.push_back(cell.first);
            }
        }
        flat_rows.push_back(std::move(row));
    }

    std::vector<std::vector<std::optional<std::string>>> cells;
    cells.reserve(flat_rows.size());
    for (const auto& row : flat_rows) {
        std::vector<std::optional<std::string>> aligned(columns.size());
        for (const auto& cell : row) {
            aligned[column_index[cell.first]] = cell.second;
        }
        cells.push_back(std::move(aligned));
    }
    return SourceTable::FromRows(columns, cells);
}

arrow::Result<std::unique_ptr<RowSource>> MakeRowSource(const SourceReference& reference,
                                                        const std::string& resolved_path) {
    if (reference.format == "csv") {
        return std::unique_ptr<RowSource>(new CsvRowSource(resolved_path));
    }
    if (reference.format == "json" || reference.format == "jsonpath") {
        return std::unique_ptr<RowSource>(new JsonRowSource(resolved_path, reference.iterator));
    }
    return SourceUnavailable(reference.path, "unsupported source format '" + reference.format + "'");
}

} // namespace star_etl
