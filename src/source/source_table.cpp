#include <star_etl/source/source_table.h>

#include <arrow/compute/api.h>
#include <arrow/compute/initialize.h>

namespace star_etl {

namespace {

// Registers the compute kernels once per process
arrow::Status InitializeCompute() {
    static const arrow::Status status = arrow::compute::Initialize();
    return status;
}

} // namespace

arrow::Result<std::shared_ptr<SourceTable>> SourceTable::FromArrowTable(
    const std::shared_ptr<arrow::Table>& table) {

    if (!table) {
        return arrow::Status::Invalid("Source table is null");
    }

    std::shared_ptr<SourceTable> result(new SourceTable());
    result->num_rows_ = table->num_rows();

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (int i = 0; i < table->num_columns(); ++i) {
        const std::string& name = table->schema()->field(i)->name();
        if (result->index_.count(name) > 0) {
            return arrow::Status::Invalid("Duplicate column '", name, "'");
        }

        std::shared_ptr<arrow::ChunkedArray> chunked = table->column(i);
        if (!chunked->type()->Equals(arrow::utf8())) {
            ARROW_RETURN_NOT_OK(InitializeCompute());
            ARROW_ASSIGN_OR_RAISE(auto cast, arrow::compute::Cast(chunked, arrow::utf8()));
            chunked = cast.chunked_array();
        }

        // Combine chunks into a single array (Arrow has no CombineChunks for columns)
        std::shared_ptr<arrow::Array> combined;
        if (chunked->num_chunks() == 0) {
            ARROW_ASSIGN_OR_RAISE(combined, arrow::MakeEmptyArray(arrow::utf8()));
        } else if (chunked->num_chunks() == 1) {
            combined = chunked->chunk(0);
        } else {
            ARROW_ASSIGN_OR_RAISE(combined, arrow::Concatenate(chunked->chunks()));
        }

        result->index_.emplace(name, i);
        result->names_.push_back(name);
        result->columns_.push_back(std::static_pointer_cast<arrow::StringArray>(combined));
        fields.push_back(arrow::field(name, arrow::utf8()));
        arrays.push_back(combined);
    }

    result->table_ = arrow::Table::Make(arrow::schema(fields), arrays, result->num_rows_);
    return result;
}

arrow::Result<std::shared_ptr<SourceTable>> SourceTable::FromRows(
    const std::vector<std::string>& columns,
    const std::vector<std::vector<std::optional<std::string>>>& rows) {

    std::vector<arrow::StringBuilder> builders(columns.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != columns.size()) {
            return arrow::Status::Invalid("Row ", r, " has ", rows[r].size(),
                                          " cells, expected ", columns.size());
        }
        for (size_t c = 0; c < columns.size(); ++c) {
            if (rows[r][c].has_value()) {
                ARROW_RETURN_NOT_OK(builders[c].Append(*rows[r][c]));
            } else {
                ARROW_RETURN_NOT_OK(builders[c].AppendNull());
            }
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (size_t c = 0; c < columns.size(); ++c) {
        std::shared_ptr<arrow::Array> array;
        ARROW_RETURN_NOT_OK(builders[c].Finish(&array));
        fields.push_back(arrow::field(columns[c], arrow::utf8()));
        arrays.push_back(std::move(array));
    }

    auto table = arrow::Table::Make(arrow::schema(fields), arrays,
                                    static_cast<int64_t>(rows.size()));
    return FromArrowTable(table);
}

int SourceTable::ColumnIndex(std::string_view name) const {
    auto it = index_.find(name);
    return it == index_.end() ? -1 : it->second;
}

} // namespace star_etl
