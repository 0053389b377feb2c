#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include <arrow/api.h>

namespace star_etl {

// Rows of one loaded source, every column held as a UTF-8 string array
//
// A null cell means "absent": templates substitute the sentinel for it.
class SourceTable {
public:
    // Normalizes every column to utf8 (arrow::compute::Cast) and combines
    // chunks so cells can be addressed by (column, row).
    static arrow::Result<std::shared_ptr<SourceTable>> FromArrowTable(
        const std::shared_ptr<arrow::Table>& table);

    // Builds a table from row-major text cells (std::nullopt = null).
    // Every row must have one cell per column.
    static arrow::Result<std::shared_ptr<SourceTable>> FromRows(
        const std::vector<std::string>& columns,
        const std::vector<std::vector<std::optional<std::string>>>& rows);

    int64_t num_rows() const { return num_rows_; }
    int num_columns() const { return static_cast<int>(names_.size()); }
    const std::vector<std::string>& column_names() const { return names_; }

    // -1 if the column does not exist
    int ColumnIndex(std::string_view name) const;

    // std::nullopt for null cells
    std::optional<std::string_view> Value(int column, int64_t row) const {
        const auto& array = columns_[column];
        if (array->IsNull(row)) {
            return std::nullopt;
        }
        return array->GetView(row);
    }

    const std::shared_ptr<arrow::StringArray>& column(int i) const { return columns_[i]; }
    const std::shared_ptr<arrow::Table>& table() const { return table_; }

private:
    SourceTable() = default;

    std::shared_ptr<arrow::Table> table_;
    std::vector<std::shared_ptr<arrow::StringArray>> columns_;
    std::vector<std::string> names_;
    absl::flat_hash_map<std::string, int> index_;   // heterogeneous string_view lookup
    int64_t num_rows_ = 0;
};

// One row of a source table: column name -> raw textual value
struct Row {
    std::shared_ptr<const SourceTable> table;
    int64_t index = 0;

    // std::nullopt if the column is missing or the cell is null
    std::optional<std::string_view> Get(std::string_view name) const {
        int column = table->ColumnIndex(name);
        if (column < 0) {
            return std::nullopt;
        }
        return table->Value(column, index);
    }

    // Same table and same row index
    bool SameOrigin(const Row& other) const {
        return table == other.table && index == other.index;
    }
};

} // namespace star_etl
