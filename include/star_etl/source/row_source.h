#pragma once

#include <memory>
#include <string>
#include <arrow/result.h>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/source/source_table.h>

namespace star_etl {

// Abstract tabular connector: produces the rows of one source
class RowSource {
public:
    virtual ~RowSource() = default;

    // Reads the whole source. Failures are SourceUnavailable.
    virtual arrow::Result<std::shared_ptr<SourceTable>> Load() = 0;

    // "csv:/data/people.csv", used in log and error messages
    virtual std::string Describe() const = 0;
};

// CSV file read with the Arrow CSV reader. Every column is read as text so
// lexical forms such as "007" survive.
class CsvRowSource : public RowSource {
public:
    explicit CsvRowSource(std::string path) : path_(std::move(path)) {}

    arrow::Result<std::shared_ptr<SourceTable>> Load() override;
    std::string Describe() const override { return "csv:" + path_; }

private:
    std::string path_;
};

// JSON document iterated with a JSONPath subset:
//   $            document root (array elements or the single object)
//   $.a.b        object keys
//   $.a[*]       all elements of an array
//   $.a[2]       one element of an array
// Nested objects are flattened with dotted keys ("address.city"); scalar
// items become a single "value" column.
class JsonRowSource : public RowSource {
public:
    JsonRowSource(std::string path, std::string iterator)
        : path_(std::move(path)), iterator_(std::move(iterator)) {}

    arrow::Result<std::shared_ptr<SourceTable>> Load() override;
    std::string Describe() const override {
        return "json:" + path_ + (iterator_.empty() ? "" : " " + iterator_);
    }

private:
    std::string path_;
    std::string iterator_;
};

// Already loaded rows, for embedding and tests
class InMemoryRowSource : public RowSource {
public:
    explicit InMemoryRowSource(std::shared_ptr<SourceTable> table, std::string name = "memory")
        : table_(std::move(table)), name_(std::move(name)) {}

    arrow::Result<std::shared_ptr<SourceTable>> Load() override { return table_; }
    std::string Describe() const override { return "memory:" + name_; }

private:
    std::shared_ptr<SourceTable> table_;
    std::string name_;
};

// Rows of a JSON text under a JSONPath iterator
arrow::Result<std::shared_ptr<SourceTable>> ParseJsonRows(const std::string& text,
                                                          const std::string& iterator);

// Connector for a source reference whose path has already been resolved.
// Unknown formats are SourceUnavailable.
arrow::Result<std::unique_ptr<RowSource>> MakeRowSource(const SourceReference& reference,
                                                        const std::string& resolved_path);

} // namespace star_etl
