#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <star_etl/mapping/prefix_table.h>
#include <star_etl/rdf/term.h>

namespace star_etl {

enum class OutputFormat { NQuads, TriG };

// "nquads"/"nq" or "trig"
arrow::Result<OutputFormat> ParseOutputFormat(std::string_view name);

// "nq" / "trig"
std::string_view FileExtension(OutputFormat format);

// Writes a statement set in generation order
class StatementSerializer {
public:
    virtual ~StatementSerializer() = default;

    virtual arrow::Status Write(const std::vector<Statement>& statements, std::ostream& out) = 0;
};

// One statement per line; triple terms as <<( s p o )>>
class NQuadsSerializer : public StatementSerializer {
public:
    arrow::Status Write(const std::vector<Statement>& statements, std::ostream& out) override;

    static std::string FormatStatement(const Statement& statement);
};

// Prefix block, default graph first, then named graphs in first-appearance
// order. IRIs are written as prefixed names when the local part is safe.
class TriGSerializer : public StatementSerializer {
public:
    explicit TriGSerializer(const PrefixTable& prefixes) : prefixes_(prefixes) {}

    arrow::Status Write(const std::vector<Statement>& statements, std::ostream& out) override;

    std::string FormatTerm(const Term& term) const;

private:
    std::string FormatIri(const std::string& iri) const;

    const PrefixTable& prefixes_;
};

std::unique_ptr<StatementSerializer> MakeSerializer(OutputFormat format,
                                                    const PrefixTable& prefixes);

// Serializes to a file, creating missing parent directories
arrow::Status WriteStatementsToFile(const std::vector<Statement>& statements,
                                    const std::string& path,
                                    OutputFormat format,
                                    const PrefixTable& prefixes);

} // namespace star_etl
