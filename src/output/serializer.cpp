#include <star_etl/output/serializer.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <unordered_map>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

// Local parts that can be written as prefixed names without escaping
bool IsSafeLocalName(const std::string& local) {
    static const std::regex kLocalName("^([A-Za-z0-9_]([A-Za-z0-9_.-]*[A-Za-z0-9_-])?)?$");
    return std::regex_match(local, kLocalName);
}

} // namespace

arrow::Result<OutputFormat> ParseOutputFormat(std::string_view name) {
    if (name == "nquads" || name == "nq" || name == "ntriples" || name == "nt") {
        return OutputFormat::NQuads;
    }
    if (name == "trig") {
        return OutputFormat::TriG;
    }
    return arrow::Status::Invalid("Unknown output format '", std::string(name),
                                  "' (expected nquads or trig)");
}

std::string_view FileExtension(OutputFormat format) {
    switch (format) {
        case OutputFormat::NQuads: return "nq";
        case OutputFormat::TriG: return "trig";
    }
    return "nq";
}

std::string NQuadsSerializer::FormatStatement(const Statement& statement) {
    std::string line = SerializeNTriplesTerm(statement.subject);
    line += ' ';
    line += SerializeNTriplesTerm(statement.predicate);
    line += ' ';
    line += SerializeNTriplesTerm(statement.object);
    if (statement.graph.has_value()) {
        line += ' ';
        line += SerializeNTriplesTerm(*statement.graph);
    }
    line += " .";
    return line;
}

arrow::Status NQuadsSerializer::Write(const std::vector<Statement>& statements, std::ostream& out) {
    for (const auto& statement : statements) {
        out << FormatStatement(statement) << '\n';
    }
    if (!out) {
        return arrow::Status::IOError("Failed writing N-Quads output");
    }
    return arrow::Status::OK();
}

std::string TriGSerializer::FormatIri(const std::string& iri) const {
    if (iri == vocab::kRdfType) {
        return "a";
    }
    auto compact = prefixes_.Compact(iri);
    if (compact.has_value() && IsSafeLocalName(compact->second)) {
        return compact->first + ":" + compact->second;
    }
    return "<" + iri + ">";
}

std::string TriGSerializer::FormatTerm(const Term& term) const {
    switch (term.kind) {
        case TermKind::IRI:
            return FormatIri(term.lexical);
        case TermKind::BlankNode:
            return "_:" + term.lexical;
        case TermKind::Literal: {
            std::string text = "\"" + EscapeLiteral(term.lexical) + "\"";
            if (!term.language.empty()) {
                text += "@" + term.language;
            } else if (!term.datatype.empty() && term.datatype != vocab::kXsdString) {
                std::string datatype = FormatIri(term.datatype);
                text += "^^" + (datatype == "a" ? "<" + term.datatype + ">" : datatype);
            }
            return text;
        }
        case TermKind::QuotedTriple:
            return "<<( " + FormatTerm(term.quoted->subject) + " " +
                   FormatTerm(term.quoted->predicate) + " " +
                   FormatTerm(term.quoted->object) + " )>>";
        case TermKind::Undefined:
            break;
    }
    return "";
}

arrow::Status TriGSerializer::Write(const std::vector<Statement>& statements, std::ostream& out) {
    for (const auto& entry : prefixes_.entries()) {
        out << "@prefix " << entry.first << ": <" << entry.second << "> .\n";
    }
    if (!prefixes_.empty()) {
        out << "\n";
    }

    // Group by graph, default graph first, named graphs by first appearance
    std::vector<const Statement*> default_graph;
    std::vector<std::string> graph_order;
    std::unordered_map<std::string, std::vector<const Statement*>> named;
    for (const auto& statement : statements) {
        if (!statement.graph.has_value()) {
            default_graph.push_back(&statement);
            continue;
        }
        const std::string key = FormatTerm(*statement.graph);
        auto it = named.find(key);
        if (it == named.end()) {
            graph_order.push_back(key);
            it = named.emplace(key, std::vector<const Statement*>()).first;
        }
        it->second.push_back(&statement);
    }

    auto write_triple = [this, &out](const Statement& statement, const char* indent) {
        out << indent << FormatTerm(statement.subject) << " "
            << FormatTerm(statement.predicate) << " "
            << FormatTerm(statement.object) << " .\n";
    };

    for (const Statement* statement : default_graph) {
        write_triple(*statement, "");
    }
    for (const auto& graph : graph_order) {
        out << "\n" << graph << " {\n";
        for (const Statement* statement : named[graph]) {
            write_triple(*statement, "    ");
        }
        out << "}\n";
    }

    if (!out) {
        return arrow::Status::IOError("Failed writing TriG output");
    }
    return arrow::Status::OK();
}

std::unique_ptr<StatementSerializer> MakeSerializer(OutputFormat format,
                                                    const PrefixTable& prefixes) {
    switch (format) {
        case OutputFormat::TriG:
            return std::make_unique<TriGSerializer>(prefixes);
        case OutputFormat::NQuads:
            break;
    }
    return std::make_unique<NQuadsSerializer>();
}

arrow::Status WriteStatementsToFile(const std::vector<Statement>& statements,
                                    const std::string& path,
                                    OutputFormat format,
                                    const PrefixTable& prefixes) {
    std::filesystem::path output(path);
    std::error_code ec;
    if (output.has_parent_path()) {
        std::filesystem::create_directories(output.parent_path(), ec);
        if (ec) {
            return arrow::Status::IOError("Cannot create directory ",
                                          output.parent_path().string(), ": ", ec.message());
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return arrow::Status::IOError("Cannot open output file ", path);
    }
    ARROW_RETURN_NOT_OK(MakeSerializer(format, prefixes)->Write(statements, out));
    STAR_ETL_LOG_OUTPUT("Wrote " << statements.size() << " statements to " << path);
    return arrow::Status::OK();
}

} // namespace star_etl
