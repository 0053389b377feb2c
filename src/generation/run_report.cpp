#include <star_etl/generation/run_report.h>

#include <sstream>
#include <nlohmann/json.hpp>

namespace star_etl {

void RunReport::AddIssue(const arrow::Status& status, const std::string& map_name,
                         std::optional<int64_t> row) {
    RunIssue issue;
    issue.kind = GetErrorKind(status).value_or(ErrorKind::RowEvaluationError);
    issue.map_name = map_name;
    issue.row = row;
    issue.message = status.message();
    issues.push_back(std::move(issue));
}

size_t RunReport::CountIssues(ErrorKind kind) const {
    size_t count = 0;
    for (const auto& issue : issues) {
        if (issue.kind == kind) {
            ++count;
        }
    }
    return count;
}

std::string RunReport::Summary() const {
    std::ostringstream oss;
    oss << "Sources loaded:        " << sources_loaded << "\n"
        << "Rows processed:        " << rows_processed << "\n"
        << "Rows skipped:          " << rows_skipped << "\n"
        << "Base triples:          " << base_triples << "\n"
        << "Reifiers:              " << reifiers << "\n"
        << "Annotation statements: " << annotation_statements << "\n";
    if (metadata_statements > 0) {
        oss << "Metadata statements:   " << metadata_statements << "\n";
    }
    oss << "Issues:                " << issues.size();
    if (maps_skipped > 0) {
        oss << " (" << maps_skipped << " maps skipped)";
    }
    return oss.str();
}

std::string RunReport::ToJson(int indent) const {
    nlohmann::json issues_json = nlohmann::json::array();
    for (const auto& issue : issues) {
        nlohmann::json item = {
            {"kind", std::string(ToString(issue.kind))},
            {"map", issue.map_name},
            {"message", issue.message}
        };
        item["row"] = issue.row.has_value() ? nlohmann::json(*issue.row) : nlohmann::json(nullptr);
        issues_json.push_back(std::move(item));
    }

    nlohmann::json report = {
        {"sources_loaded", sources_loaded},
        {"rows_processed", rows_processed},
        {"rows_skipped", rows_skipped},
        {"maps_skipped", maps_skipped},
        {"base_triples", base_triples},
        {"reifiers", reifiers},
        {"annotation_statements", annotation_statements},
        {"metadata_statements", metadata_statements},
        {"issues", issues_json}
    };
    return report.dump(indent);
}

} // namespace star_etl
