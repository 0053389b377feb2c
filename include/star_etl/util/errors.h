#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <arrow/status.h>

namespace star_etl {

// Error taxonomy of a generation run
//
// MalformedSpecification and UnsupportedConstruct abort before generation.
// SourceUnavailable is fatal only for the maps reading that source.
// RowEvaluationError and JoinConditionInvalid are recovered and recorded in
// the run report.
enum class ErrorKind {
    MalformedSpecification,
    SourceUnavailable,
    RowEvaluationError,
    JoinConditionInvalid,
    UnsupportedConstruct
};

constexpr std::string_view ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedSpecification: return "MalformedSpecification";
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::RowEvaluationError: return "RowEvaluationError";
        case ErrorKind::JoinConditionInvalid: return "JoinConditionInvalid";
        case ErrorKind::UnsupportedConstruct: return "UnsupportedConstruct";
    }
    return "Unknown";
}

// Attached to an arrow::Status to carry the error kind and the offending
// section of the mapping document (e.g. "prefixes", "mappings.person")
class EtlErrorDetail : public arrow::StatusDetail {
public:
    static constexpr const char kTypeId[] = "star_etl::EtlErrorDetail";

    EtlErrorDetail(ErrorKind kind, std::string section)
        : kind_(kind), section_(std::move(section)) {}

    const char* type_id() const override { return kTypeId; }
    std::string ToString() const override;

    ErrorKind kind() const { return kind_; }
    const std::string& section() const { return section_; }

private:
    ErrorKind kind_;
    std::string section_;
};

arrow::Status MalformedSpecification(const std::string& section,
                                     const std::string& message);
arrow::Status SourceUnavailable(const std::string& source,
                                const std::string& message);
arrow::Status RowEvaluationError(const std::string& map_name,
                                 const std::string& message);
arrow::Status JoinConditionInvalid(const std::string& map_name,
                                   const std::string& message);
arrow::Status UnsupportedConstruct(const std::string& section,
                                   const std::string& message);

// Returns the kind carried by the status, or std::nullopt for plain statuses
std::optional<ErrorKind> GetErrorKind(const arrow::Status& status);

// Returns the section carried by the status ("" for plain statuses)
std::string GetErrorSection(const arrow::Status& status);

// True for kinds that must abort the run
bool IsFatal(ErrorKind kind);

} // namespace star_etl
