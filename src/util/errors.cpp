#include <star_etl/util/errors.h>

#include <cstring>

namespace star_etl {

std::string EtlErrorDetail::ToString() const {
    std::string out(star_etl::ToString(kind_));
    if (!section_.empty()) {
        out += " [" + section_ + "]";
    }
    return out;
}

namespace {

arrow::Status MakeError(arrow::StatusCode code, ErrorKind kind,
                        const std::string& section, const std::string& message) {
    return arrow::Status(code, message,
                         std::make_shared<EtlErrorDetail>(kind, section));
}

const EtlErrorDetail* GetDetail(const arrow::Status& status) {
    if (status.ok() || status.detail() == nullptr) {
        return nullptr;
    }
    if (std::strcmp(status.detail()->type_id(), EtlErrorDetail::kTypeId) != 0) {
        return nullptr;
    }
    return static_cast<const EtlErrorDetail*>(status.detail().get());
}

} // namespace

arrow::Status MalformedSpecification(const std::string& section,
                                     const std::string& message) {
    return MakeError(arrow::StatusCode::Invalid, ErrorKind::MalformedSpecification,
                     section, "Malformed specification in '" + section + "': " + message);
}

arrow::Status SourceUnavailable(const std::string& source,
                                const std::string& message) {
    return MakeError(arrow::StatusCode::IOError, ErrorKind::SourceUnavailable,
                     source, "Source unavailable '" + source + "': " + message);
}

arrow::Status RowEvaluationError(const std::string& map_name,
                                 const std::string& message) {
    return MakeError(arrow::StatusCode::Invalid, ErrorKind::RowEvaluationError,
                     map_name, message);
}

arrow::Status JoinConditionInvalid(const std::string& map_name,
                                   const std::string& message) {
    return MakeError(arrow::StatusCode::Invalid, ErrorKind::JoinConditionInvalid,
                     map_name, "Invalid join condition in '" + map_name + "': " + message);
}

arrow::Status UnsupportedConstruct(const std::string& section,
                                   const std::string& message) {
    return MakeError(arrow::StatusCode::NotImplemented, ErrorKind::UnsupportedConstruct,
                     section, "Unsupported construct in '" + section + "': " + message);
}

std::optional<ErrorKind> GetErrorKind(const arrow::Status& status) {
    const auto* detail = GetDetail(status);
    if (detail == nullptr) {
        return std::nullopt;
    }
    return detail->kind();
}

std::string GetErrorSection(const arrow::Status& status) {
    const auto* detail = GetDetail(status);
    return detail == nullptr ? std::string() : detail->section();
}

bool IsFatal(ErrorKind kind) {
    return kind == ErrorKind::MalformedSpecification ||
           kind == ErrorKind::UnsupportedConstruct;
}

} // namespace star_etl
