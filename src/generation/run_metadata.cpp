#include <star_etl/generation/run_metadata.h>

#include <chrono>
#include <ctime>

namespace star_etl {

namespace {

constexpr const char* kDefaultBase = "http://example.org/";

Statement MetadataStatement(const Term& subject, std::string predicate, Term object) {
    Statement statement;
    statement.subject = subject;
    statement.predicate = Term::IRI(std::move(predicate));
    statement.object = std::move(object);
    statement.role = StatementRole::Metadata;
    return statement;
}

} // namespace

std::string RunDatasetIri(const MappingSpec& spec) {
    return (spec.base_iri.empty() ? std::string(kDefaultBase) : spec.base_iri) + "dataset/etl_import";
}

std::vector<Statement> BuildRunMetadata(const MappingSpec& spec,
                                        const std::string& mapping_file_name,
                                        const std::string& created_timestamp) {
    const std::string dcat(vocab::kDcatNamespace);
    const std::string dct(vocab::kDctNamespace);
    const Term dataset = Term::IRI(RunDatasetIri(spec));

    std::vector<Statement> statements;
    statements.push_back(MetadataStatement(dataset, std::string(vocab::kRdfType),
                                           Term::IRI(dcat + "Dataset")));
    statements.push_back(MetadataStatement(dataset, dct + "title",
                                           Term::Literal("ETL Pipeline Generated Dataset")));
    statements.push_back(MetadataStatement(dataset, dct + "description",
                                           Term::Literal("Generated from YARRRML mapping: " +
                                                         mapping_file_name)));
    statements.push_back(MetadataStatement(dataset, dct + "created",
                                           Term::Literal(created_timestamp, "",
                                                         std::string(vocab::kXsdDateTime))));
    for (const auto& author : spec.authors) {
        statements.push_back(MetadataStatement(dataset, dct + "creator",
                                               Term::Literal(author.DisplayName())));
    }
    return statements;
}

std::string CurrentTimestampUtc() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace star_etl
