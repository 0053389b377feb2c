#pragma once

#include <string>
#include <vector>
#include <arrow/result.h>
#include <star_etl/mapping/mapping_spec.h>

namespace YAML {
class Node;
} // namespace YAML

namespace star_etl {

// YARRRML(-star) mapping document parser
//
// Converts a YAML mapping document into a MappingSpec. Every rule shape is
// decided here; the executor never inspects YAML. Failures carry an
// EtlErrorDetail naming the offending section:
//
//   MalformedSpecification  - invalid structure, duplicate names, bad templates
//   UnsupportedConstruct    - recognized YARRRML features that are not handled
//                             (conditions, functions, nested quoted maps)
//
// Parsing never touches the referenced sources.
class YarrrmlParser {
public:
    YarrrmlParser() = default;

    arrow::Result<MappingSpec> ParseFile(const std::string& path);
    arrow::Result<MappingSpec> ParseString(const std::string& document);

private:
    arrow::Result<MappingSpec> ParseDocument(const YAML::Node& root);

    // Top-level sections
    arrow::Status ParsePrefixes(const YAML::Node& node, MappingSpec* spec);
    arrow::Status ParseAuthors(const YAML::Node& node, MappingSpec* spec);
    arrow::Status ParseExternal(const YAML::Node& node, MappingSpec* spec);
    arrow::Status ParseNamedSources(const YAML::Node& node, MappingSpec* spec);
    arrow::Status ParseTargets(const YAML::Node& node, MappingSpec* spec);
    arrow::Status ParseMappings(const YAML::Node& node, MappingSpec* spec);

    // Triples maps
    arrow::Result<TriplesMap> ParseTriplesMap(const std::string& name,
                                              const YAML::Node& node,
                                              const MappingSpec& spec);
    arrow::Result<std::vector<SourceReference>> ParseMapSources(const YAML::Node& node,
                                                                const std::string& section,
                                                                const MappingSpec& spec);
    arrow::Result<SourceReference> ParseSourceEntry(const YAML::Node& node,
                                                    const std::string& section,
                                                    const MappingSpec& spec);
    arrow::Result<SubjectRule> ParseSubject(const YAML::Node& node,
                                            const std::string& section);
    arrow::Result<QuotedSubject> ParseQuotedSubject(const YAML::Node& node,
                                                    const std::string& section);
    arrow::Status ParsePredicateObjects(const YAML::Node& node,
                                        const std::string& section,
                                        TriplesMap* map);
    arrow::Status ParseShorthandRule(const YAML::Node& node,
                                     const std::string& section,
                                     TriplesMap* map);
    arrow::Status ParseLongFormRule(const YAML::Node& node,
                                    const std::string& section,
                                    TriplesMap* map);
    arrow::Result<std::vector<ObjectRule>> ParseObjects(const YAML::Node& node,
                                                        const std::string& section);
    arrow::Result<ObjectRule> ParseObjectMap(const YAML::Node& node,
                                             const std::string& section);
    arrow::Result<std::vector<Template>> ParseTemplateList(const YAML::Node& node,
                                                           const std::string& section,
                                                           const std::string& what);

    // Cross-map checks once every map is known
    arrow::Status Validate(const MappingSpec& spec);
};

// Splits "path~format" into a source reference. Without a marker the format
// is inferred from the extension (.json -> json, otherwise csv).
SourceReference ParseSourceShortcut(const std::string& value);

// Parses "Name <email> (website)" or a bare WebID IRI
Author ParseAuthorShortcut(const std::string& value);

} // namespace star_etl
