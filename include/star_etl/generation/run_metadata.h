#pragma once

#include <string>
#include <vector>
#include <star_etl/mapping/mapping_spec.h>
#include <star_etl/rdf/term.h>

namespace star_etl {

// <base>dataset/etl_import, with http://example.org/ when the mapping has no base
std::string RunDatasetIri(const MappingSpec& spec);

// dcat:Dataset description of a run: type, dct:title, dct:description
// naming the mapping file, dct:created and one dct:creator per author.
// Statements carry StatementRole::Metadata.
std::vector<Statement> BuildRunMetadata(const MappingSpec& spec,
                                        const std::string& mapping_file_name,
                                        const std::string& created_timestamp);

// Current UTC time as xsd:dateTime lexical form: 2026-10-19T08:30:00Z
std::string CurrentTimestampUtc();

} // namespace star_etl
