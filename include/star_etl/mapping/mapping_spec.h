#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <star_etl/mapping/prefix_table.h>
#include <star_etl/mapping/template.h>

namespace star_etl {

// Tabular origin of a triples map
struct SourceReference {
    std::string name;              // declared name, or derived from the path
    std::string path;              // locator as written in the mapping
    std::string format = "csv";    // "csv", "json", "jsonpath", ...
    std::string iterator;          // JSONPath iterator ("" = document root)

    // Identity used by the source cache before path resolution
    std::string Key() const { return format + "|" + path + "|" + iterator; }

    bool operator==(const SourceReference& other) const {
        return path == other.path && format == other.format && iterator == other.iterator;
    }
};

// Output target declared in the mapping
struct TargetSpec {
    std::string name;
    std::string access;
    std::string type;
    std::string serialization;
    std::string compression;
};

struct Author {
    std::string name;
    std::string email;
    std::string website;
    std::string webid;

    // name, else webid, else email
    std::string DisplayName() const;
};

enum class ObjectKind { Literal, Iri };

// Equality join between two row fields
//   left_key:  column of the cached (quoted) row
//   right_key: column of the annotation row
struct JoinCondition {
    std::string left_key;
    std::string right_key;

    bool operator==(const JoinCondition& other) const {
        return left_key == other.left_key && right_key == other.right_key;
    }
};

// Object produced from a template
struct TermObject {
    Template value;
    ObjectKind kind = ObjectKind::Literal;
    std::optional<Template> datatype;   // may reference columns: $(my_datatype)
    std::optional<Template> language;   // may reference columns: $(my_language)
};

// Join between a child column and a column of the parent map's source
struct ReferenceJoin {
    std::string child_key;
    std::string parent_key;
};

// Object produced by the subject of another (parent) triples map
struct ReferenceObject {
    std::string parent_map;
    std::vector<ReferenceJoin> joins;   // empty: parent subject over the same row
};

using ObjectRule = std::variant<TermObject, ReferenceObject>;

// One predicate with one object; long-form rules with several predicates
// and objects are expanded into their cartesian product at parse time
struct PredicateObjectRule {
    Template predicate;
    ObjectRule object;
    std::vector<Template> graphs;              // overrides the map graphs when set
    std::vector<Template> inverse_predicates;  // (object, inverse, subject), IRI objects only

    bool IsReference() const { return std::holds_alternative<ReferenceObject>(object); }
};

struct TemplateSubject {
    std::vector<Template> templates;   // one or more IRI templates
};

// Subject of an annotation map: a quoted triple from another map
struct QuotedSubject {
    std::string quoted_map;
    std::optional<JoinCondition> join;
    std::string join_error;                       // non-empty: condition could not be parsed
    std::optional<std::string> subject_namespace; // declared entity-family filter (unexpanded)

    bool HasInvalidJoin() const { return !join_error.empty(); }
};

using SubjectRule = std::variant<TemplateSubject, QuotedSubject>;

// Named unit of the mapping
struct TriplesMap {
    std::string name;
    std::vector<SourceReference> sources;
    SubjectRule subject;
    std::vector<Template> types;
    std::vector<PredicateObjectRule> predicate_objects;
    std::vector<Template> graphs;

    bool IsQuoted() const { return std::holds_alternative<QuotedSubject>(subject); }

    const QuotedSubject* quoted_subject() const { return std::get_if<QuotedSubject>(&subject); }
    const TemplateSubject* template_subject() const { return std::get_if<TemplateSubject>(&subject); }
};

// Parsed mapping document
struct MappingSpec {
    std::string base_iri;
    PrefixTable prefixes;
    std::vector<Author> authors;
    std::unordered_map<std::string, std::string> external;
    std::vector<SourceReference> sources;   // named, reusable sources
    std::vector<TargetSpec> targets;
    std::vector<TriplesMap> triples_maps;   // document order

    const TriplesMap* FindMap(const std::string& name) const;
    const SourceReference* FindSource(const std::string& name) const;

    size_t CountQuotedMaps() const;
};

} // namespace star_etl
