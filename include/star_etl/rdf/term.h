#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace star_etl {

// Well-known vocabulary IRIs used by the generator
namespace vocab {
inline constexpr std::string_view kRdfNamespace = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kRdfsNamespace = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view kXsdNamespace = "http://www.w3.org/2001/XMLSchema#";
inline constexpr std::string_view kDcatNamespace = "http://www.w3.org/ns/dcat#";
inline constexpr std::string_view kDctNamespace = "http://purl.org/dc/terms/";

inline constexpr std::string_view kRdfType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
inline constexpr std::string_view kRdfReifies = "http://www.w3.org/1999/02/22-rdf-syntax-ns#reifies";
inline constexpr std::string_view kRdfLangString = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
inline constexpr std::string_view kXsdString = "http://www.w3.org/2001/XMLSchema#string";
inline constexpr std::string_view kXsdDateTime = "http://www.w3.org/2001/XMLSchema#dateTime";
} // namespace vocab

// TermKind enum - identifies RDF term kinds
enum class TermKind : uint8_t {
    Undefined = 0,
    IRI = 1,
    Literal = 2,
    BlankNode = 3,
    QuotedTriple = 4   // RDF 1.2 triple term, only used as object of rdf:reifies
};

constexpr std::string_view ToString(TermKind kind) {
    switch (kind) {
        case TermKind::Undefined: return "Undefined";
        case TermKind::IRI: return "IRI";
        case TermKind::Literal: return "Literal";
        case TermKind::BlankNode: return "BlankNode";
        case TermKind::QuotedTriple: return "QuotedTriple";
    }
    return "Unknown";
}

struct Triple;

// RDF Term: Full representation of an RDF term
struct Term {
    std::string lexical;      // Lexical form: "Acme", "http://example.org/dataset/7", "r12"
    TermKind kind;            // IRI, Literal, BlankNode or QuotedTriple
    std::string language;     // Language tag (for literals): "en", "de"
    std::string datatype;     // Expanded datatype IRI (for literals)
    std::shared_ptr<const Triple> quoted;  // Set for QuotedTriple terms

    Term() : kind(TermKind::Undefined) {}

    Term(std::string lex, TermKind k,
         std::string lang = "", std::string dtype = "")
        : lexical(std::move(lex)), kind(k),
          language(std::move(lang)), datatype(std::move(dtype)) {}

    static Term IRI(std::string iri) {
        return Term(std::move(iri), TermKind::IRI);
    }

    static Term Literal(std::string value,
                        std::string lang = "",
                        std::string datatype = "") {
        return Term(std::move(value), TermKind::Literal, std::move(lang), std::move(datatype));
    }

    static Term BlankNode(std::string id) {
        return Term(std::move(id), TermKind::BlankNode);
    }

    static Term Quoted(const Triple& triple);

    bool IsIRI() const { return kind == TermKind::IRI; }
    bool IsLiteral() const { return kind == TermKind::Literal; }
    bool IsBlankNode() const { return kind == TermKind::BlankNode; }
    bool IsQuoted() const { return kind == TermKind::QuotedTriple; }
    bool IsUndefined() const { return kind == TermKind::Undefined; }

    bool operator==(const Term& other) const;
    bool operator!=(const Term& other) const { return !(*this == other); }
};

// RDF Triple: (Subject, Predicate, Object)
struct Triple {
    Term subject;
    Term predicate;
    Term object;

    bool operator==(const Triple& other) const {
        return subject == other.subject &&
               predicate == other.predicate &&
               object == other.object;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }
};

// What produced a statement
enum class StatementRole : uint8_t {
    Base,        // Pass 1 triple from a triples map
    Reifies,     // reifier rdf:reifies <<( s p o )>>
    Annotation,  // reifier metadata predicate-object
    Metadata     // run metadata (dcat:Dataset description)
};

constexpr std::string_view ToString(StatementRole role) {
    switch (role) {
        case StatementRole::Base: return "Base";
        case StatementRole::Reifies: return "Reifies";
        case StatementRole::Annotation: return "Annotation";
        case StatementRole::Metadata: return "Metadata";
    }
    return "Unknown";
}

// Generated statement: a triple with an optional named graph
struct Statement {
    Term subject;
    Term predicate;
    Term object;
    std::optional<Term> graph;   // std::nullopt = default graph
    StatementRole role = StatementRole::Base;

    Triple AsTriple() const { return Triple{subject, predicate, object}; }

    bool operator==(const Statement& other) const {
        return subject == other.subject && predicate == other.predicate &&
               object == other.object && graph == other.graph && role == other.role;
    }
};

// N-Triples / N-Quads rendering of a term, with RDF 1.2 triple terms
// rendered as <<( s p o )>>
//   <http://example.org/alice>, "Alice"@en, "42"^^<xsd-iri>, _:r1
std::string SerializeNTriplesTerm(const Term& term);

// BCP 47 shape check: "en", "en-GB", "zh-Hant-TW"
bool IsValidLanguageTag(const std::string& tag);

// Escapes a literal lexical form for N-Triples (\" \\ \n \r \t)
std::string EscapeLiteral(std::string_view value);

} // namespace star_etl

namespace std {
template <>
struct hash<star_etl::Term> {
    size_t operator()(const star_etl::Term& term) const;
};

template <>
struct hash<star_etl::Triple> {
    size_t operator()(const star_etl::Triple& triple) const {
        std::hash<star_etl::Term> h;
        size_t seed = h(triple.subject);
        seed ^= h(triple.predicate) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= h(triple.object) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};
} // namespace std
