#include <star_etl/rdf/term.h>

#include <regex>

namespace star_etl {

Term Term::Quoted(const Triple& triple) {
    Term term;
    term.kind = TermKind::QuotedTriple;
    term.quoted = std::make_shared<const Triple>(triple);
    return term;
}

bool Term::operator==(const Term& other) const {
    if (kind != other.kind) {
        return false;
    }
    if (kind == TermKind::QuotedTriple) {
        if (quoted == other.quoted) {
            return true;
        }
        if (quoted == nullptr || other.quoted == nullptr) {
            return false;
        }
        return *quoted == *other.quoted;
    }
    return lexical == other.lexical &&
           language == other.language &&
           datatype == other.datatype;
}

bool IsValidLanguageTag(const std::string& tag) {
    static const std::regex kLanguageTag("^[A-Za-z]+(-[A-Za-z0-9]+)*$");
    return std::regex_match(tag, kLanguageTag);
}

std::string EscapeLiteral(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string SerializeNTriplesTerm(const Term& term) {
    switch (term.kind) {
        case TermKind::IRI:
            return "<" + term.lexical + ">";

        case TermKind::BlankNode:
            return "_:" + term.lexical;

        case TermKind::Literal: {
            std::string result = "\"" + EscapeLiteral(term.lexical) + "\"";
            if (!term.language.empty()) {
                result += "@" + term.language;
            } else if (!term.datatype.empty() && term.datatype != vocab::kXsdString) {
                result += "^^<" + term.datatype + ">";
            }
            return result;
        }

        case TermKind::QuotedTriple: {
            if (term.quoted == nullptr) {
                return "";
            }
            return "<<( " + SerializeNTriplesTerm(term.quoted->subject) + " " +
                   SerializeNTriplesTerm(term.quoted->predicate) + " " +
                   SerializeNTriplesTerm(term.quoted->object) + " )>>";
        }

        default:
            return "";
    }
}

} // namespace star_etl

size_t std::hash<star_etl::Term>::operator()(const star_etl::Term& term) const {
    if (term.kind == star_etl::TermKind::QuotedTriple && term.quoted != nullptr) {
        return std::hash<star_etl::Triple>{}(*term.quoted) ^ 0x51ed27;
    }
    size_t h1 = std::hash<std::string>{}(term.lexical);
    size_t h2 = std::hash<uint8_t>{}(static_cast<uint8_t>(term.kind));
    size_t h3 = std::hash<std::string>{}(term.language);
    size_t h4 = std::hash<std::string>{}(term.datatype);
    return h1 ^ (h2 << 1) ^ (h3 << 2) ^ (h4 << 3);
}
