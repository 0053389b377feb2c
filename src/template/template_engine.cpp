#include <star_etl/template/template_engine.h>

#include <cctype>
#include <arrow/status.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

bool IsSafeByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-';
}

} // namespace

arrow::Status ValidateIri(const std::string& iri) {
    if (iri.empty()) {
        return arrow::Status::Invalid("Empty IRI");
    }
    for (unsigned char c : iri) {
        if (c <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}' ||
            c == '|' || c == '^' || c == '`' || c == '\\') {
            return arrow::Status::Invalid("Invalid character in IRI '", iri, "'");
        }
    }
    return arrow::Status::OK();
}

bool HasUriScheme(std::string_view value) {
    if (value.empty() || !std::isalpha(static_cast<unsigned char>(value[0]))) {
        return false;
    }
    for (size_t i = 1; i < value.size(); ++i) {
        char c = value[i];
        if (c == ':') {
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '.' && c != '-') {
            return false;
        }
    }
    return false;
}

TemplateEngine::TemplateEngine(const PrefixTable& prefixes,
                               std::string base_iri,
                               std::unordered_map<std::string, std::string> external,
                               TemplateEngineOptions options)
    : prefixes_(prefixes)
    , base_iri_(std::move(base_iri))
    , external_(std::move(external))
    , options_(options)
    , sanitize_cache_(options.cache_capacity)
    , expand_cache_(options.cache_capacity) {}

std::string TemplateEngine::SanitizeValue(std::string_view value) {
    std::string result(value);
    for (char& c : result) {
        if (!IsSafeByte(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return result;
}

std::string TemplateEngine::Sanitize(std::string_view value) {
    return sanitize_cache_.GetOrCompute(std::string(value), [](const std::string& v) {
        return SanitizeValue(v);
    });
}

std::string TemplateEngine::ExpandIri(std::string_view value) {
    return expand_cache_.GetOrCompute(std::string(value), [this](const std::string& v) {
        std::string expanded = prefixes_.Expand(v);
        if (!base_iri_.empty() && !HasUriScheme(expanded)) {
            return base_iri_ + expanded;
        }
        return expanded;
    });
}

std::optional<std::string_view> TemplateEngine::External(const std::string& name) const {
    if (name.size() < 2 || name[0] != '_') {
        return std::nullopt;
    }
    auto it = external_.find(name.substr(1));
    if (it == external_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::optional<std::string_view> TemplateEngine::Lookup(const std::string& name, const Row& row) const {
    auto value = row.Get(name);
    if (value.has_value() && !value->empty()) {
        return value;
    }
    return External(name);
}

bool TemplateEngine::HasAbsentValue(const Template& tmpl, const Row& row) const {
    for (const auto& segment : tmpl.segments()) {
        if (segment.kind == TemplateSegment::Kind::Reference && !Lookup(segment.value, row)) {
            return true;
        }
    }
    return false;
}

std::string TemplateEngine::RenderIri(const Template& tmpl,
                                      const std::vector<std::optional<std::string_view>>& values) {
    std::string text;
    size_t ref = 0;
    for (const auto& segment : tmpl.segments()) {
        if (segment.kind == TemplateSegment::Kind::Text) {
            text.append(segment.value);
            continue;
        }
        const auto& value = values[ref++];
        text.append(value.has_value() ? Sanitize(*value) : std::string(kSentinel));
    }
    return ExpandIri(text);
}

std::string TemplateEngine::RenderLiteral(const Template& tmpl, const Row& row) const {
    std::string text;
    for (const auto& segment : tmpl.segments()) {
        if (segment.kind == TemplateSegment::Kind::Text) {
            text.append(segment.value);
            continue;
        }
        auto value = Lookup(segment.value, row);
        text.append(value.has_value() ? *value : kSentinel);
    }
    return text;
}

arrow::Result<Term> TemplateEngine::Instantiate(const Template& tmpl, const Row& row,
                                                ObjectKind kind) {
    if (kind == ObjectKind::Literal) {
        return Term::Literal(RenderLiteral(tmpl, row));
    }

    std::vector<std::optional<std::string_view>> values;
    for (const auto& segment : tmpl.segments()) {
        if (segment.kind == TemplateSegment::Kind::Reference) {
            values.push_back(Lookup(segment.value, row));
        }
    }
    std::string iri = RenderIri(tmpl, values);
    ARROW_RETURN_NOT_OK(ValidateIri(iri));
    return Term::IRI(std::move(iri));
}

arrow::Result<Term> TemplateEngine::InstantiateObject(const TermObject& object, const Row& row) {
    if (object.kind == ObjectKind::Iri) {
        // A direct reference to a value that already is a valid IRI is used
        // verbatim; anything else is sanitized like every other IRI
        if (object.value.IsDirectReference()) {
            auto value = Lookup(object.value.segments()[0].value, row);
            if (value.has_value() && HasUriScheme(*value)) {
                std::string iri = ExpandIri(*value);
                if (ValidateIri(iri).ok()) {
                    return Term::IRI(std::move(iri));
                }
            }
        }
        return Instantiate(object.value, row, ObjectKind::Iri);
    }

    std::string lexical = RenderLiteral(object.value, row);
    if (object.language.has_value()) {
        std::string language = RenderLiteral(*object.language, row);
        if (!IsValidLanguageTag(language)) {
            return arrow::Status::Invalid("Invalid language tag '", language, "'");
        }
        return Term::Literal(std::move(lexical), std::move(language));
    }
    if (object.datatype.has_value()) {
        ARROW_ASSIGN_OR_RAISE(auto datatype, Instantiate(*object.datatype, row, ObjectKind::Iri));
        return Term::Literal(std::move(lexical), "", std::move(datatype.lexical));
    }
    return Term::Literal(std::move(lexical));
}

std::vector<std::string> TemplateEngine::InstantiateColumn(const Template& tmpl,
                                                           const SourceTable& table) {
    std::vector<std::string> refs = tmpl.References();
    std::vector<int> columns;
    columns.reserve(refs.size());
    for (const auto& ref : refs) {
        columns.push_back(table.ColumnIndex(ref));
    }

    std::vector<std::string> result;
    result.reserve(table.num_rows());
    std::vector<std::optional<std::string_view>> values(refs.size());

    for (int64_t row = 0; row < table.num_rows(); ++row) {
        for (size_t i = 0; i < refs.size(); ++i) {
            std::optional<std::string_view> cell;
            if (columns[i] >= 0) {
                cell = table.Value(columns[i], row);
            }
            values[i] = (cell.has_value() && !cell->empty()) ? cell : External(refs[i]);
        }
        result.push_back(RenderIri(tmpl, values));
    }

    STAR_ETL_LOG_TEMPLATE("Instantiated " << result.size() << " IRIs for " << tmpl.text());
    return result;
}

} // namespace star_etl
