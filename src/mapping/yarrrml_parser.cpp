#include <star_etl/mapping/yarrrml_parser.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <unordered_set>
#include <yaml-cpp/yaml.h>
#include <star_etl/mapping/join_function.h>
#include <star_etl/rdf/term.h>
#include <star_etl/util/errors.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

// First defined child under any of the given keys (map nodes only)
std::optional<YAML::Node> FindKey(const YAML::Node& node,
                                  std::initializer_list<const char*> keys) {
    if (!node.IsMap()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        const YAML::Node child = node[key];
        if (child.IsDefined()) {
            return child;
        }
    }
    return std::nullopt;
}

const char* DescribeNode(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar: return "scalar";
        case YAML::NodeType::Sequence: return "sequence";
        case YAML::NodeType::Map: return "map";
        case YAML::NodeType::Null: return "null";
        case YAML::NodeType::Undefined: return "undefined";
    }
    return "unknown";
}

std::string Trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// "ql:JSONPath" -> "jsonpath", "CSV" -> "csv"
std::string NormalizeFormat(const std::string& format) {
    std::string lowered = ToLower(Trim(format));
    size_t colon = lowered.rfind(':');
    if (colon != std::string::npos) {
        lowered = lowered.substr(colon + 1);
    }
    return lowered;
}

arrow::Result<std::string> RequireScalar(const YAML::Node& node,
                                         const std::string& section,
                                         const std::string& what) {
    if (!node.IsScalar()) {
        return MalformedSpecification(section, what + " must be a string, found " +
                                      DescribeNode(node));
    }
    return node.Scalar();
}

arrow::Result<Template> CompileTemplate(const std::string& text,
                                        const std::string& section) {
    auto result = Template::Parse(text);
    if (!result.ok()) {
        return MalformedSpecification(section, "template '" + text + "': " +
                                      result.status().message());
    }
    return result;
}

// Scalar or sequence of scalars
arrow::Result<std::vector<std::string>> ScalarList(const YAML::Node& node,
                                                   const std::string& section,
                                                   const std::string& what) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(node.Scalar());
        return values;
    }
    if (!node.IsSequence()) {
        return MalformedSpecification(section, what + " must be a string or a list, found " +
                                      DescribeNode(node));
    }
    for (const auto& item : node) {
        ARROW_ASSIGN_OR_RAISE(auto value, RequireScalar(item, section, what));
        values.push_back(std::move(value));
    }
    return values;
}

bool IsTypePredicate(const std::string& predicate) {
    return predicate == "a" || predicate == "rdf:type" ||
           predicate == std::string(vocab::kRdfType);
}

arrow::Result<Template> CompileLanguage(const std::string& text, const std::string& section) {
    ARROW_ASSIGN_OR_RAISE(auto language, CompileTemplate(text, section));
    if (language.IsConstant() && !IsValidLanguageTag(text)) {
        return MalformedSpecification(section, "invalid language tag '" + text + "'");
    }
    return language;
}

// Shorthand modifier: "iri", "literal", "en~lang" or a datatype
arrow::Status ApplyModifier(const std::string& modifier, const std::string& section,
                            TermObject* object) {
    static constexpr std::string_view kLangMarker = "~lang";

    if (modifier == "iri") {
        object->kind = ObjectKind::Iri;
        return arrow::Status::OK();
    }
    if (modifier == "literal") {
        object->kind = ObjectKind::Literal;
        return arrow::Status::OK();
    }
    if (modifier.size() > kLangMarker.size() &&
        modifier.compare(modifier.size() - kLangMarker.size(), kLangMarker.size(), kLangMarker) == 0) {
        ARROW_ASSIGN_OR_RAISE(auto language,
            CompileLanguage(modifier.substr(0, modifier.size() - kLangMarker.size()), section));
        object->language = std::move(language);
        return arrow::Status::OK();
    }
    ARROW_ASSIGN_OR_RAISE(auto datatype, CompileTemplate(modifier, section));
    object->datatype = std::move(datatype);
    return arrow::Status::OK();
}

arrow::Result<TermObject> MakeTermObject(const std::string& value,
                                         const std::string& section) {
    TermObject object;
    ARROW_ASSIGN_OR_RAISE(object.value, CompileTemplate(value, section));
    object.kind = object.value.has_iri_marker() ? ObjectKind::Iri : ObjectKind::Literal;
    return object;
}

// Parameters of an equal(str1, str2) condition
struct EqualParameters {
    std::optional<std::string> str1;
    std::optional<std::string> str2;
    std::string str1_from;   // "s" (this map) or "o" (the other map), if declared
    std::string str2_from;
};

// Reads {function: equal, parameters: [[str1, $(a)], [str2, $(b), s]]}.
// Structural problems are returned as plain Invalid statuses so callers can
// decide how severe they are.
arrow::Result<EqualParameters> ReadEqualCondition(const YAML::Node& condition) {
    if (!condition.IsMap()) {
        return arrow::Status::Invalid("condition must be a map, found ", DescribeNode(condition));
    }

    auto function = FindKey(condition, {"function", "fn"});
    if (!function || !function->IsScalar()) {
        return arrow::Status::Invalid("condition does not name a function");
    }
    std::string name = function->Scalar();
    size_t colon = name.rfind(':');
    if ((colon == std::string::npos ? name : name.substr(colon + 1)) != "equal") {
        return arrow::Status::Invalid("unsupported condition function '", name, "'");
    }

    auto parameters = FindKey(condition, {"parameters", "pms"});
    if (!parameters || !parameters->IsSequence()) {
        return arrow::Status::Invalid("equal condition requires a parameter list");
    }

    EqualParameters result;
    for (const auto& parameter : *parameters) {
        std::string key;
        std::string value;
        std::string from;
        if (parameter.IsSequence() && parameter.size() >= 2 && parameter.size() <= 3 &&
            parameter[0].IsScalar() && parameter[1].IsScalar()) {
            key = parameter[0].Scalar();
            value = parameter[1].Scalar();
            if (parameter.size() == 3 && parameter[2].IsScalar()) {
                from = parameter[2].Scalar();
            }
        } else if (parameter.IsMap()) {
            auto p = FindKey(parameter, {"parameter"});
            auto v = FindKey(parameter, {"value"});
            if (!p || !v || !p->IsScalar() || !v->IsScalar()) {
                return arrow::Status::Invalid("parameter map needs 'parameter' and 'value'");
            }
            key = p->Scalar();
            value = v->Scalar();
            if (auto f = FindKey(parameter, {"from"}); f && f->IsScalar()) {
                from = f->Scalar();
            }
        } else {
            return arrow::Status::Invalid("malformed equal parameter (", DescribeNode(parameter), ")");
        }

        auto tmpl = Template::Parse(value);
        if (!tmpl.ok() || !tmpl->IsDirectReference()) {
            return arrow::Status::Invalid("parameter ", key, " must be a single $(reference), found '",
                                          value, "'");
        }
        std::string column = tmpl->segments()[0].value;

        if (key == "str1" || key == "grel:valueParameter") {
            result.str1 = column;
            result.str1_from = from;
        } else if (key == "str2" || key == "grel:valueParameter2") {
            result.str2 = column;
            result.str2_from = from;
        } else {
            return arrow::Status::Invalid("unknown equal parameter '", key, "'");
        }
    }

    if (!result.str1 || !result.str2) {
        return arrow::Status::Invalid("equal condition requires both str1 and str2");
    }
    return result;
}

// Splits the parameters into (this map column, other map column). Without
// "from" markers str1 belongs to the other map and str2 to this map.
std::pair<std::string, std::string> SplitBySide(const EqualParameters& params,
                                                bool str1_is_this_side_by_default) {
    bool str1_this = str1_is_this_side_by_default;
    if (params.str1_from == "s" || params.str2_from == "o") {
        str1_this = true;
    } else if (params.str1_from == "o" || params.str2_from == "s") {
        str1_this = false;
    }
    return str1_this ? std::make_pair(*params.str1, *params.str2)
                     : std::make_pair(*params.str2, *params.str1);
}

arrow::Result<SourceReference> ParseLongFormSource(const YAML::Node& node,
                                                   const std::string& section) {
    auto access = FindKey(node, {"access"});
    if (!access) {
        return MalformedSpecification(section, "source requires 'access'");
    }
    ARROW_ASSIGN_OR_RAISE(auto path, RequireScalar(*access, section, "source access"));

    SourceReference source = ParseSourceShortcut(path);
    if (auto formulation = FindKey(node, {"referenceFormulation"})) {
        ARROW_ASSIGN_OR_RAISE(auto format, RequireScalar(*formulation, section, "referenceFormulation"));
        source.format = NormalizeFormat(format);
    }
    if (auto iterator = FindKey(node, {"iterator"})) {
        ARROW_ASSIGN_OR_RAISE(source.iterator, RequireScalar(*iterator, section, "iterator"));
    }
    return source;
}

// [path~format, iterator?]
arrow::Result<SourceReference> ParseSourceList(const YAML::Node& node,
                                               const std::string& section) {
    if (node.size() == 0 || node.size() > 2) {
        return MalformedSpecification(section, "source shortcut must be [path~format, iterator?]");
    }
    ARROW_ASSIGN_OR_RAISE(auto locator, RequireScalar(node[0], section, "source locator"));
    SourceReference source = ParseSourceShortcut(locator);
    if (node.size() == 2) {
        ARROW_ASSIGN_OR_RAISE(source.iterator, RequireScalar(node[1], section, "iterator"));
    }
    return source;
}

arrow::Result<TargetSpec> ParseTarget(const std::string& name, const YAML::Node& node,
                                      const std::string& section) {
    TargetSpec target;
    target.name = name;

    auto apply_shortcut = [&target](const std::string& locator) {
        size_t tilde = locator.find('~');
        target.access = locator.substr(0, tilde);
        target.type = tilde == std::string::npos ? "localfile" : locator.substr(tilde + 1);
    };

    if (node.IsScalar()) {
        apply_shortcut(node.Scalar());
    } else if (node.IsSequence()) {
        if (node.size() == 0 || node.size() > 3) {
            return MalformedSpecification(section,
                "target shortcut must be [access~type, serialization?, compression?]");
        }
        ARROW_ASSIGN_OR_RAISE(auto locator, RequireScalar(node[0], section, "target access"));
        apply_shortcut(locator);
        if (node.size() >= 2) {
            ARROW_ASSIGN_OR_RAISE(target.serialization, RequireScalar(node[1], section, "serialization"));
        }
        if (node.size() == 3) {
            ARROW_ASSIGN_OR_RAISE(target.compression, RequireScalar(node[2], section, "compression"));
        }
    } else if (node.IsMap()) {
        auto access = FindKey(node, {"access"});
        if (!access) {
            return MalformedSpecification(section, "target '" + name + "' requires 'access'");
        }
        ARROW_ASSIGN_OR_RAISE(target.access, RequireScalar(*access, section, "target access"));
        target.type = "localfile";
        if (auto type = FindKey(node, {"type"})) {
            ARROW_ASSIGN_OR_RAISE(target.type, RequireScalar(*type, section, "target type"));
        }
        if (auto serialization = FindKey(node, {"serialization"})) {
            ARROW_ASSIGN_OR_RAISE(target.serialization,
                                  RequireScalar(*serialization, section, "serialization"));
        }
        if (auto compression = FindKey(node, {"compression"})) {
            ARROW_ASSIGN_OR_RAISE(target.compression,
                                  RequireScalar(*compression, section, "compression"));
        }
    } else {
        return MalformedSpecification(section, "target '" + name + "' has unexpected " +
                                      DescribeNode(node));
    }

    target.serialization = NormalizeFormat(target.serialization.empty() ? "nquads"
                                                                        : target.serialization);
    if (!target.compression.empty()) {
        STAR_ETL_WARN("Target '" << name << "': compression '" << target.compression
                      << "' is not supported, output is written uncompressed");
    }
    return target;
}

} // namespace

SourceReference ParseSourceShortcut(const std::string& value) {
    SourceReference source;
    std::string locator = Trim(value);
    size_t tilde = locator.find('~');
    if (tilde != std::string::npos) {
        source.path = locator.substr(0, tilde);
        source.format = NormalizeFormat(locator.substr(tilde + 1));
    } else {
        source.path = locator;
        std::string extension = ToLower(std::filesystem::path(locator).extension().string());
        source.format = extension == ".json" ? "json" : "csv";
    }
    source.name = std::filesystem::path(source.path).stem().string();
    return source;
}

Author ParseAuthorShortcut(const std::string& value) {
    Author author;
    std::string text = Trim(value);

    size_t lt = text.find('<');
    size_t paren = text.find('(');
    if (lt == std::string::npos && paren == std::string::npos &&
        (text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0)) {
        author.webid = text;
        return author;
    }

    author.name = Trim(text.substr(0, std::min(lt, paren)));
    if (lt != std::string::npos) {
        size_t gt = text.find('>', lt);
        if (gt != std::string::npos) {
            author.email = Trim(text.substr(lt + 1, gt - lt - 1));
        }
    }
    if (paren != std::string::npos) {
        size_t close = text.find(')', paren);
        if (close != std::string::npos) {
            author.website = Trim(text.substr(paren + 1, close - paren - 1));
        }
    }
    return author;
}

arrow::Result<MappingSpec> YarrrmlParser::ParseFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return arrow::Status::IOError("Mapping file not found: ", path);
    }

    STAR_ETL_LOG_PARSER("Loading mapping document " << path);
    try {
        YAML::Node root = YAML::LoadFile(path);
        return ParseDocument(root);
    } catch (const YAML::Exception& e) {
        return MalformedSpecification("document", e.what());
    }
}

arrow::Result<MappingSpec> YarrrmlParser::ParseString(const std::string& document) {
    try {
        YAML::Node root = YAML::Load(document);
        return ParseDocument(root);
    } catch (const YAML::Exception& e) {
        return MalformedSpecification("document", e.what());
    }
}

arrow::Result<MappingSpec> YarrrmlParser::ParseDocument(const YAML::Node& root) {
    if (!root.IsMap()) {
        return MalformedSpecification("document", std::string("expected a map at the top level, found ") +
                                      DescribeNode(root));
    }

    MappingSpec spec;

    if (auto base = FindKey(root, {"base"})) {
        ARROW_ASSIGN_OR_RAISE(spec.base_iri, RequireScalar(*base, "document", "base"));
    }
    if (auto prefixes = FindKey(root, {"prefixes"})) {
        ARROW_RETURN_NOT_OK(ParsePrefixes(*prefixes, &spec));
    }
    spec.prefixes.AddIfAbsent("rdf", std::string(vocab::kRdfNamespace));
    spec.prefixes.AddIfAbsent("rdfs", std::string(vocab::kRdfsNamespace));
    spec.prefixes.AddIfAbsent("xsd", std::string(vocab::kXsdNamespace));

    if (auto authors = FindKey(root, {"authors"})) {
        ARROW_RETURN_NOT_OK(ParseAuthors(*authors, &spec));
    }
    if (auto external = FindKey(root, {"external"})) {
        ARROW_RETURN_NOT_OK(ParseExternal(*external, &spec));
    }
    if (auto sources = FindKey(root, {"sources"})) {
        ARROW_RETURN_NOT_OK(ParseNamedSources(*sources, &spec));
    }
    if (auto targets = FindKey(root, {"targets"})) {
        ARROW_RETURN_NOT_OK(ParseTargets(*targets, &spec));
    }

    auto mappings = FindKey(root, {"mappings", "mapping"});
    if (!mappings) {
        return MalformedSpecification("document", "missing 'mappings' section");
    }
    ARROW_RETURN_NOT_OK(ParseMappings(*mappings, &spec));
    ARROW_RETURN_NOT_OK(Validate(spec));

    STAR_ETL_LOG_PARSER("Parsed " << spec.triples_maps.size() << " triples maps ("
                        << spec.CountQuotedMaps() << " quoted), "
                        << spec.prefixes.size() << " prefixes");
    return spec;
}

arrow::Status YarrrmlParser::ParsePrefixes(const YAML::Node& node, MappingSpec* spec) {
    if (node.IsNull()) {
        return arrow::Status::OK();
    }
    if (!node.IsMap()) {
        return MalformedSpecification("prefixes", std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    for (const auto& entry : node) {
        ARROW_ASSIGN_OR_RAISE(auto prefix, RequireScalar(entry.first, "prefixes", "prefix name"));
        ARROW_ASSIGN_OR_RAISE(auto ns, RequireScalar(entry.second, "prefixes", "namespace"));
        if (ns.empty()) {
            return MalformedSpecification("prefixes", "empty namespace for prefix '" + prefix + "'");
        }
        auto status = spec->prefixes.Add(prefix, ns);
        if (!status.ok()) {
            return MalformedSpecification("prefixes", status.message());
        }
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseAuthors(const YAML::Node& node, MappingSpec* spec) {
    auto parse_one = [spec](const YAML::Node& item) -> arrow::Status {
        if (item.IsScalar()) {
            spec->authors.push_back(ParseAuthorShortcut(item.Scalar()));
            return arrow::Status::OK();
        }
        if (!item.IsMap()) {
            return MalformedSpecification("authors", std::string("unexpected ") + DescribeNode(item));
        }
        Author author;
        if (auto name = FindKey(item, {"name"})) {
            ARROW_ASSIGN_OR_RAISE(author.name, RequireScalar(*name, "authors", "name"));
        }
        if (auto email = FindKey(item, {"email"})) {
            ARROW_ASSIGN_OR_RAISE(author.email, RequireScalar(*email, "authors", "email"));
        }
        if (auto website = FindKey(item, {"website"})) {
            ARROW_ASSIGN_OR_RAISE(author.website, RequireScalar(*website, "authors", "website"));
        }
        if (auto webid = FindKey(item, {"webid"})) {
            ARROW_ASSIGN_OR_RAISE(author.webid, RequireScalar(*webid, "authors", "webid"));
        }
        if (author.DisplayName().empty()) {
            return MalformedSpecification("authors", "author needs a name, email or webid");
        }
        spec->authors.push_back(std::move(author));
        return arrow::Status::OK();
    };

    if (node.IsSequence()) {
        for (const auto& item : node) {
            ARROW_RETURN_NOT_OK(parse_one(item));
        }
        return arrow::Status::OK();
    }
    return parse_one(node);
}

arrow::Status YarrrmlParser::ParseExternal(const YAML::Node& node, MappingSpec* spec) {
    if (!node.IsMap()) {
        return MalformedSpecification("external", std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    for (const auto& entry : node) {
        ARROW_ASSIGN_OR_RAISE(auto name, RequireScalar(entry.first, "external", "name"));
        ARROW_ASSIGN_OR_RAISE(auto value, RequireScalar(entry.second, "external", "value"));
        spec->external[name] = value;
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseNamedSources(const YAML::Node& node, MappingSpec* spec) {
    if (!node.IsMap()) {
        return MalformedSpecification("sources", std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    for (const auto& entry : node) {
        ARROW_ASSIGN_OR_RAISE(auto name, RequireScalar(entry.first, "sources", "source name"));
        if (spec->FindSource(name) != nullptr) {
            return MalformedSpecification("sources", "duplicate source '" + name + "'");
        }

        const YAML::Node& value = entry.second;
        SourceReference source;
        if (value.IsScalar()) {
            source = ParseSourceShortcut(value.Scalar());
        } else if (value.IsSequence()) {
            ARROW_ASSIGN_OR_RAISE(source, ParseSourceList(value, "sources"));
        } else if (value.IsMap()) {
            ARROW_ASSIGN_OR_RAISE(source, ParseLongFormSource(value, "sources"));
        } else {
            return MalformedSpecification("sources", "source '" + name + "' has unexpected " +
                                          DescribeNode(value));
        }
        source.name = name;
        spec->sources.push_back(std::move(source));
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseTargets(const YAML::Node& node, MappingSpec* spec) {
    if (!node.IsMap()) {
        return MalformedSpecification("targets", std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    for (const auto& entry : node) {
        ARROW_ASSIGN_OR_RAISE(auto name, RequireScalar(entry.first, "targets", "target name"));
        ARROW_ASSIGN_OR_RAISE(auto target, ParseTarget(name, entry.second, "targets"));
        spec->targets.push_back(std::move(target));
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseMappings(const YAML::Node& node, MappingSpec* spec) {
    if (!node.IsMap()) {
        return MalformedSpecification("mappings", std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    if (node.size() == 0) {
        return MalformedSpecification("mappings", "no triples maps declared");
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : node) {
        ARROW_ASSIGN_OR_RAISE(auto name, RequireScalar(entry.first, "mappings", "mapping name"));
        if (!seen.insert(name).second) {
            return MalformedSpecification("mappings", "duplicate mapping '" + name + "'");
        }
        ARROW_ASSIGN_OR_RAISE(auto map, ParseTriplesMap(name, entry.second, *spec));
        spec->triples_maps.push_back(std::move(map));
    }
    return arrow::Status::OK();
}

arrow::Result<TriplesMap> YarrrmlParser::ParseTriplesMap(const std::string& name,
                                                         const YAML::Node& node,
                                                         const MappingSpec& spec) {
    const std::string section = "mappings." + name;
    if (!node.IsMap()) {
        return MalformedSpecification(section, std::string("expected a map, found ") +
                                      DescribeNode(node));
    }
    if (FindKey(node, {"condition", "conditions"})) {
        return UnsupportedConstruct(section, "conditions on triples maps are not supported");
    }

    TriplesMap map;
    map.name = name;

    if (auto sources = FindKey(node, {"sources", "source"})) {
        ARROW_ASSIGN_OR_RAISE(map.sources, ParseMapSources(*sources, section, spec));
    }

    auto subject = FindKey(node, {"subjects", "subject", "s"});
    if (!subject) {
        return MalformedSpecification(section, "missing subjects");
    }
    ARROW_ASSIGN_OR_RAISE(map.subject, ParseSubject(*subject, section));

    if (auto graphs = FindKey(node, {"graphs", "graph", "g"})) {
        ARROW_ASSIGN_OR_RAISE(map.graphs, ParseTemplateList(*graphs, section, "graph"));
    }

    if (auto rules = FindKey(node, {"predicateobjects", "po"})) {
        ARROW_RETURN_NOT_OK(ParsePredicateObjects(*rules, section, &map));
    }

    STAR_ETL_LOG_PARSER("Triples map " << name << ": " << map.sources.size() << " sources, "
                        << map.types.size() << " types, " << map.predicate_objects.size()
                        << " rules" << (map.IsQuoted() ? " (quoted)" : ""));
    return map;
}

arrow::Result<std::vector<SourceReference>> YarrrmlParser::ParseMapSources(
    const YAML::Node& node, const std::string& section, const MappingSpec& spec) {

    std::vector<SourceReference> sources;

    if (!node.IsSequence()) {
        ARROW_ASSIGN_OR_RAISE(auto source, ParseSourceEntry(node, section, spec));
        sources.push_back(std::move(source));
        return sources;
    }
    if (node.size() == 0) {
        return MalformedSpecification(section, "empty source list");
    }

    bool all_scalars = true;
    bool all_named = true;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            all_scalars = false;
            break;
        }
        if (spec.FindSource(item.Scalar()) == nullptr) {
            all_named = false;
        }
    }

    // [path~format, iterator] is a single inline source, not a list
    if (all_scalars && !all_named) {
        ARROW_ASSIGN_OR_RAISE(auto source, ParseSourceList(node, section));
        sources.push_back(std::move(source));
        return sources;
    }

    for (const auto& item : node) {
        ARROW_ASSIGN_OR_RAISE(auto source, ParseSourceEntry(item, section, spec));
        sources.push_back(std::move(source));
    }
    return sources;
}

arrow::Result<SourceReference> YarrrmlParser::ParseSourceEntry(const YAML::Node& node,
                                                               const std::string& section,
                                                               const MappingSpec& spec) {
    if (node.IsScalar()) {
        if (const SourceReference* named = spec.FindSource(node.Scalar())) {
            return *named;
        }
        return ParseSourceShortcut(node.Scalar());
    }
    if (node.IsSequence()) {
        return ParseSourceList(node, section);
    }
    if (node.IsMap()) {
        return ParseLongFormSource(node, section);
    }
    return MalformedSpecification(section, std::string("unexpected source ") + DescribeNode(node));
}

arrow::Result<SubjectRule> YarrrmlParser::ParseSubject(const YAML::Node& node,
                                                       const std::string& section) {
    if (node.IsScalar()) {
        if (Trim(node.Scalar()).empty()) {
            return MalformedSpecification(section, "empty subject template");
        }
        ARROW_ASSIGN_OR_RAISE(auto tmpl, CompileTemplate(node.Scalar(), section));
        return SubjectRule(TemplateSubject{{std::move(tmpl)}});
    }

    if (node.IsMap()) {
        if (FindKey(node, {"quoted", "function", "fn"})) {
            ARROW_ASSIGN_OR_RAISE(auto quoted, ParseQuotedSubject(node, section));
            return SubjectRule(std::move(quoted));
        }
        if (FindKey(node, {"quotedNonAsserted"})) {
            return UnsupportedConstruct(section, "non-asserted quoted subjects are not supported");
        }
        if (auto value = FindKey(node, {"value", "v"})) {
            ARROW_ASSIGN_OR_RAISE(auto text, RequireScalar(*value, section, "subject value"));
            ARROW_ASSIGN_OR_RAISE(auto tmpl, CompileTemplate(text, section));
            return SubjectRule(TemplateSubject{{std::move(tmpl)}});
        }
        return MalformedSpecification(section, "subject map needs 'value' or 'quoted'");
    }

    if (node.IsSequence()) {
        if (node.size() == 0) {
            return MalformedSpecification(section, "empty subject list");
        }
        if (node.size() == 1 && node[0].IsMap()) {
            return ParseSubject(node[0], section);
        }

        TemplateSubject subject;
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                return MalformedSpecification(section,
                    "a quoted subject cannot be combined with other subjects");
            }
            ARROW_ASSIGN_OR_RAISE(auto tmpl, CompileTemplate(item.Scalar(), section));
            subject.templates.push_back(std::move(tmpl));
        }
        return SubjectRule(std::move(subject));
    }

    return MalformedSpecification(section, std::string("unexpected subject ") + DescribeNode(node));
}

arrow::Result<QuotedSubject> YarrrmlParser::ParseQuotedSubject(const YAML::Node& node,
                                                               const std::string& section) {
    QuotedSubject subject;

    if (auto function = FindKey(node, {"function", "fn"})) {
        ARROW_ASSIGN_OR_RAISE(auto text, RequireScalar(*function, section, "subject function"));
        auto parsed = ParseJoinFunction(text);
        if (!parsed.ok()) {
            return MalformedSpecification(section, parsed.status().message());
        }
        subject.quoted_map = parsed->quoted_map;
        subject.join = parsed->join;
        subject.join_error = parsed->join_error;
    } else {
        auto quoted = FindKey(node, {"quoted"});
        ARROW_ASSIGN_OR_RAISE(subject.quoted_map, RequireScalar(*quoted, section, "quoted"));

        if (auto condition = FindKey(node, {"condition", "conditions"})) {
            const YAML::Node* single = &*condition;
            if (condition->IsSequence()) {
                if (condition->size() != 1) {
                    subject.join_error = "only one join condition is supported";
                }
                single = nullptr;
            }

            if (subject.join_error.empty()) {
                YAML::Node first = single != nullptr ? *single : (*condition)[0];
                auto params = ReadEqualCondition(first);
                if (!params.ok()) {
                    subject.join_error = params.status().message();
                } else {
                    // "s" is this (annotation) map: the right key
                    auto sides = SplitBySide(*params, false);
                    subject.join = JoinCondition{sides.second, sides.first};
                }
            }
        }
    }

    if (auto ns = FindKey(node, {"namespace"})) {
        ARROW_ASSIGN_OR_RAISE(auto value, RequireScalar(*ns, section, "namespace"));
        subject.subject_namespace = value;
    }

    if (subject.quoted_map.empty()) {
        return MalformedSpecification(section, "quoted subject does not name a mapping");
    }
    return subject;
}

arrow::Status YarrrmlParser::ParsePredicateObjects(const YAML::Node& node,
                                                   const std::string& section,
                                                   TriplesMap* map) {
    if (!node.IsSequence()) {
        return MalformedSpecification(section, std::string("predicateobjects must be a list, found ") +
                                      DescribeNode(node));
    }
    for (const auto& rule : node) {
        if (rule.IsSequence()) {
            ARROW_RETURN_NOT_OK(ParseShorthandRule(rule, section, map));
        } else if (rule.IsMap()) {
            ARROW_RETURN_NOT_OK(ParseLongFormRule(rule, section, map));
        } else {
            return MalformedSpecification(section, std::string("unexpected predicate-object rule ") +
                                          DescribeNode(rule));
        }
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseShorthandRule(const YAML::Node& node,
                                                const std::string& section,
                                                TriplesMap* map) {
    if (node.size() < 2 || node.size() > 3) {
        return MalformedSpecification(section,
            "shorthand rule must be [predicate, object] or [predicate, object, modifier]");
    }
    ARROW_ASSIGN_OR_RAISE(auto predicates, ScalarList(node[0], section, "predicate"));
    ARROW_ASSIGN_OR_RAISE(auto objects, ScalarList(node[1], section, "object"));
    std::string modifier;
    if (node.size() == 3) {
        ARROW_ASSIGN_OR_RAISE(modifier, RequireScalar(node[2], section, "modifier"));
    }

    for (const auto& predicate : predicates) {
        if (IsTypePredicate(predicate)) {
            for (const auto& object : objects) {
                ARROW_ASSIGN_OR_RAISE(auto type, CompileTemplate(object, section));
                map->types.push_back(std::move(type));
            }
            continue;
        }

        ARROW_ASSIGN_OR_RAISE(auto predicate_template, CompileTemplate(predicate, section));
        for (const auto& object : objects) {
            ARROW_ASSIGN_OR_RAISE(auto term, MakeTermObject(object, section));
            if (!modifier.empty()) {
                ARROW_RETURN_NOT_OK(ApplyModifier(modifier, section, &term));
            }
            PredicateObjectRule rule;
            rule.predicate = predicate_template;
            rule.object = std::move(term);
            map->predicate_objects.push_back(std::move(rule));
        }
    }
    return arrow::Status::OK();
}

arrow::Status YarrrmlParser::ParseLongFormRule(const YAML::Node& node,
                                               const std::string& section,
                                               TriplesMap* map) {
    if (FindKey(node, {"condition", "conditions"})) {
        return UnsupportedConstruct(section, "conditions on predicate-object rules are not supported");
    }

    auto predicates_node = FindKey(node, {"predicates", "predicate", "p"});
    auto objects_node = FindKey(node, {"objects", "object", "o"});
    if (!predicates_node || !objects_node) {
        return MalformedSpecification(section, "long-form rule needs predicates and objects");
    }

    ARROW_ASSIGN_OR_RAISE(auto predicates, ScalarList(*predicates_node, section, "predicate"));
    ARROW_ASSIGN_OR_RAISE(auto objects, ParseObjects(*objects_node, section));

    std::vector<Template> graphs;
    if (auto graphs_node = FindKey(node, {"graphs", "graph", "g"})) {
        ARROW_ASSIGN_OR_RAISE(graphs, ParseTemplateList(*graphs_node, section, "graph"));
    }
    std::vector<Template> inverse;
    if (auto inverse_node = FindKey(node, {"inversepredicates", "inversepredicate", "i"})) {
        ARROW_ASSIGN_OR_RAISE(inverse, ParseTemplateList(*inverse_node, section, "inverse predicate"));
    }

    for (const auto& predicate : predicates) {
        if (IsTypePredicate(predicate)) {
            for (const auto& object : objects) {
                const TermObject* term = std::get_if<TermObject>(&object);
                if (term == nullptr) {
                    return MalformedSpecification(section, "type objects cannot reference another mapping");
                }
                map->types.push_back(term->value);
            }
            continue;
        }

        ARROW_ASSIGN_OR_RAISE(auto predicate_template, CompileTemplate(predicate, section));
        for (const auto& object : objects) {
            PredicateObjectRule rule;
            rule.predicate = predicate_template;
            rule.object = object;
            rule.graphs = graphs;
            rule.inverse_predicates = inverse;

            if (!rule.inverse_predicates.empty()) {
                const TermObject* term = std::get_if<TermObject>(&rule.object);
                if (term != nullptr && term->kind == ObjectKind::Literal) {
                    return MalformedSpecification(section,
                        "inverse predicates require IRI objects (predicate " + predicate + ")");
                }
            }
            map->predicate_objects.push_back(std::move(rule));
        }
    }
    return arrow::Status::OK();
}

arrow::Result<std::vector<ObjectRule>> YarrrmlParser::ParseObjects(const YAML::Node& node,
                                                                   const std::string& section) {
    std::vector<ObjectRule> objects;

    if (node.IsScalar()) {
        ARROW_ASSIGN_OR_RAISE(auto term, MakeTermObject(node.Scalar(), section));
        objects.emplace_back(std::move(term));
        return objects;
    }
    if (node.IsMap()) {
        ARROW_ASSIGN_OR_RAISE(auto object, ParseObjectMap(node, section));
        objects.push_back(std::move(object));
        return objects;
    }
    if (!node.IsSequence()) {
        return MalformedSpecification(section, std::string("unexpected objects ") + DescribeNode(node));
    }

    for (const auto& item : node) {
        if (item.IsScalar()) {
            ARROW_ASSIGN_OR_RAISE(auto term, MakeTermObject(item.Scalar(), section));
            objects.emplace_back(std::move(term));
        } else if (item.IsSequence()) {
            // [value, modifier]
            if (item.size() < 1 || item.size() > 2) {
                return MalformedSpecification(section, "object shortcut must be [value, modifier?]");
            }
            ARROW_ASSIGN_OR_RAISE(auto value, RequireScalar(item[0], section, "object value"));
            ARROW_ASSIGN_OR_RAISE(auto term, MakeTermObject(value, section));
            if (item.size() == 2) {
                ARROW_ASSIGN_OR_RAISE(auto modifier, RequireScalar(item[1], section, "modifier"));
                ARROW_RETURN_NOT_OK(ApplyModifier(modifier, section, &term));
            }
            objects.emplace_back(std::move(term));
        } else if (item.IsMap()) {
            ARROW_ASSIGN_OR_RAISE(auto object, ParseObjectMap(item, section));
            objects.push_back(std::move(object));
        } else {
            return MalformedSpecification(section, std::string("unexpected object ") + DescribeNode(item));
        }
    }
    return objects;
}

arrow::Result<ObjectRule> YarrrmlParser::ParseObjectMap(const YAML::Node& node,
                                                        const std::string& section) {
    if (FindKey(node, {"function", "fn"})) {
        return UnsupportedConstruct(section, "function objects are not supported");
    }
    if (FindKey(node, {"quoted", "quotedNonAsserted"})) {
        return UnsupportedConstruct(section, "quoted triple objects are not supported");
    }

    if (auto parent = FindKey(node, {"mapping"})) {
        ReferenceObject reference;
        ARROW_ASSIGN_OR_RAISE(reference.parent_map, RequireScalar(*parent, section, "mapping"));

        if (auto conditions = FindKey(node, {"condition", "conditions"})) {
            std::vector<YAML::Node> list;
            if (conditions->IsSequence()) {
                for (const auto& item : *conditions) {
                    list.push_back(item);
                }
            } else {
                list.push_back(*conditions);
            }
            for (const auto& condition : list) {
                auto params = ReadEqualCondition(condition);
                if (!params.ok()) {
                    return MalformedSpecification(section, "join with '" + reference.parent_map +
                                                  "': " + params.status().message());
                }
                auto sides = SplitBySide(*params, true);
                reference.joins.push_back(ReferenceJoin{sides.first, sides.second});
            }
        }
        return ObjectRule(std::move(reference));
    }

    auto value = FindKey(node, {"value", "v"});
    if (!value) {
        return MalformedSpecification(section, "object map needs 'value' or 'mapping'");
    }
    if (FindKey(node, {"condition", "conditions"})) {
        return UnsupportedConstruct(section, "conditions on object maps are not supported");
    }

    ARROW_ASSIGN_OR_RAISE(auto text, RequireScalar(*value, section, "object value"));
    ARROW_ASSIGN_OR_RAISE(auto term, MakeTermObject(text, section));

    if (auto type = FindKey(node, {"type"})) {
        ARROW_ASSIGN_OR_RAISE(auto kind, RequireScalar(*type, section, "object type"));
        if (kind == "iri") {
            term.kind = ObjectKind::Iri;
        } else if (kind == "literal") {
            term.kind = ObjectKind::Literal;
        } else if (kind == "blank") {
            return UnsupportedConstruct(section, "blank node objects are not supported");
        } else {
            return MalformedSpecification(section, "unknown object type '" + kind + "'");
        }
    }
    if (auto datatype = FindKey(node, {"datatype"})) {
        ARROW_ASSIGN_OR_RAISE(auto text_dt, RequireScalar(*datatype, section, "datatype"));
        ARROW_ASSIGN_OR_RAISE(auto dt, CompileTemplate(text_dt, section));
        term.datatype = std::move(dt);
    }
    if (auto language = FindKey(node, {"language"})) {
        ARROW_ASSIGN_OR_RAISE(auto text_lang, RequireScalar(*language, section, "language"));
        ARROW_ASSIGN_OR_RAISE(auto lang, CompileLanguage(text_lang, section));
        term.language = std::move(lang);
    }
    if (term.kind == ObjectKind::Iri && (term.datatype || term.language)) {
        return MalformedSpecification(section, "IRI objects cannot carry a datatype or language");
    }
    return ObjectRule(std::move(term));
}

arrow::Result<std::vector<Template>> YarrrmlParser::ParseTemplateList(const YAML::Node& node,
                                                                      const std::string& section,
                                                                      const std::string& what) {
    ARROW_ASSIGN_OR_RAISE(auto values, ScalarList(node, section, what));
    std::vector<Template> templates;
    templates.reserve(values.size());
    for (const auto& value : values) {
        ARROW_ASSIGN_OR_RAISE(auto tmpl, CompileTemplate(value, section));
        templates.push_back(std::move(tmpl));
    }
    return templates;
}

arrow::Status YarrrmlParser::Validate(const MappingSpec& spec) {
    for (const auto& map : spec.triples_maps) {
        const std::string section = "mappings." + map.name;

        if (const QuotedSubject* quoted = map.quoted_subject()) {
            const TriplesMap* target = spec.FindMap(quoted->quoted_map);
            if (target == nullptr) {
                return MalformedSpecification(section, "quoted mapping '" + quoted->quoted_map +
                                              "' is not defined");
            }
            if (target->IsQuoted()) {
                return UnsupportedConstruct(section, "nested quoted mapping '" + quoted->quoted_map + "'");
            }
        }

        for (const auto& rule : map.predicate_objects) {
            const ReferenceObject* reference = std::get_if<ReferenceObject>(&rule.object);
            if (reference == nullptr) {
                continue;
            }
            const TriplesMap* parent = spec.FindMap(reference->parent_map);
            if (parent == nullptr) {
                return MalformedSpecification(section, "referenced mapping '" +
                                              reference->parent_map + "' is not defined");
            }
            if (parent->IsQuoted()) {
                return UnsupportedConstruct(section, "reference to quoted mapping '" +
                                            reference->parent_map + "'");
            }
            if (map.IsQuoted()) {
                return UnsupportedConstruct(section, "referencing objects in quoted mappings");
            }
        }
    }
    return arrow::Status::OK();
}

} // namespace star_etl
