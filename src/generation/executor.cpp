#include <star_etl/generation/executor.h>

#include <algorithm>
#include <star_etl/util/errors.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace {

Statement MakeStatement(const Term& subject, const Term& predicate, const Term& object,
                        const std::optional<Term>& graph, StatementRole role) {
    Statement statement;
    statement.subject = subject;
    statement.predicate = predicate;
    statement.object = object;
    statement.graph = graph;
    statement.role = role;
    return statement;
}

// Evaluated predicate-object pair of one row, shared by every subject
struct EvaluatedRule {
    Term predicate;
    std::vector<Term> objects;
    std::vector<std::optional<Term>> graphs;
    std::vector<Term> inverse_predicates;
};

} // namespace

GenerationExecutor::GenerationExecutor(const MappingSpec& spec, ExecutorOptions options)
    : spec_(spec), options_(std::move(options)) {}

void GenerationExecutor::RegisterSource(const std::string& name,
                                        std::shared_ptr<SourceTable> table) {
    registered_[name] = std::move(table);
}

arrow::Result<GenerationResult> GenerationExecutor::Run() {
    if (options_.template_options.cache_capacity == 0) {
        return arrow::Status::Invalid("Template cache capacity must be greater than 0");
    }
    ARROW_ASSIGN_OR_RAISE(auto maps, OrderedMaps());

    cache_.Clear();
    RunState state;
    state.sources = std::make_unique<SourceCache>(options_.base_directory,
                                                  options_.search_directories);
    for (const auto& entry : registered_) {
        state.sources->Register(entry.first, entry.second);
    }
    state.engine = std::make_unique<TemplateEngine>(spec_.prefixes, spec_.base_iri,
                                                    spec_.external, options_.template_options);

    STAR_ETL_LOG_EXECUTOR("Pass 1: " << maps.size() - spec_.CountQuotedMaps()
                          << " template-subject maps");
    for (const TriplesMap* map : maps) {
        if (!map->IsQuoted()) {
            ARROW_RETURN_NOT_OK(RunTemplateMap(*map, &state));
        }
    }
    cache_.Seal();

    STAR_ETL_LOG_EXECUTOR("Pass 2: " << spec_.CountQuotedMaps() << " quoted maps over "
                          << cache_.size() << " cached triples");
    for (const TriplesMap* map : maps) {
        if (map->IsQuoted()) {
            ARROW_RETURN_NOT_OK(RunQuotedMap(*map, &state));
        }
    }

    RunReport& report = state.result.report;
    report.sources_loaded = state.loaded_sources.size();
    STAR_ETL_LOG_EXECUTOR("Generated " << state.result.statements.size() << " statements ("
                          << report.base_triples << " base, " << report.reifiers << " reifiers), "
                          << "template cache " << state.engine->cache_hits() << " hits / "
                          << state.engine->cache_misses() << " misses");
    return std::move(state.result);
}

arrow::Result<std::vector<const TriplesMap*>> GenerationExecutor::OrderedMaps() const {
    std::vector<const TriplesMap*> ordered;
    for (const auto& name : options_.map_order) {
        const TriplesMap* map = spec_.FindMap(name);
        if (map == nullptr) {
            return arrow::Status::Invalid("Unknown triples map '", name, "' in map order");
        }
        if (std::find(ordered.begin(), ordered.end(), map) != ordered.end()) {
            return arrow::Status::Invalid("Triples map '", name, "' listed twice in map order");
        }
        ordered.push_back(map);
    }
    for (const auto& map : spec_.triples_maps) {
        if (std::find(ordered.begin(), ordered.end(), &map) == ordered.end()) {
            ordered.push_back(&map);
        }
    }
    return ordered;
}

arrow::Result<std::shared_ptr<const SourceTable>> GenerationExecutor::LoadSource(
    const SourceReference& source, RunState* state) {

    ARROW_ASSIGN_OR_RAISE(auto table, state->sources->Get(source));
    if (state->loaded_sources.insert(table.get()).second) {
        state->result.report.rows_processed += static_cast<size_t>(table->num_rows());
    }
    return table;
}

arrow::Result<std::vector<std::optional<Term>>> GenerationExecutor::InstantiateGraphs(
    const TriplesMap& map, const std::vector<Template>& rule_graphs, const Row& row,
    RunState* state) {

    const std::vector<Template>& templates = rule_graphs.empty() ? map.graphs : rule_graphs;
    std::vector<std::optional<Term>> graphs;
    for (const auto& tmpl : templates) {
        if (!state->engine->ShouldEvaluate(tmpl, row)) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto graph, state->engine->Instantiate(tmpl, row, ObjectKind::Iri));
        graphs.emplace_back(std::move(graph));
    }
    if (graphs.empty()) {
        graphs.emplace_back(std::nullopt);
    }
    return graphs;
}

arrow::Result<std::vector<Term>> GenerationExecutor::InstantiateSubjects(const TriplesMap& map,
                                                                         const Row& row,
                                                                         RunState* state) {
    std::vector<Term> subjects;
    const TemplateSubject* subject = map.template_subject();
    if (subject == nullptr) {
        return arrow::Status::Invalid("Triples map '", map.name, "' has no template subject");
    }
    for (const auto& tmpl : subject->templates) {
        if (!state->engine->ShouldEvaluate(tmpl, row)) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto term, state->engine->Instantiate(tmpl, row, ObjectKind::Iri));
        subjects.push_back(std::move(term));
    }
    return subjects;
}

// ---------------------------------------------------------------------------
// Pass 1
// ---------------------------------------------------------------------------

arrow::Status GenerationExecutor::RunTemplateMap(const TriplesMap& map, RunState* state) {
    RunReport& report = state->result.report;

    if (map.sources.empty()) {
        STAR_ETL_WARN("Triples map '" << map.name << "' has no source; skipping");
        ++report.maps_skipped;
        return arrow::Status::OK();
    }

    const TemplateSubject* subject = map.template_subject();
    size_t skipped_before = report.rows_skipped;

    for (const auto& source : map.sources) {
        auto table = LoadSource(source, state);
        if (!table.ok()) {
            STAR_ETL_WARN(table.status().message() << "; skipping map '" << map.name << "'");
            report.AddIssue(table.status(), map.name);
            continue;
        }
        const std::shared_ptr<const SourceTable>& rows = *table;

        std::vector<std::vector<std::string>> column_subjects;
        if (options_.vectorized_subjects) {
            for (const auto& tmpl : subject->templates) {
                column_subjects.push_back(state->engine->InstantiateColumn(tmpl, *rows));
            }
        }

        std::vector<std::string> row_subjects(column_subjects.size());
        for (int64_t r = 0; r < rows->num_rows(); ++r) {
            Row row{rows, r};
            for (size_t i = 0; i < column_subjects.size(); ++i) {
                row_subjects[i] = column_subjects[i][r];
            }

            auto statements = EvaluateRow(map, row,
                                          options_.vectorized_subjects ? &row_subjects : nullptr,
                                          state);
            if (!statements.ok()) {
                auto error = RowEvaluationError(map.name, statements.status().message());
                STAR_ETL_LOG_EXECUTOR("Skipping row " << r << " of " << map.name << ": "
                                      << error.message());
                report.AddIssue(error, map.name, r);
                ++report.rows_skipped;
                continue;
            }

            for (auto& statement : *statements) {
                ARROW_RETURN_NOT_OK(cache_.Insert(map.name, row, statement.AsTriple()));
                ++report.base_triples;
                state->result.statements.push_back(std::move(statement));
            }
        }
    }

    if (report.rows_skipped > skipped_before) {
        STAR_ETL_WARN("Triples map '" << map.name << "': skipped "
                      << report.rows_skipped - skipped_before << " rows that could not be evaluated");
    }
    return arrow::Status::OK();
}

arrow::Result<std::vector<Statement>> GenerationExecutor::EvaluateRow(
    const TriplesMap& map, const Row& row, const std::vector<std::string>* subjects,
    RunState* state) {

    TemplateEngine& engine = *state->engine;

    std::vector<Term> subject_terms;
    if (subjects != nullptr) {
        const auto& templates = map.template_subject()->templates;
        for (size_t i = 0; i < templates.size(); ++i) {
            if (!engine.ShouldEvaluate(templates[i], row)) {
                continue;
            }
            ARROW_RETURN_NOT_OK(ValidateIri((*subjects)[i]));
            subject_terms.push_back(Term::IRI((*subjects)[i]));
        }
    } else {
        ARROW_ASSIGN_OR_RAISE(subject_terms, InstantiateSubjects(map, row, state));
    }

    std::vector<Statement> statements;
    if (subject_terms.empty()) {
        return statements;
    }

    ARROW_ASSIGN_OR_RAISE(auto map_graphs, InstantiateGraphs(map, {}, row, state));

    // Rules do not depend on the subject: evaluate once per row
    std::vector<EvaluatedRule> rules;
    const Term rdf_type = Term::IRI(std::string(vocab::kRdfType));
    for (const auto& type : map.types) {
        if (!engine.ShouldEvaluate(type, row)) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto type_term, engine.Instantiate(type, row, ObjectKind::Iri));
        rules.push_back(EvaluatedRule{rdf_type, {std::move(type_term)}, map_graphs, {}});
    }

    for (const auto& rule : map.predicate_objects) {
        if (!engine.ShouldEvaluate(rule.predicate, row)) {
            continue;
        }
        EvaluatedRule evaluated;
        ARROW_ASSIGN_OR_RAISE(evaluated.predicate,
                              engine.Instantiate(rule.predicate, row, ObjectKind::Iri));

        if (const TermObject* object = std::get_if<TermObject>(&rule.object)) {
            if (!engine.ShouldEvaluate(object->value, row)) {
                continue;
            }
            ARROW_ASSIGN_OR_RAISE(auto term, engine.InstantiateObject(*object, row));
            evaluated.objects.push_back(std::move(term));
        } else {
            ARROW_ASSIGN_OR_RAISE(evaluated.objects,
                                  ResolveReference(std::get<ReferenceObject>(rule.object), row, state));
        }

        if (rule.graphs.empty()) {
            evaluated.graphs = map_graphs;
        } else {
            ARROW_ASSIGN_OR_RAISE(evaluated.graphs, InstantiateGraphs(map, rule.graphs, row, state));
        }
        for (const auto& inverse : rule.inverse_predicates) {
            ARROW_ASSIGN_OR_RAISE(auto term, engine.Instantiate(inverse, row, ObjectKind::Iri));
            evaluated.inverse_predicates.push_back(std::move(term));
        }
        rules.push_back(std::move(evaluated));
    }

    for (const auto& subject : subject_terms) {
        for (const auto& rule : rules) {
            for (const auto& object : rule.objects) {
                for (const auto& graph : rule.graphs) {
                    statements.push_back(MakeStatement(subject, rule.predicate, object, graph,
                                                       StatementRole::Base));
                    if (!object.IsIRI()) {
                        continue;
                    }
                    for (const auto& inverse : rule.inverse_predicates) {
                        statements.push_back(MakeStatement(object, inverse, subject, graph,
                                                           StatementRole::Base));
                    }
                }
            }
        }
    }
    return statements;
}

arrow::Result<std::vector<Term>> GenerationExecutor::ResolveReference(
    const ReferenceObject& reference, const Row& row, RunState* state) {

    const TriplesMap* parent = spec_.FindMap(reference.parent_map);
    if (parent == nullptr) {
        return arrow::Status::Invalid("Unknown parent map '", reference.parent_map, "'");
    }

    // Without a join the parent subject is evaluated over the same row
    if (reference.joins.empty()) {
        return InstantiateSubjects(*parent, row, state);
    }
    if (parent->sources.empty()) {
        return arrow::Status::Invalid("Parent map '", parent->name, "' has no source");
    }

    std::vector<std::string_view> values;
    std::vector<std::string> parent_keys;
    for (const auto& join : reference.joins) {
        auto value = row.Get(join.child_key);
        if (!value.has_value() || value->empty()) {
            return std::vector<Term>{};
        }
        values.push_back(*value);
        parent_keys.push_back(join.parent_key);
    }

    ARROW_ASSIGN_OR_RAISE(auto parent_table, LoadSource(parent->sources.front(), state));

    std::string index_key = parent->name;
    for (const auto& key : parent_keys) {
        index_key += "|" + key;
    }
    auto it = state->parent_indexes.find(index_key);
    if (it == state->parent_indexes.end()) {
        it = state->parent_indexes.emplace(index_key,
                                           ParentRowIndex::Build(*parent_table, parent_keys)).first;
        STAR_ETL_LOG_JOIN("Parent index " << index_key << ": " << it->second.key_count() << " keys");
    }

    std::vector<Term> objects;
    for (int64_t parent_row : it->second.Lookup(values)) {
        ARROW_ASSIGN_OR_RAISE(auto subjects,
                              InstantiateSubjects(*parent, Row{parent_table, parent_row}, state));
        for (auto& subject : subjects) {
            objects.push_back(std::move(subject));
        }
    }
    return objects;
}

// ---------------------------------------------------------------------------
// Pass 2
// ---------------------------------------------------------------------------

arrow::Status GenerationExecutor::RunQuotedMap(const TriplesMap& map, RunState* state) {
    RunReport& report = state->result.report;
    const QuotedSubject* quoted = map.quoted_subject();

    if (quoted->HasInvalidJoin()) {
        auto status = JoinConditionInvalid(map.name, quoted->join_error);
        STAR_ETL_WARN(status.message() << "; skipping map");
        report.AddIssue(status, map.name);
        ++report.maps_skipped;
        return arrow::Status::OK();
    }
    if (map.sources.empty()) {
        STAR_ETL_WARN("Triples map '" << map.name << "' has no source; skipping");
        ++report.maps_skipped;
        return arrow::Status::OK();
    }

    const TriplesMap* target = spec_.FindMap(quoted->quoted_map);
    if (target == nullptr) {
        return MalformedSpecification("mappings." + map.name,
                                      "quoted mapping '" + quoted->quoted_map + "' is not defined");
    }

    // Without a condition annotation rows pair with the quoted map's triples
    // from the same source row, so both maps must read the same source
    if (!quoted->join.has_value()) {
        for (const auto& source : map.sources) {
            if (std::find(target->sources.begin(), target->sources.end(), source) ==
                target->sources.end()) {
                auto status = JoinConditionInvalid(map.name,
                    "no join condition and '" + target->name + "' reads a different source than '" +
                    source.path + "'");
                STAR_ETL_WARN(status.message() << "; skipping map");
                report.AddIssue(status, map.name);
                ++report.maps_skipped;
                return arrow::Status::OK();
            }
        }
    }

    std::optional<std::string> subject_namespace;
    if (quoted->subject_namespace.has_value()) {
        subject_namespace = state->engine->ExpandIri(*quoted->subject_namespace);
    }

    std::optional<JoinIndex> key_index;
    if (quoted->join.has_value()) {
        key_index = JoinIndex::BuildByKey(cache_, quoted->join->left_key, subject_namespace);
    }

    size_t skipped_before = report.rows_skipped;
    for (const auto& source : map.sources) {
        auto table = LoadSource(source, state);
        if (!table.ok()) {
            STAR_ETL_WARN(table.status().message() << "; skipping map '" << map.name << "'");
            report.AddIssue(table.status(), map.name);
            continue;
        }
        const std::shared_ptr<const SourceTable>& rows = *table;

        std::optional<JoinIndex> row_index;
        if (!quoted->join.has_value()) {
            row_index = JoinIndex::BuildByRow(cache_, target->name, rows.get(), subject_namespace);
        }
        const JoinIndex& index = key_index.has_value() ? *key_index : *row_index;

        for (int64_t r = 0; r < rows->num_rows(); ++r) {
            Row row{rows, r};
            std::string key;
            if (quoted->join.has_value()) {
                auto value = row.Get(quoted->join->right_key);
                if (!value.has_value() || value->empty()) {
                    continue;
                }
                key = std::string(*value);
            } else {
                key = std::to_string(r);
            }

            const auto& matches = index.Lookup(key);
            if (matches.empty()) {
                continue;
            }

            auto statements = AnnotateRow(map, row, matches, state);
            if (!statements.ok()) {
                auto error = RowEvaluationError(map.name, statements.status().message());
                STAR_ETL_LOG_EXECUTOR("Skipping annotation row " << r << " of " << map.name
                                      << ": " << error.message());
                report.AddIssue(error, map.name, r);
                ++report.rows_skipped;
                continue;
            }

            report.reifiers += matches.size();
            for (auto& statement : *statements) {
                if (statement.role == StatementRole::Annotation) {
                    ++report.annotation_statements;
                }
                state->result.statements.push_back(std::move(statement));
            }
        }
    }

    if (report.rows_skipped > skipped_before) {
        STAR_ETL_WARN("Triples map '" << map.name << "': skipped "
                      << report.rows_skipped - skipped_before << " annotation rows");
    }
    return arrow::Status::OK();
}

arrow::Result<std::vector<Statement>> GenerationExecutor::AnnotateRow(
    const TriplesMap& map, const Row& row, const std::vector<const CacheEntry*>& matches,
    RunState* state) {

    TemplateEngine& engine = *state->engine;
    ARROW_ASSIGN_OR_RAISE(auto map_graphs, InstantiateGraphs(map, {}, row, state));

    // Annotation values depend only on the row
    std::vector<EvaluatedRule> rules;
    const Term rdf_type = Term::IRI(std::string(vocab::kRdfType));
    for (const auto& type : map.types) {
        if (!engine.ShouldEvaluate(type, row)) {
            continue;
        }
        ARROW_ASSIGN_OR_RAISE(auto type_term, engine.Instantiate(type, row, ObjectKind::Iri));
        rules.push_back(EvaluatedRule{rdf_type, {std::move(type_term)}, map_graphs, {}});
    }
    for (const auto& rule : map.predicate_objects) {
        const TermObject* object = std::get_if<TermObject>(&rule.object);
        if (object == nullptr) {
            return UnsupportedConstruct("mappings." + map.name,
                                        "referencing objects in quoted mappings");
        }
        if (!engine.ShouldEvaluate(rule.predicate, row) ||
            !engine.ShouldEvaluate(object->value, row)) {
            continue;
        }
        EvaluatedRule evaluated;
        ARROW_ASSIGN_OR_RAISE(evaluated.predicate,
                              engine.Instantiate(rule.predicate, row, ObjectKind::Iri));
        ARROW_ASSIGN_OR_RAISE(auto term, engine.InstantiateObject(*object, row));
        evaluated.objects.push_back(std::move(term));
        if (rule.graphs.empty()) {
            evaluated.graphs = map_graphs;
        } else {
            ARROW_ASSIGN_OR_RAISE(evaluated.graphs, InstantiateGraphs(map, rule.graphs, row, state));
        }
        for (const auto& inverse : rule.inverse_predicates) {
            ARROW_ASSIGN_OR_RAISE(auto inverse_term, engine.Instantiate(inverse, row, ObjectKind::Iri));
            evaluated.inverse_predicates.push_back(std::move(inverse_term));
        }
        rules.push_back(std::move(evaluated));
    }

    const Term rdf_reifies = Term::IRI(std::string(vocab::kRdfReifies));
    uint64_t next_reifier = state->next_reifier;

    std::vector<Statement> statements;
    for (const CacheEntry* match : matches) {
        Term reifier = Term::BlankNode(options_.blank_node_prefix + std::to_string(next_reifier++));
        Term quoted_triple = Term::Quoted(match->triple);

        for (const auto& graph : map_graphs) {
            statements.push_back(MakeStatement(reifier, rdf_reifies, quoted_triple, graph,
                                               StatementRole::Reifies));
        }
        for (const auto& rule : rules) {
            for (const auto& object : rule.objects) {
                for (const auto& graph : rule.graphs) {
                    statements.push_back(MakeStatement(reifier, rule.predicate, object, graph,
                                                       StatementRole::Annotation));
                    if (!object.IsIRI()) {
                        continue;
                    }
                    for (const auto& inverse : rule.inverse_predicates) {
                        statements.push_back(MakeStatement(object, inverse, reifier, graph,
                                                           StatementRole::Annotation));
                    }
                }
            }
        }
    }

    state->next_reifier = next_reifier;
    STAR_ETL_LOG_JOIN("Row " << row.index << " of " << map.name << ": "
                      << matches.size() << " reifiers");
    return statements;
}

} // namespace star_etl
