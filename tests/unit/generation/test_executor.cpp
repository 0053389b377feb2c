#include <gtest/gtest.h>
#include <star_etl/generation/executor.h>
#include <star_etl/mapping/yarrrml_parser.h>
#include <star_etl/util/errors.h>

namespace star_etl {

namespace {

using Cells = std::vector<std::vector<std::optional<std::string>>>;

std::shared_ptr<SourceTable> MakeTable(const std::vector<std::string>& columns, const Cells& rows) {
    auto table = SourceTable::FromRows(columns, rows);
    EXPECT_TRUE(table.ok()) << table.status().ToString();
    return *table;
}

const char* kDatasetMappings = R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  metaTM:
    sources: [meta.csv~csv]
    s:
      quoted: datasetTM
      condition:
        function: equal
        parameters:
          - [str1, $(id)]
          - [str2, $(dataset_id)]
    po:
      - [ex:confidence, $(confidence)]
)";

} // namespace

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        datasets_ = MakeTable({"id", "title"},
                              {{std::string("1"), std::string("Alpha")},
                               {std::string("2"), std::string("Beta")}});
        meta_ = MakeTable({"dataset_id", "confidence"},
                          {{std::string("1"), std::string("0.9")},
                           {std::string("2"), std::string("0.9")}});
    }
    void TearDown() override {}

    MappingSpec Parse(const std::string& document) {
        auto spec = YarrrmlParser().ParseString(document);
        EXPECT_TRUE(spec.ok()) << spec.status().ToString();
        return spec.ok() ? *spec : MappingSpec();
    }

    arrow::Result<GenerationResult> Run(const MappingSpec& spec,
                                        ExecutorOptions options = ExecutorOptions()) {
        GenerationExecutor executor(spec, std::move(options));
        executor.RegisterSource("datasets", datasets_);
        executor.RegisterSource("meta", meta_);
        return executor.Run();
    }

    static std::vector<Statement> WithRole(const GenerationResult& result, StatementRole role) {
        std::vector<Statement> out;
        for (const auto& statement : result.statements) {
            if (statement.role == role) {
                out.push_back(statement);
            }
        }
        return out;
    }

    std::shared_ptr<SourceTable> datasets_;
    std::shared_ptr<SourceTable> meta_;
};

TEST_F(ExecutorTest, BaseTriplesOnePerRow) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    ASSERT_EQ(result->statements.size(), 2u);
    const Statement& first = result->statements[0];
    EXPECT_EQ(first.subject, Term::IRI("http://example.org/dataset/1"));
    EXPECT_EQ(first.predicate, Term::IRI("http://example.org/title"));
    EXPECT_EQ(first.object, Term::Literal("Alpha"));
    EXPECT_FALSE(first.graph.has_value());
    EXPECT_EQ(first.role, StatementRole::Base);

    EXPECT_EQ(result->report.base_triples, 2u);
    EXPECT_EQ(result->report.rows_processed, 2u);
    EXPECT_EQ(result->report.sources_loaded, 1u);
    EXPECT_TRUE(result->report.issues.empty());
}

TEST_F(ExecutorTest, SharedSourceRowsCountedOnce) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  labelTM:
    sources: [datasets.csv~csv]
    s: ex:label/$(id)
    po:
      - [ex:text, $(title)]
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    EXPECT_EQ(result->report.base_triples, 4u);
    EXPECT_EQ(result->report.sources_loaded, 1u);
    EXPECT_EQ(result->report.rows_processed, 2u);
}

TEST_F(ExecutorTest, AnnotationsReifyJoinedTriples) {
    MappingSpec spec = Parse(kDatasetMappings);
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    EXPECT_EQ(result->report.base_triples, 2u);
    EXPECT_EQ(result->report.reifiers, 2u);
    EXPECT_EQ(result->report.annotation_statements, 2u);

    auto reifies = WithRole(*result, StatementRole::Reifies);
    auto annotations = WithRole(*result, StatementRole::Annotation);
    ASSERT_EQ(reifies.size(), 2u);
    ASSERT_EQ(annotations.size(), 2u);

    EXPECT_EQ(reifies[0].subject, Term::BlankNode("r1"));
    EXPECT_EQ(reifies[0].predicate.lexical, std::string(vocab::kRdfReifies));
    ASSERT_TRUE(reifies[0].object.IsQuoted());
    EXPECT_EQ(reifies[0].object.quoted->subject, Term::IRI("http://example.org/dataset/1"));
    EXPECT_EQ(reifies[1].subject, Term::BlankNode("r2"));
    EXPECT_EQ(reifies[1].object.quoted->subject, Term::IRI("http://example.org/dataset/2"));

    for (const auto& annotation : annotations) {
        EXPECT_EQ(annotation.predicate, Term::IRI("http://example.org/confidence"));
        EXPECT_EQ(annotation.object, Term::Literal("0.9"));
    }
    EXPECT_EQ(annotations[0].subject, reifies[0].subject);
    EXPECT_EQ(annotations[1].subject, reifies[1].subject);
}

TEST_F(ExecutorTest, ReifiedTriplesComeFromTheCache) {
    MappingSpec spec = Parse(kDatasetMappings);
    GenerationExecutor executor(spec);
    executor.RegisterSource("datasets", datasets_);
    executor.RegisterSource("meta", meta_);
    auto result = executor.Run();
    ASSERT_TRUE(result.ok());

    EXPECT_TRUE(executor.cache().sealed());
    for (const auto& statement : WithRole(*result, StatementRole::Reifies)) {
        bool cached = false;
        for (const auto& entry : executor.cache().entries()) {
            cached = cached || entry.triple == *statement.object.quoted;
        }
        EXPECT_TRUE(cached);
    }
}

TEST_F(ExecutorTest, RunsAreDeterministic) {
    MappingSpec spec = Parse(kDatasetMappings);
    GenerationExecutor executor(spec);
    executor.RegisterSource("datasets", datasets_);
    executor.RegisterSource("meta", meta_);

    auto first = executor.Run();
    auto second = executor.Run();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first->statements, second->statements);
}

TEST_F(ExecutorTest, AnnotationWithoutMatchEmitsNothing) {
    meta_ = MakeTable({"dataset_id", "confidence"},
                      {{std::string("99"), std::string("0.1")},
                       {std::string(""), std::string("0.2")}});
    auto result = Run(Parse(kDatasetMappings));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->report.reifiers, 0u);
    EXPECT_EQ(result->statements.size(), 2u);
    EXPECT_TRUE(result->report.issues.empty());
}

TEST_F(ExecutorTest, InvalidJoinSkipsQuotedMap) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  metaTM:
    sources: [meta.csv~csv]
    s:
      function: join(quoted=datasetTM, equal(str1=$(id)))
    po:
      - [ex:confidence, $(confidence)]
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    EXPECT_EQ(result->report.base_triples, 2u);
    EXPECT_EQ(result->report.reifiers, 0u);
    EXPECT_EQ(result->report.maps_skipped, 1u);
    EXPECT_EQ(result->report.CountIssues(ErrorKind::JoinConditionInvalid), 1u);
    EXPECT_TRUE(WithRole(*result, StatementRole::Annotation).empty());
}

TEST_F(ExecutorTest, NoConditionPairsSameRow) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  provTM:
    sources: [datasets.csv~csv]
    s:
      quoted: datasetTM
    po:
      - [ex:source, row-$(id)]
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    auto reifies = WithRole(*result, StatementRole::Reifies);
    auto annotations = WithRole(*result, StatementRole::Annotation);
    ASSERT_EQ(reifies.size(), 2u);
    EXPECT_EQ(reifies[0].object.quoted->subject, Term::IRI("http://example.org/dataset/1"));
    EXPECT_EQ(annotations[0].object, Term::Literal("row-1"));
    EXPECT_EQ(reifies[1].object.quoted->subject, Term::IRI("http://example.org/dataset/2"));
    EXPECT_EQ(annotations[1].object, Term::Literal("row-2"));
}

TEST_F(ExecutorTest, NoConditionDifferentSourceIsInvalid) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  metaTM:
    sources: [meta.csv~csv]
    s:
      quoted: datasetTM
    po:
      - [ex:confidence, $(confidence)]
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->report.CountIssues(ErrorKind::JoinConditionInvalid), 1u);
    EXPECT_EQ(result->report.reifiers, 0u);
}

TEST_F(ExecutorTest, NamespaceFilter) {
    auto people = MakeTable({"id", "name"}, {{std::string("1"), std::string("Alice")}});
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  personTM:
    sources: [people.csv~csv]
    s: ex:person/$(id)
    po:
      - [ex:name, $(name)]
  metaTM:
    sources: [meta.csv~csv]
    s:
      quoted: datasetTM
      namespace: ex:dataset/
      condition:
        function: equal
        parameters:
          - [str1, $(id)]
          - [str2, $(dataset_id)]
    po:
      - [ex:confidence, $(confidence)]
)");
    GenerationExecutor executor(spec);
    executor.RegisterSource("datasets", datasets_);
    executor.RegisterSource("meta", meta_);
    executor.RegisterSource("people", people);
    auto result = executor.Run();
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    EXPECT_EQ(result->report.reifiers, 2u);
    for (const auto& statement : WithRole(*result, StatementRole::Reifies)) {
        EXPECT_EQ(statement.object.quoted->subject.lexical.rfind("http://example.org/dataset/", 0), 0u);
    }
}

TEST_F(ExecutorTest, SkipPolicyDropsRulesWithAbsentValues) {
    datasets_ = MakeTable({"id", "title"},
                          {{std::string("1"), std::nullopt},
                           {std::nullopt, std::string("Beta")}});
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
      - [ex:kind, dataset]
)");

    ExecutorOptions skip;
    skip.template_options.null_policy = NullPolicy::Skip;
    auto skipped = Run(spec, skip);
    ASSERT_TRUE(skipped.ok());
    // Row 0 keeps only the constant rule; row 1 has no subject
    ASSERT_EQ(skipped->statements.size(), 1u);
    EXPECT_EQ(skipped->statements[0].object, Term::Literal("dataset"));

    auto sentinel = Run(spec);
    ASSERT_TRUE(sentinel.ok());
    ASSERT_EQ(sentinel->statements.size(), 4u);
    EXPECT_EQ(sentinel->statements[0].object, Term::Literal("unknown"));
    EXPECT_EQ(sentinel->statements[2].subject, Term::IRI("http://example.org/dataset/unknown"));
}

TEST_F(ExecutorTest, RowErrorsSkipOnlyThatRow) {
    auto labels = MakeTable({"id", "label", "lang"},
                            {{std::string("a"), std::string("A"), std::string("en")},
                             {std::string("b"), std::string("B"), std::string("not a tag")},
                             {std::string("c"), std::string("C"), std::string("de")}});
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  labelTM:
    sources: [labels.csv]
    s: ex:item/$(id)
    po:
      - [a, ex:Item]
      - p: ex:label
        o:
          value: $(label)
          language: $(lang)
)");
    GenerationExecutor executor(spec);
    executor.RegisterSource("labels", labels);
    auto result = executor.Run();
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    // Row 1 loses its type triple too
    EXPECT_EQ(result->statements.size(), 4u);
    EXPECT_EQ(result->report.rows_skipped, 1u);
    ASSERT_EQ(result->report.issues.size(), 1u);
    EXPECT_EQ(result->report.issues[0].kind, ErrorKind::RowEvaluationError);
    EXPECT_EQ(*result->report.issues[0].row, 1);
    for (const auto& statement : result->statements) {
        EXPECT_NE(statement.subject.lexical, "http://example.org/item/b");
    }
}

TEST_F(ExecutorTest, SchemeLikeObjectValueKeepsRow) {
    auto items = MakeTable({"id", "title", "status"},
                           {{std::string("1"), std::string("Alpha"), std::string("TBD: pending")},
                            {std::string("2"), std::string("Beta"),
                             std::string("http://example.org/status/ok")}});
    MappingSpec spec = Parse(R"(
base: http://example.org/
prefixes:
  ex: http://example.org/
mappings:
  itemTM:
    sources: [items.csv]
    s: ex:item/$(id)
    po:
      - [a, ex:Item]
      - [ex:title, $(title)]
      - [ex:status, $(status)~iri]
)");
    GenerationExecutor executor(spec);
    executor.RegisterSource("items", items);
    auto result = executor.Run();
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    EXPECT_TRUE(result->report.issues.empty());
    EXPECT_EQ(result->report.rows_skipped, 0u);
    ASSERT_EQ(result->statements.size(), 6u);
    EXPECT_EQ(result->statements[1].object, Term::Literal("Alpha"));
    EXPECT_EQ(result->statements[2].object, Term::IRI("http://example.org/TBD__pending"));
    EXPECT_EQ(result->statements[5].object, Term::IRI("http://example.org/status/ok"));
}

TEST_F(ExecutorTest, VectorizedSubjectsMatchRowByRow) {
    MappingSpec spec = Parse(kDatasetMappings);
    ExecutorOptions row_by_row;
    row_by_row.vectorized_subjects = false;

    auto vectorized = Run(spec);
    auto plain = Run(spec, row_by_row);
    ASSERT_TRUE(vectorized.ok());
    ASSERT_TRUE(plain.ok());
    EXPECT_EQ(vectorized->statements, plain->statements);
}

TEST_F(ExecutorTest, ReferenceObjectJoin) {
    auto people = MakeTable({"id", "org_id"},
                            {{std::string("p1"), std::string("o1")},
                             {std::string("p2"), std::string("o9")},
                             {std::string("p3"), std::nullopt}});
    auto orgs = MakeTable({"id"}, {{std::string("o1")}, {std::string("o2")}});
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  person:
    sources: [people.csv]
    s: ex:person/$(id)
    po:
      - p: ex:worksFor
        o:
          mapping: org
          condition:
            function: equal
            parameters:
              - [str1, $(org_id)]
              - [str2, $(id)]
        i: ex:employs
  org:
    sources: [orgs.csv]
    s: ex:org/$(id)
)");
    GenerationExecutor executor(spec);
    executor.RegisterSource("people", people);
    executor.RegisterSource("orgs", orgs);
    auto result = executor.Run();
    ASSERT_TRUE(result.ok()) << result.status().ToString();

    // p1 worksFor o1 and the inverse; org maps have no rules
    ASSERT_EQ(result->statements.size(), 2u);
    EXPECT_EQ(result->statements[0].subject, Term::IRI("http://example.org/person/p1"));
    EXPECT_EQ(result->statements[0].object, Term::IRI("http://example.org/org/o1"));
    EXPECT_EQ(result->statements[1].subject, Term::IRI("http://example.org/org/o1"));
    EXPECT_EQ(result->statements[1].predicate, Term::IRI("http://example.org/employs"));
}

TEST_F(ExecutorTest, TypesAndGraphs) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    graphs: ex:graph/$(id)
    po:
      - [a, ex:Dataset]
      - p: ex:title
        o: $(title)
        g: ex:titles
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    ASSERT_EQ(result->statements.size(), 4u);

    const Statement& type = result->statements[0];
    EXPECT_EQ(type.predicate.lexical, std::string(vocab::kRdfType));
    EXPECT_EQ(type.object, Term::IRI("http://example.org/Dataset"));
    ASSERT_TRUE(type.graph.has_value());
    EXPECT_EQ(*type.graph, Term::IRI("http://example.org/graph/1"));

    const Statement& title = result->statements[1];
    ASSERT_TRUE(title.graph.has_value());
    EXPECT_EQ(*title.graph, Term::IRI("http://example.org/titles"));
}

TEST_F(ExecutorTest, MissingSourceSkipsMapOnly) {
    MappingSpec spec = Parse(R"(
prefixes:
  ex: http://example.org/
mappings:
  missingTM:
    sources: [/nonexistent/missing.csv~csv]
    s: ex:m/$(id)
  datasetTM:
    sources: [datasets.csv~csv]
    s: ex:dataset/$(id)
    po:
      - [ex:title, $(title)]
  emptyTM:
    s: ex:e/$(id)
)");
    auto result = Run(spec);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(result->report.base_triples, 2u);
    EXPECT_EQ(result->report.CountIssues(ErrorKind::SourceUnavailable), 1u);
    EXPECT_EQ(result->report.maps_skipped, 1u);
}

TEST_F(ExecutorTest, MapOrderAndBlankNodePrefix) {
    MappingSpec spec = Parse(kDatasetMappings);

    ExecutorOptions unknown;
    unknown.map_order = {"nope"};
    EXPECT_TRUE(Run(spec, unknown).status().IsInvalid());

    ExecutorOptions prefixed;
    prefixed.blank_node_prefix = "ann";
    auto result = Run(spec, prefixed);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(WithRole(*result, StatementRole::Reifies)[0].subject, Term::BlankNode("ann1"));

    ExecutorOptions zero;
    zero.template_options.cache_capacity = 0;
    EXPECT_TRUE(Run(spec, zero).status().IsInvalid());
}

} // namespace star_etl
