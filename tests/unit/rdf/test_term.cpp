#include <gtest/gtest.h>
#include <star_etl/rdf/term.h>
#include <unordered_set>

namespace star_etl {

class TermTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TermTest, SerializeIriAndBlank) {
    EXPECT_EQ(SerializeNTriplesTerm(Term::IRI("http://example.org/a")), "<http://example.org/a>");
    EXPECT_EQ(SerializeNTriplesTerm(Term::BlankNode("r1")), "_:r1");
}

TEST_F(TermTest, SerializeLiterals) {
    EXPECT_EQ(SerializeNTriplesTerm(Term::Literal("Alice")), "\"Alice\"");
    EXPECT_EQ(SerializeNTriplesTerm(Term::Literal("Hallo", "de")), "\"Hallo\"@de");
    EXPECT_EQ(SerializeNTriplesTerm(Term::Literal("42", "", "http://www.w3.org/2001/XMLSchema#integer")),
              "\"42\"^^<http://www.w3.org/2001/XMLSchema#integer>");
    // xsd:string is the implicit datatype
    EXPECT_EQ(SerializeNTriplesTerm(Term::Literal("x", "", std::string(vocab::kXsdString))), "\"x\"");
}

TEST_F(TermTest, EscapesLiteral) {
    EXPECT_EQ(EscapeLiteral("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
}

TEST_F(TermTest, QuotedTriple) {
    Triple triple{Term::IRI("http://ex/s"), Term::IRI("http://ex/p"), Term::Literal("o")};
    Term quoted = Term::Quoted(triple);
    EXPECT_TRUE(quoted.IsQuoted());
    EXPECT_EQ(SerializeNTriplesTerm(quoted), "<<( <http://ex/s> <http://ex/p> \"o\" )>>");

    Term same = Term::Quoted(triple);
    EXPECT_EQ(quoted, same);
    EXPECT_EQ(std::hash<Term>{}(quoted), std::hash<Term>{}(same));
}

TEST_F(TermTest, EqualityDistinguishesKindAndTags) {
    EXPECT_NE(Term::IRI("x"), Term::Literal("x"));
    EXPECT_NE(Term::Literal("x", "en"), Term::Literal("x", "de"));
    EXPECT_EQ(Term::Literal("x", "en"), Term::Literal("x", "en"));

    std::unordered_set<Term> terms{Term::IRI("a"), Term::IRI("a"), Term::Literal("a")};
    EXPECT_EQ(terms.size(), 2u);
}

TEST_F(TermTest, LanguageTags) {
    EXPECT_TRUE(IsValidLanguageTag("en"));
    EXPECT_TRUE(IsValidLanguageTag("en-GB"));
    EXPECT_TRUE(IsValidLanguageTag("zh-Hant-TW"));
    EXPECT_FALSE(IsValidLanguageTag(""));
    EXPECT_FALSE(IsValidLanguageTag("en_GB"));
    EXPECT_FALSE(IsValidLanguageTag("-en"));
}

TEST_F(TermTest, StatementAsTriple) {
    Statement st{Term::IRI("s"), Term::IRI("p"), Term::Literal("o"), Term::IRI("g"),
                 StatementRole::Base};
    Triple t = st.AsTriple();
    EXPECT_EQ(t.subject, Term::IRI("s"));
    EXPECT_EQ(t.object, Term::Literal("o"));
    EXPECT_EQ(ToString(StatementRole::Reifies), "Reifies");
}

} // namespace star_etl
