#include <gtest/gtest.h>
#include <star_etl/mapping/join_function.h>

namespace star_etl {

class JoinFunctionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(JoinFunctionTest, Tokenize) {
    auto tokens = TokenizeJoinFunction("join(quoted=m, equal(str1=$(a)))");
    ASSERT_TRUE(tokens.ok()) << tokens.status().ToString();
    ASSERT_EQ(tokens->size(), 14u);
    EXPECT_EQ((*tokens)[0].type, JoinTokenType::IDENT);
    EXPECT_EQ((*tokens)[0].text, "join");
    EXPECT_EQ((*tokens)[1].type, JoinTokenType::LPAREN);
    EXPECT_EQ((*tokens)[3].type, JoinTokenType::EQUALS);
    EXPECT_EQ((*tokens)[10].type, JoinTokenType::REFERENCE);
    EXPECT_EQ((*tokens)[10].text, "a");
    EXPECT_EQ(tokens->back().type, JoinTokenType::END_OF_INPUT);
}

TEST_F(JoinFunctionTest, TokenizeRejectsStrayCharacters) {
    EXPECT_FALSE(TokenizeJoinFunction("join(quoted=m; x)").ok());
    EXPECT_FALSE(TokenizeJoinFunction("equal(str1=$(a").ok());
}

TEST_F(JoinFunctionTest, FullJoin) {
    auto fn = ParseJoinFunction(
        "join(quoted=datasetTM, equal(str1=$(dataset_id), str2=$(ds)))");
    ASSERT_TRUE(fn.ok()) << fn.status().ToString();
    EXPECT_EQ(fn->quoted_map, "datasetTM");
    ASSERT_TRUE(fn->join.has_value());
    EXPECT_EQ(fn->join->left_key, "dataset_id");
    EXPECT_EQ(fn->join->right_key, "ds");
    EXPECT_TRUE(fn->join_error.empty());
}

TEST_F(JoinFunctionTest, PrefixedEqualAccepted) {
    auto fn = ParseJoinFunction("join(quoted=m, grel:equal(str1=$(a), str2=$(b)))");
    ASSERT_TRUE(fn.ok());
    ASSERT_TRUE(fn->join.has_value());
    EXPECT_EQ(fn->join->left_key, "a");
}

TEST_F(JoinFunctionTest, QuotedOnly) {
    auto fn = ParseJoinFunction("join(quoted=m)");
    ASSERT_TRUE(fn.ok());
    EXPECT_EQ(fn->quoted_map, "m");
    EXPECT_FALSE(fn->join.has_value());
    EXPECT_TRUE(fn->join_error.empty());
}

TEST_F(JoinFunctionTest, MissingParameterIsJoinError) {
    auto fn = ParseJoinFunction("join(quoted=m, equal(str1=$(a)))");
    ASSERT_TRUE(fn.ok());
    EXPECT_EQ(fn->quoted_map, "m");
    EXPECT_FALSE(fn->join.has_value());
    EXPECT_FALSE(fn->join_error.empty());
}

TEST_F(JoinFunctionTest, NonReferenceParameterIsJoinError) {
    auto fn = ParseJoinFunction("join(quoted=m, equal(str1=$(a), str2=literal))");
    ASSERT_TRUE(fn.ok());
    EXPECT_FALSE(fn->join_error.empty());
}

TEST_F(JoinFunctionTest, UnknownFunctionIsJoinError) {
    auto fn = ParseJoinFunction("join(quoted=m, contains(str1=$(a), str2=$(b)))");
    ASSERT_TRUE(fn.ok());
    EXPECT_NE(fn->join_error.find("contains"), std::string::npos);
}

TEST_F(JoinFunctionTest, BrokenSyntaxRecoversMapName) {
    auto fn = ParseJoinFunction("join(quoted = m1, equal(str1=$(a), str2=$(b))");
    ASSERT_TRUE(fn.ok());
    EXPECT_EQ(fn->quoted_map, "m1");
    EXPECT_FALSE(fn->join.has_value());
    EXPECT_FALSE(fn->join_error.empty());
}

TEST_F(JoinFunctionTest, NoMapNameFails) {
    EXPECT_FALSE(ParseJoinFunction("join(equal(str1=$(a), str2=$(b)))").ok());
    EXPECT_FALSE(ParseJoinFunction("something(").ok());
    EXPECT_FALSE(ParseJoinFunction("other(quoted=m)").ok());
}

} // namespace star_etl
