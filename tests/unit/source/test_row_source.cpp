#include <gtest/gtest.h>
#include <star_etl/source/row_source.h>
#include <star_etl/util/errors.h>

namespace star_etl {

class RowSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_dir_ = STAR_ETL_TEST_DATA_DIR;
    }
    void TearDown() override {}

    std::string data_dir_;
};

TEST_F(RowSourceTest, CsvKeepsLexicalForms) {
    CsvRowSource source(data_dir_ + "/datasets.csv");
    auto table = source.Load();
    ASSERT_TRUE(table.ok()) << table.status().ToString();

    EXPECT_EQ((*table)->num_rows(), 3);
    EXPECT_EQ((*table)->column_names(), (std::vector<std::string>{"id", "title", "publisher"}));
    int id = (*table)->ColumnIndex("id");
    EXPECT_EQ(*(*table)->Value(id, 2), "007");
    int publisher = (*table)->ColumnIndex("publisher");
    EXPECT_EQ(*(*table)->Value(publisher, 2), "");
}

TEST_F(RowSourceTest, MissingCsvIsSourceUnavailable) {
    CsvRowSource source(data_dir_ + "/nope.csv");
    auto table = source.Load();
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(GetErrorKind(table.status()), ErrorKind::SourceUnavailable);
}

TEST_F(RowSourceTest, JsonFileWithIterator) {
    JsonRowSource source(data_dir_ + "/people.json", "$.people[*]");
    auto table = source.Load();
    ASSERT_TRUE(table.ok()) << table.status().ToString();
    EXPECT_EQ((*table)->num_rows(), 3);

    int city = (*table)->ColumnIndex("address.city");
    ASSERT_GE(city, 0);
    EXPECT_EQ(*(*table)->Value(city, 0), "Ghent");
    EXPECT_FALSE((*table)->Value(city, 1).has_value());

    int id = (*table)->ColumnIndex("id");
    EXPECT_EQ(*(*table)->Value(id, 2), "3");

    int tags = (*table)->ColumnIndex("tags");
    ASSERT_GE(tags, 0);
    EXPECT_EQ(*(*table)->Value(tags, 0), "[\"a\",\"b\"]");

    int email = (*table)->ColumnIndex("email");
    ASSERT_GE(email, 0);
    EXPECT_FALSE((*table)->Value(email, 1).has_value());
}

TEST_F(RowSourceTest, JsonPathForms) {
    const std::string doc = R"({"a": {"items": [{"v": "x"}, {"v": "y"}]}, "list": [1, 2, 3]})";

    auto wildcard = ParseJsonRows(doc, "$.a.items[*]");
    ASSERT_TRUE(wildcard.ok());
    EXPECT_EQ((*wildcard)->num_rows(), 2);

    // A path ending on an array iterates its elements
    auto array = ParseJsonRows(doc, "$.a.items");
    ASSERT_TRUE(array.ok());
    EXPECT_EQ((*array)->num_rows(), 2);

    auto index = ParseJsonRows(doc, "$['a'].items[1]");
    ASSERT_TRUE(index.ok());
    ASSERT_EQ((*index)->num_rows(), 1);
    EXPECT_EQ(*(*index)->Value(0, 0), "y");

    auto scalars = ParseJsonRows(doc, "$.list[*]");
    ASSERT_TRUE(scalars.ok());
    EXPECT_EQ((*scalars)->num_rows(), 3);
    EXPECT_EQ((*scalars)->column_names(), std::vector<std::string>{"value"});

    auto none = ParseJsonRows(doc, "$.missing[*]");
    ASSERT_TRUE(none.ok());
    EXPECT_EQ((*none)->num_rows(), 0);
}

TEST_F(RowSourceTest, JsonRootArray) {
    auto table = ParseJsonRows(R"([{"id": "1"}, {"id": "2"}])", "");
    ASSERT_TRUE(table.ok());
    EXPECT_EQ((*table)->num_rows(), 2);
}

TEST_F(RowSourceTest, JsonErrors) {
    EXPECT_TRUE(ParseJsonRows("{not json", "$").status().IsInvalid());
    EXPECT_TRUE(ParseJsonRows("{}", "$..a").status().IsNotImplemented());
    EXPECT_TRUE(ParseJsonRows("{}", "a.b").status().IsInvalid());
    EXPECT_TRUE(ParseJsonRows("[]", "$[99999999999999999999]").status().IsInvalid());
}

TEST_F(RowSourceTest, MakeRowSourceByFormat) {
    SourceReference csv;
    csv.path = "x.csv";
    auto csv_source = MakeRowSource(csv, "/tmp/x.csv");
    ASSERT_TRUE(csv_source.ok());
    EXPECT_EQ((*csv_source)->Describe(), "csv:/tmp/x.csv");

    SourceReference json;
    json.path = "x.json";
    json.format = "jsonpath";
    json.iterator = "$[*]";
    auto json_source = MakeRowSource(json, "/tmp/x.json");
    ASSERT_TRUE(json_source.ok());
    EXPECT_EQ((*json_source)->Describe(), "json:/tmp/x.json $[*]");

    SourceReference xml;
    xml.path = "x.xml";
    xml.format = "xpath";
    auto xml_source = MakeRowSource(xml, "/tmp/x.xml");
    ASSERT_FALSE(xml_source.ok());
    EXPECT_EQ(GetErrorKind(xml_source.status()), ErrorKind::SourceUnavailable);
}

TEST_F(RowSourceTest, InMemory) {
    auto table = SourceTable::FromRows({"id"}, {{std::string("1")}});
    ASSERT_TRUE(table.ok());
    InMemoryRowSource source(*table, "fixture");
    auto loaded = source.Load();
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded->get(), table->get());
    EXPECT_EQ(source.Describe(), "memory:fixture");
}

} // namespace star_etl
