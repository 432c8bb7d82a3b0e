#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include "csv_loader.hpp"

namespace {

std::vector<CsvRow> parse(const std::string& text) {
    std::istringstream in(text);
    return parse_csv(in, "test.csv");
}

}  // namespace

TEST(CsvTest, PlainRows) {
    auto rows = parse("a,b,c\n1,2,3\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"1", "2", "3"}));
}

TEST(CsvTest, QuotedFieldsWithCommasQuotesAndNewlines) {
    auto rows = parse("term,definition\n\"Load, Balancer\",\"says \"\"hi\"\"\nover two lines\"\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][0], "Load, Balancer");
    EXPECT_EQ(rows[1][1], "says \"hi\"\nover two lines");
}

TEST(CsvTest, CrLfBlankLinesAndEmptyFields) {
    auto rows = parse("a,b\r\n\r\nx,\r\n,\r\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1], (CsvRow{"x", ""}));
    EXPECT_EQ(rows[2], (CsvRow{"", ""}));
}

TEST(CsvTest, MissingTrailingNewline) {
    auto rows = parse("a,b\n1,2");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"1", "2"}));
}

TEST(CsvTest, ByteOrderMarkSkipped) {
    auto rows = parse("\xEF\xBB\xBFterm,definition\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][0], "term");
}

TEST(CsvTest, Utf8PassesThrough) {
    std::istringstream in("term,definition\n\xD0\x9A\xD1\x8D\xD1\x88,\xEF\xBC\xA1\n");
    auto terms = read_terms_csv(in, "terms.csv");
    ASSERT_EQ(terms.size(), 1u);
    EXPECT_EQ(terms[0].name, "\xD0\x9A\xD1\x8D\xD1\x88");
    EXPECT_EQ(terms[0].definition, "\xEF\xBC\xA1");
}

TEST(CsvTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(parse("a,b\n\"open,1\n"), CsvError);
}

TEST(CsvTest, StrayQuoteThrows) {
    EXPECT_THROW(parse("a,b\nab\"c,1\n"), CsvError);
}

TEST(CsvTest, TermsUseHeaderOrder) {
    std::istringstream in("definition,term\nfeline,cat\n");
    auto terms = read_terms_csv(in, "terms.csv");
    ASSERT_EQ(terms.size(), 1u);
    EXPECT_EQ(terms[0].name, "cat");
    EXPECT_EQ(terms[0].definition, "feline");
}

TEST(CsvTest, LinksParsed) {
    std::istringstream in("source,target,relation\ncat,animal,is-a\ncat,pet,is-a\n");
    auto links = read_links_csv(in, "links.csv");
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[1], (RelationRec{"cat", "pet", "is-a"}));
}

TEST(CsvTest, MissingColumnThrows) {
    std::istringstream in("source,target\ncat,animal\n");
    try {
        read_links_csv(in, "links.csv");
        FAIL() << "expected CsvError";
    } catch (const CsvError& e) {
        EXPECT_NE(std::string(e.what()).find("relation"), std::string::npos);
    }
}

TEST(CsvTest, RaggedRecordThrows) {
    std::istringstream in("term,definition\ncat\n");
    EXPECT_THROW(read_terms_csv(in, "terms.csv"), CsvError);
}

TEST(CsvTest, EmptyFileThrows) {
    std::istringstream in("");
    EXPECT_THROW(read_terms_csv(in, "terms.csv"), CsvError);
}

TEST(CsvTest, MissingFileThrows) {
    EXPECT_THROW(load_terms_csv("does_not_exist_terms.csv"), CsvError);
}

TEST(CsvTest, LoadsFromDisk) {
    const char* path = "glossary_test_links.csv";
    {
        std::ofstream out(path);
        out << "source,target,relation\na,b,uses\n";
    }
    auto links = load_links_csv(path);
    std::remove(path);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].type, "uses");
}
