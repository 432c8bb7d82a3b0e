#include <gtest/gtest.h>
#include "term_index.hpp"

TEST(TermIndexTest, GetReturnsStoredTerm) {
    TermIndex idx;
    idx.put({"cat", "a small feline"});
    const TermRec* t = idx.get("cat");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->name, "cat");
    EXPECT_EQ(t->definition, "a small feline");
}

TEST(TermIndexTest, MissingNameIsNull) {
    TermIndex idx;
    idx.put({"cat", ""});
    EXPECT_EQ(idx.get("dog"), nullptr);
    EXPECT_FALSE(idx.contains("dog"));
}

TEST(TermIndexTest, LookupIsCaseSensitive) {
    TermIndex idx;
    idx.put({"API", "application programming interface"});
    EXPECT_NE(idx.get("API"), nullptr);
    EXPECT_EQ(idx.get("api"), nullptr);
}

TEST(TermIndexTest, EmptyDefinitionIsAllowed) {
    TermIndex idx;
    idx.put({"blank", ""});
    ASSERT_NE(idx.get("blank"), nullptr);
    EXPECT_EQ(idx.get("blank")->definition, "");
}

TEST(TermIndexTest, ListAllKeepsInsertionOrder) {
    TermIndex idx;
    idx.bulk_load({{"zeta", "z"}, {"alpha", "a"}, {"mu", "m"}});
    ASSERT_EQ(idx.size(), 3u);
    EXPECT_EQ(idx.list_all()[0].name, "zeta");
    EXPECT_EQ(idx.list_all()[1].name, "alpha");
    EXPECT_EQ(idx.list_all()[2].name, "mu");
}

TEST(TermIndexTest, PutOverwritesInPlace) {
    TermIndex idx;
    idx.bulk_load({{"a", "first"}, {"b", "b"}, {"a", "second"}});
    ASSERT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx.list_all()[0].name, "a");
    EXPECT_EQ(idx.list_all()[0].definition, "second");
    EXPECT_EQ(idx.get("a")->definition, "second");
}
