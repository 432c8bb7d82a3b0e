#include <gtest/gtest.h>
#include "relation_index.hpp"

TEST(RelationIndexTest, RelationsFromInInsertionOrder) {
    RelationIndex idx;
    idx.bulk_load({{"cat", "animal", "is-a"}, {"dog", "animal", "is-a"}, {"cat", "pet", "is-a"}});
    auto rs = idx.relations_from("cat");
    ASSERT_EQ(rs.size(), 2u);
    EXPECT_EQ(rs[0], (RelationRec{"cat", "animal", "is-a"}));
    EXPECT_EQ(rs[1], (RelationRec{"cat", "pet", "is-a"}));
}

TEST(RelationIndexTest, UnknownOrLeafTermHasNoRelations) {
    RelationIndex idx;
    idx.add({"cat", "animal", "is-a"});
    EXPECT_TRUE(idx.relations_from("animal").empty());
    EXPECT_TRUE(idx.relations_from("nobody").empty());
}

TEST(RelationIndexTest, IncomingTracksTargets) {
    RelationIndex idx;
    idx.bulk_load({{"cat", "animal", "is-a"}, {"dog", "animal", "is-a"}});
    auto& in = idx.incoming("animal");
    ASSERT_EQ(in.size(), 2u);
    EXPECT_EQ(idx.edge(in[0]).src, "cat");
    EXPECT_EQ(idx.edge(in[1]).src, "dog");
    EXPECT_TRUE(idx.incoming("cat").empty());
}

TEST(RelationIndexTest, OpenRelationTypesKeptVerbatim) {
    RelationIndex idx;
    idx.add({"wheel", "car", "Part Of (physical)"});
    EXPECT_EQ(idx.relations_from("wheel")[0].type, "Part Of (physical)");
}

TEST(RelationIndexTest, DuplicateTriplesAreStored) {
    RelationIndex idx;
    idx.bulk_load({{"a", "b", "x"}, {"a", "b", "x"}});
    EXPECT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx.relations_from("a").size(), 2u);
}

TEST(RelationIndexTest, HashMatchesEquality) {
    RelationHash h;
    RelationRec a{"a", "b", "x"}, b{"a", "b", "x"};
    EXPECT_EQ(h(a), h(b));
    EXPECT_FALSE(a == (RelationRec{"a", "b", "y"}));
}
