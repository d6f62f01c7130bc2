/**
 * @file test_property_tree.cpp
 * @brief Unit tests for the property tree algebra
 *
 * Tests coverage for:
 * - Construction: leaf, record, sequence, from_path
 * - Emptiness: structural and recursive
 * - map / zip_with: functor and projection laws
 * - merge / merge_all: record union, sequence append, alternatives
 * - flatten / unflatten: multi-valued paths, index steps, inverse law
 * - get_path: record and sequence-aware lookup
 * - drop_empty / unwrap_singleton_lists normalization
 * - Paths and debug rendering
 */

#include <gtest/gtest.h>
#include <confix/core/config/property_tree.hpp>

#include <string>
#include <vector>

using namespace confix::core::config;

namespace {

PropertyTree leaf(const std::string& v) {
    return PropertyTree::leaf(v);
}

PropertyTree rec(PropertyTree::RecordMap entries) {
    return PropertyTree::record(std::move(entries));
}

PropertyTree seq(PropertyTree::SequenceList elements) {
    return PropertyTree::sequence(std::move(elements));
}

/// A tree with every kind of node in it
PropertyTree sample_tree() {
    return rec({{"db", rec({{"user", leaf("admin")}, {"port", leaf("5432")}})},
                {"regions", seq({leaf("eu"), leaf("us")})},
                {"servers", seq({rec({{"host", leaf("a")}}), rec({{"host", leaf("b")}})})},
                {"unset", PropertyTree::empty()}});
}

}  // namespace

// ============================================================================
// Construction Tests
// ============================================================================

class PropertyTreeConstructionTest : public ::testing::Test {};

TEST_F(PropertyTreeConstructionTest, DefaultIsEmpty) {
    PropertyTree tree;
    EXPECT_EQ(tree.kind(), PropertyTree::Kind::EMPTY);
    EXPECT_TRUE(tree.is_empty());
    EXPECT_EQ(tree, PropertyTree::empty());
}

TEST_F(PropertyTreeConstructionTest, Kinds) {
    EXPECT_TRUE(leaf("x").is_leaf());
    EXPECT_TRUE(rec({}).is_record());
    EXPECT_TRUE(seq({}).is_sequence());
    EXPECT_EQ(leaf("x").leaf_value(), "x");
}

TEST_F(PropertyTreeConstructionTest, FromPathNestsRecords) {
    auto tree = PropertyTree::from_path({"a", "b"}, leaf("1"));
    EXPECT_EQ(tree, rec({{"a", rec({{"b", leaf("1")}})}}));
}

TEST_F(PropertyTreeConstructionTest, FromEmptyPathIsTree) {
    EXPECT_EQ(PropertyTree::from_path({}, leaf("1")), leaf("1"));
}

TEST_F(PropertyTreeConstructionTest, LeavesBuildsSequence) {
    EXPECT_EQ(PropertyTree::leaves({"1", "2"}), seq({leaf("1"), leaf("2")}));
}

TEST_F(PropertyTreeConstructionTest, AccessorsOnOtherKindsAreEmpty) {
    EXPECT_TRUE(leaf("x").record_entries().empty());
    EXPECT_TRUE(leaf("x").sequence_elements().empty());
    EXPECT_TRUE(PropertyTree::empty().record_entries().empty());
}

// ============================================================================
// Emptiness Tests
// ============================================================================

class PropertyTreeEmptinessTest : public ::testing::Test {};

TEST_F(PropertyTreeEmptinessTest, LeafIsNeverEmpty) {
    EXPECT_FALSE(leaf("").is_empty());
}

TEST_F(PropertyTreeEmptinessTest, ZeroLengthSequenceIsEmpty) {
    auto tree = seq({});
    EXPECT_TRUE(tree.is_sequence());
    EXPECT_TRUE(tree.is_empty());
    EXPECT_NE(tree, PropertyTree::empty());
}

TEST_F(PropertyTreeEmptinessTest, RecursiveEmptiness) {
    EXPECT_TRUE(rec({{"a", PropertyTree::empty()}, {"b", rec({{"c", seq({})}})}}).is_empty());
    EXPECT_FALSE(rec({{"a", PropertyTree::empty()}, {"b", leaf("1")}}).is_empty());
    EXPECT_TRUE(seq({PropertyTree::empty(), rec({})}).is_empty());
}

TEST_F(PropertyTreeEmptinessTest, GetOrElse) {
    EXPECT_EQ(PropertyTree::empty().get_or_else(leaf("x")), leaf("x"));
    EXPECT_EQ(leaf("y").get_or_else(leaf("x")), leaf("y"));
}

// ============================================================================
// Functor Law Tests
// ============================================================================

class PropertyTreeMapTest : public ::testing::Test {
protected:
    PropertyTree tree = sample_tree();
};

TEST_F(PropertyTreeMapTest, IdentityLaw) {
    EXPECT_EQ(tree.map([](const std::string& v) { return v; }), tree);
}

TEST_F(PropertyTreeMapTest, CompositionLaw) {
    auto f = [](const std::string& v) { return v + "!"; };
    auto g = [](const std::string& v) { return "<" + v + ">"; };

    EXPECT_EQ(tree.map(f).map(g), tree.map([&](const std::string& v) { return g(f(v)); }));
}

TEST_F(PropertyTreeMapTest, ChangesValueTypeKeepsShape) {
    auto sizes = tree.map([](const std::string& v) { return v.size(); });
    static_assert(std::is_same_v<decltype(sizes), BasicPropertyTree<std::size_t>>);

    EXPECT_EQ(sizes.get_path({"db", "user"}), BasicPropertyTree<std::size_t>::leaf(5));
    EXPECT_EQ(sizes.get_path({"regions"}).sequence_elements().size(), 2u);
    EXPECT_EQ(sizes.get_path({"unset"}).kind(), BasicPropertyTree<std::size_t>::Kind::EMPTY);
}

// ============================================================================
// zip_with Tests
// ============================================================================

class PropertyTreeZipTest : public ::testing::Test {
protected:
    PropertyTree tree = sample_tree();
};

TEST_F(PropertyTreeZipTest, PickLeftIsIdentity) {
    auto left = tree.zip_with(tree, [](const std::string& l, const std::string&) { return l; });
    EXPECT_EQ(left, tree);
}

TEST_F(PropertyTreeZipTest, PickRightIsIdentity) {
    auto right = tree.zip_with(tree, [](const std::string&, const std::string& r) { return r; });
    EXPECT_EQ(right, tree);
}

TEST_F(PropertyTreeZipTest, CombinesLeaves) {
    auto a = rec({{"x", leaf("1")}});
    auto b = rec({{"x", leaf("2")}});
    auto joined =
        a.zip_with(b, [](const std::string& l, const std::string& r) { return l + r; });
    EXPECT_EQ(joined, rec({{"x", leaf("12")}}));
}

TEST_F(PropertyTreeZipTest, DivergingShapesBecomeEmpty) {
    auto a = rec({{"x", leaf("1")}, {"only_left", leaf("l")}, {"list", seq({leaf("1"), leaf("2")})}});
    auto b = rec({{"x", rec({})}, {"only_right", leaf("r")}, {"list", seq({leaf("3")})}});
    auto joined =
        a.zip_with(b, [](const std::string& l, const std::string& r) { return l + r; });

    EXPECT_EQ(joined.get_path({"x"}), PropertyTree::empty());
    EXPECT_EQ(joined.get_path({"only_left"}), PropertyTree::empty());
    EXPECT_EQ(joined.get_path({"only_right"}), PropertyTree::empty());
    EXPECT_EQ(joined.get_path({"list"}), seq({leaf("13"), PropertyTree::empty()}));
}

// ============================================================================
// Merge Tests
// ============================================================================

class PropertyTreeMergeTest : public ::testing::Test {};

TEST_F(PropertyTreeMergeTest, DisjointRecordsUnion) {
    auto merged = rec({{"a", leaf("1")}}).merge(rec({{"b", leaf("2")}}));
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], rec({{"a", leaf("1")}, {"b", leaf("2")}}));
}

TEST_F(PropertyTreeMergeTest, NestedRecordsMergeRecursively) {
    auto left   = PropertyTree::from_path({"db", "user"}, leaf("u"));
    auto right  = PropertyTree::from_path({"db", "password"}, leaf("p"));
    auto merged = left.merge(right);

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], rec({{"db", rec({{"user", leaf("u")}, {"password", leaf("p")}})}}));
}

TEST_F(PropertyTreeMergeTest, SequencesAppend) {
    auto merged = seq({leaf("1")}).merge(seq({leaf("2"), leaf("3")}));
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], seq({leaf("1"), leaf("2"), leaf("3")}));
}

TEST_F(PropertyTreeMergeTest, EmptyIsIdentity) {
    EXPECT_EQ(PropertyTree::empty().merge(leaf("x")), std::vector<PropertyTree>{leaf("x")});
    EXPECT_EQ(leaf("x").merge(PropertyTree::empty()), std::vector<PropertyTree>{leaf("x")});
}

TEST_F(PropertyTreeMergeTest, StructurallyEmptyIsIdentity) {
    const std::vector<PropertyTree> empties{seq({}), rec({}), rec({{"a", PropertyTree::empty()}}),
                                            seq({PropertyTree::empty()})};

    for (const auto& empty : empties) {
        EXPECT_EQ(empty.merge(leaf("x")), std::vector<PropertyTree>{leaf("x")});
        EXPECT_EQ(leaf("x").merge(empty), std::vector<PropertyTree>{leaf("x")});
    }
}

TEST_F(PropertyTreeMergeTest, ConflictingLeavesYieldAlternatives) {
    auto merged = leaf("1").merge(leaf("2"));
    EXPECT_EQ(merged, (std::vector<PropertyTree>{leaf("1"), leaf("2")}));
}

TEST_F(PropertyTreeMergeTest, ConflictInsideRecordYieldsRecordAlternatives) {
    auto merged = rec({{"a", leaf("1")}, {"b", leaf("x")}}).merge(rec({{"a", leaf("2")}}));
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0], rec({{"a", leaf("1")}, {"b", leaf("x")}}));
    EXPECT_EQ(merged[1], rec({{"a", leaf("2")}, {"b", leaf("x")}}));
}

TEST_F(PropertyTreeMergeTest, MergeAllAccumulatesSequences) {
    std::vector<PropertyTree> trees{
        PropertyTree::from_path({"ints"}, seq({leaf("1")})),
        PropertyTree::from_path({"ints"}, seq({leaf("2")})),
        PropertyTree::from_path({"ints"}, seq({leaf("3")})),
    };
    auto merged = PropertyTree::merge_all(trees);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].get_path({"ints"}), seq({leaf("1"), leaf("2"), leaf("3")}));
}

TEST_F(PropertyTreeMergeTest, MergeAllOfNothing) {
    EXPECT_TRUE(PropertyTree::merge_all({}).empty());
}

// ============================================================================
// Flatten / Unflatten Tests
// ============================================================================

class PropertyTreeFlattenTest : public ::testing::Test {};

TEST_F(PropertyTreeFlattenTest, LeafSequenceIsOneMultiValuedPath) {
    auto flat = rec({{"regions", seq({leaf("eu"), leaf("us")})}}).flatten();
    ASSERT_EQ(flat.size(), 1u);
    EXPECT_EQ(path_to_string(flat[0].first), "regions");
    EXPECT_EQ(flat[0].second, (std::vector<std::string>{"eu", "us"}));
}

TEST_F(PropertyTreeFlattenTest, RecordSequenceUsesIndexSteps) {
    auto flat = sample_tree().flatten();

    std::vector<std::string> paths;
    for (const auto& [path, values] : flat) {
        paths.push_back(path_to_string(path));
    }
    EXPECT_EQ(paths, (std::vector<std::string>{"db.port", "db.user", "regions", "servers[0].host",
                                               "servers[1].host"}));
}

TEST_F(PropertyTreeFlattenTest, EmptyContributesNothing) {
    EXPECT_TRUE(PropertyTree::empty().flatten().empty());
    EXPECT_TRUE(rec({{"a", seq({})}}).flatten().empty());
}

TEST_F(PropertyTreeFlattenTest, UnflattenSharesPrefixes) {
    PropertyTree::Flattened pairs{
        {to_step_path({"db", "user"}), {"u"}},
        {to_step_path({"db", "port"}), {"1"}},
    };
    auto tree = PropertyTree::unflatten(pairs);
    EXPECT_EQ(tree, rec({{"db", rec({{"user", seq({leaf("u")})}, {"port", seq({leaf("1")})}})}}));
}

TEST_F(PropertyTreeFlattenTest, UnflattenIndexStepsBuildSequence) {
    StepPath first{PathStep::for_key("servers"), PathStep::for_index(1), PathStep::for_key("host")};
    StepPath second{PathStep::for_key("servers"), PathStep::for_index(0), PathStep::for_key("host")};
    auto tree = PropertyTree::unflatten(PropertyTree::Flattened{{first, {"b"}}, {second, {"a"}}})
                    .unwrap_singleton_lists();

    EXPECT_EQ(tree, rec({{"servers", seq({rec({{"host", leaf("a")}}), rec({{"host", leaf("b")}})})}}));
}

TEST_F(PropertyTreeFlattenTest, InverseUpToSingletonLists) {
    auto tree = sample_tree().drop_empty();
    EXPECT_EQ(PropertyTree::unflatten(tree.flatten()).unwrap_singleton_lists(), tree);
}

TEST_F(PropertyTreeFlattenTest, UnflattenKeysAndValues) {
    EXPECT_EQ(PropertyTree::unflatten(KeyPath{"a"}, std::vector<std::string>{"1", "2"}),
              rec({{"a", seq({leaf("1"), leaf("2")})}}));
    EXPECT_EQ(PropertyTree::unflatten(KeyPath{"a"}, leaf("1")), rec({{"a", leaf("1")}}));
}

// ============================================================================
// get_path Tests
// ============================================================================

class PropertyTreeLookupTest : public ::testing::Test {
protected:
    PropertyTree tree = sample_tree();
};

TEST_F(PropertyTreeLookupTest, RecordPath) {
    EXPECT_EQ(tree.get_path({"db", "port"}), leaf("5432"));
    EXPECT_EQ(tree.get_path({}), tree);
}

TEST_F(PropertyTreeLookupTest, MissingPathIsEmpty) {
    EXPECT_EQ(tree.get_path({"db", "host"}), PropertyTree::empty());
    EXPECT_EQ(tree.get_path({"db", "port", "deeper"}), PropertyTree::empty());
}

TEST_F(PropertyTreeLookupTest, LookupThroughSequence) {
    EXPECT_EQ(tree.get_path({"servers", "host"}), seq({leaf("a"), leaf("b")}));
}

// ============================================================================
// Normalization Tests
// ============================================================================

class PropertyTreeNormalizationTest : public ::testing::Test {};

TEST_F(PropertyTreeNormalizationTest, DropEmptyPrunesRecursively) {
    auto tree = rec({{"a", PropertyTree::empty()},
                     {"b", rec({{"c", PropertyTree::empty()}})},
                     {"d", seq({PropertyTree::empty(), leaf("x")})}});
    EXPECT_EQ(tree.drop_empty(), rec({{"d", seq({leaf("x")})}}));
}

TEST_F(PropertyTreeNormalizationTest, AllEmptyBecomesEmpty) {
    EXPECT_EQ(rec({{"a", seq({})}}).drop_empty(), PropertyTree::empty());
    EXPECT_EQ(seq({}).drop_empty(), PropertyTree::empty());
}

TEST_F(PropertyTreeNormalizationTest, DropEmptyOverList) {
    auto kept = PropertyTree::drop_empty({PropertyTree::empty(), leaf("1"), rec({})});
    EXPECT_EQ(kept, std::vector<PropertyTree>{leaf("1")});
}

TEST_F(PropertyTreeNormalizationTest, UnwrapSingletonLists) {
    auto tree = rec({{"one", seq({leaf("1")})},
                     {"two", seq({leaf("1"), leaf("2")})},
                     {"nested", seq({seq({leaf("x")})})}});
    EXPECT_EQ(tree.unwrap_singleton_lists(),
              rec({{"one", leaf("1")}, {"two", seq({leaf("1"), leaf("2")})}, {"nested", leaf("x")}}));
}

// ============================================================================
// Path and Rendering Tests
// ============================================================================

class PropertyTreeDisplayTest : public ::testing::Test {};

TEST_F(PropertyTreeDisplayTest, PathToString) {
    StepPath path{PathStep::for_key("a"), PathStep::for_key("b"), PathStep::for_index(1),
                  PathStep::for_key("c")};
    EXPECT_EQ(path_to_string(path), "a.b[1].c");
    EXPECT_EQ(path_to_string({}), "");
}

TEST_F(PropertyTreeDisplayTest, DebugRendering) {
    auto tree = rec({{"a", leaf("1")}, {"b", seq({leaf("x"), PropertyTree::empty()})}});
    EXPECT_EQ(tree.to_string(), "Record{a: Leaf(1), b: Sequence[Leaf(x), Empty]}");

    std::ostringstream oss;
    oss << leaf("v");
    EXPECT_EQ(oss.str(), "Leaf(v)");
}
