#include "kiln/graph.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace kiln;

namespace {

GraphNode make_node(const std::string &file, const std::string &ast_path, std::vector<CanonicalId> deps = {}) {
    GraphNode node;
    node.id = file + "::" + ast_path;
    node.file_path = file;
    node.dependencies = std::move(deps);
    node.summary.definition.ast_path = ast_path;
    return node;
}

void seed(Graph &graph, Index &index, std::vector<GraphNode> nodes) {
    GraphPatch patch;
    patch.upsert_nodes = std::move(nodes);
    apply_patch(graph, index, patch);
}

} // namespace

TEST(GraphTest, UpsertsMaintainIndex) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x"), make_node("/p/a.ts", "y"), make_node("/p/b.ts", "z")});

    EXPECT_EQ(graph.size(), 3u);
    EXPECT_EQ(index.at("/p/a.ts"), (std::set<CanonicalId>{"/p/a.ts::x", "/p/a.ts::y"}));
    EXPECT_EQ(index.at("/p/b.ts"), (std::set<CanonicalId>{"/p/b.ts::z"}));
    EXPECT_TRUE(check_index(graph, index).has_value());
    EXPECT_EQ(index, rebuild_index(graph));
}

TEST(GraphTest, RemovedModuleDropsAllItsNodes) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x"), make_node("/p/a.ts", "y"), make_node("/p/b.ts", "z")});

    GraphPatch patch;
    patch.removed_modules = {"/p/a.ts"};
    apply_patch(graph, index, patch);

    EXPECT_EQ(graph.size(), 1u);
    EXPECT_FALSE(index.contains("/p/a.ts"));
    EXPECT_TRUE(check_index(graph, index).has_value());
}

TEST(GraphTest, RemovedNodePrunesEmptyBucket) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x"), make_node("/p/b.ts", "z")});

    GraphPatch patch;
    patch.removed_nodes = {"/p/b.ts::z", "/p/unknown.ts::gone"};
    apply_patch(graph, index, patch);

    EXPECT_FALSE(graph.contains("/p/b.ts::z"));
    EXPECT_FALSE(index.contains("/p/b.ts"));
    EXPECT_TRUE(check_index(graph, index).has_value());
}

TEST(GraphTest, UpsertAfterRemovalInSamePatchSurvives) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x", {"/p/b.ts::z"})});

    GraphNode replacement = make_node("/p/a.ts", "x");
    GraphPatch patch;
    patch.removed_modules = {"/p/a.ts"};
    patch.removed_nodes = {replacement.id};
    patch.upsert_nodes = {replacement};
    apply_patch(graph, index, patch);

    ASSERT_TRUE(graph.contains(replacement.id));
    EXPECT_TRUE(graph.at(replacement.id).dependencies.empty());
    EXPECT_EQ(index.at("/p/a.ts"), (std::set<CanonicalId>{replacement.id}));
}

TEST(GraphTest, UpsertReplacesExistingNode) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x")});
    seed(graph, index, {make_node("/p/a.ts", "x", {"/p/b.ts::z"})});

    EXPECT_EQ(graph.size(), 1u);
    EXPECT_EQ(graph.at("/p/a.ts::x").dependencies, (std::vector<CanonicalId>{"/p/b.ts::z"}));
}

TEST(GraphTest, UpsertMovingFileFixesOldBucket) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x")});

    GraphNode moved = make_node("/p/a.ts", "x");
    moved.file_path = "/p/b.ts";
    seed(graph, index, {moved});

    EXPECT_FALSE(index.contains("/p/a.ts"));
    EXPECT_EQ(index.at("/p/b.ts"), (std::set<CanonicalId>{moved.id}));
    EXPECT_TRUE(check_index(graph, index).has_value());
}

TEST(GraphTest, CheckIndexReportsDrift) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x")});

    Index stale = index;
    stale["/p/a.ts"].insert("/p/a.ts::ghost");
    EXPECT_FALSE(check_index(graph, stale).has_value());

    Index missing;
    EXPECT_FALSE(check_index(graph, missing).has_value());
}

TEST(GraphTest, FindsNoCycleInDag) {
    Graph graph;
    Index index;
    seed(graph, index,
         {make_node("/p/a.ts", "x", {"/p/b.ts::y"}), make_node("/p/b.ts", "y", {"/p/c.ts::z", "/p/ext.ts::missing"}),
          make_node("/p/c.ts", "z")});
    EXPECT_FALSE(find_cycle(graph).has_value());
}

TEST(GraphTest, FindsCycleChain) {
    Graph graph;
    Index index;
    seed(graph, index,
         {make_node("/p/a.ts", "x", {"/p/b.ts::y"}), make_node("/p/b.ts", "y", {"/p/a.ts::x"}),
          make_node("/p/c.ts", "z", {"/p/a.ts::x"})});

    auto cycle = find_cycle(graph);
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(*cycle, (std::vector<CanonicalId>{"/p/a.ts::x", "/p/b.ts::y", "/p/a.ts::x"}));
}

TEST(GraphTest, FindsSelfLoop) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x", {"/p/a.ts::x"})});
    auto cycle = find_cycle(graph);
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(cycle->size(), 2u);
}

TEST(GraphTest, TopoSortPutsDependenciesFirst) {
    Graph graph;
    Index index;
    seed(graph, index,
         {make_node("/p/a.ts", "x", {"/p/b.ts::y"}), make_node("/p/b.ts", "y", {"/p/c.ts::z"}),
          make_node("/p/c.ts", "z")});

    auto order = topo_sort(graph);
    ASSERT_TRUE(order.has_value());
    ASSERT_EQ(order->size(), 3u);
    auto pos = [&](const CanonicalId &id) { return std::ranges::find(*order, id) - order->begin(); };
    EXPECT_LT(pos("/p/c.ts::z"), pos("/p/b.ts::y"));
    EXPECT_LT(pos("/p/b.ts::y"), pos("/p/a.ts::x"));
}

TEST(GraphTest, TopoSortRejectsCycles) {
    Graph graph;
    Index index;
    seed(graph, index, {make_node("/p/a.ts", "x", {"/p/b.ts::y"}), make_node("/p/b.ts", "y", {"/p/a.ts::x"})});
    EXPECT_FALSE(topo_sort(graph).has_value());
}
