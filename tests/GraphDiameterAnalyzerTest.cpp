/***************************************************************************************************
 * Copyright (c) 2016 - 2024
 * Blue Brain Project (BBP) / Ecole Polytechnique Federale de Lausanne (EPFL)
 *
 * This file is part of Dendrometer
 *
 * This library is free software; you can redistribute it and/or modify it under the terms of the
 * GNU General Public License version 3.0 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * You should have received a copy of the GNU General Public License along with this library;
 * if not, write to the Free Software Foundation, Inc., 59 Temple Place - Suite 330, Boston,
 * MA 02111-1307, USA.
 * You can also find it on the GNU web site < https://www.gnu.org/licenses/gpl-3.0.en.html >
 **************************************************************************************************/

#include <gtest/gtest.h>
#include <algorithms/graphs/GraphDiameterAnalyzer.h>
#include <data/graphs/RandomTreeGenerator.h>
#include <common/Exceptions.h>

using namespace Dendrometer;

namespace
{

std::vector< size_t > getGraphIndices(const GraphPath& path)
{
    std::vector< size_t > indices;
    for (const auto node : path.getNodes())
        indices.push_back(node->graphIndex);
    return indices;
}

// Builds a tree from explicit parents and weights, the first node is the root
std::unique_ptr< DirectedWeightedGraph > createTree(const std::vector< size_t >& parents,
                                                    const std::vector< double >& weights)
{
    auto graph = std::make_unique< DirectedWeightedGraph >();
    GraphNodes nodes;
    nodes.push_back(graph->addNode(Vector3f::ZERO, 1));
    for (size_t i = 0; i < parents.size(); ++i)
    {
        GraphNode* node = graph->addNode(Vector3f::ZERO, static_cast< int64_t >(i + 2));
        graph->addEdge(nodes[parents[i]], node, weights[i]);
        nodes.push_back(node);
    }
    return graph;
}

// The longest shortest path between the tips and the root, checking every pair
double computeUndirectedDiameterBruteForce(const DirectedWeightedGraph& graph)
{
    GraphNodes candidates = graph.getTips();
    candidates.push_back(graph.getRoot());

    double diameter = 0.0;
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        for (size_t j = i + 1; j < candidates.size(); ++j)
        {
            const GraphPath path = graph.getShortestPath(candidates[i], candidates[j]);
            diameter = std::max(diameter, path.getLength());
        }
    }
    return diameter;
}

}

// ============================================================================
// Directed diameter
// ============================================================================

TEST(GraphDiameterAnalyzerTest, RootOnly)
{
    DirectedWeightedGraph graph;
    const GraphNode* root = graph.addNode(Vector3f::ZERO, 1);

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 0.0);
    ASSERT_EQ(diameter.size(), 1u);
    EXPECT_EQ(diameter.getFirstNode(), root);

    const GraphPath generic = GraphDiameterAnalyzer::computeDiameterGeneric(graph);
    EXPECT_DOUBLE_EQ(generic.getLength(), 0.0);
    ASSERT_EQ(generic.size(), 1u);
    EXPECT_EQ(generic.getFirstNode(), root);
}

TEST(GraphDiameterAnalyzerTest, TwoTips)
{
    const auto graph = createTree({ 0, 0 }, { 3.0, 5.0 });

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 5.0);
    EXPECT_EQ(diameter.getSampleIndices(), std::vector< int64_t >({ 1, 3 }));

    const GraphPath generic = GraphDiameterAnalyzer::computeDiameterGeneric(*graph);
    EXPECT_DOUBLE_EQ(generic.getLength(), 5.0);
    EXPECT_EQ(generic.getSampleIndices(), std::vector< int64_t >({ 1, 3 }));
}

TEST(GraphDiameterAnalyzerTest, BalancedBinaryTree)
{
    const auto graph = RandomTreeGenerator::generateBalancedTree(3, 2, 1.0);
    ASSERT_EQ(graph->getNumberNodes(), 15u);

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 3.0);
    EXPECT_EQ(diameter.size(), 4u);

    // All the tips are equally far, the first one is selected
    EXPECT_EQ(getGraphIndices(diameter), std::vector< size_t >({ 0, 1, 3, 7 }));

    const GraphPath generic = GraphDiameterAnalyzer::computeDiameterGeneric(*graph);
    EXPECT_DOUBLE_EQ(generic.getLength(), 3.0);
    EXPECT_EQ(getGraphIndices(generic), getGraphIndices(diameter));
}

TEST(GraphDiameterAnalyzerTest, LongChain)
{
    const size_t numberNodes = 5000;
    std::vector< size_t > parents;
    std::vector< double > weights;
    for (size_t i = 0; i < numberNodes - 1; ++i)
    {
        parents.push_back(i);
        weights.push_back(0.5);
    }
    const auto graph = createTree(parents, weights);

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
    EXPECT_NEAR(diameter.getLength(), 0.5 * (numberNodes - 1), 1e-9);
    EXPECT_EQ(diameter.size(), numberNodes);
}

TEST(GraphDiameterAnalyzerTest, AgreesWithGenericOnRandomTrees)
{
    const std::vector< size_t > sizes = { 2, 3, 5, 10, 50, 100, 250, 500, 1000 };

    uint32_t seed = 0;
    for (const auto& numberNodes : sizes)
    {
        for (size_t trial = 0; trial < 5; ++trial)
        {
            const auto graph = RandomTreeGenerator::generateRandomTree(numberNodes, 0.1, 100.0,
                                                                       seed++);

            const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
            const GraphPath generic = GraphDiameterAnalyzer::computeDiameterGeneric(*graph);

            EXPECT_NEAR(diameter.getLength(), generic.getLength(), 1e-9)
                    << "Nodes [ " << numberNodes << " ], Seed [ " << seed - 1 << " ]";
            EXPECT_EQ(diameter.getLastNode(), generic.getLastNode());
            EXPECT_EQ(diameter.getFirstNode(), graph->getRoot());
        }
    }
}

TEST(GraphDiameterAnalyzerTest, PathLengthMatchesEdgeWeights)
{
    const auto graph = RandomTreeGenerator::generateRandomTree(300, 0.1, 100.0, 7);
    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);

    double length = 0.0;
    for (size_t i = 1; i < diameter.size(); ++i)
    {
        const GraphEdge* edge = graph->getEdge(diameter.getNode(i - 1), diameter.getNode(i));
        ASSERT_NE(edge, nullptr);
        length += edge->weight;
    }
    EXPECT_NEAR(length, diameter.getLength(), 1e-9);
    EXPECT_EQ(diameter.getLastNode()->outDegree(), 0u);
}

TEST(GraphDiameterAnalyzerTest, Idempotent)
{
    const auto graph = RandomTreeGenerator::generateRandomTree(200, 0.1, 100.0, 42);
    const size_t numberEdges = graph->getNumberEdges();
    const double cableLength = graph->sumEdgeWeights();

    const GraphPath first = GraphDiameterAnalyzer::computeDiameter(*graph);
    const GraphPath second = GraphDiameterAnalyzer::computeDiameter(*graph);

    EXPECT_EQ(first.getLength(), second.getLength());
    EXPECT_EQ(first.getNodes(), second.getNodes());

    // The graph is only read
    EXPECT_EQ(graph->getNumberEdges(), numberEdges);
    EXPECT_EQ(graph->sumEdgeWeights(), cableLength);
}

TEST(GraphDiameterAnalyzerTest, StableTieBreak)
{
    // Equal tips, the first inserted tip wins
    const auto graph = createTree({ 0, 0, 0 }, { 2.0, 5.0, 5.0 });

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
    EXPECT_EQ(diameter.getSampleIndices(), std::vector< int64_t >({ 1, 3 }));

    const GraphPath generic = GraphDiameterAnalyzer::computeDiameterGeneric(*graph);
    EXPECT_EQ(generic.getSampleIndices(), std::vector< int64_t >({ 1, 3 }));

    // Same result on every call
    for (size_t i = 0; i < 10; ++i)
    {
        EXPECT_EQ(GraphDiameterAnalyzer::computeDiameter(*graph).getSampleIndices(),
                  diameter.getSampleIndices());
    }
}

TEST(GraphDiameterAnalyzerTest, ZeroWeights)
{
    const auto graph = createTree({ 0, 1 }, { 0.0, 0.0 });

    const GraphPath diameter = GraphDiameterAnalyzer::computeDiameter(*graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 0.0);
    EXPECT_EQ(diameter.getSampleIndices(), std::vector< int64_t >({ 1, 2, 3 }));
}

// ============================================================================
// Invalid graphs
// ============================================================================

TEST(GraphDiameterAnalyzerTest, TwoRoots)
{
    DirectedWeightedGraph graph;
    GraphNode* a = graph.addNode(Vector3f::ZERO);
    GraphNode* b = graph.addNode(Vector3f::ZERO);
    graph.addNode(Vector3f::ZERO);
    graph.addEdge(a, b, 1.0);

    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameter(graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameterGeneric(graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeUndirectedDiameter(graph), InvalidGraphError);
}

TEST(GraphDiameterAnalyzerTest, EmptyGraph)
{
    DirectedWeightedGraph graph;

    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameter(graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameterGeneric(graph), InvalidGraphError);
}

TEST(GraphDiameterAnalyzerTest, BackEdgeCycle)
{
    auto graph = createTree({ 0, 1, 2 }, { 1.0, 1.0, 1.0 });

    // The last node points back to the first child
    GraphNodes nodes = graph->getNodes();
    graph->addEdge(nodes[3], nodes[1], 1.0);

    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameter(*graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameterGeneric(*graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeUndirectedDiameter(*graph), InvalidGraphError);
}

TEST(GraphDiameterAnalyzerTest, DetachedCycle)
{
    auto graph = createTree({ 0 }, { 1.0 });
    GraphNode* a = graph->addNode(Vector3f::ZERO);
    GraphNode* b = graph->addNode(Vector3f::ZERO);
    graph->addEdge(a, b, 1.0);
    graph->addEdge(b, a, 1.0);

    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameter(*graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameterGeneric(*graph), InvalidGraphError);
}

TEST(GraphDiameterAnalyzerTest, MultipleParents)
{
    auto graph = createTree({ 0, 0, 1 }, { 1.0, 1.0, 1.0 });
    GraphNodes nodes = graph->getNodes();
    graph->addEdge(nodes[2], nodes[3], 1.0);

    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameter(*graph), InvalidGraphError);
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameterGeneric(*graph), InvalidGraphError);
}

// ============================================================================
// Undirected diameter
// ============================================================================

TEST(GraphDiameterAnalyzerTest, Undirected_BetweenTips)
{
    // 1 -> 2 -> 4 -> 5 and 1 -> 3
    const auto graph = createTree({ 0, 0, 1, 3 }, { 3.0, 4.0, 5.0, 1.0 });

    const GraphPath diameter = GraphDiameterAnalyzer::computeUndirectedDiameter(*graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 13.0);
    EXPECT_EQ(diameter.getSampleIndices(), std::vector< int64_t >({ 5, 4, 2, 1, 3 }));
}

TEST(GraphDiameterAnalyzerTest, Undirected_FromRoot)
{
    const auto graph = createTree({ 0, 1 }, { 2.0, 3.0 });

    const GraphPath diameter = GraphDiameterAnalyzer::computeUndirectedDiameter(*graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 5.0);
    EXPECT_EQ(diameter.getSampleIndices(), std::vector< int64_t >({ 3, 2, 1 }));
}

TEST(GraphDiameterAnalyzerTest, Undirected_RootOnly)
{
    DirectedWeightedGraph graph;
    const GraphNode* root = graph.addNode(Vector3f::ZERO);

    const GraphPath diameter = GraphDiameterAnalyzer::computeUndirectedDiameter(graph);
    EXPECT_DOUBLE_EQ(diameter.getLength(), 0.0);
    ASSERT_EQ(diameter.size(), 1u);
    EXPECT_EQ(diameter.getFirstNode(), root);
}

TEST(GraphDiameterAnalyzerTest, Undirected_AgreesWithBruteForce)
{
    for (uint32_t seed = 100; seed < 120; ++seed)
    {
        const auto graph = RandomTreeGenerator::generateRandomTree(60, 0.1, 100.0, seed);

        const GraphPath diameter = GraphDiameterAnalyzer::computeUndirectedDiameter(*graph);
        const double expected = computeUndirectedDiameterBruteForce(*graph);

        EXPECT_NEAR(diameter.getLength(), expected, 1e-7) << "Seed [ " << seed << " ]";

        // Never shorter than the directed diameter
        EXPECT_GE(diameter.getLength() + 1e-9,
                  GraphDiameterAnalyzer::computeDiameter(*graph).getLength());

        // The returned path has the returned length
        const GraphPath check = graph->getShortestPath(diameter.getFirstNode(),
                                                       diameter.getLastNode());
        EXPECT_NEAR(check.getLength(), diameter.getLength(), 1e-7);
        EXPECT_EQ(check.size(), diameter.size());
    }
}

// ============================================================================
// Options and batches
// ============================================================================

TEST(GraphDiameterAnalyzerTest, Compute_Options)
{
    const auto graph = RandomTreeGenerator::generateRandomTree(100, 0.1, 100.0, 3);

    DiameterOptions options;
    EXPECT_EQ(GraphDiameterAnalyzer::compute(*graph, options).getNodes(),
              GraphDiameterAnalyzer::computeDiameter(*graph).getNodes());

    options.algorithm = DIAMETER_ALGORITHM::DIJKSTRA;
    EXPECT_EQ(GraphDiameterAnalyzer::compute(*graph, options).getNodes(),
              GraphDiameterAnalyzer::computeDiameterGeneric(*graph).getNodes());

    options.mode = DIAMETER_MODE::UNDIRECTED;
    EXPECT_THROW(GraphDiameterAnalyzer::compute(*graph, options), std::invalid_argument);

    options.algorithm = DIAMETER_ALGORITHM::TREE_TRAVERSAL;
    EXPECT_DOUBLE_EQ(GraphDiameterAnalyzer::compute(*graph, options).getLength(),
                     GraphDiameterAnalyzer::computeUndirectedDiameter(*graph).getLength());
}

TEST(GraphDiameterAnalyzerTest, ComputeDiameters_Batch)
{
    std::vector< std::unique_ptr< DirectedWeightedGraph > > graphs;
    std::vector< const DirectedWeightedGraph* > batch;
    for (uint32_t seed = 0; seed < 32; ++seed)
    {
        graphs.push_back(RandomTreeGenerator::generateRandomTree(20 + seed * 10, 0.1, 100.0,
                                                                 seed));
        batch.push_back(graphs.back().get());
    }

    const GraphPaths diameters = GraphDiameterAnalyzer::computeDiameters(batch, DiameterOptions());
    ASSERT_EQ(diameters.size(), graphs.size());
    for (size_t i = 0; i < graphs.size(); ++i)
    {
        const GraphPath expected = GraphDiameterAnalyzer::computeDiameter(*graphs[i]);
        EXPECT_EQ(diameters[i].getLength(), expected.getLength());
        EXPECT_EQ(diameters[i].getNodes(), expected.getNodes());
    }

    EXPECT_TRUE(GraphDiameterAnalyzer::computeDiameters(
                    std::vector< const DirectedWeightedGraph* >(), DiameterOptions()).empty());
}

TEST(GraphDiameterAnalyzerTest, ComputeDiameters_InvalidGraph)
{
    const auto valid = RandomTreeGenerator::generateRandomTree(50, 0.1, 100.0, 1);
    DirectedWeightedGraph invalid;
    invalid.addNode(Vector3f::ZERO);
    invalid.addNode(Vector3f::ZERO);

    std::vector< const DirectedWeightedGraph* > batch = { valid.get(), &invalid, valid.get() };
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameters(batch, DiameterOptions()),
                 InvalidGraphError);

    batch[1] = nullptr;
    EXPECT_THROW(GraphDiameterAnalyzer::computeDiameters(batch, DiameterOptions()),
                 InvalidGraphError);
}

TEST(GraphDiameterAnalyzerTest, AlgorithmNames)
{
    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithm("tree"), DIAMETER_ALGORITHM::TREE_TRAVERSAL);
    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithm("Tree-Traversal"),
              DIAMETER_ALGORITHM::TREE_TRAVERSAL);
    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithm("DIJKSTRA"), DIAMETER_ALGORITHM::DIJKSTRA);
    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithm("generic"), DIAMETER_ALGORITHM::DIJKSTRA);
    EXPECT_THROW(GraphDiameterAnalyzer::getAlgorithm("bfs"), std::invalid_argument);

    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithmName(DIAMETER_ALGORITHM::TREE_TRAVERSAL), "tree");
    EXPECT_EQ(GraphDiameterAnalyzer::getAlgorithmName(DIAMETER_ALGORITHM::DIJKSTRA), "dijkstra");
}
