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
#include <data/graphs/DirectedWeightedGraph.h>
#include <common/Exceptions.h>

using namespace Dendrometer;

namespace
{

// 1 -> 2 -> 4 -> 5 and 1 -> 3, with the weights 3, 5, 1 and 4
MorphologySamples createSamples()
{
    MorphologySamples samples;
    samples.push_back(MorphologySample(1, ROOT_PARENT_INDEX, Vector3f(0.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(2, 1, Vector3f(3.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(3, 1, Vector3f(0.f, 4.f, 0.f)));
    samples.push_back(MorphologySample(4, 2, Vector3f(3.f, 0.f, 5.f)));
    samples.push_back(MorphologySample(5, 4, Vector3f(3.f, 0.f, 6.f)));
    return samples;
}

GraphNode* findNode(const DirectedWeightedGraph& graph, const int64_t& index)
{
    for (auto node : graph.getNodes())
    {
        if (node->index == index)
            return node;
    }
    return nullptr;
}

std::vector< int64_t > getIndices(const GraphNodes& nodes)
{
    std::vector< int64_t > indices;
    for (const auto node : nodes)
        indices.push_back(node->index);
    return indices;
}

}

// ============================================================================
// Construction
// ============================================================================

TEST(DirectedWeightedGraphTest, Construction_FromSamples)
{
    DirectedWeightedGraph graph(createSamples());

    EXPECT_EQ(graph.getNumberNodes(), 5u);
    EXPECT_EQ(graph.getNumberEdges(), 4u);
    EXPECT_EQ(graph.getRoot()->index, 1);
    EXPECT_NEAR(graph.sumEdgeWeights(), 13.0, 1e-6);

    const GraphNode* node4 = findNode(graph, 4);
    ASSERT_NE(node4, nullptr);
    EXPECT_EQ(graph.getParent(node4)->index, 2);
    EXPECT_EQ(node4->parentIndex, 2);
    EXPECT_EQ(graph.inDegreeOf(node4), 1u);
    EXPECT_EQ(graph.outDegreeOf(node4), 1u);
    EXPECT_NEAR(graph.getEdge(findNode(graph, 2), node4)->weight, 5.0, 1e-6);
    EXPECT_EQ(graph.getEdge(node4, findNode(graph, 2)), nullptr);
}

TEST(DirectedWeightedGraphTest, Construction_UnitWeights)
{
    DirectedWeightedGraph graph(createSamples(), false);

    for (const auto edge : graph.getEdges())
        EXPECT_DOUBLE_EQ(edge->weight, 1.0);
    EXPECT_DOUBLE_EQ(graph.sumEdgeWeights(), 4.0);
}

TEST(DirectedWeightedGraphTest, Construction_DuplicateIndex)
{
    MorphologySamples samples = createSamples();
    samples.push_back(MorphologySample(3, 2, Vector3f(1.f, 1.f, 1.f)));

    EXPECT_THROW(DirectedWeightedGraph graph(samples), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, Construction_MissingParent)
{
    MorphologySamples samples = createSamples();
    samples.push_back(MorphologySample(6, 42, Vector3f(1.f, 1.f, 1.f)));

    EXPECT_THROW(DirectedWeightedGraph graph(samples), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, AddEdge_InvalidEdges)
{
    DirectedWeightedGraph graph;
    GraphNode* a = graph.addNode(Vector3f::ZERO);
    GraphNode* b = graph.addNode(Vector3f(1.f, 0.f, 0.f));
    graph.addEdge(a, b, 1.0);

    DirectedWeightedGraph other;
    GraphNode* foreign = other.addNode(Vector3f::ZERO);

    EXPECT_THROW(graph.addEdge(a, a, 1.0), InvalidGraphError);
    EXPECT_THROW(graph.addEdge(a, b, 2.0), InvalidGraphError);
    EXPECT_THROW(graph.addEdge(b, a, -1.0), InvalidGraphError);
    EXPECT_THROW(graph.addEdge(a, foreign, 1.0), InvalidGraphError);
    EXPECT_EQ(graph.getNumberEdges(), 1u);

    // Back-edges are accepted, the validation is done by the analysis
    EXPECT_NO_THROW(graph.addEdge(b, a, 1.0));
}

TEST(DirectedWeightedGraphTest, AddNode_DefaultIndex)
{
    DirectedWeightedGraph graph;
    GraphNode* a = graph.addNode(Vector3f::ZERO);
    GraphNode* b = graph.addNode(Vector3f::ZERO, 7);

    EXPECT_EQ(a->graphIndex, 0u);
    EXPECT_EQ(a->index, 0);
    EXPECT_EQ(b->graphIndex, 1u);
    EXPECT_EQ(b->index, 7);
    EXPECT_TRUE(a->isSameLocation(b));
}

TEST(DirectedWeightedGraphTest, RemoveEdge)
{
    DirectedWeightedGraph graph(createSamples());
    GraphEdge* edge = graph.getEdge(findNode(graph, 1), findNode(graph, 3));

    EXPECT_TRUE(graph.removeEdge(edge));
    EXPECT_FALSE(graph.removeEdge(edge));
    EXPECT_EQ(graph.getNumberEdges(), 3u);

    // The detached node becomes a second root
    EXPECT_THROW(graph.getRoot(), InvalidGraphError);
}

// ============================================================================
// Topology
// ============================================================================

TEST(DirectedWeightedGraphTest, TipsAndBranchPoints)
{
    DirectedWeightedGraph graph(createSamples());

    EXPECT_EQ(getIndices(graph.getTips()), std::vector< int64_t >({ 3, 5 }));
    EXPECT_EQ(getIndices(graph.getBranchPoints()), std::vector< int64_t >({ 1 }));
    EXPECT_EQ(getIndices(graph.getChildren(findNode(graph, 1))),
              std::vector< int64_t >({ 2, 3 }));
}

TEST(DirectedWeightedGraphTest, GetRoot_NoRoot)
{
    DirectedWeightedGraph empty;
    EXPECT_THROW(empty.getRoot(), InvalidGraphError);

    DirectedWeightedGraph cycle;
    GraphNode* a = cycle.addNode(Vector3f::ZERO);
    GraphNode* b = cycle.addNode(Vector3f(1.f, 0.f, 0.f));
    cycle.addEdge(a, b);
    cycle.addEdge(b, a);
    EXPECT_THROW(cycle.getRoot(), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, GetRoot_MultipleRoots)
{
    DirectedWeightedGraph graph;
    graph.addNode(Vector3f::ZERO);
    graph.addNode(Vector3f(1.f, 0.f, 0.f));

    EXPECT_THROW(graph.getRoot(), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, DepthFirstOrder)
{
    DirectedWeightedGraph graph(createSamples());

    EXPECT_EQ(getIndices(graph.getDepthFirstOrder(graph.getRoot())),
              std::vector< int64_t >({ 1, 2, 4, 5, 3 }));
    EXPECT_EQ(getIndices(graph.getDepthFirstOrder(findNode(graph, 4))),
              std::vector< int64_t >({ 4, 5 }));
}

TEST(DirectedWeightedGraphTest, VerifyTree)
{
    DirectedWeightedGraph graph(createSamples());
    EXPECT_NO_THROW(graph.verifyTree());

    // A back-edge gives a second parent to node 2
    graph.addEdge(findNode(graph, 4), findNode(graph, 2));
    EXPECT_THROW(graph.verifyTree(), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, VerifyTree_DetachedCycle)
{
    DirectedWeightedGraph graph;
    GraphNode* root = graph.addNode(Vector3f::ZERO);
    GraphNode* a = graph.addNode(Vector3f(1.f, 0.f, 0.f));
    GraphNode* b = graph.addNode(Vector3f(2.f, 0.f, 0.f));
    GraphNode* c = graph.addNode(Vector3f(3.f, 0.f, 0.f));
    graph.addEdge(root, a);
    graph.addEdge(b, c);
    graph.addEdge(c, b);

    EXPECT_EQ(graph.getRoot(), root);
    EXPECT_THROW(graph.verifyTree(), InvalidGraphError);
}

// ============================================================================
// Weights
// ============================================================================

TEST(DirectedWeightedGraphTest, Scale)
{
    DirectedWeightedGraph graph(createSamples());

    graph.scale(2.f, 2.f, 2.f, false);
    EXPECT_NEAR(graph.sumEdgeWeights(), 13.0, 1e-6);

    graph.assignEdgeWeightsEuclidean();
    EXPECT_NEAR(graph.sumEdgeWeights(), 26.0, 1e-5);

    graph.scale(0.5f, 0.5f, 0.5f, true);
    EXPECT_NEAR(graph.sumEdgeWeights(), 13.0, 1e-5);
}

// ============================================================================
// Shortest paths
// ============================================================================

TEST(DirectedWeightedGraphTest, ShortestPath_ThroughCommonAncestor)
{
    DirectedWeightedGraph graph(createSamples());

    const GraphPath path = graph.getShortestPath(findNode(graph, 3), findNode(graph, 5));
    EXPECT_EQ(path.getSampleIndices(), std::vector< int64_t >({ 3, 1, 2, 4, 5 }));
    EXPECT_NEAR(path.getLength(), 13.0, 1e-6);
}

TEST(DirectedWeightedGraphTest, ShortestPath_ToAncestor)
{
    DirectedWeightedGraph graph(createSamples());

    const GraphPath up = graph.getShortestPath(findNode(graph, 5), findNode(graph, 2));
    EXPECT_EQ(up.getSampleIndices(), std::vector< int64_t >({ 5, 4, 2 }));
    EXPECT_NEAR(up.getLength(), 6.0, 1e-6);

    const GraphPath down = graph.getShortestPath(findNode(graph, 2), findNode(graph, 5));
    EXPECT_EQ(down.getSampleIndices(), std::vector< int64_t >({ 2, 4, 5 }));
    EXPECT_NEAR(down.getLength(), 6.0, 1e-6);
}

TEST(DirectedWeightedGraphTest, ShortestPath_EmptyPaths)
{
    DirectedWeightedGraph graph(createSamples());
    DirectedWeightedGraph other;
    const GraphNode* foreign = other.addNode(Vector3f::ZERO);

    EXPECT_TRUE(graph.getShortestPath(findNode(graph, 3), findNode(graph, 3)).isEmpty());
    EXPECT_TRUE(graph.getShortestPath(findNode(graph, 3), foreign).isEmpty());
    EXPECT_TRUE(graph.getShortestPath(nullptr, findNode(graph, 3)).isEmpty());

    // Two separate components
    GraphNode* isolated = graph.addNode(Vector3f(9.f, 9.f, 9.f), 6);
    EXPECT_TRUE(graph.getShortestPath(findNode(graph, 3), isolated).isEmpty());
}

// ============================================================================
// Simplification
// ============================================================================

TEST(DirectedWeightedGraphTest, SimplifiedGraph)
{
    DirectedWeightedGraph graph(createSamples());
    const auto simplified = graph.getSimplifiedGraph();

    ASSERT_EQ(simplified->getNumberNodes(), 3u);
    EXPECT_EQ(simplified->getNumberEdges(), 2u);
    EXPECT_NEAR(simplified->sumEdgeWeights(), graph.sumEdgeWeights(), 1e-6);
    EXPECT_NO_THROW(simplified->verifyTree());

    // Renumbered in depth-first order from the root
    const GraphNode* root = simplified->getRoot();
    EXPECT_EQ(root->index, 1);
    EXPECT_EQ(root->parentIndex, ROOT_PARENT_INDEX);

    const GraphNodes children = simplified->getChildren(root);
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0]->index, 2);
    EXPECT_EQ(children[1]->index, 3);
    EXPECT_EQ(children[1]->parentIndex, 1);
    EXPECT_NEAR(simplified->getEdge(root, children[0])->weight, 4.0, 1e-6);
    EXPECT_NEAR(simplified->getEdge(root, children[1])->weight, 9.0, 1e-6);

    // The original graph is not modified
    EXPECT_EQ(graph.getNumberNodes(), 5u);
}

TEST(DirectedWeightedGraphTest, SimplifiedGraph_Chain)
{
    MorphologySamples samples;
    samples.push_back(MorphologySample(1, ROOT_PARENT_INDEX, Vector3f(0.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(2, 1, Vector3f(1.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(3, 2, Vector3f(2.f, 0.f, 0.f)));

    DirectedWeightedGraph graph(samples);
    const auto simplified = graph.getSimplifiedGraph();

    EXPECT_EQ(simplified->getNumberNodes(), 2u);
    ASSERT_EQ(simplified->getNumberEdges(), 1u);
    EXPECT_NEAR(simplified->getEdges().front()->weight, 2.0, 1e-6);
}

// ============================================================================
// Re-rooting and indexing
// ============================================================================

TEST(DirectedWeightedGraphTest, SetRoot)
{
    DirectedWeightedGraph graph(createSamples());
    GraphNode* newRoot = findNode(graph, 5);

    graph.setRoot(newRoot);

    EXPECT_EQ(graph.getRoot(), newRoot);
    EXPECT_NO_THROW(graph.verifyTree());
    EXPECT_NEAR(graph.sumEdgeWeights(), 13.0, 1e-6);
    EXPECT_EQ(getIndices(graph.getTips()), std::vector< int64_t >({ 3 }));
    EXPECT_EQ(graph.getParent(findNode(graph, 1))->index, 2);
    EXPECT_NEAR(graph.getEdge(findNode(graph, 2), findNode(graph, 1))->weight, 3.0, 1e-6);
}

TEST(DirectedWeightedGraphTest, SetRoot_ForeignNode)
{
    DirectedWeightedGraph graph(createSamples());
    DirectedWeightedGraph other;
    GraphNode* foreign = other.addNode(Vector3f::ZERO);

    EXPECT_THROW(graph.setRoot(foreign), InvalidGraphError);
}

TEST(DirectedWeightedGraphTest, UpdateNodeIndices)
{
    MorphologySamples samples;
    samples.push_back(MorphologySample(10, ROOT_PARENT_INDEX, Vector3f(0.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(20, 10, Vector3f(1.f, 0.f, 0.f)));
    samples.push_back(MorphologySample(30, 10, Vector3f(0.f, 1.f, 0.f)));
    samples.push_back(MorphologySample(40, 20, Vector3f(2.f, 0.f, 0.f)));

    DirectedWeightedGraph graph(samples);
    graph.updateNodeIndices();

    // The nodes keep their insertion order, only their indices change
    const GraphNodes& nodes = graph.getNodes();
    EXPECT_EQ(getIndices(nodes), std::vector< int64_t >({ 1, 2, 4, 3 }));
    EXPECT_EQ(nodes[0]->parentIndex, ROOT_PARENT_INDEX);
    EXPECT_EQ(nodes[1]->parentIndex, 1);
    EXPECT_EQ(nodes[2]->parentIndex, 1);
    EXPECT_EQ(nodes[3]->parentIndex, 2);
}

// ============================================================================
// Paths
// ============================================================================

TEST(DirectedWeightedGraphTest, GraphPath)
{
    DirectedWeightedGraph graph(createSamples());
    const GraphNode* node1 = findNode(graph, 1);
    const GraphNode* node2 = findNode(graph, 2);
    const GraphNode* node3 = findNode(graph, 3);

    GraphPath path;
    EXPECT_TRUE(path.isEmpty());
    EXPECT_DOUBLE_EQ(path.getLength(), 0.0);

    path.appendNode(node2);
    path.prependNode(node1);
    path.setLength(3.0);

    EXPECT_EQ(path.size(), 2u);
    EXPECT_TRUE(path.contains(node1));
    EXPECT_FALSE(path.contains(node3));
    EXPECT_EQ(path.getFirstNode(), node1);

    path.reverse();
    EXPECT_EQ(path.getSampleIndices(), std::vector< int64_t >({ 2, 1 }));
    EXPECT_EQ(path.getNode(1), node1);
    EXPECT_THROW(path.getNode(2), std::out_of_range);
    EXPECT_DOUBLE_EQ(path.getLength(), 3.0);
}
